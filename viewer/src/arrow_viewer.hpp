/******************************************************************************************
*                                                                                         *
*    ArrowViewer - Interactive playground for arrow routing and rendering                *
*                                                                                         *
*    Draggable nodes stand in for the layout engine; every arrow variant is drawn        *
*    between them with either render mode                                                *
*                                                                                         *
******************************************************************************************/

#pragma once

#include "imgui_arrow_canvas.hpp"
#include "arrowpath_arrow.hpp"
#include <imgui.h>
#include <memory>
#include <string>
#include <vector>

struct GLFWwindow;

namespace arrowpath {

// A box on the canvas; arrows attach to its centre
struct DemoNode : public Anchor {
    std::string label;
    ImVec2 position;          // top-left, canvas coordinates
    ImVec2 size{90.0f, 40.0f};

    DemoNode(std::string label_, ImVec2 position_) : label(std::move(label_)), position(position_) {}

    float x() const override { return position.x + size.x * 0.5f; }
    float y() const override { return position.y + size.y * 0.5f; }
};

enum class ArrowKind {
    Straight,
    Elbow,
    Detour,
};

struct DemoLink {
    size_t from_node;
    size_t to_node;
    ArrowKind kind;
};

// Owns the GLFW window and the ImGui context for its whole lifetime.
// Escape closes the window.
class ArrowViewer {
public:
    explicit ArrowViewer(ArrowConfig config = ArrowConfig{});
    ~ArrowViewer();

    ArrowViewer(const ArrowViewer&) = delete;
    ArrowViewer& operator=(const ArrowViewer&) = delete;

    // Returns false if the window could not be opened
    bool Run();

private:
    ArrowConfig config;
    std::vector<std::unique_ptr<DemoNode>> nodes;
    std::vector<DemoLink> links;

    std::vector<std::unique_ptr<Arrow>> arrows;
    std::vector<RenderedArrow> rendered;
    SequentialKeyAllocator keys{1};
    ImGuiArrowCanvas canvas;
    bool dirty = true;
    bool showJoints = false;

    GLFWwindow* window = nullptr;

    bool OpenWindow();
    void CloseWindow();
    void UpdateTitle();
    void Present();

    void Update();
    void DrawControls();
    void DrawCanvas();
    void DrawNodes(ImDrawList* draw_list, ImVec2 origin);
    void DrawJoints(ImDrawList* draw_list, ImVec2 origin) const;

    // Re-draws every link with fresh keys; bounding boxes are taken from the
    // anchors' current positions
    void RebuildArrows();
};

} // namespace arrowpath
