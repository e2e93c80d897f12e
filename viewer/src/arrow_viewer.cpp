/******************************************************************************************
*                                                                                         *
*    ArrowViewer - Implementation                                                        *
*                                                                                         *
******************************************************************************************/

#include "arrow_viewer.hpp"
#include "arrowpath_logger.hpp"
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <GLFW/glfw3.h>
#include <zf_log.h>
#include <string>

namespace arrowpath {

namespace {

constexpr int WINDOW_WIDTH = 1280;
constexpr int WINDOW_HEIGHT = 720;

void LogGlfwError(int code, const char* description)
{
    ZF_LOGE("GLFW error %d: %s", code, description);
}

} // namespace

ArrowViewer::ArrowViewer(ArrowConfig config_)
    : config(config_)
{
    nodes.push_back(std::make_unique<DemoNode>("source", ImVec2(80, 80)));
    nodes.push_back(std::make_unique<DemoNode>("filter", ImVec2(420, 260)));
    nodes.push_back(std::make_unique<DemoNode>("sink", ImVec2(760, 120)));
    nodes.push_back(std::make_unique<DemoNode>("feedback", ImVec2(300, 480)));

    links.push_back({0, 1, ArrowKind::Straight});
    links.push_back({1, 2, ArrowKind::Elbow});
    links.push_back({2, 3, ArrowKind::Detour});
    links.push_back({3, 0, ArrowKind::Elbow});
}

ArrowViewer::~ArrowViewer()
{
    CloseWindow();
}

bool ArrowViewer::OpenWindow()
{
    glfwSetErrorCallback(LogGlfwError);
    if (!glfwInit()) {
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    window = glfwCreateWindow(WINDOW_WIDTH, WINDOW_HEIGHT, "arrowpath viewer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return false;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::GetIO().IniFilename = nullptr;
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 130");

    UpdateTitle();
    return true;
}

void ArrowViewer::CloseWindow()
{
    if (!window) return;

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    window = nullptr;
}

// Title shows the active render mode and corner radius
void ArrowViewer::UpdateTitle()
{
    if (!window) return;
    const std::string title = std::string("arrowpath viewer - ") + to_str(config.mode) +
                              ", radius " + std::to_string(static_cast<int>(config.corner_radius));
    glfwSetWindowTitle(window, title.c_str());
}

void ArrowViewer::Present()
{
    ImGui::Render();
    int width = 0, height = 0;
    glfwGetFramebufferSize(window, &width, &height);
    glViewport(0, 0, width, height);
    glClearColor(0.12f, 0.12f, 0.14f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

bool ArrowViewer::Run()
{
    if (!OpenWindow()) {
        ZF_LOGE(ZF_ADD_LOCATION("could not open the viewer window"));
        return false;
    }
    ZF_LOGI("viewer running, %zu links, %s mode", links.size(), to_str(config.mode));

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        Update();
        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            glfwSetWindowShouldClose(window, GLFW_TRUE);
        }

        Present();
    }

    CloseWindow();
    return true;
}

void ArrowViewer::RebuildArrows()
{
    arrows.clear();
    rendered.clear();

    for (const auto& link : links) {
        const DemoNode& from = *nodes[link.from_node];
        const DemoNode& to = *nodes[link.to_node];

        std::unique_ptr<Arrow> arrow;
        switch (link.kind) {
            case ArrowKind::Elbow: arrow = std::make_unique<ElbowArrow>(from, config); break;
            case ArrowKind::Detour: arrow = std::make_unique<DetourArrow>(from, config); break;
            case ArrowKind::Straight:
            default: arrow = std::make_unique<Arrow>(from, config); break;
        }
        arrow->to(to);

        rendered.push_back(arrow->draw(keys));
        arrows.push_back(std::move(arrow));
    }

    ZF_LOGD("rebuilt %zu arrows, next key %llu", arrows.size(),
        static_cast<unsigned long long>(keys.peek()));
    dirty = false;
}

void ArrowViewer::Update()
{
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("arrowpath", nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoBringToFrontOnFocus);

    DrawControls();
    ImGui::Separator();
    DrawCanvas();

    ImGui::End();
}

void ArrowViewer::DrawControls()
{
    int mode = config.mode == RenderMode::Composite ? 0 : 1;
    bool changed = false;

    changed |= ImGui::RadioButton("Composite", &mode, 0);
    ImGui::SameLine();
    changed |= ImGui::RadioButton("Integrated", &mode, 1);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(200.0f);
    changed |= ImGui::SliderFloat("Corner radius", &config.corner_radius, 0.0f, 120.0f, "%.0f");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(200.0f);
    changed |= ImGui::SliderFloat("Detour margin", &config.detour_margin, 0.0f, 120.0f, "%.0f");
    ImGui::SameLine();
    ImGui::Checkbox("Show joints", &showJoints);

    if (changed) {
        config.mode = mode == 0 ? RenderMode::Composite : RenderMode::Integrated;
        dirty = true;
        UpdateTitle();
    }
}

void ArrowViewer::DrawCanvas()
{
    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const ImVec2 canvas_size = ImGui::GetContentRegionAvail();

    draw_list->PushClipRect(origin, ImVec2(origin.x + canvas_size.x, origin.y + canvas_size.y), true);

    DrawNodes(draw_list, origin);

    if (dirty) {
        RebuildArrows();
    }

    if (ImGui::IsWindowHovered()) {
        canvas.UpdateHover(rendered, origin, ImGui::GetMousePos());
    }
    canvas.DrawAll(draw_list, origin, rendered);

    if (showJoints) {
        DrawJoints(draw_list, origin);
    }

    draw_list->PopClipRect();
}

void ArrowViewer::DrawNodes(ImDrawList* draw_list, ImVec2 origin)
{
    for (size_t i = 0; i < nodes.size(); i++) {
        DemoNode& node = *nodes[i];
        const ImVec2 min(origin.x + node.position.x, origin.y + node.position.y);
        const ImVec2 max(min.x + node.size.x, min.y + node.size.y);

        ImGui::SetCursorScreenPos(min);
        ImGui::PushID(static_cast<int>(i));
        ImGui::InvisibleButton("node", node.size);
        if (ImGui::IsItemActive() && ImGui::IsMouseDragging(ImGuiMouseButton_Left)) {
            const ImVec2 delta = ImGui::GetIO().MouseDelta;
            node.position.x += delta.x;
            node.position.y += delta.y;
            dirty = true;
        }
        const bool hovered = ImGui::IsItemHovered();
        ImGui::PopID();

        draw_list->AddRectFilled(min, max, IM_COL32(60, 60, 70, 255), 4.0f);
        draw_list->AddRect(min, max, hovered ? IM_COL32(255, 200, 80, 255) : IM_COL32(120, 120, 140, 255), 4.0f);
        draw_list->AddText(ImVec2(min.x + 8.0f, min.y + 12.0f), IM_COL32(230, 230, 230, 255), node.label.c_str());
    }
}

void ArrowViewer::DrawJoints(ImDrawList* draw_list, ImVec2 origin) const
{
    for (const auto& arrow : arrows) {
        for (const auto& p : arrow->points()) {
            draw_list->AddCircleFilled(ImVec2(origin.x + p.x, origin.y + p.y), 3.0f, IM_COL32(255, 90, 90, 255));
        }
    }
}

} // namespace arrowpath
