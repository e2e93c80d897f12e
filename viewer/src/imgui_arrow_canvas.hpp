/******************************************************************************************
*                                                                                         *
*    ImGuiArrowCanvas - Replays rendered arrows into an ImDrawList                       *
*                                                                                         *
*    Owns hover tracking: fires on_enter / on_leave when the pointer crosses a shape     *
*                                                                                         *
******************************************************************************************/

#pragma once

#include "arrowpath_arrow.hpp"
#include <imgui.h>
#include <unordered_set>
#include <vector>

namespace arrowpath {

class ImGuiArrowCanvas {
public:
    // origin is the screen position of canvas coordinate (0, 0)
    void Draw(ImDrawList* draw_list, ImVec2 origin, const RenderedArrow& arrow) const;
    void DrawAll(ImDrawList* draw_list, ImVec2 origin, const std::vector<RenderedArrow>& arrows) const;

    // Hit-tests the pointer against every arrow and runs the enter/leave
    // handlers on transitions. Keys that are no longer rendered are forgotten.
    void UpdateHover(std::vector<RenderedArrow>& arrows, ImVec2 origin, ImVec2 mouse_pos);

    bool IsHovered(uint64_t key) const { return hovered.count(key) != 0; }

private:
    std::unordered_set<uint64_t> hovered;

    void DrawShape(ImDrawList* draw_list, ImVec2 origin, const Shape& shape) const;
};

} // namespace arrowpath
