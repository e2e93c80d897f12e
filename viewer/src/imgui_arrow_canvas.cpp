/******************************************************************************************
*                                                                                         *
*    ImGuiArrowCanvas - Implementation                                                   *
*                                                                                         *
******************************************************************************************/

#include "imgui_arrow_canvas.hpp"

namespace arrowpath {

static ImVec2 ToScreen(ImVec2 origin, Point p)
{
    return ImVec2(origin.x + p.x, origin.y + p.y);
}

void ImGuiArrowCanvas::DrawShape(ImDrawList* draw_list, ImVec2 origin, const Shape& shape) const
{
    const ShapeStyle& style = shape.style;
    const bool stroke = style.stroke_width > 0.0f;

    // ImGui paths have no move-to, so each sub-path is flushed before the next starts
    auto flush = [&](bool closed) {
        if (draw_list->_Path.Size == 0) return;
        if (style.filled && closed) {
            draw_list->PathFillConvex(style.fill_color);
            return;
        }
        if (stroke) {
            draw_list->PathStroke(style.stroke_color, closed ? ImDrawFlags_Closed : ImDrawFlags_None,
                                  style.stroke_width);
        } else {
            draw_list->PathClear();
        }
    };

    for (const auto& cmd : shape.commands) {
        switch (cmd.op) {
            case PathOp::MoveTo:
                flush(false);
                draw_list->PathLineTo(ToScreen(origin, cmd.to));
                break;
            case PathOp::LineTo:
                draw_list->PathLineTo(ToScreen(origin, cmd.to));
                break;
            case PathOp::QuadTo:
                draw_list->PathBezierQuadraticCurveTo(ToScreen(origin, cmd.control), ToScreen(origin, cmd.to));
                break;
            case PathOp::ClosePath:
                flush(true);
                break;
        }
    }
    flush(false);
}

void ImGuiArrowCanvas::Draw(ImDrawList* draw_list, ImVec2 origin, const RenderedArrow& arrow) const
{
    for (const auto& shape : arrow.shapes) {
        DrawShape(draw_list, origin, shape);
    }
}

void ImGuiArrowCanvas::DrawAll(ImDrawList* draw_list, ImVec2 origin, const std::vector<RenderedArrow>& arrows) const
{
    for (const auto& arrow : arrows) {
        Draw(draw_list, origin, arrow);
    }
}

void ImGuiArrowCanvas::UpdateHover(std::vector<RenderedArrow>& arrows, ImVec2 origin, ImVec2 mouse_pos)
{
    const Point pointer(mouse_pos.x - origin.x, mouse_pos.y - origin.y);
    std::unordered_set<uint64_t> still_rendered;

    for (auto& arrow : arrows) {
        still_rendered.insert(arrow.key);

        bool hit = false;
        for (const auto& shape : arrow.shapes) {
            if (hit_test(shape, pointer)) {
                hit = true;
                break;
            }
        }

        const bool was_hovered = IsHovered(arrow.key);
        if (hit && !was_hovered) {
            hovered.insert(arrow.key);
            if (arrow.on_enter) arrow.on_enter(arrow);
        } else if (!hit && was_hovered) {
            hovered.erase(arrow.key);
            if (arrow.on_leave) arrow.on_leave(arrow);
        }
    }

    for (auto it = hovered.begin(); it != hovered.end();) {
        if (still_rendered.count(*it) == 0) {
            it = hovered.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace arrowpath
