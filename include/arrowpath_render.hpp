#pragma once

#include "arrowpath_config.hpp"
#include "arrowpath_planner.hpp"
#include <vector>

namespace arrowpath {

    enum class PathOp {
        MoveTo,
        LineTo,
        QuadTo,     // control point in `control`, end point in `to`
        ClosePath,
    };

    struct PathCommand {
        PathOp op = PathOp::MoveTo;
        Point to;
        Point control;

        static PathCommand move_to(Point p) { return PathCommand{PathOp::MoveTo, p, Point()}; }
        static PathCommand line_to(Point p) { return PathCommand{PathOp::LineTo, p, Point()}; }
        static PathCommand quad_to(Point c, Point p) { return PathCommand{PathOp::QuadTo, p, c}; }
        static PathCommand close() { return PathCommand{PathOp::ClosePath, Point(), Point()}; }

        bool operator==(const PathCommand& other) const {
            return op == other.op && to == other.to && control == other.control;
        }
        bool operator!=(const PathCommand& other) const { return !(*this == other); }
    };

    struct ShapeStyle {
        float stroke_width = 1.0f;
        float hit_stroke_width = 0.0f;
        uint32_t stroke_color = COLOR_WHITE;
        uint32_t fill_color = COLOR_WHITE;
        bool filled = false;
        bool hoverable = false;   // stroke width follows pointer enter/leave

        bool operator==(const ShapeStyle& other) const {
            return stroke_width == other.stroke_width && hit_stroke_width == other.hit_stroke_width &&
                   stroke_color == other.stroke_color && fill_color == other.fill_color &&
                   filled == other.filled && hoverable == other.hoverable;
        }
    };

    struct Shape {
        std::vector<PathCommand> commands;
        ShapeStyle style;
    };

    struct Chevron {
        Point tip;
        Point left;
        Point right;
        float angle = 0.0f;
    };

    // Heading of the segment from -> to. Zero-length or non-finite input gives 0.
    float heading(Point from, Point to);

    Chevron chevron(Point from, Point to, float length, float half_angle);

    // Outline of the curve: a single line for two points, otherwise straight
    // runs joined by quadratic corners. Fewer than two points yields nothing.
    std::vector<PathCommand> trace_path(const PointSequence& points, float corner_radius);

    // Full rendering of a point sequence, origin first. Composite mode gives
    // the curve plus a filled arrow primitive; integrated mode gives a single
    // shape with the chevron appended to the curve.
    std::vector<Shape> render(const PointSequence& points, const ArrowConfig& config);

    // Polyline approximation of a shape, quadratic curves sampled uniformly
    std::vector<std::vector<Point>> flatten(const Shape& shape, int segments_per_curve = 8);

    float distance_to_segment(Point p, Point a, Point b);

    // True within max(hit_stroke_width, stroke_width)/2 of the outline, or
    // anywhere inside a closed sub-path of a filled shape
    bool hit_test(const Shape& shape, Point p);

} // namespace arrowpath
