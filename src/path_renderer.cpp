#include "arrowpath_render.hpp"
#include "arrowpath_logger.hpp"
#include <zf_log.h>
#include <algorithm>
#include <cmath>

namespace arrowpath {

namespace {

// Unit vector along (dx, dy), zero for a zero-length segment
Point direction(float dx, float dy)
{
    const float len = std::hypot(dx, dy);
    if (len == 0.0f) {
        return Point();
    }
    return Point(dx / len, dy / len);
}

// Blend radius for one segment: half of its dominant axis, capped by the corner radius
float blend_radius(float dx, float dy, float corner_radius)
{
    return std::min(corner_radius, std::max(std::abs(dx / 2.0f), std::abs(dy / 2.0f)));
}

Point lerp(Point a, Point b, float t)
{
    return Point(a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t);
}

Point quad_point(Point p0, Point c, Point p1, float t)
{
    const float u = 1.0f - t;
    return Point(u * u * p0.x + 2.0f * u * t * c.x + t * t * p1.x,
                 u * u * p0.y + 2.0f * u * t * c.y + t * t * p1.y);
}

// Even-odd rule, ray cast towards +x
bool encloses(const std::vector<Point>& ring, Point p)
{
    bool inside = false;
    for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        const Point& a = ring[i];
        const Point& b = ring[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const float cross_x = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < cross_x) {
                inside = !inside;
            }
        }
    }
    return inside;
}

} // namespace

float heading(Point from, Point to)
{
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    if (dx == 0.0f && dy == 0.0f) {
        return 0.0f;
    }
    const float angle = std::atan2(dy, dx);
    return std::isfinite(angle) ? angle : 0.0f;
}

Chevron chevron(Point from, Point to, float length, float half_angle)
{
    Chevron c;
    c.tip = to;
    c.angle = heading(from, to);
    c.left = Point(to.x - length * std::cos(c.angle - half_angle),
                   to.y - length * std::sin(c.angle - half_angle));
    c.right = Point(to.x - length * std::cos(c.angle + half_angle),
                    to.y - length * std::sin(c.angle + half_angle));
    return c;
}

std::vector<PathCommand> trace_path(const PointSequence& points, float corner_radius)
{
    std::vector<PathCommand> commands;
    if (points.size() < 2) {
        return commands;
    }

    commands.reserve(points.size() * 2);
    commands.push_back(PathCommand::move_to(points.front()));

    if (points.size() == 2) {
        commands.push_back(PathCommand::line_to(points.back()));
        return commands;
    }

    for (size_t j = 1; j + 1 < points.size(); j++) {
        const Point& prev = points[j - 1];
        const Point& joint = points[j];
        const Point& next = points[j + 1];

        const float dx1 = joint.x - prev.x;
        const float dy1 = joint.y - prev.y;
        const float dx2 = next.x - joint.x;
        const float dy2 = next.y - joint.y;

        const float br = std::min(blend_radius(dx1, dy1, corner_radius),
                                  blend_radius(dx2, dy2, corner_radius));

        // br never exceeds half of either segment, so both points stay on their runs
        const Point in = direction(dx1, dy1);
        const Point out = direction(dx2, dy2);

        const Point entry(joint.x - br * in.x, joint.y - br * in.y);
        commands.push_back(PathCommand::line_to(entry));

        // The joint itself is the control point
        const Point exit(joint.x + br * out.x, joint.y + br * out.y);
        commands.push_back(PathCommand::quad_to(joint, exit));
    }

    commands.push_back(PathCommand::line_to(points.back()));
    return commands;
}

std::vector<Shape> render(const PointSequence& points, const ArrowConfig& config)
{
    std::vector<Shape> shapes;
    if (points.size() < 2) {
        ZF_LOGD("render: %zu point(s), nothing to draw", points.size());
        return shapes;
    }

    const Point& tail = points[points.size() - 2];
    const Point& tip = points.back();
    const Chevron head = chevron(tail, tip, config.arrowhead_length, config.arrowhead_angle);

    Shape curve;
    curve.commands = trace_path(points, config.corner_radius);
    curve.style.stroke_width = config.stroke_width;
    curve.style.hit_stroke_width = config.hit_stroke_width;
    curve.style.stroke_color = config.stroke_color;
    curve.style.fill_color = config.fill_color;
    curve.style.hoverable = true;

    switch (config.mode) {
        case RenderMode::Integrated: {
            curve.commands.push_back(PathCommand::line_to(head.left));
            curve.commands.push_back(PathCommand::move_to(head.tip));
            curve.commands.push_back(PathCommand::line_to(head.right));
            shapes.push_back(std::move(curve));
            break;
        }
        case RenderMode::Composite:
        default: {
            Shape arrowhead;
            arrowhead.commands.push_back(PathCommand::move_to(head.left));
            arrowhead.commands.push_back(PathCommand::line_to(head.tip));
            arrowhead.commands.push_back(PathCommand::line_to(head.right));
            arrowhead.commands.push_back(PathCommand::close());
            arrowhead.style.stroke_width = 0.0f;
            arrowhead.style.hit_stroke_width = 0.0f;
            arrowhead.style.stroke_color = config.stroke_color;
            arrowhead.style.fill_color = config.fill_color;
            arrowhead.style.filled = true;

            shapes.push_back(std::move(curve));
            shapes.push_back(std::move(arrowhead));
            break;
        }
    }

    return shapes;
}

std::vector<std::vector<Point>> flatten(const Shape& shape, int segments_per_curve)
{
    std::vector<std::vector<Point>> polylines;
    const int segments = std::max(1, segments_per_curve);
    Point cursor;
    Point subpath_start;

    for (const auto& cmd : shape.commands) {
        switch (cmd.op) {
            case PathOp::MoveTo:
                polylines.emplace_back();
                polylines.back().push_back(cmd.to);
                cursor = cmd.to;
                subpath_start = cmd.to;
                break;
            case PathOp::LineTo:
                if (polylines.empty()) {
                    polylines.emplace_back(1, cursor);
                }
                polylines.back().push_back(cmd.to);
                cursor = cmd.to;
                break;
            case PathOp::QuadTo:
                if (polylines.empty()) {
                    polylines.emplace_back(1, cursor);
                }
                for (int i = 1; i <= segments; i++) {
                    const float t = static_cast<float>(i) / static_cast<float>(segments);
                    polylines.back().push_back(quad_point(cursor, cmd.control, cmd.to, t));
                }
                cursor = cmd.to;
                break;
            case PathOp::ClosePath:
                if (!polylines.empty()) {
                    polylines.back().push_back(subpath_start);
                }
                cursor = subpath_start;
                break;
        }
    }
    return polylines;
}

float distance_to_segment(Point p, Point a, Point b)
{
    const float abx = b.x - a.x;
    const float aby = b.y - a.y;
    const float len_sq = abx * abx + aby * aby;
    float t = 0.0f;
    if (len_sq > 0.0f) {
        t = std::clamp(((p.x - a.x) * abx + (p.y - a.y) * aby) / len_sq, 0.0f, 1.0f);
    }
    const Point closest = lerp(a, b, t);
    return std::hypot(p.x - closest.x, p.y - closest.y);
}

bool hit_test(const Shape& shape, Point p)
{
    const std::vector<std::vector<Point>> polylines = flatten(shape);

    // Filled shapes are hit anywhere inside a closed sub-path
    if (shape.style.filled) {
        for (const auto& ring : polylines) {
            if (ring.size() >= 4 && ring.front() == ring.back() && encloses(ring, p)) {
                return true;
            }
        }
    }

    const float reach = std::max(shape.style.hit_stroke_width, shape.style.stroke_width) * 0.5f;
    if (reach <= 0.0f) {
        return false;
    }

    for (const auto& polyline : polylines) {
        if (polyline.size() == 1 && distance_to_segment(p, polyline[0], polyline[0]) <= reach) {
            return true;
        }
        for (size_t i = 1; i < polyline.size(); i++) {
            if (distance_to_segment(p, polyline[i - 1], polyline[i]) <= reach) {
                return true;
            }
        }
    }
    return false;
}

} // namespace arrowpath
