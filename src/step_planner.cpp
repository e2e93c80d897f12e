#include "arrowpath_planner.hpp"
#include "arrowpath_logger.hpp"
#include <zf_log.h>

namespace arrowpath {

PointSequence plan(Point origin, const StepList& steps)
{
    PointSequence points;
    if (steps.empty()) {
        return points;
    }

    points.reserve(steps.size() + 1);
    points.push_back(origin);

    for (const auto& step : steps) {
        const Point& last = points.back();
        points.push_back(step(last.x, last.y));
    }

    // Drop the origin, callers only see the points the steps produced
    points.erase(points.begin());
    return points;
}

std::vector<float> flatten_coordinates(const PointSequence& points)
{
    std::vector<float> coords;
    coords.reserve(points.size() * 2);
    for (const auto& p : points) {
        coords.push_back(p.x);
        coords.push_back(p.y);
    }
    return coords;
}

Result<Empty, Error> validate_points(const PointSequence& points)
{
    for (size_t i = 0; i < points.size(); i++) {
        if (!is_finite(points[i])) {
            ZF_LOGW(ZF_ADD_LOCATION("point %zu is not finite (%f, %f)",
                i, static_cast<double>(points[i].x), static_cast<double>(points[i].y)));
            return Error::NonFiniteCoordinate;
        }
    }
    return Empty{};
}

} // namespace arrowpath
