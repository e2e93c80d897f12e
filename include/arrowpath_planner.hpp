#pragma once

#include "arrowpath.hpp"
#include <functional>
#include <vector>

namespace arrowpath {

    // One hop of a path: maps the end of the previous hop to the end of this one
    using Step = std::function<Point(float x, float y)>;
    using StepList = std::vector<Step>;
    using PointSequence = std::vector<Point>;

    // Folds the steps over the origin, in order. The origin itself is not part
    // of the result, so k steps give exactly k points and no steps give none.
    PointSequence plan(Point origin, const StepList& steps);

    // Flat [x0, y0, x1, y1, ...] layout for hosts that take coordinate lists
    std::vector<float> flatten_coordinates(const PointSequence& points);

    Result<Empty, Error> validate_points(const PointSequence& points);

    namespace steps {

        // Reads the anchor when the step runs, not when it is built
        inline Step to(const Anchor& anchor) {
            const Anchor* a = &anchor;
            return [a](float, float) { return Point(a->x(), a->y()); };
        }

        inline Step to(Point p) {
            return [p](float, float) { return p; };
        }

        inline Step offset(float dx, float dy) {
            return [dx, dy](float x, float y) { return Point(x + dx, y + dy); };
        }

        inline Step horizontal_to(float target_x) {
            return [target_x](float, float y) { return Point(target_x, y); };
        }

        inline Step vertical_to(float target_y) {
            return [target_y](float x, float) { return Point(x, target_y); };
        }

    } // namespace steps

} // namespace arrowpath
