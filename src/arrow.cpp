#include "arrowpath_arrow.hpp"
#include "arrowpath_logger.hpp"
#include <zf_log.h>
#include <cmath>

namespace arrowpath {

void set_stroke_width(RenderedArrow& target, float stroke_width)
{
    for (auto& shape : target.shapes) {
        if (shape.style.hoverable) {
            shape.style.stroke_width = stroke_width;
        }
    }
}

Arrow::Arrow(const Anchor& from, ArrowConfig config)
    : _from(&from), _config(config), _x(from.x()), _y(from.y())
{
}

Arrow& Arrow::to(const Anchor& target)
{
    _target = &target;
    _width = std::abs(target.x() - _from->x());
    _height = std::abs(target.y() - _from->y());
    return *this;
}

StepList Arrow::calculate_steps() const
{
    if (!_target) return {};
    return { steps::to(*_target) };
}

PointSequence Arrow::points() const
{
    PointSequence planned = plan(_from->position(), calculate_steps());
    if (planned.empty()) {
        return planned;
    }
    planned.insert(planned.begin(), _from->position());
    return planned;
}

RenderedArrow Arrow::draw(KeyAllocator& keys) const
{
    RenderedArrow rendered;
    rendered.key = keys.next_key();
    rendered.width = _width;
    rendered.height = _height;

    const float normal = _config.stroke_width;
    const float hovered = _config.hovered_stroke_width;
    rendered.on_enter = [hovered](RenderedArrow& current_target) {
        set_stroke_width(current_target, hovered);
    };
    rendered.on_leave = [normal](RenderedArrow& current_target) {
        set_stroke_width(current_target, normal);
    };

    const PointSequence path = points();
    if (path.empty()) {
        ZF_LOGD("arrow %llu has no target, nothing to draw",
            static_cast<unsigned long long>(rendered.key));
        return rendered;
    }

    auto valid = validate_points(path);
    if (valid.is_err()) {
        ZF_LOGW(ZF_ADD_LOCATION("arrow %llu not drawn: %s",
            static_cast<unsigned long long>(rendered.key), to_str(valid.unwrap_err())));
        return rendered;
    }

    rendered.shapes = render(path, _config);
    return rendered;
}

StepList ElbowArrow::calculate_steps() const
{
    if (!_target) return {};
    const Anchor* to = _target;
    return {
        [to](float, float y) { return Point(to->x(), y); },
        steps::to(*to),
    };
}

StepList DetourArrow::calculate_steps() const
{
    if (!_target) return {};
    const Anchor* to = _target;
    const float margin = _config.detour_margin;
    return {
        steps::offset(margin, 0.0f),
        [to](float x, float) { return Point(x, to->y()); },
        steps::to(*to),
    };
}

} // namespace arrowpath
