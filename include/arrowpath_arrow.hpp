#pragma once

#include "arrowpath_render.hpp"
#include <functional>

namespace arrowpath {

    struct RenderedArrow;

    // Pointer callbacks receive the rendered arrow they are attached to,
    // the way a scene-graph event carries its current target
    using PointerHandler = std::function<void(RenderedArrow& current_target)>;

    struct RenderedArrow {
        uint64_t key = 0;
        std::vector<Shape> shapes;
        float width = 0.0f;
        float height = 0.0f;
        PointerHandler on_enter;
        PointerHandler on_leave;

        bool empty() const { return shapes.empty(); }
    };

    // Applies to hoverable shapes only; nothing else about the arrow changes
    void set_stroke_width(RenderedArrow& target, float stroke_width);

    // An arrow drawn between two anchors. Subclasses change the route by
    // overriding calculate_steps(); planning and rendering stay the same.
    class Arrow : public Anchor {
    public:
        explicit Arrow(const Anchor& from, ArrowConfig config = ArrowConfig{});
        Arrow(const Anchor&&, ArrowConfig = ArrowConfig{}) = delete;
        virtual ~Arrow() = default;

        // Anchors are referenced, not copied, and must outlive the arrow
        Arrow& to(const Anchor& target);
        Arrow& to(const Anchor&&) = delete;

        float x() const override { return _x; }
        float y() const override { return _y; }
        float width() const { return _width; }
        float height() const { return _height; }

        const Anchor& from() const { return *_from; }
        const Anchor* target() const { return _target; }
        const ArrowConfig& config() const { return _config; }

        // Full polyline handed to the renderer: origin followed by the planned points.
        // Empty while no target is set.
        PointSequence points() const;

        // The rendered arrow carries on_enter/on_leave handlers bound to this config
        RenderedArrow draw(KeyAllocator& keys) const;

    protected:
        // Each step maps the end of the previous segment to the end of the next.
        // The default is a single step straight to the target.
        virtual StepList calculate_steps() const;

        const Anchor* _from;
        const Anchor* _target = nullptr;
        ArrowConfig _config;

    private:
        float _x;
        float _y;
        float _width = 0.0f;
        float _height = 0.0f;
    };

    // Horizontal run to the target's column, then vertical into the target
    class ElbowArrow : public Arrow {
    public:
        using Arrow::Arrow;

    protected:
        StepList calculate_steps() const override;
    };

    // Leaves to the right by detour_margin, drops to the target's row and
    // comes back horizontally. Used when the target sits behind the source.
    class DetourArrow : public Arrow {
    public:
        using Arrow::Arrow;

    protected:
        StepList calculate_steps() const override;
    };

} // namespace arrowpath
