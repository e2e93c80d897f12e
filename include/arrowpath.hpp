#pragma once

#include "arrowpath_result.hpp"
#include <cstdint>
#include <cmath>

namespace arrowpath {

    enum class Error {
        Unknown,
        NonFiniteCoordinate,
        InvalidConfig,
        UnknownRenderMode,
        ConfigIOError,
        ConfigParseError,
        LogFileError,
        UnknownLogLevel,
    };

    inline const char* to_str(Error error) {
        switch (error) {
            case Error::Unknown: return "Unknown error";
            case Error::NonFiniteCoordinate: return "Non-finite coordinate in point sequence";
            case Error::InvalidConfig: return "Invalid arrow configuration";
            case Error::UnknownRenderMode: return "Unknown render mode";
            case Error::ConfigIOError: return "Could not read configuration file";
            case Error::ConfigParseError: return "Could not parse configuration file";
            case Error::LogFileError: return "Could not open log file";
            case Error::UnknownLogLevel: return "Unknown log level";
            default: return "Unknown error";
        }
    }

    struct Point {
        float x = 0.0f;
        float y = 0.0f;

        constexpr Point() = default;
        constexpr Point(float x_, float y_) : x(x_), y(y_) {}

        bool operator==(const Point& other) const { return x == other.x && y == other.y; }
        bool operator!=(const Point& other) const { return !(*this == other); }
    };

    inline bool is_finite(const Point& p) {
        return std::isfinite(p.x) && std::isfinite(p.y);
    }

    // Anything an arrow can start from or point at. Owned by the layout side;
    // arrows only read the coordinates.
    struct Anchor {
        virtual ~Anchor() = default;
        virtual float x() const = 0;
        virtual float y() const = 0;

        Point position() const { return Point(x(), y()); }
    };

    struct PointAnchor : public Anchor {
        Point p;

        PointAnchor() = default;
        PointAnchor(float x_, float y_) : p(x_, y_) {}
        explicit PointAnchor(Point p_) : p(p_) {}

        float x() const override { return p.x; }
        float y() const override { return p.y; }
    };

    // Render keys are handed out by the host so that re-rendered primitives
    // can be diffed. The core never keeps a counter of its own.
    struct KeyAllocator {
        virtual ~KeyAllocator() = default;
        virtual uint64_t next_key() = 0;
    };

    class SequentialKeyAllocator : public KeyAllocator {
    public:
        explicit SequentialKeyAllocator(uint64_t first = 0) : _next(first) {}
        uint64_t next_key() override { return _next++; }
        uint64_t peek() const { return _next; }

    private:
        uint64_t _next;
    };

    enum class RenderMode {
        Composite,  // stroked curve + separate filled arrow primitive
        Integrated, // arrowhead strokes appended to the curve path
    };

    inline const char* to_str(RenderMode mode) {
        switch (mode) {
            case RenderMode::Composite: return "composite";
            case RenderMode::Integrated: return "integrated";
            default: return "unknown";
        }
    }

} // namespace arrowpath
