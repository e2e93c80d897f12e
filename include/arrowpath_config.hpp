#pragma once

#include "arrowpath.hpp"
#include "arrowpath_logger.hpp"
#include <string>

namespace arrowpath {

    constexpr float PI = 3.14159265358979323846f;

    // Packed as 0xAABBGGRR, same layout as ImGui's IM_COL32
    constexpr uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        return (uint32_t(a) << 24) | (uint32_t(b) << 16) | (uint32_t(g) << 8) | uint32_t(r);
    }

    constexpr uint32_t COLOR_WHITE = rgba(255, 255, 255);

    struct ArrowConfig {
        // Maximum smoothing distance at a joint, clamped per joint to half
        // of the shorter adjacent segment
        float corner_radius = 40.0f;

        // Chevron geometry: stroke length and half-angle from the reverse heading
        float arrowhead_length = 10.0f;
        float arrowhead_angle = PI / 6.0f;

        float stroke_width = 1.0f;
        float hovered_stroke_width = 2.0f;
        float hit_stroke_width = 5.0f;

        uint32_t stroke_color = COLOR_WHITE;
        uint32_t fill_color = COLOR_WHITE;

        RenderMode mode = RenderMode::Composite;

        // Horizontal clearance the detour variant keeps from its source
        float detour_margin = 30.0f;
    };

    namespace arrow_config {

        inline ArrowConfig composite() {
            ArrowConfig config;
            config.mode = RenderMode::Composite;
            return config;
        }

        inline ArrowConfig integrated() {
            ArrowConfig config;
            config.mode = RenderMode::Integrated;
            return config;
        }

    } // namespace arrow_config

    Result<Empty, Error> validate(const ArrowConfig& config);
    Result<RenderMode, Error> parse_render_mode(const std::string& name);

    // Reads the [arrow] table of a TOML file on top of the defaults.
    // Keys that are absent keep their default value; a key holding the
    // wrong type or an out-of-range value gives Error::InvalidConfig.
    Result<ArrowConfig, Error> load_config(const std::string& path);
    Result<ArrowConfig, Error> load_config_from_string(const std::string& toml_text);

    // [log] table of the same file: level, file, color
    Result<LogOptions, Error> load_log_options(const std::string& path);
    Result<LogOptions, Error> load_log_options_from_string(const std::string& toml_text);

} // namespace arrowpath
