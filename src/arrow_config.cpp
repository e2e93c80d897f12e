#include "arrowpath_config.hpp"
#include "arrowpath_logger.hpp"
#include <toml++/toml.hpp>
#include <zf_log.h>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>

namespace arrowpath {

namespace {

// "#RRGGBB" or "#RRGGBBAA"
std::optional<uint32_t> parse_color(const std::string& text)
{
    if (text.size() != 7 && text.size() != 9) return std::nullopt;
    if (text[0] != '#') return std::nullopt;

    for (size_t i = 1; i < text.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }

    auto byte_at = [&text](size_t pos) {
        return static_cast<uint8_t>(std::strtoul(text.substr(pos, 2).c_str(), nullptr, 16));
    };

    uint8_t alpha = text.size() == 9 ? byte_at(7) : 255;
    return rgba(byte_at(1), byte_at(3), byte_at(5), alpha);
}

// Absent keys leave `out` alone. A key of the wrong type is an error.
template<typename T>
bool read_value(const toml::table& tbl, const char* key, T& out)
{
    auto node = tbl[key];
    if (!node) return true;

    auto v = node.template value<T>();
    if (!v) {
        ZF_LOGE(ZF_ADD_LOCATION("'%s' has the wrong type", key));
        return false;
    }
    out = *v;
    return true;
}

bool read_float(const toml::table& tbl, const char* key, float& out)
{
    double v = out;
    if (!read_value(tbl, key, v)) return false;
    out = static_cast<float>(v);
    return true;
}

bool read_color(const toml::table& tbl, const char* key, uint32_t& out)
{
    if (!tbl[key]) return true;

    std::string text;
    if (!read_value(tbl, key, text)) return false;

    auto color = parse_color(text);
    if (!color) {
        ZF_LOGE(ZF_ADD_LOCATION("invalid color for '%s': %s", key, text.c_str()));
        return false;
    }
    out = *color;
    return true;
}

Result<toml::table, Error> parse_toml(const std::string& toml_text)
{
    try {
        return toml::parse(toml_text);
    } catch (const toml::parse_error& e) {
        ZF_LOGE(ZF_ADD_LOCATION("config parse error at line %u: %s",
            static_cast<unsigned>(e.source().begin.line), std::string(e.description()).c_str()));
        return Error::ConfigParseError;
    }
}

Result<std::string, Error> read_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        ZF_LOGE(ZF_ADD_LOCATION("could not open config file %s", path.c_str()));
        return Error::ConfigIOError;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// A missing table is fine, a key of the same name holding something else is not
Result<const toml::table*, Error> find_table(const toml::table& root, const char* name)
{
    auto node = root[name];
    if (!node) {
        return static_cast<const toml::table*>(nullptr);
    }
    const toml::table* tbl = node.as_table();
    if (!tbl) {
        ZF_LOGE(ZF_ADD_LOCATION("'%s' must be a table", name));
        return Error::InvalidConfig;
    }
    return tbl;
}

} // namespace

Result<Empty, Error> validate(const ArrowConfig& config)
{
    if (!std::isfinite(config.corner_radius) || config.corner_radius < 0.0f) {
        ZF_LOGW(ZF_ADD_LOCATION("corner_radius must be >= 0, got %f", static_cast<double>(config.corner_radius)));
        return Error::InvalidConfig;
    }
    if (!std::isfinite(config.arrowhead_length) || config.arrowhead_length < 0.0f) {
        ZF_LOGW(ZF_ADD_LOCATION("arrowhead_length must be >= 0, got %f", static_cast<double>(config.arrowhead_length)));
        return Error::InvalidConfig;
    }
    if (!(config.arrowhead_angle > 0.0f && config.arrowhead_angle < PI / 2.0f)) {
        ZF_LOGW(ZF_ADD_LOCATION("arrowhead_angle must be in (0, pi/2), got %f", static_cast<double>(config.arrowhead_angle)));
        return Error::InvalidConfig;
    }
    if (!(config.stroke_width > 0.0f) || !(config.hit_stroke_width > 0.0f)) {
        ZF_LOGW(ZF_ADD_LOCATION("stroke widths must be > 0"));
        return Error::InvalidConfig;
    }
    if (!(config.hovered_stroke_width >= config.stroke_width)) {
        ZF_LOGW(ZF_ADD_LOCATION("hovered_stroke_width (%f) is below stroke_width (%f)",
            static_cast<double>(config.hovered_stroke_width), static_cast<double>(config.stroke_width)));
        return Error::InvalidConfig;
    }
    if (!std::isfinite(config.detour_margin) || config.detour_margin < 0.0f) {
        ZF_LOGW(ZF_ADD_LOCATION("detour_margin must be >= 0, got %f", static_cast<double>(config.detour_margin)));
        return Error::InvalidConfig;
    }
    return Empty{};
}

Result<RenderMode, Error> parse_render_mode(const std::string& name)
{
    if (name == "composite") return RenderMode::Composite;
    if (name == "integrated") return RenderMode::Integrated;
    ZF_LOGW(ZF_ADD_LOCATION("unknown render mode '%s'", name.c_str()));
    return Error::UnknownRenderMode;
}

Result<ArrowConfig, Error> load_config_from_string(const std::string& toml_text)
{
    ArrowConfig config;

    auto parsed = parse_toml(toml_text);
    if (parsed.is_err()) {
        return parsed.unwrap_err();
    }
    auto table = find_table(parsed.unwrap(), "arrow");
    if (table.is_err()) {
        return table.unwrap_err();
    }
    const toml::table* arrow = table.unwrap();
    if (!arrow) {
        ZF_LOGI("no [arrow] table in config, using defaults");
        return config;
    }

    // Stored in degrees in the file
    float angle_deg = config.arrowhead_angle * 180.0f / PI;
    std::string mode = to_str(config.mode);

    const bool read_ok =
        read_float(*arrow, "corner_radius", config.corner_radius) &&
        read_float(*arrow, "arrowhead_length", config.arrowhead_length) &&
        read_float(*arrow, "arrowhead_angle_deg", angle_deg) &&
        read_float(*arrow, "stroke_width", config.stroke_width) &&
        read_float(*arrow, "hovered_stroke_width", config.hovered_stroke_width) &&
        read_float(*arrow, "hit_stroke_width", config.hit_stroke_width) &&
        read_float(*arrow, "detour_margin", config.detour_margin) &&
        read_color(*arrow, "stroke_color", config.stroke_color) &&
        read_color(*arrow, "fill_color", config.fill_color) &&
        read_value(*arrow, "mode", mode);
    if (!read_ok) {
        return Error::InvalidConfig;
    }

    if ((*arrow)["arrowhead_angle_deg"]) {
        config.arrowhead_angle = angle_deg * PI / 180.0f;
    }

    auto parsed_mode = parse_render_mode(mode);
    if (parsed_mode.is_err()) {
        return parsed_mode.unwrap_err();
    }
    config.mode = parsed_mode.unwrap();

    auto valid = validate(config);
    if (valid.is_err()) {
        return valid.unwrap_err();
    }
    return config;
}

Result<ArrowConfig, Error> load_config(const std::string& path)
{
    auto text = read_file(path);
    if (text.is_err()) {
        return text.unwrap_err();
    }

    auto result = load_config_from_string(text.unwrap());
    if (result.is_ok()) {
        ZF_LOGI("loaded arrow config from %s", path.c_str());
    }
    return result;
}

Result<LogOptions, Error> load_log_options_from_string(const std::string& toml_text)
{
    LogOptions options;

    auto parsed = parse_toml(toml_text);
    if (parsed.is_err()) {
        return parsed.unwrap_err();
    }
    auto table = find_table(parsed.unwrap(), "log");
    if (table.is_err()) {
        return table.unwrap_err();
    }
    const toml::table* log = table.unwrap();
    if (!log) {
        return options;
    }

    std::string level = log_level_name(options.level);
    const bool read_ok =
        read_value(*log, "level", level) &&
        read_value(*log, "file", options.file) &&
        read_value(*log, "color", options.color);
    if (!read_ok) {
        return Error::InvalidConfig;
    }

    // Level names in the file are lower case
    for (auto& c : level) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto parsed_level = parse_log_level(level);
    if (parsed_level.is_err()) {
        ZF_LOGE(ZF_ADD_LOCATION("unknown log level '%s'", level.c_str()));
        return parsed_level.unwrap_err();
    }
    options.level = parsed_level.unwrap();
    return options;
}

Result<LogOptions, Error> load_log_options(const std::string& path)
{
    auto text = read_file(path);
    if (text.is_err()) {
        return text.unwrap_err();
    }
    return load_log_options_from_string(text.unwrap());
}

} // namespace arrowpath
