#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include "arrowpath_config.hpp"

using namespace arrowpath;

class ArrowConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_path = std::filesystem::temp_directory_path() / "arrowpath_config_test.toml";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
    }

    std::filesystem::path temp_path;
};

TEST_F(ArrowConfigTest, Defaults) {
    ArrowConfig config;
    EXPECT_FLOAT_EQ(config.corner_radius, 40.0f);
    EXPECT_FLOAT_EQ(config.arrowhead_length, 10.0f);
    EXPECT_FLOAT_EQ(config.arrowhead_angle, PI / 6.0f);
    EXPECT_FLOAT_EQ(config.stroke_width, 1.0f);
    EXPECT_FLOAT_EQ(config.hovered_stroke_width, 2.0f);
    EXPECT_EQ(config.stroke_color, rgba(255, 255, 255));
    EXPECT_EQ(config.mode, RenderMode::Composite);
    EXPECT_TRUE(validate(config).is_ok());
}

TEST_F(ArrowConfigTest, Presets) {
    EXPECT_EQ(arrow_config::composite().mode, RenderMode::Composite);
    EXPECT_EQ(arrow_config::integrated().mode, RenderMode::Integrated);
    EXPECT_TRUE(validate(arrow_config::integrated()).is_ok());
}

TEST_F(ArrowConfigTest, ColorPacking) {
    EXPECT_EQ(rgba(0x11, 0x22, 0x33), 0xFF332211u);
    EXPECT_EQ(rgba(0x11, 0x22, 0x33, 0x44), 0x44332211u);
}

TEST_F(ArrowConfigTest, LoadFullTable) {
    const std::string text =
        "[arrow]\n"
        "corner_radius = 12.5\n"
        "arrowhead_length = 14\n"
        "arrowhead_angle_deg = 20.0\n"
        "stroke_width = 2.0\n"
        "hovered_stroke_width = 3.5\n"
        "hit_stroke_width = 8.0\n"
        "stroke_color = \"#FF8000\"\n"
        "fill_color = \"#00FF0080\"\n"
        "mode = \"integrated\"\n"
        "detour_margin = 45.0\n";

    auto result = load_config_from_string(text);
    ASSERT_TRUE(result.is_ok()) << to_str(result.unwrap_err());
    const ArrowConfig& config = result.unwrap();

    EXPECT_FLOAT_EQ(config.corner_radius, 12.5f);
    EXPECT_FLOAT_EQ(config.arrowhead_length, 14.0f);
    EXPECT_NEAR(config.arrowhead_angle, 20.0f * PI / 180.0f, 1e-6f);
    EXPECT_FLOAT_EQ(config.stroke_width, 2.0f);
    EXPECT_FLOAT_EQ(config.hovered_stroke_width, 3.5f);
    EXPECT_FLOAT_EQ(config.hit_stroke_width, 8.0f);
    EXPECT_EQ(config.stroke_color, rgba(0xFF, 0x80, 0x00));
    EXPECT_EQ(config.fill_color, rgba(0x00, 0xFF, 0x00, 0x80));
    EXPECT_EQ(config.mode, RenderMode::Integrated);
    EXPECT_FLOAT_EQ(config.detour_margin, 45.0f);
}

TEST_F(ArrowConfigTest, PartialTableKeepsDefaults) {
    auto result = load_config_from_string("[arrow]\ncorner_radius = 8\n");
    ASSERT_TRUE(result.is_ok());

    ArrowConfig expected;
    const ArrowConfig& config = result.unwrap();
    EXPECT_FLOAT_EQ(config.corner_radius, 8.0f);
    EXPECT_FLOAT_EQ(config.arrowhead_length, expected.arrowhead_length);
    EXPECT_FLOAT_EQ(config.stroke_width, expected.stroke_width);
    EXPECT_FLOAT_EQ(config.hovered_stroke_width, expected.hovered_stroke_width);
    EXPECT_EQ(config.mode, expected.mode);
}

TEST_F(ArrowConfigTest, MissingTableGivesDefaults) {
    auto result = load_config_from_string("[window]\nwidth = 800\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FLOAT_EQ(result.unwrap().corner_radius, 40.0f);

    EXPECT_TRUE(load_config_from_string("").is_ok());
}

TEST_F(ArrowConfigTest, MalformedTomlIsParseError) {
    auto result = load_config_from_string("[arrow\ncorner_radius = = 3\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err(), Error::ConfigParseError);
}

TEST_F(ArrowConfigTest, UnknownModeRejected) {
    auto result = load_config_from_string("[arrow]\nmode = \"dashed\"\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err(), Error::UnknownRenderMode);

    EXPECT_TRUE(parse_render_mode("composite").is_ok());
    EXPECT_EQ(parse_render_mode("integrated").unwrap(), RenderMode::Integrated);
    EXPECT_TRUE(parse_render_mode("Composite").is_err());
}

TEST_F(ArrowConfigTest, BadColorRejected) {
    for (const char* color : { "red", "#12345", "#GG0000", "FF0000" }) {
        const std::string text = std::string("[arrow]\nstroke_color = \"") + color + "\"\n";
        auto result = load_config_from_string(text);
        ASSERT_TRUE(result.is_err()) << color;
        EXPECT_EQ(result.unwrap_err(), Error::InvalidConfig) << color;
    }
}

TEST_F(ArrowConfigTest, InvalidValuesRejected) {
    const char* cases[] = {
        "[arrow]\ncorner_radius = -1.0\n",
        "[arrow]\narrowhead_length = -5\n",
        "[arrow]\narrowhead_angle_deg = 0\n",
        "[arrow]\narrowhead_angle_deg = 90\n",
        "[arrow]\nstroke_width = 0\n",
        "[arrow]\nhit_stroke_width = 0\n",
        "[arrow]\nstroke_width = 3.0\nhovered_stroke_width = 2.0\n",
        "[arrow]\ndetour_margin = -10\n",
        // Present but of the wrong type
        "[arrow]\ncorner_radius = \"big\"\n",
        "[arrow]\nstroke_width = \"2\"\n",
        "[arrow]\narrowhead_angle_deg = [30]\n",
        "[arrow]\nmode = 3\n",
        "[arrow]\nfill_color = 16777215\n",
        "[arrow]\ndetour_margin = { x = 1 }\n",
        "arrow = 5\n",
    };
    for (const char* text : cases) {
        auto result = load_config_from_string(text);
        ASSERT_TRUE(result.is_err()) << text;
        EXPECT_EQ(result.unwrap_err(), Error::InvalidConfig) << text;
    }
}

TEST_F(ArrowConfigTest, ValidateRejectsNonFinite) {
    ArrowConfig config;
    config.corner_radius = std::numeric_limits<float>::infinity();
    EXPECT_TRUE(validate(config).is_err());

    config = ArrowConfig{};
    config.hovered_stroke_width = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE(validate(config).is_err());
}

TEST_F(ArrowConfigTest, MissingFileIsIOError) {
    auto result = load_config("/nonexistent/arrowpath/config.toml");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.unwrap_err(), Error::ConfigIOError);
}

TEST_F(ArrowConfigTest, LoadFromFile) {
    {
        std::ofstream file(temp_path);
        ASSERT_TRUE(file.is_open());
        file << "# arrows for the test canvas\n"
             << "[arrow]\n"
             << "corner_radius = 16\n"
             << "mode = \"integrated\"\n";
    }

    auto result = load_config(temp_path.string());
    ASSERT_TRUE(result.is_ok());
    EXPECT_FLOAT_EQ(result.unwrap().corner_radius, 16.0f);
    EXPECT_EQ(result.unwrap().mode, RenderMode::Integrated);
}

TEST_F(ArrowConfigTest, IntegerValuesAccepted) {
    auto result = load_config_from_string("[arrow]\ncorner_radius = 25\narrowhead_angle_deg = 45\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FLOAT_EQ(result.unwrap().corner_radius, 25.0f);
    EXPECT_NEAR(result.unwrap().arrowhead_angle, PI / 4.0f, 1e-6f);
}

TEST_F(ArrowConfigTest, LogTable) {
    auto result = load_log_options_from_string(
        "[arrow]\nmode = \"integrated\"\n"
        "[log]\nlevel = \"Debug\"\nfile = \"viewer.log\"\ncolor = false\n");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.unwrap().level, LOG_DEBUG);
    EXPECT_EQ(result.unwrap().file, "viewer.log");
    EXPECT_FALSE(result.unwrap().color);

    auto defaults = load_log_options_from_string("[arrow]\ncorner_radius = 3\n");
    ASSERT_TRUE(defaults.is_ok());
    EXPECT_EQ(defaults.unwrap().level, LOG_INFO);
    EXPECT_TRUE(defaults.unwrap().file.empty());
    EXPECT_TRUE(defaults.unwrap().color);
}

TEST_F(ArrowConfigTest, LogTableRejectsBadValues) {
    auto level = load_log_options_from_string("[log]\nlevel = \"chatty\"\n");
    ASSERT_TRUE(level.is_err());
    EXPECT_EQ(level.unwrap_err(), Error::UnknownLogLevel);

    auto color = load_log_options_from_string("[log]\ncolor = \"yes\"\n");
    ASSERT_TRUE(color.is_err());
    EXPECT_EQ(color.unwrap_err(), Error::InvalidConfig);

    EXPECT_EQ(load_log_options("/nonexistent/arrowpath/config.toml").unwrap_err(), Error::ConfigIOError);
}
