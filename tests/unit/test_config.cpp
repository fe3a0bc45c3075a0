#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <rayshell/config.hpp>
#include <rayshell/log_targets.hpp>

#include "util/log_capture.hpp"

using namespace rayshell;
namespace fs = std::filesystem;

namespace
{

class ConfigFileTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
               / (std::string("rayshell_config_")
                  + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

}   // namespace

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(AppConfig, Defaults)
{
    AppConfig config;
    const auto& keys = config.runtime.keybindings;
    EXPECT_EQ(keys.toggle_metrics_window.to_string(), "F3");
    EXPECT_EQ(keys.toggle_demo_window.to_string(), "F1");
    EXPECT_EQ(keys.toggle_ui_managers_window.to_string(), "F6");
    EXPECT_EQ(keys.toggle_config_window.to_string(), "Ctrl + Comma");
    EXPECT_EQ(keys.exit_app.to_string(), "Alt + F4");

    EXPECT_EQ(config.runtime.resources.resources_path, "app_resources");
    EXPECT_EQ(config.runtime.resources.fonts_path, "fonts");
    EXPECT_EQ(config.runtime.tracing.error_style, ErrorLogStyle::ShortWithCause);
    EXPECT_EQ(config.runtime.tracing.min_level, LogLevel::Info);
    ASSERT_FALSE(config.runtime.tracing.target_filters.empty());
    EXPECT_EQ(config.runtime.tracing.target_filters[0].target, targets::UI_TRACE_EVENT_LOOP);
    EXPECT_FALSE(config.runtime.tracing.target_filters[0].enabled);

    EXPECT_EQ(config.init.ui.window_width, 1600u);
    EXPECT_EQ(config.init.ui.window_height, 900u);
    EXPECT_TRUE(config.init.ui.start_maximised);
    EXPECT_FALSE(config.init.ui.vsync);
    EXPECT_EQ(config.init.ui.hardware_acceleration, std::optional<bool>(true));
    EXPECT_EQ(config.init.ui.multisampling, 2u);
}

TEST(KeyBinding, Names)
{
    EXPECT_EQ(key_from_name("F12"), Key::F12);
    EXPECT_EQ(key_from_name("Hyper"), Key::Unknown);
    EXPECT_STREQ(key_name(Key::Escape), "Escape");
    KeyBinding all{Key::Q, true, true, true};
    EXPECT_EQ(all.to_string(), "Ctrl + Alt + Shift + Q");
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(AppConfig, RoundTrip)
{
    AppConfig config;
    config.init.ui.window_width                    = 1280;
    config.init.ui.vsync                           = true;
    config.init.ui.window_title                    = "my \"shell\"";
    config.runtime.keybindings.exit_app            = KeyBinding{Key::Q, true, false, true};
    config.runtime.resources.fonts_path            = "fonts/mono";
    config.runtime.tracing.error_style             = ErrorLogStyle::Debug;
    config.runtime.tracing.min_level               = LogLevel::Trace;
    config.runtime.tracing.target_filters          = {{"rayshell::ui", false}, {"rayshell", true}};
    config.runtime.timing.engine_tick              = std::chrono::milliseconds(250);

    AppConfig loaded;
    ASSERT_TRUE(loaded.deserialize(config.serialize()));
    EXPECT_EQ(loaded, config);
}

TEST(AppConfig, UnsetHardwareAccelerationIsNull)
{
    AppConfig config;
    config.init.ui.hardware_acceleration = std::nullopt;
    auto json                            = config.serialize();
    EXPECT_NE(json.find("\"hardware_acceleration\": null"), std::string::npos);

    AppConfig loaded;
    ASSERT_TRUE(loaded.deserialize(json));
    EXPECT_FALSE(loaded.init.ui.hardware_acceleration.has_value());
}

TEST(AppConfig, PartialDocumentKeepsOtherFields)
{
    AppConfig config;
    ASSERT_TRUE(config.deserialize(R"({"runtime": {"timing": {"ui_tick_ms": 33}}})"));
    EXPECT_EQ(config.runtime.timing.ui_tick, std::chrono::milliseconds(33));

    AppConfig expected;
    expected.runtime.timing.ui_tick = std::chrono::milliseconds(33);
    EXPECT_EQ(config, expected);
}

TEST(AppConfig, EmptyFilterListClearsFilters)
{
    AppConfig config;
    ASSERT_TRUE(config.deserialize(R"({"runtime": {"tracing": {"target_filters": []}}})"));
    EXPECT_TRUE(config.runtime.tracing.target_filters.empty());
}

TEST(AppConfig, LevelNamesAreCaseInsensitive)
{
    AppConfig config;
    ASSERT_TRUE(config.deserialize(R"({"runtime": {"tracing": {"min_level": "debug"}}})"));
    EXPECT_EQ(config.runtime.tracing.min_level, LogLevel::Debug);
}

TEST(AppConfig, RejectsNonObjects)
{
    AppConfig config;
    EXPECT_FALSE(config.deserialize(""));
    EXPECT_FALSE(config.deserialize("[1, 2]"));
    EXPECT_FALSE(config.deserialize("{\"version\": 1"));
    EXPECT_EQ(config, AppConfig{});
}

TEST(AppConfig, RejectsNewerVersion)
{
    AppConfig config;
    EXPECT_FALSE(config.deserialize(R"({"version": 2})"));
    EXPECT_TRUE(config.deserialize(R"({"version": 1})"));
}

TEST(AppConfig, UnknownValuesKeepDefaultsWithWarning)
{
    test::LogCapture capture;
    AppConfig        config;
    ASSERT_TRUE(config.deserialize(R"({
        "runtime": {
            "keybindings": { "exit_app": { "key": "Hyper", "ctrl": true } },
            "tracing": { "error_style": "Fancy", "min_level": "LOUD" }
        }
    })"));
    EXPECT_EQ(config, AppConfig{});
    EXPECT_EQ(capture.count(LogLevel::Warning, targets::GENERAL_WARNING_NON_FATAL), 3u);
}

// ─── Files ───────────────────────────────────────────────────────────────────

TEST_F(ConfigFileTest, SaveCreatesDirectoriesAndLoads)
{
    auto      path = (dir_ / "nested" / "config.json").string();
    AppConfig config;
    config.runtime.timing.program_poll = std::chrono::milliseconds(50);
    ASSERT_TRUE(config.save(path));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(AppConfig::load_or_default(path), config);
}

TEST_F(ConfigFileTest, MissingFileGivesDefaults)
{
    test::LogCapture capture;
    auto             config = AppConfig::load_or_default((dir_ / "missing.json").string());
    EXPECT_EQ(config, AppConfig{});
    EXPECT_TRUE(capture.contains("not found"));
}

TEST_F(ConfigFileTest, GarbageFileGivesDefaults)
{
    test::LogCapture capture;
    fs::create_directories(dir_);
    auto path = (dir_ / "config.json").string();
    {
        std::ofstream f(path);
        f << "this is not json";
    }
    EXPECT_EQ(AppConfig::load_or_default(path), AppConfig{});
    EXPECT_TRUE(capture.contains("could not be parsed"));
}

TEST(AppConfig, DefaultPathUnderUserConfig)
{
    auto path = AppConfig::default_path();
    EXPECT_NE(path.find("config.json"), std::string::npos);
}

// ─── ConfigStore ─────────────────────────────────────────────────────────────

TEST(ConfigStore, SnapshotIsACopy)
{
    AppConfigStore store;
    auto           before = store.snapshot();
    store.update([](AppConfig& c) { c.runtime.tracing.min_level = LogLevel::Error; });

    EXPECT_EQ(before.runtime.tracing.min_level, LogLevel::Info);
    EXPECT_EQ(store.snapshot().runtime.tracing.min_level, LogLevel::Error);
}
