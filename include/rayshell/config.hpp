#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <rayshell/error.hpp>
#include <rayshell/logger.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rayshell
{

// ─── Keybindings ─────────────────────────────────────────────────────────────

// Key codes share their values with GLFW so the window layer can compare
// them directly.
enum class Key : int
{
    Unknown = -1,
    Space   = 32,
    Comma   = 44,
    Period  = 46,
    Q       = 81,
    W       = 87,
    Escape  = 256,
    F1      = 290,
    F2      = 291,
    F3      = 292,
    F4      = 293,
    F5      = 294,
    F6      = 295,
    F7      = 296,
    F8      = 297,
    F9      = 298,
    F10     = 299,
    F11     = 300,
    F12     = 301,
};

const char* key_name(Key key);
Key         key_from_name(const std::string& name);

// A key plus the modifiers that must be held with it.
struct KeyBinding
{
    Key  key   = Key::Unknown;
    bool ctrl  = false;
    bool alt   = false;
    bool shift = false;

    // e.g. "Ctrl + Alt + F4"
    std::string to_string() const;

    bool operator==(const KeyBinding&) const = default;
};

struct KeybindingsConfig
{
    KeyBinding toggle_metrics_window{Key::F3};
    KeyBinding toggle_demo_window{Key::F1};
    KeyBinding toggle_ui_managers_window{Key::F6};
    KeyBinding toggle_config_window{Key::Comma, true};
    KeyBinding exit_app{Key::F4, false, true};

    bool operator==(const KeybindingsConfig&) const = default;
};

// ─── Resources / tracing / timing ────────────────────────────────────────────

struct ResourcesConfig
{
    std::string resources_path = "app_resources";   // relative to the executable
    std::string fonts_path     = "fonts";           // relative to resources_path

    bool operator==(const ResourcesConfig&) const = default;
};

struct TracingConfig
{
    ErrorLogStyle                error_style = ErrorLogStyle::ShortWithCause;
    LogLevel                     min_level   = LogLevel::Info;
    std::vector<LogTargetFilter> target_filters;   // first match wins

    static TracingConfig defaults();

    bool operator==(const TracingConfig&) const = default;
};

struct ThreadTimingConfig
{
    std::chrono::milliseconds engine_tick{1000};
    std::chrono::milliseconds ui_tick{16};
    std::chrono::milliseconds program_poll{1000};

    bool operator==(const ThreadTimingConfig&) const = default;
};

struct RuntimeAppConfig
{
    KeybindingsConfig  keybindings;
    ResourcesConfig    resources;
    TracingConfig      tracing = TracingConfig::defaults();
    ThreadTimingConfig timing;

    bool operator==(const RuntimeAppConfig&) const = default;
};

// ─── Init time ───────────────────────────────────────────────────────────────
// Read once while the window is created; changes need a restart.

struct UiInitConfig
{
    uint32_t            window_width    = 1600;
    uint32_t            window_height   = 900;
    bool                start_maximised = true;
    bool                vsync           = false;
    std::optional<bool> hardware_acceleration = true;   // nullopt: let the driver decide
    uint16_t            multisampling   = 2;            // 0 disables, else a power of two
    std::string         window_title    = "rayshell";
    std::string         imgui_ini_path  = "imgui.ini";
    std::string         imgui_log_path  = "imgui_log.txt";

    bool operator==(const UiInitConfig&) const = default;
};

struct InitTimeAppConfig
{
    UiInitConfig ui;

    bool operator==(const InitTimeAppConfig&) const = default;
};

// ─── Whole app ───────────────────────────────────────────────────────────────

struct AppConfig
{
    InitTimeAppConfig init;
    RuntimeAppConfig  runtime;

    // JSON form of the whole config.
    std::string serialize() const;

    // Fields missing from `json` keep their current values. Returns false if
    // the text is not a JSON object or has a newer version.
    bool deserialize(const std::string& json);

    // Creates parent directories. Returns true on success.
    bool save(const std::string& path) const;

    // Defaults (with a logged warning) when the file is missing or unparseable.
    static AppConfig load_or_default(const std::string& path);

    // ~/.config/rayshell/config.json
    static std::string default_path();

    bool operator==(const AppConfig&) const = default;
};

// Lock-guarded holder for a config value shared between threads.
template <typename T>
class ConfigStore
{
   public:
    ConfigStore() = default;
    explicit ConfigStore(T value) : value_(std::move(value)) {}

    ConfigStore(const ConfigStore&)            = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    // Copy taken under the lock; the lock is released before returning.
    T snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    template <typename F>
    void update(F&& f)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::forward<F>(f)(value_);
    }

   private:
    mutable std::mutex mutex_;
    T                  value_{};
};

using AppConfigStore = ConfigStore<AppConfig>;

}   // namespace rayshell
