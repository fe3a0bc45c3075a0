#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <rayshell/config.hpp>
#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <sstream>

#include "constants.hpp"

namespace rayshell
{

// ─── Keys ────────────────────────────────────────────────────────────────────

namespace
{

struct KeyName
{
    Key         key;
    const char* name;
};

constexpr KeyName KEY_NAMES[] = {
    {Key::Space, "Space"}, {Key::Comma, "Comma"}, {Key::Period, "Period"}, {Key::Q, "Q"},
    {Key::W, "W"},         {Key::Escape, "Escape"}, {Key::F1, "F1"},       {Key::F2, "F2"},
    {Key::F3, "F3"},       {Key::F4, "F4"},       {Key::F5, "F5"},         {Key::F6, "F6"},
    {Key::F7, "F7"},       {Key::F8, "F8"},       {Key::F9, "F9"},         {Key::F10, "F10"},
    {Key::F11, "F11"},     {Key::F12, "F12"},
};

}   // namespace

const char* key_name(Key key)
{
    for (const auto& k : KEY_NAMES)
    {
        if (k.key == key)
            return k.name;
    }
    return "Unknown";
}

Key key_from_name(const std::string& name)
{
    for (const auto& k : KEY_NAMES)
    {
        if (name == k.name)
            return k.key;
    }
    return Key::Unknown;
}

std::string KeyBinding::to_string() const
{
    std::string out;
    if (ctrl)
        out += "Ctrl + ";
    if (alt)
        out += "Alt + ";
    if (shift)
        out += "Shift + ";
    out += key_name(key);
    return out;
}

// ─── Defaults ────────────────────────────────────────────────────────────────

TracingConfig TracingConfig::defaults()
{
    TracingConfig cfg;
    // Per-frame and per-iteration categories are off unless asked for.
    cfg.target_filters = {
        {targets::UI_TRACE_EVENT_LOOP, false},
        {targets::UI_TRACE_BUILD_INTERFACE, false},
        {targets::UI_TRACE_RENDER, false},
        {targets::THREAD_TRACE_MESSAGE_LOOP, false},
        {targets::THREAD_TRACE_MUTEX_SYNC, false},
        {targets::DATA_DEBUG_DUMP_OBJECT, false},
        {targets::PROGRAM_TRACE_GLOBAL_LOOP, false},
        {targets::ENGINE_TRACE_GLOBAL_LOOP, false},
        {targets::THREAD_TRACE_MESSAGE_IGNORED, false},
        {targets::PROGRAM_TRACE_THREAD_STATUS_POLL, false},
    };
    return cfg;
}

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '\\' && i + 1 < s.size())
        {
            char n = s[++i];
            switch (n)
            {
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += n;
                    break;
            }
        }
        else
        {
            out += s[i];
        }
    }
    return out;
}

static void write_binding(std::ostream& os, const char* name, const KeyBinding& b, bool last)
{
    os << "      \"" << name << "\": { \"key\": \"" << key_name(b.key) << "\", "
       << "\"ctrl\": " << (b.ctrl ? "true" : "false") << ", "
       << "\"alt\": " << (b.alt ? "true" : "false") << ", "
       << "\"shift\": " << (b.shift ? "true" : "false") << " }" << (last ? "" : ",") << "\n";
}

std::string AppConfig::serialize() const
{
    const auto& ui = init.ui;
    const auto& rt = runtime;

    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << constants::CONFIG_FILE_VERSION << ",\n";

    os << "  \"init\": {\n";
    os << "    \"ui\": {\n";
    os << "      \"window_width\": " << ui.window_width << ",\n";
    os << "      \"window_height\": " << ui.window_height << ",\n";
    os << "      \"start_maximised\": " << (ui.start_maximised ? "true" : "false") << ",\n";
    os << "      \"vsync\": " << (ui.vsync ? "true" : "false") << ",\n";
    os << "      \"hardware_acceleration\": ";
    if (ui.hardware_acceleration)
        os << (*ui.hardware_acceleration ? "true" : "false");
    else
        os << "null";
    os << ",\n";
    os << "      \"multisampling\": " << ui.multisampling << ",\n";
    os << "      \"window_title\": \"" << escape_json(ui.window_title) << "\",\n";
    os << "      \"imgui_ini_path\": \"" << escape_json(ui.imgui_ini_path) << "\",\n";
    os << "      \"imgui_log_path\": \"" << escape_json(ui.imgui_log_path) << "\"\n";
    os << "    }\n";
    os << "  },\n";

    os << "  \"runtime\": {\n";
    os << "    \"keybindings\": {\n";
    write_binding(os, "toggle_metrics_window", rt.keybindings.toggle_metrics_window, false);
    write_binding(os, "toggle_demo_window", rt.keybindings.toggle_demo_window, false);
    write_binding(os, "toggle_ui_managers_window", rt.keybindings.toggle_ui_managers_window, false);
    write_binding(os, "toggle_config_window", rt.keybindings.toggle_config_window, false);
    write_binding(os, "exit_app", rt.keybindings.exit_app, true);
    os << "    },\n";

    os << "    \"resources\": {\n";
    os << "      \"resources_path\": \"" << escape_json(rt.resources.resources_path) << "\",\n";
    os << "      \"fonts_path\": \"" << escape_json(rt.resources.fonts_path) << "\"\n";
    os << "    },\n";

    os << "    \"tracing\": {\n";
    os << "      \"error_style\": \"" << to_string(rt.tracing.error_style) << "\",\n";
    os << "      \"min_level\": \"" << Logger::level_to_string(rt.tracing.min_level) << "\",\n";
    os << "      \"target_filters\": [\n";
    for (size_t i = 0; i < rt.tracing.target_filters.size(); ++i)
    {
        const auto& f = rt.tracing.target_filters[i];
        os << "        { \"target\": \"" << escape_json(f.target) << "\", \"enabled\": "
           << (f.enabled ? "true" : "false") << " }";
        if (i + 1 < rt.tracing.target_filters.size())
            os << ",";
        os << "\n";
    }
    os << "      ]\n";
    os << "    },\n";

    os << "    \"timing\": {\n";
    os << "      \"engine_tick_ms\": " << rt.timing.engine_tick.count() << ",\n";
    os << "      \"ui_tick_ms\": " << rt.timing.ui_tick.count() << ",\n";
    os << "      \"program_poll_ms\": " << rt.timing.program_poll.count() << "\n";
    os << "    }\n";
    os << "  }\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for our own format

// Position just past the ':' following `"key"`, or npos.
static size_t find_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    return pos + 1;
}

static size_t skip_ws(const std::string& json, size_t pos)
{
    while (pos < json.size()
           && (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r'))
        ++pos;
    return pos;
}

// Text of the balanced `open ... close` block starting at `pos`, quotes respected.
static std::string balanced_block(const std::string& json, size_t pos, char open, char close)
{
    if (pos >= json.size() || json[pos] != open)
        return "";
    int  depth     = 0;
    bool in_string = false;
    for (size_t i = pos; i < json.size(); ++i)
    {
        char c = json[i];
        if (in_string)
        {
            if (c == '\\')
                ++i;
            else if (c == '"')
                in_string = false;
            continue;
        }
        if (c == '"')
            in_string = true;
        else if (c == open)
            ++depth;
        else if (c == close)
        {
            --depth;
            if (depth == 0)
                return json.substr(pos, i - pos + 1);
        }
    }
    return "";
}

static std::string read_json_object(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return "";
    return balanced_block(json, skip_ws(json, pos), '{', '}');
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != '"')
        return std::nullopt;
    size_t end = pos + 1;
    while (end < json.size())
    {
        if (json[end] == '\\')
        {
            end += 2;
            continue;
        }
        if (json[end] == '"')
            break;
        ++end;
    }
    if (end >= json.size())
        return std::nullopt;
    return unescape_json(json.substr(pos + 1, end - pos - 1));
}

static std::optional<bool> read_json_bool(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = skip_ws(json, pos);
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

static bool read_json_null(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return false;
    pos = skip_ws(json, pos);
    return json.compare(pos, 4, "null") == 0;
}

static std::optional<long long> read_json_int(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos               = skip_ws(json, pos);
    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    long long   value = std::strtoll(begin, &end, 10);
    if (end == begin)
        return std::nullopt;
    return value;
}

static std::vector<std::string> read_json_object_array(const std::string& json,
                                                       const std::string& key)
{
    std::vector<std::string> objects;
    auto                     pos = find_value(json, key);
    if (pos == std::string::npos)
        return objects;
    std::string array = balanced_block(json, skip_ws(json, pos), '[', ']');
    for (size_t i = 1; i < array.size(); ++i)
    {
        if (array[i] == '{')
        {
            std::string obj = balanced_block(array, i, '{', '}');
            if (obj.empty())
                break;
            objects.push_back(obj);
            i += obj.size() - 1;
        }
    }
    return objects;
}

template <typename T>
static void assign(T& field, const std::optional<T>& value)
{
    if (value)
        field = *value;
}

static void read_binding(const std::string& section, const char* name, KeyBinding& binding)
{
    std::string obj = read_json_object(section, name);
    if (obj.empty())
        return;
    if (auto key = read_json_string(obj, "key"))
    {
        Key k = key_from_name(*key);
        if (k == Key::Unknown)
        {
            RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                              "unknown key '{}' for keybinding '{}', keeping {}",
                              *key,
                              name,
                              binding.to_string());
            return;
        }
        binding.key = k;
    }
    assign(binding.ctrl, read_json_bool(obj, "ctrl"));
    assign(binding.alt, read_json_bool(obj, "alt"));
    assign(binding.shift, read_json_bool(obj, "shift"));
}

bool AppConfig::deserialize(const std::string& json)
{
    size_t start = skip_ws(json, 0);
    if (start >= json.size() || json[start] != '{' || balanced_block(json, start, '{', '}').empty())
        return false;

    if (auto ver = read_json_int(json, "version"); ver && *ver > constants::CONFIG_FILE_VERSION)
        return false;   // Future version

    std::string init_section = read_json_object(json, "init");
    std::string ui           = read_json_object(init_section, "ui");
    if (!ui.empty())
    {
        auto& u = init.ui;
        if (auto v = read_json_int(ui, "window_width"); v && *v > 0)
            u.window_width = static_cast<uint32_t>(*v);
        if (auto v = read_json_int(ui, "window_height"); v && *v > 0)
            u.window_height = static_cast<uint32_t>(*v);
        assign(u.start_maximised, read_json_bool(ui, "start_maximised"));
        assign(u.vsync, read_json_bool(ui, "vsync"));
        if (read_json_null(ui, "hardware_acceleration"))
            u.hardware_acceleration = std::nullopt;
        else if (auto v = read_json_bool(ui, "hardware_acceleration"))
            u.hardware_acceleration = *v;
        if (auto v = read_json_int(ui, "multisampling"); v && *v >= 0)
            u.multisampling = static_cast<uint16_t>(*v);
        assign(u.window_title, read_json_string(ui, "window_title"));
        assign(u.imgui_ini_path, read_json_string(ui, "imgui_ini_path"));
        assign(u.imgui_log_path, read_json_string(ui, "imgui_log_path"));
    }

    std::string rt = read_json_object(json, "runtime");

    std::string keys = read_json_object(rt, "keybindings");
    if (!keys.empty())
    {
        auto& k = runtime.keybindings;
        read_binding(keys, "toggle_metrics_window", k.toggle_metrics_window);
        read_binding(keys, "toggle_demo_window", k.toggle_demo_window);
        read_binding(keys, "toggle_ui_managers_window", k.toggle_ui_managers_window);
        read_binding(keys, "toggle_config_window", k.toggle_config_window);
        read_binding(keys, "exit_app", k.exit_app);
    }

    std::string res = read_json_object(rt, "resources");
    if (!res.empty())
    {
        assign(runtime.resources.resources_path, read_json_string(res, "resources_path"));
        assign(runtime.resources.fonts_path, read_json_string(res, "fonts_path"));
    }

    std::string tracing = read_json_object(rt, "tracing");
    if (!tracing.empty())
    {
        auto& t = runtime.tracing;
        if (auto v = read_json_string(tracing, "error_style"))
        {
            if (!error_log_style_from_string(*v, t.error_style))
                RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                                  "unknown error style '{}', keeping {}",
                                  *v,
                                  to_string(t.error_style));
        }
        if (auto v = read_json_string(tracing, "min_level"))
        {
            if (!Logger::level_from_string(*v, t.min_level))
                RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                                  "unknown log level '{}', keeping {}",
                                  *v,
                                  Logger::level_to_string(t.min_level));
        }
        if (find_value(tracing, "target_filters") != std::string::npos)
        {
            t.target_filters.clear();
            for (const auto& obj : read_json_object_array(tracing, "target_filters"))
            {
                LogTargetFilter f;
                auto            target = read_json_string(obj, "target");
                if (!target || target->empty())
                    continue;
                f.target  = *target;
                f.enabled = read_json_bool(obj, "enabled").value_or(true);
                t.target_filters.push_back(std::move(f));
            }
        }
    }

    std::string timing = read_json_object(rt, "timing");
    if (!timing.empty())
    {
        auto& tm = runtime.timing;
        if (auto v = read_json_int(timing, "engine_tick_ms"); v && *v >= 0)
            tm.engine_tick = std::chrono::milliseconds(*v);
        if (auto v = read_json_int(timing, "ui_tick_ms"); v && *v >= 0)
            tm.ui_tick = std::chrono::milliseconds(*v);
        if (auto v = read_json_int(timing, "program_poll_ms"); v && *v >= 0)
            tm.program_poll = std::chrono::milliseconds(*v);
    }

    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool AppConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                              "could not create config directory {}: {}",
                              dir.string(),
                              ec.message());
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

AppConfig AppConfig::load_or_default(const std::string& path)
{
    AppConfig     config;
    std::ifstream f(path);
    if (!f.is_open())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "config file {} not found, using defaults",
                          path);
        return config;
    }

    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    AppConfig   loaded;
    if (!loaded.deserialize(json))
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "config file {} could not be parsed, using defaults",
                          path);
        return config;
    }

    RAYSHELL_LOG_DEBUG(targets::CONFIG_DEBUG_GENERAL, "loaded config from {}", path);
    return loaded;
}

std::string AppConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "config.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "rayshell";
    return (dir / "config.json").string();
}

}   // namespace rayshell
