#ifdef RAYSHELL_USE_IMGUI

    #include "imgui_frontend.hpp"

    #include <GLFW/glfw3.h>
    #include <imgui.h>
    #include <imgui_impl_glfw.h>
    #include <imgui_impl_opengl3.h>
    #include <rayshell/error.hpp>
    #include <rayshell/log_targets.hpp>
    #include <rayshell/logger.hpp>

    #include "config/constants.hpp"
    #include "resources/resource_manager.hpp"

namespace rayshell
{

namespace
{

constexpr const char* GLSL_VERSION = "#version 330";
const ImVec4          COLOUR_ERROR(1.0f, 0.35f, 0.35f, 1.0f);

ImGuiKey to_imgui_key(Key key)
{
    switch (key)
    {
        case Key::Space:
            return ImGuiKey_Space;
        case Key::Comma:
            return ImGuiKey_Comma;
        case Key::Period:
            return ImGuiKey_Period;
        case Key::Q:
            return ImGuiKey_Q;
        case Key::W:
            return ImGuiKey_W;
        case Key::Escape:
            return ImGuiKey_Escape;
        case Key::F1:
            return ImGuiKey_F1;
        case Key::F2:
            return ImGuiKey_F2;
        case Key::F3:
            return ImGuiKey_F3;
        case Key::F4:
            return ImGuiKey_F4;
        case Key::F5:
            return ImGuiKey_F5;
        case Key::F6:
            return ImGuiKey_F6;
        case Key::F7:
            return ImGuiKey_F7;
        case Key::F8:
            return ImGuiKey_F8;
        case Key::F9:
            return ImGuiKey_F9;
        case Key::F10:
            return ImGuiKey_F10;
        case Key::F11:
            return ImGuiKey_F11;
        case Key::F12:
            return ImGuiKey_F12;
        case Key::Unknown:
            break;
    }
    return ImGuiKey_None;
}

// Modifiers the binding does not ask for are ignored.
bool binding_pressed(const KeyBinding& binding)
{
    ImGuiKey key = to_imgui_key(binding.key);
    if (key == ImGuiKey_None || !ImGui::IsKeyPressed(key, false))
        return false;
    const ImGuiIO& io = ImGui::GetIO();
    return (!binding.ctrl || io.KeyCtrl) && (!binding.alt || io.KeyAlt)
           && (!binding.shift || io.KeyShift);
}

void toggle(bool& flag, const char* what)
{
    flag = !flag;
    RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_USER_INTERACTION,
                       "toggled {} window {}",
                       what,
                       flag ? "on" : "off");
}

}   // namespace

ImGuiFrontend::ImGuiFrontend(std::shared_ptr<AppConfigStore> config) : config_(std::move(config)) {}

ImGuiFrontend::~ImGuiFrontend()
{
    shutdown();
}

// ─── Lifecycle ──────────────────────────────────────────────────────────────

void ImGuiFrontend::init()
{
    AppConfig config = config_->snapshot();

    if (!adapter_.init(config.init.ui))
    {
        ErrorReport report("could not create the main window");
        report.wrap("failed to initialize the UI");
        report.note("the window needs an OpenGL 3.3 core context; check the multisampling ("
                    + std::to_string(config.init.ui.multisampling) + ") and vsync settings");
        throw Error(std::move(report));
    }

    IMGUI_CHECKVERSION();
    context_ = ImGui::CreateContext();
    ImGui::SetCurrentContext(context_);

    ImGuiIO& io  = ImGui::GetIO();
    ini_path_    = config.init.ui.imgui_ini_path;
    log_path_    = config.init.ui.imgui_log_path;
    io.IniFilename = ini_path_.empty() ? nullptr : ini_path_.c_str();
    io.LogFilename = log_path_.empty() ? nullptr : log_path_.c_str();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(adapter_.native_window(), true))
    {
        ErrorReport report("ImGui GLFW backend failed to initialize");
        report.wrap("failed to initialize the UI");
        throw Error(std::move(report));
    }
    if (!ImGui_ImplOpenGL3_Init(GLSL_VERSION))
    {
        ImGui_ImplGlfw_Shutdown();
        ErrorReport report("ImGui OpenGL3 backend failed to initialize");
        report.wrap("failed to initialize the UI");
        report.note(std::string("shader version: ") + GLSL_VERSION);
        throw Error(std::move(report));
    }
    backends_ready_ = true;

    atlas_ = std::make_unique<ImGuiFontAtlas>(io.Fonts);
    reload_fonts();

    RAYSHELL_LOG_INFO(targets::UI_DEBUG_GENERAL, "UI initialized");
}

void ImGuiFrontend::shutdown()
{
    if (backends_ready_)
    {
        ImGui::SetCurrentContext(context_);
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        backends_ready_ = false;
    }
    if (context_)
    {
        ImGui::DestroyContext(context_);
        context_ = nullptr;
    }
    atlas_.reset();
    adapter_.shutdown();
}

bool ImGuiFrontend::close_requested() const
{
    return adapter_.should_close();
}

// ─── Fonts ──────────────────────────────────────────────────────────────────

// A missing fonts folder is not fatal: ImGui's built-in font is used instead.
void ImGuiFrontend::reload_fonts()
{
    try
    {
        font_manager_.reload_list_from_resources(fonts_directory(config_->snapshot().runtime.resources));
    }
    catch (const Error& e)
    {
        ErrorReport report = e.report();
        report.wrap("could not reload fonts list from resources");
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "{}",
                          format_report(report, ErrorLogStyle::ShortWithCause));
    }
}

void ImGuiFrontend::rebuild_fonts_if_needed()
{
    if (font_manager_.fonts().empty())
        return;
    if (font_manager_.rebuild_font_if_needed(*atlas_))
    {
        // The old texture no longer matches the atlas.
        ImGui_ImplOpenGL3_DestroyFontsTexture();
        if (!ImGui_ImplOpenGL3_CreateFontsTexture())
        {
            ErrorReport report("could not upload the font texture");
            report.wrap("failed to rebuild fonts");
            throw Error(std::move(report));
        }
    }
}

// ─── Frame ──────────────────────────────────────────────────────────────────

FrameOutcome ImGuiFrontend::frame(UiData& ui)
{
    ImGui::SetCurrentContext(context_);
    adapter_.poll_events();

    rebuild_fonts_if_needed();

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    ImFont* font = font_manager_.has_font() ? atlas_->font(font_manager_.font_id()) : nullptr;
    if (font)
        ImGui::PushFont(font);

    AppConfig config = config_->snapshot();
    const auto& keys = config.runtime.keybindings;

    RAYSHELL_LOG_TRACE(targets::UI_TRACE_BUILD_INTERFACE, "building interface");
    handle_keybindings(keys, ui.windows);
    build_main_menu_bar(keys, ui.windows);

    if (ui.windows.metrics)
        ImGui::ShowMetricsWindow(&ui.windows.metrics);
    if (ui.windows.demo)
        ImGui::ShowDemoWindow(&ui.windows.demo);
    if (ui.windows.ui_management)
        build_ui_management_window(ui.windows.ui_management);
    if (ui.windows.config)
        build_config_window(config, ui.windows.config);

    if (font)
        ImGui::PopFont();

    RAYSHELL_LOG_TRACE(targets::UI_TRACE_RENDER, "rendering frame");
    ImGui::Render();
    uint32_t w = 0, h = 0;
    adapter_.framebuffer_size(w, h);
    glViewport(0, 0, static_cast<int>(w), static_cast<int>(h));
    glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    adapter_.swap_buffers();

    ++ui.frames;
    return adapter_.should_close() ? FrameOutcome::CloseRequested : FrameOutcome::Continue;
}

void ImGuiFrontend::handle_keybindings(const KeybindingsConfig& keys, ShownWindows& windows)
{
    if (binding_pressed(keys.toggle_metrics_window))
        toggle(windows.metrics, "metrics");
    if (binding_pressed(keys.toggle_demo_window))
        toggle(windows.demo, "demo");
    if (binding_pressed(keys.toggle_ui_managers_window))
        toggle(windows.ui_management, "UI management");
    if (binding_pressed(keys.toggle_config_window))
        toggle(windows.config, "config");
    if (binding_pressed(keys.exit_app))
    {
        RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_USER_INTERACTION, "exit keybinding pressed");
        adapter_.request_close();
    }
}

void ImGuiFrontend::build_main_menu_bar(const KeybindingsConfig& keys, ShownWindows& windows)
{
    if (!ImGui::BeginMainMenuBar())
        return;

    if (ImGui::BeginMenu("Tools"))
    {
        ImGui::MenuItem("Metrics", keys.toggle_metrics_window.to_string().c_str(), &windows.metrics);
        ImGui::MenuItem("Demo Window", keys.toggle_demo_window.to_string().c_str(), &windows.demo);
        ImGui::MenuItem("UI Management",
                        keys.toggle_ui_managers_window.to_string().c_str(),
                        &windows.ui_management);
        ImGui::MenuItem("Config", keys.toggle_config_window.to_string().c_str(), &windows.config);
        ImGui::Separator();
        if (ImGui::MenuItem("Exit", keys.exit_app.to_string().c_str()))
            adapter_.request_close();
        ImGui::EndMenu();
    }

    ImGui::EndMainMenuBar();
}

void ImGuiFrontend::build_ui_management_window(bool& open)
{
    if (ImGui::Begin("UI Management", &open))
        build_font_manager_panel();
    ImGui::End();
}

void ImGuiFrontend::build_font_manager_panel()
{
    if (!ImGui::CollapsingHeader("Font Manager", ImGuiTreeNodeFlags_DefaultOpen))
        return;

    if (ImGui::Button("Reload fonts list"))
    {
        RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_USER_INTERACTION, "font list reload requested");
        reload_fonts();
    }

    const auto& fonts = font_manager_.fonts();
    if (fonts.empty())
    {
        ImGui::TextColored(COLOUR_ERROR, "No fonts loaded");
        return;
    }

    const Font& current = fonts[font_manager_.selected_font_index()];
    if (ImGui::BeginCombo("Font", current.name.c_str()))
    {
        for (size_t i = 0; i < fonts.size(); ++i)
        {
            bool selected = i == font_manager_.selected_font_index();
            if (ImGui::Selectable(fonts[i].name.c_str(), selected))
                font_manager_.select_font(i);
        }
        ImGui::EndCombo();
    }

    const Font& font = fonts[font_manager_.selected_font_index()];
    if (font.weights.empty())
    {
        ImGui::TextColored(COLOUR_ERROR, "Font has no weights");
        return;
    }
    const char* weight_name = font.weights[font_manager_.selected_weight_index()].name.c_str();
    if (ImGui::BeginCombo("Weight", weight_name))
    {
        for (size_t i = 0; i < font.weights.size(); ++i)
        {
            bool selected = i == font_manager_.selected_weight_index();
            if (ImGui::Selectable(font.weights[i].name.c_str(), selected))
                font_manager_.select_weight(i);
        }
        ImGui::EndCombo();
    }

    float size = font_manager_.selected_size();
    if (ImGui::SliderFloat("Size", &size, constants::MIN_FONT_SIZE, constants::MAX_FONT_SIZE, "%.0f px"))
        font_manager_.set_size(size);
}

void ImGuiFrontend::build_config_window(const AppConfig& config, bool& open)
{
    if (!ImGui::Begin("Config", &open))
    {
        ImGui::End();
        return;
    }

    const auto& ui = config.init.ui;
    if (ImGui::TreeNode("Init time (restart to apply)"))
    {
        ImGui::Text("Window size: %ux%u", ui.window_width, ui.window_height);
        ImGui::Text("Start maximised: %s", ui.start_maximised ? "yes" : "no");
        ImGui::Text("VSync: %s", ui.vsync ? "yes" : "no");
        ImGui::Text("Hardware acceleration: %s",
                    ui.hardware_acceleration ? (*ui.hardware_acceleration ? "required" : "off")
                                             : "auto");
        ImGui::Text("Multisampling: %u", static_cast<unsigned>(ui.multisampling));
        ImGui::TreePop();
    }

    const auto& rt = config.runtime;
    if (ImGui::TreeNode("Keybindings"))
    {
        ImGui::Text("Toggle metrics: %s", rt.keybindings.toggle_metrics_window.to_string().c_str());
        ImGui::Text("Toggle demo: %s", rt.keybindings.toggle_demo_window.to_string().c_str());
        ImGui::Text("Toggle UI management: %s",
                    rt.keybindings.toggle_ui_managers_window.to_string().c_str());
        ImGui::Text("Toggle config: %s", rt.keybindings.toggle_config_window.to_string().c_str());
        ImGui::Text("Exit: %s", rt.keybindings.exit_app.to_string().c_str());
        ImGui::TreePop();
    }
    if (ImGui::TreeNode("Resources"))
    {
        ImGui::Text("Resources path: %s", rt.resources.resources_path.c_str());
        ImGui::Text("Fonts path: %s", rt.resources.fonts_path.c_str());
        ImGui::TreePop();
    }
    if (ImGui::TreeNode("Tracing"))
    {
        ImGui::Text("Error style: %s", to_string(rt.tracing.error_style).c_str());
        ImGui::Text("Min level: %s", Logger::level_to_string(rt.tracing.min_level).c_str());
        for (const auto& f : rt.tracing.target_filters)
            ImGui::BulletText("%s: %s", f.target.c_str(), f.enabled ? "on" : "off");
        ImGui::TreePop();
    }
    if (ImGui::TreeNode("Timing"))
    {
        ImGui::Text("Engine tick: %lld ms", static_cast<long long>(rt.timing.engine_tick.count()));
        ImGui::Text("UI tick: %lld ms", static_cast<long long>(rt.timing.ui_tick.count()));
        ImGui::Text("Program poll: %lld ms", static_cast<long long>(rt.timing.program_poll.count()));
        ImGui::TreePop();
    }

    ImGui::End();
}

}   // namespace rayshell

#endif   // RAYSHELL_USE_IMGUI
