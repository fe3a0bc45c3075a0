#pragma once

#ifdef RAYSHELL_USE_IMGUI

    #include <memory>
    #include <rayshell/config.hpp>
    #include <string>

    #include "font_manager.hpp"
    #include "glfw_adapter.hpp"
    #include "imgui_font_atlas.hpp"
    #include "ui_frontend.hpp"

struct ImGuiContext;

namespace rayshell
{

// Window frontend: GLFW + OpenGL 3 + Dear ImGui. Builds the main menu bar,
// the UI management window (font manager) and the config viewer.
class ImGuiFrontend : public UiFrontend
{
   public:
    explicit ImGuiFrontend(std::shared_ptr<AppConfigStore> config);
    ~ImGuiFrontend() override;

    // Throws Error if the window or the ImGui backends cannot be created.
    void         init() override;
    FrameOutcome frame(UiData& ui) override;
    bool         close_requested() const override;
    void         shutdown() override;

   private:
    void reload_fonts();
    void rebuild_fonts_if_needed();
    void handle_keybindings(const KeybindingsConfig& keys, ShownWindows& windows);
    void build_main_menu_bar(const KeybindingsConfig& keys, ShownWindows& windows);
    void build_ui_management_window(bool& open);
    void build_font_manager_panel();
    void build_config_window(const AppConfig& config, bool& open);

    std::shared_ptr<AppConfigStore> config_;
    GlfwAdapter                     adapter_;
    ImGuiContext*                   context_ = nullptr;
    std::unique_ptr<ImGuiFontAtlas> atlas_;
    FontManager                     font_manager_;
    std::string                     ini_path_;
    std::string                     log_path_;
    bool                            backends_ready_ = false;
};

}   // namespace rayshell

#endif   // RAYSHELL_USE_IMGUI
