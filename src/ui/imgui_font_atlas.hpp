#pragma once

#ifdef RAYSHELL_USE_IMGUI

    #include <vector>

    #include "font_atlas_backend.hpp"

struct ImFont;
struct ImFontAtlas;

namespace rayshell
{

// FontAtlas over the ImFontAtlas of the current ImGui context.
class ImGuiFontAtlas : public FontAtlas
{
   public:
    explicit ImGuiFontAtlas(ImFontAtlas* atlas) : atlas_(atlas) {}

    void       clear() override;
    FontHandle add_font_from_memory(const FontBytes&   data,
                                    float              size_px,
                                    const std::string& name) override;
    bool       build() override;

    // nullptr for an unknown handle.
    ImFont* font(FontHandle handle) const;

   private:
    ImFontAtlas*           atlas_;
    std::vector<ImFont*>   fonts_;
    std::vector<FontBytes> data_;   // kept alive until clear()
};

}   // namespace rayshell

#endif   // RAYSHELL_USE_IMGUI
