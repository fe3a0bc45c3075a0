#ifdef RAYSHELL_USE_IMGUI

    #include "imgui_font_atlas.hpp"

    #include <algorithm>
    #include <imgui.h>

namespace rayshell
{

void ImGuiFontAtlas::clear()
{
    atlas_->Clear();
    fonts_.clear();
    data_.clear();
}

FontHandle ImGuiFontAtlas::add_font_from_memory(const FontBytes&   data,
                                                float              size_px,
                                                const std::string& name)
{
    ImFontConfig cfg;
    cfg.FontDataOwnedByAtlas = false;   // data_ owns the bytes
    size_t len               = std::min(name.size(), sizeof(cfg.Name) - 1);
    std::copy_n(name.data(), len, cfg.Name);
    cfg.Name[len] = '\0';

    data_.push_back(data);
    ImFont* font = atlas_->AddFontFromMemoryTTF(const_cast<uint8_t*>(data->data()),
                                                static_cast<int>(data->size()),
                                                size_px,
                                                &cfg);
    fonts_.push_back(font);
    return static_cast<FontHandle>(fonts_.size() - 1);
}

bool ImGuiFontAtlas::build()
{
    return atlas_->Build();
}

ImFont* ImGuiFontAtlas::font(FontHandle handle) const
{
    if (handle < 0 || static_cast<size_t>(handle) >= fonts_.size())
        return nullptr;
    return fonts_[static_cast<size_t>(handle)];
}

}   // namespace rayshell

#endif   // RAYSHELL_USE_IMGUI
