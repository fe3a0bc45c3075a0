#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "font_atlas_backend.hpp"

namespace rayshell
{

struct FontWeight
{
    std::string name;
    FontBytes   data;
};

struct Font
{
    std::string             name;
    std::vector<FontWeight> weights;   // sorted by name
};

// Owns the fonts found on disk and the current selection, and rebuilds the
// atlas font only when the selection changed. Lives on the UI thread.
class FontManager
{
   public:
    FontManager();

    // Rescan `fonts_dir` recursively and replace the font list. Unreadable
    // files are skipped with a warning; indices are clamped to the new list.
    // Throws Error if the directory cannot be listed.
    void reload_list_from_resources(const std::filesystem::path& fonts_dir);

    // Rebuild the atlas if the selection changed or nothing is built yet.
    // Returns true if it rebuilt, in which case the caller MUST re-upload the
    // renderer's font texture before drawing. Throws Error if no fonts are
    // loaded or the atlas fails to build.
    bool rebuild_font_if_needed(FontAtlas& atlas);

    // Throws Error if rebuild_font_if_needed() has not built a font yet.
    FontHandle font_id() const;

    const std::vector<Font>& fonts() const { return fonts_; }
    size_t                   selected_font_index() const { return selected_font_index_; }
    size_t                   selected_weight_index() const { return selected_weight_index_; }
    float                    selected_size() const { return selected_size_; }
    bool                     is_dirty() const { return dirty_; }
    bool                     has_font() const { return current_font_.has_value(); }

    // Selection changes mark the manager dirty only if they change something.
    void select_font(size_t index);
    void select_weight(size_t index);
    void set_size(float size_px);

   private:
    void clamp_indices();

    std::vector<Font>         fonts_;
    size_t                    selected_font_index_   = 0;
    size_t                    selected_weight_index_ = 0;
    float                     selected_size_;
    std::optional<FontHandle> current_font_;
    bool                      dirty_ = true;
};

}   // namespace rayshell
