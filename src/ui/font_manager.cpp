#include "font_manager.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <rayshell/error.hpp>
#include <rayshell/log_targets.hpp>
#include <rayshell/logger.hpp>
#include <regex>

#include "config/constants.hpp"

namespace rayshell
{

FontManager::FontManager() : selected_size_(constants::DEFAULT_FONT_SIZE) {}

// ─── Loading ─────────────────────────────────────────────────────────────────

static bool read_file_bytes(const std::filesystem::path& path, std::vector<uint8_t>& out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "was not able to open font file at {}",
                          path.string());
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    if (f.bad())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "could not read bytes from font file at {}",
                          path.string());
        return false;
    }
    return true;
}

void FontManager::reload_list_from_resources(const std::filesystem::path& fonts_dir)
{
    RAYSHELL_LOG_DEBUG(targets::RESOURCES_DEBUG_LOAD,
                       "reloading fonts from resources folder {}",
                       fonts_dir.string());

    std::vector<std::filesystem::path> files;
    std::error_code                    ec;
    std::filesystem::recursive_directory_iterator it(fonts_dir, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec))
    {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec))
            files.push_back(it->path());
    }
    if (ec)
    {
        ErrorReport report(ec.message());
        report.wrap("could not load fonts directory");
        report.note("attempted to load from " + fonts_dir.string());
        throw Error(std::move(report));
    }
    std::sort(files.begin(), files.end());

    const std::regex path_filter(constants::FONT_FILE_PATH_FILTER);
    const std::regex name_extractor(constants::FONT_NAME_EXTRACTOR);

    // base font name -> weight name -> file data
    std::map<std::string, std::map<std::string, FontBytes>> found;
    for (const auto& path : files)
    {
        const std::string file_path = path.string();
        if (!std::regex_search(file_path, path_filter))
        {
            RAYSHELL_LOG_TRACE(targets::FONT_MANAGER_TRACE_FONT_LOAD,
                               "skipping non-matching file path at {}",
                               file_path);
            continue;
        }
        RAYSHELL_LOG_TRACE(targets::FONT_MANAGER_TRACE_FONT_LOAD,
                           "reading matching file at {}",
                           file_path);

        std::vector<uint8_t> data;
        if (!read_file_bytes(path, data))
            continue;

        std::string base_name   = constants::UNKNOWN_FONT_BASE_NAME;
        std::string weight_name = path.lexically_relative(fonts_dir).string();
        for (std::sregex_iterator m(file_path.begin(), file_path.end(), name_extractor), end;
             m != end;
             ++m)
        {
            if ((*m)[1].matched)
                base_name = (*m)[1].str();
            if ((*m)[2].matched)
                weight_name = (*m)[2].str();
        }

        RAYSHELL_LOG_TRACE(targets::FONT_MANAGER_TRACE_FONT_LOAD,
                           "inserting font {} @ {}",
                           base_name,
                           weight_name);
        auto& weights = found[base_name];
        if (weights.contains(weight_name))
        {
            RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                              "font entry already existed for {} @ {}",
                              base_name,
                              weight_name);
        }
        weights[weight_name] = std::make_shared<const std::vector<uint8_t>>(std::move(data));
    }

    fonts_.clear();
    for (auto& [base_name, weights] : found)
    {
        Font font;
        font.name = base_name;
        for (auto& [weight_name, data] : weights)
            font.weights.push_back(FontWeight{weight_name, std::move(data)});
        fonts_.push_back(std::move(font));
    }

    RAYSHELL_LOG_DEBUG(targets::RESOURCES_DEBUG_LOAD, "loaded {} font families", fonts_.size());

    clamp_indices();
    dirty_ = true;
}

// The list may have shrunk since the indices were chosen.
void FontManager::clamp_indices()
{
    if (fonts_.empty())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "font manager has no fonts after reloading");
        return;
    }
    if (selected_font_index_ >= fonts_.size())
    {
        RAYSHELL_LOG_TRACE(targets::FONT_MANAGER_TRACE_FONT_LOAD,
                           "font index {} out of range for {} fonts, clamping",
                           selected_font_index_,
                           fonts_.size());
        selected_font_index_ = fonts_.size() - 1;
    }

    const auto& weights = fonts_[selected_font_index_].weights;
    if (weights.empty())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "font manager has no weights for font {}",
                          fonts_[selected_font_index_].name);
        return;
    }
    if (selected_weight_index_ >= weights.size())
    {
        RAYSHELL_LOG_TRACE(targets::FONT_MANAGER_TRACE_FONT_LOAD,
                           "weight index {} out of range for {} weights, clamping",
                           selected_weight_index_,
                           weights.size());
        selected_weight_index_ = weights.size() - 1;
    }
}

// ─── Atlas ───────────────────────────────────────────────────────────────────

bool FontManager::rebuild_font_if_needed(FontAtlas& atlas)
{
    if (!dirty_ && current_font_)
        return false;

    RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_GENERAL, "clearing font atlas");
    atlas.clear();
    current_font_.reset();

    if (fonts_.empty())
    {
        ErrorReport report("no fonts loaded");
        report.wrap("could not rebuild font");
        report.suggestion("ensure reload_list_from_resources() has been called and completed "
                          "without error");
        throw Error(std::move(report));
    }

    selected_font_index_ = std::min(selected_font_index_, fonts_.size() - 1);
    const Font& font     = fonts_[selected_font_index_];
    if (font.weights.empty())
    {
        ErrorReport report("font " + font.name + " has no weights");
        report.wrap("could not rebuild font");
        throw Error(std::move(report));
    }
    selected_weight_index_  = std::min(selected_weight_index_, font.weights.size() - 1);
    const FontWeight& weight = font.weights[selected_weight_index_];

    selected_size_ = std::clamp(selected_size_, constants::MIN_FONT_SIZE, constants::MAX_FONT_SIZE);

    std::string full_name = font.name + " - " + weight.name + " ("
                            + std::to_string(static_cast<int>(selected_size_)) + "px)";
    RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_GENERAL, "building font {}", full_name);

    FontHandle handle = atlas.add_font_from_memory(weight.data, selected_size_, full_name);
    if (!atlas.build())
    {
        ErrorReport report("font atlas failed to build");
        report.wrap("could not rebuild font");
        report.note("font: " + full_name);
        throw Error(std::move(report));
    }

    current_font_ = handle;
    dirty_        = false;
    return true;
}

FontHandle FontManager::font_id() const
{
    if (!current_font_)
    {
        ErrorReport report("no font has been built");
        report.wrap("could not get font id");
        report.note("the font id is set when the atlas is rebuilt by rebuild_font_if_needed()");
        report.suggestion("call rebuild_font_if_needed() before font_id()");
        throw Error(std::move(report));
    }
    return *current_font_;
}

// ─── Selection ───────────────────────────────────────────────────────────────

void FontManager::select_font(size_t index)
{
    if (index >= fonts_.size())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "font index {} out of range ({} fonts), ignoring",
                          index,
                          fonts_.size());
        return;
    }
    if (index == selected_font_index_)
        return;

    RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_USER_INTERACTION,
                       "changed font to [{}]: {}",
                       index,
                       fonts_[index].name);
    selected_font_index_ = index;
    clamp_indices();
    dirty_ = true;
}

void FontManager::select_weight(size_t index)
{
    if (fonts_.empty() || index >= fonts_[selected_font_index_].weights.size())
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "weight index {} out of range, ignoring",
                          index);
        return;
    }
    if (index == selected_weight_index_)
        return;

    RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_USER_INTERACTION,
                       "changed weight to [{}]: {}",
                       index,
                       fonts_[selected_font_index_].weights[index].name);
    selected_weight_index_ = index;
    dirty_                 = true;
}

void FontManager::set_size(float size_px)
{
    float clamped = std::clamp(size_px, constants::MIN_FONT_SIZE, constants::MAX_FONT_SIZE);
    if (clamped != size_px)
    {
        RAYSHELL_LOG_WARN(targets::GENERAL_WARNING_NON_FATAL,
                          "font size {} outside [{}, {}], clamping",
                          size_px,
                          constants::MIN_FONT_SIZE,
                          constants::MAX_FONT_SIZE);
    }
    if (clamped == selected_size_)
        return;

    RAYSHELL_LOG_DEBUG(targets::UI_DEBUG_USER_INTERACTION, "changed font size to {}px", clamped);
    selected_size_ = clamped;
    dirty_         = true;
}

}   // namespace rayshell
