#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <rayshell/error.hpp>
#include <string>
#include <vector>

#include "ui/font_manager.hpp"
#include "util/log_capture.hpp"

using namespace rayshell;
namespace fs = std::filesystem;

namespace
{

// Records what the manager asks of the atlas.
class FakeAtlas : public FontAtlas
{
   public:
    void clear() override
    {
        ++clears;
        names.clear();
        held.clear();
    }

    FontHandle add_font_from_memory(const FontBytes&   data,
                                    float              size_px,
                                    const std::string& name) override
    {
        names.push_back(name);
        held.push_back(data);
        last_size  = size_px;
        last_bytes = data->size();
        return next_handle++;
    }

    bool build() override
    {
        ++builds;
        return build_succeeds;
    }

    int                      clears = 0;
    int                      builds = 0;
    bool                     build_succeeds = true;
    FontHandle               next_handle    = 1;
    float                    last_size      = 0.0f;
    size_t                   last_bytes     = 0;
    std::vector<std::string> names;
    std::vector<FontBytes>   held;
};

class FontManagerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
               / (std::string("rayshell_fonts_")
                  + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_ / "sub");
        write("Fira Code (Bold).ttf", "bold-bytes");
        write("Fira Code (Regular).ttf", "regular");
        write("Alpha (Light).ttf", "light");
        write("readme.txt", "not a font");
        write("sub/Odd.ttf", "odd");
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write(const std::string& name, const std::string& content)
    {
        std::ofstream f(dir_ / name, std::ios::binary);
        f << content;
    }

    fs::path         dir_;
    test::LogCapture capture_;
};

}   // namespace

// ─── Loading ─────────────────────────────────────────────────────────────────

TEST_F(FontManagerTest, GroupsFilesByFamilyAndWeight)
{
    FontManager fm;
    fm.reload_list_from_resources(dir_);

    const auto& fonts = fm.fonts();
    ASSERT_EQ(fonts.size(), 3u);

    EXPECT_EQ(fonts[0].name, "Alpha");
    ASSERT_EQ(fonts[0].weights.size(), 1u);
    EXPECT_EQ(fonts[0].weights[0].name, "Light");

    EXPECT_EQ(fonts[1].name, "Fira Code");
    ASSERT_EQ(fonts[1].weights.size(), 2u);
    EXPECT_EQ(fonts[1].weights[0].name, "Bold");
    EXPECT_EQ(fonts[1].weights[1].name, "Regular");
    EXPECT_EQ(std::string(fonts[1].weights[0].data->begin(), fonts[1].weights[0].data->end()),
              "bold-bytes");

    EXPECT_EQ(fonts[2].name, "Unknown Fonts");
    ASSERT_EQ(fonts[2].weights.size(), 1u);
    EXPECT_EQ(fonts[2].weights[0].name, (fs::path("sub") / "Odd.ttf").string());
    EXPECT_TRUE(fm.is_dirty());
}

TEST_F(FontManagerTest, MissingDirectoryThrows)
{
    FontManager fm;
    try
    {
        fm.reload_list_from_resources(dir_ / "nope");
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.report().message(), "could not load fonts directory");
        ASSERT_EQ(e.report().notes().size(), 1u);
        EXPECT_NE(e.report().notes()[0].find("nope"), std::string::npos);
    }
}

TEST_F(FontManagerTest, EmptyDirectoryLeavesNoFonts)
{
    fs::remove_all(dir_);
    fs::create_directories(dir_);

    FontManager fm;
    fm.reload_list_from_resources(dir_);
    EXPECT_TRUE(fm.fonts().empty());
    EXPECT_TRUE(capture_.contains("no fonts after reloading"));
}

TEST_F(FontManagerTest, ReloadClampsSelectionToShrunkList)
{
    FontManager fm;
    fm.reload_list_from_resources(dir_);
    fm.select_font(1);
    fm.select_weight(1);
    ASSERT_EQ(fm.selected_font_index(), 1u);
    ASSERT_EQ(fm.selected_weight_index(), 1u);

    fs::remove(dir_ / "Fira Code (Bold).ttf");
    fs::remove(dir_ / "Fira Code (Regular).ttf");
    fs::remove_all(dir_ / "sub");
    fm.reload_list_from_resources(dir_);

    ASSERT_EQ(fm.fonts().size(), 1u);
    EXPECT_EQ(fm.selected_font_index(), 0u);
    EXPECT_EQ(fm.selected_weight_index(), 0u);
}

// ─── Atlas ───────────────────────────────────────────────────────────────────

TEST_F(FontManagerTest, RebuildWithoutFontsThrows)
{
    FontManager fm;
    FakeAtlas   atlas;
    try
    {
        fm.rebuild_font_if_needed(atlas);
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.report().message(), "could not rebuild font");
        EXPECT_EQ(e.report().suggestions().size(), 1u);
    }
    EXPECT_EQ(atlas.clears, 1);
    EXPECT_FALSE(fm.has_font());
}

TEST_F(FontManagerTest, RebuildsOnlyWhenSelectionChanges)
{
    FontManager fm;
    FakeAtlas   atlas;
    fm.reload_list_from_resources(dir_);

    EXPECT_TRUE(fm.rebuild_font_if_needed(atlas));
    ASSERT_EQ(atlas.names.size(), 1u);
    EXPECT_EQ(atlas.names[0], "Alpha - Light (16px)");
    EXPECT_EQ(atlas.last_bytes, 5u);
    EXPECT_EQ(fm.font_id(), 1);
    EXPECT_FALSE(fm.is_dirty());

    EXPECT_FALSE(fm.rebuild_font_if_needed(atlas));
    EXPECT_EQ(atlas.builds, 1);

    fm.select_font(0);   // same font, nothing changes
    EXPECT_FALSE(fm.rebuild_font_if_needed(atlas));

    fm.select_font(1);
    EXPECT_TRUE(fm.rebuild_font_if_needed(atlas));
    EXPECT_EQ(atlas.names.back(), "Fira Code - Bold (16px)");
    EXPECT_EQ(fm.font_id(), 2);

    fm.set_size(24.0f);
    EXPECT_TRUE(fm.rebuild_font_if_needed(atlas));
    EXPECT_EQ(atlas.names.back(), "Fira Code - Bold (24px)");
    EXPECT_FLOAT_EQ(atlas.last_size, 24.0f);
    EXPECT_EQ(atlas.builds, 3);
}

TEST_F(FontManagerTest, AtlasBytesSurviveReload)
{
    FontManager fm;
    FakeAtlas   atlas;
    fm.reload_list_from_resources(dir_);
    ASSERT_TRUE(fm.rebuild_font_if_needed(atlas));
    ASSERT_EQ(atlas.held.size(), 1u);
    std::weak_ptr<const std::vector<uint8_t>> built_from = atlas.held.front();

    // Reloading mid-frame replaces every font the manager owns, but the atlas
    // keeps the bytes it was built from until its next clear().
    fs::remove(dir_ / "Alpha (Light).ttf");
    write("Alpha (Light).ttf", "light-v2");
    fm.reload_list_from_resources(dir_);
    EXPECT_TRUE(fm.is_dirty());
    ASSERT_FALSE(built_from.expired());
    EXPECT_EQ(std::string(atlas.held.front()->begin(), atlas.held.front()->end()), "light");

    EXPECT_TRUE(fm.rebuild_font_if_needed(atlas));
    EXPECT_TRUE(built_from.expired());
    EXPECT_EQ(atlas.clears, 2);
    ASSERT_EQ(atlas.held.size(), 1u);
    EXPECT_EQ(std::string(atlas.held.front()->begin(), atlas.held.front()->end()), "light-v2");
}

TEST_F(FontManagerTest, FailedBuildLeavesNoFont)
{
    FontManager fm;
    FakeAtlas   atlas;
    atlas.build_succeeds = false;
    fm.reload_list_from_resources(dir_);

    EXPECT_THROW(fm.rebuild_font_if_needed(atlas), Error);
    EXPECT_FALSE(fm.has_font());
    EXPECT_TRUE(fm.is_dirty());
    EXPECT_THROW(fm.font_id(), Error);

    atlas.build_succeeds = true;
    EXPECT_TRUE(fm.rebuild_font_if_needed(atlas));
    EXPECT_TRUE(fm.has_font());
}

TEST(FontManager, FontIdBeforeBuildThrows)
{
    FontManager fm;
    try
    {
        fm.font_id();
        FAIL() << "expected Error";
    }
    catch (const Error& e)
    {
        EXPECT_EQ(e.report().message(), "could not get font id");
    }
}

// ─── Selection ───────────────────────────────────────────────────────────────

TEST_F(FontManagerTest, OutOfRangeSelectionIsIgnored)
{
    FontManager fm;
    FakeAtlas   atlas;
    fm.reload_list_from_resources(dir_);
    fm.rebuild_font_if_needed(atlas);

    fm.select_font(7);
    fm.select_weight(3);
    EXPECT_EQ(fm.selected_font_index(), 0u);
    EXPECT_EQ(fm.selected_weight_index(), 0u);
    EXPECT_FALSE(fm.is_dirty());
    EXPECT_EQ(capture_.count(LogLevel::Warning, "rayshell::general_warning_non_fatal"), 2u);
}

TEST_F(FontManagerTest, SizeIsClamped)
{
    FontManager fm;
    fm.set_size(500.0f);
    EXPECT_FLOAT_EQ(fm.selected_size(), 128.0f);
    fm.set_size(1.0f);
    EXPECT_FLOAT_EQ(fm.selected_size(), 8.0f);
    EXPECT_EQ(capture_.count(LogLevel::Warning, "rayshell::general_warning_non_fatal"), 2u);
}

TEST_F(FontManagerTest, SameSizeDoesNotDirty)
{
    FontManager fm;
    FakeAtlas   atlas;
    fm.reload_list_from_resources(dir_);
    fm.rebuild_font_if_needed(atlas);

    fm.set_size(fm.selected_size());
    EXPECT_FALSE(fm.is_dirty());
}
