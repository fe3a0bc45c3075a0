#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rayshell
{

// Opaque handle for a font added to an atlas.
using FontHandle = int;

// Raw font file contents, shared between FontManager and the atlas.
using FontBytes = std::shared_ptr<const std::vector<uint8_t>>;

// What FontManager needs from a GPU font atlas. The renderer's font texture
// must be re-uploaded after build().
class FontAtlas
{
   public:
    virtual ~FontAtlas() = default;

    virtual void clear() = 0;

    // An atlas that reads `data` after build() must hold on to it until the
    // next clear(); FontManager may drop its own copy at any time.
    virtual FontHandle add_font_from_memory(const FontBytes&   data,
                                            float              size_px,
                                            const std::string& name) = 0;

    // Returns false if the atlas could not be rasterized.
    virtual bool build() = 0;
};

}   // namespace rayshell
