#ifndef DIGIRAIN_GLYPH_BLIT_HPP
#define DIGIRAIN_GLYPH_BLIT_HPP

#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H

namespace digirain {

    // Where a rendered glyph lands in the RGBA atlas.
    struct AtlasCell {
        int x = 0;
        int y = 0;
        int size = 0;
        int ascender = 0;
    };

    // Copies an 8-bit coverage bitmap into the atlas as white with alpha = coverage,
    // centered horizontally and sitting on the cell's baseline. Returns false, leaving
    // the atlas untouched, for any pixel mode other than FT_PIXEL_MODE_GRAY.
    bool blitGlyph(const FT_Bitmap& bitmap, int bitmapTop, const AtlasCell& cell,
                   int atlasSize, std::vector<unsigned char>& atlas);

}

#endif
