#include "GlyphBlit.hpp"

#include <cstddef>

namespace digirain {

    bool blitGlyph(const FT_Bitmap& bitmap, int bitmapTop, const AtlasCell& cell,
                   int atlasSize, std::vector<unsigned char>& atlas) {
        if (bitmap.pixel_mode != FT_PIXEL_MODE_GRAY) {
            return false;
        }

        int offsetX = (cell.size - static_cast<int>(bitmap.width)) / 2;
        int offsetY = cell.ascender - bitmapTop;

        for (unsigned int row = 0; row < bitmap.rows; row++) {
            for (unsigned int col = 0; col < bitmap.width; col++) {
                int gx = offsetX + static_cast<int>(col);
                int gy = offsetY + static_cast<int>(row);
                if (gx < 0 || gy < 0 || gx >= cell.size || gy >= cell.size) {
                    continue;
                }

                unsigned char coverage = bitmap.buffer[row * bitmap.pitch + col];
                std::size_t index = (static_cast<std::size_t>(cell.y + gy) * atlasSize + (cell.x + gx)) * 4;
                atlas[index + 0] = 255;
                atlas[index + 1] = 255;
                atlas[index + 2] = 255;
                atlas[index + 3] = coverage;
            }
        }
        return true;
    }

}
