#include <gtest/gtest.h>

#include <vector>

#include "GlyphBlit.hpp"

using namespace digirain;

namespace {

    const int kAtlasSize = 8;

    FT_Bitmap makeBitmap(std::vector<unsigned char>& pixels, unsigned int width, unsigned int rows,
                         int pitch, unsigned char pixelMode) {
        FT_Bitmap bitmap = {};
        bitmap.rows = rows;
        bitmap.width = width;
        bitmap.pitch = pitch;
        bitmap.buffer = pixels.data();
        bitmap.num_grays = pixelMode == FT_PIXEL_MODE_GRAY ? 256 : 2;
        bitmap.pixel_mode = pixelMode;
        return bitmap;
    }

    AtlasCell cellAt(int x, int y, int size, int ascender) {
        AtlasCell cell;
        cell.x = x;
        cell.y = y;
        cell.size = size;
        cell.ascender = ascender;
        return cell;
    }

    std::size_t pixelIndex(int x, int y) {
        return (static_cast<std::size_t>(y) * kAtlasSize + x) * 4;
    }

}

TEST(GlyphBlit, GrayCoverageBecomesAlpha) {
    std::vector<unsigned char> coverage = { 10, 20, 30, 40 };
    FT_Bitmap bitmap = makeBitmap(coverage, 2, 2, 2, FT_PIXEL_MODE_GRAY);
    std::vector<unsigned char> atlas(kAtlasSize * kAtlasSize * 4, 0);

    // 4 px cell at (2, 2): a 2 px glyph is centered at x + 1, top at ascender - bitmapTop
    ASSERT_TRUE(blitGlyph(bitmap, 3, cellAt(2, 2, 4, 3), kAtlasSize, atlas));

    EXPECT_EQ(atlas[pixelIndex(3, 2) + 3], 10);
    EXPECT_EQ(atlas[pixelIndex(4, 2) + 3], 20);
    EXPECT_EQ(atlas[pixelIndex(3, 3) + 3], 30);
    EXPECT_EQ(atlas[pixelIndex(4, 3) + 3], 40);
    EXPECT_EQ(atlas[pixelIndex(3, 2) + 0], 255);
    EXPECT_EQ(atlas[pixelIndex(2, 2) + 3], 0);
}

TEST(GlyphBlit, ClipsToTheCell) {
    std::vector<unsigned char> coverage(6 * 6, 200);
    FT_Bitmap bitmap = makeBitmap(coverage, 6, 6, 6, FT_PIXEL_MODE_GRAY);
    std::vector<unsigned char> atlas(kAtlasSize * kAtlasSize * 4, 0);

    ASSERT_TRUE(blitGlyph(bitmap, 0, cellAt(0, 0, 4, 0), kAtlasSize, atlas));

    int written = 0;
    for (int y = 0; y < kAtlasSize; y++) {
        for (int x = 0; x < kAtlasSize; x++) {
            if (atlas[pixelIndex(x, y) + 3] != 0) {
                EXPECT_LT(x, 4);
                EXPECT_LT(y, 4);
                written++;
            }
        }
    }
    EXPECT_EQ(written, 16);
}

TEST(GlyphBlit, MonoBitmapIsRejected) {
    // one row of 8 set pixels packed into a single byte
    std::vector<unsigned char> packed = { 0xFF };
    FT_Bitmap bitmap = makeBitmap(packed, 8, 1, 1, FT_PIXEL_MODE_MONO);
    std::vector<unsigned char> atlas(kAtlasSize * kAtlasSize * 4, 0);

    EXPECT_FALSE(blitGlyph(bitmap, 1, cellAt(0, 0, 8, 1), kAtlasSize, atlas));
    for (unsigned char byte : atlas) {
        ASSERT_EQ(byte, 0);
    }
}
