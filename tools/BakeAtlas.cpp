// Rasterizes the rain charset into a square RGBA atlas plus a glyph map.
//
//   bake_atlas <font.ttf> <out.png> <out.glyphs> [glyph_px] [atlas_px]

#include <ft2build.h>
#include FT_FREETYPE_H

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "Config.hpp"
#include "GlyphBlit.hpp"

using namespace digirain;

namespace {

    const int kPadding = 4;

    struct BakeSettings {
        std::string fontPath;
        std::string imagePath;
        std::string glyphsPath;
        int glyphSize = 32;
        int atlasSize = 512;
    };

    bool parseSettings(int argc, const char* argv[], BakeSettings& settings) {
        if (argc < 4) {
            std::cerr << "usage: " << argv[0] << " <font.ttf> <out.png> <out.glyphs> [glyph_px] [atlas_px]\n";
            return false;
        }
        settings.fontPath = argv[1];
        settings.imagePath = argv[2];
        settings.glyphsPath = argv[3];
        if (argc > 4) {
            settings.glyphSize = std::atoi(argv[4]);
        }
        if (argc > 5) {
            settings.atlasSize = std::atoi(argv[5]);
        }
        if (settings.glyphSize <= 0 || settings.atlasSize < settings.glyphSize + 2 * kPadding) {
            std::cerr << "[ERROR] Invalid glyph or atlas size\n";
            return false;
        }
        return true;
    }

}

int main(int argc, const char* argv[])
{
    BakeSettings settings;
    if (!parseSettings(argc, argv, settings)) {
        return 1;
    }

    FT_Library library = nullptr;
    if (FT_Init_FreeType(&library) != 0) {
        std::cerr << "[ERROR] Could not initialize FreeType\n";
        return 1;
    }

    FT_Face face = nullptr;
    if (FT_New_Face(library, settings.fontPath.c_str(), 0, &face) != 0) {
        std::cerr << "[ERROR] Could not load font " << settings.fontPath << "\n";
        FT_Done_FreeType(library);
        return 1;
    }

    if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(settings.glyphSize)) != 0) {
        std::cerr << "[ERROR] Font does not support " << settings.glyphSize << " px\n";
        FT_Done_Face(face);
        FT_Done_FreeType(library);
        return 1;
    }

    const int size = settings.atlasSize;
    const int cell = settings.glyphSize;
    const int ascender = static_cast<int>(face->size->metrics.ascender >> 6);

    // transparent black
    std::vector<unsigned char> atlas(static_cast<std::size_t>(size) * size * 4, 0);

    std::ofstream glyphs(settings.glyphsPath);
    if (!glyphs.is_open()) {
        std::cerr << "[ERROR] Could not write " << settings.glyphsPath << "\n";
        FT_Done_Face(face);
        FT_Done_FreeType(library);
        return 1;
    }
    glyphs << "# code u_min v_min u_max v_max width height\n";

    int x = kPadding;
    int y = kPadding;
    int baked = 0;
    int failed = 0;

    std::u32string charset = RainConfig::defaultCharset();
    for (char32_t c : charset) {
        if (x + cell + kPadding > size) {
            x = kPadding;
            y += cell + kPadding;
            if (y + cell + kPadding > size) {
                std::cerr << "[WARN] Font atlas full, skipping remaining characters\n";
                break;
            }
        }

        FT_UInt glyphIndex = FT_Get_Char_Index(face, static_cast<FT_ULong>(c));
        if (glyphIndex == 0 || FT_Load_Glyph(face, glyphIndex, FT_LOAD_RENDER) != 0) {
            std::cerr << "[WARN] Could not rasterize U+" << std::hex << static_cast<unsigned long>(c)
                << std::dec << "\n";
            failed++;
            continue;
        }

        AtlasCell target;
        target.x = x;
        target.y = y;
        target.size = cell;
        target.ascender = ascender;

        // mono bitmap fonts render 1-bit rows
        if (!blitGlyph(face->glyph->bitmap, face->glyph->bitmap_top, target, size, atlas)) {
            std::cerr << "[WARN] U+" << std::hex << static_cast<unsigned long>(c) << std::dec
                << " is not an 8-bit grayscale bitmap (pixel mode "
                << static_cast<int>(face->glyph->bitmap.pixel_mode) << "), skipped\n";
            failed++;
            continue;
        }

        char line[128];
        std::snprintf(line, sizeof(line), "U+%04lX %.6f %.6f %.6f %.6f %d %d\n",
            static_cast<unsigned long>(c),
            static_cast<float>(x) / size, static_cast<float>(y) / size,
            static_cast<float>(x + cell) / size, static_cast<float>(y + cell) / size,
            cell, cell);
        glyphs << line;

        baked++;
        x += cell + kPadding;
    }

    FT_Done_Face(face);
    FT_Done_FreeType(library);

    if (!stbi_write_png(settings.imagePath.c_str(), size, size, 4, atlas.data(), size * 4)) {
        std::cerr << "[ERROR] Could not write " << settings.imagePath << "\n";
        return 1;
    }

    std::cout << "[INFO] Generated font atlas with " << baked << " glyphs (" << size << "x" << size << ")\n";
    if (failed > 0) {
        std::cout << "[WARN] " << failed << " glyphs failed to rasterize\n";
    }
    return 0;
}
