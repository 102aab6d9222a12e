#ifndef DIGIRAIN_GLYPH_ATLAS_HPP
#define DIGIRAIN_GLYPH_ATLAS_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace digirain {

    struct GlyphMetrics {
        float u_min;
        float v_min;
        float u_max;
        float v_max;
        int width;
        int height;
    };

    // Read-only after load. Pixels are RGBA8, rows top to bottom.
    class GlyphAtlas {
    public:
        bool load(const std::string& imagePath, const std::string& glyphMapPath);

        // Returns the number of accepted entries. Bad lines are logged and skipped.
        int loadGlyphMap(std::istream& in);

        void addGlyph(char32_t c, const GlyphMetrics& metrics);
        void setPixels(int size, std::vector<unsigned char> rgba);

        const GlyphMetrics* find(char32_t c) const;

        std::size_t glyphCount() const { return glyphs.size(); }
        int size() const { return imageSize; }
        const std::vector<unsigned char>& pixels() const { return rgba; }

    private:
        bool loadImage(const std::string& path);

        std::unordered_map<char32_t, GlyphMetrics> glyphs;
        std::vector<unsigned char> rgba;
        int imageSize = 0;
    };

}

#endif
