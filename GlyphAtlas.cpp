#include "GlyphAtlas.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace digirain {

    namespace {

        bool parseCodePoint(const std::string& token, char32_t& out) {
            std::string digits = token;
            if (digits.size() > 2 && (digits[0] == 'U' || digits[0] == 'u') && digits[1] == '+') {
                digits = digits.substr(2);
            }
            if (digits.empty()) {
                return false;
            }

            char* end = nullptr;
            unsigned long value = std::strtoul(digits.c_str(), &end, 16);
            if (*end != '\0' || value > 0x10FFFF) {
                return false;
            }
            out = static_cast<char32_t>(value);
            return true;
        }

        bool inUnitRange(float v) {
            return v >= 0.0f && v <= 1.0f;
        }

    }

    bool GlyphAtlas::load(const std::string& imagePath, const std::string& glyphMapPath) {
        if (!loadImage(imagePath)) {
            return false;
        }

        std::ifstream mapFile(glyphMapPath);
        if (!mapFile.is_open()) {
            std::cerr << "[ERROR] Could not open glyph map " << glyphMapPath << "\n";
            return false;
        }

        int accepted = loadGlyphMap(mapFile);
        std::cout << "[INFO] Font atlas loaded: " << imageSize << "x" << imageSize
            << " with " << accepted << " glyphs\n";
        return true;
    }

    bool GlyphAtlas::loadImage(const std::string& path) {
        int width = 0;
        int height = 0;
        int channels = 0;

        unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, STBI_rgb_alpha);
        if (!data) {
            std::cerr << "[ERROR] Could not decode atlas image " << path
                << ": " << stbi_failure_reason() << "\n";
            return false;
        }

        if (width != height) {
            std::cerr << "[ERROR] Atlas image " << path << " is " << width << "x" << height
                << ", expected a square image\n";
            stbi_image_free(data);
            return false;
        }

        std::vector<unsigned char> pixels(data, data + static_cast<std::size_t>(width) * height * 4);
        stbi_image_free(data);

        setPixels(width, std::move(pixels));
        return true;
    }

    int GlyphAtlas::loadGlyphMap(std::istream& in) {
        int accepted = 0;
        int lineNumber = 0;
        std::string line;

        while (std::getline(in, line)) {
            lineNumber++;

            std::string::size_type hash = line.find('#');
            if (hash != std::string::npos) {
                line.erase(hash);
            }

            std::istringstream fields(line);
            std::string codeToken;
            if (!(fields >> codeToken)) {
                continue;
            }

            char32_t c = 0;
            GlyphMetrics m;
            if (!parseCodePoint(codeToken, c) ||
                !(fields >> m.u_min >> m.v_min >> m.u_max >> m.v_max >> m.width >> m.height) ||
                !(fields >> std::ws).eof()) {
                std::cerr << "[WARN] Glyph map line " << lineNumber << " is malformed, skipped\n";
                continue;
            }

            if (!inUnitRange(m.u_min) || !inUnitRange(m.v_min) ||
                !inUnitRange(m.u_max) || !inUnitRange(m.v_max) ||
                m.u_min > m.u_max || m.v_min > m.v_max ||
                m.width <= 0 || m.height <= 0) {
                std::cerr << "[WARN] Glyph map line " << lineNumber
                    << " has an invalid rectangle, skipped\n";
                continue;
            }

            addGlyph(c, m);
            accepted++;
        }

        return accepted;
    }

    void GlyphAtlas::addGlyph(char32_t c, const GlyphMetrics& metrics) {
        glyphs[c] = metrics;
    }

    void GlyphAtlas::setPixels(int size, std::vector<unsigned char> pixels) {
        imageSize = size;
        rgba = std::move(pixels);
    }

    const GlyphMetrics* GlyphAtlas::find(char32_t c) const {
        auto it = glyphs.find(c);
        if (it == glyphs.end()) {
            return nullptr;
        }
        return &it->second;
    }

}
