#include "GlyphMesh.hpp"

#include <algorithm>

namespace digirain {

    GlyphMesh::GlyphMesh(std::size_t maxQuads)
        : maxQuads(maxQuads)
    {
        vertices.reserve(maxQuads * 4);
        indices.reserve(maxQuads * 6);
    }

    void GlyphMesh::clear() {
        vertices.clear();
        indices.clear();
    }

    GlyphMeshBuilder::GlyphMeshBuilder(const RainConfig& config) {
        RainConfig c = sanitize(config);
        rowHeight = c.rowHeight;
        cullPadding = c.cullPadding;
        tailFloor = c.tailFloor;
    }

    glm::vec4 GlyphMeshBuilder::rowColor(int row, int length) const {
        if (row <= 0) {
            return glm::vec4(1.0f, 1.0f, 1.0f, 1.0f);
        }

        float fade = 1.0f - static_cast<float>(row) / static_cast<float>(std::max(1, length));
        float green = std::min(std::max(fade, tailFloor), 1.0f);
        return glm::vec4(0.0f, green, 0.0f, 1.0f);
    }

    MeshStats GlyphMeshBuilder::build(const std::vector<Streak>& streaks, const GlyphAtlas& atlas,
                                      int viewportWidth, int viewportHeight, GlyphMesh& mesh) const {
        MeshStats stats;
        mesh.clear();

        if (viewportWidth <= 0 || viewportHeight <= 0) {
            return stats;
        }

        const float w = static_cast<float>(viewportWidth);
        const float h = static_cast<float>(viewportHeight);

        for (const auto& s : streaks) {
            int length = std::min(std::max(0, s.length), kChainCapacity);

            for (int row = 0; row < length; row++) {
                float y = s.y - row * rowHeight;
                if (y < -cullPadding || y > h + cullPadding) {
                    stats.culled++;
                    continue;
                }

                const GlyphMetrics* glyph = atlas.find(s.chars[row]);
                if (!glyph) {
                    stats.misses++;
                    continue;
                }

                if (mesh.quadCount() >= mesh.maxQuads) {
                    stats.dropped++;
                    continue;
                }

                emitQuad(s.x, y, *glyph, rowColor(row, length), w, h, mesh);
                stats.quads++;
            }
        }

        return stats;
    }

    void GlyphMeshBuilder::emitQuad(float x, float y, const GlyphMetrics& glyph, const glm::vec4& color,
                                    float viewportWidth, float viewportHeight, GlyphMesh& mesh) const {
        float left = 2.0f * x / viewportWidth - 1.0f;
        float right = 2.0f * (x + glyph.width) / viewportWidth - 1.0f;
        float top = 1.0f - 2.0f * y / viewportHeight;
        float bottom = 1.0f - 2.0f * (y + glyph.height) / viewportHeight;

        std::uint32_t base = static_cast<std::uint32_t>(mesh.vertices.size());

        // v_min is the top row of the glyph in the atlas image
        mesh.vertices.push_back({ glm::vec2(left, bottom), glm::vec2(glyph.u_min, glyph.v_max), color });
        mesh.vertices.push_back({ glm::vec2(right, bottom), glm::vec2(glyph.u_max, glyph.v_max), color });
        mesh.vertices.push_back({ glm::vec2(left, top), glm::vec2(glyph.u_min, glyph.v_min), color });
        mesh.vertices.push_back({ glm::vec2(right, top), glm::vec2(glyph.u_max, glyph.v_min), color });

        // BL BR TL, BR TR TL: both counter-clockwise
        const std::uint32_t quad[6] = { base, base + 1, base + 2, base + 1, base + 3, base + 2 };
        mesh.indices.insert(mesh.indices.end(), quad, quad + 6);
    }

}
