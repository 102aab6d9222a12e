#ifndef DIGIRAIN_GLYPH_MESH_HPP
#define DIGIRAIN_GLYPH_MESH_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "Config.hpp"
#include "GlyphAtlas.hpp"
#include "Rain.hpp"

namespace digirain {

    struct GlyphVertex {
        glm::vec2 position;  // NDC
        glm::vec2 uv;
        glm::vec4 color;
    };

    // CPU-side copy of one frame's geometry. Storage is reserved once for
    // maxQuads and reused every frame.
    struct GlyphMesh {
        explicit GlyphMesh(std::size_t maxQuads = 0);

        void clear();
        std::size_t quadCount() const { return indices.size() / 6; }

        std::vector<GlyphVertex> vertices;
        std::vector<std::uint32_t> indices;
        std::size_t maxQuads;
    };

    struct MeshStats {
        int quads = 0;
        int misses = 0;   // character not in the atlas
        int culled = 0;   // row outside the padded viewport
        int dropped = 0;  // mesh capacity reached
    };

    class GlyphMeshBuilder {
    public:
        explicit GlyphMeshBuilder(const RainConfig& config);

        MeshStats build(const std::vector<Streak>& streaks, const GlyphAtlas& atlas,
                        int viewportWidth, int viewportHeight, GlyphMesh& mesh) const;

        // Color of row `row` in a chain of `length` rows. Row 0 is the head.
        glm::vec4 rowColor(int row, int length) const;

    private:
        void emitQuad(float x, float y, const GlyphMetrics& glyph, const glm::vec4& color,
                      float viewportWidth, float viewportHeight, GlyphMesh& mesh) const;

        float rowHeight;
        float cullPadding;
        float tailFloor;
    };

}

#endif
