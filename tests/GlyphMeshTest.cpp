#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "GlyphMesh.hpp"

using namespace digirain;

namespace {

    Streak makeStreak(float x, float y, const std::u32string& chars) {
        Streak s;
        s.x = x;
        s.y = y;
        s.speed = 1.0f;
        s.length = static_cast<int>(chars.size());
        s.chars.fill(U' ');
        for (std::size_t i = 0; i < chars.size(); i++) {
            s.chars[i] = chars[i];
        }
        return s;
    }

    GlyphMetrics cell(float u, float v, float size) {
        GlyphMetrics m;
        m.u_min = u;
        m.v_min = v;
        m.u_max = u + size;
        m.v_max = v + size;
        m.width = 32;
        m.height = 32;
        return m;
    }

    // 2x2 atlas, every cell mapped
    GlyphAtlas quadAtlas() {
        GlyphAtlas atlas;
        atlas.addGlyph(U'A', cell(0.0f, 0.0f, 0.5f));
        atlas.addGlyph(U'B', cell(0.5f, 0.0f, 0.5f));
        atlas.addGlyph(U'C', cell(0.0f, 0.5f, 0.5f));
        atlas.addGlyph(U'D', cell(0.5f, 0.5f, 0.5f));
        return atlas;
    }

    float signedArea(const glm::vec2& a, const glm::vec2& b, const glm::vec2& c) {
        return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    }

}

TEST(GlyphMeshBuilder, SkipsCharactersMissingFromTheAtlas) {
    GlyphAtlas atlas;
    atlas.addGlyph(U'A', cell(0.0f, 0.0f, 0.5f));

    // rows at 100, 68, 36, 4: all visible
    std::vector<Streak> streaks = { makeStreak(0.0f, 100.0f, U"AB A") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(64);
    MeshStats stats = builder.build(streaks, atlas, 200, 200, mesh);

    EXPECT_EQ(stats.quads, 2);
    EXPECT_EQ(stats.misses, 2);
    EXPECT_EQ(mesh.quadCount(), 2u);
    EXPECT_EQ(mesh.vertices.size(), 8u);
    EXPECT_EQ(mesh.indices.size(), 12u);
}

TEST(GlyphMeshBuilder, SingleColumnEndToEnd) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = { makeStreak(0.0f, 50.0f, U"ABC") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(16);

    // rows at 50, 18, -14 are inside [-50, 150]
    MeshStats stats = builder.build(streaks, atlas, 20, 100, mesh);
    EXPECT_EQ(stats.quads, 3);
    EXPECT_EQ(stats.culled, 0);
    EXPECT_EQ(mesh.vertices.size(), 12u);
    EXPECT_EQ(mesh.indices.size(), 18u);

    GlyphAtlas empty;
    stats = builder.build(streaks, empty, 20, 100, mesh);
    EXPECT_EQ(stats.quads, 0);
    EXPECT_EQ(stats.misses, 3);
    EXPECT_TRUE(mesh.vertices.empty());
    EXPECT_TRUE(mesh.indices.empty());
}

TEST(GlyphMeshBuilder, CullsRowsOutsideThePaddedViewport) {
    GlyphAtlas atlas = quadAtlas();
    RainConfig config;
    config.cullPadding = 10.0f;

    // rows at 130, 98, 66, 34, 2, -30 against a 100 px viewport
    std::vector<Streak> streaks = { makeStreak(0.0f, 130.0f, U"ABCDAB") };

    GlyphMeshBuilder builder(config);
    GlyphMesh mesh(16);
    MeshStats stats = builder.build(streaks, atlas, 100, 100, mesh);

    EXPECT_EQ(stats.quads, 4);
    EXPECT_EQ(stats.culled, 2);
}

TEST(GlyphMeshBuilder, StreakFarBelowEmitsNothing) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = { makeStreak(0.0f, 5000.0f, U"ABCD") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(16);
    MeshStats stats = builder.build(streaks, atlas, 100, 100, mesh);

    EXPECT_EQ(stats.quads, 0);
    EXPECT_EQ(stats.culled, 4);
}

TEST(GlyphMeshBuilder, HeadIsWhiteAndTailFades) {
    RainConfig config;
    GlyphMeshBuilder builder(config);

    const int length = 40;
    EXPECT_EQ(builder.rowColor(0, length), glm::vec4(1.0f, 1.0f, 1.0f, 1.0f));

    float previous = 1.0f;
    for (int row = 1; row < length; row++) {
        glm::vec4 color = builder.rowColor(row, length);
        EXPECT_LE(color.g, previous) << "row " << row;
        EXPECT_GE(color.g, config.tailFloor) << "row " << row;
        EXPECT_LE(color.g, 1.0f);
        EXPECT_FLOAT_EQ(color.r, 0.0f);
        EXPECT_FLOAT_EQ(color.b, 0.0f);
        previous = color.g;
    }
    EXPECT_FLOAT_EQ(builder.rowColor(length - 1, length).g, config.tailFloor);
}

TEST(GlyphMeshBuilder, EmittedColorsFollowRowOrder) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = { makeStreak(0.0f, 80.0f, U"ABC") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(16);
    builder.build(streaks, atlas, 100, 100, mesh);

    ASSERT_EQ(mesh.vertices.size(), 12u);
    for (int v = 0; v < 4; v++) {
        EXPECT_EQ(mesh.vertices[v].color, glm::vec4(1.0f, 1.0f, 1.0f, 1.0f));
    }
    EXPECT_GT(mesh.vertices[4].color.g, mesh.vertices[8].color.g);
}

TEST(GlyphMeshBuilder, MapsPixelsToNdcCorners) {
    GlyphAtlas atlas;
    atlas.addGlyph(U'A', cell(0.25f, 0.5f, 0.25f));
    std::vector<Streak> streaks = { makeStreak(0.0f, 0.0f, U"A") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(4);
    builder.build(streaks, atlas, 64, 64, mesh);

    ASSERT_EQ(mesh.vertices.size(), 4u);
    // bottom-left, bottom-right, top-left, top-right
    EXPECT_EQ(mesh.vertices[0].position, glm::vec2(-1.0f, 0.0f));
    EXPECT_EQ(mesh.vertices[1].position, glm::vec2(0.0f, 0.0f));
    EXPECT_EQ(mesh.vertices[2].position, glm::vec2(-1.0f, 1.0f));
    EXPECT_EQ(mesh.vertices[3].position, glm::vec2(0.0f, 1.0f));

    EXPECT_EQ(mesh.vertices[0].uv, glm::vec2(0.25f, 0.75f));
    EXPECT_EQ(mesh.vertices[1].uv, glm::vec2(0.5f, 0.75f));
    EXPECT_EQ(mesh.vertices[2].uv, glm::vec2(0.25f, 0.5f));
    EXPECT_EQ(mesh.vertices[3].uv, glm::vec2(0.5f, 0.5f));
}

TEST(GlyphMeshBuilder, TrianglesWindCounterClockwise) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = {
        makeStreak(0.0f, 90.0f, U"ABCD"),
        makeStreak(40.0f, 30.0f, U"DCBA")
    };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(32);
    builder.build(streaks, atlas, 200, 120, mesh);

    ASSERT_EQ(mesh.indices.size() % 3, 0u);
    ASSERT_GT(mesh.indices.size(), 0u);
    for (std::size_t i = 0; i < mesh.indices.size(); i += 3) {
        const glm::vec2& a = mesh.vertices[mesh.indices[i]].position;
        const glm::vec2& b = mesh.vertices[mesh.indices[i + 1]].position;
        const glm::vec2& c = mesh.vertices[mesh.indices[i + 2]].position;
        EXPECT_GT(signedArea(a, b, c), 0.0f) << "triangle " << i / 3;
    }
}

TEST(GlyphMeshBuilder, StopsAtMeshCapacity) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = { makeStreak(0.0f, 90.0f, U"ABC") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(2);
    MeshStats stats = builder.build(streaks, atlas, 100, 100, mesh);

    EXPECT_EQ(stats.quads, 2);
    EXPECT_EQ(stats.dropped, 1);
    EXPECT_EQ(mesh.quadCount(), 2u);
}

TEST(GlyphMeshBuilder, RebuildReplacesPreviousFrame) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = { makeStreak(0.0f, 90.0f, U"ABC") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(16);
    builder.build(streaks, atlas, 100, 100, mesh);
    builder.build(streaks, atlas, 100, 100, mesh);

    EXPECT_EQ(mesh.quadCount(), 3u);
    EXPECT_EQ(mesh.indices.front(), 0u);
}

TEST(GlyphMeshBuilder, AccountsForEveryRowOfASimulation) {
    RainConfig config;
    config.charset = U"ABCDE";
    RainSimulation rain(640, 480, config, 42);
    for (int frame = 0; frame < 120; frame++) {
        rain.update();
    }

    GlyphAtlas atlas = quadAtlas();
    GlyphMeshBuilder builder(config);
    GlyphMesh mesh(static_cast<std::size_t>(RainSimulation::columnCount(640, config)) * kChainCapacity);
    MeshStats stats = builder.build(rain.streaks(), atlas, 640, 480, mesh);

    int rows = 0;
    for (const auto& s : rain.streaks()) {
        rows += s.length;
    }
    EXPECT_EQ(stats.quads + stats.misses + stats.culled + stats.dropped, rows);
    EXPECT_EQ(stats.dropped, 0);
    EXPECT_GT(stats.misses, 0);
    EXPECT_EQ(static_cast<std::size_t>(stats.quads), mesh.quadCount());
}

TEST(GlyphMeshBuilder, ZeroViewportEmitsNothing) {
    GlyphAtlas atlas = quadAtlas();
    std::vector<Streak> streaks = { makeStreak(0.0f, 10.0f, U"AB") };

    GlyphMeshBuilder builder{ RainConfig() };
    GlyphMesh mesh(16);
    MeshStats stats = builder.build(streaks, atlas, 0, 0, mesh);

    EXPECT_EQ(stats.quads, 0);
    EXPECT_TRUE(mesh.vertices.empty());
}
