#ifndef DIGIRAIN_CONFIG_HPP
#define DIGIRAIN_CONFIG_HPP

#include <cstdint>
#include <string>

namespace digirain {

    // Longest chain a streak can carry. Rows are 32 px tall, so 80 rows cover
    // more than two 1080p screen heights.
    const int kChainCapacity = 80;

    struct RainConfig {
        // spawn / layout (pixels)
        int columnSpacing = 20;
        float rowHeight = 32.0f;
        int minLength = 10;
        int maxLength = 40;

        // speed = U[speedBaseMin, speedBaseMax) + U[0, speedBoostMax)
        float speedBaseMin = 2.0f;
        float speedBaseMax = 4.0f;
        float speedBoostMax = 2.5f;

        // flicker cadence, in frames
        int flickerInterval = 6;
        int headFlickerInterval = 2;
        int maxMutationsPerTick = 2;

        // vertex generation
        float cullPadding = 50.0f;
        float tailFloor = 0.15f;

        std::u32string charset = defaultCharset();

        static std::u32string defaultCharset();
    };

    struct AppConfig {
        int windowWidth = 1280;
        int windowHeight = 720;
        std::string title = "Digital Rain";

        float targetFps = 75.0f;
        int swapInterval = 1;

        // upper bound for the GPU buffers: maxColumns * kChainCapacity quads
        int maxColumns = 256;

        std::string atlasImage = "assets/atlas.png";
        std::string atlasGlyphs = "assets/atlas.glyphs";
        std::string shaderDir = "shaders";

        bool fixedSeed = false;
        std::uint32_t seed = 0;

        RainConfig rain;
    };

    // Clamp user-provided tunables into ranges the simulation can always honor.
    RainConfig sanitize(RainConfig config);

}

#endif
