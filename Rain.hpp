#ifndef DIGIRAIN_RAIN_HPP
#define DIGIRAIN_RAIN_HPP

#include <array>
#include <cstdint>
#include <random>
#include <vector>

#include "Config.hpp"

namespace digirain {

    struct Streak {
        float x;
        float y;        // head row, pixels from the top of the window
        float speed;    // pixels per frame, always > 0
        int length;     // active rows, <= kChainCapacity
        std::array<char32_t, kChainCapacity> chars;
    };

    class RainSimulation {
    public:
        RainSimulation(int width, int height, const RainConfig& config, std::uint32_t seed);
        RainSimulation(int width, int height, const RainConfig& config = RainConfig());

        void update();
        void resize(int width, int height);

        const std::vector<Streak>& streaks() const { return drops; }
        const RainConfig& config() const { return settings; }

        int width() const { return viewWidth; }
        int height() const { return viewHeight; }
        std::uint32_t frame() const { return frameCount; }

        // Streak count produced for a given width.
        static int columnCount(int width, const RainConfig& config);

    private:
        void spawnAll();
        void respawn(Streak& s, float headY);
        void flicker(Streak& s);
        char32_t randomChar();
        float randomSpeed();
        float randomColumn();

        RainConfig settings;
        std::vector<Streak> drops;
        int viewWidth;
        int viewHeight;
        std::uint32_t frameCount = 0;
        std::mt19937 rng;
    };

}

#endif
