#include "Rain.hpp"

#include <algorithm>
#include <cmath>

namespace digirain {

    RainSimulation::RainSimulation(int width, int height, const RainConfig& config, std::uint32_t seed)
        : settings(sanitize(config)), viewWidth(std::max(0, width)), viewHeight(std::max(0, height)), rng(seed)
    {
        spawnAll();
    }

    RainSimulation::RainSimulation(int width, int height, const RainConfig& config)
        : RainSimulation(width, height, config, std::random_device()())
    {
    }

    int RainSimulation::columnCount(int width, const RainConfig& config) {
        int spacing = std::max(1, config.columnSpacing);
        if (width <= 0) {
            return 0;
        }
        return (width + spacing - 1) / spacing;
    }

    void RainSimulation::spawnAll() {
        int columns = columnCount(viewWidth, settings);
        float h = static_cast<float>(std::max(1, viewHeight));

        drops.clear();
        drops.resize(columns);

        // Heads start anywhere from two screens above to the bottom edge, so the
        // first frames already show streaks at different depths.
        std::uniform_real_distribution<float> startY(-2.0f * h, h);

        for (int i = 0; i < columns; i++) {
            drops[i].x = static_cast<float>(i * settings.columnSpacing);
            respawn(drops[i], startY(rng));
        }
    }

    void RainSimulation::respawn(Streak& s, float headY) {
        std::uniform_int_distribution<int> lengthDist(settings.minLength, settings.maxLength);

        s.y = headY;
        s.speed = randomSpeed();
        s.length = std::min(lengthDist(rng), kChainCapacity);

        for (int i = 0; i < kChainCapacity; i++) {
            s.chars[i] = i < s.length ? randomChar() : U' ';
        }
    }

    void RainSimulation::update() {
        frameCount++;

        const float h = static_cast<float>(viewHeight);
        const bool headTick = frameCount % settings.headFlickerInterval == 0;
        const bool flickerTick = frameCount % settings.flickerInterval == 0;

        for (auto& s : drops) {
            s.y += s.speed;

            float tail = s.y - s.length * settings.rowHeight;
            if (tail > 2.0f * h) {
                std::uniform_real_distribution<float> aboveY(0.0f, std::max(1.0f, h));
                s.x = randomColumn();
                respawn(s, -aboveY(rng));
                continue;
            }

            if (headTick) {
                s.chars[0] = randomChar();
            }
            if (flickerTick) {
                flicker(s);
            }
        }
    }

    void RainSimulation::flicker(Streak& s) {
        const float h = static_cast<float>(viewHeight);
        const float rowH = settings.rowHeight;

        // mid-chain rows whose top edge is inside [0, height)
        int lo = std::max(1, static_cast<int>(std::floor((s.y - h) / rowH)) + 1);
        int hi = std::min(s.length - 1, static_cast<int>(std::floor(s.y / rowH)));
        if (s.y < 0.0f || lo > hi) {
            return;
        }

        std::uniform_int_distribution<int> row(lo, hi);
        for (int i = 0; i < settings.maxMutationsPerTick; i++) {
            s.chars[row(rng)] = randomChar();
        }
    }

    void RainSimulation::resize(int width, int height) {
        viewWidth = std::max(0, width);
        viewHeight = std::max(0, height);
        spawnAll();
    }

    char32_t RainSimulation::randomChar() {
        std::uniform_int_distribution<std::size_t> pick(0, settings.charset.size() - 1);
        return settings.charset[pick(rng)];
    }

    float RainSimulation::randomSpeed() {
        std::uniform_real_distribution<float> base(settings.speedBaseMin, settings.speedBaseMax);
        std::uniform_real_distribution<float> boost(0.0f, settings.speedBoostMax);
        return base(rng) + boost(rng);
    }

    float RainSimulation::randomColumn() {
        int columns = columnCount(viewWidth, settings);
        std::uniform_int_distribution<int> column(0, std::max(0, columns - 1));
        return static_cast<float>(column(rng) * settings.columnSpacing);
    }

}
