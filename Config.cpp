#include "Config.hpp"

#include <algorithm>

namespace digirain {

    std::u32string RainConfig::defaultCharset() {
        std::u32string chars;

        // half-width katakana
        for (char32_t c = 0xFF66; c <= 0xFF9D; c++) {
            chars.push_back(c);
        }
        for (char32_t c = U'0'; c <= U'9'; c++) {
            chars.push_back(c);
        }
        chars += U":.\"'-";

        return chars;
    }

    RainConfig sanitize(RainConfig config) {
        config.columnSpacing = std::max(1, config.columnSpacing);
        config.rowHeight = std::max(1.0f, config.rowHeight);

        config.minLength = std::min(std::max(1, config.minLength), kChainCapacity);
        config.maxLength = std::min(std::max(config.minLength, config.maxLength), kChainCapacity);

        config.speedBaseMin = std::max(0.1f, config.speedBaseMin);
        config.speedBaseMax = std::max(config.speedBaseMin, config.speedBaseMax);
        config.speedBoostMax = std::max(0.0f, config.speedBoostMax);

        config.flickerInterval = std::max(1, config.flickerInterval);
        config.headFlickerInterval = std::max(1, config.headFlickerInterval);
        config.maxMutationsPerTick = std::max(0, config.maxMutationsPerTick);

        config.cullPadding = std::max(0.0f, config.cullPadding);
        config.tailFloor = std::min(std::max(0.0f, config.tailFloor), 1.0f);

        if (config.charset.empty()) {
            config.charset = RainConfig::defaultCharset();
        }

        return config;
    }

}
