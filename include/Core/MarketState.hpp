#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Pathfinder {
    // Where the latest price sits relative to the window mean, in std-dev bands.
    enum class MarketState : std::uint8_t {
        EXTREME_LOW,    // z < -2
        VERY_LOW,       // -2 <= z < -1
        LOW,            // -1 <= z < -0.5
        SLIGHT_LOW,     // -0.5 <= z < -0.25
        NEUTRAL,        // -0.25 <= z < 0.25
        SLIGHT_HIGH,    // 0.25 <= z < 0.5
        HIGH,           // 0.5 <= z < 1
        VERY_HIGH,      // 1 <= z < 2
        EXTREME_HIGH    // z >= 2
    };

    inline constexpr std::size_t kStateCount = 9;

    inline constexpr std::array<MarketState, kStateCount> kAllStates{
        MarketState::EXTREME_LOW, MarketState::VERY_LOW, MarketState::LOW,
        MarketState::SLIGHT_LOW, MarketState::NEUTRAL, MarketState::SLIGHT_HIGH,
        MarketState::HIGH, MarketState::VERY_HIGH, MarketState::EXTREME_HIGH
    };

    inline constexpr std::array<MarketState, 3> kBullishTargets{
        MarketState::HIGH, MarketState::VERY_HIGH, MarketState::EXTREME_HIGH
    };

    inline constexpr std::array<MarketState, 3> kBearishTargets{
        MarketState::LOW, MarketState::VERY_LOW, MarketState::EXTREME_LOW
    };

    [[nodiscard]] constexpr std::size_t index_of(MarketState state) noexcept {
        return static_cast<std::size_t>(state);
    }

    // Ordinal position, -4 (EXTREME_LOW) .. +4 (EXTREME_HIGH).
    [[nodiscard]] constexpr int ordinal(MarketState state) noexcept {
        return static_cast<int>(state) - 4;
    }

    // Fixed value used when translating a target state into a trading signal.
    [[nodiscard]] constexpr double signal_value(MarketState state) noexcept {
        constexpr std::array<double, kStateCount> values{
            -1.0, -0.8, -0.6, -0.3, 0.0, 0.3, 0.6, 0.8, 1.0
        };
        return values[index_of(state)];
    }

    [[nodiscard]] constexpr std::string_view to_string(MarketState state) noexcept {
        switch (state) {
            case MarketState::EXTREME_LOW:  return "extreme_low";
            case MarketState::VERY_LOW:     return "very_low";
            case MarketState::LOW:          return "low";
            case MarketState::SLIGHT_LOW:   return "slight_low";
            case MarketState::NEUTRAL:      return "neutral";
            case MarketState::SLIGHT_HIGH:  return "slight_high";
            case MarketState::HIGH:         return "high";
            case MarketState::VERY_HIGH:    return "very_high";
            case MarketState::EXTREME_HIGH: return "extreme_high";
        }
        return "neutral";
    }
}
