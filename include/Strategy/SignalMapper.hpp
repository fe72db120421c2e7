#pragma once
#include "Core/MarketState.hpp"

namespace Pathfinder {
    class SignalMapper {
    public:
        // Target value scaled by confidence, blended 70/30 with a nonzero deadlock
        // score, clipped to [-1, 1] and rounded to 4 decimals.
        [[nodiscard]] static double map(MarketState target, double confidence, double deadlock) noexcept;

        [[nodiscard]] static double round4(double value) noexcept;
    };
}
