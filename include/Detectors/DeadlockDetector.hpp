#pragma once
#include "Core/MarketState.hpp"
#include <cstddef>
#include <span>

namespace Pathfinder {

// Individual indicator readings plus the combined, sensitivity-scaled score.
struct DeadlockReading {
    double volatility_trend = 0.0;   // -1 when rolling volatility collapsed
    double range_trend = 0.0;        // -1 when the price range narrowed
    double trend_divergence = 0.0;   // sign of short-term drift when it opposes the long-term one
    double state_persistence = 0.0;  // penalty for sitting at an extreme state
    double score = 0.0;              // clipped to [-1, 1]
};

// Flags compressed / "stuck" markets that are likely to break out.
class DeadlockDetector {
public:
    static constexpr std::size_t kMinPrices = 30;

    explicit DeadlockDetector(double sensitivity) : sensitivity_(sensitivity) {}

    [[nodiscard]] DeadlockReading analyze(std::span<const double> prices, MarketState current) const;

    [[nodiscard]] double score(std::span<const double> prices, MarketState current) const {
        return analyze(prices, current).score;
    }

private:
    double sensitivity_;

    [[nodiscard]] static double volatility_trend(std::span<const double> returns);
    [[nodiscard]] static double range_trend(std::span<const double> prices);
    [[nodiscard]] static double trend_divergence(std::span<const double> returns) noexcept;
    [[nodiscard]] static double state_persistence(MarketState current) noexcept;
};

} // namespace Pathfinder
