#include "Detectors/DeadlockDetector.hpp"
#include "Analysis/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace Pathfinder {

namespace {
    constexpr std::size_t kVolWindow = 10;
    constexpr std::size_t kRangeWindow = 10;
    constexpr std::size_t kRangeStep = 5;
    constexpr std::size_t kShortTrend = 10;
    constexpr std::size_t kLongTrend = 30;

    constexpr double kVolCollapse = -0.3;
    constexpr double kRangeCollapse = -0.2;
}

DeadlockReading DeadlockDetector::analyze(std::span<const double> prices, MarketState current) const {
    DeadlockReading reading;
    if (prices.size() < kMinPrices) return reading;

    const std::vector<double> returns = Stats::simple_returns(prices);

    reading.volatility_trend = volatility_trend(returns);
    reading.range_trend = range_trend(prices);
    reading.trend_divergence = trend_divergence(returns);
    reading.state_persistence = state_persistence(current);

    const double combined =
        reading.volatility_trend * 0.3 +
        reading.range_trend * 0.2 +
        reading.trend_divergence * 0.3 +
        reading.state_persistence * 0.2;

    reading.score = Stats::clip(Stats::finite_or(combined * sensitivity_), -1.0, 1.0);
    return reading;
}

//--------------------------------------------------------------------
// VOLATILITY COMPRESSION: "Is energy building up?"
//--------------------------------------------------------------------
double DeadlockDetector::volatility_trend(std::span<const double> returns) {
    std::vector<double> volatilities;
    for (std::size_t i = kVolWindow; i < returns.size(); ++i) {
        volatilities.push_back(Stats::stddev(returns.subspan(i - kVolWindow, kVolWindow)));
    }
    if (volatilities.size() < kVolWindow) return 0.0;

    const double latest = volatilities.back();
    const double earlier = volatilities[volatilities.size() - kVolWindow];
    const double change = (latest / earlier) - 1.0;

    // 0/0 on dead-flat series is not a collapse.
    if (!std::isfinite(change)) return 0.0;
    return change < kVolCollapse ? -1.0 : 0.0;
}

//--------------------------------------------------------------------
// RANGE COMPRESSION: "Is price consolidating?"
//--------------------------------------------------------------------
double DeadlockDetector::range_trend(std::span<const double> prices) {
    std::vector<double> ranges;
    for (std::size_t i = kRangeWindow; i < prices.size(); i += kRangeStep) {
        const auto window = prices.subspan(i - kRangeWindow, kRangeWindow);
        const auto [lo, hi] = std::minmax_element(window.begin(), window.end());
        ranges.push_back(*hi - *lo);
    }
    if (ranges.size() < 2) return 0.0;

    const double change = (ranges.back() / ranges.front()) - 1.0;
    if (!std::isfinite(change)) return 0.0;
    return change < kRangeCollapse ? -1.0 : 0.0;
}

double DeadlockDetector::trend_divergence(std::span<const double> returns) noexcept {
    if (returns.size() < kShortTrend) return 0.0;

    const double short_trend = Stats::mean(returns.last(kShortTrend));
    const double long_trend = returns.size() >= kLongTrend
        ? Stats::mean(returns.last(kLongTrend))
        : short_trend;

    if (short_trend * long_trend < 0.0) {
        return static_cast<double>(Stats::sign(short_trend));
    }
    return 0.0;
}

double DeadlockDetector::state_persistence(MarketState current) noexcept {
    switch (current) {
        case MarketState::EXTREME_LOW:
        case MarketState::EXTREME_HIGH:
            return -0.5;
        case MarketState::VERY_LOW:
        case MarketState::VERY_HIGH:
            return -0.3;
        default:
            return 0.0;
    }
}

} // namespace Pathfinder
