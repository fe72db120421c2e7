#include "Graph/StateDiscretizer.hpp"
#include "Analysis/Statistics.hpp"

#include <algorithm>
#include <cmath>

namespace Pathfinder {

namespace {
    constexpr double kFlatTolerance = 1e-12;
}

MarketState StateDiscretizer::classify(double z) noexcept {
    if (!std::isfinite(z)) return MarketState::NEUTRAL;

    if (z < -2.0)  return MarketState::EXTREME_LOW;
    if (z < -1.0)  return MarketState::VERY_LOW;
    if (z < -0.5)  return MarketState::LOW;
    if (z < -0.25) return MarketState::SLIGHT_LOW;
    if (z < 0.25)  return MarketState::NEUTRAL;
    if (z < 0.5)   return MarketState::SLIGHT_HIGH;
    if (z < 1.0)   return MarketState::HIGH;
    if (z < 2.0)   return MarketState::VERY_HIGH;
    return MarketState::EXTREME_HIGH;
}

std::expected<Discretization, DiscretizeError>
StateDiscretizer::discretize(std::span<const double> prices) const {
    if (lookback_ == 0 || prices.size() < lookback_) {
        return std::unexpected(DiscretizeError::INSUFFICIENT_DATA);
    }

    const auto window = prices.last(lookback_);

    Discretization out;
    out.mean = Stats::mean(window);
    out.stddev = Stats::stddev(window);
    out.degenerate = !std::isfinite(out.stddev)
                  || out.stddev <= kFlatTolerance * std::max(1.0, std::abs(out.mean));

    out.states.reserve(window.size());
    for (double price : window) {
        out.states.push_back(out.degenerate
            ? MarketState::NEUTRAL
            : classify((price - out.mean) / out.stddev));
    }
    out.current = out.states.back();

    return out;
}

} // namespace Pathfinder
