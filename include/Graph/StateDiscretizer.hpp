#pragma once
#include "Core/MarketState.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace Pathfinder {

enum class DiscretizeError {
    INSUFFICIENT_DATA
};

struct Discretization {
    std::vector<MarketState> states;   // one label per price in the window
    MarketState current = MarketState::NEUTRAL;
    double mean = 0.0;
    double stddev = 0.0;
    bool degenerate = false;           // flat window, everything mapped to NEUTRAL
};

// Z-score binning of the most recent `lookback` prices into MarketStates.
class StateDiscretizer {
public:
    explicit StateDiscretizer(std::size_t lookback) : lookback_(lookback) {}

    [[nodiscard]] std::expected<Discretization, DiscretizeError>
    discretize(std::span<const double> prices) const;

    [[nodiscard]] static MarketState classify(double z) noexcept;

    [[nodiscard]] std::size_t lookback() const noexcept { return lookback_; }

private:
    std::size_t lookback_;
};

} // namespace Pathfinder
