#pragma once
#include <span>
#include <vector>

namespace Pathfinder::Stats {
    [[nodiscard]] double mean(std::span<const double> values) noexcept;

    // Population standard deviation (ddof = 0). Zero for fewer than two samples.
    [[nodiscard]] double stddev(std::span<const double> values) noexcept;

    [[nodiscard]] int sign(double value) noexcept;

    // Sum of sign(v) over the values.
    [[nodiscard]] int sign_sum(std::span<const double> values) noexcept;

    [[nodiscard]] double clip(double value, double lo, double hi) noexcept;

    // Replaces NaN / +-inf with the fallback.
    [[nodiscard]] double finite_or(double value, double fallback = 0.0) noexcept;

    [[nodiscard]] std::vector<double> simple_returns(std::span<const double> prices);
}
