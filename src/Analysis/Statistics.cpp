#include "Analysis/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace Pathfinder::Stats {

double mean(std::span<const double> values) noexcept {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

//--------------------------------------------------------------------
// VOLATILITY: population standard deviation around the sample mean
//--------------------------------------------------------------------
double stddev(std::span<const double> values) noexcept {
    if (values.size() < 2) return 0.0;

    const double mu = mean(values);
    double variance = 0.0;
    for (double v : values) {
        variance += (v - mu) * (v - mu);
    }
    variance /= static_cast<double>(values.size());

    return std::sqrt(variance);
}

int sign(double value) noexcept {
    return (value > 0.0) - (value < 0.0);
}

int sign_sum(std::span<const double> values) noexcept {
    int total = 0;
    for (double v : values) total += sign(v);
    return total;
}

double clip(double value, double lo, double hi) noexcept {
    return std::min(hi, std::max(lo, value));
}

double finite_or(double value, double fallback) noexcept {
    return std::isfinite(value) ? value : fallback;
}

std::vector<double> simple_returns(std::span<const double> prices) {
    std::vector<double> out;
    if (prices.size() < 2) return out;

    out.reserve(prices.size() - 1);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        out.push_back(finite_or((prices[i] - prices[i - 1]) / prices[i - 1]));
    }
    return out;
}

} // namespace Pathfinder::Stats
