#include "Graph/GraphBuilder.hpp"
#include "Analysis/Statistics.hpp"

#include <array>
#include <cmath>

namespace Pathfinder {

double GraphBuilder::volume_weight(double volume, double volume_mean, double volume_std) noexcept {
    if (!(volume_std > 0.0)) return 1.0;

    const double z = Stats::finite_or((volume - volume_mean) / volume_std);
    return 1.0 + 0.2 * Stats::clip(z, -2.5, 2.5);
}

double GraphBuilder::edge_weight(double price_change, double volume_weight, double risk_weight) noexcept {
    // Dijkstra minimises, so rewards enter with a negative sign.
    const double reward = price_change > 0.0 ? -price_change * volume_weight : 0.0;
    const double risk = price_change < 0.0 ? std::abs(price_change) * volume_weight : 0.0;

    return Stats::finite_or(risk_weight * risk - (1.0 - risk_weight) * reward);
}

std::expected<StateGraph, BuildError> GraphBuilder::build(
    std::span<const MarketState> states,
    std::span<const double> prices,
    std::span<const double> volumes
) const {
    if (states.empty()) {
        return std::unexpected(BuildError::INSUFFICIENT_DATA);
    }
    if (prices.size() != states.size() || (!volumes.empty() && volumes.size() != states.size())) {
        return std::unexpected(BuildError::LENGTH_MISMATCH);
    }

    const bool use_volume = !volumes.empty();
    const double vol_mean = use_volume ? Stats::finite_or(Stats::mean(volumes)) : 0.0;
    const double vol_std = use_volume ? Stats::finite_or(Stats::stddev(volumes)) : 0.0;

    // Accumulate per-transition sums, then average.
    std::array<std::array<double, kStateCount>, kStateCount> sums{};
    std::array<std::array<int, kStateCount>, kStateCount> counts{};

    StateGraph graph;
    graph.add_node(states.front());

    for (std::size_t i = 1; i < states.size(); ++i) {
        const MarketState from = states[i - 1];
        const MarketState to = states[i];
        graph.add_node(to);

        if (from == to) continue;

        const double price_change = Stats::finite_or((prices[i] - prices[i - 1]) / prices[i - 1]);
        const double vw = use_volume ? volume_weight(volumes[i], vol_mean, vol_std) : 1.0;

        sums[index_of(from)][index_of(to)] += edge_weight(price_change, vw, risk_weight_);
        counts[index_of(from)][index_of(to)] += 1;
    }

    for (std::size_t from = 0; from < kStateCount; ++from) {
        for (std::size_t to = 0; to < kStateCount; ++to) {
            if (counts[from][to] == 0) continue;
            const double avg = sums[from][to] / static_cast<double>(counts[from][to]);
            graph.set_edge(kAllStates[from], kAllStates[to], Stats::finite_or(avg));
        }
    }

    return graph;
}

} // namespace Pathfinder
