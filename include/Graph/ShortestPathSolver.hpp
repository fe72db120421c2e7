#pragma once
#include "Core/MarketState.hpp"
#include "Graph/StateGraph.hpp"
#include <array>
#include <optional>
#include <span>
#include <vector>

namespace Pathfinder {

// Output of one Dijkstra run from a single start state.
struct ShortestPaths {
    MarketState start = MarketState::NEUTRAL;
    std::array<double, kStateCount> distance{};
    std::array<std::optional<MarketState>, kStateCount> predecessor{};

    [[nodiscard]] double distance_to(MarketState target) const noexcept {
        return distance[index_of(target)];
    }

    // A target counts as reachable only if it was reached through at least one edge.
    [[nodiscard]] bool reachable(MarketState target) const noexcept {
        return predecessor[index_of(target)].has_value();
    }

    // start -> ... -> target, or nullopt if the predecessor chain never reaches start.
    [[nodiscard]] std::optional<std::vector<MarketState>> path_to(MarketState target) const;
};

class ShortestPathSolver {
public:
    // Stops as soon as every target has been settled or the queue runs dry.
    // Equal-distance entries are popped in insertion order.
    [[nodiscard]] ShortestPaths solve(
        const StateGraph& graph,
        MarketState start,
        std::span<const MarketState> targets
    ) const;

    // Sum of edge weights along `path`; +inf if a hop has no edge.
    [[nodiscard]] static double path_score(const StateGraph& graph, std::span<const MarketState> path) noexcept;
};

} // namespace Pathfinder
