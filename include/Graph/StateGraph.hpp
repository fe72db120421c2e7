#pragma once
#include "Core/MarketState.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace Pathfinder {

// Directed weighted graph over the 9 market states, stored as a fixed
// adjacency matrix. Lower weight = more attractive transition.
class StateGraph {
public:
    using Edge = std::pair<MarketState, double>;

    void add_node(MarketState state) noexcept;
    [[nodiscard]] bool has_node(MarketState state) const noexcept;
    [[nodiscard]] std::size_t node_count() const noexcept;

    // Adds the endpoints as nodes if needed; replaces an existing weight.
    void set_edge(MarketState from, MarketState to, double weight) noexcept;
    [[nodiscard]] bool has_edge(MarketState from, MarketState to) const noexcept;
    [[nodiscard]] std::optional<double> weight(MarketState from, MarketState to) const noexcept;
    [[nodiscard]] std::size_t edge_count() const noexcept;

    // Outgoing edges in ascending state order.
    [[nodiscard]] std::vector<Edge> neighbors(MarketState from) const;

    [[nodiscard]] bool empty() const noexcept { return node_count() == 0; }

    bool operator==(const StateGraph&) const = default;

private:
    std::array<bool, kStateCount> nodes_{};
    std::array<std::array<bool, kStateCount>, kStateCount> present_{};
    std::array<std::array<double, kStateCount>, kStateCount> weights_{};
};

} // namespace Pathfinder
