#include "Graph/StateGraph.hpp"
#include <algorithm>

namespace Pathfinder {

void StateGraph::add_node(MarketState state) noexcept {
    nodes_[index_of(state)] = true;
}

bool StateGraph::has_node(MarketState state) const noexcept {
    return nodes_[index_of(state)];
}

std::size_t StateGraph::node_count() const noexcept {
    return static_cast<std::size_t>(std::count(nodes_.begin(), nodes_.end(), true));
}

void StateGraph::set_edge(MarketState from, MarketState to, double weight) noexcept {
    add_node(from);
    add_node(to);
    present_[index_of(from)][index_of(to)] = true;
    weights_[index_of(from)][index_of(to)] = weight;
}

bool StateGraph::has_edge(MarketState from, MarketState to) const noexcept {
    return present_[index_of(from)][index_of(to)];
}

std::optional<double> StateGraph::weight(MarketState from, MarketState to) const noexcept {
    if (!has_edge(from, to)) return std::nullopt;
    return weights_[index_of(from)][index_of(to)];
}

std::size_t StateGraph::edge_count() const noexcept {
    std::size_t count = 0;
    for (const auto& row : present_) {
        count += static_cast<std::size_t>(std::count(row.begin(), row.end(), true));
    }
    return count;
}

std::vector<StateGraph::Edge> StateGraph::neighbors(MarketState from) const {
    std::vector<Edge> out;
    const auto& row = present_[index_of(from)];
    for (std::size_t to = 0; to < kStateCount; ++to) {
        if (row[to]) {
            out.emplace_back(kAllStates[to], weights_[index_of(from)][to]);
        }
    }
    return out;
}

} // namespace Pathfinder
