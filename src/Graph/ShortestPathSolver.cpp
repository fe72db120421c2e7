#include "Graph/ShortestPathSolver.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <queue>

namespace Pathfinder {

namespace {
    struct QueueEntry {
        double distance;
        std::uint64_t sequence;   // insertion order, breaks distance ties FIFO
        MarketState state;

        bool operator>(const QueueEntry& other) const noexcept {
            if (distance != other.distance) return distance > other.distance;
            return sequence > other.sequence;
        }
    };
}

std::optional<std::vector<MarketState>> ShortestPaths::path_to(MarketState target) const {
    if (target != start && !reachable(target)) return std::nullopt;

    std::vector<MarketState> path{target};
    MarketState current = target;

    // A valid chain visits each state at most once.
    for (std::size_t hops = 0; current != start; ++hops) {
        const auto& prev = predecessor[index_of(current)];
        if (!prev || hops >= kStateCount) return std::nullopt;
        current = *prev;
        path.push_back(current);
    }

    std::reverse(path.begin(), path.end());
    return path;
}

ShortestPaths ShortestPathSolver::solve(
    const StateGraph& graph,
    MarketState start,
    std::span<const MarketState> targets
) const {
    ShortestPaths result;
    result.start = start;
    result.distance.fill(std::numeric_limits<double>::infinity());
    result.distance[index_of(start)] = 0.0;

    std::array<bool, kStateCount> visited{};
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<>> queue;
    std::uint64_t sequence = 0;
    queue.push({0.0, sequence++, start});

    const auto all_targets_visited = [&]() {
        return std::all_of(targets.begin(), targets.end(),
                           [&](MarketState t) { return visited[index_of(t)]; });
    };

    while (!queue.empty()) {
        const QueueEntry entry = queue.top();
        queue.pop();

        if (visited[index_of(entry.state)]) continue;
        visited[index_of(entry.state)] = true;

        if (all_targets_visited()) break;

        for (const auto& [neighbor, weight] : graph.neighbors(entry.state)) {
            const double candidate = entry.distance + weight;
            if (candidate < result.distance[index_of(neighbor)]) {
                result.distance[index_of(neighbor)] = candidate;
                result.predecessor[index_of(neighbor)] = entry.state;
                queue.push({candidate, sequence++, neighbor});
            }
        }
    }

    return result;
}

double ShortestPathSolver::path_score(const StateGraph& graph, std::span<const MarketState> path) noexcept {
    double score = 0.0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        const auto w = graph.weight(path[i - 1], path[i]);
        if (!w) return std::numeric_limits<double>::infinity();
        score += *w;
    }
    return score;
}

} // namespace Pathfinder
