#pragma once
#include "Core/MarketState.hpp"
#include "Graph/ShortestPathSolver.hpp"
#include "Graph/StateGraph.hpp"
#include <span>
#include <vector>

namespace Pathfinder {

struct PolicyConfig {
    double state_threshold = 0.25;
    int structure_levels = 3;
    double deadlock_sensitivity = 1.5;
};

struct TrendStats {
    double volatility = 0.0;   // std of the last 10 returns
    double trend = 0.0;        // mean / std of the last 10 returns
};

struct Decision {
    MarketState target = MarketState::NEUTRAL;
    double confidence = 0.3;
    int level = 1;                         // decision level that produced the target
    std::vector<MarketState> path;         // only filled by level 3
    double path_score = 0.0;
};

// Three-level structured decision tree:
//   level 3 - shortest-path targets gated by semaphore and trend
//   level 2 - plain trend following toward SLIGHT_HIGH / SLIGHT_LOW
//   level 1 - stay NEUTRAL
class DecisionPolicy {
public:
    static constexpr std::size_t kTrendWindow = 10;

    explicit DecisionPolicy(PolicyConfig cfg) : cfg_(cfg) {}

    [[nodiscard]] Decision decide(
        const StateGraph& graph,
        MarketState current,
        int semaphore,
        std::span<const double> returns
    ) const noexcept;

    [[nodiscard]] static TrendStats trend_stats(std::span<const double> returns) noexcept;
    [[nodiscard]] static Decision neutral_fallback() noexcept { return Decision{}; }

private:
    PolicyConfig cfg_;
    ShortestPathSolver solver_;

    [[nodiscard]] std::optional<Decision> structured_level(
        const StateGraph& graph, MarketState current, int semaphore, const TrendStats& stats) const;
    [[nodiscard]] std::optional<Decision> trend_level(const TrendStats& stats) const noexcept;

    [[nodiscard]] std::optional<Decision> best_target(
        const StateGraph& graph, const ShortestPaths& paths, std::span<const MarketState> targets) const;
};

} // namespace Pathfinder
