#include "Strategy/DecisionPolicy.hpp"
#include "Analysis/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>

namespace Pathfinder {

TrendStats DecisionPolicy::trend_stats(std::span<const double> returns) noexcept {
    if (returns.size() < kTrendWindow) return {};

    const auto recent = returns.last(kTrendWindow);
    TrendStats stats;
    stats.volatility = Stats::finite_or(Stats::stddev(recent));
    stats.trend = stats.volatility > 0.0
        ? Stats::finite_or(Stats::mean(recent) / stats.volatility)
        : 0.0;
    return stats;
}

Decision DecisionPolicy::decide(
    const StateGraph& graph,
    MarketState current,
    int semaphore,
    std::span<const double> returns
) const noexcept {
    if (graph.empty() || !graph.has_node(current)) {
        return neutral_fallback();
    }

    try {
        const TrendStats stats = trend_stats(returns);

        if (cfg_.structure_levels >= 3) {
            if (auto decision = structured_level(graph, current, semaphore, stats)) {
                return *decision;
            }
        }
        if (cfg_.structure_levels >= 2) {
            if (auto decision = trend_level(stats)) {
                return *decision;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[DECISION ERROR] " << e.what() << ", falling back to neutral" << std::endl;
    }

    return neutral_fallback();
}

//--------------------------------------------------------------------
// LEVEL 3: shortest paths toward bullish / bearish regions
//--------------------------------------------------------------------
std::optional<Decision> DecisionPolicy::structured_level(
    const StateGraph& graph, MarketState current, int semaphore, const TrendStats& stats) const {

    const ShortestPaths bull = solver_.solve(graph, current, kBullishTargets);
    const ShortestPaths bear = solver_.solve(graph, current, kBearishTargets);

    const auto any_reachable = [](const ShortestPaths& paths, std::span<const MarketState> targets) {
        for (MarketState t : targets) {
            if (paths.reachable(t)) return true;
        }
        return false;
    };

    const bool bull_exists = any_reachable(bull, kBullishTargets);
    const bool bear_exists = any_reachable(bear, kBearishTargets);
    if (!bull_exists && !bear_exists) return std::nullopt;

    const double trend = stats.trend;
    const double breakout = cfg_.state_threshold * cfg_.deadlock_sensitivity;

    const bool bullish = bull_exists && (
        (semaphore > 0 && trend > 0.0) || semaphore >= 3 || trend > breakout);
    if (bullish) {
        if (auto decision = best_target(graph, bull, kBullishTargets)) {
            decision->confidence = Stats::clip(
                Stats::finite_or(0.5 + 0.1 * semaphore + 0.2 * trend), 0.0, 1.0);
            return decision;
        }
    }

    const bool bearish = bear_exists && (
        (semaphore < 0 && trend < 0.0) || semaphore <= -3 || trend < -breakout);
    if (bearish) {
        if (auto decision = best_target(graph, bear, kBearishTargets)) {
            decision->confidence = Stats::clip(
                Stats::finite_or(0.5 - 0.1 * semaphore - 0.2 * trend), 0.0, 1.0);
            return decision;
        }
    }

    return std::nullopt;
}

std::optional<Decision> DecisionPolicy::best_target(
    const StateGraph& graph, const ShortestPaths& paths, std::span<const MarketState> targets) const {

    std::optional<Decision> best;
    for (MarketState target : targets) {
        if (!paths.reachable(target)) continue;

        auto path = paths.path_to(target);
        if (!path) continue;

        const double score = ShortestPathSolver::path_score(graph, *path);
        if (!std::isfinite(score)) continue;

        // Strict comparison keeps the earlier target on ties.
        if (!best || score < best->path_score) {
            best = Decision{target, 0.0, 3, std::move(*path), score};
        }
    }
    return best;
}

//--------------------------------------------------------------------
// LEVEL 2: simple trend following
//--------------------------------------------------------------------
std::optional<Decision> DecisionPolicy::trend_level(const TrendStats& stats) const noexcept {
    const double trend = stats.trend;
    if (trend > cfg_.state_threshold) {
        return Decision{MarketState::SLIGHT_HIGH, std::min(0.7, 0.4 + trend), 2, {}, 0.0};
    }
    if (trend < -cfg_.state_threshold) {
        return Decision{MarketState::SLIGHT_LOW, std::min(0.7, 0.4 - trend), 2, {}, 0.0};
    }
    return std::nullopt;
}

} // namespace Pathfinder
