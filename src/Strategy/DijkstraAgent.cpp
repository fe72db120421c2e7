#include "Strategy/DijkstraAgent.hpp"
#include "Strategy/SignalMapper.hpp"
#include "Utils/TimeLogger.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <vector>

namespace Pathfinder {

namespace {
    std::size_t lookback_of(const DijkstraConfig& cfg) {
        return static_cast<std::size_t>(std::max(0, cfg.lookback_window));
    }

    const char* describe(BuildError error) {
        switch (error) {
            case BuildError::INSUFFICIENT_DATA: return "insufficient data";
            case BuildError::LENGTH_MISMATCH:   return "price/volume length mismatch";
        }
        return "unknown";
    }
}

DijkstraAgent::DijkstraAgent(DijkstraConfig cfg, ILogger* logger)
    : cfg_(cfg),
      logger_(logger),
      discretizer_(lookback_of(cfg)),
      graph_builder_(cfg.risk_weight),
      policy_(PolicyConfig{cfg.state_threshold, cfg.structure_levels, cfg.deadlock_sensitivity}),
      deadlock_detector_(cfg.deadlock_sensitivity),
      hysteresis_(0) {}

double DijkstraAgent::strategy(const PriceWindow& window) {
    DecisionTrace trace;
    {
        // Constructed before the lock so it reports after the lock is released;
        // the measured time includes waiting for other callers.
        std::optional<TimeLogger> timer;
        if (logger_) timer.emplace(*logger_, "DijkstraAgent::strategy");

        std::lock_guard<std::mutex> lock(mutex_);
        run_locked(window);
        trace = last_trace_;
    }

    // Sinks run unlocked: they may block on I/O or read the agent back.
    if (logger_) {
        try {
            logger_->log_decision(name(), trace);
        } catch (const std::exception& e) {
            std::cerr << "[DIJKSTRA ERROR] telemetry: " << e.what() << std::endl;
        }
    }

    return trace.fitted ? trace.signal : 0.0;
}

void DijkstraAgent::fit(const PriceWindow& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    run_locked(window);
}

double DijkstraAgent::predict(const PriceWindow& window) {
    std::lock_guard<std::mutex> lock(mutex_);
    run_locked(window);
    return last_trace_.fitted ? last_trace_.signal : 0.0;
}

void DijkstraAgent::run_locked(const PriceWindow& window) {
    try {
        fit_locked(window);
    } catch (const std::exception& e) {
        std::cerr << "[DIJKSTRA ERROR] " << e.what() << std::endl;
        mark_not_fitted();
    }
}

//--------------------------------------------------------------------
// PIPELINE: discretize -> graph -> policy -> semaphore -> deadlock -> signal
//--------------------------------------------------------------------
void DijkstraAgent::fit_locked(const PriceWindow& window) {
    const std::size_t lookback = lookback_of(cfg_);

    // Not enough history: bail out before touching any state.
    auto discretized = discretizer_.discretize(window.closes);
    if (!discretized) {
        mark_not_fitted();
        return;
    }

    auto graph = graph_builder_.build(
        discretized->states,
        window.recent_closes(lookback),
        window.recent_volumes(lookback));
    if (!graph) {
        std::cerr << "[DIJKSTRA] Graph build failed: " << describe(graph.error()) << std::endl;
        mark_not_fitted();
        return;
    }

    const std::vector<double> returns = window.returns();
    const MarketState current = discretized->current;
    const int semaphore_before = hysteresis_.value();

    const Decision decision = policy_.decide(*graph, current, semaphore_before, returns);
    const DeadlockReading deadlock = deadlock_detector_.analyze(window.closes, current);

    // Last step that mutates the agent; nothing after it can throw.
    const int semaphore_after = hysteresis_.update(current, decision.target, returns);

    DecisionTrace trace;
    trace.fitted = true;
    trace.current_state = current;
    trace.target_state = decision.target;
    trace.confidence = decision.confidence;
    trace.decision_level = decision.level;
    trace.path_score = decision.path_score;
    trace.semaphore_before = semaphore_before;
    trace.semaphore_after = semaphore_after;
    trace.deadlock = deadlock;
    trace.graph_nodes = graph->node_count();
    trace.graph_edges = graph->edge_count();
    trace.signal = SignalMapper::map(decision.target, decision.confidence, deadlock.score);

    last_trace_ = trace;
}

void DijkstraAgent::mark_not_fitted() {
    DecisionTrace trace;
    trace.fitted = false;
    trace.current_state = last_trace_.current_state;
    trace.semaphore_before = hysteresis_.value();
    trace.semaphore_after = hysteresis_.value();
    last_trace_ = trace;
}

bool DijkstraAgent::is_fitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_trace_.fitted;
}

double DijkstraAgent::latest_signal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_trace_.fitted ? last_trace_.signal : 0.0;
}

MarketState DijkstraAgent::current_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_trace_.current_state;
}

int DijkstraAgent::semaphore() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hysteresis_.value();
}

DecisionTrace DijkstraAgent::last_trace() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_trace_;
}

void DijkstraAgent::set_semaphore(int value) {
    std::lock_guard<std::mutex> lock(mutex_);
    hysteresis_.reset(value);
}

} // namespace Pathfinder
