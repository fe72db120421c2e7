#pragma once
#include "Core/MarketState.hpp"
#include "Detectors/DeadlockDetector.hpp"
#include <cstddef>

namespace Pathfinder {

// Everything one decision produced, kept for telemetry and inspection.
// Trivially copyable so it can be handed across threads by value.
struct DecisionTrace {
    bool fitted = false;
    MarketState current_state = MarketState::NEUTRAL;
    MarketState target_state = MarketState::NEUTRAL;
    double confidence = 0.0;
    int decision_level = 1;
    double path_score = 0.0;
    int semaphore_before = 0;
    int semaphore_after = 0;
    DeadlockReading deadlock;
    std::size_t graph_nodes = 0;
    std::size_t graph_edges = 0;
    double signal = 0.0;
};

} // namespace Pathfinder
