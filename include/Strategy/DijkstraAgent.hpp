#ifndef DIJKSTRAAGENT_HPP
#define DIJKSTRAAGENT_HPP

#include <mutex>
#include <string>

#include "Core/DecisionTrace.hpp"
#include "Core/DijkstraConfig.hpp"
#include "Core/MarketState.hpp"
#include "Core/PriceWindow.hpp"
#include "Detectors/DeadlockDetector.hpp"
#include "Graph/GraphBuilder.hpp"
#include "Graph/StateDiscretizer.hpp"
#include "Strategy/DecisionPolicy.hpp"
#include "Strategy/HysteresisController.hpp"
#include "Strategy/ISignalAgent.hpp"
#include "Utils/ILogger.hpp"

namespace Pathfinder {

// Shortest-path decision engine.
//
// Every call rebuilds the state graph from the supplied window, searches for
// the cheapest route to the bullish and bearish regions, and turns the chosen
// target into a signal. The only memory carried between calls is the
// hysteresis semaphore, which belongs to this instance, so one agent per
// symbol keeps conviction histories apart.
//
// Calls are serialized internally: an agent may be shared between threads
// without losing semaphore updates. The logger is called after the lock is
// released, so a sink may query the agent.
class DijkstraAgent final : public ISignalAgent {
public:
    // `logger` is optional and must outlive the agent.
    explicit DijkstraAgent(DijkstraConfig cfg = {}, ILogger* logger = nullptr);

    // Fits on the window and returns the rounded signal. Never throws;
    // anything that goes wrong yields 0.0.
    double strategy(const PriceWindow& window) override;

    // Runs the pipeline and stores the outcome without returning it.
    void fit(const PriceWindow& window);

    // fit() followed by latest_signal(), or 0.0 when the fit failed.
    double predict(const PriceWindow& window);

    [[nodiscard]] std::string name() const override { return "Dijkstra Agent"; }

    [[nodiscard]] bool is_fitted() const;
    [[nodiscard]] double latest_signal() const;
    [[nodiscard]] MarketState current_state() const;
    [[nodiscard]] int semaphore() const;
    [[nodiscard]] DecisionTrace last_trace() const;
    [[nodiscard]] const DijkstraConfig& config() const noexcept { return cfg_; }

    // Clamped to the semaphore range.
    void set_semaphore(int value);

private:
    DijkstraConfig cfg_;
    ILogger* logger_;

    StateDiscretizer discretizer_;
    GraphBuilder graph_builder_;
    DecisionPolicy policy_;
    DeadlockDetector deadlock_detector_;

    mutable std::mutex mutex_;
    HysteresisController hysteresis_;
    DecisionTrace last_trace_;

    // Caller holds mutex_.
    void run_locked(const PriceWindow& window);
    void fit_locked(const PriceWindow& window);
    void mark_not_fitted();
};

} // namespace Pathfinder

#endif // DIJKSTRAAGENT_HPP
