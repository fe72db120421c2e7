#include <gtest/gtest.h>
#include "Strategy/DijkstraAgent.hpp"

#include <atomic>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Pathfinder;

namespace {
    PriceWindow rising_window() {
        std::vector<double> closes;
        for (int i = 0; i < 52; ++i) closes.push_back(100.0 + i);
        return PriceWindow(closes);
    }

    PriceWindow falling_window() {
        std::vector<double> closes;
        for (int i = 0; i < 52; ++i) closes.push_back(200.0 - i);
        return PriceWindow(closes);
    }

    PriceWindow wavy_window(std::size_t n) {
        std::vector<double> closes;
        std::vector<double> volumes;
        for (std::size_t i = 0; i < n; ++i) {
            const double t = static_cast<double>(i);
            closes.push_back(100.0 + 8.0 * std::sin(0.3 * t) + 3.0 * std::cos(1.1 * t));
            volumes.push_back(1000.0 + 250.0 * std::sin(0.7 * t));
        }
        return PriceWindow(closes, volumes);
    }

    class RecordingLogger : public ILogger {
    public:
        void log(const std::string& methodName, long) override {
            timings.push_back(methodName);
        }
        void log_decision(const std::string& agentName, const DecisionTrace& trace) override {
            agents.push_back(agentName);
            traces.push_back(trace);
        }

        std::vector<std::string> timings;
        std::vector<std::string> agents;
        std::vector<DecisionTrace> traces;
    };

    // Reads the agent back from inside the callbacks, as a dashboard sink would.
    class ReadBackLogger : public ILogger {
    public:
        void log(const std::string&, long) override {
            if (agent) semaphore_at_timing = agent->semaphore();
        }
        void log_decision(const std::string&, const DecisionTrace&) override {
            if (agent) {
                semaphore_at_decision = agent->semaphore();
                fitted_at_decision = agent->last_trace().fitted;
            }
        }

        DijkstraAgent* agent = nullptr;
        int semaphore_at_timing = 99;
        int semaphore_at_decision = 99;
        bool fitted_at_decision = false;
    };

    class ThrowingLogger : public ILogger {
    public:
        void log(const std::string&, long) override { throw std::runtime_error("timing sink down"); }
        void log_decision(const std::string&, const DecisionTrace&) override {
            throw std::runtime_error("decision sink down");
        }
    };
}

TEST(DijkstraAgentTest, RisingMarketGivesPositiveSignal) {
    DijkstraAgent agent;
    const double signal = agent.strategy(rising_window());

    EXPECT_TRUE(agent.is_fitted());
    EXPECT_GT(signal, 0.0);
    EXPECT_NEAR(signal, 0.12, 1e-3);
    EXPECT_EQ(agent.current_state(), MarketState::VERY_HIGH);

    const DecisionTrace trace = agent.last_trace();
    EXPECT_EQ(trace.target_state, MarketState::SLIGHT_HIGH);
    EXPECT_EQ(trace.decision_level, 2);
    EXPECT_EQ(trace.semaphore_before, 0);
    EXPECT_EQ(trace.semaphore_after, -1);
    EXPECT_EQ(agent.semaphore(), -1);
}

TEST(DijkstraAgentTest, FallingMarketGivesNegativeSignal) {
    DijkstraAgent agent;
    const double signal = agent.strategy(falling_window());

    EXPECT_LT(signal, 0.0);
    EXPECT_NEAR(signal, -0.174, 1e-3);
    EXPECT_EQ(agent.current_state(), MarketState::VERY_LOW);
    EXPECT_EQ(agent.last_trace().target_state, MarketState::SLIGHT_LOW);
    EXPECT_EQ(agent.semaphore(), 1);
}

TEST(DijkstraAgentTest, FlatMarketIsExactlyNeutral) {
    DijkstraAgent agent;
    const double signal = agent.strategy(PriceWindow(std::vector<double>(52, 100.0)));

    EXPECT_TRUE(agent.is_fitted());
    EXPECT_DOUBLE_EQ(signal, 0.0);
    EXPECT_EQ(agent.current_state(), MarketState::NEUTRAL);
    EXPECT_EQ(agent.last_trace().graph_nodes, 1u);
    EXPECT_EQ(agent.last_trace().graph_edges, 0u);
}

TEST(DijkstraAgentTest, ShortHistoryIsNotFitted) {
    DijkstraAgent agent;
    agent.set_semaphore(2);

    std::vector<double> closes;
    for (int i = 0; i < 41; ++i) closes.push_back(100.0 + i);

    EXPECT_DOUBLE_EQ(agent.strategy(PriceWindow(closes)), 0.0);
    EXPECT_FALSE(agent.is_fitted());
    EXPECT_DOUBLE_EQ(agent.latest_signal(), 0.0);
    EXPECT_EQ(agent.semaphore(), 2);

    EXPECT_DOUBLE_EQ(agent.strategy(PriceWindow{}), 0.0);
}

TEST(DijkstraAgentTest, FailedFitClearsPreviousSignal) {
    DijkstraAgent agent;
    ASSERT_NE(agent.strategy(rising_window()), 0.0);

    std::vector<double> closes(10, 100.0);
    agent.fit(PriceWindow(closes));
    EXPECT_FALSE(agent.is_fitted());
    EXPECT_DOUBLE_EQ(agent.latest_signal(), 0.0);
}

TEST(DijkstraAgentTest, SameInputsSameOutputs) {
    const PriceWindow window = wavy_window(120);

    DijkstraAgent first;
    DijkstraAgent second;
    first.set_semaphore(2);
    second.set_semaphore(2);

    EXPECT_DOUBLE_EQ(first.strategy(window), second.strategy(window));
    EXPECT_EQ(first.semaphore(), second.semaphore());
    EXPECT_EQ(first.last_trace().target_state, second.last_trace().target_state);
}

TEST(DijkstraAgentTest, SignalAndSemaphoreStayBounded) {
    DijkstraAgent agent;
    for (std::size_t n = 42; n < 160; n += 3) {
        const double signal = agent.predict(wavy_window(n));
        EXPECT_GE(signal, -1.0);
        EXPECT_LE(signal, 1.0);
        EXPECT_GE(agent.semaphore(), HysteresisController::kMin);
        EXPECT_LE(agent.semaphore(), HysteresisController::kMax);
    }
}

TEST(DijkstraAgentTest, MismatchedVolumesAreIgnored) {
    std::vector<double> closes;
    for (int i = 0; i < 52; ++i) closes.push_back(100.0 + i);

    DijkstraAgent with_bad_volume;
    DijkstraAgent without_volume;
    EXPECT_DOUBLE_EQ(with_bad_volume.strategy(PriceWindow(closes, std::vector<double>(7, 1.0))),
                     without_volume.strategy(PriceWindow(closes)));
}

TEST(DijkstraAgentTest, SetSemaphoreIsClamped) {
    DijkstraAgent agent;
    agent.set_semaphore(12);
    EXPECT_EQ(agent.semaphore(), 5);
    agent.set_semaphore(-12);
    EXPECT_EQ(agent.semaphore(), -5);
}

TEST(DijkstraAgentTest, ExposesNameAndConfig) {
    DijkstraConfig cfg;
    cfg.lookback_window = 30;
    DijkstraAgent agent(cfg);

    EXPECT_EQ(agent.name(), "Dijkstra Agent");
    EXPECT_EQ(agent.config(), cfg);

    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) closes.push_back(100.0 + i);
    agent.fit(PriceWindow(closes));
    EXPECT_TRUE(agent.is_fitted());
}

TEST(DijkstraAgentTest, ReportsToLogger) {
    RecordingLogger logger;
    DijkstraAgent agent(DijkstraConfig{}, &logger);

    agent.strategy(rising_window());

    ASSERT_EQ(logger.timings.size(), 1u);
    EXPECT_EQ(logger.timings[0], "DijkstraAgent::strategy");
    ASSERT_EQ(logger.agents.size(), 1u);
    EXPECT_EQ(logger.agents[0], "Dijkstra Agent");
    EXPECT_TRUE(logger.traces[0].fitted);
    EXPECT_DOUBLE_EQ(logger.traces[0].signal, agent.latest_signal());
}

TEST(DijkstraAgentTest, LoggerMayReadAgentBack) {
    ReadBackLogger logger;
    DijkstraAgent agent(DijkstraConfig{}, &logger);
    logger.agent = &agent;

    const double signal = agent.strategy(rising_window());

    EXPECT_GT(signal, 0.0);
    EXPECT_EQ(logger.semaphore_at_timing, -1);
    EXPECT_EQ(logger.semaphore_at_decision, -1);
    EXPECT_TRUE(logger.fitted_at_decision);
}

TEST(DijkstraAgentTest, LoggerFailuresDoNotLeak) {
    ThrowingLogger logger;
    DijkstraAgent agent(DijkstraConfig{}, &logger);

    double signal = 0.0;
    EXPECT_NO_THROW(signal = agent.strategy(rising_window()));
    EXPECT_GT(signal, 0.0);
}

TEST(DijkstraAgentTest, ConcurrentCallsKeepEveryUpdate) {
    DijkstraAgent agent;
    const PriceWindow window = rising_window();
    std::atomic<int> out_of_range{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                const double s = agent.strategy(window);
                if (s < -1.0 || s > 1.0) ++out_of_range;
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(out_of_range.load(), 0);
    // Every call pushes one step toward SLIGHT_HIGH from VERY_HIGH.
    EXPECT_EQ(agent.semaphore(), HysteresisController::kMin);
}
