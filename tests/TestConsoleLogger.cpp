#include <gtest/gtest.h>
#include "Utils/ConsoleLogger.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

using namespace Pathfinder;

namespace {
    // Swaps std::cout's buffer for the lifetime of the object.
    class CoutCapture {
    public:
        CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
        ~CoutCapture() { std::cout.rdbuf(previous_); }

        std::string text() const { return buffer_.str(); }

    private:
        std::ostringstream buffer_;
        std::streambuf* previous_;
    };

    DecisionTrace fitted_trace() {
        DecisionTrace trace;
        trace.fitted = true;
        trace.current_state = MarketState::VERY_HIGH;
        trace.target_state = MarketState::SLIGHT_HIGH;
        trace.confidence = 0.7;
        trace.decision_level = 2;
        trace.semaphore_after = -1;
        trace.signal = 0.12;
        return trace;
    }
}

TEST(ConsoleLoggerTest, PrintsDecisionSummary) {
    std::mutex out_mutex;
    ConsoleLogger logger(out_mutex);
    CoutCapture capture;

    logger.log_decision("Dijkstra Agent", fitted_trace());
    logger.log_decision("Dijkstra Agent", DecisionTrace{});

    const std::string text = capture.text();
    EXPECT_NE(text.find("[DECISION] Dijkstra Agent: very_high -> slight_high (level 2, confidence 0.700)"),
              std::string::npos);
    EXPECT_NE(text.find("| signal 0.1200"), std::string::npos);
    EXPECT_NE(text.find("not fitted, neutral signal"), std::string::npos);
}

TEST(ConsoleLoggerTest, LeavesStreamFormatUntouched) {
    std::mutex out_mutex;
    ConsoleLogger logger(out_mutex);
    CoutCapture capture;

    const auto flags = std::cout.flags();
    const auto precision = std::cout.precision();

    logger.log_decision("Dijkstra Agent", fitted_trace());

    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
}

TEST(ConsoleLoggerTest, WritesUnderTheSharedLock) {
    std::mutex out_mutex;
    ConsoleLogger logger(out_mutex);
    CoutCapture capture;

    std::unique_lock<std::mutex> held(out_mutex);
    std::thread writer([&]() { logger.log("Scope", 7); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(capture.text().empty());

    held.unlock();
    writer.join();
    EXPECT_EQ(capture.text(), "[TIMING] Scope took 7 us\n");
}
