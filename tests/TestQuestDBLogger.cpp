#include <gtest/gtest.h>
#include "Utils/QuestDBLogger.hpp"

using namespace Pathfinder;

TEST(QuestDBLoggerTest, BasicLogging) {
    // Nothing listens on this port in CI; failures are reported, not thrown.
    QuestDBLogger logger("http://127.0.0.1:1");
    ASSERT_NO_THROW(logger.log("TestMethod", 42));
    ASSERT_NO_THROW(logger.log_decision("Dijkstra Agent", DecisionTrace{}));
}

TEST(QuestDBLoggerTest, TimingQuery) {
    const std::string query = QuestDBLogger::build_timing_query("DijkstraAgent::strategy", 1250);
    EXPECT_EQ(query,
              "INSERT INTO execution_times(ts, methodName, durationUs) "
              "VALUES(systimestamp(), 'DijkstraAgent::strategy', 1250)");
}

TEST(QuestDBLoggerTest, QuotesAreEscaped) {
    const std::string query = QuestDBLogger::build_timing_query("it's", 1);
    EXPECT_NE(query.find("'it''s'"), std::string::npos);
}

TEST(QuestDBLoggerTest, DecisionQuery) {
    DecisionTrace trace;
    trace.fitted = true;
    trace.current_state = MarketState::VERY_HIGH;
    trace.target_state = MarketState::SLIGHT_HIGH;
    trace.confidence = 0.7;
    trace.decision_level = 2;
    trace.semaphore_after = -1;
    trace.graph_nodes = 4;
    trace.graph_edges = 3;
    trace.signal = 0.12;

    const std::string query = QuestDBLogger::build_decision_query("Dijkstra Agent", trace);
    EXPECT_EQ(query.rfind("INSERT INTO dijkstra_decisions(", 0), 0u);
    EXPECT_NE(query.find("'Dijkstra Agent', true, 'very_high', 'slight_high', 0.700000, 2, "), std::string::npos);
    EXPECT_NE(query.find(", 4, 3, 0.1200)"), std::string::npos);
}
