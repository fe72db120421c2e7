#include <gtest/gtest.h>
#include "Graph/GraphBuilder.hpp"
#include "Graph/StateDiscretizer.hpp"

#include <cmath>
#include <vector>

using namespace Pathfinder;

namespace {
    std::vector<double> zigzag(std::size_t n) {
        std::vector<double> prices;
        for (std::size_t i = 0; i < n; ++i) {
            prices.push_back(100.0 + 10.0 * std::sin(0.4 * static_cast<double>(i)) + 0.1 * static_cast<double>(i));
        }
        return prices;
    }
}

TEST(GraphBuilderTest, EdgeWeightsAreNonNegative) {
    EXPECT_NEAR(GraphBuilder::edge_weight(0.01, 1.0, 0.7), 0.003, 1e-12);
    EXPECT_NEAR(GraphBuilder::edge_weight(-0.01, 1.0, 0.7), 0.007, 1e-12);
    EXPECT_DOUBLE_EQ(GraphBuilder::edge_weight(0.0, 1.0, 0.7), 0.0);
}

TEST(GraphBuilderTest, VolumeWeight) {
    EXPECT_DOUBLE_EQ(GraphBuilder::volume_weight(500.0, 100.0, 0.0), 1.0);
    EXPECT_NEAR(GraphBuilder::volume_weight(110.0, 100.0, 10.0), 1.2, 1e-12);
    EXPECT_NEAR(GraphBuilder::volume_weight(1000.0, 100.0, 10.0), 1.5, 1e-12);
    EXPECT_NEAR(GraphBuilder::volume_weight(0.0, 100.0, 10.0), 0.5, 1e-12);
}

TEST(GraphBuilderTest, RepeatedTransitionsAreAveraged) {
    const std::vector<MarketState> states{
        MarketState::NEUTRAL, MarketState::HIGH, MarketState::NEUTRAL, MarketState::HIGH
    };
    const std::vector<double> prices{100.0, 101.0, 100.0, 102.0};

    auto graph = GraphBuilder(0.7).build(states, prices);
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->node_count(), 2u);
    EXPECT_EQ(graph->edge_count(), 2u);

    const auto up = graph->weight(MarketState::NEUTRAL, MarketState::HIGH);
    ASSERT_TRUE(up.has_value());
    EXPECT_NEAR(*up, (0.3 * 0.01 + 0.3 * 0.02) / 2.0, 1e-12);

    const auto down = graph->weight(MarketState::HIGH, MarketState::NEUTRAL);
    ASSERT_TRUE(down.has_value());
    EXPECT_NEAR(*down, 0.7 * (1.0 / 101.0), 1e-12);
}

TEST(GraphBuilderTest, SelfTransitionsAddNoEdge) {
    const std::vector<MarketState> states(10, MarketState::NEUTRAL);
    const std::vector<double> prices(10, 100.0);

    auto graph = GraphBuilder(0.7).build(states, prices);
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->node_count(), 1u);
    EXPECT_EQ(graph->edge_count(), 0u);
    EXPECT_TRUE(graph->has_node(MarketState::NEUTRAL));
}

TEST(GraphBuilderTest, RejectsBadInput) {
    const std::vector<MarketState> states{MarketState::NEUTRAL, MarketState::HIGH};
    const std::vector<double> prices{100.0, 101.0};
    const std::vector<double> short_volumes{1.0};

    EXPECT_EQ(GraphBuilder(0.7).build({}, {}).error(), BuildError::INSUFFICIENT_DATA);
    EXPECT_EQ(GraphBuilder(0.7).build(states, prices, short_volumes).error(), BuildError::LENGTH_MISMATCH);
}

TEST(GraphBuilderTest, BuildIsDeterministicAndFinite) {
    const auto prices = zigzag(60);
    std::vector<double> volumes;
    for (std::size_t i = 0; i < prices.size(); ++i) volumes.push_back(1000.0 + 37.0 * static_cast<double>(i % 7));

    auto discretized = StateDiscretizer(42).discretize(prices);
    ASSERT_TRUE(discretized.has_value());

    const std::span<const double> window = std::span<const double>(prices).last(42);
    const std::span<const double> vol_window = std::span<const double>(volumes).last(42);

    GraphBuilder builder(0.7);
    auto first = builder.build(discretized->states, window, vol_window);
    auto second = builder.build(discretized->states, window, vol_window);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);

    EXPECT_LE(first->node_count(), kStateCount);
    for (MarketState from : kAllStates) {
        for (const auto& [to, weight] : first->neighbors(from)) {
            EXPECT_NE(from, to);
            EXPECT_TRUE(std::isfinite(weight));
            EXPECT_GE(weight, 0.0);
        }
    }
}
