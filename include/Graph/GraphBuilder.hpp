#pragma once
#include "Core/MarketState.hpp"
#include "Graph/StateGraph.hpp"
#include <expected>
#include <span>

namespace Pathfinder {

enum class BuildError {
    INSUFFICIENT_DATA,
    LENGTH_MISMATCH
};

// Turns a labelled price window into a StateGraph. Each observed transition
// s[i-1] -> s[i] contributes a risk/reward weight; repeated transitions are
// averaged into a single edge. Self-transitions only register the node.
class GraphBuilder {
public:
    explicit GraphBuilder(double risk_weight) : risk_weight_(risk_weight) {}

    // `volumes` may be empty; otherwise it must be aligned with `prices`.
    [[nodiscard]] std::expected<StateGraph, BuildError> build(
        std::span<const MarketState> states,
        std::span<const double> prices,
        std::span<const double> volumes = {}
    ) const;

    [[nodiscard]] static double volume_weight(double volume, double volume_mean, double volume_std) noexcept;
    [[nodiscard]] static double edge_weight(double price_change, double volume_weight, double risk_weight) noexcept;

    [[nodiscard]] double risk_weight() const noexcept { return risk_weight_; }

private:
    double risk_weight_;
};

} // namespace Pathfinder
