#pragma once
#include "Core/MarketState.hpp"
#include <cstddef>
#include <span>

namespace Pathfinder {

// Bounded conviction counter ("semaphore") carried between decisions.
// Positive = accumulated bullish conviction, negative = bearish.
class HysteresisController {
public:
    static constexpr int kMin = -5;
    static constexpr int kMax = 5;
    static constexpr std::size_t kMomentumWindow = 5;

    explicit HysteresisController(int initial = 0) noexcept;

    [[nodiscard]] int value() const noexcept { return semaphore_; }
    void reset(int value = 0) noexcept;

    // Applies one update and returns the new value.
    int update(MarketState current, MarketState target, std::span<const double> returns) noexcept;

    // Pure form of update(), used by the controller and by tests.
    [[nodiscard]] static int next(int semaphore, MarketState current, MarketState target,
                                  std::span<const double> returns) noexcept;

private:
    int semaphore_;
};

} // namespace Pathfinder
