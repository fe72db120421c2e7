#include "Strategy/HysteresisController.hpp"
#include "Analysis/Statistics.hpp"

#include <algorithm>
#include <cstdlib>

namespace Pathfinder {

HysteresisController::HysteresisController(int initial) noexcept
    : semaphore_(std::clamp(initial, kMin, kMax)) {}

void HysteresisController::reset(int value) noexcept {
    semaphore_ = std::clamp(value, kMin, kMax);
}

int HysteresisController::update(MarketState current, MarketState target,
                                 std::span<const double> returns) noexcept {
    semaphore_ = next(semaphore_, current, target, returns);
    return semaphore_;
}

int HysteresisController::next(int semaphore, MarketState current, MarketState target,
                               std::span<const double> returns) noexcept {
    const int current_value = ordinal(current);
    const int target_value = ordinal(target);
    const int direction = Stats::sign(static_cast<double>(target_value - current_value));

    // No transition wanted: decay toward zero without crossing it.
    if (direction == 0) {
        if (semaphore > 0) --semaphore;
        else if (semaphore < 0) ++semaphore;
        return std::clamp(semaphore, kMin, kMax);
    }

    const auto recent = returns.last(std::min(kMomentumWindow, returns.size()));
    const int momentum = Stats::sign_sum(recent);

    const bool momentum_agrees = (direction > 0 && momentum > 0) || (direction < 0 && momentum < 0);
    const int step = momentum_agrees ? std::min(2, std::abs(target_value - current_value)) : 1;

    return std::clamp(semaphore + direction * step, kMin, kMax);
}

} // namespace Pathfinder
