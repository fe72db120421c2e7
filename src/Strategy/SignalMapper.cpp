#include "Strategy/SignalMapper.hpp"
#include "Analysis/Statistics.hpp"
#include <cmath>

namespace Pathfinder {

double SignalMapper::map(MarketState target, double confidence, double deadlock) noexcept {
    double signal = Stats::clip(Stats::finite_or(signal_value(target) * confidence), -1.0, 1.0);

    // A deadlock reading points at the likely breakout direction.
    deadlock = Stats::finite_or(deadlock);
    if (deadlock != 0.0) {
        signal = Stats::clip(Stats::finite_or(signal * 0.7 + deadlock * 0.3), -1.0, 1.0);
    }

    return round4(signal);
}

double SignalMapper::round4(double value) noexcept {
    const double rounded = std::round(Stats::finite_or(value) * 10000.0) / 10000.0;
    // Avoid handing out -0.0.
    return rounded == 0.0 ? 0.0 : rounded;
}

} // namespace Pathfinder
