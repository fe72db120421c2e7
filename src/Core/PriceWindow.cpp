#include "Core/PriceWindow.hpp"
#include "Analysis/Statistics.hpp"

#include <utility>

namespace Pathfinder {

PriceWindow::PriceWindow(std::vector<double> close_prices, std::vector<double> volume_column)
    : closes(std::move(close_prices)),
      volumes(std::move(volume_column)) {}

bool PriceWindow::has_volume() const noexcept {
    return !volumes.empty() && volumes.size() == closes.size();
}

std::span<const double> PriceWindow::recent_closes(std::size_t count) const noexcept {
    std::span<const double> all(closes);
    return count >= all.size() ? all : all.last(count);
}

std::span<const double> PriceWindow::recent_volumes(std::size_t count) const noexcept {
    if (!has_volume()) return {};
    std::span<const double> all(volumes);
    return count >= all.size() ? all : all.last(count);
}

std::vector<double> PriceWindow::returns() const {
    return Stats::simple_returns(closes);
}

} // namespace Pathfinder
