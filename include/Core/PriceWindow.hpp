#ifndef PRICEWINDOW_HPP
#define PRICEWINDOW_HPP

#include <cstddef>
#include <span>
#include <vector>

namespace Pathfinder {

// Ordered close/volume history handed to an agent for a single decision.
// The volume column is optional; when present it must match closes in length,
// otherwise it is ignored.
struct PriceWindow {
    std::vector<double> closes;
    std::vector<double> volumes;

    PriceWindow() = default;
    explicit PriceWindow(std::vector<double> close_prices,
                         std::vector<double> volume_column = {});

    [[nodiscard]] std::size_t size() const noexcept { return closes.size(); }
    [[nodiscard]] bool empty() const noexcept { return closes.empty(); }
    [[nodiscard]] bool has_volume() const noexcept;

    // Most recent `count` closes (all of them if fewer are available).
    [[nodiscard]] std::span<const double> recent_closes(std::size_t count) const noexcept;

    // Volumes aligned with recent_closes(count); empty when there is no volume column.
    [[nodiscard]] std::span<const double> recent_volumes(std::size_t count) const noexcept;

    // Simple returns (p[i] - p[i-1]) / p[i-1]; non-finite results are stored as 0.
    [[nodiscard]] std::vector<double> returns() const;
};

} // namespace Pathfinder

#endif // PRICEWINDOW_HPP
