#pragma once
#include <cstddef>
#include <istream>
#include <string>
#include "Core/PriceWindow.hpp"

namespace Pathfinder {

struct CsvLoadResult {
    PriceWindow window;
    std::size_t rows_read = 0;
    std::size_t rows_skipped = 0;
};

// Reads OHLCV-style CSV with a header row. The `close` column is required,
// `volume` is optional; header matching is case-insensitive and other
// columns are ignored. Rows that fail to parse are skipped and counted.
class CsvPriceLoader {
public:
    explicit CsvPriceLoader(char delimiter = ',') : delimiter_(delimiter) {}

    // Throws std::runtime_error if the file cannot be opened or has no close column.
    [[nodiscard]] CsvLoadResult load(const std::string& path) const;
    [[nodiscard]] CsvLoadResult parse(std::istream& input) const;

private:
    char delimiter_;
};

} // namespace Pathfinder
