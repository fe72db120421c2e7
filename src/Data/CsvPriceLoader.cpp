#include "Data/CsvPriceLoader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Pathfinder {

namespace {
    std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    std::string lower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::vector<std::string> split(const std::string& line, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            tokens.push_back(trim(token));
        }
        return tokens;
    }

    // Whole-field numeric parse; "12abc" is rejected.
    std::optional<double> to_double(const std::string& field) {
        if (field.empty()) return std::nullopt;
        try {
            std::size_t consumed = 0;
            const double value = std::stod(field, &consumed);
            if (consumed != field.size()) return std::nullopt;
            return value;
        } catch (const std::logic_error&) {   // invalid_argument / out_of_range
            return std::nullopt;
        }
    }

    std::optional<std::size_t> column_of(const std::vector<std::string>& header, const std::string& name) {
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (lower(header[i]) == name) return i;
        }
        return std::nullopt;
    }
}

CsvLoadResult CsvPriceLoader::load(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open price file: " + path);
    }

    CsvLoadResult result = parse(file);
    std::cout << "[CSV] Loaded " << result.rows_read << " rows from " << path;
    if (result.rows_skipped > 0) std::cout << " (" << result.rows_skipped << " skipped)";
    std::cout << std::endl;
    return result;
}

CsvLoadResult CsvPriceLoader::parse(std::istream& input) const {
    std::string line;
    if (!std::getline(input, line)) {
        throw std::runtime_error("price CSV is empty, expected a header row");
    }

    const auto header = split(line, delimiter_);
    const auto close_col = column_of(header, "close");
    if (!close_col) {
        throw std::runtime_error("price CSV has no 'close' column");
    }
    const auto volume_col = column_of(header, "volume");

    std::vector<double> closes;
    std::vector<double> volumes;
    CsvLoadResult result;

    while (std::getline(input, line)) {
        if (trim(line).empty()) continue;

        const auto tokens = split(line, delimiter_);
        const auto close = *close_col < tokens.size() ? to_double(tokens[*close_col]) : std::nullopt;

        std::optional<double> volume;
        if (volume_col) {
            volume = *volume_col < tokens.size() ? to_double(tokens[*volume_col]) : std::nullopt;
        }

        // Keep the columns aligned: a row is taken whole or not at all.
        if (!close || (volume_col && !volume)) {
            ++result.rows_skipped;
            continue;
        }

        closes.push_back(*close);
        if (volume) volumes.push_back(*volume);
        ++result.rows_read;
    }

    result.window = PriceWindow(std::move(closes), std::move(volumes));
    return result;
}

} // namespace Pathfinder
