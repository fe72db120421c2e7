#ifndef BINANCEKLINESCLIENT_HPP
#define BINANCEKLINESCLIENT_HPP

#include <memory>     // For std::unique_ptr
#include <string>

#include "Core/PriceWindow.hpp"

namespace Pathfinder {

// Fetches candle history from Binance's public REST API (/api/v3/klines)
// and converts it into a PriceWindow (close + volume).
class BinanceKlinesClient {
public:
    explicit BinanceKlinesClient(std::string host = "api.binance.com", std::string port = "443");
    ~BinanceKlinesClient();

    BinanceKlinesClient(const BinanceKlinesClient&) = delete;
    BinanceKlinesClient& operator=(const BinanceKlinesClient&) = delete;

    // Blocking HTTPS request. Errors are reported on std::cerr and yield an
    // empty window, which the agents treat as insufficient data.
    PriceWindow fetch_klines(const std::string& symbol, const std::string& interval, int limit);

    // Request path for one page of candles; `limit` is clamped to 1..1000.
    static std::string klines_target(const std::string& symbol, const std::string& interval, int limit);

    // Parses the klines JSON body: an array of
    // [openTime, open, high, low, close, volume, closeTime, ...] rows with
    // numeric fields encoded as strings. Malformed bodies yield an empty window.
    static PriceWindow parse_klines(const std::string& body);

private:
    // PIMPL keeps Beast/Asio out of this header.
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace Pathfinder

#endif // BINANCEKLINESCLIENT_HPP
