#include "Clients/BinanceKlinesClient.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <utility> // For std::move
#include <vector>

namespace beast = boost::beast;         // from <boost/beast/core.hpp>
namespace http = beast::http;           // from <boost/beast/http.hpp>
namespace net = boost::asio;            // from <boost/asio/io_context.hpp>
namespace ssl = net::ssl;               // from <boost/asio/ssl/context.hpp>
using tcp = net::ip::tcp;               // from <boost/asio/ip/tcp.hpp>
using json = nlohmann::json;            // from <nlohmann/json.hpp>

namespace Pathfinder {

namespace {
    // Binance encodes prices and volumes as strings; accept plain numbers too.
    double field_as_double(const json& field) {
        if (field.is_string()) return std::stod(field.get<std::string>());
        return field.get<double>();
    }
}

class BinanceKlinesClient::Impl {
public:
    Impl(std::string host, std::string port)
        : host_(std::move(host)), port_(std::move(port)), ctx_(ssl::context::tlsv12_client) {
        ctx_.set_default_verify_paths();
        ctx_.set_verify_mode(ssl::verify_peer);
    }

    // Body of a 200 response, or empty after reporting the failing stage.
    std::string get(const std::string& target) {
        const char* stage = "TLS setup";
        try {
            net::io_context ioc;
            beast::ssl_stream<tcp::socket> stream(ioc, ctx_);

            if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
                throw beast::system_error(beast::error_code(
                    static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
            }
            stream.set_verify_callback(ssl::host_name_verification(host_));

            stage = "resolve";
            tcp::resolver resolver(ioc);
            const auto endpoints = resolver.resolve(host_, port_);

            stage = "connect";
            net::connect(beast::get_lowest_layer(stream), endpoints);

            stage = "handshake";
            stream.handshake(ssl::stream_base::client);

            stage = "request";
            http::write(stream, make_request(target));

            stage = "response";
            beast::flat_buffer buffer;
            http::response<http::string_body> res;
            http::read(stream, buffer, res);

            close_quietly(stream);

            if (res.result() != http::status::ok) {
                std::cerr << "[KLINES ERROR] HTTP " << res.result_int() << " for " << target
                          << ": " << res.body() << std::endl;
                return {};
            }
            return std::move(res.body());
        } catch (const beast::system_error& e) {
            std::cerr << "[KLINES ERROR] " << stage << " failed for " << host_ << ": "
                      << e.code().message() << std::endl;
            return {};
        }
    }

private:
    std::string host_;
    std::string port_;
    ssl::context ctx_;

    http::request<http::empty_body> make_request(const std::string& target) const {
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::accept, "application/json");
        return req;
    }

    // The body is already read; a missing close_notify is not worth reporting.
    static void close_quietly(beast::ssl_stream<tcp::socket>& stream) {
        beast::error_code ec;
        stream.shutdown(ec);
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            std::cerr << "[KLINES] TLS shutdown: " << ec.message() << std::endl;
        }
    }
};

BinanceKlinesClient::BinanceKlinesClient(std::string host, std::string port)
    : pimpl_(std::make_unique<Impl>(std::move(host), std::move(port))) {}

BinanceKlinesClient::~BinanceKlinesClient() = default;

std::string BinanceKlinesClient::klines_target(const std::string& symbol, const std::string& interval, int limit) {
    // Binance caps a klines page at 1000 rows.
    const int rows = std::clamp(limit, 1, 1000);
    return "/api/v3/klines?symbol=" + symbol + "&interval=" + interval + "&limit=" + std::to_string(rows);
}

PriceWindow BinanceKlinesClient::fetch_klines(const std::string& symbol, const std::string& interval, int limit) {
    std::cout << "[KLINES] Fetching " << symbol << " " << interval << " x" << limit << std::endl;

    const std::string body = pimpl_->get(klines_target(symbol, interval, limit));
    if (body.empty()) return {};

    PriceWindow window = parse_klines(body);
    std::cout << "[KLINES] Received " << window.size() << " candles for " << symbol << std::endl;
    return window;
}

PriceWindow BinanceKlinesClient::parse_klines(const std::string& body) {
    std::vector<double> closes;
    std::vector<double> volumes;

    try {
        const json rows = json::parse(body);
        if (!rows.is_array()) {
            std::cerr << "[KLINES PARSE ERROR] Expected an array, got: " << rows.type_name() << std::endl;
            return {};
        }

        std::size_t skipped = 0;
        for (const auto& row : rows) {
            if (!row.is_array() || row.size() < 6) {
                ++skipped;
                continue;
            }
            try {
                const double close = field_as_double(row[4]);
                const double volume = field_as_double(row[5]);
                closes.push_back(close);
                volumes.push_back(volume);
            } catch (const std::exception&) {
                ++skipped;   // bad number in this row only
            }
        }
        if (skipped > 0) {
            std::cerr << "[KLINES PARSE] Skipped " << skipped << " malformed row(s)" << std::endl;
        }
    } catch (const json::exception& e) {
        std::cerr << "[KLINES PARSE ERROR] " << e.what() << std::endl;
        return {};
    }

    return PriceWindow(std::move(closes), std::move(volumes));
}

} // namespace Pathfinder
