#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "Core/DijkstraConfig.hpp"

namespace Pathfinder {

// Settings for the `pathfinder` runner, loaded from JSON:
//
// {
//   "symbols": ["BTCUSDT", "ETHUSDT"],
//   "interval": "1h",
//   "history_limit": 200,
//   "poll_interval_ms": 60000,
//   "questdb": { "enabled": false, "url": "http://localhost:9000" },
//   "agent": { "lookback_window": 42, "risk_weight": 0.7, ... },
//   "overrides": { "ETHUSDT": { "lookback_window": 30 } }
// }
//
// Every key is optional; missing keys keep the defaults below.
struct RunnerConfig {
    std::vector<std::string> symbols{"BTCUSDT"};
    std::string interval = "1h";
    int history_limit = 200;
    int poll_interval_ms = 60000;

    bool questdb_enabled = false;
    std::string questdb_url = "http://localhost:9000";

    DijkstraConfig agent;
    std::map<std::string, DijkstraConfig> overrides;

    // Agent settings for a symbol: the override when present, else `agent`.
    [[nodiscard]] DijkstraConfig config_for(const std::string& symbol) const;
};

// All three throw std::runtime_error on unreadable files, malformed JSON or
// values of the wrong type.
[[nodiscard]] RunnerConfig load_runner_config(const std::string& path);
[[nodiscard]] RunnerConfig parse_runner_config(const std::string& json_text);
[[nodiscard]] DijkstraConfig parse_dijkstra_config(const nlohmann::json& node, const DijkstraConfig& base);

} // namespace Pathfinder
