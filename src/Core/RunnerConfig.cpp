#include "Core/RunnerConfig.hpp"
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace Pathfinder {

DijkstraConfig RunnerConfig::config_for(const std::string& symbol) const {
    const auto it = overrides.find(symbol);
    return it != overrides.end() ? it->second : agent;
}

DijkstraConfig parse_dijkstra_config(const json& node, const DijkstraConfig& base) {
    if (!node.is_object()) {
        throw std::runtime_error("agent config must be a JSON object");
    }

    try {
        DijkstraConfig cfg = base;
        cfg.lookback_window = node.value("lookback_window", base.lookback_window);
        cfg.risk_weight = node.value("risk_weight", base.risk_weight);
        cfg.state_threshold = node.value("state_threshold", base.state_threshold);
        cfg.structure_levels = node.value("structure_levels", base.structure_levels);
        cfg.deadlock_sensitivity = node.value("deadlock_sensitivity", base.deadlock_sensitivity);
        return cfg;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid agent config: ") + e.what());
    }
}

RunnerConfig parse_runner_config(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    RunnerConfig cfg;
    try {
        cfg.symbols = root.value("symbols", cfg.symbols);
        cfg.interval = root.value("interval", cfg.interval);
        cfg.history_limit = root.value("history_limit", cfg.history_limit);
        cfg.poll_interval_ms = root.value("poll_interval_ms", cfg.poll_interval_ms);

        if (root.contains("questdb")) {
            const json& questdb = root.at("questdb");
            cfg.questdb_enabled = questdb.value("enabled", cfg.questdb_enabled);
            cfg.questdb_url = questdb.value("url", cfg.questdb_url);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid runner config: ") + e.what());
    }

    if (root.contains("agent")) {
        cfg.agent = parse_dijkstra_config(root.at("agent"), cfg.agent);
    }

    // Overrides are layered on top of the shared agent section.
    if (root.contains("overrides")) {
        const json& overrides = root.at("overrides");
        if (!overrides.is_object()) {
            throw std::runtime_error("overrides must be a JSON object keyed by symbol");
        }
        for (const auto& [symbol, node] : overrides.items()) {
            cfg.overrides[symbol] = parse_dijkstra_config(node, cfg.agent);
        }
    }

    if (cfg.symbols.empty()) {
        throw std::runtime_error("config lists no symbols");
    }
    return cfg;
}

RunnerConfig load_runner_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    RunnerConfig cfg = parse_runner_config(buffer.str());
    std::cout << "[CONFIG] Loaded " << path << " (" << cfg.symbols.size() << " symbol(s), "
              << cfg.overrides.size() << " override(s))" << std::endl;
    return cfg;
}

} // namespace Pathfinder
