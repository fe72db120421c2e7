#include <iostream>
#include <thread>
#include <atomic>
#include <csignal>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <iomanip> // For std::setprecision
#include <chrono>  // For std::chrono
#include <cstdlib>
#include <stop_token>
#include <string>

#include "Clients/BinanceKlinesClient.hpp"
#include "Core/RunnerConfig.hpp"
#include "Data/CsvPriceLoader.hpp"
#include "Strategy/DijkstraAgent.hpp"
#include "Utils/ConsoleLogger.hpp"
#include "Utils/QuestDBLogger.hpp"

using namespace Pathfinder;

// Global kill switch
std::atomic<bool> global_shutdown{false};
std::mutex cout_mutex; // Shared by every writer to std::cout, ConsoleLogger included

namespace {

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " [--config FILE]              poll Binance klines and print signals\n"
              << "  " << program << " --csv FILE [--config FILE]   one decision on a local OHLCV file\n";
}

void print_signal(const std::string& symbol, const DijkstraAgent& agent, double signal) {
    const DecisionTrace trace = agent.last_trace();

    std::ostringstream line;
    line << "[SIGNAL] " << symbol << " " << std::fixed << std::setprecision(4) << signal;
    if (trace.fitted) {
        line << "  (" << to_string(trace.current_state) << " -> " << to_string(trace.target_state)
             << ", level " << trace.decision_level
             << ", semaphore " << trace.semaphore_after << ")";
    } else {
        line << "  (not fitted)";
    }

    std::lock_guard<std::mutex> lock(cout_mutex);
    std::cout << line.str() << "\n";
}

int run_csv(const std::string& path, const RunnerConfig& cfg) {
    const CsvLoadResult loaded = CsvPriceLoader().load(path);

    ConsoleLogger logger(cout_mutex);
    DijkstraAgent agent(cfg.agent, &logger);
    const double signal = agent.strategy(loaded.window);
    print_signal(path, agent, signal);
    return EXIT_SUCCESS;
}

//------------------------------------------------------------------
// LIVE LOOP: one agent per symbol so each keeps its own semaphore
//------------------------------------------------------------------
void poll_symbols(std::stop_token st, const RunnerConfig& cfg, ILogger& logger) {
    std::cout << "🟢 Starting Dijkstra strategy thread\n";

    BinanceKlinesClient client;
    std::map<std::string, std::unique_ptr<DijkstraAgent>> agents;
    for (const auto& symbol : cfg.symbols) {
        const DijkstraConfig agent_cfg = cfg.config_for(symbol);
        agents.emplace(symbol, std::make_unique<DijkstraAgent>(agent_cfg, &logger));
        std::lock_guard<std::mutex> lock(cout_mutex);
        std::cout << "🔧 " << symbol << ": lookback=" << agent_cfg.lookback_window
                  << ", risk_weight=" << agent_cfg.risk_weight
                  << ", levels=" << agent_cfg.structure_levels << "\n";
    }

    while (!st.stop_requested() && !global_shutdown) {
        for (const auto& symbol : cfg.symbols) {
            if (st.stop_requested() || global_shutdown) break;

            const PriceWindow window = client.fetch_klines(symbol, cfg.interval, cfg.history_limit);
            DijkstraAgent& agent = *agents.at(symbol);
            const double signal = agent.strategy(window);
            print_signal(symbol, agent, signal);
        }

        // Sleep in slices so shutdown is not held up by a long poll interval.
        const auto wake = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.poll_interval_ms);
        while (std::chrono::steady_clock::now() < wake && !st.stop_requested() && !global_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
    std::cout << "💀 Strategy thread terminated\n";
}

int run_live(const RunnerConfig& cfg) {
    std::unique_ptr<ILogger> logger;
    if (cfg.questdb_enabled) {
        std::cout << "📡 Decision telemetry -> QuestDB at " << cfg.questdb_url << "\n";
        logger = std::make_unique<QuestDBLogger>(cfg.questdb_url);
    } else {
        logger = std::make_unique<ConsoleLogger>(cout_mutex);
    }

    // Set up signal handler for graceful shutdown
    std::signal(SIGINT, [](int) {
        global_shutdown = true;
    });

    std::jthread strategy_thread([&](std::stop_token st) {
        poll_symbols(st, cfg, *logger);
    });

    std::cout << "🔥 Pathfinder online, polling every " << cfg.poll_interval_ms << " ms\n";
    std::cout << "🛑 Press Ctrl+C to shutdown gracefully\n";

    while (!global_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n🛑 Shutting down...\n";
    strategy_thread.request_stop();
    strategy_thread.join();
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string csv_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "--csv") && i + 1 < argc) {
            (arg == "--config" ? config_path : csv_path) = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    try {
        const RunnerConfig cfg = config_path.empty() ? RunnerConfig{} : load_runner_config(config_path);
        return csv_path.empty() ? run_live(cfg) : run_csv(csv_path, cfg);
    } catch (const std::exception& e) {
        std::cerr << "💥 FATAL ERROR: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
