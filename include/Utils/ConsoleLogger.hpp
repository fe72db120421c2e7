#pragma once
#include "ILogger.hpp"
#include <mutex>

namespace Pathfinder {
    // Prints timings and decisions to std::cout. `out_mutex` is the lock every
    // other writer to std::cout in the process uses; it must outlive the logger.
    class ConsoleLogger : public ILogger {
    public:
        explicit ConsoleLogger(std::mutex& out_mutex) : cout_mutex_(out_mutex) {}

        void log(const std::string& methodName, long durationMicros) override;
        void log_decision(const std::string& agentName, const DecisionTrace& trace) override;

    private:
        std::mutex& cout_mutex_;

        void write_line(const std::string& line);
    };
}
