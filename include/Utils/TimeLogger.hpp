#pragma once
#include <chrono>
#include <string>
#include "ILogger.hpp"

namespace Pathfinder {
    // Reports the lifetime of the enclosing scope to the logger, in microseconds.
    class TimeLogger {
    public:
        explicit TimeLogger(ILogger& logger, std::string methodName);
        ~TimeLogger();

        TimeLogger(const TimeLogger&) = delete;
        TimeLogger& operator=(const TimeLogger&) = delete;

    private:
        ILogger& logger;
        std::string methodName;
        std::chrono::time_point<std::chrono::steady_clock> start;
    };
}
