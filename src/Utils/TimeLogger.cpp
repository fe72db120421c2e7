#include "Utils/TimeLogger.hpp"
#include <exception>
#include <iostream>
#include <utility>

namespace Pathfinder {

TimeLogger::TimeLogger(ILogger& logger, std::string methodName)
    : logger(logger),
      methodName(std::move(methodName)),
      start(std::chrono::steady_clock::now()) {}

TimeLogger::~TimeLogger() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    try {
        logger.log(methodName, static_cast<long>(elapsed.count()));
    } catch (const std::exception& e) {
        // Destructors must not throw.
        std::cerr << "[TIMING ERROR] " << methodName << ": " << e.what() << std::endl;
    }
}

} // namespace Pathfinder
