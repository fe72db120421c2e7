#pragma once
#include <string>
#include "Core/DecisionTrace.hpp"

namespace Pathfinder {
    class ILogger {
    public:
        virtual ~ILogger() = default;
        virtual void log(const std::string& methodName, long durationMicros) = 0;
        virtual void log_decision(const std::string& agentName, const DecisionTrace& trace) = 0;
    };
}
