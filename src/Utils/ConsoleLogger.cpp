#include "Utils/ConsoleLogger.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Pathfinder {

void ConsoleLogger::log(const std::string& methodName, long durationMicros) {
    std::ostringstream line;
    line << "[TIMING] " << methodName << " took " << durationMicros << " us\n";
    write_line(line.str());
}

void ConsoleLogger::log_decision(const std::string& agentName, const DecisionTrace& trace) {
    std::ostringstream line;
    if (!trace.fitted) {
        line << "[DECISION] " << agentName << ": not fitted, neutral signal\n";
        write_line(line.str());
        return;
    }
    line << "[DECISION] " << agentName
         << ": " << to_string(trace.current_state) << " -> " << to_string(trace.target_state)
         << " (level " << trace.decision_level
         << ", confidence " << std::fixed << std::setprecision(3) << trace.confidence << ")"
         << " | semaphore " << trace.semaphore_before << " -> " << trace.semaphore_after
         << " | deadlock " << trace.deadlock.score
         << " | graph " << trace.graph_nodes << "n/" << trace.graph_edges << "e"
         << " | signal " << std::setprecision(4) << trace.signal << "\n";
    write_line(line.str());
}

void ConsoleLogger::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(cout_mutex_);
    std::cout << line << std::flush;
}

} // namespace Pathfinder
