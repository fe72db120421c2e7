#include "Utils/QuestDBLogger.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace Pathfinder {

namespace {
    size_t discard_body(char*, size_t size, size_t nmemb, void*) {
        return size * nmemb;
    }

    // Single quotes are the only thing that can break out of a QuestDB string literal.
    std::string quote(const std::string& text) {
        std::string out = "'";
        for (char c : text) {
            out += c;
            if (c == '\'') out += '\'';
        }
        out += "'";
        return out;
    }
}

QuestDBLogger::QuestDBLogger(std::string baseUrl)
    : curlHandle(nullptr), baseUrl(std::move(baseUrl)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curlHandle = curl_easy_init();
    if (!curlHandle) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

QuestDBLogger::~QuestDBLogger() {
    if (curlHandle) curl_easy_cleanup(curlHandle);
    curl_global_cleanup();
}

std::string QuestDBLogger::build_timing_query(const std::string& methodName, long durationMicros) {
    return "INSERT INTO execution_times(ts, methodName, durationUs) "
           "VALUES(systimestamp(), " + quote(methodName) + ", " + std::to_string(durationMicros) + ")";
}

std::string QuestDBLogger::build_decision_query(const std::string& agentName, const DecisionTrace& trace) {
    std::ostringstream query;
    query << std::fixed << std::setprecision(6)
          << "INSERT INTO dijkstra_decisions(ts, agent, fitted, currentState, targetState, confidence, "
             "level, pathScore, semaphoreBefore, semaphoreAfter, deadlock, graphNodes, graphEdges, signal) "
          << "VALUES(systimestamp(), "
          << quote(agentName) << ", "
          << (trace.fitted ? "true" : "false") << ", "
          << quote(std::string(to_string(trace.current_state))) << ", "
          << quote(std::string(to_string(trace.target_state))) << ", "
          << trace.confidence << ", "
          << trace.decision_level << ", "
          << trace.path_score << ", "
          << trace.semaphore_before << ", "
          << trace.semaphore_after << ", "
          << trace.deadlock.score << ", "
          << trace.graph_nodes << ", "
          << trace.graph_edges << ", "
          << std::setprecision(4) << trace.signal << ")";
    return query.str();
}

void QuestDBLogger::log(const std::string& methodName, long durationMicros) {
    execute(build_timing_query(methodName, durationMicros));
}

void QuestDBLogger::log_decision(const std::string& agentName, const DecisionTrace& trace) {
    execute(build_decision_query(agentName, trace));
}

void QuestDBLogger::execute(const std::string& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    char* escaped = curl_easy_escape(curlHandle, query.c_str(), static_cast<int>(query.length()));
    if (!escaped) {
        std::cerr << "[QUESTDB ERROR] Failed to escape query" << std::endl;
        return;
    }

    const std::string url = baseUrl + "/exec?query=" + std::string(escaped);
    curl_free(escaped);

    curl_easy_setopt(curlHandle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, &discard_body);
    curl_easy_setopt(curlHandle, CURLOPT_TIMEOUT_MS, 2000L);

    const CURLcode res = curl_easy_perform(curlHandle);
    if (res != CURLE_OK) {
        std::cerr << "[QUESTDB ERROR] " << curl_easy_strerror(res) << std::endl;
    }
}

} // namespace Pathfinder
