#pragma once
#include "ILogger.hpp"
#include <curl/curl.h>
#include <mutex>
#include <string>

namespace Pathfinder {
    // Pushes timings and decision telemetry to QuestDB over its HTTP /exec endpoint.
    class QuestDBLogger : public ILogger {
    public:
        explicit QuestDBLogger(std::string baseUrl = "http://localhost:9000");
        ~QuestDBLogger() override;

        QuestDBLogger(const QuestDBLogger&) = delete;
        QuestDBLogger& operator=(const QuestDBLogger&) = delete;

        void log(const std::string& methodName, long durationMicros) override;
        void log_decision(const std::string& agentName, const DecisionTrace& trace) override;

        [[nodiscard]] static std::string build_timing_query(const std::string& methodName, long durationMicros);
        [[nodiscard]] static std::string build_decision_query(const std::string& agentName, const DecisionTrace& trace);

    private:
        CURL* curlHandle;
        std::string baseUrl;
        std::mutex mutex_;   // a CURL easy handle is not safe to share between threads

        void execute(const std::string& query);
    };
}
