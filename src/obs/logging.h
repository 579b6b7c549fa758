#pragma once

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "obs/context.h"

namespace csvsentry {
namespace obs {

enum class LogLevel {
    Info,
    Warn,
    Error
};

inline const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

inline std::string NowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = time_point_cast<seconds>(now);
    auto ms = duration_cast<milliseconds>(now - secs).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

// Explicit fields win over the thread's request context.
inline void MergeContext(nlohmann::json& j) {
    if (!HasContext()) return;
    const auto& ctx = GetContext();
    if (!ctx.request_id.empty() && !j.contains("request_id")) {
        j["request_id"] = ctx.request_id;
    }
    if (!ctx.operation.empty() && !j.contains("operation")) {
        j["operation"] = ctx.operation;
    }
    if (!ctx.upload_name.empty() && !j.contains("upload_name")) {
        j["upload_name"] = ctx.upload_name;
    }
}

inline void LogEvent(LogLevel level,
                     const std::string& event,
                     const std::string& component,
                     const nlohmann::json& fields = nlohmann::json::object()) {
    nlohmann::json j = fields;
    MergeContext(j);
    j["ts"] = NowIso8601();
    j["level"] = LevelToString(level);
    j["event"] = event;
    j["component"] = component;

    switch (level) {
        case LogLevel::Info:
            spdlog::info(j.dump());
            break;
        case LogLevel::Warn:
            spdlog::warn(j.dump());
            break;
        case LogLevel::Error:
            spdlog::error(j.dump());
            break;
    }
}

class ScopedTimer {
public:
    ScopedTimer(std::string event, std::string component, nlohmann::json fields = nlohmann::json::object())
        : event_(std::move(event)),
          component_(std::move(component)),
          fields_(std::move(fields)),
          start_(std::chrono::steady_clock::now()) {}

    // Logs once and returns the elapsed milliseconds.
    auto Stop(LogLevel level = LogLevel::Info, nlohmann::json extra = nlohmann::json::object()) -> double {
        if (stopped_) return duration_ms_;
        stopped_ = true;
        duration_ms_ = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
        nlohmann::json payload = fields_;
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            payload[it.key()] = it.value();
        }
        payload["duration_ms"] = duration_ms_;
        LogEvent(level, event_, component_, payload);
        return duration_ms_;
    }

    ~ScopedTimer() {
        if (!stopped_) {
            Stop(LogLevel::Info);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    auto operator=(const ScopedTimer&) -> ScopedTimer& = delete;

private:
    std::string event_;
    std::string component_;
    nlohmann::json fields_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
    double duration_ms_ = 0.0;
};

} // namespace obs
} // namespace csvsentry
