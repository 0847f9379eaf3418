#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace omotes {

/**
 * Logger domains used by the SDK.
 */
namespace log_domains {
    constexpr const char* SDK = "omotes_sdk";
    constexpr const char* INTERNAL = "omotes_sdk_internal";
}

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * Receives every log entry at or above the current level.
 *
 * An entry is a flat JSON object with at least "level", "message",
 * "domain" and "timestamp".
 */
using LogSink = std::function<void(const nlohmann::json& entry)>;

/**
 * Parse a level name ("debug", "info", "warning"/"warn", "error").
 *
 * Unknown names fall back to Info.
 */
LogLevel log_level_from_string(const std::string& level);

const char* log_level_name(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * Replace the sink. Passing nullptr restores the stdout sink.
 *
 * @return The previously installed sink
 */
LogSink set_log_sink(LogSink sink);

std::string now_iso8601();

void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, domain, message, fields);
}

inline void log_warning(const std::string& domain, const std::string& message,
                        const nlohmann::json& fields = {}) {
    log(LogLevel::Warning, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, domain, message, fields);
}

} // namespace omotes
