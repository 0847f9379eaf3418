#include "omotes/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace omotes {

namespace {

LogLevel initial_level() {
    const char* level = std::getenv("OMOTES_LOG_LEVEL");
    return level ? log_level_from_string(level) : LogLevel::Info;
}

std::atomic<int>& current_level() {
    static std::atomic<int> level{static_cast<int>(initial_level())};
    return level;
}

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

void stdout_sink(const nlohmann::json& entry) {
    std::cout << entry.dump() << std::endl;
}

LogSink& current_sink() {
    static LogSink sink = stdout_sink;
    return sink;
}

} // namespace

LogLevel log_level_from_string(const std::string& level) {
    std::string lowered(level);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    current_level().store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(current_level().load());
}

LogSink set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    LogSink previous = std::move(current_sink());
    current_sink() = sink ? std::move(sink) : LogSink(stdout_sink);
    return previous;
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

void log(LogLevel level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields) {
    if (static_cast<int>(level) < current_level().load()) {
        return;
    }

    nlohmann::json log_entry = {
        {"level", log_level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        sink = current_sink();
    }
    sink(log_entry);
}

} // namespace omotes
