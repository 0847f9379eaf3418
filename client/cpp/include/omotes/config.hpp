#pragma once

#include <string>
#include "logging.hpp"

namespace omotes {

/**
 * Read an environment variable with fallback.
 */
std::string from_env(const std::string& env_var, const std::string& default_value);

/**
 * Worker-side settings.
 *
 * Task results and progress updates are published on queues shared by all
 * workers; the orchestrator consumes them and relays to the client.
 */
struct WorkerConfig {
    std::string task_result_queue_name = "omotes_task_result_events";
    std::string task_progress_queue_name = "omotes_task_progress_events";
    LogLevel log_level = LogLevel::Info;

    /**
     * Load from TASK_RESULT_QUEUE_NAME, TASK_PROGRESS_QUEUE_NAME and
     * LOG_LEVEL, using the defaults above for unset variables.
     */
    static WorkerConfig from_env();
};

} // namespace omotes
