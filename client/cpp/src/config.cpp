#include "omotes/config.hpp"

#include <cstdlib>

namespace omotes {

std::string from_env(const std::string& env_var, const std::string& default_value) {
    const char* value = std::getenv(env_var.c_str());
    return value ? value : default_value;
}

WorkerConfig WorkerConfig::from_env() {
    WorkerConfig config;
    config.task_result_queue_name =
        omotes::from_env("TASK_RESULT_QUEUE_NAME", config.task_result_queue_name);
    config.task_progress_queue_name =
        omotes::from_env("TASK_PROGRESS_QUEUE_NAME", config.task_progress_queue_name);
    config.log_level = log_level_from_string(omotes::from_env("LOG_LEVEL", "info"));
    return config;
}

} // namespace omotes
