#include "omotes/task_runner.hpp"

#include <exception>
#include "omotes/errors.hpp"
#include "omotes/helpers.hpp"
#include "omotes/logging.hpp"

namespace omotes {

void InlineTaskRunner::register_task(const std::string& task_type, TaskBody body) {
    if (!body) {
        throw InvalidArgumentError("Task body for " + task_type + " must be set");
    }
    tasks_[task_type] = std::move(body);
}

void InlineTaskRunner::start() {
    started_ = true;
    log_info(log_domains::INTERNAL, "Task runner started", {{"task_types", tasks_.size()}});
}

void InlineTaskRunner::enqueue(const std::string& task_type, TaskInvocation invocation) {
    if (invocation.task_id.empty()) {
        invocation.task_id = helpers::generate_uuid();
    }
    pending_.emplace_back(task_type, std::move(invocation));
}

size_t InlineTaskRunner::run_pending() {
    size_t ran = 0;
    while (started_ && !pending_.empty()) {
        auto [task_type, invocation] = std::move(pending_.front());
        pending_.pop_front();

        auto it = tasks_.find(task_type);
        if (it == tasks_.end()) {
            throw InvalidArgumentError("No task registered for type " + task_type);
        }

        ++ran;
        try {
            it->second(invocation);
            ++succeeded_;
        } catch (const std::exception& e) {
            ++failed_;
            log_error(log_domains::INTERNAL, "Failure detected for task",
                      {{"task_id", invocation.task_id},
                       {"task_type", task_type},
                       {"error", e.what()}});
        } catch (...) {
            ++failed_;
            log_error(log_domains::INTERNAL, "Failure detected for task",
                      {{"task_id", invocation.task_id},
                       {"task_type", task_type},
                       {"error", "unknown error"}});
        }
    }
    return ran;
}

} // namespace omotes
