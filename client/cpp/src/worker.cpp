#include "omotes/worker.hpp"

#include <exception>
#include "omotes/errors.hpp"
#include "omotes/logging.hpp"
#include "omotes/task.pb.h"

namespace omotes {

void TaskUtil::update_progress(double fraction, const std::string& message) const {
    log_debug(log_domains::INTERNAL, "Sending progress update",
              {{"job_id", invocation_.job_id},
               {"task_id", invocation_.task_id},
               {"progress", fraction},
               {"message", message}});

    protocol::TaskProgressUpdate update;
    update.set_job_id(invocation_.job_id);
    update.set_task_id(invocation_.task_id);
    update.set_task_type(definition_.task_type);
    update.set_progress(fraction);
    update.set_message(message);
    bus_.publish(definition_.config.task_progress_queue_name, update.SerializeAsString());
}

Worker::Worker(WorkerDefinition definition,
               std::shared_ptr<MessageBus> bus,
               std::shared_ptr<TaskRunner> runner)
    : definition_(std::move(definition)), bus_(std::move(bus)), runner_(std::move(runner)) {
    if (!bus_ || !runner_) {
        throw InvalidArgumentError("Worker requires a message bus and a task runner");
    }
}

void Worker::start() {
    if (definition_.task_type.empty()) {
        throw InvalidArgumentError("Worker task type must not be empty");
    }
    if (!definition_.task_function) {
        throw InvalidArgumentError("Worker task function must be set for " + definition_.task_type);
    }

    set_log_level(definition_.config.log_level);
    bus_->start();
    runner_->register_task(definition_.task_type,
                           [this](const TaskInvocation& invocation) { execute_task(invocation); });
    runner_->start();

    log_info(log_domains::INTERNAL, "Starting worker",
             {{"task_type", definition_.task_type},
              {"result_queue", definition_.config.task_result_queue_name},
              {"progress_queue", definition_.config.task_progress_queue_name}});
}

void Worker::execute_task(const TaskInvocation& invocation) {
    log_info(log_domains::INTERNAL, "Worker started new task",
             {{"job_id", invocation.job_id}, {"task_id", invocation.task_id}});

    TaskUtil task_util(definition_, invocation, *bus_);
    UpdateProgressHandler update_progress = [&task_util](double fraction, const std::string& message) {
        task_util.update_progress(fraction, message);
    };

    std::string output_esdl;
    try {
        task_util.update_progress(0.0, "Job calculation started");
        output_esdl = definition_.task_function(invocation.input_esdl, invocation.workflow_config,
                                                update_progress);
    } catch (const std::exception& e) {
        log_error(log_domains::INTERNAL, "Failure detected for task",
                  {{"job_id", invocation.job_id},
                   {"task_id", invocation.task_id},
                   {"error", e.what()}});
        publish_result(invocation, false, "", e.what());
        throw;
    } catch (...) {
        log_error(log_domains::INTERNAL, "Failure detected for task",
                  {{"job_id", invocation.job_id},
                   {"task_id", invocation.task_id},
                   {"error", "unknown error"}});
        publish_result(invocation, false, "", "unknown error");
        throw;
    }

    task_util.update_progress(1.0, "Calculation finished.");
    publish_result(invocation, true, output_esdl, "");
}

void Worker::publish_result(const TaskInvocation& invocation, bool succeeded,
                            const std::string& output_esdl, const std::string& logs) {
    protocol::TaskResult result;
    result.set_job_id(invocation.job_id);
    result.set_task_id(invocation.task_id);
    result.set_task_type(definition_.task_type);
    result.set_result_type(succeeded ? protocol::TaskResult::SUCCEEDED : protocol::TaskResult::FAILED);
    result.set_output_esdl(output_esdl);
    result.set_logs(logs);
    bus_->publish(definition_.config.task_result_queue_name, result.SerializeAsString());
}

} // namespace omotes
