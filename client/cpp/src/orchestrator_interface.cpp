#include "omotes/orchestrator_interface.hpp"

#include "omotes/helpers.hpp"
#include "omotes/logging.hpp"
#include "omotes/queue_names.hpp"

namespace omotes {

OrchestratorInterface::OrchestratorInterface(
    std::shared_ptr<MessageBus> bus,
    std::shared_ptr<const WorkflowTypeManager> workflow_type_manager)
    : bus_(std::move(bus)), workflow_type_manager_(std::move(workflow_type_manager)) {
    if (!bus_) {
        throw InvalidArgumentError("OrchestratorInterface requires a message bus");
    }
    if (!workflow_type_manager_) {
        throw InvalidArgumentError("OrchestratorInterface requires a workflow type manager");
    }
}

void OrchestratorInterface::start() {
    bus_->start();
}

void OrchestratorInterface::stop() {
    bus_->stop();
}

void OrchestratorInterface::connect_to_job_submissions(NewJobCallback on_new_job) {
    if (!on_new_job) {
        throw InvalidArgumentError("A callback is required for job submissions");
    }

    for (const auto& workflow : workflow_type_manager_->get_all_workflows()) {
        const WorkflowType* workflow_type =
            workflow_type_manager_->get_workflow_by_name(workflow.workflow_type_name());

        bus_->subscribe(
            queue_names::job_submission_queue_name(*workflow_type),
            [manager = workflow_type_manager_, workflow_type, on_new_job](const std::string& message) {
                auto submission = helpers::decode_message<protocol::JobSubmission>(message);

                if (submission.workflow_type() != workflow_type->workflow_type_name()) {
                    log_error(log_domains::INTERNAL,
                              "Received a job submission that was meant for another workflow type. "
                              "Dropping message.",
                              {{"job_id", submission.uuid()},
                               {"workflow_type", submission.workflow_type()},
                               {"queue", queue_names::job_submission_queue_name(*workflow_type)}});
                    return;
                }

                Job job(submission.uuid(), *workflow_type);
                on_new_job(submission, job);
            });
    }

    log_info(log_domains::INTERNAL, "Listening for job submissions",
             {{"workflow_types", workflow_type_manager_->size()}});
}

void OrchestratorInterface::connect_to_job_cancellations(JobCancelCallback on_cancel) {
    if (!on_cancel) {
        throw InvalidArgumentError("A callback is required for job cancellations");
    }
    bus_->subscribe(queue_names::job_cancel_queue_name(),
                    [on_cancel = std::move(on_cancel)](const std::string& message) {
                        on_cancel(helpers::decode_message<protocol::JobCancel>(message));
                    });
}

void OrchestratorInterface::connect_to_task_events(const WorkerConfig& config,
                                                   TaskProgressCallback on_progress,
                                                   TaskResultCallback on_result) {
    if (!on_progress || !on_result) {
        throw InvalidArgumentError("Callbacks are required for task progress and task results");
    }
    bus_->subscribe(config.task_progress_queue_name,
                    [on_progress = std::move(on_progress)](const std::string& message) {
                        on_progress(helpers::decode_message<protocol::TaskProgressUpdate>(message));
                    });
    bus_->subscribe(config.task_result_queue_name,
                    [on_result = std::move(on_result)](const std::string& message) {
                        on_result(helpers::decode_message<protocol::TaskResult>(message));
                    });
}

void OrchestratorInterface::send_job_progress_update(const Job& job,
                                                     const protocol::JobProgressUpdate& progress_update) {
    bus_->publish(queue_names::job_progress_queue_name(job), progress_update.SerializeAsString());
}

void OrchestratorInterface::send_job_status_update(const Job& job,
                                                   const protocol::JobStatusUpdate& status_update) {
    bus_->publish(queue_names::job_status_queue_name(job), status_update.SerializeAsString());
}

void OrchestratorInterface::send_job_result(const Job& job, const protocol::JobResult& result) {
    bus_->publish(queue_names::job_results_queue_name(job), result.SerializeAsString());
}

void OrchestratorInterface::send_available_workflows() {
    bus_->publish(queue_names::available_workflows_queue_name(),
                  workflow_type_manager_->to_pb_message().SerializeAsString());
    log_info(log_domains::INTERNAL, "Published available workflows",
             {{"workflow_types", workflow_type_manager_->size()}});
}

} // namespace omotes
