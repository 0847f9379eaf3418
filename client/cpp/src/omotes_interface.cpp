#include "omotes/omotes_interface.hpp"

#include <cmath>
#include "omotes/helpers.hpp"
#include "omotes/logging.hpp"
#include "omotes/queue_names.hpp"

namespace omotes {

OmotesInterface::OmotesInterface(std::shared_ptr<MessageBus> bus)
    : bus_(std::move(bus)) {
    if (!bus_) {
        throw InvalidArgumentError("OmotesInterface requires a message bus");
    }
}

void OmotesInterface::start() {
    bus_->start();
}

void OmotesInterface::stop() {
    bus_->stop();
}

void OmotesInterface::connect_to_submitted_job(const Job& job, JobCallbacks callbacks,
                                               bool auto_disconnect) {
    if (!callbacks.on_finished) {
        throw InvalidArgumentError("A result callback is required for job " + job.id());
    }

    bus_->receive_once(
        queue_names::job_results_queue_name(job),
        std::nullopt,
        [this, job, on_finished = std::move(callbacks.on_finished), auto_disconnect](
            const std::string& message) {
            auto result = helpers::decode_message<protocol::JobResult>(message);
            on_finished(job, result);
            if (auto_disconnect) {
                disconnect_from_submitted_job(job);
            }
        },
        nullptr);

    bus_->subscribe(
        queue_names::job_progress_queue_name(job),
        [job, on_progress = std::move(callbacks.on_progress_update)](const std::string& message) {
            auto update = helpers::decode_message<protocol::JobProgressUpdate>(message);
            if (on_progress) {
                on_progress(job, update);
            }
        });

    bus_->subscribe(
        queue_names::job_status_queue_name(job),
        [job, on_status = std::move(callbacks.on_status_update)](const std::string& message) {
            auto update = helpers::decode_message<protocol::JobStatusUpdate>(message);
            if (on_status) {
                on_status(job, update);
            }
        });

    log_debug(log_domains::SDK, "Connected to job", {{"job_id", job.id()}});
}

Job OmotesInterface::submit_job(const std::string& esdl,
                                const ParamsDict& params_dict,
                                const WorkflowType& workflow_type,
                                std::optional<std::chrono::duration<double>> job_timeout,
                                JobCallbacks callbacks,
                                bool auto_disconnect) {
    if (job_timeout && !(job_timeout->count() >= 0.0)) {
        throw InvalidArgumentError("Job timeout must not be negative for workflow " +
                                   workflow_type.workflow_type_name());
    }
    // An invalid parameter set must fail before any subscription is made.
    google::protobuf::Struct params_struct = convert_params_dict_to_struct(workflow_type, params_dict);

    Job job(helpers::generate_uuid(), workflow_type);
    connect_to_submitted_job(job, std::move(callbacks), auto_disconnect);

    protocol::JobSubmission submission;
    submission.set_uuid(job.id());
    if (job_timeout) {
        submission.set_timeout_ms(static_cast<uint64_t>(std::llround(job_timeout->count() * 1000.0)));
    }
    submission.set_workflow_type(workflow_type.workflow_type_name());
    submission.set_esdl(esdl);
    *submission.mutable_params_dict() = std::move(params_struct);

    bus_->publish(queue_names::job_submission_queue_name(workflow_type),
                  submission.SerializeAsString());

    log_info(log_domains::SDK, "Submitted job",
             {{"job_id", job.id()}, {"workflow_type", workflow_type.workflow_type_name()}});
    return job;
}

void OmotesInterface::disconnect_from_submitted_job(const Job& job) {
    bus_->unsubscribe(queue_names::job_results_queue_name(job));
    bus_->unsubscribe(queue_names::job_progress_queue_name(job));
    bus_->unsubscribe(queue_names::job_status_queue_name(job));
    log_debug(log_domains::SDK, "Disconnected from job", {{"job_id", job.id()}});
}

void OmotesInterface::cancel_job(const Job& job) {
    protocol::JobCancel cancel;
    cancel.set_uuid(job.id());
    bus_->publish(queue_names::job_cancel_queue_name(), cancel.SerializeAsString());
    log_info(log_domains::SDK, "Requested job cancellation", {{"job_id", job.id()}});
}

void OmotesInterface::connect_to_available_workflows(AvailableWorkflowsCallback callback) {
    if (!callback) {
        throw InvalidArgumentError("A callback is required for available workflows");
    }
    bus_->subscribe(
        queue_names::available_workflows_queue_name(),
        [callback = std::move(callback)](const std::string& message) {
            auto available_workflows = helpers::decode_message<protocol::AvailableWorkflows>(message);
            callback(WorkflowTypeManager::from_pb_message(available_workflows));
        });
}

} // namespace omotes
