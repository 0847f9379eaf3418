#include "roundtrip_orchestrator.hpp"

#include "omotes/logging.hpp"

namespace roundtrip {

RoundtripOrchestrator::RoundtripOrchestrator(
    std::shared_ptr<omotes::OrchestratorInterface> orchestrator,
    std::shared_ptr<omotes::InlineTaskRunner> runner,
    omotes::WorkerConfig worker_config)
    : orchestrator_(std::move(orchestrator)),
      runner_(std::move(runner)),
      worker_config_(std::move(worker_config)) {}

void RoundtripOrchestrator::start() {
    orchestrator_->start();
    orchestrator_->connect_to_job_submissions(
        [this](const omotes::protocol::JobSubmission& submission, const omotes::Job& job) {
            on_new_job(submission, job);
        });
    orchestrator_->connect_to_job_cancellations(
        [this](const omotes::protocol::JobCancel& cancel) { on_cancel(cancel); });
    orchestrator_->connect_to_task_events(
        worker_config_,
        [this](const omotes::protocol::TaskProgressUpdate& update) { on_task_progress(update); },
        [this](const omotes::protocol::TaskResult& result) { on_task_result(result); });
    orchestrator_->send_available_workflows();
}

void RoundtripOrchestrator::on_new_job(const omotes::protocol::JobSubmission& submission,
                                       const omotes::Job& job) {
    omotes::log_info("orchestrator", "job_received",
                     {{"job_id", job.id()}, {"workflow_type", submission.workflow_type()}});
    jobs_.emplace(job.id(), job);
    send_status(job, omotes::protocol::JobStatusUpdate::REGISTERED);

    omotes::TaskInvocation invocation;
    invocation.job_id = job.id();
    invocation.input_esdl = submission.esdl();
    invocation.workflow_config = submission.params_dict();
    runner_->enqueue(job.workflow_type().workflow_type_name(), std::move(invocation));
    send_status(job, omotes::protocol::JobStatusUpdate::ENQUEUED);
}

void RoundtripOrchestrator::on_cancel(const omotes::protocol::JobCancel& cancel) {
    auto it = jobs_.find(cancel.uuid());
    if (it == jobs_.end()) {
        omotes::log_warning("orchestrator", "cancel_for_unknown_job", {{"job_id", cancel.uuid()}});
        return;
    }
    // Inline tasks cannot be interrupted; the client is told and the result still follows.
    send_status(it->second, omotes::protocol::JobStatusUpdate::CANCELLED);
}

void RoundtripOrchestrator::on_task_progress(const omotes::protocol::TaskProgressUpdate& update) {
    auto it = jobs_.find(update.job_id());
    if (it == jobs_.end()) {
        return;
    }
    if (update.progress() == 0.0) {
        send_status(it->second, omotes::protocol::JobStatusUpdate::RUNNING);
    }

    omotes::protocol::JobProgressUpdate progress;
    progress.set_uuid(update.job_id());
    progress.set_progress(update.progress());
    progress.set_message(update.message());
    orchestrator_->send_job_progress_update(it->second, progress);
}

void RoundtripOrchestrator::on_task_result(const omotes::protocol::TaskResult& result) {
    auto it = jobs_.find(result.job_id());
    if (it == jobs_.end()) {
        omotes::log_warning("orchestrator", "result_for_unknown_job", {{"job_id", result.job_id()}});
        return;
    }
    const omotes::Job job = it->second;
    jobs_.erase(it);

    bool succeeded = result.result_type() == omotes::protocol::TaskResult::SUCCEEDED;
    send_status(job, succeeded ? omotes::protocol::JobStatusUpdate::SUCCEEDED
                               : omotes::protocol::JobStatusUpdate::FAILED);

    omotes::protocol::JobResult job_result;
    job_result.set_uuid(job.id());
    job_result.set_result_type(succeeded ? omotes::protocol::JobResult::SUCCEEDED
                                         : omotes::protocol::JobResult::FAILED);
    job_result.set_output_esdl(result.output_esdl());
    job_result.set_logs(result.logs());
    orchestrator_->send_job_result(job, job_result);
}

void RoundtripOrchestrator::send_status(const omotes::Job& job,
                                        omotes::protocol::JobStatusUpdate::JobStatus status) {
    omotes::protocol::JobStatusUpdate update;
    update.set_uuid(job.id());
    update.set_status(status);
    orchestrator_->send_job_status_update(job, update);
}

}  // namespace roundtrip
