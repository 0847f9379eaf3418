#pragma once

#include <map>
#include <memory>
#include <string>
#include "omotes/config.hpp"
#include "omotes/orchestrator_interface.hpp"
#include "omotes/task_runner.hpp"

namespace roundtrip {

/**
 * Minimal orchestrator: hands each submitted job to the task runner as a task
 * of the same name as its workflow type, and relays worker progress and
 * results to the client's job queues.
 */
class RoundtripOrchestrator {
public:
    RoundtripOrchestrator(std::shared_ptr<omotes::OrchestratorInterface> orchestrator,
                          std::shared_ptr<omotes::InlineTaskRunner> runner,
                          omotes::WorkerConfig worker_config);

    void start();

    size_t active_jobs() const { return jobs_.size(); }

private:
    void on_new_job(const omotes::protocol::JobSubmission& submission, const omotes::Job& job);
    void on_cancel(const omotes::protocol::JobCancel& cancel);
    void on_task_progress(const omotes::protocol::TaskProgressUpdate& update);
    void on_task_result(const omotes::protocol::TaskResult& result);

    void send_status(const omotes::Job& job, omotes::protocol::JobStatusUpdate::JobStatus status);

    std::shared_ptr<omotes::OrchestratorInterface> orchestrator_;
    std::shared_ptr<omotes::InlineTaskRunner> runner_;
    omotes::WorkerConfig worker_config_;
    std::map<std::string, omotes::Job> jobs_;
};

}  // namespace roundtrip
