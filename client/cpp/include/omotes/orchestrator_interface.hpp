#pragma once

#include <functional>
#include <memory>
#include "omotes/job.pb.h"
#include "omotes/task.pb.h"
#include "config.hpp"
#include "job.hpp"
#include "message_bus.hpp"
#include "workflow_type.hpp"

namespace omotes {

using NewJobCallback = std::function<void(const protocol::JobSubmission&, const Job&)>;
using JobCancelCallback = std::function<void(const protocol::JobCancel&)>;
using TaskProgressCallback = std::function<void(const protocol::TaskProgressUpdate&)>;
using TaskResultCallback = std::function<void(const protocol::TaskResult&)>;

/**
 * Orchestrator-side session: receives submissions and cancellations from
 * clients and publishes per-job updates back to them.
 *
 * Job handles passed to callbacks refer to WorkflowTypes owned by the shared
 * registry, which the session keeps alive.
 */
class OrchestratorInterface {
public:
    OrchestratorInterface(std::shared_ptr<MessageBus> bus,
                          std::shared_ptr<const WorkflowTypeManager> workflow_type_manager);

    void start();
    void stop();

    /**
     * Subscribe to the submission queue of every known workflow type.
     *
     * A submission whose embedded workflow type does not match the queue it
     * arrived on is logged as an error and dropped.
     */
    void connect_to_job_submissions(NewJobCallback on_new_job);

    void connect_to_job_cancellations(JobCancelCallback on_cancel);

    /**
     * Subscribe to the queues workers publish task progress and results on.
     */
    void connect_to_task_events(const WorkerConfig& config,
                                TaskProgressCallback on_progress,
                                TaskResultCallback on_result);

    void send_job_progress_update(const Job& job, const protocol::JobProgressUpdate& progress_update);
    void send_job_status_update(const Job& job, const protocol::JobStatusUpdate& status_update);
    void send_job_result(const Job& job, const protocol::JobResult& result);

    /**
     * Publish the workflow catalog for clients.
     */
    void send_available_workflows();

    const WorkflowTypeManager& workflow_type_manager() const { return *workflow_type_manager_; }

private:
    std::shared_ptr<MessageBus> bus_;
    std::shared_ptr<const WorkflowTypeManager> workflow_type_manager_;
};

} // namespace omotes
