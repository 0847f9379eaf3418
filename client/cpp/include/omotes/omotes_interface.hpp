#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "omotes/job.pb.h"
#include "job.hpp"
#include "message_bus.hpp"
#include "workflow_type.hpp"

namespace omotes {

using JobResultCallback = std::function<void(const Job&, const protocol::JobResult&)>;
using JobProgressCallback = std::function<void(const Job&, const protocol::JobProgressUpdate&)>;
using JobStatusCallback = std::function<void(const Job&, const protocol::JobStatusUpdate&)>;
using AvailableWorkflowsCallback = std::function<void(const WorkflowTypeManager&)>;

/**
 * Callbacks for one job. Only on_finished is required; progress and status
 * updates without a callback are decoded and discarded.
 */
struct JobCallbacks {
    JobResultCallback on_finished;
    JobProgressCallback on_progress_update;
    JobStatusCallback on_status_update;
};

/**
 * Client-side session: submits jobs and follows their progress.
 *
 * The returned Job handles are the only state a client needs to keep across
 * restarts; connect_to_submitted_job() re-attaches to a running job.
 * Callbacks run on whatever context the MessageBus delivers on and capture
 * this session, so it must outlive its subscriptions or be stopped first.
 *
 * Example:
 *   OmotesInterface omotes(bus);
 *   omotes.start();
 *   Job job = omotes.submit_job(esdl, params, *workflow, std::chrono::hours(1),
 *                               {on_finished, on_progress, on_status});
 */
class OmotesInterface {
public:
    explicit OmotesInterface(std::shared_ptr<MessageBus> bus);

    void start();
    void stop();

    /**
     * Subscribe to the job's result, progress and status queues.
     *
     * The result queue is consumed once; the other two until disconnected.
     * Nothing is published. Use after a restart to resume a running job.
     *
     * @param auto_disconnect Disconnect once on_finished returns normally
     * @throws InvalidArgumentError if callbacks.on_finished is empty
     */
    void connect_to_submitted_job(const Job& job, JobCallbacks callbacks,
                                  bool auto_disconnect = true);

    /**
     * Submit a new job.
     *
     * Subscriptions for the job are made before the submission is published,
     * so no update can be missed.
     *
     * @param esdl Input document
     * @param params_dict Values for the workflow's declared parameters
     * @param workflow_type Workflow to run; must outlive the returned Job
     * @param job_timeout How long the job may run; std::nullopt for no limit
     * @return Handle of the new job
     * @throws InvalidArgumentError if job_timeout is negative
     * @throws MissingFieldException if a declared parameter has no value
     * @throws WrongFieldTypeException if a parameter value has the wrong kind
     */
    Job submit_job(const std::string& esdl,
                   const ParamsDict& params_dict,
                   const WorkflowType& workflow_type,
                   std::optional<std::chrono::duration<double>> job_timeout,
                   JobCallbacks callbacks,
                   bool auto_disconnect = true);

    /**
     * Stop listening to all queues of the job. Idempotent, and safe to call
     * from within the job's own callbacks.
     */
    void disconnect_from_submitted_job(const Job& job);

    /**
     * Request cancellation. Subscriptions are kept so the final result is
     * still delivered.
     */
    void cancel_job(const Job& job);

    /**
     * Receive the orchestrator's workflow catalog whenever it is published.
     */
    void connect_to_available_workflows(AvailableWorkflowsCallback callback);

private:
    std::shared_ptr<MessageBus> bus_;
};

} // namespace omotes
