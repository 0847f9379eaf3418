#pragma once

#include <string>
#include "job.hpp"
#include "workflow_type.hpp"

namespace omotes {

/**
 * Names of the broker queues shared by client, orchestrator and workers.
 *
 * Workflow names and job ids are used verbatim.
 */
namespace queue_names {

/// Queue on which new jobs of this workflow type are submitted.
std::string job_submission_queue_name(const WorkflowType& workflow_type);

std::string job_results_queue_name(const Job& job);

std::string job_progress_queue_name(const Job& job);

std::string job_status_queue_name(const Job& job);

/// Shared queue for cancellation requests of all jobs.
std::string job_cancel_queue_name();

/// Queue on which the orchestrator publishes its workflow catalog.
std::string available_workflows_queue_name();

} // namespace queue_names
} // namespace omotes
