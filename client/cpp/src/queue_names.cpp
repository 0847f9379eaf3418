#include "omotes/queue_names.hpp"

namespace omotes {
namespace queue_names {

std::string job_submission_queue_name(const WorkflowType& workflow_type) {
    return "job_submissions." + workflow_type.workflow_type_name();
}

std::string job_results_queue_name(const Job& job) {
    return "jobs." + job.id() + ".result";
}

std::string job_progress_queue_name(const Job& job) {
    return "jobs." + job.id() + ".progress";
}

std::string job_status_queue_name(const Job& job) {
    return "jobs." + job.id() + ".status";
}

std::string job_cancel_queue_name() {
    return "job_cancellations";
}

std::string available_workflows_queue_name() {
    return "available_workflows";
}

} // namespace queue_names
} // namespace omotes
