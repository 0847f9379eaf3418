#pragma once

#include <string>
#include "workflow_type.hpp"

namespace omotes {

/**
 * Handle to a submitted job.
 *
 * Holds the job id and a non-owning reference to the job's WorkflowType.
 * The registry owning that WorkflowType must outlive the handle.
 */
class Job {
public:
    Job(std::string id, const WorkflowType& workflow_type)
        : id_(std::move(id)), workflow_type_(&workflow_type) {}

    const std::string& id() const { return id_; }

    const WorkflowType& workflow_type() const { return *workflow_type_; }

    bool operator==(const Job& other) const { return id_ == other.id_; }
    bool operator!=(const Job& other) const { return !(*this == other); }

private:
    std::string id_;
    const WorkflowType* workflow_type_;
};

} // namespace omotes
