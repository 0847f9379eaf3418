#pragma once

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <google/protobuf/struct.pb.h>

namespace omotes {

/**
 * One execution of a task as handed to a worker by the runner.
 */
struct TaskInvocation {
    std::string task_id;
    std::string job_id;
    std::string input_esdl;
    google::protobuf::Struct workflow_config;
};

using TaskBody = std::function<void(const TaskInvocation&)>;

/**
 * Execution runtime that delivers task invocations to workers.
 *
 * A body that throws marks the invocation as failed; the runner decides what
 * happens next (retry, dead-letter, or record).
 */
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    /**
     * Register the body to run for every invocation of task_type.
     */
    virtual void register_task(const std::string& task_type, TaskBody body) = 0;

    virtual void start() = 0;
};

/**
 * TaskRunner that runs queued invocations on the caller's thread.
 *
 * Failures are logged and counted; invocations are never retried.
 */
class InlineTaskRunner : public TaskRunner {
public:
    void register_task(const std::string& task_type, TaskBody body) override;
    void start() override;

    /**
     * Queue an invocation. A missing task_id is filled with a new UUID.
     */
    void enqueue(const std::string& task_type, TaskInvocation invocation);

    /**
     * Run every queued invocation.
     *
     * @return Number of invocations run
     * @throws InvalidArgumentError if an invocation names an unregistered task type
     */
    size_t run_pending();

    bool is_started() const { return started_; }
    size_t succeeded() const { return succeeded_; }
    size_t failed() const { return failed_; }

private:
    std::map<std::string, TaskBody> tasks_;
    std::deque<std::pair<std::string, TaskInvocation>> pending_;
    bool started_ = false;
    size_t succeeded_ = 0;
    size_t failed_ = 0;
};

} // namespace omotes
