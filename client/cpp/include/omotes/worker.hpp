#pragma once

#include <functional>
#include <memory>
#include <string>
#include <google/protobuf/struct.pb.h>
#include "config.hpp"
#include "message_bus.hpp"
#include "task_runner.hpp"

namespace omotes {

/**
 * Reports task progress as a fraction between 0.0 and 1.0 with a message.
 */
using UpdateProgressHandler = std::function<void(double fraction, const std::string& message)>;

/**
 * The computation a worker performs: input ESDL and workflow configuration
 * in, output ESDL out.
 */
using WorkerTaskFunction = std::function<std::string(const std::string& input_esdl,
                                                     const google::protobuf::Struct& workflow_config,
                                                     const UpdateProgressHandler& update_progress)>;

/**
 * Everything a worker process needs to know about the one task type it runs.
 */
struct WorkerDefinition {
    /// Technical task name; the orchestrator routes tasks of this type here.
    std::string task_type;
    WorkerTaskFunction task_function;
    WorkerConfig config;
};

/**
 * Per-invocation helper handed to the task function.
 */
class TaskUtil {
public:
    TaskUtil(const WorkerDefinition& definition, const TaskInvocation& invocation, MessageBus& bus)
        : definition_(definition), invocation_(invocation), bus_(bus) {}

    /**
     * Publish a TaskProgressUpdate on the configured progress queue.
     */
    void update_progress(double fraction, const std::string& message) const;

private:
    const WorkerDefinition& definition_;
    const TaskInvocation& invocation_;
    MessageBus& bus_;
};

/**
 * Worker running a single task type.
 *
 * Example:
 *   WorkerDefinition definition{"grow_optimizer", optimize, WorkerConfig::from_env()};
 *   Worker worker(definition, bus, runner);
 *   worker.start();
 */
class Worker {
public:
    Worker(WorkerDefinition definition,
           std::shared_ptr<MessageBus> bus,
           std::shared_ptr<TaskRunner> runner);

    // The runner keeps a pointer to this worker after start().
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    /**
     * Apply the configured log level, start the bus and register the task
     * with the runner.
     *
     * @throws InvalidArgumentError if the definition has no task type or function
     */
    void start();

    /**
     * Run one invocation.
     *
     * Publishes progress 0.0, runs the task function, publishes progress 1.0
     * and a SUCCEEDED TaskResult with the output ESDL. If the task function
     * throws anything, a FAILED TaskResult carrying the error text is
     * published and the exception is rethrown to the runner.
     */
    void execute_task(const TaskInvocation& invocation);

    const WorkerDefinition& definition() const { return definition_; }

private:
    void publish_result(const TaskInvocation& invocation, bool succeeded,
                        const std::string& output_esdl, const std::string& logs);

    WorkerDefinition definition_;
    std::shared_ptr<MessageBus> bus_;
    std::shared_ptr<TaskRunner> runner_;
};

} // namespace omotes
