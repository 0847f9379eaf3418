#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "omotes/in_memory_message_bus.hpp"
#include "omotes/omotes_interface.hpp"
#include "omotes/queue_names.hpp"
#include "log_capture.hpp"

using namespace omotes;

// =============================================================================
// Test Fixture
// =============================================================================

class OmotesInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        IntegerParameter steps;
        steps.key_name = "steps";
        workflow_ = std::make_unique<WorkflowType>(
            "simulator", "Simulator", std::vector<WorkflowParameter>{steps});

        bus_ = std::make_shared<InMemoryMessageBus>();
        omotes_ = std::make_unique<OmotesInterface>(bus_);
        omotes_->start();
    }

    JobCallbacks recording_callbacks() {
        return {
            [this](const Job&, const protocol::JobResult& result) { results_.push_back(result); },
            [this](const Job&, const protocol::JobProgressUpdate& update) { progress_.push_back(update); },
            [this](const Job&, const protocol::JobStatusUpdate& update) { statuses_.push_back(update); },
        };
    }

    Job submit(bool auto_disconnect = true) {
        return omotes_->submit_job("<esdl/>", ParamsDict{{"steps", int64_t{3}}}, *workflow_,
                                   std::nullopt, recording_callbacks(), auto_disconnect);
    }

    void publish_result(const Job& job, protocol::JobResult::ResultType type) {
        protocol::JobResult result;
        result.set_uuid(job.id());
        result.set_result_type(type);
        result.set_output_esdl("<output/>");
        bus_->publish(queue_names::job_results_queue_name(job), result.SerializeAsString());
    }

    void publish_progress(const Job& job, double progress) {
        protocol::JobProgressUpdate update;
        update.set_uuid(job.id());
        update.set_progress(progress);
        bus_->publish(queue_names::job_progress_queue_name(job), update.SerializeAsString());
    }

    test_support::LogCapture logs_;
    std::unique_ptr<WorkflowType> workflow_;
    std::shared_ptr<InMemoryMessageBus> bus_;
    std::unique_ptr<OmotesInterface> omotes_;
    std::vector<protocol::JobResult> results_;
    std::vector<protocol::JobProgressUpdate> progress_;
    std::vector<protocol::JobStatusUpdate> statuses_;
};

// =============================================================================
// Submission Tests
// =============================================================================

TEST_F(OmotesInterfaceTest, SubmitJob_ShouldPublishSubmissionOnWorkflowQueue) {
    // Given a submission consumer on the workflow queue
    std::vector<protocol::JobSubmission> submissions;
    bus_->subscribe("job_submissions.simulator", [&](const std::string& message) {
        protocol::JobSubmission submission;
        ASSERT_TRUE(submission.ParseFromString(message));
        submissions.push_back(submission);
    });

    // When I submit a job with a timeout
    Job job = omotes_->submit_job("<esdl/>", ParamsDict{{"steps", int64_t{3}}}, *workflow_,
                                  std::chrono::milliseconds(1500), recording_callbacks());
    bus_->process_events();

    // Then the submission should carry the job id, type, input and parameters
    ASSERT_EQ(submissions.size(), 1u);
    EXPECT_EQ(submissions[0].uuid(), job.id());
    EXPECT_EQ(submissions[0].workflow_type(), "simulator");
    EXPECT_EQ(submissions[0].esdl(), "<esdl/>");
    ASSERT_TRUE(submissions[0].has_timeout_ms());
    EXPECT_EQ(submissions[0].timeout_ms(), 1500u);
    EXPECT_DOUBLE_EQ(submissions[0].params_dict().fields().at("steps").number_value(), 3.0);
}

TEST_F(OmotesInterfaceTest, SubmitJob_WithoutTimeout_ShouldLeaveTimeoutUnset) {
    protocol::JobSubmission submission;
    bus_->subscribe("job_submissions.simulator", [&](const std::string& message) {
        EXPECT_TRUE(submission.ParseFromString(message));
    });

    submit();
    bus_->process_events();

    EXPECT_FALSE(submission.has_timeout_ms());
}

TEST_F(OmotesInterfaceTest, SubmitJob_ShouldSubscribeBeforePublishing) {
    Job job = submit();

    EXPECT_TRUE(bus_->has_consumer(queue_names::job_results_queue_name(job)));
    EXPECT_TRUE(bus_->has_consumer(queue_names::job_progress_queue_name(job)));
    EXPECT_TRUE(bus_->has_consumer(queue_names::job_status_queue_name(job)));
    EXPECT_EQ(bus_->pending("job_submissions.simulator"), 1u);
}

TEST_F(OmotesInterfaceTest, SubmitJob_MissingParameter_ShouldThrowWithoutSubscribing) {
    EXPECT_THROW(omotes_->submit_job("<esdl/>", ParamsDict{}, *workflow_, std::nullopt,
                                     recording_callbacks()),
                 MissingFieldException);
    EXPECT_EQ(bus_->pending("job_submissions.simulator"), 0u);
}

TEST_F(OmotesInterfaceTest, SubmitJob_NegativeTimeout_ShouldThrowInvalidArgument) {
    EXPECT_THROW(omotes_->submit_job("<esdl/>", ParamsDict{{"steps", int64_t{3}}}, *workflow_,
                                     std::chrono::seconds(-5), recording_callbacks()),
                 InvalidArgumentError);
    EXPECT_EQ(bus_->pending("job_submissions.simulator"), 0u);
    EXPECT_EQ(bus_->consumer_count(), 0u);
}

TEST_F(OmotesInterfaceTest, SubmitJob_ShouldGenerateDistinctIds) {
    Job first = submit();
    Job second = submit();

    EXPECT_NE(first, second);
    EXPECT_EQ(first.id().size(), 36u);
}

// =============================================================================
// Update Delivery Tests
// =============================================================================

TEST_F(OmotesInterfaceTest, Updates_ShouldReachCallbacks) {
    Job job = submit();

    protocol::JobStatusUpdate status;
    status.set_uuid(job.id());
    status.set_status(protocol::JobStatusUpdate::RUNNING);
    bus_->publish(queue_names::job_status_queue_name(job), status.SerializeAsString());
    publish_progress(job, 0.5);
    bus_->process_events();

    ASSERT_EQ(statuses_.size(), 1u);
    EXPECT_EQ(statuses_[0].status(), protocol::JobStatusUpdate::RUNNING);
    ASSERT_EQ(progress_.size(), 1u);
    EXPECT_DOUBLE_EQ(progress_[0].progress(), 0.5);
}

TEST_F(OmotesInterfaceTest, Result_WithAutoDisconnect_ShouldDisconnectAfterCallback) {
    // Given a submitted job
    Job job = submit();

    // When its result arrives
    publish_result(job, protocol::JobResult::SUCCEEDED);
    bus_->process_events();

    // Then the callback should run and all job queues should be released
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].output_esdl(), "<output/>");
    EXPECT_FALSE(bus_->has_consumer(queue_names::job_progress_queue_name(job)));
    EXPECT_FALSE(bus_->has_consumer(queue_names::job_status_queue_name(job)));
}

TEST_F(OmotesInterfaceTest, Result_WithoutAutoDisconnect_ShouldKeepUpdateSubscriptions) {
    Job job = submit(false);

    publish_result(job, protocol::JobResult::FAILED);
    bus_->process_events();

    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].result_type(), protocol::JobResult::FAILED);
    EXPECT_TRUE(bus_->has_consumer(queue_names::job_progress_queue_name(job)));
}

TEST_F(OmotesInterfaceTest, ResultCallbackThrows_ShouldPropagateAndSkipDisconnect) {
    Job job = omotes_->submit_job(
        "<esdl/>", ParamsDict{{"steps", int64_t{3}}}, *workflow_, std::nullopt,
        {[](const Job&, const protocol::JobResult&) { throw std::runtime_error("handler failed"); },
         nullptr, nullptr});

    publish_result(job, protocol::JobResult::SUCCEEDED);

    EXPECT_THROW(bus_->process_events(), std::runtime_error);
    EXPECT_TRUE(bus_->has_consumer(queue_names::job_progress_queue_name(job)));
}

TEST_F(OmotesInterfaceTest, NullProgressCallback_ShouldDiscardUpdates) {
    Job job = omotes_->submit_job(
        "<esdl/>", ParamsDict{{"steps", int64_t{3}}}, *workflow_, std::nullopt,
        {[](const Job&, const protocol::JobResult&) {}, nullptr, nullptr});

    publish_progress(job, 0.25);

    EXPECT_NO_THROW(bus_->process_events());
    EXPECT_EQ(bus_->pending(queue_names::job_progress_queue_name(job)), 0u);
}

TEST_F(OmotesInterfaceTest, MissingResultCallback_ShouldThrowInvalidArgument) {
    Job job("some-id", *workflow_);

    EXPECT_THROW(omotes_->connect_to_submitted_job(job, JobCallbacks{}), InvalidArgumentError);
}

TEST_F(OmotesInterfaceTest, UndecodableResult_ShouldThrowMessageDecodeError) {
    Job job = submit();

    bus_->publish(queue_names::job_results_queue_name(job), std::string("\xff\xff\xff", 3));

    EXPECT_THROW(bus_->process_events(), MessageDecodeError);
    EXPECT_TRUE(results_.empty());
}

TEST_F(OmotesInterfaceTest, CompletedJobs_ShouldLeaveNoQueuesOrConsumersBehind) {
    // Given a consumer draining the submission queue
    bus_->subscribe("job_submissions.simulator", [](const std::string&) {});

    // When several jobs run to completion
    for (int i = 0; i < 3; ++i) {
        Job job = submit();
        protocol::JobStatusUpdate status;
        status.set_uuid(job.id());
        status.set_status(protocol::JobStatusUpdate::SUCCEEDED);
        bus_->publish(queue_names::job_status_queue_name(job), status.SerializeAsString());
        publish_progress(job, 1.0);
        publish_result(job, protocol::JobResult::SUCCEEDED);
        bus_->process_events();
    }

    // Then the bus should hold no per-job state
    EXPECT_EQ(results_.size(), 3u);
    EXPECT_EQ(bus_->queue_count(), 0u);
    EXPECT_EQ(bus_->consumer_count(), 1u);
}

// =============================================================================
// Connect / Disconnect Tests
// =============================================================================

TEST_F(OmotesInterfaceTest, SubmitThenDisconnect_ShouldIgnoreLaterUpdates) {
    // Given a job that is disconnected right after submission
    Job job = submit();
    EXPECT_NO_THROW(omotes_->disconnect_from_submitted_job(job));

    // When updates and the result are published
    publish_progress(job, 0.5);
    publish_result(job, protocol::JobResult::SUCCEEDED);
    bus_->process_events();

    // Then no callback should be invoked
    EXPECT_TRUE(progress_.empty());
    EXPECT_TRUE(results_.empty());
}

TEST_F(OmotesInterfaceTest, Disconnect_ShouldBeIdempotent) {
    Job job = submit();

    omotes_->disconnect_from_submitted_job(job);
    EXPECT_NO_THROW(omotes_->disconnect_from_submitted_job(job));
}

TEST_F(OmotesInterfaceTest, Reconnect_ShouldReceiveResultPublishedWhileAway) {
    // Given a job whose client went away before the result was published
    Job job = submit();
    omotes_->disconnect_from_submitted_job(job);
    publish_result(job, protocol::JobResult::SUCCEEDED);
    bus_->process_events();
    ASSERT_TRUE(results_.empty());

    // When the client reconnects with the stored handle
    omotes_->connect_to_submitted_job(job, recording_callbacks());
    bus_->process_events();

    // Then the queued result should be delivered
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].uuid(), job.id());
}

// =============================================================================
// Cancellation and Catalog Tests
// =============================================================================

TEST_F(OmotesInterfaceTest, CancelJob_ShouldPublishOnCancellationQueue) {
    Job job = submit();

    omotes_->cancel_job(job);

    ASSERT_EQ(bus_->pending("job_cancellations"), 1u);
    EXPECT_TRUE(bus_->has_consumer(queue_names::job_results_queue_name(job)));
}

TEST_F(OmotesInterfaceTest, AvailableWorkflows_ShouldBuildManager) {
    // Given a catalog listener
    std::vector<std::string> names;
    omotes_->connect_to_available_workflows([&](const WorkflowTypeManager& manager) {
        for (const auto& workflow : manager.get_all_workflows()) {
            names.push_back(workflow.workflow_type_name());
        }
    });

    // When a catalog is published
    WorkflowTypeManager catalog({WorkflowType("a", "A"), WorkflowType("b", "B")});
    bus_->publish("available_workflows", catalog.to_pb_message().SerializeAsString());
    bus_->process_events();

    // Then the listener should see every workflow
    EXPECT_EQ(names, (std::vector<std::string>{"a", "b"}));
}
