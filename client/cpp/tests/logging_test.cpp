#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "omotes/logging.hpp"
#include "log_capture.hpp"

using namespace omotes;

// =============================================================================
// Log Sink Tests
// =============================================================================

TEST(LoggingTest, EntryFields_ShouldBeMergedIntoLogLine) {
    test_support::LogCapture logs;

    log_info(log_domains::SDK, "Submitted job", {{"job_id", "job-1"}});

    ASSERT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.entries()[0]["message"], "Submitted job");
    EXPECT_EQ(logs.entries()[0]["job_id"], "job-1");
    EXPECT_EQ(logs.entries()[0]["level"], "info");
}

TEST(LoggingTest, LevelThreshold_ShouldDropLowerEntries) {
    test_support::LogCapture logs(LogLevel::Warning);

    log_debug(log_domains::SDK, "hidden");
    log_error(log_domains::SDK, "shown");

    EXPECT_EQ(logs.entries().size(), 1u);
    EXPECT_EQ(logs.count("error"), 1u);
}

TEST(LoggingTest, SinkThatLogs_ShouldNotDeadlock) {
    // Given a sink that emits one nested entry of its own
    test_support::LogCapture logs;
    std::vector<std::string> seen;
    LogSink previous = set_log_sink([&seen](const nlohmann::json& entry) {
        seen.push_back(entry["message"].get<std::string>());
        if (seen.size() == 1) {
            log_info(log_domains::INTERNAL, "nested");
        }
    });

    // When an entry is logged
    log_info(log_domains::INTERNAL, "outer");
    set_log_sink(previous);

    // Then both entries should reach the sink
    EXPECT_EQ(seen, (std::vector<std::string>{"outer", "nested"}));
}

TEST(LoggingTest, SinkThatReplacesItself_ShouldNotDeadlock) {
    test_support::LogCapture logs;
    LogSink previous;
    int replaced_calls = 0;
    previous = set_log_sink([&](const nlohmann::json&) {
        set_log_sink([&replaced_calls](const nlohmann::json&) { ++replaced_calls; });
    });

    log_info(log_domains::INTERNAL, "first");
    log_info(log_domains::INTERNAL, "second");
    set_log_sink(previous);

    EXPECT_EQ(replaced_calls, 1);
}

TEST(LoggingTest, LogLevelFromString_ShouldBeCaseInsensitive) {
    EXPECT_EQ(log_level_from_string("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(log_level_from_string("Warning"), LogLevel::Warning);
    EXPECT_EQ(log_level_from_string("unknown"), LogLevel::Info);
}
