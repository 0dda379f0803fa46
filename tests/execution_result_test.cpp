//! # Execution Result Tests
//!
//! Status transitions and run-time derivation.

#include "exemplar/core/execution_result.hpp"

#include <chrono>
#include <gtest/gtest.h>

using namespace exemplar::core;
using namespace std::chrono_literals;

class ExecutionResultTest : public ::testing::Test {
protected:
    ExecutionResult result;
    Timestamp t0 = Timestamp{} + 10s;
};

TEST_F(ExecutionResultTest, StartsNotStarted) {
    EXPECT_EQ(result.status(), Status::NotStarted);
    EXPECT_FALSE(result.started_at());
    EXPECT_FALSE(result.finished_at());
    EXPECT_FALSE(result.run_time());
    EXPECT_DOUBLE_EQ(result.run_time_seconds(), 0.0);
    EXPECT_FALSE(result.pending_message());
    EXPECT_FALSE(result.pending_fixed());
}

TEST_F(ExecutionResultTest, RunTimeIsFinishedMinusStarted) {
    ASSERT_TRUE(result.record_started(t0));
    EXPECT_EQ(result.status(), Status::Started);
    EXPECT_FALSE(result.run_time());

    ASSERT_TRUE(result.record_finished(Status::Passed, t0 + 250ms));
    EXPECT_EQ(result.status(), Status::Passed);
    EXPECT_EQ(*result.started_at(), t0);
    EXPECT_EQ(*result.finished_at(), t0 + 250ms);
    EXPECT_EQ(*result.run_time(), *result.finished_at() - *result.started_at());
    EXPECT_DOUBLE_EQ(result.run_time_seconds(), 0.25);
}

TEST_F(ExecutionResultTest, NeverGoesBackward) {
    ASSERT_TRUE(result.record_started(t0));
    ASSERT_TRUE(result.record_finished(Status::Failed, t0 + 1s));

    EXPECT_FALSE(result.record_started(t0 + 2s));
    EXPECT_FALSE(result.record_finished(Status::Passed, t0 + 3s));
    EXPECT_EQ(result.status(), Status::Failed);
    EXPECT_EQ(*result.finished_at(), t0 + 1s);
}

TEST_F(ExecutionResultTest, CannotFinishBeforeStarting) {
    EXPECT_FALSE(result.record_finished(Status::Passed, t0));
    EXPECT_EQ(result.status(), Status::NotStarted);
    EXPECT_FALSE(result.run_time());
}

TEST_F(ExecutionResultTest, RejectsNonTerminalFinish) {
    ASSERT_TRUE(result.record_started(t0));
    EXPECT_FALSE(result.record_finished(Status::Started, t0 + 1s));
    EXPECT_FALSE(result.record_finished(Status::NotStarted, t0 + 1s));
    EXPECT_EQ(result.status(), Status::Started);
}

TEST_F(ExecutionResultTest, ClockSteppingBackYieldsZeroRunTime) {
    ASSERT_TRUE(result.record_started(t0));
    ASSERT_TRUE(result.record_finished(Status::Pending, t0 - 5s));
    EXPECT_EQ(*result.run_time(), Duration::zero());
    EXPECT_EQ(*result.finished_at(), t0);
}

TEST(StatusTest, NamesAndTerminality) {
    EXPECT_STREQ(status_name(Status::NotStarted), "not_started");
    EXPECT_STREQ(status_name(Status::Pending), "pending");
    EXPECT_FALSE(is_terminal(Status::NotStarted));
    EXPECT_FALSE(is_terminal(Status::Started));
    EXPECT_TRUE(is_terminal(Status::Passed));
    EXPECT_TRUE(is_terminal(Status::Failed));
    EXPECT_TRUE(is_terminal(Status::Pending));
}
