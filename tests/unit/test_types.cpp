/**
 * @file test_types.cpp
 * @brief Unit tests for core types and the task state machine.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>
#include <set>

using namespace task_dispatch;

TEST(TypesTest, TaskTypeRoundTrip) {
    for (auto type : kAllTaskTypes) {
        auto parsed = parse_task_type(to_string(type));
        ASSERT_TRUE(parsed.has_value()) << to_string(type);
        EXPECT_EQ(*parsed, type);
    }
}

TEST(TypesTest, TaskTypeAcceptsDashedSpelling) {
    EXPECT_EQ(parse_task_type("code-writing"), TaskType::CodeWriting);
    EXPECT_EQ(parse_task_type("Research"), TaskType::Research);
    EXPECT_FALSE(parse_task_type("astrology").has_value());
}

TEST(TypesTest, TaskStatusNames) {
    EXPECT_EQ(to_string(TaskStatus::Pending), "pending");
    EXPECT_EQ(to_string(TaskStatus::Skipped), "skipped");
    EXPECT_EQ(parse_task_status("cancelled"), TaskStatus::Cancelled);
    EXPECT_FALSE(parse_task_status("paused").has_value());
}

TEST(TypesTest, TerminalStates) {
    EXPECT_TRUE(is_terminal(TaskStatus::Completed));
    EXPECT_TRUE(is_terminal(TaskStatus::Failed));
    EXPECT_TRUE(is_terminal(TaskStatus::Cancelled));
    EXPECT_TRUE(is_terminal(TaskStatus::Skipped));
    EXPECT_FALSE(is_terminal(TaskStatus::Pending));
    EXPECT_FALSE(is_terminal(TaskStatus::Running));
}

TEST(TypesTest, HappyPathTransitions) {
    EXPECT_TRUE(is_valid_transition(TaskStatus::Pending, TaskStatus::Ready));
    EXPECT_TRUE(is_valid_transition(TaskStatus::Ready, TaskStatus::Scheduled));
    EXPECT_TRUE(is_valid_transition(TaskStatus::Scheduled, TaskStatus::Running));
    EXPECT_TRUE(is_valid_transition(TaskStatus::Running, TaskStatus::Completed));
}

TEST(TypesTest, RetryPath) {
    EXPECT_TRUE(is_valid_transition(TaskStatus::Running, TaskStatus::Failed));
    EXPECT_TRUE(is_valid_transition(TaskStatus::Failed, TaskStatus::Pending));
    EXPECT_FALSE(is_valid_transition(TaskStatus::Failed, TaskStatus::Running));
}

TEST(TypesTest, FinalStatesAreSticky) {
    for (auto from : {TaskStatus::Completed, TaskStatus::Cancelled, TaskStatus::Skipped}) {
        for (auto to : {TaskStatus::Pending, TaskStatus::Ready, TaskStatus::Running,
                        TaskStatus::Failed, TaskStatus::Completed}) {
            EXPECT_FALSE(is_valid_transition(from, to))
                << to_string(from) << " -> " << to_string(to);
        }
    }
}

TEST(TypesTest, CannotSkipAheadToRunning) {
    EXPECT_FALSE(is_valid_transition(TaskStatus::Pending, TaskStatus::Running));
    EXPECT_FALSE(is_valid_transition(TaskStatus::Pending, TaskStatus::Completed));
    EXPECT_FALSE(is_valid_transition(TaskStatus::Ready, TaskStatus::Completed));
}

TEST(TypesTest, EstimatedDurationClampsComplexity) {
    Task task;
    task.estimated_complexity = 2.0;
    EXPECT_EQ(estimated_duration(task), Duration{120'000});

    task.estimated_complexity = 0.1;
    EXPECT_EQ(estimated_duration(task), Duration{60'000});

    task.estimated_complexity = 9.0;
    EXPECT_EQ(estimated_duration(task), Duration{300'000});
}

TEST(TypesTest, GenerateIdFormat) {
    auto id = generate_id("ckpt");
    EXPECT_EQ(id.rfind("ckpt-", 0), 0u);
    EXPECT_EQ(id.size(), 5u + 36u);
    EXPECT_EQ(id[5 + 14], '4');
}

TEST(TypesTest, GenerateIdUniqueness) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generate_id("session"));
    }
    EXPECT_EQ(ids.size(), 1000u);
}
