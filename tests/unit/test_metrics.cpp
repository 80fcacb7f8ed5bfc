/**
 * @file test_metrics.cpp
 * @brief Unit tests for MetricsCollector aggregation and event emission.
 */

#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace task_dispatch;
using namespace std::chrono_literals;

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        buffer_ = sink->buffer();
        collector_ = std::make_unique<MetricsCollector>(std::move(sink));
        t0_ = std::chrono::steady_clock::now();
    }

    [[nodiscard]] MemorySink events() const { return MemorySink(buffer_); }

    std::shared_ptr<MemorySink::Buffer> buffer_;
    std::unique_ptr<MetricsCollector> collector_;
    SteadyTime t0_;
};

TEST_F(MetricsCollectorTest, TaskDurationAndAgentUtilization) {
    collector_->begin_session(2, t0_);
    collector_->record_task_started("a", "coder-1", t0_);
    collector_->record_task_finished("a", TaskStatus::Completed, t0_ + 400ms);
    collector_->record_task_terminal("a", TaskStatus::Completed);
    collector_->record_task_started("b", "coder-1", t0_ + 400ms);
    collector_->record_task_finished("b", TaskStatus::Completed, t0_ + 600ms);
    collector_->record_task_terminal("b", TaskStatus::Completed);
    collector_->end_session(t0_ + 1000ms);

    auto m = collector_->snapshot(t0_ + 5000ms);
    EXPECT_EQ(m.total_tasks, 2u);
    EXPECT_EQ(m.completed_tasks, 2u);
    EXPECT_EQ(m.end_to_end_latency, 1000ms);
    EXPECT_EQ(m.tasks.at("a").duration, 400ms);
    EXPECT_EQ(m.tasks.at("b").duration, 200ms);
    EXPECT_DOUBLE_EQ(m.average_task_ms, 300.0);

    const auto& agent = m.agents.at("coder-1");
    EXPECT_EQ(agent.busy_time, 600ms);
    EXPECT_EQ(agent.tasks_completed, 2u);
    EXPECT_DOUBLE_EQ(agent.utilization, 0.6);
    EXPECT_DOUBLE_EQ(m.completion_percentage(), 100.0);
}

TEST_F(MetricsCollectorTest, RetriesAccumulateAcrossAttempts) {
    collector_->begin_session(1, t0_);
    collector_->record_task_started("flaky", "gen-1", t0_);
    collector_->record_task_finished("flaky", TaskStatus::Failed, t0_ + 100ms);
    collector_->record_retry("flaky");
    collector_->record_task_started("flaky", "gen-1", t0_ + 200ms);
    collector_->record_task_finished("flaky", TaskStatus::Completed, t0_ + 250ms);
    collector_->record_task_terminal("flaky", TaskStatus::Completed);

    auto m = collector_->snapshot(t0_ + 300ms);
    const auto& task = m.tasks.at("flaky");
    EXPECT_EQ(task.attempts, 2u);
    EXPECT_EQ(task.retries, 1u);
    EXPECT_EQ(task.duration, 150ms);
    EXPECT_EQ(task.final_status, TaskStatus::Completed);
    EXPECT_EQ(m.total_retries, 1u);
    EXPECT_EQ(m.agents.at("gen-1").tasks_failed, 1u);
    EXPECT_EQ(m.agents.at("gen-1").tasks_completed, 1u);
}

TEST_F(MetricsCollectorTest, TerminalCountsAndRates) {
    collector_->begin_session(4, t0_);
    collector_->record_task_terminal("a", TaskStatus::Completed);
    collector_->record_task_terminal("b", TaskStatus::Failed);
    collector_->record_task_terminal("c", TaskStatus::Skipped);
    collector_->record_task_terminal("d", TaskStatus::Cancelled);

    auto m = collector_->snapshot(t0_);
    EXPECT_EQ(m.completed_tasks, 1u);
    EXPECT_EQ(m.failed_tasks, 1u);
    EXPECT_EQ(m.skipped_tasks, 1u);
    EXPECT_EQ(m.cancelled_tasks, 1u);
    EXPECT_DOUBLE_EQ(m.completion_percentage(), 25.0);
    EXPECT_DOUBLE_EQ(m.success_rate(), 50.0);
}

TEST_F(MetricsCollectorTest, QueueDepthSeries) {
    collector_->begin_session(3, t0_);
    collector_->record_queue_depth(3, 0, t0_);
    collector_->record_queue_depth(1, 2, t0_ + 50ms);

    auto m = collector_->snapshot(t0_ + 100ms);
    ASSERT_EQ(m.queue_depth.size(), 2u);
    EXPECT_EQ(m.queue_depth[1].offset, 50ms);
    EXPECT_EQ(m.queue_depth[1].ready, 1u);
    EXPECT_EQ(m.queue_depth[1].running, 2u);
}

TEST_F(MetricsCollectorTest, RestoreReseedsCounters) {
    collector_->begin_session(3, t0_);
    collector_->restore_task("a", TaskStatus::Completed, 0);
    collector_->restore_task("b", TaskStatus::Pending, 2);

    auto m = collector_->snapshot(t0_);
    EXPECT_EQ(m.completed_tasks, 1u);
    EXPECT_EQ(m.total_retries, 2u);
    EXPECT_EQ(m.tasks.at("b").retries, 2u);
}

TEST_F(MetricsCollectorTest, EmitsStructuredEvents) {
    collector_->begin_session(1, t0_);
    collector_->record_task_started("a", "coder-1", t0_);
    collector_->record_task_finished("a", TaskStatus::Completed, t0_ + 10ms);
    collector_->record_custom("plan_summary", R"({"phases":3})");
    collector_->end_session(t0_ + 20ms);

    auto sink = events();
    EXPECT_EQ(sink.count_containing(R"("event":"session_started")"), 1u);
    EXPECT_EQ(sink.count_containing(R"("event":"task_started")"), 1u);
    EXPECT_EQ(sink.count_containing(R"("state":"completed")"), 1u);
    EXPECT_EQ(sink.count_containing(R"("data":{"phases":3})"), 1u);
    EXPECT_EQ(sink.count_containing(R"("latency_ms":20)"), 1u);
}
