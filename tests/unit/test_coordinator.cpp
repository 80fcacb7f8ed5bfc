/**
 * @file test_coordinator.cpp
 * @brief Unit tests for the Coordinator scheduling loop: retries, timeouts,
 *        cancellation, skip propagation and concurrency limits.
 */

#include "coordination/coordinator.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

using namespace task_dispatch;
using namespace std::chrono_literals;

namespace {

Task make_task(const std::string& id, std::vector<std::string> inputs = {},
               std::vector<std::string> outputs = {}, TaskType type = TaskType::Generic) {
    Task task;
    task.id = id;
    task.type = type;
    task.description = "task " + id;
    task.inputs = std::move(inputs);
    task.outputs = std::move(outputs);
    return task;
}

Edge dep(const TaskId& from, const TaskId& to) {
    return Edge{from, to, DependencyKind::Data, 1.0, Provenance::Rule, "test"};
}

ArtifactMap declared_outputs(const Task& task) {
    ArtifactMap out;
    for (const auto& name : task.outputs) out[name] = task.id + ":" + name;
    return out;
}

/// Spin until `flag` is set or two seconds pass.
bool wait_for(const std::atomic<bool>& flag) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!flag.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    return flag.load();
}

}  // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Debug);
        bus_ = std::make_unique<MessageBus>(BusConfig{}, *logger_);

        config_.tick_interval_ms = 5;
        config_.retry_backoff_base_ms = 5;
        config_.retry_backoff_max_ms = 20;
        config_.task_timeout_default_ms = 10'000;
        config_.cancel_grace_period_ms = 2'000;

        agents_.blueprints = {"worker"};
        agents_.pool_size_per_type = 4;

        handler_ = [](const Task& task, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
            return declared_outputs(task);
        };
        ASSERT_TRUE(registry_.register_factory("worker", [this] {
            return std::make_unique<AgentBlueprint>(
                "worker", std::set<TaskType>{TaskType::Generic},
                [this]() -> AgentHandler {
                    return [this](const Task& task, const ArtifactMap& inputs, std::stop_token stop) {
                        return handler_(task, inputs, std::move(stop));
                    };
                });
        }));
    }

    /// Build, freeze and seed the graph, then construct the coordinator.
    void prepare(std::vector<Task> tasks, std::vector<Edge> edges = {}) {
        auto built = ExecutionGraph::build(std::move(tasks), edges);
        ASSERT_TRUE(built.has_value()) << built.error().message;
        graph_ = std::move(built).value();
        ASSERT_TRUE(graph_.freeze());

        state_ = std::make_unique<StateManager>(*bus_, &store_, *logger_, std::make_unique<NullSink>());
        ASSERT_TRUE(state_->initialize("session", graph_));
        factory_ = std::make_unique<AgentFactory>(agents_, registry_, *logger_);
        coordinator_ = std::make_unique<Coordinator>(config_, checkpoint_, graph_, *state_,
                                                     *factory_, *logger_);
    }

    [[nodiscard]] TaskStatus status_of(const TaskId& id) const {
        return state_->task(id)->status;
    }

    std::unique_ptr<Logger> logger_;
    std::unique_ptr<MessageBus> bus_;
    MemoryCheckpointStore store_;
    BlueprintRegistry registry_;
    AgentHandler handler_;

    CoordinatorConfig config_;
    CheckpointConfig checkpoint_;
    AgentsConfig agents_;

    ExecutionGraph graph_;
    std::unique_ptr<StateManager> state_;
    std::unique_ptr<AgentFactory> factory_;
    std::unique_ptr<Coordinator> coordinator_;   // Declared last: torn down first
};

// ─── Policies ────────────────────────────────

TEST(CoordinatorPolicyTest, DeadlineScalesWithComplexity) {
    CoordinatorConfig config;
    Task task;
    task.estimated_complexity = 3.0;
    EXPECT_EQ(Coordinator::deadline_for(task, config), Duration{900'000});

    task.estimated_complexity = 9.0;
    EXPECT_EQ(Coordinator::deadline_for(task, config), Duration{1'500'000});
}

TEST(CoordinatorPolicyTest, BackoffDoublesUpToCap) {
    CoordinatorConfig config;
    EXPECT_EQ(Coordinator::backoff_for(0, config), Duration{0});
    EXPECT_EQ(Coordinator::backoff_for(1, config), Duration{1'000});
    EXPECT_EQ(Coordinator::backoff_for(2, config), Duration{2'000});
    EXPECT_EQ(Coordinator::backoff_for(4, config), Duration{8'000});
    EXPECT_EQ(Coordinator::backoff_for(10, config), Duration{60'000});
    EXPECT_EQ(Coordinator::backoff_for(64, config), Duration{60'000});
}

TEST_F(CoordinatorTest, RankReadyPrefersPriorityThenCriticalPath) {
    auto urgent = make_task("b");
    urgent.priority = 5;
    auto heavy = make_task("c");
    heavy.estimated_complexity = 3.0;
    prepare({make_task("a"), urgent, heavy, make_task("d")});

    EXPECT_EQ(coordinator_->rank_ready({"d", "a", "c", "b"}),
              (std::vector<TaskId>{"b", "c", "a", "d"}));
}

TEST_F(CoordinatorTest, RunNeedsFrozenGraph) {
    ExecutionGraph open;
    ASSERT_TRUE(open.add_task(make_task("t")));
    StateManager state(*bus_, nullptr, *logger_, std::make_unique<NullSink>());
    AgentFactory factory(agents_, registry_, *logger_);
    Coordinator coordinator(config_, checkpoint_, open, state, factory, *logger_);

    auto result = coordinator.run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

// ─── Execution ───────────────────────────────

TEST_F(CoordinatorTest, ArtifactsFlowDownstream) {
    std::mutex mutex;
    ArtifactMap seen_by_consumer;
    handler_ = [&](const Task& task, const ArtifactMap& inputs, std::stop_token) -> Result<ArtifactMap> {
        if (task.id == "consumer") {
            std::lock_guard lock(mutex);
            seen_by_consumer = inputs;
        }
        return declared_outputs(task);
    };
    prepare({make_task("producer", {}, {"x"}), make_task("consumer", {"x"}, {"y"})},
            {dep("producer", "consumer")});

    ASSERT_TRUE(coordinator_->run());

    EXPECT_EQ(status_of("producer"), TaskStatus::Completed);
    EXPECT_EQ(status_of("consumer"), TaskStatus::Completed);
    EXPECT_EQ(seen_by_consumer, (ArtifactMap{{"x", "producer:x"}}));
    EXPECT_EQ(state_->metrics().snapshot().completed_tasks, 2u);
    EXPECT_EQ(factory_->busy_count(), 0u);
    EXPECT_TRUE(state_->assignments().empty());

    auto latest = store_.latest("session");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->reason, "final");
}

TEST_F(CoordinatorTest, ConcurrencyLimitIsRespected) {
    config_.max_concurrent_agents = 2;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    handler_ = [&](const Task& task, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(15ms);
        --active;
        return declared_outputs(task);
    };

    std::vector<Task> tasks;
    for (int i = 0; i < 6; ++i) tasks.push_back(make_task("t" + std::to_string(i)));
    prepare(std::move(tasks));

    ASSERT_TRUE(coordinator_->run());
    EXPECT_EQ(state_->count(TaskStatus::Completed), 6u);
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

// ─── Failure handling ────────────────────────

TEST_F(CoordinatorTest, TransientFailureIsRetried) {
    std::atomic<int> attempts{0};
    handler_ = [&](const Task& task, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
        if (++attempts <= 2) return Error{ErrorCode::TaskExecution, "flaky"};
        return declared_outputs(task);
    };
    prepare({make_task("flaky", {}, {"out"})});

    ASSERT_TRUE(coordinator_->run());
    EXPECT_EQ(attempts.load(), 3);
    auto task = state_->task("flaky");
    EXPECT_EQ(task->status, TaskStatus::Completed);
    EXPECT_EQ(task->retry_count, 2u);
    EXPECT_EQ(state_->metrics().snapshot().total_retries, 2u);
    EXPECT_EQ(factory_->busy_count(), 0u);
    EXPECT_TRUE(state_->assignments().empty());
}

TEST_F(CoordinatorTest, ExhaustedRetriesSkipDescendants) {
    config_.max_retries = 1;
    std::atomic<int> attempts{0};
    handler_ = [&](const Task& task, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
        if (task.id == "root") {
            ++attempts;
            return Error{ErrorCode::TaskExecution, "broken"};
        }
        return declared_outputs(task);
    };
    prepare({make_task("root", {}, {"x"}), make_task("mid", {"x"}, {"y"}),
             make_task("leaf", {"y"}), make_task("side")},
            {dep("root", "mid"), dep("mid", "leaf")});

    ASSERT_TRUE(coordinator_->run());

    EXPECT_EQ(attempts.load(), 2);
    auto root = state_->task("root");
    EXPECT_EQ(root->status, TaskStatus::Failed);
    EXPECT_EQ(root->retry_count, 2u);
    EXPECT_EQ(root->failure_reason, "broken");
    EXPECT_EQ(status_of("mid"), TaskStatus::Skipped);
    EXPECT_EQ(status_of("leaf"), TaskStatus::Skipped);
    EXPECT_NE(state_->task("leaf")->failure_reason.find("root"), std::string::npos);
    EXPECT_EQ(status_of("side"), TaskStatus::Completed);
}

TEST_F(CoordinatorTest, BestEffortFailureLeavesPlaceholder) {
    config_.max_retries = 0;
    std::mutex mutex;
    ArtifactMap seen;
    handler_ = [&](const Task& task, const ArtifactMap& inputs, std::stop_token) -> Result<ArtifactMap> {
        if (task.id == "optional") return Error{ErrorCode::TaskExecution, "unavailable"};
        std::lock_guard lock(mutex);
        seen = inputs;
        return declared_outputs(task);
    };
    auto optional = make_task("optional", {}, {"notes"});
    optional.best_effort = true;
    optional.required = false;
    prepare({optional, make_task("main", {"notes"}, {"report"})}, {dep("optional", "main")});

    ASSERT_TRUE(coordinator_->run());

    EXPECT_EQ(status_of("optional"), TaskStatus::Failed);
    EXPECT_EQ(status_of("main"), TaskStatus::Completed);
    ASSERT_TRUE(seen.contains("notes"));
    EXPECT_EQ(seen.at("notes").rfind("placeholder:", 0), 0u);

    auto artifacts = state_->artifacts();
    auto notes = std::find_if(artifacts.begin(), artifacts.end(),
                              [](const Artifact& a) { return a.name == "notes"; });
    ASSERT_NE(notes, artifacts.end());
    EXPECT_TRUE(notes->placeholder);
}

TEST_F(CoordinatorTest, MissingCapabilityFailsWithoutRetry) {
    prepare({make_task("review", {}, {}, TaskType::Review), make_task("after")},
            {dep("review", "after")});

    ASSERT_TRUE(coordinator_->run());

    auto review = state_->task("review");
    EXPECT_EQ(review->status, TaskStatus::Failed);
    EXPECT_EQ(review->retry_count, 1u);
    EXPECT_NE(review->failure_reason.find("No agent blueprint serves review"), std::string::npos);
    EXPECT_EQ(status_of("after"), TaskStatus::Skipped);
}

// ─── Timeouts ────────────────────────────────

TEST_F(CoordinatorTest, OverrunningTaskTimesOut) {
    config_.max_retries = 0;
    config_.task_timeout_default_ms = 20;
    handler_ = [](const Task&, const ArtifactMap&, std::stop_token stop) -> Result<ArtifactMap> {
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return Error{ErrorCode::Cancelled, "stopped"};
    };
    prepare({make_task("slow")});

    ASSERT_TRUE(coordinator_->run());

    auto slow = state_->task("slow");
    EXPECT_EQ(slow->status, TaskStatus::Failed);
    EXPECT_NE(slow->failure_reason.find("deadline"), std::string::npos);
    EXPECT_EQ(factory_->busy_count(), 0u);
}

TEST_F(CoordinatorTest, UncooperativeAgentIsForciblyTerminated) {
    config_.max_retries = 0;
    config_.task_timeout_default_ms = 10;
    config_.cancel_grace_period_ms = 20;
    auto returned = std::make_shared<std::atomic<bool>>(false);
    handler_ = [returned](const Task& task, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
        std::this_thread::sleep_for(200ms);
        *returned = true;
        return declared_outputs(task);
    };
    prepare({make_task("stubborn")});

    ASSERT_TRUE(coordinator_->run());

    auto stubborn = state_->task("stubborn");
    EXPECT_EQ(stubborn->status, TaskStatus::Failed);
    EXPECT_NE(stubborn->failure_reason.find("did not stop"), std::string::npos);
    EXPECT_EQ(state_->agent_statuses().at("worker-0"), AgentStatus::Failed);
    EXPECT_FALSE(factory_->agent("worker-0").has_value());

    // The late result must not change the recorded failure
    ASSERT_TRUE(wait_for(*returned));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(state_->task("stubborn")->status, TaskStatus::Failed);
}

TEST_F(CoordinatorTest, StuckAgentDoesNotStallOtherTasks) {
    config_.max_retries = 0;
    config_.max_concurrent_agents = 1;
    config_.task_timeout_default_ms = 10;
    config_.cancel_grace_period_ms = 20;

    auto release = std::make_shared<std::atomic<bool>>(false);
    auto returned = std::make_shared<std::atomic<bool>>(false);
    handler_ = [release, returned](const Task& task, const ArtifactMap&,
                                   std::stop_token) -> Result<ArtifactMap> {
        if (task.id == "stubborn") {
            auto limit = std::chrono::steady_clock::now() + 3s;
            while (!release->load() && std::chrono::steady_clock::now() < limit) {
                std::this_thread::sleep_for(1ms);
            }
            *returned = true;
        }
        return declared_outputs(task);
    };
    auto stubborn = make_task("stubborn");
    stubborn.priority = 10;
    prepare({stubborn, make_task("other")});

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(coordinator_->run());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1000ms);
    EXPECT_FALSE(returned->load());
    EXPECT_EQ(status_of("other"), TaskStatus::Completed);
    EXPECT_EQ(status_of("stubborn"), TaskStatus::Failed);
    EXPECT_NE(state_->task("stubborn")->failure_reason.find("did not stop"), std::string::npos);

    // Tearing down the coordinator must not wait on the stuck worker either
    start = std::chrono::steady_clock::now();
    coordinator_.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);

    *release = true;
    EXPECT_TRUE(wait_for(*returned));
    std::this_thread::sleep_for(20ms);
}

// ─── Cancellation ────────────────────────────

TEST_F(CoordinatorTest, CancelBeforeRunCancelsEverything) {
    prepare({make_task("a", {}, {"x"}), make_task("b", {"x"})}, {dep("a", "b")});
    coordinator_->cancel();
    EXPECT_TRUE(coordinator_->cancel_requested());

    ASSERT_TRUE(coordinator_->run());
    EXPECT_EQ(state_->count(TaskStatus::Cancelled), 2u);
}

TEST_F(CoordinatorTest, CancelStopsRunningTasks) {
    std::atomic<bool> started{false};
    handler_ = [&](const Task&, const ArtifactMap&, std::stop_token stop) -> Result<ArtifactMap> {
        started = true;
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return Error{ErrorCode::Cancelled, "stopped"};
    };
    prepare({make_task("long", {}, {"x"}), make_task("next", {"x"})}, {dep("long", "next")});

    std::jthread canceller([&] {
        if (wait_for(started)) coordinator_->cancel();
    });
    ASSERT_TRUE(coordinator_->run());

    EXPECT_EQ(status_of("long"), TaskStatus::Cancelled);
    EXPECT_EQ(state_->task("long")->failure_reason, "cancelled while running");
    EXPECT_EQ(status_of("next"), TaskStatus::Cancelled);
}

TEST_F(CoordinatorTest, CancelTaskSkipsOnlyItsDependents) {
    std::atomic<bool> started{false};
    handler_ = [&](const Task& task, const ArtifactMap&, std::stop_token stop) -> Result<ArtifactMap> {
        if (task.id != "long") return declared_outputs(task);
        started = true;
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return Error{ErrorCode::Cancelled, "stopped"};
    };
    prepare({make_task("long", {}, {"x"}), make_task("next", {"x"}), make_task("other")},
            {dep("long", "next")});

    std::jthread canceller([&] {
        if (wait_for(started)) coordinator_->cancel_task("long");
    });
    ASSERT_TRUE(coordinator_->run());

    EXPECT_EQ(status_of("long"), TaskStatus::Cancelled);
    EXPECT_EQ(status_of("next"), TaskStatus::Skipped);
    EXPECT_EQ(status_of("other"), TaskStatus::Completed);
    EXPECT_FALSE(coordinator_->cancel_requested());
}

// ─── Resume ──────────────────────────────────

TEST_F(CoordinatorTest, OrphanedTasksAreRequeued) {
    prepare({make_task("orphan", {}, {"x"}), make_task("after", {"x"})}, {dep("orphan", "after")});

    ASSERT_TRUE(state_->transition("orphan", TaskStatus::Ready));
    ASSERT_TRUE(state_->assign("orphan", "worker-9"));
    ASSERT_TRUE(state_->transition("orphan", TaskStatus::Running));

    ASSERT_TRUE(coordinator_->reset_orphans());
    EXPECT_EQ(status_of("orphan"), TaskStatus::Pending);
    EXPECT_TRUE(state_->assignments().empty());

    ASSERT_TRUE(coordinator_->run());
    EXPECT_EQ(status_of("orphan"), TaskStatus::Completed);
    EXPECT_EQ(status_of("after"), TaskStatus::Completed);
}
