/**
 * @file test_agent_factory.cpp
 * @brief Unit tests for built-in blueprints and pooled agent allocation.
 */

#include "agents/agent_factory.hpp"
#include "agents/builtin_agents.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>

using namespace task_dispatch;

class AgentFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Debug);
        ASSERT_TRUE(register_builtin_blueprints(registry_));
    }

    std::unique_ptr<AgentFactory> make_factory(AgentsConfig config = {}) {
        return std::make_unique<AgentFactory>(config, registry_, *logger_);
    }

    BlueprintRegistry registry_;
    std::unique_ptr<Logger> logger_;
};

// ─── Built-in behaviors ──────────────────────

TEST(BuiltinAgentsTest, ProducesDeclaredArtifacts) {
    Task task;
    task.id = "impl";
    task.description = "Write the parser";
    task.outputs = {"parser_source"};

    auto produced = produce_artifacts(task, {{"grammar", "g"}}, "code_writer", {}, std::stop_token{});
    ASSERT_TRUE(produced.has_value());
    ASSERT_EQ(produced->size(), 1u);
    EXPECT_NE(produced->at("parser_source").find("inputs: grammar"), std::string::npos);
}

TEST(BuiltinAgentsTest, TaskWithoutOutputsGetsResultArtifact) {
    Task task;
    task.id = "chore";
    task.description = "Tidy up";
    auto produced = produce_artifacts(task, {}, "generalist", {}, std::stop_token{});
    ASSERT_TRUE(produced.has_value());
    EXPECT_EQ(produced->at("chore_result"), "[generalist] Tidy up");
}

TEST(BuiltinAgentsTest, SimulatedWorkHonorsStop) {
    Task task;
    task.id = "slow";
    task.description = "Take a while";

    std::stop_source source;
    source.request_stop();
    auto produced = produce_artifacts(task, {}, "tester", SimulationOptions{Duration{10'000}},
                                      source.get_token());
    ASSERT_FALSE(produced.has_value());
    EXPECT_EQ(produced.error().code, ErrorCode::Cancelled);
}

TEST_F(AgentFactoryTest, AllBuiltinBlueprintsLoad) {
    auto factory = make_factory();
    EXPECT_EQ(factory->blueprint_names(),
              (std::vector<std::string>{"code_writer", "researcher", "tester",
                                        "reviewer", "documenter", "generalist"}));
    EXPECT_TRUE(factory->load_failures().empty());
    for (auto type : kAllTaskTypes) {
        EXPECT_TRUE(factory->can_serve(type)) << to_string(type);
    }
}

// ─── Allocation ──────────────────────────────

TEST_F(AgentFactoryTest, AcquireMatchesCapability) {
    auto factory = make_factory();
    auto lease = factory->acquire(TaskType::Testing, "t1");
    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease->agent->blueprint(), "tester");
    EXPECT_EQ(lease->agent->id(), "tester-0");
    EXPECT_EQ(lease->task_id, "t1");

    auto snapshot = factory->agent("tester-0");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->status, AgentStatus::Busy);
    EXPECT_EQ(snapshot->current_task, "t1");
}

TEST_F(AgentFactoryTest, CapacityBoundsConcurrentLeases) {
    AgentsConfig config;
    config.pool_size_per_type = 2;
    config.pool_size["reviewer"] = 1;
    auto factory = make_factory(config);

    ASSERT_TRUE(factory->acquire(TaskType::Review, "r1"));
    EXPECT_FALSE(factory->acquire(TaskType::Review, "r2"));

    ASSERT_TRUE(factory->acquire(TaskType::CodeWriting, "c1"));
    ASSERT_TRUE(factory->acquire(TaskType::Debugging, "c2"));
    EXPECT_FALSE(factory->acquire(TaskType::CodeWriting, "c3"));
    EXPECT_EQ(factory->busy_count(), 3u);
}

TEST_F(AgentFactoryTest, ReleasedAgentIsReused) {
    auto factory = make_factory();
    auto first = factory->acquire(TaskType::Research, "a");
    ASSERT_TRUE(first);
    ASSERT_TRUE(factory->release(first->agent->id()));

    auto second = factory->acquire(TaskType::Research, "b");
    ASSERT_TRUE(second);
    EXPECT_EQ(second->agent->id(), first->agent->id());
    EXPECT_EQ(factory->pool_status()[1].created, 1u);
}

TEST_F(AgentFactoryTest, ReleaseRequiresBusyAgent) {
    auto factory = make_factory();
    EXPECT_EQ(factory->release("nobody").error().code, ErrorCode::NotFound);

    auto lease = factory->acquire(TaskType::Generic, "g");
    ASSERT_TRUE(lease);
    ASSERT_TRUE(factory->release(lease->agent->id()));
    EXPECT_EQ(factory->release(lease->agent->id()).error().code, ErrorCode::InvalidTransition);
}

TEST_F(AgentFactoryTest, FailedAgentHoldsSlotUntilEvicted) {
    AgentsConfig config;
    config.pool_size_per_type = 1;
    auto factory = make_factory(config);

    auto lease = factory->acquire(TaskType::Documentation, "d1");
    ASSERT_TRUE(lease);
    auto id = lease->agent->id();
    ASSERT_TRUE(factory->mark_failed(id));

    EXPECT_FALSE(factory->acquire(TaskType::Documentation, "d2"));
    EXPECT_EQ(factory->pool_status()[4].failed, 1u);

    ASSERT_TRUE(factory->evict(id));
    auto fresh = factory->acquire(TaskType::Documentation, "d2");
    ASSERT_TRUE(fresh);
    EXPECT_NE(fresh->agent->id(), id);
    EXPECT_EQ(factory->evict("ghost").error().code, ErrorCode::NotFound);
}

TEST_F(AgentFactoryTest, PoolStatusAndUtilization) {
    AgentsConfig config;
    config.pool_size_per_type = 2;
    config.blueprints = {"tester", "generalist"};
    auto factory = make_factory(config);

    ASSERT_TRUE(factory->acquire(TaskType::Testing, "t1"));
    auto pools = factory->pool_status();
    ASSERT_EQ(pools.size(), 2u);
    EXPECT_EQ(pools[0].blueprint, "tester");
    EXPECT_EQ(pools[0].busy, 1u);
    EXPECT_DOUBLE_EQ(pools[0].utilization(), 0.5);
    EXPECT_DOUBLE_EQ(factory->utilization(), 0.25);
    EXPECT_FALSE(factory->can_serve(TaskType::Review));
}

TEST_F(AgentFactoryTest, UnknownBlueprintIsReported) {
    AgentsConfig config;
    config.blueprints = {"tester", "astronaut"};
    auto factory = make_factory(config);
    ASSERT_EQ(factory->load_failures().size(), 1u);
    EXPECT_EQ(factory->load_failures()[0].name, "astronaut");
    EXPECT_EQ(factory->blueprint_names(), (std::vector<std::string>{"tester"}));
}

TEST_F(AgentFactoryTest, ZeroCapacityPoolCannotServe) {
    AgentsConfig config;
    config.pool_size["tester"] = 0;
    auto factory = make_factory(config);
    EXPECT_FALSE(factory->can_serve(TaskType::Testing));
    EXPECT_FALSE(factory->acquire(TaskType::Testing, "t"));
}

TEST_F(AgentFactoryTest, ShutdownRefusesFurtherLeases) {
    auto factory = make_factory();
    ASSERT_TRUE(factory->acquire(TaskType::Review, "r"));
    factory->shutdown_all();
    EXPECT_TRUE(factory->is_shut_down());
    EXPECT_TRUE(factory->agents().empty());
    EXPECT_FALSE(factory->acquire(TaskType::Review, "r2"));
}

TEST_F(AgentFactoryTest, ConcurrentAcquireNeverDoubleBooks) {
    AgentsConfig config;
    config.pool_size_per_type = 3;
    auto factory = make_factory(config);

    std::mutex mutex;
    std::set<AgentId> granted;
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto lease = factory->acquire(TaskType::Testing, "t" + std::to_string(i));
            if (!lease) {
                ++refused;
                return;
            }
            std::lock_guard lock(mutex);
            EXPECT_TRUE(granted.insert(lease->agent->id()).second);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.size(), 3u);
    EXPECT_EQ(refused.load(), 5);
}
