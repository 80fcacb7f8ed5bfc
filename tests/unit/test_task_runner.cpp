/**
 * @file test_task_runner.cpp
 * @brief Unit tests for Agent execution and TaskRunner outcome normalization.
 */

#include "executor/task_runner.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace task_dispatch;

namespace {

Task make_task(TaskType type, std::vector<std::string> outputs = {}) {
    Task task;
    task.id = "t1";
    task.type = type;
    task.description = "unit of work";
    task.outputs = std::move(outputs);
    return task;
}

Agent make_agent(AgentHandler handler) {
    return Agent("coder-1", "code_writer", {TaskType::CodeWriting}, std::move(handler));
}

}  // namespace

TEST(TaskRunnerTest, SuccessfulRunKeepsArtifacts) {
    auto agent = make_agent([](const Task& task, const ArtifactMap& inputs, std::stop_token) {
        return Result<ArtifactMap>{ArtifactMap{{"source", task.id + ":" + inputs.at("design")}}};
    });
    auto task = make_task(TaskType::CodeWriting, {"source"});

    TaskRunner runner;
    auto outcome = runner.execute(agent, task, {{"design", "sketch"}}, std::stop_token{});
    EXPECT_EQ(outcome.task_id, "t1");
    EXPECT_EQ(outcome.agent_id, "coder-1");
    ASSERT_TRUE(outcome.artifacts.has_value()) << outcome.artifacts.error().message;
    EXPECT_EQ(outcome.artifacts->at("source"), "t1:sketch");
}

TEST(TaskRunnerTest, HandlerExceptionBecomesTaskExecutionError) {
    auto agent = make_agent([](const Task&, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
        throw std::runtime_error("disk on fire");
    });

    TaskRunner runner;
    auto outcome = runner.execute(agent, make_task(TaskType::CodeWriting), {}, std::stop_token{});
    ASSERT_FALSE(outcome.artifacts.has_value());
    EXPECT_EQ(outcome.artifacts.error().code, ErrorCode::TaskExecution);
    EXPECT_NE(outcome.artifacts.error().message.find("disk on fire"), std::string::npos);
}

TEST(TaskRunnerTest, MissingDeclaredOutputIsAFailure) {
    auto agent = make_agent([](const Task&, const ArtifactMap&, std::stop_token) {
        return Result<ArtifactMap>{ArtifactMap{{"other", "x"}}};
    });

    TaskRunner runner;
    auto outcome = runner.execute(agent, make_task(TaskType::CodeWriting, {"source"}), {},
                                  std::stop_token{});
    ASSERT_FALSE(outcome.artifacts.has_value());
    EXPECT_EQ(outcome.artifacts.error().code, ErrorCode::TaskExecution);
}

TEST(TaskRunnerTest, FailureAfterStopIsCancelled) {
    auto agent = make_agent([](const Task&, const ArtifactMap&, std::stop_token) -> Result<ArtifactMap> {
        return Error{ErrorCode::TaskExecution, "interrupted"};
    });

    std::stop_source source;
    source.request_stop();

    TaskRunner runner;
    auto outcome = runner.execute(agent, make_task(TaskType::CodeWriting), {}, source.get_token());
    ASSERT_FALSE(outcome.artifacts.has_value());
    EXPECT_EQ(outcome.artifacts.error().code, ErrorCode::Cancelled);
}

TEST(TaskRunnerTest, CapabilityMismatchIsRejected) {
    bool called = false;
    auto agent = make_agent([&called](const Task&, const ArtifactMap&, std::stop_token) {
        called = true;
        return Result<ArtifactMap>{ArtifactMap{}};
    });

    TaskRunner runner;
    auto outcome = runner.execute(agent, make_task(TaskType::Review), {}, std::stop_token{});
    ASSERT_FALSE(outcome.artifacts.has_value());
    EXPECT_EQ(outcome.artifacts.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(called);
}

TEST(AgentBlueprintTest, InstantiateGivesFreshHandler) {
    int made = 0;
    AgentBlueprint blueprint("tester", {TaskType::Testing}, [&made]() -> AgentHandler {
        ++made;
        return [](const Task&, const ArtifactMap&, std::stop_token) {
            return Result<ArtifactMap>{ArtifactMap{}};
        };
    });

    auto a = blueprint.instantiate("tester-1");
    auto b = blueprint.instantiate("tester-2");
    EXPECT_EQ(made, 2);
    EXPECT_EQ(a->blueprint(), "tester");
    EXPECT_TRUE(b->can_handle(TaskType::Testing));
    EXPECT_FALSE(b->can_handle(TaskType::CodeWriting));
    EXPECT_TRUE(blueprint.serves(TaskType::Testing));
}
