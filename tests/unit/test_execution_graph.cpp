/**
 * @file test_execution_graph.cpp
 * @brief Unit tests for ExecutionGraph construction, ordering and analysis.
 */

#include "graph/execution_graph.hpp"

#include <gtest/gtest.h>

using namespace task_dispatch;

namespace {

Task make_task(const std::string& id, double complexity = 1.0, int priority = 0,
               TaskType type = TaskType::Generic) {
    Task task;
    task.id = id;
    task.type = type;
    task.description = "task " + id;
    task.estimated_complexity = complexity;
    task.priority = priority;
    return task;
}

Edge dep(const std::string& from, const std::string& to) {
    return Edge{from, to, DependencyKind::Logical, 1.0, Provenance::Rule, "test"};
}

ExecutionGraph build_or_die(std::vector<Task> tasks, const std::vector<Edge>& edges) {
    auto graph = ExecutionGraph::build(std::move(tasks), edges);
    EXPECT_TRUE(graph.has_value()) << graph.error().message;
    return std::move(graph).value();
}

}  // namespace

TEST(ExecutionGraphTest, IndependentPairThenJoin) {
    auto graph = build_or_die({make_task("T1"), make_task("T2"), make_task("T3")},
                              {dep("T1", "T3"), dep("T2", "T3")});

    auto phases = graph.compute_phases();
    ASSERT_EQ(phases.size(), 2u);
    EXPECT_EQ(phases[0], (std::vector<TaskId>{"T1", "T2"}));
    EXPECT_EQ(phases[1], (std::vector<TaskId>{"T3"}));

    // Two agents: both first-phase tasks run together, then T3.
    EXPECT_EQ(graph.estimate_makespan(2), Duration{120'000});
    EXPECT_EQ(graph.estimate_makespan(1), Duration{180'000});
}

TEST(ExecutionGraphTest, SingleTaskIsOnePhase) {
    auto graph = build_or_die({make_task("only")}, {});
    auto phases = graph.compute_phases();
    ASSERT_EQ(phases.size(), 1u);
    EXPECT_EQ(phases[0], (std::vector<TaskId>{"only"}));
    EXPECT_EQ(graph.critical_path().tasks, (std::vector<TaskId>{"only"}));
}

TEST(ExecutionGraphTest, EmptyGraph) {
    ExecutionGraph graph;
    EXPECT_TRUE(graph.compute_phases().empty());
    EXPECT_TRUE(graph.critical_path().tasks.empty());
    EXPECT_TRUE(graph.freeze().has_value());
}

TEST(ExecutionGraphTest, CycleIsRejected) {
    auto graph = ExecutionGraph::build({make_task("a"), make_task("b"), make_task("c")},
                                       {dep("a", "b"), dep("b", "c"), dep("c", "a")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::CycleDetected);
    EXPECT_NE(graph.error().message.find("a"), std::string::npos);
}

TEST(ExecutionGraphTest, SelfDependencyIsACycle) {
    ExecutionGraph graph;
    ASSERT_TRUE(graph.add_task(make_task("a")));
    auto added = graph.add_edge(dep("a", "a"));
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ErrorCode::CycleDetected);
}

TEST(ExecutionGraphTest, MalformedInput) {
    ExecutionGraph graph;
    ASSERT_TRUE(graph.add_task(make_task("a")));
    EXPECT_EQ(graph.add_task(make_task("a")).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(graph.add_task(make_task("")).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(graph.add_edge(dep("a", "ghost")).error().code, ErrorCode::NotFound);
}

TEST(ExecutionGraphTest, MutationAfterFreezeFails) {
    auto graph = build_or_die({make_task("a"), make_task("b")}, {});
    ASSERT_TRUE(graph.freeze());
    EXPECT_TRUE(graph.is_frozen());

    EXPECT_EQ(graph.add_task(make_task("c")).error().code, ErrorCode::GraphFrozen);
    EXPECT_EQ(graph.add_edge(dep("a", "b")).error().code, ErrorCode::GraphFrozen);
    EXPECT_EQ(graph.remove_task("a").error().code, ErrorCode::GraphFrozen);
    EXPECT_EQ(graph.task_count(), 2u);
}

TEST(ExecutionGraphTest, RemoveTaskDropsItsEdges) {
    auto graph = build_or_die({make_task("a"), make_task("b"), make_task("c")},
                              {dep("a", "b"), dep("b", "c")});
    ASSERT_TRUE(graph.remove_task("b"));
    EXPECT_EQ(graph.edge_count(), 0u);
    EXPECT_TRUE(graph.successors("a").empty());
    EXPECT_TRUE(graph.predecessors("c").empty());
}

TEST(ExecutionGraphTest, TopologicalTiesByPriorityThenId) {
    auto graph = build_or_die({make_task("b", 1, 5), make_task("a", 1, 5), make_task("z", 1, 9),
                               make_task("m", 1, 0)},
                              {dep("m", "z")});
    // m is the only source of z; among sources z is not yet available.
    EXPECT_EQ(graph.topological_order(), (std::vector<TaskId>{"a", "b", "m", "z"}));
}

TEST(ExecutionGraphTest, CriticalPathFollowsHeaviestChain) {
    auto graph = build_or_die({make_task("start", 1), make_task("light", 1), make_task("heavy", 4),
                               make_task("end", 1)},
                              {dep("start", "light"), dep("start", "heavy"),
                               dep("light", "end"), dep("heavy", "end")});
    auto path = graph.critical_path();
    EXPECT_EQ(path.tasks, (std::vector<TaskId>{"start", "heavy", "end"}));
    EXPECT_EQ(path.length, Duration{6 * 60'000});
}

TEST(ExecutionGraphTest, ReadyTasksRespectDependencies) {
    auto graph = build_or_die({make_task("a"), make_task("b"), make_task("c")},
                              {dep("a", "b"), dep("b", "c")});

    TaskStatusMap statuses{{"a", TaskStatus::Pending}, {"b", TaskStatus::Pending},
                           {"c", TaskStatus::Pending}};
    EXPECT_EQ(graph.ready_tasks(statuses), (std::vector<TaskId>{"a"}));

    statuses["a"] = TaskStatus::Completed;
    EXPECT_EQ(graph.ready_tasks(statuses), (std::vector<TaskId>{"b"}));

    statuses["b"] = TaskStatus::Running;
    EXPECT_TRUE(graph.ready_tasks(statuses).empty());
}

TEST(ExecutionGraphTest, BestEffortFailureSatisfiesDependents) {
    auto optional_step = make_task("lint");
    optional_step.best_effort = true;
    auto graph = build_or_die({optional_step, make_task("build"), make_task("ship")},
                              {dep("lint", "ship"), dep("build", "ship")});

    TaskStatusMap statuses{{"lint", TaskStatus::Failed}, {"build", TaskStatus::Completed},
                           {"ship", TaskStatus::Pending}};
    EXPECT_EQ(graph.ready_tasks(statuses), (std::vector<TaskId>{"ship"}));

    statuses["build"] = TaskStatus::Failed;
    EXPECT_TRUE(graph.ready_tasks(statuses).empty());
}

TEST(ExecutionGraphTest, SkipCascadeReachesAllDescendants) {
    auto graph = build_or_die({make_task("A"), make_task("B"), make_task("C"), make_task("D")},
                              {dep("A", "B"), dep("B", "C")});
    ASSERT_TRUE(graph.freeze());

    auto skipped = graph.propagate_skip("A");
    EXPECT_EQ(skipped, (std::vector<TaskId>{"B", "C"}));
    EXPECT_TRUE(graph.is_skipped("C"));
    EXPECT_FALSE(graph.is_skipped("D"));
    EXPECT_EQ(graph.skipped().at("C"), "A");

    // Skipped tasks never become ready.
    TaskStatusMap statuses{{"A", TaskStatus::Completed}, {"B", TaskStatus::Pending},
                           {"C", TaskStatus::Pending}, {"D", TaskStatus::Pending}};
    EXPECT_EQ(graph.ready_tasks(statuses), (std::vector<TaskId>{"D"}));

    // Already-skipped tasks are not reported twice.
    EXPECT_TRUE(graph.propagate_skip("B").empty());
}

TEST(ExecutionGraphTest, DescendantsInTopologicalOrder) {
    auto graph = build_or_die({make_task("r"), make_task("x"), make_task("y"), make_task("z")},
                              {dep("r", "y"), dep("r", "x"), dep("x", "z"), dep("y", "z")});
    EXPECT_EQ(graph.descendants("r"), (std::vector<TaskId>{"x", "y", "z"}));
    EXPECT_EQ(graph.predecessors("z"), (std::vector<TaskId>{"x", "y"}));
    EXPECT_TRUE(graph.descendants("missing").empty());
}

TEST(ExecutionGraphTest, StatsAndResourceRequirements) {
    auto graph = build_or_die({make_task("r", 1, 0, TaskType::Research),
                               make_task("c1", 2, 0, TaskType::CodeWriting),
                               make_task("c2", 3, 0, TaskType::CodeWriting),
                               make_task("t", 1, 0, TaskType::Testing)},
                              {dep("r", "c1"), dep("r", "c2"), dep("c1", "t"), dep("c2", "t")});

    auto stats = graph.stats();
    EXPECT_EQ(stats.task_count, 4u);
    EXPECT_EQ(stats.edge_count, 4u);
    EXPECT_EQ(stats.phase_count, 3u);
    EXPECT_EQ(stats.max_parallelism, 2u);
    EXPECT_EQ(stats.sequential_duration, Duration{7 * 60'000});
    EXPECT_EQ(stats.parallel_duration, Duration{5 * 60'000});
    EXPECT_EQ(stats.critical_duration, Duration{5 * 60'000});
    EXPECT_NEAR(stats.parallel_efficiency, 2.0 / 7.0, 1e-9);

    auto demand = graph.resource_requirements();
    EXPECT_EQ(demand.at(TaskType::CodeWriting), 2u);
    EXPECT_EQ(demand.at(TaskType::Research), 1u);
}

TEST(ExecutionGraphTest, SnapshotRoundTrip) {
    auto graph = build_or_die({make_task("a"), make_task("b"), make_task("c")},
                              {dep("a", "b"), dep("b", "c")});
    ASSERT_TRUE(graph.freeze());
    (void)graph.propagate_skip("b");

    auto snapshot = graph.snapshot();
    auto restored = ExecutionGraph::from_snapshot(snapshot);
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_TRUE(restored->is_frozen());
    EXPECT_TRUE(restored->is_skipped("c"));
    EXPECT_EQ(restored->snapshot(), snapshot);
}

TEST(ExecutionGraphTest, FirstEdgeForAPairWins) {
    ExecutionGraph graph;
    ASSERT_TRUE(graph.add_task(make_task("a")));
    ASSERT_TRUE(graph.add_task(make_task("b")));
    ASSERT_TRUE(graph.add_edge(Edge{"a", "b", DependencyKind::Data, 0.9, Provenance::Rule, "first"}));
    ASSERT_TRUE(graph.add_edge(Edge{"a", "b", DependencyKind::Resource, 0.5, Provenance::Model, "second"}));
    ASSERT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.edges()[0].reason, "first");
}
