/**
 * @file task_generator.cpp
 * @brief Synthetic task set generator — all topology implementations.
 * @author TaskDispatch contributors
 *
 * Generates task sets that model common dispatch shapes:
 * - Linear chains (strictly sequential work)
 * - Fan-out/fan-in (independent parallel work merged at the end)
 * - Diamond (repeated parallel stages)
 * - Software projects (artifact-linked, resolver-driven)
 * - Random DAGs (for stress testing and benchmarking)
 */

#include "graph/task_generator.hpp"

#include <format>

namespace task_dispatch {

namespace {

Task make_task(TaskId id, std::string description, TaskType type, double complexity = 1.0) {
    Task task;
    task.id = std::move(id);
    task.description = std::move(description);
    task.type = type;
    task.estimated_complexity = complexity;
    return task;
}

Edge logical(const TaskId& from, const TaskId& to) {
    return Edge{.from = from, .to = to, .kind = DependencyKind::Logical, .confidence = 1.0,
                .provenance = Provenance::Rule, .reason = "generated"};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: T0 → T1 → T2 → ... → Tn-1
// ─────────────────────────────────────────────

TaskSet TaskSetGenerator::linear_chain(size_t num_tasks, TaskType type) {
    TaskSet set;
    for (size_t i = 0; i < num_tasks; ++i) {
        auto id = std::format("chain_{}", i);
        set.tasks.push_back(make_task(id, std::format("Chain task {}", i), type));
        if (i > 0) {
            set.edges.push_back(logical(std::format("chain_{}", i - 1), id));
        }
    }
    return set;
}

// ─────────────────────────────────────────────
// Fan-out / Fan-in:
//          src
//       /   |   \   (backslash)
//     b_0  b_1  b_2  ... b_{width-1}
//       \   |   /
//          sink
// ─────────────────────────────────────────────

TaskSet TaskSetGenerator::fan_out_fan_in(size_t width, TaskType type) {
    TaskSet set;
    set.tasks.push_back(make_task("fan_src", "Fan-out source", type));

    for (size_t i = 0; i < width; ++i) {
        auto branch_id = std::format("fan_branch_{}", i);
        set.tasks.push_back(make_task(branch_id, std::format("Branch {}", i), type));
        set.edges.push_back(logical("fan_src", branch_id));
        set.edges.push_back(logical(branch_id, "fan_sink"));
    }

    set.tasks.push_back(make_task("fan_sink", "Fan-in sink", type));
    return set;
}

// ─────────────────────────────────────────────
// Diamond: hub_d → {diamond_d_w} → merge_d → hub_{d+1} → ...
// ─────────────────────────────────────────────

TaskSet TaskSetGenerator::diamond(size_t depth, size_t width, TaskType type) {
    TaskSet set;
    TaskId prev_merge;

    for (size_t d = 0; d < depth; ++d) {
        auto hub_id = std::format("hub_{}", d);
        set.tasks.push_back(make_task(hub_id, std::format("Hub {}", d), type));
        if (d > 0) set.edges.push_back(logical(prev_merge, hub_id));

        auto merge_id = std::format("merge_{}", d);
        for (size_t w = 0; w < width; ++w) {
            auto branch_id = std::format("diamond_{}_{}", d, w);
            set.tasks.push_back(make_task(branch_id, std::format("Diamond D{} B{}", d, w), type));
            set.edges.push_back(logical(hub_id, branch_id));
            set.edges.push_back(logical(branch_id, merge_id));
        }

        set.tasks.push_back(make_task(merge_id, std::format("Merge {}", d), type));
        prev_merge = merge_id;
    }
    return set;
}

// ─────────────────────────────────────────────
// Software project:
//   research → feature_i_impl → feature_i_tests → review → docs
// ─────────────────────────────────────────────

TaskSet TaskSetGenerator::software_project(size_t num_features) {
    TaskSet set;

    auto research = make_task("research", "Research architecture options", TaskType::Research, 2.0);
    research.outputs = {"findings"};
    set.tasks.push_back(std::move(research));

    auto review = make_task("review", "Review all feature work", TaskType::Review, 2.0);
    auto docs = make_task("docs", "Document the delivered features", TaskType::Documentation, 1.5);
    docs.inputs = {"review_notes"};
    review.outputs = {"review_notes"};

    for (size_t i = 0; i < num_features; ++i) {
        auto impl = make_task(std::format("feature_{}_impl", i),
                              std::format("Write feature {} module", i),
                              TaskType::CodeWriting, 3.0);
        impl.inputs = {"findings"};
        impl.outputs = {std::format("feature_{}_source", i)};
        impl.context["subject"] = std::format("feature_{}", i);

        auto tests = make_task(std::format("feature_{}_tests", i),
                               std::format("Write tests for feature {}", i),
                               TaskType::Testing, 2.0);
        tests.inputs = {std::format("feature_{}_source", i)};
        tests.outputs = {std::format("feature_{}_report", i)};
        tests.context["subject"] = std::format("feature_{}", i);

        review.inputs.push_back(std::format("feature_{}_report", i));
        set.tasks.push_back(std::move(impl));
        set.tasks.push_back(std::move(tests));
    }

    set.tasks.push_back(std::move(review));
    set.tasks.push_back(std::move(docs));
    return set;
}

// ─────────────────────────────────────────────
// Random DAG:
// Edges only go from lower to higher index, which guarantees acyclicity.
// ─────────────────────────────────────────────

TaskSet TaskSetGenerator::random_dag(size_t num_tasks,
                                     float edge_probability,
                                     double min_complexity,
                                     double max_complexity,
                                     std::mt19937& rng) {
    TaskSet set;
    std::uniform_real_distribution<double> complexity(min_complexity, max_complexity);
    std::uniform_int_distribution<int> priority(0, 10);

    for (size_t i = 0; i < num_tasks; ++i) {
        auto task = make_task(std::format("rand_{}", i), std::format("Random task {}", i),
                              TaskType::Generic, complexity(rng));
        task.priority = priority(rng);
        set.tasks.push_back(std::move(task));
    }

    std::uniform_real_distribution<float> edge_dist(0.0f, 1.0f);
    for (size_t i = 0; i < num_tasks; ++i) {
        for (size_t j = i + 1; j < num_tasks; ++j) {
            if (edge_dist(rng) < edge_probability) {
                set.edges.push_back(logical(set.tasks[i].id, set.tasks[j].id));
            }
        }
    }
    return set;
}

}  // namespace task_dispatch
