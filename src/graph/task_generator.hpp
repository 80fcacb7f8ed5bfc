/**
 * @file task_generator.hpp
 * @brief Synthetic task sets for testing and benchmarking.
 * @author TaskDispatch contributors
 */

#pragma once

#include "core/types.hpp"

#include <random>
#include <vector>

namespace task_dispatch {

/**
 * @brief Tasks plus explicit edges, ready for ExecutionGraph::build.
 */
struct TaskSet {
    std::vector<Task> tasks;
    std::vector<Edge> edges;
};

/**
 * @brief Factory for synthetic task sets with various topologies.
 */
class TaskSetGenerator {
public:
    /// Linear chain: T0 → T1 → ... → Tn-1
    static TaskSet linear_chain(size_t num_tasks, TaskType type = TaskType::Generic);

    /// Fan-out / fan-in: src → {branch_0 .. branch_w-1} → sink
    static TaskSet fan_out_fan_in(size_t width, TaskType type = TaskType::Generic);

    /// Diamond: repeated fan-out/fan-in at each depth level
    static TaskSet diamond(size_t depth, size_t width, TaskType type = TaskType::Generic);

    /**
     * @brief Artifact-linked project: research → per-feature code → tests →
     *        review, then documentation. Carries no edges; the resolver
     *        derives them from declared inputs/outputs.
     */
    static TaskSet software_project(size_t num_features);

    /// Random DAG with configurable edge probability and complexity range
    static TaskSet random_dag(size_t num_tasks,
                              float edge_probability,
                              double min_complexity,
                              double max_complexity,
                              std::mt19937& rng);
};

}  // namespace task_dispatch
