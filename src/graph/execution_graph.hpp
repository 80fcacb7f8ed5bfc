/**
 * @file execution_graph.hpp
 * @brief Directed Acyclic Graph of tasks and dependency edges.
 * @author TaskDispatch contributors
 *
 * Nodes are tasks, edges are resolved dependencies. Provides deterministic
 * topological ordering, phase partitioning, critical path analysis and
 * ready-set queries. Structure is mutable only until freeze(); afterwards
 * the sole permitted change is skip propagation after a terminal failure.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace task_dispatch {

/**
 * @brief Plain node/edge export of a graph, for checkpoints and visualizers.
 */
struct GraphSnapshot {
    std::vector<Task> tasks;
    std::vector<Edge> edges;
    bool frozen = false;
    std::map<TaskId, TaskId> skipped;   ///< Skipped task → failed ancestor

    bool operator==(const GraphSnapshot&) const = default;
};

struct CriticalPath {
    std::vector<TaskId> tasks;
    Duration length{0};
};

struct GraphStats {
    size_t task_count = 0;
    size_t edge_count = 0;
    size_t phase_count = 0;
    size_t max_parallelism = 0;
    double avg_parallelism = 0.0;
    Duration sequential_duration{0};    ///< Sum of all estimated durations
    Duration parallel_duration{0};      ///< Sum of per-phase maxima
    Duration critical_duration{0};
    double parallel_efficiency = 0.0;   ///< (sequential - parallel) / sequential
};

using TaskStatusMap = std::map<TaskId, TaskStatus>;

/**
 * @brief Validated execution DAG.
 */
class ExecutionGraph {
public:
    ExecutionGraph() = default;

    /**
     * @brief Build a graph from resolver output.
     * @return CycleDetected if the edges admit no topological order,
     *         InvalidArgument / NotFound on malformed input.
     */
    [[nodiscard]] static Result<ExecutionGraph> build(std::vector<Task> tasks,
                                                      const std::vector<Edge>& edges);

    [[nodiscard]] static Result<ExecutionGraph> from_snapshot(const GraphSnapshot& snapshot);

    // ── Construction ──────────────────────────
    Result<void> add_task(Task task);
    Result<void> add_edge(Edge edge);
    Result<void> remove_task(const TaskId& id);

    /// Validates acyclicity and seals the structure.
    Result<void> freeze();
    [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

    // ── Ordering ──────────────────────────────
    /// Kahn's order; ties by priority descending, then id ascending.
    [[nodiscard]] std::vector<TaskId> topological_order() const;
    [[nodiscard]] std::vector<std::vector<TaskId>> compute_phases() const;
    [[nodiscard]] CriticalPath critical_path() const;
    [[nodiscard]] bool has_cycle() const;

    /**
     * @brief Pending/Ready tasks whose predecessors are all satisfied.
     *
     * A predecessor is satisfied when Completed, or when it ended Failed and
     * is marked best-effort.
     */
    [[nodiscard]] std::vector<TaskId> ready_tasks(const TaskStatusMap& statuses) const;

    // ── Skip propagation ──────────────────────
    /// Marks all not-yet-skipped descendants of `failed` and returns them in topological order.
    std::vector<TaskId> propagate_skip(const TaskId& failed);
    [[nodiscard]] bool is_skipped(const TaskId& id) const;
    [[nodiscard]] const std::map<TaskId, TaskId>& skipped() const noexcept { return skipped_; }

    // ── Queries ───────────────────────────────
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] const Task* find_task(const TaskId& id) const;
    [[nodiscard]] std::vector<Task> tasks() const;
    [[nodiscard]] std::vector<Edge> edges() const;
    [[nodiscard]] std::vector<TaskId> predecessors(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> successors(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> descendants(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

    // ── Analysis ──────────────────────────────
    [[nodiscard]] GraphStats stats() const;
    /// Phase-batched estimate with at most `max_agents` tasks in flight.
    [[nodiscard]] Duration estimate_makespan(uint32_t max_agents) const;
    /// Peak per-phase demand for each capability.
    [[nodiscard]] std::map<TaskType, size_t> resource_requirements() const;

    [[nodiscard]] GraphSnapshot snapshot() const;

private:
    Result<void> check_mutable(std::string_view op) const;
    [[nodiscard]] std::vector<TaskId> cycle_members() const;

    std::map<TaskId, Task> tasks_;
    std::map<std::pair<TaskId, TaskId>, Edge> edges_;
    std::unordered_map<TaskId, std::vector<TaskId>> adj_list_;       // forward edges
    std::unordered_map<TaskId, std::vector<TaskId>> reverse_adj_;    // backward edges
    std::map<TaskId, TaskId> skipped_;
    bool frozen_ = false;
};

}  // namespace task_dispatch
