/**
 * @file execution_result.hpp
 * @brief Outcome of one dispatch and its JSON export.
 * @author TaskDispatch contributors
 */

#pragma once

#include "core/serialization.hpp"
#include "core/types.hpp"
#include "graph/dependency_resolver.hpp"
#include "graph/execution_graph.hpp"
#include "telemetry/metrics_collector.hpp"

#include <optional>
#include <string>
#include <vector>

namespace task_dispatch {

struct TaskResult {
    TaskId id;
    TaskType type = TaskType::Generic;
    TaskStatus status = TaskStatus::Pending;
    std::vector<std::string> output_artifacts;
    std::string reason;                 ///< Failure or skip reason, if any
    uint32_t retries = 0;
    bool required = true;
};

/**
 * @brief Everything a caller gets back from Dispatcher::dispatch / resume.
 *
 * Tasks are listed in topological order. A Failed overall status still
 * carries the artifacts produced before the failure.
 */
struct ExecutionResult {
    SessionId session_id;
    ExecutionStatus status = ExecutionStatus::Initializing;
    std::string decomposition_strategy;     ///< "model", "pattern" or "resumed"
    std::string fallback_reason;
    std::vector<TaskResult> tasks;
    std::vector<Artifact> artifacts;
    ExecutionMetrics metrics;

    std::vector<std::vector<TaskId>> phases;
    CriticalPath critical_path;
    GraphStats graph_stats;
    std::vector<Edge> edges;
    std::vector<RemovedEdge> removed_edges;
    std::vector<std::string> rules_applied;
    bool model_refined = false;
    std::optional<CheckpointId> last_checkpoint;

    [[nodiscard]] const TaskResult* find(const TaskId& id) const;
    [[nodiscard]] size_t count(TaskStatus status) const;
};

/// Overall verdict: Cancelled if cancelled, Failed if a required task failed, else Completed.
[[nodiscard]] ExecutionStatus overall_status(const std::vector<TaskResult>& tasks, bool cancelled);

void to_json(Json& j, ExecutionStatus status);
void to_json(Json& j, const TaskMetrics& metrics);
void to_json(Json& j, const AgentMetrics& metrics);
void to_json(Json& j, const ExecutionMetrics& metrics);
void to_json(Json& j, const CriticalPath& path);
void to_json(Json& j, const GraphStats& stats);
void to_json(Json& j, const RemovedEdge& removed);
void to_json(Json& j, const TaskResult& task);
void to_json(Json& j, const ExecutionResult& result);

}  // namespace task_dispatch
