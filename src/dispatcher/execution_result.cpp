/**
 * @file execution_result.cpp
 * @brief ExecutionResult queries and JSON export.
 * @author TaskDispatch contributors
 */

#include "dispatcher/execution_result.hpp"

#include <algorithm>

namespace task_dispatch {

const TaskResult* ExecutionResult::find(const TaskId& id) const {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&](const TaskResult& t) { return t.id == id; });
    return it != tasks.end() ? &*it : nullptr;
}

size_t ExecutionResult::count(TaskStatus status) const {
    return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(),
                                             [&](const TaskResult& t) { return t.status == status; }));
}

ExecutionStatus overall_status(const std::vector<TaskResult>& tasks, bool cancelled) {
    if (cancelled) return ExecutionStatus::Cancelled;
    bool required_failed = std::any_of(tasks.begin(), tasks.end(), [](const TaskResult& t) {
        return t.required && t.status == TaskStatus::Failed;
    });
    return required_failed ? ExecutionStatus::Failed : ExecutionStatus::Completed;
}

// ─────────────────────────────────────────────
// JSON export
// ─────────────────────────────────────────────

void to_json(Json& j, ExecutionStatus status) {
    j = std::string{to_string(status)};
}

void to_json(Json& j, const TaskMetrics& metrics) {
    j = Json{
        {"task_id", metrics.task_id},
        {"agent_id", metrics.agent_id},
        {"final_status", metrics.final_status},
        {"duration_ms", metrics.duration.count()},
        {"attempts", metrics.attempts},
        {"retries", metrics.retries},
    };
}

void to_json(Json& j, const AgentMetrics& metrics) {
    j = Json{
        {"agent_id", metrics.agent_id},
        {"busy_ms", metrics.busy_time.count()},
        {"tasks_completed", metrics.tasks_completed},
        {"tasks_failed", metrics.tasks_failed},
        {"utilization", metrics.utilization},
    };
}

void to_json(Json& j, const ExecutionMetrics& metrics) {
    Json tasks = Json::array();
    for (const auto& [_, t] : metrics.tasks) tasks.push_back(t);
    Json agents = Json::array();
    for (const auto& [_, a] : metrics.agents) agents.push_back(a);
    Json depth = Json::array();
    for (const auto& sample : metrics.queue_depth) {
        depth.push_back({{"offset_ms", sample.offset.count()},
                         {"ready", sample.ready},
                         {"running", sample.running}});
    }

    j = Json{
        {"total_tasks", metrics.total_tasks},
        {"completed_tasks", metrics.completed_tasks},
        {"failed_tasks", metrics.failed_tasks},
        {"cancelled_tasks", metrics.cancelled_tasks},
        {"skipped_tasks", metrics.skipped_tasks},
        {"total_retries", metrics.total_retries},
        {"end_to_end_latency_ms", metrics.end_to_end_latency.count()},
        {"average_task_ms", metrics.average_task_ms},
        {"completion_percentage", metrics.completion_percentage()},
        {"success_rate", metrics.success_rate()},
        {"tasks", std::move(tasks)},
        {"agents", std::move(agents)},
        {"queue_depth", std::move(depth)},
    };
}

void to_json(Json& j, const CriticalPath& path) {
    j = Json{{"tasks", path.tasks}, {"length_ms", path.length.count()}};
}

void to_json(Json& j, const GraphStats& stats) {
    j = Json{
        {"task_count", stats.task_count},
        {"edge_count", stats.edge_count},
        {"phase_count", stats.phase_count},
        {"max_parallelism", stats.max_parallelism},
        {"avg_parallelism", stats.avg_parallelism},
        {"sequential_ms", stats.sequential_duration.count()},
        {"parallel_ms", stats.parallel_duration.count()},
        {"critical_ms", stats.critical_duration.count()},
        {"parallel_efficiency", stats.parallel_efficiency},
    };
}

void to_json(Json& j, const RemovedEdge& removed) {
    j = Json{{"edge", removed.edge}, {"reason", removed.reason}};
}

void to_json(Json& j, const TaskResult& task) {
    j = Json{
        {"id", task.id},
        {"type", task.type},
        {"status", task.status},
        {"output_artifacts", task.output_artifacts},
        {"retries", task.retries},
        {"required", task.required},
    };
    if (!task.reason.empty()) j["reason"] = task.reason;
}

void to_json(Json& j, const ExecutionResult& result) {
    j = Json{
        {"session_id", result.session_id},
        {"status", result.status},
        {"tasks", result.tasks},
        {"artifacts", result.artifacts},
        {"metrics", result.metrics},
        {"plan", {
            {"decomposition", result.decomposition_strategy},
            {"phases", result.phases},
            {"critical_path", result.critical_path},
            {"stats", result.graph_stats},
            {"edges", result.edges},
        }},
        {"dependency_audit", {
            {"removed", result.removed_edges},
            {"rules_applied", result.rules_applied},
            {"model_refined", result.model_refined},
        }},
    };
    if (!result.fallback_reason.empty()) j["plan"]["fallback_reason"] = result.fallback_reason;
    if (result.last_checkpoint) j["last_checkpoint"] = *result.last_checkpoint;
}

}  // namespace task_dispatch
