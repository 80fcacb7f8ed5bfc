/**
 * @file types.hpp
 * @brief Fundamental types used throughout the task dispatch engine.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, AgentId, the capability enum, task/agent status machines,
 * dependency edges and artifacts. All types are plain values; ownership of
 * live state sits in StateManager.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace task_dispatch {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using AgentId = std::string;
using SessionId = std::string;
using CheckpointId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Capability Tags
// ─────────────────────────────────────────────

/**
 * @brief Closed set of capabilities a task can require.
 *
 * Agents declare a set of these; matching is set membership.
 */
enum class TaskType : uint8_t {
    CodeWriting,
    Research,
    Testing,
    Review,
    Documentation,
    Debugging,
    Deployment,
    Analysis,
    Generic
};

inline constexpr TaskType kAllTaskTypes[] = {
    TaskType::CodeWriting, TaskType::Research, TaskType::Testing,
    TaskType::Review, TaskType::Documentation, TaskType::Debugging,
    TaskType::Deployment, TaskType::Analysis, TaskType::Generic
};

[[nodiscard]] constexpr std::string_view to_string(TaskType type) noexcept {
    switch (type) {
        case TaskType::CodeWriting:   return "code_writing";
        case TaskType::Research:      return "research";
        case TaskType::Testing:       return "testing";
        case TaskType::Review:        return "review";
        case TaskType::Documentation: return "documentation";
        case TaskType::Debugging:     return "debugging";
        case TaskType::Deployment:    return "deployment";
        case TaskType::Analysis:      return "analysis";
        case TaskType::Generic:       return "generic";
    }
    return "unknown";
}

/// Accepts both snake_case and dashed spellings ("code-writing").
[[nodiscard]] std::optional<TaskType> parse_task_type(std::string_view text);

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Waiting for dependencies
    Ready,         ///< All dependencies met, awaiting an agent
    Scheduled,     ///< Bound to an agent
    Running,       ///< Currently executing
    Completed,     ///< Finished successfully
    Failed,        ///< Execution failed (terminal once retries are exhausted)
    Cancelled,     ///< Stopped on request
    Skipped        ///< Never run because an upstream task failed
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Ready:     return "ready";
        case TaskStatus::Scheduled: return "scheduled";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        case TaskStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text);

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed
        || status == TaskStatus::Cancelled || status == TaskStatus::Skipped;
}

/**
 * @brief Legal edges of the per-task state machine.
 *
 * Failed → Pending is the retry path; terminal failure simply stays Failed.
 */
[[nodiscard]] bool is_valid_transition(TaskStatus from, TaskStatus to) noexcept;

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Initializing,
    Planning,
    Executing,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Initializing: return "initializing";
        case ExecutionStatus::Planning:     return "planning";
        case ExecutionStatus::Executing:    return "executing";
        case ExecutionStatus::Completed:    return "completed";
        case ExecutionStatus::Failed:       return "failed";
        case ExecutionStatus::Cancelled:    return "cancelled";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

/**
 * @brief Atomic unit of work produced by the decomposer.
 *
 * Static fields (id..best_effort) are fixed once the graph is frozen; the
 * lifecycle fields are only mutated through StateManager.
 */
struct Task {
    TaskId id;
    TaskType type = TaskType::Generic;
    std::string description;
    std::vector<std::string> inputs;            ///< Artifact names consumed
    std::vector<std::string> outputs;           ///< Artifact names produced
    double estimated_complexity = 1.0;          ///< 1.0 = simple, 5.0 = very complex
    int priority = 0;                           ///< Higher runs first
    bool required = true;                       ///< Counts toward overall status
    bool best_effort = false;                   ///< Dependents proceed on failure
    std::map<std::string, std::string> context;

    TaskStatus status = TaskStatus::Pending;
    AgentId assigned_agent;
    uint32_t retry_count = 0;
    std::string failure_reason;
    std::optional<Timestamp> started_at;        ///< Latest attempt
    std::optional<Timestamp> completed_at;      ///< Set on reaching a terminal state

    bool operator==(const Task&) const = default;
};

/// Estimated wall time used for critical-path weighting (one minute per point).
[[nodiscard]] Duration estimated_duration(const Task& task) noexcept;

/// Complexity clamped into the [1, 5] band used for deadlines.
[[nodiscard]] constexpr double clamp_complexity(double complexity) noexcept {
    return std::clamp(complexity, 1.0, 5.0);
}

// ─────────────────────────────────────────────
// Dependency Edge
// ─────────────────────────────────────────────

enum class DependencyKind : uint8_t {
    Data,       ///< Output of one task is input to another
    Logical,    ///< Must complete before the other starts
    Resource    ///< Both touch the same resource; serialized
};

[[nodiscard]] constexpr std::string_view to_string(DependencyKind kind) noexcept {
    switch (kind) {
        case DependencyKind::Data:     return "data";
        case DependencyKind::Logical:  return "logical";
        case DependencyKind::Resource: return "resource";
    }
    return "unknown";
}

[[nodiscard]] std::optional<DependencyKind> parse_dependency_kind(std::string_view text);

enum class Provenance : uint8_t {
    Rule,
    Model
};

[[nodiscard]] constexpr std::string_view to_string(Provenance provenance) noexcept {
    switch (provenance) {
        case Provenance::Rule:  return "rule";
        case Provenance::Model: return "model";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Provenance> parse_provenance(std::string_view text);

struct Edge {
    TaskId from;
    TaskId to;
    DependencyKind kind = DependencyKind::Logical;
    double confidence = 1.0;
    Provenance provenance = Provenance::Rule;
    std::string reason;                       ///< Rule name or model rationale

    bool operator==(const Edge&) const = default;
};

// ─────────────────────────────────────────────
// Artifacts
// ─────────────────────────────────────────────

struct Artifact {
    std::string name;
    std::string content;
    TaskId producer;
    bool placeholder = false;                 ///< Stand-in for a failed best-effort producer

    bool operator==(const Artifact&) const = default;
};

/// Random identifier of the form `<prefix>-xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`.
[[nodiscard]] std::string generate_id(std::string_view prefix);

}  // namespace task_dispatch
