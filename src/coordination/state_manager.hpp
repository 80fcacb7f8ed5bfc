/**
 * @file state_manager.hpp
 * @brief Authoritative task/agent state, artifacts, checkpoints and metrics.
 * @author TaskDispatch contributors
 *
 * Every lifecycle mutation goes through here: it is validated against the
 * task state machine, stamped, recorded in the metrics collector and
 * published on the bus ("task.<id>", "agent.<id>"). Readers get copies.
 */

#pragma once

#include "agents/agent.hpp"
#include "coordination/checkpoint_store.hpp"
#include "coordination/message_bus.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/execution_graph.hpp"
#include "telemetry/metrics_collector.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace task_dispatch {

class StateManager {
public:
    /**
     * @param store Optional; without one checkpoint() fails with NotFound.
     */
    StateManager(MessageBus& bus,
                 ICheckpointStore* store,
                 Logger& logger,
                 std::unique_ptr<ILogSink> metrics_sink);

    // ── Session ───────────────────────────────

    /// Seed the task table from a frozen graph; every task starts Pending.
    Result<void> initialize(const SessionId& session, const ExecutionGraph& graph);

    [[nodiscard]] SessionId session_id() const;

    // ── Task lifecycle ────────────────────────

    /**
     * @brief Validated status change.
     *
     * Entering Failed increments the task's retry counter. Entering
     * Completed, Cancelled or Skipped is final and stamps completed_at.
     * @return NotFound, or InvalidTransition if the state machine forbids it.
     */
    Result<void> transition(const TaskId& id, TaskStatus to, std::string reason = {});

    /// A Failed task that will not be retried: stamp it and count it as terminal.
    Result<void> finalize_failure(const TaskId& id);

    /// Bind `agent` to a Ready task (→ Scheduled) and mark the agent busy.
    Result<void> assign(const TaskId& id, const AgentId& agent);

    /// Detach an agent from whatever it was running and record its new status.
    void release_agent(const AgentId& agent, AgentStatus status);

    // ── Artifacts ─────────────────────────────

    void store_artifacts(const TaskId& producer, const ArtifactMap& artifacts, bool placeholder = false);

    /// Declared inputs of `task` that have been produced so far.
    [[nodiscard]] ArtifactMap inputs_for(const Task& task) const;
    [[nodiscard]] std::vector<Artifact> artifacts() const;
    [[nodiscard]] std::vector<Artifact> artifacts_of(const TaskId& producer) const;

    // ── Snapshots ─────────────────────────────

    [[nodiscard]] std::optional<Task> task(const TaskId& id) const;
    [[nodiscard]] std::vector<Task> tasks() const;
    [[nodiscard]] TaskStatusMap statuses() const;
    [[nodiscard]] size_t count(TaskStatus status) const;
    [[nodiscard]] bool all_terminal() const;
    [[nodiscard]] std::map<AgentId, TaskId> assignments() const;
    [[nodiscard]] std::map<AgentId, AgentStatus> agent_statuses() const;

    // ── Persistence ───────────────────────────

    /// Persist graph + task table + assignments + artifacts.
    Result<CheckpointId> checkpoint(const ExecutionGraph& graph, std::string reason);

    /**
     * @brief Rehydrate a session exactly as checkpointed.
     * @return The rebuilt graph; CheckpointCorrupt if the snapshot is inconsistent.
     */
    Result<ExecutionGraph> restore(const CheckpointId& id);

    [[nodiscard]] std::optional<CheckpointId> last_checkpoint() const;
    [[nodiscard]] bool has_store() const noexcept { return store_ != nullptr; }

    // ── Metrics ───────────────────────────────

    [[nodiscard]] MetricsCollector& metrics() noexcept { return metrics_; }
    [[nodiscard]] const MetricsCollector& metrics() const noexcept { return metrics_; }

private:
    void publish_task_event(const Task& task, TaskStatus from, const std::string& reason);
    void publish_agent_event(const AgentId& agent, AgentStatus status, const TaskId& task);

    MessageBus& bus_;
    ICheckpointStore* store_;
    ComponentLogger log_;
    MetricsCollector metrics_;

    mutable std::mutex mutex_;
    SessionId session_;
    std::map<TaskId, Task> tasks_;
    std::map<AgentId, TaskId> assignments_;
    std::map<AgentId, AgentStatus> agents_;
    std::map<std::string, Artifact> artifacts_;
    uint64_t checkpoint_sequence_ = 0;
    std::optional<CheckpointId> last_checkpoint_;
};

}  // namespace task_dispatch
