/**
 * @file dispatcher.hpp
 * @brief End-to-end dispatch: decompose, resolve, build, execute, aggregate.
 * @author TaskDispatch contributors
 *
 * Structural errors (blank specification, cycles, invalid graph) abort
 * before any task runs and come back as an Error. Once execution starts the
 * dispatch always produces an ExecutionResult, whose status reflects task
 * failures or cancellation.
 *
 * Progress events go to "dispatch.<session>"; per-task and per-agent events
 * are published by the StateManager on "task.<id>" and "agent.<id>".
 */

#pragma once

#include "coordination/coordinator.hpp"
#include "coordination/state_manager.hpp"
#include "core/result.hpp"
#include "core/specification.hpp"
#include "dispatcher/dispatch_context.hpp"
#include "dispatcher/execution_result.hpp"
#include "graph/dependency_resolver.hpp"
#include "graph/execution_graph.hpp"
#include "graph/task_decomposer.hpp"

#include <map>
#include <mutex>

namespace task_dispatch {

/// The planning half of a dispatch, before anything executes.
struct DispatchPlan {
    Decomposition decomposition;
    Resolution resolution;
    ExecutionGraph graph;       ///< Frozen
};

struct DispatchStatus {
    SessionId session_id;
    ExecutionStatus phase = ExecutionStatus::Initializing;
    size_t total_tasks = 0;
    std::map<TaskStatus, size_t> counts;

    [[nodiscard]] double completion_percentage() const noexcept;
};

class Dispatcher {
public:
    explicit Dispatcher(DispatchContext& context);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Decompose and resolve `spec` into a frozen graph without running it.
     * @return DecompositionError, CycleDetected or InvalidArgument.
     */
    [[nodiscard]] Result<DispatchPlan> plan(const Specification& spec) const;

    /**
     * @brief Plan and execute `spec`. Blocks until every task is terminal.
     * @return Structural errors; InvalidArgument if a dispatch is already running.
     */
    [[nodiscard]] Result<ExecutionResult> dispatch(const Specification& spec);

    /**
     * @brief Continue a checkpointed session without re-decomposing.
     * @return NotFound without a checkpoint store or for an unknown id;
     *         CheckpointCorrupt if the checkpoint is inconsistent.
     */
    [[nodiscard]] Result<ExecutionResult> resume(const CheckpointId& id);

    /// Cancel the dispatch in progress. Thread-safe; no-op when idle.
    void cancel();

    /// Snapshot of the dispatch in progress (or the last one). Thread-safe.
    [[nodiscard]] DispatchStatus status() const;

private:
    Result<void> begin(const SessionId& session);
    Result<ExecutionResult> execute(ExecutionGraph& graph, StateManager& state,
                                    ExecutionResult result, bool resumed);
    void finish(ExecutionStatus phase);
    void publish(const std::string& event, Json details = Json::object()) const;
    [[nodiscard]] ExecutionResult aggregate(const ExecutionGraph& graph, const StateManager& state,
                                            ExecutionResult result, bool cancelled) const;

    DispatchContext& context_;
    ComponentLogger log_;

    mutable std::mutex mutex_;
    bool active_ = false;
    bool cancel_requested_ = false;
    SessionId session_;
    ExecutionStatus phase_ = ExecutionStatus::Initializing;
    size_t total_tasks_ = 0;
    const StateManager* active_state_ = nullptr;
    Coordinator* active_coordinator_ = nullptr;
    std::map<TaskStatus, size_t> final_counts_;
};

}  // namespace task_dispatch
