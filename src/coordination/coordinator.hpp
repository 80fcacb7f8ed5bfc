/**
 * @file coordinator.hpp
 * @brief Tick-driven scheduling loop over a frozen execution graph.
 * @author TaskDispatch contributors
 *
 * Each tick: apply cancellation requests, harvest finished jobs, enforce
 * deadlines and grace periods, release retries whose backoff elapsed,
 * promote satisfied tasks to Ready, and bind ranked Ready tasks to agents
 * up to the concurrency limit. There is one global ready queue; any idle
 * agent with the right capability takes the best-ranked task it can serve.
 *
 * The coordinator is the single writer of task state (through the
 * StateManager). Agents run on a thread pool and only return outcomes.
 */

#pragma once

#include "agents/agent_factory.hpp"
#include "coordination/state_manager.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/task_runner.hpp"
#include "executor/thread_pool.hpp"
#include "graph/execution_graph.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace task_dispatch {

class Coordinator {
public:
    Coordinator(const CoordinatorConfig& config,
                const CheckpointConfig& checkpoint_config,
                ExecutionGraph& graph,
                StateManager& state,
                AgentFactory& agents,
                Logger& logger);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /**
     * @brief Drive every task to a terminal state. Blocks the caller.
     * @return InvalidArgument if the graph is not frozen.
     */
    Result<void> run();

    /// Cancel the whole dispatch. Thread-safe; takes effect on the next tick.
    void cancel();
    [[nodiscard]] bool cancel_requested() const noexcept { return cancel_all_.load(); }

    /// Cancel one task (and, through skip propagation, its dependents). Thread-safe.
    void cancel_task(const TaskId& id);

    /**
     * @brief Prepare a restored session: tasks caught Scheduled/Running are
     *        returned to Pending, non-terminal failures are queued for retry.
     */
    Result<void> reset_orphans();

    // ── Policy helpers ────────────────────────

    /// task_timeout_default scaled by clamped complexity.
    [[nodiscard]] static Duration deadline_for(const Task& task, const CoordinatorConfig& config);

    /// base * 2^(retry_count - 1), capped.
    [[nodiscard]] static Duration backoff_for(uint32_t retry_count, const CoordinatorConfig& config);

    /// Ranking order for Ready tasks: priority, critical-path membership, arrival, id.
    [[nodiscard]] std::vector<TaskId> rank_ready(const std::vector<TaskId>& ready) const;

private:
    enum class StopReason : uint8_t { None, Timeout, Cancel };

    struct InFlight {
        TaskId task_id;
        AgentLease lease;
        CancellableJob<TaskOutcome> job;
        SteadyTime deadline;
        StopReason stop_reason = StopReason::None;
        std::optional<SteadyTime> stop_requested_at;
    };

    /// Shared with running jobs, which may outlive the coordinator once abandoned.
    struct WakeSignal {
        std::mutex mutex;
        std::condition_variable cv;
        bool woken = false;

        void notify();
    };

    // ── Tick phases ───────────────────────────
    void apply_cancellations(SteadyTime now);
    void harvest(SteadyTime now);
    void enforce_deadlines(SteadyTime now);
    void enforce_grace_periods(SteadyTime now);
    void release_backoffs(SteadyTime now);
    void promote_ready();
    void assign_ready(SteadyTime now);
    void settle_unreachable();
    void maybe_checkpoint(SteadyTime now, bool force, const char* reason);

    // ── Outcomes ──────────────────────────────
    void complete_task(const InFlight& flight, const ArtifactMap& artifacts);
    void fail_task(const TaskId& id, const Error& error, SteadyTime now, bool retryable = true);
    void cancel_running(InFlight& flight, SteadyTime now);
    void finish_cancelled(const TaskId& id, const std::string& reason);
    void skip_descendants(const TaskId& origin, const std::string& reason);

    [[nodiscard]] TaskStatusMap effective_statuses() const;
    [[nodiscard]] bool finished() const;
    [[nodiscard]] size_t active_count() const;
    void wake();
    void log_result(const Result<void>& result, std::string_view what) const;

    CoordinatorConfig config_;
    CheckpointConfig checkpoint_config_;
    ExecutionGraph& graph_;
    StateManager& state_;
    AgentFactory& agents_;
    ComponentLogger log_;
    TaskRunner runner_;

    std::set<TaskId> critical_;
    std::map<TaskId, uint64_t> arrival_;
    uint64_t next_arrival_ = 0;
    std::map<TaskId, SteadyTime> retry_at_;           ///< Failed tasks awaiting backoff
    std::map<TaskId, SteadyTime> waiting_since_;      ///< Ready tasks with no free agent
    std::vector<InFlight> in_flight_;
    std::optional<SteadyTime> last_checkpoint_;
    bool checkpoint_due_ = false;
    std::pair<size_t, size_t> last_depth_{SIZE_MAX, SIZE_MAX};

    std::atomic<bool> cancel_all_{false};
    bool cancel_all_applied_ = false;
    std::mutex request_mutex_;
    std::vector<TaskId> cancel_requests_;

    std::shared_ptr<WakeSignal> wake_ = std::make_shared<WakeSignal>();

    std::unique_ptr<ThreadPool> pool_;   // Declared last: joins workers before the rest is torn down
};

}  // namespace task_dispatch
