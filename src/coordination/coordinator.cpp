/**
 * @file coordinator.cpp
 * @brief Coordinator scheduling loop implementation.
 * @author TaskDispatch contributors
 */

#include "coordination/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace task_dispatch {

Coordinator::Coordinator(const CoordinatorConfig& config,
                         const CheckpointConfig& checkpoint_config,
                         ExecutionGraph& graph,
                         StateManager& state,
                         AgentFactory& agents,
                         Logger& logger)
    : config_(config)
    , checkpoint_config_(checkpoint_config)
    , graph_(graph)
    , state_(state)
    , agents_(agents)
    , log_(logger, "coordinator")
    , pool_(std::make_unique<ThreadPool>(std::max<uint32_t>(1, config.max_concurrent_agents))) {
    for (const auto& id : graph_.critical_path().tasks) critical_.insert(id);
}

Coordinator::~Coordinator() {
    for (auto& flight : in_flight_) flight.job.request_stop();
    pool_.reset();
}

// ─────────────────────────────────────────────
// Policy helpers
// ─────────────────────────────────────────────

Duration Coordinator::deadline_for(const Task& task, const CoordinatorConfig& config) {
    auto scaled = static_cast<double>(config.task_timeout_default_ms) * clamp_complexity(task.estimated_complexity);
    return Duration{static_cast<Duration::rep>(scaled)};
}

Duration Coordinator::backoff_for(uint32_t retry_count, const CoordinatorConfig& config) {
    if (retry_count == 0) return Duration{0};
    uint64_t delay = config.retry_backoff_base_ms;
    for (uint32_t i = 1; i < retry_count && delay < config.retry_backoff_max_ms; ++i) {
        delay *= 2;
    }
    return Duration{static_cast<Duration::rep>(std::min(delay, config.retry_backoff_max_ms))};
}

std::vector<TaskId> Coordinator::rank_ready(const std::vector<TaskId>& ready) const {
    auto ranked = ready;
    auto priority_of = [this](const TaskId& id) {
        const auto* task = graph_.find_task(id);
        return task ? task->priority : 0;
    };
    auto arrival_of = [this](const TaskId& id) {
        auto it = arrival_.find(id);
        return it != arrival_.end() ? it->second : UINT64_MAX;
    };

    std::sort(ranked.begin(), ranked.end(), [&](const TaskId& a, const TaskId& b) {
        int pa = priority_of(a);
        int pb = priority_of(b);
        if (pa != pb) return pa > pb;
        bool ca = critical_.contains(a);
        bool cb = critical_.contains(b);
        if (ca != cb) return ca;
        auto aa = arrival_of(a);
        auto ab = arrival_of(b);
        if (aa != ab) return aa < ab;
        return a < b;
    });
    return ranked;
}

// ─────────────────────────────────────────────
// Main loop
// ─────────────────────────────────────────────

Result<void> Coordinator::run() {
    if (!graph_.is_frozen()) {
        return Error{ErrorCode::InvalidArgument, "Coordinator needs a frozen execution graph"};
    }

    log_.info(std::format("Scheduling {} tasks on up to {} concurrent agents",
                          graph_.task_count(), config_.max_concurrent_agents));

    auto tick = Duration{std::max<uint64_t>(1, config_.tick_interval_ms)};
    last_checkpoint_ = std::chrono::steady_clock::now();

    while (true) {
        auto now = std::chrono::steady_clock::now();

        apply_cancellations(now);
        harvest(now);
        enforce_deadlines(now);
        enforce_grace_periods(now);
        release_backoffs(now);
        promote_ready();
        assign_ready(now);
        settle_unreachable();

        std::pair<size_t, size_t> depth{state_.count(TaskStatus::Ready), active_count()};
        if (depth != last_depth_) {
            state_.metrics().record_queue_depth(depth.first, depth.second, now);
            last_depth_ = depth;
        }

        maybe_checkpoint(now, false, "interval");
        if (finished()) break;

        std::unique_lock lock(wake_->mutex);
        wake_->cv.wait_for(lock, tick, [this] { return wake_->woken; });
        wake_->woken = false;
    }

    maybe_checkpoint(std::chrono::steady_clock::now(), true, "final");
    state_.metrics().end_session(std::chrono::steady_clock::now());

    log_.info(std::format("Dispatch loop finished: {} completed, {} failed, {} skipped, {} cancelled",
                          state_.count(TaskStatus::Completed), state_.count(TaskStatus::Failed),
                          state_.count(TaskStatus::Skipped), state_.count(TaskStatus::Cancelled)));
    return {};
}

void Coordinator::cancel() {
    cancel_all_ = true;
    wake();
}

void Coordinator::cancel_task(const TaskId& id) {
    {
        std::lock_guard lock(request_mutex_);
        cancel_requests_.push_back(id);
    }
    wake();
}

Result<void> Coordinator::reset_orphans() {
    for (const auto& [agent, task_id] : state_.assignments()) {
        state_.release_agent(agent, AgentStatus::Idle);
    }

    auto now = std::chrono::steady_clock::now();
    size_t reset = 0;
    for (const auto& task : state_.tasks()) {
        if (task.status == TaskStatus::Scheduled || task.status == TaskStatus::Running) {
            auto moved = state_.transition(task.id, TaskStatus::Pending, "orphaned by interrupted session");
            if (!moved) return moved;
            ++reset;
        } else if (task.status == TaskStatus::Failed && !task.completed_at) {
            if (task.retry_count <= config_.max_retries) {
                retry_at_[task.id] = now;
            } else {
                auto finalized = state_.finalize_failure(task.id);
                if (!finalized) return finalized;
                if (!task.best_effort) skip_descendants(task.id, std::format("upstream task {} failed", task.id));
            }
        }
    }
    if (reset > 0) log_.info(std::format("Returned {} orphaned task(s) to pending", reset));
    return {};
}

// ─────────────────────────────────────────────
// Tick phases
// ─────────────────────────────────────────────

void Coordinator::apply_cancellations(SteadyTime now) {
    std::vector<TaskId> requests;
    {
        std::lock_guard lock(request_mutex_);
        requests.swap(cancel_requests_);
    }

    if (cancel_all_ && !cancel_all_applied_) {
        cancel_all_applied_ = true;
        log_.warn("Dispatch cancellation requested");
        for (const auto& task : state_.tasks()) {
            if (task.status == TaskStatus::Pending || task.status == TaskStatus::Ready
                || retry_at_.contains(task.id)) {
                finish_cancelled(task.id, "dispatch cancelled");
            }
        }
        for (auto& flight : in_flight_) {
            if (flight.stop_reason != StopReason::Cancel) cancel_running(flight, now);
        }
        checkpoint_due_ = true;
    }

    for (const auto& id : requests) {
        auto task = state_.task(id);
        if (!task) {
            log_.warn("Ignoring cancellation of unknown task " + id);
            continue;
        }
        if (task->status == TaskStatus::Pending || task->status == TaskStatus::Ready
            || retry_at_.contains(id)) {
            finish_cancelled(id, "cancelled on request");
            skip_descendants(id, std::format("upstream task {} was cancelled", id));
            checkpoint_due_ = true;
            continue;
        }
        auto flight = std::find_if(in_flight_.begin(), in_flight_.end(), [&](const InFlight& f) {
            return f.task_id == id;
        });
        if (flight != in_flight_.end()) {
            if (flight->stop_reason != StopReason::Cancel) cancel_running(*flight, now);
            continue;
        }
        log_.debug(std::format("Cancellation of {} ignored: task is {}", id, to_string(task->status)));
    }
}

void Coordinator::harvest(SteadyTime now) {
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (!it->job.ready()) {
            ++it;
            continue;
        }
        InFlight flight = std::move(*it);
        it = in_flight_.erase(it);

        TaskOutcome outcome;
        try {
            outcome = flight.job.future.get();
        } catch (const std::exception& e) {
            outcome.artifacts = Error{ErrorCode::TaskExecution,
                                      "Execution of " + flight.task_id + " was lost: " + e.what()};
        }

        const AgentId agent = flight.lease.agent->id();
        if (outcome.artifacts) {
            complete_task(flight, *outcome.artifacts);
            continue;
        }

        if (flight.stop_reason == StopReason::Cancel) {
            finish_cancelled(flight.task_id, "cancelled while running");
            skip_descendants(flight.task_id, std::format("upstream task {} was cancelled", flight.task_id));
            checkpoint_due_ = true;
        } else if (flight.stop_reason == StopReason::Timeout) {
            fail_task(flight.task_id,
                      Error{ErrorCode::Timeout, std::format("Task {} exceeded its deadline", flight.task_id)},
                      now);
        } else {
            fail_task(flight.task_id, outcome.artifacts.error(), now);
        }
        state_.release_agent(agent, AgentStatus::Idle);
        log_result(agents_.release(agent), "Releasing agent " + agent);
    }
}

void Coordinator::enforce_deadlines(SteadyTime now) {
    for (auto& flight : in_flight_) {
        if (flight.stop_reason != StopReason::None || now < flight.deadline) continue;
        flight.job.request_stop();
        flight.stop_reason = StopReason::Timeout;
        flight.stop_requested_at = now;
        log_.warn(std::format("Task {} passed its deadline; stop requested", flight.task_id));
    }
}

void Coordinator::enforce_grace_periods(SteadyTime now) {
    auto grace = Duration{config_.cancel_grace_period_ms};
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (!it->stop_requested_at || now - *it->stop_requested_at < grace || it->job.ready()) {
            ++it;
            continue;
        }
        InFlight flight = std::move(*it);
        it = in_flight_.erase(it);

        // The worker thread is left to finish on its own; its outcome is never read.
        const AgentId agent = flight.lease.agent->id();
        if (!pool_->abandon(flight.job.stop)) {
            log_.warn("Job for " + flight.task_id + " was not running when abandoned");
        }
        log_.error(std::format("Agent {} ignored the stop request for {}; forcing termination",
                               agent, flight.task_id));

        if (flight.stop_reason == StopReason::Timeout) {
            fail_task(flight.task_id,
                      Error{ErrorCode::Timeout,
                            std::format("Task {} exceeded its deadline and did not stop", flight.task_id)},
                      now);
        } else {
            finish_cancelled(flight.task_id, "forcibly cancelled after grace period");
            skip_descendants(flight.task_id, std::format("upstream task {} was cancelled", flight.task_id));
            checkpoint_due_ = true;
        }

        state_.release_agent(agent, AgentStatus::Failed);
        log_result(agents_.mark_failed(agent), "Marking agent " + agent + " failed");
        log_result(agents_.evict(agent), "Evicting agent " + agent);
    }
}

void Coordinator::release_backoffs(SteadyTime now) {
    for (auto it = retry_at_.begin(); it != retry_at_.end();) {
        if (now < it->second) {
            ++it;
            continue;
        }
        log_result(state_.transition(it->first, TaskStatus::Pending, "retry"), "Retrying " + it->first);
        arrival_.erase(it->first);
        it = retry_at_.erase(it);
    }
}

void Coordinator::promote_ready() {
    auto statuses = effective_statuses();
    for (const auto& id : graph_.ready_tasks(statuses)) {
        if (statuses[id] != TaskStatus::Pending || retry_at_.contains(id)) continue;
        auto moved = state_.transition(id, TaskStatus::Ready);
        if (!moved) {
            log_result(moved, "Promoting " + id);
            continue;
        }
        arrival_.emplace(id, next_arrival_++);
    }
}

void Coordinator::assign_ready(SteadyTime now) {
    std::vector<TaskId> ready;
    for (const auto& [id, status] : state_.statuses()) {
        if (status == TaskStatus::Ready) ready.push_back(id);
    }

    for (const auto& id : rank_ready(ready)) {
        if (active_count() >= config_.max_concurrent_agents) break;

        auto task = state_.task(id);
        if (!task) continue;

        if (!agents_.can_serve(task->type)) {
            fail_task(id,
                      Error{ErrorCode::ResourceExhausted,
                            std::format("No agent blueprint serves {}", to_string(task->type))},
                      now, /*retryable=*/false);
            continue;
        }

        auto lease = agents_.acquire(task->type, id);
        if (!lease) {
            auto [since, _] = waiting_since_.emplace(id, now);
            if (now - since->second >= Duration{config_.agent_wait_timeout_ms}) {
                waiting_since_.erase(since);
                fail_task(id,
                          Error{ErrorCode::ResourceExhausted,
                                std::format("No {} agent became available within {} ms",
                                            to_string(task->type), config_.agent_wait_timeout_ms)},
                          now);
            }
            continue;
        }
        waiting_since_.erase(id);

        const AgentId agent_id = lease->agent->id();
        auto assigned = state_.assign(id, agent_id);
        if (!assigned) {
            log_result(assigned, "Assigning " + id);
            log_result(agents_.release(agent_id), "Releasing agent " + agent_id);
            continue;
        }
        auto running = state_.transition(id, TaskStatus::Running);
        if (!running) {
            log_result(running, "Starting " + id);
            state_.release_agent(agent_id, AgentStatus::Idle);
            log_result(agents_.release(agent_id), "Releasing agent " + agent_id);
            continue;
        }

        auto snapshot = state_.task(id).value_or(*task);
        auto inputs = state_.inputs_for(snapshot);
        auto agent = lease->agent;
        auto job = pool_->submit_cancellable(
            [runner = runner_, signal = wake_, agent, snapshot, inputs](std::stop_token stop) {
                auto outcome = runner.execute(*agent, snapshot, inputs, stop);
                signal->notify();
                return outcome;
            });

        in_flight_.push_back(InFlight{
            .task_id = id,
            .lease = *lease,
            .job = std::move(job),
            .deadline = now + deadline_for(snapshot, config_)
        });
        log_.debug(std::format("Task {} dispatched to {}", id, agent_id));
    }
}

void Coordinator::settle_unreachable() {
    if (!in_flight_.empty() || !retry_at_.empty()) return;

    auto statuses = state_.statuses();
    bool any_ready = std::any_of(statuses.begin(), statuses.end(),
        [](const auto& entry) { return entry.second == TaskStatus::Ready; });
    if (any_ready) return;

    for (const auto& [id, status] : statuses) {
        if (status != TaskStatus::Pending) continue;
        log_.error("Task " + id + " can no longer become ready");
        log_result(state_.transition(id, TaskStatus::Skipped, "predecessors can no longer complete"),
                   "Skipping " + id);
    }
}

void Coordinator::maybe_checkpoint(SteadyTime now, bool force, const char* reason) {
    if (!checkpoint_config_.enabled || !state_.has_store()) return;

    bool periodic = !last_checkpoint_
        || now - *last_checkpoint_ >= std::chrono::seconds(checkpoint_config_.interval_seconds);
    if (!force && !checkpoint_due_ && !periodic) return;

    std::string why = force ? reason : (checkpoint_due_ ? "transition" : reason);
    auto saved = state_.checkpoint(graph_, why);
    if (!saved) {
        log_.warn("Continuing without checkpoint: " + saved.error().message);
    }
    last_checkpoint_ = now;
    checkpoint_due_ = false;
}

// ─────────────────────────────────────────────
// Outcomes
// ─────────────────────────────────────────────

void Coordinator::complete_task(const InFlight& flight, const ArtifactMap& artifacts) {
    const AgentId agent = flight.lease.agent->id();
    state_.store_artifacts(flight.task_id, artifacts);
    log_result(state_.transition(flight.task_id, TaskStatus::Completed), "Completing " + flight.task_id);
    state_.release_agent(agent, AgentStatus::Idle);
    log_result(agents_.release(agent), "Releasing agent " + agent);
    checkpoint_due_ = true;
    log_.info(std::format("Task {} completed by {} ({} artifact(s))", flight.task_id, agent, artifacts.size()));
}

void Coordinator::fail_task(const TaskId& id, const Error& error, SteadyTime now, bool retryable) {
    waiting_since_.erase(id);
    auto moved = state_.transition(id, TaskStatus::Failed, error.message);
    if (!moved) {
        log_result(moved, "Failing " + id);
        return;
    }
    auto task = state_.task(id);
    if (!task) return;

    if (retryable && task->retry_count <= config_.max_retries) {
        auto delay = backoff_for(task->retry_count, config_);
        retry_at_[id] = now + delay;
        log_.warn(std::format("Task {} failed (attempt {}/{}): {}; retrying in {} ms",
                              id, task->retry_count, config_.max_retries + 1, error.message, delay.count()));
        return;
    }

    log_result(state_.finalize_failure(id), "Finalizing " + id);
    checkpoint_due_ = true;

    if (task->best_effort) {
        ArtifactMap placeholders;
        for (const auto& output : task->outputs) {
            placeholders[output] = std::format("placeholder: {} failed ({})", id, error.message);
        }
        state_.store_artifacts(id, placeholders, /*placeholder=*/true);
        log_.warn(std::format("Best-effort task {} failed; dependents continue with placeholders", id));
        return;
    }
    skip_descendants(id, std::format("upstream task {} failed", id));
}

void Coordinator::cancel_running(InFlight& flight, SteadyTime now) {
    flight.job.request_stop();
    flight.stop_reason = StopReason::Cancel;
    flight.stop_requested_at = now;
    log_.info("Stop requested for running task " + flight.task_id);
}

void Coordinator::finish_cancelled(const TaskId& id, const std::string& reason) {
    waiting_since_.erase(id);
    if (retry_at_.erase(id) > 0) {
        log_result(state_.transition(id, TaskStatus::Pending, "retry withdrawn"), "Withdrawing retry of " + id);
    }
    log_result(state_.transition(id, TaskStatus::Cancelled, reason), "Cancelling " + id);
}

void Coordinator::skip_descendants(const TaskId& origin, const std::string& reason) {
    auto skipped = graph_.propagate_skip(origin);
    size_t moved = 0;
    for (const auto& id : skipped) {
        auto task = state_.task(id);
        if (!task || (task->status != TaskStatus::Pending && task->status != TaskStatus::Ready)) continue;
        waiting_since_.erase(id);
        log_result(state_.transition(id, TaskStatus::Skipped, reason), "Skipping " + id);
        ++moved;
    }
    if (moved > 0) {
        log_.warn(std::format("{} dependent task(s) skipped: {}", moved, reason));
    }
}

// ─────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────

TaskStatusMap Coordinator::effective_statuses() const {
    auto statuses = state_.statuses();
    for (const auto& [id, _] : retry_at_) statuses[id] = TaskStatus::Pending;
    return statuses;
}

bool Coordinator::finished() const {
    return in_flight_.empty() && retry_at_.empty() && state_.all_terminal();
}

size_t Coordinator::active_count() const {
    return in_flight_.size();
}

void Coordinator::wake() {
    wake_->notify();
}

void Coordinator::WakeSignal::notify() {
    {
        std::lock_guard lock(mutex);
        woken = true;
    }
    cv.notify_one();
}

void Coordinator::log_result(const Result<void>& result, std::string_view what) const {
    if (!result) log_.error(std::string{what} + ": " + result.error().message);
}

}  // namespace task_dispatch
