/**
 * @file state_manager.cpp
 * @brief StateManager implementation.
 * @author TaskDispatch contributors
 */

#include "coordination/state_manager.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <set>

namespace task_dispatch {

namespace {

// Millisecond resolution so timestamps survive a checkpoint round-trip unchanged.
Timestamp now_ms() {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

}  // anonymous namespace

StateManager::StateManager(MessageBus& bus,
                           ICheckpointStore* store,
                           Logger& logger,
                           std::unique_ptr<ILogSink> metrics_sink)
    : bus_(bus)
    , store_(store)
    , log_(logger, "state_manager")
    , metrics_(std::move(metrics_sink)) {}

// ─────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────

Result<void> StateManager::initialize(const SessionId& session, const ExecutionGraph& graph) {
    if (!graph.is_frozen()) {
        return Error{ErrorCode::InvalidArgument, "State can only be seeded from a frozen graph"};
    }
    {
        std::lock_guard lock(mutex_);
        session_ = session;
        tasks_.clear();
        assignments_.clear();
        agents_.clear();
        artifacts_.clear();
        checkpoint_sequence_ = 0;
        last_checkpoint_.reset();
        for (auto task : graph.tasks()) {
            task.status = TaskStatus::Pending;
            task.assigned_agent.clear();
            task.retry_count = 0;
            task.failure_reason.clear();
            task.started_at.reset();
            task.completed_at.reset();
            tasks_.emplace(task.id, std::move(task));
        }
    }
    metrics_.begin_session(graph.task_count(), std::chrono::steady_clock::now());
    log_.info(std::format("Session {} initialized with {} tasks", session, graph.task_count()));
    return {};
}

SessionId StateManager::session_id() const {
    std::lock_guard lock(mutex_);
    return session_;
}

// ─────────────────────────────────────────────
// Task lifecycle
// ─────────────────────────────────────────────

Result<void> StateManager::transition(const TaskId& id, TaskStatus to, std::string reason) {
    Task updated;
    TaskStatus from = TaskStatus::Pending;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error{ErrorCode::NotFound, "Unknown task: " + id};

        auto& task = it->second;
        from = task.status;
        if (!is_valid_transition(from, to)) {
            return Error{ErrorCode::InvalidTransition,
                         std::format("Task {}: {} -> {} is not allowed", id, to_string(from), to_string(to))};
        }

        task.status = to;
        auto now = now_ms();
        switch (to) {
            case TaskStatus::Running:
                task.started_at = now;
                break;
            case TaskStatus::Failed:
                ++task.retry_count;
                task.failure_reason = reason;
                break;
            case TaskStatus::Completed:
                task.completed_at = now;
                task.failure_reason.clear();
                break;
            case TaskStatus::Cancelled:
            case TaskStatus::Skipped:
                task.completed_at = now;
                task.failure_reason = reason;
                break;
            case TaskStatus::Pending:
            case TaskStatus::Ready:
            case TaskStatus::Scheduled:
                break;
        }

        // Leaving an agent-bound state frees the binding.
        bool was_bound = from == TaskStatus::Scheduled || from == TaskStatus::Running;
        bool still_bound = to == TaskStatus::Scheduled || to == TaskStatus::Running;
        if (was_bound && !still_bound && !task.assigned_agent.empty()) {
            assignments_.erase(task.assigned_agent);
            task.assigned_agent.clear();
        }
        updated = task;
    }

    auto steady_now = std::chrono::steady_clock::now();
    if (to == TaskStatus::Running) {
        metrics_.record_task_started(id, updated.assigned_agent, steady_now);
    }
    if (from == TaskStatus::Running) {
        metrics_.record_task_finished(id, to, steady_now);
    }
    if (from == TaskStatus::Failed && to == TaskStatus::Pending) {
        metrics_.record_retry(id);
    }
    if (to == TaskStatus::Completed || to == TaskStatus::Cancelled || to == TaskStatus::Skipped) {
        metrics_.record_task_terminal(id, to);
    }

    publish_task_event(updated, from, reason);
    return {};
}

Result<void> StateManager::finalize_failure(const TaskId& id) {
    Task updated;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error{ErrorCode::NotFound, "Unknown task: " + id};
        if (it->second.status != TaskStatus::Failed) {
            return Error{ErrorCode::InvalidTransition, "Task " + id + " is not failed"};
        }
        it->second.completed_at = now_ms();
        updated = it->second;
    }
    metrics_.record_task_terminal(id, TaskStatus::Failed);
    bus_.publish("task." + id,
                 Json{{"task_id", id},
                      {"status", "failed"},
                      {"terminal", true},
                      {"reason", updated.failure_reason},
                      {"retry_count", updated.retry_count}},
                 MessagePriority::High);
    log_.warn(std::format("Task {} failed permanently after {} attempt(s): {}",
                          id, updated.retry_count, updated.failure_reason));
    return {};
}

Result<void> StateManager::assign(const TaskId& id, const AgentId& agent) {
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return Error{ErrorCode::NotFound, "Unknown task: " + id};
        if (it->second.status != TaskStatus::Ready) {
            return Error{ErrorCode::InvalidTransition,
                         "Task " + id + " is " + std::string{to_string(it->second.status)} + ", not ready"};
        }
        if (auto bound = assignments_.find(agent); bound != assignments_.end()) {
            return Error{ErrorCode::InvalidArgument,
                         "Agent " + agent + " is already bound to " + bound->second};
        }
        it->second.assigned_agent = agent;
        assignments_[agent] = id;
        agents_[agent] = AgentStatus::Busy;
    }
    publish_agent_event(agent, AgentStatus::Busy, id);
    return transition(id, TaskStatus::Scheduled, "assigned to " + agent);
}

void StateManager::release_agent(const AgentId& agent, AgentStatus status) {
    {
        std::lock_guard lock(mutex_);
        if (auto it = assignments_.find(agent); it != assignments_.end()) {
            if (auto task = tasks_.find(it->second); task != tasks_.end()) {
                task->second.assigned_agent.clear();
            }
            assignments_.erase(it);
        }
        agents_[agent] = status;
    }
    publish_agent_event(agent, status, {});
}

// ─────────────────────────────────────────────
// Artifacts
// ─────────────────────────────────────────────

void StateManager::store_artifacts(const TaskId& producer, const ArtifactMap& artifacts, bool placeholder) {
    std::lock_guard lock(mutex_);
    for (const auto& [name, content] : artifacts) {
        auto it = artifacts_.find(name);
        if (placeholder && it != artifacts_.end() && !it->second.placeholder) continue;
        artifacts_[name] = Artifact{name, content, producer, placeholder};
    }
}

ArtifactMap StateManager::inputs_for(const Task& task) const {
    std::lock_guard lock(mutex_);
    ArtifactMap inputs;
    for (const auto& name : task.inputs) {
        if (auto it = artifacts_.find(name); it != artifacts_.end()) {
            inputs[name] = it->second.content;
        }
    }
    return inputs;
}

std::vector<Artifact> StateManager::artifacts() const {
    std::lock_guard lock(mutex_);
    std::vector<Artifact> out;
    out.reserve(artifacts_.size());
    for (const auto& [_, artifact] : artifacts_) out.push_back(artifact);
    return out;
}

std::vector<Artifact> StateManager::artifacts_of(const TaskId& producer) const {
    std::lock_guard lock(mutex_);
    std::vector<Artifact> out;
    for (const auto& [_, artifact] : artifacts_) {
        if (artifact.producer == producer) out.push_back(artifact);
    }
    return out;
}

// ─────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────

std::optional<Task> StateManager::task(const TaskId& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<Task> StateManager::tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [_, task] : tasks_) out.push_back(task);
    return out;
}

TaskStatusMap StateManager::statuses() const {
    std::lock_guard lock(mutex_);
    TaskStatusMap out;
    for (const auto& [id, task] : tasks_) out.emplace(id, task.status);
    return out;
}

size_t StateManager::count(TaskStatus status) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [status](const auto& entry) { return entry.second.status == status; }));
}

bool StateManager::all_terminal() const {
    std::lock_guard lock(mutex_);
    return std::all_of(tasks_.begin(), tasks_.end(),
        [](const auto& entry) { return is_terminal(entry.second.status); });
}

std::map<AgentId, TaskId> StateManager::assignments() const {
    std::lock_guard lock(mutex_);
    return assignments_;
}

std::map<AgentId, AgentStatus> StateManager::agent_statuses() const {
    std::lock_guard lock(mutex_);
    return agents_;
}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

Result<CheckpointId> StateManager::checkpoint(const ExecutionGraph& graph, std::string reason) {
    if (!store_) return Error{ErrorCode::NotFound, "No checkpoint store configured"};

    Checkpoint cp;
    {
        std::lock_guard lock(mutex_);
        cp.id = generate_id("ckpt");
        cp.session_id = session_;
        cp.sequence = ++checkpoint_sequence_;
        cp.created_at = now_ms();
        cp.tasks = tasks_;
        cp.assignments = assignments_;
        for (const auto& [_, artifact] : artifacts_) cp.artifacts.push_back(artifact);
    }
    cp.graph = graph.snapshot();
    cp.reason = std::move(reason);

    auto saved = store_->save(cp);
    if (!saved) {
        log_.error("Checkpoint failed: " + saved.error().message);
        return saved.error();
    }

    {
        std::lock_guard lock(mutex_);
        last_checkpoint_ = cp.id;
    }
    bus_.publish("checkpoint." + cp.session_id,
                 Json{{"checkpoint_id", cp.id}, {"sequence", cp.sequence}, {"reason", cp.reason}},
                 MessagePriority::Low);
    log_.debug(std::format("Checkpoint {} ({}) written", cp.id, cp.reason));
    return cp.id;
}

Result<ExecutionGraph> StateManager::restore(const CheckpointId& id) {
    if (!store_) return Error{ErrorCode::NotFound, "No checkpoint store configured"};

    auto loaded = store_->load(id);
    if (!loaded) return loaded.error();
    auto& cp = *loaded;

    auto graph = ExecutionGraph::from_snapshot(cp.graph);
    if (!graph) {
        return Error{ErrorCode::CheckpointCorrupt,
                     "Checkpoint " + id + " holds an invalid graph: " + graph.error().message};
    }

    std::set<TaskId> graph_ids;
    for (const auto& task : cp.graph.tasks) graph_ids.insert(task.id);
    std::set<TaskId> table_ids;
    for (const auto& [task_id, _] : cp.tasks) table_ids.insert(task_id);
    if (graph_ids != table_ids) {
        return Error{ErrorCode::CheckpointCorrupt,
                     "Checkpoint " + id + ": task table does not match the graph"};
    }
    for (const auto& [agent, task_id] : cp.assignments) {
        if (!table_ids.contains(task_id)) {
            return Error{ErrorCode::CheckpointCorrupt,
                         "Checkpoint " + id + ": agent " + agent + " bound to unknown task " + task_id};
        }
    }

    {
        std::lock_guard lock(mutex_);
        session_ = cp.session_id;
        tasks_ = cp.tasks;
        assignments_ = cp.assignments;
        agents_.clear();
        for (const auto& [agent, _] : assignments_) agents_[agent] = AgentStatus::Busy;
        artifacts_.clear();
        for (const auto& artifact : cp.artifacts) artifacts_[artifact.name] = artifact;
        checkpoint_sequence_ = cp.sequence;
        last_checkpoint_ = cp.id;
    }

    metrics_.begin_session(cp.tasks.size(), std::chrono::steady_clock::now());
    for (const auto& [task_id, task] : cp.tasks) {
        metrics_.restore_task(task_id, task.status, task.retry_count);
    }

    log_.info(std::format("Restored session {} from checkpoint {} (seq {})",
                          cp.session_id, cp.id, cp.sequence));
    return std::move(graph).value();
}

std::optional<CheckpointId> StateManager::last_checkpoint() const {
    std::lock_guard lock(mutex_);
    return last_checkpoint_;
}

// ─────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────

void StateManager::publish_task_event(const Task& task, TaskStatus from, const std::string& reason) {
    Json payload{
        {"task_id", task.id},
        {"from", from},
        {"status", task.status},
        {"reason", reason},
        {"retry_count", task.retry_count},
        {"agent", task.assigned_agent}
    };
    auto priority = task.status == TaskStatus::Failed ? MessagePriority::High : MessagePriority::Normal;
    bus_.publish("task." + task.id, std::move(payload), priority);
}

void StateManager::publish_agent_event(const AgentId& agent, AgentStatus status, const TaskId& task) {
    bus_.publish("agent." + agent,
                 Json{{"agent_id", agent}, {"status", std::string{to_string(status)}}, {"task_id", task}});
}

}  // namespace task_dispatch
