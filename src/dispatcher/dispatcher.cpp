/**
 * @file dispatcher.cpp
 * @brief Dispatcher implementation.
 * @author TaskDispatch contributors
 */

#include "dispatcher/dispatcher.hpp"

#include "agents/agent_factory.hpp"

#include <format>

namespace task_dispatch {

double DispatchStatus::completion_percentage() const noexcept {
    if (total_tasks == 0) return 0.0;
    auto it = counts.find(TaskStatus::Completed);
    size_t completed = it != counts.end() ? it->second : 0;
    return 100.0 * static_cast<double>(completed) / static_cast<double>(total_tasks);
}

Dispatcher::Dispatcher(DispatchContext& context)
    : context_(context)
    , log_(context.logger(), "dispatcher") {}

// ─────────────────────────────────────────────
// Planning
// ─────────────────────────────────────────────

Result<DispatchPlan> Dispatcher::plan(const Specification& spec) const {
    const auto& config = context_.config();

    TaskDecomposer decomposer(config.decomposer, context_.logger(), context_.model());
    auto decomposition = decomposer.decompose(spec);
    if (!decomposition) return decomposition.error();

    DependencyResolver resolver(config.resolver, context_.logger(), context_.rules(), context_.model());
    auto resolution = resolver.resolve(decomposition->tasks);
    if (!resolution) return resolution.error();

    auto graph = ExecutionGraph::build(decomposition->tasks, resolution->edges);
    if (!graph) return graph.error();
    if (auto frozen = graph->freeze(); !frozen) return frozen.error();

    log_.info(std::format("Planned {} tasks, {} edges ({} removed) via {} decomposition",
                          graph->task_count(), graph->edge_count(),
                          resolution->removed.size(), decomposition->strategy));

    return DispatchPlan{
        .decomposition = std::move(*decomposition),
        .resolution = std::move(*resolution),
        .graph = std::move(*graph),
    };
}

// ─────────────────────────────────────────────
// Dispatch / resume
// ─────────────────────────────────────────────

Result<ExecutionResult> Dispatcher::dispatch(const Specification& spec) {
    auto session = generate_id("session");
    if (auto started = begin(session); !started) return started.error();

    publish("planning", {{"spec_id", spec.id}, {"requirements", spec.requirements.size()}});

    auto planned = plan(spec);
    if (!planned) {
        const auto& err = planned.error();
        log_.error(std::format("Dispatch {} aborted before execution: [{}] {}",
                               session, to_string(err.code), err.message));
        publish("aborted", {{"code", std::string{to_string(err.code)}}, {"error", err.message}});
        finish(ExecutionStatus::Failed);
        return err;
    }

    auto& p = *planned;
    publish("planned", {
        {"tasks", p.graph.task_count()},
        {"edges", p.graph.edge_count()},
        {"phases", p.graph.compute_phases().size()},
        {"strategy", p.decomposition.strategy},
    });

    StateManager state(context_.bus(), context_.checkpoints(), context_.logger(),
                       context_.make_metrics_sink());
    if (auto init = state.initialize(session, p.graph); !init) {
        finish(ExecutionStatus::Failed);
        return init.error();
    }

    ExecutionResult result;
    result.session_id = session;
    result.decomposition_strategy = p.decomposition.strategy;
    result.fallback_reason = p.decomposition.fallback_reason;
    result.removed_edges = p.resolution.removed;
    result.rules_applied = p.resolution.rules_applied;
    result.model_refined = p.resolution.model_refined;

    return execute(p.graph, state, std::move(result), false);
}

Result<ExecutionResult> Dispatcher::resume(const CheckpointId& id) {
    if (context_.checkpoints() == nullptr) {
        return Error{ErrorCode::NotFound, "Checkpointing is disabled; cannot resume " + id};
    }

    StateManager state(context_.bus(), context_.checkpoints(), context_.logger(),
                       context_.make_metrics_sink());
    auto graph = state.restore(id);
    if (!graph) return graph.error();
    if (!graph->is_frozen()) {
        if (auto frozen = graph->freeze(); !frozen) return frozen.error();
    }

    auto session = state.session_id();
    if (auto started = begin(session); !started) return started.error();

    log_.info(std::format("Resuming session {} from checkpoint {}", session, id));
    publish("resuming", {{"checkpoint_id", id}});

    ExecutionResult result;
    result.session_id = session;
    result.decomposition_strategy = "resumed";
    return execute(*graph, state, std::move(result), true);
}

Result<ExecutionResult> Dispatcher::execute(ExecutionGraph& graph, StateManager& state,
                                            ExecutionResult result, bool resumed) {
    const auto& config = context_.config();
    auto& bus = context_.bus();

    bool owns_bus_thread = !bus.running();
    if (owns_bus_thread) bus.start();

    AgentFactory agents(config.agents, context_.blueprints(), context_.logger());

    Result<void> ran;
    bool cancelled = false;
    {
        Coordinator coordinator(config.coordinator, config.checkpoint, graph, state, agents,
                                context_.logger());
        {
            std::lock_guard lock(mutex_);
            active_state_ = &state;
            active_coordinator_ = &coordinator;
            total_tasks_ = graph.task_count();
            phase_ = ExecutionStatus::Executing;
            if (cancel_requested_) coordinator.cancel();
        }
        publish("executing", {{"tasks", graph.task_count()}, {"resumed", resumed}});

        if (resumed) ran = coordinator.reset_orphans();
        if (ran) ran = coordinator.run();

        {
            std::lock_guard lock(mutex_);
            active_coordinator_ = nullptr;
        }
        cancelled = coordinator.cancel_requested() && state.count(TaskStatus::Cancelled) > 0;
    }
    agents.shutdown_all();

    auto outcome = aggregate(graph, state, std::move(result), cancelled);
    {
        std::lock_guard lock(mutex_);
        active_state_ = nullptr;
        final_counts_.clear();
        for (const auto& task : outcome.tasks) ++final_counts_[task.status];
    }

    if (!ran) {
        const auto& err = ran.error();
        log_.error(std::format("Dispatch {} stopped: [{}] {}",
                               outcome.session_id, to_string(err.code), err.message));
        publish("aborted", {{"code", std::string{to_string(err.code)}}, {"error", err.message}});
        finish(ExecutionStatus::Failed);
        if (owns_bus_thread) bus.stop();
        return err;
    }

    log_.info(std::format("Dispatch {} {}: {}/{} tasks completed in {} ms",
                          outcome.session_id, to_string(outcome.status),
                          outcome.count(TaskStatus::Completed), outcome.tasks.size(),
                          outcome.metrics.end_to_end_latency.count()));
    publish("finished", {
        {"status", std::string{to_string(outcome.status)}},
        {"completed", outcome.count(TaskStatus::Completed)},
        {"failed", outcome.count(TaskStatus::Failed)},
        {"skipped", outcome.count(TaskStatus::Skipped)},
        {"cancelled", outcome.count(TaskStatus::Cancelled)},
    });
    finish(outcome.status);

    if (owns_bus_thread) {
        bus.stop();
        bus.drain();
    }
    return outcome;
}

ExecutionResult Dispatcher::aggregate(const ExecutionGraph& graph, const StateManager& state,
                                      ExecutionResult result, bool cancelled) const {
    std::map<TaskId, Task> by_id;
    for (auto& task : state.tasks()) by_id.emplace(task.id, std::move(task));

    result.metrics = state.metrics().snapshot();

    for (const auto& id : graph.topological_order()) {
        auto it = by_id.find(id);
        if (it == by_id.end()) continue;
        const auto& task = it->second;

        TaskResult entry;
        entry.id = task.id;
        entry.type = task.type;
        entry.status = task.status;
        entry.reason = task.failure_reason;
        entry.required = task.required;
        for (const auto& artifact : state.artifacts_of(task.id)) {
            entry.output_artifacts.push_back(artifact.name);
        }
        auto metrics = result.metrics.tasks.find(task.id);
        entry.retries = metrics != result.metrics.tasks.end() ? metrics->second.retries : 0;
        result.tasks.push_back(std::move(entry));
    }

    result.artifacts = state.artifacts();
    result.phases = graph.compute_phases();
    result.critical_path = graph.critical_path();
    result.graph_stats = graph.stats();
    result.edges = graph.edges();
    result.last_checkpoint = state.last_checkpoint();
    result.status = overall_status(result.tasks, cancelled);
    return result;
}

// ─────────────────────────────────────────────
// Control and status
// ─────────────────────────────────────────────

void Dispatcher::cancel() {
    std::lock_guard lock(mutex_);
    if (!active_) return;
    cancel_requested_ = true;
    if (active_coordinator_ != nullptr) active_coordinator_->cancel();
    log_.info("Cancellation requested for session " + session_);
}

DispatchStatus Dispatcher::status() const {
    std::lock_guard lock(mutex_);
    DispatchStatus status{
        .session_id = session_,
        .phase = phase_,
        .total_tasks = total_tasks_,
        .counts = {},
    };
    if (active_state_ != nullptr) {
        for (const auto& task : active_state_->tasks()) ++status.counts[task.status];
    } else {
        status.counts = final_counts_;
    }
    return status;
}

Result<void> Dispatcher::begin(const SessionId& session) {
    std::lock_guard lock(mutex_);
    if (active_) {
        return Error{ErrorCode::InvalidArgument, "A dispatch is already running: " + session_};
    }
    active_ = true;
    cancel_requested_ = false;
    session_ = session;
    phase_ = ExecutionStatus::Planning;
    total_tasks_ = 0;
    final_counts_.clear();
    return {};
}

void Dispatcher::finish(ExecutionStatus phase) {
    std::lock_guard lock(mutex_);
    phase_ = phase;
    active_ = false;
}

void Dispatcher::publish(const std::string& event, Json details) const {
    SessionId session;
    {
        std::lock_guard lock(mutex_);
        session = session_;
    }
    details["event"] = event;
    details["session_id"] = session;
    context_.bus().publish("dispatch." + session, std::move(details));
}

}  // namespace task_dispatch
