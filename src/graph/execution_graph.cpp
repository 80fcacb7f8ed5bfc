/**
 * @file execution_graph.cpp
 * @brief ExecutionGraph implementation — graph algorithms.
 * @author TaskDispatch contributors
 *
 * Kahn's algorithm with a (priority, id) ordered frontier gives a
 * deterministic topological order; phases, critical path and makespan are
 * all computed over that order in O(V+E) (plus the frontier's log factor).
 */

#include "graph/execution_graph.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <sstream>
#include <unordered_set>

namespace task_dispatch {

namespace {

/// Frontier key: higher priority first, then lexicographic id.
using FrontierKey = std::pair<int, TaskId>;

FrontierKey frontier_key(const Task& task) {
    return {-task.priority, task.id};
}

void sort_by_priority(std::vector<TaskId>& ids, const std::map<TaskId, Task>& tasks) {
    std::sort(ids.begin(), ids.end(), [&](const TaskId& a, const TaskId& b) {
        return frontier_key(tasks.at(a)) < frontier_key(tasks.at(b));
    });
}

}  // namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<ExecutionGraph> ExecutionGraph::build(std::vector<Task> tasks, const std::vector<Edge>& edges) {
    ExecutionGraph graph;
    for (auto& task : tasks) {
        if (auto added = graph.add_task(std::move(task)); !added) {
            return added.error();
        }
    }
    for (const auto& edge : edges) {
        if (auto added = graph.add_edge(edge); !added) {
            return added.error();
        }
    }
    if (graph.has_cycle()) {
        std::ostringstream oss;
        oss << "Dependency cycle among tasks:";
        for (const auto& id : graph.cycle_members()) {
            oss << ' ' << id;
        }
        return Error{ErrorCode::CycleDetected, oss.str()};
    }
    return graph;
}

Result<ExecutionGraph> ExecutionGraph::from_snapshot(const GraphSnapshot& snapshot) {
    auto built = build(snapshot.tasks, snapshot.edges);
    if (!built) return built.error();

    auto graph = std::move(built).value();
    for (const auto& [task, cause] : snapshot.skipped) {
        if (!graph.contains(task)) {
            return Error{ErrorCode::NotFound, "Skipped task not in snapshot: " + task};
        }
        graph.skipped_[task] = cause;
    }
    graph.frozen_ = snapshot.frozen;
    return graph;
}

Result<void> ExecutionGraph::check_mutable(std::string_view op) const {
    if (frozen_) {
        return Error{ErrorCode::GraphFrozen,
                     std::string{op} + " is not permitted after the graph is frozen"};
    }
    return {};
}

Result<void> ExecutionGraph::add_task(Task task) {
    if (auto ok = check_mutable("add_task"); !ok) return ok;
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Task id must not be empty"};
    }
    if (tasks_.contains(task.id)) {
        return Error{ErrorCode::InvalidArgument, "Duplicate task id: " + task.id};
    }
    TaskId id = task.id;
    adj_list_[id];
    reverse_adj_[id];
    tasks_.emplace(id, std::move(task));
    return {};
}

Result<void> ExecutionGraph::add_edge(Edge edge) {
    if (auto ok = check_mutable("add_edge"); !ok) return ok;
    if (!tasks_.contains(edge.from)) {
        return Error{ErrorCode::NotFound, "Edge source not in graph: " + edge.from};
    }
    if (!tasks_.contains(edge.to)) {
        return Error{ErrorCode::NotFound, "Edge target not in graph: " + edge.to};
    }
    if (edge.from == edge.to) {
        return Error{ErrorCode::CycleDetected, "Self-dependency on task " + edge.from};
    }

    auto key = std::make_pair(edge.from, edge.to);
    if (edges_.contains(key)) return {};  // first edge for a pair wins

    adj_list_[edge.from].push_back(edge.to);
    reverse_adj_[edge.to].push_back(edge.from);
    edges_.emplace(std::move(key), std::move(edge));
    return {};
}

Result<void> ExecutionGraph::remove_task(const TaskId& id) {
    if (auto ok = check_mutable("remove_task"); !ok) return ok;
    if (!tasks_.contains(id)) {
        return Error{ErrorCode::NotFound, "No such task: " + id};
    }

    for (const auto& succ : adj_list_[id]) {
        auto& preds = reverse_adj_[succ];
        preds.erase(std::remove(preds.begin(), preds.end(), id), preds.end());
        edges_.erase({id, succ});
    }
    for (const auto& pred : reverse_adj_[id]) {
        auto& succs = adj_list_[pred];
        succs.erase(std::remove(succs.begin(), succs.end(), id), succs.end());
        edges_.erase({pred, id});
    }
    adj_list_.erase(id);
    reverse_adj_.erase(id);
    tasks_.erase(id);
    return {};
}

Result<void> ExecutionGraph::freeze() {
    if (frozen_) return {};
    if (has_cycle()) {
        return Error{ErrorCode::CycleDetected, "Cannot freeze a graph containing a cycle"};
    }
    frozen_ = true;
    return {};
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> ExecutionGraph::topological_order() const {
    std::unordered_map<TaskId, size_t> in_degree;
    std::set<FrontierKey> frontier;

    for (const auto& [id, task] : tasks_) {
        auto deg = reverse_adj_.at(id).size();
        in_degree[id] = deg;
        if (deg == 0) frontier.insert(frontier_key(task));
    }

    std::vector<TaskId> order;
    order.reserve(tasks_.size());

    while (!frontier.empty()) {
        auto current = frontier.begin()->second;
        frontier.erase(frontier.begin());
        order.push_back(current);

        for (const auto& next : adj_list_.at(current)) {
            if (--in_degree[next] == 0) {
                frontier.insert(frontier_key(tasks_.at(next)));
            }
        }
    }

    return order;
}

bool ExecutionGraph::has_cycle() const {
    return topological_order().size() != tasks_.size();
}

std::vector<TaskId> ExecutionGraph::cycle_members() const {
    auto order = topological_order();
    std::unordered_set<TaskId> placed(order.begin(), order.end());
    std::vector<TaskId> members;
    for (const auto& [id, _] : tasks_) {
        if (!placed.contains(id)) members.push_back(id);
    }
    return members;
}

// ─────────────────────────────────────────────
// Phases and Critical Path
// ─────────────────────────────────────────────

std::vector<std::vector<TaskId>> ExecutionGraph::compute_phases() const {
    auto topo = topological_order();
    if (topo.size() != tasks_.size()) return {};

    // level = longest edge-count path from any source
    std::unordered_map<TaskId, size_t> level;
    size_t max_level = 0;
    for (const auto& id : topo) {
        size_t lvl = 0;
        for (const auto& pred : reverse_adj_.at(id)) {
            lvl = std::max(lvl, level[pred] + 1);
        }
        level[id] = lvl;
        max_level = std::max(max_level, lvl);
    }

    std::vector<std::vector<TaskId>> phases(topo.empty() ? 0 : max_level + 1);
    for (const auto& id : topo) {
        phases[level[id]].push_back(id);
    }
    for (auto& phase : phases) {
        sort_by_priority(phase, tasks_);
    }
    return phases;
}

CriticalPath ExecutionGraph::critical_path() const {
    CriticalPath result;
    auto topo = topological_order();
    if (topo.empty() || topo.size() != tasks_.size()) return result;

    // dist[v] = heaviest path ending at v, inclusive of v's own duration
    std::unordered_map<TaskId, int64_t> dist;
    std::unordered_map<TaskId, TaskId> best_pred;

    for (const auto& v : topo) {
        int64_t best = 0;
        const TaskId* via = nullptr;
        for (const auto& u : reverse_adj_.at(v)) {
            if (dist[u] > best || (dist[u] == best && via != nullptr && u < *via)) {
                best = dist[u];
                via = &u;
            }
        }
        dist[v] = best + estimated_duration(tasks_.at(v)).count();
        if (via != nullptr) best_pred[v] = *via;
    }

    const TaskId* end = nullptr;
    for (const auto& id : topo) {
        if (end == nullptr || dist[id] > dist[*end]) end = &id;
    }

    result.length = Duration{dist[*end]};
    for (TaskId cursor = *end;;) {
        result.tasks.push_back(cursor);
        auto it = best_pred.find(cursor);
        if (it == best_pred.end()) break;
        cursor = it->second;
    }
    std::reverse(result.tasks.begin(), result.tasks.end());
    return result;
}

// ─────────────────────────────────────────────
// Ready Tasks
// ─────────────────────────────────────────────

std::vector<TaskId> ExecutionGraph::ready_tasks(const TaskStatusMap& statuses) const {
    auto status_of = [&](const TaskId& id) {
        auto it = statuses.find(id);
        return it == statuses.end() ? TaskStatus::Pending : it->second;
    };

    std::vector<TaskId> ready;
    for (const auto& [id, task] : tasks_) {
        auto status = status_of(id);
        if (status != TaskStatus::Pending && status != TaskStatus::Ready) continue;
        if (skipped_.contains(id)) continue;

        bool all_deps_met = true;
        for (const auto& dep : reverse_adj_.at(id)) {
            auto dep_status = status_of(dep);
            bool satisfied = dep_status == TaskStatus::Completed
                || (dep_status == TaskStatus::Failed && tasks_.at(dep).best_effort);
            if (!satisfied) {
                all_deps_met = false;
                break;
            }
        }
        if (all_deps_met) ready.push_back(id);
    }

    sort_by_priority(ready, tasks_);
    return ready;
}

// ─────────────────────────────────────────────
// Skip Propagation
// ─────────────────────────────────────────────

std::vector<TaskId> ExecutionGraph::propagate_skip(const TaskId& failed) {
    std::vector<TaskId> newly_skipped;
    for (const auto& id : descendants(failed)) {
        if (skipped_.emplace(id, failed).second) {
            newly_skipped.push_back(id);
        }
    }
    return newly_skipped;
}

bool ExecutionGraph::is_skipped(const TaskId& id) const {
    return skipped_.contains(id);
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

bool ExecutionGraph::contains(const TaskId& id) const {
    return tasks_.contains(id);
}

const Task* ExecutionGraph::find_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

std::vector<Task> ExecutionGraph::tasks() const {
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) {
        out.push_back(task);
    }
    return out;
}

std::vector<Edge> ExecutionGraph::edges() const {
    std::vector<Edge> out;
    out.reserve(edges_.size());
    for (const auto& [key, edge] : edges_) {
        out.push_back(edge);
    }
    return out;
}

std::vector<TaskId> ExecutionGraph::predecessors(const TaskId& id) const {
    auto it = reverse_adj_.find(id);
    if (it == reverse_adj_.end()) return {};
    auto out = it->second;
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<TaskId> ExecutionGraph::successors(const TaskId& id) const {
    auto it = adj_list_.find(id);
    if (it == adj_list_.end()) return {};
    auto out = it->second;
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<TaskId> ExecutionGraph::descendants(const TaskId& id) const {
    if (!tasks_.contains(id)) return {};

    std::unordered_set<TaskId> seen;
    std::deque<TaskId> queue{id};
    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();
        for (const auto& next : adj_list_.at(current)) {
            if (seen.insert(next).second) queue.push_back(next);
        }
    }

    std::vector<TaskId> out;
    for (const auto& candidate : topological_order()) {
        if (seen.contains(candidate)) out.push_back(candidate);
    }
    return out;
}

// ─────────────────────────────────────────────
// Analysis
// ─────────────────────────────────────────────

GraphStats ExecutionGraph::stats() const {
    GraphStats s;
    s.task_count = tasks_.size();
    s.edge_count = edges_.size();

    auto phases = compute_phases();
    s.phase_count = phases.size();

    int64_t sequential = 0;
    for (const auto& [id, task] : tasks_) {
        sequential += estimated_duration(task).count();
    }

    int64_t parallel = 0;
    size_t total_in_phases = 0;
    for (const auto& phase : phases) {
        s.max_parallelism = std::max(s.max_parallelism, phase.size());
        total_in_phases += phase.size();
        int64_t longest = 0;
        for (const auto& id : phase) {
            longest = std::max(longest, estimated_duration(tasks_.at(id)).count());
        }
        parallel += longest;
    }

    s.avg_parallelism = phases.empty() ? 0.0
        : static_cast<double>(total_in_phases) / static_cast<double>(phases.size());
    s.sequential_duration = Duration{sequential};
    s.parallel_duration = Duration{parallel};
    s.critical_duration = critical_path().length;
    s.parallel_efficiency = sequential > 0
        ? static_cast<double>(sequential - parallel) / static_cast<double>(sequential)
        : 0.0;
    return s;
}

Duration ExecutionGraph::estimate_makespan(uint32_t max_agents) const {
    size_t width = max_agents == 0 ? 1 : max_agents;
    int64_t total = 0;

    for (const auto& phase : compute_phases()) {
        for (size_t start = 0; start < phase.size(); start += width) {
            int64_t batch = 0;
            auto stop = std::min(phase.size(), start + width);
            for (size_t i = start; i < stop; ++i) {
                batch = std::max(batch, estimated_duration(tasks_.at(phase[i])).count());
            }
            total += batch;
        }
    }
    return Duration{total};
}

std::map<TaskType, size_t> ExecutionGraph::resource_requirements() const {
    std::map<TaskType, size_t> peak;
    for (const auto& phase : compute_phases()) {
        std::map<TaskType, size_t> demand;
        for (const auto& id : phase) {
            ++demand[tasks_.at(id).type];
        }
        for (const auto& [type, count] : demand) {
            peak[type] = std::max(peak[type], count);
        }
    }
    return peak;
}

GraphSnapshot ExecutionGraph::snapshot() const {
    GraphSnapshot snap;
    snap.tasks = tasks();
    snap.edges = edges();
    snap.frozen = frozen_;
    snap.skipped = skipped_;
    return snap;
}

}  // namespace task_dispatch
