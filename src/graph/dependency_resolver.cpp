/**
 * @file dependency_resolver.cpp
 * @brief DependencyResolver implementation.
 * @author TaskDispatch contributors
 *
 * Every stage operates on edge lists sorted by (from, to) and iterates nodes
 * in lexicographic order, so identical inputs always give identical output.
 */

#include "graph/dependency_resolver.hpp"

#include "core/serialization.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <stack>
#include <tuple>

namespace task_dispatch {

namespace {

using EdgeKey = std::pair<TaskId, TaskId>;

int kind_rank(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::Data:     return 3;
        case DependencyKind::Logical:  return 2;
        case DependencyKind::Resource: return 1;
    }
    return 0;
}

/// True when `a` should win over `b` for the same (from, to) pair.
bool outranks(const Edge& a, const Edge& b) {
    auto rank = [](const Edge& e) {
        return std::make_tuple(e.provenance == Provenance::Rule ? 1 : 0,
                               kind_rank(e.kind), e.confidence);
    };
    return rank(a) > rank(b);
}

/// Cycle-breaking victim order: model edges first, then lower confidence,
/// then the lexicographically larger pair.
bool weaker(const Edge& a, const Edge& b) {
    if (a.provenance != b.provenance) return a.provenance == Provenance::Model;
    if (a.confidence != b.confidence) return a.confidence < b.confidence;
    return std::tie(a.from, a.to) > std::tie(b.from, b.to);
}

std::string describe(const Edge& e) {
    std::ostringstream oss;
    oss << e.from << " -> " << e.to << " (" << to_string(e.kind) << ", "
        << to_string(e.provenance) << ", confidence " << e.confidence;
    if (!e.reason.empty()) oss << ", " << e.reason;
    oss << ")";
    return oss.str();
}

/// Indices of the edges forming one cycle, or empty if the edge set is acyclic.
std::vector<size_t> find_cycle(const std::vector<Edge>& edges) {
    std::map<TaskId, std::vector<size_t>> out;
    for (size_t i = 0; i < edges.size(); ++i) {
        out[edges[i].from].push_back(i);
        out[edges[i].to];
    }

    enum class Color : uint8_t { White, Gray, Black };
    std::map<TaskId, Color> color;
    for (const auto& [node, _] : out) color[node] = Color::White;

    struct Frame {
        TaskId node;
        size_t next;
        size_t via;   // edge index used to enter; npos for roots
    };

    for (const auto& [root, _] : out) {
        if (color[root] != Color::White) continue;

        std::vector<Frame> stack;
        stack.push_back({root, 0, std::string::npos});
        color[root] = Color::Gray;

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& succ = out[frame.node];
            if (frame.next >= succ.size()) {
                color[frame.node] = Color::Black;
                stack.pop_back();
                continue;
            }

            size_t edge_idx = succ[frame.next++];
            const auto& target = edges[edge_idx].to;

            if (color[target] == Color::Gray) {
                std::vector<size_t> cycle{edge_idx};
                for (auto it = stack.rbegin(); it != stack.rend() && it->node != target; ++it) {
                    cycle.push_back(it->via);
                }
                return cycle;
            }
            if (color[target] == Color::White) {
                color[target] = Color::Gray;
                stack.push_back({target, 0, edge_idx});
            }
        }
    }
    return {};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

DependencyResolver::DependencyResolver(const ResolverConfig& config,
                                       Logger& logger,
                                       const RuleRegistry& registry,
                                       std::shared_ptr<ILanguageModelClient> client)
    : config_(config), log_(logger, "resolver") {
    auto loaded = registry.load(config_.rules, log_);
    rules_ = std::move(loaded.products);
    load_failures_ = std::move(loaded.failures);

    if (client && config_.model_refinement) {
        client_ = std::make_shared<TimedModelClient>(std::move(client));
    }
}

// ─────────────────────────────────────────────
// Resolve
// ─────────────────────────────────────────────

Result<Resolution> DependencyResolver::resolve(const std::vector<Task>& tasks) const {
    std::set<TaskId> ids;
    for (const auto& task : tasks) {
        if (task.id.empty()) {
            return Error{ErrorCode::InvalidArgument, "Task with empty id"};
        }
        if (!ids.insert(task.id).second) {
            return Error{ErrorCode::InvalidArgument, "Duplicate task id: " + task.id};
        }
    }

    Resolution resolution;

    std::vector<Edge> rule_edges;
    for (const auto& rule : rules_) {
        auto derived = rule->derive(tasks);
        log_.debug(std::string{rule->name()} + " proposed " + std::to_string(derived.size()) + " edges");
        rule_edges.insert(rule_edges.end(), derived.begin(), derived.end());
        resolution.rules_applied.emplace_back(rule->name());
    }

    auto merged = rule_edges;
    if (client_) {
        if (tasks.size() > config_.max_model_tasks) {
            log_.info("Skipping model refinement for " + std::to_string(tasks.size())
                      + " tasks (limit " + std::to_string(config_.max_model_tasks) + ")");
        } else {
            auto model_edges = refine_with_model(tasks, rule_edges, resolution.removed);
            resolution.model_refined = true;
            merged.insert(merged.end(), model_edges.begin(), model_edges.end());
        }
    }

    auto unique = deduplicate(std::move(merged));
    auto acyclic = break_cycles(std::move(unique), resolution.removed, log_);
    resolution.edges = transitive_reduction(std::move(acyclic), resolution.removed);

    log_.info("Resolved " + std::to_string(resolution.edges.size()) + " edges for "
              + std::to_string(tasks.size()) + " tasks (" + std::to_string(resolution.removed.size())
              + " removed)");
    return resolution;
}

// ─────────────────────────────────────────────
// Model refinement
// ─────────────────────────────────────────────

std::string DependencyResolver::build_prompt(const std::vector<Task>& tasks) const {
    std::ostringstream oss;
    oss << "Identify the dependencies between these software development tasks.\n\nTASKS:\n";
    for (size_t i = 0; i < tasks.size(); ++i) {
        oss << i + 1 << ". " << tasks[i].id << ": " << tasks[i].description
            << " (type: " << to_string(tasks[i].type) << ")\n";
    }
    oss << "\nOnly include essential dependencies; unnecessary ones reduce parallelism.\n"
        << "Types: data (output feeds input), logical (must finish first), "
        << "resource (cannot run simultaneously).\n\n"
        << "Respond with JSON only:\n"
        << R"({"dependencies": [{"source_task_id": "...", "target_task_id": "...", )"
        << R"("dependency_type": "data|logical|resource", "description": "...", )"
        << R"("confidence": 0.0}]})" << '\n';
    return oss.str();
}

Result<std::vector<Edge>> DependencyResolver::parse_model_edges(std::string_view response,
                                                                const std::vector<Task>& tasks) const {
    auto doc = extract_json_object(response);
    if (!doc) return doc.error();

    auto deps = doc->find("dependencies");
    if (deps == doc->end() || !deps->is_array()) {
        return Error{ErrorCode::ExternalService, "Model response has no dependencies array"};
    }

    std::set<TaskId> ids;
    for (const auto& t : tasks) ids.insert(t.id);

    std::vector<Edge> edges;
    for (const auto& entry : *deps) {
        if (!entry.is_object()) continue;
        try {
            Edge edge;
            edge.from = entry.value("source_task_id", std::string{});
            edge.to = entry.value("target_task_id", std::string{});
            if (!ids.contains(edge.from) || !ids.contains(edge.to) || edge.from == edge.to) {
                log_.debug("Ignoring model edge with unknown endpoints: " + edge.from + " -> " + edge.to);
                continue;
            }
            auto kind = parse_dependency_kind(entry.value("dependency_type", std::string{"logical"}));
            if (!kind) continue;
            edge.kind = *kind;
            edge.confidence = std::clamp(entry.value("confidence", 0.5), 0.0, 1.0);
            edge.provenance = Provenance::Model;
            edge.reason = entry.value("description", std::string{"model suggestion"});
            edges.push_back(std::move(edge));
        } catch (const Json::exception& e) {
            log_.debug(std::string{"Ignoring malformed model edge: "} + e.what());
        }
    }
    return edges;
}

std::vector<Edge> DependencyResolver::refine_with_model(const std::vector<Task>& tasks,
                                                        const std::vector<Edge>& rule_edges,
                                                        std::vector<RemovedEdge>& removed) const {
    LanguageModelRequest request;
    request.prompt = build_prompt(tasks);
    request.max_tokens = 3000;
    request.temperature = 0.1;

    auto response = client_->generate(request);
    if (!response) {
        log_.warn("Model refinement failed, keeping rule edges only: " + response.error().message);
        return {};
    }

    auto proposed = parse_model_edges(*response, tasks);
    if (!proposed) {
        log_.warn("Model refinement unusable, keeping rule edges only: " + proposed.error().message);
        return {};
    }

    std::set<EdgeKey> rule_pairs;
    for (const auto& e : rule_edges) rule_pairs.emplace(e.from, e.to);

    std::vector<Edge> accepted;
    for (auto& edge : *proposed) {
        if (edge.confidence < config_.confidence_threshold) {
            removed.push_back({edge, "below_threshold"});
            continue;
        }
        if (rule_pairs.contains({edge.to, edge.from})) {
            log_.info("Model edge contradicts a rule edge, dropped: " + describe(edge));
            removed.push_back({edge, "contradicts_rule"});
            continue;
        }
        accepted.push_back(std::move(edge));
    }
    return accepted;
}

// ─────────────────────────────────────────────
// Merge / Cycle breaking / Reduction
// ─────────────────────────────────────────────

std::vector<Edge> DependencyResolver::deduplicate(std::vector<Edge> edges) {
    std::map<EdgeKey, Edge> best;
    for (auto& edge : edges) {
        if (edge.from == edge.to) continue;
        EdgeKey key{edge.from, edge.to};
        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(std::move(key), std::move(edge));
        } else if (outranks(edge, it->second)) {
            it->second = std::move(edge);
        }
    }

    std::vector<Edge> out;
    out.reserve(best.size());
    for (auto& [key, edge] : best) out.push_back(std::move(edge));
    return out;
}

std::vector<Edge> DependencyResolver::break_cycles(std::vector<Edge> edges,
                                                   std::vector<RemovedEdge>& removed,
                                                   const ComponentLogger& log) {
    for (auto cycle = find_cycle(edges); !cycle.empty(); cycle = find_cycle(edges)) {
        size_t victim = cycle.front();
        for (size_t idx : cycle) {
            if (weaker(edges[idx], edges[victim])) victim = idx;
        }

        log.warn("Breaking dependency cycle by removing " + describe(edges[victim]));
        removed.push_back({edges[victim], "cycle"});
        edges.erase(edges.begin() + static_cast<std::ptrdiff_t>(victim));
    }
    return edges;
}

std::vector<Edge> DependencyResolver::transitive_reduction(std::vector<Edge> edges,
                                                           std::vector<RemovedEdge>& removed) {
    std::map<TaskId, std::set<TaskId>> succ;
    for (const auto& e : edges) succ[e.from].insert(e.to);

    auto reachable_from = [&](const TaskId& start) {
        std::set<TaskId> seen;
        std::stack<TaskId> pending;
        pending.push(start);
        while (!pending.empty()) {
            auto node = pending.top();
            pending.pop();
            auto it = succ.find(node);
            if (it == succ.end()) continue;
            for (const auto& next : it->second) {
                if (seen.insert(next).second) pending.push(next);
            }
        }
        return seen;
    };

    std::set<EdgeKey> redundant;
    for (const auto& [u, direct] : succ) {
        std::set<TaskId> indirect;
        for (const auto& s : direct) {
            auto r = reachable_from(s);
            indirect.insert(r.begin(), r.end());
        }
        for (const auto& v : direct) {
            if (indirect.contains(v)) redundant.emplace(u, v);
        }
    }

    std::vector<Edge> kept;
    kept.reserve(edges.size());
    for (auto& e : edges) {
        if (redundant.contains({e.from, e.to})) {
            removed.push_back({e, "transitive"});
        } else {
            kept.push_back(std::move(e));
        }
    }
    return kept;
}

}  // namespace task_dispatch
