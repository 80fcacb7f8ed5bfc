/**
 * @file dependency_rules.cpp
 * @brief Built-in dependency rules.
 * @author TaskDispatch contributors
 */

#include "graph/dependency_rules.hpp"

#include "graph/task_decomposer.hpp"

#include <algorithm>
#include <set>

namespace task_dispatch {

namespace {

bool mentions_any(const std::set<std::string>& tokens, std::initializer_list<const char*> words) {
    return std::any_of(words.begin(), words.end(),
                       [&](const char* w) { return tokens.contains(w); });
}

/// Subject pairs that never order each other.
bool unrelated(const std::string& a, const std::string& b) {
    static const std::set<std::pair<std::string, std::string>> pairs = {
        {"frontend", "backend"}, {"backend", "frontend"},
        {"frontend", "database"}, {"database", "frontend"},
    };
    return pairs.contains({a, b});
}

bool same_subject(const Task& a, const Task& b) {
    auto sa = task_subject(a);
    auto sb = task_subject(b);
    if (sa.empty() || sb.empty() || sa == "general" || sb == "general" || sa == sb) return true;
    return !unrelated(sa, sb);
}

std::string join_words(const std::string& head, const std::vector<std::string>& tail) {
    std::string out = head;
    for (const auto& t : tail) {
        out += ' ';
        out += t;
    }
    return out;
}

}  // anonymous namespace

std::string task_subject(const Task& task) {
    if (auto it = task.context.find("subject"); it != task.context.end()) {
        return it->second;
    }
    auto tokens = tokenize(task.description);
    if (mentions_any(tokens, {"ui", "frontend", "component", "interface", "styling"})) return "frontend";
    if (mentions_any(tokens, {"api", "backend", "server", "endpoint", "service"})) return "backend";
    if (mentions_any(tokens, {"database", "schema", "data", "model", "storage"})) return "database";
    if (mentions_any(tokens, {"deploy", "deployment", "infrastructure", "hosting"})) return "deployment";
    return {};
}

Result<void> register_builtin_rules(RuleRegistry& registry) {
    std::vector<std::pair<std::string, RuleRegistry::Factory>> builtins = {
        {"artifact_match", [] { return std::make_unique<ArtifactMatchRule>(); }},
        {"type_ordering", [] { return std::make_unique<TypeOrderingRule>(); }},
        {"resource_contention", [] { return std::make_unique<ResourceContentionRule>(); }},
        {"keyword_precedence", [] { return std::make_unique<KeywordPrecedenceRule>(); }},
    };
    for (auto& [name, factory] : builtins) {
        if (auto ok = registry.register_factory(name, std::move(factory)); !ok) return ok;
    }
    return {};
}

// ─────────────────────────────────────────────
// ArtifactMatchRule
// ─────────────────────────────────────────────

std::vector<Edge> ArtifactMatchRule::derive(const std::vector<Task>& tasks) const {
    std::map<std::string, std::vector<const Task*>> producers;
    for (const auto& task : tasks) {
        for (const auto& artifact : task.outputs) {
            producers[artifact].push_back(&task);
        }
    }

    std::vector<Edge> edges;
    for (const auto& consumer : tasks) {
        for (const auto& input : consumer.inputs) {
            auto it = producers.find(input);
            if (it == producers.end()) continue;
            for (const Task* producer : it->second) {
                if (producer->id == consumer.id) continue;
                edges.push_back(Edge{
                    .from = producer->id,
                    .to = consumer.id,
                    .kind = DependencyKind::Data,
                    .confidence = 1.0,
                    .provenance = Provenance::Rule,
                    .reason = "artifact_match: " + input,
                });
            }
        }
    }
    return edges;
}

// ─────────────────────────────────────────────
// TypeOrderingRule
// ─────────────────────────────────────────────

TypeOrderingRule::TypeOrderingRule() {
    using T = TaskType;
    precedence_ = {
        {{T::Research, T::CodeWriting}, 0.8},
        {{T::Research, T::Testing}, 0.6},
        {{T::Research, T::Documentation}, 0.5},
        {{T::Analysis, T::CodeWriting}, 0.8},
        {{T::CodeWriting, T::Testing}, 0.9},
        {{T::CodeWriting, T::Review}, 0.8},
        {{T::CodeWriting, T::Documentation}, 0.7},
        {{T::CodeWriting, T::Deployment}, 0.8},
        {{T::Testing, T::Review}, 0.7},
        {{T::Testing, T::Debugging}, 0.7},
        {{T::Testing, T::Deployment}, 0.8},
    };
}

std::vector<Edge> TypeOrderingRule::derive(const std::vector<Task>& tasks) const {
    std::vector<Edge> edges;
    for (const auto& source : tasks) {
        for (const auto& target : tasks) {
            if (source.id == target.id) continue;
            auto it = precedence_.find({source.type, target.type});
            if (it == precedence_.end()) continue;
            if (!same_subject(source, target)) continue;
            edges.push_back(Edge{
                .from = source.id,
                .to = target.id,
                .kind = DependencyKind::Logical,
                .confidence = it->second,
                .provenance = Provenance::Rule,
                .reason = "type_ordering: " + std::string{to_string(source.type)}
                          + " -> " + std::string{to_string(target.type)},
            });
        }
    }
    return edges;
}

// ─────────────────────────────────────────────
// ResourceContentionRule
// ─────────────────────────────────────────────

std::vector<Edge> ResourceContentionRule::derive(const std::vector<Task>& tasks) const {
    std::map<std::string, std::vector<const Task*>> writers;
    for (const auto& task : tasks) {
        for (const auto& artifact : task.outputs) {
            writers[artifact].push_back(&task);
        }
    }

    std::vector<Edge> edges;
    for (const auto& [artifact, list] : writers) {
        // Chain consecutive writers; transitive closure serializes the rest.
        for (size_t i = 1; i < list.size(); ++i) {
            if (list[i - 1]->id == list[i]->id) continue;
            edges.push_back(Edge{
                .from = list[i - 1]->id,
                .to = list[i]->id,
                .kind = DependencyKind::Resource,
                .confidence = 0.9,
                .provenance = Provenance::Rule,
                .reason = "resource_contention: " + artifact,
            });
        }
    }
    return edges;
}

// ─────────────────────────────────────────────
// KeywordPrecedenceRule
// ─────────────────────────────────────────────

KeywordPrecedenceRule::KeywordPrecedenceRule() {
    auto icase = std::regex::ECMAScript | std::regex::icase;
    auto add = [&](const char* name, const char* src, const char* dst,
                   DependencyKind kind, double confidence) {
        patterns_.push_back(Pattern{name, std::regex(src, icase), std::regex(dst, icase),
                                    kind, confidence});
    };

    add("research_before_implementation", "research|investigate|analyze|study",
        "implement|create|build|develop", DependencyKind::Logical, 0.8);
    add("design_before_implementation", "design|architect|plan|wireframe",
        "implement|create|build|code", DependencyKind::Logical, 0.9);
    add("implementation_before_testing", "implement|create|build|develop|code",
        "test|verify|validate|check", DependencyKind::Logical, 0.9);
    add("schema_before_data_access", "schema|database.*design|table.*create",
        "data.*access|repository|dao|orm", DependencyKind::Data, 0.9);
    add("api_before_client", "api.*design|endpoint.*design|service.*interface",
        "client|frontend|ui.*integration", DependencyKind::Data, 0.8);
    add("auth_before_protected", "authentication|auth.*system|login",
        "protected|secure|authorized|user.*profile", DependencyKind::Logical, 0.8);
    add("components_before_ui", "component.*library|ui.*components|design.*system",
        "page|screen|complex.*ui|dashboard", DependencyKind::Data, 0.7);
    add("unit_before_integration_tests", "unit.*test|component.*test",
        "integration.*test|e2e.*test|system.*test", DependencyKind::Logical, 0.8);
}

std::vector<Edge> KeywordPrecedenceRule::derive(const std::vector<Task>& tasks) const {
    std::vector<std::string> source_text;
    std::vector<std::string> target_text;
    for (const auto& task : tasks) {
        source_text.push_back(join_words(task.description, task.outputs));
        target_text.push_back(join_words(task.description, task.inputs));
    }

    std::vector<Edge> edges;
    for (size_t s = 0; s < tasks.size(); ++s) {
        for (size_t t = 0; t < tasks.size(); ++t) {
            if (s == t || tasks[s].id == tasks[t].id) continue;
            for (const auto& p : patterns_) {
                if (!std::regex_search(source_text[s], p.source)) continue;
                if (!std::regex_search(target_text[t], p.target)) continue;
                edges.push_back(Edge{
                    .from = tasks[s].id,
                    .to = tasks[t].id,
                    .kind = p.kind,
                    .confidence = p.confidence,
                    .provenance = Provenance::Rule,
                    .reason = "keyword_precedence: " + p.name,
                });
            }
        }
    }
    return edges;
}

}  // namespace task_dispatch
