/**
 * @file dependency_rules.hpp
 * @brief Rule layer of the dependency resolver.
 * @author TaskDispatch contributors
 *
 * Each rule inspects the whole task list and proposes edges. Rules are
 * looked up by name in a RuleRegistry so the enabled set comes from config.
 */

#pragma once

#include "core/registry.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace task_dispatch {

// ─────────────────────────────────────────────
// IDependencyRule (Virtual — pluggable)
// ─────────────────────────────────────────────

class IDependencyRule {
public:
    virtual ~IDependencyRule() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    /// Edges implied by this rule; all carry Provenance::Rule.
    [[nodiscard]] virtual std::vector<Edge> derive(const std::vector<Task>& tasks) const = 0;
};

using RuleRegistry = PluginRegistry<IDependencyRule>;

/// Registers the built-in rules under their canonical names.
Result<void> register_builtin_rules(RuleRegistry& registry);

/// Subject a task works on: its "subject" context entry, else a keyword guess.
[[nodiscard]] std::string task_subject(const Task& task);

// ─────────────────────────────────────────────
// Built-in rules
// ─────────────────────────────────────────────

/**
 * @brief B consumes an artifact A produces ⇒ A→B (data, confidence 1.0).
 */
class ArtifactMatchRule : public IDependencyRule {
public:
    [[nodiscard]] std::string_view name() const override { return "artifact_match"; }
    [[nodiscard]] std::vector<Edge> derive(const std::vector<Task>& tasks) const override;
};

/**
 * @brief Capability precedence (research before code-writing, code before
 *        testing, ...) between tasks on compatible subjects.
 */
class TypeOrderingRule : public IDependencyRule {
public:
    TypeOrderingRule();

    [[nodiscard]] std::string_view name() const override { return "type_ordering"; }
    [[nodiscard]] std::vector<Edge> derive(const std::vector<Task>& tasks) const override;

    [[nodiscard]] const std::map<std::pair<TaskType, TaskType>, double>& matrix() const noexcept {
        return precedence_;
    }

private:
    std::map<std::pair<TaskType, TaskType>, double> precedence_;
};

/**
 * @brief Tasks writing the same artifact are serialized in list order.
 */
class ResourceContentionRule : public IDependencyRule {
public:
    [[nodiscard]] std::string_view name() const override { return "resource_contention"; }
    [[nodiscard]] std::vector<Edge> derive(const std::vector<Task>& tasks) const override;
};

/**
 * @brief Description keyword pairs (design → implement, implement → test, ...).
 */
class KeywordPrecedenceRule : public IDependencyRule {
public:
    struct Pattern {
        std::string name;
        std::regex source;
        std::regex target;
        DependencyKind kind;
        double confidence;
    };

    KeywordPrecedenceRule();

    [[nodiscard]] std::string_view name() const override { return "keyword_precedence"; }
    [[nodiscard]] std::vector<Edge> derive(const std::vector<Task>& tasks) const override;

private:
    std::vector<Pattern> patterns_;
};

}  // namespace task_dispatch
