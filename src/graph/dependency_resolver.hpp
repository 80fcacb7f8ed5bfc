/**
 * @file dependency_resolver.hpp
 * @brief Task list → minimal acyclic dependency edge set.
 * @author TaskDispatch contributors
 *
 * Pipeline: rule layer → optional model refinement → merge/dedup →
 * cycle breaking → transitive reduction. Rule edges are authoritative; the
 * model can only add edges at or above the confidence threshold.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/dependency_rules.hpp"
#include "llm/language_model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace task_dispatch {

/// An edge dropped during resolution, kept for the audit trail.
struct RemovedEdge {
    Edge edge;
    std::string reason;   ///< "cycle", "transitive", "below_threshold", "contradicts_rule"
};

struct Resolution {
    std::vector<Edge> edges;            ///< Sorted by (from, to)
    std::vector<RemovedEdge> removed;
    bool model_refined = false;
    std::vector<std::string> rules_applied;
};

class DependencyResolver {
public:
    /// Loads `config.rules` from `registry`; rules that fail to load are logged and excluded.
    DependencyResolver(const ResolverConfig& config,
                       Logger& logger,
                       const RuleRegistry& registry,
                       std::shared_ptr<ILanguageModelClient> client = nullptr);

    /**
     * @return InvalidArgument on duplicate or empty task ids.
     */
    [[nodiscard]] Result<Resolution> resolve(const std::vector<Task>& tasks) const;

    [[nodiscard]] const std::vector<PluginLoadFailure>& load_failures() const noexcept {
        return load_failures_;
    }

    // ── Building blocks (exposed for tests) ───

    /// One edge per (from, to): rule over model, then data > logical > resource, then confidence.
    [[nodiscard]] static std::vector<Edge> deduplicate(std::vector<Edge> edges);

    /// Repeatedly drop the lowest-confidence edge on some cycle until acyclic.
    [[nodiscard]] static std::vector<Edge> break_cycles(std::vector<Edge> edges,
                                                        std::vector<RemovedEdge>& removed,
                                                        const ComponentLogger& log);

    /// Drop u→w whenever w is reachable from u through another path. Input must be acyclic.
    [[nodiscard]] static std::vector<Edge> transitive_reduction(std::vector<Edge> edges,
                                                                std::vector<RemovedEdge>& removed);

    [[nodiscard]] std::string build_prompt(const std::vector<Task>& tasks) const;
    [[nodiscard]] Result<std::vector<Edge>> parse_model_edges(std::string_view response,
                                                              const std::vector<Task>& tasks) const;

private:
    [[nodiscard]] std::vector<Edge> refine_with_model(const std::vector<Task>& tasks,
                                                      const std::vector<Edge>& rule_edges,
                                                      std::vector<RemovedEdge>& removed) const;

    ResolverConfig config_;
    ComponentLogger log_;
    std::vector<std::unique_ptr<IDependencyRule>> rules_;
    std::vector<PluginLoadFailure> load_failures_;
    std::shared_ptr<ILanguageModelClient> client_;
};

}  // namespace task_dispatch
