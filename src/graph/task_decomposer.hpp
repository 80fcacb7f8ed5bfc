/**
 * @file task_decomposer.hpp
 * @brief Specification → atomic task list.
 * @author TaskDispatch contributors
 *
 * Two strategies: a deterministic keyword/archetype decomposer and a
 * model-assisted one. The model path is tried first when configured, and any
 * failure (call error, timeout, malformed or empty output) falls back to the
 * deterministic path.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/specification.hpp"
#include "core/types.hpp"
#include "llm/language_model.hpp"

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace task_dispatch {

/**
 * @brief Keyword profile of a specification, driving archetype selection.
 */
struct SpecAnalysis {
    double complexity_score = 3.0;    ///< 1-10 scale
    bool has_ui = false;
    bool has_backend = false;
    bool has_data = false;
    bool has_integrations = false;
    bool needs_testing = false;
    bool needs_integration_tests = false;
    bool needs_e2e_tests = false;
    std::set<std::string> domains;

    [[nodiscard]] bool any_archetype() const noexcept {
        return has_ui || has_backend || has_data || has_integrations;
    }
};

/// Lower-cased alphanumeric word tokens of `text`.
[[nodiscard]] std::set<std::string> tokenize(std::string_view text);

/// True when `text` contains a letter or digit; any non-ASCII character counts.
[[nodiscard]] bool has_words(std::string_view text);

[[nodiscard]] SpecAnalysis analyze_specification(const Specification& spec);

/**
 * @brief Deterministic archetype-based decomposer. Never returns an empty list.
 */
class PatternDecomposer {
public:
    [[nodiscard]] std::vector<Task> decompose(const Specification& spec) const;
    [[nodiscard]] std::vector<Task> decompose(const Specification& spec,
                                              const SpecAnalysis& analysis) const;
};

/**
 * @brief Model-assisted decomposer speaking the `{"tasks": [...]}` contract.
 */
class ModelDecomposer {
public:
    ModelDecomposer(std::shared_ptr<ILanguageModelClient> client,
                    const DecomposerConfig& config,
                    ComponentLogger logger);

    [[nodiscard]] Result<std::vector<Task>> decompose(const Specification& spec,
                                                      const SpecAnalysis& analysis) const;

    [[nodiscard]] std::string build_prompt(const Specification& spec,
                                           const SpecAnalysis& analysis) const;

    /// Parse a raw completion; entries that fail validation are skipped.
    [[nodiscard]] Result<std::vector<Task>> parse_response(std::string_view response) const;

private:
    std::shared_ptr<ILanguageModelClient> client_;
    DecomposerConfig config_;
    ComponentLogger log_;
};

struct Decomposition {
    std::vector<Task> tasks;
    std::string strategy;          ///< "model" or "pattern"
    std::string fallback_reason;   ///< Why the model path was abandoned, if it was
};

/**
 * @brief Front door: strategy selection, fallback and output validation.
 */
class TaskDecomposer {
public:
    /// `client` may be null; decomposition is then purely deterministic.
    TaskDecomposer(const DecomposerConfig& config,
                   Logger& logger,
                   std::shared_ptr<ILanguageModelClient> client = nullptr);

    /**
     * @return DecompositionError for a blank specification or when no valid
     *         task survives validation.
     */
    [[nodiscard]] Result<Decomposition> decompose(const Specification& spec) const;

private:
    [[nodiscard]] Result<std::vector<Task>> validate_and_refine(std::vector<Task> tasks,
                                                                const Specification& spec) const;

    DecomposerConfig config_;
    ComponentLogger log_;
    PatternDecomposer pattern_;
    std::unique_ptr<ModelDecomposer> model_;
};

/// Per-type complexity adjustment, clamped to [1, 5].
[[nodiscard]] double refine_complexity(TaskType type, double complexity) noexcept;

}  // namespace task_dispatch
