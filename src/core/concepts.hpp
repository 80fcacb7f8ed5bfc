/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for task_dispatch plug-in points.
 * @author Dimitris Kafetzis
 *
 * Pluggable components (dependency rules, agent blueprints) are registered by
 * name and built by factories. These concepts pin down what a registrable
 * product and a typed agent behavior must provide.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace task_dispatch {

// ─────────────────────────────────────────────
// NamedPlugin
// ─────────────────────────────────────────────

/**
 * @concept NamedPlugin
 * @brief Anything a PluginRegistry can hold: it must report its own name.
 */
template <typename T>
concept NamedPlugin = requires(const T& plugin) {
    { plugin.name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// AgentBehaviorLike
// ─────────────────────────────────────────────

/// Artifacts produced by one task execution, keyed by artifact name.
using ArtifactMap = std::map<std::string, std::string>;

/**
 * @concept AgentBehaviorLike
 * @brief Constrains typed agent behaviors that can be wrapped into blueprints.
 *
 * A behavior declares its capability set statically and executes one task
 * given resolved input artifacts, honoring the stop token for cooperative
 * cancellation.
 */
template <typename T>
concept AgentBehaviorLike = requires(
    T behavior,
    const Task& task,
    const ArtifactMap& inputs,
    std::stop_token stop
) {
    { T::blueprint_name() } -> std::convertible_to<std::string_view>;
    { T::capabilities() } -> std::convertible_to<std::vector<TaskType>>;
    { behavior.execute(task, inputs, stop) } -> std::same_as<Result<ArtifactMap>>;
};

}  // namespace task_dispatch
