/**
 * @file serialization.hpp
 * @brief JSON encoding of core value types via nlohmann/json.
 * @author TaskDispatch contributors
 *
 * to_json/from_json overloads live in the task_dispatch namespace so
 * nlohmann finds them by ADL. Enums travel as their snake_case names.
 * Unknown enum names throw std::invalid_argument; the decoding helpers wrap
 * that and nlohmann's own exceptions into Result errors.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace task_dispatch {

using Json = nlohmann::json;

// ── Enums ────────────────────────────────────
void to_json(Json& j, TaskType type);
void from_json(const Json& j, TaskType& type);
void to_json(Json& j, TaskStatus status);
void from_json(const Json& j, TaskStatus& status);
void to_json(Json& j, DependencyKind kind);
void from_json(const Json& j, DependencyKind& kind);
void to_json(Json& j, Provenance provenance);
void from_json(const Json& j, Provenance& provenance);

// ── Time ─────────────────────────────────────
/// Timestamps travel as integer milliseconds since the Unix epoch.
[[nodiscard]] int64_t to_epoch_ms(Timestamp ts) noexcept;
[[nodiscard]] Timestamp from_epoch_ms(int64_t ms) noexcept;

// ── Records ──────────────────────────────────
void to_json(Json& j, const Task& task);
void from_json(const Json& j, Task& task);
void to_json(Json& j, const Edge& edge);
void from_json(const Json& j, Edge& edge);
void to_json(Json& j, const Artifact& artifact);
void from_json(const Json& j, Artifact& artifact);

/**
 * @brief Parse JSON text, mapping parse failures to `on_error`.
 */
[[nodiscard]] Result<Json> parse_json(std::string_view text,
                                      ErrorCode on_error = ErrorCode::InvalidArgument);

/**
 * @brief Locate and parse the first JSON object embedded in free text.
 *
 * Model responses often wrap JSON in prose or code fences; this scans for
 * the outermost balanced `{...}` block.
 */
[[nodiscard]] Result<Json> extract_json_object(std::string_view text);

/**
 * @brief Convert a JSON value into T, mapping type errors to `on_error`.
 */
template <typename T>
[[nodiscard]] Result<T> decode(const Json& j, ErrorCode on_error = ErrorCode::InvalidArgument) {
    try {
        return j.get<T>();
    } catch (const std::exception& e) {
        return Error{on_error, std::string{"JSON decode failed: "} + e.what()};
    }
}

}  // namespace task_dispatch
