/**
 * @file specification.hpp
 * @brief Finalized specification accepted as dispatch input.
 * @author TaskDispatch contributors
 */

#pragma once

#include "core/result.hpp"
#include "core/serialization.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace task_dispatch {

/**
 * @brief Input to decomposition. Only requirements/constraints are mandatory
 *        in the JSON form; everything else defaults to empty.
 */
struct Specification {
    std::string id;
    std::string title;
    std::string description;
    std::vector<std::string> requirements;
    std::vector<std::string> constraints;
    std::vector<std::string> success_criteria;

    /// True when there is nothing to decompose.
    [[nodiscard]] bool is_blank() const;

    /// All text fields joined by newlines, for keyword analysis and prompts.
    [[nodiscard]] std::string full_text() const;

    bool operator==(const Specification&) const = default;
};

void to_json(Json& j, const Specification& spec);
void from_json(const Json& j, Specification& spec);

/**
 * @brief Read a specification JSON file.
 * @return Io if unreadable, DecompositionError if the JSON does not describe
 *         a specification.
 */
Result<Specification> load_specification(const std::filesystem::path& path);

}  // namespace task_dispatch
