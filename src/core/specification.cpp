/**
 * @file specification.cpp
 * @brief Specification helpers and JSON mapping.
 * @author TaskDispatch contributors
 */

#include "core/specification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace task_dispatch {

namespace {

bool blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool all_blank(const std::vector<std::string>& items) {
    return std::all_of(items.begin(), items.end(), blank);
}

}  // anonymous namespace

bool Specification::is_blank() const {
    return blank(title) && blank(description) && all_blank(requirements) && all_blank(constraints);
}

std::string Specification::full_text() const {
    std::ostringstream oss;
    oss << title << '\n' << description << '\n';
    for (const auto& r : requirements) oss << r << '\n';
    for (const auto& c : constraints) oss << c << '\n';
    for (const auto& s : success_criteria) oss << s << '\n';
    return oss.str();
}

void to_json(Json& j, const Specification& spec) {
    j = Json{
        {"id", spec.id},
        {"title", spec.title},
        {"description", spec.description},
        {"requirements", spec.requirements},
        {"constraints", spec.constraints},
        {"success_criteria", spec.success_criteria}
    };
}

void from_json(const Json& j, Specification& spec) {
    if (!j.is_object()) {
        throw std::invalid_argument("specification must be a JSON object");
    }
    spec.id = j.value("id", std::string{});
    spec.title = j.value("title", std::string{});
    spec.description = j.value("description", std::string{});
    spec.requirements = j.value("requirements", std::vector<std::string>{});
    spec.constraints = j.value("constraints", std::vector<std::string>{});
    spec.success_criteria = j.value("success_criteria", std::vector<std::string>{});
}

Result<Specification> load_specification(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error{ErrorCode::Io, "Cannot open specification file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parse_json(buffer.str(), ErrorCode::DecompositionError);
    if (!parsed) return parsed.error();
    return decode<Specification>(*parsed, ErrorCode::DecompositionError);
}

}  // namespace task_dispatch
