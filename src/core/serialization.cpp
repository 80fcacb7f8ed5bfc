/**
 * @file serialization.cpp
 * @brief JSON encoding of core value types.
 * @author TaskDispatch contributors
 */

#include "core/serialization.hpp"

#include <chrono>

namespace task_dispatch {

namespace {

template <typename Enum, typename Parser>
Enum parse_enum(const Json& j, Parser parser, std::string_view what) {
    auto text = j.get<std::string>();
    auto parsed = parser(text);
    if (!parsed) {
        throw std::invalid_argument("unknown " + std::string{what} + ": " + text);
    }
    return *parsed;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Enums
// ─────────────────────────────────────────────

void to_json(Json& j, TaskType type) { j = std::string{to_string(type)}; }
void from_json(const Json& j, TaskType& type) {
    type = parse_enum<TaskType>(j, parse_task_type, "task type");
}

void to_json(Json& j, TaskStatus status) { j = std::string{to_string(status)}; }
void from_json(const Json& j, TaskStatus& status) {
    status = parse_enum<TaskStatus>(j, parse_task_status, "task status");
}

void to_json(Json& j, DependencyKind kind) { j = std::string{to_string(kind)}; }
void from_json(const Json& j, DependencyKind& kind) {
    kind = parse_enum<DependencyKind>(j, parse_dependency_kind, "dependency kind");
}

void to_json(Json& j, Provenance provenance) { j = std::string{to_string(provenance)}; }
void from_json(const Json& j, Provenance& provenance) {
    provenance = parse_enum<Provenance>(j, parse_provenance, "provenance");
}

// ─────────────────────────────────────────────
// Time
// ─────────────────────────────────────────────

int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{ms})};
}

namespace {

Json optional_time(const std::optional<Timestamp>& ts) {
    return ts ? Json(to_epoch_ms(*ts)) : Json(nullptr);
}

std::optional<Timestamp> read_optional_time(const Json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return from_epoch_ms(j.at(key).get<int64_t>());
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

void to_json(Json& j, const Task& task) {
    j = Json{
        {"id", task.id},
        {"type", task.type},
        {"description", task.description},
        {"inputs", task.inputs},
        {"outputs", task.outputs},
        {"estimated_complexity", task.estimated_complexity},
        {"priority", task.priority},
        {"required", task.required},
        {"best_effort", task.best_effort},
        {"context", task.context},
        {"status", task.status},
        {"assigned_agent", task.assigned_agent},
        {"retry_count", task.retry_count},
        {"failure_reason", task.failure_reason},
        {"started_at", optional_time(task.started_at)},
        {"completed_at", optional_time(task.completed_at)}
    };
}

void from_json(const Json& j, Task& task) {
    j.at("id").get_to(task.id);
    j.at("type").get_to(task.type);
    j.at("description").get_to(task.description);
    task.inputs = j.value("inputs", std::vector<std::string>{});
    task.outputs = j.value("outputs", std::vector<std::string>{});
    task.estimated_complexity = j.value("estimated_complexity", 1.0);
    task.priority = j.value("priority", 0);
    task.required = j.value("required", true);
    task.best_effort = j.value("best_effort", false);
    task.context = j.value("context", std::map<std::string, std::string>{});
    task.status = j.contains("status") ? j.at("status").get<TaskStatus>() : TaskStatus::Pending;
    task.assigned_agent = j.value("assigned_agent", std::string{});
    task.retry_count = j.value("retry_count", uint32_t{0});
    task.failure_reason = j.value("failure_reason", std::string{});
    task.started_at = read_optional_time(j, "started_at");
    task.completed_at = read_optional_time(j, "completed_at");
}

// ─────────────────────────────────────────────
// Edge / Artifact
// ─────────────────────────────────────────────

void to_json(Json& j, const Edge& edge) {
    j = Json{
        {"from", edge.from},
        {"to", edge.to},
        {"kind", edge.kind},
        {"confidence", edge.confidence},
        {"provenance", edge.provenance},
        {"reason", edge.reason}
    };
}

void from_json(const Json& j, Edge& edge) {
    j.at("from").get_to(edge.from);
    j.at("to").get_to(edge.to);
    edge.kind = j.contains("kind") ? j.at("kind").get<DependencyKind>() : DependencyKind::Logical;
    edge.confidence = j.value("confidence", 1.0);
    edge.provenance = j.contains("provenance") ? j.at("provenance").get<Provenance>() : Provenance::Rule;
    edge.reason = j.value("reason", std::string{});
}

void to_json(Json& j, const Artifact& artifact) {
    j = Json{
        {"name", artifact.name},
        {"content", artifact.content},
        {"producer", artifact.producer},
        {"placeholder", artifact.placeholder}
    };
}

void from_json(const Json& j, Artifact& artifact) {
    j.at("name").get_to(artifact.name);
    artifact.content = j.value("content", std::string{});
    artifact.producer = j.value("producer", std::string{});
    artifact.placeholder = j.value("placeholder", false);
}

// ─────────────────────────────────────────────
// Parsing helpers
// ─────────────────────────────────────────────

Result<Json> parse_json(std::string_view text, ErrorCode on_error) {
    auto parsed = Json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Error{on_error, "Malformed JSON"};
    }
    return parsed;
}

Result<Json> extract_json_object(std::string_view text) {
    auto start = text.find('{');
    while (start != std::string_view::npos) {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }
            if (c == '"') {
                in_string = true;
            } else if (c == '{') {
                ++depth;
            } else if (c == '}' && --depth == 0) {
                auto candidate = parse_json(text.substr(start, i - start + 1));
                if (candidate && candidate->is_object()) return candidate;
                break;
            }
        }
        start = text.find('{', start + 1);
    }
    return Error{ErrorCode::ExternalService, "No JSON object found in model response"};
}

}  // namespace task_dispatch
