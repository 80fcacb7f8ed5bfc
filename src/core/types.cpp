/**
 * @file types.cpp
 * @brief Parsing helpers and the task state machine table.
 * @author TaskDispatch contributors
 */

#include "core/types.hpp"

#include <cctype>
#include <random>
#include <sstream>

namespace task_dispatch {

namespace {

std::string normalize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '-' || c == ' ') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

}  // anonymous namespace

std::optional<TaskType> parse_task_type(std::string_view text) {
    auto key = normalize(text);
    for (auto type : kAllTaskTypes) {
        if (key == to_string(type)) return type;
    }
    return std::nullopt;
}

std::optional<TaskStatus> parse_task_status(std::string_view text) {
    static constexpr TaskStatus all[] = {
        TaskStatus::Pending, TaskStatus::Ready, TaskStatus::Scheduled,
        TaskStatus::Running, TaskStatus::Completed, TaskStatus::Failed,
        TaskStatus::Cancelled, TaskStatus::Skipped
    };
    auto key = normalize(text);
    for (auto status : all) {
        if (key == to_string(status)) return status;
    }
    return std::nullopt;
}

std::optional<DependencyKind> parse_dependency_kind(std::string_view text) {
    auto key = normalize(text);
    if (key == "data") return DependencyKind::Data;
    if (key == "logical") return DependencyKind::Logical;
    if (key == "resource") return DependencyKind::Resource;
    return std::nullopt;
}

std::optional<Provenance> parse_provenance(std::string_view text) {
    auto key = normalize(text);
    if (key == "rule") return Provenance::Rule;
    if (key == "model") return Provenance::Model;
    return std::nullopt;
}

bool is_valid_transition(TaskStatus from, TaskStatus to) noexcept {
    switch (from) {
        case TaskStatus::Pending:
            return to == TaskStatus::Ready || to == TaskStatus::Cancelled
                || to == TaskStatus::Skipped;
        case TaskStatus::Ready:
            return to == TaskStatus::Scheduled || to == TaskStatus::Pending
                || to == TaskStatus::Cancelled || to == TaskStatus::Skipped
                || to == TaskStatus::Failed;
        case TaskStatus::Scheduled:
            return to == TaskStatus::Running || to == TaskStatus::Pending
                || to == TaskStatus::Cancelled || to == TaskStatus::Failed;
        case TaskStatus::Running:
            return to == TaskStatus::Completed || to == TaskStatus::Failed
                || to == TaskStatus::Cancelled || to == TaskStatus::Pending;
        case TaskStatus::Failed:
            return to == TaskStatus::Pending;
        case TaskStatus::Completed:
        case TaskStatus::Cancelled:
        case TaskStatus::Skipped:
            return false;
    }
    return false;
}

Duration estimated_duration(const Task& task) noexcept {
    auto minutes = clamp_complexity(task.estimated_complexity) * 60'000.0;
    return Duration{static_cast<int64_t>(minutes)};
}

std::string generate_id(std::string_view prefix) {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex_chars = "0123456789abcdef";

    std::ostringstream oss;
    if (!prefix.empty()) oss << prefix << '-';
    for (int i = 0; i < 32; i++) {
        if (i == 8 || i == 12 || i == 16 || i == 20) oss << '-';
        if (i == 12) {
            oss << '4';
        } else if (i == 16) {
            oss << hex_chars[(dis(gen) & 0x3) | 0x8];
        } else {
            oss << hex_chars[dis(gen)];
        }
    }
    return oss.str();
}

}  // namespace task_dispatch
