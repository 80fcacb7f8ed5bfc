/**
 * @file checkpoint_store.cpp
 * @brief Checkpoint JSON encoding and the file / memory stores.
 * @author TaskDispatch contributors
 */

#include "coordination/checkpoint_store.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace task_dispatch {

// ─────────────────────────────────────────────
// JSON encoding
// ─────────────────────────────────────────────

void to_json(Json& j, const GraphSnapshot& snapshot) {
    j = Json{
        {"tasks", snapshot.tasks},
        {"edges", snapshot.edges},
        {"frozen", snapshot.frozen},
        {"skipped", snapshot.skipped}
    };
}

void from_json(const Json& j, GraphSnapshot& snapshot) {
    j.at("tasks").get_to(snapshot.tasks);
    j.at("edges").get_to(snapshot.edges);
    snapshot.frozen = j.value("frozen", false);
    snapshot.skipped = j.value("skipped", std::map<TaskId, TaskId>{});
}

void to_json(Json& j, const Checkpoint& checkpoint) {
    Json tasks = Json::array();
    for (const auto& [_, task] : checkpoint.tasks) tasks.push_back(task);

    j = Json{
        {"format_version", 1},
        {"id", checkpoint.id},
        {"session_id", checkpoint.session_id},
        {"sequence", checkpoint.sequence},
        {"created_at", to_epoch_ms(checkpoint.created_at)},
        {"graph", checkpoint.graph},
        {"tasks", std::move(tasks)},
        {"assignments", checkpoint.assignments},
        {"artifacts", checkpoint.artifacts},
        {"reason", checkpoint.reason}
    };
}

void from_json(const Json& j, Checkpoint& checkpoint) {
    j.at("id").get_to(checkpoint.id);
    j.at("session_id").get_to(checkpoint.session_id);
    checkpoint.sequence = j.value("sequence", uint64_t{0});
    checkpoint.created_at = from_epoch_ms(j.at("created_at").get<int64_t>());
    j.at("graph").get_to(checkpoint.graph);

    checkpoint.tasks.clear();
    for (const auto& entry : j.at("tasks")) {
        auto task = entry.get<Task>();
        checkpoint.tasks.emplace(task.id, std::move(task));
    }
    checkpoint.assignments = j.value("assignments", std::map<AgentId, TaskId>{});
    checkpoint.artifacts = j.value("artifacts", std::vector<Artifact>{});
    checkpoint.reason = j.value("reason", std::string{});
}

namespace {

CheckpointInfo info_of(const Checkpoint& checkpoint) {
    return CheckpointInfo{checkpoint.id, checkpoint.session_id, checkpoint.sequence, checkpoint.created_at};
}

void sort_infos(std::vector<CheckpointInfo>& infos) {
    std::sort(infos.begin(), infos.end(), [](const CheckpointInfo& a, const CheckpointInfo& b) {
        if (a.session_id != b.session_id) return a.session_id < b.session_id;
        if (a.sequence != b.sequence) return a.sequence < b.sequence;
        return a.id < b.id;
    });
}

}  // anonymous namespace

Result<Checkpoint> ICheckpointStore::latest(const SessionId& session) const {
    auto infos = list(session);
    if (!infos) return infos.error();
    if (infos->empty()) {
        return Error{ErrorCode::NotFound, "No checkpoints for session " + session};
    }
    return load(infos->back().id);
}

// ─────────────────────────────────────────────
// FileCheckpointStore
// ─────────────────────────────────────────────

FileCheckpointStore::FileCheckpointStore(std::filesystem::path dir, size_t retention, Logger& logger)
    : dir_(std::move(dir))
    , retention_(retention)
    , log_(logger, "checkpoint_store") {}

std::filesystem::path FileCheckpointStore::path_for(const CheckpointId& id) const {
    return dir_ / (id + ".json");
}

Result<void> FileCheckpointStore::save(const Checkpoint& checkpoint) {
    if (checkpoint.id.empty() || checkpoint.id.find_first_of("/\\") != std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "Invalid checkpoint id: '" + checkpoint.id + "'"};
    }

    {
        std::lock_guard lock(mutex_);
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create " + dir_.string() + ": " + ec.message()};
        }

        auto final_path = path_for(checkpoint.id);
        auto tmp_path = final_path;
        tmp_path += ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out) return Error{ErrorCode::Io, "Cannot write " + tmp_path.string()};
            out << Json(checkpoint).dump(2);
            if (!out) return Error{ErrorCode::Io, "Short write to " + tmp_path.string()};
        }
        std::filesystem::rename(tmp_path, final_path, ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot publish " + final_path.string() + ": " + ec.message()};
        }
        index_[checkpoint.id] = info_of(checkpoint);
        unreadable_.erase(checkpoint.id);
    }

    log_.debug(std::format("Saved checkpoint {} (session {}, seq {})",
                           checkpoint.id, checkpoint.session_id, checkpoint.sequence));

    if (retention_ > 0) {
        auto pruned = prune(checkpoint.session_id, retention_);
        if (!pruned) return pruned.error();
    }
    return {};
}

Result<Checkpoint> FileCheckpointStore::load(const CheckpointId& id) const {
    std::lock_guard lock(mutex_);
    return read_file(id);
}

Result<Checkpoint> FileCheckpointStore::read_file(const CheckpointId& id) const {
    auto path = path_for(id);
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "No checkpoint " + id + " in " + dir_.string()};
    }

    std::ifstream in(path);
    if (!in) return Error{ErrorCode::Io, "Cannot read " + path.string()};
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto json = parse_json(buffer.str(), ErrorCode::CheckpointCorrupt);
    if (!json) {
        return Error{ErrorCode::CheckpointCorrupt, "Checkpoint " + id + ": " + json.error().message};
    }
    auto checkpoint = decode<Checkpoint>(*json, ErrorCode::CheckpointCorrupt);
    if (!checkpoint) {
        return Error{ErrorCode::CheckpointCorrupt, "Checkpoint " + id + ": " + checkpoint.error().message};
    }
    return checkpoint;
}

Result<void> FileCheckpointStore::refresh_index() const {
    std::set<CheckpointId> present;
    std::error_code ec;
    if (std::filesystem::exists(dir_, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
            if (entry.path().extension() == ".json") present.insert(entry.path().stem().string());
        }
        if (ec) return Error{ErrorCode::Io, "Cannot list " + dir_.string() + ": " + ec.message()};
    }

    std::erase_if(index_, [&](const auto& entry) { return !present.contains(entry.first); });
    std::erase_if(unreadable_, [&](const CheckpointId& id) { return !present.contains(id); });

    for (const auto& id : present) {
        if (index_.contains(id) || unreadable_.contains(id)) continue;
        auto checkpoint = read_file(id);
        if (!checkpoint) {
            log_.warn("Skipping unreadable checkpoint " + id + ": " + checkpoint.error().message);
            unreadable_.insert(id);
            continue;
        }
        index_.emplace(id, info_of(*checkpoint));
    }
    return {};
}

Result<std::vector<CheckpointInfo>> FileCheckpointStore::list(const SessionId& session) const {
    std::lock_guard lock(mutex_);
    auto refreshed = refresh_index();
    if (!refreshed) return refreshed.error();

    std::vector<CheckpointInfo> infos;
    for (const auto& [id, info] : index_) {
        if (session.empty() || info.session_id == session) infos.push_back(info);
    }
    sort_infos(infos);
    return infos;
}

Result<size_t> FileCheckpointStore::prune(const SessionId& session, size_t keep) {
    std::lock_guard lock(mutex_);
    auto refreshed = refresh_index();
    if (!refreshed) return refreshed.error();

    std::vector<CheckpointInfo> infos;
    for (const auto& [id, info] : index_) {
        if (info.session_id == session) infos.push_back(info);
    }
    if (infos.size() <= keep) return size_t{0};
    sort_infos(infos);

    size_t removed = 0;
    for (size_t i = 0; i + keep < infos.size(); ++i) {
        const auto& id = infos[i].id;
        std::error_code ec;
        if (std::filesystem::remove(path_for(id), ec)) ++removed;
        if (ec) return Error{ErrorCode::Io, "Cannot remove checkpoint " + id + ": " + ec.message()};
        index_.erase(id);
    }
    log_.debug(std::format("Pruned {} checkpoint(s) of session {}", removed, session));
    return removed;
}

// ─────────────────────────────────────────────
// MemoryCheckpointStore
// ─────────────────────────────────────────────

Result<void> MemoryCheckpointStore::save(const Checkpoint& checkpoint) {
    if (checkpoint.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Checkpoint id must not be empty"};
    }
    {
        std::lock_guard lock(mutex_);
        checkpoints_[checkpoint.id] = checkpoint;
    }
    if (retention_ > 0) {
        auto pruned = prune(checkpoint.session_id, retention_);
        if (!pruned) return pruned.error();
    }
    return {};
}

Result<Checkpoint> MemoryCheckpointStore::load(const CheckpointId& id) const {
    std::lock_guard lock(mutex_);
    auto it = checkpoints_.find(id);
    if (it == checkpoints_.end()) return Error{ErrorCode::NotFound, "No checkpoint " + id};
    return it->second;
}

Result<std::vector<CheckpointInfo>> MemoryCheckpointStore::list(const SessionId& session) const {
    std::lock_guard lock(mutex_);
    std::vector<CheckpointInfo> infos;
    for (const auto& [_, checkpoint] : checkpoints_) {
        if (session.empty() || checkpoint.session_id == session) infos.push_back(info_of(checkpoint));
    }
    sort_infos(infos);
    return infos;
}

Result<size_t> MemoryCheckpointStore::prune(const SessionId& session, size_t keep) {
    auto infos = list(session);
    if (!infos) return infos.error();

    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (size_t i = 0; i + keep < infos->size(); ++i) {
        removed += checkpoints_.erase((*infos)[i].id);
    }
    return removed;
}

}  // namespace task_dispatch
