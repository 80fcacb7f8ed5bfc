/**
 * @file checkpoint_store.hpp
 * @brief Durable snapshots of a dispatch session.
 * @author TaskDispatch contributors
 *
 * A checkpoint carries the frozen graph, the live task-state table, the
 * agent-assignment table and the artifacts produced so far. The store
 * contract is small so the backing technology can be swapped freely.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/serialization.hpp"
#include "core/types.hpp"
#include "graph/execution_graph.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace task_dispatch {

struct Checkpoint {
    CheckpointId id;
    SessionId session_id;
    uint64_t sequence = 0;                        ///< Monotonic per session
    Timestamp created_at;
    GraphSnapshot graph;
    std::map<TaskId, Task> tasks;                 ///< Live lifecycle state
    std::map<AgentId, TaskId> assignments;
    std::vector<Artifact> artifacts;
    std::string reason;                           ///< What triggered it ("interval", "task.failed", ...)

    bool operator==(const Checkpoint&) const = default;
};

struct CheckpointInfo {
    CheckpointId id;
    SessionId session_id;
    uint64_t sequence = 0;
    Timestamp created_at;
};

void to_json(Json& j, const GraphSnapshot& snapshot);
void from_json(const Json& j, GraphSnapshot& snapshot);
void to_json(Json& j, const Checkpoint& checkpoint);
void from_json(const Json& j, Checkpoint& checkpoint);

// ─────────────────────────────────────────────
// ICheckpointStore (Virtual — runtime-configurable)
// ─────────────────────────────────────────────

class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    virtual Result<void> save(const Checkpoint& checkpoint) = 0;

    /// NotFound if absent, CheckpointCorrupt if unreadable.
    virtual Result<Checkpoint> load(const CheckpointId& id) const = 0;

    /// Oldest first; an empty session lists everything.
    virtual Result<std::vector<CheckpointInfo>> list(const SessionId& session = {}) const = 0;

    /// Keep the `keep` newest checkpoints of `session`; returns how many were removed.
    virtual Result<size_t> prune(const SessionId& session, size_t keep) = 0;

    /// Most recent checkpoint of `session`.
    Result<Checkpoint> latest(const SessionId& session) const;
};

// ─────────────────────────────────────────────
// File-backed store: one JSON document per checkpoint
// ─────────────────────────────────────────────

class FileCheckpointStore : public ICheckpointStore {
public:
    /// `retention` = 0 keeps everything.
    FileCheckpointStore(std::filesystem::path dir, size_t retention, Logger& logger);

    Result<void> save(const Checkpoint& checkpoint) override;
    Result<Checkpoint> load(const CheckpointId& id) const override;
    Result<std::vector<CheckpointInfo>> list(const SessionId& session = {}) const override;
    Result<size_t> prune(const SessionId& session, size_t keep) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }
    [[nodiscard]] std::filesystem::path path_for(const CheckpointId& id) const;

private:
    /// Sync index_ with the directory, parsing only files not seen before. Requires mutex_.
    Result<void> refresh_index() const;
    Result<Checkpoint> read_file(const CheckpointId& id) const;

    std::filesystem::path dir_;
    size_t retention_;
    ComponentLogger log_;
    mutable std::mutex mutex_;
    mutable std::map<CheckpointId, CheckpointInfo> index_;
    mutable std::set<CheckpointId> unreadable_;
};

// ─────────────────────────────────────────────
// In-memory store (tests, ephemeral sessions)
// ─────────────────────────────────────────────

class MemoryCheckpointStore : public ICheckpointStore {
public:
    explicit MemoryCheckpointStore(size_t retention = 0) : retention_(retention) {}

    Result<void> save(const Checkpoint& checkpoint) override;
    Result<Checkpoint> load(const CheckpointId& id) const override;
    Result<std::vector<CheckpointInfo>> list(const SessionId& session = {}) const override;
    Result<size_t> prune(const SessionId& session, size_t keep) override;

private:
    size_t retention_;
    std::map<CheckpointId, Checkpoint> checkpoints_;
    mutable std::mutex mutex_;
};

}  // namespace task_dispatch
