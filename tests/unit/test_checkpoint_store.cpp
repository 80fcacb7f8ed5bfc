/**
 * @file test_checkpoint_store.cpp
 * @brief Unit tests for checkpoint encoding and the file / memory stores.
 */

#include "coordination/checkpoint_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace task_dispatch;

namespace {

Checkpoint make_checkpoint(const SessionId& session, uint64_t sequence) {
    Task a;
    a.id = "a";
    a.description = "produce";
    a.outputs = {"x"};
    a.status = TaskStatus::Completed;
    a.completed_at = from_epoch_ms(1'700'000'000'500);

    Task b;
    b.id = "b";
    b.description = "consume";
    b.inputs = {"x"};
    b.status = TaskStatus::Running;
    b.assigned_agent = "generalist-0";
    b.retry_count = 1;

    Checkpoint cp;
    cp.id = session + "-" + std::to_string(sequence);
    cp.session_id = session;
    cp.sequence = sequence;
    cp.created_at = from_epoch_ms(1'700'000'000'000 + static_cast<int64_t>(sequence));
    cp.graph.tasks = {a, b};
    cp.graph.edges = {Edge{"a", "b", DependencyKind::Data, 1.0, Provenance::Rule, "artifact_match: x"}};
    cp.graph.frozen = true;
    cp.tasks = {{"a", a}, {"b", b}};
    cp.assignments = {{"generalist-0", "b"}};
    cp.artifacts = {Artifact{"x", "payload", "a", false}};
    cp.reason = "task.completed";
    return cp;
}

}  // namespace

// ─── Encoding ────────────────────────────────

TEST(CheckpointEncodingTest, JsonRoundTripPreservesEverything) {
    auto original = make_checkpoint("s1", 3);
    Json encoded = original;
    EXPECT_EQ(encoded["format_version"], 1);
    EXPECT_EQ(encoded["tasks"].size(), 2u);

    auto decoded = encoded.get<Checkpoint>();
    EXPECT_EQ(decoded, original);
}

// ─── File store ──────────────────────────────

class FileCheckpointStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "td_test_checkpoints";
        std::filesystem::remove_all(dir_);
        logger_ = std::make_unique<Logger>(std::make_unique<NullSink>());
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    std::unique_ptr<Logger> logger_;
};

TEST_F(FileCheckpointStoreTest, SaveThenLoad) {
    FileCheckpointStore store(dir_, 0, *logger_);
    auto cp = make_checkpoint("s1", 1);
    ASSERT_TRUE(store.save(cp));
    EXPECT_TRUE(std::filesystem::exists(store.path_for(cp.id)));

    auto loaded = store.load(cp.id);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(*loaded, cp);
}

TEST_F(FileCheckpointStoreTest, MissingCheckpointIsNotFound) {
    FileCheckpointStore store(dir_, 0, *logger_);
    auto loaded = store.load("nope");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);

    auto latest = store.latest("s1");
    ASSERT_FALSE(latest.has_value());
    EXPECT_EQ(latest.error().code, ErrorCode::NotFound);
}

TEST_F(FileCheckpointStoreTest, CorruptFileIsReported) {
    FileCheckpointStore store(dir_, 0, *logger_);
    std::filesystem::create_directories(dir_);
    {
        std::ofstream out(store.path_for("broken"));
        out << "{\"id\": \"broken\", \"session_id\": ";
    }
    {
        std::ofstream out(store.path_for("wrong_shape"));
        out << R"({"id": "wrong_shape", "tasks": 4})";
    }

    EXPECT_EQ(store.load("broken").error().code, ErrorCode::CheckpointCorrupt);
    EXPECT_EQ(store.load("wrong_shape").error().code, ErrorCode::CheckpointCorrupt);

    // Unreadable entries are skipped when listing.
    ASSERT_TRUE(store.save(make_checkpoint("s1", 1)));
    auto infos = store.list();
    ASSERT_TRUE(infos.has_value());
    EXPECT_EQ(infos->size(), 1u);
}

TEST_F(FileCheckpointStoreTest, RetentionKeepsNewest) {
    FileCheckpointStore store(dir_, 3, *logger_);
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        ASSERT_TRUE(store.save(make_checkpoint("s1", seq)));
    }
    ASSERT_TRUE(store.save(make_checkpoint("s2", 1)));

    auto infos = store.list("s1");
    ASSERT_TRUE(infos.has_value());
    ASSERT_EQ(infos->size(), 3u);
    EXPECT_EQ(infos->front().sequence, 3u);
    EXPECT_EQ(infos->back().sequence, 5u);

    auto latest = store.latest("s1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->sequence, 5u);
    EXPECT_EQ(store.list()->size(), 4u);
}

TEST_F(FileCheckpointStoreTest, PruneUsesIndexNotFileContents) {
    FileCheckpointStore store(dir_, 3, *logger_);
    for (uint64_t seq = 1; seq <= 3; ++seq) {
        ASSERT_TRUE(store.save(make_checkpoint("s1", seq)));
    }

    // Once indexed, an old checkpoint is pruned by its recorded sequence without being re-read.
    {
        std::ofstream out(store.path_for("s1-1"), std::ios::trunc);
        out << "not json";
    }
    ASSERT_TRUE(store.save(make_checkpoint("s1", 4)));

    EXPECT_FALSE(std::filesystem::exists(store.path_for("s1-1")));
    auto infos = store.list("s1");
    ASSERT_TRUE(infos.has_value());
    ASSERT_EQ(infos->size(), 3u);
    EXPECT_EQ(infos->front().sequence, 2u);
}

TEST_F(FileCheckpointStoreTest, UnreadableFileIsParsedOnce) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger logger(std::move(sink), LogLevel::Debug);
    FileCheckpointStore store(dir_, 2, logger);

    std::filesystem::create_directories(dir_);
    {
        std::ofstream out(store.path_for("foreign"));
        out << "{\"id\": \"foreign\", \"session_id\": ";
    }
    for (uint64_t seq = 1; seq <= 4; ++seq) {
        ASSERT_TRUE(store.save(make_checkpoint("s1", seq)));
    }
    EXPECT_EQ(store.list("s1")->size(), 2u);

    MemorySink view(buffer);
    EXPECT_EQ(view.count_containing("Skipping unreadable checkpoint foreign"), 1u);
    EXPECT_TRUE(std::filesystem::exists(store.path_for("foreign")));
}

TEST_F(FileCheckpointStoreTest, FilesAddedByAnotherStoreAreListed) {
    FileCheckpointStore writer(dir_, 0, *logger_);
    FileCheckpointStore reader(dir_, 0, *logger_);
    ASSERT_TRUE(writer.save(make_checkpoint("s1", 1)));
    EXPECT_EQ(reader.list("s1")->size(), 1u);

    ASSERT_TRUE(writer.save(make_checkpoint("s1", 2)));
    std::filesystem::remove(writer.path_for("s1-1"));
    auto infos = reader.list("s1");
    ASSERT_TRUE(infos.has_value());
    ASSERT_EQ(infos->size(), 1u);
    EXPECT_EQ(infos->front().sequence, 2u);
}

TEST_F(FileCheckpointStoreTest, RejectsPathLikeIds) {
    FileCheckpointStore store(dir_, 0, *logger_);
    auto cp = make_checkpoint("s1", 1);
    cp.id = "../escape";
    EXPECT_EQ(store.save(cp).error().code, ErrorCode::InvalidArgument);
}

// ─── Memory store ────────────────────────────

TEST(MemoryCheckpointStoreTest, ListPruneAndLatest) {
    MemoryCheckpointStore store;
    for (uint64_t seq = 1; seq <= 4; ++seq) {
        ASSERT_TRUE(store.save(make_checkpoint("s", seq)));
    }
    ASSERT_TRUE(store.save(make_checkpoint("other", 9)));

    EXPECT_EQ(store.list("s")->size(), 4u);
    EXPECT_EQ(store.list()->size(), 5u);

    auto removed = store.prune("s", 1);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 3u);
    EXPECT_EQ(store.latest("s")->sequence, 4u);
    EXPECT_EQ(store.load("s-1").error().code, ErrorCode::NotFound);
}

TEST(MemoryCheckpointStoreTest, RetentionAppliesOnSave) {
    MemoryCheckpointStore store(2);
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        ASSERT_TRUE(store.save(make_checkpoint("s", seq)));
    }
    auto infos = store.list("s");
    ASSERT_EQ(infos->size(), 2u);
    EXPECT_EQ(infos->front().sequence, 4u);
}
