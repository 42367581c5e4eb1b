#include <gtest/gtest.h>
#include "puresend/storage/resume_manager.hpp"
#include "puresend/storage/chunk_manager.hpp"
#include "puresend/storage/storage_config.hpp"
#include <filesystem>
#include <fstream>
#include <random>

using namespace puresend::storage;
using puresend::core::ErrorCode;

class ResumeManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "puresend_resume_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        source_ = test_dir_ / "source.bin";
        std::ofstream file(source_, std::ios::binary);
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        for (int i = 0; i < 4096 + 500; ++i) {
            file.put(static_cast<char>(dist(rng)));
        }
        file.close();

        ASSERT_TRUE(chunk_manager_.chunk_file(source_, metadata_));
        ASSERT_EQ(metadata_.chunk_count(), 5u);

        ledger_ = std::make_unique<ResumeManager>(test_dir_ / "state" / "resume.db", std::chrono::hours(24));
        ASSERT_TRUE(ledger_->initialize());
    }

    void TearDown() override {
        ledger_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    ResumeRecord make_record(const std::string& task_id, ResumeRecord::Direction direction) {
        ResumeRecord record;
        record.task_id = task_id;
        record.direction = direction;
        record.file = metadata_;
        record.file_hash = metadata_.hash;
        record.peer_id = "peer-1";
        record.peer_name = "laptop";
        record.peer_ip = "192.168.1.20";
        record.peer_port = 53317;
        record.source_path = source_.string();
        record.save_path = (test_dir_ / "received.bin").string();
        record.created_at = std::chrono::system_clock::now();
        return record;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_;
    ChunkManager chunk_manager_{1024};
    FileMetadata metadata_;
    std::unique_ptr<ResumeManager> ledger_;
};

TEST_F(ResumeManagerTest, SaveAndLoad) {
    auto record = make_record("task-1", ResumeRecord::Direction::Send);
    record.encrypted = true;
    ASSERT_TRUE(ledger_->save(record));

    auto loaded = ledger_->load("task-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->direction, ResumeRecord::Direction::Send);
    EXPECT_EQ(loaded->state, ResumeRecord::State::Active);
    EXPECT_EQ(loaded->file, metadata_);
    EXPECT_EQ(loaded->file_hash, metadata_.hash);
    EXPECT_EQ(loaded->peer_port, 53317);
    EXPECT_EQ(loaded->source_path, source_.string());
    EXPECT_TRUE(loaded->encrypted);
    EXPECT_EQ(loaded->resume_offset, 0u);
    EXPECT_TRUE(loaded->completed_chunks.empty());

    EXPECT_FALSE(ledger_->load("missing").has_value());
    EXPECT_EQ(ledger_->count(), 1u);
}

TEST_F(ResumeManagerTest, OffsetFollowsContiguousPrefix) {
    ASSERT_TRUE(ledger_->save(make_record("task-1", ResumeRecord::Direction::Receive)));

    ASSERT_TRUE(ledger_->commit_chunk("task-1", 0, metadata_.chunks[0].hash));
    ASSERT_TRUE(ledger_->commit_chunk("task-1", 2, metadata_.chunks[2].hash));
    EXPECT_EQ(ledger_->load("task-1")->resume_offset, 1024u);

    ASSERT_TRUE(ledger_->commit_chunk("task-1", 1, metadata_.chunks[1].hash));
    auto loaded = ledger_->load("task-1");
    EXPECT_EQ(loaded->resume_offset, 3072u);
    EXPECT_EQ(loaded->first_missing_chunk(), 3u);
    EXPECT_EQ(loaded->completed_chunks.size(), 3u);

    ASSERT_TRUE(ledger_->forget_chunks("task-1", {1}));
    EXPECT_EQ(ledger_->load("task-1")->resume_offset, 1024u);
}

TEST_F(ResumeManagerTest, CommitWithoutRecordFails) {
    auto result = ledger_->commit_chunk("nobody", 0, metadata_.chunks[0].hash);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(ledger_->count(), 0u);
}

TEST_F(ResumeManagerTest, InterruptAndResumeState) {
    ASSERT_TRUE(ledger_->save(make_record("task-1", ResumeRecord::Direction::Send)));

    auto when = std::chrono::system_clock::now();
    ASSERT_TRUE(ledger_->mark_interrupted("task-1", when));

    auto loaded = ledger_->load("task-1");
    EXPECT_EQ(loaded->state, ResumeRecord::State::Interrupted);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::hours>(loaded->expires_at - loaded->interrupted_at).count(), 24);
    EXPECT_EQ(ledger_->list(true).size(), 1u);

    ASSERT_TRUE(ledger_->mark_active("task-1"));
    EXPECT_EQ(ledger_->load("task-1")->state, ResumeRecord::State::Active);
    EXPECT_TRUE(ledger_->list(true).empty());

    EXPECT_EQ(ledger_->mark_interrupted("missing").error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(ledger_->mark_active("missing").error, ErrorCode::NOT_FOUND);
}

TEST_F(ResumeManagerTest, RestartTurnsActiveIntoInterrupted) {
    ASSERT_TRUE(ledger_->save(make_record("task-1", ResumeRecord::Direction::Send)));
    ASSERT_TRUE(ledger_->save(make_record("task-2", ResumeRecord::Direction::Receive)));
    ASSERT_TRUE(ledger_->commit_chunk("task-2", 0, metadata_.chunks[0].hash));

    ledger_ = std::make_unique<ResumeManager>(test_dir_ / "state" / "resume.db", std::chrono::hours(24));
    ASSERT_TRUE(ledger_->initialize());

    EXPECT_EQ(ledger_->recover_after_restart(), 2u);
    EXPECT_EQ(ledger_->list(true).size(), 2u);
    EXPECT_EQ(ledger_->load("task-2")->resume_offset, 1024u);
    EXPECT_EQ(ledger_->recover_after_restart(), 0u);
}

TEST_F(ResumeManagerTest, PurgeExpiredKeepsActive) {
    ASSERT_TRUE(ledger_->save(make_record("old", ResumeRecord::Direction::Send)));
    ASSERT_TRUE(ledger_->save(make_record("live", ResumeRecord::Direction::Send)));

    auto now = std::chrono::system_clock::now();
    ASSERT_TRUE(ledger_->mark_interrupted("old", now - std::chrono::hours(25)));

    EXPECT_EQ(ledger_->purge_expired(now), 1u);
    EXPECT_FALSE(ledger_->load("old").has_value());
    EXPECT_TRUE(ledger_->load("live").has_value());
}

TEST_F(ResumeManagerTest, RemoveDropsChunks) {
    ASSERT_TRUE(ledger_->save(make_record("task-1", ResumeRecord::Direction::Receive)));
    ASSERT_TRUE(ledger_->commit_chunk("task-1", 0, metadata_.chunks[0].hash));

    ASSERT_TRUE(ledger_->remove("task-1"));
    EXPECT_FALSE(ledger_->load("task-1").has_value());
    EXPECT_TRUE(ledger_->remove("task-1"));

    // Chunks went with the record, so a fresh record starts empty.
    ASSERT_TRUE(ledger_->save(make_record("task-1", ResumeRecord::Direction::Receive)));
    EXPECT_TRUE(ledger_->load("task-1")->completed_chunks.empty());

    ASSERT_TRUE(ledger_->remove_all());
    EXPECT_EQ(ledger_->count(), 0u);
}

TEST_F(ResumeManagerTest, ValidateSendDetectsChangedSource) {
    auto record = make_record("task-1", ResumeRecord::Direction::Send);
    EXPECT_TRUE(ledger_->validate(record, chunk_manager_));

    {
        std::fstream file(source_, std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(10);
        file.put('\x5A');
        file.put('\xA5');
        file.put('\x5A');
    }
    EXPECT_EQ(ledger_->validate(record, chunk_manager_).error, ErrorCode::VERIFICATION_ERROR);

    std::filesystem::remove(source_);
    EXPECT_EQ(ledger_->validate(record, chunk_manager_).error, ErrorCode::NOT_FOUND);
}

TEST_F(ResumeManagerTest, ValidateReceiveRechecksCommittedChunks) {
    auto record = make_record("task-1", ResumeRecord::Direction::Receive);
    EXPECT_EQ(ledger_->validate(record, chunk_manager_).error, ErrorCode::NOT_FOUND);

    auto partial = StorageConfig::get_partial_path(record.save_path);
    ASSERT_TRUE(chunk_manager_.prepare_destination(partial, metadata_.size));
    ASSERT_TRUE(ledger_->save(record));

    std::vector<std::uint8_t> data;
    for (std::uint32_t i : {0u, 1u}) {
        ASSERT_TRUE(chunk_manager_.read_chunk(source_, metadata_, i, data));
        ASSERT_TRUE(chunk_manager_.write_chunk(partial, metadata_, i, data));
        ASSERT_TRUE(ledger_->commit_chunk("task-1", i, metadata_.chunks[i].hash));
        record.completed_chunks[i] = metadata_.chunks[i].hash;
    }
    EXPECT_TRUE(ledger_->validate(record, chunk_manager_));
    EXPECT_EQ(record.completed_chunks.size(), 2u);

    // Chunk 2 was never written: only that claim is dropped.
    ASSERT_TRUE(ledger_->commit_chunk("task-1", 2, metadata_.chunks[2].hash));
    record.completed_chunks[2] = metadata_.chunks[2].hash;
    EXPECT_TRUE(ledger_->validate(record, chunk_manager_));
    EXPECT_EQ(record.completed_chunks.size(), 2u);
    EXPECT_FALSE(record.completed_chunks.count(2));
    EXPECT_FALSE(ledger_->load("task-1")->completed_chunks.count(2));

    // A damaged chunk on disk goes the same way; the intact one stays.
    {
        auto offset = static_cast<std::streamoff>(metadata_.chunks[1].offset + 3);
        std::fstream file(partial, std::ios::in | std::ios::out | std::ios::binary);
        file.seekg(offset);
        char byte = 0;
        file.get(byte);
        file.seekp(offset);
        file.put(static_cast<char>(~byte));
    }
    EXPECT_TRUE(ledger_->validate(record, chunk_manager_));
    ASSERT_EQ(record.completed_chunks.size(), 1u);
    EXPECT_TRUE(record.completed_chunks.count(0));

    auto stored = ledger_->load("task-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->completed_chunks, record.completed_chunks);
    EXPECT_EQ(stored->contiguous_offset(), metadata_.chunks[0].size);

    // A chunk table that does not match the file is not repairable.
    auto foreign = record;
    foreign.completed_chunks[0] = metadata_.chunks[1].hash;
    EXPECT_EQ(ledger_->validate(foreign, chunk_manager_).error, ErrorCode::VERIFICATION_ERROR);

    record.file_hash = "0000";
    EXPECT_EQ(ledger_->validate(record, chunk_manager_).error, ErrorCode::VERIFICATION_ERROR);
}
