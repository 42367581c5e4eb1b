#include <gtest/gtest.h>
#include "puresend/transfer/transfer_manager.hpp"
#include "puresend/storage/resume_manager.hpp"
#include "puresend/storage/chunk_manager.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <thread>

using namespace puresend;
using namespace puresend::transfer;
using core::ErrorCode;

namespace {

// State shared by every channel a test's factory hands out.
struct FakeLink {
    std::mutex mutex;
    std::vector<network::FileOfferMessage> offers;
    std::vector<std::uint32_t> delivered;
    int fail_after = -1;  // acknowledged chunks before the link drops, once
    bool reject = false;
    std::chrono::milliseconds chunk_delay{0};
    int channels = 0;
};

class FakeChannel : public network::TransferChannel {
public:
    explicit FakeChannel(std::shared_ptr<FakeLink> link) : link_(std::move(link)) {}

    core::Result open(const std::string&, std::uint16_t) override {
        std::lock_guard<std::mutex> lock(link_->mutex);
        ++link_->channels;
        return core::Result();
    }

    core::Result send_offer(const network::FileOfferMessage& offer, network::FileResponseMessage& reply) override {
        std::lock_guard<std::mutex> lock(link_->mutex);
        link_->offers.push_back(offer);
        if (link_->reject) {
            return core::Result(ErrorCode::REJECTED, "Declined by receiver");
        }
        reply.task_id = offer.task_id;
        reply.accepted = true;
        reply.start_chunk = offer.resume_chunk;
        return core::Result();
    }

    core::Result send_chunk(const network::ChunkDataMessage& chunk, bool, network::ChunkAckMessage& ack) override {
        std::this_thread::sleep_for(link_->chunk_delay);

        std::lock_guard<std::mutex> lock(link_->mutex);
        if (aborted_) {
            return core::Result(ErrorCode::CANCELLED, "Aborted");
        }
        if (link_->fail_after >= 0 && static_cast<int>(link_->delivered.size()) == link_->fail_after) {
            link_->fail_after = -1;
            return core::Result(ErrorCode::NETWORK_ERROR, "Connection reset by peer");
        }
        if (!storage::ChunkManager::verify_chunk(chunk.data, chunk.chunk_hash)) {
            ack.ok = false;
            ack.reason = "hash mismatch";
        }
        link_->delivered.push_back(chunk.chunk_index);
        ack.task_id = chunk.task_id;
        ack.chunk_index = chunk.chunk_index;
        return core::Result();
    }

    core::Result send_cancel(const network::CancelMessage&) override {
        return core::Result();
    }

    void abort() override {
        std::lock_guard<std::mutex> lock(link_->mutex);
        aborted_ = true;
    }

    void close() override {}

private:
    std::shared_ptr<FakeLink> link_;
    bool aborted_ = false;
};

}

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "puresend_transfer_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        source_ = test_dir_ / "holiday.mp4";
        std::vector<char> content(9'400'000);
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& byte : content) {
            byte = static_cast<char>(dist(rng));
        }
        std::ofstream file(source_, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();

        storage_.set_base_directory(test_dir_);
        storage_.chunk_size = 1'000'000;
        storage_.create_directories();

        storage::ChunkManager chunker(storage_);
        ASSERT_TRUE(chunker.chunk_file(source_, metadata_));
        ASSERT_EQ(metadata_.chunk_count(), 10u);

        ledger_ = std::make_shared<storage::ResumeManager>(test_dir_ / "resume.db");
        ASSERT_TRUE(ledger_->initialize());

        link_ = std::make_shared<FakeLink>();

        TransferSettings settings;
        settings.local_id = "node-a";
        settings.local_name = "Desk";
        settings.progress_interval = std::chrono::milliseconds(0);

        auto link = link_;
        manager_ = std::make_unique<TransferManager>(settings, storage_, ledger_, [link]() {
            return std::make_unique<FakeChannel>(link);
        });
        ASSERT_TRUE(manager_->initialize());

        manager_->set_progress_handler([this](const TransferProgress& progress) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(progress);
        });

        peer_ = TaskPeer{"peer-b", "Laptop", "192.168.1.20", 53317};
    }

    void TearDown() override {
        manager_.reset();
        ledger_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    // Waits until the task leaves pending/transferring.
    TransferTask wait_for_settle(const std::string& task_id) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
        while (std::chrono::steady_clock::now() < deadline) {
            auto task = manager_->get_task(task_id);
            if (task && task->status != TaskStatus::Pending && task->status != TaskStatus::Transferring) {
                return *task;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ADD_FAILURE() << "Task " << task_id << " did not settle";
        return *manager_->get_task(task_id);
    }

    std::vector<std::uint32_t> delivered() {
        std::lock_guard<std::mutex> lock(link_->mutex);
        return link_->delivered;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_;
    storage::StorageConfig storage_;
    storage::FileMetadata metadata_;
    std::shared_ptr<storage::ResumeManager> ledger_;
    std::shared_ptr<FakeLink> link_;
    std::unique_ptr<TransferManager> manager_;
    TaskPeer peer_;

    std::mutex events_mutex_;
    std::vector<TransferProgress> events_;
};

TEST_F(TransferManagerTest, SendsEveryChunkInOrder) {
    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));

    auto task = wait_for_settle(task_id);
    EXPECT_EQ(task.status, TaskStatus::Completed);
    EXPECT_EQ(task.transferred_bytes, 9'400'000u);
    EXPECT_EQ(task.progress, 100);
    EXPECT_FALSE(task.error.has_value());
    EXPECT_TRUE(task.completed_at.has_value());

    EXPECT_EQ(delivered(), (std::vector<std::uint32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_FALSE(ledger_->load(task_id).has_value());

    std::lock_guard<std::mutex> lock(link_->mutex);
    ASSERT_EQ(link_->offers.size(), 1u);
    EXPECT_FALSE(link_->offers[0].resume);
    EXPECT_EQ(link_->offers[0].sender_id, "node-a");
    auto offered = storage::FileMetadata::deserialize(link_->offers[0].metadata);
    EXPECT_EQ(offered.hash, metadata_.hash);
    EXPECT_FALSE(offered.path.has_value());
}

TEST_F(TransferManagerTest, ProgressNeverGoesBackwards) {
    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));
    wait_for_settle(task_id);

    std::lock_guard<std::mutex> lock(events_mutex_);
    ASSERT_FALSE(events_.empty());
    EXPECT_EQ(events_.back().status, TaskStatus::Completed);
    EXPECT_EQ(events_.back().progress, 100);

    std::uint64_t last = 0;
    for (const auto& event : events_) {
        EXPECT_EQ(event.task_id, task_id);
        if (event.status == TaskStatus::Pending) {
            continue;
        }
        EXPECT_GE(event.transferred_bytes, last);
        EXPECT_EQ(event.total_bytes, 9'400'000u);
        last = event.transferred_bytes;
    }
}

TEST_F(TransferManagerTest, DroppedLinkLeavesResumableTask) {
    link_->fail_after = 6;

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));

    auto task = wait_for_settle(task_id);
    ASSERT_EQ(task.status, TaskStatus::Interrupted);
    EXPECT_TRUE(task.resumable);
    EXPECT_EQ(task.resume_offset, 6'000'000u);
    EXPECT_EQ(task.transferred_bytes, 6'000'000u);
    ASSERT_TRUE(task.error.has_value());

    auto record = ledger_->load(task_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->state, storage::ResumeRecord::State::Interrupted);
    EXPECT_EQ(record->resume_offset, 6'000'000u);
    EXPECT_EQ(record->completed_chunks.size(), 6u);

    auto resumable = manager_->get_resumable_tasks();
    ASSERT_EQ(resumable.size(), 1u);
    EXPECT_EQ(resumable[0].id, task_id);
    EXPECT_EQ(resumable[0].resume_offset, 6'000'000u);

    ASSERT_TRUE(manager_->resume_transfer(task_id));
    task = wait_for_settle(task_id);

    EXPECT_EQ(task.status, TaskStatus::Completed);
    EXPECT_TRUE(task.resumed);
    EXPECT_EQ(task.transferred_bytes, 9'400'000u);
    EXPECT_EQ(delivered(), (std::vector<std::uint32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_FALSE(ledger_->load(task_id).has_value());

    std::lock_guard<std::mutex> lock(link_->mutex);
    ASSERT_EQ(link_->offers.size(), 2u);
    EXPECT_TRUE(link_->offers[1].resume);
    EXPECT_EQ(link_->offers[1].resume_chunk, 6u);
    EXPECT_EQ(link_->offers[1].task_id, task_id);
}

TEST_F(TransferManagerTest, ResumeAfterRestartRebuildsTask) {
    link_->fail_after = 3;

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));
    ASSERT_EQ(wait_for_settle(task_id).status, TaskStatus::Interrupted);

    auto link = link_;
    manager_ = std::make_unique<TransferManager>(TransferSettings{}, storage_, ledger_, [link]() {
        return std::make_unique<FakeChannel>(link);
    });
    ASSERT_TRUE(manager_->initialize());
    EXPECT_FALSE(manager_->get_task(task_id).has_value());

    ASSERT_TRUE(manager_->resume_transfer(task_id));
    auto task = wait_for_settle(task_id);
    EXPECT_EQ(task.status, TaskStatus::Completed);
    EXPECT_EQ(task.peer->ip, "192.168.1.20");
    EXPECT_EQ(delivered(), (std::vector<std::uint32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST_F(TransferManagerTest, ResumeRefusesChangedSource) {
    link_->fail_after = 2;

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));
    ASSERT_EQ(wait_for_settle(task_id).status, TaskStatus::Interrupted);

    {
        std::ofstream file(source_, std::ios::binary | std::ios::app);
        file << "appended";
    }

    auto result = manager_->resume_transfer(task_id);
    EXPECT_EQ(result.error, ErrorCode::VERIFICATION_ERROR);

    auto task = manager_->get_task(task_id);
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_FALSE(task->resumable);
    EXPECT_FALSE(ledger_->load(task_id).has_value());
    EXPECT_TRUE(manager_->get_resumable_tasks().empty());
}

TEST_F(TransferManagerTest, RejectedOfferFailsTask) {
    link_->reject = true;

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));

    auto task = wait_for_settle(task_id);
    EXPECT_EQ(task.status, TaskStatus::Failed);
    ASSERT_TRUE(task.error.has_value());
    EXPECT_NE(task.error->find("REJECTED"), std::string::npos);
    EXPECT_FALSE(ledger_->load(task_id).has_value());
    EXPECT_TRUE(delivered().empty());
}

TEST_F(TransferManagerTest, CancelStopsBetweenChunks) {
    link_->chunk_delay = std::chrono::milliseconds(30);

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (delivered().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(manager_->cancel(task_id));

    auto task = wait_for_settle(task_id);
    EXPECT_EQ(task.status, TaskStatus::Cancelled);
    EXPECT_FALSE(task.resumable);
    EXPECT_LT(delivered().size(), 10u);
    EXPECT_FALSE(ledger_->load(task_id).has_value());

    EXPECT_EQ(manager_->cancel(task_id).error, ErrorCode::STATE_ERROR);
    EXPECT_EQ(manager_->resume_transfer(task_id).error, ErrorCode::STATE_ERROR);
}

TEST_F(TransferManagerTest, CancelInterruptedTaskDropsResumeState) {
    link_->fail_after = 4;

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));
    ASSERT_EQ(wait_for_settle(task_id).status, TaskStatus::Interrupted);

    ASSERT_TRUE(manager_->cancel(task_id));
    EXPECT_EQ(manager_->get_task(task_id)->status, TaskStatus::Cancelled);
    EXPECT_FALSE(ledger_->load(task_id).has_value());
}

TEST_F(TransferManagerTest, SendValidatesArguments) {
    std::string task_id;

    auto no_path = metadata_;
    no_path.path.reset();
    EXPECT_EQ(manager_->send(no_path, peer_, task_id).error, ErrorCode::INVALID_ARGUMENT);

    auto no_port = peer_;
    no_port.port = 0;
    EXPECT_EQ(manager_->send(metadata_, no_port, task_id).error, ErrorCode::INVALID_ARGUMENT);

    auto broken = metadata_;
    broken.chunks.pop_back();
    EXPECT_EQ(manager_->send(broken, peer_, task_id).error, ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(manager_->get_tasks().empty());
    EXPECT_EQ(manager_->resume_transfer("unknown").error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->cancel("unknown").error, ErrorCode::NOT_FOUND);
}

TEST_F(TransferManagerTest, CleanupRemovesFinishedTasks) {
    std::string done_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, done_id));
    ASSERT_EQ(wait_for_settle(done_id).status, TaskStatus::Completed);

    link_->fail_after = static_cast<int>(delivered().size()) + 1;
    std::string interrupted_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, interrupted_id));
    ASSERT_EQ(wait_for_settle(interrupted_id).status, TaskStatus::Interrupted);

    EXPECT_EQ(manager_->get_tasks().size(), 2u);
    EXPECT_EQ(manager_->cleanup(), 1u);
    ASSERT_EQ(manager_->get_tasks().size(), 1u);
    EXPECT_EQ(manager_->get_tasks()[0].id, interrupted_id);

    // An interrupted task keeps its resume record until it is cancelled.
    EXPECT_EQ(manager_->remove_task(interrupted_id).error, ErrorCode::STATE_ERROR);
    EXPECT_EQ(manager_->get_tasks().size(), 1u);
    EXPECT_TRUE(ledger_->load(interrupted_id).has_value());

    ASSERT_TRUE(manager_->cancel(interrupted_id));
    ASSERT_TRUE(manager_->remove_task(interrupted_id));
    EXPECT_TRUE(manager_->get_tasks().empty());
    EXPECT_FALSE(ledger_->load(interrupted_id).has_value());
    EXPECT_EQ(manager_->remove_task(interrupted_id).error, ErrorCode::NOT_FOUND);
}

TEST_F(TransferManagerTest, CleanupResumeInfoIsIdempotent) {
    link_->fail_after = 1;

    std::string task_id;
    ASSERT_TRUE(manager_->send(metadata_, peer_, task_id));
    ASSERT_EQ(wait_for_settle(task_id).status, TaskStatus::Interrupted);

    EXPECT_TRUE(manager_->cleanup_resume_info(task_id));
    EXPECT_TRUE(manager_->cleanup_resume_info(task_id));
    EXPECT_FALSE(ledger_->load(task_id).has_value());
    EXPECT_TRUE(manager_->cleanup_resume_info(std::nullopt));
    EXPECT_EQ(manager_->resume_transfer(task_id).error, ErrorCode::NOT_FOUND);
}

TEST_F(TransferManagerTest, ReceiveSettingsAreApplied) {
    manager_->set_auto_receive(true);
    manager_->set_overwrite(true);

    auto state = manager_->get_receiving_state();
    EXPECT_FALSE(state.is_receiving);
    EXPECT_TRUE(state.auto_receive);
    EXPECT_TRUE(state.file_overwrite);

    auto directory = test_dir_ / "inbox";
    ASSERT_TRUE(manager_->update_receive_directory(directory));
    EXPECT_EQ(manager_->get_receive_directory(), directory);
    EXPECT_TRUE(std::filesystem::is_directory(directory));
    EXPECT_EQ(manager_->update_receive_directory("").error, ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(manager_->accept_incoming("unknown").error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(manager_->reject_incoming("unknown").error, ErrorCode::NOT_FOUND);
}
