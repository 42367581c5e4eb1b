#include <gtest/gtest.h>
#include "puresend/transfer/transfer_manager.hpp"
#include "puresend/storage/chunk_manager.hpp"
#include "puresend/storage/resume_manager.hpp"
#include "puresend/crypto/hash.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <thread>

using namespace puresend;
using namespace puresend::transfer;

namespace {

struct LinkFaults {
    std::atomic<int> cut_after{-1};     // acknowledged chunks before the link is cut, once
    std::atomic<int> corrupt_chunk{-1}; // chunk whose payload gets one byte flipped, once
    std::atomic<int> acknowledged{0};
};

// Real TCP channel with injectable link loss and payload damage.
class FaultyChannel : public network::TransferChannel {
public:
    explicit FaultyChannel(std::shared_ptr<LinkFaults> faults)
        : faults_(std::move(faults))
        , inner_(network::ChannelTimeouts{std::chrono::seconds(10), std::chrono::seconds(20)}) {
    }

    core::Result open(const std::string& address, std::uint16_t port) override {
        return inner_.open(address, port);
    }

    core::Result send_offer(const network::FileOfferMessage& offer, network::FileResponseMessage& reply) override {
        return inner_.send_offer(offer, reply);
    }

    core::Result send_chunk(const network::ChunkDataMessage& chunk, bool compressed,
                            network::ChunkAckMessage& ack) override {
        int cut = faults_->cut_after.load();
        if (cut >= 0 && faults_->acknowledged.load() == cut) {
            faults_->cut_after = -1;
            inner_.close();
            return core::Result(core::ErrorCode::NETWORK_ERROR, "Link cut");
        }

        core::Result result;
        int corrupt = faults_->corrupt_chunk.load();
        if (corrupt >= 0 && chunk.chunk_index == static_cast<std::uint32_t>(corrupt) && !chunk.data.empty()) {
            faults_->corrupt_chunk = -1;
            auto damaged = chunk;
            damaged.data[damaged.data.size() / 2] ^= 0xFF;
            result = inner_.send_chunk(damaged, compressed, ack);
        } else {
            result = inner_.send_chunk(chunk, compressed, ack);
        }

        if (result && ack.ok) {
            ++faults_->acknowledged;
        }
        return result;
    }

    core::Result send_cancel(const network::CancelMessage& cancel) override {
        return inner_.send_cancel(cancel);
    }

    void abort() override { inner_.abort(); }
    void close() override { inner_.close(); }

private:
    std::shared_ptr<LinkFaults> faults_;
    network::TcpTransferChannel inner_;
};

}

// Two managers talking over real TCP on the loopback interface.
class LoopbackTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "puresend_loopback_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_ / "outbox");

        source_ = test_dir_ / "outbox" / "archive.tar";
        std::vector<char> content(3 * 1024 * 1024 + 517);
        std::mt19937 rng(42);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& byte : content) {
            byte = static_cast<char>(dist(rng));
        }
        std::ofstream file(source_, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();

        sender_storage_.set_base_directory(test_dir_ / "sender");
        sender_storage_.chunk_size = 256 * 1024;
        ASSERT_TRUE(sender_storage_.create_directories());

        receiver_storage_.set_base_directory(test_dir_ / "receiver");
        ASSERT_TRUE(receiver_storage_.create_directories());

        storage::ChunkManager chunker(sender_storage_);
        ASSERT_TRUE(chunker.chunk_file(source_, metadata_));

        sender_ledger_ = std::make_shared<storage::ResumeManager>(test_dir_ / "sender.db");
        receiver_ledger_ = std::make_shared<storage::ResumeManager>(test_dir_ / "receiver.db");
        ASSERT_TRUE(sender_ledger_->initialize());
        ASSERT_TRUE(receiver_ledger_->initialize());
    }

    void TearDown() override {
        sender_.reset();
        receiver_.reset();
        sender_ledger_.reset();
        receiver_ledger_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    void start(bool encryption, bool auto_receive, network::ChannelFactory channel_factory = nullptr) {
        TransferSettings sender_settings;
        sender_settings.local_id = "node-sender";
        sender_settings.local_name = "Desk";
        sender_settings.encryption = encryption;
        sender_settings.compression = sender_compression_;
        sender_ = std::make_unique<TransferManager>(sender_settings, sender_storage_, sender_ledger_,
                                                    std::move(channel_factory));
        ASSERT_TRUE(sender_->initialize());

        TransferSettings receiver_settings;
        receiver_settings.local_id = "node-receiver";
        receiver_settings.local_name = "Laptop";
        receiver_settings.auto_receive = auto_receive;
        receiver_ = std::make_unique<TransferManager>(receiver_settings, receiver_storage_, receiver_ledger_);
        ASSERT_TRUE(receiver_->initialize());

        ReceivingState state;
        ASSERT_TRUE(receiver_->start_receiving(state));
        ASSERT_TRUE(state.is_receiving);
        ASSERT_NE(state.port, 0);
        EXPECT_EQ(state.share_code.size(), 6u);
        peer_ = TaskPeer{"node-receiver", "Laptop", "127.0.0.1", state.port};
    }

    static TransferTask wait_for_settle(TransferManager& manager, const std::string& task_id) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (std::chrono::steady_clock::now() < deadline) {
            auto task = manager.get_task(task_id);
            if (task && task->status != TaskStatus::Pending && task->status != TaskStatus::Transferring) {
                return *task;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        ADD_FAILURE() << "Task " << task_id << " did not settle";
        auto task = manager.get_task(task_id);
        return task ? *task : TransferTask{};
    }

    void expect_received_copy(const TransferTask& received) {
        expect_received_copy(received, metadata_);
    }

    void expect_received_copy(const TransferTask& received, const storage::FileMetadata& file) {
        ASSERT_TRUE(received.save_path.has_value());
        std::filesystem::path saved(*received.save_path);
        EXPECT_EQ(saved.parent_path(), receiver_storage_.receive_directory);
        EXPECT_EQ(saved.filename(), file.name);
        EXPECT_EQ(std::filesystem::file_size(saved), file.size);

        crypto::Sha256Hash hash{};
        ASSERT_TRUE(crypto::Sha256Hasher::hash_file(saved, hash));
        EXPECT_EQ(crypto::hash_utils::hash_to_hex(hash), file.hash);
        EXPECT_FALSE(std::filesystem::exists(storage::StorageConfig::get_partial_path(saved)));
    }

    // Highly compressible text spread over several chunks.
    storage::FileMetadata prepare_log_file() {
        auto path = test_dir_ / "outbox" / "server_log.txt";
        {
            std::ofstream file(path);
            for (int line = 0; file.tellp() < 1'500'000; ++line) {
                file << "2026-10-18 12:00:" << (line % 60) << " INFO request " << line
                     << " served from cache in " << (line % 17) << " ms\n";
            }
        }

        storage::FileMetadata file;
        storage::ChunkManager chunker(sender_storage_);
        EXPECT_TRUE(chunker.chunk_file(path, file));
        EXPECT_EQ(file.mime_type, "text/plain");
        EXPECT_GT(file.chunk_count(), 4u);
        return file;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_;
    storage::StorageConfig sender_storage_;
    storage::StorageConfig receiver_storage_;
    storage::FileMetadata metadata_;
    std::shared_ptr<storage::ResumeManager> sender_ledger_;
    std::shared_ptr<storage::ResumeManager> receiver_ledger_;
    std::unique_ptr<TransferManager> sender_;
    std::unique_ptr<TransferManager> receiver_;
    TaskPeer peer_;
    CompressionSettings sender_compression_;
};

TEST_F(LoopbackTransferTest, AutoReceivedFileArrivesIntact) {
    start(false, true);

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    EXPECT_EQ(sent.transferred_bytes, metadata_.size);

    // Both sides share the task id.
    auto received = wait_for_settle(*receiver_, task_id);
    EXPECT_EQ(received.status, TaskStatus::Completed) << received.error.value_or("");
    EXPECT_EQ(received.direction, TransferDirection::Receive);
    expect_received_copy(received);

    EXPECT_FALSE(sender_ledger_->load(task_id).has_value());
    EXPECT_FALSE(receiver_ledger_->load(task_id).has_value());
}

TEST_F(LoopbackTransferTest, EncryptedTransfer) {
    start(true, true);

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    EXPECT_TRUE(sent.encrypted);

    auto received = wait_for_settle(*receiver_, task_id);
    EXPECT_EQ(received.status, TaskStatus::Completed) << received.error.value_or("");
    EXPECT_TRUE(received.encrypted);
    expect_received_copy(received);
}

TEST_F(LoopbackTransferTest, ManualAcceptance) {
    start(false, false);

    std::mutex mutex;
    std::optional<IncomingOffer> offered;
    receiver_->set_offer_handler([&](const IncomingOffer& offer) {
        std::lock_guard<std::mutex> lock(mutex);
        offered = offer;
    });

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (offered) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        ASSERT_TRUE(offered.has_value());
        EXPECT_EQ(offered->task_id, task_id);
        EXPECT_EQ(offered->sender_id, "node-sender");
        EXPECT_EQ(offered->sender_name, "Desk");
        EXPECT_EQ(offered->file.name, "archive.tar");
        EXPECT_EQ(offered->file.hash, metadata_.hash);
    }

    ASSERT_TRUE(receiver_->accept_incoming(task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    expect_received_copy(wait_for_settle(*receiver_, task_id));
}

TEST_F(LoopbackTransferTest, RejectedOfferFailsSender) {
    start(false, false);

    std::mutex mutex;
    std::string offered_id;
    receiver_->set_offer_handler([&](const IncomingOffer& offer) {
        std::lock_guard<std::mutex> lock(mutex);
        offered_id = offer.task_id;
    });

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!offered_id.empty()) {
                break;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(receiver_->reject_incoming(task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Failed);
    ASSERT_TRUE(sent.error.has_value());

    EXPECT_TRUE(std::filesystem::is_empty(receiver_storage_.receive_directory));
}

TEST_F(LoopbackTransferTest, StoppedReceiverRefusesConnections) {
    start(false, true);
    ASSERT_TRUE(receiver_->stop_receiving());
    EXPECT_FALSE(receiver_->get_receiving_state().is_receiving);

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_NE(sent.status, TaskStatus::Completed);
}

TEST_F(LoopbackTransferTest, TextIsCompressedOnTheWire) {
    start(true, true);
    auto file = prepare_log_file();

    std::string task_id;
    ASSERT_TRUE(sender_->send(file, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    EXPECT_TRUE(sent.encrypted);
    ASSERT_TRUE(sent.compression_ratio.has_value());
    EXPECT_GT(*sent.compression_ratio, 0.0);
    EXPECT_LT(*sent.compression_ratio, 0.5);

    auto received = wait_for_settle(*receiver_, task_id);
    EXPECT_EQ(received.status, TaskStatus::Completed) << received.error.value_or("");
    ASSERT_TRUE(received.compression_ratio.has_value());
    EXPECT_DOUBLE_EQ(*received.compression_ratio, *sent.compression_ratio);
    expect_received_copy(received, file);
}

TEST_F(LoopbackTransferTest, CompressionCanBeTurnedOff) {
    sender_compression_.enabled = false;
    start(false, true);
    auto file = prepare_log_file();

    std::string task_id;
    ASSERT_TRUE(sender_->send(file, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    EXPECT_FALSE(sent.compression_ratio.has_value());

    auto received = wait_for_settle(*receiver_, task_id);
    EXPECT_FALSE(received.compression_ratio.has_value());
    expect_received_copy(received, file);
}

TEST_F(LoopbackTransferTest, PrecompressedFilesGoAsTheyAre) {
    start(false, true);

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    EXPECT_FALSE(sent.compression_ratio.has_value());
}

TEST_F(LoopbackTransferTest, DamagedChunkIsRejected) {
    auto faults = std::make_shared<LinkFaults>();
    faults->corrupt_chunk = 2;
    start(false, true, [faults]() { return std::make_unique<FaultyChannel>(faults); });

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Failed);
    ASSERT_TRUE(sent.error.has_value());
    EXPECT_NE(sent.error->find("VERIFICATION_ERROR"), std::string::npos) << *sent.error;
    EXPECT_NE(sent.error->find("chunk 2"), std::string::npos) << *sent.error;
    EXPECT_EQ(faults->acknowledged.load(), 2);

    auto received = wait_for_settle(*receiver_, task_id);
    EXPECT_EQ(received.status, TaskStatus::Failed);
    ASSERT_TRUE(received.error.has_value());
    EXPECT_NE(received.error->find("VERIFICATION_ERROR"), std::string::npos) << *received.error;

    EXPECT_FALSE(sender_ledger_->load(task_id).has_value());
    EXPECT_FALSE(receiver_ledger_->load(task_id).has_value());
    EXPECT_FALSE(std::filesystem::exists(receiver_storage_.receive_directory / "archive.tar"));
}

TEST_F(LoopbackTransferTest, ReceiverResumesAfterLinkLoss) {
    auto faults = std::make_shared<LinkFaults>();
    faults->cut_after = 6;
    start(false, true, [faults]() { return std::make_unique<FaultyChannel>(faults); });

    std::string task_id;
    ASSERT_TRUE(sender_->send(metadata_, peer_, task_id));

    auto sent = wait_for_settle(*sender_, task_id);
    ASSERT_EQ(sent.status, TaskStatus::Interrupted) << sent.error.value_or("");
    auto received = wait_for_settle(*receiver_, task_id);
    ASSERT_EQ(received.status, TaskStatus::Interrupted) << received.error.value_or("");
    ASSERT_TRUE(received.save_path.has_value());

    auto record = receiver_ledger_->load(task_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->direction, storage::ResumeRecord::Direction::Receive);
    EXPECT_EQ(record->completed_chunks.size(), 6u);

    // Damage chunk 4 on disk while the task is parked.
    auto partial = storage::StorageConfig::get_partial_path(*received.save_path);
    ASSERT_TRUE(std::filesystem::exists(partial));
    {
        auto offset = static_cast<std::streamoff>(metadata_.chunks[4].offset + 100);
        std::fstream file(partial, std::ios::in | std::ios::out | std::ios::binary);
        file.seekg(offset);
        char byte = 0;
        file.get(byte);
        file.seekp(offset);
        file.put(static_cast<char>(~byte));
    }

    ASSERT_TRUE(receiver_->resume_transfer(task_id));
    EXPECT_EQ(receiver_->get_task(task_id)->status, TaskStatus::Pending);
    record = receiver_ledger_->load(task_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->completed_chunks.size(), 5u);
    EXPECT_FALSE(record->completed_chunks.count(4));

    ASSERT_TRUE(sender_->resume_transfer(task_id));

    sent = wait_for_settle(*sender_, task_id);
    EXPECT_EQ(sent.status, TaskStatus::Completed) << sent.error.value_or("");
    EXPECT_TRUE(sent.resumed);
    EXPECT_EQ(sent.resume_offset, metadata_.bytes_before(4));

    received = wait_for_settle(*receiver_, task_id);
    EXPECT_EQ(received.status, TaskStatus::Completed) << received.error.value_or("");
    EXPECT_TRUE(received.resumed);
    expect_received_copy(received);

    EXPECT_FALSE(sender_ledger_->load(task_id).has_value());
    EXPECT_FALSE(receiver_ledger_->load(task_id).has_value());
}
