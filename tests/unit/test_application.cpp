#include <gtest/gtest.h>
#include "puresend/core/application.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace puresend;
using core::ErrorCode;

namespace {

class RefusingChannel : public network::TransferChannel {
public:
    core::Result open(const std::string&, std::uint16_t) override { return core::Result(); }

    core::Result send_offer(const network::FileOfferMessage&, network::FileResponseMessage&) override {
        return core::Result(ErrorCode::REJECTED, "Declined by receiver");
    }

    core::Result send_chunk(const network::ChunkDataMessage&, bool, network::ChunkAckMessage&) override {
        return core::Result(ErrorCode::STATE_ERROR, "No chunks expected");
    }

    core::Result send_cancel(const network::CancelMessage&) override { return core::Result(); }
    void abort() override {}
    void close() override {}
};

class ReachableProbe : public network::LivenessProbe {
public:
    bool probe(const std::string&, std::uint16_t, std::chrono::milliseconds) override { return true; }
};

}

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "puresend_application_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        source_ = test_dir_ / "report.txt";
        std::ofstream file(source_);
        file << "quarterly numbers";
        file.close();

        core::ApplicationSettings settings;
        settings.storage.set_base_directory(test_dir_ / "data");
        settings.transfer.local_id = "node-a";
        settings.transfer.local_name = "Desk";
        settings.discovery.local_id = "node-a";
        settings.discovery_enabled = false;

        app_ = std::make_unique<core::Application>(
            settings,
            []() { return std::make_unique<RefusingChannel>(); },
            std::make_shared<ReachableProbe>());
        ASSERT_TRUE(app_->initialize());
        events_ = app_->subscribe();
    }

    void TearDown() override {
        events_.reset();
        app_->shutdown();
        app_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    // Next event of the given alternative, skipping others.
    template<typename T>
    std::optional<T> next_event(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto event = events_->next(std::chrono::milliseconds(50));
            if (event && std::holds_alternative<T>(*event)) {
                return std::get<T>(*event);
            }
        }
        return std::nullopt;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_;
    std::unique_ptr<core::Application> app_;
    std::shared_ptr<core::Application::Subscription> events_;
};

TEST_F(ApplicationTest, PrepareTransfer) {
    storage::FileMetadata metadata;
    ASSERT_TRUE(app_->prepare_transfer(source_, metadata));
    EXPECT_EQ(metadata.name, "report.txt");
    EXPECT_EQ(metadata.size, 17u);
    EXPECT_EQ(metadata.mime_type, "text/plain");
    EXPECT_EQ(metadata.chunk_count(), 1u);

    storage::FileMetadata missing;
    EXPECT_EQ(app_->prepare_transfer(test_dir_ / "nope.txt", missing).error, ErrorCode::IO_ERROR);
}

TEST_F(ApplicationTest, RejectedSendIsPublished) {
    storage::FileMetadata metadata;
    ASSERT_TRUE(app_->prepare_transfer(source_, metadata));

    std::string task_id;
    ASSERT_TRUE(app_->send(metadata, "peer-b", "192.168.1.20", 53317, task_id));

    std::optional<transfer::TransferProgress> failed;
    while (auto progress = next_event<transfer::TransferProgress>()) {
        if (progress->status == transfer::TaskStatus::Failed) {
            failed = progress;
            break;
        }
    }
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->task_id, task_id);
    EXPECT_TRUE(failed->error.has_value());

    nlohmann::json j = core::AppEvent(*failed);
    EXPECT_EQ(j["type"], "transfer-progress");
    EXPECT_EQ(j["payload"]["status"], "failed");

    EXPECT_EQ(app_->cleanup(), 1u);
    EXPECT_TRUE(app_->get_tasks().empty());
}

TEST_F(ApplicationTest, ManualPeerEvents) {
    network::PeerInfo peer;
    ASSERT_TRUE(app_->add_manual("192.168.1.50", 5353, peer));

    auto discovered = next_event<network::PeerEvent>();
    ASSERT_TRUE(discovered.has_value());
    EXPECT_EQ(discovered->kind, network::PeerEventKind::Discovered);
    EXPECT_EQ(discovered->peer.id, peer.id);

    bool online = false;
    ASSERT_TRUE(app_->check_online(peer.id, online));
    EXPECT_TRUE(online);
    EXPECT_EQ(app_->get_peers().front().status, network::PeerStatus::Online);

    ASSERT_TRUE(app_->remove_peer(peer.id));
    EXPECT_TRUE(app_->get_peers().empty());
}

TEST_F(ApplicationTest, ShareLifecycle) {
    storage::FileMetadata metadata;
    ASSERT_TRUE(app_->prepare_transfer(source_, metadata));

    share::ShareLinkInfo info;
    ASSERT_TRUE(app_->start_share({metadata}, share::ShareSettings{}, info));
    EXPECT_FALSE(info.links.empty());
    ASSERT_TRUE(app_->get_share_info().has_value());

    share::ShareSettings settings;
    settings.pin_enabled = true;
    settings.pin = "123456";
    ASSERT_TRUE(app_->update_share_settings(settings));
    EXPECT_TRUE(app_->get_share_info()->pin_enabled);

    app_->stop_share();
    EXPECT_EQ(app_->get_share_info()->status, share::ShareStatus::Stopped);
    EXPECT_EQ(app_->accept_request("missing").error, ErrorCode::NOT_FOUND);
}

TEST_F(ApplicationTest, ReceiveDirectoryMustBeUsable) {
    auto target = test_dir_ / "inbox";
    ASSERT_TRUE(app_->update_receive_directory(target));
    EXPECT_TRUE(std::filesystem::is_directory(target));

    EXPECT_FALSE(app_->update_receive_directory(source_ / "sub"));
}

TEST_F(ApplicationTest, ResumeUnknownTask) {
    EXPECT_TRUE(app_->get_resumable_tasks().empty());
    EXPECT_EQ(app_->resume_transfer("ghost").error, ErrorCode::NOT_FOUND);
    EXPECT_TRUE(app_->cleanup_resume_info(std::nullopt));
}
