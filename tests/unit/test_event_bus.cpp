#include <gtest/gtest.h>
#include "puresend/core/event_bus.hpp"
#include "puresend/core/application.hpp"
#include <nlohmann/json.hpp>
#include <thread>

using namespace puresend;
using namespace puresend::core;

class EventBusTest : public ::testing::Test {
protected:
    EventBus<int> bus_;
};

TEST_F(EventBusTest, EverySubscriberSeesEveryEvent) {
    auto first = bus_.subscribe();
    auto second = bus_.subscribe();

    bus_.publish(1);
    bus_.publish(2);

    EXPECT_EQ(first->drain(), (std::vector<int>{1, 2}));
    EXPECT_EQ(second->drain(), (std::vector<int>{1, 2}));
}

TEST_F(EventBusTest, DroppingTheSubscriptionUnsubscribes) {
    auto kept = bus_.subscribe();
    {
        auto dropped = bus_.subscribe();
        EXPECT_EQ(bus_.subscriber_count(), 2u);
    }

    bus_.publish(7);
    EXPECT_EQ(bus_.subscriber_count(), 1u);
    EXPECT_EQ(kept->try_next(), 7);
}

TEST_F(EventBusTest, FullQueueDropsOldest) {
    auto subscription = bus_.subscribe(3);

    for (int i = 0; i < 5; ++i) {
        bus_.publish(i);
    }

    EXPECT_EQ(subscription->pending(), 3u);
    EXPECT_EQ(subscription->dropped(), 2u);
    EXPECT_EQ(subscription->drain(), (std::vector<int>{2, 3, 4}));
}

TEST_F(EventBusTest, NextWaitsForPublisher) {
    auto subscription = bus_.subscribe();

    std::thread publisher([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus_.publish(42);
    });

    auto event = subscription->next(std::chrono::seconds(5));
    publisher.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(*event, 42);
    EXPECT_FALSE(subscription->next(std::chrono::milliseconds(10)).has_value());
}

TEST_F(EventBusTest, CloseWakesWaiters) {
    auto subscription = bus_.subscribe();

    std::thread closer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        bus_.close();
    });

    auto started = std::chrono::steady_clock::now();
    auto event = subscription->next(std::chrono::seconds(10));
    closer.join();

    EXPECT_FALSE(event.has_value());
    EXPECT_TRUE(subscription->closed());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));

    bus_.publish(1);
    EXPECT_EQ(subscription->pending(), 0u);
}

TEST(AppEventTest, SerializesWithTypeAndPayload) {
    transfer::TransferProgress progress;
    progress.task_id = "task-1";
    progress.status = transfer::TaskStatus::Transferring;
    progress.progress = 40;
    progress.transferred_bytes = 400;
    progress.total_bytes = 1000;

    nlohmann::json j = AppEvent(progress);
    EXPECT_EQ(j["type"], "transfer-progress");
    EXPECT_EQ(j["payload"]["taskId"], "task-1");

    share::AccessRequest request;
    request.id = "req-1";
    request.ip = "192.168.1.20";
    EXPECT_EQ(event_name(RequestChange{RequestChange::Source::Share, request}), "share-request");
    EXPECT_EQ(event_name(RequestChange{RequestChange::Source::WebUpload, request}), "web-upload-request");

    network::PeerEvent peer_event{network::PeerEventKind::Offline, {}};
    peer_event.peer.id = "peer-1";
    nlohmann::json peer_json = AppEvent(peer_event);
    EXPECT_EQ(peer_json["type"], "peer");
    EXPECT_EQ(peer_json["payload"]["kind"], "offline");
    EXPECT_EQ(peer_json["payload"]["peer"]["id"], "peer-1");
}
