#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace puresend::core {

// Fan-out of events to independent subscriber queues.
//
// Each subscriber owns its Subscription through a shared_ptr; the bus only keeps a weak
// reference, so dropping the subscription is the unsubscribe operation. Publishing never
// blocks: when a queue is full its oldest event is discarded and counted.
template<typename Event>
class EventBus {
public:
    class Subscription {
    public:
        explicit Subscription(std::size_t capacity) : capacity_(capacity) {}

        std::optional<Event> try_next() {
            std::lock_guard<std::mutex> lock(mutex_);
            return pop_locked();
        }

        std::optional<Event> next(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
            return pop_locked();
        }

        std::vector<Event> drain() {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Event> events(queue_.begin(), queue_.end());
            queue_.clear();
            return events;
        }

        std::size_t pending() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

        std::size_t dropped() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return dropped_;
        }

        bool closed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

    private:
        friend class EventBus;

        void push(const Event& event) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return;
                }
                if (queue_.size() >= capacity_) {
                    queue_.pop_front();
                    ++dropped_;
                }
                queue_.push_back(event);
            }
            cv_.notify_one();
        }

        void close() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        std::optional<Event> pop_locked() {
            if (queue_.empty()) {
                return std::nullopt;
            }
            Event event = std::move(queue_.front());
            queue_.pop_front();
            return event;
        }

        std::size_t capacity_;
        std::deque<Event> queue_;
        std::size_t dropped_ = 0;
        bool closed_ = false;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
    };

    static constexpr std::size_t DEFAULT_CAPACITY = 4096;

    EventBus() = default;
    ~EventBus() { close(); }

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    std::shared_ptr<Subscription> subscribe(std::size_t capacity = DEFAULT_CAPACITY) {
        auto subscription = std::make_shared<Subscription>(capacity == 0 ? 1 : capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.push_back(subscription);
        return subscription;
    }

    void publish(const Event& event) {
        std::vector<std::shared_ptr<Subscription>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscribers_.begin();
            while (it != subscribers_.end()) {
                if (auto subscription = it->lock()) {
                    live.push_back(std::move(subscription));
                    ++it;
                } else {
                    it = subscribers_.erase(it);
                }
            }
        }

        for (auto& subscription : live) {
            subscription->push(event);
        }
    }

    std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& weak : subscribers_) {
            if (!weak.expired()) {
                ++count;
            }
        }
        return count;
    }

    // Wakes every blocked subscriber; later publishes are ignored by closed queues.
    void close() {
        std::vector<std::shared_ptr<Subscription>> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& weak : subscribers_) {
                if (auto subscription = weak.lock()) {
                    live.push_back(std::move(subscription));
                }
            }
            subscribers_.clear();
        }

        for (auto& subscription : live) {
            subscription->close();
        }
    }

private:
    std::vector<std::weak_ptr<Subscription>> subscribers_;
    mutable std::mutex mutex_;
};

} // namespace puresend::core
