#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <deque>
#include <vector>
#include <cstdint>

namespace puresend::transfer {

struct SessionStats {
    std::string session_id;
    std::uint64_t total_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    double percentage_complete = 0.0;
    std::uint64_t current_speed_bps = 0;
    std::uint64_t average_speed_bps = 0;
    // Unset while no rate is known yet.
    std::optional<std::chrono::milliseconds> estimated_time_remaining;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point last_update;
};

// Byte-rate bookkeeping per transfer. The current speed is measured over a short sliding
// window; the average covers everything since start_session().
class PerformanceMonitor {
public:
    using Clock = std::chrono::steady_clock;

    explicit PerformanceMonitor(std::chrono::milliseconds speed_window = std::chrono::seconds(2));

    // `already_transferred` seeds resumed sessions; those bytes never count toward the speed.
    void start_session(const std::string& session_id, std::uint64_t total_bytes,
                       std::uint64_t already_transferred = 0, Clock::time_point now = Clock::now());
    void end_session(const std::string& session_id);
    bool has_session(const std::string& session_id) const;

    void on_bytes_transferred(const std::string& session_id, std::uint64_t bytes,
                              Clock::time_point now = Clock::now());

    std::optional<SessionStats> get_session_stats(const std::string& session_id,
                                                  Clock::time_point now = Clock::now()) const;
    std::vector<SessionStats> get_all_session_stats(Clock::time_point now = Clock::now()) const;

    std::uint64_t get_total_bytes_transferred() const;

private:
    struct SessionData {
        std::uint64_t total_bytes = 0;
        std::uint64_t bytes_transferred = 0;
        std::uint64_t baseline_bytes = 0;
        Clock::time_point start_time;
        Clock::time_point last_update;
        std::deque<std::pair<Clock::time_point, std::uint64_t>> transfer_history;
    };

    SessionStats make_stats(const std::string& session_id, const SessionData& session,
                            Clock::time_point now) const;
    std::uint64_t current_speed(const SessionData& session, Clock::time_point now) const;
    void cleanup_old_history(SessionData& session, Clock::time_point now) const;

    std::chrono::milliseconds speed_window_;
    std::unordered_map<std::string, SessionData> sessions_;
    mutable std::mutex mutex_;

    static constexpr std::chrono::seconds HISTORY_WINDOW{30};
};

} // namespace puresend::transfer
