#include "puresend/transfer/performance_monitor.hpp"
#include <algorithm>

namespace puresend::transfer {

PerformanceMonitor::PerformanceMonitor(std::chrono::milliseconds speed_window)
    : speed_window_(speed_window.count() > 0 ? speed_window : std::chrono::milliseconds(1000)) {
}

void PerformanceMonitor::start_session(const std::string& session_id, std::uint64_t total_bytes,
                                       std::uint64_t already_transferred, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    SessionData session;
    session.total_bytes = total_bytes;
    session.bytes_transferred = std::min(already_transferred, total_bytes);
    session.baseline_bytes = session.bytes_transferred;
    session.start_time = now;
    session.last_update = now;
    sessions_[session_id] = std::move(session);
}

void PerformanceMonitor::end_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

bool PerformanceMonitor::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

void PerformanceMonitor::on_bytes_transferred(const std::string& session_id, std::uint64_t bytes,
                                              Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return;
    }

    auto& session = it->second;
    session.bytes_transferred = std::min(session.bytes_transferred + bytes, session.total_bytes);
    session.last_update = now;
    session.transfer_history.emplace_back(now, bytes);
    cleanup_old_history(session, now);
}

std::optional<SessionStats> PerformanceMonitor::get_session_stats(const std::string& session_id,
                                                                  Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return make_stats(session_id, it->second, now);
}

std::vector<SessionStats> PerformanceMonitor::get_all_session_stats(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionStats> all_stats;
    all_stats.reserve(sessions_.size());
    for (const auto& [session_id, session] : sessions_) {
        all_stats.push_back(make_stats(session_id, session, now));
    }
    return all_stats;
}

std::uint64_t PerformanceMonitor::get_total_bytes_transferred() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::uint64_t total = 0;
    for (const auto& [session_id, session] : sessions_) {
        total += session.bytes_transferred - session.baseline_bytes;
    }
    return total;
}

SessionStats PerformanceMonitor::make_stats(const std::string& session_id, const SessionData& session,
                                            Clock::time_point now) const {
    SessionStats stats;
    stats.session_id = session_id;
    stats.total_bytes = session.total_bytes;
    stats.bytes_transferred = session.bytes_transferred;
    stats.percentage_complete = session.total_bytes > 0
        ? (static_cast<double>(session.bytes_transferred) / session.total_bytes) * 100.0
        : 0.0;
    stats.start_time = session.start_time;
    stats.last_update = session.last_update;

    stats.current_speed_bps = current_speed(session, now);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - session.start_time);
    if (elapsed.count() > 0) {
        stats.average_speed_bps = ((session.bytes_transferred - session.baseline_bytes) * 1000) / elapsed.count();
    }

    if (session.bytes_transferred >= session.total_bytes) {
        stats.estimated_time_remaining = std::chrono::milliseconds(0);
    } else {
        // Current speed when available, otherwise the average.
        std::uint64_t speed = stats.current_speed_bps > 0 ? stats.current_speed_bps : stats.average_speed_bps;
        if (speed > 0) {
            std::uint64_t remaining_bytes = session.total_bytes - session.bytes_transferred;
            stats.estimated_time_remaining = std::chrono::milliseconds((remaining_bytes * 1000) / speed);
        }
    }

    return stats;
}

std::uint64_t PerformanceMonitor::current_speed(const SessionData& session, Clock::time_point now) const {
    auto window_start = now - speed_window_;

    std::uint64_t recent_bytes = 0;
    for (const auto& [timestamp, bytes] : session.transfer_history) {
        if (timestamp > window_start) {
            recent_bytes += bytes;
        }
    }

    // A session younger than the window is measured over its actual age.
    auto span = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(now - session.start_time),
                         speed_window_);
    if (span.count() <= 0) {
        return 0;
    }
    return (recent_bytes * 1000) / span.count();
}

void PerformanceMonitor::cleanup_old_history(SessionData& session, Clock::time_point now) const {
    auto cutoff = now - HISTORY_WINDOW;

    while (!session.transfer_history.empty() &&
           session.transfer_history.front().first < cutoff) {
        session.transfer_history.pop_front();
    }
}

} // namespace puresend::transfer
