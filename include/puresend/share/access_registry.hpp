#pragma once

#include "share_models.hpp"
#include "../core/error.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace puresend::share {

struct AccessPolicy {
    std::uint32_t max_pin_attempts = 3;
    std::chrono::seconds lock_duration{300};
};

enum class AccessDecision {
    Allowed,
    Pending,
    PinRequired,
    Rejected,
    NoRequest
};

// Per-IP access requests of one HTTP server, their PIN state and their transfer records.
//
// A client IP owns at most one request. PIN failures are counted per IP even before a
// request exists; reaching the limit locks the IP until `locked_until`, and attempts made
// while locked are refused without being counted.
class AccessRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using ChangeHandler = std::function<void(const AccessRequest&)>;

    explicit AccessRegistry(AccessPolicy policy = {}, Clock clock = nullptr);

    AccessRegistry(const AccessRegistry&) = delete;
    AccessRegistry& operator=(const AccessRegistry&) = delete;

    // Replaces the settings without touching existing requests.
    void set_settings(const ShareSettings& settings);

    // Settings change on a running server: disabling the PIN unlocks every IP and enabling
    // auto accept accepts every pending request.
    void update_settings(const ShareSettings& settings);

    ShareSettings settings() const;
    const AccessPolicy& policy() const { return policy_; }

    AccessDecision check(const std::string& ip) const;

    // Request of `ip`, created on first contact unless a PIN has to be entered first.
    std::optional<AccessRequest> touch(const std::string& ip, const std::optional<std::string>& user_agent);

    // SUCCESS for the right PIN, AUTH_ERROR for a wrong one, REJECTED while locked and
    // STATE_ERROR when no PIN is configured. `result` is filled in every case.
    core::Result verify_pin(const std::string& ip, const std::string& pin,
                            const std::optional<std::string>& user_agent, PinVerifyResult& result);

    // pending -> accepted / pending -> rejected; STATE_ERROR from any other state.
    core::Result accept(const std::string& request_id);
    core::Result reject(const std::string& request_id);

    bool is_allowed(const std::string& ip) const;
    bool is_rejected(const std::string& ip) const;
    bool is_verified(const std::string& ip) const;
    bool is_locked(const std::string& ip) const;

    // End of the running lock of `ip`; unset when the IP is not locked.
    std::optional<std::chrono::system_clock::time_point> locked_until(const std::string& ip) const;

    std::optional<AccessRequest> get(const std::string& request_id) const;
    std::optional<AccessRequest> find_by_ip(const std::string& ip) const;

    // Oldest first.
    std::vector<AccessRequest> list() const;

    // Adds a transferring record to the request of `ip`. An empty `record_id` gets a random one.
    core::Result start_record(const std::string& ip, const std::string& file_name,
                              std::uint64_t file_size, std::string& record_id);
    void update_record(const std::string& record_id, std::uint64_t transferred_bytes, std::uint64_t speed);
    void finish_record(const std::string& record_id, RecordStatus status,
                       const std::optional<std::string>& error = std::nullopt);

    // Drops every request, verified IP and PIN attempt.
    void clear();

    void set_change_handler(ChangeHandler handler);

private:
    struct PinAttempt {
        std::uint32_t attempts = 0;
        bool locked = false;
        std::optional<std::chrono::system_clock::time_point> locked_until;
    };

    std::chrono::system_clock::time_point now() const;

    AccessRequest* find_by_ip_locked(const std::string& ip);
    const AccessRequest* find_by_ip_locked(const std::string& ip) const;
    AccessRequest* find_by_record_locked(const std::string& record_id, TransferRecord*& record);
    AccessRequest& create_locked(const std::string& ip, const std::optional<std::string>& user_agent);
    bool still_locked_locked(const std::string& ip) const;
    void project_attempts_locked(const std::string& ip);

    void notify(const std::vector<AccessRequest>& changed);

    AccessPolicy policy_;
    Clock clock_;

    ShareSettings settings_;
    std::unordered_map<std::string, AccessRequest> requests_;
    std::unordered_map<std::string, PinAttempt> attempts_;
    std::unordered_set<std::string> verified_ips_;
    std::unordered_set<std::string> rejected_ips_;
    mutable std::mutex mutex_;

    ChangeHandler change_handler_;
    std::mutex handler_mutex_;
};

} // namespace puresend::share
