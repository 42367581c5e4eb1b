#include "puresend/share/access_registry.hpp"
#include "puresend/crypto/random.hpp"
#include "puresend/core/logger.hpp"
#include <sodium.h>
#include <algorithm>

namespace puresend::share {

namespace {
    double percent(std::uint64_t done, std::uint64_t total) {
        if (total == 0) {
            return 0.0;
        }
        return std::min(100.0, 100.0 * static_cast<double>(done) / static_cast<double>(total));
    }

    bool pin_matches(const std::string& given, const std::string& expected) {
        if (given.size() != expected.size()) {
            return false;
        }
        return sodium_memcmp(given.data(), expected.data(), expected.size()) == 0;
    }
}

AccessRegistry::AccessRegistry(AccessPolicy policy, Clock clock)
    : policy_(policy)
    , clock_(std::move(clock)) {
    if (policy_.max_pin_attempts == 0) {
        policy_.max_pin_attempts = 1;
    }
}

std::chrono::system_clock::time_point AccessRegistry::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

void AccessRegistry::set_settings(const ShareSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

void AccessRegistry::update_settings(const ShareSettings& settings) {
    std::vector<AccessRequest> changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool pin_was_required = settings_.requires_pin();
        settings_ = settings;

        if (pin_was_required && !settings_.requires_pin()) {
            attempts_.clear();
            for (auto& [id, request] : requests_) {
                if (request.locked || request.pin_attempts > 0) {
                    request.locked = false;
                    request.locked_until.reset();
                    request.pin_attempts = 0;
                    changed.push_back(request);
                }
            }
            LOG_INFO("PIN disabled, all client IPs unlocked");
        }

        if (settings_.auto_accept) {
            for (auto& [id, request] : requests_) {
                if (request.status == RequestStatus::Pending) {
                    request.status = RequestStatus::Accepted;
                    verified_ips_.insert(request.ip);
                    changed.push_back(request);
                }
            }
        }
    }
    notify(changed);
}

ShareSettings AccessRegistry::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

AccessDecision AccessRegistry::check(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rejected_ips_.count(ip)) {
        return AccessDecision::Rejected;
    }

    const AccessRequest* request = find_by_ip_locked(ip);
    if (settings_.requires_pin() && !verified_ips_.count(ip) && !request) {
        return AccessDecision::PinRequired;
    }
    if (!request) {
        return AccessDecision::NoRequest;
    }

    switch (request->status) {
        case RequestStatus::Accepted: return AccessDecision::Allowed;
        case RequestStatus::Rejected: return AccessDecision::Rejected;
        case RequestStatus::Pending: return AccessDecision::Pending;
    }
    return AccessDecision::Pending;
}

std::optional<AccessRequest> AccessRegistry::touch(const std::string& ip,
                                                   const std::optional<std::string>& user_agent) {
    AccessRequest created;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const AccessRequest* existing = find_by_ip_locked(ip)) {
            return *existing;
        }
        if (settings_.requires_pin() && !verified_ips_.count(ip)) {
            return std::nullopt;
        }
        created = create_locked(ip, user_agent);
    }

    notify({created});
    return created;
}

core::Result AccessRegistry::verify_pin(const std::string& ip, const std::string& pin,
                                        const std::optional<std::string>& user_agent,
                                        PinVerifyResult& result) {
    result = PinVerifyResult{};
    std::vector<AccessRequest> changed;
    core::Result outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = now();

        auto attempt = attempts_.find(ip);
        if (attempt != attempts_.end() && attempt->second.locked) {
            if (attempt->second.locked_until && current < *attempt->second.locked_until) {
                result.remaining_attempts = 0;
                result.locked = true;
                result.locked_until = attempt->second.locked_until;
                return core::Result(core::ErrorCode::REJECTED, "Too many wrong PINs from " + ip);
            }
            // The lock ran out, the next attempt starts a fresh count.
            attempts_.erase(attempt);
            project_attempts_locked(ip);
        }

        if (!settings_.requires_pin()) {
            return core::Result(core::ErrorCode::STATE_ERROR, "No PIN is configured");
        }

        if (pin_matches(pin, *settings_.pin)) {
            attempts_.erase(ip);
            verified_ips_.insert(ip);

            AccessRequest* request = find_by_ip_locked(ip);
            if (!request) {
                request = &create_locked(ip, user_agent);
            } else if (request->status == RequestStatus::Pending && settings_.auto_accept) {
                request->status = RequestStatus::Accepted;
            }
            request->pin_verified = true;
            request->pin_attempts = 0;
            request->locked = false;
            request->locked_until.reset();
            changed.push_back(*request);

            result.success = true;
            LOG_INFO("PIN verified for {}", ip);
        } else {
            auto& state = attempts_[ip];
            ++state.attempts;
            if (state.attempts >= policy_.max_pin_attempts) {
                state.locked = true;
                state.locked_until = current + policy_.lock_duration;
                LOG_WARN("Locking {} after {} wrong PINs", ip, state.attempts);
            }
            project_attempts_locked(ip);
            if (const AccessRequest* request = find_by_ip_locked(ip)) {
                changed.push_back(*request);
            }

            result.remaining_attempts = state.attempts >= policy_.max_pin_attempts
                ? 0 : policy_.max_pin_attempts - state.attempts;
            result.locked = state.locked;
            result.locked_until = state.locked_until;
            outcome = core::Result(core::ErrorCode::AUTH_ERROR, "Wrong PIN");
        }
    }

    notify(changed);
    return outcome;
}

core::Result AccessRegistry::accept(const std::string& request_id) {
    AccessRequest changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(request_id);
        if (it == requests_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown access request: " + request_id);
        }
        if (it->second.status != RequestStatus::Pending) {
            return core::Result(core::ErrorCode::STATE_ERROR,
                                std::string("Access request is already ") + to_string(it->second.status));
        }
        it->second.status = RequestStatus::Accepted;
        verified_ips_.insert(it->second.ip);
        rejected_ips_.erase(it->second.ip);
        changed = it->second;
    }

    LOG_INFO("Access request {} from {} accepted", changed.id, changed.ip);
    notify({changed});
    return core::Result();
}

core::Result AccessRegistry::reject(const std::string& request_id) {
    AccessRequest changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(request_id);
        if (it == requests_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown access request: " + request_id);
        }
        if (it->second.status != RequestStatus::Pending) {
            return core::Result(core::ErrorCode::STATE_ERROR,
                                std::string("Access request is already ") + to_string(it->second.status));
        }
        it->second.status = RequestStatus::Rejected;
        rejected_ips_.insert(it->second.ip);
        verified_ips_.erase(it->second.ip);
        changed = it->second;
    }

    LOG_INFO("Access request {} from {} rejected", changed.id, changed.ip);
    notify({changed});
    return core::Result();
}

bool AccessRegistry::is_allowed(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const AccessRequest* request = find_by_ip_locked(ip);
    return request && request->status == RequestStatus::Accepted;
}

bool AccessRegistry::is_rejected(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_ips_.count(ip) > 0;
}

bool AccessRegistry::is_verified(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return verified_ips_.count(ip) > 0;
}

bool AccessRegistry::is_locked(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return still_locked_locked(ip);
}

std::optional<std::chrono::system_clock::time_point> AccessRegistry::locked_until(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!still_locked_locked(ip)) {
        return std::nullopt;
    }
    return attempts_.at(ip).locked_until;
}

std::optional<AccessRequest> AccessRegistry::get(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AccessRequest> AccessRegistry::find_by_ip(const std::string& ip) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const AccessRequest* request = find_by_ip_locked(ip);
    if (!request) {
        return std::nullopt;
    }
    return *request;
}

std::vector<AccessRequest> AccessRegistry::list() const {
    std::vector<AccessRequest> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(requests_.size());
        for (const auto& [id, request] : requests_) {
            result.push_back(request);
        }
    }
    std::sort(result.begin(), result.end(), [](const AccessRequest& a, const AccessRequest& b) {
        return a.requested_at < b.requested_at;
    });
    return result;
}

core::Result AccessRegistry::start_record(const std::string& ip, const std::string& file_name,
                                          std::uint64_t file_size, std::string& record_id) {
    AccessRequest changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        AccessRequest* request = find_by_ip_locked(ip);
        if (!request) {
            return core::Result(core::ErrorCode::NOT_FOUND, "No access request for " + ip);
        }

        if (record_id.empty()) {
            record_id = crypto::SecureRandom::generate_id(16);
        }

        TransferRecord record;
        record.id = record_id;
        record.file_name = file_name;
        record.file_size = file_size;
        record.started_at = now();
        request->records.insert(request->records.begin(), std::move(record));
        changed = *request;
    }

    notify({changed});
    return core::Result();
}

void AccessRegistry::update_record(const std::string& record_id, std::uint64_t transferred_bytes,
                                   std::uint64_t speed) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferRecord* record = nullptr;
    if (!find_by_record_locked(record_id, record)) {
        return;
    }
    record->transferred_bytes = std::min(transferred_bytes, record->file_size);
    record->speed = speed;
    record->progress = percent(record->transferred_bytes, record->file_size);
}

void AccessRegistry::finish_record(const std::string& record_id, RecordStatus status,
                                   const std::optional<std::string>& error) {
    AccessRequest changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TransferRecord* record = nullptr;
        AccessRequest* request = find_by_record_locked(record_id, record);
        if (!request) {
            return;
        }

        record->status = status;
        record->speed = 0;
        record->completed_at = now();
        record->error = error;
        if (status == RecordStatus::Completed) {
            record->transferred_bytes = record->file_size;
            record->progress = 100.0;
        }
        changed = *request;
    }

    notify({changed});
}

void AccessRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.clear();
    attempts_.clear();
    verified_ips_.clear();
    rejected_ips_.clear();
}

void AccessRegistry::set_change_handler(ChangeHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    change_handler_ = std::move(handler);
}

AccessRequest* AccessRegistry::find_by_ip_locked(const std::string& ip) {
    for (auto& [id, request] : requests_) {
        if (request.ip == ip) {
            return &request;
        }
    }
    return nullptr;
}

const AccessRequest* AccessRegistry::find_by_ip_locked(const std::string& ip) const {
    for (const auto& [id, request] : requests_) {
        if (request.ip == ip) {
            return &request;
        }
    }
    return nullptr;
}

AccessRequest* AccessRegistry::find_by_record_locked(const std::string& record_id, TransferRecord*& record) {
    for (auto& [id, request] : requests_) {
        for (auto& candidate : request.records) {
            if (candidate.id == record_id) {
                record = &candidate;
                return &request;
            }
        }
    }
    return nullptr;
}

AccessRequest& AccessRegistry::create_locked(const std::string& ip, const std::optional<std::string>& user_agent) {
    AccessRequest request;
    request.id = crypto::SecureRandom::generate_id(16);
    request.ip = ip;
    request.user_agent = user_agent;
    request.requested_at = now();
    request.pin_verified = verified_ips_.count(ip) > 0;
    if (settings_.auto_accept) {
        request.status = RequestStatus::Accepted;
        verified_ips_.insert(ip);
    }

    LOG_INFO("New access request {} from {} ({})", request.id, ip, to_string(request.status));
    auto [it, inserted] = requests_.emplace(request.id, std::move(request));
    auto& stored = it->second;
    project_attempts_locked(ip);
    return stored;
}

bool AccessRegistry::still_locked_locked(const std::string& ip) const {
    auto it = attempts_.find(ip);
    return it != attempts_.end() && it->second.locked && it->second.locked_until &&
           now() < *it->second.locked_until;
}

void AccessRegistry::project_attempts_locked(const std::string& ip) {
    AccessRequest* request = find_by_ip_locked(ip);
    if (!request) {
        return;
    }

    auto it = attempts_.find(ip);
    if (it == attempts_.end()) {
        request->pin_attempts = 0;
        request->locked = false;
        request->locked_until.reset();
    } else {
        request->pin_attempts = it->second.attempts;
        request->locked = it->second.locked;
        request->locked_until = it->second.locked_until;
    }
}

void AccessRegistry::notify(const std::vector<AccessRequest>& changed) {
    if (changed.empty()) {
        return;
    }

    ChangeHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = change_handler_;
    }
    if (!handler) {
        return;
    }
    for (const auto& request : changed) {
        handler(request);
    }
}

} // namespace puresend::share
