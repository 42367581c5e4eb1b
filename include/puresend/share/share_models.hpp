#pragma once

#include "../storage/file_metadata.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace puresend::share {

enum class ShareStatus { Active, Stopped };

// pending -> accepted | rejected
enum class RequestStatus { Pending, Accepted, Rejected };

enum class RecordStatus { Transferring, Completed, Failed, Cancelled };

// Aggregate over the records of one request.
enum class ActivityStatus { Idle, Transferring, Completed, Failed };

const char* to_string(ShareStatus status);
const char* to_string(RequestStatus status);
const char* to_string(RecordStatus status);
const char* to_string(ActivityStatus status);

struct ShareSettings {
    bool pin_enabled = false;
    std::optional<std::string> pin;
    bool auto_accept = false;

    // A PIN is only enforced when enabled and non-empty.
    bool requires_pin() const { return pin_enabled && pin && !pin->empty(); }
};

struct ShareLinkInfo {
    std::vector<std::string> links;
    std::uint16_t port = 0;
    std::vector<storage::FileMetadata> files;
    std::chrono::system_clock::time_point created_at;
    bool pin_enabled = false;
    std::optional<std::string> pin;
    bool auto_accept = false;
    ShareStatus status = ShareStatus::Active;
};

// One file moved for a request: a download on a share, an upload on web upload.
struct TransferRecord {
    std::string id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::uint64_t transferred_bytes = 0;
    double progress = 0.0;
    std::uint64_t speed = 0; // bytes per second
    RecordStatus status = RecordStatus::Transferring;
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::string> error;
};

struct AccessRequest {
    std::string id;
    std::string ip;
    std::optional<std::string> user_agent;
    std::chrono::system_clock::time_point requested_at;
    RequestStatus status = RequestStatus::Pending;

    bool pin_verified = false;
    std::uint32_t pin_attempts = 0;
    bool locked = false;
    std::optional<std::chrono::system_clock::time_point> locked_until;

    // Newest first.
    std::vector<TransferRecord> records;

    ActivityStatus activity() const;
};

struct PinVerifyResult {
    bool success = false;
    std::optional<std::uint32_t> remaining_attempts;
    bool locked = false;
    std::optional<std::chrono::system_clock::time_point> locked_until;
};

ActivityStatus aggregate_status(const std::vector<TransferRecord>& records);

void to_json(nlohmann::json& j, const ShareSettings& settings);
void from_json(const nlohmann::json& j, ShareSettings& settings);
void to_json(nlohmann::json& j, const ShareLinkInfo& info);
void to_json(nlohmann::json& j, const TransferRecord& record);
void to_json(nlohmann::json& j, const AccessRequest& request);
void to_json(nlohmann::json& j, const PinVerifyResult& result);

} // namespace puresend::share
