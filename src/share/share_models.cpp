#include "puresend/share/share_models.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

namespace puresend::share {

using core::utils::TimeUtils;

namespace {
    nlohmann::json optional_time(const std::optional<std::chrono::system_clock::time_point>& time) {
        return time ? nlohmann::json(TimeUtils::to_unix_millis(*time)) : nlohmann::json(nullptr);
    }
}

const char* to_string(ShareStatus status) {
    return status == ShareStatus::Active ? "active" : "stopped";
}

const char* to_string(RequestStatus status) {
    switch (status) {
        case RequestStatus::Pending: return "pending";
        case RequestStatus::Accepted: return "accepted";
        case RequestStatus::Rejected: return "rejected";
    }
    return "unknown";
}

const char* to_string(RecordStatus status) {
    switch (status) {
        case RecordStatus::Transferring: return "transferring";
        case RecordStatus::Completed: return "completed";
        case RecordStatus::Failed: return "failed";
        case RecordStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(ActivityStatus status) {
    switch (status) {
        case ActivityStatus::Idle: return "idle";
        case ActivityStatus::Transferring: return "transferring";
        case ActivityStatus::Completed: return "completed";
        case ActivityStatus::Failed: return "failed";
    }
    return "unknown";
}

ActivityStatus aggregate_status(const std::vector<TransferRecord>& records) {
    auto has = [&records](RecordStatus status) {
        return std::any_of(records.begin(), records.end(),
                           [status](const TransferRecord& r) { return r.status == status; });
    };

    if (has(RecordStatus::Transferring)) {
        return ActivityStatus::Transferring;
    }
    if (has(RecordStatus::Failed)) {
        return ActivityStatus::Failed;
    }
    if (!records.empty() &&
        std::all_of(records.begin(), records.end(),
                    [](const TransferRecord& r) { return r.status == RecordStatus::Completed; })) {
        return ActivityStatus::Completed;
    }
    return ActivityStatus::Idle;
}

ActivityStatus AccessRequest::activity() const {
    return aggregate_status(records);
}

void to_json(nlohmann::json& j, const ShareSettings& settings) {
    j = nlohmann::json{
        {"pinEnabled", settings.pin_enabled},
        {"pin", settings.pin ? nlohmann::json(*settings.pin) : nlohmann::json(nullptr)},
        {"autoAccept", settings.auto_accept}
    };
}

void from_json(const nlohmann::json& j, ShareSettings& settings) {
    settings.pin_enabled = j.value("pinEnabled", false);
    settings.auto_accept = j.value("autoAccept", false);
    if (j.contains("pin") && j["pin"].is_string()) {
        settings.pin = j["pin"].get<std::string>();
    } else {
        settings.pin.reset();
    }
}

void to_json(nlohmann::json& j, const ShareLinkInfo& info) {
    j = nlohmann::json{
        {"links", info.links},
        {"port", info.port},
        {"files", info.files},
        {"createdAt", TimeUtils::to_unix_millis(info.created_at)},
        {"pinEnabled", info.pin_enabled},
        {"pin", info.pin ? nlohmann::json(*info.pin) : nlohmann::json(nullptr)},
        {"autoAccept", info.auto_accept},
        {"status", to_string(info.status)}
    };
}

void to_json(nlohmann::json& j, const TransferRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"fileName", record.file_name},
        {"fileSize", record.file_size},
        {"transferredBytes", record.transferred_bytes},
        {"progress", record.progress},
        {"speed", record.speed},
        {"status", to_string(record.status)},
        {"startedAt", TimeUtils::to_unix_millis(record.started_at)},
        {"completedAt", optional_time(record.completed_at)}
    };
    if (record.error) {
        j["error"] = *record.error;
    }
}

void to_json(nlohmann::json& j, const AccessRequest& request) {
    j = nlohmann::json{
        {"id", request.id},
        {"ip", request.ip},
        {"userAgent", request.user_agent ? nlohmann::json(*request.user_agent) : nlohmann::json(nullptr)},
        {"requestedAt", TimeUtils::to_unix_millis(request.requested_at)},
        {"status", to_string(request.status)},
        {"pinVerified", request.pin_verified},
        {"pinAttempts", request.pin_attempts},
        {"locked", request.locked},
        {"lockedUntil", optional_time(request.locked_until)},
        {"transferStatus", to_string(request.activity())},
        {"records", request.records}
    };
}

void to_json(nlohmann::json& j, const PinVerifyResult& result) {
    j = nlohmann::json{
        {"success", result.success},
        {"locked", result.locked},
        {"locked_until", optional_time(result.locked_until)}
    };
    j["remaining_attempts"] = result.remaining_attempts ? nlohmann::json(*result.remaining_attempts)
                                                        : nlohmann::json(nullptr);
}

} // namespace puresend::share
