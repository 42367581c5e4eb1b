#include "puresend/transfer/transfer_task.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace puresend::transfer {

using core::utils::TimeUtils;

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Transferring: return "transferring";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        case TaskStatus::Interrupted: return "interrupted";
    }
    return "unknown";
}

const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::Send ? "send" : "receive";
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

void TransferTask::set_transferred(std::uint64_t bytes) {
    transferred_bytes = std::min(bytes, file.size);
    if (file.size == 0) {
        progress = status == TaskStatus::Completed ? 100 : 0;
    } else {
        progress = static_cast<int>(std::lround(100.0 * static_cast<double>(transferred_bytes) /
                                                static_cast<double>(file.size)));
    }
}

TransferProgress make_progress(const TransferTask& task) {
    TransferProgress progress;
    progress.task_id = task.id;
    progress.status = task.status;
    progress.progress = task.progress;
    progress.transferred_bytes = task.transferred_bytes;
    progress.total_bytes = task.file.size;
    progress.speed = task.speed;
    progress.estimated_time_remaining = task.estimated_time_remaining;
    progress.error = task.error;
    return progress;
}

void to_json(nlohmann::json& j, const TransferTask& task) {
    j = nlohmann::json{
        {"id", task.id},
        {"file", task.file},
        {"fileName", task.file.name},
        {"fileSize", task.file.size},
        {"direction", to_string(task.direction)},
        {"status", to_string(task.status)},
        {"progress", task.progress},
        {"transferredBytes", task.transferred_bytes},
        {"speed", task.speed},
        {"resumable", task.resumable},
        {"resumeOffset", task.resume_offset},
        {"resumed", task.resumed},
        {"encrypted", task.encrypted},
        {"createdAt", TimeUtils::to_unix_millis(task.created_at)},
        {"mode", task.mode}
    };

    if (task.peer) {
        j["peer"] = {
            {"id", task.peer->id},
            {"name", task.peer->name},
            {"ip", task.peer->ip},
            {"port", task.peer->port}
        };
        j["peerName"] = task.peer->name;
    } else {
        j["peerName"] = nullptr;
    }

    j["completedAt"] = task.completed_at ? nlohmann::json(TimeUtils::to_unix_millis(*task.completed_at))
                                         : nlohmann::json(nullptr);
    if (task.estimated_time_remaining) {
        j["estimatedTimeRemaining"] = task.estimated_time_remaining->count();
    }
    if (task.compression_ratio) {
        j["compressionRatio"] = *task.compression_ratio;
    }
    if (task.error) {
        j["error"] = *task.error;
    }
    if (task.save_path) {
        j["savePath"] = *task.save_path;
    }
}

void to_json(nlohmann::json& j, const TransferProgress& progress) {
    j = nlohmann::json{
        {"taskId", progress.task_id},
        {"status", to_string(progress.status)},
        {"progress", progress.progress},
        {"transferredBytes", progress.transferred_bytes},
        {"totalBytes", progress.total_bytes},
        {"speed", progress.speed}
    };
    j["estimatedTimeRemaining"] = progress.estimated_time_remaining
        ? nlohmann::json(progress.estimated_time_remaining->count())
        : nlohmann::json(nullptr);
    if (progress.error) {
        j["error"] = *progress.error;
    }
}

void to_json(nlohmann::json& j, const IncomingOffer& offer) {
    j = nlohmann::json{
        {"taskId", offer.task_id},
        {"senderId", offer.sender_id},
        {"senderName", offer.sender_name},
        {"senderIp", offer.sender_ip},
        {"file", offer.file},
        {"encrypted", offer.encrypted}
    };
}

} // namespace puresend::transfer
