#pragma once

#include "../storage/file_metadata.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace puresend::transfer {

// pending -> transferring -> {completed, failed, cancelled, interrupted}
enum class TaskStatus {
    Pending,
    Transferring,
    Completed,
    Failed,
    Cancelled,
    Interrupted
};

enum class TransferDirection { Send, Receive };

const char* to_string(TaskStatus status);
const char* to_string(TransferDirection direction);

// completed, failed or cancelled
bool is_terminal(TaskStatus status);

struct TaskPeer {
    std::string id;
    std::string name;
    std::string ip;
    std::uint16_t port = 0;
};

struct TransferTask {
    std::string id;
    storage::FileMetadata file;
    TransferDirection direction = TransferDirection::Send;
    std::optional<TaskPeer> peer;
    TaskStatus status = TaskStatus::Pending;

    int progress = 0;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t speed = 0; // bytes per second
    std::optional<std::chrono::milliseconds> estimated_time_remaining;

    bool resumable = false;
    std::uint64_t resume_offset = 0;
    bool resumed = false;
    bool encrypted = false;
    std::optional<double> compression_ratio;

    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::optional<std::string> error;

    std::string source_path;            // send side
    std::optional<std::string> save_path; // receive side, final destination
    std::string mode = "local";

    // Sets transferred bytes and the rounded percentage together.
    void set_transferred(std::uint64_t bytes);
};

struct TransferProgress {
    std::string task_id;
    TaskStatus status = TaskStatus::Pending;
    int progress = 0;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t speed = 0;
    std::optional<std::chrono::milliseconds> estimated_time_remaining;
    std::optional<std::string> error;
};

// Raised on the receiving side when an offer needs acceptIncoming/rejectIncoming.
struct IncomingOffer {
    std::string task_id;
    std::string sender_id;
    std::string sender_name;
    std::string sender_ip;
    storage::FileMetadata file;
    bool encrypted = false;
};

TransferProgress make_progress(const TransferTask& task);

void to_json(nlohmann::json& j, const TransferTask& task);
void to_json(nlohmann::json& j, const TransferProgress& progress);
void to_json(nlohmann::json& j, const IncomingOffer& offer);

} // namespace puresend::transfer
