#pragma once

#include "transfer_task.hpp"
#include "performance_monitor.hpp"
#include "compression.hpp"
#include "../network/transport.hpp"
#include "../network/tcp_server.hpp"
#include "../storage/chunk_manager.hpp"
#include "../storage/resume_manager.hpp"
#include "../storage/storage_config.hpp"
#include "../core/error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace puresend::network {
class Connection;
}

namespace puresend::crypto {
class SessionCipher;
}

namespace puresend::transfer {

struct TransferSettings {
    std::string local_id;
    std::string local_name;

    std::uint16_t port = 0; // 0 picks a free port
    bool auto_receive = false;
    bool overwrite = false;
    bool encryption = false;
    CompressionSettings compression;

    std::chrono::milliseconds offer_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds progress_interval{100};
};

struct ReceivingState {
    bool is_receiving = false;
    std::uint16_t port = 0;
    std::string network_address;
    std::string share_code;
    bool auto_receive = false;
    bool file_overwrite = false;
};

void to_json(nlohmann::json& j, const ReceivingState& state);

class TransferSession;

// Owns every send and receive task of this node.
//
// Each task runs on its own worker thread and is strictly sequential: chunk N+1 is not
// sent before chunk N was acknowledged, and the receiver acknowledges only after the chunk
// verified and was written durably. Progress is committed to the resume ledger as it goes,
// so a connection drop leaves an interrupted task that resume_transfer() can continue.
class TransferManager {
public:
    using ProgressHandler = std::function<void(const TransferProgress&)>;
    using OfferHandler = std::function<void(const IncomingOffer&)>;

    TransferManager(TransferSettings settings,
                    storage::StorageConfig storage,
                    std::shared_ptr<storage::ResumeManager> ledger,
                    network::ChannelFactory channel_factory = nullptr);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Turns ledger records left active by a previous run into interrupted ones and drops expired ones.
    core::Result initialize();

    // Tasks are created pending; the worker opens the channel and offers the file.
    core::Result send(const storage::FileMetadata& metadata, const TaskPeer& peer, std::string& task_id);

    core::Result cancel(const std::string& task_id);
    // Completed, failed or cancelled tasks only; STATE_ERROR for anything else.
    core::Result remove_task(const std::string& task_id);

    // Removes completed, failed and cancelled tasks; returns how many went.
    std::size_t cleanup();

    std::vector<TransferTask> get_tasks() const;
    std::optional<TransferTask> get_task(const std::string& task_id) const;

    // Interrupted tasks whose ledger record still validates. Invalid or expired records are deleted.
    std::vector<TransferTask> get_resumable_tasks();

    core::Result resume_transfer(const std::string& task_id);

    // One record when `task_id` is set, every record otherwise. Idempotent.
    core::Result cleanup_resume_info(const std::optional<std::string>& task_id);

    core::Result start_receiving(ReceivingState& state);
    core::Result stop_receiving();
    ReceivingState get_receiving_state() const;

    core::Result update_receive_directory(const std::filesystem::path& directory);
    std::filesystem::path get_receive_directory() const;

    void set_auto_receive(bool enabled);
    void set_overwrite(bool enabled);

    core::Result accept_incoming(const std::string& task_id);
    core::Result reject_incoming(const std::string& task_id);

    void set_progress_handler(ProgressHandler handler);
    void set_offer_handler(OfferHandler handler);

    const TransferSettings& settings() const { return settings_; }

private:
    friend class TransferSession;

    struct TaskRuntime {
        std::atomic<bool> cancel_requested{false};
        std::thread worker;
        // Set while a send worker or a receive session drives the task.
        bool active = false;
        network::TransferChannel* channel = nullptr;
        std::chrono::steady_clock::time_point last_progress;

        // Receive side, while the offer waits for the user.
        bool awaiting_decision = false;
        std::optional<bool> decision;
    };

    struct TaskEntry {
        TransferTask task;
        std::unique_ptr<TaskRuntime> runtime;
    };

    struct SessionThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void run_send(const std::string& task_id, bool resume);
    core::Result stream_chunks(const std::string& task_id, network::TransferChannel& channel,
                               const storage::FileMetadata& file, const std::string& source_path,
                               std::uint32_t start_chunk, const crypto::SessionCipher* cipher,
                               std::optional<int> deflate_level, TaskRuntime& runtime);

    void handle_connection(network::tcp::socket socket);
    void reap_session_threads(bool wait_all);
    void register_connection(network::Connection* connection);
    void unregister_connection(network::Connection* connection);

    // Applies `update` under the lock and publishes progress when forced or the rate limit allows.
    void update_task(const std::string& task_id, const std::function<void(TransferTask&)>& update,
                     bool force_event);
    // Final transition of a worker; the worker must not touch its runtime afterwards.
    void finish_task(const std::string& task_id, TaskStatus status, const core::Result& cause);
    // `compression_ratio` is wire payload bytes over file bytes for the chunks moved so far.
    void record_bytes(const std::string& task_id, std::uint64_t chunk_bytes, std::uint64_t transferred,
                      std::optional<double> compression_ratio = std::nullopt);

    TaskRuntime* find_runtime_locked(const std::string& task_id);
    std::optional<TransferTask> rebuild_from_ledger(const storage::ResumeRecord& record) const;
    storage::ResumeRecord make_ledger_record(const TransferTask& task) const;
    void emit(const TransferProgress& progress);
    void emit_offer(const IncomingOffer& offer);

    TransferSettings settings_;
    storage::StorageConfig storage_;
    storage::ChunkManager chunk_manager_;
    std::shared_ptr<storage::ResumeManager> ledger_;
    network::ChannelFactory channel_factory_;
    PerformanceMonitor monitor_;

    std::unordered_map<std::string, TaskEntry> tasks_;
    mutable std::mutex tasks_mutex_;
    std::condition_variable decision_cv_;

    std::unique_ptr<network::TcpServer> server_;
    ReceivingState receiving_;
    mutable std::mutex receive_mutex_;

    std::vector<SessionThread> session_threads_;
    std::unordered_set<network::Connection*> open_connections_;
    std::mutex session_threads_mutex_;

    std::atomic<bool> shutting_down_;

    ProgressHandler progress_handler_;
    OfferHandler offer_handler_;
    std::mutex handler_mutex_;
};

} // namespace puresend::transfer
