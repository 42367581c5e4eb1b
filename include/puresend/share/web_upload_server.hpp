#pragma once

#include "access_registry.hpp"
#include "share_models.hpp"
#include "../network/http_common.hpp"
#include "../storage/chunk_manager.hpp"
#include "../storage/file_metadata.hpp"
#include "../transfer/performance_monitor.hpp"
#include "../core/error.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace puresend::core {
class Config;
}

namespace puresend::share {

struct WebUploadConfig {
    std::uint16_t port = 0; // 0 picks a free port
    std::filesystem::path receive_directory;
    bool auto_receive = false;
    bool overwrite = false;

    std::uint32_t chunk_size = 1024 * 1024;        // offered to clients that do not ask for one
    std::uint32_t max_chunk_size = 10 * 1024 * 1024; // request body limit per chunk
    std::uint32_t min_chunk_size = 64 * 1024;
    std::uint64_t max_chunk_count = 1 << 20;          // bounds the per-upload chunk table
    std::uint64_t max_file_size = 64ULL * 1024 * 1024 * 1024;
    std::chrono::hours session_expiry{24};
    std::chrono::milliseconds progress_interval{100};

    static WebUploadConfig from_config(const core::Config& config);
};

struct WebUploadInfo {
    std::vector<std::string> urls;
    std::uint16_t port = 0;
};

enum class UploadEventKind { Started, Progress, Completed, Failed };

const char* to_string(UploadEventKind kind);

struct WebUploadEvent {
    UploadEventKind kind = UploadEventKind::Started;
    std::string request_id;
    std::string upload_id;
    std::string client_ip;
    std::string file_name;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    double progress = 0.0;
    std::uint64_t speed = 0;
    std::optional<std::string> saved_path;
    std::optional<std::string> file_hash;
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const WebUploadInfo& info);
void to_json(nlohmann::json& j, const WebUploadEvent& event);

// Lets browsers on the LAN push files into the receive directory.
//
// A file is announced with POST /upload/init and then sent as fixed-size chunks in any
// order with POST /upload/chunk. Chunks go straight to their offset in a partial file; the
// file is moved to its final name once every chunk arrived. Clients need an accepted
// access request first, obtained by visiting / or /request-status.
class WebUploadServer {
public:
    using EventHandler = std::function<void(const WebUploadEvent&)>;

    explicit WebUploadServer(WebUploadConfig config, AccessRegistry::Clock clock = nullptr);
    ~WebUploadServer();

    WebUploadServer(const WebUploadServer&) = delete;
    WebUploadServer& operator=(const WebUploadServer&) = delete;

    core::Result start(WebUploadInfo& info);

    // Stops listening and drops unfinished uploads together with their partial files.
    void stop();

    bool is_running() const { return running_; }

    core::Result accept_request(const std::string& request_id);
    core::Result reject_request(const std::string& request_id);
    std::vector<AccessRequest> get_requests() const;

    void set_auto_receive(bool enabled);
    void set_overwrite(bool enabled);
    void set_receive_directory(const std::filesystem::path& directory);

    void set_request_handler(AccessRegistry::ChangeHandler handler);
    void set_event_handler(EventHandler handler);

private:
    struct UploadSession {
        std::string id;
        std::string request_id;
        std::string client_ip;
        std::string file_name;
        storage::FileMetadata layout; // chunk table only, no hashes
        storage::ChunkBitmap received;
        std::filesystem::path partial_path;
        std::filesystem::path directory;
        std::uint64_t received_bytes = 0;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_event;
        bool finishing = false;
    };

    void handle(network::HttpExchange& exchange);
    core::Result handle_index(network::HttpExchange& exchange);
    core::Result handle_request_status(network::HttpExchange& exchange);
    core::Result handle_capabilities(network::HttpExchange& exchange);
    core::Result handle_init(network::HttpExchange& exchange);
    core::Result handle_chunk(network::HttpExchange& exchange);
    core::Result handle_status(network::HttpExchange& exchange, const std::string& upload_id);

    // Moves the complete partial file into place and hashes it.
    core::Result finish_upload(const UploadSession& session, std::filesystem::path& saved_path,
                               std::string& file_hash);
    void purge_expired_sessions();
    void emit(const WebUploadEvent& event);

    WebUploadConfig config_;
    AccessRegistry access_;
    storage::ChunkManager chunk_manager_;
    transfer::PerformanceMonitor monitor_;

    std::unique_ptr<network::HttpServer> http_;
    std::unordered_map<std::string, UploadSession> sessions_;
    mutable std::mutex mutex_;
    std::atomic<bool> running_;

    EventHandler event_handler_;
    std::mutex handler_mutex_;
};

} // namespace puresend::share
