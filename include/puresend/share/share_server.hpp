#pragma once

#include "access_registry.hpp"
#include "share_models.hpp"
#include "../network/http_common.hpp"
#include "../storage/file_metadata.hpp"
#include "../transfer/performance_monitor.hpp"
#include "../core/error.hpp"
#include <atomic>
#include <chrono>
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

struct ShareServerConfig {
    std::uint16_t port = 0; // 0 picks a free port
    std::size_t max_files = 1000;
    std::uint64_t max_total_size = 256ULL * 1024 * 1024 * 1024; // 256GB
    AccessPolicy access;
    std::chrono::milliseconds progress_interval{100};

    static ShareServerConfig from_config(const core::Config& config);
};

struct DownloadProgress {
    std::string request_id;
    std::string record_id;
    std::string client_ip;
    std::string file_name;
    std::uint64_t transferred_bytes = 0;
    std::uint64_t total_bytes = 0;
    double progress = 0.0;
    std::uint64_t speed = 0;
    RecordStatus status = RecordStatus::Transferring;
};

void to_json(nlohmann::json& j, const DownloadProgress& progress);

// Serves a fixed set of files over HTTP to clients the host approved.
//
// Routes: GET / (landing page), GET /files, POST /verify-pin, GET /request-status and
// GET /download/{fileId}. Every download becomes a TransferRecord of the client's request.
class ShareServer {
public:
    using DownloadHandler = std::function<void(const DownloadProgress&)>;

    explicit ShareServer(ShareServerConfig config, AccessRegistry::Clock clock = nullptr);
    ~ShareServer();

    ShareServer(const ShareServer&) = delete;
    ShareServer& operator=(const ShareServer&) = delete;

    // Every file needs a path. CAPACITY_ERROR above max_files or max_total_size.
    core::Result start(const std::vector<storage::FileMetadata>& files,
                       const ShareSettings& settings,
                       ShareLinkInfo& info);

    // Closes the listener and aborts downloads in flight. Idempotent.
    void stop();

    bool is_active() const { return active_; }
    std::optional<ShareLinkInfo> get_info() const;

    core::Result update_files(const std::vector<storage::FileMetadata>& files);
    core::Result update_settings(const ShareSettings& settings);

    core::Result accept_request(const std::string& request_id);
    core::Result reject_request(const std::string& request_id);
    std::vector<AccessRequest> get_requests() const;

    AccessRegistry& access() { return access_; }

    void set_request_handler(AccessRegistry::ChangeHandler handler);
    void set_download_handler(DownloadHandler handler);

private:
    void handle(network::HttpExchange& exchange);
    core::Result handle_index(network::HttpExchange& exchange);
    core::Result handle_files(network::HttpExchange& exchange);
    core::Result handle_verify_pin(network::HttpExchange& exchange);
    core::Result handle_request_status(network::HttpExchange& exchange);
    core::Result handle_download(network::HttpExchange& exchange, const std::string& file_id);

    core::Result check_capacity(const std::vector<storage::FileMetadata>& files) const;
    void emit(const DownloadProgress& progress);

    ShareServerConfig config_;
    AccessRegistry access_;
    transfer::PerformanceMonitor monitor_;

    std::unique_ptr<network::HttpServer> http_;
    std::optional<ShareLinkInfo> info_;
    std::unordered_map<std::string, storage::FileMetadata> files_by_id_;
    mutable std::mutex mutex_;
    std::atomic<bool> active_;

    DownloadHandler download_handler_;
    std::mutex handler_mutex_;
};

} // namespace puresend::share
