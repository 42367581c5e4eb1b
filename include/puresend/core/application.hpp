#pragma once

#include "error.hpp"
#include "event_bus.hpp"
#include "../network/network_info.hpp"
#include "../network/peer_discovery.hpp"
#include "../network/transport.hpp"
#include "../share/share_models.hpp"
#include "../share/share_server.hpp"
#include "../share/web_upload_server.hpp"
#include "../storage/file_metadata.hpp"
#include "../storage/file_metadata_service.hpp"
#include "../storage/resume_manager.hpp"
#include "../storage/storage_config.hpp"
#include "../transfer/transfer_manager.hpp"
#include "../transfer/transfer_task.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace puresend::core {

class Config;

// An access request of the share or the web upload server changed.
struct RequestChange {
    enum class Source { Share, WebUpload };

    Source source = Source::Share;
    share::AccessRequest request;
};

using AppEvent = std::variant<transfer::TransferProgress,
                              transfer::IncomingOffer,
                              share::WebUploadEvent,
                              share::DownloadProgress,
                              RequestChange,
                              network::PeerEvent>;

// "transfer-progress", "incoming-offer", "web-upload-file", "share-download",
// "share-request", "web-upload-request" or "peer".
std::string event_name(const AppEvent& event);

// {"type": event_name(event), "payload": {...}}
void to_json(nlohmann::json& j, const AppEvent& event);

struct ApplicationSettings {
    transfer::TransferSettings transfer;
    storage::StorageConfig storage;
    network::DiscoveryConfig discovery;
    bool discovery_enabled = true;
    share::ShareServerConfig share;
    share::WebUploadConfig web_upload;

    static ApplicationSettings from_config(const Config& config);
};

// The command surface of the engine. Owns every component and forwards their
// notifications to the event bus.
class Application {
public:
    using Subscription = EventBus<AppEvent>::Subscription;

    explicit Application(ApplicationSettings settings,
                         network::ChannelFactory channel_factory = nullptr,
                         std::shared_ptr<network::LivenessProbe> probe = nullptr);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Creates directories, opens the resume ledger and starts discovery when enabled.
    Result initialize();
    void shutdown();

    // Files
    Result prepare_transfer(const std::filesystem::path& path, storage::FileMetadata& metadata) const;
    network::NetworkInfo get_network_info() const;

    // Transfers
    Result send(const storage::FileMetadata& metadata, const std::string& peer_id,
                const std::string& peer_ip, std::uint16_t peer_port, std::string& task_id);
    Result cancel(const std::string& task_id);
    std::size_t cleanup();
    Result remove_task(const std::string& task_id);
    std::vector<transfer::TransferTask> get_tasks() const;
    std::optional<transfer::TransferTask> get_task(const std::string& task_id) const;

    Result start_receiving(transfer::ReceivingState& state);
    Result stop_receiving();
    Result update_receive_directory(const std::filesystem::path& directory);
    Result accept_incoming(const std::string& task_id);
    Result reject_incoming(const std::string& task_id);
    void set_auto_receive(bool enabled);
    void set_overwrite(bool enabled);

    // Resume
    std::vector<transfer::TransferTask> get_resumable_tasks();
    Result resume_transfer(const std::string& task_id);
    Result cleanup_resume_info(const std::optional<std::string>& task_id);

    // Web upload
    Result start_web_upload(share::WebUploadInfo& info);
    void stop_web_upload();
    Result accept_web_upload_request(const std::string& request_id);
    Result reject_web_upload_request(const std::string& request_id);
    std::vector<share::AccessRequest> get_web_upload_requests() const;

    // Share
    Result start_share(const std::vector<storage::FileMetadata>& files,
                       const share::ShareSettings& settings, share::ShareLinkInfo& info);
    void stop_share();
    Result update_share_settings(const share::ShareSettings& settings);
    Result update_share_files(const std::vector<storage::FileMetadata>& files);
    Result accept_request(const std::string& request_id);
    Result reject_request(const std::string& request_id);
    std::vector<share::AccessRequest> get_share_requests() const;
    std::optional<share::ShareLinkInfo> get_share_info() const;

    // Peers
    Result add_manual(const std::string& ip, std::uint16_t port, network::PeerInfo& peer);
    Result refresh();
    Result check_online(const std::string& peer_id, bool& online);
    Result remove_peer(const std::string& peer_id);
    std::vector<network::PeerInfo> get_peers() const;

    std::shared_ptr<Subscription> subscribe(std::size_t capacity = EventBus<AppEvent>::DEFAULT_CAPACITY);

    const ApplicationSettings& settings() const { return settings_; }

private:
    void wire_events();

    ApplicationSettings settings_;
    storage::FileMetadataService metadata_service_;
    std::shared_ptr<storage::ResumeManager> ledger_;

    EventBus<AppEvent> events_;

    std::unique_ptr<transfer::TransferManager> transfers_;
    std::unique_ptr<network::PeerDiscoveryService> discovery_;
    std::unique_ptr<share::ShareServer> share_;
    std::unique_ptr<share::WebUploadServer> web_upload_;

    bool initialized_;
};

} // namespace puresend::core
