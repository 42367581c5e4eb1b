#include "puresend/core/application.hpp"
#include "puresend/core/config.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include "puresend/crypto/random.hpp"
#include <nlohmann/json.hpp>

namespace puresend::core {

namespace {
    template<class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

std::string event_name(const AppEvent& event) {
    return std::visit(overloaded{
        [](const transfer::TransferProgress&) { return std::string("transfer-progress"); },
        [](const transfer::IncomingOffer&) { return std::string("incoming-offer"); },
        [](const share::WebUploadEvent&) { return std::string("web-upload-file"); },
        [](const share::DownloadProgress&) { return std::string("share-download"); },
        [](const RequestChange& change) {
            return std::string(change.source == RequestChange::Source::Share ? "share-request" : "web-upload-request");
        },
        [](const network::PeerEvent&) { return std::string("peer"); }
    }, event);
}

void to_json(nlohmann::json& j, const AppEvent& event) {
    nlohmann::json payload = std::visit(overloaded{
        [](const RequestChange& change) { return nlohmann::json(change.request); },
        [](const network::PeerEvent& peer) {
            return nlohmann::json{{"kind", network::to_string(peer.kind)}, {"peer", peer.peer}};
        },
        [](const auto& value) { return nlohmann::json(value); }
    }, event);

    j = nlohmann::json{
        {"type", event_name(event)},
        {"payload", std::move(payload)}
    };
}

ApplicationSettings ApplicationSettings::from_config(const Config& config) {
    ApplicationSettings settings;
    settings.storage = storage::StorageConfig::from_config(config);

    auto node_id = config.get_string("node.id");
    if (node_id.empty()) {
        node_id = crypto::SecureRandom::generate_id(8);
    }
    auto node_name = config.get_string("node.name", "puresend");

    auto& transfer = settings.transfer;
    transfer.local_id = node_id;
    transfer.local_name = node_name;
    transfer.port = static_cast<std::uint16_t>(config.get_int("transfer.port", 0));
    transfer.auto_receive = config.get_bool("receive.auto_accept", false);
    transfer.overwrite = config.get_bool("receive.overwrite", false);
    transfer.encryption = config.get_bool("transfer.encryption", false);
    transfer.compression.enabled = config.get_bool("transfer.compression", true);
    transfer.compression.mode = transfer::parse_compression_mode(config.get_string("transfer.compression_mode", "smart"))
                                    .value_or(transfer::CompressionMode::Smart);
    transfer.compression.level = config.get_int("transfer.compression_level", 6);
    transfer.offer_timeout = std::chrono::seconds(config.get_int("transfer.offer_timeout_seconds", 60));
    transfer.io_timeout = std::chrono::seconds(config.get_int("transfer.io_timeout_seconds", 30));

    auto& discovery = settings.discovery;
    discovery.local_id = node_id;
    discovery.local_name = node_name;
    discovery.device_type = config.get_string("node.device_type", "desktop");
    discovery.discovery_port = static_cast<std::uint16_t>(config.get_int("discovery.port", 5353));
    discovery.announce_interval = std::chrono::milliseconds(config.get_int("discovery.announce_interval_ms", 3000));
    discovery.peer_timeout = std::chrono::milliseconds(config.get_int("discovery.peer_timeout_ms", 10000));
    discovery.probe_timeout = std::chrono::milliseconds(config.get_int("discovery.probe_timeout_ms", 2000));
    settings.discovery_enabled = config.get_bool("discovery.enabled", true);

    settings.share = share::ShareServerConfig::from_config(config);
    settings.web_upload = share::WebUploadConfig::from_config(config);
    return settings;
}

Application::Application(ApplicationSettings settings,
                         network::ChannelFactory channel_factory,
                         std::shared_ptr<network::LivenessProbe> probe)
    : settings_(std::move(settings))
    , metadata_service_(settings_.storage)
    , ledger_(std::make_shared<storage::ResumeManager>(settings_.storage.database_path,
                                                       settings_.storage.resume_expiry))
    , transfers_(std::make_unique<transfer::TransferManager>(settings_.transfer, settings_.storage,
                                                             ledger_, std::move(channel_factory)))
    , discovery_(std::make_unique<network::PeerDiscoveryService>(settings_.discovery, std::move(probe)))
    , share_(std::make_unique<share::ShareServer>(settings_.share))
    , web_upload_(std::make_unique<share::WebUploadServer>(settings_.web_upload))
    , initialized_(false) {
    wire_events();
}

Application::~Application() {
    shutdown();
}

void Application::wire_events() {
    transfers_->set_progress_handler([this](const transfer::TransferProgress& progress) {
        events_.publish(progress);
    });
    transfers_->set_offer_handler([this](const transfer::IncomingOffer& offer) {
        events_.publish(offer);
    });
    discovery_->set_event_handler([this](const network::PeerEvent& event) {
        events_.publish(event);
    });
    share_->set_request_handler([this](const share::AccessRequest& request) {
        events_.publish(RequestChange{RequestChange::Source::Share, request});
    });
    share_->set_download_handler([this](const share::DownloadProgress& progress) {
        events_.publish(progress);
    });
    web_upload_->set_request_handler([this](const share::AccessRequest& request) {
        events_.publish(RequestChange{RequestChange::Source::WebUpload, request});
    });
    web_upload_->set_event_handler([this](const share::WebUploadEvent& event) {
        events_.publish(event);
    });
}

Result Application::initialize() {
    if (initialized_) {
        return Result();
    }

    if (!settings_.storage.create_directories()) {
        return Result(ErrorCode::IO_ERROR,
                      "Cannot create receive directory " + settings_.storage.receive_directory.string());
    }

    auto result = ledger_->initialize();
    if (!result) {
        LOG_ERROR("Cannot open resume ledger: {}", result.describe());
        return result;
    }

    result = transfers_->initialize();
    if (!result) {
        return result;
    }

    if (settings_.discovery_enabled) {
        auto started = discovery_->start();
        if (!started) {
            // Manual peers keep working without the multicast socket.
            LOG_WARN("Peer discovery unavailable: {}", started.describe());
        }
    }

    initialized_ = true;
    LOG_INFO("PureSend engine ready as {} ({})", settings_.transfer.local_name, settings_.transfer.local_id);
    return Result();
}

void Application::shutdown() {
    if (!initialized_) {
        return;
    }
    initialized_ = false;

    web_upload_->stop();
    share_->stop();
    discovery_->stop();

    auto stopped = transfers_->stop_receiving();
    if (!stopped && stopped.error != ErrorCode::STATE_ERROR) {
        LOG_WARN("Stopping the receiver: {}", stopped.describe());
    }
    LOG_INFO("PureSend engine stopped");
}

Result Application::prepare_transfer(const std::filesystem::path& path, storage::FileMetadata& metadata) const {
    return metadata_service_.prepare_transfer(path, metadata);
}

network::NetworkInfo Application::get_network_info() const {
    return network::get_network_info();
}

Result Application::send(const storage::FileMetadata& metadata, const std::string& peer_id,
                         const std::string& peer_ip, std::uint16_t peer_port, std::string& task_id) {
    transfer::TaskPeer peer;
    peer.id = peer_id;
    peer.ip = peer_ip;
    peer.port = peer_port;
    peer.name = peer_ip;
    if (auto known = discovery_->get_peer(peer_id)) {
        peer.name = known->name;
    }
    return transfers_->send(metadata, peer, task_id);
}

Result Application::cancel(const std::string& task_id) {
    return transfers_->cancel(task_id);
}

std::size_t Application::cleanup() {
    return transfers_->cleanup();
}

Result Application::remove_task(const std::string& task_id) {
    return transfers_->remove_task(task_id);
}

std::vector<transfer::TransferTask> Application::get_tasks() const {
    return transfers_->get_tasks();
}

std::optional<transfer::TransferTask> Application::get_task(const std::string& task_id) const {
    return transfers_->get_task(task_id);
}

Result Application::start_receiving(transfer::ReceivingState& state) {
    auto result = transfers_->start_receiving(state);
    if (result) {
        discovery_->set_transfer_port(state.port);
    }
    return result;
}

Result Application::stop_receiving() {
    return transfers_->stop_receiving();
}

Result Application::update_receive_directory(const std::filesystem::path& directory) {
    auto result = transfers_->update_receive_directory(directory);
    if (result) {
        web_upload_->set_receive_directory(directory);
    }
    return result;
}

Result Application::accept_incoming(const std::string& task_id) {
    return transfers_->accept_incoming(task_id);
}

Result Application::reject_incoming(const std::string& task_id) {
    return transfers_->reject_incoming(task_id);
}

void Application::set_auto_receive(bool enabled) {
    transfers_->set_auto_receive(enabled);
    web_upload_->set_auto_receive(enabled);
}

void Application::set_overwrite(bool enabled) {
    transfers_->set_overwrite(enabled);
    web_upload_->set_overwrite(enabled);
}

std::vector<transfer::TransferTask> Application::get_resumable_tasks() {
    return transfers_->get_resumable_tasks();
}

Result Application::resume_transfer(const std::string& task_id) {
    return transfers_->resume_transfer(task_id);
}

Result Application::cleanup_resume_info(const std::optional<std::string>& task_id) {
    return transfers_->cleanup_resume_info(task_id);
}

Result Application::start_web_upload(share::WebUploadInfo& info) {
    return web_upload_->start(info);
}

void Application::stop_web_upload() {
    web_upload_->stop();
}

Result Application::accept_web_upload_request(const std::string& request_id) {
    return web_upload_->accept_request(request_id);
}

Result Application::reject_web_upload_request(const std::string& request_id) {
    return web_upload_->reject_request(request_id);
}

std::vector<share::AccessRequest> Application::get_web_upload_requests() const {
    return web_upload_->get_requests();
}

Result Application::start_share(const std::vector<storage::FileMetadata>& files,
                                const share::ShareSettings& settings, share::ShareLinkInfo& info) {
    return share_->start(files, settings, info);
}

void Application::stop_share() {
    share_->stop();
}

Result Application::update_share_settings(const share::ShareSettings& settings) {
    return share_->update_settings(settings);
}

Result Application::update_share_files(const std::vector<storage::FileMetadata>& files) {
    return share_->update_files(files);
}

Result Application::accept_request(const std::string& request_id) {
    return share_->accept_request(request_id);
}

Result Application::reject_request(const std::string& request_id) {
    return share_->reject_request(request_id);
}

std::vector<share::AccessRequest> Application::get_share_requests() const {
    return share_->get_requests();
}

std::optional<share::ShareLinkInfo> Application::get_share_info() const {
    return share_->get_info();
}

Result Application::add_manual(const std::string& ip, std::uint16_t port, network::PeerInfo& peer) {
    return discovery_->add_manual(ip, port, peer);
}

Result Application::refresh() {
    return discovery_->refresh();
}

Result Application::check_online(const std::string& peer_id, bool& online) {
    return discovery_->check_online(peer_id, online);
}

Result Application::remove_peer(const std::string& peer_id) {
    return discovery_->remove_peer(peer_id);
}

std::vector<network::PeerInfo> Application::get_peers() const {
    return discovery_->get_peers();
}

std::shared_ptr<Application::Subscription> Application::subscribe(std::size_t capacity) {
    return events_.subscribe(capacity);
}

} // namespace puresend::core
