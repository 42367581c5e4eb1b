#include "puresend/network/peer_discovery.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <boost/asio/ip/multicast.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace puresend::network {

using core::utils::TimeUtils;

const char* to_string(PeerStatus status) {
    switch (status) {
        case PeerStatus::Online: return "online";
        case PeerStatus::Offline: return "offline";
        case PeerStatus::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(DeviceType type) {
    switch (type) {
        case DeviceType::Desktop: return "desktop";
        case DeviceType::Mobile: return "mobile";
        case DeviceType::Web: return "web";
        case DeviceType::Unknown: return "unknown";
    }
    return "unknown";
}

DeviceType device_type_from_string(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);
    if (lower == "desktop") return DeviceType::Desktop;
    if (lower == "mobile") return DeviceType::Mobile;
    if (lower == "web") return DeviceType::Web;
    return DeviceType::Unknown;
}

const char* to_string(PeerEventKind kind) {
    switch (kind) {
        case PeerEventKind::Discovered: return "discovered";
        case PeerEventKind::Updated: return "updated";
        case PeerEventKind::Offline: return "offline";
        case PeerEventKind::Removed: return "removed";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const PeerInfo& peer) {
    j = nlohmann::json{
        {"id", peer.id},
        {"name", peer.name},
        {"ip", peer.ip},
        {"port", peer.port},
        {"deviceType", to_string(peer.device_type)},
        {"status", to_string(peer.status)},
        {"discoveredAt", TimeUtils::to_unix_millis(peer.discovered_at)},
        {"lastSeen", TimeUtils::to_unix_millis(peer.last_seen)}
    };
}

bool TcpLivenessProbe::probe(const std::string& ip, std::uint16_t port, std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(ip, ec);
    if (ec) {
        return false;
    }

    boost::asio::io_context io_context;
    boost::asio::ip::tcp::socket socket(io_context);
    boost::system::error_code connect_ec = boost::asio::error::would_block;
    socket.async_connect(boost::asio::ip::tcp::endpoint(address, port),
        [&connect_ec](const boost::system::error_code& result) {
            connect_ec = result;
        });

    io_context.run_for(timeout);
    if (!io_context.stopped()) {
        socket.close(ec);
        io_context.run();
    }

    socket.close(ec);
    return !connect_ec;
}

PeerDiscoveryService::PeerDiscoveryService(DiscoveryConfig config, std::shared_ptr<LivenessProbe> probe)
    : config_(std::move(config))
    , probe_(probe ? std::move(probe) : std::make_shared<TcpLivenessProbe>())
    , transfer_port_(config_.transfer_port)
    , running_(false)
    , io_context_()
    , socket_(io_context_)
    , receive_buffer_{} {

    boost::system::error_code ec;
    auto group = boost::asio::ip::make_address(config_.multicast_group, ec);
    if (ec) {
        LOG_WARN("Invalid multicast group {}, using 239.255.42.99", config_.multicast_group);
        group = boost::asio::ip::make_address("239.255.42.99");
    }
    multicast_endpoint_ = udp::endpoint(group, config_.discovery_port);
}

PeerDiscoveryService::~PeerDiscoveryService() {
    stop();
}

core::Result PeerDiscoveryService::start() {
    if (running_) {
        LOG_WARN("Peer discovery already running");
        return core::Result(core::ErrorCode::STATE_ERROR, "Peer discovery already running");
    }

    try {
        io_context_.restart();
        socket_.open(udp::v4());
        socket_.set_option(udp::socket::reuse_address(true));
        socket_.set_option(boost::asio::ip::multicast::enable_loopback(true));
        socket_.bind(udp::endpoint(udp::v4(), config_.discovery_port));
        socket_.set_option(boost::asio::ip::multicast::join_group(multicast_endpoint_.address()));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start peer discovery: {}", e.what());
        boost::system::error_code ec;
        socket_.close(ec);
        return core::Result(core::ErrorCode::NETWORK_ERROR,
                            "Cannot bind discovery port " + std::to_string(config_.discovery_port) + ": " + e.what());
    }

    running_ = true;
    do_receive();

    io_thread_ = std::thread([this]() {
        LOG_DEBUG("Peer discovery IO thread started");
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Peer discovery IO error: {}", e.what());
                if (!running_) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }
        LOG_DEBUG("Peer discovery IO thread stopped");
    });

    discovery_thread_ = std::thread([this]() {
        discovery_loop();
    });

    LOG_INFO("Peer discovery started on {}:{} as '{}' ({})",
             multicast_endpoint_.address().to_string(), config_.discovery_port,
             config_.local_name, config_.local_id);
    return core::Result();
}

void PeerDiscoveryService::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping peer discovery");
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        running_ = false;
    }
    loop_cv_.notify_all();

    io_context_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    if (discovery_thread_.joinable()) {
        discovery_thread_.join();
    }

    boost::system::error_code ec;
    socket_.close(ec);
}

void PeerDiscoveryService::set_transfer_port(std::uint16_t port) {
    transfer_port_ = port;
}

core::Result PeerDiscoveryService::refresh() {
    if (running_) {
        send_query();
    }
    expire_stale_peers();
    return core::Result();
}

core::Result PeerDiscoveryService::add_manual(const std::string& ip, std::uint16_t port, PeerInfo& peer) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address_v4(ip, ec);
    if (ec || port == 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid peer address " + ip + ":" + std::to_string(port));
    }

    auto endpoint = address.to_string() + ":" + std::to_string(port);
    auto now = TimeUtils::now();

    PeerEvent event{PeerEventKind::Discovered, {}};
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto id = "manual-" + endpoint;
        auto it = peers_.find(id);
        if (it != peers_.end()) {
            peer = it->second;
            return core::Result();
        }

        PeerInfo info;
        info.id = id;
        info.name = "Manual (" + endpoint + ")";
        info.ip = address.to_string();
        info.port = port;
        info.device_type = DeviceType::Unknown;
        info.status = PeerStatus::Unknown;
        info.discovered_at = now;
        info.last_seen = now;
        info.manual = true;

        peers_[id] = info;
        peer = info;
        event.peer = info;
    }

    LOG_INFO("Added manual peer {}", endpoint);
    emit({event});
    return core::Result();
}

core::Result PeerDiscoveryService::check_online(const std::string& peer_id, bool& online) {
    std::string ip;
    std::uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown peer " + peer_id);
        }
        ip = it->second.ip;
        port = it->second.port;
    }

    online = probe_->probe(ip, port, config_.probe_timeout);

    std::vector<PeerEvent> events;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            // Removed while probing.
            return core::Result();
        }

        auto previous = it->second.status;
        it->second.status = online ? PeerStatus::Online : PeerStatus::Offline;
        if (online) {
            it->second.last_seen = TimeUtils::now();
        }

        if (previous != it->second.status) {
            events.push_back({online ? PeerEventKind::Updated : PeerEventKind::Offline, it->second});
        }
    }

    LOG_DEBUG("Peer {} at {}:{} is {}", peer_id, ip, port, online ? "reachable" : "unreachable");
    emit(events);
    return core::Result();
}

core::Result PeerDiscoveryService::remove_peer(const std::string& peer_id) {
    PeerEvent event{PeerEventKind::Removed, {}};
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(peer_id);
        if (it == peers_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Unknown peer " + peer_id);
        }
        event.peer = it->second;
        peers_.erase(it);
    }

    LOG_INFO("Removed peer {}", peer_id);
    emit({event});
    return core::Result();
}

std::vector<PeerInfo> PeerDiscoveryService::get_peers() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    std::vector<PeerInfo> peers;
    peers.reserve(peers_.size());

    for (const auto& [id, info] : peers_) {
        peers.push_back(info);
    }

    std::sort(peers.begin(), peers.end(),
              [](const PeerInfo& a, const PeerInfo& b) { return a.discovered_at < b.discovered_at; });
    return peers;
}

std::optional<PeerInfo> PeerDiscoveryService::get_peer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peers_.find(peer_id);
    if (it != peers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void PeerDiscoveryService::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

void PeerDiscoveryService::emit(const std::vector<PeerEvent>& events) {
    if (events.empty()) {
        return;
    }

    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = event_handler_;
    }
    if (!handler) {
        return;
    }

    for (const auto& event : events) {
        handler(event);
    }
}

void PeerDiscoveryService::handle_announce(const std::string& sender_ip, const PeerAnnounceMessage& message,
                                           std::chrono::system_clock::time_point now) {
    if (message.peer_id.empty() || message.peer_id == config_.local_id) {
        return;
    }

    PeerEvent event{PeerEventKind::Updated, {}};
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);

        auto it = peers_.find(message.peer_id);
        if (it == peers_.end()) {
            PeerInfo info;
            info.id = message.peer_id;
            info.name = message.name;
            info.ip = sender_ip;
            info.port = message.transfer_port;
            info.device_type = device_type_from_string(message.device_type);
            info.status = PeerStatus::Online;
            info.discovered_at = now;
            info.last_seen = now;

            peers_[info.id] = info;
            event = {PeerEventKind::Discovered, info};
            changed = true;

            LOG_INFO("Discovered peer '{}' ({}) at {}:{}", info.name, info.id, info.ip, info.port);
        } else {
            auto& info = it->second;
            changed = info.status != PeerStatus::Online || info.ip != sender_ip ||
                      info.port != message.transfer_port || info.name != message.name;

            info.name = message.name;
            info.ip = sender_ip;
            info.port = message.transfer_port;
            info.device_type = device_type_from_string(message.device_type);
            info.status = PeerStatus::Online;
            info.last_seen = now;
            event.peer = info;

            if (changed) {
                LOG_DEBUG("Updated peer '{}' ({}) at {}:{}", info.name, info.id, info.ip, info.port);
            }
        }
    }

    if (changed) {
        emit({event});
    }
}

std::size_t PeerDiscoveryService::expire_stale_peers(std::chrono::system_clock::time_point now) {
    std::vector<PeerEvent> events;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        for (auto& [id, info] : peers_) {
            if (info.manual || info.status != PeerStatus::Online) {
                continue;
            }
            if (now - info.last_seen > config_.peer_timeout) {
                info.status = PeerStatus::Offline;
                events.push_back({PeerEventKind::Offline, info});
                LOG_INFO("Peer '{}' ({}) went offline", info.name, info.id);
            }
        }
    }

    emit(events);
    return events.size();
}

void PeerDiscoveryService::do_receive() {
    if (!running_) {
        return;
    }

    socket_.async_receive_from(
        boost::asio::buffer(receive_buffer_), sender_endpoint_,
        [this](boost::system::error_code ec, std::size_t bytes_received) {
            if (!ec && running_) {
                handle_datagram(sender_endpoint_,
                                std::span<const std::uint8_t>(receive_buffer_.data(), bytes_received));
                do_receive();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Discovery receive error: {}", ec.message());
                if (running_) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    do_receive();
                }
            }
        });
}

void PeerDiscoveryService::handle_datagram(const udp::endpoint& sender, std::span<const std::uint8_t> data) {
    try {
        auto frame = decode_frame(data);

        switch (frame.header.type) {
            case MessageType::PEER_ANNOUNCE:
            case MessageType::PEER_RESPONSE:
                handle_announce(sender.address().to_string(), PeerAnnounceMessage::deserialize(frame.payload));
                break;
            case MessageType::PEER_QUERY: {
                auto query = PeerQueryMessage::deserialize(frame.payload);
                if (query.peer_id != config_.local_id) {
                    send_announcement(MessageType::PEER_RESPONSE, sender);
                }
                break;
            }
            default:
                LOG_DEBUG("Ignoring discovery message {} from {}",
                          to_string(frame.header.type), sender.address().to_string());
                break;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Dropping discovery datagram from {}: {}", sender.address().to_string(), e.what());
    }
}

void PeerDiscoveryService::send_announcement(MessageType type, const udp::endpoint& destination) {
    PeerAnnounceMessage msg;
    msg.peer_id = config_.local_id;
    msg.name = config_.local_name;
    msg.device_type = config_.device_type;
    msg.transfer_port = transfer_port_;
    msg.timestamp = static_cast<std::uint64_t>(TimeUtils::to_unix_millis(TimeUtils::now()));

    auto message = std::make_shared<std::vector<std::uint8_t>>(encode_frame(type, msg));

    socket_.async_send_to(
        boost::asio::buffer(*message), destination,
        [message, type](boost::system::error_code ec, std::size_t bytes_sent) {
            if (ec) {
                LOG_WARN("Failed to send {}: {}", to_string(type), ec.message());
            } else {
                LOG_TRACE("Sent {} ({} bytes)", to_string(type), bytes_sent);
            }
        });
}

void PeerDiscoveryService::send_query() {
    boost::asio::post(io_context_, [this]() {
        PeerQueryMessage query{config_.local_id};
        auto message = std::make_shared<std::vector<std::uint8_t>>(encode_frame(MessageType::PEER_QUERY, query));

        socket_.async_send_to(
            boost::asio::buffer(*message), multicast_endpoint_,
            [message](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    LOG_WARN("Failed to send peer query: {}", ec.message());
                }
            });
    });
}

void PeerDiscoveryService::discovery_loop() {
    LOG_DEBUG("Peer discovery loop started");

    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (running_) {
        lock.unlock();
        boost::asio::post(io_context_, [this]() {
            send_announcement(MessageType::PEER_ANNOUNCE, multicast_endpoint_);
        });
        expire_stale_peers();
        lock.lock();

        loop_cv_.wait_for(lock, config_.announce_interval, [this]() { return !running_; });
    }

    LOG_DEBUG("Peer discovery loop stopped");
}

} // namespace puresend::network
