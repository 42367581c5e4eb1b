#pragma once

#include "protocol.hpp"
#include "../core/error.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace puresend::network {

using boost::asio::ip::udp;

enum class PeerStatus { Online, Offline, Unknown };
enum class DeviceType { Desktop, Mobile, Web, Unknown };

const char* to_string(PeerStatus status);
const char* to_string(DeviceType type);
DeviceType device_type_from_string(const std::string& name);

struct PeerInfo {
    std::string id;
    std::string name;
    std::string ip;
    std::uint16_t port = 0;
    DeviceType device_type = DeviceType::Unknown;
    PeerStatus status = PeerStatus::Unknown;
    std::chrono::system_clock::time_point discovered_at;
    std::chrono::system_clock::time_point last_seen;
    bool manual = false;
};

void to_json(nlohmann::json& j, const PeerInfo& peer);

enum class PeerEventKind { Discovered, Updated, Offline, Removed };

struct PeerEvent {
    PeerEventKind kind;
    PeerInfo peer;
};

const char* to_string(PeerEventKind kind);

// Reachability check used by check_online().
class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;
    virtual bool probe(const std::string& ip, std::uint16_t port, std::chrono::milliseconds timeout) = 0;
};

// Plain TCP connect with a deadline.
class TcpLivenessProbe : public LivenessProbe {
public:
    bool probe(const std::string& ip, std::uint16_t port, std::chrono::milliseconds timeout) override;
};

struct DiscoveryConfig {
    std::string local_id;
    std::string local_name;
    std::string device_type = "desktop";
    std::uint16_t transfer_port = 0;
    std::uint16_t discovery_port = 5353;
    std::string multicast_group = "239.255.42.99";
    std::chrono::milliseconds announce_interval{3000};
    std::chrono::milliseconds peer_timeout{10000};
    std::chrono::milliseconds probe_timeout{2000};
};

class PeerDiscoveryService {
public:
    using EventHandler = std::function<void(const PeerEvent&)>;

    explicit PeerDiscoveryService(DiscoveryConfig config, std::shared_ptr<LivenessProbe> probe = nullptr);
    ~PeerDiscoveryService();

    PeerDiscoveryService(const PeerDiscoveryService&) = delete;
    PeerDiscoveryService& operator=(const PeerDiscoveryService&) = delete;

    core::Result start();
    void stop();
    bool is_running() const { return running_; }

    // Port advertised in announcements; changes when the receive listener is rebound.
    void set_transfer_port(std::uint16_t port);

    // Sends an active query and ages peers that went quiet.
    core::Result refresh();

    core::Result add_manual(const std::string& ip, std::uint16_t port, PeerInfo& peer);

    // Probes the peer now; the result overrides the cached status.
    core::Result check_online(const std::string& peer_id, bool& online);

    core::Result remove_peer(const std::string& peer_id);

    std::vector<PeerInfo> get_peers() const;
    std::optional<PeerInfo> get_peer(const std::string& peer_id) const;

    void set_event_handler(EventHandler handler);

    // Merges one PEER_ANNOUNCE or PEER_RESPONSE received from `sender_ip`.
    void handle_announce(const std::string& sender_ip, const PeerAnnounceMessage& message,
                         std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Flips discovered peers not heard from within the timeout to offline; returns how many flipped.
    std::size_t expire_stale_peers(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    const DiscoveryConfig& config() const { return config_; }

private:
    void do_receive();
    void handle_datagram(const udp::endpoint& sender, std::span<const std::uint8_t> data);
    void send_announcement(MessageType type, const udp::endpoint& destination);
    void send_query();
    void discovery_loop();
    void emit(const std::vector<PeerEvent>& events);

    DiscoveryConfig config_;
    std::shared_ptr<LivenessProbe> probe_;
    std::atomic<std::uint16_t> transfer_port_;

    std::atomic<bool> running_;
    boost::asio::io_context io_context_;
    udp::socket socket_;
    udp::endpoint multicast_endpoint_;
    udp::endpoint sender_endpoint_;
    std::array<std::uint8_t, 2048> receive_buffer_;

    std::thread io_thread_;
    std::thread discovery_thread_;
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;

    std::unordered_map<std::string, PeerInfo> peers_;
    mutable std::mutex peers_mutex_;

    EventHandler event_handler_;
    std::mutex handler_mutex_;
};

} // namespace puresend::network
