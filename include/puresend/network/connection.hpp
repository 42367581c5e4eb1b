#pragma once

#include "protocol.hpp"
#include "../core/error.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace puresend::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    CLOSING
};

// A framed peer-to-peer stream driven from a single worker thread.
//
// Every operation runs the connection's private io_context for at most `timeout`, so a
// silent peer surfaces as NETWORK_ERROR instead of blocking the worker forever. abort() may
// be called from any thread.
class Connection {
public:
    explicit Connection(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    core::Result connect(const std::string& address, std::uint16_t port);

    // Takes over a socket accepted on another io_context.
    core::Result adopt(tcp::socket& accepted);

    core::Result send(MessageType type, std::span<const std::uint8_t> payload,
                      MessageFlags flags = MessageFlags::NONE);

    template<MessagePayload T>
    core::Result send(MessageType type, const T& payload, MessageFlags flags = MessageFlags::NONE) {
        auto payload_data = payload.serialize();
        return send(type, payload_data, flags);
    }

    // Reads one frame. Malformed frames and checksum mismatches are PROTOCOL_ERROR.
    core::Result receive(Frame& frame);
    core::Result receive(Frame& frame, std::chrono::milliseconds timeout);

    void close();
    void abort();

    ConnectionState get_state() const { return state_; }
    bool is_open() const { return state_ == ConnectionState::CONNECTED; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::string get_remote_address() const;
    std::uint16_t get_remote_port() const;

    void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds get_timeout() const { return timeout_; }

private:
    // Runs queued work until it completes or `timeout` elapses; on timeout the socket is closed.
    bool run_for(std::chrono::milliseconds timeout);
    core::Result network_error(const std::string& what, const boost::system::error_code& ec) const;

    boost::asio::io_context io_context_;
    tcp::socket socket_;
    std::atomic<ConnectionState> state_;
    std::atomic<bool> aborted_;
    std::chrono::milliseconds timeout_;
    std::string remote_endpoint_;

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
};

} // namespace puresend::network
