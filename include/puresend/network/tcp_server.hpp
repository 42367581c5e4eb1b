#pragma once

#include "../core/error.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace puresend::network {

using boost::asio::ip::tcp;

// Accept loop on its own io_context thread. Each accepted socket is handed to the
// connection handler, which is expected to move it onto a worker quickly.
class TcpServer {
public:
    using ConnectionHandler = std::function<void(tcp::socket socket)>;

    explicit TcpServer(std::string name, std::uint16_t port = 0);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Port 0 lets the OS pick; get_port() reports the bound port afterwards.
    core::Result start();
    void stop();

    bool is_running() const { return running_; }
    std::uint16_t get_port() const { return bound_port_; }
    // Connections accepted since the last start().
    std::uint64_t accepted_count() const { return accepted_; }

    void set_connection_handler(ConnectionHandler handler) { connection_handler_ = std::move(handler); }

private:
    static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

    void do_accept();

    std::string name_;
    std::uint16_t port_;
    std::atomic<std::uint16_t> bound_port_;
    std::atomic<bool> running_;
    std::atomic<std::uint64_t> accepted_{0};

    boost::asio::io_context io_context_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    boost::asio::steady_timer retry_timer_;
    std::thread server_thread_;
    std::mutex lifecycle_mutex_;

    ConnectionHandler connection_handler_;
};

} // namespace puresend::network
