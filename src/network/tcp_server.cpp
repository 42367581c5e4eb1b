#include "puresend/network/tcp_server.hpp"
#include "puresend/core/logger.hpp"

namespace puresend::network {

TcpServer::TcpServer(std::string name, std::uint16_t port)
    : name_(std::move(name))
    , port_(port)
    , bound_port_(0)
    , running_(false)
    , io_context_()
    , retry_timer_(io_context_) {
}

TcpServer::~TcpServer() {
    stop();
}

core::Result TcpServer::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
        LOG_WARN("{} server already running", name_);
        return core::Result(core::ErrorCode::STATE_ERROR, name_ + " server already running");
    }

    try {
        io_context_.restart();
        accepted_ = 0;
        acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
        acceptor_->open(tcp::v4());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(tcp::endpoint(tcp::v4(), port_));
        acceptor_->listen();
        bound_port_ = acceptor_->local_endpoint().port();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start {} server on port {}: {}", name_, port_, e.what());
        acceptor_.reset();
        return core::Result(core::ErrorCode::NETWORK_ERROR,
                            "Cannot listen on port " + std::to_string(port_) + ": " + e.what());
    }

    running_ = true;
    do_accept();

    server_thread_ = std::thread([this]() {
        LOG_INFO("{} server started on port {}", name_, bound_port_.load());

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("{} server IO error: {}", name_, e.what());
                if (!running_) break;

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }

        LOG_INFO("{} server stopped", name_);
    });

    return core::Result();
}

void TcpServer::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!running_) {
        return;
    }

    LOG_INFO("Stopping {} server on port {}", name_, bound_port_.load());
    running_ = false;

    io_context_.stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    retry_timer_.cancel();
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
    bound_port_ = 0;
}

void TcpServer::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_->async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted || !running_) {
                return;
            }
            if (ec) {
                // Typically EMFILE; back off so the loop does not spin.
                LOG_ERROR("{} accept error: {}", name_, ec.message());
                retry_timer_.expires_after(ACCEPT_RETRY_DELAY);
                retry_timer_.async_wait([this](boost::system::error_code timer_ec) {
                    if (!timer_ec) {
                        do_accept();
                    }
                });
                return;
            }

            ++accepted_;
            boost::system::error_code endpoint_ec;
            auto remote = socket.remote_endpoint(endpoint_ec);
            if (!endpoint_ec) {
                LOG_DEBUG("{} connection #{} from {}:{}", name_, accepted_.load(),
                          remote.address().to_string(), remote.port());
            }

            if (connection_handler_) {
                connection_handler_(std::move(socket));
            }
            do_accept();
        });
}

} // namespace puresend::network
