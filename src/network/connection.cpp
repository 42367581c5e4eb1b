#include "puresend/network/connection.hpp"
#include "puresend/core/logger.hpp"
#include <boost/asio/write.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/connect.hpp>
#include <unistd.h>

namespace puresend::network {

Connection::Connection(std::chrono::milliseconds timeout)
    : io_context_()
    , socket_(io_context_)
    , state_(ConnectionState::DISCONNECTED)
    , aborted_(false)
    , timeout_(timeout)
    , read_header_buffer_{} {
}

Connection::~Connection() {
    close();
}

core::Result Connection::network_error(const std::string& what, const boost::system::error_code& ec) const {
    if (aborted_) {
        return core::Result(core::ErrorCode::CANCELLED, what + ": connection aborted");
    }
    if (ec == boost::asio::error::operation_aborted) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, what + ": timed out after " +
                            std::to_string(timeout_.count()) + " ms");
    }
    return core::Result(core::ErrorCode::NETWORK_ERROR, what + ": " + ec.message());
}

bool Connection::run_for(std::chrono::milliseconds timeout) {
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
        // Timed out: closing the socket completes the pending operation with operation_aborted.
        boost::system::error_code ec;
        socket_.close(ec);
        io_context_.run();
        return false;
    }
    return true;
}

core::Result Connection::connect(const std::string& address, std::uint16_t port) {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid peer address " + address);
    }

    state_ = ConnectionState::CONNECTING;
    remote_endpoint_ = address + ":" + std::to_string(port);

    boost::system::error_code connect_ec = boost::asio::error::would_block;
    socket_.async_connect(tcp::endpoint(ip, port),
        [&connect_ec](const boost::system::error_code& result) {
            connect_ec = result;
        });

    run_for(timeout_);

    if (connect_ec) {
        state_ = ConnectionState::DISCONNECTED;
        return network_error("Connect to " + remote_endpoint_, connect_ec);
    }

    socket_.set_option(tcp::no_delay(true), ec);
    state_ = ConnectionState::CONNECTED;
    LOG_DEBUG("Connected to {}", remote_endpoint_);
    return core::Result();
}

core::Result Connection::adopt(tcp::socket& accepted) {
    boost::system::error_code ec;
    auto remote = accepted.remote_endpoint(ec);
    remote_endpoint_ = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());

    auto native = accepted.release(ec);
    if (ec) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Cannot take over socket: " + ec.message());
    }

    socket_.assign(tcp::v4(), native, ec);
    if (ec) {
        ::close(native);
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Cannot take over socket: " + ec.message());
    }

    socket_.set_option(tcp::no_delay(true), ec);
    state_ = ConnectionState::CONNECTED;
    return core::Result();
}

core::Result Connection::send(MessageType type, std::span<const std::uint8_t> payload, MessageFlags flags) {
    if (state_ != ConnectionState::CONNECTED) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Connection to " + remote_endpoint_ + " is not open");
    }

    auto message = encode_frame(type, payload, flags);

    boost::system::error_code write_ec = boost::asio::error::would_block;
    boost::asio::async_write(socket_, boost::asio::buffer(message),
        [&write_ec](const boost::system::error_code& ec, std::size_t) {
            write_ec = ec;
        });

    run_for(timeout_);

    if (write_ec) {
        state_ = ConnectionState::DISCONNECTED;
        return network_error(std::string("Send ") + to_string(type) + " to " + remote_endpoint_, write_ec);
    }

    LOG_TRACE("Sent {} ({} bytes) to {}", to_string(type), payload.size(), remote_endpoint_);
    return core::Result();
}

core::Result Connection::receive(Frame& frame) {
    return receive(frame, timeout_);
}

core::Result Connection::receive(Frame& frame, std::chrono::milliseconds timeout) {
    if (state_ != ConnectionState::CONNECTED) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Connection to " + remote_endpoint_ + " is not open");
    }

    boost::system::error_code read_ec = boost::asio::error::would_block;
    boost::asio::async_read(socket_, boost::asio::buffer(read_header_buffer_),
        [&read_ec](const boost::system::error_code& ec, std::size_t) {
            read_ec = ec;
        });
    run_for(timeout);

    if (read_ec) {
        state_ = ConnectionState::DISCONNECTED;
        return network_error("Read from " + remote_endpoint_, read_ec);
    }

    try {
        frame.header = MessageHeader::deserialize(read_header_buffer_);
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, e.what());
    }

    if (!frame.header.is_valid()) {
        LOG_ERROR("Invalid message header from {}", remote_endpoint_);
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, "Invalid message header from " + remote_endpoint_);
    }

    frame.payload.resize(frame.header.payload_size);
    if (frame.header.payload_size > 0) {
        read_ec = boost::asio::error::would_block;
        boost::asio::async_read(socket_, boost::asio::buffer(frame.payload),
            [&read_ec](const boost::system::error_code& ec, std::size_t) {
                read_ec = ec;
            });
        run_for(timeout_);

        if (read_ec) {
            state_ = ConnectionState::DISCONNECTED;
            return network_error("Read from " + remote_endpoint_, read_ec);
        }
    }

    if (!frame.header.verify_checksum(frame.payload)) {
        LOG_ERROR("Checksum mismatch for message from {}", remote_endpoint_);
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, "Checksum mismatch from " + remote_endpoint_);
    }

    LOG_TRACE("Received {} ({} bytes) from {}", to_string(frame.header.type),
              frame.payload.size(), remote_endpoint_);
    return core::Result();
}

void Connection::close() {
    if (state_ == ConnectionState::DISCONNECTED && !socket_.is_open()) {
        return;
    }

    state_ = ConnectionState::CLOSING;

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    state_ = ConnectionState::DISCONNECTED;
}

void Connection::abort() {
    aborted_ = true;
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        socket_.close(ec);
    });
}

std::string Connection::get_remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? "unknown" : endpoint.address().to_string();
}

std::uint16_t Connection::get_remote_port() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

} // namespace puresend::network
