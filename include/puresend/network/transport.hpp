#pragma once

#include "protocol.hpp"
#include "connection.hpp"
#include "../core/error.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace puresend::network {

// Sending half of a transfer: one offer, then strictly alternating chunk and acknowledgement.
//
// NETWORK_ERROR from any call means the link is gone; REJECTED means the receiver declined
// the offer; CANCELLED means the receiver cancelled or the channel was aborted locally.
class TransferChannel {
public:
    virtual ~TransferChannel() = default;

    virtual core::Result open(const std::string& address, std::uint16_t port) = 0;
    virtual core::Result send_offer(const FileOfferMessage& offer, FileResponseMessage& reply) = 0;
    // `compressed` marks a deflated payload; only valid once the reply agreed to compression.
    virtual core::Result send_chunk(const ChunkDataMessage& chunk, bool compressed, ChunkAckMessage& ack) = 0;
    virtual core::Result send_cancel(const CancelMessage& cancel) = 0;

    // Safe to call from another thread while a send is blocked.
    virtual void abort() = 0;
    virtual void close() = 0;
};

using ChannelFactory = std::function<std::unique_ptr<TransferChannel>()>;

struct ChannelTimeouts {
    std::chrono::milliseconds io{std::chrono::seconds(30)};
    // How long the receiver may take to answer an offer, including user approval.
    std::chrono::milliseconds offer{std::chrono::seconds(75)};
};

class TcpTransferChannel : public TransferChannel {
public:
    explicit TcpTransferChannel(ChannelTimeouts timeouts = {});

    core::Result open(const std::string& address, std::uint16_t port) override;
    core::Result send_offer(const FileOfferMessage& offer, FileResponseMessage& reply) override;
    core::Result send_chunk(const ChunkDataMessage& chunk, bool compressed, ChunkAckMessage& ack) override;
    core::Result send_cancel(const CancelMessage& cancel) override;
    void abort() override;
    void close() override;

private:
    // Maps CANCEL and ERROR_RESPONSE replies to results; PROTOCOL_ERROR for anything unexpected.
    core::Result expect(const Frame& frame, MessageType expected) const;

    ChannelTimeouts timeouts_;
    Connection connection_;
    bool encrypted_;
};

ChannelFactory make_tcp_channel_factory(ChannelTimeouts timeouts = {});

} // namespace puresend::network
