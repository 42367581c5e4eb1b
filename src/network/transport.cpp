#include "puresend/network/transport.hpp"
#include "puresend/core/logger.hpp"

namespace puresend::network {

TcpTransferChannel::TcpTransferChannel(ChannelTimeouts timeouts)
    : timeouts_(timeouts)
    , connection_(timeouts.io)
    , encrypted_(false) {
}

core::Result TcpTransferChannel::open(const std::string& address, std::uint16_t port) {
    return connection_.connect(address, port);
}

core::Result TcpTransferChannel::expect(const Frame& frame, MessageType expected) const {
    if (frame.header.type == expected) {
        return core::Result();
    }

    try {
        if (frame.header.type == MessageType::CANCEL) {
            auto cancel = CancelMessage::deserialize(frame.payload);
            return core::Result(core::ErrorCode::CANCELLED,
                                "Cancelled by receiver" + (cancel.reason.empty() ? "" : ": " + cancel.reason));
        }
        if (frame.header.type == MessageType::ERROR_RESPONSE) {
            auto error = ErrorMessage::deserialize(frame.payload);
            auto code = static_cast<ErrorCode>(error.error_code);
            if (code == ErrorCode::TRANSFER_REJECTED) {
                return core::Result(core::ErrorCode::REJECTED, error.error_message);
            }
            if (code == ErrorCode::VERIFICATION_FAILED) {
                return core::Result(core::ErrorCode::VERIFICATION_ERROR, error.error_message);
            }
            return core::Result(core::ErrorCode::PROTOCOL_ERROR, "Receiver error: " + error.error_message);
        }
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, e.what());
    }

    return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                        std::string("Expected ") + to_string(expected) + ", got " + to_string(frame.header.type));
}

core::Result TcpTransferChannel::send_offer(const FileOfferMessage& offer, FileResponseMessage& reply) {
    auto result = connection_.send(MessageType::FILE_OFFER, offer);
    if (!result) {
        return result;
    }

    Frame frame;
    result = connection_.receive(frame, timeouts_.offer);
    if (!result) {
        return result;
    }

    result = expect(frame, MessageType::FILE_RESPONSE);
    if (!result) {
        return result;
    }

    try {
        reply = FileResponseMessage::deserialize(frame.payload);
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, std::string("Bad FILE_RESPONSE: ") + e.what());
    }

    if (reply.task_id != offer.task_id) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, "FILE_RESPONSE for another task: " + reply.task_id);
    }

    if (!reply.accepted) {
        return core::Result(core::ErrorCode::REJECTED,
                            reply.reason.empty() ? "Receiver declined the transfer" : reply.reason);
    }

    encrypted_ = offer.encrypted;
    return core::Result();
}

core::Result TcpTransferChannel::send_chunk(const ChunkDataMessage& chunk, bool compressed, ChunkAckMessage& ack) {
    auto flags = encrypted_ ? MessageFlags::ENCRYPTED : MessageFlags::NONE;
    if (compressed) {
        flags = flags | MessageFlags::COMPRESSED;
    }
    auto result = connection_.send(MessageType::CHUNK_DATA, chunk, flags);
    if (!result) {
        return result;
    }

    Frame frame;
    result = connection_.receive(frame);
    if (!result) {
        return result;
    }

    result = expect(frame, MessageType::CHUNK_ACK);
    if (!result) {
        return result;
    }

    try {
        ack = ChunkAckMessage::deserialize(frame.payload);
    } catch (const std::exception& e) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR, std::string("Bad CHUNK_ACK: ") + e.what());
    }

    if (ack.chunk_index != chunk.chunk_index) {
        return core::Result(core::ErrorCode::PROTOCOL_ERROR,
                            "Acknowledgement for chunk " + std::to_string(ack.chunk_index) +
                            ", expected " + std::to_string(chunk.chunk_index));
    }
    return core::Result();
}

core::Result TcpTransferChannel::send_cancel(const CancelMessage& cancel) {
    if (!connection_.is_open()) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Connection already closed");
    }
    return connection_.send(MessageType::CANCEL, cancel);
}

void TcpTransferChannel::abort() {
    connection_.abort();
}

void TcpTransferChannel::close() {
    connection_.close();
}

ChannelFactory make_tcp_channel_factory(ChannelTimeouts timeouts) {
    return [timeouts]() -> std::unique_ptr<TransferChannel> {
        return std::make_unique<TcpTransferChannel>(timeouts);
    };
}

} // namespace puresend::network
