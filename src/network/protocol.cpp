#include "puresend/network/protocol.hpp"
#include "puresend/core/byte_buffer.hpp"
#include <chrono>
#include <random>
#include <mutex>
#include <algorithm>
#include <stdexcept>

namespace puresend::network {

using core::ByteReader;
using core::ByteWriter;

namespace {
    std::uint64_t generate_message_id() {
        static std::mutex mutex;
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        std::lock_guard<std::mutex> lock(mutex);
        return gen();
    }

    std::uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()).count();
    }

    constexpr std::array<std::uint32_t, 256> make_crc_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
            }
            table[i] = c;
        }
        return table;
    }

    constexpr auto CRC_TABLE = make_crc_table();

    void expect_consumed(const ByteReader& reader, const char* what) {
        if (reader.remaining() != 0) {
            throw std::runtime_error(std::string("Trailing bytes after ") + what);
        }
    }
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = CRC_TABLE[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::HEARTBEAT: return "HEARTBEAT";
        case MessageType::PEER_ANNOUNCE: return "PEER_ANNOUNCE";
        case MessageType::PEER_QUERY: return "PEER_QUERY";
        case MessageType::PEER_RESPONSE: return "PEER_RESPONSE";
        case MessageType::FILE_OFFER: return "FILE_OFFER";
        case MessageType::FILE_RESPONSE: return "FILE_RESPONSE";
        case MessageType::CHUNK_DATA: return "CHUNK_DATA";
        case MessageType::CHUNK_ACK: return "CHUNK_ACK";
        case MessageType::CANCEL: return "CANCEL";
        case MessageType::ERROR_RESPONSE: return "ERROR_RESPONSE";
    }
    return "UNKNOWN";
}

MessageHeader::MessageHeader()
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::HEARTBEAT)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(0)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);

    ByteWriter writer(buffer);
    writer.write_uint32(magic);
    writer.write_uint16(version);
    writer.write_uint8(static_cast<std::uint8_t>(type));
    writer.write_uint8(static_cast<std::uint8_t>(flags));
    writer.write_uint64(message_id);
    writer.write_uint32(payload_size);
    writer.write_uint64(timestamp);
    writer.write_raw(checksum);

    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }

    MessageHeader header;
    ByteReader reader(data.first(MESSAGE_HEADER_SIZE));

    header.magic = reader.read_uint32();
    header.version = reader.read_uint16();
    header.type = static_cast<MessageType>(reader.read_uint8());
    header.flags = static_cast<MessageFlags>(reader.read_uint8());
    header.message_id = reader.read_uint64();
    header.payload_size = reader.read_uint32();
    header.timestamp = reader.read_uint64();
    auto crc = reader.read_raw(4);
    std::copy(crc.begin(), crc.end(), header.checksum.begin());

    return header;
}

std::vector<std::uint8_t> encode_frame(MessageType type, std::span<const std::uint8_t> payload,
                                       MessageFlags flags) {
    MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
    header.flags = flags;
    header.calculate_checksum(payload);

    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

Frame decode_frame(std::span<const std::uint8_t> data) {
    Frame frame;
    frame.header = MessageHeader::deserialize(data);
    if (!frame.header.is_valid()) {
        throw std::runtime_error("Invalid message header");
    }

    auto payload = data.subspan(MESSAGE_HEADER_SIZE);
    if (payload.size() != frame.header.payload_size) {
        throw std::runtime_error("Payload length does not match header");
    }
    if (!frame.header.verify_checksum(payload)) {
        throw std::runtime_error("Checksum mismatch");
    }

    frame.payload.assign(payload.begin(), payload.end());
    return frame;
}

std::vector<std::uint8_t> HeartbeatMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_uint64(timestamp);
    return buffer;
}

HeartbeatMessage HeartbeatMessage::deserialize(std::span<const std::uint8_t> data) {
    HeartbeatMessage msg;
    ByteReader reader(data);
    msg.timestamp = reader.read_uint64();
    return msg;
}

std::vector<std::uint8_t> PeerAnnounceMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_string(peer_id);
    writer.write_string(name);
    writer.write_string(device_type);
    writer.write_uint16(transfer_port);
    writer.write_uint64(timestamp);
    return buffer;
}

PeerAnnounceMessage PeerAnnounceMessage::deserialize(std::span<const std::uint8_t> data) {
    PeerAnnounceMessage msg;
    ByteReader reader(data);
    msg.peer_id = reader.read_string();
    msg.name = reader.read_string();
    msg.device_type = reader.read_string();
    msg.transfer_port = reader.read_uint16();
    msg.timestamp = reader.read_uint64();
    return msg;
}

std::vector<std::uint8_t> PeerQueryMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_string(peer_id);
    return buffer;
}

PeerQueryMessage PeerQueryMessage::deserialize(std::span<const std::uint8_t> data) {
    PeerQueryMessage msg;
    ByteReader reader(data);
    msg.peer_id = reader.read_string();
    return msg;
}

std::vector<std::uint8_t> FileOfferMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(metadata.size() + 128);
    ByteWriter writer(buffer);
    writer.write_string(task_id);
    writer.write_string(sender_id);
    writer.write_string(sender_name);
    writer.write_bytes(metadata);
    writer.write_bool(resume);
    writer.write_uint32(resume_chunk);
    writer.write_bool(encrypted);
    writer.write_bytes(public_key);
    writer.write_bool(compressed);
    return buffer;
}

FileOfferMessage FileOfferMessage::deserialize(std::span<const std::uint8_t> data) {
    FileOfferMessage msg;
    ByteReader reader(data);
    msg.task_id = reader.read_string();
    msg.sender_id = reader.read_string();
    msg.sender_name = reader.read_string();
    msg.metadata = reader.read_bytes();
    msg.resume = reader.read_bool();
    msg.resume_chunk = reader.read_uint32();
    msg.encrypted = reader.read_bool();
    msg.public_key = reader.read_bytes();
    msg.compressed = reader.read_bool();
    expect_consumed(reader, "FILE_OFFER");
    return msg;
}

std::vector<std::uint8_t> FileResponseMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_string(task_id);
    writer.write_bool(accepted);
    writer.write_uint32(start_chunk);
    writer.write_string(reason);
    writer.write_bytes(public_key);
    writer.write_bool(compressed);
    return buffer;
}

FileResponseMessage FileResponseMessage::deserialize(std::span<const std::uint8_t> data) {
    FileResponseMessage msg;
    ByteReader reader(data);
    msg.task_id = reader.read_string();
    msg.accepted = reader.read_bool();
    msg.start_chunk = reader.read_uint32();
    msg.reason = reader.read_string();
    msg.public_key = reader.read_bytes();
    msg.compressed = reader.read_bool();
    expect_consumed(reader, "FILE_RESPONSE");
    return msg;
}

std::vector<std::uint8_t> ChunkDataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(data.size() + task_id.size() + chunk_hash.size() + 16);
    ByteWriter writer(buffer);
    writer.write_string(task_id);
    writer.write_uint32(chunk_index);
    writer.write_bytes(data);
    writer.write_string(chunk_hash);
    return buffer;
}

ChunkDataMessage ChunkDataMessage::deserialize(std::span<const std::uint8_t> data_span) {
    ChunkDataMessage msg;
    ByteReader reader(data_span);
    msg.task_id = reader.read_string();
    msg.chunk_index = reader.read_uint32();
    msg.data = reader.read_bytes();
    msg.chunk_hash = reader.read_string();
    expect_consumed(reader, "CHUNK_DATA");
    return msg;
}

std::vector<std::uint8_t> ChunkAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_string(task_id);
    writer.write_uint32(chunk_index);
    writer.write_bool(ok);
    writer.write_string(reason);
    return buffer;
}

ChunkAckMessage ChunkAckMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkAckMessage msg;
    ByteReader reader(data);
    msg.task_id = reader.read_string();
    msg.chunk_index = reader.read_uint32();
    msg.ok = reader.read_bool();
    msg.reason = reader.read_string();
    return msg;
}

std::vector<std::uint8_t> CancelMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_string(task_id);
    writer.write_string(reason);
    return buffer;
}

CancelMessage CancelMessage::deserialize(std::span<const std::uint8_t> data) {
    CancelMessage msg;
    ByteReader reader(data);
    msg.task_id = reader.read_string();
    msg.reason = reader.read_string();
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    ByteWriter writer(buffer);
    writer.write_uint32(error_code);
    writer.write_string(error_message);
    writer.write_uint64(request_id);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    ByteReader reader(data);
    msg.error_code = reader.read_uint32();
    msg.error_message = reader.read_string();
    msg.request_id = reader.read_uint64();
    return msg;
}

} // namespace puresend::network
