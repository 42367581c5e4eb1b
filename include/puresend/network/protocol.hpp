#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <span>
#include <concepts>

namespace puresend::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x50534E44; // "PSND"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    HEARTBEAT       = 0x03,

    PEER_ANNOUNCE   = 0x10,
    PEER_QUERY      = 0x11,
    PEER_RESPONSE   = 0x12,

    FILE_OFFER      = 0x20,
    FILE_RESPONSE   = 0x22,
    CHUNK_DATA      = 0x24,
    CHUNK_ACK       = 0x25,
    CANCEL          = 0x26,

    ERROR_RESPONSE  = 0xFF
};

enum class MessageFlags : std::uint8_t {
    NONE            = 0x00,
    COMPRESSED      = 0x01,
    ENCRYPTED       = 0x02
};

inline MessageFlags operator|(MessageFlags a, MessageFlags b) {
    return static_cast<MessageFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

inline bool has_flag(MessageFlags flags, MessageFlags flag) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

const char* to_string(MessageType type);

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    MessageFlags flags;            // Message flags
    std::uint64_t message_id;      // Unique message ID
    std::uint32_t payload_size;    // Payload length in bytes
    std::uint64_t timestamp;       // Unix timestamp (nanoseconds)
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload

    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);

    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;

    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
} __attribute__((packed));

static_assert(sizeof(MessageHeader) == MESSAGE_HEADER_SIZE);

std::uint32_t crc32(std::span<const std::uint8_t> data);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Header and payload of one decoded message.
struct Frame {
    MessageHeader header;
    std::vector<std::uint8_t> payload;
};

// Header (with checksum) followed by the payload, ready to write.
std::vector<std::uint8_t> encode_frame(MessageType type, std::span<const std::uint8_t> payload,
                                       MessageFlags flags = MessageFlags::NONE);

template<MessagePayload T>
std::vector<std::uint8_t> encode_frame(MessageType type, const T& message,
                                       MessageFlags flags = MessageFlags::NONE) {
    auto payload = message.serialize();
    return encode_frame(type, payload, flags);
}

// Parses a complete datagram; throws std::runtime_error on a bad magic, length or checksum.
Frame decode_frame(std::span<const std::uint8_t> data);

struct HeartbeatMessage {
    std::uint64_t timestamp = 0;

    std::vector<std::uint8_t> serialize() const;
    static HeartbeatMessage deserialize(std::span<const std::uint8_t> data);
};

// Sent as PEER_ANNOUNCE periodically and as PEER_RESPONSE to a PEER_QUERY.
// The address is taken from the datagram source, not from the payload.
struct PeerAnnounceMessage {
    std::string peer_id;
    std::string name;
    std::string device_type;
    std::uint16_t transfer_port = 0;
    std::uint64_t timestamp = 0;

    std::vector<std::uint8_t> serialize() const;
    static PeerAnnounceMessage deserialize(std::span<const std::uint8_t> data);
};

struct PeerQueryMessage {
    std::string peer_id;

    std::vector<std::uint8_t> serialize() const;
    static PeerQueryMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileOfferMessage {
    std::string task_id;
    std::string sender_id;
    std::string sender_name;
    std::vector<std::uint8_t> metadata;   // FileMetadata::serialize()
    bool resume = false;
    std::uint32_t resume_chunk = 0;       // first chunk the sender has not had acknowledged
    bool encrypted = false;
    std::vector<std::uint8_t> public_key; // X25519, present when encrypted
    bool compressed = false;              // sender would deflate chunk payloads

    std::vector<std::uint8_t> serialize() const;
    static FileOfferMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileResponseMessage {
    std::string task_id;
    bool accepted = false;
    std::uint32_t start_chunk = 0;
    std::string reason;
    std::vector<std::uint8_t> public_key;
    bool compressed = false;              // receiver takes COMPRESSED chunks

    std::vector<std::uint8_t> serialize() const;
    static FileResponseMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkDataMessage {
    std::string task_id;
    std::uint32_t chunk_index = 0;
    std::vector<std::uint8_t> data;
    std::string chunk_hash;

    std::vector<std::uint8_t> serialize() const;
    static ChunkDataMessage deserialize(std::span<const std::uint8_t> data);
};

// `ok == false` is a negative acknowledgement: the chunk did not verify.
struct ChunkAckMessage {
    std::string task_id;
    std::uint32_t chunk_index = 0;
    bool ok = true;
    std::string reason;

    std::vector<std::uint8_t> serialize() const;
    static ChunkAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct CancelMessage {
    std::string task_id;
    std::string reason;

    std::vector<std::uint8_t> serialize() const;
    static CancelMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    std::uint32_t error_code = 0;
    std::string error_message;
    std::uint64_t request_id = 0;

    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

enum class ErrorCode : std::uint32_t {
    NONE                    = 0,
    PROTOCOL_VERSION        = 1,
    INVALID_MESSAGE         = 2,
    TRANSFER_REJECTED       = 3,
    VERIFICATION_FAILED     = 4,
    STORAGE_FAILED          = 5,
    UNKNOWN_TASK            = 6,
    INTERNAL_ERROR          = 99
};

}

static_assert(puresend::network::MessagePayload<puresend::network::FileOfferMessage>);
static_assert(puresend::network::MessagePayload<puresend::network::ChunkDataMessage>);
static_assert(puresend::network::MessagePayload<puresend::network::PeerAnnounceMessage>);
