#pragma once

#include <cstdint>
#include <array>
#include <vector>
#include <span>
#include <string>
#include <concepts>

namespace mediapush::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x4D505348; // "MPSH"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 4 * 1024 * 1024;

enum class MessageType : std::uint8_t {
    AUTH            = 0x01,
    AUTH_OK         = 0x02,
    DISCONNECT      = 0x04,
    
    RESOLVE_ENTITY  = 0x10,
    ENTITY          = 0x11,
    
    SAVE_PART       = 0x20,
    PART_ACK        = 0x21,
    
    SEND_MEDIA      = 0x30,
    MEDIA_SENT      = 0x31,
    
    ERROR_RESPONSE  = 0xFF
};

enum class MessageFlags : std::uint8_t {
    NONE            = 0x00
};

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    MessageFlags flags;            // Message flags
    std::uint64_t message_id;      // Replies echo the request's id
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

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

struct AuthMessage {
    std::int64_t api_id;
    std::string api_hash;
    std::string phone;
    std::string session_token;
    
    std::vector<std::uint8_t> serialize() const;
    static AuthMessage deserialize(std::span<const std::uint8_t> data);
};

struct AuthOkMessage {
    std::string session_token;
    std::string account_name;
    
    std::vector<std::uint8_t> serialize() const;
    static AuthOkMessage deserialize(std::span<const std::uint8_t> data);
};

enum class PeerKind : std::uint8_t {
    USERNAME = 0,
    NUMERIC_ID = 1
};

struct ResolveEntityMessage {
    PeerKind kind;
    std::int64_t peer_id;
    std::string username;
    
    // Numeric identifiers (optional '-' then digits) become ids, anything
    // else is looked up by name.
    static ResolveEntityMessage from_identifier(const std::string& identifier);
    
    std::vector<std::uint8_t> serialize() const;
    static ResolveEntityMessage deserialize(std::span<const std::uint8_t> data);
};

struct EntityMessage {
    std::int64_t entity_id;
    std::string name;
    
    std::vector<std::uint8_t> serialize() const;
    static EntityMessage deserialize(std::span<const std::uint8_t> data);
};

struct SavePartMessage {
    std::int64_t file_id;
    std::uint32_t part_index;
    std::uint32_t part_count;
    bool big;
    std::vector<std::uint8_t> data;
    
    std::vector<std::uint8_t> serialize() const;
    static SavePartMessage deserialize(std::span<const std::uint8_t> data);
};

struct PartAckMessage {
    std::int64_t file_id;
    std::uint32_t part_index;
    
    std::vector<std::uint8_t> serialize() const;
    static PartAckMessage deserialize(std::span<const std::uint8_t> data);
};

struct SendMediaMessage {
    std::int64_t entity_id;
    std::int64_t file_id;
    std::uint32_t part_count;
    std::string name;
    bool big;
    std::string md5_hex;
    bool supports_streaming;
    
    std::vector<std::uint8_t> serialize() const;
    static SendMediaMessage deserialize(std::span<const std::uint8_t> data);
};

struct MediaSentMessage {
    std::int64_t message_id;
    
    std::vector<std::uint8_t> serialize() const;
    static MediaSentMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    std::uint32_t error_code;
    std::string error_message;
    std::uint64_t request_id;
    
    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

enum class ErrorCode : std::uint32_t {
    NONE                    = 0,
    PROTOCOL_VERSION        = 1,
    INVALID_MESSAGE         = 2,
    AUTHENTICATION_FAILED   = 3,
    ENTITY_NOT_FOUND        = 4,
    PART_REJECTED           = 5,
    FILE_INCOMPLETE         = 6,
    CHECKSUM_MISMATCH       = 7,
    RATE_LIMITED            = 8,
    INTERNAL_ERROR          = 99
};

// Header followed by payload, checksum filled in.
std::vector<std::uint8_t> encode_frame(MessageType type, std::uint64_t message_id,
                                       std::span<const std::uint8_t> payload);

template<MessagePayload T>
std::vector<std::uint8_t> encode_frame(MessageType type, std::uint64_t message_id, const T& payload) {
    auto payload_data = payload.serialize();
    return encode_frame(type, message_id, payload_data);
}

std::uint64_t next_message_id();

}

static_assert(mediapush::network::MessagePayload<mediapush::network::AuthMessage>);
static_assert(mediapush::network::MessagePayload<mediapush::network::SavePartMessage>);
static_assert(mediapush::network::MessagePayload<mediapush::network::SendMediaMessage>);
