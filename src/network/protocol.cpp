#include "mediapush/network/protocol.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/utils.hpp"
#include <boost/crc.hpp>
#include <atomic>
#include <chrono>
#include <random>
#include <algorithm>

namespace mediapush::network {

namespace {
    std::uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()).count();
    }
    
    std::uint32_t calculate_crc32(std::span<const std::uint8_t> data) {
        boost::crc_32_type crc;
        crc.process_bytes(data.data(), data.size());
        return crc.checksum();
    }
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }
    
    void write_int64(std::vector<std::uint8_t>& buffer, std::int64_t value) {
        write_uint64(buffer, static_cast<std::uint64_t>(value));
    }
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_bool(std::vector<std::uint8_t>& buffer, bool value) {
        buffer.push_back(value ? 1 : 0);
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }
    
    void write_bytes(std::vector<std::uint8_t>& buffer, const std::vector<std::uint8_t>& bytes) {
        write_uint32(buffer, static_cast<std::uint32_t>(bytes.size()));
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }
    
    void require(const std::span<const std::uint8_t>& data, size_t count, const char* what) {
        if (data.size() < count) {
            throw core::ProtocolError(std::string("Insufficient data for ") + what);
        }
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        require(data, 4, "uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        require(data, 8, "uint64");
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }
    
    std::int64_t read_int64(std::span<const std::uint8_t>& data) {
        return static_cast<std::int64_t>(read_uint64(data));
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        require(data, 2, "uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }
    
    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        require(data, 1, "uint8");
        std::uint8_t value = data[0];
        data = data.subspan(1);
        return value;
    }
    
    bool read_bool(std::span<const std::uint8_t>& data) {
        return read_uint8(data) != 0;
    }
    
    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        require(data, length, "string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
    
    std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        require(data, length, "bytes");
        std::vector<std::uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }
}

std::uint64_t next_message_id() {
    static std::atomic<std::uint64_t> next_id{std::random_device{}() | 1ULL};
    return next_id.fetch_add(1, std::memory_order_relaxed);
}

MessageHeader::MessageHeader() 
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::DISCONNECT)
    , flags(MessageFlags::NONE)
    , message_id(0)
    , payload_size(0)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , message_id(next_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = calculate_crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = calculate_crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);
    
    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(static_cast<std::uint8_t>(flags));
    write_uint64(buffer, message_id);
    write_uint32(buffer, payload_size);
    write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());
    
    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    require(data, MESSAGE_HEADER_SIZE, "message header");
    
    MessageHeader header;
    auto span = data;
    
    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(read_uint8(span));
    header.flags = static_cast<MessageFlags>(read_uint8(span));
    header.message_id = read_uint64(span);
    header.payload_size = read_uint32(span);
    header.timestamp = read_uint64(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());
    
    return header;
}

std::vector<std::uint8_t> encode_frame(MessageType type, std::uint64_t message_id,
                                       std::span<const std::uint8_t> payload) {
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        throw core::ProtocolError("Payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit");
    }
    
    MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
    header.message_id = message_id;
    header.calculate_checksum(payload);
    
    auto frame = header.serialize();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::vector<std::uint8_t> AuthMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_int64(buffer, api_id);
    write_string(buffer, api_hash);
    write_string(buffer, phone);
    write_string(buffer, session_token);
    return buffer;
}

AuthMessage AuthMessage::deserialize(std::span<const std::uint8_t> data) {
    AuthMessage msg;
    auto span = data;
    msg.api_id = read_int64(span);
    msg.api_hash = read_string(span);
    msg.phone = read_string(span);
    msg.session_token = read_string(span);
    return msg;
}

std::vector<std::uint8_t> AuthOkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, session_token);
    write_string(buffer, account_name);
    return buffer;
}

AuthOkMessage AuthOkMessage::deserialize(std::span<const std::uint8_t> data) {
    AuthOkMessage msg;
    auto span = data;
    msg.session_token = read_string(span);
    msg.account_name = read_string(span);
    return msg;
}

ResolveEntityMessage ResolveEntityMessage::from_identifier(const std::string& identifier) {
    auto trimmed = core::utils::StringUtils::trim(identifier);
    
    ResolveEntityMessage msg{PeerKind::USERNAME, 0, identifier};
    if (core::utils::StringUtils::is_integer(trimmed)) {
        try {
            msg.peer_id = std::stoll(trimmed);
            msg.kind = PeerKind::NUMERIC_ID;
            msg.username.clear();
        } catch (const std::out_of_range&) {
            // Too long for an id; let the gateway try it as a name.
        }
    }
    return msg;
}

std::vector<std::uint8_t> ResolveEntityMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.push_back(static_cast<std::uint8_t>(kind));
    write_int64(buffer, peer_id);
    write_string(buffer, username);
    return buffer;
}

ResolveEntityMessage ResolveEntityMessage::deserialize(std::span<const std::uint8_t> data) {
    ResolveEntityMessage msg;
    auto span = data;
    msg.kind = static_cast<PeerKind>(read_uint8(span));
    msg.peer_id = read_int64(span);
    msg.username = read_string(span);
    return msg;
}

std::vector<std::uint8_t> EntityMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_int64(buffer, entity_id);
    write_string(buffer, name);
    return buffer;
}

EntityMessage EntityMessage::deserialize(std::span<const std::uint8_t> data) {
    EntityMessage msg;
    auto span = data;
    msg.entity_id = read_int64(span);
    msg.name = read_string(span);
    return msg;
}

std::vector<std::uint8_t> SavePartMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(21 + data.size());
    write_int64(buffer, file_id);
    write_uint32(buffer, part_index);
    write_uint32(buffer, part_count);
    write_bool(buffer, big);
    write_bytes(buffer, data);
    return buffer;
}

SavePartMessage SavePartMessage::deserialize(std::span<const std::uint8_t> data_span) {
    SavePartMessage msg;
    auto span = data_span;
    msg.file_id = read_int64(span);
    msg.part_index = read_uint32(span);
    msg.part_count = read_uint32(span);
    msg.big = read_bool(span);
    msg.data = read_bytes(span);
    return msg;
}

std::vector<std::uint8_t> PartAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_int64(buffer, file_id);
    write_uint32(buffer, part_index);
    return buffer;
}

PartAckMessage PartAckMessage::deserialize(std::span<const std::uint8_t> data) {
    PartAckMessage msg;
    auto span = data;
    msg.file_id = read_int64(span);
    msg.part_index = read_uint32(span);
    return msg;
}

std::vector<std::uint8_t> SendMediaMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_int64(buffer, entity_id);
    write_int64(buffer, file_id);
    write_uint32(buffer, part_count);
    write_string(buffer, name);
    write_bool(buffer, big);
    write_string(buffer, md5_hex);
    write_bool(buffer, supports_streaming);
    return buffer;
}

SendMediaMessage SendMediaMessage::deserialize(std::span<const std::uint8_t> data) {
    SendMediaMessage msg;
    auto span = data;
    msg.entity_id = read_int64(span);
    msg.file_id = read_int64(span);
    msg.part_count = read_uint32(span);
    msg.name = read_string(span);
    msg.big = read_bool(span);
    msg.md5_hex = read_string(span);
    msg.supports_streaming = read_bool(span);
    return msg;
}

std::vector<std::uint8_t> MediaSentMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_int64(buffer, message_id);
    return buffer;
}

MediaSentMessage MediaSentMessage::deserialize(std::span<const std::uint8_t> data) {
    MediaSentMessage msg;
    auto span = data;
    msg.message_id = read_int64(span);
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, error_code);
    write_string(buffer, error_message);
    write_uint64(buffer, request_id);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.error_code = read_uint32(span);
    msg.error_message = read_string(span);
    msg.request_id = read_uint64(span);
    return msg;
}

}
