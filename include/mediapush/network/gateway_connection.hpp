#pragma once

#include "protocol.hpp"
#include "proxy.hpp"
#include "mediapush/core/errors.hpp"
#include <boost/asio.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mediapush::network {

using boost::asio::ip::tcp;

struct GatewayEndpoint {
    std::string host;
    std::uint16_t port = 0;
    std::optional<ProxySettings> proxy;
    
    std::string to_string() const { return host + ":" + std::to_string(port); }
};

struct Frame {
    MessageHeader header;
    std::vector<std::uint8_t> payload;
};

// One blocking request/response connection to the gateway. Not thread-safe;
// only shutdown() may be called from another thread.
class GatewayConnection {
public:
    explicit GatewayConnection(GatewayEndpoint endpoint);
    ~GatewayConnection();
    
    GatewayConnection(const GatewayConnection&) = delete;
    GatewayConnection& operator=(const GatewayConnection&) = delete;
    
    // Connects directly or through the configured proxy.
    void open();
    void close();
    // Unblocks a pending read or write.
    void shutdown();
    bool is_open() const { return socket_.is_open(); }
    
    // Sends one request and waits for its reply. An ERROR_RESPONSE reply
    // becomes a TransferError, anything other than `reply_type` a
    // ProtocolError.
    template<MessagePayload Reply, MessagePayload Request>
    Reply request(MessageType type, const Request& payload, MessageType reply_type) {
        auto message_id = next_message_id();
        write_frame(encode_frame(type, message_id, payload));
        auto reply = read_reply(message_id, reply_type);
        return Reply::deserialize(reply.payload);
    }
    
    // Fire-and-forget message, used for DISCONNECT.
    void notify(MessageType type);
    
    const GatewayEndpoint& endpoint() const { return endpoint_; }
    
private:
    GatewayEndpoint endpoint_;
    boost::asio::io_context io_context_;
    tcp::socket socket_;
    
    void write_frame(const std::vector<std::uint8_t>& frame);
    Frame read_frame();
    Frame read_reply(std::uint64_t message_id, MessageType reply_type);
};

}
