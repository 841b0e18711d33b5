#include "mediapush/network/gateway_connection.hpp"
#include "mediapush/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace mediapush::network {

GatewayConnection::GatewayConnection(GatewayEndpoint endpoint)
    : endpoint_(std::move(endpoint))
    , io_context_()
    , socket_(io_context_) {
}

GatewayConnection::~GatewayConnection() {
    close();
}

void GatewayConnection::open() {
    const std::string& connect_host = endpoint_.proxy ? endpoint_.proxy->host : endpoint_.host;
    std::uint16_t connect_port = endpoint_.proxy ? endpoint_.proxy->port : endpoint_.port;
    
    try {
        tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(connect_host, std::to_string(connect_port));
        boost::asio::connect(socket_, endpoints);
        socket_.set_option(tcp::no_delay(true));
        
        if (endpoint_.proxy) {
            establish_tunnel(socket_, *endpoint_.proxy, endpoint_.host, endpoint_.port);
        }
    } catch (const boost::system::system_error& e) {
        close();
        throw core::TransferError("Cannot connect to gateway " + endpoint_.to_string() +
                                  (endpoint_.proxy ? " via " + describe(*endpoint_.proxy) : std::string()) +
                                  ": " + e.code().message());
    } catch (const core::TransferError&) {
        close();
        throw;
    }
    
    LOG_DEBUG("Connected to gateway {}", endpoint_.to_string());
}

void GatewayConnection::close() {
    if (!socket_.is_open()) {
        return;
    }
    
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void GatewayConnection::shutdown() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

void GatewayConnection::notify(MessageType type) {
    write_frame(encode_frame(type, next_message_id(), std::span<const std::uint8_t>()));
}

void GatewayConnection::write_frame(const std::vector<std::uint8_t>& frame) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(frame), ec);
    if (ec) {
        throw core::TransferError("Write to gateway " + endpoint_.to_string() + " failed: " + ec.message());
    }
}

Frame GatewayConnection::read_frame() {
    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> header_buffer{};
    boost::system::error_code ec;
    boost::asio::read(socket_, boost::asio::buffer(header_buffer), ec);
    if (ec) {
        throw core::TransferError("Read from gateway " + endpoint_.to_string() + " failed: " + ec.message());
    }
    
    Frame frame;
    frame.header = MessageHeader::deserialize(header_buffer);
    if (!frame.header.is_valid()) {
        throw core::ProtocolError("Invalid message header from gateway " + endpoint_.to_string());
    }
    
    frame.payload.resize(frame.header.payload_size);
    if (!frame.payload.empty()) {
        boost::asio::read(socket_, boost::asio::buffer(frame.payload), ec);
        if (ec) {
            throw core::TransferError("Read from gateway " + endpoint_.to_string() + " failed: " + ec.message());
        }
    }
    
    if (!frame.header.verify_checksum(frame.payload)) {
        throw core::ProtocolError("Checksum mismatch for message from gateway " + endpoint_.to_string());
    }
    
    return frame;
}

Frame GatewayConnection::read_reply(std::uint64_t message_id, MessageType reply_type) {
    auto frame = read_frame();
    
    if (frame.header.message_id != message_id) {
        throw core::ProtocolError("Reply for unknown request " + std::to_string(frame.header.message_id));
    }
    
    if (frame.header.type == MessageType::ERROR_RESPONSE) {
        auto error = ErrorMessage::deserialize(frame.payload);
        throw core::TransferError("Gateway error " + std::to_string(error.error_code) + ": " + error.error_message);
    }
    
    if (frame.header.type != reply_type) {
        throw core::ProtocolError("Unexpected message type " +
                                  std::to_string(static_cast<int>(frame.header.type)) + " from gateway");
    }
    
    return frame;
}

}
