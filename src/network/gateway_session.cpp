#include "mediapush/network/gateway_session.hpp"
#include "mediapush/core/logger.hpp"
#include "mediapush/core/utils.hpp"
#include <fstream>

namespace mediapush::network {

GatewaySession::GatewaySession(GatewayEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {
}

GatewaySession::~GatewaySession() {
    if (control_) {
        control_->close();
    }
}

void GatewaySession::connect(const transfer::Credentials& credentials) {
    if (control_) {
        throw core::TransferError("Session is already connected");
    }
    
    credentials_ = credentials;
    session_token_ = load_token(credentials.session_path);
    
    auto connection = std::make_unique<GatewayConnection>(endpoint_);
    connection->open();
    auto auth = authenticate(*connection);
    
    account_name_ = auth.account_name;
    if (auth.session_token != session_token_) {
        session_token_ = auth.session_token;
        store_token(credentials.session_path, session_token_);
    }
    control_ = std::move(connection);
    
    LOG_INFO("Connected to gateway {} as {}", endpoint_.to_string(), account_name_);
}

transfer::Entity GatewaySession::resolve_entity(const std::string& identifier) {
    auto request = ResolveEntityMessage::from_identifier(identifier);
    auto entity = control().request<EntityMessage>(MessageType::RESOLVE_ENTITY, request, MessageType::ENTITY);
    return transfer::Entity{entity.entity_id, entity.name};
}

void GatewaySession::send(const transfer::Entity& target, const transfer::UploadDescriptor& descriptor,
                          bool supports_streaming) {
    SendMediaMessage request{
        target.id,
        descriptor.file_id,
        descriptor.part_count,
        descriptor.name,
        descriptor.is_large(),
        descriptor.md5_hex.value_or(""),
        supports_streaming
    };
    auto sent = control().request<MediaSentMessage>(MessageType::SEND_MEDIA, request, MessageType::MEDIA_SENT);
    LOG_DEBUG("Sent {} to {} as message {}", descriptor.name, target.id, sent.message_id);
}

void GatewaySession::disconnect() {
    if (!control_) {
        return;
    }
    
    auto connection = std::move(control_);
    try {
        connection->notify(MessageType::DISCONNECT);
    } catch (const core::TransferError& e) {
        LOG_DEBUG("Disconnect notice not delivered: {}", e.what());
    }
    connection->close();
    LOG_INFO("Disconnected from gateway {}", endpoint_.to_string());
}

std::unique_ptr<GatewayConnection> GatewaySession::open_authenticated_connection() {
    if (!credentials_ || !control_) {
        throw core::TransferError("Session is not connected");
    }
    
    auto connection = std::make_unique<GatewayConnection>(endpoint_);
    connection->open();
    authenticate(*connection);
    return connection;
}

ConnectionFactory GatewaySession::connection_factory() {
    return [this] { return open_authenticated_connection(); };
}

AuthOkMessage GatewaySession::authenticate(GatewayConnection& connection) {
    AuthMessage request{credentials_->api_id, credentials_->api_hash, credentials_->phone, session_token_};
    return connection.request<AuthOkMessage>(MessageType::AUTH, request, MessageType::AUTH_OK);
}

GatewayConnection& GatewaySession::control() {
    if (!control_) {
        throw core::TransferError("Session is not connected");
    }
    return *control_;
}

std::string GatewaySession::load_token(const std::filesystem::path& session_path) {
    std::ifstream file(session_path);
    if (!file.is_open()) {
        LOG_DEBUG("No session file at {}", session_path.string());
        return "";
    }
    
    std::string token;
    std::getline(file, token);
    return core::utils::StringUtils::trim(token);
}

void GatewaySession::store_token(const std::filesystem::path& session_path, const std::string& token) {
    std::error_code ec;
    if (session_path.has_parent_path()) {
        std::filesystem::create_directories(session_path.parent_path(), ec);
    }
    
    std::ofstream file(session_path, std::ios::trunc);
    if (!file.is_open()) {
        LOG_WARN("Cannot write session file {}", session_path.string());
        return;
    }
    file << token << "\n";
    
    std::filesystem::permissions(session_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
}

}
