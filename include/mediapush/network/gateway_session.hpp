#pragma once

#include "gateway_connection.hpp"
#include "parallel_transport.hpp"
#include "mediapush/transfer/messaging_session.hpp"
#include <memory>
#include <optional>
#include <string>

namespace mediapush::network {

// MessagingSession backed by one control connection to the gateway. The
// session token is read from and written back to the session file, so an
// already authorized account does not need to log in again.
class GatewaySession : public transfer::MessagingSession {
public:
    explicit GatewaySession(GatewayEndpoint endpoint);
    ~GatewaySession() override;
    
    void connect(const transfer::Credentials& credentials) override;
    transfer::Entity resolve_entity(const std::string& identifier) override;
    void send(const transfer::Entity& target, const transfer::UploadDescriptor& descriptor,
              bool supports_streaming) override;
    void disconnect() override;
    
    bool is_connected() const { return control_ != nullptr; }
    const std::string& account_name() const { return account_name_; }
    
    // Additional authenticated connections for part uploads.
    std::unique_ptr<GatewayConnection> open_authenticated_connection();
    ConnectionFactory connection_factory();
    
private:
    GatewayEndpoint endpoint_;
    std::unique_ptr<GatewayConnection> control_;
    std::optional<transfer::Credentials> credentials_;
    std::string session_token_;
    std::string account_name_;
    
    AuthOkMessage authenticate(GatewayConnection& connection);
    GatewayConnection& control();
    
    static std::string load_token(const std::filesystem::path& session_path);
    static void store_token(const std::filesystem::path& session_path, const std::string& token);
};

}
