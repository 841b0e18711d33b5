#pragma once

#include "upload_descriptor.hpp"
#include <filesystem>
#include <string>
#include <cstdint>

namespace mediapush::transfer {

struct Credentials {
    std::int64_t api_id = 0;
    std::string api_hash;
    std::string phone;
    std::filesystem::path session_path;
};

struct Entity {
    std::int64_t id = 0;
    std::string name;
};

// The authenticated client the batch sends through.
class MessagingSession {
public:
    virtual ~MessagingSession() = default;
    
    virtual void connect(const Credentials& credentials) = 0;
    virtual Entity resolve_entity(const std::string& identifier) = 0;
    virtual void send(const Entity& target, const UploadDescriptor& descriptor, bool supports_streaming) = 0;
    virtual void disconnect() = 0;
};

// Connects on construction and disconnects exactly once when it goes out of
// scope, including during stack unwinding.
class SessionGuard {
public:
    SessionGuard(MessagingSession& session, const Credentials& credentials);
    ~SessionGuard();
    
    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;
    
    MessagingSession& session() { return session_; }
    
private:
    MessagingSession& session_;
};

} // namespace mediapush::transfer
