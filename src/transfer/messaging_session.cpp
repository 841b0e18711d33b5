#include "mediapush/transfer/messaging_session.hpp"
#include "mediapush/core/logger.hpp"

namespace mediapush::transfer {

SessionGuard::SessionGuard(MessagingSession& session, const Credentials& credentials)
    : session_(session) {
    session_.connect(credentials);
}

SessionGuard::~SessionGuard() {
    try {
        session_.disconnect();
    } catch (const std::exception& e) {
        LOG_WARN("Disconnect failed: {}", e.what());
    }
}

} // namespace mediapush::transfer
