#pragma once

#include <stdexcept>
#include <string>

namespace mediapush::core {

// Missing or invalid settings. Raised before any upload starts.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Failure while reading, pushing or finalizing a file, or while talking to
// the gateway. Aborts the batch.
class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& message)
        : TransferError(message) {}
};

}
