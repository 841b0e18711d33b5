#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace mediapush::crypto {

constexpr size_t MD5_DIGEST_SIZE = 16;

using Md5Digest = std::array<std::uint8_t, MD5_DIGEST_SIZE>;

enum class CryptoError {
    SUCCESS = 0,
    DIGEST_FAILED,
    RANDOM_GENERATION_FAILED,
    INVALID_STATE
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
