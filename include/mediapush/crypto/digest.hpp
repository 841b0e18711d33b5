#pragma once

#include "crypto_types.hpp"
#include <memory>
#include <span>
#include <string>

namespace mediapush::crypto {

// Incremental MD5, the content checksum the gateway expects for files that
// are uploaded in one piece.
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();
    
    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;
    
    CryptoResult update(std::span<const std::uint8_t> data);
    
    // Consumes the hasher; further updates fail with INVALID_STATE.
    Md5Digest finalize();
    
    static Md5Digest hash(std::span<const std::uint8_t> data);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

namespace digest_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);

}

}
