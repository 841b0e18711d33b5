#include "mediapush/crypto/random.hpp"
#include "mediapush/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace mediapush::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

std::uint64_t SecureRandom::generate_uint64() {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    
    std::uint64_t high = randombytes_random();
    std::uint64_t low = randombytes_random();
    return (high << 32) | low;
}

std::uint64_t SecureRandom::next_uint64() {
    return generate_uint64();
}

}
