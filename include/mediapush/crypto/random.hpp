#pragma once

#include "crypto_types.hpp"
#include <cstdint>

namespace mediapush::crypto {

// Source of upload file identifiers. Tests substitute a deterministic one.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual std::uint64_t next_uint64() = 0;
};

class SecureRandom : public RandomSource {
public:
    // Initializes libsodium once per process. Safe to call repeatedly.
    static bool initialize();
    
    static std::uint64_t generate_uint64();
    
    std::uint64_t next_uint64() override;
    
private:
    static bool initialized_;
};

}
