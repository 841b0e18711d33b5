#pragma once

#include <cstdint>
#include <span>

namespace mediapush::transfer {

// Moves the ordered parts of one file to the remote side. Implementations
// may spread parts over several connections; callers only see a blocking
// push per part.
class Transport {
public:
    virtual ~Transport() = default;
    
    virtual void open(std::uint32_t connection_count, std::int64_t file_id,
                      std::uint32_t part_count, bool large) = 0;
    
    // Blocks until the transport has accepted the part.
    virtual void push(std::span<const std::uint8_t> part) = 0;
    
    // Waits for every accepted part to be stored remotely and releases the
    // transfer's resources. Throws core::TransferError on failure.
    virtual void finalize() = 0;
    
    virtual std::uint32_t default_connection_count(std::uint64_t file_size) const = 0;
};

} // namespace mediapush::transfer
