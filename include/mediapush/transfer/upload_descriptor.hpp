#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace mediapush::transfer {

// Reference to a completed upload, handed to the send step. Small files
// carry the hex MD5 of their content; large files carry none.
struct UploadDescriptor {
    std::int64_t file_id = 0;
    std::uint32_t part_count = 0;
    std::string name;
    std::optional<std::string> md5_hex;
    
    bool is_large() const { return !md5_hex.has_value(); }
    
    static UploadDescriptor small_file(std::int64_t file_id, std::uint32_t part_count,
                                       std::string name, std::string md5_hex) {
        return UploadDescriptor{file_id, part_count, std::move(name), std::move(md5_hex)};
    }
    
    static UploadDescriptor large_file(std::int64_t file_id, std::uint32_t part_count, std::string name) {
        return UploadDescriptor{file_id, part_count, std::move(name), std::nullopt};
    }
};

} // namespace mediapush::transfer
