#pragma once

#include "transport.hpp"
#include "upload_descriptor.hpp"
#include "../crypto/random.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <cstdint>

namespace mediapush::transfer {

using ProgressSink = std::function<void(std::uint64_t current_bytes, std::uint64_t total_bytes)>;

// Per-file upload plan.
struct UploadSession {
    std::int64_t file_id = 0;
    std::uint64_t total_size = 0;
    std::uint32_t part_size = 0;
    std::uint32_t part_count = 0;
    bool large = false;
    
    static UploadSession plan(std::int64_t file_id, std::uint64_t total_size, std::uint32_t part_size);
};

// Reads a file part by part into a Transport and describes the result.
class ChunkedUploadPipeline {
public:
    // Much larger than the transport's network chunk, so local reads and
    // per-call overhead stay off the critical path.
    static constexpr std::uint32_t DEFAULT_PART_SIZE = 512 * 1024;
    // Files strictly above this size are uploaded as large files, without MD5.
    static constexpr std::uint64_t LARGE_FILE_THRESHOLD = 10ULL * 1024 * 1024;
    
    ChunkedUploadPipeline(Transport& transport, crypto::RandomSource& random,
                          std::uint32_t part_size = DEFAULT_PART_SIZE);
    
    // Exceptions from the transport propagate; exceptions from the progress
    // sink are swallowed.
    UploadDescriptor upload(const std::filesystem::path& file_path,
                            const ProgressSink& progress,
                            std::optional<std::uint32_t> connections = std::nullopt);
    
    std::uint32_t part_size() const { return part_size_; }
    
    static bool is_large(std::uint64_t file_size) { return file_size > LARGE_FILE_THRESHOLD; }
    
private:
    Transport& transport_;
    crypto::RandomSource& random_;
    std::uint32_t part_size_;
    
    static void report(const ProgressSink& progress, std::uint64_t current, std::uint64_t total);
};

} // namespace mediapush::transfer
