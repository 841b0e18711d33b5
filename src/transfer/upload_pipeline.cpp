#include "mediapush/transfer/upload_pipeline.hpp"
#include "mediapush/crypto/digest.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/logger.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace mediapush::transfer {

UploadSession UploadSession::plan(std::int64_t file_id, std::uint64_t total_size, std::uint32_t part_size) {
    std::uint64_t parts = (total_size + part_size - 1) / part_size;
    if (parts > std::numeric_limits<std::uint32_t>::max()) {
        throw core::TransferError("File too large: " + std::to_string(total_size) + " bytes");
    }
    
    UploadSession session;
    session.file_id = file_id;
    session.total_size = total_size;
    session.part_size = part_size;
    session.part_count = static_cast<std::uint32_t>(parts);
    session.large = ChunkedUploadPipeline::is_large(total_size);
    return session;
}

ChunkedUploadPipeline::ChunkedUploadPipeline(Transport& transport, crypto::RandomSource& random,
                                             std::uint32_t part_size)
    : transport_(transport)
    , random_(random)
    , part_size_(part_size) {
    if (part_size_ == 0) {
        throw std::invalid_argument("Part size must be positive");
    }
}

UploadDescriptor ChunkedUploadPipeline::upload(const std::filesystem::path& file_path,
                                               const ProgressSink& progress,
                                               std::optional<std::uint32_t> connections) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        throw core::TransferError("Cannot stat " + file_path.string() + ": " + ec.message());
    }
    
    auto session = UploadSession::plan(static_cast<std::int64_t>(random_.next_uint64()), file_size, part_size_);
    auto connection_count = connections.value_or(transport_.default_connection_count(file_size));
    
    LOG_DEBUG("Uploading {} ({} bytes, {} parts, {} connections, {})",
              file_path.string(), file_size, session.part_count, connection_count,
              session.large ? "large" : "small");
    
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw core::TransferError("Cannot open " + file_path.string());
    }
    
    transport_.open(connection_count, session.file_id, session.part_count, session.large);
    
    crypto::Md5Hasher md5;
    std::vector<std::uint8_t> buffer(session.part_size);
    std::uint64_t uploaded = 0;
    
    while (true) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<size_t>(file.gcount());
        if (file.bad()) {
            throw core::TransferError("Read error in " + file_path.string());
        }
        if (bytes_read == 0) {
            break;
        }
        
        std::span<const std::uint8_t> part(buffer.data(), bytes_read);
        transport_.push(part);
        uploaded += bytes_read;
        
        if (!session.large) {
            auto result = md5.update(part);
            if (!result.success()) {
                throw core::TransferError("Checksum of " + file_path.string() + " failed: " + result.message);
            }
        }
        
        report(progress, uploaded, file_size);
    }
    
    transport_.finalize();
    
    auto name = file_path.filename().string();
    if (session.large) {
        return UploadDescriptor::large_file(session.file_id, session.part_count, name);
    }
    auto digest = md5.finalize();
    return UploadDescriptor::small_file(session.file_id, session.part_count, name,
                                        crypto::digest_utils::to_hex(digest));
}

void ChunkedUploadPipeline::report(const ProgressSink& progress, std::uint64_t current, std::uint64_t total) {
    if (!progress) {
        return;
    }
    
    try {
        progress(current, total);
    } catch (const std::exception& e) {
        LOG_DEBUG("Progress report failed: {}", e.what());
    } catch (...) {
        LOG_DEBUG("Progress report failed with a non-standard exception");
    }
}

} // namespace mediapush::transfer
