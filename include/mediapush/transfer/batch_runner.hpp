#pragma once

#include "messaging_session.hpp"
#include "throughput_meter.hpp"
#include "upload_pipeline.hpp"
#include "../storage/file_catalog.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace mediapush::transfer {

struct BatchTotals {
    size_t files = 0;
    std::uint64_t bytes = 0;
    double seconds = 0.0;
    
    void add(std::uint64_t file_bytes, double file_seconds) {
        ++files;
        bytes += file_bytes;
        seconds += file_seconds;
    }
    
    // MB/s over the whole batch, 0 when no time was measured.
    double average_rate() const;
};

struct BatchOptions {
    std::string target;
    std::filesystem::path directory;
    Credentials credentials;
    std::optional<std::uint32_t> connections;
    std::chrono::steady_clock::duration progress_interval = ThroughputMeter::DEFAULT_INTERVAL;
};

// Uploads and sends a list of files one after another. The session is only
// connected when there is something to upload, and is always disconnected
// before run() returns or throws.
class BatchRunner {
public:
    using Clock = ThroughputMeter::Clock;
    
    BatchRunner(MessagingSession& session,
                ChunkedUploadPipeline& pipeline,
                BatchOptions options,
                std::ostream& out = std::cout,
                Clock clock = &std::chrono::steady_clock::now);
    
    // The first failure aborts the remaining files and propagates.
    BatchTotals run(const std::vector<storage::FileEntry>& files);
    
private:
    MessagingSession& session_;
    ChunkedUploadPipeline& pipeline_;
    BatchOptions options_;
    std::ostream& out_;
    Clock clock_;
    
    double upload_one(const Entity& target, const storage::FileEntry& file, size_t index, size_t count);
};

} // namespace mediapush::transfer
