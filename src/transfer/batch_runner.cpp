#include "mediapush/transfer/batch_runner.hpp"
#include "mediapush/core/logger.hpp"
#include "mediapush/core/utils.hpp"
#include <iomanip>

namespace mediapush::transfer {

using core::utils::BYTES_PER_MB;

double BatchTotals::average_rate() const {
    return seconds > 0 ? (bytes / BYTES_PER_MB) / seconds : 0.0;
}

BatchRunner::BatchRunner(MessagingSession& session,
                         ChunkedUploadPipeline& pipeline,
                         BatchOptions options,
                         std::ostream& out,
                         Clock clock)
    : session_(session)
    , pipeline_(pipeline)
    , options_(std::move(options))
    , out_(out)
    , clock_(std::move(clock)) {
}

BatchTotals BatchRunner::run(const std::vector<storage::FileEntry>& files) {
    BatchTotals totals;
    
    if (files.empty()) {
        out_ << "No video files found in " << options_.directory.string() << "\n";
        LOG_INFO("Nothing to upload in {}", options_.directory.string());
        return totals;
    }
    
    SessionGuard guard(session_, options_.credentials);
    auto target = session_.resolve_entity(options_.target);
    LOG_INFO("Resolved target '{}' to entity {} ({})", options_.target, target.id, target.name);
    
    out_ << "Target: " << options_.target << "\n";
    out_ << "Directory: " << options_.directory.string() << "\n";
    out_ << "Files: " << files.size() << "\n";
    
    for (size_t i = 0; i < files.size(); ++i) {
        double seconds = upload_one(target, files[i], i + 1, files.size());
        totals.add(files[i].size, seconds);
    }
    
    out_ << "\nTotal: " << std::fixed << std::setprecision(2)
         << totals.bytes / BYTES_PER_MB << " MB / "
         << totals.seconds << "s = "
         << totals.average_rate() << " MB/s\n";
    out_.flush();
    
    LOG_INFO("Batch complete: {} files, {} bytes in {:.2f}s", totals.files, totals.bytes, totals.seconds);
    return totals;
}

double BatchRunner::upload_one(const Entity& target, const storage::FileEntry& file, size_t index, size_t count) {
    out_ << "\n[" << index << "/" << count << "] " << file.filename << " ("
         << std::fixed << std::setprecision(2) << file.size / BYTES_PER_MB << " MB)\n";
    out_.flush();
    
    ThroughputMeter meter(file.display_name, options_.progress_interval, out_, clock_);
    
    auto start = clock_();
    auto descriptor = pipeline_.upload(file.path,
        [&meter](std::uint64_t current, std::uint64_t total) { meter.observe(current, total); },
        options_.connections);
    session_.send(target, descriptor, true);
    double seconds = std::chrono::duration<double>(clock_() - start).count();
    
    double rate = seconds > 0 ? (file.size / BYTES_PER_MB) / seconds : 0.0;
    out_ << "Done: " << file.filename << " in " << std::fixed << std::setprecision(2)
         << seconds << "s avg " << rate << " MB/s\n";
    out_.flush();
    
    LOG_DEBUG("Sent {} as file {} ({} parts, {})", file.filename, descriptor.file_id,
              descriptor.part_count, descriptor.is_large() ? "large" : "md5 " + *descriptor.md5_hex);
    return seconds;
}

} // namespace mediapush::transfer
