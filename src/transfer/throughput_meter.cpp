#include "mediapush/transfer/throughput_meter.hpp"
#include "mediapush/core/utils.hpp"
#include <iomanip>

namespace mediapush::transfer {

using core::utils::BYTES_PER_MB;

ThroughputMeter::ThroughputMeter(std::string label,
                                 std::chrono::steady_clock::duration min_interval,
                                 std::ostream& out,
                                 Clock clock)
    : label_(std::move(label))
    , min_interval_(min_interval)
    , out_(out)
    , clock_(std::move(clock))
    , start_time_(clock_())
    , last_emit_(start_time_)
    , last_bytes_(0)
    , last_instant_rate_(0.0)
    , last_average_rate_(0.0)
    , emitted_lines_(0) {
}

void ThroughputMeter::observe(std::uint64_t current_bytes, std::uint64_t total_bytes) {
    auto now = clock_();
    bool terminal = current_bytes == total_bytes;
    
    if (now - last_emit_ < min_interval_ && !terminal) {
        return;
    }
    
    double since_last = std::chrono::duration<double>(now - last_emit_).count();
    double since_start = std::chrono::duration<double>(now - start_time_).count();
    double delta_mb = static_cast<double>(current_bytes - last_bytes_) / BYTES_PER_MB;
    
    last_instant_rate_ = since_last > 0 ? delta_mb / since_last : 0.0;
    last_average_rate_ = since_start > 0 ? (current_bytes / BYTES_PER_MB) / since_start : 0.0;
    double percent = total_bytes > 0 ? static_cast<double>(current_bytes) / total_bytes * 100.0 : 0.0;
    
    out_ << '\r' << label_ << ' ' << std::fixed << std::setprecision(2)
         << std::setw(8) << current_bytes / BYTES_PER_MB << '/'
         << std::setw(8) << total_bytes / BYTES_PER_MB << " MB "
         << std::setw(6) << percent << "% inst "
         << std::setw(6) << last_instant_rate_ << " MB/s avg "
         << std::setw(6) << last_average_rate_ << " MB/s";
    
    if (terminal) {
        out_ << '\n';
    }
    out_.flush();
    
    last_emit_ = now;
    last_bytes_ = current_bytes;
    ++emitted_lines_;
}

} // namespace mediapush::transfer
