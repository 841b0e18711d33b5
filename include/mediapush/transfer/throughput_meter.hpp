#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace mediapush::transfer {

// Progress observer for one file. Rewrites a single status line at most once
// per interval, plus a final line when the transfer reaches its total.
class ThroughputMeter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    
    static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{500};
    
    explicit ThroughputMeter(std::string label,
                             std::chrono::steady_clock::duration min_interval = DEFAULT_INTERVAL,
                             std::ostream& out = std::cout,
                             Clock clock = &std::chrono::steady_clock::now);
    
    void observe(std::uint64_t current_bytes, std::uint64_t total_bytes);
    
    // Rates of the most recent emitted line, in MB/s.
    double last_instant_rate() const { return last_instant_rate_; }
    double last_average_rate() const { return last_average_rate_; }
    size_t emitted_lines() const { return emitted_lines_; }
    
private:
    std::string label_;
    std::chrono::steady_clock::duration min_interval_;
    std::ostream& out_;
    Clock clock_;
    
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_emit_;
    std::uint64_t last_bytes_;
    
    double last_instant_rate_;
    double last_average_rate_;
    size_t emitted_lines_;
};

} // namespace mediapush::transfer
