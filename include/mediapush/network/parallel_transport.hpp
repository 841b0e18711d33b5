#pragma once

#include "gateway_connection.hpp"
#include "mediapush/transfer/transport.hpp"
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mediapush::network {

// Produces a connection that is open and authenticated.
using ConnectionFactory = std::function<std::unique_ptr<GatewayConnection>()>;

// Transport that spreads the parts of one file over several gateway
// connections, one worker thread per connection. push() hands a part to a
// bounded queue and only blocks while every worker is busy.
class ParallelTransport : public transfer::Transport {
public:
    static constexpr std::uint32_t MAX_CONNECTIONS = 20;
    // Files of at least this size get MAX_CONNECTIONS.
    static constexpr std::uint64_t FULL_SPEED_FILE_SIZE = 100ULL * 1024 * 1024;
    
    explicit ParallelTransport(ConnectionFactory factory);
    ~ParallelTransport() override;
    
    void open(std::uint32_t connection_count, std::int64_t file_id,
              std::uint32_t part_count, bool large) override;
    void push(std::span<const std::uint8_t> part) override;
    void finalize() override;
    std::uint32_t default_connection_count(std::uint64_t file_size) const override;
    
    bool is_open() const { return !workers_.empty(); }
    
private:
    struct PendingPart {
        std::uint32_t index;
        std::vector<std::uint8_t> data;
    };
    
    ConnectionFactory factory_;
    
    std::int64_t file_id_;
    std::uint32_t part_count_;
    bool large_;
    std::uint32_t next_part_index_;
    
    std::vector<std::unique_ptr<GatewayConnection>> connections_;
    std::vector<std::thread> workers_;
    
    std::mutex mutex_;
    std::condition_variable queue_not_empty_;
    std::condition_variable queue_not_full_;
    std::deque<PendingPart> queue_;
    size_t queue_capacity_;
    bool closing_;
    std::exception_ptr failure_;
    
    void worker_loop(GatewayConnection& connection);
    void record_failure(std::exception_ptr failure);
    void stop_workers();
    void abort();
    [[noreturn]] void rethrow_failure();
};

}
