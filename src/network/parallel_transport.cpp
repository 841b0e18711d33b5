#include "mediapush/network/parallel_transport.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/logger.hpp"
#include <algorithm>

namespace mediapush::network {

ParallelTransport::ParallelTransport(ConnectionFactory factory)
    : factory_(std::move(factory))
    , file_id_(0)
    , part_count_(0)
    , large_(false)
    , next_part_index_(0)
    , queue_capacity_(0)
    , closing_(false) {
}

ParallelTransport::~ParallelTransport() {
    abort();
}

std::uint32_t ParallelTransport::default_connection_count(std::uint64_t file_size) const {
    if (file_size >= FULL_SPEED_FILE_SIZE) {
        return MAX_CONNECTIONS;
    }
    auto count = (file_size * MAX_CONNECTIONS + FULL_SPEED_FILE_SIZE - 1) / FULL_SPEED_FILE_SIZE;
    return std::max<std::uint32_t>(1, static_cast<std::uint32_t>(count));
}

void ParallelTransport::open(std::uint32_t connection_count, std::int64_t file_id,
                             std::uint32_t part_count, bool large) {
    if (is_open()) {
        LOG_WARN("Abandoning unfinished upload of file {}", file_id_);
        abort();
    }
    
    connection_count = std::max<std::uint32_t>(1, connection_count);
    
    file_id_ = file_id;
    part_count_ = part_count;
    large_ = large;
    next_part_index_ = 0;
    queue_.clear();
    queue_capacity_ = connection_count;
    closing_ = false;
    failure_ = nullptr;
    
    connections_.clear();
    for (std::uint32_t i = 0; i < connection_count; ++i) {
        connections_.push_back(factory_());
    }
    
    for (auto& connection : connections_) {
        workers_.emplace_back(&ParallelTransport::worker_loop, this, std::ref(*connection));
    }
    
    LOG_DEBUG("Opened transfer of file {} ({} parts, {}) over {} connections",
              file_id_, part_count_, large_ ? "big" : "small", connection_count);
}

void ParallelTransport::push(std::span<const std::uint8_t> part) {
    if (!is_open()) {
        throw core::TransferError("push() without an open transfer");
    }
    
    std::unique_lock<std::mutex> lock(mutex_);
    queue_not_full_.wait(lock, [this] { return queue_.size() < queue_capacity_ || failure_; });
    
    if (failure_) {
        lock.unlock();
        abort();
        rethrow_failure();
    }
    
    if (next_part_index_ >= part_count_) {
        throw core::TransferError("File " + std::to_string(file_id_) + " has more than the declared " +
                                  std::to_string(part_count_) + " parts");
    }
    
    queue_.push_back(PendingPart{next_part_index_++, std::vector<std::uint8_t>(part.begin(), part.end())});
    queue_not_empty_.notify_one();
}

void ParallelTransport::finalize() {
    if (!is_open()) {
        throw core::TransferError("finalize() without an open transfer");
    }
    
    stop_workers();
    connections_.clear();
    
    if (failure_) {
        rethrow_failure();
    }
    
    if (next_part_index_ != part_count_) {
        throw core::TransferError("File " + std::to_string(file_id_) + " ended after " +
                                  std::to_string(next_part_index_) + " of " +
                                  std::to_string(part_count_) + " parts");
    }
    
    LOG_DEBUG("Finished transfer of file {}", file_id_);
}

void ParallelTransport::worker_loop(GatewayConnection& connection) {
    while (true) {
        PendingPart part;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_not_empty_.wait(lock, [this] { return !queue_.empty() || closing_ || failure_; });
            
            if (failure_ || queue_.empty()) {
                return;
            }
            part = std::move(queue_.front());
            queue_.pop_front();
            queue_not_full_.notify_one();
        }
        
        try {
            SavePartMessage message{file_id_, part.index, part_count_, large_, std::move(part.data)};
            auto ack = connection.request<PartAckMessage>(MessageType::SAVE_PART, message, MessageType::PART_ACK);
            if (ack.file_id != file_id_ || ack.part_index != part.index) {
                throw core::ProtocolError("Acknowledgement for part " + std::to_string(ack.part_index) +
                                          " while waiting for part " + std::to_string(part.index));
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Part {} of file {} failed: {}", part.index, file_id_, e.what());
            record_failure(std::current_exception());
            return;
        }
    }
}

void ParallelTransport::record_failure(std::exception_ptr failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure_) {
        failure_ = failure;
    }
    queue_not_empty_.notify_all();
    queue_not_full_.notify_all();
}

void ParallelTransport::stop_workers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
    }
    queue_not_empty_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void ParallelTransport::abort() {
    if (!is_open()) {
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        closing_ = true;
    }
    for (auto& connection : connections_) {
        connection->shutdown();
    }
    stop_workers();
    connections_.clear();
}

void ParallelTransport::rethrow_failure() {
    try {
        std::rethrow_exception(failure_);
    } catch (const core::TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::TransferError(e.what());
    }
}

}
