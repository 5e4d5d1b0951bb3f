#include "dsup/upload/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace dsup::upload {

WorkerPool::WorkerPool(std::size_t worker_count, ChunkSender sender)
    : worker_count_(worker_count == 0 ? 1 : worker_count),
      sender_(std::move(sender)),
      queue_(worker_count_) {
    workers_.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("Worker pool started with {} workers", worker_count_);
}

WorkerPool::~WorkerPool() {
    queue_.close();
    join_workers();
}

void WorkerPool::on_chunk_completed(ChunkCompletedHandler handler) {
    completed_handler_ = std::move(handler);
}

dsup::Result<std::vector<ChunkReceipt>> WorkerPool::drain(Chunk first, ChunkReader& reader) {
    if (drained_) {
        return dsup::Err<std::vector<ChunkReceipt>>(ErrorCode::IllegalState,
                                                    "Worker pool already drained");
    }
    drained_ = true;

    std::optional<Chunk> pending(std::move(first));
    while (pending.has_value() && !failed_.load()) {
        if (!queue_.push(std::move(*pending))) {
            break;
        }

        auto next = reader.next();
        if (next.is_error()) {
            record_failure(next.error());
            break;
        }
        pending = std::move(next.value());
    }

    if (failed_.load()) {
        const auto dropped = queue_.clear();
        if (dropped > 0) {
            spdlog::debug("Dropped {} queued chunks after failure", dropped);
        }
    }

    queue_.close();
    join_workers();

    std::lock_guard lock(results_mutex_);
    if (first_error_.has_value()) {
        return dsup::Err<std::vector<ChunkReceipt>>(*first_error_);
    }
    return dsup::Ok(std::move(receipts_));
}

void WorkerPool::worker_loop() {
    while (auto chunk = queue_.pop()) {
        if (failed_.load()) {
            continue;
        }

        dsup::Result<void> sent = dsup::Ok();
        try {
            sent = sender_(*chunk);
        } catch (const std::exception& e) {
            sent = dsup::Err<void>(ErrorCode::Transport, e.what());
        }

        if (sent.is_error()) {
            spdlog::warn("Chunk {} [{}, {}) failed: {}",
                         chunk->seq_num, chunk->byte_offset, chunk->end_byte_offset,
                         sent.error().describe());
            record_failure(sent.error());
            queue_.clear();
            continue;
        }

        // Results of chunks that were in flight when another worker failed are discarded
        if (failed_.load()) {
            continue;
        }

        ChunkReceipt receipt{chunk->seq_num, chunk->byte_offset, chunk->end_byte_offset};
        {
            std::lock_guard lock(results_mutex_);
            receipts_.push_back(receipt);
        }
        spdlog::debug("Chunk {} [{}, {}) acknowledged",
                      receipt.seq_num, receipt.byte_offset, receipt.end_byte_offset);
        if (completed_handler_) {
            completed_handler_(receipt);
        }
    }
}

void WorkerPool::record_failure(Error error) {
    std::lock_guard lock(results_mutex_);
    if (!first_error_.has_value()) {
        first_error_ = std::move(error);
    }
    failed_.store(true);
}

void WorkerPool::join_workers() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace dsup::upload
