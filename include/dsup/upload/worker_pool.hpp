#pragma once

#include "dsup/core/result.hpp"
#include "dsup/upload/chunk_reader.hpp"
#include "dsup/upload/types.hpp"
#include "dsup/upload/work_queue.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace dsup::upload {

/// Transmits one chunk to the remote service
using ChunkSender = std::function<dsup::Result<void>(const Chunk&)>;

/// Invoked from a worker thread after a chunk has been acknowledged
using ChunkCompletedHandler = std::function<void(const ChunkReceipt&)>;

/**
 * @brief Fixed-size pool of upload workers fed by a single producer
 *
 * The thread calling drain() is the only reader of the ChunkReader; it pushes
 * chunks into a bounded queue consumed by the workers. Completion order is
 * unrelated to seq_num.
 *
 * On the first failure the pool stops admitting work: queued chunks are
 * dropped, the producer stops reading, and chunks already in flight finish
 * but their receipts are discarded. drain() returns that first error.
 *
 * A pool serves exactly one drain() call.
 */
class WorkerPool {
public:
    WorkerPool(std::size_t worker_count, ChunkSender sender);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void on_chunk_completed(ChunkCompletedHandler handler);

    /**
     * @brief Send `first` and every remaining chunk of `reader`
     *
     * BLOCKS: until every worker has finished (full barrier)
     * RETURNS: receipts in completion order, or the first failure
     */
    dsup::Result<std::vector<ChunkReceipt>> drain(Chunk first, ChunkReader& reader);

    [[nodiscard]] std::size_t size() const noexcept { return worker_count_; }

private:
    void worker_loop();
    void record_failure(Error error);
    void join_workers();

    const std::size_t worker_count_;
    ChunkSender sender_;
    ChunkCompletedHandler completed_handler_;

    BoundedQueue<Chunk> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> failed_{false};
    bool drained_ = false;

    std::mutex results_mutex_;
    std::vector<ChunkReceipt> receipts_;
    std::optional<Error> first_error_;
};

} // namespace dsup::upload
