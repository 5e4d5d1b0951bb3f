/**
 * @file events.hpp
 * @brief Event types emitted during an upload
 *
 * NAMING CONVENTION:
 * - Events are past-tense: UploadInitiatedEvent, ChunkUploadedEvent
 *
 * WHO EMITS:
 * - UploadCoordinator (initiate, chunk, commit, failure)
 * - wait_for_finish (status polls)
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent, MetricsComponent (components.hpp)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace dsup::events {

struct UploadInitiatedEvent {
    std::string content_type;
    std::uint64_t chunk_size;
    std::size_t parallelism;
    std::chrono::system_clock::time_point timestamp;

    UploadInitiatedEvent(std::string type, std::uint64_t size, std::size_t workers)
        : content_type(std::move(type)),
          chunk_size(size),
          parallelism(workers),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted from a worker thread once the service acknowledged a chunk
 */
struct ChunkUploadedEvent {
    std::uint64_t seq_num;
    std::uint64_t byte_offset;
    std::uint64_t end_byte_offset;

    std::uint64_t bytes() const noexcept { return end_byte_offset - byte_offset; }
};

struct UploadCommittedEvent {
    std::string content_type;
    std::uint64_t chunks;
    std::uint64_t total_bytes;
    bool commit_issued;
    std::chrono::milliseconds duration;
};

struct UploadFailedEvent {
    std::string content_type;
    std::string stage;   // "initiate", "dispatch", "commit", "show"
    std::string error;
};

/**
 * @brief Emitted on every status fetch of wait_for_finish
 */
struct StatusPolledEvent {
    std::int64_t source_id;
    bool finished;
    bool failed;
    std::chrono::milliseconds elapsed;
};

} // namespace dsup::events
