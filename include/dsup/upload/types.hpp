#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dsup::upload {

/**
 * @brief One contiguous, sequence-numbered slice of the input stream
 *
 * Covers the half-open range [byte_offset, end_byte_offset). Chunks produced
 * by the same reader tile the stream: chunk[i].end_byte_offset equals
 * chunk[i + 1].byte_offset.
 */
struct Chunk {
    std::uint64_t seq_num = 0;
    std::uint64_t byte_offset = 0;
    std::uint64_t end_byte_offset = 0;
    std::vector<std::uint8_t> payload;

    std::uint64_t size() const noexcept { return end_byte_offset - byte_offset; }
};

/**
 * @brief Completion record produced by a worker once the chunk call succeeds
 */
struct ChunkReceipt {
    std::uint64_t seq_num = 0;
    std::uint64_t byte_offset = 0;
    std::uint64_t end_byte_offset = 0;

    bool operator==(const ChunkReceipt& other) const noexcept {
        return seq_num == other.seq_num &&
               byte_offset == other.byte_offset &&
               end_byte_offset == other.end_byte_offset;
    }
};

/**
 * @brief Server-advertised parameters returned by initiate
 */
struct UploadPlan {
    std::int64_t preferred_chunk_size = 0;
    std::int64_t preferred_upload_parallelism = 0;
};

enum class UploadState {
    Init,
    Dispatching,
    AwaitingCommit,
    Committed,
    Failed
};

inline const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::Init: return "init";
        case UploadState::Dispatching: return "dispatching";
        case UploadState::AwaitingCommit: return "awaiting_commit";
        case UploadState::Committed: return "committed";
        case UploadState::Failed: return "failed";
    }
    return "unknown";
}

/**
 * @brief Point-in-time view of one upload call
 */
struct UploadSessionInfo {
    std::string content_type;
    std::uint64_t chunk_size = 0;
    std::size_t parallelism = 0;
    UploadState state = UploadState::Init;
    std::vector<ChunkReceipt> receipts;
    std::uint64_t bytes_read = 0;
    std::uint64_t chunks_read = 0;
    bool commit_issued = false;
    std::string last_error; ///< Populated when state == Failed
    std::chrono::steady_clock::time_point started_at{};
};

} // namespace dsup::upload
