#pragma once

#include "dsup/core/result.hpp"
#include "dsup/upload/types.hpp"

#include <cstdint>
#include <istream>
#include <mutex>
#include <optional>

namespace dsup::upload {

/**
 * @brief Splits a byte stream into sequentially numbered chunks
 *
 * Each call to next() reads up to chunk_size bytes and assigns the next
 * seq_num and byte range as one indivisible step, so concurrent callers never
 * observe duplicate sequence numbers or overlapping ranges. The stream is
 * borrowed and must outlive the reader.
 *
 * THREAD SAFETY: next() and the accessors may be called from any thread.
 */
class ChunkReader {
public:
    ChunkReader(std::istream& input, std::uint64_t chunk_size);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    /**
     * @brief Read the next chunk
     *
     * RETURNS: the chunk, std::nullopt once the stream yields zero bytes, or
     *          an error if the stream fails. End of stream is sticky.
     */
    dsup::Result<std::optional<Chunk>> next();

    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t bytes_read() const;
    [[nodiscard]] std::uint64_t chunks_read() const;

private:
    std::istream& input_;
    const std::uint64_t chunk_size_;

    mutable std::mutex mutex_;
    std::uint64_t next_seq_num_ = 0;
    std::uint64_t byte_offset_ = 0;
    bool exhausted_ = false;
};

} // namespace dsup::upload
