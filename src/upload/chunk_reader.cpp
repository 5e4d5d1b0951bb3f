#include "dsup/upload/chunk_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <new>

namespace dsup::upload {
namespace {

// The buffer grows by this much per read, so a huge chunk_size only costs
// what the stream actually delivers
constexpr std::size_t kReadSlice = 64 * 1024;

} // namespace

ChunkReader::ChunkReader(std::istream& input, std::uint64_t chunk_size)
    : input_(input), chunk_size_(chunk_size) {}

dsup::Result<std::optional<Chunk>> ChunkReader::next() {
    if (chunk_size_ == 0) {
        return dsup::Err<std::optional<Chunk>>(ErrorCode::InvalidArgument,
                                               "chunk_size must be > 0");
    }

    std::lock_guard lock(mutex_);
    if (exhausted_) {
        return dsup::Ok(std::optional<Chunk>{});
    }

    std::vector<std::uint8_t> buffer;
    std::size_t bytes_read = 0;
    try {
        while (bytes_read < chunk_size_) {
            const auto slice = static_cast<std::size_t>(
                std::min<std::uint64_t>(kReadSlice, chunk_size_ - bytes_read));
            buffer.resize(bytes_read + slice);
            input_.read(reinterpret_cast<char*>(buffer.data() + bytes_read), static_cast<std::streamsize>(slice));
            const auto got = static_cast<std::size_t>(input_.gcount());
            bytes_read += got;
            if (got < slice) {
                break;
            }
        }
    } catch (const std::bad_alloc&) {
        exhausted_ = true;
        return dsup::Err<std::optional<Chunk>>(
            ErrorCode::StreamRead,
            "Out of memory buffering a chunk at offset " + std::to_string(byte_offset_ + bytes_read));
    }

    if (input_.bad()) {
        exhausted_ = true;
        return dsup::Err<std::optional<Chunk>>(
            ErrorCode::StreamRead,
            "Input stream failed after " + std::to_string(byte_offset_) + " bytes");
    }

    if (bytes_read == 0) {
        exhausted_ = true;
        spdlog::debug("Chunk reader exhausted: chunks={} bytes={}", next_seq_num_, byte_offset_);
        return dsup::Ok(std::optional<Chunk>{});
    }

    buffer.resize(bytes_read);

    Chunk chunk;
    chunk.seq_num = next_seq_num_++;
    chunk.byte_offset = byte_offset_;
    byte_offset_ += bytes_read;
    chunk.end_byte_offset = byte_offset_;
    chunk.payload = std::move(buffer);
    return dsup::Ok(std::optional<Chunk>(std::move(chunk)));
}

std::uint64_t ChunkReader::bytes_read() const {
    std::lock_guard lock(mutex_);
    return byte_offset_;
}

std::uint64_t ChunkReader::chunks_read() const {
    std::lock_guard lock(mutex_);
    return next_seq_num_;
}

} // namespace dsup::upload
