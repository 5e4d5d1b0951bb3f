#pragma once

#include "dsup/api/snapshot.hpp"
#include "dsup/core/result.hpp"
#include "dsup/upload/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dsup::api {

/**
 * @brief Remote operations the upload pipeline needs from one source
 *
 * Implementations must allow send_chunk() to be called concurrently from
 * several worker threads. Every failure on the wire is reported as
 * ErrorCode::Transport.
 */
class SourceApi {
public:
    virtual ~SourceApi() = default;

    /// Opens an upload; the reply carries the chunk size and parallelism to use
    virtual dsup::Result<upload::UploadPlan> initiate(const std::string& content_type) = 0;

    virtual dsup::Result<void> send_chunk(std::uint64_t seq_num,
                                          std::uint64_t byte_offset,
                                          const std::vector<std::uint8_t>& payload) = 0;

    /// Finalizes the upload at `end_byte_offset` total bytes
    virtual dsup::Result<void> commit(std::uint64_t seq_num, std::uint64_t end_byte_offset) = 0;

    virtual dsup::Result<SourceSnapshot> show() = 0;

    /// Turns off server-side parsing so the upload is stored as an opaque blob
    virtual dsup::Result<SourceSnapshot> disable_parse_source() = 0;
};

} // namespace dsup::api
