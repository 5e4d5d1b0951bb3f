#pragma once

#include "dsup/core/result.hpp"
#include "dsup/upload/types.hpp"

#include <string>
#include <vector>

namespace dsup::upload {

/**
 * @brief State of one upload call: Init -> Dispatching -> AwaitingCommit -> Committed
 *
 * Failed is reachable from every non-terminal state. Committed and Failed
 * are terminal.
 */
class UploadSession {
public:
    explicit UploadSession(std::string content_type);

    [[nodiscard]] UploadState state() const noexcept { return info_.state; }
    [[nodiscard]] const UploadSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return info_.state == UploadState::Committed || info_.state == UploadState::Failed;
    }

    dsup::Result<void> begin_dispatch(std::uint64_t chunk_size, std::size_t parallelism);
    dsup::Result<void> await_commit(std::vector<ChunkReceipt> receipts,
                                    std::uint64_t bytes_read,
                                    std::uint64_t chunks_read);
    dsup::Result<void> mark_committed(bool commit_issued);
    dsup::Result<void> mark_failed(std::string error_message);

private:
    dsup::Result<void> transition_to(UploadState next_state);
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    UploadSessionInfo info_;
};

} // namespace dsup::upload
