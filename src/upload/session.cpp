#include "dsup/upload/session.hpp"

#include <chrono>

namespace dsup::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    if (target == UploadState::Failed) {
        return true;
    }

    switch (current) {
        case UploadState::Init: return target == UploadState::Dispatching;
        case UploadState::Dispatching: return target == UploadState::AwaitingCommit;
        case UploadState::AwaitingCommit: return target == UploadState::Committed;
        default: return false;
    }
}

} // namespace

UploadSession::UploadSession(std::string content_type) {
    info_.content_type = std::move(content_type);
    info_.state = UploadState::Init;
    info_.started_at = std::chrono::steady_clock::now();
}

dsup::Result<void> UploadSession::begin_dispatch(std::uint64_t chunk_size, std::size_t parallelism) {
    if (auto res = transition_to(UploadState::Dispatching); res.is_error()) {
        return res;
    }
    info_.chunk_size = chunk_size;
    info_.parallelism = parallelism;
    return dsup::Ok();
}

dsup::Result<void> UploadSession::await_commit(std::vector<ChunkReceipt> receipts,
                                               std::uint64_t bytes_read,
                                               std::uint64_t chunks_read) {
    if (auto res = transition_to(UploadState::AwaitingCommit); res.is_error()) {
        return res;
    }
    info_.receipts = std::move(receipts);
    info_.bytes_read = bytes_read;
    info_.chunks_read = chunks_read;
    return dsup::Ok();
}

dsup::Result<void> UploadSession::mark_committed(bool commit_issued) {
    if (auto res = transition_to(UploadState::Committed); res.is_error()) {
        return res;
    }
    info_.commit_issued = commit_issued;
    return dsup::Ok();
}

dsup::Result<void> UploadSession::mark_failed(std::string error_message) {
    if (auto res = transition_to(UploadState::Failed); res.is_error()) {
        return res;
    }
    info_.last_error = std::move(error_message);
    return dsup::Ok();
}

dsup::Result<void> UploadSession::transition_to(UploadState next_state) {
    if (!can_transition(next_state)) {
        return dsup::Err<void>(ErrorCode::IllegalState,
                               std::string("Illegal upload state transition: ") +
                                   to_string(info_.state) + " -> " + to_string(next_state));
    }
    info_.state = next_state;
    return dsup::Ok();
}

bool UploadSession::can_transition(UploadState target) const noexcept {
    if (is_terminal()) {
        return false;
    }
    return is_progressive(info_.state, target);
}

} // namespace dsup::upload
