#pragma once

#include "dsup/api/source_api.hpp"
#include "dsup/core/result.hpp"
#include "dsup/events/event_bus.hpp"
#include "dsup/upload/chunk_reader.hpp"
#include "dsup/upload/session.hpp"
#include "dsup/upload/types.hpp"
#include "dsup/upload/worker_pool.hpp"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace dsup::upload {

struct CoordinatorOptions {
    /// Upper bound applied to the server's parallelism hint
    std::size_t max_parallelism = 16;
    /// Issue commit(0, 0) for an empty stream instead of skipping the commit
    bool commit_empty_uploads = false;
};

struct UploadReport {
    api::SourceSnapshot source;
    UploadSessionInfo session;
};

/**
 * @brief Runs one chunked upload: initiate, dispatch, commit, show
 *
 * Any initiate, chunk or commit failure aborts the upload and is returned to
 * the caller; nothing already sent is committed and no state is kept for a
 * resume. The committed offset is the end of the highest seq_num chunk, not
 * of whichever chunk finished last.
 *
 * Not safe for concurrent upload() calls on the same instance.
 */
class UploadCoordinator {
public:
    explicit UploadCoordinator(api::SourceApi& api,
                               events::EventBus* bus = nullptr,
                               CoordinatorOptions options = {});

    dsup::Result<UploadReport> upload(std::istream& input, const std::string& content_type);

    /// Session of the most recent upload() call, including failed ones
    [[nodiscard]] const UploadSessionInfo& last_session() const noexcept { return last_session_; }

    /// Number of worker pools provisioned so far
    [[nodiscard]] std::size_t pools_created() const noexcept { return pools_created_; }

    /**
     * @brief Check that receipts tile [0, bytes_read) and pick the final one
     *
     * RETURNS: the receipt with the highest seq_num, or ContiguityViolation
     */
    static dsup::Result<ChunkReceipt> final_receipt(std::vector<ChunkReceipt> receipts,
                                                    std::uint64_t bytes_read,
                                                    std::uint64_t chunks_read);

private:
    WorkerPool& ensure_pool(std::size_t parallelism);
    dsup::Result<std::vector<ChunkReceipt>> dispatch(ChunkReader& reader, std::size_t parallelism);
    dsup::Result<bool> finalize(const std::vector<ChunkReceipt>& receipts, const ChunkReader& reader);
    Error fail(UploadSession& session, const char* stage, Error error);

    api::SourceApi& api_;
    events::EventBus* bus_;
    CoordinatorOptions options_;

    std::unique_ptr<WorkerPool> pool_;
    std::size_t pools_created_ = 0;
    UploadSessionInfo last_session_;
};

} // namespace dsup::upload
