#include "dsup/upload/coordinator.hpp"

#include "dsup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace dsup::upload {

UploadCoordinator::UploadCoordinator(api::SourceApi& api,
                                     events::EventBus* bus,
                                     CoordinatorOptions options)
    : api_(api), bus_(bus), options_(options) {
    if (options_.max_parallelism == 0) {
        options_.max_parallelism = 1;
    }
}

dsup::Result<UploadReport> UploadCoordinator::upload(std::istream& input,
                                                      const std::string& content_type) {
    UploadSession session(content_type);

    auto plan = api_.initiate(content_type);
    if (plan.is_error()) {
        return dsup::Err<UploadReport>(fail(session, "initiate", plan.error()));
    }

    const auto& advertised = plan.value();
    if (advertised.preferred_chunk_size < 1 || advertised.preferred_upload_parallelism < 1) {
        return dsup::Err<UploadReport>(fail(session, "initiate",
            Error{ErrorCode::Protocol,
                  "Invalid upload plan: chunk_size=" + std::to_string(advertised.preferred_chunk_size) +
                  " parallelism=" + std::to_string(advertised.preferred_upload_parallelism)}));
    }

    const auto chunk_size = static_cast<std::uint64_t>(advertised.preferred_chunk_size);
    const auto parallelism = std::min(
        static_cast<std::size_t>(advertised.preferred_upload_parallelism), options_.max_parallelism);

    if (auto res = session.begin_dispatch(chunk_size, parallelism); res.is_error()) {
        return dsup::Err<UploadReport>(fail(session, "initiate", res.error()));
    }
    if (bus_) {
        bus_->emit(events::UploadInitiatedEvent{content_type, chunk_size, parallelism});
    }

    ChunkReader reader(input, chunk_size);
    auto dispatched = dispatch(reader, parallelism);
    if (dispatched.is_error()) {
        return dsup::Err<UploadReport>(fail(session, "dispatch", dispatched.error()));
    }

    if (auto res = session.await_commit(dispatched.value(), reader.bytes_read(), reader.chunks_read());
        res.is_error()) {
        return dsup::Err<UploadReport>(fail(session, "dispatch", res.error()));
    }

    auto committed = finalize(session.info().receipts, reader);
    if (committed.is_error()) {
        return dsup::Err<UploadReport>(fail(session, "commit", committed.error()));
    }

    if (auto res = session.mark_committed(committed.value()); res.is_error()) {
        return dsup::Err<UploadReport>(fail(session, "commit", res.error()));
    }
    last_session_ = session.info();

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session.info().started_at);
    if (bus_) {
        bus_->emit(events::UploadCommittedEvent{content_type, reader.chunks_read(),
                                                reader.bytes_read(), committed.value(), duration});
    }

    auto shown = api_.show();
    if (shown.is_error()) {
        spdlog::warn("Upload committed but fetching the source failed: {}", shown.error().describe());
        if (bus_) {
            bus_->emit(events::UploadFailedEvent{content_type, "show", shown.error().describe()});
        }
        return dsup::Err<UploadReport>(shown.error());
    }

    return dsup::Ok(UploadReport{std::move(shown.value()), session.info()});
}

dsup::Result<ChunkReceipt> UploadCoordinator::final_receipt(std::vector<ChunkReceipt> receipts,
                                                            std::uint64_t bytes_read,
                                                            std::uint64_t chunks_read) {
    if (receipts.empty()) {
        return dsup::Err<ChunkReceipt>(ErrorCode::ContiguityViolation, "No chunk receipts to commit");
    }
    if (receipts.size() != chunks_read) {
        return dsup::Err<ChunkReceipt>(ErrorCode::ContiguityViolation,
            "Reader produced " + std::to_string(chunks_read) + " chunks but " +
            std::to_string(receipts.size()) + " were acknowledged");
    }

    std::sort(receipts.begin(), receipts.end(),
              [](const ChunkReceipt& a, const ChunkReceipt& b) { return a.seq_num < b.seq_num; });

    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < receipts.size(); ++i) {
        const auto& receipt = receipts[i];
        if (receipt.seq_num != i || receipt.byte_offset != expected_offset ||
            receipt.end_byte_offset <= receipt.byte_offset) {
            return dsup::Err<ChunkReceipt>(ErrorCode::ContiguityViolation,
                "Chunk " + std::to_string(receipt.seq_num) + " [" +
                std::to_string(receipt.byte_offset) + ", " + std::to_string(receipt.end_byte_offset) +
                ") does not continue at seq " + std::to_string(i) + " offset " +
                std::to_string(expected_offset));
        }
        expected_offset = receipt.end_byte_offset;
    }

    if (expected_offset != bytes_read) {
        return dsup::Err<ChunkReceipt>(ErrorCode::ContiguityViolation,
            "Commit offset " + std::to_string(expected_offset) + " != bytes read " +
            std::to_string(bytes_read));
    }

    return dsup::Ok(receipts.back());
}

WorkerPool& UploadCoordinator::ensure_pool(std::size_t parallelism) {
    if (!pool_) {
        pool_ = std::make_unique<WorkerPool>(parallelism, [this](const Chunk& chunk) {
            return api_.send_chunk(chunk.seq_num, chunk.byte_offset, chunk.payload);
        });
        if (bus_) {
            pool_->on_chunk_completed([bus = bus_](const ChunkReceipt& receipt) {
                bus->emit(events::ChunkUploadedEvent{receipt.seq_num, receipt.byte_offset,
                                                     receipt.end_byte_offset});
            });
        }
        ++pools_created_;
    }
    return *pool_;
}

dsup::Result<std::vector<ChunkReceipt>> UploadCoordinator::dispatch(ChunkReader& reader,
                                                                     std::size_t parallelism) {
    auto first = reader.next();
    if (first.is_error()) {
        return dsup::Err<std::vector<ChunkReceipt>>(first.error());
    }
    if (!first.value().has_value()) {
        spdlog::debug("Input stream is empty, no workers provisioned");
        return dsup::Ok(std::vector<ChunkReceipt>{});
    }

    auto& pool = ensure_pool(parallelism);
    auto drained = pool.drain(std::move(*first.value()), reader);
    pool_.reset();
    return drained;
}

dsup::Result<bool> UploadCoordinator::finalize(const std::vector<ChunkReceipt>& receipts,
                                               const ChunkReader& reader) {
    if (receipts.empty()) {
        if (!options_.commit_empty_uploads) {
            spdlog::info("Empty upload, skipping commit");
            return dsup::Ok(false);
        }
        if (auto res = api_.commit(0, 0); res.is_error()) {
            return dsup::Err<bool>(res.error());
        }
        return dsup::Ok(true);
    }

    auto last = final_receipt(receipts, reader.bytes_read(), reader.chunks_read());
    if (last.is_error()) {
        return dsup::Err<bool>(last.error());
    }

    spdlog::info("Committing upload at seq={} offset={}", last.value().seq_num,
                 last.value().end_byte_offset);
    if (auto res = api_.commit(last.value().seq_num, last.value().end_byte_offset); res.is_error()) {
        return dsup::Err<bool>(res.error());
    }
    return dsup::Ok(true);
}

Error UploadCoordinator::fail(UploadSession& session, const char* stage, Error error) {
    if (auto res = session.mark_failed(error.describe()); res.is_error()) {
        spdlog::warn("Could not mark upload failed: {}", res.error().describe());
    }
    last_session_ = session.info();

    spdlog::error("Upload of {} failed during {}: {}", session.info().content_type, stage,
                  error.describe());
    if (bus_) {
        bus_->emit(events::UploadFailedEvent{session.info().content_type, stage, error.describe()});
    }
    return error;
}

} // namespace dsup::upload
