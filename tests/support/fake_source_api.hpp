#pragma once

#include "dsup/api/source_api.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace dsup::test_support {

/**
 * @brief In-process SourceApi that records every call
 */
class FakeSourceApi : public api::SourceApi {
public:
    struct SentChunk {
        std::uint64_t seq_num;
        std::uint64_t byte_offset;
        std::vector<std::uint8_t> payload;
    };

    upload::UploadPlan plan{100, 4};
    std::optional<Error> initiate_error;
    std::optional<std::uint64_t> fail_seq;
    std::optional<Error> commit_error;
    std::optional<Error> show_error;
    bool parse_source = true;

    /// Per-seq delay before the chunk is acknowledged
    std::map<std::uint64_t, std::chrono::milliseconds> chunk_delays;

    /// Runs inside send_chunk before the fake records anything
    std::function<void(std::uint64_t)> on_send;

    Result<upload::UploadPlan> initiate(const std::string& content_type) override {
        std::lock_guard lock(mutex_);
        initiated_types_.push_back(content_type);
        if (initiate_error) {
            return Err<upload::UploadPlan>(*initiate_error);
        }
        return Ok(plan);
    }

    Result<void> send_chunk(std::uint64_t seq_num,
                            std::uint64_t byte_offset,
                            const std::vector<std::uint8_t>& payload) override {
        if (on_send) {
            on_send(seq_num);
        }
        if (auto it = chunk_delays.find(seq_num); it != chunk_delays.end()) {
            std::this_thread::sleep_for(it->second);
        }

        std::lock_guard lock(mutex_);
        ++send_attempts_;
        if (fail_seq && *fail_seq == seq_num) {
            return Err<void>(Error{ErrorCode::Transport, "chunk rejected", 500});
        }
        sent_.push_back(SentChunk{seq_num, byte_offset, payload});
        completion_order_.push_back(seq_num);
        return Ok();
    }

    Result<void> commit(std::uint64_t seq_num, std::uint64_t end_byte_offset) override {
        std::lock_guard lock(mutex_);
        commits_.emplace_back(seq_num, end_byte_offset);
        if (commit_error) {
            return Err<void>(*commit_error);
        }
        finished_ = true;
        return Ok();
    }

    Result<api::SourceSnapshot> show() override {
        std::lock_guard lock(mutex_);
        ++show_calls_;
        if (show_error) {
            return Err<api::SourceSnapshot>(*show_error);
        }
        return Ok(snapshot_locked());
    }

    Result<api::SourceSnapshot> disable_parse_source() override {
        std::lock_guard lock(mutex_);
        ++disable_calls_;
        parse_source = false;
        return Ok(snapshot_locked());
    }

    std::vector<SentChunk> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    std::vector<std::uint64_t> completion_order() const {
        std::lock_guard lock(mutex_);
        return completion_order_;
    }

    std::vector<std::pair<std::uint64_t, std::uint64_t>> commits() const {
        std::lock_guard lock(mutex_);
        return commits_;
    }

    std::vector<std::string> initiated_types() const {
        std::lock_guard lock(mutex_);
        return initiated_types_;
    }

    std::size_t send_attempts() const {
        std::lock_guard lock(mutex_);
        return send_attempts_;
    }

    std::size_t show_calls() const {
        std::lock_guard lock(mutex_);
        return show_calls_;
    }

    std::size_t disable_calls() const {
        std::lock_guard lock(mutex_);
        return disable_calls_;
    }

    /// Payloads concatenated in seq_num order
    std::vector<std::uint8_t> reassembled() const {
        auto chunks = sent();
        std::sort(chunks.begin(), chunks.end(),
                  [](const SentChunk& a, const SentChunk& b) { return a.seq_num < b.seq_num; });
        std::vector<std::uint8_t> bytes;
        for (const auto& chunk : chunks) {
            bytes.insert(bytes.end(), chunk.payload.begin(), chunk.payload.end());
        }
        return bytes;
    }

private:
    api::SourceSnapshot snapshot_locked() const {
        api::SourceSnapshot snapshot;
        snapshot.id = 42;
        snapshot.parse_source = parse_source;
        if (finished_) {
            snapshot.finished_at = "2024-01-01T00:00:00Z";
        }
        return snapshot;
    }

    mutable std::mutex mutex_;
    std::vector<SentChunk> sent_;
    std::vector<std::uint64_t> completion_order_;
    std::vector<std::pair<std::uint64_t, std::uint64_t>> commits_;
    std::vector<std::string> initiated_types_;
    std::size_t send_attempts_ = 0;
    std::size_t show_calls_ = 0;
    std::size_t disable_calls_ = 0;
    bool finished_ = false;
};

inline std::string make_payload(std::size_t length) {
    std::string data(length, '\0');
    for (std::size_t i = 0; i < length; ++i) {
        data[i] = static_cast<char>('a' + (i % 26));
    }
    return data;
}

inline std::vector<std::uint8_t> to_bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace dsup::test_support
