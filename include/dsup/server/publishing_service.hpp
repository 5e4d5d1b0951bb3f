#pragma once

#include "dsup/core/result.hpp"
#include "dsup/network/http_router.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dsup::server {

struct PublishingOptions {
    std::int64_t chunk_size = 4 * 1024 * 1024;
    std::int64_t upload_parallelism = 4;

    /// Basic auth is required when username is non-empty
    std::string username;
    std::string password;

    /// Reply 500 to the chunk with this seq_num
    std::optional<std::uint64_t> fail_chunk_seq;
    /// Accept commits but mark the source failed instead of finished
    bool fail_processing = false;
};

struct CommitRecord {
    std::int64_t source_id;
    std::uint64_t seq_num;
    std::uint64_t byte_offset;
};

/**
 * @brief In-memory publishing endpoints for local development and tests
 *
 * Serves the source lifecycle under /api/publishing/v1/source: create,
 * show, update, initiate, chunk and commit. Chunk payloads are kept by
 * offset and assembled on commit, which checks that they tile the
 * committed range before setting finished_at.
 *
 * THREAD SAFETY:
 * All state is behind one mutex; accessors may be called from the test
 * thread while the io_context thread serves requests.
 */
class PublishingService {
public:
    explicit PublishingService(PublishingOptions options = {});

    void register_routes(network::HttpRouter& router);

    dsup::Result<nlohmann::json> create_source(const std::string& filename);

    std::optional<std::vector<std::uint8_t>> assembled_bytes(std::int64_t source_id) const;
    std::vector<CommitRecord> commits() const;
    std::size_t chunks_received(std::int64_t source_id) const;

private:
    struct StoredChunk {
        std::uint64_t seq_num;
        std::vector<std::uint8_t> payload;
    };

    struct SourceRecord {
        std::int64_t id = 0;
        std::string filename;
        std::string content_type;
        bool parse_source = true;
        bool initiated = false;
        std::optional<std::string> finished_at;
        std::optional<std::string> failed_at;
        nlohmann::json failure_details;
        std::map<std::uint64_t, StoredChunk> chunks;  // byte_offset -> chunk
        std::unordered_set<std::uint64_t> seen_seqs;
        std::optional<std::vector<std::uint8_t>> assembled;
    };

    network::HttpResponse handle_create(const network::HttpContext& ctx);
    network::HttpResponse handle_show(const network::HttpContext& ctx);
    network::HttpResponse handle_update(const network::HttpContext& ctx);
    network::HttpResponse handle_initiate(const network::HttpContext& ctx);
    network::HttpResponse handle_chunk(const network::HttpContext& ctx);
    network::HttpResponse handle_commit(const network::HttpContext& ctx);

    bool authorize(const network::HttpContext& ctx, network::HttpResponse& response) const;

    SourceRecord* find_source(const network::HttpContext& ctx);
    nlohmann::json to_json(const SourceRecord& record) const;

    static std::string timestamp_now();

    PublishingOptions options_;
    std::atomic<std::int64_t> next_id_{1};

    mutable std::mutex mutex_;
    std::unordered_map<std::int64_t, SourceRecord> sources_;
    std::vector<CommitRecord> commits_;
};

} // namespace dsup::server
