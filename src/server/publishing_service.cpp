#include "dsup/server/publishing_service.hpp"

#include "dsup/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dsup::server {
namespace {

using json = nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

constexpr const char* kSourceRoot = "/api/publishing/v1/source";

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error(HttpStatus status, const std::string& message) {
    return make_json_response(status, json{{"error", message}});
}

} // namespace

PublishingService::PublishingService(PublishingOptions options)
    : options_(std::move(options)) {
}

void PublishingService::register_routes(network::HttpRouter& router) {
    router.use([this](const HttpContext& ctx, HttpResponse& response) {
        return authorize(ctx, response);
    });

    const std::string root = kSourceRoot;
    router.post(root, [this](const HttpContext& ctx) { return handle_create(ctx); });
    router.get(root + "/:id", [this](const HttpContext& ctx) { return handle_show(ctx); });
    router.post(root + "/:id", [this](const HttpContext& ctx) { return handle_update(ctx); });
    router.post(root + "/:id/initiate", [this](const HttpContext& ctx) { return handle_initiate(ctx); });
    router.post(root + "/:id/chunk/:seq_num/:byte_offset",
                [this](const HttpContext& ctx) { return handle_chunk(ctx); });
    router.post(root + "/:id/commit/:seq_num/:byte_offset",
                [this](const HttpContext& ctx) { return handle_commit(ctx); });
}

dsup::Result<json> PublishingService::create_source(const std::string& filename) {
    if (filename.empty()) {
        return dsup::Err<json>(ErrorCode::InvalidArgument, "filename is required");
    }

    std::lock_guard lock(mutex_);
    SourceRecord record;
    record.id = next_id_++;
    record.filename = filename;
    const auto id = record.id;
    auto it = sources_.emplace(id, std::move(record)).first;
    spdlog::info("Created source {} ({})", it->first, filename);
    return dsup::Ok(to_json(it->second));
}

std::optional<std::vector<std::uint8_t>> PublishingService::assembled_bytes(std::int64_t source_id) const {
    std::lock_guard lock(mutex_);
    auto it = sources_.find(source_id);
    if (it == sources_.end()) {
        return std::nullopt;
    }
    return it->second.assembled;
}

std::vector<CommitRecord> PublishingService::commits() const {
    std::lock_guard lock(mutex_);
    return commits_;
}

std::size_t PublishingService::chunks_received(std::int64_t source_id) const {
    std::lock_guard lock(mutex_);
    auto it = sources_.find(source_id);
    return it == sources_.end() ? 0 : it->second.chunks.size();
}

// ────────────────────────────────────────────────────────────
// Handlers
// ────────────────────────────────────────────────────────────

HttpResponse PublishingService::handle_create(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return make_error(HttpStatus::BAD_REQUEST, "Invalid JSON");
    }

    const auto source_type = payload.value("source_type", json::object());
    if (!source_type.is_object() || source_type.value("type", "") != "upload") {
        return make_error(HttpStatus::BAD_REQUEST, "source_type.type must be 'upload'");
    }

    auto created = create_source(source_type.value("filename", ""));
    if (created.is_error()) {
        return make_error(HttpStatus::BAD_REQUEST, created.error().message);
    }
    return make_json_response(HttpStatus::CREATED, created.value());
}

HttpResponse PublishingService::handle_show(const HttpContext& ctx) {
    std::lock_guard lock(mutex_);
    auto* record = find_source(ctx);
    if (!record) {
        return make_error(HttpStatus::NOT_FOUND, "Unknown source " + ctx.get_param("id"));
    }
    return make_json_response(HttpStatus::OK, to_json(*record));
}

HttpResponse PublishingService::handle_update(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return make_error(HttpStatus::BAD_REQUEST, "Invalid JSON");
    }

    std::lock_guard lock(mutex_);
    auto* record = find_source(ctx);
    if (!record) {
        return make_error(HttpStatus::NOT_FOUND, "Unknown source " + ctx.get_param("id"));
    }

    if (auto options = payload.find("parse_options"); options != payload.end() && options->is_object()) {
        if (auto flag = options->find("parse_source"); flag != options->end()) {
            if (!flag->is_boolean()) {
                return make_error(HttpStatus::BAD_REQUEST, "parse_source must be a boolean");
            }
            record->parse_source = flag->get<bool>();
        }
    }
    return make_json_response(HttpStatus::OK, to_json(*record));
}

HttpResponse PublishingService::handle_initiate(const HttpContext& ctx) {
    auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return make_error(HttpStatus::BAD_REQUEST, "Invalid JSON");
    }
    const std::string content_type = payload.value("content_type", "");
    if (content_type.empty()) {
        return make_error(HttpStatus::BAD_REQUEST, "content_type required");
    }

    std::lock_guard lock(mutex_);
    auto* record = find_source(ctx);
    if (!record) {
        return make_error(HttpStatus::NOT_FOUND, "Unknown source " + ctx.get_param("id"));
    }
    if (record->finished_at || record->failed_at) {
        return make_error(HttpStatus::CONFLICT, "Source already processed");
    }

    record->initiated = true;
    record->content_type = content_type;
    record->chunks.clear();
    record->seen_seqs.clear();

    return make_json_response(HttpStatus::OK, json{
        {"preferred_chunk_size", options_.chunk_size},
        {"preferred_upload_parallelism", options_.upload_parallelism}
    });
}

HttpResponse PublishingService::handle_chunk(const HttpContext& ctx) {
    const auto seq_num = ctx.number_param("seq_num");
    const auto byte_offset = ctx.number_param("byte_offset");
    if (!seq_num || !byte_offset) {
        return make_error(HttpStatus::BAD_REQUEST, "seq_num and byte_offset must be numbers");
    }

    if (options_.fail_chunk_seq && *options_.fail_chunk_seq == *seq_num) {
        spdlog::warn("Rejecting chunk {} (injected failure)", *seq_num);
        return make_error(HttpStatus::INTERNAL_SERVER_ERROR, "Injected failure for chunk " +
                          std::to_string(*seq_num));
    }

    std::lock_guard lock(mutex_);
    auto* record = find_source(ctx);
    if (!record) {
        return make_error(HttpStatus::NOT_FOUND, "Unknown source " + ctx.get_param("id"));
    }
    if (!record->initiated) {
        return make_error(HttpStatus::CONFLICT, "Upload not initiated");
    }
    if (ctx.request.body.empty()) {
        return make_error(HttpStatus::BAD_REQUEST, "Empty chunk");
    }
    if (record->seen_seqs.count(*seq_num) > 0 || record->chunks.count(*byte_offset) > 0) {
        return make_error(HttpStatus::CONFLICT, "Duplicate chunk " + std::to_string(*seq_num));
    }

    record->seen_seqs.insert(*seq_num);
    record->chunks.emplace(*byte_offset, StoredChunk{*seq_num, ctx.request.body});
    spdlog::debug("Source {} stored chunk {} at offset {} ({} bytes)",
                  record->id, *seq_num, *byte_offset, ctx.request.body.size());
    return make_json_response(HttpStatus::OK, json{{"seq_num", *seq_num}, {"byte_offset", *byte_offset}});
}

HttpResponse PublishingService::handle_commit(const HttpContext& ctx) {
    const auto seq_num = ctx.number_param("seq_num");
    const auto byte_offset = ctx.number_param("byte_offset");
    if (!seq_num || !byte_offset) {
        return make_error(HttpStatus::BAD_REQUEST, "seq_num and byte_offset must be numbers");
    }

    std::lock_guard lock(mutex_);
    auto* record = find_source(ctx);
    if (!record) {
        return make_error(HttpStatus::NOT_FOUND, "Unknown source " + ctx.get_param("id"));
    }
    if (!record->initiated) {
        return make_error(HttpStatus::CONFLICT, "Upload not initiated");
    }
    commits_.push_back(CommitRecord{record->id, *seq_num, *byte_offset});

    std::vector<std::uint8_t> assembled;
    assembled.reserve(*byte_offset);
    std::uint64_t expected_seq = 0;
    for (const auto& [offset, chunk] : record->chunks) {
        if (offset != assembled.size() || chunk.seq_num != expected_seq) {
            return make_error(HttpStatus::UNPROCESSABLE_ENTITY,
                              "Chunk " + std::to_string(chunk.seq_num) + " at offset " +
                              std::to_string(offset) + " leaves a gap");
        }
        assembled.insert(assembled.end(), chunk.payload.begin(), chunk.payload.end());
        ++expected_seq;
    }

    const std::uint64_t last_seq = expected_seq == 0 ? 0 : expected_seq - 1;
    if (assembled.size() != *byte_offset || last_seq != *seq_num) {
        return make_error(HttpStatus::UNPROCESSABLE_ENTITY,
                          "Commit at seq " + std::to_string(*seq_num) + " offset " +
                          std::to_string(*byte_offset) + " does not match " +
                          std::to_string(assembled.size()) + " received bytes");
    }

    record->assembled = std::move(assembled);
    if (options_.fail_processing) {
        record->failed_at = timestamp_now();
        record->failure_details = json{{"message", "processing failed"}, {"content_type", record->content_type}};
        spdlog::warn("Source {} marked failed after commit", record->id);
    } else {
        record->finished_at = timestamp_now();
        spdlog::info("Source {} committed {} bytes in {} chunks", record->id, *byte_offset, expected_seq);
    }
    return make_json_response(HttpStatus::OK, to_json(*record));
}

bool PublishingService::authorize(const HttpContext& ctx, HttpResponse& response) const {
    if (options_.username.empty()) {
        return true;
    }
    const std::string expected =
        "Basic " + network::HttpClient::base64_encode(options_.username + ":" + options_.password);
    if (ctx.request.get_header("Authorization") == expected) {
        return true;
    }
    response = make_error(HttpStatus::UNAUTHORIZED, "Authentication required");
    response.set_header("WWW-Authenticate", "Basic realm=\"publishing\"");
    return false;
}

// ────────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────────

PublishingService::SourceRecord* PublishingService::find_source(const HttpContext& ctx) {
    const auto id = ctx.number_param("id");
    if (!id) {
        return nullptr;
    }
    auto it = sources_.find(static_cast<std::int64_t>(*id));
    return it == sources_.end() ? nullptr : &it->second;
}

json PublishingService::to_json(const SourceRecord& record) const {
    const std::string self = std::string(kSourceRoot) + "/" + std::to_string(record.id);

    json resource;
    resource["id"] = record.id;
    resource["filename"] = record.filename;
    resource["content_type"] = record.content_type.empty() ? json(nullptr) : json(record.content_type);
    resource["parse_options"] = json{{"parse_source", record.parse_source}};
    resource["finished_at"] = record.finished_at ? json(*record.finished_at) : json(nullptr);
    resource["failed_at"] = record.failed_at ? json(*record.failed_at) : json(nullptr);
    resource["failure_details"] = record.failure_details;

    json links;
    links["show"] = self;
    links["update"] = self;
    links["initiate"] = self + "/initiate";
    links["chunk"] = self + "/chunk/{seq_num}/{byte_offset}";
    links["commit"] = self + "/commit/{seq_num}/{byte_offset}";

    return json{{"resource", resource}, {"links", links}};
}

std::string PublishingService::timestamp_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace dsup::server
