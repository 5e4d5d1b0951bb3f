#include "dsup/api/http_source_api.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dsup::api {
namespace {

using json = nlohmann::json;

constexpr const char* kSourceEndpoint = "/api/publishing/v1/source";

void replace_all(std::string& text, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

HttpSourceApi::HttpSourceApi(const network::HttpClient& client, SourceSnapshot snapshot)
    : client_(client), snapshot_(std::move(snapshot)) {
}

SourceSnapshot HttpSourceApi::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_;
}

std::string HttpSourceApi::expand_link(std::string link, std::uint64_t seq_num, std::uint64_t byte_offset) {
    replace_all(link, "{seq_num}", std::to_string(seq_num));
    replace_all(link, "{byte_offset}", std::to_string(byte_offset));
    return link;
}

dsup::Result<std::string> HttpSourceApi::require_link(const std::string& name) const {
    std::lock_guard lock(mutex_);
    if (auto link = snapshot_.link(name)) {
        return dsup::Ok(*link);
    }
    return dsup::Err<std::string>(ErrorCode::Protocol,
                                  "Source " + std::to_string(snapshot_.id) + " has no '" + name + "' link");
}

dsup::Result<SourceSnapshot> HttpSourceApi::store(const network::HttpResponse& response) {
    auto parsed = SourceSnapshot::parse(response.body_as_string());
    if (parsed.is_error()) {
        return parsed;
    }
    std::lock_guard lock(mutex_);
    snapshot_ = parsed.value();
    return parsed;
}

dsup::Result<upload::UploadPlan> HttpSourceApi::initiate(const std::string& content_type) {
    auto link = require_link("initiate");
    if (link.is_error()) {
        return dsup::Err<upload::UploadPlan>(link.error());
    }

    const json body{{"content_type", content_type}};
    auto response = client_.post(link.value(), "application/json", body.dump());
    if (response.is_error()) {
        return dsup::Err<upload::UploadPlan>(response.error());
    }

    auto document = json::parse(response.value().body_as_string(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return dsup::Err<upload::UploadPlan>(ErrorCode::Protocol, "Initiate response is not a JSON object");
    }

    const auto size_it = document.find("preferred_chunk_size");
    const auto parallel_it = document.find("preferred_upload_parallelism");
    if (size_it == document.end() || !size_it->is_number_integer() ||
        parallel_it == document.end() || !parallel_it->is_number_integer()) {
        return dsup::Err<upload::UploadPlan>(ErrorCode::Protocol,
            "Initiate response lacks preferred_chunk_size or preferred_upload_parallelism");
    }

    upload::UploadPlan plan;
    plan.preferred_chunk_size = size_it->get<std::int64_t>();
    plan.preferred_upload_parallelism = parallel_it->get<std::int64_t>();
    spdlog::debug("Initiated {} upload: chunk_size={} parallelism={}",
                  content_type, plan.preferred_chunk_size, plan.preferred_upload_parallelism);
    return dsup::Ok(plan);
}

dsup::Result<void> HttpSourceApi::send_chunk(std::uint64_t seq_num,
                                             std::uint64_t byte_offset,
                                             const std::vector<std::uint8_t>& payload) {
    auto link = require_link("chunk");
    if (link.is_error()) {
        return dsup::Err<void>(link.error());
    }

    auto response = client_.post(expand_link(link.value(), seq_num, byte_offset),
                                 "application/octet-stream", payload);
    if (response.is_error()) {
        return dsup::Err<void>(response.error());
    }
    return dsup::Ok();
}

dsup::Result<void> HttpSourceApi::commit(std::uint64_t seq_num, std::uint64_t end_byte_offset) {
    auto link = require_link("commit");
    if (link.is_error()) {
        return dsup::Err<void>(link.error());
    }

    auto response = client_.post(expand_link(link.value(), seq_num, end_byte_offset),
                                 "application/json", std::string{});
    if (response.is_error()) {
        return dsup::Err<void>(response.error());
    }
    return dsup::Ok();
}

dsup::Result<SourceSnapshot> HttpSourceApi::show() {
    auto link = require_link("show");
    if (link.is_error()) {
        return dsup::Err<SourceSnapshot>(link.error());
    }

    auto response = client_.get(link.value());
    if (response.is_error()) {
        return dsup::Err<SourceSnapshot>(response.error());
    }
    return store(response.value());
}

dsup::Result<SourceSnapshot> HttpSourceApi::disable_parse_source() {
    auto link = require_link("update");
    if (link.is_error()) {
        return dsup::Err<SourceSnapshot>(link.error());
    }

    const json body{{"parse_options", {{"parse_source", false}}}};
    auto response = client_.post(link.value(), "application/json", body.dump());
    if (response.is_error()) {
        return dsup::Err<SourceSnapshot>(response.error());
    }
    return store(response.value());
}

dsup::Result<SourceSnapshot> HttpSourceApi::create_upload(const network::HttpClient& client,
                                                          const std::string& filename) {
    const json body{{"source_type", {{"type", "upload"}, {"filename", filename}}}};
    auto response = client.post(kSourceEndpoint, "application/json", body.dump());
    if (response.is_error()) {
        return dsup::Err<SourceSnapshot>(response.error());
    }
    auto snapshot = SourceSnapshot::parse(response.value().body_as_string());
    if (snapshot.is_ok()) {
        spdlog::info("Created upload source {} for {}", snapshot.value().id, filename);
    }
    return snapshot;
}

dsup::Result<SourceSnapshot> HttpSourceApi::lookup(const network::HttpClient& client, std::int64_t id) {
    auto response = client.get(std::string(kSourceEndpoint) + "/" + std::to_string(id));
    if (response.is_error()) {
        return dsup::Err<SourceSnapshot>(response.error());
    }
    return SourceSnapshot::parse(response.value().body_as_string());
}

} // namespace dsup::api
