#include "dsup/api/snapshot.hpp"

namespace dsup::api {
namespace {

std::optional<std::string> optional_timestamp(const nlohmann::json& resource, const char* key) {
    auto it = resource.find(key);
    if (it == resource.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

} // namespace

std::optional<std::string> SourceSnapshot::link(const std::string& name) const {
    auto it = links.find(name);
    if (it == links.end()) {
        return std::nullopt;
    }
    return it->second;
}

dsup::Result<SourceSnapshot> SourceSnapshot::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        return dsup::Err<SourceSnapshot>(ErrorCode::Protocol, "Source document is not an object");
    }

    const auto resource_it = document.find("resource");
    if (resource_it == document.end() || !resource_it->is_object()) {
        return dsup::Err<SourceSnapshot>(ErrorCode::Protocol, "Source document has no resource");
    }
    const auto& resource = *resource_it;

    SourceSnapshot snapshot;
    try {
        snapshot.id = resource.value("id", static_cast<std::int64_t>(0));
        snapshot.finished_at = optional_timestamp(resource, "finished_at");
        snapshot.failed_at = optional_timestamp(resource, "failed_at");

        if (auto options = resource.find("parse_options");
            options != resource.end() && options->is_object()) {
            snapshot.parse_source = options->value("parse_source", true);
        }

        if (auto details = resource.find("failure_details"); details != resource.end()) {
            snapshot.failure_details = *details;
        }

        if (auto links = document.find("links"); links != document.end() && links->is_object()) {
            for (const auto& [name, value] : links->items()) {
                if (value.is_string()) {
                    snapshot.links.emplace(name, value.get<std::string>());
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return dsup::Err<SourceSnapshot>(ErrorCode::Protocol,
                                         std::string("Malformed source document: ") + e.what());
    }

    snapshot.raw = document;
    return dsup::Ok(std::move(snapshot));
}

dsup::Result<SourceSnapshot> SourceSnapshot::parse(const std::string& body) {
    auto document = nlohmann::json::parse(body, nullptr, false);
    if (document.is_discarded()) {
        return dsup::Err<SourceSnapshot>(ErrorCode::Protocol, "Source response is not valid JSON");
    }
    return from_json(document);
}

} // namespace dsup::api
