#pragma once

#include "dsup/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace dsup::api {

/**
 * @brief Point-in-time state of a source as reported by the service
 *
 * Parsed from the `{"resource": {...}, "links": {...}}` envelope returned by
 * every source endpoint. The raw document is kept for callers that need
 * fields this struct does not model.
 */
struct SourceSnapshot {
    std::int64_t id = 0;
    std::optional<std::string> finished_at;
    std::optional<std::string> failed_at;
    bool parse_source = true;
    nlohmann::json failure_details;
    std::unordered_map<std::string, std::string> links;
    nlohmann::json raw;

    [[nodiscard]] bool is_finished() const noexcept { return finished_at.has_value(); }
    [[nodiscard]] bool is_failed() const noexcept { return failed_at.has_value(); }

    /**
     * @brief Look up a link by name ("show", "chunk", "commit", ...)
     */
    [[nodiscard]] std::optional<std::string> link(const std::string& name) const;

    static dsup::Result<SourceSnapshot> from_json(const nlohmann::json& document);
    static dsup::Result<SourceSnapshot> parse(const std::string& body);
};

} // namespace dsup::api
