#include "dsup/network/http_types.hpp"

#include <strings.h>

#include <sstream>

namespace dsup {
namespace network {

std::string find_header(const HttpHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

std::string version_to_string(HttpVersion version) {
    return version == HttpVersion::HTTP_1_0 ? "HTTP/1.0" : "HTTP/1.1";
}

std::string reason_phrase_for(int status_code) {
    switch (static_cast<HttpStatus>(status_code)) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::CREATED: return "Created";
        case HttpStatus::NO_CONTENT: return "No Content";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::UNAUTHORIZED: return "Unauthorized";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
        case HttpStatus::CONFLICT: return "Conflict";
        case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
        case HttpStatus::UNPROCESSABLE_ENTITY: return "Unprocessable Entity";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
    }
    return "Unknown";
}

// ────────────────────────────────────────────────────────────
// HttpMessage
// ────────────────────────────────────────────────────────────

void HttpMessage::set_body(const std::string& content) {
    set_body(std::vector<uint8_t>(content.begin(), content.end()));
}

void HttpMessage::set_body(std::vector<uint8_t> data) {
    body = std::move(data);
    headers["Content-Length"] = std::to_string(body.size());
}

std::vector<uint8_t> HttpMessage::serialize_with(const std::string& start_line) const {
    std::ostringstream head;
    head << start_line << "\r\n";
    for (const auto& [name, value] : headers) {
        if (strcasecmp(name.c_str(), "Content-Length") != 0) {
            head << name << ": " << value << "\r\n";
        }
    }
    // Always derived from the body
    head << "Content-Length: " << body.size() << "\r\n\r\n";

    const std::string text = head.str();
    std::vector<uint8_t> wire;
    wire.reserve(text.size() + body.size());
    wire.insert(wire.end(), text.begin(), text.end());
    wire.insert(wire.end(), body.begin(), body.end());
    return wire;
}

std::vector<uint8_t> HttpRequest::serialize() const {
    return serialize_with(HttpMethodUtils::to_string(method) + " " + url + " " + version_to_string(version));
}

std::vector<uint8_t> HttpResponse::serialize() const {
    const std::string reason = reason_phrase.empty() ? reason_phrase_for(status_code) : reason_phrase;
    return serialize_with(version_to_string(version) + " " + std::to_string(status_code) + " " + reason);
}

// ────────────────────────────────────────────────────────────
// HttpMethodUtils
// ────────────────────────────────────────────────────────────

HttpMethod HttpMethodUtils::from_string(const std::string& method_str) {
    static const std::unordered_map<std::string, HttpMethod> kMethods = {
        {"GET", HttpMethod::GET},
        {"POST", HttpMethod::POST},
        {"PUT", HttpMethod::PUT},
        {"PATCH", HttpMethod::PATCH},
        {"DELETE", HttpMethod::DELETE_METHOD},
        {"HEAD", HttpMethod::HEAD},
    };
    auto it = kMethods.find(method_str);
    return it == kMethods.end() ? HttpMethod::UNKNOWN : it->second;
}

std::string HttpMethodUtils::to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::UNKNOWN: break;
    }
    return "UNKNOWN";
}

} // namespace network
} // namespace dsup
