#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace dsup {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/**
 * @brief Case-insensitive header lookup (RFC 7230 field names)
 *
 * @return Header value if found, empty string otherwise
 */
std::string find_header(const HttpHeaders& headers, const std::string& name);

std::string version_to_string(HttpVersion version);

/// Standard reason phrase for a status code; "Unknown" for codes we never emit
std::string reason_phrase_for(int status_code);

/**
 * @brief Headers and body shared by requests and responses
 *
 * The body is a byte vector because chunk payloads are binary.
 */
struct HttpMessage {
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const { return find_header(headers, name); }

    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    void set_body(const std::string& content);
    void set_body(std::vector<uint8_t> data);

protected:
    /// Start line, headers (Content-Length always present), blank line, body
    std::vector<uint8_t> serialize_with(const std::string& start_line) const;
};

/**
 * @brief An HTTP request, built by the client or parsed by the server
 *
 * Wire format:
 * POST /api/publishing/v1/source/7/chunk/0/0 HTTP/1.1
 * Host: data.example.org
 * Content-Type: application/octet-stream
 * Content-Length: 4096
 *
 * [body]
 *
 * Content-Length is written even for bodiless POSTs (commit) so they are
 * never mistaken for open-ended messages.
 */
struct HttpRequest : HttpMessage {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                    // Request target, e.g. "/api/publishing/v1/source"

    std::vector<uint8_t> serialize() const;
};

/**
 * @brief An HTTP response, built by the server or parsed by the client
 */
struct HttpResponse : HttpMessage {
    int status_code = 200;
    std::string reason_phrase;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(reason_phrase_for(static_cast<int>(status))) {
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::vector<uint8_t> serialize() const;
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str);
    static std::string to_string(HttpMethod method);
};

} // namespace network
} // namespace dsup
