#pragma once

#include "http_types.hpp"
#include "dsup/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <string>

namespace dsup {
namespace network {

enum class MessageKind {
    Request,   // Server side: "METHOD SP URL SP VERSION"
    Response   // Client side: "VERSION SP CODE SP REASON"
};

/**
 * @brief State machine states for HTTP message parsing
 *
 * Message format:
 * START-LINE CRLF
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Content-Length, chunked, or until EOF
 */
enum class ParseState {
    START_LINE,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,            // Fixed-length body (Content-Length)
    CHUNK_SIZE,      // Chunked transfer coding: hex size line
    CHUNK_DATA,
    CHUNK_DATA_END,  // CRLF after each chunk's data
    CHUNK_TRAILER,   // Optional trailer fields after the last chunk
    BODY_UNTIL_EOF,  // Response without framing: body ends when the peer closes
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x message parser
 *
 * Feed data as it arrives from the socket; parse() reports true once a full
 * message is buffered. For responses that are delimited by connection close,
 * call finish() when the peer closes.
 *
 * Usage example:
 * ```cpp
 * HttpParser parser(MessageKind::Response);
 * while (!done) {
 *     auto n = socket.read_some(buffer, ec);
 *     if (ec == asio::error::eof) { done = parser.finish().is_ok(); break; }
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 *     done = result.value();
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxLineLength = 16 * 1024;
    static constexpr std::size_t kDefaultMaxBody = 256 * 1024 * 1024;
    static constexpr std::size_t kMaxReserve = 1024 * 1024;  // Larger bodies grow as bytes arrive

    explicit HttpParser(MessageKind kind = MessageKind::Request) : kind_(kind) { reset(); }

    /**
     * @brief Parse incoming data
     *
     * @return true if the message is complete, false if more data is needed,
     *         or a Protocol error for malformed input
     */
    Result<bool> parse(const char* data, std::size_t len) {
        std::size_t i = 0;
        while (i < len) {
            switch (state_) {
                case ParseState::BODY:
                case ParseState::CHUNK_DATA:
                case ParseState::BODY_UNTIL_EOF:
                    i += consume_body(data + i, len - i);
                    if (state_ == ParseState::PARSE_ERROR) {
                        return malformed();
                    }
                    continue;

                case ParseState::COMPLETE:
                    return Ok(true);

                case ParseState::PARSE_ERROR:
                    return Err<bool>(ErrorCode::Protocol, "Parser in error state");

                default:
                    break;
            }

            const char c = data[i++];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::START_LINE: ok = parse_start_line(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::CHUNK_SIZE: ok = parse_chunk_size(c); break;
                case ParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); break;
                case ParseState::CHUNK_TRAILER: ok = parse_chunk_trailer(c); break;
                default: break;
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return malformed();
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a response whose body runs until EOF; any other unfinished
     * message is an error.
     */
    Result<bool> finish() {
        if (state_ == ParseState::BODY_UNTIL_EOF) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
        return Err<bool>(ErrorCode::Protocol,
                         "Connection closed before the HTTP " + std::string(kind_name()) + " was complete");
    }

    HttpRequest get_request() const {
        HttpRequest request;
        request.method = method_;
        request.url = url_;
        request.version = version_;
        request.headers = headers_;
        request.body = body_;
        return request;
    }

    HttpResponse get_response() const {
        HttpResponse response;
        response.version = version_;
        response.status_code = status_code_;
        response.reason_phrase = reason_;
        response.headers = headers_;
        response.body = body_;
        return response;
    }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    /// Bodies announced or received beyond this fail with a Protocol error
    void set_max_body_bytes(std::size_t limit) { max_body_bytes_ = limit; }

    std::size_t max_body_bytes() const { return max_body_bytes_; }

    /// True when the last error was an over-limit body
    bool body_too_large() const { return body_too_large_; }

    ParseState state() const { return state_; }

    void reset() {
        state_ = ParseState::START_LINE;
        method_ = HttpMethod::UNKNOWN;
        url_.clear();
        version_ = HttpVersion::HTTP_1_1;
        status_code_ = 0;
        reason_.clear();
        headers_.clear();
        body_.clear();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        expected_length_ = 0;
        chunk_remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    MessageKind kind_;
    ParseState state_;

    HttpMethod method_;
    std::string url_;
    HttpVersion version_;
    int status_code_;
    std::string reason_;
    HttpHeaders headers_;
    std::vector<uint8_t> body_;

    std::string buffer_;                // Current token or line
    std::string current_header_name_;
    std::string error_;                 // Detail for the next error report
    std::size_t expected_length_;       // Content-Length
    std::size_t chunk_remaining_;       // Bytes left in the current chunk
    std::size_t line_;
    bool last_char_was_cr_;
    std::size_t max_body_bytes_ = kDefaultMaxBody;
    bool body_too_large_ = false;

    const char* kind_name() const { return kind_ == MessageKind::Request ? "request" : "response"; }

    Result<bool> malformed() const {
        return Err<bool>(ErrorCode::Protocol,
                         "Malformed HTTP " + std::string(kind_name()) + " at line " +
                         std::to_string(line_) + (error_.empty() ? "" : ": " + error_));
    }

    bool reject_body_size(std::size_t announced) {
        body_too_large_ = true;
        error_ = "body of " + std::to_string(announced) + " bytes exceeds limit of " +
                 std::to_string(max_body_bytes_);
        return false;
    }

    /**
     * @brief Decimal Content-Length without exceptions
     *
     * @return false on a non-digit or a value that does not fit size_t
     */
    static bool parse_length(const std::string& text, std::size_t& value) {
        if (text.empty()) {
            return false;
        }
        constexpr auto kMax = std::numeric_limits<std::size_t>::max();
        value = 0;
        for (const char ch : text) {
            if (ch < '0' || ch > '9') {
                return false;
            }
            const auto digit = static_cast<std::size_t>(ch - '0');
            if (value > (kMax - digit) / 10) {
                return false;
            }
            value = value * 10 + digit;
        }
        return true;
    }

    /**
     * @brief Accumulate one CRLF-terminated line into buffer_
     *
     * @return 1 when the line is complete, 0 when more input is needed,
     *         -1 on an overlong line or a bare LF/CR mix
     */
    int accumulate_line(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return 0;
        }
        if (c == '\n') {
            if (!last_char_was_cr_) {
                error_ = "bare LF";
                return -1;
            }
            last_char_was_cr_ = false;
            return 1;
        }
        last_char_was_cr_ = false;
        if (buffer_.size() >= kMaxLineLength) {
            error_ = "line too long";
            return -1;
        }
        buffer_ += c;
        return 0;
    }

    bool parse_start_line(char c) {
        const int status = accumulate_line(c);
        if (status <= 0) {
            return status == 0;
        }

        const auto first_space = buffer_.find(' ');
        if (first_space == std::string::npos) {
            error_ = "incomplete start line";
            return false;
        }
        const auto second_space = buffer_.find(' ', first_space + 1);

        bool ok = kind_ == MessageKind::Request
            ? parse_request_line(first_space, second_space)
            : parse_status_line(first_space, second_space);
        buffer_.clear();
        state_ = ParseState::HEADER_NAME;
        return ok;
    }

    bool parse_request_line(std::size_t first_space, std::size_t second_space) {
        if (second_space == std::string::npos) {
            error_ = "incomplete request line";
            return false;
        }
        method_ = HttpMethodUtils::from_string(buffer_.substr(0, first_space));
        if (method_ == HttpMethod::UNKNOWN) {
            error_ = "unknown method";
            return false;
        }
        url_ = buffer_.substr(first_space + 1, second_space - first_space - 1);
        if (url_.empty()) {
            error_ = "empty URL";
            return false;
        }
        return parse_version(buffer_.substr(second_space + 1));
    }

    bool parse_status_line(std::size_t first_space, std::size_t second_space) {
        if (!parse_version(buffer_.substr(0, first_space))) {
            return false;
        }
        const auto code = buffer_.substr(first_space + 1,
            second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);
        if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                             [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            error_ = "invalid status code";
            return false;
        }
        status_code_ = std::stoi(code);
        reason_ = second_space == std::string::npos ? "" : buffer_.substr(second_space + 1);
        return true;
    }

    bool parse_version(const std::string& text) {
        if (text == "HTTP/1.1") {
            version_ = HttpVersion::HTTP_1_1;
        } else if (text == "HTTP/1.0") {
            version_ = HttpVersion::HTTP_1_0;
        } else {
            error_ = "unsupported version '" + text + "'";
            return false;
        }
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line - headers complete
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                error_ = "header without value";
                return false;
            }
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                error_ = "empty header name";
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            error_ = "invalid header name character";
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        const int status = accumulate_line(c);
        if (status <= 0) {
            return status == 0;
        }

        while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
            buffer_.pop_back();
        }
        headers_[current_header_name_] = buffer_;
        buffer_.clear();
        current_header_name_.clear();
        state_ = ParseState::HEADER_NAME;
        return true;
    }

    /**
     * @brief Pick the body framing once the header block has ended
     */
    bool begin_body() {
        if (kind_ == MessageKind::Response &&
            (status_code_ / 100 == 1 || status_code_ == 204 || status_code_ == 304)) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::string transfer_encoding = find_header(headers_, "Transfer-Encoding");
        std::transform(transfer_encoding.begin(), transfer_encoding.end(), transfer_encoding.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (transfer_encoding.find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = find_header(headers_, "Content-Length");
        if (!content_length.empty()) {
            if (!parse_length(content_length, expected_length_)) {
                error_ = "invalid Content-Length";
                return false;
            }
            if (expected_length_ > max_body_bytes_) {
                return reject_body_size(expected_length_);
            }
            if (expected_length_ > 0) {
                body_.reserve(std::min(expected_length_, kMaxReserve));
                state_ = ParseState::BODY;
                return true;
            }
            state_ = ParseState::COMPLETE;
            return true;
        }

        state_ = kind_ == MessageKind::Response ? ParseState::BODY_UNTIL_EOF : ParseState::COMPLETE;
        return true;
    }

    bool parse_chunk_size(char c) {
        const int status = accumulate_line(c);
        if (status <= 0) {
            return status == 0;
        }

        // Ignore chunk extensions
        const auto digits = buffer_.substr(0, buffer_.find(';'));
        buffer_.clear();
        if (digits.empty() || digits.size() > 15 ||
            !std::all_of(digits.begin(), digits.end(),
                         [](unsigned char ch) { return std::isxdigit(ch) != 0; })) {
            error_ = "invalid chunk size";
            return false;
        }

        chunk_remaining_ = static_cast<std::size_t>(std::stoull(digits, nullptr, 16));
        if (chunk_remaining_ > max_body_bytes_ - std::min(body_.size(), max_body_bytes_)) {
            return reject_body_size(body_.size() + chunk_remaining_);
        }
        state_ = chunk_remaining_ == 0 ? ParseState::CHUNK_TRAILER : ParseState::CHUNK_DATA;
        return true;
    }

    bool parse_chunk_data_end(char c) {
        const int status = accumulate_line(c);
        if (status <= 0) {
            return status == 0;
        }
        if (!buffer_.empty()) {
            error_ = "chunk data overrun";
            return false;
        }
        state_ = ParseState::CHUNK_SIZE;
        return true;
    }

    bool parse_chunk_trailer(char c) {
        const int status = accumulate_line(c);
        if (status <= 0) {
            return status == 0;
        }
        if (buffer_.empty()) {
            state_ = ParseState::COMPLETE;
        }
        buffer_.clear();
        return true;
    }

    /**
     * @brief Copy as much body data as the current state allows
     *
     * @return Number of bytes consumed
     */
    std::size_t consume_body(const char* data, std::size_t len) {
        std::size_t take = len;
        if (state_ == ParseState::BODY_UNTIL_EOF && body_.size() + len > max_body_bytes_) {
            reject_body_size(body_.size() + len);
            state_ = ParseState::PARSE_ERROR;
            return len;
        }
        if (state_ == ParseState::BODY) {
            take = std::min(len, expected_length_ - body_.size());
        } else if (state_ == ParseState::CHUNK_DATA) {
            take = std::min(len, chunk_remaining_);
            chunk_remaining_ -= take;
        }

        body_.insert(body_.end(),
                     reinterpret_cast<const uint8_t*>(data),
                     reinterpret_cast<const uint8_t*>(data) + take);

        if (state_ == ParseState::BODY && body_.size() >= expected_length_) {
            state_ = ParseState::COMPLETE;
        } else if (state_ == ParseState::CHUNK_DATA && chunk_remaining_ == 0) {
            state_ = ParseState::CHUNK_DATA_END;
        }
        return take;
    }
};

} // namespace network
} // namespace dsup
