#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace dsup {

/**
 * @brief Failure categories surfaced by the upload client
 *
 * A remote source that reports its own failure is not an error; it is a
 * normal WaitOutcome (see api/wait.hpp).
 */
enum class ErrorCode {
    Transport,           ///< initiate/chunk/commit/show failed on the wire or with a non-2xx status
    ContiguityViolation, ///< commit offset does not match the bytes read
    Timeout,             ///< wait_for_finish ran past its deadline
    Protocol,            ///< unparseable or invalid response
    StreamRead,          ///< local input stream failed
    InvalidArgument,
    IllegalState
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Transport: return "transport";
        case ErrorCode::ContiguityViolation: return "contiguity_violation";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Protocol: return "protocol";
        case ErrorCode::StreamRead: return "stream_read";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IllegalState: return "illegal_state";
    }
    return "unknown";
}

struct Error {
    ErrorCode code = ErrorCode::Transport;
    std::string message;
    int http_status = 0; ///< Set for Transport errors caused by a non-2xx reply

    Error() = default;
    Error(ErrorCode c, std::string msg, int status = 0)
        : code(c), message(std::move(msg)), http_status(status) {}

    std::string describe() const {
        std::string text = std::string(to_string(code)) + ": " + message;
        if (http_status != 0) {
            text += " (HTTP " + std::to_string(http_status) + ")";
        }
        return text;
    }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(Error error) { return Result<T>(ErrValue<Error>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace dsup
