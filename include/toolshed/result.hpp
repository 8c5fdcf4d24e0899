#pragma once

/**
 * @file result.hpp
 * @brief Error values for library, project and config operations
 *
 * Expected failures (missing files, unparsable manifests, unknown tools) are
 * returned, not thrown, so a batch can record one bad item and move on.
 * Components with a fixed failure vocabulary (hydration, launching, sealing)
 * report through their own result structs instead.
 */

#include <optional>
#include <string>
#include <utility>

namespace toolshed {

enum class ErrorCode {
    FILE_NOT_FOUND,
    IO_ERROR,
    PARSE_ERROR,         // not JSON, or the wrong JSON shape
    INVALID_INPUT,       // well-formed but semantically wrong
    TOOL_NOT_INSTALLED,
    ROOT_UNRESOLVED,     // no library root could be determined
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "file_not_found";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::INVALID_INPUT: return "invalid_input";
        case ErrorCode::TOOL_NOT_INSTALLED: return "tool_not_installed";
        case ErrorCode::ROOT_UNRESOLVED: return "root_unresolved";
    }
    return "unknown";
}

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    // Prefix the message with where it happened ("<path>: <message>")
    Error& withContext(const std::string& context) {
        message_.insert(0, context + ": ");
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
};

/**
 * Either a T or an E. Check isOk() before value() and isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_.emplace(std::move(value));
        return r;
    }
    static Result err(E error) {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    bool isOk() const { return value_.has_value(); }
    bool isErr() const { return !value_.has_value(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    bool isOk() const { return !error_.has_value(); }
    bool isErr() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    Result() = default;

    std::optional<E> error_;
};

} // namespace toolshed
