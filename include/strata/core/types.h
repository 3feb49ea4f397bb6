#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// Error types
enum class ErrorCode {
    Success = 0,
    // Validation
    InvalidPath,
    InvalidSlug,
    InvalidArgument,
    ParseFailed,
    ValidationFailed,
    SerializeFailed,
    // I/O
    NotFound,
    IoReadError,
    IoWriteError,
    // Consistency
    IndexError,
    // Registry
    RegistryMissing,
    RegistryParseFailed,
    RegistryReadFailed,
    RegistryWriteFailed,
    StoreNotFound,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidPath: return "Invalid path";
        case ErrorCode::InvalidSlug: return "Invalid slug";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ParseFailed: return "Parse failed";
        case ErrorCode::ValidationFailed: return "Validation failed";
        case ErrorCode::SerializeFailed: return "Serialize failed";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::IoReadError: return "I/O read error";
        case ErrorCode::IoWriteError: return "I/O write error";
        case ErrorCode::IndexError: return "Index error";
        case ErrorCode::RegistryMissing: return "Registry missing";
        case ErrorCode::RegistryParseFailed: return "Registry parse failed";
        case ErrorCode::RegistryReadFailed: return "Registry read failed";
        case ErrorCode::RegistryWriteFailed: return "Registry write failed";
        case ErrorCode::StoreNotFound: return "Store not found";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable machine-readable name, used in CLI JSON output
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "SUCCESS";
        case ErrorCode::InvalidPath: return "INVALID_PATH";
        case ErrorCode::InvalidSlug: return "INVALID_SLUG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::ParseFailed: return "PARSE_FAILED";
        case ErrorCode::ValidationFailed: return "VALIDATION_FAILED";
        case ErrorCode::SerializeFailed: return "SERIALIZE_FAILED";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::IoReadError: return "IO_READ_ERROR";
        case ErrorCode::IoWriteError: return "IO_WRITE_ERROR";
        case ErrorCode::IndexError: return "INDEX_ERROR";
        case ErrorCode::RegistryMissing: return "REGISTRY_MISSING";
        case ErrorCode::RegistryParseFailed: return "REGISTRY_PARSE_FAILED";
        case ErrorCode::RegistryReadFailed: return "REGISTRY_READ_FAILED";
        case ErrorCode::RegistryWriteFailed: return "REGISTRY_WRITE_FAILED";
        case ErrorCode::StoreNotFound: return "STORE_NOT_FOUND";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        case ErrorCode::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Error struct for detailed error information. `path` names the offending
// category, memory, or file when there is one.
struct Error {
    ErrorCode code;
    std::string message;
    std::string path;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string p)
        : code(c), message(std::move(msg)), path(std::move(p)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    // Comparison operators for ErrorCode
    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    // Friend operators for ErrorCode on the left side
    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace strata

// Format support for ErrorCode
#include <format>
template <> struct std::formatter<strata::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(strata::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", strata::errorToString(error));
    }
};

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<strata::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(strata::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", strata::errorToString(error));
    }
};
#endif

namespace strata {

// Store layout defaults
inline constexpr const char* DEFAULT_MEMORY_EXTENSION = ".md";
inline constexpr const char* DEFAULT_INDEX_EXTENSION = ".yaml";
inline constexpr const char* INDEX_FILE_STEM = "index";
inline constexpr size_t MAX_DESCRIPTION_LENGTH = 500;

} // namespace strata
