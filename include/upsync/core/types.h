#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace upsync {

// Type aliases
using EnvMap = std::map<std::string, std::string>;
using RawEnv = std::vector<std::pair<std::string, std::string>>;

// Error types
enum class ErrorCode {
    Success = 0,
    EnvLookup,
    UnresolvedCycle,
    MissingDirectory,
    CanonicalizeError,
    ParentConflict,
    CreateDirError,
    DeleteError,
    RenameError,
    SymlinkError,
    IOError,
    InvalidArgument,
    ConfigError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::EnvLookup: return "Environment lookup failed";
        case ErrorCode::UnresolvedCycle: return "Unresolved environment cycle";
        case ErrorCode::MissingDirectory: return "Missing directory";
        case ErrorCode::CanonicalizeError: return "Canonicalize failed";
        case ErrorCode::ParentConflict: return "Parent directory conflict";
        case ErrorCode::CreateDirError: return "Create directory failed";
        case ErrorCode::DeleteError: return "Delete failed";
        case ErrorCode::RenameError: return "Rename failed";
        case ErrorCode::SymlinkError: return "Symlink failed";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information.
// Context fields are filled by the call site that knows them; unused ones stay empty.
struct Error {
    ErrorCode code;
    std::string message;

    std::vector<std::filesystem::path> paths; // path(s) involved, source first
    std::string variable;                     // EnvLookup: the missing name
    std::vector<std::string> keys;            // UnresolvedCycle: keys still queued
    std::error_code cause;                    // underlying OS error, if any

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    Error& withPath(std::filesystem::path p) {
        paths.push_back(std::move(p));
        return *this;
    }

    Error& withCause(std::error_code ec) {
        cause = ec;
        return *this;
    }

    // Human readable one-liner: "<message>: <os error>"
    std::string describe() const {
        if (cause) {
            return message + ": " + cause.message();
        }
        return message;
    }

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

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

} // namespace upsync

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<upsync::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(upsync::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", upsync::errorToString(error));
    }
};
