#pragma once

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace civdl {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error taxonomy shared by the catalog client and the download engine.
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    // API layer
    ResourceNotFound,
    AuthenticationFailed,
    RateLimited,
    ApiError,
    InvalidResponse,
    // Transfer layer
    NetworkError,
    FilesystemError,
    IncompleteTransfer,
    // Cooperative interruption of a running transfer
    Cancelled,
    Paused,
    Unknown
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ResourceNotFound: return "ResourceNotFound";
        case ErrorCode::AuthenticationFailed: return "AuthenticationFailed";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::ApiError: return "ApiError";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::FilesystemError: return "FilesystemError";
        case ErrorCode::IncompleteTransfer: return "IncompleteTransfer";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Paused: return "Paused";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    int httpStatus{0}; // 0 when the failure did not come from an HTTP status

    Error() = default;
    Error(ErrorCode c, std::string msg, int status = 0)
        : code(c), message(std::move(msg)), httpStatus(status) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Ordered query parameters. Setting an existing key replaces its value.
 */
class QueryParams {
public:
    QueryParams() = default;
    QueryParams(std::initializer_list<std::pair<std::string, std::string>> init) {
        for (const auto& [k, v] : init)
            set(k, v);
    }

    void set(std::string key, std::string value) {
        for (auto& [k, v] : items_) {
            if (k == key) {
                v = std::move(value);
                return;
            }
        }
        items_.emplace_back(std::move(key), std::move(value));
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        for (const auto& [k, v] : items_) {
            if (k == key)
                return v;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] auto begin() const { return items_.begin(); }
    [[nodiscard]] auto end() const { return items_.end(); }

private:
    std::vector<std::pair<std::string, std::string>> items_;
};

} // namespace civdl
