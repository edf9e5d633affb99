#pragma once

#include <mcp_gateway/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// SessionId — validated client-presented session identifier.
//
// Rules:
//   - Non-empty, max 128 characters
//   - ASCII letters, digits, '-', '_' and '.'
//   - No ':' (the key separator in the backend namespaces)
// ---------------------------------------------------------------------------
class SessionId {
public:
    static Result<SessionId, std::string> Create(std::string_view id);

    // Fresh server-side id: 32 lowercase hex characters.
    static SessionId Generate();

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const SessionId& other) const { return value_ == other.value_; }
    bool operator!=(const SessionId& other) const { return value_ != other.value_; }

    SessionId(const SessionId&) = default;
    SessionId& operator=(const SessionId&) = default;
    SessionId(SessionId&&) noexcept = default;
    SessionId& operator=(SessionId&&) noexcept = default;

private:
    explicit SessionId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// BackendUrl — validated session backend locator.
//
// Accepted forms:
//   redis://[user:password@]host[:port][/db]
//   rediss://...          (TLS)
//   memory://             (in-process backend)
// ---------------------------------------------------------------------------
class BackendUrl {
public:
    enum class Kind { Redis, Memory };

    static Result<BackendUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }

    bool operator==(const BackendUrl& other) const { return value_ == other.value_; }
    bool operator!=(const BackendUrl& other) const { return value_ != other.value_; }

    BackendUrl(const BackendUrl&) = default;
    BackendUrl& operator=(const BackendUrl&) = default;
    BackendUrl(BackendUrl&&) noexcept = default;
    BackendUrl& operator=(BackendUrl&&) noexcept = default;

private:
    BackendUrl(std::string value, Kind kind)
        : value_(std::move(value)), kind_(kind) {}
    std::string value_;
    Kind kind_;
};

} // namespace mcp_gateway
