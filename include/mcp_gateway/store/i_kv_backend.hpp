#pragma once

#include <mcp_gateway/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// IKeyValueBackend — the shared key-value store behind all session records.
//
// Mirrors the Redis command subset the session subsystem relies on. Every
// call is single-key atomic; there are no multi-key transactions.
//
// Methods return Result<T, Error> with ErrorCategory::BackendUnavailable on
// connectivity failures — never throw on expected failures. Absence is a
// value (nullopt / false / empty), not an error.
// ---------------------------------------------------------------------------
class IKeyValueBackend {
public:
    virtual ~IKeyValueBackend() = default;

    // Non-copyable, non-movable (polymorphic base).
    IKeyValueBackend(const IKeyValueBackend&) = delete;
    IKeyValueBackend& operator=(const IKeyValueBackend&) = delete;
    IKeyValueBackend(IKeyValueBackend&&) = delete;
    IKeyValueBackend& operator=(IKeyValueBackend&&) = delete;

    // -- Strings -------------------------------------------------------------

    // SETEX key ttl value
    [[nodiscard]] virtual Result<void, Error> SetEx(
        std::string_view key, std::chrono::seconds ttl,
        std::string_view value) = 0;

    // GET key
    [[nodiscard]] virtual Result<std::optional<std::string>, Error> Get(
        std::string_view key) = 0;

    // DEL key — true when a key was removed.
    [[nodiscard]] virtual Result<bool, Error> Del(std::string_view key) = 0;

    // EXPIRE key ttl — true when the key exists.
    [[nodiscard]] virtual Result<bool, Error> Expire(
        std::string_view key, std::chrono::seconds ttl) = 0;

    // -- Sets ----------------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> SAdd(
        std::string_view key, std::string_view member) = 0;

    [[nodiscard]] virtual Result<bool, Error> SRem(
        std::string_view key, std::string_view member) = 0;

    [[nodiscard]] virtual Result<std::vector<std::string>, Error> SMembers(
        std::string_view key) = 0;

    // -- Enumeration / health -----------------------------------------------

    // KEYS <prefix>* — full keys, unordered. Only viable at low key counts.
    [[nodiscard]] virtual Result<std::vector<std::string>, Error> KeysWithPrefix(
        std::string_view prefix) = 0;

    [[nodiscard]] virtual Result<void, Error> Ping() = 0;

protected:
    IKeyValueBackend() = default;
};

} // namespace mcp_gateway
