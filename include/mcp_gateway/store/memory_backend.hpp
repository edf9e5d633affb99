#pragma once

#include <mcp_gateway/core/clock.hpp>
#include <mcp_gateway/store/i_kv_backend.hpp>

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <variant>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// MemoryBackend — in-process IKeyValueBackend with Redis TTL semantics.
//
// Selected by the "memory://" backend URL for single-process deployments and
// used as the storage underneath test doubles. Expiry is evaluated lazily
// against the injected clock on every access.
// ---------------------------------------------------------------------------
class MemoryBackend : public IKeyValueBackend {
public:
    explicit MemoryBackend(const IClock& clock = DefaultClock());

    [[nodiscard]] Result<void, Error> SetEx(
        std::string_view key, std::chrono::seconds ttl,
        std::string_view value) override;
    [[nodiscard]] Result<std::optional<std::string>, Error> Get(
        std::string_view key) override;
    [[nodiscard]] Result<bool, Error> Del(std::string_view key) override;
    [[nodiscard]] Result<bool, Error> Expire(
        std::string_view key, std::chrono::seconds ttl) override;

    [[nodiscard]] Result<void, Error> SAdd(
        std::string_view key, std::string_view member) override;
    [[nodiscard]] Result<bool, Error> SRem(
        std::string_view key, std::string_view member) override;
    [[nodiscard]] Result<std::vector<std::string>, Error> SMembers(
        std::string_view key) override;

    [[nodiscard]] Result<std::vector<std::string>, Error> KeysWithPrefix(
        std::string_view prefix) override;
    [[nodiscard]] Result<void, Error> Ping() override;

    // Remaining TTL of a key; nullopt if absent or persistent.
    [[nodiscard]] std::optional<std::chrono::seconds> Ttl(std::string_view key);

private:
    using Value = std::variant<std::string, std::set<std::string>>;

    struct Entry {
        Value value;
        std::optional<TimePoint> expires_at;
    };

    // Returns the live entry for key, erasing it first if expired.
    // Caller holds mutex_.
    Entry* FindLive(std::string_view key);

    const IClock& clock_;
    std::map<std::string, Entry, std::less<>> entries_;
    std::mutex mutex_;
};

} // namespace mcp_gateway
