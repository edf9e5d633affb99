#pragma once

#include <mcp_gateway/store/i_kv_backend.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// RedisBackendOptions — connection settings for the Redis backend.
// ---------------------------------------------------------------------------
struct RedisBackendOptions {
    std::chrono::milliseconds connect_timeout{1500};
    std::chrono::milliseconds socket_timeout{1500};
    std::size_t pool_size = 4;
};

// ---------------------------------------------------------------------------
// RedisBackend — IKeyValueBackend over redis++ (sw::redis::Redis).
//
// Uses pimpl to avoid leaking redis++ into the public header. The client
// holds a connection pool and is safe to share across request workers.
// redis++ exceptions are caught here and mapped to Error:
//   IoError / TimeoutError / ClosedError -> BackendUnavailable
//   ReplyError (e.g. WRONGTYPE)          -> Internal
// ---------------------------------------------------------------------------
class RedisBackend : public IKeyValueBackend {
public:
    explicit RedisBackend(const std::string& url,
                          const RedisBackendOptions& options = {});
    ~RedisBackend() override;

    RedisBackend(const RedisBackend&) = delete;
    RedisBackend& operator=(const RedisBackend&) = delete;
    RedisBackend(RedisBackend&&) = delete;
    RedisBackend& operator=(RedisBackend&&) = delete;

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

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_gateway
