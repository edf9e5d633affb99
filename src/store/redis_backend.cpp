#include <mcp_gateway/store/redis_backend.hpp>

#include <mcp_gateway/core/log.hpp>

#include <sw/redis++/redis++.h>

#include <iterator>
#include <type_traits>

namespace mcp_gateway {

namespace {

// Escape glob metacharacters so a key prefix matches literally in KEYS.
std::string EscapeGlob(std::string_view prefix) {
    std::string out;
    out.reserve(prefix.size());
    for (char c : prefix) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// Strip credentials from a redis URL before it reaches a log line.
std::string RedactUrl(const std::string& url) {
    auto scheme_end = url.find("://");
    auto at = url.rfind('@');
    if (scheme_end == std::string::npos || at == std::string::npos ||
        at < scheme_end) {
        return url;
    }
    return url.substr(0, scheme_end + 3) + "<redacted>@" + url.substr(at + 1);
}

// Run fn against the client and translate redis++ exceptions.
template <typename T, typename Fn>
Result<T, Error> Guarded(sw::redis::Redis* redis, const std::string& init_error,
                         const char* operation, std::string_view key, Fn&& fn) {
    if (!redis) {
        return Result<T, Error>::Err(
            Error::BackendUnavailable(operation, std::string(key), init_error));
    }
    try {
        if constexpr (std::is_void_v<T>) {
            fn(*redis);
            return Result<T, Error>::Ok();
        } else {
            return Result<T, Error>::Ok(fn(*redis));
        }
    } catch (const sw::redis::ReplyError& e) {
        return Result<T, Error>::Err(
            Error{operation, std::string(key), e.what(), ErrorCategory::Internal});
    } catch (const sw::redis::Error& e) {
        // IoError, TimeoutError, ClosedError and friends.
        LogWarn("redis", std::string(operation) + " failed: " + e.what());
        return Result<T, Error>::Err(
            Error::BackendUnavailable(operation, std::string(key), e.what()));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the redis++ client.
// ---------------------------------------------------------------------------
struct RedisBackend::Impl {
    std::unique_ptr<sw::redis::Redis> redis;
    std::string init_error;

    Impl(const std::string& url, const RedisBackendOptions& options) {
        try {
            sw::redis::ConnectionOptions conn(url);
            conn.connect_timeout = options.connect_timeout;
            conn.socket_timeout = options.socket_timeout;

            sw::redis::ConnectionPoolOptions pool;
            pool.size = options.pool_size;

            redis = std::make_unique<sw::redis::Redis>(conn, pool);
            LogInfo("redis", "Session backend at " + RedactUrl(url));
        } catch (const sw::redis::Error& e) {
            init_error = e.what();
            LogError("redis", "Cannot initialise Redis client for " +
                                  RedactUrl(url) + ": " + init_error);
        }
    }

    template <typename T, typename Fn>
    Result<T, Error> Run(const char* operation, std::string_view key, Fn&& fn) {
        return Guarded<T>(redis.get(), init_error, operation, key,
                          std::forward<Fn>(fn));
    }
};

RedisBackend::RedisBackend(const std::string& url,
                           const RedisBackendOptions& options)
    : impl_(std::make_unique<Impl>(url, options)) {}

RedisBackend::~RedisBackend() = default;

Result<void, Error> RedisBackend::SetEx(std::string_view key,
                                        std::chrono::seconds ttl,
                                        std::string_view value) {
    const std::string k(key);
    const std::string v(value);
    return impl_->Run<void>("SetEx", key, [&](sw::redis::Redis& r) {
        r.setex(k, ttl, v);
    });
}

Result<std::optional<std::string>, Error> RedisBackend::Get(std::string_view key) {
    const std::string k(key);
    return impl_->Run<std::optional<std::string>>(
        "Get", key, [&](sw::redis::Redis& r) -> std::optional<std::string> {
            auto value = r.get(k);
            if (!value) {
                return std::nullopt;
            }
            return std::string(*value);
        });
}

Result<bool, Error> RedisBackend::Del(std::string_view key) {
    const std::string k(key);
    return impl_->Run<bool>("Del", key, [&](sw::redis::Redis& r) {
        return r.del(k) > 0;
    });
}

Result<bool, Error> RedisBackend::Expire(std::string_view key,
                                         std::chrono::seconds ttl) {
    const std::string k(key);
    return impl_->Run<bool>("Expire", key, [&](sw::redis::Redis& r) {
        return r.expire(k, ttl);
    });
}

Result<void, Error> RedisBackend::SAdd(std::string_view key,
                                       std::string_view member) {
    const std::string k(key);
    const std::string m(member);
    return impl_->Run<void>("SAdd", key, [&](sw::redis::Redis& r) {
        r.sadd(k, m);
    });
}

Result<bool, Error> RedisBackend::SRem(std::string_view key,
                                       std::string_view member) {
    const std::string k(key);
    const std::string m(member);
    return impl_->Run<bool>("SRem", key, [&](sw::redis::Redis& r) {
        return r.srem(k, m) > 0;
    });
}

Result<std::vector<std::string>, Error> RedisBackend::SMembers(std::string_view key) {
    const std::string k(key);
    return impl_->Run<std::vector<std::string>>(
        "SMembers", key, [&](sw::redis::Redis& r) {
            std::vector<std::string> members;
            r.smembers(k, std::back_inserter(members));
            return members;
        });
}

Result<std::vector<std::string>, Error> RedisBackend::KeysWithPrefix(
    std::string_view prefix) {
    const std::string pattern = EscapeGlob(prefix) + "*";
    return impl_->Run<std::vector<std::string>>(
        "Keys", prefix, [&](sw::redis::Redis& r) {
            std::vector<std::string> keys;
            r.keys(pattern, std::back_inserter(keys));
            return keys;
        });
}

Result<void, Error> RedisBackend::Ping() {
    return impl_->Run<void>("Ping", "", [](sw::redis::Redis& r) {
        r.ping();
    });
}

} // namespace mcp_gateway
