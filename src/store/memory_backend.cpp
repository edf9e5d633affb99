#include <mcp_gateway/store/memory_backend.hpp>

namespace mcp_gateway {

namespace {

Error WrongType(const std::string& operation, std::string_view key) {
    return Error{operation, std::string(key),
                 "WRONGTYPE Operation against a key holding the wrong kind of value",
                 ErrorCategory::Internal};
}

} // anonymous namespace

MemoryBackend::MemoryBackend(const IClock& clock) : clock_(clock) {}

MemoryBackend::Entry* MemoryBackend::FindLive(std::string_view key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= clock_.Now()) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

Result<void, Error> MemoryBackend::SetEx(std::string_view key,
                                         std::chrono::seconds ttl,
                                         std::string_view value) {
    if (ttl.count() <= 0) {
        return Result<void, Error>::Err(Error{
            "SetEx", std::string(key), "invalid expire time in 'setex' command",
            ErrorCategory::Internal});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[std::string(key)] = Entry{std::string(value), clock_.Now() + ttl};
    return Result<void, Error>::Ok();
}

Result<std::optional<std::string>, Error> MemoryBackend::Get(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (!entry) {
        return Result<std::optional<std::string>, Error>::Ok(std::nullopt);
    }
    if (!std::holds_alternative<std::string>(entry->value)) {
        return Result<std::optional<std::string>, Error>::Err(WrongType("Get", key));
    }
    return Result<std::optional<std::string>, Error>::Ok(
        std::get<std::string>(entry->value));
}

Result<bool, Error> MemoryBackend::Del(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!FindLive(key)) {
        return Result<bool, Error>::Ok(false);
    }
    entries_.erase(entries_.find(key));
    return Result<bool, Error>::Ok(true);
}

Result<bool, Error> MemoryBackend::Expire(std::string_view key,
                                          std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (!entry) {
        return Result<bool, Error>::Ok(false);
    }
    if (ttl.count() <= 0) {
        // Redis deletes a key given a non-positive expiry.
        entries_.erase(entries_.find(key));
        return Result<bool, Error>::Ok(true);
    }
    entry->expires_at = clock_.Now() + ttl;
    return Result<bool, Error>::Ok(true);
}

Result<void, Error> MemoryBackend::SAdd(std::string_view key,
                                        std::string_view member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (!entry) {
        entries_[std::string(key)] =
            Entry{std::set<std::string>{std::string(member)}, std::nullopt};
        return Result<void, Error>::Ok();
    }
    auto* members = std::get_if<std::set<std::string>>(&entry->value);
    if (!members) {
        return Result<void, Error>::Err(WrongType("SAdd", key));
    }
    members->insert(std::string(member));
    return Result<void, Error>::Ok();
}

Result<bool, Error> MemoryBackend::SRem(std::string_view key,
                                        std::string_view member) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (!entry) {
        return Result<bool, Error>::Ok(false);
    }
    auto* members = std::get_if<std::set<std::string>>(&entry->value);
    if (!members) {
        return Result<bool, Error>::Err(WrongType("SRem", key));
    }
    const bool removed = members->erase(std::string(member)) > 0;
    if (members->empty()) {
        entries_.erase(entries_.find(key));
    }
    return Result<bool, Error>::Ok(removed);
}

Result<std::vector<std::string>, Error> MemoryBackend::SMembers(
    std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (!entry) {
        return Result<std::vector<std::string>, Error>::Ok({});
    }
    auto* members = std::get_if<std::set<std::string>>(&entry->value);
    if (!members) {
        return Result<std::vector<std::string>, Error>::Err(WrongType("SMembers", key));
    }
    return Result<std::vector<std::string>, Error>::Ok(
        std::vector<std::string>(members->begin(), members->end()));
}

Result<std::vector<std::string>, Error> MemoryBackend::KeysWithPrefix(
    std::string_view prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.Now();
    std::vector<std::string> keys;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (it->second.expires_at && *it->second.expires_at <= now) {
            it = entries_.erase(it);
            continue;
        }
        keys.push_back(it->first);
        ++it;
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(keys));
}

Result<void, Error> MemoryBackend::Ping() {
    return Result<void, Error>::Ok();
}

std::optional<std::chrono::seconds> MemoryBackend::Ttl(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLive(key);
    if (!entry || !entry->expires_at) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        *entry->expires_at - clock_.Now());
}

} // namespace mcp_gateway
