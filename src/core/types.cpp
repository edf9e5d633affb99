#include <mcp_gateway/core/types.hpp>

#include <mcp_gateway/core/digest.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_gateway {

namespace {

bool IsSessionIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
           c == '_' || c == '.';
}

bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// SessionId
// ---------------------------------------------------------------------------
Result<SessionId, std::string> SessionId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<SessionId, std::string>::Err("Session id must not be empty");
    }
    if (id.size() > 128) {
        return Result<SessionId, std::string>::Err(
            "Session id must be at most 128 characters, got " +
            std::to_string(id.size()));
    }
    if (!std::all_of(id.begin(), id.end(), IsSessionIdChar)) {
        return Result<SessionId, std::string>::Err(
            "Session id must contain only letters, digits, '-', '_' and '.'");
    }
    return Result<SessionId, std::string>::Ok(SessionId(std::string(id)));
}

SessionId SessionId::Generate() {
    return SessionId(RandomHex(16));
}

// ---------------------------------------------------------------------------
// BackendUrl
// ---------------------------------------------------------------------------
Result<BackendUrl, std::string> BackendUrl::Create(std::string_view url) {
    if (url.empty()) {
        return Result<BackendUrl, std::string>::Err("Backend URL must not be empty");
    }
    if (StartsWith(url, "memory://")) {
        return Result<BackendUrl, std::string>::Ok(
            BackendUrl(std::string(url), Kind::Memory));
    }

    std::string_view rest;
    if (StartsWith(url, "redis://")) {
        rest = url.substr(8);
    } else if (StartsWith(url, "rediss://")) {
        rest = url.substr(9);
    } else {
        return Result<BackendUrl, std::string>::Err(
            "Backend URL must start with redis://, rediss:// or memory://");
    }

    auto at = rest.rfind('@');
    auto host_part = at == std::string_view::npos ? rest : rest.substr(at + 1);
    auto slash = host_part.find('/');
    auto host_port = host_part.substr(0, slash);
    auto colon = host_port.rfind(':');
    auto host = host_port.substr(0, colon);
    if (host.empty()) {
        return Result<BackendUrl, std::string>::Err("Backend URL has no host");
    }
    if (colon != std::string_view::npos) {
        auto port = host_port.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return Result<BackendUrl, std::string>::Err(
                "Backend URL has an invalid port");
        }
    }
    return Result<BackendUrl, std::string>::Ok(
        BackendUrl(std::string(url), Kind::Redis));
}

} // namespace mcp_gateway
