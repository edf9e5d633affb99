#include <mcp_gateway/identity/identity.hpp>

#include <mcp_gateway/core/digest.hpp>

namespace mcp_gateway {

std::string ToString(UserType type) {
    switch (type) {
        case UserType::Individual:        return "individual";
        case UserType::Organization:      return "organization";
        case UserType::ServiceAccount:    return "service_account";
        case UserType::Anonymous:         return "anonymous";
        case UserType::AuthenticatedUser: return "authenticated_user";
    }
    return "anonymous";
}

std::string ToString(AuthMethod method) {
    switch (method) {
        case AuthMethod::Jwt:       return "jwt";
        case AuthMethod::ApiKey:    return "api_key";
        case AuthMethod::Anonymous: return "anonymous";
    }
    return "anonymous";
}

std::optional<UserType> ParseUserType(std::string_view name) {
    if (name == "individual") return UserType::Individual;
    if (name == "organization") return UserType::Organization;
    if (name == "service_account") return UserType::ServiceAccount;
    if (name == "anonymous") return UserType::Anonymous;
    if (name == "authenticated_user") return UserType::AuthenticatedUser;
    return std::nullopt;
}

std::optional<AuthMethod> ParseAuthMethod(std::string_view name) {
    if (name == "jwt") return AuthMethod::Jwt;
    if (name == "api_key") return AuthMethod::ApiKey;
    if (name == "anonymous") return AuthMethod::Anonymous;
    return std::nullopt;
}

std::string IdentityHash(const Identity& identity) {
    const auto material = identity.user_id + ":" + ToString(identity.user_type) +
                          ":" + ToString(identity.auth_method);
    return Sha256Hex(material).substr(0, kIdentityHashLength);
}

} // namespace mcp_gateway
