#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

enum class UserType {
    Individual,
    Organization,
    ServiceAccount,
    Anonymous,
    AuthenticatedUser,
};

enum class AuthMethod {
    Jwt,
    ApiKey,
    Anonymous,
};

// Wire names: "individual", "organization", "service_account", "anonymous",
// "authenticated_user" / "jwt", "api_key", "anonymous".
std::string ToString(UserType type);
std::string ToString(AuthMethod method);
std::optional<UserType> ParseUserType(std::string_view name);
std::optional<AuthMethod> ParseAuthMethod(std::string_view name);

// ---------------------------------------------------------------------------
// Identity — the resolved caller behind a request.
//
// Never persisted standalone; sessions carry its hash as the partition key
// plus a denormalized copy for statistics.
// ---------------------------------------------------------------------------
struct Identity {
    std::string user_id;
    UserType user_type = UserType::Anonymous;
    std::map<std::string, std::string> metadata;
    AuthMethod auth_method = AuthMethod::Anonymous;

    bool operator==(const Identity& other) const {
        return user_id == other.user_id && user_type == other.user_type &&
               metadata == other.metadata && auth_method == other.auth_method;
    }
    bool operator!=(const Identity& other) const { return !(*this == other); }
};

// Number of hex characters kept from the SHA-256 digest.
constexpr std::size_t kIdentityHashLength = 16;

// Partition key: first 16 hex chars of
// SHA-256("<user_id>:<user_type>:<auth_method>"). Metadata does not
// participate, so the same caller maps to the same partition in every process.
std::string IdentityHash(const Identity& identity);

} // namespace mcp_gateway
