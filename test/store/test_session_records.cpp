#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/store/session_records.hpp>

#include <chrono>

using namespace mcp_gateway;

namespace {

TimePoint At(long long epoch_ms) {
    return TimePoint(std::chrono::milliseconds(epoch_ms));
}

ApplicationSession MakeSession() {
    ApplicationSession session;
    session.session_id = "s1";
    session.identity_hash = "0123456789abcdef";
    session.client_id = "c1";
    session.created_at = At(1767225600000);
    session.last_accessed = At(1767225660500);
    session.payload = {{"a", 1}};
    Identity owner;
    owner.user_id = "alice";
    owner.user_type = UserType::AuthenticatedUser;
    owner.auth_method = AuthMethod::Jwt;
    owner.metadata["client_ip"] = "10.0.0.1";
    session.owner = owner;
    return session;
}

} // anonymous namespace

TEST_CASE("ApplicationSession: encoded record uses the stored field names", "[store][records]") {
    auto j = nlohmann::json::parse(EncodeApplicationSession(MakeSession()));
    CHECK(j["session_id"] == "s1");
    CHECK(j["identity_hash"] == "0123456789abcdef");
    CHECK(j["client_id"] == "c1");
    CHECK(j["created_at"] == "2026-01-01T00:00:00.000Z");
    CHECK(j["last_accessed"] == "2026-01-01T00:01:00.500Z");
    CHECK(j["data"] == nlohmann::json{{"a", 1}});
    CHECK(j["is_active"] == true);
    CHECK(j["user_context"]["user_id"] == "alice");
    CHECK(j["user_context"]["user_type"] == "authenticated_user");
    CHECK(j["user_context"]["authentication_method"] == "jwt");
}

TEST_CASE("ApplicationSession: decode restores every field", "[store][records]") {
    auto original = MakeSession();
    auto decoded = DecodeApplicationSession(EncodeApplicationSession(original));
    REQUIRE(decoded.has_value());
    CHECK(decoded->session_id == original.session_id);
    CHECK(decoded->identity_hash == original.identity_hash);
    CHECK(decoded->created_at == original.created_at);
    CHECK(decoded->last_accessed == original.last_accessed);
    CHECK(decoded->payload == original.payload);
    REQUIRE(decoded->owner.has_value());
    CHECK(*decoded->owner == *original.owner);
}

TEST_CASE("ApplicationSession: malformed records decode to nullopt", "[store][records]") {
    CHECK_FALSE(DecodeApplicationSession("not json").has_value());
    CHECK_FALSE(DecodeApplicationSession("[1,2]").has_value());
    CHECK_FALSE(DecodeApplicationSession(R"({"session_id":"s1"})").has_value());
    CHECK_FALSE(DecodeApplicationSession(
        R"({"session_id":"s1","client_id":"c","created_at":"yesterday",)"
        R"("last_accessed":"2026-01-01T00:00:00Z"})").has_value());
}

TEST_CASE("ApplicationSession: missing optional fields take defaults", "[store][records]") {
    auto decoded = DecodeApplicationSession(
        R"({"session_id":"s1","client_id":"c","created_at":"2026-01-01T00:00:00Z",)"
        R"("last_accessed":"2026-01-01T00:00:00Z","data":"oops"})");
    REQUIRE(decoded.has_value());
    CHECK(decoded->identity_hash.empty());
    CHECK(decoded->payload == nlohmann::json::object());
    CHECK(decoded->is_active);
    CHECK_FALSE(decoded->owner.has_value());
}

TEST_CASE("IdentityFromJson: rejects unknown enum names", "[store][records]") {
    nlohmann::json j = {{"user_id", "u"},
                        {"user_type", "robot"},
                        {"authentication_method", "jwt"}};
    CHECK_FALSE(IdentityFromJson(j).has_value());
}

TEST_CASE("TransportSession: encode and decode", "[store][records]") {
    TransportSession record;
    record.session_id = "s1";
    record.transport_kind = std::string(kReferenceTransportKind);
    record.server_name = "LOG_TRACKED";
    record.created_at = At(1767225600000);
    record.last_accessed = At(1767225600000);

    auto j = nlohmann::json::parse(EncodeTransportSession(record));
    CHECK(j["transport_type"] == "reference");
    CHECK(j["server_name"] == "LOG_TRACKED");

    auto decoded = DecodeTransportSession(j.dump());
    REQUIRE(decoded.has_value());
    CHECK(decoded->session_id == "s1");
    CHECK(decoded->transport_kind == "reference");
    CHECK(decoded->is_active);
    CHECK_FALSE(DecodeTransportSession("{}").has_value());
}
