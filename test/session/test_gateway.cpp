#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/session/gateway.hpp>

#include "../../test/mocks/flaky_backend.hpp"
#include "../../test/mocks/manual_clock.hpp"
#include "../../test/mocks/mock_transport_factory.hpp"

#include <map>
#include <string>

using namespace mcp_gateway;
using mcp_gateway::testing::FlakyBackend;
using mcp_gateway::testing::ManualClock;
using mcp_gateway::testing::MockTransportFactory;
using std::chrono::seconds;

namespace {

using Headers = std::map<std::string, std::string>;

const std::string kId = "0123456789abcdef0123456789abcdef";
const std::string kOtherId = "fedcba9876543210fedcba9876543210";

struct Fixture {
    ManualClock clock;
    FlakyBackend backend{clock};
    SessionStore store{backend, clock};
    TenantSessionIndex index{store, backend};
    TransportRegistry registry{store};
    MockTransportFactory factory;
    RecoveryOrchestrator recovery{store, index, registry, factory, clock};
    IdentityResolver resolver;
    SessionGateway gateway{resolver, index, registry, recovery, factory};
};

Headers WithSession(const std::string& id) {
    return {{"mcp-session-id", id}, {"x-forwarded-for", "10.0.0.5"}};
}

} // anonymous namespace

TEST_CASE("SessionGateway: missing id is rejected for non-initialize", "[session][gateway]") {
    Fixture f;
    auto admitted = f.gateway.Admit({}, "tools/list");
    REQUIRE(admitted.IsErr());
    CHECK(admitted.Error().category == ErrorCategory::SessionNotFound);
    CHECK(JsonRpcErrorCode(admitted.Error()) == -32000);
    CHECK(f.factory.CreateCount() == 0);
}

TEST_CASE("SessionGateway: initialize without an id gets a generated one", "[session][gateway]") {
    Fixture f;
    auto admitted = f.gateway.Admit({}, "initialize");
    REQUIRE(admitted.IsOk());
    const auto& context = admitted.Value();
    CHECK(context.generated_id);
    CHECK(context.session_id.size() == 32);
    REQUIRE(context.transport);
    CHECK(context.transport->SessionId() == context.session_id);
    CHECK_FALSE(context.recovery.has_value());
    CHECK(f.registry.Resolve(context.session_id).Value().IsLive());
    CHECK(context.identity.user_type == UserType::Anonymous);
}

TEST_CASE("SessionGateway: malformed ids are rejected", "[session][gateway]") {
    Fixture f;
    auto admitted = f.gateway.Admit(WithSession("bad id!"), "initialize");
    REQUIRE(admitted.IsErr());
    CHECK(admitted.Error().category == ErrorCategory::SessionNotFound);
}

TEST_CASE("SessionGateway: header name is matched case-insensitively", "[session][gateway]") {
    CHECK(SessionGateway::PresentedSessionId({{"Mcp-Session-Id", kId}}) == kId);
    CHECK_FALSE(SessionGateway::PresentedSessionId({{"mcp-session-id", ""}}).has_value());
    CHECK_FALSE(SessionGateway::PresentedSessionId({{"other", kId}}).has_value());
}

TEST_CASE("SessionGateway: unknown transport on a request triggers recovery", "[session][gateway]") {
    Fixture f;
    auto admitted = f.gateway.Admit(WithSession(kId), "tools/call");
    REQUIRE(admitted.IsOk());
    CHECK(admitted.Value().session_id == kId);
    REQUIRE(admitted.Value().recovery.has_value());
    CHECK(*admitted.Value().recovery == RecoveryStage::Reattached);
    REQUIRE(admitted.Value().transport);

    auto again = f.gateway.Admit(WithSession(kId), "tools/call");
    REQUIRE(again.IsOk());
    CHECK_FALSE(again.Value().recovery.has_value());
    CHECK(again.Value().transport == admitted.Value().transport);
    CHECK(f.factory.CreateCount() == 1);
}

TEST_CASE("SessionGateway: a second id from the same caller reuses the recent session", "[session][gateway]") {
    Fixture f;
    auto first = f.gateway.Admit(WithSession(kId), "initialize");
    REQUIRE(first.IsOk());
    f.clock.Advance(seconds(30));

    auto second = f.gateway.Admit(WithSession(kOtherId), "initialize");
    REQUIRE(second.IsOk());
    CHECK(second.Value().session_id == kId);
    CHECK(second.Value().transport == first.Value().transport);
}

TEST_CASE("SessionGateway: different callers never share a session", "[session][gateway]") {
    Fixture f;
    auto alice = f.gateway.Admit(
        {{"mcp-session-id", kId}, {"authorization", "ApiKey alice-key"}}, "initialize");
    auto bob = f.gateway.Admit(
        {{"mcp-session-id", kId}, {"authorization", "ApiKey bob-key"}}, "initialize");
    REQUIRE(alice.IsOk());
    REQUIRE(bob.IsOk());
    CHECK(alice.Value().identity.user_id != bob.Value().identity.user_id);
    CHECK(alice.Value().session.identity_hash != bob.Value().session.identity_hash);
}

TEST_CASE("SessionGateway: exhausted recovery maps to its JSON-RPC code", "[session][gateway]") {
    Fixture f;
    f.factory.SetFailing(true);
    for (int i = 0; i < 3; ++i) {
        auto attempt = f.gateway.Admit(WithSession(kId), "tools/list");
        REQUIRE(attempt.IsErr());
        CHECK(JsonRpcErrorCode(attempt.Error()) == -32003);
    }
    auto rejected = f.gateway.Admit(WithSession(kId), "tools/list");
    REQUIRE(rejected.IsErr());
    CHECK(rejected.Error().category == ErrorCategory::RecoveryExhausted);
    CHECK(JsonRpcErrorCode(rejected.Error()) == -32001);
}

TEST_CASE("SessionGateway: backend outage maps to its JSON-RPC code", "[session][gateway]") {
    Fixture f;
    f.backend.SetUnreachable(true);
    auto admitted = f.gateway.Admit(WithSession(kId), "initialize");
    REQUIRE(admitted.IsErr());
    CHECK(admitted.Error().category == ErrorCategory::BackendUnavailable);
    CHECK(JsonRpcErrorCode(admitted.Error()) == -32002);
}

TEST_CASE("SessionGateway: Close deactivates and unbinds", "[session][gateway]") {
    Fixture f;
    auto admitted = f.gateway.Admit(WithSession(kId), "initialize");
    REQUIRE(admitted.IsOk());
    auto transport = admitted.Value().transport;

    auto closed = f.gateway.Close(WithSession(kId));
    REQUIRE(closed.IsOk());
    CHECK(closed.Value() == StoreStatus::Ok);
    CHECK_FALSE(transport->IsOpen());
    CHECK(f.registry.Resolve(kId).Value().state == TransportState::NeverRegistered);

    auto session = f.index.Get(kId, admitted.Value().identity).Value();
    REQUIRE(session.has_value());
    CHECK_FALSE(session->is_active);
}

TEST_CASE("SessionGateway: second close of a session leaves its sibling active", "[session][gateway]") {
    Fixture f;
    auto a = f.gateway.Admit(WithSession(kId), "initialize");
    REQUIRE(a.IsOk());
    f.clock.Advance(seconds(400));
    auto b = f.gateway.Admit(WithSession(kOtherId), "initialize");
    REQUIRE(b.IsOk());
    REQUIRE(b.Value().session_id == kOtherId);
    auto b_transport = b.Value().transport;

    REQUIRE(f.gateway.Close(WithSession(kId)).Value() == StoreStatus::Ok);
    auto again = f.gateway.Close(WithSession(kId));
    REQUIRE(again.IsOk());
    CHECK(again.Value() == StoreStatus::Absent);

    auto session_b = f.index.Get(kOtherId, b.Value().identity).Value();
    REQUIRE(session_b.has_value());
    CHECK(session_b->is_active);
    CHECK(b_transport->IsOpen());
    CHECK(f.registry.Resolve(kOtherId).Value().IsLive());
    CHECK(f.factory.CreateCount() == 2);
}

TEST_CASE("SessionGateway: closing an unknown id creates and recovers nothing", "[session][gateway]") {
    Fixture f;
    auto closed = f.gateway.Close(WithSession(kId));
    REQUIRE(closed.IsOk());
    CHECK(closed.Value() == StoreStatus::Absent);
    CHECK(f.factory.CreateCount() == 0);
    CHECK(f.recovery.Stats().attempts.empty());
    CHECK(f.backend.Inner().KeysWithPrefix("mcp_").Value().empty());
}

TEST_CASE("SessionGateway: Close without an id is rejected", "[session][gateway]") {
    Fixture f;
    auto closed = f.gateway.Close({});
    REQUIRE(closed.IsErr());
    CHECK(closed.Error().category == ErrorCategory::SessionNotFound);
}

TEST_CASE("JsonRpcErrorCode: other categories are internal errors", "[session][gateway]") {
    CHECK(JsonRpcErrorCode(Error{"x", "", "m", ErrorCategory::Internal}) == -32603);
    CHECK(JsonRpcErrorCode(Error{"x", "", "m", ErrorCategory::Config}) == -32603);
}
