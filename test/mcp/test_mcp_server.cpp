#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/core/version.hpp>
#include <mcp_gateway/mcp/mcp_server.hpp>
#include <mcp_gateway/store/memory_backend.hpp>

#include "../../test/mocks/manual_clock.hpp"

#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace mcp_gateway;

namespace {

const std::string kId = "0123456789abcdef0123456789abcdef";

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& params) -> ToolResult {
            return {nlohmann::json::array({
                {{"type", "text"}, {"text", params.value("message", "")}}
            }), std::nullopt};
        });
    registry.Register("fail", "Always fails", nlohmann::json::object(),
        [](const nlohmann::json&) -> ToolResult {
            return {nlohmann::json::array({{{"type", "text"}, {"text", "nope"}}}),
                    ToolErrorKind::Upstream};
        });
    return registry;
}

// The session subsystem on an in-process backend, answering into `out`.
struct Stack {
    testing::ManualClock clock;
    MemoryBackend backend{clock};
    SessionStore store{backend, clock};
    TenantSessionIndex index{store, backend};
    TransportRegistry registry{store};
    std::ostringstream out;
    StreamTransportFactory factory{out};
    RecoveryOrchestrator recovery{store, index, registry, factory, clock};
    IdentityResolver resolver;
    SessionGateway gateway{resolver, index, registry, recovery, factory};

    std::vector<nlohmann::json> Lines() const {
        std::vector<nlohmann::json> lines;
        std::istringstream in(out.str());
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(nlohmann::json::parse(line));
        }
        return lines;
    }
};

nlohmann::json Request(int id, const std::string& method,
                       const nlohmann::json& params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

std::string Envelope(const nlohmann::json& headers, const nlohmann::json& message) {
    return nlohmann::json{{"headers", headers}, {"message", message}}.dump();
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "mcp-gateway");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["capabilities"].contains("tools"));
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
}

TEST_CASE("McpServer: tools/call executes tool", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    auto response = server.HandleMessage(
        Request(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["content"][0]["text"] == "hi");
    CHECK_FALSE((*response)["result"].contains("isError"));
}

TEST_CASE("McpServer: tool failures are results with isError", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "fail"}}));
    REQUIRE(response.has_value());
    CHECK_FALSE(response->contains("error"));
    CHECK((*response)["result"]["isError"] == true);
    CHECK((*response)["result"]["content"][0]["text"] == "nope");
}

TEST_CASE("McpServer: tools/call parameter errors", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    auto missing = server.HandleMessage(Request(5, "tools/call"));
    CHECK((*missing)["error"]["code"] == -32602);
    CHECK((*missing)["error"]["message"] == "Missing 'name' parameter");

    auto unknown = server.HandleMessage(Request(6, "tools/call", {{"name", "nope"}}));
    CHECK((*unknown)["error"]["code"] == -32602);
    CHECK((*unknown)["error"]["message"] == "Unknown tool: nope");
}

TEST_CASE("McpServer: protocol errors", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    auto unknown = server.HandleMessage(Request(7, "resources/list"));
    CHECK((*unknown)["error"]["code"] == -32601);
    CHECK((*unknown)["error"]["message"] == "Method not found: resources/list");

    auto version = server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 8}, {"method", "ping"}});
    CHECK((*version)["error"]["code"] == -32600);

    auto not_object = server.HandleMessage(nlohmann::json::array());
    CHECK((*not_object)["error"]["code"] == -32600);

    auto no_method = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 9}});
    CHECK((*no_method)["error"]["message"] == "Missing 'method'");
}

TEST_CASE("McpServer: notifications and ping", "[mcp][server]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);

    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());

    auto pong = server.HandleMessage(Request(10, "ping"));
    REQUIRE(pong.has_value());
    CHECK((*pong)["result"] == nlohmann::json::object());
}

// ===========================================================================
// HandleLine — session admission
// ===========================================================================

TEST_CASE("McpServer: parse errors are answered without a session", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine("{not json");

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["headers"] == nlohmann::json::object());
    CHECK(lines[0]["message"]["error"]["code"] == -32700);
}

TEST_CASE("McpServer: initialize without a session id gets one", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(Request(1, "initialize").dump());

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 1);
    const auto id = lines[0]["headers"]["mcp-session-id"].get<std::string>();
    CHECK(id.size() == 32);
    CHECK(lines[0]["message"]["result"]["protocolVersion"] == "2024-11-05");
    CHECK(stack.registry.Resolve(id).Value().IsLive());
}

TEST_CASE("McpServer: requests without a session id are rejected", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(Request(2, "tools/list").dump());

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["message"]["id"] == 2);
    CHECK(lines[0]["message"]["error"]["code"] == -32000);
}

TEST_CASE("McpServer: unknown session on a request is recovered", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(Envelope({{"mcp-session-id", kId}},
                               Request(3, "tools/call", {{"name", "echo"},
                                                         {"arguments", {{"message", "back"}}}})));

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["headers"]["mcp-session-id"] == kId);
    CHECK(lines[0]["message"]["result"]["content"][0]["text"] == "back");
    CHECK(stack.recovery.Stats().attempts.count(kId) == 1);
}

TEST_CASE("McpServer: a second id from the same caller answers on the reused session", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(Envelope({{"mcp-session-id", kId}}, Request(1, "initialize")));
    server.HandleLine(Envelope({{"mcp-session-id", "fedcba9876543210fedcba9876543210"}},
                               Request(2, "tools/list")));

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[1]["headers"]["mcp-session-id"] == kId);
    CHECK(lines[1]["message"]["id"] == 2);
}

TEST_CASE("McpServer: notifications inside an envelope produce no output", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(Envelope({{"mcp-session-id", kId}},
                               {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));
    CHECK(stack.out.str().empty());
}

TEST_CASE("McpServer: close envelope ends the session", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(Envelope({{"mcp-session-id", kId}}, Request(1, "initialize")));
    server.HandleLine(nlohmann::json{{"headers", {{"mcp-session-id", kId}}},
                                     {"close", true}}.dump());

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[1]["headers"]["mcp-session-id"] == kId);
    CHECK(lines[1]["closed"] == true);
    CHECK(stack.registry.Resolve(kId).Value().state == TransportState::NeverRegistered);
}

TEST_CASE("McpServer: closing an already closed session is an error", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    const auto close = nlohmann::json{{"headers", {{"mcp-session-id", kId}}},
                                      {"close", true}}.dump();
    server.HandleLine(Envelope({{"mcp-session-id", kId}}, Request(1, "initialize")));
    server.HandleLine(close);
    server.HandleLine(close);

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 3);
    CHECK(lines[1]["closed"] == true);
    CHECK_FALSE(lines[2].contains("closed"));
    CHECK(lines[2]["headers"]["mcp-session-id"] == kId);
    CHECK(lines[2]["message"]["error"]["code"] == -32000);
    CHECK(stack.registry.LocalCount() == 0);
}

TEST_CASE("McpServer: close without a session id is an error", "[mcp][server][session]") {
    Stack stack;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory);
    server.HandleLine(nlohmann::json{{"headers", nlohmann::json::object()},
                                     {"close", true}}.dump());

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["message"]["error"]["code"] == -32000);
    CHECK(lines[0]["message"]["id"].is_null());
}

// ===========================================================================
// Run
// ===========================================================================

TEST_CASE("McpServer: Run answers every line before returning", "[mcp][server][run]") {
    Stack stack;
    std::ostringstream script;
    script << Envelope({{"mcp-session-id", kId}}, Request(1, "initialize")) << "\n"
           << "\n"
           << Envelope({{"mcp-session-id", kId}}, Request(2, "tools/list")) << "\n"
           << Envelope({{"mcp-session-id", kId}}, Request(3, "ping")) << "\n"
           << "garbage\n";
    std::istringstream in(script.str());

    McpServerOptions options;
    options.workers = 3;
    McpServer server(MakeTestRegistry(), stack.gateway, stack.factory, options, in);
    server.Run();

    auto lines = stack.Lines();
    REQUIRE(lines.size() == 4);
    std::set<int> ids;
    int parse_errors = 0;
    for (const auto& line : lines) {
        const auto& message = line["message"];
        if (message["id"].is_number()) {
            ids.insert(message["id"].get<int>());
        } else if (message["error"]["code"] == -32700) {
            ++parse_errors;
        }
    }
    CHECK(ids == std::set<int>{1, 2, 3});
    CHECK(parse_errors == 1);
}
