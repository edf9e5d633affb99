#pragma once

#include <mcp_gateway/mcp/tool_registry.hpp>
#include <mcp_gateway/session/gateway.hpp>
#include <mcp_gateway/session/transport.hpp>

#include <condition_variable>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

struct McpServerOptions {
    std::string name = "mcp-gateway";
    int workers = 4;
};

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over line-delimited stdin/stdout.
//
// Each input line is a session envelope
//
//   {"headers":{"mcp-session-id":"...","authorization":"..."},
//    "message":{"jsonrpc":"2.0","id":1,"method":"tools/call",...}}
//
// or a bare JSON-RPC message (no headers). An envelope with "close": true
// and no message ends the session named in its headers.
//
// Requests are admitted through the SessionGateway and answered on the
// session's transport, which echoes the effective session id. Admission
// failures become JSON-RPC errors. Requests run on a fixed worker pool.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - tools/list
//   - tools/call
//   - notifications/* (notification, no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry, SessionGateway& gateway,
              StreamTransportFactory& output, McpServerOptions options = {},
              std::istream& in = std::cin);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop. Blocks until EOF on the input, then waits for
    // in-flight requests.
    void Run();

    // Admit and answer one input line on the calling thread.
    void HandleLine(const std::string& line);

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications. No session handling.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) const;

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id) const;
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;
    void HandleClose(const std::map<std::string, std::string>& headers);
    void WriteEnvelope(const std::map<std::string, std::string>& headers,
                       const nlohmann::json& message);

    void StartWorkers();
    void StopWorkers();
    void WorkerLoop();

    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    SessionGateway& gateway_;
    StreamTransportFactory& output_;
    McpServerOptions options_;
    std::istream& in_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace mcp_gateway
