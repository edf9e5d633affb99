#include <mcp_gateway/mcp/mcp_server.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/version.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "mcp";

// Lines the reader may queue ahead of the workers before it blocks.
constexpr std::size_t kMaxQueuedLines = 256;

std::map<std::string, std::string> ReadHeaders(const nlohmann::json& envelope) {
    std::map<std::string, std::string> headers;
    auto it = envelope.find("headers");
    if (it == envelope.end() || !it->is_object()) {
        return headers;
    }
    for (const auto& [name, value] : it->items()) {
        if (value.is_string()) {
            headers[name] = value.get<std::string>();
        }
    }
    return headers;
}

bool IsEnvelope(const nlohmann::json& parsed) {
    return parsed.is_object() &&
           (parsed.contains("headers") || parsed.contains("message") ||
            parsed.contains("close"));
}

std::map<std::string, std::string> SessionHeader(const std::string& session_id) {
    return {{std::string(kSessionIdHeader), session_id}};
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry, SessionGateway& gateway,
                     StreamTransportFactory& output, McpServerOptions options,
                     std::istream& in)
    : registry_(std::move(registry)),
      gateway_(gateway),
      output_(output),
      options_(std::move(options)),
      in_(in) {}

McpServer::~McpServer() {
    StopWorkers();
}

// ---------------------------------------------------------------------------
// Run loop and worker pool
// ---------------------------------------------------------------------------
void McpServer::Run() {
    StartWorkers();
    LogInfo(kComponent, "Serving " + options_.name + " on stdio with " +
                            std::to_string(options_.workers) + " workers");

    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) continue;

        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this] { return queue_.size() < kMaxQueuedLines; });
        queue_.push_back(std::move(line));
        lock.unlock();
        queue_cv_.notify_all();
    }

    LogInfo(kComponent, "Input closed, draining in-flight requests");
    StopWorkers();
}

void McpServer::StartWorkers() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = false;
    const int count = std::max(1, options_.workers);
    for (int i = 0; i < count; ++i) {
        workers_.emplace_back(&McpServer::WorkerLoop, this);
    }
}

void McpServer::StopWorkers() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void McpServer::WorkerLoop() {
    for (;;) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;  // stopping and drained
            }
            line = std::move(queue_.front());
            queue_.pop_front();
        }
        queue_cv_.notify_all();

        try {
            HandleLine(line);
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("Request failed: ") + e.what());
            WriteEnvelope({}, MakeError(nullptr, -32603, "Internal error"));
        }
    }
}

// ---------------------------------------------------------------------------
// Line handling
// ---------------------------------------------------------------------------
void McpServer::HandleLine(const std::string& line) {
    auto parsed = nlohmann::json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        WriteEnvelope({}, MakeError(nullptr, -32700, "Parse error"));
        return;
    }

    std::map<std::string, std::string> headers;
    nlohmann::json message = parsed;
    if (IsEnvelope(parsed)) {
        headers = ReadHeaders(parsed);
        const bool close = parsed.contains("close") && parsed["close"].is_boolean() &&
                           parsed["close"].get<bool>();
        if (close && !parsed.contains("message")) {
            HandleClose(headers);
            return;
        }
        message = parsed.value("message", nlohmann::json());
    }

    // Malformed and notification messages never reach the gateway.
    const bool is_request = message.is_object() && message.contains("id") &&
                            message.contains("jsonrpc") && message["jsonrpc"] == "2.0" &&
                            message.contains("method") && message["method"].is_string();
    if (!is_request) {
        auto response = HandleMessage(message);
        if (response) {
            WriteEnvelope(headers, *response);
        }
        return;
    }

    const auto id = message["id"];
    const auto method = message["method"].get<std::string>();

    auto admitted = gateway_.Admit(headers, method);
    if (admitted.IsErr()) {
        const auto& error = admitted.Error();
        LogWarn(kComponent, "Rejected " + method + ": " + error.ToString());
        auto presented = SessionGateway::PresentedSessionId(headers);
        WriteEnvelope(presented ? SessionHeader(*presented)
                                : std::map<std::string, std::string>{},
                      MakeError(id, JsonRpcErrorCode(error), error.message));
        return;
    }

    const auto& context = admitted.Value();
    auto response = HandleMessage(message);
    if (!response) {
        return;
    }

    auto sent = context.transport->Send(*response);
    if (sent.IsErr()) {
        LogWarn(kComponent, "Transport for " + context.session_id +
                                " rejected response: " + sent.Error().ToString());
        WriteEnvelope(SessionHeader(context.session_id), *response);
    }
}

void McpServer::HandleClose(const std::map<std::string, std::string>& headers) {
    auto presented = SessionGateway::PresentedSessionId(headers);
    const auto reply_headers = presented ? SessionHeader(*presented)
                                         : std::map<std::string, std::string>{};

    auto closed = gateway_.Close(headers);
    if (closed.IsErr()) {
        LogWarn(kComponent, "Cannot close session: " + closed.Error().ToString());
        WriteEnvelope(reply_headers, MakeError(nullptr, JsonRpcErrorCode(closed.Error()),
                                               closed.Error().message));
        return;
    }
    if (closed.Value() == StoreStatus::Absent) {
        WriteEnvelope(reply_headers, MakeError(nullptr, -32000, "Session not found"));
        return;
    }
    output_.WriteRaw({{"headers", reply_headers}, {"closed", true}});
}

void McpServer::WriteEnvelope(const std::map<std::string, std::string>& headers,
                              const nlohmann::json& message) {
    output_.WriteRaw({{"headers", headers}, {"message", message}});
}

// ---------------------------------------------------------------------------
// JSON-RPC dispatch
// ---------------------------------------------------------------------------
std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) const {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    if (!message.contains("id")) {
        LogDebug(kComponent, "Notification " + message.value("method", std::string()));
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, -32600, "Missing 'method'");
    }
    const auto method = message["method"].get<std::string>();
    auto params = message.value("params", nlohmann::json::object());

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    }
    return MakeError(id, -32601, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) const {
    nlohmann::json result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", options_.name},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, -32602, "Unknown tool: " + tool_name);
    }

    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.IsError()) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, int code,
                                    const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace mcp_gateway
