#pragma once

#include <mcp_gateway/core/result.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// ITransport — a process-local channel that delivers responses for one
// session. Never serialized; only its existence is recorded in the store.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual std::string Kind() const = 0;
    [[nodiscard]] virtual const std::string& SessionId() const = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;

    // Deliver one JSON-RPC message to the remote client.
    [[nodiscard]] virtual Result<void, Error> Send(const nlohmann::json& message) = 0;

    virtual void Close() = 0;
};

// ---------------------------------------------------------------------------
// ITransportFactory — constructs transports for recovery and new sessions.
// Failures are reported as TransportConstructionFailed.
// ---------------------------------------------------------------------------
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    [[nodiscard]] virtual Result<std::shared_ptr<ITransport>, Error> Create(
        std::string_view session_id, std::string_view server_name) = 0;
};

// ---------------------------------------------------------------------------
// StreamTransport — writes one envelope line per message to a shared
// output stream:
//
//   {"headers":{"mcp-session-id":"<id>"},"message":{...}}
//
// All transports created by one factory share a write mutex so lines from
// concurrent workers never interleave.
// ---------------------------------------------------------------------------
class StreamTransport : public ITransport {
public:
    StreamTransport(std::string session_id, std::ostream& out,
                    std::shared_ptr<std::mutex> write_mutex);

    [[nodiscard]] std::string Kind() const override { return "stream"; }
    [[nodiscard]] const std::string& SessionId() const override {
        return session_id_;
    }
    [[nodiscard]] bool IsOpen() const override { return open_.load(); }

    [[nodiscard]] Result<void, Error> Send(const nlohmann::json& message) override;
    void Close() override;

private:
    std::string session_id_;
    std::ostream& out_;
    std::shared_ptr<std::mutex> write_mutex_;
    std::atomic<bool> open_{true};
};

class StreamTransportFactory : public ITransportFactory {
public:
    explicit StreamTransportFactory(std::ostream& out);

    [[nodiscard]] Result<std::shared_ptr<ITransport>, Error> Create(
        std::string_view session_id, std::string_view server_name) override;

    // Serializes writes that bypass a transport (parse errors and the like).
    void WriteRaw(const nlohmann::json& line);

private:
    std::ostream& out_;
    std::shared_ptr<std::mutex> write_mutex_;
};

} // namespace mcp_gateway
