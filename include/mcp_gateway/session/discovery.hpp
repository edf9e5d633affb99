#pragma once

#include <mcp_gateway/identity/identity_resolver.hpp>
#include <mcp_gateway/session/tenant_index.hpp>
#include <mcp_gateway/session/transport_registry.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// BoundedLruSet — set of strings that evicts the least recently seen entry
// once capacity is reached. Not thread-safe.
// ---------------------------------------------------------------------------
class BoundedLruSet {
public:
    explicit BoundedLruSet(std::size_t capacity);

    // True if present; marks the entry most recently used.
    bool Touch(const std::string& value);
    void Insert(const std::string& value);

    [[nodiscard]] std::size_t Size() const noexcept { return index_.size(); }
    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::list<std::string> order_;  // front = most recent
    std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

// What a single diagnostic line revealed.
struct DiscoveredSignals {
    std::optional<std::string> session_id;
    std::optional<std::string> authorization;  // "Bearer <tok>" or "ApiKey <tok>"
    std::optional<std::string> client_ip;
    std::optional<std::string> user_agent;
};

struct DiscoveryOptions {
    std::size_t capacity = 10000;
    std::string server_name = "LOG_TRACKED";
};

struct DiscoveryCounters {
    std::uint64_t lines_observed = 0;
    std::uint64_t sessions_tracked = 0;
    std::uint64_t duplicates_skipped = 0;
    std::uint64_t failures = 0;
    std::uint64_t dropped = 0;
    std::size_t remembered = 0;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// SessionDiscovery — best-effort session tracking from free-text log lines.
//
// Extracts a session id (and, when present, a credential, client IP and
// user agent), then goes through the same TenantSessionIndex::FindOrCreate
// and TransportRegistry::Bind as live requests. The existence record is
// bound only when the registry has never seen the id.
//
// Observe() never throws; failures are counted and logged at DEBUG.
// ---------------------------------------------------------------------------
class SessionDiscovery {
public:
    SessionDiscovery(const IdentityResolver& resolver, TenantSessionIndex& index,
                     TransportRegistry& registry, DiscoveryOptions options = {});

    [[nodiscard]] static DiscoveredSignals Extract(std::string_view line);

    void Observe(std::string_view line) noexcept;

    [[nodiscard]] DiscoveryCounters Counters() const;

    // Lines queued by a pump but never observed.
    void CountDropped() noexcept { ++dropped_; }

private:
    void Track(const std::string& session_id, const DiscoveredSignals& signals,
               std::string_view line);

    const IdentityResolver& resolver_;
    TenantSessionIndex& index_;
    TransportRegistry& registry_;
    DiscoveryOptions options_;

    BoundedLruSet processed_;
    mutable std::mutex processed_mutex_;

    std::atomic<std::uint64_t> lines_observed_{0};
    std::atomic<std::uint64_t> sessions_tracked_{0};
    std::atomic<std::uint64_t> duplicates_skipped_{0};
    std::atomic<std::uint64_t> failures_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

// ---------------------------------------------------------------------------
// DiscoveryPump — hands log lines to SessionDiscovery on a background
// thread.
//
// Offer() only enqueues, so it is safe to call from a log sink while the
// logger lock is held. When the queue is full the line is dropped. The
// worker thread suppresses the diagnostic tap so discovery's own log lines
// are not fed back.
// ---------------------------------------------------------------------------
class DiscoveryPump {
public:
    explicit DiscoveryPump(SessionDiscovery& discovery,
                           std::size_t queue_capacity = 1024);
    ~DiscoveryPump();

    DiscoveryPump(const DiscoveryPump&) = delete;
    DiscoveryPump& operator=(const DiscoveryPump&) = delete;

    void Offer(std::string_view line);

    // Processes queued lines, then joins the worker. Idempotent.
    void Stop();

    // Blocks until the queue is empty and the worker is idle.
    void Drain();

private:
    void Loop();

    SessionDiscovery& discovery_;
    std::size_t queue_capacity_;
    std::deque<std::string> queue_;
    bool stopping_ = false;
    bool busy_ = false;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::thread worker_;
};

} // namespace mcp_gateway
