#include <mcp_gateway/session/discovery.hpp>

#include <mcp_gateway/core/log.hpp>

#include <regex>
#include <vector>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "discovery";
constexpr std::size_t kLogExcerptLength = 200;

const std::vector<std::regex>& SessionIdPatterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(session_id=([a-f0-9]{32}))"),
        std::regex(R"(session_id=([a-f0-9-]{36}))"),
        std::regex(R"re("session_id":\s*"([a-f0-9]{32})")re"),
        std::regex(R"re("session_id":\s*"([a-f0-9-]{36})")re"),
        std::regex(R"(session_id:\s*([a-f0-9]{32}))"),
        std::regex(R"(Session-ID:\s*([a-f0-9]{32}))"),
        std::regex(R"(mcp-session-id:\s*([a-f0-9]{32}))"),
    };
    return patterns;
}

struct TokenPattern {
    std::regex pattern;
    const char* scheme;
};

const std::vector<TokenPattern>& TokenPatterns() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<TokenPattern> patterns = {
        {std::regex(R"(authorization:\s*bearer\s+([a-zA-Z0-9._-]+))", flags), "Bearer"},
        {std::regex(R"re("authorization":\s*"bearer\s+([a-zA-Z0-9._-]+)")re", flags), "Bearer"},
        {std::regex(R"(apikey\s+([a-zA-Z0-9._-]+))", flags), "ApiKey"},
    };
    return patterns;
}

const std::regex& Ipv4Pattern() {
    static const std::regex pattern(R"((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))");
    return pattern;
}

const std::regex& UserAgentPattern() {
    static const std::regex pattern(R"(user-agent['"]:\s*['"]([^'"]+)['"])",
                                    std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::optional<std::string> FirstGroup(const std::string& text, const std::regex& re) {
    std::smatch match;
    if (std::regex_search(text, match, re)) {
        return match[1].str();
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BoundedLruSet
// ---------------------------------------------------------------------------
BoundedLruSet::BoundedLruSet(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool BoundedLruSet::Touch(const std::string& value) {
    auto it = index_.find(value);
    if (it == index_.end()) {
        return false;
    }
    order_.splice(order_.begin(), order_, it->second);
    return true;
}

void BoundedLruSet::Insert(const std::string& value) {
    if (Touch(value)) {
        return;
    }
    order_.push_front(value);
    index_[value] = order_.begin();
    if (index_.size() > capacity_) {
        index_.erase(order_.back());
        order_.pop_back();
    }
}

// ---------------------------------------------------------------------------
// DiscoveryCounters
// ---------------------------------------------------------------------------
nlohmann::json DiscoveryCounters::ToJson() const {
    return {
        {"lines_observed", lines_observed},
        {"sessions_tracked", sessions_tracked},
        {"duplicates_skipped", duplicates_skipped},
        {"failures", failures},
        {"dropped", dropped},
        {"remembered", remembered},
    };
}

// ---------------------------------------------------------------------------
// SessionDiscovery
// ---------------------------------------------------------------------------
SessionDiscovery::SessionDiscovery(const IdentityResolver& resolver,
                                   TenantSessionIndex& index,
                                   TransportRegistry& registry,
                                   DiscoveryOptions options)
    : resolver_(resolver),
      index_(index),
      registry_(registry),
      options_(std::move(options)),
      processed_(options_.capacity) {}

DiscoveredSignals SessionDiscovery::Extract(std::string_view line) {
    const std::string text(line);
    DiscoveredSignals signals;

    for (const auto& pattern : SessionIdPatterns()) {
        if (auto id = FirstGroup(text, pattern)) {
            signals.session_id = std::move(id);
            break;
        }
    }
    for (const auto& token : TokenPatterns()) {
        if (auto value = FirstGroup(text, token.pattern)) {
            signals.authorization = std::string(token.scheme) + " " + *value;
            break;
        }
    }
    signals.client_ip = FirstGroup(text, Ipv4Pattern());
    signals.user_agent = FirstGroup(text, UserAgentPattern());
    return signals;
}

void SessionDiscovery::Observe(std::string_view line) noexcept {
    ++lines_observed_;
    try {
        auto signals = Extract(line);
        if (!signals.session_id) {
            return;
        }
        const auto& id = *signals.session_id;
        {
            std::lock_guard<std::mutex> lock(processed_mutex_);
            if (processed_.Touch(id)) {
                ++duplicates_skipped_;
                return;
            }
        }
        Track(id, signals, line);
    } catch (const std::exception& e) {
        ++failures_;
        LogDebug(kComponent, std::string("Session tracking error: ") + e.what());
    }
}

void SessionDiscovery::Track(const std::string& session_id,
                             const DiscoveredSignals& signals,
                             std::string_view line) {
    RequestMetadata request;
    request.authorization = signals.authorization;
    request.client_ip = signals.client_ip;
    request.user_agent = signals.user_agent;
    const auto identity = resolver_.Resolve(request);

    const nlohmann::json payload = {
        {"source", "log_tracker"},
        {"detected_from", "diagnostic_log"},
        {"log_message", std::string(line.substr(0, kLogExcerptLength))},
        {"original_session_id", session_id},
    };

    auto session = index_.FindOrCreate(session_id, identity, payload);
    if (session.IsErr()) {
        ++failures_;
        LogDebug(kComponent, "Could not track session " + session_id + ": " +
                                 session.Error().ToString());
        return;
    }

    auto lookup = registry_.Resolve(session_id);
    if (lookup.IsErr()) {
        ++failures_;
        LogDebug(kComponent, "Could not resolve transport for " + session_id +
                                 ": " + lookup.Error().ToString());
        return;
    }
    if (lookup.Value().state == TransportState::NeverRegistered) {
        auto bound = registry_.Bind(session_id, nullptr, options_.server_name);
        if (bound.IsErr()) {
            ++failures_;
            LogDebug(kComponent, "Could not record transport reference for " +
                                     session_id + ": " + bound.Error().ToString());
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(processed_mutex_);
        processed_.Insert(session_id);
    }
    ++sessions_tracked_;
    LogDebug(kComponent, "Tracked " + session_id + " for user " + identity.user_id);
}

DiscoveryCounters SessionDiscovery::Counters() const {
    DiscoveryCounters counters;
    counters.lines_observed = lines_observed_.load();
    counters.sessions_tracked = sessions_tracked_.load();
    counters.duplicates_skipped = duplicates_skipped_.load();
    counters.failures = failures_.load();
    counters.dropped = dropped_.load();
    std::lock_guard<std::mutex> lock(processed_mutex_);
    counters.remembered = processed_.Size();
    return counters;
}

// ---------------------------------------------------------------------------
// DiscoveryPump
// ---------------------------------------------------------------------------
DiscoveryPump::DiscoveryPump(SessionDiscovery& discovery,
                             std::size_t queue_capacity)
    : discovery_(discovery),
      queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity),
      worker_([this] { Loop(); }) {}

DiscoveryPump::~DiscoveryPump() {
    Stop();
}

void DiscoveryPump::Offer(std::string_view line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (queue_.size() >= queue_capacity_) {
            discovery_.CountDropped();
            return;
        }
        queue_.emplace_back(line);
    }
    wake_.notify_one();
}

void DiscoveryPump::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DiscoveryPump::Drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void DiscoveryPump::Loop() {
    ScopedTapSuppression suppress;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ and nothing left to do.
            break;
        }
        auto line = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        discovery_.Observe(line);

        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            idle_.notify_all();
        }
    }
    idle_.notify_all();
}

} // namespace mcp_gateway
