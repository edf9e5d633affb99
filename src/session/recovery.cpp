#include <mcp_gateway/session/recovery.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "recovery";

Result<RecoveryOutcome, Error> Fail(const Error& error) {
    return Result<RecoveryOutcome, Error>::Err(error);
}

} // anonymous namespace

std::string ToString(RecoveryStage stage) {
    switch (stage) {
        case RecoveryStage::Existing:   return "existing";
        case RecoveryStage::Reattached: return "reattached";
        case RecoveryStage::Rebuilt:    return "rebuilt";
    }
    return "existing";
}

nlohmann::json RecoveryStats::ToJson() const {
    nlohmann::json per_session = nlohmann::json::object();
    for (const auto& [id, attempt] : attempts) {
        per_session[id] = {
            {"count", attempt.count},
            {"last_attempt", FormatIso8601(attempt.last_attempt)},
        };
    }
    return {
        {"total_sessions_with_recovery_attempts", attempts.size()},
        {"recovery_attempts", per_session},
        {"max_recovery_attempts", max_attempts},
        {"recovery_timeout", cooldown.count()},
    };
}

RecoveryOrchestrator::RecoveryOrchestrator(SessionStore& store,
                                           TenantSessionIndex& index,
                                           TransportRegistry& registry,
                                           ITransportFactory& factory,
                                           const IClock& clock,
                                           RecoveryOptions options)
    : store_(store),
      index_(index),
      registry_(registry),
      factory_(factory),
      clock_(clock),
      options_(std::move(options)),
      last_cleanup_(clock.Now()) {}

// ---------------------------------------------------------------------------
// Admission gate
// ---------------------------------------------------------------------------
bool RecoveryOrchestrator::Admit(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.Now();

    auto& attempt = attempts_[session_id];
    const bool in_cooldown = attempt.count > 0 &&
                             now - attempt.last_attempt < options_.cooldown;
    if (in_cooldown && attempt.count >= options_.max_attempts) {
        return false;
    }
    if (!in_cooldown) {
        attempt.count = 0;
    }
    ++attempt.count;
    attempt.last_attempt = now;
    return true;
}

std::size_t RecoveryOrchestrator::CleanupOldAttempts() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = clock_.Now() - 2 * options_.cooldown;
    std::size_t removed = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        if (it->second.last_attempt < cutoff) {
            it = attempts_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    last_cleanup_ = clock_.Now();
    return removed;
}

RecoveryStats RecoveryOrchestrator::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RecoveryStats stats;
    stats.attempts = attempts_;
    stats.max_attempts = options_.max_attempts;
    stats.cooldown = options_.cooldown;
    return stats;
}

// ---------------------------------------------------------------------------
// Recover
// ---------------------------------------------------------------------------
Result<RecoveryOutcome, Error> RecoveryOrchestrator::Recover(
    std::string_view session_id, std::string_view identity_hash) {
    return Run(std::string(session_id), std::string(identity_hash), nullptr);
}

Result<RecoveryOutcome, Error> RecoveryOrchestrator::Recover(
    std::string_view session_id, const Identity& owner) {
    return Run(std::string(session_id), IdentityHash(owner), &owner);
}

Result<RecoveryOutcome, Error> RecoveryOrchestrator::Run(
    const std::string& id, const std::string& tenant, const Identity* owner) {

    bool cleanup_due = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_due = clock_.Now() - last_cleanup_ >= options_.cleanup_interval;
    }
    if (cleanup_due) {
        auto removed = CleanupOldAttempts();
        LogDebug(kComponent, "Dropped " + std::to_string(removed) +
                                 " idle recovery counters");
    }

    if (!Admit(id)) {
        LogError(kComponent, "Skipping recovery for session " + id +
                                 ": too many attempts");
        return Fail(Error{"Recover", id,
                          "Recovery attempts exhausted; start a new session",
                          ErrorCategory::RecoveryExhausted});
    }
    LogWarn(kComponent, "Attempting to recover session " + id);

    // Stage 1: the transport may have been bound by a concurrent request.
    auto lookup = registry_.Resolve(id);
    if (lookup.IsErr()) {
        return Fail(lookup.Error());
    }
    if (lookup.Value().IsLive()) {
        LogInfo(kComponent, "Session " + id + " already has a live transport");
        return Result<RecoveryOutcome, Error>::Ok(
            RecoveryOutcome{RecoveryStage::Existing, lookup.Value().handle});
    }
    if (lookup.Value().state == TransportState::KnownUnresolvable) {
        LogWarn(kComponent, "Transport for session " + id +
                                " exists in the store but cannot be recreated");
    }

    // Stage 2: reattach to an existing application session.
    auto session = store_.Get(id, tenant);
    if (session.IsErr()) {
        return Fail(session.Error());
    }
    if (session.Value() && session.Value()->is_active) {
        LogInfo(kComponent, "Found application session " + id +
                                ", creating new transport");
        return Attach(id, RecoveryStage::Reattached);
    }

    // Stage 3: full rebuild.
    return Rebuild(id, tenant, owner);
}

Result<RecoveryOutcome, Error> RecoveryOrchestrator::Attach(
    const std::string& session_id, RecoveryStage stage) {
    auto transport = factory_.Create(session_id, options_.server_name);
    if (transport.IsErr()) {
        auto error = transport.Error();
        error.category = ErrorCategory::TransportConstructionFailed;
        LogError(kComponent, "Failed to create transport for session " +
                                 session_id + ": " + error.message);
        return Fail(error);
    }

    auto handle = transport.Value();
    auto bound = registry_.Bind(session_id, handle, options_.server_name);
    if (bound.IsErr()) {
        handle->Close();
        LogError(kComponent, "Failed to bind transport for session " +
                                 session_id + ": " + bound.Error().message);
        return Fail(bound.Error());
    }

    LogInfo(kComponent, "Recovered session " + session_id + " (" +
                            ToString(stage) + ")");
    return Result<RecoveryOutcome, Error>::Ok(RecoveryOutcome{stage, handle});
}

Result<RecoveryOutcome, Error> RecoveryOrchestrator::Rebuild(
    const std::string& session_id, const std::string& identity_hash,
    const Identity* owner) {
    LogInfo(kComponent, "Creating new unified session for " + session_id);

    const auto client_id = "recovered_client_" + session_id.substr(0, 8);
    const nlohmann::json payload = {
        {"recovered", true},
        {"recovery_time", FormatIso8601(clock_.Now())},
    };

    auto created = owner ? store_.Create(session_id, client_id, payload, *owner)
                         : store_.Create(session_id, client_id, payload, identity_hash);
    if (created.IsErr()) {
        LogError(kComponent, "Failed to create application session for " +
                                 session_id + ": " + created.Error().message);
        return Fail(created.Error());
    }
    if (!identity_hash.empty()) {
        auto registered = index_.Register(identity_hash, session_id);
        if (registered.IsErr()) {
            return Fail(registered.Error());
        }
    }
    return Attach(session_id, RecoveryStage::Rebuilt);
}

} // namespace mcp_gateway
