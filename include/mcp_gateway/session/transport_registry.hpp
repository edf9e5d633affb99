#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/session/transport.hpp>
#include <mcp_gateway/store/session_store.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_gateway {

enum class TransportState {
    Live,               // local handle present
    KnownUnresolvable,  // existence record only; must be recreated
    NeverRegistered,    // no local handle, no existence record
};

std::string ToString(TransportState state);

// ---------------------------------------------------------------------------
// TransportLookup — result of TransportRegistry::Resolve.
//
// handle is set only when state == Live; record is set whenever the
// durable existence record was read.
// ---------------------------------------------------------------------------
struct TransportLookup {
    TransportState state = TransportState::NeverRegistered;
    std::shared_ptr<ITransport> handle;
    std::optional<TransportSession> record;

    [[nodiscard]] bool IsLive() const noexcept {
        return state == TransportState::Live;
    }
};

// ---------------------------------------------------------------------------
// TransportRegistry — which transport serves which session in this process.
//
// Two tiers:
//   - local map session_id -> handle (authoritative for liveness here)
//   - durable existence record in the SessionStore (visible to all
//     processes, survives restarts, cannot rebuild a transport)
//
// Bind writes the durable record before publishing the handle, so a failed
// write never leaves a handle registered locally.
// ---------------------------------------------------------------------------
class TransportRegistry {
public:
    explicit TransportRegistry(SessionStore& store);

    // handle may be null for an existence-only binding ("reference" kind).
    // Such a binding never displaces an open local handle.
    [[nodiscard]] Result<void, Error> Bind(std::string_view session_id,
                                           std::shared_ptr<ITransport> handle,
                                           std::string_view server_name);

    [[nodiscard]] Result<TransportLookup, Error> Resolve(std::string_view session_id);

    // Closes and drops the local handle and deletes the durable record.
    // Absent when neither existed.
    [[nodiscard]] Result<StoreStatus, Error> Unbind(std::string_view session_id);

    [[nodiscard]] Result<StoreStatus, Error> Touch(std::string_view session_id);

    [[nodiscard]] std::size_t LocalCount() const;

    // Session ids with a durable existence record.
    [[nodiscard]] Result<std::vector<std::string>, Error> List();

private:
    std::shared_ptr<ITransport> LocalHandle(const std::string& session_id);
    std::shared_ptr<ITransport> TakeLocal(const std::string& session_id);

    SessionStore& store_;
    std::map<std::string, std::shared_ptr<ITransport>> local_;
    mutable std::mutex mutex_;
};

} // namespace mcp_gateway
