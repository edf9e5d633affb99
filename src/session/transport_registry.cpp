#include <mcp_gateway/session/transport_registry.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "transport";

} // anonymous namespace

std::string ToString(TransportState state) {
    switch (state) {
        case TransportState::Live:              return "live";
        case TransportState::KnownUnresolvable: return "known_unresolvable";
        case TransportState::NeverRegistered:   return "never_registered";
    }
    return "never_registered";
}

TransportRegistry::TransportRegistry(SessionStore& store) : store_(store) {}

std::shared_ptr<ITransport> TransportRegistry::LocalHandle(
    const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = local_.find(session_id);
    if (it == local_.end()) {
        return nullptr;
    }
    if (!it->second->IsOpen()) {
        local_.erase(it);
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<ITransport> TransportRegistry::TakeLocal(
    const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = local_.find(session_id);
    if (it == local_.end()) {
        return nullptr;
    }
    auto handle = std::move(it->second);
    local_.erase(it);
    return handle;
}

Result<void, Error> TransportRegistry::Bind(std::string_view session_id,
                                            std::shared_ptr<ITransport> handle,
                                            std::string_view server_name) {
    if (!handle && LocalHandle(std::string(session_id))) {
        LogDebug(kComponent, "Session " + std::string(session_id) +
                                 " already has a live transport");
        auto touched = store_.TouchTransport(session_id);
        if (touched.IsErr()) {
            return Result<void, Error>::Err(touched.Error());
        }
        return Result<void, Error>::Ok();
    }

    const auto now = store_.GetClock().Now();
    TransportSession record;
    record.session_id = std::string(session_id);
    record.transport_kind = handle ? handle->Kind()
                                   : std::string(kReferenceTransportKind);
    record.server_name = std::string(server_name);
    record.created_at = now;
    record.last_accessed = now;
    record.is_active = true;

    auto written = store_.PutTransport(record);
    if (written.IsErr()) {
        return written;
    }

    std::shared_ptr<ITransport> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = local_.find(record.session_id);
        if (handle) {
            if (it != local_.end()) {
                replaced = std::move(it->second);
                local_.erase(it);
            }
            local_.emplace(record.session_id, std::move(handle));
        } else if (it != local_.end() && !it->second->IsOpen()) {
            // An existence-only bind never displaces an open handle.
            local_.erase(it);
        }
    }
    if (replaced) {
        replaced->Close();
    }

    LogDebug(kComponent, "Bound " + record.transport_kind + " transport for session " +
                             record.session_id);
    return Result<void, Error>::Ok();
}

Result<TransportLookup, Error> TransportRegistry::Resolve(std::string_view session_id) {
    const std::string id(session_id);
    TransportLookup lookup;

    if (auto handle = LocalHandle(id)) {
        auto touched = store_.TouchTransport(id);
        if (touched.IsErr()) {
            // Local liveness stands on its own.
            LogWarn(kComponent, "Could not refresh transport record for " + id +
                                    ": " + touched.Error().message);
        }
        lookup.state = TransportState::Live;
        lookup.handle = std::move(handle);
        return Result<TransportLookup, Error>::Ok(std::move(lookup));
    }

    auto record = store_.GetTransport(id);
    if (record.IsErr()) {
        return Result<TransportLookup, Error>::Err(record.Error());
    }
    if (record.Value()) {
        lookup.state = TransportState::KnownUnresolvable;
        lookup.record = record.Value();
    } else {
        lookup.state = TransportState::NeverRegistered;
    }
    return Result<TransportLookup, Error>::Ok(std::move(lookup));
}

Result<StoreStatus, Error> TransportRegistry::Unbind(std::string_view session_id) {
    const std::string id(session_id);
    auto handle = TakeLocal(id);
    if (handle) {
        handle->Close();
    }

    auto removed = store_.DeleteTransport(id);
    if (removed.IsErr()) {
        return removed;
    }
    if (handle || removed.Value() == StoreStatus::Ok) {
        LogDebug(kComponent, "Unbound transport for session " + id);
        return Result<StoreStatus, Error>::Ok(StoreStatus::Ok);
    }
    return Result<StoreStatus, Error>::Ok(StoreStatus::Absent);
}

Result<StoreStatus, Error> TransportRegistry::Touch(std::string_view session_id) {
    return store_.TouchTransport(session_id);
}

std::size_t TransportRegistry::LocalCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_.size();
}

Result<std::vector<std::string>, Error> TransportRegistry::List() {
    return store_.ListTransports();
}

} // namespace mcp_gateway
