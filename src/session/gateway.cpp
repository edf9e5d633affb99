#include <mcp_gateway/session/gateway.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "gateway";

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

Result<SessionContext, Error> Reject(const Error& error) {
    return Result<SessionContext, Error>::Err(error);
}

} // anonymous namespace

int JsonRpcErrorCode(const Error& error) {
    switch (error.category) {
        case ErrorCategory::SessionNotFound:             return -32000;
        case ErrorCategory::RecoveryExhausted:           return -32001;
        case ErrorCategory::BackendUnavailable:          return -32002;
        case ErrorCategory::TransportConstructionFailed: return -32003;
        default:                                         return -32603;
    }
}

SessionGateway::SessionGateway(const IdentityResolver& resolver,
                               TenantSessionIndex& index,
                               TransportRegistry& registry,
                               RecoveryOrchestrator& recovery,
                               ITransportFactory& factory,
                               GatewayOptions options)
    : resolver_(resolver),
      index_(index),
      registry_(registry),
      recovery_(recovery),
      factory_(factory),
      options_(std::move(options)) {}

std::optional<std::string> SessionGateway::PresentedSessionId(
    const std::map<std::string, std::string>& headers) {
    for (const auto& [name, value] : headers) {
        if (EqualsIgnoreCase(name, kSessionIdHeader) && !value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

Result<std::shared_ptr<ITransport>, Error> SessionGateway::OpenTransport(
    const std::string& session_id) {
    auto transport = factory_.Create(session_id, options_.server_name);
    if (transport.IsErr()) {
        auto error = transport.Error();
        error.category = ErrorCategory::TransportConstructionFailed;
        return Result<std::shared_ptr<ITransport>, Error>::Err(error);
    }
    auto handle = transport.Value();
    auto bound = registry_.Bind(session_id, handle, options_.server_name);
    if (bound.IsErr()) {
        handle->Close();
        return Result<std::shared_ptr<ITransport>, Error>::Err(bound.Error());
    }
    return Result<std::shared_ptr<ITransport>, Error>::Ok(std::move(handle));
}

Result<SessionContext, Error> SessionGateway::Admit(
    const std::map<std::string, std::string>& headers, std::string_view method) {
    SessionContext context;

    auto presented = PresentedSessionId(headers);
    if (!presented) {
        if (method != "initialize") {
            return Reject(Error{"Admit", "", "Missing session id",
                                ErrorCategory::SessionNotFound});
        }
        presented = SessionId::Generate().Value();
        context.generated_id = true;
    }
    auto validated = SessionId::Create(*presented);
    if (validated.IsErr()) {
        return Reject(Error{"Admit", "", "Invalid session id: " + validated.Error(),
                            ErrorCategory::SessionNotFound});
    }
    const auto& requested_id = validated.Value().Value();
    LogInfo(kComponent, "Processing " + std::string(method) +
                            " request for session " + requested_id);

    context.identity = resolver_.Resolve(RequestMetadata::FromHeaderMap(headers));

    const nlohmann::json request_payload = {
        {"source", "gateway"},
        {"last_request_method", std::string(method)},
        {"last_request_time", FormatIso8601(Clock::now())},
    };
    auto session = index_.FindOrCreate(requested_id, context.identity,
                                       request_payload);
    if (session.IsErr()) {
        LogError(kComponent, "Cannot resolve session " + requested_id + ": " +
                                 session.Error().ToString());
        return Reject(session.Error());
    }
    context.session = session.Value();
    context.session_id = context.session.session_id;
    if (context.session_id != requested_id) {
        LogInfo(kComponent, "Session " + requested_id + " served by recent session " +
                                context.session_id);
    }

    auto lookup = registry_.Resolve(context.session_id);
    if (lookup.IsErr()) {
        return Reject(lookup.Error());
    }
    if (lookup.Value().IsLive()) {
        context.transport = lookup.Value().handle;
        return Result<SessionContext, Error>::Ok(std::move(context));
    }

    if (method == "initialize") {
        auto opened = OpenTransport(context.session_id);
        if (opened.IsErr()) {
            LogError(kComponent, "Cannot open transport for " + context.session_id +
                                     ": " + opened.Error().ToString());
            return Reject(opened.Error());
        }
        context.transport = opened.Value();
        return Result<SessionContext, Error>::Ok(std::move(context));
    }

    auto recovered = recovery_.Recover(context.session_id, context.identity);
    if (recovered.IsErr()) {
        return Reject(recovered.Error());
    }
    context.transport = recovered.Value().transport;
    context.recovery = recovered.Value().stage;
    return Result<SessionContext, Error>::Ok(std::move(context));
}

Result<StoreStatus, Error> SessionGateway::Close(
    const std::map<std::string, std::string>& headers) {
    auto presented = PresentedSessionId(headers);
    if (!presented) {
        return Result<StoreStatus, Error>::Err(
            Error{"Close", "", "Missing session id", ErrorCategory::SessionNotFound});
    }
    auto validated = SessionId::Create(*presented);
    if (validated.IsErr()) {
        return Result<StoreStatus, Error>::Err(
            Error{"Close", "", "Invalid session id: " + validated.Error(),
                  ErrorCategory::SessionNotFound});
    }
    const auto& session_id = validated.Value().Value();
    const auto identity = resolver_.Resolve(RequestMetadata::FromHeaderMap(headers));

    auto session = index_.Get(session_id, identity);
    if (session.IsErr()) {
        return Result<StoreStatus, Error>::Err(session.Error());
    }
    const bool was_active = session.Value() && session.Value()->is_active;
    if (was_active) {
        auto deactivated = index_.Deactivate(session_id, identity);
        if (deactivated.IsErr()) {
            return deactivated;
        }
    }

    auto unbound = registry_.Unbind(session_id);
    if (unbound.IsErr()) {
        return unbound;
    }
    if (!was_active && unbound.Value() == StoreStatus::Absent) {
        LogInfo(kComponent, "Nothing to close for session " + session_id);
        return Result<StoreStatus, Error>::Ok(StoreStatus::Absent);
    }
    LogInfo(kComponent, "Closed session " + session_id);
    return Result<StoreStatus, Error>::Ok(StoreStatus::Ok);
}

} // namespace mcp_gateway
