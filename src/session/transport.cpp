#include <mcp_gateway/session/transport.hpp>

namespace mcp_gateway {

StreamTransport::StreamTransport(std::string session_id, std::ostream& out,
                                 std::shared_ptr<std::mutex> write_mutex)
    : session_id_(std::move(session_id)),
      out_(out),
      write_mutex_(std::move(write_mutex)) {}

Result<void, Error> StreamTransport::Send(const nlohmann::json& message) {
    if (!IsOpen()) {
        return Result<void, Error>::Err(Error{
            "Send", session_id_, "Transport is closed",
            ErrorCategory::TransportConstructionFailed});
    }

    nlohmann::json envelope = {
        {"headers", {{"mcp-session-id", session_id_}}},
        {"message", message},
    };
    const auto line = envelope.dump();

    std::lock_guard<std::mutex> lock(*write_mutex_);
    out_ << line << "\n";
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(Error{
            "Send", session_id_, "Output stream rejected the write",
            ErrorCategory::Internal});
    }
    return Result<void, Error>::Ok();
}

void StreamTransport::Close() {
    open_.store(false);
}

StreamTransportFactory::StreamTransportFactory(std::ostream& out)
    : out_(out), write_mutex_(std::make_shared<std::mutex>()) {}

Result<std::shared_ptr<ITransport>, Error> StreamTransportFactory::Create(
    std::string_view session_id, std::string_view /*server_name*/) {
    bool writable = false;
    {
        std::lock_guard<std::mutex> lock(*write_mutex_);
        writable = static_cast<bool>(out_);
    }
    if (!writable) {
        return Result<std::shared_ptr<ITransport>, Error>::Err(Error{
            "CreateTransport", std::string(session_id),
            "Output stream is not writable",
            ErrorCategory::TransportConstructionFailed});
    }
    return Result<std::shared_ptr<ITransport>, Error>::Ok(
        std::make_shared<StreamTransport>(std::string(session_id), out_,
                                          write_mutex_));
}

void StreamTransportFactory::WriteRaw(const nlohmann::json& line) {
    const auto text = line.dump();
    std::lock_guard<std::mutex> lock(*write_mutex_);
    out_ << text << "\n";
    out_.flush();
}

} // namespace mcp_gateway
