#include "mcpdiff/client/session.hpp"

#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/util/log.hpp"

#include <atomic>

namespace mcpdiff::client
{

namespace
{
std::atomic<std::int64_t> g_request_id{0};
}

std::int64_t next_request_id()
{
    return ++g_request_id;
}

std::string to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Unstarted:
        return "unstarted";
    case SessionState::Starting:
        return "starting";
    case SessionState::Ready:
        return "ready";
    case SessionState::Stopping:
        return "stopping";
    case SessionState::Stopped:
        return "stopped";
    case SessionState::Failed:
        return "failed";
    }
    return "unknown";
}

TransportFactory stdio_transport_factory(std::string label, ServerCommand command,
                                         Settings settings, std::ostream* stderr_stream)
{
    return [label = std::move(label), command = std::move(command),
            settings = std::move(settings), stderr_stream]() -> std::unique_ptr<ITransport>
    { return std::make_unique<StdioTransport>(label, command, settings, stderr_stream); };
}

Session::Session(std::string label, TransportFactory factory, Settings settings)
    : label_(std::move(label)), factory_(std::move(factory)), settings_(std::move(settings))
{
}

Session::~Session()
{
    stop();
}

void Session::start()
{
    if (state_ != SessionState::Unstarted)
        throw SessionError("[" + label_ + "] cannot start a session that is " + to_string(state_));

    state_ = SessionState::Starting;
    try
    {
        transport_ = factory_();

        auto id = next_request_id();
        transport_->send(Json{
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", "initialize"},
            {"params",
             Json{{"protocolVersion", settings_.protocol_version},
                  {"capabilities", Json::object()},
                  {"clientInfo",
                   Json{{"name", settings_.client_name}, {"version", settings_.client_version}}}}},
        });
        initialize_response_ = transport_->receive_matching(id);

        // Servers may report configuration problems here; callers inspect
        // initialize_failed() instead of the handshake aborting.
        if (initialize_failed())
            log::warn("[" + label_ + "] initialize returned error: " +
                      initialize_response_["error"].dump());

        transport_->send(Json{{"jsonrpc", "2.0"},
                              {"method", "notifications/initialized"},
                              {"params", Json::object()}});
    }
    catch (const Error& e)
    {
        mark_failed(e.what());
        throw;
    }

    state_ = SessionState::Ready;
    log::info("[" + label_ + "] session ready");
}

void Session::stop() noexcept
{
    if (state_ == SessionState::Stopped || state_ == SessionState::Failed)
        return;

    state_ = SessionState::Stopping;
    if (transport_)
    {
        try
        {
            transport_->close();
        }
        catch (const std::exception& e)
        {
            log::warn("[" + label_ + "] error while stopping: " + e.what());
        }
        transport_.reset();
        log::info("[" + label_ + "] session stopped");
    }
    state_ = SessionState::Stopped;
}

void Session::require_ready(const std::string& operation) const
{
    if (state_ == SessionState::Ready)
        return;
    std::string message = "[" + label_ + "] cannot " + operation + ": session is " + to_string(state_);
    if (failure_)
        message += " (" + *failure_ + ")";
    throw SessionError(message);
}

void Session::mark_failed(const std::string& reason) noexcept
{
    failure_ = reason;
    state_ = SessionState::Failed;
    if (transport_)
    {
        try
        {
            transport_->close();
        }
        catch (const std::exception& e)
        {
            log::warn("[" + label_ + "] error while releasing failed session: " + e.what());
        }
        transport_.reset();
    }
    log::error(reason);
}

Json Session::request(const std::string& method, const Json& params)
{
    require_ready(method);

    auto id = next_request_id();
    try
    {
        transport_->send(Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
        return transport_->receive_matching(id);
    }
    catch (const TransportError& e)
    {
        // Closed stream: nothing more will ever arrive on this session
        mark_failed(e.what());
        throw;
    }
}

void Session::notify(const std::string& method, const Json& params)
{
    require_ready(method);
    try
    {
        transport_->send(Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
    }
    catch (const TransportError& e)
    {
        mark_failed(e.what());
        throw;
    }
}

} // namespace mcpdiff::client
