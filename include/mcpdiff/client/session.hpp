#pragma once
/// @file client/session.hpp
/// @brief One server under test: transport ownership, handshake and shutdown

#include "mcpdiff/client/transport.hpp"
#include "mcpdiff/settings.hpp"
#include "mcpdiff/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace mcpdiff::client
{

enum class SessionState
{
    Unstarted,
    Starting, ///< Handshake in flight
    Ready,    ///< Accepts tool calls
    Stopping,
    Stopped,
    Failed, ///< Terminal; the transport has been released
};

std::string to_string(SessionState state);

/// Next JSON-RPC request id. Process-wide and monotonic across all sessions.
std::int64_t next_request_id();

/// Creates the session's transport; for stdio this is where the process is spawned
using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

/// Factory that spawns `command` with StdioTransport when the session starts
TransportFactory stdio_transport_factory(std::string label, ServerCommand command,
                                         Settings settings, std::ostream* stderr_stream = nullptr);

/// Owns exactly one transport (and through it one subprocess).
///
/// Lifecycle: Unstarted -> Starting -> Ready -> Stopping -> Stopped.
/// Observing a closed stream moves the session to Failed from any live state.
class Session
{
  public:
    Session(std::string label, TransportFactory factory, Settings settings = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Create the transport, send `initialize`, await its response (success or
    /// error), then send `notifications/initialized`.
    /// @throws TransportError / TimeoutError / ProtocolError on handshake failure;
    ///         the session is Failed afterwards
    void start();

    /// Best-effort shutdown. Never throws.
    void stop() noexcept;

    /// Send a request and return the whole response message
    /// @throws SessionError if the session is not Ready
    Json request(const std::string& method, const Json& params);

    /// Send a notification; no response is awaited
    void notify(const std::string& method, const Json& params);

    SessionState state() const
    {
        return state_;
    }

    const std::string& label() const
    {
        return label_;
    }

    /// Response to the initialize request (null before the handshake)
    const Json& initialize_response() const
    {
        return initialize_response_;
    }

    /// True when the server answered initialize with an error
    bool initialize_failed() const
    {
        return initialize_response_.is_object() && initialize_response_.contains("error");
    }

    /// Why the session failed, if it did
    const std::optional<std::string>& failure() const
    {
        return failure_;
    }

  private:
    void require_ready(const std::string& operation) const;
    void mark_failed(const std::string& reason) noexcept;

    std::string label_;
    TransportFactory factory_;
    Settings settings_;
    std::unique_ptr<ITransport> transport_;
    SessionState state_ = SessionState::Unstarted;
    Json initialize_response_;
    std::optional<std::string> failure_;
};

} // namespace mcpdiff::client
