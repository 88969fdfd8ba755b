#pragma once
/// @file client/transport.hpp
/// @brief Line-delimited JSON-RPC transports
/// @details A transport frames outgoing messages as one JSON object per line and
///          correlates incoming responses by id. StdioTransport talks to a real
///          subprocess; MemoryTransport replays scripted lines in-process.

#include "mcpdiff/settings.hpp"
#include "mcpdiff/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace mcpdiff::process
{
class Process;
}

namespace mcpdiff::client
{

// ============================================================================
// Transport Interface
// ============================================================================

/// Abstract transport for one peer
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Write one message followed by a newline, all or nothing.
    /// @throws TransportError if the write cannot complete
    virtual void send(const Json& message) = 0;

    /// Block until the response carrying `id` arrives.
    /// Notifications and malformed lines are skipped.
    /// @throws TransportError on end of stream, TimeoutError when the read bound
    ///         elapses, ProtocolError when a response for another id arrives
    virtual Json receive_matching(std::int64_t id) = 0;

    /// Release the peer. Idempotent.
    virtual void close() = 0;
};

/// One read attempt from the underlying line source
struct IncomingLine
{
    enum class Status
    {
        Line,
        Eof,
        Timeout
    };

    Status status = Status::Eof;
    std::string text;
};

/// Shared framing and correlation logic over a line source/sink
class LineTransport : public ITransport
{
  public:
    LineTransport(std::string label, std::chrono::milliseconds read_timeout);

    void send(const Json& message) override;
    Json receive_matching(std::int64_t id) override;

    const std::string& label() const
    {
        return label_;
    }

    std::chrono::milliseconds read_timeout() const
    {
        return read_timeout_;
    }

  protected:
    /// Write `line` (already newline-terminated) completely or throw TransportError
    virtual void write_line(const std::string& line) = 0;

    /// Wait at most `timeout` for the next line
    virtual IncomingLine read_line(std::chrono::milliseconds timeout) = 0;

    /// Best-effort error-stream content for failure messages
    virtual std::string diagnostics() = 0;

    /// "[label] message"
    std::string labelled(const std::string& message) const;

  private:
    std::string label_;
    std::chrono::milliseconds read_timeout_;
    // Requests that timed out; their late responses are dropped, not treated as
    // out-of-order.
    std::set<std::int64_t> abandoned_;
};

// ============================================================================
// StdioTransport
// ============================================================================

/// Spawns a server subprocess and exchanges lines over its stdin/stdout.
/// The subprocess's stderr is captured (bounded tail) for diagnostics.
class StdioTransport : public LineTransport
{
  public:
    /// Spawns immediately.
    /// @param stderr_stream Optional stream that receives the server's stderr as it
    ///                      is read. Caller retains ownership.
    /// @throws TransportError if the process cannot be started
    StdioTransport(std::string label, const ServerCommand& command, const Settings& settings,
                   std::ostream* stderr_stream = nullptr);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Close stdin, send SIGTERM, wait up to the stop grace, then SIGKILL.
    /// Never throws.
    void close() override;

    /// Exit status once the process has been reaped
    std::optional<int> exit_code() const
    {
        return exit_code_;
    }

    int pid() const;

    /// Everything captured from stderr so far (bounded)
    const std::string& captured_stderr() const
    {
        return stderr_tail_;
    }

  protected:
    void write_line(const std::string& line) override;
    IncomingLine read_line(std::chrono::milliseconds timeout) override;
    std::string diagnostics() override;

  private:
    void drain_stderr(std::chrono::milliseconds linger);
    void append_stderr(const std::string& chunk);

    static constexpr size_t MAX_STDERR_BYTES = 64 * 1024;

    std::unique_ptr<process::Process> process_;
    std::chrono::milliseconds stop_grace_;
    std::ostream* stderr_stream_ = nullptr;
    std::string stderr_tail_;
    std::optional<int> exit_code_;
    bool closed_ = false;
};

// ============================================================================
// MemoryTransport
// ============================================================================

/// In-process transport backed by a queue of incoming lines.
/// An empty queue with the output still open reads as a timeout, since nothing
/// else can ever produce a line.
class MemoryTransport : public LineTransport
{
  public:
    /// Invoked for every message sent; typically pushes the reply lines
    using Responder = std::function<void(const Json& sent, MemoryTransport& self)>;

    explicit MemoryTransport(std::string label = "memory", Responder responder = {},
                             std::chrono::milliseconds read_timeout = std::chrono::seconds(1));

    void push_line(std::string line);
    void push_message(const Json& message);

    /// Reads past the queued lines report end of stream
    void close_output();

    /// Text reported as the peer's error stream on failures
    void set_stderr(std::string text);

    /// Make every subsequent send fail with TransportError
    void fail_writes(bool fail = true);

    void close() override;

    bool closed() const
    {
        return closed_;
    }

    /// Messages written so far, decoded
    const std::vector<Json>& sent() const
    {
        return sent_;
    }

    /// Raw lines written so far, including the trailing newline
    const std::vector<std::string>& sent_lines() const
    {
        return sent_lines_;
    }

  protected:
    void write_line(const std::string& line) override;
    IncomingLine read_line(std::chrono::milliseconds timeout) override;
    std::string diagnostics() override;

  private:
    Responder responder_;
    std::deque<std::string> incoming_;
    std::vector<Json> sent_;
    std::vector<std::string> sent_lines_;
    std::string stderr_;
    bool output_closed_ = false;
    bool fail_writes_ = false;
    bool closed_ = false;
};

} // namespace mcpdiff::client
