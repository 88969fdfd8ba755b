#include "mcpdiff/client/transport.hpp"

#include "internal/process.hpp"
#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/util/json.hpp"
#include "mcpdiff/util/log.hpp"

#include <algorithm>
#include <cctype>

namespace mcpdiff::client
{

namespace
{

constexpr std::chrono::milliseconds POLL_SLICE{100};
constexpr std::chrono::milliseconds STDERR_LINGER{500};
constexpr size_t LOG_PREVIEW_CHARS = 100;

bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string preview(const std::string& s)
{
    if (s.size() <= LOG_PREVIEW_CHARS)
        return s;
    return s.substr(0, LOG_PREVIEW_CHARS) + "...";
}

} // namespace

// =============================================================================
// LineTransport
// =============================================================================

LineTransport::LineTransport(std::string label, std::chrono::milliseconds read_timeout)
    : label_(std::move(label)), read_timeout_(read_timeout)
{
}

std::string LineTransport::labelled(const std::string& message) const
{
    return "[" + label_ + "] " + message;
}

void LineTransport::send(const Json& message)
{
    // Compact dump never contains a raw newline, so one message is one line
    std::string line = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    line.push_back('\n');
    write_line(line);
}

Json LineTransport::receive_matching(std::int64_t id)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + read_timeout_;

    for (;;)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() < 0)
            remaining = std::chrono::milliseconds(0);

        IncomingLine in = read_line(remaining);

        if (in.status == IncomingLine::Status::Timeout)
        {
            abandoned_.insert(id);
            throw TimeoutError(labelled(
                "no response to request " + std::to_string(id) + " within " +
                std::to_string(read_timeout_.count()) + " ms"));
        }

        if (in.status == IncomingLine::Status::Eof)
        {
            std::string stderr_text = diagnostics();
            throw TransportError(labelled(
                "server closed unexpectedly while awaiting response to request " +
                std::to_string(id) +
                (stderr_text.empty() ? std::string("") : "; stderr: " + stderr_text)));
        }

        if (is_blank(in.text))
            continue;

        auto parsed = util::json::try_parse(in.text);
        if (!parsed || !parsed->is_object())
        {
            log::warn(labelled("Invalid JSON: " + preview(in.text)));
            continue;
        }

        const Json& msg = *parsed;
        auto id_it = msg.find("id");
        if (id_it == msg.end())
        {
            auto method = msg.find("method");
            log::debug(labelled("discarding notification " +
                                (method != msg.end() && method->is_string() ? method->get<std::string>()
                                                                            : std::string("?"))));
            continue;
        }

        if (id_it->is_number_integer() && id_it->get<std::int64_t>() == id)
            return msg;

        if (id_it->is_number_integer() && abandoned_.erase(id_it->get<std::int64_t>()) > 0)
        {
            log::debug(labelled("dropping late response to timed-out request " + id_it->dump()));
            continue;
        }

        throw ProtocolError(labelled("out-of-order response: expected id " + std::to_string(id) +
                                     ", got " + id_it->dump() + " in " + preview(msg.dump())));
    }
}

// =============================================================================
// StdioTransport
// =============================================================================

StdioTransport::StdioTransport(std::string label, const ServerCommand& command,
                               const Settings& settings, std::ostream* stderr_stream)
    : LineTransport(std::move(label), settings.read_timeout),
      process_(std::make_unique<process::Process>()), stop_grace_(settings.stop_grace),
      stderr_stream_(stderr_stream)
{
    process::ProcessOptions options;
    options.working_directory = command.working_directory;
    options.environment = command.environment;
    options.inherit_environment = true;
    options.redirect_stdin = true;
    options.redirect_stdout = true;
    options.redirect_stderr = true;

    try
    {
        process_->spawn(command.executable, command.args, options);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(labelled(std::string("failed to start server: ") + e.what()));
    }
    log::debug(labelled("spawned '" + command.executable + "' as pid " + std::to_string(pid())));
}

StdioTransport::~StdioTransport()
{
    close();
}

int StdioTransport::pid() const
{
    return process_ ? process_->pid() : 0;
}

void StdioTransport::append_stderr(const std::string& chunk)
{
    if (chunk.empty())
        return;
    if (stderr_stream_ != nullptr)
    {
        stderr_stream_->write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        stderr_stream_->flush();
    }
    stderr_tail_ += chunk;
    if (stderr_tail_.size() > MAX_STDERR_BYTES)
        stderr_tail_.erase(0, stderr_tail_.size() - MAX_STDERR_BYTES);
}

void StdioTransport::drain_stderr(std::chrono::milliseconds linger)
{
    if (!process_ || !process_->has_stderr())
        return;

    auto& pipe = process_->stderr_pipe();
    try
    {
        append_stderr(pipe.read_available());
        if (linger.count() <= 0)
            return;

        // After stdout EOF the server may still be flushing its last words
        const auto deadline = std::chrono::steady_clock::now() + linger;
        while (!pipe.at_eof() && std::chrono::steady_clock::now() < deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (!pipe.has_data(static_cast<int>(std::max<long long>(left.count(), 0))))
                break;
            append_stderr(pipe.read_available());
        }
    }
    catch (const process::ProcessError& e)
    {
        log::debug(labelled(std::string("stderr read failed: ") + e.what()));
    }
}

void StdioTransport::write_line(const std::string& line)
{
    if (closed_ || !process_->has_stdin())
        throw TransportError(labelled("cannot write: server stdin is closed"));
    try
    {
        process_->stdin_pipe().write(line);
    }
    catch (const process::ProcessError& e)
    {
        std::string stderr_text = diagnostics();
        throw TransportError(labelled(std::string("write failed: ") + e.what() +
                                      (stderr_text.empty() ? "" : "; stderr: " + stderr_text)));
    }
}

IncomingLine StdioTransport::read_line(std::chrono::milliseconds timeout)
{
    if (closed_)
        return {IncomingLine::Status::Eof, {}};

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    try
    {
        auto& out = process_->stdout_pipe();
        for (;;)
        {
            // Keep stderr moving so a chatty server cannot block on a full pipe
            drain_stderr(std::chrono::milliseconds(0));

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (left.count() < 0)
                left = std::chrono::milliseconds(0);
            auto r = out.read_line(std::min(left, POLL_SLICE));
            switch (r.status)
            {
            case process::LineStatus::Line:
                return {IncomingLine::Status::Line, std::move(r.line)};
            case process::LineStatus::Eof:
                return {IncomingLine::Status::Eof, {}};
            case process::LineStatus::Timeout:
                if (clock::now() >= deadline)
                    return {IncomingLine::Status::Timeout, {}};
                break;
            }
        }
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(labelled(std::string("read failed: ") + e.what()));
    }
}

std::string StdioTransport::diagnostics()
{
    drain_stderr(STDERR_LINGER);
    return stderr_tail_;
}

void StdioTransport::close()
{
    if (closed_ || !process_)
        return;
    closed_ = true;

    try
    {
        if (process_->has_stdin())
            process_->stdin_pipe().close();

        process_->terminate();
        auto code = process_->wait_for(stop_grace_);
        if (!code)
        {
            log::warn(labelled("server did not exit within " + std::to_string(stop_grace_.count()) +
                               " ms of SIGTERM; killing"));
            process_->kill();
            code = process_->wait();
        }
        exit_code_ = code;
        drain_stderr(std::chrono::milliseconds(0));
        log::debug(labelled("server exited with status " + std::to_string(*exit_code_)));
    }
    catch (const process::ProcessError& e)
    {
        log::warn(labelled(std::string("stop failed: ") + e.what()));
    }
}

// =============================================================================
// MemoryTransport
// =============================================================================

MemoryTransport::MemoryTransport(std::string label, Responder responder,
                                 std::chrono::milliseconds read_timeout)
    : LineTransport(std::move(label), read_timeout), responder_(std::move(responder))
{
}

void MemoryTransport::push_line(std::string line)
{
    incoming_.push_back(std::move(line));
}

void MemoryTransport::push_message(const Json& message)
{
    incoming_.push_back(message.dump());
}

void MemoryTransport::close_output()
{
    output_closed_ = true;
}

void MemoryTransport::set_stderr(std::string text)
{
    stderr_ = std::move(text);
}

void MemoryTransport::fail_writes(bool fail)
{
    fail_writes_ = fail;
}

void MemoryTransport::close()
{
    closed_ = true;
    output_closed_ = true;
}

void MemoryTransport::write_line(const std::string& line)
{
    if (closed_)
        throw TransportError(labelled("cannot write: transport is closed"));
    if (fail_writes_)
        throw TransportError(labelled("write failed: Broken pipe"));

    sent_lines_.push_back(line);
    auto message = util::json::try_parse(line);
    if (!message)
        throw ProtocolError(labelled("sent a line that is not JSON"));
    sent_.push_back(*message);
    if (responder_)
        responder_(sent_.back(), *this);
}

IncomingLine MemoryTransport::read_line(std::chrono::milliseconds /*timeout*/)
{
    if (!incoming_.empty())
    {
        IncomingLine line{IncomingLine::Status::Line, std::move(incoming_.front())};
        incoming_.pop_front();
        return line;
    }
    if (output_closed_)
        return {IncomingLine::Status::Eof, {}};
    return {IncomingLine::Status::Timeout, {}};
}

std::string MemoryTransport::diagnostics()
{
    return stderr_;
}

} // namespace mcpdiff::client
