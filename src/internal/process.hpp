// POSIX process management for mcpdiff StdioTransport

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpdiff::process
{

struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Outcome of a bounded line read
enum class LineStatus
{
    Line,    ///< A complete line was read (terminator stripped)
    Eof,     ///< The writer closed the pipe and no buffered data remains
    Timeout, ///< No complete line arrived before the deadline
};

struct LineRead
{
    LineStatus status = LineStatus::Eof;
    std::string line;
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Read one newline-terminated line, waiting at most `timeout`.
    /// Partial lines stay buffered across calls, so a Timeout never loses data.
    LineRead read_line(std::chrono::milliseconds timeout);

    /// Drain whatever is readable right now without blocking
    std::string read_available();

    /// Check if data is available without blocking
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check)
    bool has_data(int timeout_ms = 0);

    /// True once a read returned end-of-file
    bool at_eof() const;

    void close();

    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Pipe for writing input to a subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write all of `size` bytes or throw; never returns a short count
    size_t write(const char* data, size_t size);

    size_t write(const std::string& data);

    void close();

    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    std::string working_directory;
    /// Variables overlaid on the inherited environment
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = true;
};

class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process; throws ProcessError if the executable cannot be started
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    /// Non-throwing accessors for teardown paths
    bool has_stdin() const;
    bool has_stderr() const;

    bool is_running() const;

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Wait at most `timeout` for termination
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Blocking wait for process termination
    int wait();

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Forcefully kill the process (SIGKILL)
    void kill();

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

/// Find an executable in the system PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace mcpdiff::process
