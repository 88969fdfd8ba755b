// POSIX implementation of subprocess process management

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace mcpdiff::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;
    bool eof = false;
    std::string buffer;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static void close_pair(int fds[2])
{
    for (int i = 0; i < 2; ++i)
    {
        if (fds[i] >= 0)
        {
            ::close(fds[i]);
            fds[i] = -1;
        }
    }
}

static void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// A dead reader must surface as EPIPE from write(), not kill the harness.
static void ignore_sigpipe()
{
    static const bool installed = []
    {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)installed;
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    for (;;)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                return 0;
            throw ProcessError("Read failed: " + get_errno_message());
        }
        if (bytes_read == 0)
            handle_->eof = true;
        return static_cast<size_t>(bytes_read);
    }
}

LineRead ReadPipe::read_line(std::chrono::milliseconds timeout)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    for (;;)
    {
        auto& buf = handle_->buffer;
        auto nl = buf.find('\n');
        if (nl != std::string::npos)
        {
            LineRead out{LineStatus::Line, buf.substr(0, nl)};
            buf.erase(0, nl + 1);
            if (!out.line.empty() && out.line.back() == '\r')
                out.line.pop_back();
            return out;
        }

        if (handle_->eof || !is_open())
        {
            if (!buf.empty())
            {
                LineRead out{LineStatus::Line, std::move(buf)};
                buf.clear();
                return out;
            }
            return {LineStatus::Eof, {}};
        }

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0)
            return {LineStatus::Timeout, {}};

        if (!has_data(static_cast<int>(remaining.count())))
            continue;

        char chunk[4096];
        size_t n = read(chunk, sizeof(chunk));
        buf.append(chunk, n);
    }
}

std::string ReadPipe::read_available()
{
    std::string out;
    if (!is_open())
        return out;

    char chunk[4096];
    while (!handle_->eof && has_data(0))
    {
        size_t n = read(chunk, sizeof(chunk));
        if (n == 0)
            break;
        out.append(chunk, n);
    }
    return out;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + get_errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

bool ReadPipe::at_eof() const
{
    return handle_ && handle_->eof;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe implementation
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    ignore_sigpipe();

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process implementation
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (handle_ && handle_->running)
    {
        try
        {
            terminate();
            if (!wait_for(std::chrono::milliseconds(2000)))
            {
                kill();
                wait();
            }
        }
        catch (const ProcessError&)
        {
            // Child already reaped elsewhere; nothing left to release
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    int stdin_fds[2] = {-1, -1};
    int stdout_fds[2] = {-1, -1};
    int stderr_fds[2] = {-1, -1};
    int error_fds[2] = {-1, -1};

    auto fail = [&](const std::string& what)
    {
        std::string message = what + ": " + get_errno_message();
        close_pair(stdin_fds);
        close_pair(stdout_fds);
        close_pair(stderr_fds);
        close_pair(error_fds);
        throw ProcessError(message);
    };

    if (options.redirect_stdin && pipe(stdin_fds) != 0)
        fail("Failed to create stdin pipe");
    if (options.redirect_stdout && pipe(stdout_fds) != 0)
        fail("Failed to create stdout pipe");
    if (options.redirect_stderr && pipe(stderr_fds) != 0)
        fail("Failed to create stderr pipe");

    // Error pipe for detecting exec failures
    if (pipe(error_fds) != 0)
        fail("Failed to create error pipe");
    set_cloexec(error_fds[1]);

    // Parent ends must not leak into sibling servers spawned later, or their
    // EOF would never be observed.
    if (stdin_fds[1] >= 0)
        set_cloexec(stdin_fds[1]);
    if (stdout_fds[0] >= 0)
        set_cloexec(stdout_fds[0]);
    if (stderr_fds[0] >= 0)
        set_cloexec(stderr_fds[0]);

    pid_t pid = fork();
    if (pid < 0)
        fail("Failed to fork process");

    if (pid == 0)
    {
        // Child process
        ::close(error_fds[0]);

        auto child_fail = [&]()
        {
            int err = errno;
            (void)::write(error_fds[1], &err, sizeof(err));
            _exit(127);
        };

        if (options.redirect_stdin)
        {
            ::close(stdin_fds[1]);
            if (dup2(stdin_fds[0], STDIN_FILENO) < 0)
                child_fail();
            ::close(stdin_fds[0]);
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_fds[0]);
            if (dup2(stdout_fds[1], STDOUT_FILENO) < 0)
                child_fail();
            ::close(stdout_fds[1]);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_fds[0]);
            if (dup2(stderr_fds[1], STDERR_FILENO) < 0)
                child_fail();
            ::close(stderr_fds[1]);
        }

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail();

        if (!options.inherit_environment)
        {
#if defined(__linux__) && defined(_GNU_SOURCE)
            clearenv();
#else
            if (environ)
                environ[0] = nullptr;
#endif
        }

        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        execvp(executable.c_str(), argv.data());
        child_fail();
    }

    // Parent process
    ::close(error_fds[1]);
    error_fds[1] = -1;
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_fds[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    close_pair(error_fds);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        close_pair(stdin_fds);
        close_pair(stdout_fds);
        close_pair(stderr_fds);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_fds[0]);
        stdin_->handle_->fd = stdin_fds[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_fds[1]);
        stdout_->handle_->fd = stdout_fds[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_fds[1]);
        stderr_->handle_->fd = stderr_fds[0];
    }

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

bool Process::has_stdin() const
{
    return stdin_ && stdin_->is_open();
}

bool Process::has_stderr() const
{
    return stderr_ && stderr_->is_open();
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    int result = ::kill(handle_->pid, 0);
    if (result == 0)
        return true;

    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    if (result == 0)
        return std::nullopt;

    throw ProcessError("waitpid failed: " + get_errno_message());
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw ProcessError("waitpid failed: " + get_errno_message());
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto usable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos)
    {
        if (usable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();
        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (usable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace mcpdiff::process
