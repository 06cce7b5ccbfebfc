// POSIX implementation of subprocess process management
// Adapted from copilot-sdk-cpp

#ifndef _WIN32

#include "process.hpp"

#include "mcphub/exceptions.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <signal.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace mcphub::process
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

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
    // Serializes waitpid() against kill() so a reaped pid is never signalled
    std::mutex mutex;
};

// =============================================================================
// Helper functions
// =============================================================================

static std::string get_errno_message()
{
    return std::strerror(errno);
}

static int make_pipe(int fds[2])
{
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC);
#else
    if (::pipe(fds) != 0)
        return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

static void close_pair(int fds[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static void ignore_sigpipe_once()
{
    // Writes to a dead child must fail with EPIPE instead of killing this process
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

static int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Parent environment with overrides applied, built before fork()
static std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides)
{
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e)
    {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos)
            continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides)
        env[key] = value;

    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [key, value] : env)
        out.push_back(key + "=" + value);
    return out;
}

// =============================================================================
// ReadPipe implementation
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    ssize_t bytes_read;
    do
    {
        bytes_read = ::read(handle_->fd, buffer, size);
    } while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_read);
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

size_t WritePipe::write(const char* data, size_t size, const std::atomic<bool>* cancel)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < size)
    {
        if (cancel && cancel->load(std::memory_order_acquire))
            break;

        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                wait_writable(50);
                continue;
            }
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + get_errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data, const std::atomic<bool>* cancel)
{
    return write(data.data(), data.size(), cancel);
}

bool WritePipe::wait_writable(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(handle_->fd, &write_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, nullptr, &write_fds, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("select failed: " + get_errno_message());
    }
    return result > 0;
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
      stdout_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    shutdown(std::chrono::milliseconds(1000));
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    ignore_sigpipe_once();

    int stdin_pipe[2] = {-1, -1};
    if (make_pipe(stdin_pipe) != 0)
        throw SpawnError("Failed to create stdin pipe: " + get_errno_message(), executable);

    int stdout_pipe[2] = {-1, -1};
    if (make_pipe(stdout_pipe) != 0)
    {
        close_pair(stdin_pipe);
        throw SpawnError("Failed to create stdout pipe: " + get_errno_message(), executable);
    }

    // Error pipe for detecting exec failures
    int error_pipe[2] = {-1, -1};
    if (make_pipe(error_pipe) != 0)
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        throw SpawnError("Failed to create error pipe: " + get_errno_message(), executable);
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> env_strings = merged_environment(options.environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& e : env_strings)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(error_pipe);
        throw SpawnError("Failed to fork process: " + get_errno_message(), executable);
    }

    if (pid == 0)
    {
        // Child process: only async-signal-safe calls from here on
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 || dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
        {
            int err = errno;
            (void)::write(error_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        environ = envp.data();
        execvp(executable.c_str(), argv.data());

        int err = errno;
        (void)::write(error_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    ::close(error_pipe[1]);
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        throw SpawnError("Failed to execute '" + executable + "': " + std::strerror(child_errno),
                         executable);
    }

    ::close(stdin_pipe[0]);
    fcntl(stdin_pipe[1], F_SETFL, fcntl(stdin_pipe[1], F_GETFL) | O_NONBLOCK);
    stdin_->handle_->fd = stdin_pipe[1];

    ::close(stdout_pipe[1]);
    stdout_->handle_->fd = stdout_pipe[0];

    std::lock_guard<std::mutex> lock(handle_->mutex);
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

bool Process::is_running() const
{
    if (!handle_)
        return false;
    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->pid == 0 || !handle_->running)
        return false;

    int result = ::kill(handle_->pid, 0);
    if (result == 0)
        return true;

    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_)
        return -1;
    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->pid == 0 || !handle_->running)
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

    if (errno == ECHILD)
    {
        handle_->running = false;
        return handle_->exit_code;
    }
    throw ProcessError("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    while (true)
    {
        if (auto code = wait_for(std::chrono::milliseconds(100)))
            return *code;
    }
}

std::optional<int> Process::wait_for(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto code = try_wait())
            return code;
        if (std::chrono::steady_clock::now() >= deadline)
            return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void Process::terminate()
{
    if (!handle_)
        return;
    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (!handle_)
        return;
    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

void Process::shutdown(std::chrono::milliseconds grace)
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();

    if (!handle_ || handle_->pid == 0)
        return;
    if (try_wait())
        return;

    terminate();
    if (wait_for(grace))
        return;

    kill();
    wait();
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

    if (name.empty())
        return std::nullopt;

    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (fs::exists(exe_path) && access(exe_path.c_str(), X_OK) == 0)
            return name;
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos)
    {
        if (fs::exists(name) && access(name.c_str(), X_OK) == 0)
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
            fs::path test_path = fs::path(dir) / name;
            if (fs::exists(test_path) && access(test_path.c_str(), X_OK) == 0)
                return test_path.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace mcphub::process

#endif // !_WIN32
