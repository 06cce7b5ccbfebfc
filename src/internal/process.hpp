// Subprocess management for the mcphub stdio transport
// Adapted from copilot-sdk-cpp (which was adapted from claude-agent-sdk-cpp)

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcphub::process
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when an I/O operation on a child pipe fails
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Pipe for reading output from a subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;

    /// Read up to size bytes into buffer
    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Check if data (or EOF) is available without blocking
    /// @param timeout_ms Timeout in milliseconds (0 = non-blocking check)
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Pipe for writing input to a subprocess. The descriptor is non-blocking.
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;

    /// Write all of data, waiting for the pipe to drain as needed.
    /// Returns early (with the count written so far) once @p cancel becomes true.
    size_t write(const char* data, size_t size, const std::atomic<bool>* cancel = nullptr);

    size_t write(const std::string& data, const std::atomic<bool>* cancel = nullptr);

    /// Wait until the pipe accepts more data
    bool wait_writable(int timeout_ms);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Applied on top of the parent's environment
    std::map<std::string, std::string> environment;
};

/// Child process with piped stdin/stdout. stderr is inherited from the parent.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Spawn a new process. Throws mcphub::SpawnError on failure.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    bool is_running() const;

    /// Non-blocking wait for process termination
    std::optional<int> try_wait();

    /// Blocks until the process exits. Only used after SIGKILL; callers that must be able
    /// to stop waiting use wait_for().
    int wait();

    /// Bounded wait: at most @p timeout, nullopt if still running
    std::optional<int> wait_for(std::chrono::milliseconds timeout);

    /// Request graceful termination (SIGTERM)
    void terminate();

    /// Forcefully kill the process (SIGKILL)
    void kill();

    /// Close stdin, SIGTERM, wait up to @p grace, then SIGKILL and reap. Idempotent.
    void shutdown(std::chrono::milliseconds grace);

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
};

/// Find an executable in the system PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace mcphub::process
