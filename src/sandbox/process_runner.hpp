#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace kiln::sandbox {

struct ResourceLimits {
    std::uint64_t max_memory_bytes = 0;  // RLIMIT_AS, 0 = unlimited
    std::uint64_t max_cpu_seconds = 0;   // RLIMIT_CPU, 0 = unlimited
};

struct ProcessSpec {
    std::string executable;              // absolute path or a name looked up on PATH
    std::vector<std::string> args;
    std::string working_dir;             // empty = current directory
    bool inherit_env = true;
    std::map<std::string, std::string> env;
    ResourceLimits limits;
    bool isolate_network = false;        // best-effort unshare(CLONE_NEWNET) in the child
};

struct ProcessOutcome {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool escaped = false;  // a detached descendant still held the output pipes
};

struct CapturedProcess {
    ProcessOutcome outcome;
    std::string stdout_text;
    std::string stderr_text;
};

using ChunkHandler = std::function<void(const std::string&)>;

// A launched child with piped stdin/stdout/stderr, running in its own process
// group. The child is reaped by this object; destroying it kills the group.
class ChildProcess {
public:
    static std::unique_ptr<ChildProcess> Launch(const ProcessSpec& spec);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid_; }

    void Write(const std::string& data);
    void CloseStdin();
    // Blocks until data is available; returns "" at end of stream or after
    // AbandonOutput.
    std::string ReadStdout();
    std::string ReadStderr();
    // Releases blocked readers even if a descendant outside the process group
    // keeps the pipes open.
    void AbandonOutput();

    // Exit code if the child has exited, without blocking.
    std::optional<int> TryWait();
    // SIGTERM to the group, wait up to `grace`, then SIGKILL. Returns the exit code.
    int Stop(std::chrono::milliseconds grace);
    void Signal(int signal_number);

private:
    struct Impl;
    explicit ChildProcess(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
    pid_t pid_ = -1;
};

class ProcessRunner {
public:
    static constexpr std::chrono::milliseconds kTerminateGrace{2000};

    // Runs to completion, streaming output chunks to the handlers as they
    // arrive. Stops the process group when `timeout` elapses or `cancel`
    // becomes true.
    static ProcessOutcome Run(const ProcessSpec& spec,
                              const std::string& stdin_data,
                              std::chrono::milliseconds timeout,
                              const std::atomic<bool>* cancel,
                              const ChunkHandler& on_stdout,
                              const ChunkHandler& on_stderr);

    static CapturedProcess Capture(const ProcessSpec& spec,
                                   std::chrono::milliseconds timeout,
                                   const std::string& stdin_data = {});
};

}  // namespace kiln::sandbox
