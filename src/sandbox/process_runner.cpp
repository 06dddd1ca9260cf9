#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace kiln::sandbox {
namespace bp = boost::process;

namespace {

constexpr int kReadChunk = 4096;
constexpr int kPollIntervalMs = 100;
constexpr int kTimedOutExitCode = 124;
// How long output may stay open after the child is gone.
constexpr std::chrono::milliseconds kOutputDrain{500};

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Async-signal-safe; used between fork and exec.
void WriteProcFile(const char* path, const char* text, std::size_t length) {
    const int fd = ::open(path, O_WRONLY);
    if (fd >= 0) {
        const auto written = ::write(fd, text, length);
        static_cast<void>(written);
        ::close(fd);
    }
}

// Writes "<id> <id> 1\n" into `out` and returns its length.
std::size_t IdentityMapLine(unsigned id, char* out) {
    char digits[16];
    std::size_t count = 0;
    do {
        digits[count++] = static_cast<char>('0' + id % 10);
        id /= 10;
    } while (id != 0);
    std::size_t length = 0;
    for (int copy = 0; copy < 2; ++copy) {
        for (std::size_t i = count; i > 0; --i) {
            out[length++] = digits[i - 1];
        }
        out[length++] = ' ';
    }
    out[length++] = '1';
    out[length++] = '\n';
    return length;
}

// Maps the caller's ids onto themselves inside a fresh user namespace, so
// files created there keep their owner.
void MapOwnIds(uid_t uid, gid_t gid) {
    char line[48];
    WriteProcFile("/proc/self/setgroups", "deny", 4);
    WriteProcFile("/proc/self/uid_map", line, IdentityMapLine(static_cast<unsigned>(uid), line));
    WriteProcFile("/proc/self/gid_map", line, IdentityMapLine(static_cast<unsigned>(gid), line));
}

// Runs in the forked child before exec.
struct ChildSetup : bp::extend::handler {
    ResourceLimits limits;
    bool isolate_network = false;

    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
        if (limits.max_memory_bytes > 0) {
            rlimit rl{};
            rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.max_memory_bytes);
            ::setrlimit(RLIMIT_AS, &rl);
        }
        if (limits.max_cpu_seconds > 0) {
            rlimit rl{};
            rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.max_cpu_seconds);
            ::setrlimit(RLIMIT_CPU, &rl);
        }
        if (isolate_network) {
            if (::unshare(CLONE_NEWNET) != 0) {
                const auto uid = ::geteuid();
                const auto gid = ::getegid();
                if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0) {
                    MapOwnIds(uid, gid);
                }
            }
        }
    }
};

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string ResolveExecutable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return executable;
    }
    const auto found = bp::search_path(executable);
    if (found.empty()) {
        throw std::runtime_error("executable not found on PATH: " + executable);
    }
    return found.string();
}

// Blocks until the pipe has data or reaches end of stream, checking
// `abandoned` between polls. Returns "" at end of stream or once abandoned.
std::string ReadChunk(bp::pipe& pipe, const std::atomic<bool>& abandoned) {
    pollfd watched{};
    watched.fd = pipe.native_source();
    watched.events = POLLIN;
    for (;;) {
        if (abandoned.load()) {
            return {};
        }
        watched.revents = 0;
        const int ready = ::poll(&watched, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("poll on child output failed: ") + std::strerror(errno));
        }
        if (ready > 0) {
            break;
        }
    }
    char buffer[kReadChunk];
    const auto n = pipe.read(buffer, kReadChunk);
    return n > 0 ? std::string(buffer, static_cast<std::size_t>(n)) : std::string();
}

}  // namespace

struct ChildProcess::Impl {
    bp::pipe in;
    bp::pipe out;
    bp::pipe err;
    bp::child child;
    std::mutex wait_mutex;
    std::optional<int> exit_code;
    std::atomic<bool> abandoned{false};
};

ChildProcess::ChildProcess(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)), pid_(impl_->child.id()) {}

std::unique_ptr<ChildProcess> ChildProcess::Launch(const ProcessSpec& spec) {
    IgnoreSigpipeOnce();
    auto impl = std::make_unique<Impl>();

    bp::environment env;
    if (spec.inherit_env) {
        env = bp::environment(boost::this_process::environment());
    }
    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }
    const auto start_dir = spec.working_dir.empty()
        ? std::filesystem::current_path().string()
        : spec.working_dir;

    ChildSetup setup;
    setup.limits = spec.limits;
    setup.isolate_network = spec.isolate_network;

    try {
        impl->child = bp::child(
            bp::exe = ResolveExecutable(spec.executable),
            bp::args = spec.args,
            env,
            bp::start_dir = start_dir,
            bp::std_in < impl->in,
            bp::std_out > impl->out,
            bp::std_err > impl->err,
            setup);
    } catch (const bp::process_error& ex) {
        throw std::runtime_error("failed to launch " + spec.executable + ": " + ex.what());
    }
    // Reaped through waitpid below, not through bp::child.
    impl->child.detach();
    return std::unique_ptr<ChildProcess>(new ChildProcess(std::move(impl)));
}

ChildProcess::~ChildProcess() {
    if (!TryWait().has_value()) {
        Signal(SIGKILL);
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        if (!impl_->exit_code.has_value()) {
            int status = 0;
            if (::waitpid(pid_, &status, 0) == pid_) {
                impl_->exit_code = DecodeStatus(status);
            }
        }
    }
    // Stray descendants still in the group.
    ::kill(-pid_, SIGKILL);
}

void ChildProcess::Write(const std::string& data) {
    std::size_t offset = 0;
    while (offset < data.size()) {
        const auto written = impl_->in.write(data.data() + offset, static_cast<int>(data.size() - offset));
        if (written <= 0) {
            throw std::runtime_error("short write to child stdin");
        }
        offset += static_cast<std::size_t>(written);
    }
}

void ChildProcess::CloseStdin() {
    const auto sink = impl_->in.native_sink();
    if (sink != -1) {
        ::close(sink);
        impl_->in.assign_sink(-1);
    }
}

std::string ChildProcess::ReadStdout() {
    return ReadChunk(impl_->out, impl_->abandoned);
}

std::string ChildProcess::ReadStderr() {
    return ReadChunk(impl_->err, impl_->abandoned);
}

void ChildProcess::AbandonOutput() {
    impl_->abandoned.store(true);
}

std::optional<int> ChildProcess::TryWait() {
    std::lock_guard<std::mutex> lock(impl_->wait_mutex);
    if (impl_->exit_code.has_value()) {
        return impl_->exit_code;
    }
    int status = 0;
    const auto waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        impl_->exit_code = DecodeStatus(status);
    } else if (waited < 0) {
        impl_->exit_code = -1;
    }
    return impl_->exit_code;
}

void ChildProcess::Signal(int signal_number) {
    std::lock_guard<std::mutex> lock(impl_->wait_mutex);
    // Once reaped, the pid may be reused; only the group is addressed.
    if (::kill(-pid_, signal_number) != 0 && !impl_->exit_code.has_value()) {
        ::kill(pid_, signal_number);
    }
}

int ChildProcess::Stop(std::chrono::milliseconds grace) {
    if (auto code = TryWait()) {
        return *code;
    }
    Signal(SIGTERM);
    const auto grace_deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < grace_deadline) {
        if (auto code = TryWait()) {
            return *code;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    Signal(SIGKILL);
    std::lock_guard<std::mutex> lock(impl_->wait_mutex);
    if (!impl_->exit_code.has_value()) {
        int status = 0;
        impl_->exit_code = ::waitpid(pid_, &status, 0) == pid_ ? DecodeStatus(status) : -1;
    }
    return *impl_->exit_code;
}

ProcessOutcome ProcessRunner::Run(const ProcessSpec& spec,
                                  const std::string& stdin_data,
                                  std::chrono::milliseconds timeout,
                                  const std::atomic<bool>* cancel,
                                  const ChunkHandler& on_stdout,
                                  const ChunkHandler& on_stderr) {
    ProcessOutcome outcome{};
    auto process = ChildProcess::Launch(spec);

    std::thread writer([&process, &stdin_data] {
        try {
            if (!stdin_data.empty()) {
                process->Write(stdin_data);
            }
        } catch (const std::exception& ex) {
            kiln::utils::LogDebug("process", "stdin write stopped", {{"error", ex.what()}});
        }
        process->CloseStdin();
    });
    std::atomic<bool> out_done{false};
    std::atomic<bool> err_done{false};
    auto pump = [](const char* stream, const std::function<std::string()>& read, const ChunkHandler& handler,
                   std::atomic<bool>& done) {
        try {
            for (;;) {
                auto chunk = read();
                if (chunk.empty()) {
                    break;
                }
                if (handler) {
                    handler(chunk);
                }
            }
        } catch (const std::exception& ex) {
            kiln::utils::LogWarn("process", "output reader failed", {{"stream", stream}, {"error", ex.what()}});
        }
        done.store(true);
    };
    std::thread out_reader(pump, "stdout", [&process] { return process->ReadStdout(); }, std::cref(on_stdout),
                           std::ref(out_done));
    std::thread err_reader(pump, "stderr", [&process] { return process->ReadStderr(); }, std::cref(on_stderr),
                           std::ref(err_done));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::optional<int> exit_code;
    while (std::chrono::steady_clock::now() < deadline) {
        exit_code = process->TryWait();
        if (exit_code.has_value()) {
            break;
        }
        if (cancel != nullptr && cancel->load()) {
            outcome.cancelled = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!exit_code.has_value()) {
        outcome.timed_out = !outcome.cancelled;
        const auto code = process->Stop(kTerminateGrace);
        outcome.exit_code = outcome.timed_out ? kTimedOutExitCode : code;
    } else {
        outcome.exit_code = *exit_code;
    }
    // Background children may still hold the pipes open.
    process->Signal(SIGKILL);
    const auto drain_deadline = std::chrono::steady_clock::now() + kOutputDrain;
    while ((!out_done.load() || !err_done.load()) && std::chrono::steady_clock::now() < drain_deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (!out_done.load() || !err_done.load()) {
        // A descendant left the process group and kept the pipes.
        kiln::utils::LogWarn("process", "abandoning output held open by a detached descendant",
                             {{"executable", spec.executable}});
        process->AbandonOutput();
        outcome.escaped = true;
    }

    writer.join();
    out_reader.join();
    err_reader.join();
    return outcome;
}

CapturedProcess ProcessRunner::Capture(const ProcessSpec& spec,
                                       std::chrono::milliseconds timeout,
                                       const std::string& stdin_data) {
    CapturedProcess captured{};
    std::mutex mutex;
    captured.outcome = Run(
        spec, stdin_data, timeout, nullptr,
        [&](const std::string& chunk) {
            std::lock_guard<std::mutex> lock(mutex);
            captured.stdout_text += chunk;
        },
        [&](const std::string& chunk) {
            std::lock_guard<std::mutex> lock(mutex);
            captured.stderr_text += chunk;
        });
    return captured;
}

}  // namespace kiln::sandbox
