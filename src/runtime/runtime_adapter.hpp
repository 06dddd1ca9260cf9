#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/runtime_backend.hpp"
#include "runtime/runtime_types.hpp"

namespace kiln::runtime {

struct AdapterTimeouts {
    // How long an aborted backend call may take to unwind before the adapter
    // gives up on it.
    std::chrono::milliseconds abort_grace{2000};
    // Upper bound on the backend's graceful Terminate().
    std::chrono::milliseconds terminate_timeout{10000};
};

struct RunOutcome {
    ExecutionResult result;
    std::vector<std::string> declared_outputs;
};

// Drives one RuntimeBackend and enforces the rules every backend shares:
// start-once, one backend call at a time (others fail with Busy), a
// supervising deadline on execute/install, remote path validation, the
// package allowlist, and bounded termination.
class RuntimeAdapter {
public:
    RuntimeAdapter(std::shared_ptr<RuntimeBackend> backend,
                   RuntimeConfig config,
                   AdapterTimeouts timeouts = {});
    ~RuntimeAdapter();

    RuntimeAdapter(const RuntimeAdapter&) = delete;
    RuntimeAdapter& operator=(const RuntimeAdapter&) = delete;

    const RuntimeConfig& Config() const { return config_; }
    std::string BackendName() const;
    bool IsRunning() const;

    void Start();
    RunOutcome Execute(const std::string& code, Language language);
    ExecutionResult InstallPackage(const std::string& package_spec);

    void Upload(const std::filesystem::path& local_path, const std::string& remote_path);
    void Download(const std::string& remote_path, const std::filesystem::path& local_path);
    std::vector<std::string> ListFiles(const std::string& remote_path = ".");
    FileSnapshot Snapshot();

    // Idempotent; never throws.
    TerminationReport Terminate();

private:
    enum class State {
        kCreated,
        kStarting,
        kRunning,
        kTerminated
    };

    class BusyGuard {
    public:
        explicit BusyGuard(std::atomic<bool>& flag);
        ~BusyGuard();

    private:
        std::atomic<bool>& flag_;
    };

    void RequireRunning() const;
    // Aborts the backend after a missed deadline, tears the adapter down and
    // throws ExecutionTimeoutError with what was captured.
    void FailAfterDeadline(const std::function<bool(std::chrono::milliseconds)>& wait_unwound,
                           const OutputSink& sink,
                           std::chrono::steady_clock::time_point started,
                           const std::string& operation);
    std::string Resolve(const std::string& remote_path) const;

    std::shared_ptr<RuntimeBackend> backend_;
    const RuntimeConfig config_;
    const AdapterTimeouts timeouts_;

    mutable std::mutex state_mutex_;
    State state_ = State::kCreated;
    bool start_attempted_ = false;
    TerminationReport last_report_;
    std::atomic<bool> in_flight_{false};
};

}  // namespace kiln::runtime
