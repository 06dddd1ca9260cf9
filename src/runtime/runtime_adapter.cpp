#include "runtime/runtime_adapter.hpp"

#include <future>
#include <thread>
#include <type_traits>
#include <utility>

#include "runtime/path_policy.hpp"
#include "runtime/sandbox_error.hpp"
#include "utils/logging.hpp"

namespace kiln::runtime {
namespace {

constexpr int kTimedOutExitCode = 124;

// Runs fn on a detached thread. The thread owns everything it touches, so a
// call that never returns cannot outlive its data.
template <typename Fn>
auto LaunchDetached(Fn fn) -> std::future<decltype(fn())> {
    using Result = decltype(fn());
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

template <typename Result>
Result GetOrMap(std::future<Result>& future, ErrorCode fallback, const std::string& context) {
    try {
        return future.get();
    } catch (const SandboxError&) {
        throw;
    } catch (const std::exception& ex) {
        throw SandboxError(fallback, context + ": " + ex.what());
    }
}

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

}  // namespace

RuntimeAdapter::BusyGuard::BusyGuard(std::atomic<bool>& flag) : flag_(flag) {
    if (flag_.exchange(true)) {
        throw SandboxError(ErrorCode::kBusy, "another operation is in flight on this sandbox");
    }
}

RuntimeAdapter::BusyGuard::~BusyGuard() {
    flag_.store(false);
}

RuntimeAdapter::RuntimeAdapter(std::shared_ptr<RuntimeBackend> backend,
                               RuntimeConfig config,
                               AdapterTimeouts timeouts)
    : backend_(std::move(backend)), config_(std::move(config)), timeouts_(timeouts) {}

RuntimeAdapter::~RuntimeAdapter() {
    Terminate();
}

std::string RuntimeAdapter::BackendName() const {
    return backend_->Name();
}

bool RuntimeAdapter::IsRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::kRunning;
}

void RuntimeAdapter::Start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (start_attempted_) {
            throw SandboxError(ErrorCode::kAlreadyStarted, "sandbox was already started");
        }
        start_attempted_ = true;
        state_ = State::kStarting;
    }
    try {
        backend_->Start(config_);
    } catch (const std::exception& ex) {
        kiln::utils::LogError("runtime", "backend failed to start",
                              {{"backend", backend_->Name()}, {"error", ex.what()}});
        const auto report = Terminate();
        if (!report.clean) {
            kiln::utils::LogWarn("runtime", "cleanup after failed start was unclean", {{"error", report.error}});
        }
        throw SandboxError(ErrorCode::kProvisionFailure,
                           "failed to provision " + backend_->Name() + " sandbox: " + ex.what());
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == State::kStarting) {
        state_ = State::kRunning;
    }
    kiln::utils::LogInfo("runtime", "sandbox started", {{"backend", backend_->Name()}});
}

void RuntimeAdapter::RequireRunning() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::kRunning) {
        throw SandboxError(ErrorCode::kNotStarted, "sandbox is not running");
    }
}

std::string RuntimeAdapter::Resolve(const std::string& remote_path) const {
    return ResolveRemotePath(config_.working_directory, remote_path);
}

void RuntimeAdapter::FailAfterDeadline(const std::function<bool(std::chrono::milliseconds)>& wait_unwound,
                                       const OutputSink& sink,
                                       std::chrono::steady_clock::time_point started,
                                       const std::string& operation) {
    kiln::utils::LogWarn("runtime", operation + " exceeded its deadline",
                         {{"backend", backend_->Name()},
                          {"limit_ms", std::to_string(config_.max_execution_time.count())}});
    try {
        backend_->Abort();
    } catch (const std::exception& ex) {
        kiln::utils::LogWarn("runtime", "abort failed", {{"error", ex.what()}});
    }
    if (!wait_unwound(timeouts_.abort_grace)) {
        kiln::utils::LogWarn("runtime", "backend call did not unwind after abort");
    }

    ExecutionResult partial{};
    partial.stdout_text = sink.Stdout();
    partial.stderr_text = sink.Stderr();
    partial.exit_code = kTimedOutExitCode;
    partial.execution_duration = ElapsedSince(started);

    const auto report = Terminate();
    if (!report.clean) {
        kiln::utils::LogWarn("runtime", "termination after timeout was unclean", {{"error", report.error}});
    }
    throw ExecutionTimeoutError(
        operation + " timed out after " + std::to_string(config_.max_execution_time.count()) + " ms",
        std::move(partial));
}

RunOutcome RuntimeAdapter::Execute(const std::string& code, Language language) {
    BusyGuard guard(in_flight_);
    RequireRunning();

    auto sink = std::make_shared<OutputSink>();
    auto backend = backend_;
    const auto started = std::chrono::steady_clock::now();
    auto future = LaunchDetached([backend, sink, code, language] {
        return backend->Run(code, language, *sink);
    });
    if (future.wait_for(config_.max_execution_time) != std::future_status::ready) {
        FailAfterDeadline(
            [&future](std::chrono::milliseconds grace) {
                return future.wait_for(grace) == std::future_status::ready;
            },
            *sink, started, "execution");
    }
    auto run = GetOrMap(future, ErrorCode::kBackendFailure, "execution failed");

    RunOutcome outcome{};
    outcome.result.stdout_text = sink->Stdout();
    outcome.result.stderr_text = sink->Stderr();
    outcome.result.exit_code = run.exit_code;
    outcome.result.execution_duration = ElapsedSince(started);
    outcome.declared_outputs = std::move(run.declared_outputs);
    kiln::utils::LogDebug("runtime", "execution finished",
                          {{"language", ToString(language)},
                           {"exit_code", std::to_string(run.exit_code)},
                           {"duration_ms", std::to_string(outcome.result.execution_duration.count())}});
    return outcome;
}

ExecutionResult RuntimeAdapter::InstallPackage(const std::string& package_spec) {
    BusyGuard guard(in_flight_);
    RequireRunning();
    CheckPackageAllowed(package_spec, config_.network_policy.allowed_packages);

    auto sink = std::make_shared<OutputSink>();
    auto backend = backend_;
    const auto started = std::chrono::steady_clock::now();
    auto future = LaunchDetached([backend, sink, package_spec] {
        backend->InstallPackage(package_spec, *sink);
    });
    if (future.wait_for(config_.max_execution_time) != std::future_status::ready) {
        FailAfterDeadline(
            [&future](std::chrono::milliseconds grace) {
                return future.wait_for(grace) == std::future_status::ready;
            },
            *sink, started, "package installation");
    }
    GetOrMap(future, ErrorCode::kBackendFailure, "failed to install " + package_spec);

    ExecutionResult result{};
    result.stdout_text = sink->Stdout();
    result.stderr_text = sink->Stderr();
    result.exit_code = 0;
    result.execution_duration = ElapsedSince(started);
    kiln::utils::LogInfo("runtime", "package installed", {{"package", package_spec}});
    return result;
}

void RuntimeAdapter::Upload(const std::filesystem::path& local_path, const std::string& remote_path) {
    BusyGuard guard(in_flight_);
    RequireRunning();
    const auto resolved = Resolve(remote_path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(local_path, ec)) {
        throw SandboxError(ErrorCode::kNotFound, "local file not found: " + local_path.string());
    }
    try {
        backend_->Upload(local_path, resolved);
    } catch (const SandboxError&) {
        throw;
    } catch (const std::exception& ex) {
        throw SandboxError(ErrorCode::kBackendFailure, "upload to " + resolved + " failed: " + ex.what());
    }
}

void RuntimeAdapter::Download(const std::string& remote_path, const std::filesystem::path& local_path) {
    BusyGuard guard(in_flight_);
    RequireRunning();
    const auto resolved = Resolve(remote_path);
    try {
        backend_->Download(resolved, local_path);
    } catch (const SandboxError&) {
        throw;
    } catch (const std::exception& ex) {
        throw SandboxError(ErrorCode::kBackendFailure, "download of " + resolved + " failed: " + ex.what());
    }
}

std::vector<std::string> RuntimeAdapter::ListFiles(const std::string& remote_path) {
    BusyGuard guard(in_flight_);
    RequireRunning();
    const auto resolved = Resolve(remote_path);
    try {
        return backend_->ListFiles(resolved);
    } catch (const SandboxError&) {
        throw;
    } catch (const std::exception& ex) {
        throw SandboxError(ErrorCode::kBackendFailure, "listing " + resolved + " failed: " + ex.what());
    }
}

FileSnapshot RuntimeAdapter::Snapshot() {
    BusyGuard guard(in_flight_);
    RequireRunning();
    try {
        return backend_->Snapshot();
    } catch (const SandboxError&) {
        throw;
    } catch (const std::exception& ex) {
        throw SandboxError(ErrorCode::kBackendFailure, std::string("snapshot failed: ") + ex.what());
    }
}

TerminationReport RuntimeAdapter::Terminate() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == State::kTerminated) {
            return last_report_;
        }
        const bool never_started = state_ == State::kCreated;
        state_ = State::kTerminated;
        if (never_started) {
            last_report_ = TerminationReport{};
            return last_report_;
        }
    }

    TerminationReport report{};
    auto backend = backend_;
    auto future = LaunchDetached([backend] { backend->Terminate(); });
    if (future.wait_for(timeouts_.terminate_timeout) == std::future_status::ready) {
        try {
            future.get();
        } catch (const std::exception& ex) {
            report.clean = false;
            report.error = ex.what();
        }
    } else {
        report.clean = false;
        report.error = "graceful termination timed out";
    }

    if (!report.clean) {
        kiln::utils::LogWarn("runtime", "graceful termination failed, forcing",
                             {{"backend", backend_->Name()}, {"error", report.error}});
        auto forced = LaunchDetached([backend] { backend->ForceKill(); });
        if (forced.wait_for(timeouts_.terminate_timeout) != std::future_status::ready) {
            report.error += "; force kill timed out";
            kiln::utils::LogError("runtime", "force kill timed out", {{"backend", backend_->Name()}});
        } else {
            try {
                forced.get();
                report.clean = true;
            } catch (const std::exception& ex) {
                report.error += "; force kill failed: " + std::string(ex.what());
                kiln::utils::LogError("runtime", "force kill failed",
                                      {{"backend", backend_->Name()}, {"error", ex.what()}});
            }
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_report_ = report;
    return report;
}

}  // namespace kiln::runtime
