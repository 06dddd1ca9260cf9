#include "session/session_manager.hpp"

#include <future>
#include <optional>
#include <thread>
#include <utility>

#include "runtime/sandbox_error.hpp"
#include "utils/logging.hpp"

namespace kiln::session {
namespace {

using kiln::runtime::ErrorCode;
using kiln::runtime::SandboxError;

std::string Quoted(const std::string& id) {
    return "session '" + id + "'";
}

std::string Millis(std::chrono::milliseconds value) {
    return std::to_string(value.count());
}

}  // namespace

// Try-locks the session for one call and puts it back afterwards. When a
// shutdown has claimed the session meanwhile, the session ends here.
class SessionManager::Operation {
public:
    Operation(std::shared_ptr<Session> session, bool execute_class)
        : session_(std::move(session))
        , lock_(session_->OpMutex(), std::try_to_lock)
        , execute_class_(execute_class) {
        if (!lock_.owns_lock()) {
            throw SandboxError(ErrorCode::kBusy, Quoted(session_->Id()) + " is busy");
        }
        const auto state = session_->State();
        if (state == SessionState::kProvisioning) {
            throw SandboxError(ErrorCode::kBusy, Quoted(session_->Id()) + " is still provisioning");
        }
        if (state != SessionState::kWarm || session_->Adapter() == nullptr ||
            (execute_class_ && !session_->Transition(SessionState::kWarm, SessionState::kExecuting))) {
            throw SandboxError(ErrorCode::kSessionNotFound, Quoted(session_->Id()) + " is closed");
        }
    }

    ~Operation() {
        if (execute_class_ && session_->Transition(SessionState::kExecuting, SessionState::kWarm)) {
            return;
        }
        if (session_->State() != SessionState::kTerminating) {
            return;
        }
        const auto report = session_->TerminateAdapter();
        session_->SetState(SessionState::kTerminated);
        kiln::utils::LogInfo("session", "terminated after shutdown",
                             {{"session", session_->Id()}, {"clean", report.clean ? "true" : "false"}});
    }

    Operation(const Operation&) = delete;
    Operation& operator=(const Operation&) = delete;

    kiln::runtime::RuntimeAdapter& Adapter() { return *session_->Adapter(); }

private:
    std::shared_ptr<Session> session_;
    std::unique_lock<std::timed_mutex> lock_;
    bool execute_class_;
};

SessionManager::SessionManager(std::shared_ptr<kiln::backends::AdapterFactory> factory,
                               kiln::artifacts::ArtifactProcessor processor,
                               std::shared_ptr<kiln::integrations::AuditDispatcher> audit,
                               SessionManagerOptions options,
                               Clock clock)
    : factory_(std::move(factory))
    , processor_(std::move(processor))
    , audit_(std::move(audit))
    , options_(options)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , reaper_([this] { return ScanIdle(); }, options.reaper_interval) {}

SessionManager::~SessionManager() {
    Shutdown();
}

std::shared_ptr<Session> SessionManager::GetOrCreateSession(const std::string& id,
                                                            const kiln::runtime::RuntimeConfig& config) {
    if (id.empty()) {
        throw SandboxError(ErrorCode::kProvisionFailure, "session id is empty");
    }
    for (;;) {
        if (auto existing = registry_.Find(id)) {
            const auto state = existing->WaitProvisioned();
            if (state == SessionState::kWarm || state == SessionState::kExecuting) {
                existing->Touch(clock_());
                return existing;
            }
            if (auto error = existing->ProvisionError()) {
                std::rethrow_exception(error);
            }
            // Being closed; its entry is about to go.
            std::this_thread::yield();
            continue;
        }
        auto fresh = std::make_shared<Session>(id, config, clock_());
        std::unique_lock<std::timed_mutex> op(fresh->OpMutex());
        auto [session, inserted] = registry_.Insert(fresh);
        if (!inserted) {
            continue;
        }
        return Provision(std::move(session), std::move(op));
    }
}

std::shared_ptr<Session> SessionManager::Provision(std::shared_ptr<Session> session,
                                                   std::unique_lock<std::timed_mutex> op) {
    const auto& config = session->Config();
    kiln::utils::LogInfo("session", "provisioning",
                         {{"session", session->Id()},
                          {"backend", kiln::runtime::ToString(config.backend_kind)},
                          {"network", kiln::runtime::ToString(config.network_policy.mode)}});

    auto fail = [&](std::exception_ptr error, const std::string& reason) {
        registry_.Remove(session);
        session->FailProvisioning(std::move(error));
        kiln::utils::LogError("session", "provisioning failed", {{"session", session->Id()}, {"error", reason}});
    };

    try {
        auto adapter = factory_->Create(config);
        adapter->Start();
        session->SetAdapter(std::move(adapter));
    } catch (const SandboxError& ex) {
        fail(std::current_exception(), ex.what());
        throw;
    } catch (const std::exception& ex) {
        SandboxError wrapped(ErrorCode::kProvisionFailure, ex.what());
        fail(std::make_exception_ptr(wrapped), ex.what());
        throw wrapped;
    }

    if (!session->MarkProvisioned(clock_())) {
        session->TerminateAdapter();
        SandboxError cancelled(ErrorCode::kProvisionFailure, "session manager shut down during provisioning");
        fail(std::make_exception_ptr(cancelled), cancelled.what());
        throw cancelled;
    }
    kiln::utils::LogInfo("session", "ready", {{"session", session->Id()}});
    return session;
}

std::shared_ptr<Session> SessionManager::RequireSession(const std::string& id) const {
    auto session = registry_.Find(id);
    if (!session) {
        throw SandboxError(ErrorCode::kSessionNotFound, Quoted(id) + " not found");
    }
    return session;
}

kiln::runtime::ExecutionResult SessionManager::Execute(const std::string& id,
                                                       const std::string& code,
                                                       kiln::runtime::Language language) {
    auto session = RequireSession(id);
    Operation op(session, true);
    auto& adapter = op.Adapter();
    if (audit_) {
        audit_->Publish(id, kiln::runtime::ToString(language), code);
    }

    std::optional<kiln::runtime::FileSnapshot> before;
    try {
        before = adapter.Snapshot();
    } catch (const std::exception& ex) {
        kiln::utils::LogWarn("session", "pre-execution snapshot failed", {{"session", id}, {"error", ex.what()}});
    }

    kiln::runtime::RunOutcome outcome;
    try {
        outcome = adapter.Execute(code, language);
    } catch (const kiln::runtime::ExecutionTimeoutError&) {
        EndAfterTimeout(session);
        throw;
    }

    if (before.has_value() || !outcome.declared_outputs.empty()) {
        CollectArtifacts(*session, before.value_or(kiln::runtime::FileSnapshot{}), outcome);
    } else {
        outcome.result.warnings.push_back("artifact scan skipped: no pre-execution snapshot");
    }
    session->Touch(clock_());
    kiln::utils::LogInfo("session", "executed",
                         {{"session", id},
                          {"language", kiln::runtime::ToString(language)},
                          {"exit_code", std::to_string(outcome.result.exit_code)},
                          {"duration_ms", Millis(outcome.result.execution_duration)},
                          {"artifacts", std::to_string(outcome.result.artifacts.size())}});
    return std::move(outcome.result);
}

void SessionManager::CollectArtifacts(Session& session,
                                      const kiln::runtime::FileSnapshot& before,
                                      kiln::runtime::RunOutcome& outcome) {
    auto& adapter = *session.Adapter();
    kiln::runtime::FileSnapshot after;
    try {
        after = adapter.Snapshot();
    } catch (const std::exception& ex) {
        outcome.result.warnings.push_back(std::string("artifact scan failed: ") + ex.what());
        kiln::utils::LogWarn("session", "post-execution snapshot failed",
                             {{"session", session.Id()}, {"error", ex.what()}});
        return;
    }
    const auto candidates = outcome.declared_outputs.empty()
        ? kiln::artifacts::ArtifactProcessor::ChangedFiles(before, after)
        : outcome.declared_outputs;
    if (candidates.empty()) {
        return;
    }
    processor_.Process(
        session.Id(),
        session.Config().working_directory,
        candidates,
        after,
        [&adapter](const std::string& remote_path, const std::filesystem::path& local_path) {
            adapter.Download(remote_path, local_path);
        },
        session.Ledger(),
        outcome.result);
}

kiln::runtime::ExecutionResult SessionManager::InstallPackage(const std::string& id, const std::string& package_spec) {
    auto session = RequireSession(id);
    Operation op(session, true);
    try {
        auto result = op.Adapter().InstallPackage(package_spec);
        session->Touch(clock_());
        kiln::utils::LogInfo("session", "package install finished",
                             {{"session", id}, {"package", package_spec}, {"exit_code", std::to_string(result.exit_code)}});
        return result;
    } catch (const kiln::runtime::ExecutionTimeoutError&) {
        EndAfterTimeout(session);
        throw;
    }
}

std::vector<std::string> SessionManager::ListFiles(const std::string& id, const std::string& path) {
    auto session = RequireSession(id);
    Operation op(session, false);
    auto entries = op.Adapter().ListFiles(path);
    session->Touch(clock_());
    return entries;
}

void SessionManager::Upload(const std::string& id,
                            const std::filesystem::path& local_path,
                            const std::string& remote_path) {
    auto session = RequireSession(id);
    Operation op(session, false);
    op.Adapter().Upload(local_path, remote_path);
    session->Touch(clock_());
}

void SessionManager::Download(const std::string& id,
                              const std::string& remote_path,
                              const std::filesystem::path& local_path) {
    auto session = RequireSession(id);
    Operation op(session, false);
    op.Adapter().Download(remote_path, local_path);
    session->Touch(clock_());
}

void SessionManager::EndAfterTimeout(const std::shared_ptr<Session>& session) {
    session->SetState(SessionState::kTerminating);
    registry_.Remove(session);
    const auto report = session->TerminateAdapter();
    session->SetState(SessionState::kTerminated);
    kiln::utils::LogWarn("session", "execution timed out; session terminated",
                         {{"session", session->Id()},
                          {"limit_ms", Millis(session->Config().max_execution_time)},
                          {"clean", report.clean ? "true" : "false"}});
}

void SessionManager::CloseSession(const std::string& id) {
    auto session = RequireSession(id);
    std::unique_lock<std::timed_mutex> op(session->OpMutex());
    if (!session->Transition(SessionState::kWarm, SessionState::kTerminating)) {
        throw SandboxError(ErrorCode::kSessionNotFound, Quoted(id) + " not found");
    }
    registry_.Remove(session);
    const auto report = session->TerminateAdapter();
    session->SetState(SessionState::kTerminated);
    if (!report.clean) {
        kiln::utils::LogError("session", "termination was not clean", {{"session", id}, {"error", report.error}});
        throw SandboxError(ErrorCode::kTerminationFailure,
                           Quoted(id) + " did not terminate cleanly: " + report.error);
    }
    kiln::utils::LogInfo("session", "closed", {{"session", id}});
}

std::shared_ptr<Session> SessionManager::GetSession(const std::string& id) const {
    return registry_.Find(id);
}

std::size_t SessionManager::SessionCount() const {
    return registry_.Size();
}

void SessionManager::StartReaper() {
    reaper_.Start();
}

ReapReport SessionManager::ReapOnce() {
    return reaper_.RunOnce();
}

ReapReport SessionManager::ScanIdle() {
    ReapReport report{};
    const auto now = clock_();
    for (const auto& session : registry_.List()) {
        ++report.scanned;
        std::unique_lock<std::timed_mutex> op(session->OpMutex(), std::try_to_lock);
        if (!op.owns_lock()) {
            ++report.skipped_busy;
            continue;
        }
        if (session->State() != SessionState::kWarm ||
            now - session->LastUsedAt() <= session->Config().idle_timeout) {
            continue;
        }
        if (!session->Transition(SessionState::kWarm, SessionState::kTerminating)) {
            continue;
        }
        registry_.Remove(session);
        const auto result = session->TerminateAdapter();
        session->SetState(SessionState::kTerminated);
        ++report.reaped;
        if (result.clean) {
            kiln::utils::LogInfo("reaper", "reaped idle session", {{"session", session->Id()}});
        } else {
            ++report.failures;
            kiln::utils::LogWarn("reaper", "idle session did not terminate cleanly",
                                 {{"session", session->Id()}, {"error", result.error}});
        }
    }
    return report;
}

void SessionManager::TerminateForShutdown(const std::shared_ptr<Session>& session) {
    const bool claimed = session->Transition(SessionState::kWarm, SessionState::kTerminating) ||
                         session->Transition(SessionState::kExecuting, SessionState::kTerminating) ||
                         session->Transition(SessionState::kProvisioning, SessionState::kTerminating);
    if (!claimed) {
        return;
    }
    std::unique_lock<std::timed_mutex> op(session->OpMutex(), std::defer_lock);
    if (!op.try_lock_for(options_.shutdown_grace)) {
        kiln::utils::LogWarn("session", "operation still running at shutdown; it will terminate the session itself",
                             {{"session", session->Id()}, {"grace_ms", Millis(options_.shutdown_grace)}});
        return;
    }
    if (session->State() == SessionState::kTerminated) {
        return;
    }
    const auto report = session->TerminateAdapter();
    session->SetState(SessionState::kTerminated);
    if (!report.clean) {
        kiln::utils::LogWarn("session", "termination was not clean",
                             {{"session", session->Id()}, {"error", report.error}});
    }
}

void SessionManager::Shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    const auto sessions = registry_.CloseAndTakeAll();
    kiln::utils::LogInfo("session", "shutting down", {{"sessions", std::to_string(sessions.size())}});

    std::vector<std::future<void>> pending;
    pending.reserve(sessions.size());
    for (const auto& session : sessions) {
        pending.push_back(std::async(std::launch::async, [this, session] { TerminateForShutdown(session); }));
    }
    for (auto& terminated : pending) {
        try {
            terminated.get();
        } catch (const std::exception& ex) {
            kiln::utils::LogError("session", "termination during shutdown failed", {{"error", ex.what()}});
        }
    }
    reaper_.Stop();
}

}  // namespace kiln::session
