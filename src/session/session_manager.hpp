#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "artifacts/artifact_processor.hpp"
#include "backends/adapter_factory.hpp"
#include "integrations/audit.hpp"
#include "runtime/runtime_types.hpp"
#include "session/reaper.hpp"
#include "session/session.hpp"
#include "session/session_registry.hpp"

namespace kiln::session {

struct SessionManagerOptions {
    std::chrono::milliseconds reaper_interval{30000};
    // How long Shutdown waits for a session's in-flight operation.
    std::chrono::milliseconds shutdown_grace{10000};
};

// Owns every live sandbox. Each caller-supplied session id maps to at most
// one Session; operations on one session are serialized, operations on
// different sessions run in parallel.
class SessionManager {
public:
    using Clock = std::function<TimePoint()>;

    SessionManager(std::shared_ptr<kiln::backends::AdapterFactory> factory,
                   kiln::artifacts::ArtifactProcessor processor,
                   std::shared_ptr<kiln::integrations::AuditDispatcher> audit,
                   SessionManagerOptions options = {},
                   Clock clock = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Returns the live session for `id`, provisioning it from `config` when
    // there is none. Concurrent callers for a new id share one boot and see
    // the same session or the same ProvisionFailure.
    std::shared_ptr<Session> GetOrCreateSession(const std::string& id, const kiln::runtime::RuntimeConfig& config);

    kiln::runtime::ExecutionResult Execute(const std::string& id,
                                           const std::string& code,
                                           kiln::runtime::Language language);
    kiln::runtime::ExecutionResult InstallPackage(const std::string& id, const std::string& package_spec);
    std::vector<std::string> ListFiles(const std::string& id, const std::string& path = ".");
    void Upload(const std::string& id, const std::filesystem::path& local_path, const std::string& remote_path);
    void Download(const std::string& id, const std::string& remote_path, const std::filesystem::path& local_path);

    // Waits for the in-flight operation, then terminates. Throws
    // SessionNotFound, or TerminationFailure after removing the entry.
    void CloseSession(const std::string& id);

    std::shared_ptr<Session> GetSession(const std::string& id) const;
    std::size_t SessionCount() const;

    void StartReaper();
    ReapReport ReapOnce();
    ReaperStats ReaperStatistics() const { return reaper_.Stats(); }

    // Best-effort; never throws.
    void Shutdown();

private:
    // Holds the session's operation lock for one call.
    class Operation;

    std::shared_ptr<Session> Provision(std::shared_ptr<Session> session, std::unique_lock<std::timed_mutex> op);
    std::shared_ptr<Session> RequireSession(const std::string& id) const;
    void EndAfterTimeout(const std::shared_ptr<Session>& session);
    void CollectArtifacts(Session& session,
                          const kiln::runtime::FileSnapshot& before,
                          kiln::runtime::RunOutcome& outcome);
    ReapReport ScanIdle();
    void TerminateForShutdown(const std::shared_ptr<Session>& session);

    std::shared_ptr<kiln::backends::AdapterFactory> factory_;
    kiln::artifacts::ArtifactProcessor processor_;
    std::shared_ptr<kiln::integrations::AuditDispatcher> audit_;
    SessionManagerOptions options_;
    Clock clock_;
    SessionRegistry registry_;
    Reaper reaper_;
    std::atomic<bool> shut_down_{false};
};

}  // namespace kiln::session
