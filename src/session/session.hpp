#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include "artifacts/artifact_processor.hpp"
#include "runtime/runtime_adapter.hpp"
#include "runtime/runtime_types.hpp"

namespace kiln::session {

enum class SessionState {
    kProvisioning,
    kWarm,
    kExecuting,
    kTerminating,
    kTerminated
};

const char* ToString(SessionState state);

using TimePoint = std::chrono::steady_clock::time_point;

// One sandbox bound to a caller-supplied id. Operations on the session are
// serialized by OpMutex(); state and last-use time have their own lock so the
// registry and the reaper can read them without waiting on an operation.
class Session {
public:
    Session(std::string id, kiln::runtime::RuntimeConfig config, TimePoint created_at);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const { return id_; }
    const kiln::runtime::RuntimeConfig& Config() const { return config_; }
    TimePoint CreatedAt() const { return created_at_; }

    SessionState State() const;
    TimePoint LastUsedAt() const;
    bool IsLive() const;

    std::timed_mutex& OpMutex() { return op_mutex_; }

    // Callers hold OpMutex().
    kiln::runtime::RuntimeAdapter* Adapter() { return adapter_.get(); }
    kiln::artifacts::ArtifactLedger& Ledger() { return ledger_; }
    void SetAdapter(std::unique_ptr<kiln::runtime::RuntimeAdapter> adapter);
    kiln::runtime::TerminationReport TerminateAdapter();

    void SetState(SessionState state);
    // Moves to `to` only from `from`; returns whether it did.
    bool Transition(SessionState from, SessionState to);
    // Never moves backwards, even under a frozen clock.
    void Touch(TimePoint now);

    // Provisioning -> Warm, unless a shutdown already claimed the session.
    bool MarkProvisioned(TimePoint now);
    void FailProvisioning(std::exception_ptr error);
    // Blocks until the session has left Provisioning.
    SessionState WaitProvisioned() const;
    std::exception_ptr ProvisionError() const;

private:
    const std::string id_;
    const kiln::runtime::RuntimeConfig config_;
    const TimePoint created_at_;

    std::timed_mutex op_mutex_;
    std::unique_ptr<kiln::runtime::RuntimeAdapter> adapter_;
    kiln::artifacts::ArtifactLedger ledger_;

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    SessionState state_ = SessionState::kProvisioning;
    TimePoint last_used_at_;
    std::exception_ptr provision_error_;
};

}  // namespace kiln::session
