#include "session/session.hpp"

namespace kiln::session {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::kProvisioning: return "provisioning";
        case SessionState::kWarm: return "warm";
        case SessionState::kExecuting: return "executing";
        case SessionState::kTerminating: return "terminating";
        case SessionState::kTerminated: return "terminated";
    }
    return "terminated";
}

Session::Session(std::string id, kiln::runtime::RuntimeConfig config, TimePoint created_at)
    : id_(std::move(id))
    , config_(std::move(config))
    , created_at_(created_at)
    , last_used_at_(created_at) {}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

TimePoint Session::LastUsedAt() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_used_at_;
}

bool Session::IsLive() const {
    const auto state = State();
    return state == SessionState::kWarm || state == SessionState::kExecuting;
}

void Session::SetAdapter(std::unique_ptr<kiln::runtime::RuntimeAdapter> adapter) {
    adapter_ = std::move(adapter);
}

kiln::runtime::TerminationReport Session::TerminateAdapter() {
    if (!adapter_) {
        return {};
    }
    return adapter_->Terminate();
}

void Session::SetState(SessionState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
    }
    state_cv_.notify_all();
}

bool Session::Transition(SessionState from, SessionState to) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != from) {
            return false;
        }
        state_ = to;
    }
    state_cv_.notify_all();
    return true;
}

void Session::Touch(TimePoint now) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (now <= last_used_at_) {
        now = last_used_at_ + std::chrono::nanoseconds(1);
    }
    last_used_at_ = now;
}

bool Session::MarkProvisioned(TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::kProvisioning) {
            return false;
        }
        state_ = SessionState::kWarm;
        last_used_at_ = now;
    }
    state_cv_.notify_all();
    return true;
}

void Session::FailProvisioning(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        provision_error_ = std::move(error);
        state_ = SessionState::kTerminated;
    }
    state_cv_.notify_all();
}

SessionState Session::WaitProvisioned() const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return state_ != SessionState::kProvisioning; });
    return state_;
}

std::exception_ptr Session::ProvisionError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return provision_error_;
}

}  // namespace kiln::session
