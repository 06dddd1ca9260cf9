#include "session/session_registry.hpp"

#include "runtime/sandbox_error.hpp"

namespace kiln::session {

std::shared_ptr<Session> SessionRegistry::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::pair<std::shared_ptr<Session>, bool> SessionRegistry::Insert(std::shared_ptr<Session> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw kiln::runtime::SandboxError(kiln::runtime::ErrorCode::kProvisionFailure,
                                          "session manager is shutting down");
    }
    const auto [it, inserted] = sessions_.emplace(session->Id(), session);
    return {it->second, inserted};
}

bool SessionRegistry::Remove(const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session->Id());
    if (it == sessions_.end() || it->second != session) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

std::size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::shared_ptr<Session>> SessionRegistry::CloseAndTakeAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    std::vector<std::shared_ptr<Session>> sessions;
    sessions.reserve(sessions_.size());
    for (auto& [id, session] : sessions_) {
        sessions.push_back(std::move(session));
    }
    sessions_.clear();
    return sessions;
}

bool SessionRegistry::Closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace kiln::session
