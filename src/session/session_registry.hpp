#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "session/session.hpp"

namespace kiln::session {

// id -> live Session. Owned by the manager; the lock is held only for
// structural changes, never across a backend call.
class SessionRegistry {
public:
    std::shared_ptr<Session> Find(const std::string& id) const;

    // Inserts `session` unless the id is taken. Returns the entry that ends up
    // in the registry and whether it is the one passed in. Throws
    // SandboxError(kProvisionFailure) once the registry is closed.
    std::pair<std::shared_ptr<Session>, bool> Insert(std::shared_ptr<Session> session);

    // Removes the entry only if it is still `session`.
    bool Remove(const std::shared_ptr<Session>& session);

    std::vector<std::shared_ptr<Session>> List() const;
    std::size_t Size() const;

    // Refuses further inserts and hands back every entry.
    std::vector<std::shared_ptr<Session>> CloseAndTakeAll();
    bool Closed() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    bool closed_ = false;
};

}  // namespace kiln::session
