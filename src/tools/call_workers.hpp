#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <vector>

namespace kiln::tools {

// Runs tool calls concurrently, one thread each. Finished calls are reaped
// whenever a new one is spawned, so a long-lived loop only holds live ones.
class CallWorkers {
public:
    CallWorkers() = default;
    ~CallWorkers();

    CallWorkers(const CallWorkers&) = delete;
    CallWorkers& operator=(const CallWorkers&) = delete;

    void Spawn(std::function<void()> call);
    // Drops finished calls and returns how many are still running.
    std::size_t Reap();
    void JoinAll();

private:
    std::vector<std::future<void>> calls_;
};

}  // namespace kiln::tools
