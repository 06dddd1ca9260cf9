#include "tools/call_workers.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "utils/logging.hpp"

namespace kiln::tools {
namespace {

void Collect(std::future<void>& call) {
    try {
        call.get();
    } catch (const std::exception& ex) {
        kiln::utils::LogError("tools", "tool call worker failed", {{"error", ex.what()}});
    }
}

}  // namespace

CallWorkers::~CallWorkers() {
    JoinAll();
}

void CallWorkers::Spawn(std::function<void()> call) {
    Reap();
    calls_.push_back(std::async(std::launch::async, std::move(call)));
}

std::size_t CallWorkers::Reap() {
    const auto finished = std::partition(calls_.begin(), calls_.end(), [](const std::future<void>& call) {
        return call.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
    });
    for (auto it = finished; it != calls_.end(); ++it) {
        Collect(*it);
    }
    calls_.erase(finished, calls_.end());
    return calls_.size();
}

void CallWorkers::JoinAll() {
    for (auto& call : calls_) {
        Collect(call);
    }
    calls_.clear();
}

}  // namespace kiln::tools
