#include "integrations/audit.hpp"

#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace kiln::integrations {

void LogAuditSink::Notify(const AuditEvent& event) {
    kiln::utils::LogInfo("audit", "AUDIT: executing " + event.language + " code",
                         {{"hash", event.code_hash},
                          {"length", std::to_string(event.code.size())},
                          {"session", event.session_id}});
}

AuditDispatcher::AuditDispatcher(std::shared_ptr<AuditSink> sink, std::size_t max_pending)
    : sink_(std::move(sink)), max_pending_(max_pending) {}

AuditDispatcher::~AuditDispatcher() {
    Stop();
}

void AuditDispatcher::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void AuditDispatcher::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AuditDispatcher::Publish(const std::string& session_id, const std::string& language, const std::string& code) {
    AuditEvent event{session_id, language, kiln::utils::Sha256Hex(code), code};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_pending_) {
            const auto dropped = ++dropped_;
            // One line per hundred drops is enough to see a stalled sink.
            if (dropped % 100 == 1) {
                kiln::utils::LogWarn("audit", "audit queue full; dropping events",
                                     {{"dropped", std::to_string(dropped)}, {"session", session_id}});
            }
            return;
        }
        queue_.push(std::move(event));
    }
    cv_.notify_one();
}

std::size_t AuditDispatcher::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool AuditDispatcher::TryConsume(AuditEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || !running_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop();
    return true;
}

void AuditDispatcher::RunLoop() {
    for (;;) {
        AuditEvent event{};
        if (!TryConsume(event, std::chrono::milliseconds(1000))) {
            if (!running_) {
                break;
            }
            continue;
        }
        if (!sink_) {
            continue;
        }
        try {
            sink_->Notify(event);
            ++delivered_;
        } catch (const std::exception& ex) {
            ++failed_;
            kiln::utils::LogWarn("audit", "audit sink failed", {{"session", event.session_id}, {"error", ex.what()}});
        }
    }
}

}  // namespace kiln::integrations
