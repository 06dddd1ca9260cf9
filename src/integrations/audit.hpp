#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace kiln::integrations {

struct AuditEvent {
    std::string session_id;
    std::string language;
    std::string code_hash;  // sha256 hex of the code
    std::string code;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void Notify(const AuditEvent& event) = 0;
};

// Logs one line per execution; the code itself is not logged.
class LogAuditSink : public AuditSink {
public:
    void Notify(const AuditEvent& event) override;
};

// Delivers audit events to a sink on a worker thread. Publish never blocks
// on the sink and never throws because of it. At most `max_pending` events
// wait for delivery; further ones are dropped and counted.
class AuditDispatcher {
public:
    static constexpr std::size_t kDefaultMaxPending = 1024;

    explicit AuditDispatcher(std::shared_ptr<AuditSink> sink, std::size_t max_pending = kDefaultMaxPending);
    ~AuditDispatcher();

    AuditDispatcher(const AuditDispatcher&) = delete;
    AuditDispatcher& operator=(const AuditDispatcher&) = delete;

    void Start();
    // Drains what is queued, then joins the worker.
    void Stop();

    void Publish(const std::string& session_id, const std::string& language, const std::string& code);

    std::size_t Pending() const;
    std::size_t Delivered() const { return delivered_.load(); }
    std::size_t Failed() const { return failed_.load(); }
    std::size_t Dropped() const { return dropped_.load(); }

private:
    void RunLoop();
    bool TryConsume(AuditEvent& event, std::chrono::milliseconds timeout);

    std::shared_ptr<AuditSink> sink_;
    std::size_t max_pending_;
    std::queue<AuditEvent> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> dropped_{0};
    std::thread worker_;
};

}  // namespace kiln::integrations
