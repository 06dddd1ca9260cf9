#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace kiln::session {

struct ReapReport {
    std::size_t scanned = 0;
    std::size_t reaped = 0;
    std::size_t skipped_busy = 0;
    std::size_t failures = 0;
};

struct ReaperStats {
    std::size_t scans = 0;
    std::size_t reaped = 0;
    std::size_t failures = 0;
};

// Runs an idle-session scan every `interval` on its own thread until stopped.
class Reaper {
public:
    using ScanHandler = std::function<ReapReport()>;

    Reaper(ScanHandler on_scan, std::chrono::milliseconds interval);
    ~Reaper();

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    void Start();
    // Wakes the worker and joins it.
    void Stop();
    bool Running() const { return running_.load(); }

    ReapReport RunOnce();
    ReaperStats Stats() const;

private:
    void RunLoop();

    ScanHandler on_scan_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread worker_;

    mutable std::mutex stats_mutex_;
    ReaperStats stats_;
};

}  // namespace kiln::session
