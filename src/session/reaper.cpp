#include "session/reaper.hpp"

#include <exception>
#include <string>

#include "utils/logging.hpp"

namespace kiln::session {

Reaper::Reaper(ScanHandler on_scan, std::chrono::milliseconds interval)
    : on_scan_(std::move(on_scan))
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(30000)) {}

Reaper::~Reaper() {
    Stop();
}

void Reaper::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void Reaper::Stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

ReapReport Reaper::RunOnce() {
    ReapReport report{};
    if (!on_scan_) {
        return report;
    }
    report = on_scan_();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.scans;
    stats_.reaped += report.reaped;
    stats_.failures += report.failures;
    return report;
}

ReaperStats Reaper::Stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void Reaper::RunLoop() {
    kiln::utils::LogInfo("reaper", "started", {{"interval_ms", std::to_string(interval_.count())}});
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
        }
        if (!running_) {
            break;
        }
        try {
            const auto report = RunOnce();
            if (report.reaped > 0 || report.failures > 0) {
                kiln::utils::LogInfo("reaper", "scan finished",
                                     {{"scanned", std::to_string(report.scanned)},
                                      {"reaped", std::to_string(report.reaped)},
                                      {"failures", std::to_string(report.failures)}});
            }
        } catch (const std::exception& ex) {
            kiln::utils::LogError("reaper", "scan failed", {{"error", ex.what()}});
        }
    }
    kiln::utils::LogInfo("reaper", "stopped");
}

}  // namespace kiln::session
