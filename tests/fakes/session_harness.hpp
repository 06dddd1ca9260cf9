#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "artifacts/artifact_processor.hpp"
#include "backends/adapter_factory.hpp"
#include "fakes/fake_backend.hpp"
#include "fakes/fake_storage.hpp"
#include "integrations/audit.hpp"
#include "session/session_manager.hpp"

namespace kiln::fakes {

// A SessionManager wired to fake backends, fake storage and a manual clock.
class SessionHarness {
public:
    explicit SessionHarness(std::shared_ptr<kiln::integrations::AuditDispatcher> audit = nullptr,
                            kiln::artifacts::ArtifactOptions artifact_options = {}) {
        staging_dir = std::filesystem::temp_directory_path() / "kiln_session_test";
        std::filesystem::create_directories(staging_dir);
        if (artifact_options.staging_dir.empty()) {
            artifact_options.staging_dir = staging_dir;
        }

        factory = std::make_shared<kiln::backends::AdapterFactory>();
        kiln::runtime::AdapterTimeouts timeouts{};
        timeouts.abort_grace = std::chrono::milliseconds(200);
        timeouts.terminate_timeout = std::chrono::milliseconds(500);
        factory->SetTimeouts(timeouts);
        factory->Register(kiln::runtime::BackendKind::kDocker, [this] {
            auto backend = std::make_shared<FakeBackend>();
            if (configure) {
                configure(*backend);
            }
            std::lock_guard<std::mutex> lock(backends_mutex);
            backends.push_back(backend);
            return std::shared_ptr<kiln::runtime::RuntimeBackend>(backend);
        });

        storage = std::make_shared<FakeStorage>();
        kiln::session::SessionManagerOptions options{};
        options.reaper_interval = std::chrono::milliseconds(50);
        options.shutdown_grace = std::chrono::milliseconds(300);
        manager = std::make_shared<kiln::session::SessionManager>(
            factory,
            kiln::artifacts::ArtifactProcessor(artifact_options, storage),
            std::move(audit),
            options,
            [this] { return kiln::session::TimePoint(std::chrono::milliseconds(now_ms.load())); });

        config.max_execution_time = std::chrono::milliseconds(500);
        config.idle_timeout = std::chrono::seconds(300);
        config.network_policy = kiln::runtime::NetworkPolicy::None({"numpy"});
    }

    ~SessionHarness() {
        manager.reset();
        std::error_code ec;
        std::filesystem::remove_all(staging_dir, ec);
    }

    void Advance(std::chrono::milliseconds delta) { now_ms += delta.count(); }

    std::shared_ptr<FakeBackend> Backend(std::size_t index) {
        std::lock_guard<std::mutex> lock(backends_mutex);
        return index < backends.size() ? backends[index] : nullptr;
    }

    std::size_t BackendCount() {
        std::lock_guard<std::mutex> lock(backends_mutex);
        return backends.size();
    }

    std::function<void(FakeBackend&)> configure;
    std::atomic<long long> now_ms{1000000};
    std::filesystem::path staging_dir;
    std::shared_ptr<kiln::backends::AdapterFactory> factory;
    std::shared_ptr<FakeStorage> storage;
    std::shared_ptr<kiln::session::SessionManager> manager;
    kiln::runtime::RuntimeConfig config;

private:
    std::mutex backends_mutex;
    std::vector<std::shared_ptr<FakeBackend>> backends;
};

}  // namespace kiln::fakes
