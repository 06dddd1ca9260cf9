#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/runtime_types.hpp"

namespace kiln::runtime {

// Collects stdout/stderr as it arrives so a timed-out run can still report
// what was captured. Appended to from backend reader threads.
class OutputSink {
public:
    void AppendStdout(const std::string& chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        stdout_ += chunk;
    }

    void AppendStderr(const std::string& chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_ += chunk;
    }

    std::string Stdout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stdout_;
    }

    std::string Stderr() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stderr_;
    }

private:
    mutable std::mutex mutex_;
    std::string stdout_;
    std::string stderr_;
};

// Backend-specific half of the runtime contract. Paths handed to a backend
// have already been validated and resolved to absolute paths inside the
// working directory by RuntimeAdapter; backends do not re-check them.
//
// Failures are reported by throwing SandboxError (or any std::exception,
// which the adapter maps to BackendFailure / ProvisionFailure).
class RuntimeBackend {
public:
    virtual ~RuntimeBackend() = default;

    virtual std::string Name() const = 0;

    virtual void Start(const RuntimeConfig& config) = 0;
    virtual BackendRunResult Run(const std::string& code, Language language, OutputSink& sink) = 0;
    // Called from a thread other than the one inside Run(); must make Run()
    // return promptly.
    virtual void Abort() = 0;

    virtual void Upload(const std::filesystem::path& local_path, const std::string& remote_path) = 0;
    virtual void Download(const std::string& remote_path, const std::filesystem::path& local_path) = 0;
    virtual std::vector<std::string> ListFiles(const std::string& remote_dir) = 0;
    virtual FileSnapshot Snapshot() = 0;
    virtual void InstallPackage(const std::string& package_spec, OutputSink& sink) = 0;

    virtual void Terminate() = 0;
    virtual void ForceKill() = 0;
};

}  // namespace kiln::runtime
