#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "runtime/runtime_backend.hpp"
#include "sandbox/interpreter_session.hpp"
#include "sandbox/process_runner.hpp"

namespace kiln::backends {

struct ProcessBackendOptions {
    std::filesystem::path root_dir;
    std::string python = "python3";
    std::string bash = "bash";
    std::string rscript = "Rscript";
};

// Runs code as host subprocesses inside a private per-sandbox directory that
// stands in for the working directory. Intended for development and tests;
// isolation is limited to rlimits and a best-effort network namespace.
class ProcessBackend : public kiln::runtime::RuntimeBackend {
public:
    explicit ProcessBackend(ProcessBackendOptions options);
    ~ProcessBackend() override;

    std::string Name() const override { return "process"; }

    void Start(const kiln::runtime::RuntimeConfig& config) override;
    kiln::runtime::BackendRunResult Run(const std::string& code,
                                        kiln::runtime::Language language,
                                        kiln::runtime::OutputSink& sink) override;
    void Abort() override;

    void Upload(const std::filesystem::path& local_path, const std::string& remote_path) override;
    void Download(const std::string& remote_path, const std::filesystem::path& local_path) override;
    std::vector<std::string> ListFiles(const std::string& remote_dir) override;
    kiln::runtime::FileSnapshot Snapshot() override;
    void InstallPackage(const std::string& package_spec, kiln::runtime::OutputSink& sink) override;

    void Terminate() override;
    void ForceKill() override;

    // Host directory backing the working directory (empty before Start).
    const std::filesystem::path& WorkDir() const { return work_dir_; }

private:
    std::filesystem::path HostPath(const std::string& remote_path) const;
    kiln::sandbox::ProcessSpec BaseSpec() const;
    // Removes the sandbox directory, then throws if `contained` is false.
    void RemoveSandbox(bool contained);
    kiln::runtime::BackendRunResult RunOneShot(const std::string& executable,
                                               const std::vector<std::string>& args,
                                               kiln::runtime::OutputSink& sink);

    ProcessBackendOptions options_;
    kiln::runtime::RuntimeConfig config_;
    std::filesystem::path sandbox_dir_;
    std::filesystem::path work_dir_;
    std::filesystem::path site_packages_;
    std::unique_ptr<kiln::sandbox::InterpreterSession> interpreter_;
    std::atomic<bool> cancel_{false};
};

}  // namespace kiln::backends
