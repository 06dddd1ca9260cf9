#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/runtime_backend.hpp"
#include "sandbox/interpreter_session.hpp"
#include "sandbox/process_runner.hpp"

namespace kiln::backends {

struct DockerBackendOptions {
    std::string binary = "docker";
    std::string image = "python:3.12-slim";
    // Host-side interpreter used to fetch wheels for offline installs.
    std::string host_python = "python3";
    std::filesystem::path staging_dir;
    std::chrono::seconds command_timeout{600};
};

// A container per sandbox, driven through the docker CLI. Python runs in a
// persistent interpreter attached with `docker exec -i`.
class DockerBackend : public kiln::runtime::RuntimeBackend {
public:
    explicit DockerBackend(DockerBackendOptions options);
    ~DockerBackend() override;

    std::string Name() const override { return "docker"; }

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

    // docker CLI argument lists.
    static std::vector<std::string> RunArgs(const kiln::runtime::RuntimeConfig& config,
                                            const std::string& image,
                                            const std::string& name);
    static std::vector<std::string> ExecArgs(const std::string& container,
                                             const std::string& working_dir,
                                             kiln::runtime::Language language,
                                             const std::string& code);
    static std::vector<std::string> InterpreterArgs(const std::string& container, const std::string& working_dir);
    static std::vector<std::string> SnapshotArgs(const std::string& container, const std::string& working_dir);
    static std::vector<std::string> OfflineInstallArgs(const std::string& container,
                                                       const std::string& package_dir,
                                                       const std::string& package_spec);
    // Host-side `python -m pip download` arguments, index pinned by policy.
    static std::vector<std::string> DownloadArgs(const kiln::runtime::NetworkPolicy& policy,
                                                 const std::string& dest,
                                                 const std::string& package_spec);
    static kiln::runtime::FileSnapshot ParseSnapshot(const std::string& find_output);

private:
    kiln::sandbox::CapturedProcess Docker(const std::vector<std::string>& args) const;
    // Throws std::runtime_error carrying stderr when the command fails.
    std::string DockerChecked(const std::vector<std::string>& args, const std::string& what) const;

    DockerBackendOptions options_;
    kiln::runtime::RuntimeConfig config_;
    std::string container_;
    std::unique_ptr<kiln::sandbox::InterpreterSession> interpreter_;
    std::atomic<bool> cancel_{false};
};

}  // namespace kiln::backends
