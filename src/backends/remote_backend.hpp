#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "runtime/runtime_backend.hpp"
#include "utils/http.hpp"

namespace kiln::backends {

struct RemoteBackendOptions {
    std::string api_base = "https://api.e2b.dev";
    std::string template_id = "code-interpreter-v1";
    std::string api_key;
    kiln::utils::HttpClientOptions http;
};

// A microVM sandbox behind a REST API:
//   POST   /sandboxes                       create
//   POST   /sandboxes/{id}/execute          run code
//   POST   /sandboxes/{id}/files?path=      write a file
//   GET    /sandboxes/{id}/files?path=      read a file
//   GET    /sandboxes/{id}/files/list       list (path, recursive)
//   POST   /sandboxes/{id}/packages         pip install
//   DELETE /sandboxes/{id}                  destroy
class RemoteBackend : public kiln::runtime::RuntimeBackend {
public:
    explicit RemoteBackend(RemoteBackendOptions options);

    std::string Name() const override { return "remote"; }

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

    const std::string& SandboxId() const { return sandbox_id_; }

private:
    std::shared_ptr<httplib::Client> Client();
    httplib::Headers Headers() const;
    std::string SandboxPath(const std::string& suffix) const;
    void Destroy();

    RemoteBackendOptions options_;
    kiln::utils::ParsedUrl url_;
    kiln::runtime::RuntimeConfig config_;
    std::string sandbox_id_;

    std::mutex clients_mutex_;
    std::vector<std::weak_ptr<httplib::Client>> live_clients_;
};

}  // namespace kiln::backends
