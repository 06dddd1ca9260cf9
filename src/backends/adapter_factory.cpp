#include "backends/adapter_factory.hpp"

#include <stdexcept>

#include "artifacts/http_object_storage.hpp"
#include "backends/docker_backend.hpp"
#include "backends/process_backend.hpp"
#include "backends/remote_backend.hpp"
#include "runtime/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kiln::backends {

AdapterFactory::AdapterFactory(const kiln::config::Config& config,
                               const kiln::integrations::SecretsProvider& secrets) {
    DockerBackendOptions docker{};
    docker.binary = config.docker.binary;
    docker.image = config.docker.image;
    if (!config.artifacts.staging_dir.empty()) {
        docker.staging_dir = std::filesystem::path(config.artifacts.staging_dir) / "packages";
    }
    Register(kiln::runtime::BackendKind::kDocker, [docker] { return std::make_shared<DockerBackend>(docker); });

    RemoteBackendOptions remote{};
    remote.api_base = config.remote.api_base;
    remote.template_id = config.remote.template_id;
    remote.api_key = secrets.GetSecret(config.remote.api_key_secret).value_or("");
    remote.http.use_proxy = config.remote.use_proxy;
    if (remote.api_key.empty() && kiln::utils::ToLower(config.runtime.backend) == "remote") {
        kiln::utils::LogWarn("config", "no API key for the remote backend", {{"secret", config.remote.api_key_secret}});
    }
    Register(kiln::runtime::BackendKind::kRemote, [remote] { return std::make_shared<RemoteBackend>(remote); });

    ProcessBackendOptions process{};
    process.root_dir = config.process.root_dir;
    process.python = config.process.python;
    Register(kiln::runtime::BackendKind::kProcess, [process] { return std::make_shared<ProcessBackend>(process); });
}

void AdapterFactory::Register(kiln::runtime::BackendKind kind, Builder builder) {
    builders_[kind] = std::move(builder);
}

bool AdapterFactory::Supports(kiln::runtime::BackendKind kind) const {
    return builders_.count(kind) > 0;
}

std::unique_ptr<kiln::runtime::RuntimeAdapter> AdapterFactory::Create(const kiln::runtime::RuntimeConfig& config) const {
    const auto it = builders_.find(config.backend_kind);
    if (it == builders_.end() || !it->second) {
        throw kiln::runtime::SandboxError(
            kiln::runtime::ErrorCode::kProvisionFailure,
            std::string("no builder registered for backend ") + kiln::runtime::ToString(config.backend_kind));
    }
    return std::make_unique<kiln::runtime::RuntimeAdapter>(it->second(), config, timeouts_);
}

std::shared_ptr<kiln::artifacts::ObjectStorage> CreateObjectStorage(const kiln::config::Config& config,
                                                                    const kiln::integrations::SecretsProvider& secrets) {
    const auto kind = kiln::utils::ToLower(config.storage.kind);
    if (kind == "none" || kind.empty()) {
        return nullptr;
    }
    if (kind != "http") {
        throw std::invalid_argument("unknown storage kind: " + config.storage.kind);
    }
    if (config.storage.endpoint.empty()) {
        throw std::invalid_argument("storage.endpoint is required for storage kind " + config.storage.kind);
    }
    kiln::artifacts::HttpObjectStorageOptions options{};
    options.endpoint = config.storage.endpoint;
    options.bucket = config.storage.bucket;
    options.public_base = config.storage.public_base;
    options.url_ttl = std::chrono::seconds(config.storage.url_ttl_s > 0 ? config.storage.url_ttl_s : 3600);
    options.token = secrets.GetSecret(config.storage.token_secret).value_or("");
    options.signing_key = secrets.GetSecret(config.storage.signing_key_secret).value_or("");
    if (options.signing_key.empty()) {
        kiln::utils::LogWarn("storage", "no signing key; issued URLs carry no signature");
    }
    return std::make_shared<kiln::artifacts::HttpObjectStorage>(std::move(options));
}

}  // namespace kiln::backends
