#pragma once

#include <functional>
#include <map>
#include <memory>

#include "artifacts/object_storage.hpp"
#include "config/config_schema.hpp"
#include "integrations/secrets.hpp"
#include "runtime/runtime_adapter.hpp"
#include "runtime/runtime_backend.hpp"
#include "runtime/runtime_types.hpp"

namespace kiln::backends {

// Builds RuntimeAdapters from a dispatch table keyed by BackendKind.
// Credentials are read from the secrets provider once, here.
class AdapterFactory {
public:
    using Builder = std::function<std::shared_ptr<kiln::runtime::RuntimeBackend>()>;

    AdapterFactory(const kiln::config::Config& config, const kiln::integrations::SecretsProvider& secrets);
    // Empty table; for callers that register their own builders.
    AdapterFactory() = default;

    void Register(kiln::runtime::BackendKind kind, Builder builder);
    bool Supports(kiln::runtime::BackendKind kind) const;

    void SetTimeouts(kiln::runtime::AdapterTimeouts timeouts) { timeouts_ = timeouts; }

    // Not started. Throws SandboxError(kProvisionFailure) for a kind with no
    // registered builder.
    std::unique_ptr<kiln::runtime::RuntimeAdapter> Create(const kiln::runtime::RuntimeConfig& config) const;

private:
    std::map<kiln::runtime::BackendKind, Builder> builders_;
    kiln::runtime::AdapterTimeouts timeouts_;
};

// HttpObjectStorage for storage.kind == "http", nullptr for "none".
std::shared_ptr<kiln::artifacts::ObjectStorage> CreateObjectStorage(const kiln::config::Config& config,
                                                                    const kiln::integrations::SecretsProvider& secrets);

}  // namespace kiln::backends
