#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace kiln::config {
namespace {

using kiln::utils::GetEnv;

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyDouble(double& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyStringList(std::vector<std::string>& target, const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return;
    }
    target.clear();
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            target.push_back(item.get<std::string>());
        }
    }
}

const nlohmann::json* Section(const nlohmann::json& data, const char* name) {
    if (data.contains(name) && data[name].is_object()) {
        return &data[name];
    }
    return nullptr;
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (const auto* runtime = Section(data, "runtime")) {
        ApplyString(config.runtime.backend, *runtime, "backend");
        ApplyInt(config.runtime.idle_timeout_s, *runtime, "idleTimeoutS");
        ApplyInt(config.runtime.max_memory_mb, *runtime, "maxMemoryMb");
        ApplyDouble(config.runtime.max_cpu, *runtime, "maxCpu");
        ApplyInt(config.runtime.max_execution_time_s, *runtime, "maxExecutionTimeS");
        ApplyString(config.runtime.network, *runtime, "network");
        ApplyStringList(config.runtime.allowed_domains, *runtime, "allowedDomains");
        ApplyStringList(config.runtime.allowed_packages, *runtime, "allowedPackages");
        ApplyString(config.runtime.working_directory, *runtime, "workingDirectory");
    }
    if (const auto* docker = Section(data, "docker")) {
        ApplyString(config.docker.binary, *docker, "binary");
        ApplyString(config.docker.image, *docker, "image");
    }
    if (const auto* remote = Section(data, "remote")) {
        ApplyString(config.remote.api_base, *remote, "apiBase");
        ApplyString(config.remote.template_id, *remote, "template");
        ApplyString(config.remote.api_key_secret, *remote, "apiKeySecret");
        ApplyBool(config.remote.use_proxy, *remote, "useProxy");
    }
    if (const auto* process = Section(data, "process")) {
        ApplyString(config.process.root_dir, *process, "rootDir");
        ApplyString(config.process.python, *process, "python");
    }
    if (const auto* reaper = Section(data, "reaper")) {
        ApplyInt(config.reaper.interval_s, *reaper, "intervalS");
        ApplyInt(config.reaper.shutdown_grace_s, *reaper, "shutdownGraceS");
    }
    if (const auto* artifacts = Section(data, "artifacts")) {
        if (artifacts->contains("maxArtifactBytes") && (*artifacts)["maxArtifactBytes"].is_number_unsigned()) {
            config.artifacts.max_artifact_bytes = (*artifacts)["maxArtifactBytes"].get<std::uint64_t>();
        }
        ApplyString(config.artifacts.staging_dir, *artifacts, "stagingDir");
    }
    if (const auto* storage = Section(data, "storage")) {
        ApplyString(config.storage.kind, *storage, "kind");
        ApplyString(config.storage.endpoint, *storage, "endpoint");
        ApplyString(config.storage.bucket, *storage, "bucket");
        ApplyString(config.storage.public_base, *storage, "publicBase");
        ApplyInt(config.storage.url_ttl_s, *storage, "urlTtlS");
        ApplyString(config.storage.token_secret, *storage, "tokenSecret");
        ApplyString(config.storage.signing_key_secret, *storage, "signingKeySecret");
    }
    if (const auto* audit = Section(data, "audit")) {
        ApplyBool(config.audit.enabled, *audit, "enabled");
    }
    if (const auto* logging = Section(data, "logging")) {
        ApplyString(config.logging.level, *logging, "level");
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = kiln::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        kiln::utils::LogWarn("config", "ignoring non-integer value", {{"value", value}});
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        kiln::utils::LogWarn("config", "ignoring non-numeric value", {{"value", value}});
        return fallback;
    }
}

void OverrideString(std::string& target, const char* env) {
    const auto value = GetEnv(env);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(int& target, const char* env) {
    const auto value = GetEnv(env);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideList(std::vector<std::string>& target, const char* env) {
    const auto value = GetEnv(env);
    if (!value.empty()) {
        target = kiln::utils::SplitCsv(value);
    }
}

void ApplyEnvOverrides(Config& config) {
    OverrideString(config.runtime.backend, "KILN_RUNTIME_BACKEND");
    OverrideInt(config.runtime.idle_timeout_s, "KILN_RUNTIME_IDLE_TIMEOUT_S");
    OverrideInt(config.runtime.max_memory_mb, "KILN_RUNTIME_MAX_MEMORY_MB");
    const auto max_cpu = GetEnv("KILN_RUNTIME_MAX_CPU");
    if (!max_cpu.empty()) {
        config.runtime.max_cpu = ParseDouble(max_cpu, config.runtime.max_cpu);
    }
    OverrideInt(config.runtime.max_execution_time_s, "KILN_RUNTIME_MAX_EXECUTION_TIME_S");
    OverrideString(config.runtime.network, "KILN_RUNTIME_NETWORK");
    OverrideList(config.runtime.allowed_domains, "KILN_RUNTIME_ALLOWED_DOMAINS");
    OverrideList(config.runtime.allowed_packages, "KILN_RUNTIME_ALLOWED_PACKAGES");
    OverrideString(config.runtime.working_directory, "KILN_RUNTIME_WORKING_DIRECTORY");

    OverrideString(config.docker.binary, "KILN_DOCKER_BINARY");
    OverrideString(config.docker.image, "KILN_DOCKER_IMAGE");

    OverrideString(config.remote.api_base, "KILN_REMOTE_API_BASE");
    OverrideString(config.remote.template_id, "KILN_REMOTE_TEMPLATE");
    OverrideString(config.remote.api_key_secret, "KILN_REMOTE_API_KEY_SECRET");
    const auto use_proxy = GetEnv("KILN_REMOTE_USE_PROXY");
    if (!use_proxy.empty()) {
        config.remote.use_proxy = ParseBool(use_proxy);
    }

    OverrideString(config.process.root_dir, "KILN_PROCESS_ROOT_DIR");
    OverrideString(config.process.python, "KILN_PROCESS_PYTHON");

    OverrideInt(config.reaper.interval_s, "KILN_REAPER_INTERVAL_S");
    OverrideInt(config.reaper.shutdown_grace_s, "KILN_REAPER_SHUTDOWN_GRACE_S");

    const auto max_artifact = GetEnv("KILN_ARTIFACTS_MAX_ARTIFACT_BYTES");
    if (!max_artifact.empty()) {
        try {
            config.artifacts.max_artifact_bytes = std::stoull(max_artifact);
        } catch (const std::exception&) {
            kiln::utils::LogWarn("config", "ignoring non-integer value", {{"value", max_artifact}});
        }
    }
    OverrideString(config.artifacts.staging_dir, "KILN_ARTIFACTS_STAGING_DIR");

    OverrideString(config.storage.kind, "KILN_STORAGE_KIND");
    OverrideString(config.storage.endpoint, "KILN_STORAGE_ENDPOINT");
    OverrideString(config.storage.bucket, "KILN_STORAGE_BUCKET");
    OverrideString(config.storage.public_base, "KILN_STORAGE_PUBLIC_BASE");
    OverrideInt(config.storage.url_ttl_s, "KILN_STORAGE_URL_TTL_S");
    OverrideString(config.storage.token_secret, "KILN_STORAGE_TOKEN_SECRET");
    OverrideString(config.storage.signing_key_secret, "KILN_STORAGE_SIGNING_KEY_SECRET");

    const auto audit_enabled = GetEnv("KILN_AUDIT_ENABLED");
    if (!audit_enabled.empty()) {
        config.audit.enabled = ParseBool(audit_enabled);
    }
    OverrideString(config.logging.level, "KILN_LOG_LEVEL");
}

std::set<std::string> ToSet(const std::vector<std::string>& items, bool lowercase) {
    std::set<std::string> result;
    for (const auto& item : items) {
        const auto trimmed = kiln::utils::Trim(item);
        if (!trimmed.empty()) {
            result.insert(lowercase ? kiln::utils::ToLower(trimmed) : trimmed);
        }
    }
    return result;
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    const auto from_env = GetEnv("KILN_CONFIG");
    if (!from_env.empty()) {
        return from_env;
    }
    return GetHomePath() / ".kiln" / "config.json";
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const std::exception& ex) {
            kiln::utils::LogWarn("config", "keeping defaults, config file is not valid JSON",
                                 {{"path", path.string()}, {"error", ex.what()}});
        }
    }
    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(DefaultConfigPath());
}

kiln::runtime::RuntimeConfig MakeRuntimeConfig(const Config& config) {
    const auto backend = kiln::runtime::ParseBackendKind(config.runtime.backend);
    if (!backend.has_value()) {
        throw std::invalid_argument("unknown runtime backend: " + config.runtime.backend);
    }
    const auto packages = ToSet(config.runtime.allowed_packages, true);
    const auto network = kiln::utils::ToLower(kiln::utils::Trim(config.runtime.network));

    kiln::runtime::RuntimeConfig runtime{};
    runtime.backend_kind = *backend;
    runtime.idle_timeout = std::chrono::seconds(std::max(1, config.runtime.idle_timeout_s));
    runtime.max_memory_bytes = static_cast<std::uint64_t>(std::max(16, config.runtime.max_memory_mb)) * 1024 * 1024;
    runtime.max_cpu = config.runtime.max_cpu > 0.0 ? config.runtime.max_cpu : 1.0;
    runtime.max_execution_time = std::chrono::seconds(std::max(1, config.runtime.max_execution_time_s));
    if (network == "none") {
        runtime.network_policy = kiln::runtime::NetworkPolicy::None(packages);
    } else if (network == "allowlist") {
        runtime.network_policy = kiln::runtime::NetworkPolicy::Allowlist(
            ToSet(config.runtime.allowed_domains, true), packages);
    } else {
        throw std::invalid_argument("unknown network mode: " + config.runtime.network);
    }
    runtime.working_directory = config.runtime.working_directory.empty() ? "/home/user"
                                                                         : config.runtime.working_directory;
    return runtime;
}

std::string DescribeConfig(const Config& config) {
    nlohmann::json out = {
        {"runtime",
         {{"backend", config.runtime.backend},
          {"idleTimeoutS", config.runtime.idle_timeout_s},
          {"maxMemoryMb", config.runtime.max_memory_mb},
          {"maxCpu", config.runtime.max_cpu},
          {"maxExecutionTimeS", config.runtime.max_execution_time_s},
          {"network", config.runtime.network},
          {"allowedDomains", config.runtime.allowed_domains},
          {"allowedPackages", config.runtime.allowed_packages},
          {"workingDirectory", config.runtime.working_directory}}},
        {"docker", {{"binary", config.docker.binary}, {"image", config.docker.image}}},
        {"remote",
         {{"apiBase", config.remote.api_base},
          {"template", config.remote.template_id},
          {"apiKeySecret", config.remote.api_key_secret},
          {"useProxy", config.remote.use_proxy}}},
        {"process", {{"rootDir", config.process.root_dir}, {"python", config.process.python}}},
        {"reaper", {{"intervalS", config.reaper.interval_s}, {"shutdownGraceS", config.reaper.shutdown_grace_s}}},
        {"artifacts",
         {{"maxArtifactBytes", config.artifacts.max_artifact_bytes}, {"stagingDir", config.artifacts.staging_dir}}},
        {"storage",
         {{"kind", config.storage.kind},
          {"endpoint", config.storage.endpoint},
          {"bucket", config.storage.bucket},
          {"publicBase", config.storage.public_base},
          {"urlTtlS", config.storage.url_ttl_s},
          {"tokenSecret", config.storage.token_secret},
          {"signingKeySecret", config.storage.signing_key_secret}}},
        {"audit", {{"enabled", config.audit.enabled}}},
        {"logging", {{"level", config.logging.level}}},
    };
    return out.dump(2);
}

}  // namespace kiln::config
