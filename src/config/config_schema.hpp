#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kiln::config {

struct RuntimeSection {
    std::string backend = "docker";
    int idle_timeout_s = 300;
    int max_memory_mb = 512;
    double max_cpu = 1.0;
    int max_execution_time_s = 60;
    std::string network = "none";
    std::vector<std::string> allowed_domains = {"pypi.org", "files.pythonhosted.org"};
    std::vector<std::string> allowed_packages = {"numpy", "pandas", "matplotlib", "scipy", "requests"};
    std::string working_directory = "/home/user";
};

struct DockerSection {
    std::string binary = "docker";
    std::string image = "python:3.12-slim";
};

struct RemoteSection {
    std::string api_base = "https://api.e2b.dev";
    std::string template_id = "code-interpreter-v1";
    std::string api_key_secret = "E2B_API_KEY";
    bool use_proxy = false;
};

struct ProcessSection {
    std::string root_dir;  // <tmp>/kiln when empty
    std::string python = "python3";
};

struct ReaperSection {
    int interval_s = 30;
    int shutdown_grace_s = 10;
};

struct ArtifactsSection {
    std::uint64_t max_artifact_bytes = 10ULL * 1024 * 1024;
    std::string staging_dir;  // <tmp>/kiln-artifacts when empty
};

struct StorageSection {
    std::string kind = "none";  // none | http
    std::string endpoint;
    std::string bucket = "kiln-artifacts";
    std::string public_base;
    int url_ttl_s = 3600;
    std::string token_secret = "KILN_STORAGE_TOKEN";
    std::string signing_key_secret = "KILN_STORAGE_SIGNING_KEY";
};

struct AuditSection {
    bool enabled = true;
};

struct LoggingSection {
    std::string level = "info";
};

struct Config {
    RuntimeSection runtime;
    DockerSection docker;
    RemoteSection remote;
    ProcessSection process;
    ReaperSection reaper;
    ArtifactsSection artifacts;
    StorageSection storage;
    AuditSection audit;
    LoggingSection logging;
};

}  // namespace kiln::config
