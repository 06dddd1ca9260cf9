#include "backends/remote_backend.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "runtime/path_policy.hpp"
#include "runtime/sandbox_error.hpp"
#include "utils/logging.hpp"

namespace kiln::backends {
using kiln::runtime::ErrorCode;
using kiln::runtime::SandboxError;

namespace {

constexpr std::uint64_t kBytesPerMb = 1024ULL * 1024ULL;

nlohmann::json ParseBody(const httplib::Result& result, const std::string& what) {
    auto body = nlohmann::json::parse(result->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw std::runtime_error(what + ": response is not a JSON object");
    }
    return body;
}

void RequireSuccess(const httplib::Result& result, const std::string& what) {
    if (!result || result->status >= 400) {
        throw std::runtime_error(what + ": " + kiln::utils::DescribeFailure(result));
    }
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

}  // namespace

RemoteBackend::RemoteBackend(RemoteBackendOptions options)
    : options_(std::move(options)), url_(kiln::utils::ParseUrl(options_.api_base)) {}

std::shared_ptr<httplib::Client> RemoteBackend::Client() {
    std::shared_ptr<httplib::Client> client = kiln::utils::MakeHttpClient(url_, options_.http);
    std::lock_guard<std::mutex> lock(clients_mutex_);
    live_clients_.erase(
        std::remove_if(live_clients_.begin(), live_clients_.end(), [](const auto& weak) { return weak.expired(); }),
        live_clients_.end());
    live_clients_.push_back(client);
    return client;
}

httplib::Headers RemoteBackend::Headers() const {
    httplib::Headers headers{{"Accept", "application/json"}};
    if (!options_.api_key.empty()) {
        headers.emplace("X-API-Key", options_.api_key);
    }
    return headers;
}

std::string RemoteBackend::SandboxPath(const std::string& suffix) const {
    return url_.base_path + "/sandboxes/" + sandbox_id_ + suffix;
}

void RemoteBackend::Start(const kiln::runtime::RuntimeConfig& config) {
    config_ = config;
    nlohmann::json allowed = nlohmann::json::array();
    for (const auto& domain : config_.network_policy.allowed_domains) {
        allowed.push_back(domain);
    }
    const nlohmann::json payload = {
        {"templateID", options_.template_id},
        {"timeoutMs", std::chrono::duration_cast<std::chrono::milliseconds>(config_.idle_timeout).count()},
        {"memoryMB", config_.max_memory_bytes / kBytesPerMb},
        {"cpuCount", config_.max_cpu},
        {"cwd", config_.working_directory},
        {"network", {{"mode", kiln::runtime::ToString(config_.network_policy.mode)}, {"allowedDomains", allowed}}},
    };
    auto client = Client();
    auto result = client->Post((url_.base_path + "/sandboxes").c_str(), Headers(), payload.dump(), "application/json");
    RequireSuccess(result, "create sandbox");
    const auto body = ParseBody(result, "create sandbox");
    sandbox_id_ = body.value("sandboxID", std::string());
    if (sandbox_id_.empty()) {
        throw std::runtime_error("create sandbox: response has no sandboxID");
    }
    kiln::utils::LogInfo("remote", "sandbox created", {{"sandbox", sandbox_id_}, {"template", options_.template_id}});
}

kiln::runtime::BackendRunResult RemoteBackend::Run(const std::string& code,
                                                   kiln::runtime::Language language,
                                                   kiln::runtime::OutputSink& sink) {
    const nlohmann::json payload = {
        {"code", code},
        {"language", kiln::runtime::ToString(language)},
        {"cwd", config_.working_directory},
    };
    auto client = Client();
    auto result = client->Post(SandboxPath("/execute").c_str(), Headers(), payload.dump(), "application/json");
    RequireSuccess(result, "execute");
    const auto body = ParseBody(result, "execute");
    sink.AppendStdout(body.value("stdout", std::string()));
    sink.AppendStderr(body.value("stderr", std::string()));

    kiln::runtime::BackendRunResult run{};
    run.exit_code = body.value("exitCode", 0);
    if (body.contains("outputs") && body["outputs"].is_array()) {
        for (const auto& output : body["outputs"]) {
            if (!output.is_string()) {
                continue;
            }
            const auto path = output.get<std::string>();
            run.declared_outputs.push_back(
                path.empty() || path.front() != '/'
                    ? path
                    : kiln::runtime::RelativeToWorkingDir(config_.working_directory, path));
        }
    }
    return run;
}

void RemoteBackend::Abort() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (const auto& weak : live_clients_) {
        if (auto client = weak.lock()) {
            client->stop();
        }
    }
}

void RemoteBackend::Upload(const std::filesystem::path& local_path, const std::string& remote_path) {
    const auto content = ReadFile(local_path);
    auto client = Client();
    const auto path = SandboxPath("/files?path=" + kiln::utils::UrlEncode(remote_path));
    auto result = client->Post(path.c_str(), Headers(), content, "application/octet-stream");
    RequireSuccess(result, "upload " + remote_path);
}

void RemoteBackend::Download(const std::string& remote_path, const std::filesystem::path& local_path) {
    auto client = Client();
    const auto path = SandboxPath("/files?path=" + kiln::utils::UrlEncode(remote_path));
    auto result = client->Get(path.c_str(), Headers());
    if (result && result->status == 404) {
        throw SandboxError(ErrorCode::kNotFound, "no such file in sandbox: " + remote_path);
    }
    RequireSuccess(result, "download " + remote_path);
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path());
    }
    std::ofstream output(local_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot write " + local_path.string());
    }
    output.write(result->body.data(), static_cast<std::streamsize>(result->body.size()));
}

std::vector<std::string> RemoteBackend::ListFiles(const std::string& remote_dir) {
    auto client = Client();
    const auto path = SandboxPath("/files/list?path=" + kiln::utils::UrlEncode(remote_dir) + "&recursive=false");
    auto result = client->Get(path.c_str(), Headers());
    if (result && result->status == 404) {
        throw SandboxError(ErrorCode::kNotFound, "no such directory in sandbox: " + remote_dir);
    }
    RequireSuccess(result, "list " + remote_dir);
    const auto body = ParseBody(result, "list " + remote_dir);
    std::vector<std::string> names;
    for (const auto& entry : body.value("entries", nlohmann::json::array())) {
        names.push_back(entry.value("name", std::string()));
    }
    return names;
}

kiln::runtime::FileSnapshot RemoteBackend::Snapshot() {
    auto client = Client();
    const auto path = SandboxPath("/files/list?path=" + kiln::utils::UrlEncode(config_.working_directory) +
                                  "&recursive=true");
    auto result = client->Get(path.c_str(), Headers());
    RequireSuccess(result, "snapshot");
    const auto body = ParseBody(result, "snapshot");
    kiln::runtime::FileSnapshot snapshot;
    for (const auto& entry : body.value("entries", nlohmann::json::array())) {
        if (entry.value("type", std::string("file")) != "file") {
            continue;
        }
        const auto relative = kiln::runtime::RelativeToWorkingDir(
            config_.working_directory, entry.value("path", std::string()));
        if (relative.empty()) {
            continue;
        }
        kiln::runtime::FileStamp stamp{};
        stamp.size = entry.value("size", std::uint64_t{0});
        stamp.mtime_ns = entry.value("mtimeNs", std::int64_t{0});
        snapshot[relative] = stamp;
    }
    return snapshot;
}

void RemoteBackend::InstallPackage(const std::string& package_spec, kiln::runtime::OutputSink& sink) {
    const nlohmann::json payload = {{"package", package_spec}};
    auto client = Client();
    auto result = client->Post(SandboxPath("/packages").c_str(), Headers(), payload.dump(), "application/json");
    RequireSuccess(result, "install " + package_spec);
    const auto body = ParseBody(result, "install " + package_spec);
    sink.AppendStdout(body.value("stdout", std::string()));
    sink.AppendStderr(body.value("stderr", std::string()));
    const auto exit_code = body.value("exitCode", 0);
    if (exit_code != 0) {
        throw SandboxError(ErrorCode::kBackendFailure,
                           "pip install exited with " + std::to_string(exit_code) + ": " +
                               body.value("stderr", std::string()));
    }
}

void RemoteBackend::Destroy() {
    if (sandbox_id_.empty()) {
        return;
    }
    auto client = Client();
    auto result = client->Delete(SandboxPath("").c_str(), Headers());
    if (result && result->status == 404) {
        return;
    }
    RequireSuccess(result, "delete sandbox " + sandbox_id_);
    kiln::utils::LogInfo("remote", "sandbox deleted", {{"sandbox", sandbox_id_}});
}

void RemoteBackend::Terminate() {
    Destroy();
}

void RemoteBackend::ForceKill() {
    Abort();
    Destroy();
}

}  // namespace kiln::backends
