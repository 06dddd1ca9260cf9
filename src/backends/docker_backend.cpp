#include "backends/docker_backend.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "runtime/path_policy.hpp"
#include "runtime/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace kiln::backends {
namespace fs = std::filesystem;
using kiln::runtime::ErrorCode;
using kiln::runtime::SandboxError;

namespace {

constexpr std::chrono::milliseconds kOneShotCeiling{std::chrono::hours(6)};
constexpr std::chrono::milliseconds kCloseGrace{2000};
constexpr const char* kPackageRoot = "/tmp/packages";

std::string ParentOf(const std::string& remote_path) {
    const auto slash = remote_path.rfind('/');
    return slash == 0 || slash == std::string::npos ? "/" : remote_path.substr(0, slash);
}

bool IsGoneContainerError(const std::string& stderr_text) {
    return stderr_text.find("No such container") != std::string::npos ||
        stderr_text.find("is not running") != std::string::npos;
}

std::string Tail(const std::string& text, std::size_t max_chars) {
    return text.size() <= max_chars ? text : text.substr(text.size() - max_chars);
}

}  // namespace

DockerBackend::DockerBackend(DockerBackendOptions options) : options_(std::move(options)) {
    if (options_.staging_dir.empty()) {
        options_.staging_dir = fs::temp_directory_path() / "kiln-packages";
    }
}

DockerBackend::~DockerBackend() {
    interpreter_.reset();
}

std::vector<std::string> DockerBackend::RunArgs(const kiln::runtime::RuntimeConfig& config,
                                                const std::string& image,
                                                const std::string& name) {
    char cpus[32];
    std::snprintf(cpus, sizeof(cpus), "%.2f", config.max_cpu);
    // User code never gets a network; package fetches happen on the host.
    return {
        "run", "-d", "--rm",
        "--name", name,
        "--network", "none",
        "--memory", std::to_string(config.max_memory_bytes),
        "--cpus", cpus,
        "-w", config.working_directory,
        image,
        "sleep", "infinity"};
}

std::vector<std::string> DockerBackend::ExecArgs(const std::string& container,
                                                 const std::string& working_dir,
                                                 kiln::runtime::Language language,
                                                 const std::string& code) {
    switch (language) {
        case kiln::runtime::Language::kPython:
            return {"exec", "-w", working_dir, container, "python3", "-c", code};
        case kiln::runtime::Language::kBash:
            return {"exec", "-w", working_dir, container, "bash", "-c", code};
        case kiln::runtime::Language::kR:
            return {"exec", "-w", working_dir, container, "Rscript", "-e", code};
    }
    throw SandboxError(ErrorCode::kUnsupportedLanguage, "unsupported language");
}

std::vector<std::string> DockerBackend::InterpreterArgs(const std::string& container, const std::string& working_dir) {
    return {"exec", "-i", "-w", working_dir, container, "python3"};
}

std::vector<std::string> DockerBackend::SnapshotArgs(const std::string& container, const std::string& working_dir) {
    return {"exec", container, "find", working_dir, "-type", "f", "-printf", "%P\\t%s\\t%T@\\n"};
}

std::vector<std::string> DockerBackend::OfflineInstallArgs(const std::string& container,
                                                           const std::string& package_dir,
                                                           const std::string& package_spec) {
    return {"exec", container, "pip", "install", "--no-index", "--find-links", package_dir, package_spec};
}

std::vector<std::string> DockerBackend::DownloadArgs(const kiln::runtime::NetworkPolicy& policy,
                                                     const std::string& dest,
                                                     const std::string& package_spec) {
    std::vector<std::string> args{"-m", "pip", "download", "--disable-pip-version-check", "--no-input"};
    const auto index_args = kiln::runtime::PipIndexArgs(policy);
    args.insert(args.end(), index_args.begin(), index_args.end());
    args.insert(args.end(), {"--dest", dest, package_spec});
    return args;
}

kiln::runtime::FileSnapshot DockerBackend::ParseSnapshot(const std::string& find_output) {
    kiln::runtime::FileSnapshot snapshot;
    std::istringstream lines(find_output);
    std::string line;
    while (std::getline(lines, line)) {
        const auto time_tab = line.rfind('\t');
        if (time_tab == std::string::npos || time_tab == 0) {
            continue;
        }
        const auto size_tab = line.rfind('\t', time_tab - 1);
        if (size_tab == std::string::npos || size_tab == 0) {
            continue;
        }
        const auto path = line.substr(0, size_tab);
        const auto size_text = line.substr(size_tab + 1, time_tab - size_tab - 1);
        const auto time_text = line.substr(time_tab + 1);
        try {
            kiln::runtime::FileStamp stamp{};
            stamp.size = std::stoull(size_text);
            const auto dot = time_text.find('.');
            const auto seconds = std::stoll(time_text.substr(0, dot));
            std::string fraction = dot == std::string::npos ? "" : time_text.substr(dot + 1);
            fraction.resize(9, '0');
            stamp.mtime_ns = seconds * 1000000000LL + std::stoll(fraction);
            snapshot[path] = stamp;
        } catch (const std::exception& ex) {
            kiln::utils::LogWarn("docker", "skipping unparsable snapshot line", {{"line", line}, {"error", ex.what()}});
        }
    }
    return snapshot;
}

kiln::sandbox::CapturedProcess DockerBackend::Docker(const std::vector<std::string>& args) const {
    kiln::sandbox::ProcessSpec spec{};
    spec.executable = options_.binary;
    spec.args = args;
    auto captured = kiln::sandbox::ProcessRunner::Capture(
        spec, std::chrono::duration_cast<std::chrono::milliseconds>(options_.command_timeout));
    if (captured.outcome.timed_out) {
        throw std::runtime_error("docker " + (args.empty() ? std::string() : args.front()) + " timed out");
    }
    return captured;
}

std::string DockerBackend::DockerChecked(const std::vector<std::string>& args, const std::string& what) const {
    auto captured = Docker(args);
    if (captured.outcome.exit_code != 0) {
        throw std::runtime_error(what + " failed (exit " + std::to_string(captured.outcome.exit_code) + "): " +
                                 kiln::utils::Trim(captured.stderr_text));
    }
    return captured.stdout_text;
}

void DockerBackend::Start(const kiln::runtime::RuntimeConfig& config) {
    config_ = config;
    const auto name = "kiln-" + kiln::utils::RandomHex(6);
    container_ = kiln::utils::Trim(DockerChecked(RunArgs(config_, options_.image, name), "docker run"));
    if (container_.empty()) {
        container_ = name;
    }
    DockerChecked({"exec", container_, "mkdir", "-p", config_.working_directory}, "creating working directory");

    kiln::sandbox::ProcessSpec launcher{};
    launcher.executable = options_.binary;
    launcher.args = InterpreterArgs(container_, config_.working_directory);
    interpreter_ = std::make_unique<kiln::sandbox::InterpreterSession>(launcher);
    kiln::utils::LogInfo("docker", "container started",
                         {{"container", container_.substr(0, 12)}, {"image", options_.image},
                          {"network", kiln::runtime::ToString(config_.network_policy.mode)}});
}

kiln::runtime::BackendRunResult DockerBackend::Run(const std::string& code,
                                                   kiln::runtime::Language language,
                                                   kiln::runtime::OutputSink& sink) {
    cancel_.store(false);
    kiln::runtime::BackendRunResult result{};
    if (language == kiln::runtime::Language::kPython) {
        result.exit_code = interpreter_->Execute(code, sink);
        return result;
    }
    kiln::sandbox::ProcessSpec spec{};
    spec.executable = options_.binary;
    spec.args = ExecArgs(container_, config_.working_directory, language, code);
    const auto outcome = kiln::sandbox::ProcessRunner::Run(
        spec, {}, kOneShotCeiling, &cancel_,
        [&sink](const std::string& chunk) { sink.AppendStdout(chunk); },
        [&sink](const std::string& chunk) { sink.AppendStderr(chunk); });
    result.exit_code = outcome.exit_code;
    return result;
}

void DockerBackend::Abort() {
    cancel_.store(true);
    if (interpreter_) {
        interpreter_->Abort();
    }
    // The exec'd processes live in the container, not under the CLI client.
    const auto killed = Docker({"kill", container_});
    if (killed.outcome.exit_code != 0 && !IsGoneContainerError(killed.stderr_text)) {
        kiln::utils::LogWarn("docker", "kill during abort failed", {{"error", kiln::utils::Trim(killed.stderr_text)}});
    }
}

void DockerBackend::Upload(const fs::path& local_path, const std::string& remote_path) {
    DockerChecked({"exec", container_, "mkdir", "-p", ParentOf(remote_path)}, "creating " + ParentOf(remote_path));
    DockerChecked({"cp", local_path.string(), container_ + ":" + remote_path}, "docker cp to " + remote_path);
}

void DockerBackend::Download(const std::string& remote_path, const fs::path& local_path) {
    const auto probe = Docker({"exec", container_, "test", "-f", remote_path});
    if (probe.outcome.exit_code != 0) {
        throw SandboxError(ErrorCode::kNotFound, "no such file in sandbox: " + remote_path);
    }
    if (local_path.has_parent_path()) {
        fs::create_directories(local_path.parent_path());
    }
    DockerChecked({"cp", container_ + ":" + remote_path, local_path.string()}, "docker cp from " + remote_path);
}

std::vector<std::string> DockerBackend::ListFiles(const std::string& remote_dir) {
    const auto listed = Docker({"exec", container_, "ls", "-1", "-A", "--", remote_dir});
    if (listed.outcome.exit_code != 0) {
        if (listed.stderr_text.find("No such file") != std::string::npos) {
            throw SandboxError(ErrorCode::kNotFound, "no such directory in sandbox: " + remote_dir);
        }
        throw std::runtime_error("ls failed: " + kiln::utils::Trim(listed.stderr_text));
    }
    std::vector<std::string> names;
    std::istringstream lines(listed.stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty()) {
            names.push_back(line);
        }
    }
    return names;
}

kiln::runtime::FileSnapshot DockerBackend::Snapshot() {
    return ParseSnapshot(DockerChecked(SnapshotArgs(container_, config_.working_directory), "snapshot"));
}

void DockerBackend::InstallPackage(const std::string& package_spec, kiln::runtime::OutputSink& sink) {
    cancel_.store(false);
    auto stream = [this, &sink](const kiln::sandbox::ProcessSpec& spec) {
        return kiln::sandbox::ProcessRunner::Run(
            spec, {}, kOneShotCeiling, &cancel_,
            [&sink](const std::string& chunk) { sink.AppendStdout(chunk); },
            [&sink](const std::string& chunk) { sink.AppendStderr(chunk); });
    };

    // The container has no network: fetch on the host, install from files.
    const auto name = kiln::runtime::PackageBaseName(package_spec);
    const auto staging = options_.staging_dir / kiln::utils::RandomHex(6) / name;
    kiln::sandbox::ProcessSpec download{};
    download.executable = options_.host_python;
    download.args = DownloadArgs(config_.network_policy, staging.string(), package_spec);
    fs::create_directories(staging);
    const auto fetched = stream(download);
    if (fetched.exit_code != 0) {
        std::error_code ec;
        fs::remove_all(staging.parent_path(), ec);
        throw SandboxError(ErrorCode::kBackendFailure,
                           "pip download exited with " + std::to_string(fetched.exit_code) + ": " +
                               Tail(sink.Stderr(), 400));
    }
    const std::string package_dir = std::string(kPackageRoot) + "/" + name;
    try {
        DockerChecked({"exec", container_, "mkdir", "-p", kPackageRoot}, "creating package directory");
        DockerChecked({"cp", staging.string(), container_ + ":" + kPackageRoot + "/"}, "copying packages");
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove_all(staging.parent_path(), ec);
        throw;
    }
    std::error_code ec;
    fs::remove_all(staging.parent_path(), ec);

    kiln::sandbox::ProcessSpec install{};
    install.executable = options_.binary;
    install.args = OfflineInstallArgs(container_, package_dir, package_spec);
    const auto outcome = stream(install);
    if (outcome.exit_code != 0) {
        throw SandboxError(ErrorCode::kBackendFailure,
                           "pip install exited with " + std::to_string(outcome.exit_code) + ": " +
                               Tail(sink.Stderr(), 400));
    }
}

void DockerBackend::Terminate() {
    if (interpreter_ && !interpreter_->Close(kCloseGrace)) {
        // The container kill below takes everything in it down.
        kiln::utils::LogWarn("docker", "interpreter client left output open", {{"container", container_.substr(0, 12)}});
    }
    if (container_.empty()) {
        return;
    }
    const auto killed = Docker({"kill", container_});
    if (killed.outcome.exit_code != 0 && !IsGoneContainerError(killed.stderr_text)) {
        throw std::runtime_error("docker kill failed: " + kiln::utils::Trim(killed.stderr_text));
    }
    kiln::utils::LogInfo("docker", "container stopped", {{"container", container_.substr(0, 12)}});
}

void DockerBackend::ForceKill() {
    if (interpreter_) {
        interpreter_->Abort();
        interpreter_->Close(std::chrono::milliseconds(0));
    }
    if (container_.empty()) {
        return;
    }
    const auto removed = Docker({"rm", "-f", container_});
    if (removed.outcome.exit_code != 0 && !IsGoneContainerError(removed.stderr_text)) {
        throw std::runtime_error("docker rm -f failed: " + kiln::utils::Trim(removed.stderr_text));
    }
}

}  // namespace kiln::backends
