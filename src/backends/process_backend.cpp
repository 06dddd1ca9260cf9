#include "backends/process_backend.hpp"

#include <algorithm>
#include <chrono>
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

// The adapter owns the deadline; this only bounds a runaway helper.
constexpr std::chrono::milliseconds kOneShotCeiling{std::chrono::hours(6)};
constexpr std::chrono::milliseconds kCloseGrace{2000};

std::string Tail(const std::string& text, std::size_t max_chars) {
    return text.size() <= max_chars ? text : text.substr(text.size() - max_chars);
}

bool IsWithin(const fs::path& root, const fs::path& candidate) {
    const auto relative = candidate.lexically_relative(root);
    return !relative.empty() && *relative.begin() != "..";
}

}  // namespace

ProcessBackend::ProcessBackend(ProcessBackendOptions options) : options_(std::move(options)) {
    if (options_.root_dir.empty()) {
        options_.root_dir = fs::temp_directory_path() / "kiln";
    }
}

ProcessBackend::~ProcessBackend() {
    interpreter_.reset();
}

void ProcessBackend::Start(const kiln::runtime::RuntimeConfig& config) {
    config_ = config;
    sandbox_dir_ = options_.root_dir / ("sbx-" + kiln::utils::RandomHex(8));
    work_dir_ = sandbox_dir_ / "work";
    site_packages_ = sandbox_dir_ / ".kiln" / "site-packages";
    fs::create_directories(work_dir_);
    fs::create_directories(site_packages_);
    // Confinement checks compare canonical paths.
    work_dir_ = fs::canonical(work_dir_);

    interpreter_ = std::make_unique<kiln::sandbox::InterpreterSession>([this] {
        auto spec = BaseSpec();
        spec.executable = options_.python;
        return spec;
    }());
    kiln::utils::LogDebug("process", "network isolation is best-effort for host processes");
    kiln::utils::LogInfo("process", "sandbox directory ready", {{"dir", sandbox_dir_.string()}});
}

kiln::sandbox::ProcessSpec ProcessBackend::BaseSpec() const {
    kiln::sandbox::ProcessSpec spec{};
    spec.working_dir = work_dir_.string();
    spec.inherit_env = false;
    for (const char* name : {"PATH", "LANG", "LC_ALL", "TZ"}) {
        const auto value = kiln::utils::GetEnv(name);
        if (!value.empty()) {
            spec.env[name] = value;
        }
    }
    spec.env["HOME"] = work_dir_.string();
    spec.env["PYTHONPATH"] = site_packages_.string();
    spec.env["PYTHONDONTWRITEBYTECODE"] = "1";
    spec.env["MPLBACKEND"] = "Agg";
    spec.limits.max_memory_bytes = config_.max_memory_bytes;
    spec.isolate_network = true;
    return spec;
}

fs::path ProcessBackend::HostPath(const std::string& remote_path) const {
    const auto relative = kiln::runtime::RelativeToWorkingDir(config_.working_directory, remote_path);
    const auto mapped = relative.empty() ? work_dir_ : work_dir_ / relative;
    // Sandboxed code can plant symlinks; follow them before trusting the path.
    const auto resolved = fs::weakly_canonical(mapped);
    if (!IsWithin(work_dir_, resolved)) {
        throw SandboxError(ErrorCode::kPathViolation,
                           "remote path '" + remote_path + "' resolves outside the working directory");
    }
    // Whatever is still a link after canonicalization is dangling.
    auto current = work_dir_;
    for (const auto& part : resolved.lexically_relative(work_dir_)) {
        if (part == ".") {
            continue;
        }
        current /= part;
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(current, ec))) {
            throw SandboxError(ErrorCode::kPathViolation,
                               "remote path '" + remote_path + "' goes through a dangling symlink");
        }
    }
    return resolved;
}

kiln::runtime::BackendRunResult ProcessBackend::RunOneShot(const std::string& executable,
                                                           const std::vector<std::string>& args,
                                                           kiln::runtime::OutputSink& sink) {
    auto spec = BaseSpec();
    spec.executable = executable;
    spec.args = args;
    const auto cpu_seconds = std::chrono::duration_cast<std::chrono::seconds>(config_.max_execution_time).count();
    spec.limits.max_cpu_seconds = static_cast<std::uint64_t>(cpu_seconds) + 1;

    const auto outcome = kiln::sandbox::ProcessRunner::Run(
        spec, {}, kOneShotCeiling, &cancel_,
        [&sink](const std::string& chunk) { sink.AppendStdout(chunk); },
        [&sink](const std::string& chunk) { sink.AppendStderr(chunk); });
    kiln::runtime::BackendRunResult result{};
    result.exit_code = outcome.exit_code;
    return result;
}

kiln::runtime::BackendRunResult ProcessBackend::Run(const std::string& code,
                                                    kiln::runtime::Language language,
                                                    kiln::runtime::OutputSink& sink) {
    cancel_.store(false);
    switch (language) {
        case kiln::runtime::Language::kPython: {
            kiln::runtime::BackendRunResult result{};
            result.exit_code = interpreter_->Execute(code, sink);
            return result;
        }
        case kiln::runtime::Language::kBash:
            return RunOneShot(options_.bash, {"-c", code}, sink);
        case kiln::runtime::Language::kR:
            return RunOneShot(options_.rscript, {"-e", code}, sink);
    }
    throw SandboxError(ErrorCode::kUnsupportedLanguage, "unsupported language");
}

void ProcessBackend::Abort() {
    cancel_.store(true);
    if (interpreter_) {
        interpreter_->Abort();
    }
}

void ProcessBackend::Upload(const fs::path& local_path, const std::string& remote_path) {
    const auto target = HostPath(remote_path);
    fs::create_directories(target.parent_path());
    fs::copy_file(local_path, target, fs::copy_options::overwrite_existing);
}

void ProcessBackend::Download(const std::string& remote_path, const fs::path& local_path) {
    const auto source = HostPath(remote_path);
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        throw SandboxError(ErrorCode::kNotFound, "no such file in sandbox: " + remote_path);
    }
    if (local_path.has_parent_path()) {
        fs::create_directories(local_path.parent_path());
    }
    fs::copy_file(source, local_path, fs::copy_options::overwrite_existing);
}

std::vector<std::string> ProcessBackend::ListFiles(const std::string& remote_dir) {
    const auto dir = HostPath(remote_dir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw SandboxError(ErrorCode::kNotFound, "no such directory in sandbox: " + remote_dir);
    }
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

kiln::runtime::FileSnapshot ProcessBackend::Snapshot() {
    kiln::runtime::FileSnapshot snapshot;
    for (const auto& entry : fs::recursive_directory_iterator(work_dir_, fs::directory_options::skip_permission_denied)) {
        // Links may point anywhere on the host.
        if (entry.is_symlink() || !entry.is_regular_file()) {
            continue;
        }
        kiln::runtime::FileStamp stamp{};
        stamp.size = entry.file_size();
        stamp.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            entry.last_write_time().time_since_epoch()).count();
        snapshot[fs::relative(entry.path(), work_dir_).generic_string()] = stamp;
    }
    return snapshot;
}

void ProcessBackend::InstallPackage(const std::string& package_spec, kiln::runtime::OutputSink& sink) {
    cancel_.store(false);
    auto spec = BaseSpec();
    spec.executable = options_.python;
    spec.args = {"-m", "pip", "install", "--disable-pip-version-check", "--no-input"};
    const auto index_args = kiln::runtime::PipIndexArgs(config_.network_policy);
    spec.args.insert(spec.args.end(), index_args.begin(), index_args.end());
    spec.args.insert(spec.args.end(), {"--target", site_packages_.string(), package_spec});
    // pip reaches the index; user code never does.
    spec.isolate_network = false;
    spec.limits = {};
    const auto outcome = kiln::sandbox::ProcessRunner::Run(
        spec, {}, kOneShotCeiling, &cancel_,
        [&sink](const std::string& chunk) { sink.AppendStdout(chunk); },
        [&sink](const std::string& chunk) { sink.AppendStderr(chunk); });
    if (outcome.exit_code != 0) {
        throw SandboxError(ErrorCode::kBackendFailure,
                           "pip install exited with " + std::to_string(outcome.exit_code) + ": " +
                               Tail(sink.Stderr(), 400));
    }
}

void ProcessBackend::RemoveSandbox(bool contained) {
    if (!sandbox_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(sandbox_dir_, ec);
        if (ec) {
            throw std::runtime_error("failed to remove " + sandbox_dir_.string() + ": " + ec.message());
        }
    }
    if (!contained) {
        throw std::runtime_error("a sandbox process left its process group and is still running");
    }
}

void ProcessBackend::Terminate() {
    const bool contained = !interpreter_ || interpreter_->Close(kCloseGrace);
    RemoveSandbox(contained);
    kiln::utils::LogInfo("process", "sandbox removed", {{"dir", sandbox_dir_.string()}});
}

void ProcessBackend::ForceKill() {
    cancel_.store(true);
    bool contained = true;
    if (interpreter_) {
        interpreter_->Abort();
        contained = interpreter_->Close(std::chrono::milliseconds(0));
    }
    RemoveSandbox(contained);
}

}  // namespace kiln::backends
