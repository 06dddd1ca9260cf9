#include "artifacts/artifact_processor.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "artifacts/mime_types.hpp"
#include "runtime/path_policy.hpp"
#include "runtime/sandbox_error.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace kiln::artifacts {
namespace fs = std::filesystem;
using kiln::runtime::FileReference;

namespace {

std::string ReadAll(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("cannot read staged copy " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

std::string BaseName(const std::string& relative_path) {
    const auto slash = relative_path.rfind('/');
    return slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
}

// Removes the staging directory on every path out of ProcessOne.
class StagingDir {
public:
    explicit StagingDir(fs::path path) : path_(std::move(path)) {
        fs::create_directories(path_);
    }
    ~StagingDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace

std::optional<FileReference> ArtifactLedger::Find(const std::string& fingerprint,
                                                  std::chrono::system_clock::time_point now) const {
    const auto it = entries_.find(fingerprint);
    if (it == entries_.end() || !it->second.expires_at.has_value() || *it->second.expires_at <= now) {
        return std::nullopt;
    }
    return it->second;
}

void ArtifactLedger::Remember(const FileReference& reference) {
    entries_[reference.fingerprint] = reference;
}

ArtifactProcessor::ArtifactProcessor(ArtifactOptions options, std::shared_ptr<ObjectStorage> storage)
    : options_(std::move(options)), storage_(std::move(storage)) {
    if (options_.staging_dir.empty()) {
        options_.staging_dir = fs::temp_directory_path() / "kiln-artifacts";
    }
}

std::vector<std::string> ArtifactProcessor::ChangedFiles(const kiln::runtime::FileSnapshot& before,
                                                         const kiln::runtime::FileSnapshot& after) {
    std::vector<std::string> changed;
    for (const auto& [path, stamp] : after) {
        const auto it = before.find(path);
        if (it == before.end() || it->second != stamp) {
            changed.push_back(path);
        }
    }
    return changed;
}

void ArtifactProcessor::Process(const std::string& session_id,
                                const std::string& working_dir,
                                const std::vector<std::string>& candidates,
                                const kiln::runtime::FileSnapshot& after,
                                const Downloader& download,
                                ArtifactLedger& ledger,
                                kiln::runtime::ExecutionResult& result) const {
    for (const auto& relative_path : candidates) {
        auto reference = ProcessOne(session_id, working_dir, relative_path, after, download, ledger, result.warnings);
        if (reference.has_value()) {
            result.artifacts.push_back(std::move(*reference));
        }
    }
}

std::optional<FileReference> ArtifactProcessor::ProcessOne(const std::string& session_id,
                                                           const std::string& working_dir,
                                                           const std::string& relative_path,
                                                           const kiln::runtime::FileSnapshot& after,
                                                           const Downloader& download,
                                                           ArtifactLedger& ledger,
                                                           std::vector<std::string>& warnings) const {
    auto warn = [&](const std::string& reason) {
        warnings.push_back(relative_path + ": " + reason);
        kiln::utils::LogWarn("artifact", reason, {{"session", session_id}, {"path", relative_path}});
        return std::nullopt;
    };

    std::string remote_path;
    try {
        remote_path = kiln::runtime::ResolveRemotePath(working_dir, relative_path);
    } catch (const kiln::runtime::SandboxError& ex) {
        return warn(ex.what());
    }
    const auto stamp = after.find(relative_path);
    if (stamp != after.end() && stamp->second.size > options_.max_artifact_bytes) {
        return warn("artifact exceeds " + std::to_string(options_.max_artifact_bytes) + " bytes and was dropped");
    }

    std::string bytes;
    try {
        StagingDir staging(options_.staging_dir / kiln::utils::RandomHex(8));
        const auto local = staging.Path() / "artifact";
        download(relative_path, local);
        bytes = ReadAll(local);
    } catch (const std::exception& ex) {
        return warn(std::string("could not retrieve artifact: ") + ex.what());
    }
    if (bytes.size() > options_.max_artifact_bytes) {
        return warn("artifact exceeds " + std::to_string(options_.max_artifact_bytes) + " bytes and was dropped");
    }

    const auto name = BaseName(relative_path);
    const auto classification = ClassifyByName(name);
    const auto fingerprint = kiln::utils::Sha256Hex(bytes);
    const auto artifact_id = "art_" + kiln::utils::Sha256Hex(session_id + "\n" + remote_path + "\n" + fingerprint).substr(0, 16);

    if (classification.artifact_class == ArtifactClass::kImage) {
        return FileReference::Inline(artifact_id, name, remote_path, classification.mime_type, std::move(bytes), fingerprint);
    }

    if (auto previous = ledger.Find(fingerprint, std::chrono::system_clock::now())) {
        kiln::utils::LogDebug("artifact", "reusing earlier upload", {{"session", session_id}, {"path", relative_path}});
        return FileReference::External(artifact_id, name, remote_path, classification.mime_type, bytes.size(),
                                       *previous->url, *previous->expires_at, fingerprint);
    }
    if (!storage_) {
        return warn("no object storage configured; artifact omitted");
    }

    const auto key = session_id + "/" + fingerprint.substr(0, 16) + "/" + name;
    try {
        const auto stored = storage_->Put(bytes, key, classification.mime_type);
        auto reference = FileReference::External(artifact_id, name, remote_path, classification.mime_type,
                                                 bytes.size(), stored.url, stored.expires_at, fingerprint);
        ledger.Remember(reference);
        return reference;
    } catch (const std::exception& ex) {
        return warn(std::string(kiln::runtime::ToString(kiln::runtime::ErrorCode::kStorageUploadFailure)) + ": " +
                    ex.what());
    }
}

}  // namespace kiln::artifacts
