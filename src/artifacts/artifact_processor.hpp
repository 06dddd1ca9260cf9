#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "artifacts/object_storage.hpp"
#include "runtime/runtime_types.hpp"

namespace kiln::artifacts {

struct ArtifactOptions {
    std::uint64_t max_artifact_bytes = 10ULL * 1024 * 1024;
    std::filesystem::path staging_dir;
};

// Per-session record of uploaded artifacts, keyed by content fingerprint.
class ArtifactLedger {
public:
    // A previously issued external reference for this content that is still
    // valid at `now`.
    std::optional<kiln::runtime::FileReference> Find(const std::string& fingerprint,
                                                     std::chrono::system_clock::time_point now) const;
    void Remember(const kiln::runtime::FileReference& reference);
    std::size_t Size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, kiln::runtime::FileReference> entries_;
};

// Copies a remote file (path relative to the working directory) to a host path.
using Downloader = std::function<void(const std::string& remote_path, const std::filesystem::path& local_path)>;

// Turns files produced by an execution into FileReferences: images are
// inlined, everything else is uploaded to object storage. Individual
// failures never fail the execution; they are reported in result.warnings.
class ArtifactProcessor {
public:
    ArtifactProcessor(ArtifactOptions options, std::shared_ptr<ObjectStorage> storage);

    // New or modified files, in path order.
    static std::vector<std::string> ChangedFiles(const kiln::runtime::FileSnapshot& before,
                                                 const kiln::runtime::FileSnapshot& after);

    void Process(const std::string& session_id,
                 const std::string& working_dir,
                 const std::vector<std::string>& candidates,
                 const kiln::runtime::FileSnapshot& after,
                 const Downloader& download,
                 ArtifactLedger& ledger,
                 kiln::runtime::ExecutionResult& result) const;

    const ArtifactOptions& Options() const { return options_; }

private:
    std::optional<kiln::runtime::FileReference> ProcessOne(const std::string& session_id,
                                                           const std::string& working_dir,
                                                           const std::string& relative_path,
                                                           const kiln::runtime::FileSnapshot& after,
                                                           const Downloader& download,
                                                           ArtifactLedger& ledger,
                                                           std::vector<std::string>& warnings) const;

    ArtifactOptions options_;
    std::shared_ptr<ObjectStorage> storage_;
};

}  // namespace kiln::artifacts
