#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kiln::runtime {

enum class BackendKind {
    kDocker,
    kRemote,
    kProcess
};

enum class Language {
    kPython,
    kBash,
    kR
};

const char* ToString(BackendKind kind);
const char* ToString(Language language);
std::optional<BackendKind> ParseBackendKind(const std::string& value);
std::optional<Language> ParseLanguage(const std::string& value);

struct NetworkPolicy {
    enum class Mode {
        kNone,
        kAllowlist
    };

    Mode mode = Mode::kNone;
    std::set<std::string> allowed_domains;
    // Lowercased base names (no version specifiers).
    std::set<std::string> allowed_packages;

    static NetworkPolicy None(std::set<std::string> packages = {});
    static NetworkPolicy Allowlist(std::set<std::string> domains, std::set<std::string> packages);
};

const char* ToString(NetworkPolicy::Mode mode);

struct RuntimeConfig {
    BackendKind backend_kind = BackendKind::kDocker;
    std::chrono::seconds idle_timeout{300};
    std::uint64_t max_memory_bytes = 512ULL * 1024 * 1024;
    double max_cpu = 1.0;
    std::chrono::milliseconds max_execution_time{60000};
    NetworkPolicy network_policy;
    std::string working_directory = "/home/user";
};

struct FileReference {
    enum class Kind {
        kInline,
        kExternal
    };

    std::string artifact_id;
    std::string name;
    std::string path;
    Kind kind = Kind::kInline;
    std::string mime_type;
    std::uint64_t size_bytes = 0;
    std::string fingerprint;
    std::optional<std::string> inline_data;
    std::optional<std::string> url;
    std::optional<std::chrono::system_clock::time_point> expires_at;

    static FileReference Inline(std::string artifact_id,
                                std::string name,
                                std::string path,
                                std::string mime_type,
                                std::string data,
                                std::string fingerprint);
    static FileReference External(std::string artifact_id,
                                  std::string name,
                                  std::string path,
                                  std::string mime_type,
                                  std::uint64_t size_bytes,
                                  std::string url,
                                  std::chrono::system_clock::time_point expires_at,
                                  std::string fingerprint);

    bool IsValid() const;
};

const char* ToString(FileReference::Kind kind);

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::vector<FileReference> artifacts;
    std::chrono::milliseconds execution_duration{0};
    std::vector<std::string> warnings;

    double DurationSeconds() const {
        return std::chrono::duration<double>(execution_duration).count();
    }
};

struct FileStamp {
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;

    bool operator==(const FileStamp& other) const {
        return size == other.size && mtime_ns == other.mtime_ns;
    }
    bool operator!=(const FileStamp& other) const { return !(*this == other); }
};

// Relative path (to the working directory) -> stamp, regular files only.
using FileSnapshot = std::map<std::string, FileStamp>;

struct BackendRunResult {
    int exit_code = 0;
    // Relative paths the language layer reported as outputs, if any.
    std::vector<std::string> declared_outputs;
};

struct TerminationReport {
    bool clean = true;
    std::string error;
};

}  // namespace kiln::runtime
