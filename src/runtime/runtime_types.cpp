#include "runtime/runtime_types.hpp"

#include <utility>

#include "utils/common.hpp"

namespace kiln::runtime {

const char* ToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::kDocker: return "docker";
        case BackendKind::kRemote: return "remote";
        case BackendKind::kProcess: return "process";
    }
    return "docker";
}

const char* ToString(Language language) {
    switch (language) {
        case Language::kPython: return "python";
        case Language::kBash: return "bash";
        case Language::kR: return "r";
    }
    return "python";
}

std::optional<BackendKind> ParseBackendKind(const std::string& value) {
    const auto lowered = kiln::utils::ToLower(kiln::utils::Trim(value));
    if (lowered == "docker" || lowered == "container" || lowered == "local-container") {
        return BackendKind::kDocker;
    }
    if (lowered == "remote" || lowered == "e2b" || lowered == "microvm" || lowered == "remote-microvm") {
        return BackendKind::kRemote;
    }
    if (lowered == "process" || lowered == "local") {
        return BackendKind::kProcess;
    }
    return std::nullopt;
}

std::optional<Language> ParseLanguage(const std::string& value) {
    const auto lowered = kiln::utils::ToLower(kiln::utils::Trim(value));
    if (lowered == "python" || lowered == "py") {
        return Language::kPython;
    }
    if (lowered == "bash" || lowered == "sh") {
        return Language::kBash;
    }
    if (lowered == "r") {
        return Language::kR;
    }
    return std::nullopt;
}

NetworkPolicy NetworkPolicy::None(std::set<std::string> packages) {
    NetworkPolicy policy{};
    policy.mode = Mode::kNone;
    policy.allowed_packages = std::move(packages);
    return policy;
}

NetworkPolicy NetworkPolicy::Allowlist(std::set<std::string> domains, std::set<std::string> packages) {
    NetworkPolicy policy{};
    policy.mode = Mode::kAllowlist;
    policy.allowed_domains = std::move(domains);
    policy.allowed_packages = std::move(packages);
    return policy;
}

const char* ToString(NetworkPolicy::Mode mode) {
    return mode == NetworkPolicy::Mode::kAllowlist ? "allowlist" : "none";
}

FileReference FileReference::Inline(std::string artifact_id,
                                    std::string name,
                                    std::string path,
                                    std::string mime_type,
                                    std::string data,
                                    std::string fingerprint) {
    FileReference ref{};
    ref.artifact_id = std::move(artifact_id);
    ref.name = std::move(name);
    ref.path = std::move(path);
    ref.kind = Kind::kInline;
    ref.mime_type = std::move(mime_type);
    ref.size_bytes = data.size();
    ref.fingerprint = std::move(fingerprint);
    ref.inline_data = std::move(data);
    return ref;
}

FileReference FileReference::External(std::string artifact_id,
                                      std::string name,
                                      std::string path,
                                      std::string mime_type,
                                      std::uint64_t size_bytes,
                                      std::string url,
                                      std::chrono::system_clock::time_point expires_at,
                                      std::string fingerprint) {
    FileReference ref{};
    ref.artifact_id = std::move(artifact_id);
    ref.name = std::move(name);
    ref.path = std::move(path);
    ref.kind = Kind::kExternal;
    ref.mime_type = std::move(mime_type);
    ref.size_bytes = size_bytes;
    ref.fingerprint = std::move(fingerprint);
    ref.url = std::move(url);
    ref.expires_at = expires_at;
    return ref;
}

bool FileReference::IsValid() const {
    if (kind == Kind::kInline) {
        return inline_data.has_value() && !url.has_value() && !expires_at.has_value();
    }
    return !inline_data.has_value() && url.has_value() && !url->empty() && expires_at.has_value();
}

const char* ToString(FileReference::Kind kind) {
    return kind == FileReference::Kind::kInline ? "inline" : "external";
}

}  // namespace kiln::runtime
