#include "runtime/path_policy.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "runtime/sandbox_error.hpp"
#include "utils/common.hpp"

namespace kiln::runtime {
namespace {

std::vector<std::string> SplitSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        segments.push_back(segment);
    }
    return segments;
}

// Normalizes "/a//b/./c/" to "/a/b/c". Callers reject ".." beforehand.
std::string NormalizeAbsolute(const std::string& path) {
    std::vector<std::string> kept;
    for (const auto& segment : SplitSegments(path)) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        kept.push_back(segment);
    }
    return "/" + kiln::utils::Join(kept, "/");
}

bool IsWithin(const std::string& root, const std::string& candidate) {
    if (root == "/") {
        return true;
    }
    if (candidate == root) {
        return true;
    }
    return kiln::utils::StartsWith(candidate, root + "/");
}

}  // namespace

std::string ResolveRemotePath(const std::string& working_dir, const std::string& remote_path) {
    if (remote_path.empty()) {
        throw SandboxError(ErrorCode::kPathViolation, "remote path is empty");
    }
    if (remote_path.find('\0') != std::string::npos) {
        throw SandboxError(ErrorCode::kPathViolation, "remote path contains NUL");
    }
    for (const auto& segment : SplitSegments(remote_path)) {
        if (segment == "..") {
            throw SandboxError(
                ErrorCode::kPathViolation,
                "remote path '" + remote_path + "' contains a parent-directory segment");
        }
    }
    const auto root = NormalizeAbsolute(working_dir);
    const auto joined = remote_path.front() == '/' ? remote_path : root + "/" + remote_path;
    const auto resolved = NormalizeAbsolute(joined);
    if (!IsWithin(root, resolved)) {
        throw SandboxError(
            ErrorCode::kPathViolation,
            "remote path '" + remote_path + "' is outside " + root);
    }
    return resolved;
}

std::string RelativeToWorkingDir(const std::string& working_dir, const std::string& absolute_path) {
    const auto root = NormalizeAbsolute(working_dir);
    const auto path = NormalizeAbsolute(absolute_path);
    if (path == root) {
        return {};
    }
    if (root == "/") {
        return path.substr(1);
    }
    if (kiln::utils::StartsWith(path, root + "/")) {
        return path.substr(root.size() + 1);
    }
    return path;
}

std::string PackageBaseName(const std::string& package_spec) {
    const auto spec = kiln::utils::Trim(package_spec);
    if (spec.empty()) {
        return {};
    }
    for (unsigned char c : spec) {
        const bool allowed = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '=' ||
            c == '<' || c == '>' || c == '!' || c == '~' || c == ',' || c == '[' || c == ']';
        if (!allowed) {
            return {};
        }
    }
    const auto end = spec.find_first_of("<>=!~,[");
    auto name = kiln::utils::ToLower(spec.substr(0, end));
    // PEP 503: runs of -, _ and . compare equal.
    std::replace(name.begin(), name.end(), '_', '-');
    std::replace(name.begin(), name.end(), '.', '-');
    return name;
}

void CheckPackageAllowed(const std::string& package_spec, const std::set<std::string>& allowed_packages) {
    const auto base = PackageBaseName(package_spec);
    if (base.empty()) {
        throw SandboxError(
            ErrorCode::kPackageNotAllowed,
            "package spec '" + package_spec + "' is not a valid requirement");
    }
    for (const auto& allowed : allowed_packages) {
        if (PackageBaseName(allowed) == base) {
            return;
        }
    }
    throw SandboxError(
        ErrorCode::kPackageNotAllowed,
        "package '" + base + "' is not in the allowed list");
}

std::vector<std::string> PipIndexArgs(const NetworkPolicy& policy) {
    if (policy.mode != NetworkPolicy::Mode::kAllowlist) {
        return {};
    }
    if (policy.allowed_domains.empty()) {
        throw SandboxError(ErrorCode::kPackageNotAllowed, "the network allowlist names no package index domain");
    }
    const auto preferred = policy.allowed_domains.find("pypi.org");
    const auto& domain = preferred != policy.allowed_domains.end() ? *preferred : *policy.allowed_domains.begin();
    return {"--isolated", "--index-url", "https://" + domain + "/simple"};
}

}  // namespace kiln::runtime
