#pragma once

#include <set>
#include <string>
#include <vector>

#include "runtime/runtime_types.hpp"

namespace kiln::runtime {

// Resolves a caller-supplied remote path against the working directory.
// Relative paths are taken relative to working_dir; absolute paths must lie
// inside it. Throws SandboxError(kPathViolation) for empty paths, embedded
// NUL, any ".." segment, or anything that lands outside working_dir.
std::string ResolveRemotePath(const std::string& working_dir, const std::string& remote_path);

// Path of `absolute_path` relative to working_dir ("" for the root itself).
std::string RelativeToWorkingDir(const std::string& working_dir, const std::string& absolute_path);

// "Pandas>=1.0,<2.0" -> "pandas". Returns "" for specs that contain shell
// metacharacters or whitespace.
std::string PackageBaseName(const std::string& package_spec);

// Throws SandboxError(kPackageNotAllowed) unless the base name is in the
// allowlist.
void CheckPackageAllowed(const std::string& package_spec, const std::set<std::string>& allowed_packages);

// pip arguments that pin package fetches to the policy's index. Under
// allowlist mode the index is built from allowed_domains ("pypi.org" when
// listed, else the first domain) and pip is run isolated so no configured
// index can widen it. Throws SandboxError(kPackageNotAllowed) when allowlist
// mode lists no domain. Under none mode the host's own pip setup is used.
std::vector<std::string> PipIndexArgs(const NetworkPolicy& policy);

}  // namespace kiln::runtime
