#include <gtest/gtest.h>

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "runtime/path_policy.hpp"
#include "runtime/sandbox_error.hpp"

using namespace kiln::runtime;

namespace {

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SandboxError& ex) {
        return ex.Code();
    }
    ADD_FAILURE() << "expected a SandboxError";
    return ErrorCode::kBackendFailure;
}

}  // namespace

TEST(PathPolicyTest, ResolvesRelativePathsAgainstWorkingDirectory) {
    EXPECT_EQ(ResolveRemotePath("/home/user", "data.csv"), "/home/user/data.csv");
    EXPECT_EQ(ResolveRemotePath("/home/user", "./out//plot.png"), "/home/user/out/plot.png");
    EXPECT_EQ(ResolveRemotePath("/home/user/", "."), "/home/user");
}

TEST(PathPolicyTest, AcceptsAbsolutePathsInsideWorkingDirectory) {
    EXPECT_EQ(ResolveRemotePath("/home/user", "/home/user/a/b.txt"), "/home/user/a/b.txt");
}

TEST(PathPolicyTest, RejectsTraversalAndEscapes) {
    EXPECT_EQ(CodeOf([] { ResolveRemotePath("/home/user", "../etc/passwd"); }), ErrorCode::kPathViolation);
    EXPECT_EQ(CodeOf([] { ResolveRemotePath("/home/user", "a/../../b"); }), ErrorCode::kPathViolation);
    EXPECT_EQ(CodeOf([] { ResolveRemotePath("/home/user", "/etc/passwd"); }), ErrorCode::kPathViolation);
    EXPECT_EQ(CodeOf([] { ResolveRemotePath("/home/user", "/home/username/x"); }), ErrorCode::kPathViolation);
    EXPECT_EQ(CodeOf([] { ResolveRemotePath("/home/user", ""); }), ErrorCode::kPathViolation);
    EXPECT_EQ(CodeOf([] { ResolveRemotePath("/home/user", std::string("a\0b", 3)); }), ErrorCode::kPathViolation);
}

TEST(PathPolicyTest, RelativeToWorkingDirectory) {
    EXPECT_EQ(RelativeToWorkingDir("/home/user", "/home/user/out/plot.png"), "out/plot.png");
    EXPECT_EQ(RelativeToWorkingDir("/home/user", "/home/user"), "");
}

TEST(PathPolicyTest, PackageBaseNameStripsVersionsAndNormalizes) {
    EXPECT_EQ(PackageBaseName("numpy"), "numpy");
    EXPECT_EQ(PackageBaseName("Pandas>=1.0,<2.0"), "pandas");
    EXPECT_EQ(PackageBaseName("scikit_learn==1.4"), "scikit-learn");
    EXPECT_EQ(PackageBaseName("requests[socks]"), "requests");
    EXPECT_EQ(PackageBaseName("numpy; rm -rf /"), "");
    EXPECT_EQ(PackageBaseName("  "), "");
}

TEST(PathPolicyTest, PackageAllowlist) {
    const std::set<std::string> allowed{"numpy", "pandas"};
    EXPECT_NO_THROW(CheckPackageAllowed("numpy==1.26.4", allowed));
    EXPECT_NO_THROW(CheckPackageAllowed("Pandas", allowed));
    EXPECT_EQ(CodeOf([&] { CheckPackageAllowed("torch", allowed); }), ErrorCode::kPackageNotAllowed);
    EXPECT_EQ(CodeOf([&] { CheckPackageAllowed("numpy && curl evil", allowed); }), ErrorCode::kPackageNotAllowed);
}

TEST(PathPolicyTest, PipIndexFollowsNetworkPolicy) {
    EXPECT_TRUE(PipIndexArgs(NetworkPolicy::None()).empty());
    EXPECT_EQ(PipIndexArgs(NetworkPolicy::Allowlist({"pypi.org", "files.pythonhosted.org"}, {})),
              (std::vector<std::string>{"--isolated", "--index-url", "https://pypi.org/simple"}));
    EXPECT_EQ(CodeOf([] { PipIndexArgs(NetworkPolicy::Allowlist({}, {"numpy"})); }), ErrorCode::kPackageNotAllowed);
}
