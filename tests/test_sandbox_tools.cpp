#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "fakes/session_harness.hpp"
#include "nlohmann/json.hpp"
#include "tools/sandbox_tools.hpp"
#include "tools/tool_registry.hpp"

using kiln::fakes::FakeBackend;
using kiln::fakes::SessionHarness;
using kiln::runtime::ExecutionResult;
using kiln::runtime::FileReference;

class SandboxToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        kiln::tools::RegisterSandboxTools(registry, {harness.manager, harness.config});
    }

    SessionHarness harness;
    kiln::tools::ToolRegistry registry;
};

TEST(RenderExecutionResultTest, OrdersBlocksAndSkipsEmptyStreams) {
    ExecutionResult result{};
    result.stdout_text = "4\n";
    result.exit_code = 0;
    result.execution_duration = std::chrono::milliseconds(1500);
    EXPECT_EQ(kiln::tools::RenderExecutionResult(result), "STDOUT:\n4\n\nExit Code: 0\nDuration: 1.5000s");
}

TEST(RenderExecutionResultTest, ListsArtifactsAndWarnings) {
    ExecutionResult result{};
    result.stderr_text = "oops\n";
    result.exit_code = 2;

    FileReference inline_ref{};
    inline_ref.name = "plot.png";
    inline_ref.kind = FileReference::Kind::kInline;
    inline_ref.mime_type = "image/png";
    inline_ref.size_bytes = 120;
    result.artifacts.push_back(inline_ref);

    FileReference external{};
    external.name = "data.csv";
    external.kind = FileReference::Kind::kExternal;
    external.url = "https://storage.test/s1/data.csv";
    result.artifacts.push_back(external);
    result.warnings.push_back("report.pdf skipped: too large");

    EXPECT_EQ(kiln::tools::RenderExecutionResult(result),
              "STDERR:\noops\n\n"
              "Exit Code: 2\n"
              "Artifact: plot.png (inline image/png, 120 bytes)\n"
              "Artifact: data.csv (https://storage.test/s1/data.csv)\n"
              "Warning: report.pdf skipped: too large");
}

TEST_F(SandboxToolsTest, RegistersThreeToolsWithSchemas) {
    EXPECT_EQ(registry.List(), (std::vector<std::string>{"execute_code", "install_package", "list_files"}));
    for (const auto& def : registry.GetDefinitions()) {
        const auto schema = nlohmann::json::parse(def.parameters_json);
        EXPECT_EQ(schema["type"], "object") << def.name;
        EXPECT_FALSE(def.description.empty()) << def.name;
    }
}

TEST_F(SandboxToolsTest, ExecuteCodeCreatesSessionOnFirstUse) {
    const auto output = registry.Execute("execute_code",
                                         {{"session_id", "s1"}, {"language", "python"}, {"code", "print(1)"}});
    EXPECT_EQ(output.rfind("STDOUT:\nprint(1)", 0), 0u) << output;
    EXPECT_NE(output.find("Exit Code: 0"), std::string::npos);
    EXPECT_EQ(harness.manager->SessionCount(), 1u);

    registry.Execute("execute_code", {{"session_id", "s1"}, {"language", "bash"}, {"code", "ls"}});
    EXPECT_EQ(harness.BackendCount(), 1u);
}

TEST_F(SandboxToolsTest, ExecuteCodeRejectsBadInput) {
    EXPECT_EQ(registry.Execute("execute_code", {{"session_id", "s1"}, {"code", "x"}}),
              "Error: session_id, language and code are required");
    EXPECT_EQ(registry.Execute("execute_code", {{"session_id", "s1"}, {"language", "cobol"}, {"code", "x"}}),
              "Error: unsupported language 'cobol'");
    EXPECT_EQ(harness.BackendCount(), 0u);
}

TEST_F(SandboxToolsTest, TimeoutReportsPartialOutput) {
    harness.configure = [](FakeBackend& backend) {
        backend.on_run = [](const std::string&, kiln::runtime::Language, kiln::runtime::OutputSink& sink,
                            FakeBackend& self) {
            sink.AppendStdout("partial\n");
            self.WaitForAbort();
            return kiln::runtime::BackendRunResult{};
        };
    };
    const auto output = registry.Execute("execute_code",
                                         {{"session_id", "s1"}, {"language", "python"}, {"code", "while True: pass"}});
    EXPECT_EQ(output.rfind("Error: ", 0), 0u) << output;
    EXPECT_NE(output.find("timed out"), std::string::npos);
    EXPECT_NE(output.find("STDOUT:\npartial\n"), std::string::npos);
    EXPECT_EQ(harness.manager->SessionCount(), 0u);
}

TEST_F(SandboxToolsTest, InstallPackageReportsSuccess) {
    EXPECT_EQ(registry.Execute("install_package", {{"session_id", "s1"}, {"package_name", "numpy"}}),
              "Package numpy installed successfully.");
    ASSERT_EQ(harness.Backend(0)->installed.size(), 1u);
    EXPECT_EQ(harness.Backend(0)->installed[0], "numpy");
}

TEST_F(SandboxToolsTest, InstallPackageOutsideAllowlistIsAnError) {
    const auto output = registry.Execute("install_package", {{"session_id", "s1"}, {"package_name", "left-pad"}});
    EXPECT_EQ(output.rfind("Error: ", 0), 0u) << output;
    EXPECT_TRUE(harness.Backend(0)->installed.empty());
    EXPECT_EQ(registry.Execute("install_package", {{"session_id", "s1"}}),
              "Error: session_id and package_name are required");
}

TEST_F(SandboxToolsTest, FailedInstallReportsBackendError) {
    harness.configure = [](kiln::fakes::FakeBackend& backend) {
        backend.on_install = [](const std::string&, kiln::runtime::OutputSink& sink, kiln::fakes::FakeBackend&) {
            sink.AppendStderr("ERROR: No matching distribution found for numpy\n");
            throw std::runtime_error("pip install exited with 1");
        };
    };
    const auto output = registry.Execute("install_package", {{"session_id", "s1"}, {"package_name", "numpy"}});
    EXPECT_EQ(output.rfind("Error: ", 0), 0u) << output;
    EXPECT_NE(output.find("pip install exited with 1"), std::string::npos);
    EXPECT_EQ(output.find("installed successfully"), std::string::npos);
}

TEST_F(SandboxToolsTest, ListFilesShowsWorkingDirectory) {
    registry.Execute("execute_code", {{"session_id", "s1"}, {"language", "python"}, {"code", "pass"}});
    harness.Backend(0)->WriteFile("a.txt", "a");
    harness.Backend(0)->WriteFile("out/b.txt", "b");
    EXPECT_EQ(registry.Execute("list_files", {{"session_id", "s1"}}), "a.txt\nout");
    EXPECT_EQ(registry.Execute("list_files", {{"session_id", "s1"}, {"path", "out"}}), "b.txt");
    const auto escaped = registry.Execute("list_files", {{"session_id", "s1"}, {"path", "../../etc"}});
    EXPECT_EQ(escaped.rfind("Error: ", 0), 0u) << escaped;
}

TEST_F(SandboxToolsTest, UnknownToolIsReported) {
    EXPECT_EQ(registry.Execute("delete_everything", {}), "Error: Tool 'delete_everything' not found");
}

TEST_F(SandboxToolsTest, ProvisionFailureIsReturnedAsText) {
    harness.configure = [](FakeBackend& backend) { backend.fail_start = true; };
    const auto output = registry.Execute("execute_code",
                                         {{"session_id", "s1"}, {"language", "python"}, {"code", "1"}});
    EXPECT_EQ(output.rfind("Error: ", 0), 0u) << output;
    EXPECT_EQ(harness.manager->SessionCount(), 0u);
}

TEST_F(SandboxToolsTest, DuplicateRegistrationIsRejected) {
    EXPECT_TRUE(registry.Has("execute_code"));
    EXPECT_THROW(registry.Register(std::make_unique<kiln::tools::ListFilesTool>(
                     kiln::tools::SandboxToolContext{harness.manager, harness.config})),
                 std::invalid_argument);
    EXPECT_EQ(registry.List().size(), 3u);
}
