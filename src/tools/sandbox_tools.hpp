#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "runtime/runtime_types.hpp"
#include "session/session_manager.hpp"
#include "tools/tool.hpp"
#include "tools/tool_registry.hpp"

namespace kiln::tools {

struct SandboxToolContext {
    std::shared_ptr<kiln::session::SessionManager> manager;
    // Used when a call names a session that does not exist yet.
    kiln::runtime::RuntimeConfig session_config;
};

// STDOUT/STDERR blocks, exit code, duration, then one line per artifact and
// per warning.
std::string RenderExecutionResult(const kiln::runtime::ExecutionResult& result);

class ExecuteCodeTool : public Tool {
public:
    explicit ExecuteCodeTool(SandboxToolContext context);

    std::string Name() const override { return "execute_code"; }
    std::string Description() const override {
        return "Execute python, bash or r code in the session's sandbox. Returns stdout, stderr, "
               "exit code and any files the code produced.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolParams& params) override;

private:
    SandboxToolContext context_;
};

class InstallPackageTool : public Tool {
public:
    explicit InstallPackageTool(SandboxToolContext context);

    std::string Name() const override { return "install_package"; }
    std::string Description() const override {
        return "Install a Python package from the allowed list into the session's sandbox.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolParams& params) override;

private:
    SandboxToolContext context_;
};

class ListFilesTool : public Tool {
public:
    explicit ListFilesTool(SandboxToolContext context);

    std::string Name() const override { return "list_files"; }
    std::string Description() const override {
        return "List a directory inside the session's working directory.";
    }
    std::string ParametersJson() const override;
    std::string Execute(const ToolParams& params) override;

private:
    SandboxToolContext context_;
};

void RegisterSandboxTools(ToolRegistry& registry, const SandboxToolContext& context);

}  // namespace kiln::tools
