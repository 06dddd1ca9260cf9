#include "tools/sandbox_tools.hpp"

#include <cstdio>
#include <sstream>
#include <vector>

#include "runtime/sandbox_error.hpp"
#include "utils/common.hpp"

namespace kiln::tools {
namespace {

const std::string* Param(const ToolParams& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

std::string FormatDuration(double seconds) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.4fs", seconds);
    return buffer;
}

}  // namespace

std::string RenderExecutionResult(const kiln::runtime::ExecutionResult& result) {
    std::vector<std::string> blocks;
    if (!result.stdout_text.empty()) {
        blocks.push_back("STDOUT:\n" + result.stdout_text);
    }
    if (!result.stderr_text.empty()) {
        blocks.push_back("STDERR:\n" + result.stderr_text);
    }
    blocks.push_back("Exit Code: " + std::to_string(result.exit_code));
    if (result.execution_duration.count() > 0) {
        blocks.push_back("Duration: " + FormatDuration(result.DurationSeconds()));
    }
    for (const auto& artifact : result.artifacts) {
        std::ostringstream line;
        line << "Artifact: " << artifact.name << " (";
        if (artifact.kind == kiln::runtime::FileReference::Kind::kInline) {
            line << "inline " << artifact.mime_type << ", " << artifact.size_bytes << " bytes";
        } else {
            line << artifact.url.value_or("No URL");
        }
        line << ")";
        blocks.push_back(line.str());
    }
    for (const auto& warning : result.warnings) {
        blocks.push_back("Warning: " + warning);
    }
    return kiln::utils::Join(blocks, "\n");
}

ExecuteCodeTool::ExecuteCodeTool(SandboxToolContext context)
    : context_(std::move(context)) {}

std::string ExecuteCodeTool::ParametersJson() const {
    return R"({"type":"object","properties":{"session_id":{"type":"string"},"language":{"type":"string","enum":["python","bash","r"]},"code":{"type":"string"}},"required":["session_id","language","code"]})";
}

std::string ExecuteCodeTool::Execute(const ToolParams& params) {
    const auto* session_id = Param(params, "session_id");
    const auto* language_name = Param(params, "language");
    const auto* code = Param(params, "code");
    if (!session_id || !language_name || !code) {
        return "Error: session_id, language and code are required";
    }
    const auto language = kiln::runtime::ParseLanguage(*language_name);
    if (!language) {
        return "Error: unsupported language '" + *language_name + "'";
    }
    try {
        context_.manager->GetOrCreateSession(*session_id, context_.session_config);
        return RenderExecutionResult(context_.manager->Execute(*session_id, *code, *language));
    } catch (const kiln::runtime::ExecutionTimeoutError& ex) {
        const auto& partial = ex.Partial();
        std::string text = std::string("Error: ") + ex.what();
        if (!partial.stdout_text.empty()) {
            text += "\nSTDOUT:\n" + partial.stdout_text;
        }
        if (!partial.stderr_text.empty()) {
            text += "\nSTDERR:\n" + partial.stderr_text;
        }
        return text;
    } catch (const kiln::runtime::SandboxError& ex) {
        return std::string("Error: ") + ex.what();
    }
}

InstallPackageTool::InstallPackageTool(SandboxToolContext context)
    : context_(std::move(context)) {}

std::string InstallPackageTool::ParametersJson() const {
    return R"({"type":"object","properties":{"session_id":{"type":"string"},"package_name":{"type":"string"}},"required":["session_id","package_name"]})";
}

std::string InstallPackageTool::Execute(const ToolParams& params) {
    const auto* session_id = Param(params, "session_id");
    const auto* package = Param(params, "package_name");
    if (!session_id || !package) {
        return "Error: session_id and package_name are required";
    }
    try {
        context_.manager->GetOrCreateSession(*session_id, context_.session_config);
        // Install failures surface as SandboxError.
        context_.manager->InstallPackage(*session_id, *package);
        return "Package " + *package + " installed successfully.";
    } catch (const kiln::runtime::SandboxError& ex) {
        return std::string("Error: ") + ex.what();
    }
}

ListFilesTool::ListFilesTool(SandboxToolContext context)
    : context_(std::move(context)) {}

std::string ListFilesTool::ParametersJson() const {
    return R"({"type":"object","properties":{"session_id":{"type":"string"},"path":{"type":"string","default":"."}},"required":["session_id"]})";
}

std::string ListFilesTool::Execute(const ToolParams& params) {
    const auto* session_id = Param(params, "session_id");
    if (!session_id) {
        return "Error: session_id is required";
    }
    const auto* path = Param(params, "path");
    try {
        context_.manager->GetOrCreateSession(*session_id, context_.session_config);
        const auto entries = context_.manager->ListFiles(*session_id, path ? *path : ".");
        return kiln::utils::Join(entries, "\n");
    } catch (const kiln::runtime::SandboxError& ex) {
        return std::string("Error: ") + ex.what();
    }
}

void RegisterSandboxTools(ToolRegistry& registry, const SandboxToolContext& context) {
    registry.Register(std::make_unique<ExecuteCodeTool>(context));
    registry.Register(std::make_unique<InstallPackageTool>(context));
    registry.Register(std::make_unique<ListFilesTool>(context));
}

}  // namespace kiln::tools
