#include "tools/tool_registry.hpp"

#include <exception>
#include <stdexcept>
#include <unordered_map>

#include "utils/logging.hpp"

namespace kiln::tools {
namespace {

// Code bodies can be large; only their size is logged.
std::unordered_map<std::string, std::string> CallFields(const std::string& name, const ToolParams& params) {
    std::unordered_map<std::string, std::string> fields{{"tool", name}};
    for (const auto& [key, value] : params) {
        fields[key] = key == "code" ? std::to_string(value.size()) + " bytes" : value;
    }
    return fields;
}

}  // namespace

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    if (name.empty()) {
        throw std::invalid_argument("tool has no name");
    }
    if (!tools_.emplace(name, std::move(tool)).second) {
        throw std::invalid_argument("tool already registered: " + name);
    }
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::vector<ToolDefinition> ToolRegistry::GetDefinitions() const {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        defs.push_back(tool->Definition());
    }
    return defs;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::string ToolRegistry::Execute(const std::string& name, const ToolParams& params) {
    const auto it = tools_.find(name);
    if (it == tools_.end()) {
        kiln::utils::LogWarn("tool", "unknown tool", {{"tool", name}});
        return "Error: Tool '" + name + "' not found";
    }
    kiln::utils::LogInfo("tool", "start", CallFields(name, params));
    std::string result;
    try {
        result = it->second->Execute(params);
    } catch (const std::exception& ex) {
        kiln::utils::LogError("tool", "failed", {{"tool", name}, {"error", ex.what()}});
        result = std::string("Error: ") + ex.what();
    }
    kiln::utils::LogInfo("tool", "end", {{"tool", name}, {"size", std::to_string(result.size())}});
    return result;
}

}  // namespace kiln::tools
