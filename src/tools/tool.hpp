#pragma once

#include <string>
#include <unordered_map>

namespace kiln::tools {

using ToolParams = std::unordered_map<std::string, std::string>;

// What a caller needs to invoke a tool: parameters_json is a JSON Schema
// object describing ToolParams.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

// A named operation over string parameters. Execute reports failures in its
// returned text ("Error: ..."); it throws only on programming errors.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual std::string Execute(const ToolParams& params) = 0;

    ToolDefinition Definition() const { return {Name(), Description(), ParametersJson()}; }
};

}  // namespace kiln::tools
