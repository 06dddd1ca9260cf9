#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tools/tool.hpp"

namespace kiln::tools {

// Name-keyed tool table. Execute never throws: unknown tools and escaped
// exceptions come back as "Error: ..." text.
class ToolRegistry {
public:
    // Throws std::invalid_argument for an unnamed or already registered tool.
    void Register(std::unique_ptr<Tool> tool);
    bool Has(const std::string& name) const;

    // Sorted by name.
    std::vector<ToolDefinition> GetDefinitions() const;
    std::vector<std::string> List() const;

    std::string Execute(const std::string& name, const ToolParams& params);

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace kiln::tools
