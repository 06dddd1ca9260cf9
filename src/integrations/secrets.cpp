#include "integrations/secrets.hpp"

#include "utils/common.hpp"

namespace kiln::integrations {

std::optional<std::string> EnvSecretsProvider::GetSecret(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    for (const auto& candidate : {name, "KILN_" + name}) {
        const auto value = kiln::utils::GetEnv(candidate.c_str());
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace kiln::integrations
