#pragma once

#include <map>
#include <optional>
#include <string>

namespace kiln::integrations {

class SecretsProvider {
public:
    virtual ~SecretsProvider() = default;
    virtual std::optional<std::string> GetSecret(const std::string& name) const = 0;
};

// NAME, then KILN_NAME, from the process environment.
class EnvSecretsProvider : public SecretsProvider {
public:
    std::optional<std::string> GetSecret(const std::string& name) const override;
};

class StaticSecretsProvider : public SecretsProvider {
public:
    explicit StaticSecretsProvider(std::map<std::string, std::string> secrets) : secrets_(std::move(secrets)) {}

    std::optional<std::string> GetSecret(const std::string& name) const override {
        const auto it = secrets_.find(name);
        return it == secrets_.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

private:
    std::map<std::string, std::string> secrets_;
};

}  // namespace kiln::integrations
