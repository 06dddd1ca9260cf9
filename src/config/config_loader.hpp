#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "runtime/runtime_types.hpp"

namespace kiln::config {

// ~/.kiln/config.json, or $KILN_CONFIG when set.
std::filesystem::path DefaultConfigPath();

// Defaults, then the JSON file (camelCase keys), then KILN_* environment
// overrides. A missing or malformed file leaves the defaults in place.
Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

// Throws std::invalid_argument for an unknown backend or network mode.
kiln::runtime::RuntimeConfig MakeRuntimeConfig(const Config& config);

// The effective configuration as JSON text, with secrets left out.
std::string DescribeConfig(const Config& config);

}  // namespace kiln::config
