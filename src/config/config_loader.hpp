#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace scalebox::config {

std::filesystem::path GetConfigPath();

// Applies the camelCase keys of a config.json document on top of config.
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);

// Defaults, then ~/.scalebox/config.json, then SCALEBOX_* environment variables.
Config LoadConfig();

// Throws InvalidArgumentError when no credential is configured.
void ValidateConnectionConfig(const ConnectionConfig& config);

}  // namespace scalebox::config
