#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace rampart::config {

// $RAMPART_CONFIG, or ~/.rampart/config.json.
std::filesystem::path GetConfigPath();

// Defaults, then the config file, then environment overrides.
Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironment(Config& config);

// Expands a leading "~" in a configured path.
std::string ExpandUserPath(const std::string& value);

}  // namespace rampart::config
