#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace courier::config {

// Defaults, then ~/.courier/config.json, then COURIER_* environment variables.
Config LoadConfig();

// Applies a JSON document over the defaults and clamps numeric floors.
Config LoadConfigFromJson(const nlohmann::json& data);

std::filesystem::path GetDataPath();

}  // namespace courier::config
