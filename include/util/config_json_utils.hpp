#pragma once

#include "util/upgrader_config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace vfsup::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, UpgraderConfig& cfg, std::string& err);

} // namespace vfsup::config::detail
