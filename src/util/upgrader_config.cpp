#include "util/upgrader_config.hpp"

#include "util/config_json_utils.hpp"

namespace vfsup::config {

Result UpgraderConfig::LoadFromFile(const std::string& path, UpgraderConfig& out) {
    out = UpgraderConfig{};

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail("Config: " + err);
    }

    UpgraderConfig loaded;
    if (!detail::FillConfigFromJson(json, loaded, err)) {
        return Result::Fail("Config: " + err + " in " + path);
    }

    out = std::move(loaded);
    return Result::Ok();
}

} // namespace vfsup::config
