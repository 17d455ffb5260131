#include "util/config_json_utils.hpp"

#include <filesystem>
#include <fstream>

namespace vfsup::config::detail {

namespace {

// Each getter reports a present-but-mistyped key as an error instead of
// silently keeping the default.

bool GetString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64(const nlohmann::json& j, const char* key, std::uint64_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetStringList(const nlohmann::json& j,
                   const char* key,
                   std::vector<std::string>& out,
                   std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UpgraderConfig& cfg, std::string& err) {
    if (!GetString(j, "RingConfigPath", cfg.ring_config_path, err) ||
        !GetString(j, "ReleaseFeedUrl", cfg.release_feed_url, err) ||
        !GetString(j, "DownloadDirectory", cfg.download_directory, err) ||
        !GetString(j, "LogDirectory", cfg.log_directory, err) ||
        !GetString(j, "ProductName", cfg.product_name, err) ||
        !GetString(j, "ProductCli", cfg.product_cli, err) ||
        !GetString(j, "CurrentVersion", cfg.current_version, err) ||
        !GetString(j, "DependencyName", cfg.dependency_name, err) ||
        !GetString(j, "DependencyCli", cfg.dependency_cli, err) ||
        !GetString(j, "DependencyAssetPrefix", cfg.dependency_asset_prefix, err) ||
        !GetString(j, "ProductAssetPrefix", cfg.product_asset_prefix, err) ||
        !GetString(j, "InstallerEntry", cfg.installer_entry, err) ||
        !GetString(j, "RerunCommand", cfg.rerun_command, err) ||
        !GetU64(j, "MinFreeDiskBytes", cfg.min_free_disk_bytes, err) ||
        !GetStringList(j, "BlockingProcesses", cfg.blocking_processes, err)) {
        return false;
    }

    std::string level;
    if (!GetString(j, "LogLevel", level, err))
        return false;
    if (!level.empty() && !ParseLogLevel(level, cfg.log_level)) {
        err = "unknown LogLevel: " + level;
        return false;
    }

    if (cfg.download_directory.empty()) {
        err = "DownloadDirectory must not be empty";
        return false;
    }
    const auto dl = std::filesystem::path(cfg.download_directory).lexically_normal();
    if (dl == "." || dl == ".." || dl == dl.root_path()) {
        err = "DownloadDirectory must name a dedicated directory: " + cfg.download_directory;
        return false;
    }
    if (cfg.product_asset_prefix.empty() || cfg.dependency_asset_prefix.empty()) {
        err = "ProductAssetPrefix/DependencyAssetPrefix must not be empty";
        return false;
    }
    if (cfg.product_asset_prefix == cfg.dependency_asset_prefix) {
        err = "ProductAssetPrefix and DependencyAssetPrefix must differ";
        return false;
    }

    return true;
}

} // namespace vfsup::config::detail
