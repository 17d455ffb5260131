#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vfsup::config {

constexpr const char* kDefaultConfigPath = "/etc/vfs-upgrader/upgrader.json";

struct UpgraderConfig {
    std::string ring_config_path = "/etc/vfs/config.json";
    std::string release_feed_url = "https://api.github.com/repos/microsoft/VFSForGit/releases";
    std::string download_directory = "/var/cache/vfs-upgrader/downloads";
    std::string log_directory = "/var/log/vfs-upgrader";

    std::string product_name = "VFSForGit";
    std::string product_cli = "/usr/local/bin/gvfs";
    // Empty means the version this binary was built for.
    std::string current_version;

    std::string dependency_name = "Git";
    // Queried with --version for the installed-version log event.
    std::string dependency_cli = "/usr/bin/git";
    std::string dependency_asset_prefix = "Git-";
    std::string product_asset_prefix = "VFSForGit";
    std::string installer_entry = "install.sh";

    std::string rerun_command = "gvfs upgrade --confirm";
    std::uint64_t min_free_disk_bytes = 512ULL * 1024 * 1024;
    std::vector<std::string> blocking_processes = {"gvfs", "git"};

    LogLevel log_level = LogLevel::Info;

    // Keys absent from the file keep their defaults.
    static Result LoadFromFile(const std::string& path, UpgraderConfig& out);
};

} // namespace vfsup::config
