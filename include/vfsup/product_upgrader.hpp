#pragma once

#include "net/http_client.hpp"
#include "system/process_launcher.hpp"
#include "util/result.hpp"
#include "vfsup/archive_unpacker.hpp"
#include "vfsup/release_feed.hpp"
#include "vfsup/ring.hpp"
#include "vfsup/version.hpp"

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vfsup {

// Release discovery, download and installer execution. Failures are reported as
// values; nothing here throws into the orchestrator.
class IProductUpgrader {
  public:
    virtual ~IProductUpgrader() = default;

    virtual std::expected<RingType, std::string> LoadRingConfig() = 0;
    // nullopt: nothing newer than the installed version in this ring.
    virtual std::expected<std::optional<ProductVersion>, std::string> GetNewerVersion(RingType ring) = 0;
    virtual std::expected<DependencyVersion, std::string> GetDependencyVersion() = 0;
    virtual Result DownloadNewestVersion() = 0;
    // false: the installer ran and reported failure.
    virtual std::expected<bool, std::string> RunDependencyInstaller(const DependencyVersion& version) = 0;
    virtual std::expected<bool, std::string> RunProductInstaller(const ProductVersion& version) = 0;
    virtual Result Cleanup() = 0;

    virtual std::string CurrentVersion() const = 0;
    // Best effort: nullopt when the installed dependency cannot be queried.
    virtual std::optional<std::string> InstalledDependencyVersion() = 0;
};

class ProductUpgrader final : public IProductUpgrader {
  public:
    struct Options {
        std::string ring_config_path;
        std::string release_feed_url;
        std::string download_directory;
        std::string current_version;
        // Answers `--version` with "<name> version <x>".
        std::string dependency_cli;
        std::string dependency_asset_prefix = "Git-";
        std::string product_asset_prefix;
        std::string installer_entry = "install.sh";
    };

    ProductUpgrader(Options opt,
                    std::shared_ptr<IHttpClient> http,
                    std::shared_ptr<IProcessLauncher> launcher);

    std::expected<RingType, std::string> LoadRingConfig() override;
    std::expected<std::optional<ProductVersion>, std::string> GetNewerVersion(RingType ring) override;
    std::expected<DependencyVersion, std::string> GetDependencyVersion() override;
    Result DownloadNewestVersion() override;
    std::expected<bool, std::string> RunDependencyInstaller(const DependencyVersion& version) override;
    std::expected<bool, std::string> RunProductInstaller(const ProductVersion& version) override;
    Result Cleanup() override;

    std::string CurrentVersion() const override { return opt_.current_version; }
    std::optional<std::string> InstalledDependencyVersion() override;

    // Asset name prefix -> local path of the verified download.
    const std::map<std::string, std::string>& DownloadedAssets() const { return downloaded_; }

  private:
    Result DownloadAsset(const ReleaseAsset& asset, std::string& out_path);
    std::expected<bool, std::string> RunInstaller(const std::string& asset_prefix,
                                                  const std::string& version_text);

    Options opt_;
    std::shared_ptr<IHttpClient> http_;
    std::shared_ptr<IProcessLauncher> launcher_;
    ArchiveUnpacker unpacker_;

    std::optional<ReleaseInfo> newest_;
    std::map<std::string, std::string> downloaded_;
    // Files and directories this instance wrote; Cleanup() removes exactly these.
    std::vector<std::string> created_;
    bool created_download_dir_ = false;
};

} // namespace vfsup
