#include "vfsup/product_upgrader.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <string_view>

namespace fs = std::filesystem;

namespace vfsup {

namespace {

constexpr std::array<std::string_view, 5> kArchiveSuffixes = {
    ".tar.gz", ".tgz", ".tar.xz", ".tar.bz2", ".tar"};

std::string StripArchiveSuffix(const std::string& name) {
    for (auto suffix : kArchiveSuffixes) {
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return name.substr(0, name.size() - suffix.size());
        }
    }
    return name;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ProductUpgrader::ProductUpgrader(Options opt,
                                 std::shared_ptr<IHttpClient> http,
                                 std::shared_ptr<IProcessLauncher> launcher)
    : opt_(std::move(opt)),
      http_(http ? std::move(http) : std::make_shared<CurlHttpClient>()),
      launcher_(launcher ? std::move(launcher) : std::make_shared<PosixProcessLauncher>()) {}

std::expected<RingType, std::string> ProductUpgrader::LoadRingConfig() {
    return RingConfig::LoadFromFile(opt_.ring_config_path);
}

std::expected<std::optional<ProductVersion>, std::string> ProductUpgrader::GetNewerVersion(RingType ring) {
    newest_.reset();

    auto current = ProductVersion::Parse(opt_.current_version);
    if (!current) {
        return std::unexpected("Installed version is unknown: " + current.error());
    }

    auto body = http_->Get(opt_.release_feed_url);
    if (!body) {
        return std::unexpected("Could not fetch release information: " + body.error());
    }

    auto releases = ReleaseFeed::Parse(*body);
    if (!releases) {
        return std::unexpected("Could not read release information: " + releases.error());
    }
    LogDebug("Release feed lists %zu releases", releases->size());

    newest_ = ReleaseFeed::SelectNewest(*releases, ring, *current);
    if (!newest_) {
        LogInfo("No release newer than %s in ring %s", current->ToString().c_str(), ToString(ring));
        return std::optional<ProductVersion>{};
    }

    LogInfo("Newest release in ring %s: %s (%zu assets)",
            ToString(ring),
            newest_->tag.c_str(),
            newest_->assets.size());
    return std::optional<ProductVersion>(newest_->version);
}

std::expected<DependencyVersion, std::string> ProductUpgrader::GetDependencyVersion() {
    if (!newest_) {
        return std::unexpected("No release selected; check for a newer version first");
    }

    const ReleaseAsset* asset = newest_->FindAssetByPrefix(opt_.dependency_asset_prefix);
    if (!asset) {
        return std::unexpected("Release " + newest_->tag + " has no " + opt_.dependency_asset_prefix +
                               " asset");
    }

    // "Git-2.40.0.vfs.0.1-linux-x64.tar.gz" -> "2.40.0.vfs.0.1"
    std::string rest = StripArchiveSuffix(asset->name.substr(opt_.dependency_asset_prefix.size()));
    rest = rest.substr(0, rest.find('-'));

    auto version = DependencyVersion::Parse(rest);
    if (!version) {
        return std::unexpected("Cannot read version from asset " + asset->name + ": " + version.error());
    }
    return *version;
}

Result ProductUpgrader::DownloadNewestVersion() {
    if (!newest_) return Result::Fail("No release selected to download");

    std::error_code ec;
    if (fs::create_directories(opt_.download_directory, ec)) created_download_dir_ = true;
    if (ec) {
        return Result::Fail(ec.value(),
                            "Cannot create download directory " + opt_.download_directory + ": " +
                                ec.message());
    }

    downloaded_.clear();
    for (const std::string& prefix : {opt_.dependency_asset_prefix, opt_.product_asset_prefix}) {
        const ReleaseAsset* asset = newest_->FindAssetByPrefix(prefix);
        if (!asset) {
            return Result::Fail("Release " + newest_->tag + " has no asset starting with " + prefix);
        }

        std::string local_path;
        auto r = DownloadAsset(*asset, local_path);
        if (!r.is_ok()) return r;
        downloaded_.emplace(prefix, std::move(local_path));
    }
    return Result::Ok();
}

Result ProductUpgrader::DownloadAsset(const ReleaseAsset& asset, std::string& out_path) {
    if (asset.name.find('/') != std::string::npos || asset.name == "..") {
        return Result::Fail("Refusing asset with unsafe name: " + asset.name);
    }

    out_path = (fs::path(opt_.download_directory) / asset.name).string();
    LogInfo("Downloading %s", asset.url.c_str());

    auto r = http_->DownloadToFile(asset.url, out_path);
    if (!r.is_ok()) return r;
    created_.push_back(out_path);

    if (!asset.sha256.empty()) {
        auto actual = Sha256HexFile(out_path);
        if (!actual) return Result::Fail(actual.error());
        if (*actual != ToLower(asset.sha256)) {
            std::error_code ec;
            fs::remove(out_path, ec);
            return Result::Fail("Checksum mismatch for " + asset.name + " (expected " + asset.sha256 +
                                ", got " + *actual + ")");
        }
        LogDebug("sha256 ok for %s", asset.name.c_str());
    }
    return Result::Ok();
}

std::expected<bool, std::string> ProductUpgrader::RunDependencyInstaller(const DependencyVersion& version) {
    return RunInstaller(opt_.dependency_asset_prefix, version.ToString());
}

std::expected<bool, std::string> ProductUpgrader::RunProductInstaller(const ProductVersion& version) {
    return RunInstaller(opt_.product_asset_prefix, version.ToString());
}

std::expected<bool, std::string> ProductUpgrader::RunInstaller(const std::string& asset_prefix,
                                                               const std::string& version_text) {
    auto it = downloaded_.find(asset_prefix);
    if (it == downloaded_.end()) {
        return std::unexpected("Installer for " + asset_prefix + " has not been downloaded");
    }

    const fs::path archive_path(it->second);
    const fs::path unpack_dir =
        archive_path.parent_path() / StripArchiveSuffix(archive_path.filename().string());

    const std::string install_log = unpack_dir.string() + ".install.log";
    created_.push_back(unpack_dir.string());
    created_.push_back(install_log);

    auto unpacked = unpacker_.UnpackToDir(archive_path.string(), unpack_dir.string());
    if (!unpacked.is_ok()) {
        return std::unexpected("Cannot unpack " + archive_path.filename().string() + ": " +
                               unpacked.message());
    }

    const fs::path installer = unpack_dir / opt_.installer_entry;
    std::error_code ec;
    if (!fs::is_regular_file(installer, ec)) {
        return std::unexpected("Installer " + opt_.installer_entry + " missing from " +
                               archive_path.filename().string());
    }

    LogInfo("Running installer %s (version %s)", installer.c_str(), version_text.c_str());

    auto exit_code = RunToCompletion(*launcher_, installer.string(), {"--log", install_log});
    if (!exit_code) return std::unexpected(exit_code.error());

    if (*exit_code != 0) {
        LogError("Installer %s exited with %d, see %s",
                 installer.c_str(), *exit_code, install_log.c_str());
        return false;
    }
    return true;
}

std::optional<std::string> ProductUpgrader::InstalledDependencyVersion() {
    if (opt_.dependency_cli.empty()) return std::nullopt;

    auto output = ReadCommandOutput(opt_.dependency_cli, {"--version"});
    if (!output) {
        LogDebug("Cannot query installed dependency version: %s", output.error().c_str());
        return std::nullopt;
    }

    constexpr std::string_view kMarker = "version ";
    const auto pos = output->find(kMarker);
    if (pos == std::string::npos) {
        LogDebug("Unexpected %s --version output: %s", opt_.dependency_cli.c_str(), output->c_str());
        return std::nullopt;
    }
    const auto begin = pos + kMarker.size();
    const auto end = output->find_first_of(" \t\r\n", begin);
    std::string version = output->substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    if (version.empty()) return std::nullopt;
    return version;
}

Result ProductUpgrader::Cleanup() {
    downloaded_.clear();

    // Only what this run put on disk; the directory may be shared.
    Result result = Result::Ok();
    for (const auto& path : created_) {
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec && result.is_ok()) {
            result = Result::Fail(ec.value(), "Cannot delete " + path + ": " + ec.message());
        }
    }
    LogDebug("Removed %zu downloaded items", created_.size());
    created_.clear();

    if (created_download_dir_) {
        std::error_code ec;
        if (fs::is_empty(opt_.download_directory, ec) && !ec) {
            fs::remove(opt_.download_directory, ec);
        }
        created_download_dir_ = false;
    }
    return result;
}

} // namespace vfsup
