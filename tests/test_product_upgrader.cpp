#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"
#include "vfsup/product_upgrader.hpp"

#include <cctype>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace vfsup {
namespace {

namespace fs = std::filesystem;

class FakeHttpClient final : public IHttpClient {
  public:
    std::map<std::string, std::string> responses;
    int get_calls = 0;
    int download_calls = 0;

    std::expected<std::string, std::string> Get(const std::string& url) override {
        ++get_calls;
        auto it = responses.find(url);
        if (it == responses.end()) return std::unexpected("HTTP 404 for " + url);
        return it->second;
    }

    Result DownloadToFile(const std::string& url, const std::string& path) override {
        ++download_calls;
        auto it = responses.find(url);
        if (it == responses.end()) return Result::Fail(22, "HTTP 404 for " + url);
        testutil::WriteFile(path, it->second);
        return Result::Ok();
    }
};

std::string TarBytes(const std::vector<testutil::TarEntry>& entries) {
    const auto bytes = testutil::BuildTar(entries);
    return std::string(bytes.begin(), bytes.end());
}

std::string Sha(const std::string& data) {
    return Sha256Hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

constexpr const char* kFeedUrl = "https://example.test/releases";
constexpr const char* kGitUrl = "https://example.test/Git-2.40.0.vfs.0.1-linux-x64.tar";
constexpr const char* kProductUrl = "https://example.test/VFSForGit-2.1.0.tar";

class ProductUpgraderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        git_tar = TarBytes({{"install.sh", "#!/bin/sh\nexit 0\n", AE_IFREG, 0755}});
        product_tar = TarBytes({{"install.sh", "#!/bin/sh\nexit 0\n", AE_IFREG, 0755},
                                {"bin/gvfs", "elf"}});
        SetFeed(Sha(git_tar), Sha(product_tar));
        http->responses[kGitUrl] = git_tar;
        http->responses[kProductUrl] = product_tar;
    }

    void SetFeed(const std::string& git_sha, const std::string& product_sha) {
        http->responses[kFeedUrl] = R"([
          {"tag_name": "v2.2.0", "prerelease": true, "assets": []},
          {"tag_name": "v2.1.0", "prerelease": false, "assets": [
            {"name": "Git-2.40.0.vfs.0.1-linux-x64.tar",
             "browser_download_url": ")" + std::string(kGitUrl) + R"(",
             "sha256": ")" + git_sha + R"("},
            {"name": "VFSForGit-2.1.0.tar",
             "browser_download_url": ")" + std::string(kProductUrl) + R"(",
             "sha256": ")" + product_sha + R"("}
          ]},
          {"tag_name": "v2.0.0", "prerelease": false, "assets": []}
        ])";
    }

    ProductUpgrader Make(const std::string& current = "2.0.0") {
        ProductUpgrader::Options opt;
        opt.ring_config_path = tmp.Join("config.json");
        opt.release_feed_url = kFeedUrl;
        opt.download_directory = tmp.Join("downloads");
        opt.current_version = current;
        opt.dependency_asset_prefix = "Git-";
        opt.product_asset_prefix = "VFSForGit";
        opt.installer_entry = "install.sh";
        return ProductUpgrader(opt, http, launcher);
    }

    testutil::TemporaryDirectory tmp;
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<testutil::FakeProcessLauncher> launcher =
        std::make_shared<testutil::FakeProcessLauncher>();
    std::string git_tar;
    std::string product_tar;
};

TEST_F(ProductUpgraderTest, LoadsRingFromConfigFile) {
    auto upgrader = Make();

    auto ring = upgrader.LoadRingConfig();
    ASSERT_TRUE(ring.has_value()) << ring.error();
    EXPECT_EQ(*ring, RingType::None);

    testutil::WriteFile(tmp.Join("config.json"), R"({"upgrade.ring": "Slow"})");
    ring = upgrader.LoadRingConfig();
    ASSERT_TRUE(ring.has_value()) << ring.error();
    EXPECT_EQ(*ring, RingType::Slow);
}

TEST_F(ProductUpgraderTest, FindsNewerVersionForRing) {
    auto upgrader = Make();

    auto slow = upgrader.GetNewerVersion(RingType::Slow);
    ASSERT_TRUE(slow.has_value()) << slow.error();
    ASSERT_TRUE(slow->has_value());
    EXPECT_EQ((*slow)->ToString(), "2.1.0");

    auto fast = upgrader.GetNewerVersion(RingType::Fast);
    ASSERT_TRUE(fast.has_value()) << fast.error();
    ASSERT_TRUE(fast->has_value());
    EXPECT_EQ((*fast)->ToString(), "2.2.0");
}

TEST_F(ProductUpgraderTest, NoNewerVersionIsNotAnError) {
    auto upgrader = Make("2.1.0");

    auto newer = upgrader.GetNewerVersion(RingType::Slow);
    ASSERT_TRUE(newer.has_value()) << newer.error();
    EXPECT_FALSE(newer->has_value());
    EXPECT_FALSE(upgrader.GetDependencyVersion().has_value());
}

TEST_F(ProductUpgraderTest, FeedFetchFailureIsError) {
    http->responses.erase(kFeedUrl);
    auto upgrader = Make();

    auto newer = upgrader.GetNewerVersion(RingType::Slow);
    ASSERT_FALSE(newer.has_value());
    EXPECT_NE(newer.error().find("HTTP 404"), std::string::npos);
}

TEST_F(ProductUpgraderTest, UnknownInstalledVersionIsError) {
    auto upgrader = Make("dev-build");
    auto newer = upgrader.GetNewerVersion(RingType::Slow);
    ASSERT_FALSE(newer.has_value());
    EXPECT_EQ(http->get_calls, 0);
}

TEST_F(ProductUpgraderTest, ReadsDependencyVersionFromAssetName) {
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());

    auto dep = upgrader.GetDependencyVersion();
    ASSERT_TRUE(dep.has_value()) << dep.error();
    EXPECT_EQ(dep->ToString(), "2.40.0.vfs.0.1");
    EXPECT_EQ(dep->Minor(), 40);
}

TEST_F(ProductUpgraderTest, MissingDependencyAssetIsError) {
    auto upgrader = Make();
    auto newer = upgrader.GetNewerVersion(RingType::Fast);
    ASSERT_TRUE(newer.has_value()) << newer.error();

    auto dep = upgrader.GetDependencyVersion();
    ASSERT_FALSE(dep.has_value());
    EXPECT_NE(dep.error().find("v2.2.0"), std::string::npos);
}

TEST_F(ProductUpgraderTest, DownloadsAndVerifiesAssets) {
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());

    auto res = upgrader.DownloadNewestVersion();
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(http->download_calls, 2);

    const auto& assets = upgrader.DownloadedAssets();
    ASSERT_EQ(assets.size(), 2u);
    EXPECT_EQ(assets.at("Git-"), tmp.Join("downloads") + "/Git-2.40.0.vfs.0.1-linux-x64.tar");
    EXPECT_EQ(testutil::ReadFile(assets.at("VFSForGit")), product_tar);
}

TEST_F(ProductUpgraderTest, ChecksumIsCaseInsensitive) {
    std::string upper = Sha(git_tar);
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    SetFeed(upper, Sha(product_tar));
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());

    auto res = upgrader.DownloadNewestVersion();
    EXPECT_TRUE(res.is_ok()) << res.msg;
}

TEST_F(ProductUpgraderTest, ChecksumMismatchRemovesFile) {
    SetFeed(Sha("something else"), Sha(product_tar));
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());

    auto res = upgrader.DownloadNewestVersion();
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Checksum mismatch"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp.Join("downloads") + "/Git-2.40.0.vfs.0.1-linux-x64.tar"));
}

TEST_F(ProductUpgraderTest, DownloadWithoutReleaseFails) {
    auto upgrader = Make();
    EXPECT_FALSE(upgrader.DownloadNewestVersion().is_ok());
}

TEST_F(ProductUpgraderTest, RunsInstallersFromUnpackedAssets) {
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());
    auto dep = upgrader.GetDependencyVersion();
    ASSERT_TRUE(dep.has_value()) << dep.error();
    ASSERT_TRUE(upgrader.DownloadNewestVersion().is_ok());

    auto git = upgrader.RunDependencyInstaller(*dep);
    ASSERT_TRUE(git.has_value()) << git.error();
    EXPECT_TRUE(*git);

    auto product = upgrader.RunProductInstaller(*ProductVersion::Parse("2.1.0"));
    ASSERT_TRUE(product.has_value()) << product.error();
    EXPECT_TRUE(*product);

    const std::string downloads = tmp.Join("downloads");
    ASSERT_EQ(launcher->launches.size(), 2u);
    EXPECT_EQ(launcher->launches[0].path, downloads + "/Git-2.40.0.vfs.0.1-linux-x64/install.sh");
    EXPECT_EQ(launcher->launches[0].args,
              (std::vector<std::string>{"--log", downloads + "/Git-2.40.0.vfs.0.1-linux-x64.install.log"}));
    EXPECT_EQ(launcher->launches[1].path, downloads + "/VFSForGit-2.1.0/install.sh");
    EXPECT_TRUE(fs::exists(downloads + "/VFSForGit-2.1.0/bin/gvfs"));
}

TEST_F(ProductUpgraderTest, NonZeroInstallerExitIsFalse) {
    launcher->exit_code = 1;
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());
    ASSERT_TRUE(upgrader.DownloadNewestVersion().is_ok());

    auto product = upgrader.RunProductInstaller(*ProductVersion::Parse("2.1.0"));
    ASSERT_TRUE(product.has_value()) << product.error();
    EXPECT_FALSE(*product);
}

TEST_F(ProductUpgraderTest, InstallerThatCannotStartIsError) {
    launcher->start_result = false;
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());
    ASSERT_TRUE(upgrader.DownloadNewestVersion().is_ok());

    auto product = upgrader.RunProductInstaller(*ProductVersion::Parse("2.1.0"));
    ASSERT_FALSE(product.has_value());
    EXPECT_NE(product.error().find("failed to start"), std::string::npos);
}

TEST_F(ProductUpgraderTest, MissingInstallerEntryIsError) {
    product_tar = TarBytes({{"README", "no installer here"}});
    http->responses[kProductUrl] = product_tar;
    SetFeed(Sha(git_tar), Sha(product_tar));

    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());
    ASSERT_TRUE(upgrader.DownloadNewestVersion().is_ok());

    auto product = upgrader.RunProductInstaller(*ProductVersion::Parse("2.1.0"));
    ASSERT_FALSE(product.has_value());
    EXPECT_NE(product.error().find("install.sh missing"), std::string::npos);
    EXPECT_TRUE(launcher->launches.empty());
}

TEST_F(ProductUpgraderTest, InstallBeforeDownloadIsError) {
    auto upgrader = Make();
    auto product = upgrader.RunProductInstaller(*ProductVersion::Parse("2.1.0"));
    EXPECT_FALSE(product.has_value());
}

TEST_F(ProductUpgraderTest, CleanupRemovesDownloadsAndIsRepeatable) {
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());
    ASSERT_TRUE(upgrader.DownloadNewestVersion().is_ok());
    ASSERT_TRUE(fs::exists(tmp.Join("downloads")));

    auto first = upgrader.Cleanup();
    ASSERT_TRUE(first.is_ok()) << first.msg;
    EXPECT_FALSE(fs::exists(tmp.Join("downloads")));
    EXPECT_TRUE(upgrader.DownloadedAssets().empty());

    auto second = upgrader.Cleanup();
    EXPECT_TRUE(second.is_ok()) << second.msg;
}

TEST_F(ProductUpgraderTest, CleanupWithoutDownloadTouchesNothing) {
    fs::create_directories(tmp.Join("downloads"));
    testutil::WriteFile(tmp.Join("downloads/keep.txt"), "operator data");
    auto upgrader = Make();

    auto res = upgrader.Cleanup();
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(testutil::ReadFile(tmp.Join("downloads/keep.txt")), "operator data");
}

TEST_F(ProductUpgraderTest, CleanupKeepsFilesItDidNotCreate) {
    fs::create_directories(tmp.Join("downloads"));
    testutil::WriteFile(tmp.Join("downloads/keep.txt"), "operator data");
    auto upgrader = Make();
    ASSERT_TRUE(upgrader.GetNewerVersion(RingType::Slow).has_value());
    auto dep = upgrader.GetDependencyVersion();
    ASSERT_TRUE(dep.has_value()) << dep.error();
    ASSERT_TRUE(upgrader.DownloadNewestVersion().is_ok());
    ASSERT_TRUE(upgrader.RunDependencyInstaller(*dep).has_value());

    auto res = upgrader.Cleanup();
    ASSERT_TRUE(res.is_ok()) << res.msg;

    const std::string downloads = tmp.Join("downloads");
    EXPECT_EQ(testutil::ReadFile(downloads + "/keep.txt"), "operator data");
    EXPECT_FALSE(fs::exists(downloads + "/Git-2.40.0.vfs.0.1-linux-x64.tar"));
    EXPECT_FALSE(fs::exists(downloads + "/Git-2.40.0.vfs.0.1-linux-x64"));
    EXPECT_FALSE(fs::exists(downloads + "/VFSForGit-2.1.0.tar"));
}

TEST_F(ProductUpgraderTest, ReadsInstalledDependencyVersion) {
    const std::string cli = tmp.Join("git");
    testutil::WriteFile(cli, "#!/bin/sh\necho 'git version 2.40.0.vfs.0.1'\n");
    fs::permissions(cli, fs::perms::owner_all);

    ProductUpgrader::Options opt;
    opt.download_directory = tmp.Join("downloads");
    opt.product_asset_prefix = "VFSForGit";
    opt.dependency_cli = cli;
    ProductUpgrader upgrader(opt, http, launcher);

    auto version = upgrader.InstalledDependencyVersion();
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(*version, "2.40.0.vfs.0.1");
}

TEST_F(ProductUpgraderTest, InstalledDependencyVersionIsBestEffort) {
    const std::string broken = tmp.Join("git");
    testutil::WriteFile(broken, "#!/bin/sh\necho 'no such command' >&2\nexit 1\n");
    fs::permissions(broken, fs::perms::owner_all);

    ProductUpgrader::Options opt;
    opt.download_directory = tmp.Join("downloads");
    opt.product_asset_prefix = "VFSForGit";

    EXPECT_FALSE(ProductUpgrader(opt, http, launcher).InstalledDependencyVersion().has_value());

    opt.dependency_cli = broken;
    EXPECT_FALSE(ProductUpgrader(opt, http, launcher).InstalledDependencyVersion().has_value());

    opt.dependency_cli = tmp.Join("missing-git");
    EXPECT_FALSE(ProductUpgrader(opt, http, launcher).InstalledDependencyVersion().has_value());
}

} // namespace
} // namespace vfsup
