#include <gtest/gtest.h>

#include "vfsup/release_feed.hpp"

namespace vfsup {
namespace {

constexpr const char* kFeed = R"([
  {
    "tag_name": "v1.0.21014.1",
    "prerelease": true,
    "assets": [
      {"name": "Git-2.41.0.vfs.0.0-linux-x64.tar.gz",
       "browser_download_url": "https://example.test/Git-2.41.0.tar.gz"},
      {"name": "VFSForGit.1.0.21014.1.tar.gz",
       "browser_download_url": "https://example.test/VFSForGit.1.0.21014.1.tar.gz",
       "sha256": "ABCDEF", "size": 1234}
    ]
  },
  {
    "tag_name": "v1.0.20112.1",
    "prerelease": false,
    "assets": [
      {"name": "Git-2.40.0.vfs.0.1-linux-x64.tar.gz",
       "browser_download_url": "https://example.test/Git-2.40.0.tar.gz"}
    ]
  },
  {"tag_name": "nightly-2020", "prerelease": true},
  {"tag_name": "v1.0.19130.1", "prerelease": false}
])";

ProductVersion PV(const char* text) { return *ProductVersion::Parse(text); }

TEST(ReleaseFeedTest, ParsesReleasesAndSkipsNonVersionTags) {
    auto releases = ReleaseFeed::Parse(kFeed);
    ASSERT_TRUE(releases.has_value()) << releases.error();
    ASSERT_EQ(releases->size(), 3u);

    const auto& first = (*releases)[0];
    EXPECT_EQ(first.tag, "v1.0.21014.1");
    EXPECT_TRUE(first.prerelease);
    ASSERT_EQ(first.assets.size(), 2u);
    EXPECT_EQ(first.assets[1].sha256, "ABCDEF");
    EXPECT_EQ(first.assets[1].size, 1234u);
    EXPECT_TRUE((*releases)[2].assets.empty());
}

TEST(ReleaseFeedTest, FindsAssetByPrefix) {
    auto releases = ReleaseFeed::Parse(kFeed);
    ASSERT_TRUE(releases.has_value()) << releases.error();

    const auto& first = (*releases)[0];
    const ReleaseAsset* git = first.FindAssetByPrefix("Git-");
    ASSERT_NE(git, nullptr);
    EXPECT_EQ(git->name, "Git-2.41.0.vfs.0.0-linux-x64.tar.gz");
    EXPECT_EQ(first.FindAssetByPrefix("Scalar"), nullptr);
}

TEST(ReleaseFeedTest, SlowRingIgnoresPrereleases) {
    auto releases = ReleaseFeed::Parse(kFeed);
    ASSERT_TRUE(releases.has_value()) << releases.error();

    auto slow = ReleaseFeed::SelectNewest(*releases, RingType::Slow, PV("1.0.19130.1"));
    ASSERT_TRUE(slow.has_value());
    EXPECT_EQ(slow->tag, "v1.0.20112.1");

    auto fast = ReleaseFeed::SelectNewest(*releases, RingType::Fast, PV("1.0.19130.1"));
    ASSERT_TRUE(fast.has_value());
    EXPECT_EQ(fast->tag, "v1.0.21014.1");
}

TEST(ReleaseFeedTest, NothingNewerThanCurrent) {
    auto releases = ReleaseFeed::Parse(kFeed);
    ASSERT_TRUE(releases.has_value()) << releases.error();

    EXPECT_FALSE(ReleaseFeed::SelectNewest(*releases, RingType::Fast, PV("1.0.21014.1")).has_value());
    EXPECT_FALSE(ReleaseFeed::SelectNewest(*releases, RingType::Slow, PV("1.0.20112.1")).has_value());
}

TEST(ReleaseFeedTest, NoneAndInvalidRingsSeeNothing) {
    auto releases = ReleaseFeed::Parse(kFeed);
    ASSERT_TRUE(releases.has_value()) << releases.error();

    EXPECT_FALSE(ReleaseFeed::SelectNewest(*releases, RingType::None, PV("0.1")).has_value());
    EXPECT_FALSE(ReleaseFeed::SelectNewest(*releases, RingType::Invalid, PV("0.1")).has_value());
}

TEST(ReleaseFeedTest, RejectsMalformedFeeds) {
    EXPECT_FALSE(ReleaseFeed::Parse("not json").has_value());
    EXPECT_FALSE(ReleaseFeed::Parse(R"({"tag_name": "v1.0"})").has_value());
    EXPECT_FALSE(ReleaseFeed::Parse(R"([{"tag_name": "v1.0", "assets": {}}])").has_value());
    EXPECT_FALSE(ReleaseFeed::Parse(R"([{"tag_name": "v1.0", "assets": [{"name": "x"}]}])").has_value());
    EXPECT_FALSE(ReleaseFeed::Parse(R"([{"tag_name": 5}])").has_value());
}

} // namespace
} // namespace vfsup
