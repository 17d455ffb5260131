#include <gtest/gtest.h>

#include "testing.hpp"
#include "vfsup/archive_unpacker.hpp"

#include <filesystem>
#include <string>

namespace vfsup {
namespace {

TEST(ArchivePathPolicyTest, NormalizesSafeEntryPath) {
    std::string out;
    auto res = ArchivePathPolicy::Normalize("./dir//file.txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "dir/file.txt");
}

TEST(ArchivePathPolicyTest, RootEntryNormalizesToEmpty) {
    std::string out = "stale";
    auto res = ArchivePathPolicy::Normalize("./", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.empty());
}

TEST(ArchivePathPolicyTest, RejectsUnsafeEntryPath) {
    std::string out;

    auto res = ArchivePathPolicy::Normalize("../escape.txt", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);

    res = ArchivePathPolicy::Normalize("a/../../b", out);
    EXPECT_FALSE(res.is_ok());

    res = ArchivePathPolicy::Normalize("dir\\file", out);
    EXPECT_FALSE(res.is_ok());
}

TEST(ArchivePathPolicyTest, RejectsAbsolutePath) {
    std::string out;
    auto res = ArchivePathPolicy::Normalize("/etc/passwd", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Absolute path"), std::string::npos);
}

TEST(ArchiveUnpackerTest, UnpacksFilesAndDirectories) {
    testutil::TemporaryDirectory tmp;
    const std::string tar = tmp.Join("Git-2.40.0.tar");
    testutil::WriteTar(tar, {
        {"./bin", "", AE_IFDIR, 0755},
        {"./bin/git", "#!/bin/sh\n", AE_IFREG, 0755},
        {"install.sh", "#!/bin/sh\nexit 0\n", AE_IFREG, 0755},
    });

    const std::string dst = tmp.Join("out");
    ArchiveUnpacker unpacker;
    auto res = unpacker.UnpackToDir(tar, dst);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_TRUE(std::filesystem::is_directory(dst + "/bin"));
    EXPECT_EQ(testutil::ReadFile(dst + "/bin/git"), "#!/bin/sh\n");
    EXPECT_EQ(testutil::ReadFile(dst + "/install.sh"), "#!/bin/sh\nexit 0\n");
}

TEST(ArchiveUnpackerTest, RefusesEntryOutsideDestination) {
    testutil::TemporaryDirectory tmp;
    const std::string tar = tmp.Join("evil.tar");
    testutil::WriteTar(tar, {{"../escape.txt", "gotcha"}});

    ArchiveUnpacker unpacker;
    auto res = unpacker.UnpackToDir(tar, tmp.Join("out"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_FALSE(std::filesystem::exists(tmp.Join("escape.txt")));
}

TEST(ArchiveUnpackerTest, MissingArchiveFails) {
    testutil::TemporaryDirectory tmp;
    ArchiveUnpacker unpacker;
    auto res = unpacker.UnpackToDir(tmp.Join("missing.tar"), tmp.Join("out"));
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Could not open archive"), std::string::npos);
}

} // namespace
} // namespace vfsup
