#pragma once

#include "vfsup/ring.hpp"
#include "vfsup/version.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vfsup {

struct ReleaseAsset {
    std::string name;
    std::string url;
    std::string sha256;
    std::uint64_t size = 0;
};

struct ReleaseInfo {
    std::string tag;
    ProductVersion version;
    bool prerelease = false;
    std::vector<ReleaseAsset> assets;

    const ReleaseAsset* FindAssetByPrefix(std::string_view prefix) const;
};

class ReleaseFeed {
  public:
    // Releases with a tag that is not a version are dropped.
    static std::expected<std::vector<ReleaseInfo>, std::string> Parse(const std::string& json_text);

    // Slow sees only full releases, Fast also sees prereleases. Returns the newest
    // eligible release strictly newer than current.
    static std::optional<ReleaseInfo> SelectNewest(const std::vector<ReleaseInfo>& releases,
                                                   RingType ring,
                                                   const ProductVersion& current);
};

} // namespace vfsup
