#include "vfsup/release_feed.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace vfsup {

using json = nlohmann::json;

namespace {

std::expected<std::vector<ReleaseAsset>, std::string> ParseAssets(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'assets' must be an array");
    }

    std::vector<ReleaseAsset> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_object()) return std::unexpected("release asset must be an object");
        ReleaseAsset a;
        a.name = item.value("name", "");
        a.url = item.value("browser_download_url", "");
        a.sha256 = item.value("sha256", "");
        a.size = item.value("size", 0ULL);
        if (a.name.empty() || a.url.empty()) {
            return std::unexpected("release asset missing name or browser_download_url");
        }
        out.push_back(std::move(a));
    }
    return out;
}

bool IsEligible(const ReleaseInfo& release, RingType ring) {
    switch (ring) {
        case RingType::Fast: return true;
        case RingType::Slow: return !release.prerelease;
        default:             return false;
    }
}

} // namespace

const ReleaseAsset* ReleaseInfo::FindAssetByPrefix(std::string_view prefix) const {
    for (const auto& asset : assets) {
        if (asset.name.rfind(prefix, 0) == 0) return &asset;
    }
    return nullptr;
}

std::expected<std::vector<ReleaseInfo>, std::string> ReleaseFeed::Parse(const std::string& json_text) {
    try {
        auto j = json::parse(json_text);
        if (!j.is_array()) {
            return std::unexpected("release feed root must be an array");
        }

        std::vector<ReleaseInfo> releases;
        for (const auto& item : j) {
            if (!item.is_object()) return std::unexpected("release entry must be an object");

            ReleaseInfo r;
            r.tag = item.value("tag_name", "");
            r.prerelease = item.value("prerelease", false);

            auto version = ProductVersion::Parse(r.tag);
            if (!version) {
                LogDebug("Skipping release '%s': %s", r.tag.c_str(), version.error().c_str());
                continue;
            }
            r.version = *version;

            if (item.contains("assets")) {
                auto assets = ParseAssets(item["assets"]);
                if (!assets)
                    return std::unexpected("release " + r.tag + ": " + assets.error());
                r.assets = std::move(*assets);
            }
            releases.push_back(std::move(r));
        }
        return releases;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid release feed: ") + e.what());
    }
}

std::optional<ReleaseInfo> ReleaseFeed::SelectNewest(const std::vector<ReleaseInfo>& releases,
                                                     RingType ring,
                                                     const ProductVersion& current) {
    const ReleaseInfo* best = nullptr;
    for (const auto& release : releases) {
        if (!IsEligible(release, ring)) continue;
        if (release.version <= current) continue;
        if (!best || release.version > best->version) best = &release;
    }
    if (!best) return std::nullopt;
    return *best;
}

} // namespace vfsup
