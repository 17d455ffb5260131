#include "vfsup/version.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>

namespace vfsup {

namespace {

constexpr size_t kMaxProductComponents = 4;

std::vector<std::string_view> SplitDots(std::string_view text) {
    std::vector<std::string_view> out;
    for (auto&& rng : text | std::views::split('.')) {
        out.emplace_back(rng.begin(), rng.end());
    }
    return out;
}

bool ParseNonNegative(std::string_view sv, int& out) {
    if (sv.empty()) return false;
    const auto* end = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(sv.data(), end, out);
    return ec == std::errc() && ptr == end && out >= 0;
}

} // namespace

std::expected<ProductVersion, std::string> ProductVersion::Parse(std::string_view text) {
    std::string_view sv = text;
    if (!sv.empty() && (sv.front() == 'v' || sv.front() == 'V')) sv.remove_prefix(1);
    if (sv.empty()) return std::unexpected("empty version string");

    const auto pieces = SplitDots(sv);
    if (pieces.size() > kMaxProductComponents) {
        return std::unexpected("too many version components: " + std::string(text));
    }

    ProductVersion v;
    v.parts_.reserve(pieces.size());
    for (auto piece : pieces) {
        int n = 0;
        if (!ParseNonNegative(piece, n)) {
            return std::unexpected("invalid version: " + std::string(text));
        }
        v.parts_.push_back(n);
    }
    return v;
}

std::string ProductVersion::ToString() const {
    std::string out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i) out.push_back('.');
        out += std::to_string(parts_[i]);
    }
    return out;
}

int ProductVersion::Compare(const ProductVersion& lhs, const ProductVersion& rhs) {
    const size_t n = std::max(lhs.parts_.size(), rhs.parts_.size());
    for (size_t i = 0; i < n; ++i) {
        const int l = i < lhs.parts_.size() ? lhs.parts_[i] : 0;
        const int r = i < rhs.parts_.size() ? rhs.parts_[i] : 0;
        if (l > r) return 1;
        if (l < r) return -1;
    }
    return 0;
}

std::expected<DependencyVersion, std::string> DependencyVersion::Parse(std::string_view text) {
    const auto pieces = SplitDots(text);
    if (pieces.size() < 3) {
        return std::unexpected("invalid dependency version: " + std::string(text));
    }

    DependencyVersion v;
    if (!ParseNonNegative(pieces[0], v.major_) ||
        !ParseNonNegative(pieces[1], v.minor_) ||
        !ParseNonNegative(pieces[2], v.build_)) {
        return std::unexpected("invalid dependency version: " + std::string(text));
    }

    // Optional "<platform>.<revision>.<minor_revision>" tail; anything after that
    // (e.g. a commit hash) is kept only in the display text.
    if (pieces.size() > 3) {
        v.platform_ = std::string(pieces[3]);
        if (v.platform_.empty()) {
            return std::unexpected("invalid dependency version: " + std::string(text));
        }
        if (pieces.size() > 4 && !ParseNonNegative(pieces[4], v.revision_)) {
            return std::unexpected("invalid dependency revision: " + std::string(text));
        }
        if (pieces.size() > 5 && !ParseNonNegative(pieces[5], v.minor_revision_)) {
            return std::unexpected("invalid dependency minor revision: " + std::string(text));
        }
    }

    v.text_ = std::string(text);
    return v;
}

} // namespace vfsup
