#pragma once

#include <compare>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vfsup {

// Product release version: 1-4 numeric components, optional leading 'v'.
// Missing trailing components compare as zero, so "2.1" == "2.1.0".
class ProductVersion {
  public:
    ProductVersion() = default;

    static std::expected<ProductVersion, std::string> Parse(std::string_view text);

    const std::vector<int>& Components() const { return parts_; }
    std::string ToString() const;

    friend std::strong_ordering operator<=>(const ProductVersion& lhs, const ProductVersion& rhs) {
        return Compare(lhs, rhs) <=> 0;
    }
    friend bool operator==(const ProductVersion& lhs, const ProductVersion& rhs) {
        return Compare(lhs, rhs) == 0;
    }

  private:
    static int Compare(const ProductVersion& lhs, const ProductVersion& rhs);

    std::vector<int> parts_;
};

// Version of the bundled Git, e.g. "2.40.0" or "2.40.0.vfs.0.1".
class DependencyVersion {
  public:
    DependencyVersion() = default;

    static std::expected<DependencyVersion, std::string> Parse(std::string_view text);

    int Major() const { return major_; }
    int Minor() const { return minor_; }
    int Build() const { return build_; }
    const std::string& Platform() const { return platform_; }
    int Revision() const { return revision_; }
    int MinorRevision() const { return minor_revision_; }

    const std::string& ToString() const { return text_; }

    friend bool operator==(const DependencyVersion& lhs, const DependencyVersion& rhs) {
        return lhs.text_ == rhs.text_;
    }

  private:
    std::string text_;
    int major_ = 0;
    int minor_ = 0;
    int build_ = 0;
    std::string platform_;
    int revision_ = 0;
    int minor_revision_ = 0;
};

} // namespace vfsup
