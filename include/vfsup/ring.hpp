#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace vfsup {

enum class RingType : int {
    Invalid = 0,
    None = 10,
    Slow = 20,
    Fast = 30,
};

// Case-insensitive. Unknown text maps to RingType::Invalid.
RingType ParseRing(std::string_view text);
const char* ToString(RingType ring);

class RingConfig {
  public:
    static constexpr const char* kRingKey = "upgrade.ring";

    // A missing file or an unset key means RingType::None. Unreadable or
    // malformed files are errors.
    static std::expected<RingType, std::string> LoadFromFile(const std::string& path);
};

} // namespace vfsup
