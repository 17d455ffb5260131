#include "vfsup/ring.hpp"

#include "util/logger.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace vfsup {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

RingType ParseRing(std::string_view text) {
    if (EqualsIgnoreCase(text, "None")) return RingType::None;
    if (EqualsIgnoreCase(text, "Slow")) return RingType::Slow;
    if (EqualsIgnoreCase(text, "Fast")) return RingType::Fast;
    return RingType::Invalid;
}

const char* ToString(RingType ring) {
    switch (ring) {
        case RingType::None: return "None";
        case RingType::Slow: return "Slow";
        case RingType::Fast: return "Fast";
        default:             return "Invalid";
    }
}

std::expected<RingType, std::string> RingConfig::LoadFromFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) return std::unexpected("cannot stat ring config " + path + ": " + ec.message());
        LogDebug("Ring config %s not found, ring is None", path.c_str());
        return RingType::None;
    }

    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open ring config: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("invalid JSON in ") + path + ": " + e.what());
    }

    if (!j.is_object()) {
        return std::unexpected("ring config must be JSON object: " + path);
    }

    auto it = j.find(kRingKey);
    if (it == j.end() || it->is_null()) return RingType::None;
    if (!it->is_string()) {
        return std::unexpected(std::string(kRingKey) + " must be a string in " + path);
    }

    const std::string value = it->get<std::string>();
    if (value.empty()) return RingType::None;

    const RingType ring = ParseRing(value);
    if (ring == RingType::Invalid) {
        LogWarn("Unrecognised %s value '%s' in %s", kRingKey, value.c_str(), path.c_str());
    }
    return ring;
}

} // namespace vfsup
