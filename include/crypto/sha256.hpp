#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace vfsup {

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::expected<std::string, std::string> Sha256HexFile(const std::string& path);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vfsup
