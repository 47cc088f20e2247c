// =============================================================================
// blkstore - Block Checksums Implementation
// =============================================================================

#include "blkstore/codec/checksum.h"

#include <fmt/format.h>
#include <xxhash.h>

#include <algorithm>
#include <cctype>

namespace blkstore::codec {

BlockChecksum computeChecksum(std::span<const std::uint8_t> data) {
    const XXH128_hash_t hash = XXH3_128bits(data.data(), data.size());
    return fmt::format("{:016x}{:016x}", hash.high64, hash.low64);
}

BlockChecksum computeChecksum(std::string_view data) {
    return computeChecksum(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()),
                                      data.size()));
}

std::string hashName(std::string_view name) {
    return fmt::format("{:016x}", XXH3_64bits(name.data(), name.size()));
}

bool checksumEquals(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

bool isWellFormedChecksum(std::string_view checksum) noexcept {
    return checksum.size() == kChecksumHexLength &&
           std::ranges::all_of(checksum,
                               [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

}  // namespace blkstore::codec
