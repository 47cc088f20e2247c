// =============================================================================
// blkstore - Block Checksums
// =============================================================================
// Block identity digests backed by xxHash.
//
// A block's checksum is the XXH3-128 digest of its *decompressed* content,
// rendered as 32 lowercase hex characters (canonical big-endian order).
// =============================================================================

#ifndef BLKSTORE_CODEC_CHECKSUM_H
#define BLKSTORE_CODEC_CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "blkstore/common/types.h"

namespace blkstore::codec {

/// @brief Length of a hex-encoded block checksum.
inline constexpr std::size_t kChecksumHexLength = 32;

/// @brief Compute the block checksum of decompressed content.
/// @param data Decompressed block content.
/// @return 32-character lowercase hex digest.
[[nodiscard]] BlockChecksum computeChecksum(std::span<const std::uint8_t> data);

/// @brief Convenience overload for textual content.
[[nodiscard]] BlockChecksum computeChecksum(std::string_view data);

/// @brief 64-bit hash of a name, as 16 lowercase hex characters.
/// @note Used to spread volume directories; not a block identity.
[[nodiscard]] std::string hashName(std::string_view name);

/// @brief Compare two hex checksums, ignoring ASCII case.
[[nodiscard]] bool checksumEquals(std::string_view lhs, std::string_view rhs) noexcept;

/// @brief Check that a string looks like a hex checksum of the expected length.
[[nodiscard]] bool isWellFormedChecksum(std::string_view checksum) noexcept;

}  // namespace blkstore::codec

#endif  // BLKSTORE_CODEC_CHECKSUM_H
