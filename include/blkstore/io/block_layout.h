// =============================================================================
// blkstore - Block Layout
// =============================================================================
// Where blocks live inside a backup store, and how large they are.
//
// Layout:
//   backupstore/volumes/<h0h1>/<h2h3>/<volume>/blocks/<c0c1>/<c2c3>/<checksum>.blk
// where h is the hashName() of the volume and c the block checksum. The two
// fan-out levels keep directory sizes bounded on filesystem backends.
// =============================================================================

#ifndef BLKSTORE_IO_BLOCK_LAYOUT_H
#define BLKSTORE_IO_BLOCK_LAYOUT_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "blkstore/common/error.h"

namespace blkstore::io {

// =============================================================================
// Constants
// =============================================================================

inline constexpr std::string_view kBackupstoreBase = "backupstore";
inline constexpr std::string_view kVolumeDirectory = "volumes";
inline constexpr std::string_view kBlocksDirectory = "blocks";
inline constexpr std::string_view kBlockSuffix = ".blk";

/// @brief End offset of the first fan-out level in the checksum.
inline constexpr std::size_t kBlockSeparateLayer1 = 2;

/// @brief End offset of the second fan-out level in the checksum.
inline constexpr std::size_t kBlockSeparateLayer2 = 4;

// =============================================================================
// Paths
// =============================================================================

/// @brief Directory holding everything belonging to @p volumeName.
[[nodiscard]] std::string volumePath(std::string_view volumeName);

/// @brief Directory holding the blocks of @p volumeName (trailing '/').
[[nodiscard]] std::string blockDirectory(std::string_view volumeName);

/// @brief Backend path of one block.
/// @return kInvalidArgument if the volume name is empty or contains '/', or
///         the checksum is shorter than the fan-out prefix or not hex.
[[nodiscard]] Result<std::string> blockFilePath(std::string_view volumeName,
                                                std::string_view checksum);

// =============================================================================
// Block Size
// =============================================================================

/// @brief Parse a size quantity such as "2Mi", "512Ki", "1.5Gi", "4M" or "65536".
/// @note Binary suffixes Ki..Pi, decimal suffixes k..P; fractions round up.
[[nodiscard]] Result<std::uint64_t> parseQuantity(std::string_view text);

/// @brief Block size requested by backup parameters.
/// @return kDefaultBlockSize when the parameter is absent, empty or zero;
///         kInvalidArgument above kMaxBlockSize.
[[nodiscard]] Result<std::uint64_t> blockSizeFromParameters(
    const std::map<std::string, std::string, std::less<>>& parameters);

}  // namespace blkstore::io

#endif  // BLKSTORE_IO_BLOCK_LAYOUT_H
