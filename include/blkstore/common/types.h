// =============================================================================
// blkstore - Common Type Definitions
// =============================================================================
// Core type definitions shared by the blkstore library.
//
// This module defines:
// - Codec: Enum for block compression codecs
// - Block size and compression level constants
// - Conversion helpers between enums and their CLI/string forms
//
// Naming Conventions (per project style guide):
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef BLKSTORE_COMMON_TYPES_H
#define BLKSTORE_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace blkstore {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Hex-encoded block checksum (block identity).
using BlockChecksum = std::string;

/// @brief Type alias for compression level.
using CompressionLevel = int;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default logical block size (2 MiB).
inline constexpr std::uint64_t kDefaultBlockSize = 2ULL * 1024 * 1024;

/// @brief Largest accepted block size (1 GiB); a block is buffered whole in memory.
inline constexpr std::uint64_t kMaxBlockSize = 1ULL << 30;

/// @brief Parameter key carrying a custom block size.
inline constexpr std::string_view kBlockSizeParameter = "backupBlockSize";

/// @brief Default gzip compression level (zlib scale 1-9).
inline constexpr CompressionLevel kDefaultGzipLevel = 6;

/// @brief Default zstd compression level (1-22).
inline constexpr CompressionLevel kDefaultZstdLevel = 3;

// =============================================================================
// Codec Enumeration
// =============================================================================

/// @brief Compression codecs a block may be stored with.
/// @note gzip and zstd carry mutually detectable magic headers; kNone does not.
enum class Codec : std::uint8_t {
    /// @brief Stored as-is.
    kNone = 0,

    /// @brief gzip container (RFC 1952) via zlib.
    kGzip = 1,

    /// @brief zstd frame via libzstd.
    kZstd = 2
};

/// @brief All codecs, in enum order.
inline constexpr std::array<Codec, 3> kAllCodecs = {Codec::kNone, Codec::kGzip, Codec::kZstd};

/// @brief Convert Codec to its canonical name.
/// @param codec The codec.
/// @return Lowercase codec name as used on the command line.
[[nodiscard]] constexpr std::string_view codecToString(Codec codec) noexcept {
    switch (codec) {
        case Codec::kNone:
            return "none";
        case Codec::kGzip:
            return "gzip";
        case Codec::kZstd:
            return "zstd";
    }
    return "unknown";
}

/// @brief Parse a codec name.
/// @param name Codec name ("none", "gzip", "zstd").
/// @return The codec, or std::nullopt for unknown names.
[[nodiscard]] constexpr std::optional<Codec> codecFromString(std::string_view name) noexcept {
    for (Codec codec : kAllCodecs) {
        if (codecToString(codec) == name) {
            return codec;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Static Assertions
// =============================================================================

static_assert(sizeof(Codec) == 1, "Codec must be 1 byte");
static_assert(codecFromString("gzip") == Codec::kGzip, "codec names must round-trip");

}  // namespace blkstore

#endif  // BLKSTORE_COMMON_TYPES_H
