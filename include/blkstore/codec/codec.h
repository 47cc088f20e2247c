// =============================================================================
// blkstore - Block Codecs
// =============================================================================
// Compression codec adapters and the decompress-and-verify primitive.
//
// This module provides:
// - Codec detection from container magic bytes (gzip, zstd)
// - compress()/decompress() over zlib and libzstd
// - decompressAndVerify(): drain a block stream, decompress it, and check the
//   XXH3-128 digest of the result against the block checksum
//
// Failure classes are kept distinct by ErrorCode, never by message text:
// - kWrongContainer: data is not the requested codec's container at all.
//   The codec whose magic *was* found (if any) is attached to the Error.
// - kDecompressionFailed: container recognized, payload corrupt/truncated.
// - kChecksumError: decompression succeeded, digest mismatch.
// =============================================================================

#ifndef BLKSTORE_CODEC_CODEC_H
#define BLKSTORE_CODEC_CODEC_H

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "blkstore/common/error.h"
#include "blkstore/common/types.h"

namespace blkstore::codec {

// =============================================================================
// Format Detection
// =============================================================================

/// @brief Number of leading bytes needed to recognize every supported magic.
inline constexpr std::size_t kMagicProbeSize = 4;

/// @brief Detect a codec from the leading bytes of a block.
/// @param data First bytes of the raw block (may be shorter than kMagicProbeSize).
/// @return kGzip or kZstd when a magic header matches, std::nullopt otherwise.
/// @note Never returns kNone: uncompressed data has no signature.
[[nodiscard]] std::optional<Codec> detectCodec(std::span<const std::uint8_t> data) noexcept;

/// @brief The other member of the mutually-detectable gzip/zstd pair.
/// @return std::nullopt for kNone.
[[nodiscard]] std::optional<Codec> pairedCodec(Codec codec) noexcept;

// =============================================================================
// Compression / Decompression
// =============================================================================

/// @brief Compress a buffer.
/// @param codec Target codec.
/// @param data Raw content.
/// @param level Codec-specific level; std::nullopt selects the codec default.
[[nodiscard]] Result<std::vector<std::uint8_t>> compress(
    Codec codec, std::span<const std::uint8_t> data,
    std::optional<CompressionLevel> level = std::nullopt);

/// @brief Decompress a whole block.
/// @param codec Codec the block is expected to be in.
/// @param data Raw (compressed) block bytes.
/// @return Decompressed bytes, or kWrongContainer / kDecompressionFailed.
[[nodiscard]] Result<std::vector<std::uint8_t>> decompress(Codec codec,
                                                           std::span<const std::uint8_t> data);

// =============================================================================
// Verified Blocks
// =============================================================================

/// @brief Decompressed block content whose checksum has been verified.
class VerifiedBlock {
public:
    VerifiedBlock(std::vector<std::uint8_t> data, Codec codec, BlockChecksum checksum)
        : data_(std::move(data)), codec_(codec), checksum_(std::move(checksum)) {}

    /// @brief Decompressed content.
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return data_; }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    /// @brief Codec the block was actually decoded with.
    [[nodiscard]] Codec codec() const noexcept { return codec_; }

    [[nodiscard]] const BlockChecksum& checksum() const noexcept { return checksum_; }

    /// @brief Hand the content over as a readable stream.
    /// @note Leaves this block empty.
    [[nodiscard]] std::unique_ptr<std::istream> release();

private:
    std::vector<std::uint8_t> data_;
    Codec codec_;
    BlockChecksum checksum_;
};

/// @brief Read a raw block stream to its end, decompress it, verify the digest.
/// @param codec Codec to decode with.
/// @param stream Raw block stream; consumed entirely.
/// @param checksum Expected checksum of the decompressed content.
/// @return The verified block, or an error tagged as described in the file header.
[[nodiscard]] Result<VerifiedBlock> decompressAndVerify(Codec codec, std::istream& stream,
                                                        std::string_view checksum);

/// @brief Drain a stream into memory.
/// @return kIOError if the stream reports a read failure.
[[nodiscard]] Result<std::vector<std::uint8_t>> readAll(std::istream& stream);

}  // namespace blkstore::codec

#endif  // BLKSTORE_CODEC_CODEC_H
