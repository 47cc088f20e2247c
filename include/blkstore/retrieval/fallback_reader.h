// =============================================================================
// blkstore - Fallback Decompressing Block Reader
// =============================================================================
// Fetches a block, decompresses it with the requested codec and verifies its
// checksum. When the data turns out to be in another codec's container, the
// block is fetched again and decoded once more with that codec.
//
// Blocks written by older releases may carry a codec different from the one
// recorded for the backup, so a wrong-container failure is expected to happen
// occasionally and is recovered from. Checksum mismatches and corrupt payloads
// inside the right container are not.
// =============================================================================

#ifndef BLKSTORE_RETRIEVAL_FALLBACK_READER_H
#define BLKSTORE_RETRIEVAL_FALLBACK_READER_H

#include <optional>
#include <string_view>

#include "blkstore/codec/codec.h"
#include "blkstore/common/error.h"
#include "blkstore/common/types.h"
#include "blkstore/io/backend.h"
#include "blkstore/retrieval/retrying_reader.h"

namespace blkstore::retrieval {

/// @brief Pick the codec to fall back to after a failed decode.
/// @param requested Codec the first attempt used.
/// @param failure Error from that attempt.
/// @return The sniffed codec when the failure is a wrong-container error that
///         identified one, otherwise the other codec of the gzip/zstd pair;
///         std::nullopt when the failure is not a wrong-container error or no
///         distinct alternative exists.
[[nodiscard]] std::optional<Codec> selectFallbackCodec(Codec requested, const Error& failure);

/// @brief Fetch, decompress and verify one block, with a single codec fallback.
///
/// Each fetch goes through readWithRetry() with @p options; a fetch failure is
/// returned unchanged. At most two fetches are made: the second only after a
/// wrong-container failure of the first decode.
///
/// @param backend Block source.
/// @param path Backend path of the block.
/// @param codec Codec the block is expected to be stored with.
/// @param checksum Expected checksum of the decompressed content.
/// @param options Retry options used for both fetches.
[[nodiscard]] Result<codec::VerifiedBlock> decompressAndVerifyWithFallback(
    io::BackendDriver& backend, std::string_view path, Codec codec, std::string_view checksum,
    const RetryOptions& options = {});

}  // namespace blkstore::retrieval

#endif  // BLKSTORE_RETRIEVAL_FALLBACK_READER_H
