// =============================================================================
// blkstore - Fallback Decompressing Block Reader Implementation
// =============================================================================

#include "blkstore/retrieval/fallback_reader.h"

#include <fmt/format.h>

#include "blkstore/common/logger.h"

namespace blkstore::retrieval {

std::optional<Codec> selectFallbackCodec(Codec requested, const Error& failure) {
    if (failure.code() != ErrorCode::kWrongContainer) {
        return std::nullopt;
    }
    if (const auto sniffed = failure.sniffedCodec(); sniffed && *sniffed != requested) {
        return sniffed;
    }
    return codec::pairedCodec(requested);
}

Result<codec::VerifiedBlock> decompressAndVerifyWithFallback(io::BackendDriver& backend,
                                                             std::string_view path, Codec codec,
                                                             std::string_view checksum,
                                                             const RetryOptions& options) {
    auto stream = readWithRetry(backend, path, options);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    auto block = codec::decompressAndVerify(codec, **stream, checksum);
    stream->reset();
    if (block) {
        return block;
    }

    const Error& failure = block.error();
    const std::optional<Codec> alternative = selectFallbackCodec(codec, failure);
    if (!alternative) {
        BLKSTORE_LOG_ERROR("Block {} failed {} verification: {}", path, codecToString(codec),
                           failure.describe());
        return std::unexpected(failure.wrap(fmt::format(
            "decompression verification failed for block {} with {}", path, codecToString(codec))));
    }

    BLKSTORE_LOG_WARNING("Block {} is not {} ({}), retrying with {}", path, codecToString(codec),
                         failure.message(), codecToString(*alternative));

    // Streams cannot be rewound; the fallback needs a fresh one.
    auto retriedStream = readWithRetry(backend, path, options);
    if (!retriedStream) {
        return std::unexpected(retriedStream.error());
    }
    auto retried = codec::decompressAndVerify(*alternative, **retriedStream, checksum);
    if (!retried) {
        BLKSTORE_LOG_ERROR("Block {} failed {} fallback verification: {}", path,
                           codecToString(*alternative), retried.error().describe());
        return std::unexpected(retried.error().wrap(
            fmt::format("fallback decompression with {} also failed for block {} (requested {})",
                        codecToString(*alternative), path, codecToString(codec))));
    }

    BLKSTORE_LOG_INFO("Block {} was stored with {} instead of {}", path,
                      codecToString(*alternative), codecToString(codec));
    return retried;
}

}  // namespace blkstore::retrieval
