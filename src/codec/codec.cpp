// =============================================================================
// blkstore - Block Codecs Implementation
// =============================================================================
// gzip via zlib (inflateInit2/deflateInit2 with the gzip wrapper bit set),
// zstd via the libzstd streaming decoder. Both accept concatenated
// members/frames, as the command-line tools produce them.
// =============================================================================

#include "blkstore/codec/codec.h"

#include <fmt/format.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <sstream>

#include "blkstore/codec/checksum.h"
#include "blkstore/common/logger.h"

namespace blkstore::codec {

namespace {

// =============================================================================
// Magic Bytes for Format Detection
// =============================================================================

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Zstd magic: 0x28 0xb5 0x2f 0xfd (little-endian 0xFD2FB528)
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

/// @brief Output chunk size used while inflating.
constexpr std::size_t kInflateChunkSize = 64 * 1024;

/// @brief Read chunk size used while draining block streams.
constexpr std::size_t kReadChunkSize = 64 * 1024;

template <std::size_t N>
bool hasMagic(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) noexcept {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

/// @brief Build the tagged wrong-container error for @p requested.
Error wrongContainer(Codec requested, std::span<const std::uint8_t> data) {
    const std::optional<Codec> sniffed = detectCodec(data);
    const std::string found = sniffed.has_value()
                                  ? fmt::format("found {} header", codecToString(*sniffed))
                                  : std::string("no recognizable header");
    return Error{ErrorCode::kWrongContainer,
                 fmt::format("data is not a {} container ({})", codecToString(requested), found),
                 sniffed};
}

/// @brief Releases zlib inflate state on scope exit.
struct InflateGuard {
    z_stream* stream;
    ~InflateGuard() { inflateEnd(stream); }
};

/// @brief Releases zlib deflate state on scope exit.
struct DeflateGuard {
    z_stream* stream;
    ~DeflateGuard() { deflateEnd(stream); }
};

struct ZstdDCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const noexcept { ZSTD_freeDCtx(ctx); }
};

std::string zlibMessage(const z_stream& stream, int ret) {
    return stream.msg != nullptr ? std::string(stream.msg) : std::string(zError(ret));
}

// =============================================================================
// gzip
// =============================================================================

Result<std::vector<std::uint8_t>> gzipCompress(std::span<const std::uint8_t> data,
                                               CompressionLevel level) {
    if (level < Z_BEST_SPEED || level > Z_BEST_COMPRESSION) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidArgument, fmt::format("invalid gzip level {} (expected 1-9)", level));
    }
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kInvalidArgument,
                                                    "block too large for gzip");
    }

    z_stream stream{};
    int ret = deflateInit2(&stream, level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidState, "failed to initialize zlib: " + std::string(zError(ret)));
    }
    DeflateGuard guard{&stream};

    std::vector<std::uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    ret = deflate(&stream, Z_FINISH);
    if (ret != Z_STREAM_END) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidState, "gzip compression failed: " + zlibMessage(stream, ret));
    }
    out.resize(stream.total_out);
    return out;
}

Result<std::vector<std::uint8_t>> gzipDecompress(std::span<const std::uint8_t> data) {
    if (!hasMagic(data, kGzipMagic)) {
        return std::unexpected(wrongContainer(Codec::kGzip, data));
    }
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kInvalidArgument,
                                                    "block too large for gzip");
    }

    z_stream stream{};
    int ret = inflateInit2(&stream, 16 + MAX_WBITS);
    if (ret != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidState, "failed to initialize zlib: " + std::string(zError(ret)));
    }
    InflateGuard guard{&stream};

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> chunk(kInflateChunkSize);

    for (;;) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        const std::size_t produced = chunk.size() - stream.avail_out;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_STREAM_END) {
            if (stream.avail_in == 0) {
                break;
            }
            // Another gzip member follows.
            if (!hasMagic({stream.next_in, stream.avail_in}, kGzipMagic)) {
                return makeError<std::vector<std::uint8_t>>(
                    ErrorCode::kDecompressionFailed,
                    fmt::format("trailing garbage after gzip member ({} bytes)", stream.avail_in));
            }
            inflateReset(&stream);
            continue;
        }
        if (ret == Z_BUF_ERROR && stream.avail_in == 0) {
            return makeError<std::vector<std::uint8_t>>(ErrorCode::kDecompressionFailed,
                                                        "unexpected end of gzip stream");
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return makeError<std::vector<std::uint8_t>>(
                ErrorCode::kDecompressionFailed,
                "gzip decompression failed: " + zlibMessage(stream, ret));
        }
    }
    return out;
}

// =============================================================================
// zstd
// =============================================================================

Result<std::vector<std::uint8_t>> zstdCompress(std::span<const std::uint8_t> data,
                                               CompressionLevel level) {
    if (level < 1 || level > ZSTD_maxCLevel()) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidArgument,
            fmt::format("invalid zstd level {} (expected 1-{})", level, ZSTD_maxCLevel()));
    }

    std::vector<std::uint8_t> out(ZSTD_compressBound(data.size()));
    const std::size_t size = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), level);
    if (ZSTD_isError(size)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kInvalidState,
            "zstd compression failed: " + std::string(ZSTD_getErrorName(size)));
    }
    out.resize(size);
    return out;
}

Result<std::vector<std::uint8_t>> zstdDecompress(std::span<const std::uint8_t> data) {
    if (!hasMagic(data, kZstdMagic)) {
        return std::unexpected(wrongContainer(Codec::kZstd, data));
    }

    std::unique_ptr<ZSTD_DCtx, ZstdDCtxDeleter> ctx(ZSTD_createDCtx());
    if (!ctx) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kInvalidState,
                                                    "failed to create zstd context");
    }

    ZSTD_inBuffer input{data.data(), data.size(), 0};
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> chunk(ZSTD_DStreamOutSize());

    for (;;) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        const std::size_t ret = ZSTD_decompressStream(ctx.get(), &output, &input);
        if (ZSTD_isError(ret)) {
            return makeError<std::vector<std::uint8_t>>(
                ErrorCode::kDecompressionFailed,
                "zstd decompression failed: " + std::string(ZSTD_getErrorName(ret)));
        }
        out.insert(out.end(), chunk.begin(),
                   chunk.begin() + static_cast<std::ptrdiff_t>(output.pos));

        const bool inputDone = input.pos == input.size;
        if (ret == 0 && inputDone) {
            break;
        }
        if (inputDone && output.pos == 0) {
            return makeError<std::vector<std::uint8_t>>(ErrorCode::kDecompressionFailed,
                                                        "unexpected end of zstd frame");
        }
    }
    return out;
}

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

std::optional<Codec> detectCodec(std::span<const std::uint8_t> data) noexcept {
    if (hasMagic(data, kGzipMagic)) {
        return Codec::kGzip;
    }
    if (hasMagic(data, kZstdMagic)) {
        return Codec::kZstd;
    }
    return std::nullopt;
}

std::optional<Codec> pairedCodec(Codec codec) noexcept {
    switch (codec) {
        case Codec::kGzip:
            return Codec::kZstd;
        case Codec::kZstd:
            return Codec::kGzip;
        case Codec::kNone:
            break;
    }
    return std::nullopt;
}

// =============================================================================
// Compression / Decompression
// =============================================================================

Result<std::vector<std::uint8_t>> compress(Codec codec, std::span<const std::uint8_t> data,
                                           std::optional<CompressionLevel> level) {
    switch (codec) {
        case Codec::kNone:
            return std::vector<std::uint8_t>(data.begin(), data.end());
        case Codec::kGzip:
            return gzipCompress(data, level.value_or(kDefaultGzipLevel));
        case Codec::kZstd:
            return zstdCompress(data, level.value_or(kDefaultZstdLevel));
    }
    return makeError<std::vector<std::uint8_t>>(
        ErrorCode::kUnsupportedCodec,
        fmt::format("unsupported codec {}", static_cast<unsigned>(codec)));
}

Result<std::vector<std::uint8_t>> decompress(Codec codec, std::span<const std::uint8_t> data) {
    switch (codec) {
        case Codec::kNone:
            return std::vector<std::uint8_t>(data.begin(), data.end());
        case Codec::kGzip:
            return gzipDecompress(data);
        case Codec::kZstd:
            return zstdDecompress(data);
    }
    return makeError<std::vector<std::uint8_t>>(
        ErrorCode::kUnsupportedCodec,
        fmt::format("unsupported codec {}", static_cast<unsigned>(codec)));
}

// =============================================================================
// Verified Blocks
// =============================================================================

std::unique_ptr<std::istream> VerifiedBlock::release() {
    std::string content(data_.begin(), data_.end());
    data_.clear();
    data_.shrink_to_fit();
    return std::make_unique<std::istringstream>(std::move(content), std::ios::binary);
}

Result<std::vector<std::uint8_t>> readAll(std::istream& stream) {
    std::vector<std::uint8_t> data;
    std::vector<char> buffer(kReadChunkSize);

    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytesRead = static_cast<std::size_t>(stream.gcount());
        data.insert(data.end(), buffer.begin(),
                    buffer.begin() + static_cast<std::ptrdiff_t>(bytesRead));
    }

    if (stream.bad()) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError, fmt::format("block stream read failed after {} bytes", data.size()));
    }
    return data;
}

Result<VerifiedBlock> decompressAndVerify(Codec codec, std::istream& stream,
                                          std::string_view checksum) {
    auto raw = readAll(stream);
    if (!raw) {
        return std::unexpected(raw.error());
    }

    auto content = decompress(codec, *raw);
    if (!content) {
        return std::unexpected(content.error());
    }

    BlockChecksum actual = computeChecksum(*content);
    if (!checksumEquals(actual, checksum)) {
        return makeError<VerifiedBlock>(ErrorCode::kChecksumError,
                                        ChecksumError::formatChecksumMismatch(checksum, actual));
    }

    BLKSTORE_LOG_DEBUG("Verified {} block {}: {} -> {} bytes", codecToString(codec), actual,
                       raw->size(), content->size());
    return VerifiedBlock{std::move(*content), codec, std::move(actual)};
}

}  // namespace blkstore::codec
