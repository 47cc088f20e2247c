// =============================================================================
// blkstore - Codec and Checksum Tests
// =============================================================================
// Unit and property tests for block compression, container sniffing and
// decompress-then-verify.
// =============================================================================

#include "blkstore/codec/codec.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "blkstore/codec/checksum.h"
#include "test_support.h"

namespace blkstore::codec::test {
namespace {

using blkstore::test::bytesOf;
using blkstore::test::samplePayload;

std::vector<std::uint8_t> compressed(Codec codec, const std::vector<std::uint8_t>& data) {
    auto result = compress(codec, data);
    EXPECT_TRUE(result.has_value()) << result.error().describe();
    return result.value_or(std::vector<std::uint8_t>{});
}

std::istringstream streamOf(const std::vector<std::uint8_t>& data) {
    return std::istringstream(std::string(data.begin(), data.end()), std::ios::binary);
}

// =============================================================================
// Checksum Tests
// =============================================================================

TEST(ChecksumTest, IsThirtyTwoLowercaseHexCharacters) {
    const BlockChecksum checksum = computeChecksum(std::string_view("hello block"));
    EXPECT_EQ(checksum.size(), kChecksumHexLength);
    EXPECT_TRUE(isWellFormedChecksum(checksum));
    EXPECT_EQ(checksum.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(ChecksumTest, DependsOnContent) {
    EXPECT_EQ(computeChecksum(std::string_view("abc")), computeChecksum(std::string_view("abc")));
    EXPECT_NE(computeChecksum(std::string_view("abc")), computeChecksum(std::string_view("abd")));
}

TEST(ChecksumTest, ComparisonIgnoresCase) {
    EXPECT_TRUE(checksumEquals("00ABcd", "00abCD"));
    EXPECT_FALSE(checksumEquals("00ab", "00ac"));
    EXPECT_FALSE(checksumEquals("00ab", "00ab0"));
}

TEST(ChecksumTest, RejectsMalformedChecksums) {
    EXPECT_FALSE(isWellFormedChecksum(""));
    EXPECT_FALSE(isWellFormedChecksum("xyz"));
    EXPECT_FALSE(isWellFormedChecksum(std::string(31, 'a')));
    EXPECT_TRUE(isWellFormedChecksum(std::string(32, 'a')));
}

TEST(ChecksumTest, NameHashIsSixteenHexCharacters) {
    const std::string hash = hashName("volume-1");
    EXPECT_EQ(hash.size(), 16U);
    EXPECT_EQ(hash, hashName("volume-1"));
    EXPECT_NE(hash, hashName("volume-2"));
}

// =============================================================================
// Detection Tests
// =============================================================================

TEST(DetectCodecTest, RecognizesMagicHeaders) {
    const auto data = samplePayload(1024);
    EXPECT_EQ(detectCodec(compressed(Codec::kGzip, data)), Codec::kGzip);
    EXPECT_EQ(detectCodec(compressed(Codec::kZstd, data)), Codec::kZstd);
    EXPECT_EQ(detectCodec(bytesOf("plain text")), std::nullopt);
    EXPECT_EQ(detectCodec({}), std::nullopt);
}

TEST(DetectCodecTest, PairsGzipWithZstd) {
    EXPECT_EQ(pairedCodec(Codec::kGzip), Codec::kZstd);
    EXPECT_EQ(pairedCodec(Codec::kZstd), Codec::kGzip);
    EXPECT_EQ(pairedCodec(Codec::kNone), std::nullopt);
}

// =============================================================================
// Decompression Tests
// =============================================================================

TEST(DecompressTest, WrongContainerIsTaggedWithSniffedCodec) {
    const auto zstdData = compressed(Codec::kZstd, samplePayload(4096));

    auto result = decompress(Codec::kGzip, zstdData);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kWrongContainer);
    EXPECT_EQ(result.error().sniffedCodec(), Codec::kZstd);
}

TEST(DecompressTest, UnrecognizedDataIsWrongContainerWithoutHint) {
    auto result = decompress(Codec::kZstd, bytesOf("definitely not compressed"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kWrongContainer);
    EXPECT_FALSE(result.error().sniffedCodec().has_value());
}

TEST(DecompressTest, TruncatedGzipFails) {
    auto data = compressed(Codec::kGzip, samplePayload(64 * 1024));
    data.resize(data.size() / 2);

    auto result = decompress(Codec::kGzip, data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(DecompressTest, TruncatedZstdFails) {
    auto data = compressed(Codec::kZstd, samplePayload(64 * 1024));
    data.resize(data.size() / 2);

    auto result = decompress(Codec::kZstd, data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDecompressionFailed);
}

TEST(DecompressTest, ConcatenatedGzipMembers) {
    auto first = compressed(Codec::kGzip, bytesOf("first "));
    const auto second = compressed(Codec::kGzip, bytesOf("second"));
    first.insert(first.end(), second.begin(), second.end());

    auto result = decompress(Codec::kGzip, first);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(*result, bytesOf("first second"));
}

TEST(DecompressTest, InvalidLevelIsRejected) {
    auto result = compress(Codec::kGzip, bytesOf("x"), 42);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

// =============================================================================
// Decompress-and-Verify Tests
// =============================================================================

TEST(DecompressAndVerifyTest, ReturnsVerifiedContent) {
    const auto data = samplePayload(10000);
    const BlockChecksum checksum = computeChecksum(data);
    auto stream = streamOf(compressed(Codec::kZstd, data));

    auto block = decompressAndVerify(Codec::kZstd, stream, checksum);
    ASSERT_TRUE(block.has_value()) << block.error().describe();
    EXPECT_EQ(block->codec(), Codec::kZstd);
    EXPECT_EQ(block->checksum(), checksum);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), block->bytes().begin(), block->bytes().end()));
}

TEST(DecompressAndVerifyTest, ChecksumMismatchIsReported) {
    const auto data = samplePayload(2048);
    const BlockChecksum wrong = computeChecksum(bytesOf("other content"));
    auto stream = streamOf(compressed(Codec::kGzip, data));

    auto block = decompressAndVerify(Codec::kGzip, stream, wrong);
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code(), ErrorCode::kChecksumError);
    EXPECT_NE(block.error().message().find("checksum mismatch: expected " + wrong),
              std::string::npos);
}

TEST(DecompressAndVerifyTest, ReleaseYieldsContentStream) {
    const auto data = bytesOf("stream me");
    auto stream = streamOf(compressed(Codec::kGzip, data));

    auto block = decompressAndVerify(Codec::kGzip, stream, computeChecksum(data));
    ASSERT_TRUE(block.has_value());
    auto content = block->release();
    std::string text((std::istreambuf_iterator<char>(*content)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, "stream me");
    EXPECT_EQ(block->size(), 0U);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(CodecProperty, CompressedBlocksVerifyToIdenticalContent,
              (const std::vector<std::uint8_t>& data)) {
    const Codec codec = *rc::gen::elementOf(kAllCodecs);
    auto packed = compress(codec, data);
    RC_ASSERT(packed.has_value());

    std::istringstream stream(std::string(packed->begin(), packed->end()), std::ios::binary);
    auto block = decompressAndVerify(codec, stream, computeChecksum(data));
    RC_ASSERT(block.has_value());
    RC_ASSERT(std::equal(data.begin(), data.end(), block->bytes().begin(), block->bytes().end()));
}

RC_GTEST_PROP(CodecProperty, CrossCodecDecodeIsAlwaysWrongContainer,
              (const std::vector<std::uint8_t>& data)) {
    const Codec stored = *rc::gen::element(Codec::kGzip, Codec::kZstd);
    const Codec requested = *pairedCodec(stored);
    auto packed = compress(stored, data);
    RC_ASSERT(packed.has_value());

    auto result = decompress(requested, *packed);
    RC_ASSERT(!result.has_value());
    RC_ASSERT(result.error().code() == ErrorCode::kWrongContainer);
    RC_ASSERT(result.error().sniffedCodec() == std::optional<Codec>(stored));
}

}  // namespace
}  // namespace blkstore::codec::test
