// =============================================================================
// blkstore - Block Layout Tests
// =============================================================================

#include "blkstore/io/block_layout.h"

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "blkstore/codec/checksum.h"
#include "blkstore/common/types.h"

namespace blkstore::io {
namespace {

using Parameters = std::map<std::string, std::string, std::less<>>;

// =============================================================================
// Path Tests
// =============================================================================

TEST(BlockLayoutTest, VolumePathFansOutByNameHash) {
    const std::string hash = codec::hashName("vol-a");
    EXPECT_EQ(volumePath("vol-a"),
              "backupstore/volumes/" + hash.substr(0, 2) + "/" + hash.substr(2, 2) + "/vol-a");
}

TEST(BlockLayoutTest, BlockDirectoryEndsWithSeparator) {
    EXPECT_EQ(blockDirectory("vol-a"), volumePath("vol-a") + "/blocks/");
}

TEST(BlockLayoutTest, BlockFilePathFansOutByChecksum) {
    const std::string checksum = "0123456789abcdef0123456789abcdef";
    auto path = blockFilePath("vol-a", checksum);

    ASSERT_TRUE(path.has_value()) << path.error().describe();
    EXPECT_EQ(*path, blockDirectory("vol-a") + "01/23/" + checksum + ".blk");
}

TEST(BlockLayoutTest, ShortChecksumIsRejected) {
    auto path = blockFilePath("vol-a", "abc");
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code(), ErrorCode::kInvalidArgument);
}

TEST(BlockLayoutTest, NonHexChecksumIsRejected) {
    auto path = blockFilePath("vol-a", "../../etc/passwd");
    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().code(), ErrorCode::kInvalidArgument);
}

TEST(BlockLayoutTest, InvalidVolumeNamesAreRejected) {
    for (const char* name : {"", ".", "..", "a/b"}) {
        auto path = blockFilePath(name, "abcd");
        EXPECT_FALSE(path.has_value()) << "volume '" << name << "'";
    }
}

// =============================================================================
// Quantity Tests
// =============================================================================

TEST(ParseQuantityTest, PlainAndSuffixedValues) {
    EXPECT_EQ(parseQuantity("65536").value(), 65536U);
    EXPECT_EQ(parseQuantity("512Ki").value(), 512U * 1024);
    EXPECT_EQ(parseQuantity("2Mi").value(), 2U * 1024 * 1024);
    EXPECT_EQ(parseQuantity("1Gi").value(), 1ULL << 30);
    EXPECT_EQ(parseQuantity("4M").value(), 4'000'000U);
    EXPECT_EQ(parseQuantity("3k").value(), 3'000U);
}

TEST(ParseQuantityTest, FractionsRoundUp) {
    EXPECT_EQ(parseQuantity("1.5Ki").value(), 1536U);
    EXPECT_EQ(parseQuantity("0.5").value(), 1U);
    EXPECT_EQ(parseQuantity(".5Mi").value(), 512U * 1024);
}

TEST(ParseQuantityTest, RejectsMalformedInput) {
    for (const char* text : {"", "Mi", "1.", "-1", "12XB", "1 Mi", "99999999999999999999"}) {
        auto value = parseQuantity(text);
        ASSERT_FALSE(value.has_value()) << "'" << text << "'";
        EXPECT_EQ(value.error().code(), ErrorCode::kInvalidArgument);
    }
}

TEST(ParseQuantityTest, RejectsOverflow) {
    EXPECT_FALSE(parseQuantity("20000Pi").has_value());
}

// =============================================================================
// Block Size Tests
// =============================================================================

TEST(BlockSizeTest, DefaultsWhenParameterMissingOrEmptyOrZero) {
    EXPECT_EQ(blockSizeFromParameters({}).value(), kDefaultBlockSize);
    EXPECT_EQ(blockSizeFromParameters(Parameters{{"backupBlockSize", ""}}).value(),
              kDefaultBlockSize);
    EXPECT_EQ(blockSizeFromParameters(Parameters{{"backupBlockSize", "0"}}).value(),
              kDefaultBlockSize);
    EXPECT_EQ(blockSizeFromParameters(Parameters{{"otherKey", "16Mi"}}).value(),
              kDefaultBlockSize);
}

TEST(BlockSizeTest, ReadsBackupBlockSize) {
    EXPECT_EQ(blockSizeFromParameters(Parameters{{"backupBlockSize", "16Mi"}}).value(),
              16U * 1024 * 1024);
}

TEST(BlockSizeTest, InvalidValueNamesValueAndKey) {
    auto size = blockSizeFromParameters(Parameters{{"backupBlockSize", "lots"}});
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_NE(size.error().message().find("invalid block size lots from parameter backupBlockSize"),
              std::string::npos);
}

TEST(BlockSizeTest, OversizedValueIsRejected) {
    auto size = blockSizeFromParameters(Parameters{{"backupBlockSize", "1Pi"}});
    ASSERT_FALSE(size.has_value());
    EXPECT_EQ(size.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_NE(size.error().message().find("exceeds the maximum"), std::string::npos);

    EXPECT_EQ(blockSizeFromParameters(Parameters{{"backupBlockSize", "1Gi"}}).value(),
              kMaxBlockSize);
}

}  // namespace
}  // namespace blkstore::io
