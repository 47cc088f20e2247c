// =============================================================================
// blkstore - Put / Fetch Command Tests
// =============================================================================
// End-to-end tests: store files with PutCommand, then fetch and verify them
// with FetchCommand against a filesystem store.
// =============================================================================

#include <gtest/gtest.h>
#include <tbb/global_control.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "blkstore/codec/checksum.h"
#include "blkstore/codec/codec.h"
#include "blkstore/io/backend.h"
#include "blkstore/io/block_layout.h"
#include "commands/fetch_command.h"
#include "commands/put_command.h"
#include "test_support.h"

namespace blkstore::commands {
namespace {

using blkstore::test::RecordingSleeper;
using blkstore::test::samplePayload;
using blkstore::test::TempDir;

constexpr std::string_view kVolume = "vol-1";

void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<std::uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

class CommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        storeRoot_ = dir_.path() / "store";
        std::filesystem::create_directories(storeRoot_);
    }

    [[nodiscard]] retrieval::RetrievalConfig config() const {
        retrieval::RetrievalConfig config;
        config.root = storeRoot_;
        config.schedule = retrieval::BackoffSchedule{std::chrono::milliseconds(1),
                                                     std::chrono::milliseconds(1)};
        config.maxParallelFetches = 4;
        return config;
    }

    /// @brief Store @p data and return its block checksums.
    std::vector<BlockChecksum> put(const std::vector<std::uint8_t>& data, Codec codec,
                                   const std::string& blockSize = "") {
        const auto input = dir_.path() / "input.bin";
        writeFile(input, data);

        PutOptions opts;
        opts.inputPath = input;
        opts.volume = std::string(kVolume);
        opts.codec = codec;
        opts.blockSize = blockSize;
        opts.config = config();

        PutCommand cmd(std::move(opts));
        std::ostringstream out;
        EXPECT_EQ(cmd.execute(out), 0);
        return cmd.checksums();
    }

    FetchOptions fetchOptions(std::vector<BlockChecksum> checksums, Codec codec) {
        FetchOptions opts;
        opts.checksums = std::move(checksums);
        opts.volume = std::string(kVolume);
        opts.codec = codec;
        opts.config = config();
        opts.sleeper = sleeper_.sleeper();
        return opts;
    }

    TempDir dir_;
    std::filesystem::path storeRoot_;
    RecordingSleeper sleeper_;
};

TEST_F(CommandsTest, PutSplitsIntoBlocksAndFetchRestoresThem) {
    const auto data = samplePayload(10 * 1024);
    const auto checksums = put(data, Codec::kGzip, "4Ki");
    ASSERT_EQ(checksums.size(), 3U);

    auto opts = fetchOptions(checksums, Codec::kGzip);
    opts.outputDir = dir_.path() / "out";
    FetchCommand cmd(std::move(opts));
    std::ostringstream out;

    ASSERT_EQ(cmd.execute(out), 0);
    EXPECT_EQ(cmd.summary().verified, 3U);

    std::vector<std::uint8_t> restored;
    for (const auto& checksum : checksums) {
        const auto part = readFile(dir_.path() / "out" / checksum);
        restored.insert(restored.end(), part.begin(), part.end());
        EXPECT_NE(out.str().find(checksum + " OK"), std::string::npos);
    }
    EXPECT_EQ(restored, data);
}

TEST_F(CommandsTest, PutSkipsBlocksAlreadyStored) {
    const auto data = samplePayload(1000);
    const auto first = put(data, Codec::kZstd);

    const auto input = dir_.path() / "again.bin";
    writeFile(input, data);
    PutOptions opts;
    opts.inputPath = input;
    opts.volume = std::string(kVolume);
    opts.codec = Codec::kZstd;
    opts.config = config();
    PutCommand cmd(std::move(opts));
    std::ostringstream out;

    ASSERT_EQ(cmd.execute(out), 0);
    EXPECT_EQ(cmd.checksums(), first);
    EXPECT_EQ(cmd.reusedBlocks(), 1U);
    EXPECT_EQ(out.str(), first.front() + "\n");
}

TEST_F(CommandsTest, EmptyFileIsStoredAsOneEmptyBlock) {
    const auto checksums = put({}, Codec::kGzip);
    ASSERT_EQ(checksums.size(), 1U);
    EXPECT_EQ(checksums.front(), codec::computeChecksum(std::string_view()));
}

TEST_F(CommandsTest, PutRejectsOversizedBlockSize) {
    const auto input = dir_.path() / "input.bin";
    writeFile(input, samplePayload(100));
    PutOptions opts;
    opts.inputPath = input;
    opts.volume = std::string(kVolume);
    opts.codec = Codec::kGzip;
    opts.blockSize = "1Pi";
    opts.config = config();
    PutCommand cmd(std::move(opts));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kInvalidArgument));
    EXPECT_TRUE(cmd.checksums().empty());
}

TEST_F(CommandsTest, VerifyRecoversBlocksStoredWithOtherCodec) {
    const auto data = samplePayload(3000);
    const auto checksums = put(data, Codec::kZstd);

    FetchCommand cmd(fetchOptions(checksums, Codec::kGzip));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), 0);
    EXPECT_TRUE(cmd.verifyOnly());
    EXPECT_TRUE(cmd.summary().passed());
}

TEST_F(CommandsTest, MissingBlockExhaustsScheduleAndFails) {
    const auto data = samplePayload(2000);
    auto checksums = put(data, Codec::kGzip);
    checksums.push_back(codec::computeChecksum(std::string_view("never stored")));

    FetchCommand cmd(fetchOptions(checksums, Codec::kGzip));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kRetryExhausted));
    EXPECT_EQ(cmd.summary().verified, 1U);
    ASSERT_EQ(cmd.summary().errors.size(), 1U);
    EXPECT_NE(cmd.summary().errors.front().message().find("after 3 attempts"), std::string::npos);
    EXPECT_EQ(sleeper_.waits().size(), 2U);
}

TEST_F(CommandsTest, CorruptBlockFailsWithChecksumError) {
    const auto data = samplePayload(2000);
    const auto checksums = put(data, Codec::kGzip);

    // Replace the stored block with valid gzip of other content.
    io::FilesystemBackend backend(storeRoot_);
    const auto path = io::blockFilePath(kVolume, checksums.front()).value();
    const auto other = codec::compress(Codec::kGzip, samplePayload(2000, 99)).value();
    ASSERT_TRUE(backend.write(path, other).has_value());

    FetchCommand cmd(fetchOptions(checksums, Codec::kGzip));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kChecksumError));
    EXPECT_FALSE(cmd.summary().passed());
}

TEST_F(CommandsTest, InvalidChecksumIsReportedPerBlock) {
    FetchCommand cmd(fetchOptions({"xyz"}, Codec::kGzip));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kInvalidArgument));
    ASSERT_EQ(cmd.summary().errors.size(), 1U);
    EXPECT_NE(cmd.summary().errors.front().message().find("block xyz"), std::string::npos);
}

TEST_F(CommandsTest, MissingStoreRootFailsBeforeFetching) {
    auto opts = fetchOptions({"abcd"}, Codec::kGzip);
    opts.config.root = dir_.path() / "nowhere";
    FetchCommand cmd(std::move(opts));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kFileNotFound));
}

TEST_F(CommandsTest, NoChecksumsIsTriviallySuccessful) {
    FetchCommand cmd(fetchOptions({}, Codec::kGzip));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), 0);
    EXPECT_TRUE(cmd.summary().passed());
}

TEST_F(CommandsTest, FetchCompletesWithoutWorkerThreads) {
    const auto data = samplePayload(10 * 1024);
    const auto checksums = put(data, Codec::kZstd, "2Ki");
    ASSERT_EQ(checksums.size(), 5U);

    tbb::global_control single(tbb::global_control::max_allowed_parallelism, 1);
    auto opts = fetchOptions(checksums, Codec::kZstd);
    opts.outputDir = dir_.path() / "out";
    FetchCommand cmd(std::move(opts));
    std::ostringstream out;

    ASSERT_EQ(cmd.execute(out), 0);
    EXPECT_EQ(cmd.summary().verified, 5U);
}

TEST_F(CommandsTest, FailFastStopsRemainingBlocks) {
    tbb::global_control single(tbb::global_control::max_allowed_parallelism, 1);
    auto opts = fetchOptions({"xyz", "qqq", "zzz"}, Codec::kGzip);
    opts.failFast = true;
    FetchCommand cmd(std::move(opts));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kInvalidArgument));
    EXPECT_EQ(cmd.summary().errors.size(), 1U);
    EXPECT_EQ(cmd.summary().verified, 0U);
}

TEST_F(CommandsTest, WithoutFailFastEveryFailureIsReported) {
    tbb::global_control single(tbb::global_control::max_allowed_parallelism, 1);
    FetchCommand cmd(fetchOptions({"xyz", "qqq", "zzz"}, Codec::kGzip));
    std::ostringstream out;

    EXPECT_EQ(cmd.execute(out), toExitCode(ErrorCode::kInvalidArgument));
    EXPECT_EQ(cmd.summary().errors.size(), 3U);
}

}  // namespace
}  // namespace blkstore::commands
