// =============================================================================
// blkstore - Retrieval Configuration Tests
// =============================================================================

#include "blkstore/retrieval/retrieval_config.h"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>

#include "test_support.h"

namespace blkstore::retrieval {
namespace {

using namespace std::chrono_literals;
using blkstore::test::TempDir;

TEST(RetrievalConfigTest, DefaultsUseReferenceSchedule) {
    const RetrievalConfig config;
    EXPECT_EQ(config.schedule, BackoffSchedule::reference());
    EXPECT_EQ(config.maxParallelFetches, 0U);
    EXPECT_GE(config.effectiveParallelism(), 1U);
}

TEST(RetrievalConfigTest, ExistingDirectoryValidates) {
    TempDir dir;
    RetrievalConfig config;
    config.root = dir.path();
    config.maxParallelFetches = 8;

    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.effectiveParallelism(), 8U);
}

TEST(RetrievalConfigTest, MissingRootIsNotFound) {
    TempDir dir;
    RetrievalConfig config;
    config.root = dir.path() / "absent";

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFileNotFound);
}

TEST(RetrievalConfigTest, FileRootIsRejected) {
    TempDir dir;
    const auto file = dir.path() / "file";
    std::ofstream(file) << "x";
    RetrievalConfig config;
    config.root = file;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(RetrievalConfigTest, EmptyRootIsRejected) {
    RetrievalConfig config;
    config.root.clear();

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(RetrievalConfigTest, NegativeWaitIsRejected) {
    TempDir dir;
    RetrievalConfig config;
    config.root = dir.path();
    config.schedule = BackoffSchedule{1s, -5ms};

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

TEST(RetrievalConfigTest, ExcessiveParallelismIsRejected) {
    TempDir dir;
    RetrievalConfig config;
    config.root = dir.path();
    config.maxParallelFetches = kMaxParallelFetches + 1;

    EXPECT_FALSE(config.validate().has_value());
}

}  // namespace
}  // namespace blkstore::retrieval
