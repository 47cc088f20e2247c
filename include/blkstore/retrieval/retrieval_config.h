// =============================================================================
// blkstore - Retrieval Configuration
// =============================================================================
// Settings shared by every command that talks to a block store.
// =============================================================================

#ifndef BLKSTORE_RETRIEVAL_RETRIEVAL_CONFIG_H
#define BLKSTORE_RETRIEVAL_RETRIEVAL_CONFIG_H

#include <cstddef>
#include <filesystem>
#include <string>

#include "blkstore/common/error.h"
#include "blkstore/common/logger.h"
#include "blkstore/retrieval/backoff.h"

namespace blkstore::retrieval {

/// @brief Upper bound on concurrently fetched blocks.
inline constexpr std::size_t kMaxParallelFetches = 256;

/// @brief Store location, retry schedule and logging settings.
struct RetrievalConfig {
    /// @brief Root directory of the block store.
    std::filesystem::path root = ".";

    /// @brief Waits between read attempts.
    BackoffSchedule schedule = BackoffSchedule::reference();

    /// @brief Concurrent block fetches (0 = one per hardware thread).
    std::size_t maxParallelFetches = 0;

    /// @brief Log destination; empty logs to the console.
    std::string logFile;

    log::Level logLevel = log::Level::kInfo;

    /// @brief Check the configuration before any block is touched.
    /// @return kFileNotFound if the root does not exist, kInvalidArgument for
    ///         a root that is not a directory, a negative wait or an
    ///         out-of-range parallelism.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Parallelism to use once defaults are resolved.
    [[nodiscard]] std::size_t effectiveParallelism() const noexcept;
};

}  // namespace blkstore::retrieval

#endif  // BLKSTORE_RETRIEVAL_RETRIEVAL_CONFIG_H
