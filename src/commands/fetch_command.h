// =============================================================================
// blkstore - Fetch Command
// =============================================================================
// Command handler for retrieving blocks from a store.
//
// This module provides:
// - FetchCommand: fetch, decompress and verify blocks in parallel, writing
//   their content to an output directory
// - Verify mode: the same retrieval without writing anything
//
// Every block runs as its own task with its own error channel; the channels
// are merged into a single stream of failures that the command consumes.
// =============================================================================

#ifndef BLKSTORE_COMMANDS_FETCH_COMMAND_H
#define BLKSTORE_COMMANDS_FETCH_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "blkstore/common/error.h"
#include "blkstore/common/types.h"
#include "blkstore/retrieval/backoff.h"
#include "blkstore/retrieval/retrieval_config.h"

namespace blkstore::commands {

// =============================================================================
// Fetch Options
// =============================================================================

/// @brief Configuration options for fetch and verify.
struct FetchOptions {
    /// @brief Checksums of the blocks to retrieve.
    std::vector<BlockChecksum> checksums;

    /// @brief Volume the blocks belong to.
    std::string volume;

    /// @brief Codec the blocks are expected to be stored with.
    Codec codec = Codec::kGzip;

    /// @brief Directory receiving one file per block, named by checksum.
    /// @note Empty means verify only.
    std::filesystem::path outputDir;

    /// @brief Cancel outstanding blocks after the first failure.
    bool failFast = false;

    /// @brief Store location, schedule and parallelism.
    retrieval::RetrievalConfig config;

    /// @brief Wait strategy between attempts (empty = real sleep).
    retrieval::Sleeper sleeper;
};

// =============================================================================
// Fetch Summary
// =============================================================================

/// @brief Outcome of one fetch run.
struct FetchSummary {
    /// @brief Blocks requested.
    std::size_t requested = 0;

    /// @brief Blocks retrieved and verified.
    std::size_t verified = 0;

    /// @brief Failures received from the merged error channel, in arrival order.
    std::vector<Error> errors;

    [[nodiscard]] bool passed() const noexcept { return errors.empty() && verified == requested; }
};

// =============================================================================
// FetchCommand Class
// =============================================================================

/// @brief Command handler for fetching and verifying blocks.
class FetchCommand {
public:
    explicit FetchCommand(FetchOptions options);

    /// @brief Execute the fetch.
    /// @param out Receives one "<checksum> OK" line per verified block.
    /// @return Exit code: 0, or the code of the first failure received.
    [[nodiscard]] int execute(std::ostream& out);

    [[nodiscard]] const FetchSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

    [[nodiscard]] bool verifyOnly() const noexcept { return options_.outputDir.empty(); }

private:
    /// @brief Fetch all blocks; throws BlkstoreException on setup failures.
    void run(std::ostream& out);

    FetchOptions options_;
    FetchSummary summary_;
};

}  // namespace blkstore::commands

#endif  // BLKSTORE_COMMANDS_FETCH_COMMAND_H
