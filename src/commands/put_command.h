// =============================================================================
// blkstore - Put Command
// =============================================================================
// Command handler that splits a file into blocks and stores them.
//
// Each block is checksummed over its raw content, compressed with the chosen
// codec and written to its content-addressed path. Blocks already present in
// the store are left untouched.
// =============================================================================

#ifndef BLKSTORE_COMMANDS_PUT_COMMAND_H
#define BLKSTORE_COMMANDS_PUT_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "blkstore/common/types.h"
#include "blkstore/retrieval/retrieval_config.h"

namespace blkstore::commands {

// =============================================================================
// Put Options
// =============================================================================

/// @brief Configuration options for the put command.
struct PutOptions {
    /// @brief File to store.
    std::filesystem::path inputPath;

    /// @brief Volume the blocks belong to.
    std::string volume;

    /// @brief Codec blocks are compressed with.
    Codec codec = Codec::kGzip;

    /// @brief Compression level (std::nullopt = codec default).
    std::optional<CompressionLevel> level;

    /// @brief Block size quantity, e.g. "2Mi" (empty = default).
    std::string blockSize;

    /// @brief Store location.
    retrieval::RetrievalConfig config;
};

// =============================================================================
// PutCommand Class
// =============================================================================

/// @brief Command handler for storing a file as blocks.
class PutCommand {
public:
    explicit PutCommand(PutOptions options);

    /// @brief Execute the put command.
    /// @param out Receives one checksum per stored block, in file order.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute(std::ostream& out);

    /// @brief Checksums of the blocks written by the last execute().
    [[nodiscard]] const std::vector<BlockChecksum>& checksums() const noexcept {
        return checksums_;
    }

    /// @brief Number of blocks that were already present.
    [[nodiscard]] std::size_t reusedBlocks() const noexcept { return reusedBlocks_; }

    [[nodiscard]] const PutOptions& options() const noexcept { return options_; }

private:
    /// @brief Store the input; throws BlkstoreException on failure.
    void run(std::ostream& out);

    PutOptions options_;
    std::vector<BlockChecksum> checksums_;
    std::size_t reusedBlocks_ = 0;
};

}  // namespace blkstore::commands

#endif  // BLKSTORE_COMMANDS_PUT_COMMAND_H
