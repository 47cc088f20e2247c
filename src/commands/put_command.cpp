// =============================================================================
// blkstore - Put Command Implementation
// =============================================================================

#include "put_command.h"

#include <fstream>
#include <map>
#include <span>

#include <fmt/format.h>

#include "blkstore/codec/checksum.h"
#include "blkstore/codec/codec.h"
#include "blkstore/common/error.h"
#include "blkstore/common/logger.h"
#include "blkstore/io/backend.h"
#include "blkstore/io/block_layout.h"

namespace blkstore::commands {

PutCommand::PutCommand(PutOptions options) : options_(std::move(options)) {}

int PutCommand::execute(std::ostream& out) {
    try {
        run(out);
        return toExitCode(ErrorCode::kSuccess);
    } catch (const BlkstoreException& e) {
        BLKSTORE_LOG_ERROR("Put failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        BLKSTORE_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void PutCommand::run(std::ostream& out) {
    checksums_.clear();
    reusedBlocks_ = 0;

    if (options_.volume.empty()) {
        throw UsageError("a volume name is required");
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.config.root, ec);
    if (ec) {
        throw IOError(fmt::format("cannot create store root {}", options_.config.root.string()),
                      ec);
    }
    unwrapOrThrow(options_.config.validate());

    const std::map<std::string, std::string, std::less<>> parameters{
        {std::string(kBlockSizeParameter), options_.blockSize}};
    const std::uint64_t blockSize = unwrapOrThrow(io::blockSizeFromParameters(parameters));

    std::ifstream input(options_.inputPath, std::ios::binary);
    if (!input) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      fmt::format("cannot open {}", options_.inputPath.string()));
    }

    io::FilesystemBackend backend(options_.config.root);
    std::vector<std::uint8_t> buffer(blockSize);
    std::uint64_t totalBytes = 0;

    // An empty file still yields one (empty) block.
    do {
        input.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        if (input.bad()) {
            throw IOError(fmt::format("read failed on {}", options_.inputPath.string()));
        }
        const auto count = static_cast<std::size_t>(input.gcount());
        if (count == 0 && !checksums_.empty()) {
            break;
        }

        const std::span<const std::uint8_t> content(buffer.data(), count);
        BlockChecksum checksum = codec::computeChecksum(content);
        const std::string path = unwrapOrThrow(io::blockFilePath(options_.volume, checksum));

        if (backend.exists(path)) {
            BLKSTORE_LOG_DEBUG("Block {} already stored, skipping", path);
            ++reusedBlocks_;
        } else {
            auto compressed = unwrapOrThrow(codec::compress(options_.codec, content, options_.level));
            unwrapOrThrow(backend.write(path, compressed));
            BLKSTORE_LOG_DEBUG("Stored block {} ({} -> {} bytes, {})", path, count,
                               compressed.size(), codecToString(options_.codec));
        }

        out << checksum << '\n';
        checksums_.push_back(std::move(checksum));
        totalBytes += count;
    } while (input);

    BLKSTORE_LOG_INFO("Stored {} ({} bytes) as {} blocks in volume {} ({} already present)",
                      options_.inputPath.string(), totalBytes, checksums_.size(),
                      options_.volume, reusedBlocks_);
}

}  // namespace blkstore::commands
