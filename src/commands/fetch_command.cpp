// =============================================================================
// blkstore - Fetch Command Implementation
// =============================================================================

#include "fetch_command.h"

#include <fstream>
#include <memory>
#include <stop_token>

#include <fmt/format.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include "blkstore/codec/codec.h"
#include "blkstore/common/logger.h"
#include "blkstore/concurrency/error_channel.h"
#include "blkstore/io/backend.h"
#include "blkstore/io/block_layout.h"
#include "blkstore/retrieval/fallback_reader.h"

namespace blkstore::commands {

namespace {

/// @brief Write verified content to @p target, replacing any previous file.
void writeBlockFile(const std::filesystem::path& target, const codec::VerifiedBlock& block) {
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError(ErrorCode::kFileOpenFailed, fmt::format("cannot create {}", target.string()));
    }
    const auto bytes = block.bytes();
    file.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        throw IOError(fmt::format("write failed on {}", target.string()));
    }
}

}  // namespace

FetchCommand::FetchCommand(FetchOptions options) : options_(std::move(options)) {}

int FetchCommand::execute(std::ostream& out) {
    try {
        run(out);
    } catch (const BlkstoreException& e) {
        BLKSTORE_LOG_ERROR("Fetch failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        BLKSTORE_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }

    if (summary_.errors.empty()) {
        return toExitCode(summary_.passed() ? ErrorCode::kSuccess : ErrorCode::kCancelled);
    }
    return toExitCode(summary_.errors.front().code());
}

void FetchCommand::run(std::ostream& out) {
    summary_ = FetchSummary{};
    summary_.requested = options_.checksums.size();

    if (options_.volume.empty()) {
        throw UsageError("a volume name is required");
    }
    unwrapOrThrow(options_.config.validate());

    if (!verifyOnly()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.outputDir, ec);
        if (ec) {
            throw IOError(
                fmt::format("cannot create output directory {}", options_.outputDir.string()), ec);
        }
    }

    const std::size_t count = options_.checksums.size();
    io::FilesystemBackend backend(options_.config.root);
    std::stop_source stopSource;

    retrieval::RetryOptions retryOptions;
    retryOptions.schedule = options_.config.schedule;
    retryOptions.sleeper = options_.sleeper;
    retryOptions.stopToken = stopSource.get_token();

    std::vector<std::shared_ptr<concurrency::ErrorChannel>> channels;
    channels.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        channels.push_back(concurrency::makeErrorChannel());
    }
    // 1 = verified; written by exactly one task each.
    std::vector<char> verified(count, 0);

    // The merge is not tied to stopSource: a fail-fast stop must not discard
    // the error that triggered it.
    auto merged = concurrency::mergeErrorChannels(std::stop_token{}, channels);

    BLKSTORE_LOG_INFO("{} {} blocks of volume {} ({}, parallelism {})",
                      verifyOnly() ? "Verifying" : "Fetching", count, options_.volume,
                      codecToString(options_.codec), options_.config.effectiveParallelism());

    // The calling thread keeps its arena slot and runs blocks itself while
    // waiting, so progress does not depend on TBB having worker threads.
    tbb::task_arena arena(static_cast<int>(options_.config.effectiveParallelism()));
    tbb::task_group group;

    arena.execute([&] {
        for (std::size_t i = 0; i < count; ++i) {
            group.run([&, i] {
                const BlockChecksum& checksum = options_.checksums[i];
                if (stopSource.stop_requested()) {
                    channels[i]->close();
                    return;
                }
                auto outcome = tryExecute([&] {
                    const std::string path =
                        unwrapOrThrow(io::blockFilePath(options_.volume, checksum));
                    auto block = unwrapOrThrow(retrieval::decompressAndVerifyWithFallback(
                        backend, path, options_.codec, checksum, retryOptions));
                    if (!verifyOnly()) {
                        writeBlockFile(options_.outputDir / checksum, block);
                    }
                });
                if (outcome) {
                    verified[i] = 1;
                } else if (outcome.error().code() != ErrorCode::kCancelled ||
                           !stopSource.stop_requested()) {
                    channels[i]->send(outcome.error().wrap(fmt::format("block {}", checksum)));
                    if (options_.failFast && stopSource.request_stop()) {
                        BLKSTORE_LOG_WARNING("Cancelling outstanding blocks after failure of {}",
                                             checksum);
                    }
                }
                channels[i]->close();
            });
        }
        group.wait();
    });

    // Every channel is closed by now; the output holds up to count errors.
    while (auto error = merged->receive()) {
        BLKSTORE_LOG_ERROR("{}", error->describe());
        summary_.errors.push_back(std::move(*error));
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (verified[i] != 0) {
            ++summary_.verified;
            out << options_.checksums[i] << " OK\n";
        }
    }

    BLKSTORE_LOG_INFO("{} of {} blocks verified, {} failed", summary_.verified, count,
                      summary_.errors.size());
}

}  // namespace blkstore::commands
