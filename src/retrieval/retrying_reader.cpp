// =============================================================================
// blkstore - Retrying Block Reader Implementation
// =============================================================================

#include "blkstore/retrieval/retrying_reader.h"

#include <fmt/format.h>

#include "blkstore/common/logger.h"

namespace blkstore::retrieval {

namespace {

Error cancelled(std::string_view path, std::size_t attempts) {
    return Error{ErrorCode::kCancelled,
                 fmt::format("read of block {} cancelled after {} attempts", path, attempts)};
}

}  // namespace

Result<io::ReadStream> readWithRetry(io::BackendDriver& backend, std::string_view path,
                                     const RetryOptions& options) {
    const BackoffSchedule& schedule = options.schedule;
    const std::stop_token& stopToken = options.stopToken;

    // Number of retries already taken; attempts made so far is retries + 1.
    std::size_t retries = 0;

    for (;;) {
        if (stopToken.stop_requested()) {
            return std::unexpected(cancelled(path, retries));
        }

        auto stream = backend.read(path);
        if (stream) {
            if (retries > 0) {
                BLKSTORE_LOG_INFO("Read block {} from {} backend on attempt {}", path,
                                  backend.kind(), retries + 1);
            }
            return stream;
        }

        const Error& error = stream.error();
        const std::size_t attempts = retries + 1;

        if (!backend.isRetryable(error)) {
            BLKSTORE_LOG_ERROR("Giving up on block {} after {} attempts, error is not retryable: {}",
                               path, attempts, error.describe());
            return std::unexpected(error.wrap(
                fmt::format("failed to read block {} after {} attempts", path, attempts)));
        }

        if (retries < schedule.size()) {
            const BackoffSchedule::Duration wait = schedule[retries];
            BLKSTORE_LOG_WARNING("Failed to read block {} (attempt {}), retrying in {}: {}", path,
                                 attempts, formatDuration(wait), error.describe());

            const bool elapsed = options.sleeper ? options.sleeper(wait, stopToken)
                                                 : interruptibleSleep(wait, stopToken);
            if (!elapsed) {
                return std::unexpected(cancelled(path, attempts));
            }
            ++retries;
            continue;
        }

        BLKSTORE_LOG_ERROR("Failed to read block {} after {} attempts: {}", path, attempts,
                           error.describe());
        return makeError<io::ReadStream>(
            ErrorCode::kRetryExhausted,
            fmt::format("failed to read block {} after {} attempts: {}", path, attempts,
                        error.message()));
    }
}

}  // namespace blkstore::retrieval
