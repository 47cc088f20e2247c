// =============================================================================
// blkstore - Retrying Block Reader
// =============================================================================
// Opens a block through a BackendDriver, retrying transient failures on a
// BackoffSchedule.
//
// Attempts are strictly sequential. With a schedule of N entries a block is
// tried at most N + 1 times: the initial read plus one retry per entry. Each
// call owns its own attempt counter, so concurrent retrievals share nothing.
// =============================================================================

#ifndef BLKSTORE_RETRIEVAL_RETRYING_READER_H
#define BLKSTORE_RETRIEVAL_RETRYING_READER_H

#include <cstdint>
#include <stop_token>
#include <string_view>

#include "blkstore/common/error.h"
#include "blkstore/io/backend.h"
#include "blkstore/retrieval/backoff.h"

namespace blkstore::retrieval {

/// @brief Options controlling one retrieval.
struct RetryOptions {
    /// @brief Waits between attempts.
    BackoffSchedule schedule = BackoffSchedule::reference();

    /// @brief Wait strategy; empty means interruptibleSleep().
    Sleeper sleeper;

    /// @brief Abandons the retry loop when triggered.
    std::stop_token stopToken;
};

/// @brief Open @p path on @p backend, retrying per @p options.
///
/// - Success on any attempt returns the stream at once.
/// - A failure the backend classifies as terminal is returned right away,
///   wrapped with the path and the attempt count.
/// - A retryable failure waits schedule[i] before attempt i + 2; once the
///   schedule is used up the result is ErrorCode::kRetryExhausted.
/// - A stop request before an attempt or during a wait yields
///   ErrorCode::kCancelled.
[[nodiscard]] Result<io::ReadStream> readWithRetry(io::BackendDriver& backend,
                                                   std::string_view path,
                                                   const RetryOptions& options = {});

}  // namespace blkstore::retrieval

#endif  // BLKSTORE_RETRIEVAL_RETRYING_READER_H
