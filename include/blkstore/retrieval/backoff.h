// =============================================================================
// blkstore - Backoff Schedule
// =============================================================================
// The literal table of waits between block read attempts.
//
// The reference schedule is aggressive at first and very patient later, so a
// retrieval rides out both short network blips and long backend outages:
//   1s, 5s, 30s, 2m, 5m, 15m, 30m, 1h, 2h, 6h
// No jitter and no formula: entry i is the wait after the (i+1)-th failure.
// =============================================================================

#ifndef BLKSTORE_RETRIEVAL_BACKOFF_H
#define BLKSTORE_RETRIEVAL_BACKOFF_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "blkstore/common/error.h"

namespace blkstore::retrieval {

/// @brief Immutable ordered sequence of backoff waits.
class BackoffSchedule {
public:
    using Duration = std::chrono::milliseconds;
    using const_iterator = std::vector<Duration>::const_iterator;

    /// @brief Empty schedule: the first failure is final.
    BackoffSchedule() = default;

    explicit BackoffSchedule(std::vector<Duration> steps) : steps_(std::move(steps)) {}

    BackoffSchedule(std::initializer_list<Duration> steps) : steps_(steps) {}

    /// @brief The ten-step reference schedule (1s ... 6h).
    [[nodiscard]] static const BackoffSchedule& reference();

    /// @brief Parse a comma-separated list of durations, e.g. "1s,5s,30s,2m,1h".
    /// @note Units: ms, s, m, h. "none" or "" yields an empty schedule.
    [[nodiscard]] static Result<BackoffSchedule> parse(std::string_view text);

    /// @brief Number of retries the schedule allows.
    [[nodiscard]] std::size_t size() const noexcept { return steps_.size(); }

    [[nodiscard]] bool empty() const noexcept { return steps_.empty(); }

    /// @brief Wait before retry number @p index (0-based).
    [[nodiscard]] Duration operator[](std::size_t index) const { return steps_.at(index); }

    [[nodiscard]] const_iterator begin() const noexcept { return steps_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return steps_.end(); }

    /// @brief Sum of all waits: worst-case time spent sleeping.
    [[nodiscard]] Duration total() const noexcept;

    /// @brief Render in the form accepted by parse().
    [[nodiscard]] std::string toString() const;

    bool operator==(const BackoffSchedule&) const = default;

private:
    std::vector<Duration> steps_;
};

/// @brief Parse one duration ("250ms", "5s", "2m", "1h").
[[nodiscard]] Result<BackoffSchedule::Duration> parseDuration(std::string_view text);

/// @brief Render a duration with the largest unit that divides it exactly.
[[nodiscard]] std::string formatDuration(BackoffSchedule::Duration duration);

/// @brief Wait strategy used between attempts.
/// @return false if the wait was interrupted by a stop request.
using Sleeper = std::function<bool(BackoffSchedule::Duration, std::stop_token)>;

/// @brief Block for @p duration or until @p stopToken is triggered.
/// @return true if the full duration elapsed, false if stopped early.
bool interruptibleSleep(BackoffSchedule::Duration duration, std::stop_token stopToken);

}  // namespace blkstore::retrieval

#endif  // BLKSTORE_RETRIEVAL_BACKOFF_H
