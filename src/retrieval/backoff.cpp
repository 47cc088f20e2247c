// =============================================================================
// blkstore - Backoff Schedule Implementation
// =============================================================================

#include "blkstore/retrieval/backoff.h"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <mutex>
#include <numeric>
#include <utility>

namespace blkstore::retrieval {

namespace {

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;
using Duration = BackoffSchedule::Duration;

/// @brief Unit suffixes in increasing scale.
constexpr std::array<std::pair<std::string_view, std::int64_t>, 4> kUnits = {{
    {"ms", 1},
    {"s", 1'000},
    {"m", 60'000},
    {"h", 3'600'000},
}};

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// =============================================================================
// BackoffSchedule
// =============================================================================

const BackoffSchedule& BackoffSchedule::reference() {
    static const BackoffSchedule kReference{
        seconds(1), seconds(5),  seconds(30), minutes(2), minutes(5),
        minutes(15), minutes(30), hours(1),   hours(2),   hours(6),
    };
    return kReference;
}

Result<BackoffSchedule> BackoffSchedule::parse(std::string_view text) {
    text = trim(text);
    if (text.empty() || text == "none") {
        return BackoffSchedule{};
    }

    std::vector<Duration> steps;
    while (!text.empty()) {
        const std::size_t comma = text.find(',');
        const std::string_view item = trim(text.substr(0, comma));
        auto duration = parseDuration(item);
        if (!duration) {
            return std::unexpected(
                duration.error().wrap(fmt::format("backoff step {}", steps.size() + 1)));
        }
        steps.push_back(*duration);
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
        if (trim(text).empty()) {
            return makeError<BackoffSchedule>(ErrorCode::kInvalidArgument,
                                              "trailing ',' in backoff schedule");
        }
    }
    return BackoffSchedule{std::move(steps)};
}

Duration BackoffSchedule::total() const noexcept {
    return std::accumulate(steps_.begin(), steps_.end(), Duration::zero());
}

std::string BackoffSchedule::toString() const {
    if (steps_.empty()) {
        return "none";
    }
    std::string out;
    for (const Duration step : steps_) {
        if (!out.empty()) {
            out += ',';
        }
        out += formatDuration(step);
    }
    return out;
}

// =============================================================================
// Durations
// =============================================================================

Result<Duration> parseDuration(std::string_view text) {
    std::size_t digits = 0;
    while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') {
        ++digits;
    }
    if (digits == 0) {
        return makeError<Duration>(ErrorCode::kInvalidArgument,
                                   fmt::format("invalid duration '{}'", text));
    }

    std::int64_t count = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, count);
    if (ec != std::errc{}) {
        return makeError<Duration>(ErrorCode::kInvalidArgument,
                                   fmt::format("duration '{}' out of range", text));
    }

    const std::string_view unit = text.substr(digits);
    for (const auto& [name, scale] : kUnits) {
        if (unit == name) {
            if (count > std::numeric_limits<std::int64_t>::max() / scale) {
                return makeError<Duration>(ErrorCode::kInvalidArgument,
                                           fmt::format("duration '{}' out of range", text));
            }
            return Duration(count * scale);
        }
    }
    return makeError<Duration>(
        ErrorCode::kInvalidArgument,
        fmt::format("invalid duration '{}' (expected a unit of ms, s, m or h)", text));
}

std::string formatDuration(Duration duration) {
    const std::int64_t ms = duration.count();
    if (ms != 0) {
        for (auto it = kUnits.rbegin(); it != kUnits.rend(); ++it) {
            if (ms % it->second == 0) {
                return fmt::format("{}{}", ms / it->second, it->first);
            }
        }
    }
    return fmt::format("{}ms", ms);
}

// =============================================================================
// Sleeping
// =============================================================================

bool interruptibleSleep(Duration duration, std::stop_token stopToken) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stopToken, duration, [] { return false; });
    return !stopToken.stop_requested();
}

}  // namespace blkstore::retrieval
