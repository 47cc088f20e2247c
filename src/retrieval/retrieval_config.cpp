// =============================================================================
// blkstore - Retrieval Configuration Implementation
// =============================================================================

#include "blkstore/retrieval/retrieval_config.h"

#include <algorithm>
#include <system_error>
#include <thread>

#include <fmt/format.h>

namespace blkstore::retrieval {

VoidResult RetrievalConfig::validate() const {
    if (root.empty()) {
        return makeVoidError(ErrorCode::kInvalidArgument, "store root must not be empty");
    }

    std::error_code ec;
    const auto status = std::filesystem::status(root, ec);
    if (!std::filesystem::exists(status)) {
        return makeVoidError(ErrorCode::kFileNotFound,
                             fmt::format("store root {} does not exist", root.string()));
    }
    if (!std::filesystem::is_directory(status)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("store root {} is not a directory", root.string()));
    }

    const bool negativeWait = std::any_of(schedule.begin(), schedule.end(), [](auto wait) {
        return wait < BackoffSchedule::Duration::zero();
    });
    if (negativeWait) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("backoff schedule {} has a negative wait",
                                         schedule.toString()));
    }

    if (maxParallelFetches > kMaxParallelFetches) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("parallelism {} exceeds the maximum of {}",
                                         maxParallelFetches, kMaxParallelFetches));
    }
    return {};
}

std::size_t RetrievalConfig::effectiveParallelism() const noexcept {
    if (maxParallelFetches != 0) {
        return maxParallelFetches;
    }
    return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
}

}  // namespace blkstore::retrieval
