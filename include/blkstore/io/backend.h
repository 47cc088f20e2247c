// =============================================================================
// blkstore - Storage Backend Drivers
// =============================================================================
// The read capability every block source exposes, and a local filesystem
// implementation of it.
//
// Ownership: read() hands the caller an exclusively owned stream; destroying
// the unique_ptr releases it. Drivers keep no per-read cursor, so one driver
// can serve concurrent reads.
// =============================================================================

#ifndef BLKSTORE_IO_BACKEND_H
#define BLKSTORE_IO_BACKEND_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string_view>

#include "blkstore/common/error.h"

namespace blkstore::io {

/// @brief Exclusively owned, sequential block stream.
using ReadStream = std::unique_ptr<std::istream>;

/// @brief Default retry classification of backend error codes.
/// @return true for conditions that may clear up on their own (I/O errors,
///         open failures, blocks not yet visible); false for permission,
///         argument and codec errors.
[[nodiscard]] bool isRetryableByDefault(ErrorCode code) noexcept;

// =============================================================================
// BackendDriver Interface
// =============================================================================

/// @brief Abstract block source (filesystem, object store, ...).
class BackendDriver {
public:
    virtual ~BackendDriver() = default;

    BackendDriver() = default;
    BackendDriver(const BackendDriver&) = delete;
    BackendDriver& operator=(const BackendDriver&) = delete;
    BackendDriver(BackendDriver&&) = delete;
    BackendDriver& operator=(BackendDriver&&) = delete;

    /// @brief Short driver name for logs ("file", "s3", ...).
    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;

    /// @brief Open the block at @p path for reading.
    /// @param path Backend-relative block path.
    /// @return A fresh stream positioned at the start of the block.
    [[nodiscard]] virtual Result<ReadStream> read(std::string_view path) = 0;

    /// @brief Whether a failure returned by read() is worth retrying.
    /// @note Drivers override this when they know more than the error code.
    [[nodiscard]] virtual bool isRetryable(const Error& error) const noexcept {
        return isRetryableByDefault(error.code());
    }
};

// =============================================================================
// FilesystemBackend
// =============================================================================

/// @brief Backend rooted at a local directory.
class FilesystemBackend final : public BackendDriver {
public:
    /// @brief Construct rooted at @p root (not required to exist yet).
    explicit FilesystemBackend(std::filesystem::path root);

    [[nodiscard]] std::string_view kind() const noexcept override { return "file"; }

    [[nodiscard]] Result<ReadStream> read(std::string_view path) override;

    /// @brief Store @p data at @p path, creating parent directories.
    /// @note Writes to a temporary sibling and renames it into place.
    [[nodiscard]] VoidResult write(std::string_view path, std::span<const std::uint8_t> data);

    /// @brief Check whether a block exists.
    [[nodiscard]] bool exists(std::string_view path) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    /// @brief Resolve a backend path under root_, rejecting escapes.
    [[nodiscard]] Result<std::filesystem::path> resolve(std::string_view path) const;

    std::filesystem::path root_;
};

}  // namespace blkstore::io

#endif  // BLKSTORE_IO_BACKEND_H
