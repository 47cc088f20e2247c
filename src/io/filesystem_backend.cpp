// =============================================================================
// blkstore - Filesystem Backend Implementation
// =============================================================================

#include "blkstore/io/backend.h"

#include <fmt/format.h>

#include <cerrno>
#include <fstream>
#include <system_error>
#include <utility>

#include "blkstore/common/logger.h"

namespace blkstore::io {

bool isRetryableByDefault(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kIOError:
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileOpenFailed:
            return true;
        default:
            return false;
    }
}

FilesystemBackend::FilesystemBackend(std::filesystem::path root) : root_(std::move(root)) {}

Result<std::filesystem::path> FilesystemBackend::resolve(std::string_view path) const {
    const std::filesystem::path relative(path);
    if (relative.empty() || relative.is_absolute()) {
        return makeError<std::filesystem::path>(
            ErrorCode::kInvalidArgument, fmt::format("invalid block path '{}'", path));
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return makeError<std::filesystem::path>(
                ErrorCode::kInvalidArgument,
                fmt::format("block path '{}' escapes the backend root", path));
        }
    }
    return root_ / relative;
}

Result<ReadStream> FilesystemBackend::read(std::string_view path) {
    auto fullPath = resolve(path);
    if (!fullPath) {
        return std::unexpected(fullPath.error());
    }

    std::error_code ec;
    const auto status = std::filesystem::status(*fullPath, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return makeError<ReadStream>(ErrorCode::kFileNotFound,
                                     fmt::format("block {} not found", fullPath->string()));
    }
    if (ec) {
        const ErrorCode code = ec == std::errc::permission_denied ? ErrorCode::kPermissionDenied
                                                                  : ErrorCode::kIOError;
        return makeError<ReadStream>(
            code, fmt::format("cannot stat block {}: {}", fullPath->string(), ec.message()));
    }
    if (!std::filesystem::is_regular_file(status)) {
        return makeError<ReadStream>(ErrorCode::kInvalidArgument,
                                     fmt::format("block {} is not a file", fullPath->string()));
    }

    errno = 0;
    auto stream = std::make_unique<std::ifstream>(*fullPath, std::ios::binary);
    if (!stream->is_open()) {
        const int savedErrno = errno;
        const ErrorCode code =
            savedErrno == EACCES ? ErrorCode::kPermissionDenied : ErrorCode::kFileOpenFailed;
        return makeError<ReadStream>(
            code, fmt::format("failed to open block {}: {}", fullPath->string(),
                              std::generic_category().message(savedErrno)));
    }

    BLKSTORE_LOG_TRACE("Opened block {}", fullPath->string());
    return ReadStream{std::move(stream)};
}

VoidResult FilesystemBackend::write(std::string_view path, std::span<const std::uint8_t> data) {
    auto fullPath = resolve(path);
    if (!fullPath) {
        return std::unexpected(fullPath.error());
    }

    std::error_code ec;
    std::filesystem::create_directories(fullPath->parent_path(), ec);
    if (ec) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("cannot create directory {}: {}",
                                         fullPath->parent_path().string(), ec.message()));
    }

    std::filesystem::path tempPath = *fullPath;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return makeVoidError(ErrorCode::kFileOpenFailed,
                                 fmt::format("failed to create {}", tempPath.string()));
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tempPath, ec);
            return makeVoidError(ErrorCode::kIOError,
                                 fmt::format("failed to write {}", tempPath.string()));
        }
    }

    std::filesystem::rename(tempPath, *fullPath, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);
        return makeVoidError(ErrorCode::kIOError, fmt::format("failed to move block into {}: {}",
                                                              fullPath->string(), ec.message()));
    }
    return makeVoidSuccess();
}

bool FilesystemBackend::exists(std::string_view path) const {
    auto fullPath = resolve(path);
    if (!fullPath) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(*fullPath, ec);
}

}  // namespace blkstore::io
