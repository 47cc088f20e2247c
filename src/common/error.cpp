// =============================================================================
// blkstore - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "blkstore/common/error.h"

#include <fmt/format.h>

namespace blkstore {

// =============================================================================
// BlkstoreException Implementation
// =============================================================================

std::string BlkstoreException::formatWhat(ErrorCode code, std::string_view message) {
    return fmt::format("[{}] {}", errorCodeToString(code), message);
}

// =============================================================================
// IOError / ChecksumError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::string_view expected,
                                                  std::string_view actual) {
    return fmt::format("checksum mismatch: expected {}, got {}", expected, actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

Error Error::wrap(std::string_view context) const {
    return Error{code_, fmt::format("{}: {}", context, message_), sniffedCodec_};
}

std::string Error::describe() const {
    return fmt::format("[{}] {}", errorCodeToString(code_), message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(code_, message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kPermissionDenied:
        case ErrorCode::kRetryExhausted:
            throw IOError(code_, message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kWrongContainer:
        case ErrorCode::kDecompressionFailed:
            throw FormatError(code_, message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kUnsupportedCodec:
            throw UnsupportedCodecError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
        case ErrorCode::kCancelled:
            break;
    }
    throw BlkstoreException(code_, message_);
}

}  // namespace blkstore
