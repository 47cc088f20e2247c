// =============================================================================
// blkstore - Error Handling Framework
// =============================================================================
// Error handling for the blkstore library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - BlkstoreException hierarchy for the command-line boundary
// - Result<T, E> type for functional error handling (using std::expected)
// - Error wrapping with a message prefix, and a structured codec hint for
//   wrong-container failures
//
// Library code returns Result<T>; only the CLI layer converts to exceptions.
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (read/write failure)
// - 3: Format error
// - 4: Checksum verification failure
// - 5: Unsupported codec
// - 6 and above: finer-grained library codes
// =============================================================================

#ifndef BLKSTORE_COMMON_ERROR_H
#define BLKSTORE_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "blkstore/common/types.h"

namespace blkstore {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Transient read/write failure; retryable by default.
    kIOError = 2,

    /// @brief Format error.
    kFormatError = 3,

    /// @brief Checksum verification failure.
    /// @note Decompression succeeded but the digest did not match.
    kChecksumError = 4,

    /// @brief Unsupported codec.
    kUnsupportedCodec = 5,

    /// @brief Invalid argument value.
    kInvalidArgument = 6,

    /// @brief Block or file not found.
    kFileNotFound = 7,

    /// @brief Failed to open file.
    kFileOpenFailed = 8,

    /// @brief Permission denied by the backend.
    kPermissionDenied = 9,

    /// @brief Invalid state for operation.
    kInvalidState = 10,

    /// @brief Operation was cancelled.
    kCancelled = 11,

    /// @brief Decompression failed inside a valid container.
    kDecompressionFailed = 12,

    /// @brief Data is not in the requested codec's container format.
    /// @note Carries the sniffed codec (if any) in Error::sniffedCodec().
    kWrongContainer = 13,

    /// @brief Backend read kept failing until the backoff schedule ran out.
    kRetryExhausted = 14
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "not found";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kPermissionDenied:
            return "permission denied";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kWrongContainer:
            return "wrong container";
        case ErrorCode::kRetryExhausted:
            return "retry exhausted";
    }
    return "unknown error";
}

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all blkstore errors.
class BlkstoreException : public std::exception {
public:
    BlkstoreException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        what_ = formatWhat(code_, message_);
    }

    ~BlkstoreException() override = default;

    BlkstoreException(const BlkstoreException&) = default;
    BlkstoreException(BlkstoreException&&) noexcept = default;
    BlkstoreException& operator=(const BlkstoreException&) = default;
    BlkstoreException& operator=(BlkstoreException&&) noexcept = default;

    /// @brief "[category] message".
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without the category prefix).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    static std::string formatWhat(ErrorCode code, std::string_view message);

    ErrorCode code_;
    std::string message_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public BlkstoreException {
public:
    explicit UsageError(std::string message)
        : BlkstoreException(ErrorCode::kUsageError, std::move(message)) {}

    /// @brief Construct with a specific usage-family code (invalid argument).
    UsageError(ErrorCode code, std::string message)
        : BlkstoreException(code, std::move(message)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for read/write failures, missing blocks, permission denied.
class IOError : public BlkstoreException {
public:
    explicit IOError(std::string message)
        : BlkstoreException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with a specific I/O-family code (not found, retry exhausted, ...).
    IOError(ErrorCode code, std::string message)
        : BlkstoreException(code, std::move(message)) {}

    /// @brief Construct from system error code.
    /// @param message Descriptive error message.
    /// @param ec System error code.
    IOError(const std::string& message, std::error_code ec)
        : BlkstoreException(ErrorCode::kIOError, formatWithSystemError(message, ec)) {}

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown for wrong containers and corrupted compressed data.
class FormatError : public BlkstoreException {
public:
    explicit FormatError(std::string message)
        : BlkstoreException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(ErrorCode code, std::string message)
        : BlkstoreException(code, std::move(message)) {}
};

/// @brief Exception for checksum verification failures (exit code 4).
class ChecksumError : public BlkstoreException {
public:
    explicit ChecksumError(std::string message)
        : BlkstoreException(ErrorCode::kChecksumError, std::move(message)) {}

    /// @brief Format the canonical mismatch message.
    [[nodiscard]] static std::string formatChecksumMismatch(std::string_view expected,
                                                            std::string_view actual);
};

/// @brief Exception for unsupported codec errors (exit code 5).
class UnsupportedCodecError : public BlkstoreException {
public:
    explicit UnsupportedCodecError(std::string message)
        : BlkstoreException(ErrorCode::kUnsupportedCodec, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
/// @note Lightweight error type for use with std::expected.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct a wrong-container error with the codec sniffed from the data.
    Error(ErrorCode code, std::string message, std::optional<Codec> sniffedCodec)
        : code_(code), message_(std::move(message)), sniffedCodec_(sniffedCodec) {}

    /// @brief Construct from a BlkstoreException.
    explicit Error(const BlkstoreException& ex) : code_(ex.code()), message_(ex.message()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the exit code.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Codec whose magic header was found in the data, if any.
    /// @note Only meaningful for ErrorCode::kWrongContainer.
    [[nodiscard]] std::optional<Codec> sniffedCodec() const noexcept { return sniffedCodec_; }

    /// @brief Return a copy with @p context prefixed to the message.
    /// @note Code and codec hint are preserved.
    [[nodiscard]] Error wrap(std::string_view context) const;

    /// @brief "[category] message" rendering for logs and the CLI.
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the exception class matching code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<Codec> sniffedCodec_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
/// @tparam T The expected value type.
/// @param code The error code.
/// @param message The error message.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const BlkstoreException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws BlkstoreException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) {
    using ReturnType = decltype(func());
    using ValueType = std::conditional_t<std::is_void_v<ReturnType>, std::monostate, ReturnType>;
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return Result<ValueType>{std::monostate{}};
        } else {
            return Result<ValueType>{func()};
        }
    } catch (const BlkstoreException& ex) {
        return Result<ValueType>{std::unexpected(Error{ex})};
    } catch (const std::exception& ex) {
        return Result<ValueType>{std::unexpected(Error{ErrorCode::kIOError, ex.what()})};
    }
}

}  // namespace blkstore

#endif  // BLKSTORE_COMMON_ERROR_H
