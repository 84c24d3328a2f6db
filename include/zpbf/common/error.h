// =============================================================================
// zstd-pbf - Error Handling Framework
// =============================================================================
// Error handling for the zstd-pbf library and command-line tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - ZpbfException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (file, frame, offset) for diagnostics
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (open, read, write, rename failure)
// - 3: Format error (malformed or truncated PBF framing)
// - 4: Unsupported blob compression variant
// - 5: Codec failure (zlib/zstd context or encoder error)
// =============================================================================

#ifndef ZPBF_COMMON_ERROR_H
#define ZPBF_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace zpbf {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    /// @note Conflicting presets, missing positionals, existing output file.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Open, read, write or rename failure on an OS file.
    kIOError = 2,

    /// @brief Format error.
    /// @note Oversize, truncated or undecodable header or blob.
    kFormatError = 3,

    /// @brief Unsupported blob compression variant.
    kUnsupportedCodec = 4,

    /// @brief Underlying compressor or decompressor failure.
    kCodecError = 5
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
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
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
        case ErrorCode::kCodecError:
            return "codec error";
    }
    return "unknown error";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Identifies the file and, while transcoding, the frame being processed.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Zero-based index of the frame being processed (if applicable).
    std::optional<std::uint64_t> frameIndex;

    /// @brief Byte offset of the frame start in the input (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the frame index.
    ErrorContext& withFrame(std::uint64_t index) {
        frameIndex = index;
        return *this;
    }

    /// @brief Set the byte offset.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all zstd-pbf errors.
/// @note Provides error code, message, and optional context.
class ZpbfException : public std::exception {
public:
    /// @brief Construct with error code and message.
    ZpbfException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    ZpbfException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ZpbfException() override = default;

    ZpbfException(const ZpbfException&) = default;
    ZpbfException(ZpbfException&&) noexcept = default;
    ZpbfException& operator=(const ZpbfException&) = default;
    ZpbfException& operator=(ZpbfException&&) noexcept = default;

    /// @brief Get the formatted error message including context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Attach context to an exception raised without one.
    /// @note Existing context is kept; the caller closest to the fault wins.
    void attachContext(ErrorContext context);

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public ZpbfException {
public:
    explicit UsageError(std::string message)
        : ZpbfException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : ZpbfException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for open, read, write and rename failures.
class IOError : public ZpbfException {
public:
    /// @brief Construct with message.
    explicit IOError(std::string message)
        : ZpbfException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with message and context.
    IOError(std::string message, ErrorContext context)
        : ZpbfException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : ZpbfException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                        std::move(context)) {}

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

/// @brief Exception for container format errors (exit code 3).
/// @note Thrown for oversize or truncated frames, undecodable headers or blobs,
///       and decompressed size mismatches.
class FormatError : public ZpbfException {
public:
    explicit FormatError(std::string message)
        : ZpbfException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : ZpbfException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for unsupported blob variants (exit code 4).
/// @note Thrown when a blob is stored with a codec that cannot be a source.
class UnsupportedError : public ZpbfException {
public:
    explicit UnsupportedError(std::string message)
        : ZpbfException(ErrorCode::kUnsupportedCodec, std::move(message)) {}

    UnsupportedError(std::string message, ErrorContext context)
        : ZpbfException(ErrorCode::kUnsupportedCodec, std::move(message), std::move(context)) {}
};

/// @brief Exception for codec failures (exit code 5).
class CodecError : public ZpbfException {
public:
    explicit CodecError(std::string message)
        : ZpbfException(ErrorCode::kCodecError, std::move(message)) {}

    CodecError(std::string message, ErrorContext context)
        : ZpbfException(ErrorCode::kCodecError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception class matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

}  // namespace zpbf

#endif  // ZPBF_COMMON_ERROR_H
