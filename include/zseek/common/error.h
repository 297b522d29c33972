// =============================================================================
// zseek - Error Handling Framework
// =============================================================================
// Error handling for the zseek library.
//
// This module provides:
// - ErrorCode enum covering transport, index, decode and seek failures
// - ZseekException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (source name, frame, physical and logical offsets)
//
// Index errors (kTruncatedIndex, kCorruptIndex, kEmptyArchive) are fatal for
// reader construction. kDecodeError and kTransportError are fatal for a single
// read call only. kOutOfRange signals a broken frame index invariant.
// kInternalError covers standard exceptions such as std::bad_alloc.
// =============================================================================

#ifndef ZSEEK_COMMON_ERROR_H
#define ZSEEK_COMMON_ERROR_H

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
#include <variant>

namespace zseek {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error categories reported by the library.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Invalid argument or configuration value.
    kInvalidArgument = 1,

    /// @brief Remote fetch failed (network, auth, bounds, short response).
    kTransportError = 2,

    /// @brief Trailer shorter than the seek table it declares.
    kTruncatedIndex = 3,

    /// @brief Seek table failed validation (magic, reserved bits, contiguity).
    kCorruptIndex = 4,

    /// @brief Archive contains no frames and empty archives are not accepted.
    kEmptyArchive = 5,

    /// @brief A frame failed to decompress or verify.
    kDecodeError = 6,

    /// @brief Seek to a negative or overflowing position.
    kInvalidSeek = 7,

    /// @brief Logical offset outside of the frame index.
    kOutOfRange = 8,

    /// @brief Unexpected failure outside of zseek's own error hierarchy.
    kInternalError = 9
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kTransportError:
            return "transport error";
        case ErrorCode::kTruncatedIndex:
            return "truncated index";
        case ErrorCode::kCorruptIndex:
            return "corrupt index";
        case ErrorCode::kEmptyArchive:
            return "empty archive";
        case ErrorCode::kDecodeError:
            return "decode error";
        case ErrorCode::kInvalidSeek:
            return "invalid seek";
        case ErrorCode::kOutOfRange:
            return "out of range";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an index error.
/// @note Index errors are fatal for reader construction and never retried.
[[nodiscard]] constexpr bool isIndexError(ErrorCode code) noexcept {
    return code == ErrorCode::kTruncatedIndex || code == ErrorCode::kCorruptIndex ||
           code == ErrorCode::kEmptyArchive;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Name of the range source (object key, file path).
    std::string sourceName;

    /// @brief Frame where the error occurred (if applicable).
    std::optional<std::uint32_t> frameId;

    /// @brief Physical (compressed) byte offset (if applicable).
    std::optional<std::uint64_t> physicalOffset;

    /// @brief Logical (decompressed) byte offset (if applicable).
    std::optional<std::uint64_t> logicalOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with source name.
    explicit ErrorContext(std::string name,
                          std::source_location loc = std::source_location::current())
        : sourceName(std::move(name)), location(loc) {}

    ErrorContext& withSource(std::string name) {
        sourceName = std::move(name);
        return *this;
    }

    ErrorContext& withFrame(std::uint32_t id) {
        frameId = id;
        return *this;
    }

    ErrorContext& withPhysicalOffset(std::uint64_t offset) {
        physicalOffset = offset;
        return *this;
    }

    ErrorContext& withLogicalOffset(std::uint64_t offset) {
        logicalOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all zseek errors.
/// @note Provides error code, message, and optional context.
class ZseekException : public std::exception {
public:
    ZseekException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    ZseekException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ZseekException() override = default;

    ZseekException(const ZseekException&) = default;
    ZseekException(ZseekException&&) noexcept = default;
    ZseekException& operator=(const ZseekException&) = default;
    ZseekException& operator=(ZseekException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

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

/// @brief Invalid argument or configuration value.
class InvalidArgumentError : public ZseekException {
public:
    explicit InvalidArgumentError(std::string message)
        : ZseekException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Remote fetch failure.
/// @note Not retried by the library. Fetches are idempotent, so callers may
///       retry the whole operation.
class TransportError : public ZseekException {
public:
    explicit TransportError(std::string message)
        : ZseekException(ErrorCode::kTransportError, std::move(message)) {}

    TransportError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kTransportError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code with context.
    TransportError(std::string message, std::error_code ec, ErrorContext context)
        : ZseekException(ErrorCode::kTransportError, formatWithSystemError(message, ec),
                         std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Seek table declares more bytes than the object holds.
class TruncatedIndexError : public ZseekException {
public:
    explicit TruncatedIndexError(std::string message)
        : ZseekException(ErrorCode::kTruncatedIndex, std::move(message)) {}

    TruncatedIndexError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kTruncatedIndex, std::move(message), std::move(context)) {}
};

/// @brief Seek table failed validation.
class CorruptIndexError : public ZseekException {
public:
    explicit CorruptIndexError(std::string message)
        : ZseekException(ErrorCode::kCorruptIndex, std::move(message)) {}

    CorruptIndexError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kCorruptIndex, std::move(message), std::move(context)) {}
};

/// @brief Archive holds zero frames while empty archives are rejected.
class EmptyArchiveError : public ZseekException {
public:
    explicit EmptyArchiveError(std::string message)
        : ZseekException(ErrorCode::kEmptyArchive, std::move(message)) {}

    EmptyArchiveError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kEmptyArchive, std::move(message), std::move(context)) {}
};

/// @brief A frame failed to decompress, or its output failed verification.
class DecodeError : public ZseekException {
public:
    explicit DecodeError(std::string message)
        : ZseekException(ErrorCode::kDecodeError, std::move(message)) {}

    DecodeError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kDecodeError, std::move(message), std::move(context)) {}

    /// @brief Construct from a frame checksum mismatch.
    /// @param expected Checksum stored in the seek table.
    /// @param actual Checksum of the decoded payload.
    /// @param context Additional error context.
    DecodeError(std::uint32_t expected, std::uint32_t actual, ErrorContext context)
        : ZseekException(ErrorCode::kDecodeError, formatChecksumMismatch(expected, actual),
                         std::move(context)),
          expectedChecksum_(expected),
          actualChecksum_(actual) {}

    [[nodiscard]] std::optional<std::uint32_t> expectedChecksum() const noexcept {
        return expectedChecksum_;
    }

    [[nodiscard]] std::optional<std::uint32_t> actualChecksum() const noexcept {
        return actualChecksum_;
    }

private:
    static std::string formatChecksumMismatch(std::uint32_t expected, std::uint32_t actual);

    std::optional<std::uint32_t> expectedChecksum_;
    std::optional<std::uint32_t> actualChecksum_;
};

/// @brief Seek resolved to a negative or overflowing position.
class InvalidSeekError : public ZseekException {
public:
    explicit InvalidSeekError(std::string message)
        : ZseekException(ErrorCode::kInvalidSeek, std::move(message)) {}

    InvalidSeekError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kInvalidSeek, std::move(message), std::move(context)) {}
};

/// @brief Logical offset not covered by the frame index.
/// @note Treated as a defect, never as a recoverable condition.
class OutOfRangeError : public ZseekException {
public:
    explicit OutOfRangeError(std::string message)
        : ZseekException(ErrorCode::kOutOfRange, std::move(message)) {}

    OutOfRangeError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kOutOfRange, std::move(message), std::move(context)) {}
};

/// @brief Unexpected internal failure.
class InternalError : public ZseekException {
public:
    explicit InternalError(std::string message)
        : ZseekException(ErrorCode::kInternalError, std::move(message)) {}

    InternalError(std::string message, ErrorContext context)
        : ZseekException(ErrorCode::kInternalError, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a ZseekException.
    explicit Error(const ZseekException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(const ZseekException& ex) {
    return std::unexpected(Error{ex});
}

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

/// @brief Return the value of a Result or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note Only library exceptions and std::exception are converted; anything
///       else propagates.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const ZseekException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInternalError, ex.what()});
    }
}

}  // namespace zseek

#endif  // ZSEEK_COMMON_ERROR_H
