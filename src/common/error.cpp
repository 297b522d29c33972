// =============================================================================
// zseek - Error Handling Framework Implementation
// =============================================================================

#include "zseek/common/error.h"

#include <fmt/format.h>
#include <sstream>

namespace zseek {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!sourceName.empty()) {
        oss << "source: " << sourceName;
        hasContent = true;
    }

    if (frameId.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "frame: " << *frameId;
        hasContent = true;
    }

    if (physicalOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "physical offset: 0x" << std::hex << *physicalOffset << std::dec;
        hasContent = true;
    }

    if (logicalOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "logical offset: " << *logicalOffset;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// ZseekException Implementation
// =============================================================================

void ZseekException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string TransportError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string DecodeError::formatChecksumMismatch(std::uint32_t expected, std::uint32_t actual) {
    return fmt::format("frame checksum mismatch: expected 0x{:08x}, got 0x{:08x}", expected,
                       actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kTransportError:
            throw TransportError(message_);
        case ErrorCode::kTruncatedIndex:
            throw TruncatedIndexError(message_);
        case ErrorCode::kCorruptIndex:
            throw CorruptIndexError(message_);
        case ErrorCode::kEmptyArchive:
            throw EmptyArchiveError(message_);
        case ErrorCode::kDecodeError:
            throw DecodeError(message_);
        case ErrorCode::kInvalidSeek:
            throw InvalidSeekError(message_);
        case ErrorCode::kOutOfRange:
            throw OutOfRangeError(message_);
        case ErrorCode::kInternalError:
            throw InternalError(message_);
        case ErrorCode::kSuccess:
            throw ZseekException(ErrorCode::kSuccess, message_);
    }
    throw ZseekException(code_, message_);
}

}  // namespace zseek
