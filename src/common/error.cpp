// =============================================================================
// zstd-pbf - Error Handling Framework Implementation
// =============================================================================

#include "zpbf/common/error.h"

#include <format>
#include <sstream>

namespace zpbf {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (frameIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "frame: " << *frameIndex;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// ZpbfException Implementation
// =============================================================================

void ZpbfException::formatWhat() {
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

void ZpbfException::attachContext(ErrorContext context) {
    if (context_.has_value()) {
        return;
    }
    context_ = std::move(context);
    formatWhat();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kUnsupportedCodec:
            throw UnsupportedError(message_);
        case ErrorCode::kCodecError:
            throw CodecError(message_);
        case ErrorCode::kSuccess:
            throw ZpbfException(ErrorCode::kSuccess, message_);
    }
    throw ZpbfException(code_, message_);
}

}  // namespace zpbf
