// =============================================================================
// docsan - Error Handling Framework Implementation
// =============================================================================

#include "docsan/common/error.h"

#include <format>
#include <sstream>

namespace docsan {

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

    if (entryIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "entry: " << *entryIndex;
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
// DocsanException Implementation
// =============================================================================

void DocsanException::formatWhat() {
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

// =============================================================================
// Specific Exception Formatting
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string MappingFileError::formatChecksumMismatch(std::uint64_t expected,
                                                     std::uint64_t actual) {
    return std::format("mapping checksum mismatch: expected 0x{:016x}, got 0x{:016x}",
                       expected, actual);
}

std::string PlaceholderCollisionError::formatCollision(std::uint64_t offset,
                                                       const std::string& text) {
    return std::format(
        "source text already contains placeholder delimiters at offset {}: \"{}\"", offset,
        text);
}

// =============================================================================
// Error Implementation
// =============================================================================

DocsanException Error::toException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            return UsageError(code_, message_);
        case ErrorCode::kIOError:
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
            return IOError(code_, message_);
        case ErrorCode::kMappingFileError:
            return MappingFileError(message_);
        case ErrorCode::kPlaceholderCollision:
            return PlaceholderCollisionError(message_);
        case ErrorCode::kDetectorUnavailable:
            return DetectorUnavailableError(message_);
        case ErrorCode::kLeakDetected:
            return LeakDetectedError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
            break;
    }
    return DocsanException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(code_, message_);
        case ErrorCode::kIOError:
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
            throw IOError(code_, message_);
        case ErrorCode::kMappingFileError:
            throw MappingFileError(message_);
        case ErrorCode::kPlaceholderCollision:
            throw PlaceholderCollisionError(message_);
        case ErrorCode::kDetectorUnavailable:
            throw DetectorUnavailableError(message_);
        case ErrorCode::kLeakDetected:
            throw LeakDetectedError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
            break;
    }
    throw DocsanException(code_, message_);
}

}  // namespace docsan
