// =============================================================================
// autoclaved-reader - Error Handling Framework Implementation
// =============================================================================

#include "acr/common/error.h"

#include <format>
#include <sstream>

namespace acr {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!archiveFile.empty()) {
        oss << "archive: " << archiveFile;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

    if (byteLength.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "length: " << *byteLength;
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
// ACRException Implementation
// =============================================================================

void ACRException::formatWhat(std::string_view detailName) {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_);
    if (!detailName.empty()) {
        oss << ": " << detailName;
    }
    oss << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// FetchError Implementation
// =============================================================================

std::string FetchError::formatLengthMismatch(std::uint64_t expected, std::uint64_t actual) {
    return std::format("fetched {} bytes, expected {}", actual, expected);
}

FetchError FetchError::fromHttpStatus(long status, ErrorContext context) {
    FetchError error(FetchErrorKind::kHttpStatus, std::format("HTTP status {}", status),
                     std::move(context));
    error.httpStatus_ = status;
    return error;
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kFetchError:
            throw FetchError(static_cast<FetchErrorKind>(detail_), message_);
        case ErrorCode::kDecodeError:
            throw DecodeError(static_cast<DecodeErrorKind>(detail_), message_);
        case ErrorCode::kIntegrityError:
            throw IntegrityError(static_cast<IntegrityErrorKind>(detail_), message_);
        case ErrorCode::kNotFound:
            throw NotFoundError(message_);
        case ErrorCode::kConfigError:
            throw ConfigError(message_);
        case ErrorCode::kCancelled:
            throw CancelledError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidState:
            break;
    }
    throw ACRException(code_, message_);
}

}  // namespace acr
