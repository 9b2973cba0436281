// =============================================================================
// autoclaved-reader - Error Handling Framework
// =============================================================================
// Error taxonomy for fetching, decoding and reconstructing archive records.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - ACRException hierarchy for structured error handling
// - Per-family kind enums (FetchErrorKind, DecodeErrorKind, IntegrityErrorKind)
// - Result<T, E> type for functional error handling (using std::expected)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: Fetch error (transport, HTTP status, length, timeout)
// - 3: Decode error (LZ4 frame corruption, malformed record)
// - 4: Integrity error (streamed report boundaries or size)
// - 5: Not found (the index has no such record or report)
// - 6: Configuration error
// - 7: Cancelled (consumer went away)
// - 8: Invalid state
// =============================================================================

#ifndef ACR_COMMON_ERROR_H
#define ACR_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace acr {

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

    /// @brief Range request failed or delivered unexpected bytes.
    kFetchError = 2,

    /// @brief LZ4 frame corruption or malformed single record.
    kDecodeError = 3,

    /// @brief Streamed report violated a boundary or size invariant.
    kIntegrityError = 4,

    /// @brief The locator resolver returned nothing.
    kNotFound = 5,

    /// @brief Invalid configuration value.
    kConfigError = 6,

    /// @brief Operation was cancelled by its consumer.
    kCancelled = 7,

    /// @brief Invalid state for operation.
    kInvalidState = 8
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
        case ErrorCode::kFetchError:
            return "fetch error";
        case ErrorCode::kDecodeError:
            return "decode error";
        case ErrorCode::kIntegrityError:
            return "integrity error";
        case ErrorCode::kNotFound:
            return "not found";
        case ErrorCode::kConfigError:
            return "configuration error";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

// =============================================================================
// Error Kinds
// =============================================================================

/// @brief Distinguishes the causes of a FetchError.
enum class FetchErrorKind : std::uint8_t {
    kTransport = 0,        ///< Connection, DNS, TLS or other transport failure
    kHttpStatus = 1,       ///< Non-success HTTP status
    kRangeNotHonored = 2,  ///< Server answered 200 to a range starting past byte 0
    kLengthMismatch = 3,   ///< Body length differs from the requested range
    kUnconsumedData = 4,   ///< Server delivered bytes beyond the requested range
    kTimeout = 5           ///< Request exceeded the configured timeout
};

/// @brief Distinguishes the causes of a DecodeError.
enum class DecodeErrorKind : std::uint8_t {
    kCorruptFrame = 0,    ///< Bad frame header, block or checksum
    kTruncatedFrame = 1,  ///< Input ended inside a frame
    kMalformedRecord = 2  ///< Sliced record failed a boundary check
};

/// @brief Distinguishes the causes of an IntegrityError.
enum class IntegrityErrorKind : std::uint8_t {
    kBadStart = 0,      ///< First emitted byte is not '{'
    kBadEnd = 1,        ///< Completing chunk does not end with '\n'
    kTrailingData = 2,  ///< Compressed bytes left after the report completed
    kSizeMismatch = 3   ///< Emitted byte count cannot reach the report size
};

[[nodiscard]] constexpr std::string_view fetchErrorKindToString(FetchErrorKind kind) noexcept {
    switch (kind) {
        case FetchErrorKind::kTransport:
            return "transport";
        case FetchErrorKind::kHttpStatus:
            return "http status";
        case FetchErrorKind::kRangeNotHonored:
            return "range not honored";
        case FetchErrorKind::kLengthMismatch:
            return "length mismatch";
        case FetchErrorKind::kUnconsumedData:
            return "unconsumed data";
        case FetchErrorKind::kTimeout:
            return "timeout";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view decodeErrorKindToString(DecodeErrorKind kind) noexcept {
    switch (kind) {
        case DecodeErrorKind::kCorruptFrame:
            return "corrupt frame";
        case DecodeErrorKind::kTruncatedFrame:
            return "truncated frame";
        case DecodeErrorKind::kMalformedRecord:
            return "malformed record";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view integrityErrorKindToString(
    IntegrityErrorKind kind) noexcept {
    switch (kind) {
        case IntegrityErrorKind::kBadStart:
            return "bad start";
        case IntegrityErrorKind::kBadEnd:
            return "bad end";
        case IntegrityErrorKind::kTrailingData:
            return "trailing data";
        case IntegrityErrorKind::kSizeMismatch:
            return "size mismatch";
    }
    return "unknown";
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Archive file associated with the error (if applicable).
    std::string archiveFile;

    /// @brief Byte offset where the error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Length of the byte range involved (if applicable).
    std::optional<std::uint64_t> byteLength;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with archive file.
    explicit ErrorContext(std::string archive,
                          std::source_location loc = std::source_location::current())
        : archiveFile(std::move(archive)), location(loc) {}

    ErrorContext& withArchive(std::string archive) {
        archiveFile = std::move(archive);
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    ErrorContext& withLength(std::uint64_t length) {
        byteLength = length;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all autoclaved-reader errors.
/// @note Carries an error code, a family-specific kind (detail) and an
///       optional context.
class ACRException : public std::exception {
public:
    ACRException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat({});
    }

    ACRException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat({});
    }

    ~ACRException() override = default;

    ACRException(const ACRException&) = default;
    ACRException(ACRException&&) noexcept = default;
    ACRException& operator=(const ACRException&) = default;
    ACRException& operator=(ACRException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Family-specific kind as a raw value (0 for families without kinds).
    [[nodiscard]] std::uint8_t detail() const noexcept { return detail_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Construct a family exception with a kind.
    ACRException(ErrorCode code, std::uint8_t detail, std::string_view detailName,
                 std::string message, std::optional<ErrorContext> context)
        : code_(code), detail_(detail), message_(std::move(message)), context_(std::move(context)) {
        formatWhat(detailName);
    }

    /// @brief Format the what() string from code, kind, message and context.
    void formatWhat(std::string_view detailName);

    ErrorCode code_;
    std::uint8_t detail_ = 0;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public ACRException {
public:
    explicit UsageError(std::string message)
        : ACRException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : ACRException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for range request failures (exit code 2).
class FetchError : public ACRException {
public:
    FetchError(FetchErrorKind kind, std::string message)
        : ACRException(ErrorCode::kFetchError, static_cast<std::uint8_t>(kind),
                       fetchErrorKindToString(kind), std::move(message), std::nullopt) {}

    FetchError(FetchErrorKind kind, std::string message, ErrorContext context)
        : ACRException(ErrorCode::kFetchError, static_cast<std::uint8_t>(kind),
                       fetchErrorKindToString(kind), std::move(message), std::move(context)) {}

    /// @brief Body length differs from the requested range length.
    FetchError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : ACRException(ErrorCode::kFetchError,
                       static_cast<std::uint8_t>(FetchErrorKind::kLengthMismatch),
                       fetchErrorKindToString(FetchErrorKind::kLengthMismatch),
                       formatLengthMismatch(expected, actual), std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] FetchErrorKind kind() const noexcept {
        return static_cast<FetchErrorKind>(detail_);
    }

    /// @brief HTTP status, when the failure was a status code.
    [[nodiscard]] std::optional<long> httpStatus() const noexcept { return httpStatus_; }

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

    /// @brief Create an error for a non-success HTTP status.
    [[nodiscard]] static FetchError fromHttpStatus(long status, ErrorContext context);

private:
    static std::string formatLengthMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<long> httpStatus_;
    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief Exception for LZ4 and record decoding failures (exit code 3).
class DecodeError : public ACRException {
public:
    DecodeError(DecodeErrorKind kind, std::string message)
        : ACRException(ErrorCode::kDecodeError, static_cast<std::uint8_t>(kind),
                       decodeErrorKindToString(kind), std::move(message), std::nullopt) {}

    DecodeError(DecodeErrorKind kind, std::string message, ErrorContext context)
        : ACRException(ErrorCode::kDecodeError, static_cast<std::uint8_t>(kind),
                       decodeErrorKindToString(kind), std::move(message), std::move(context)) {}

    [[nodiscard]] DecodeErrorKind kind() const noexcept {
        return static_cast<DecodeErrorKind>(detail_);
    }
};

/// @brief Exception for streamed report invariant violations (exit code 4).
class IntegrityError : public ACRException {
public:
    IntegrityError(IntegrityErrorKind kind, std::string message)
        : ACRException(ErrorCode::kIntegrityError, static_cast<std::uint8_t>(kind),
                       integrityErrorKindToString(kind), std::move(message), std::nullopt) {}

    IntegrityError(IntegrityErrorKind kind, std::string message, ErrorContext context)
        : ACRException(ErrorCode::kIntegrityError, static_cast<std::uint8_t>(kind),
                       integrityErrorKindToString(kind), std::move(message), std::move(context)) {}

    [[nodiscard]] IntegrityErrorKind kind() const noexcept {
        return static_cast<IntegrityErrorKind>(detail_);
    }
};

/// @brief Exception for identifiers the index does not know (exit code 5).
class NotFoundError : public ACRException {
public:
    explicit NotFoundError(std::string message)
        : ACRException(ErrorCode::kNotFound, std::move(message)) {}
};

/// @brief Exception for invalid configuration (exit code 6).
class ConfigError : public ACRException {
public:
    explicit ConfigError(std::string message)
        : ACRException(ErrorCode::kConfigError, std::move(message)) {}
};

/// @brief Exception for operations abandoned by their consumer (exit code 7).
class CancelledError : public ACRException {
public:
    explicit CancelledError(std::string message)
        : ACRException(ErrorCode::kCancelled, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode, kind and message.
class Error {
public:
    Error(ErrorCode code, std::string message, std::uint8_t detail = 0)
        : code_(code), detail_(detail), message_(std::move(message)) {}

    /// @brief Construct from an ACRException, keeping its kind.
    explicit Error(const ACRException& ex)
        : code_(ex.code()), detail_(ex.detail()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::uint8_t detail() const noexcept { return detail_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the code and kind.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::uint8_t detail_ = 0;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(const ACRException& ex) {
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

/// @brief Return the value or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if the result holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const ACRException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInvalidState, ex.what()});
    }
}

}  // namespace acr

#endif  // ACR_COMMON_ERROR_H
