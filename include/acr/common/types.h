// =============================================================================
// autoclaved-reader - Common Type Definitions
// =============================================================================
// Core type definitions for locating records inside autoclaved archives.
//
// This module defines:
// - FrameSpan: Byte range of one or more concatenated LZ4 frames
// - ByteSlice: Offset/length of a record in the decompressed frame bytes
// - RecordLocator: Everything needed to recover one record body
// - ReportPlan: Contiguous window and sizes for a multi-record report
// - ReconstructionState: Lifecycle of a streamed report
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef ACR_COMMON_TYPES_H
#define ACR_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace acr {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Absolute byte offset inside an archive file or decompressed stream.
using ByteOffset = std::uint64_t;

/// @brief Byte count (sizes and lengths).
using ByteCount = std::uint64_t;

/// @brief Numeric measurement identifier used by the index.
using MeasurementNo = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief First byte of every record body.
inline constexpr std::uint8_t kRecordOpen = '{';

/// @brief Last byte of every record body.
inline constexpr std::uint8_t kRecordClose = '}';

/// @brief Separator that follows each record inside a report.
inline constexpr std::uint8_t kRecordSeparator = '\n';

/// @brief Default size of one decompressed output chunk.
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;  // 64KB

/// @brief Smallest chunk size accepted by the configuration.
inline constexpr std::size_t kMinChunkSize = 1024;  // 1KB

/// @brief Default cap on network bytes buffered ahead of the consumer.
inline constexpr std::size_t kDefaultMaxBufferedBytes = 256 * 1024;  // 256KB

/// @brief Default connection timeout for range requests.
inline constexpr long kDefaultConnectTimeoutMs = 10'000;

/// @brief Default total timeout for one range request.
inline constexpr long kDefaultTimeoutMs = 120'000;

/// @brief Default location of the public autoclaved archive files.
inline constexpr std::string_view kDefaultArchiveBaseUrl =
    "http://datacollector.infra.ooni.io/ooni-public/autoclaved/";

/// @brief Prefix of public measurement identifiers ("temp-id-<n>").
inline constexpr std::string_view kMeasurementIdPrefix = "temp-id-";

// =============================================================================
// FrameSpan
// =============================================================================

/// @brief Exact byte range of one or more concatenated LZ4 frames.
/// @note Delivered by a single Range request; frameSize must be > 0.
struct FrameSpan {
    /// @brief Offset of the first frame byte inside the archive file.
    ByteOffset frameOff = 0;

    /// @brief Number of compressed bytes covered by the span.
    ByteCount frameSize = 0;

    /// @brief One past the last byte of the span.
    [[nodiscard]] constexpr ByteOffset end() const noexcept { return frameOff + frameSize; }

    /// @brief Check the span is non-empty and does not overflow.
    [[nodiscard]] constexpr bool isValid() const noexcept {
        return frameSize > 0 && frameOff + frameSize > frameOff;
    }

    bool operator==(const FrameSpan&) const = default;
};

// =============================================================================
// ByteSlice
// =============================================================================

/// @brief Offset and length of one record inside a decompressed FrameSpan.
struct ByteSlice {
    ByteOffset intraOff = 0;
    ByteCount intraSize = 0;

    [[nodiscard]] constexpr ByteOffset end() const noexcept { return intraOff + intraSize; }

    bool operator==(const ByteSlice&) const = default;
};

// =============================================================================
// RecordLocator
// =============================================================================

/// @brief Byte coordinates of a single record body.
struct RecordLocator {
    /// @brief Archive file path, relative to the configured base URL.
    std::string archiveFile;

    /// @brief Compressed frame(s) holding the record.
    FrameSpan frame;

    /// @brief Record position inside the decompressed frame bytes.
    ByteSlice slice;

    bool operator==(const RecordLocator&) const = default;
};

/// @brief Canonical reconstruction order: (frameOff, intraOff) ascending.
[[nodiscard]] constexpr bool locatorOrderLess(const RecordLocator& a,
                                              const RecordLocator& b) noexcept {
    if (a.frame.frameOff != b.frame.frameOff) {
        return a.frame.frameOff < b.frame.frameOff;
    }
    return a.slice.intraOff < b.slice.intraOff;
}

// =============================================================================
// ReportPlan
// =============================================================================

/// @brief Everything the streaming reconstructor needs for one report.
struct ReportPlan {
    /// @brief Archive file holding every record of the report.
    std::string archiveFile;

    /// @brief Single contiguous window covering all frames of the report.
    FrameSpan window;

    /// @brief Decompressed bytes to drop before the first record.
    ByteOffset leadingTrim = 0;

    /// @brief Sum of (intraSize + 1) over all member records.
    ByteCount reportSize = 0;

    bool operator==(const ReportPlan&) const = default;
};

// =============================================================================
// Reconstruction State
// =============================================================================

/// @brief Lifecycle of a streamed report reconstruction.
enum class ReconstructionState : std::uint8_t {
    kInit = 0,       ///< No byte fetched yet
    kStreaming = 1,  ///< Chunks are being produced
    kComplete = 2,   ///< All boundary and size checks passed
    kFailed = 3,     ///< A fetch, decode or integrity check failed
    kCancelled = 4   ///< The consumer went away before completion
};

/// @brief Convert ReconstructionState to string.
[[nodiscard]] constexpr std::string_view reconstructionStateToString(
    ReconstructionState state) noexcept {
    switch (state) {
        case ReconstructionState::kInit:
            return "init";
        case ReconstructionState::kStreaming:
            return "streaming";
        case ReconstructionState::kComplete:
            return "complete";
        case ReconstructionState::kFailed:
            return "failed";
        case ReconstructionState::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

}  // namespace acr

#endif  // ACR_COMMON_TYPES_H
