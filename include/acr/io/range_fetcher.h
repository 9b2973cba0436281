// =============================================================================
// autoclaved-reader - Range Fetcher
// =============================================================================
// Byte-range access to remote archive files.
//
// This module provides:
// - ByteRange: Inclusive-header byte range of an archive file
// - formatRangeHeader(): "bytes=<first>-<last>" value for a ByteRange
// - joinArchiveUrl(): Resolve an archive file name against a base URL
// - RangeFetcher: Abstract fetcher with a buffered and a streaming path
//
// The buffered path checks the body length against the requested
// length before returning. The streaming path hands back a ByteSource;
// the caller decides when it must be exhausted.
// =============================================================================

#ifndef ACR_IO_RANGE_FETCHER_H
#define ACR_IO_RANGE_FETCHER_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "acr/common/types.h"
#include "acr/io/byte_source.h"

namespace acr::io {

// =============================================================================
// ByteRange
// =============================================================================

/// @brief Byte range [offset, offset + length) of an archive file.
struct ByteRange {
    ByteOffset offset = 0;
    ByteCount length = 0;

    /// @brief Last byte of the range (inclusive, as sent in the Range header).
    [[nodiscard]] constexpr ByteOffset last() const noexcept { return offset + length - 1; }

    [[nodiscard]] static constexpr ByteRange fromSpan(const FrameSpan& span) noexcept {
        return ByteRange{span.frameOff, span.frameSize};
    }

    bool operator==(const ByteRange&) const = default;
};

/// @brief Format the Range header value for a range.
/// @throws UsageError if the range is empty.
[[nodiscard]] std::string formatRangeHeader(const ByteRange& range);

/// @brief Resolve an archive file name against a base URL.
/// @note Each path segment is percent-encoded; '/' separators are kept.
/// @throws UsageError for empty names, absolute paths or ".." segments.
[[nodiscard]] std::string joinArchiveUrl(std::string_view baseUrl, std::string_view archiveFile);

// =============================================================================
// FetchedRange
// =============================================================================

/// @brief Fully buffered body of a range request.
struct FetchedRange {
    /// @brief Body bytes.
    std::vector<std::uint8_t> bytes;

    /// @brief Length announced by the server (Content-Length), if any.
    std::optional<std::uint64_t> declaredLength;
};

// =============================================================================
// RangeFetcher
// =============================================================================

/// @brief Fetches byte ranges of archive files.
/// @note Implementations must be safe to call concurrently; every call is
///       an independent request.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    /// @brief Fetch and buffer a whole range.
    /// @throws FetchError (kLengthMismatch if the body length differs from
    ///         range.length, other kinds for transport failures).
    /// @throws UsageError if the range is empty.
    [[nodiscard]] FetchedRange fetch(const std::string& archiveFile, const ByteRange& range) const;

    /// @brief Open a range as an incrementally-readable source.
    /// @throws UsageError if the range is empty.
    [[nodiscard]] std::unique_ptr<ByteSource> open(const std::string& archiveFile,
                                                   const ByteRange& range) const;

protected:
    /// @brief Transport-specific buffered fetch; no length check needed.
    [[nodiscard]] virtual FetchedRange fetchRange(const std::string& archiveFile,
                                                  const ByteRange& range) const = 0;

    /// @brief Transport-specific streaming open.
    [[nodiscard]] virtual std::unique_ptr<ByteSource> openRange(const std::string& archiveFile,
                                                                const ByteRange& range) const = 0;
};

}  // namespace acr::io

#endif  // ACR_IO_RANGE_FETCHER_H
