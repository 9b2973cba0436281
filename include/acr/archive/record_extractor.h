// =============================================================================
// autoclaved-reader - Single Record Extractor
// =============================================================================
// Non-streaming path: recover one record body from its byte coordinates.
//
// The frame span is fetched in one buffered range request, decoded in
// memory and sliced. The slice must hold exactly intraSize bytes,
// start with '{' and end with '}'. Record bytes are returned untouched.
// =============================================================================

#ifndef ACR_ARCHIVE_RECORD_EXTRACTOR_H
#define ACR_ARCHIVE_RECORD_EXTRACTOR_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "acr/common/error.h"
#include "acr/common/types.h"
#include "acr/io/range_fetcher.h"

namespace acr::archive {

/// @brief Check a sliced record against its expected size and braces.
/// @throws DecodeError kMalformedRecord naming the failed check with the
///         observed and expected values.
void validateRecord(std::span<const std::uint8_t> record, const RecordLocator& locator);

/// @brief Extracts single records from archive files.
/// @note Stateless apart from the fetcher reference; safe to share
///       between threads if the fetcher is.
class RecordExtractor {
public:
    /// @param fetcher Range fetcher; must outlive the extractor.
    /// @param chunkSize Decompression chunk size.
    explicit RecordExtractor(const io::RangeFetcher& fetcher,
                             std::size_t chunkSize = kDefaultChunkSize);

    /// @brief Fetch, decode and slice one record.
    /// @throws UsageError for an empty frame span.
    /// @throws FetchError, DecodeError.
    [[nodiscard]] std::vector<std::uint8_t> extract(const RecordLocator& locator) const;

    /// @brief extract() with errors returned as a Result.
    [[nodiscard]] Result<std::vector<std::uint8_t>> tryExtract(const RecordLocator& locator) const;

    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

private:
    const io::RangeFetcher* fetcher_;
    std::size_t chunkSize_;
};

}  // namespace acr::archive

#endif  // ACR_ARCHIVE_RECORD_EXTRACTOR_H
