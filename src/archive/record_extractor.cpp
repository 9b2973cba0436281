// =============================================================================
// autoclaved-reader - Single Record Extractor Implementation
// =============================================================================

#include "acr/archive/record_extractor.h"

#include <fmt/format.h>

#include "acr/common/logger.h"
#include "acr/io/lz4_frame_stream.h"

namespace acr::archive {

namespace {

[[nodiscard]] ErrorContext recordContext(const RecordLocator& locator) {
    return ErrorContext(locator.archiveFile)
        .withOffset(locator.slice.intraOff)
        .withLength(locator.slice.intraSize);
}

}  // namespace

void validateRecord(std::span<const std::uint8_t> record, const RecordLocator& locator) {
    if (record.size() != locator.slice.intraSize) {
        throw DecodeError(DecodeErrorKind::kMalformedRecord,
                          fmt::format("record length is {} bytes, expected {}", record.size(),
                                      locator.slice.intraSize),
                          recordContext(locator));
    }
    if (record.empty()) {
        throw DecodeError(DecodeErrorKind::kMalformedRecord, "record is empty, expected '{...}'",
                          recordContext(locator));
    }
    if (record.front() != kRecordOpen) {
        throw DecodeError(DecodeErrorKind::kMalformedRecord,
                          fmt::format("record starts with byte 0x{:02x}, expected '{{'",
                                      record.front()),
                          recordContext(locator));
    }
    if (record.back() != kRecordClose) {
        throw DecodeError(DecodeErrorKind::kMalformedRecord,
                          fmt::format("record ends with byte 0x{:02x}, expected '}}'",
                                      record.back()),
                          recordContext(locator));
    }
}

RecordExtractor::RecordExtractor(const io::RangeFetcher& fetcher, std::size_t chunkSize)
    : fetcher_(&fetcher), chunkSize_(chunkSize) {}

std::vector<std::uint8_t> RecordExtractor::extract(const RecordLocator& locator) const {
    if (!locator.frame.isValid()) {
        throw UsageError(fmt::format("invalid frame span {}+{}", locator.frame.frameOff,
                                     locator.frame.frameSize),
                         ErrorContext(locator.archiveFile));
    }

    ACR_LOG_DEBUG("Extracting record from {} frame {}+{} slice {}+{}", locator.archiveFile,
                  locator.frame.frameOff, locator.frame.frameSize, locator.slice.intraOff,
                  locator.slice.intraSize);

    io::FetchedRange fetched =
        fetcher_->fetch(locator.archiveFile, io::ByteRange::fromSpan(locator.frame));
    std::vector<std::uint8_t> decoded = io::decompressFrames(fetched.bytes, chunkSize_);

    std::span<const std::uint8_t> all(decoded);
    std::span<const std::uint8_t> record;
    if (locator.slice.intraOff < all.size()) {
        const std::size_t offset = static_cast<std::size_t>(locator.slice.intraOff);
        const std::size_t available = all.size() - offset;
        const std::size_t length = locator.slice.intraSize < available
                                       ? static_cast<std::size_t>(locator.slice.intraSize)
                                       : available;
        record = all.subspan(offset, length);
    }

    validateRecord(record, locator);
    return std::vector<std::uint8_t>(record.begin(), record.end());
}

Result<std::vector<std::uint8_t>> RecordExtractor::tryExtract(const RecordLocator& locator) const {
    return tryExecute([&]() { return extract(locator); });
}

}  // namespace acr::archive
