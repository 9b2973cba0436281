// =============================================================================
// autoclaved-reader - Range Fetcher Implementation
// =============================================================================

#include "acr/io/range_fetcher.h"

#include <fmt/format.h>

#include "acr/common/error.h"

namespace acr::io {

namespace {

[[nodiscard]] bool isUnreserved(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

void appendEncodedSegment(std::string& out, std::string_view segment) {
    constexpr char kHex[] = "0123456789ABCDEF";
    for (unsigned char c : segment) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
}

void requireNonEmpty(const std::string& archiveFile, const ByteRange& range) {
    if (range.length == 0) {
        throw UsageError("cannot fetch an empty byte range",
                         ErrorContext(archiveFile).withOffset(range.offset));
    }
}

}  // namespace

std::string formatRangeHeader(const ByteRange& range) {
    if (range.length == 0) {
        throw UsageError(fmt::format("empty byte range at offset {}", range.offset));
    }
    return fmt::format("bytes={}-{}", range.offset, range.last());
}

std::string joinArchiveUrl(std::string_view baseUrl, std::string_view archiveFile) {
    if (archiveFile.empty()) {
        throw UsageError("archive file name is empty");
    }
    if (archiveFile.front() == '/') {
        throw UsageError(fmt::format("archive file name must be relative: '{}'", archiveFile));
    }

    std::string url(baseUrl);
    if (url.empty() || url.back() != '/') {
        url.push_back('/');
    }

    std::size_t start = 0;
    while (start <= archiveFile.size()) {
        std::size_t end = archiveFile.find('/', start);
        if (end == std::string_view::npos) {
            end = archiveFile.size();
        }
        std::string_view segment = archiveFile.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw UsageError(
                fmt::format("invalid path segment '{}' in archive file '{}'", segment, archiveFile));
        }
        if (start > 0) {
            url.push_back('/');
        }
        appendEncodedSegment(url, segment);
        start = end + 1;
    }
    return url;
}

// =============================================================================
// RangeFetcher Implementation
// =============================================================================

FetchedRange RangeFetcher::fetch(const std::string& archiveFile, const ByteRange& range) const {
    requireNonEmpty(archiveFile, range);

    FetchedRange fetched = fetchRange(archiveFile, range);

    auto context = [&]() {
        return ErrorContext(archiveFile).withOffset(range.offset).withLength(range.length);
    };
    if (fetched.bytes.size() != range.length) {
        throw FetchError(range.length, fetched.bytes.size(), context());
    }
    if (fetched.declaredLength.has_value() && *fetched.declaredLength != range.length) {
        throw FetchError(range.length, *fetched.declaredLength, context());
    }
    return fetched;
}

std::unique_ptr<ByteSource> RangeFetcher::open(const std::string& archiveFile,
                                               const ByteRange& range) const {
    requireNonEmpty(archiveFile, range);
    return openRange(archiveFile, range);
}

}  // namespace acr::io
