// =============================================================================
// autoclaved-reader - HTTP Range Fetcher
// =============================================================================
// libcurl implementation of RangeFetcher.
//
// This module provides:
// - HttpRangeFetcher: Issues "Range: bytes=<first>-<last>" requests
//   against <base_url>/<archive file>
// - HttpRangeSource: Streaming body with consumer-driven backpressure
//
// Status policy: 206 is success; 200 only for ranges starting at byte 0;
// >= 400 is FetchError::kHttpStatus. Non-HTTP schemes (file://) report
// status 0 and are accepted.
//
// Usage:
//   HttpRangeFetcher fetcher(config.archiveBaseUrl, config.fetch);
//   auto body = fetcher.fetch("2017-01-01/a.lz4", {frameOff, frameSize});
// =============================================================================

#ifndef ACR_IO_HTTP_RANGE_FETCHER_H
#define ACR_IO_HTTP_RANGE_FETCHER_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "acr/common/config.h"
#include "acr/common/error.h"
#include "acr/io/byte_source.h"
#include "acr/io/range_fetcher.h"

namespace acr::io {

/// @brief Initialise libcurl once per process (thread-safe).
void ensureCurlInitialized();

/// @brief Check the response status of a range request.
/// @return The error to raise, or nullopt if the status is acceptable.
[[nodiscard]] std::optional<FetchError> checkRangeStatus(long status, const std::string& url,
                                                         const ByteRange& range);

// =============================================================================
// HttpRangeSource
// =============================================================================

/// @brief Streaming body of one range request.
/// @note The transfer only advances inside read(); at most
///       FetchOptions::maxBufferedBytes wait in memory before libcurl is
///       paused. Destroying the source aborts the transfer.
class HttpRangeSource final : public ByteSource {
public:
    /// @brief Start a range request.
    /// @throws ConfigError if options.maxBufferedBytes is zero.
    /// @throws FetchError if the transfer cannot be set up.
    HttpRangeSource(std::string url, ByteRange range, const FetchOptions& options);

    ~HttpRangeSource() override;

    /// @throws FetchError on transport failure, bad status, timeout,
    ///         over-delivery (kUnconsumedData) or a short body
    ///         (kLengthMismatch, raised at end of stream).
    [[nodiscard]] std::size_t read(std::span<std::uint8_t> out) override;

    [[nodiscard]] std::optional<std::uint64_t> declaredLength() const override {
        return declaredLength_;
    }

    [[nodiscard]] std::string displayName() const override { return url_; }

    /// @brief Body bytes received from the network so far.
    [[nodiscard]] std::uint64_t bytesReceived() const noexcept { return received_; }

private:
    struct Handles;

    static std::size_t writeCallback(char* ptr, std::size_t size, std::size_t nmemb,
                                     void* userdata);

    std::size_t onData(const char* data, std::size_t size);

    /// @brief Drive the transfer until bytes are buffered or it finished.
    void pump();

    /// @brief Raise the stored or libcurl error of a finished transfer.
    void raiseTransferError();

    std::string url_;
    ByteRange range_;
    FetchOptions options_;
    std::unique_ptr<Handles> handles_;

    std::vector<std::uint8_t> pending_;
    std::size_t pendingOffset_ = 0;

    std::uint64_t received_ = 0;
    std::optional<std::uint64_t> declaredLength_;
    bool statusChecked_ = false;
    bool paused_ = false;
    bool finished_ = false;
    int transferResult_ = 0;
    std::exception_ptr callbackError_;
};

// =============================================================================
// HttpRangeFetcher
// =============================================================================

/// @brief RangeFetcher over HTTP(S) (and file://) using libcurl.
class HttpRangeFetcher final : public RangeFetcher {
public:
    /// @throws ConfigError if options.maxBufferedBytes is zero.
    HttpRangeFetcher(std::string baseUrl, FetchOptions options);

    [[nodiscard]] const std::string& baseUrl() const noexcept { return baseUrl_; }

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

protected:
    [[nodiscard]] FetchedRange fetchRange(const std::string& archiveFile,
                                          const ByteRange& range) const override;

    [[nodiscard]] std::unique_ptr<ByteSource> openRange(const std::string& archiveFile,
                                                        const ByteRange& range) const override;

private:
    std::string baseUrl_;
    FetchOptions options_;
};

}  // namespace acr::io

#endif  // ACR_IO_HTTP_RANGE_FETCHER_H
