// =============================================================================
// autoclaved-reader - HTTP Range Fetcher Implementation
// =============================================================================
// The buffered path runs one easy transfer to completion. The streaming
// path attaches the easy handle to a private multi handle and advances
// it from read(), so network progress follows the consumer.
// =============================================================================

#include "acr/io/http_range_fetcher.h"

#include <curl/curl.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <mutex>

#include "acr/common/error.h"
#include "acr/common/logger.h"

namespace acr::io {

namespace {

// =============================================================================
// libcurl Handle Ownership
// =============================================================================

struct EasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct MultiDeleter {
    void operator()(CURLM* handle) const noexcept { curl_multi_cleanup(handle); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using MultiHandle = std::unique_ptr<CURLM, MultiDeleter>;

/// @brief Upper bound on one wait for socket activity.
constexpr int kPollTimeoutMs = 100;

[[nodiscard]] ErrorContext rangeContext(const std::string& url, const ByteRange& range) {
    return ErrorContext(url).withOffset(range.offset).withLength(range.length);
}

[[nodiscard]] FetchError curlError(CURLcode code, long status, const char* detail,
                                   const std::string& url, const ByteRange& range) {
    std::string message = curl_easy_strerror(code);
    if (detail != nullptr && detail[0] != '\0') {
        message = fmt::format("{}: {}", message, detail);
    }
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return FetchError(FetchErrorKind::kTimeout, std::move(message),
                              rangeContext(url, range));
        case CURLE_HTTP_RETURNED_ERROR:
            return FetchError::fromHttpStatus(status, rangeContext(url, range));
        case CURLE_RANGE_ERROR:
            return FetchError(FetchErrorKind::kRangeNotHonored, std::move(message),
                              rangeContext(url, range));
        default:
            return FetchError(FetchErrorKind::kTransport, std::move(message),
                              rangeContext(url, range));
    }
}

void configureEasy(CURL* easy, const std::string& url, const ByteRange& range,
                   const FetchOptions& options, char* errorBuffer) {
    const std::string rangeSpec = fmt::format("{}-{}", range.offset, range.last());

    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_RANGE, rangeSpec.c_str());
    curl_easy_setopt(easy, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, options.connectTimeoutMs);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, options.timeoutMs);
    curl_easy_setopt(easy, CURLOPT_USERAGENT, options.userAgent.c_str());
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, errorBuffer);
}

[[nodiscard]] long responseStatus(CURL* easy) {
    long status = 0;
    curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
    return status;
}

/// @brief Content-Length of an HTTP response, if the server sent one.
[[nodiscard]] std::optional<std::uint64_t> contentLength(CURL* easy, long status) {
    if (status == 0) {
        return std::nullopt;
    }
    curl_off_t length = -1;
    if (curl_easy_getinfo(easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK ||
        length < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(length);
}

// =============================================================================
// Buffered Transfer State
// =============================================================================

struct BufferedBody {
    std::vector<std::uint8_t> bytes;
    std::uint64_t limit = 0;
    bool overflowed = false;
};

std::size_t bufferedWriteCallback(char* ptr, std::size_t size, std::size_t nmemb,
                                  void* userdata) {
    auto* body = static_cast<BufferedBody*>(userdata);
    const std::size_t total = size * nmemb;
    if (body->bytes.size() + total > body->limit) {
        body->overflowed = true;
        return 0;
    }
    body->bytes.insert(body->bytes.end(), ptr, ptr + total);
    return total;
}

void requirePositiveBuffer(const FetchOptions& options) {
    if (options.maxBufferedBytes == 0) {
        throw ConfigError("max buffered bytes must be positive");
    }
}

}  // namespace

// =============================================================================
// Status Policy
// =============================================================================

std::optional<FetchError> checkRangeStatus(long status, const std::string& url,
                                           const ByteRange& range) {
    // Non-HTTP schemes (file://) report no status
    if (status == 0 || status == 206) {
        return std::nullopt;
    }
    if (status == 200) {
        if (range.offset == 0) {
            return std::nullopt;
        }
        return FetchError(FetchErrorKind::kRangeNotHonored,
                          fmt::format("server ignored the Range header (HTTP 200 for bytes {}-{})",
                                      range.offset, range.last()),
                          rangeContext(url, range));
    }
    return FetchError::fromHttpStatus(status, rangeContext(url, range));
}

// =============================================================================
// libcurl Initialisation
// =============================================================================

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw FetchError(FetchErrorKind::kTransport,
                             fmt::format("curl_global_init failed: {}", curl_easy_strerror(rc)));
        }
    });
}

// =============================================================================
// HttpRangeSource Implementation
// =============================================================================

struct HttpRangeSource::Handles {
    MultiHandle multi;
    EasyHandle easy;
    std::array<char, CURL_ERROR_SIZE> errorBuffer{};
    bool attached = false;

    ~Handles() {
        if (attached) {
            curl_multi_remove_handle(multi.get(), easy.get());
        }
    }
};

HttpRangeSource::HttpRangeSource(std::string url, ByteRange range, const FetchOptions& options)
    : url_(std::move(url)), range_(range), options_(options), handles_(std::make_unique<Handles>()) {
    requirePositiveBuffer(options_);
    ensureCurlInitialized();

    handles_->multi.reset(curl_multi_init());
    handles_->easy.reset(curl_easy_init());
    if (!handles_->multi || !handles_->easy) {
        throw FetchError(FetchErrorKind::kTransport, "failed to initialise libcurl handles",
                         rangeContext(url_, range_));
    }

    CURL* easy = handles_->easy.get();
    configureEasy(easy, url_, range_, options_, handles_->errorBuffer.data());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &HttpRangeSource::writeCallback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);

    CURLMcode mc = curl_multi_add_handle(handles_->multi.get(), easy);
    if (mc != CURLM_OK) {
        throw FetchError(FetchErrorKind::kTransport,
                         fmt::format("curl_multi_add_handle failed: {}", curl_multi_strerror(mc)),
                         rangeContext(url_, range_));
    }
    handles_->attached = true;

    ACR_LOG_DEBUG("Streaming GET {} Range: {}", url_, formatRangeHeader(range_));
}

HttpRangeSource::~HttpRangeSource() = default;

std::size_t HttpRangeSource::writeCallback(char* ptr, std::size_t size, std::size_t nmemb,
                                           void* userdata) {
    return static_cast<HttpRangeSource*>(userdata)->onData(ptr, size * nmemb);
}

std::size_t HttpRangeSource::onData(const char* data, std::size_t size) {
    CURL* easy = handles_->easy.get();

    if (!statusChecked_) {
        const long status = responseStatus(easy);
        if (auto error = checkRangeStatus(status, url_, range_)) {
            callbackError_ = std::make_exception_ptr(*error);
            return 0;
        }
        declaredLength_ = contentLength(easy, status);
        statusChecked_ = true;
    }

    if (received_ + size > range_.length) {
        callbackError_ = std::make_exception_ptr(FetchError(
            FetchErrorKind::kUnconsumedData,
            fmt::format("server sent more than the {} requested bytes", range_.length),
            rangeContext(url_, range_)));
        return 0;
    }

    if (pending_.size() - pendingOffset_ >= options_.maxBufferedBytes) {
        paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    pending_.insert(pending_.end(), data, data + size);
    received_ += size;
    return size;
}

void HttpRangeSource::pump() {
    CURLM* multi = handles_->multi.get();

    while (pending_.empty()) {
        // A paused handle may still hold body bytes after the transfer ended
        if (paused_) {
            paused_ = false;
            CURLcode rc = curl_easy_pause(handles_->easy.get(), CURLPAUSE_CONT);
            if (rc != CURLE_OK) {
                throw curlError(rc, 0, nullptr, url_, range_);
            }
            continue;
        }
        if (finished_) {
            break;
        }

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi, &running);
        if (mc != CURLM_OK) {
            throw FetchError(FetchErrorKind::kTransport,
                             fmt::format("curl_multi_perform failed: {}", curl_multi_strerror(mc)),
                             rangeContext(url_, range_));
        }

        if (running == 0) {
            int queued = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
                if (msg->msg == CURLMSG_DONE) {
                    transferResult_ = static_cast<int>(msg->data.result);
                }
            }
            finished_ = true;
            break;
        }

        if (!pending_.empty() || paused_) {
            continue;
        }

        mc = curl_multi_poll(multi, nullptr, 0, kPollTimeoutMs, nullptr);
        if (mc != CURLM_OK) {
            throw FetchError(FetchErrorKind::kTransport,
                             fmt::format("curl_multi_poll failed: {}", curl_multi_strerror(mc)),
                             rangeContext(url_, range_));
        }
    }

    if (finished_ && pending_.empty()) {
        raiseTransferError();
    }
}

void HttpRangeSource::raiseTransferError() {
    if (callbackError_) {
        std::rethrow_exception(callbackError_);
    }

    CURL* easy = handles_->easy.get();
    const long status = responseStatus(easy);
    const auto code = static_cast<CURLcode>(transferResult_);
    if (code != CURLE_OK) {
        throw curlError(code, status, handles_->errorBuffer.data(), url_, range_);
    }
    if (auto error = checkRangeStatus(status, url_, range_)) {
        throw *error;
    }
}

std::size_t HttpRangeSource::read(std::span<std::uint8_t> out) {
    if (out.empty()) {
        return 0;
    }

    if (pendingOffset_ == pending_.size()) {
        pending_.clear();
        pendingOffset_ = 0;
        pump();
        if (pending_.empty()) {
            if (received_ < range_.length) {
                throw FetchError(range_.length, received_, rangeContext(url_, range_));
            }
            return 0;
        }
    }

    const std::size_t n = std::min(out.size(), pending_.size() - pendingOffset_);
    std::memcpy(out.data(), pending_.data() + pendingOffset_, n);
    pendingOffset_ += n;
    return n;
}

// =============================================================================
// HttpRangeFetcher Implementation
// =============================================================================

HttpRangeFetcher::HttpRangeFetcher(std::string baseUrl, FetchOptions options)
    : baseUrl_(std::move(baseUrl)), options_(std::move(options)) {
    requirePositiveBuffer(options_);
    ensureCurlInitialized();
}

FetchedRange HttpRangeFetcher::fetchRange(const std::string& archiveFile,
                                          const ByteRange& range) const {
    const std::string url = joinArchiveUrl(baseUrl_, archiveFile);
    ACR_LOG_DEBUG("GET {} Range: {}", url, formatRangeHeader(range));

    EasyHandle easy(curl_easy_init());
    if (!easy) {
        throw FetchError(FetchErrorKind::kTransport, "failed to initialise libcurl handle",
                         rangeContext(url, range));
    }

    std::array<char, CURL_ERROR_SIZE> errorBuffer{};
    BufferedBody body;
    body.limit = range.length;
    body.bytes.reserve(static_cast<std::size_t>(range.length));

    configureEasy(easy.get(), url, range, options_, errorBuffer.data());
    curl_easy_setopt(easy.get(), CURLOPT_WRITEFUNCTION, &bufferedWriteCallback);
    curl_easy_setopt(easy.get(), CURLOPT_WRITEDATA, &body);

    const CURLcode rc = curl_easy_perform(easy.get());
    const long status = responseStatus(easy.get());

    if (auto error = checkRangeStatus(status, url, range)) {
        if (rc == CURLE_OK || rc == CURLE_WRITE_ERROR) {
            throw *error;
        }
    }
    if (rc != CURLE_OK) {
        if (body.overflowed) {
            throw FetchError(FetchErrorKind::kLengthMismatch,
                             fmt::format("server sent more than the {} requested bytes",
                                         range.length),
                             rangeContext(url, range));
        }
        throw curlError(rc, status, errorBuffer.data(), url, range);
    }

    FetchedRange fetched;
    fetched.bytes = std::move(body.bytes);
    fetched.declaredLength = contentLength(easy.get(), status);
    return fetched;
}

std::unique_ptr<ByteSource> HttpRangeFetcher::openRange(const std::string& archiveFile,
                                                        const ByteRange& range) const {
    return std::make_unique<HttpRangeSource>(joinArchiveUrl(baseUrl_, archiveFile), range,
                                             options_);
}

}  // namespace acr::io
