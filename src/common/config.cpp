// =============================================================================
// autoclaved-reader - Engine Configuration Implementation
// =============================================================================

#include "acr/common/config.h"

#include <fmt/format.h>

namespace acr {

VoidResult EngineConfig::validate() const {
    if (archiveBaseUrl.empty()) {
        return makeVoidError(ErrorCode::kConfigError, "archive base URL must not be empty");
    }
    if (archiveBaseUrl.find("://") == std::string::npos) {
        return makeVoidError(ErrorCode::kConfigError,
                             fmt::format("archive base URL has no scheme: '{}'", archiveBaseUrl));
    }
    if (fetch.connectTimeoutMs <= 0) {
        return makeVoidError(ErrorCode::kConfigError,
                             fmt::format("connect timeout must be positive, got {} ms",
                                         fetch.connectTimeoutMs));
    }
    if (fetch.timeoutMs <= 0) {
        return makeVoidError(
            ErrorCode::kConfigError,
            fmt::format("request timeout must be positive, got {} ms", fetch.timeoutMs));
    }
    if (chunkSize < kMinChunkSize) {
        return makeVoidError(ErrorCode::kConfigError,
                             fmt::format("chunk size must be at least {} bytes, got {}",
                                         kMinChunkSize, chunkSize));
    }
    if (fetch.maxBufferedBytes < chunkSize) {
        return makeVoidError(
            ErrorCode::kConfigError,
            fmt::format("network buffer ({} bytes) must hold at least one chunk ({} bytes)",
                        fetch.maxBufferedBytes, chunkSize));
    }
    return makeVoidSuccess();
}

}  // namespace acr
