// =============================================================================
// autoclaved-reader - Engine Configuration
// =============================================================================
// Settings shared by the range fetcher, the frame decoder and the CLI.
//
// The CLI binds every field to a command-line option, an environment
// variable and an optional INI/TOML file (see src/main.cpp); library
// users fill the structs directly and call validate().
// =============================================================================

#ifndef ACR_COMMON_CONFIG_H
#define ACR_COMMON_CONFIG_H

#include <cstddef>
#include <string>

#include "acr/common/error.h"
#include "acr/common/logger.h"
#include "acr/common/types.h"

namespace acr {

// =============================================================================
// FetchOptions
// =============================================================================

/// @brief Transport settings for HTTP range requests.
struct FetchOptions {
    /// @brief Maximum time to establish a connection, in milliseconds.
    long connectTimeoutMs = kDefaultConnectTimeoutMs;

    /// @brief Maximum duration of one range request, in milliseconds.
    /// @note Expiry surfaces as FetchError::kTimeout; the engine never resumes.
    long timeoutMs = kDefaultTimeoutMs;

    /// @brief Network bytes buffered ahead of the consumer before pausing.
    std::size_t maxBufferedBytes = kDefaultMaxBufferedBytes;

    /// @brief Follow HTTP redirects.
    bool followRedirects = true;

    /// @brief User-Agent header value.
    std::string userAgent = "autoclaved-reader/0.1";

    bool operator==(const FetchOptions&) const = default;
};

// =============================================================================
// EngineConfig
// =============================================================================

/// @brief Complete configuration of the archive engine.
struct EngineConfig {
    /// @brief Base URL the archive file names are resolved against.
    std::string archiveBaseUrl{kDefaultArchiveBaseUrl};

    /// @brief Transport settings.
    FetchOptions fetch;

    /// @brief Size of one decompressed output chunk.
    std::size_t chunkSize = kDefaultChunkSize;

    /// @brief Minimum log level.
    log::Level logLevel = log::Level::kWarning;

    /// @brief Optional log file (empty = stderr only).
    std::string logFile;

    /// @brief Check every field is usable.
    /// @return kConfigError describing the first invalid field.
    [[nodiscard]] VoidResult validate() const;

    bool operator==(const EngineConfig&) const = default;
};

}  // namespace acr

#endif  // ACR_COMMON_CONFIG_H
