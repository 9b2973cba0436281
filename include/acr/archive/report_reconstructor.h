// =============================================================================
// autoclaved-reader - Streaming Report Reconstructor
// =============================================================================
// Streaming path: rebuild a multi-record report from one contiguous
// window of LZ4 frames.
//
// This module provides:
// - ReportStream: Pull-based chunk sequence with a lifecycle state
// - ReportReconstructor: Opens streams and pushes them into a ChunkSink
// - ReconstructionSummary: Outcome of a push-style reconstruction
//
// Chunks are produced as the window is decoded; network reads happen
// only when the consumer asks for the next chunk, so memory stays
// bounded by one frame and the transport buffer.
//
// Output contract:
// - The first emitted byte is '{' (IntegrityError::kBadStart)
// - A chunk that completes the report ends with '\n' (kBadEnd)
// - No compressed bytes remain in the window (kTrailingData)
// - Exactly reportSize bytes are emitted (kSizeMismatch). When the
//   window decodes to reportSize - 1 bytes the missing final separator
//   is appended.
//
// Bytes already handed to the consumer cannot be taken back: a stream
// that ends in an exception must be treated as invalid as a whole.
// =============================================================================

#ifndef ACR_ARCHIVE_REPORT_RECONSTRUCTOR_H
#define ACR_ARCHIVE_REPORT_RECONSTRUCTOR_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>

#include "acr/common/error.h"
#include "acr/common/types.h"
#include "acr/io/range_fetcher.h"

namespace acr::archive {

/// @brief Receives report chunks; returning false cancels the stream.
using ChunkSink = std::function<bool(std::span<const std::uint8_t>)>;

/// @brief Outcome of ReportReconstructor::reconstruct().
struct ReconstructionSummary {
    ReconstructionState state = ReconstructionState::kInit;
    std::uint64_t bytesEmitted = 0;
    std::uint64_t framesDecoded = 0;
    bool separatorSynthesized = false;
};

// =============================================================================
// ReportStream
// =============================================================================

/// @brief Lazy, finite, non-restartable chunk sequence of one report.
class ReportStream {
public:
    ~ReportStream();

    ReportStream(const ReportStream&) = delete;
    ReportStream& operator=(const ReportStream&) = delete;
    ReportStream(ReportStream&&) noexcept;
    ReportStream& operator=(ReportStream&&) noexcept;

    /// @brief Produce the next non-empty chunk.
    /// @return The chunk (valid until the next call), or nullopt once the
    ///         report is complete or the stream was cancelled.
    /// @throws FetchError, DecodeError, IntegrityError; the stream is then
    ///         kFailed and the network transfer is released.
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> next();

    /// @brief Abandon the stream and release the network transfer.
    /// @note The trailing checks are skipped. No effect on finished streams.
    void cancel() noexcept;

    [[nodiscard]] ReconstructionState state() const noexcept;

    /// @brief Report bytes handed out so far (including a synthesized separator).
    [[nodiscard]] std::uint64_t bytesEmitted() const noexcept;

    [[nodiscard]] std::uint64_t framesDecoded() const noexcept;

    /// @brief True if the final record separator was appended by the engine.
    [[nodiscard]] bool separatorSynthesized() const noexcept;

    [[nodiscard]] const ReportPlan& plan() const noexcept;

private:
    friend class ReportReconstructor;

    ReportStream(const io::RangeFetcher& fetcher, ReportPlan plan, std::size_t chunkSize);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// ReportReconstructor
// =============================================================================

/// @brief Creates report streams over a RangeFetcher.
class ReportReconstructor {
public:
    /// @param fetcher Range fetcher; must outlive every stream opened.
    /// @param chunkSize Upper bound on the size of one chunk.
    explicit ReportReconstructor(const io::RangeFetcher& fetcher,
                                 std::size_t chunkSize = kDefaultChunkSize);

    /// @brief Check a plan can be reconstructed.
    /// @throws UsageError for an empty window or a report size below 2.
    static void validatePlan(const ReportPlan& plan);

    /// @brief Open a stream; nothing is fetched until the first next().
    /// @throws UsageError as validatePlan().
    [[nodiscard]] ReportStream open(ReportPlan plan) const;

    /// @brief Stream a whole report into a sink.
    /// @return Summary; state is kComplete or kCancelled (sink returned false).
    /// @throws FetchError, DecodeError, IntegrityError, UsageError.
    ReconstructionSummary reconstruct(const ReportPlan& plan, const ChunkSink& sink) const;

    /// @brief reconstruct() with errors returned as a Result.
    [[nodiscard]] Result<ReconstructionSummary> tryReconstruct(const ReportPlan& plan,
                                                               const ChunkSink& sink) const;

private:
    const io::RangeFetcher* fetcher_;
    std::size_t chunkSize_;
};

}  // namespace acr::archive

#endif  // ACR_ARCHIVE_REPORT_RECONSTRUCTOR_H
