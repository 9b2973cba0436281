// =============================================================================
// autoclaved-reader - Streaming Report Reconstructor Implementation
// =============================================================================

#include "acr/archive/report_reconstructor.h"

#include <algorithm>

#include <fmt/format.h>

#include "acr/common/logger.h"
#include "acr/io/lz4_frame_stream.h"

namespace acr::archive {

namespace {

/// @brief Smallest report: one empty-bodied record plus its separator.
constexpr ByteCount kMinReportSize = 2;

[[nodiscard]] bool isTerminal(ReconstructionState state) noexcept {
    return state == ReconstructionState::kComplete || state == ReconstructionState::kFailed ||
           state == ReconstructionState::kCancelled;
}

}  // namespace

// =============================================================================
// ReportStream::Impl
// =============================================================================

class ReportStream::Impl {
public:
    Impl(const io::RangeFetcher& fetcher, ReportPlan plan, std::size_t chunkSize)
        : fetcher_(&fetcher),
          plan_(std::move(plan)),
          chunkSize_(chunkSize),
          trim_(plan_.leadingTrim),
          remaining_(plan_.reportSize) {}

    std::optional<std::span<const std::uint8_t>> next() {
        if (isTerminal(state_)) {
            return std::nullopt;
        }
        try {
            return advance();
        } catch (const std::exception&) {
            state_ = ReconstructionState::kFailed;
            release();
            throw;
        }
    }

    void cancel() noexcept {
        if (isTerminal(state_)) {
            return;
        }
        ACR_LOG_DEBUG("Report stream for {} cancelled after {} of {} bytes", plan_.archiveFile,
                      emitted_, plan_.reportSize);
        state_ = ReconstructionState::kCancelled;
        release();
    }

    [[nodiscard]] ReconstructionState state() const noexcept { return state_; }
    [[nodiscard]] std::uint64_t bytesEmitted() const noexcept { return emitted_; }
    [[nodiscard]] std::uint64_t framesDecoded() const noexcept { return frames_; }
    [[nodiscard]] bool separatorSynthesized() const noexcept { return synthesized_; }
    [[nodiscard]] const ReportPlan& plan() const noexcept { return plan_; }

private:
    std::optional<std::span<const std::uint8_t>> advance() {
        if (!decoder_) {
            openWindow();
        }

        while (!stopDecoding()) {
            auto chunk = decoder_->next();
            frames_ = decoder_->framesDecoded();
            if (!chunk) {
                break;
            }
            if (state_ == ReconstructionState::kInit) {
                state_ = ReconstructionState::kStreaming;
            }
            if (auto piece = accept(*chunk); !piece.empty()) {
                return piece;
            }
        }

        return finish();
    }

    void openWindow() {
        ACR_LOG_DEBUG("Report window: archive={} frame_off={} window_size={} leading_trim={} "
                      "report_size={}",
                      plan_.archiveFile, plan_.window.frameOff, plan_.window.frameSize,
                      plan_.leadingTrim, plan_.reportSize);
        source_ = fetcher_->open(plan_.archiveFile, io::ByteRange::fromSpan(plan_.window));
        decoder_ = std::make_unique<io::Lz4FrameDecoder>(*source_, chunkSize_);
    }

    /// @brief Stop once the report is owed at most one byte and no frame is
    ///        half decoded.
    [[nodiscard]] bool stopDecoding() const noexcept {
        return remaining_ <= 1 && decoder_->atFrameBoundary();
    }

    /// @brief Trim, truncate and check one decoded chunk.
    /// @return The part of the chunk that belongs to the report.
    std::span<const std::uint8_t> accept(std::span<const std::uint8_t> d) {
        if (remaining_ <= 1) {
            // Rest of the frame that completed the report
            dropped_ += d.size();
            return {};
        }

        if (trim_ > 0) {
            const auto drop = static_cast<std::size_t>(std::min<ByteCount>(trim_, d.size()));
            d = d.subspan(drop);
            trim_ -= drop;
        }
        if (d.size() > remaining_) {
            dropped_ += d.size() - remaining_;
            d = d.first(static_cast<std::size_t>(remaining_));
        }
        if (d.empty()) {
            return d;
        }

        if (atStart_ && d.front() != kRecordOpen) {
            throw IntegrityError(IntegrityErrorKind::kBadStart,
                                 fmt::format("report starts with byte 0x{:02x}, expected '{{'",
                                             d.front()),
                                 windowContext());
        }
        if (d.size() == remaining_ && remaining_ > 1 && d.back() != kRecordSeparator) {
            throw IntegrityError(IntegrityErrorKind::kBadEnd,
                                 fmt::format("report ends with byte 0x{:02x}, expected '\\n'",
                                             d.back()),
                                 windowContext());
        }

        remaining_ -= d.size();
        emitted_ += d.size();
        atStart_ = false;
        return d;
    }

    /// @brief Trailing checks once decoding stopped.
    std::optional<std::span<const std::uint8_t>> finish() {
        if (!decoder_->sourceExhausted()) {
            throw IntegrityError(IntegrityErrorKind::kTrailingData,
                                 fmt::format("compressed bytes remain in the window after "
                                             "{} frames ({} compressed bytes consumed)",
                                             frames_, decoder_->compressedBytesConsumed()),
                                 windowContext());
        }
        if (dropped_ > 0) {
            ACR_LOG_DEBUG("Dropped {} decoded bytes past the end of the report in {}", dropped_,
                          plan_.archiveFile);
        }

        std::optional<std::span<const std::uint8_t>> tail;
        if (remaining_ == 1) {
            ACR_LOG_DEBUG("Appending missing record separator to report from {}",
                          plan_.archiveFile);
            synthesized_ = true;
            remaining_ = 0;
            emitted_ += 1;
            tail = std::span<const std::uint8_t>(&kRecordSeparator, 1);
        } else if (remaining_ != 0) {
            throw IntegrityError(IntegrityErrorKind::kSizeMismatch,
                                 fmt::format("window decoded to {} report bytes, expected {}",
                                             emitted_, plan_.reportSize),
                                 windowContext());
        }

        state_ = ReconstructionState::kComplete;
        release();
        return tail;
    }

    void release() noexcept {
        decoder_.reset();
        source_.reset();
    }

    [[nodiscard]] ErrorContext windowContext() const {
        return ErrorContext(plan_.archiveFile)
            .withOffset(plan_.window.frameOff)
            .withLength(plan_.window.frameSize);
    }

    const io::RangeFetcher* fetcher_;
    ReportPlan plan_;
    std::size_t chunkSize_;

    std::unique_ptr<io::ByteSource> source_;
    std::unique_ptr<io::Lz4FrameDecoder> decoder_;

    ReconstructionState state_ = ReconstructionState::kInit;
    ByteCount trim_;
    ByteCount remaining_;
    bool atStart_ = true;
    std::uint64_t emitted_ = 0;
    std::uint64_t dropped_ = 0;
    std::uint64_t frames_ = 0;
    bool synthesized_ = false;
};

// =============================================================================
// ReportStream Public Interface
// =============================================================================

ReportStream::ReportStream(const io::RangeFetcher& fetcher, ReportPlan plan,
                           std::size_t chunkSize)
    : impl_(std::make_unique<Impl>(fetcher, std::move(plan), chunkSize)) {}

ReportStream::~ReportStream() {
    if (impl_) {
        impl_->cancel();
    }
}

ReportStream::ReportStream(ReportStream&&) noexcept = default;

ReportStream& ReportStream::operator=(ReportStream&& other) noexcept {
    if (this != &other) {
        if (impl_) {
            impl_->cancel();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

std::optional<std::span<const std::uint8_t>> ReportStream::next() {
    return impl_->next();
}

void ReportStream::cancel() noexcept {
    impl_->cancel();
}

ReconstructionState ReportStream::state() const noexcept {
    return impl_->state();
}

std::uint64_t ReportStream::bytesEmitted() const noexcept {
    return impl_->bytesEmitted();
}

std::uint64_t ReportStream::framesDecoded() const noexcept {
    return impl_->framesDecoded();
}

bool ReportStream::separatorSynthesized() const noexcept {
    return impl_->separatorSynthesized();
}

const ReportPlan& ReportStream::plan() const noexcept {
    return impl_->plan();
}

// =============================================================================
// ReportReconstructor Implementation
// =============================================================================

ReportReconstructor::ReportReconstructor(const io::RangeFetcher& fetcher, std::size_t chunkSize)
    : fetcher_(&fetcher), chunkSize_(chunkSize) {}

void ReportReconstructor::validatePlan(const ReportPlan& plan) {
    if (!plan.window.isValid()) {
        throw UsageError(fmt::format("invalid report window {}+{}", plan.window.frameOff,
                                     plan.window.frameSize),
                         ErrorContext(plan.archiveFile));
    }
    if (plan.reportSize < kMinReportSize) {
        throw UsageError(fmt::format("report size must be at least {} bytes, got {}",
                                     kMinReportSize, plan.reportSize),
                         ErrorContext(plan.archiveFile));
    }
}

ReportStream ReportReconstructor::open(ReportPlan plan) const {
    validatePlan(plan);
    return ReportStream(*fetcher_, std::move(plan), chunkSize_);
}

ReconstructionSummary ReportReconstructor::reconstruct(const ReportPlan& plan,
                                                       const ChunkSink& sink) const {
    ReportStream stream = open(plan);
    while (auto chunk = stream.next()) {
        if (!sink(*chunk)) {
            stream.cancel();
            break;
        }
    }

    ReconstructionSummary summary;
    summary.state = stream.state();
    summary.bytesEmitted = stream.bytesEmitted();
    summary.framesDecoded = stream.framesDecoded();
    summary.separatorSynthesized = stream.separatorSynthesized();
    return summary;
}

Result<ReconstructionSummary> ReportReconstructor::tryReconstruct(const ReportPlan& plan,
                                                                  const ChunkSink& sink) const {
    return tryExecute([&]() { return reconstruct(plan, sink); });
}

}  // namespace acr::archive
