// =============================================================================
// autoclaved-reader - LZ4 Frame Stream Implementation
// =============================================================================

#include "acr/io/lz4_frame_stream.h"

#include <lz4frame.h>
#include <fmt/format.h>

#include "acr/common/error.h"
#include "acr/common/logger.h"

namespace acr::io {

namespace {

/// @brief Bytes read at a frame boundary before liblz4 can give a hint.
/// @note Smallest LZ4 frame header (magic + FLG + BD + HC).
constexpr std::size_t kFrameHeaderProbe = 7;

struct DecompressionContextDeleter {
    void operator()(LZ4F_dctx* ctx) const noexcept { LZ4F_freeDecompressionContext(ctx); }
};

using DecompressionContext = std::unique_ptr<LZ4F_dctx, DecompressionContextDeleter>;

}  // namespace

// =============================================================================
// Lz4FrameDecoder::Impl
// =============================================================================

class Lz4FrameDecoder::Impl {
public:
    Impl(ByteSource& source, std::size_t chunkSize)
        : source_(&source), output_(chunkSize == 0 ? kDefaultChunkSize : chunkSize) {
        LZ4F_dctx* ctx = nullptr;
        LZ4F_errorCode_t rc = LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION);
        if (LZ4F_isError(rc)) {
            throw DecodeError(DecodeErrorKind::kCorruptFrame,
                              fmt::format("failed to create LZ4 decompression context: {}",
                                          LZ4F_getErrorName(rc)));
        }
        ctx_.reset(ctx);
    }

    std::optional<std::span<const std::uint8_t>> next() {
        if (inputPos_ == input_.size() && !outputPending_) {
            if (!refill()) {
                return std::nullopt;
            }
        }

        std::size_t dstSize = output_.size();
        std::size_t srcSize = input_.size() - inputPos_;
        const std::size_t hint = LZ4F_decompress(ctx_.get(), output_.data(), &dstSize,
                                                 input_.data() + inputPos_, &srcSize, nullptr);
        if (LZ4F_isError(hint)) {
            throw DecodeError(DecodeErrorKind::kCorruptFrame,
                              fmt::format("LZ4 frame {} is corrupt: {}", frames_ + 1,
                                          LZ4F_getErrorName(hint)),
                              context());
        }

        inputPos_ += srcSize;
        consumed_ += srcSize;
        produced_ += dstSize;
        outputPending_ = dstSize == output_.size();

        if (hint == 0) {
            // End mark (and checksum) consumed; the context is ready for
            // the next frame.
            inFrame_ = false;
            outputPending_ = false;
            nextHint_ = 0;
            ++frames_;
            ACR_LOG_TRACE("Decoded LZ4 frame {} ({} compressed bytes so far)", frames_,
                          consumed_);
        } else {
            inFrame_ = true;
            nextHint_ = hint;
        }

        return std::span<const std::uint8_t>(output_.data(), dstSize);
    }

    [[nodiscard]] bool atFrameBoundary() const noexcept { return !inFrame_; }

    bool sourceExhausted() {
        if (inputPos_ < input_.size() || lookahead_.has_value()) {
            return false;
        }
        std::uint8_t byte = 0;
        if (source_->read(std::span<std::uint8_t>(&byte, 1)) == 0) {
            return true;
        }
        lookahead_ = byte;
        return false;
    }

    [[nodiscard]] std::uint64_t framesDecoded() const noexcept { return frames_; }
    [[nodiscard]] std::uint64_t compressedBytesConsumed() const noexcept { return consumed_; }
    [[nodiscard]] std::uint64_t decompressedBytesProduced() const noexcept { return produced_; }

private:
    /// @brief Read the next block of compressed input.
    /// @return false at a clean end of stream (frame boundary, no bytes).
    bool refill() {
        const std::size_t want = inFrame_ ? nextHint_ : kFrameHeaderProbe;
        input_.resize(want);
        inputPos_ = 0;

        std::size_t got = 0;
        if (lookahead_.has_value()) {
            input_[0] = *lookahead_;
            lookahead_.reset();
            got = 1;
        }
        got += readFully(*source_, std::span<std::uint8_t>(input_).subspan(got));

        if (got == 0 && !inFrame_) {
            input_.clear();
            return false;
        }
        if (got < want) {
            throw DecodeError(DecodeErrorKind::kTruncatedFrame,
                              fmt::format("compressed input ends inside LZ4 frame {} "
                                          "({} of {} expected bytes)",
                                          frames_ + 1, got, want),
                              context());
        }
        return true;
    }

    [[nodiscard]] ErrorContext context() const {
        return ErrorContext(source_->displayName()).withOffset(consumed_);
    }

    ByteSource* source_;
    DecompressionContext ctx_;

    std::vector<std::uint8_t> input_;
    std::size_t inputPos_ = 0;
    std::optional<std::uint8_t> lookahead_;

    std::vector<std::uint8_t> output_;
    bool outputPending_ = false;

    bool inFrame_ = false;
    std::size_t nextHint_ = 0;

    std::uint64_t frames_ = 0;
    std::uint64_t consumed_ = 0;
    std::uint64_t produced_ = 0;
};

// =============================================================================
// Lz4FrameDecoder Public Interface
// =============================================================================

Lz4FrameDecoder::Lz4FrameDecoder(ByteSource& source, std::size_t chunkSize)
    : impl_(std::make_unique<Impl>(source, chunkSize)) {}

Lz4FrameDecoder::~Lz4FrameDecoder() = default;

Lz4FrameDecoder::Lz4FrameDecoder(Lz4FrameDecoder&&) noexcept = default;
Lz4FrameDecoder& Lz4FrameDecoder::operator=(Lz4FrameDecoder&&) noexcept = default;

std::optional<std::span<const std::uint8_t>> Lz4FrameDecoder::next() {
    return impl_->next();
}

bool Lz4FrameDecoder::atFrameBoundary() const noexcept {
    return impl_->atFrameBoundary();
}

bool Lz4FrameDecoder::sourceExhausted() {
    return impl_->sourceExhausted();
}

std::uint64_t Lz4FrameDecoder::framesDecoded() const noexcept {
    return impl_->framesDecoded();
}

std::uint64_t Lz4FrameDecoder::compressedBytesConsumed() const noexcept {
    return impl_->compressedBytesConsumed();
}

std::uint64_t Lz4FrameDecoder::decompressedBytesProduced() const noexcept {
    return impl_->decompressedBytesProduced();
}

// =============================================================================
// Convenience Functions
// =============================================================================

std::vector<std::uint8_t> decompressFrames(std::span<const std::uint8_t> compressed,
                                           std::size_t chunkSize) {
    MemoryByteSource source(compressed);
    Lz4FrameDecoder decoder(source, chunkSize);

    std::vector<std::uint8_t> out;
    while (auto chunk = decoder.next()) {
        out.insert(out.end(), chunk->begin(), chunk->end());
    }
    return out;
}

}  // namespace acr::io
