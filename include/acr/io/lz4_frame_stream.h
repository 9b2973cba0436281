// =============================================================================
// autoclaved-reader - LZ4 Frame Stream
// =============================================================================
// Incremental decoder for one or more concatenated LZ4 frames.
//
// This module provides:
// - Lz4FrameDecoder: Pull-based decoder over a ByteSource
// - decompressFrames(): One-shot decoding of an in-memory buffer
//
// The decoder reads exactly as many compressed bytes as liblz4 asks for
// next. It therefore never reads past the end of the last frame, and the
// chunk sequence depends only on the frames, not on how the source
// splits its reads.
//
// Usage:
//   Lz4FrameDecoder decoder(source, config.chunkSize);
//   while (auto chunk = decoder.next()) {
//       consume(*chunk);
//   }
// =============================================================================

#ifndef ACR_IO_LZ4_FRAME_STREAM_H
#define ACR_IO_LZ4_FRAME_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "acr/common/types.h"
#include "acr/io/byte_source.h"

namespace acr::io {

// =============================================================================
// Lz4FrameDecoder
// =============================================================================

/// @brief Decodes concatenated LZ4 frames into chunks of at most chunkSize.
/// @note Not restartable. The source must outlive the decoder.
class Lz4FrameDecoder {
public:
    /// @param source Compressed bytes.
    /// @param chunkSize Upper bound on the size of one returned chunk.
    /// @throws DecodeError if the decompression context cannot be created.
    explicit Lz4FrameDecoder(ByteSource& source, std::size_t chunkSize = kDefaultChunkSize);

    ~Lz4FrameDecoder();

    Lz4FrameDecoder(const Lz4FrameDecoder&) = delete;
    Lz4FrameDecoder& operator=(const Lz4FrameDecoder&) = delete;
    Lz4FrameDecoder(Lz4FrameDecoder&&) noexcept;
    Lz4FrameDecoder& operator=(Lz4FrameDecoder&&) noexcept;

    /// @brief Decode the next chunk.
    /// @return The chunk (possibly empty for frame headers, end marks and
    ///         empty frames), or nullopt once the source ended on a frame
    ///         boundary. The span is valid until the next call.
    /// @throws DecodeError kCorruptFrame for invalid input,
    ///         kTruncatedFrame if the source ends inside a frame.
    /// @throws FetchError propagated from the source.
    [[nodiscard]] std::optional<std::span<const std::uint8_t>> next();

    /// @brief True when no frame is partially decoded.
    [[nodiscard]] bool atFrameBoundary() const noexcept;

    /// @brief Check the source has no bytes left.
    /// @note Reads at most one byte, which is kept and decoded later.
    [[nodiscard]] bool sourceExhausted();

    /// @brief Number of frames decoded to their end mark.
    [[nodiscard]] std::uint64_t framesDecoded() const noexcept;

    /// @brief Compressed bytes consumed by liblz4 so far.
    [[nodiscard]] std::uint64_t compressedBytesConsumed() const noexcept;

    /// @brief Decompressed bytes returned so far.
    [[nodiscard]] std::uint64_t decompressedBytesProduced() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Decode every frame of an in-memory buffer.
/// @throws DecodeError as Lz4FrameDecoder::next().
[[nodiscard]] std::vector<std::uint8_t> decompressFrames(std::span<const std::uint8_t> compressed,
                                                         std::size_t chunkSize = kDefaultChunkSize);

}  // namespace acr::io

#endif  // ACR_IO_LZ4_FRAME_STREAM_H
