// =============================================================================
// autoclaved-reader - Byte Sources
// =============================================================================
// Pull-based byte streams consumed by the LZ4 frame decoder.
//
// This module provides:
// - ByteSource: Abstract incrementally-readable byte stream
// - MemoryByteSource: ByteSource over a caller-owned buffer
// - readFully(): Read until a buffer is full or the stream ends
//
// A read() returning 0 is end of stream; nothing else signals it.
// =============================================================================

#ifndef ACR_IO_BYTE_SOURCE_H
#define ACR_IO_BYTE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace acr::io {

// =============================================================================
// ByteSource
// =============================================================================

/// @brief Incrementally-readable byte stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    ByteSource() = default;
    ByteSource(const ByteSource&) = delete;
    ByteSource& operator=(const ByteSource&) = delete;

    /// @brief Read up to out.size() bytes.
    /// @return Number of bytes read; 0 only at end of stream.
    /// @throws FetchError on transport failures.
    [[nodiscard]] virtual std::size_t read(std::span<std::uint8_t> out) = 0;

    /// @brief Length announced by the producer, if it announced one.
    [[nodiscard]] virtual std::optional<std::uint64_t> declaredLength() const = 0;

    /// @brief Human-readable name for diagnostics (URL, "memory", ...).
    [[nodiscard]] virtual std::string displayName() const = 0;

protected:
    ByteSource(ByteSource&&) = default;
    ByteSource& operator=(ByteSource&&) = default;
};

/// @brief Read until out is full or the source reaches end of stream.
/// @return Number of bytes read (< out.size() only at end of stream).
[[nodiscard]] std::size_t readFully(ByteSource& source, std::span<std::uint8_t> out);

// =============================================================================
// MemoryByteSource
// =============================================================================

/// @brief ByteSource over a buffer that outlives it.
class MemoryByteSource final : public ByteSource {
public:
    /// @param data Buffer to stream.
    /// @param maxReadSize Upper bound on bytes returned per read (0 = unbounded).
    explicit MemoryByteSource(std::span<const std::uint8_t> data, std::size_t maxReadSize = 0);

    [[nodiscard]] std::size_t read(std::span<std::uint8_t> out) override;

    [[nodiscard]] std::optional<std::uint64_t> declaredLength() const override {
        return data_.size();
    }

    [[nodiscard]] std::string displayName() const override { return "memory"; }

    /// @brief Bytes not yet read.
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - position_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t maxReadSize_ = 0;
    std::size_t position_ = 0;
};

}  // namespace acr::io

#endif  // ACR_IO_BYTE_SOURCE_H
