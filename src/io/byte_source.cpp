// =============================================================================
// autoclaved-reader - Byte Sources Implementation
// =============================================================================

#include "acr/io/byte_source.h"

#include <algorithm>
#include <cstring>

namespace acr::io {

std::size_t readFully(ByteSource& source, std::span<std::uint8_t> out) {
    std::size_t total = 0;
    while (total < out.size()) {
        std::size_t n = source.read(out.subspan(total));
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

// =============================================================================
// MemoryByteSource Implementation
// =============================================================================

MemoryByteSource::MemoryByteSource(std::span<const std::uint8_t> data, std::size_t maxReadSize)
    : data_(data), maxReadSize_(maxReadSize) {}

std::size_t MemoryByteSource::read(std::span<std::uint8_t> out) {
    std::size_t n = std::min(out.size(), remaining());
    if (maxReadSize_ > 0) {
        n = std::min(n, maxReadSize_);
    }
    if (n > 0) {
        std::memcpy(out.data(), data_.data() + position_, n);
        position_ += n;
    }
    return n;
}

}  // namespace acr::io
