// =============================================================================
// autoclaved-reader - Common Type Tests
// =============================================================================

#include "acr/common/types.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace acr {
namespace {

TEST(FrameSpanTest, EndAndValidity) {
    constexpr FrameSpan span{100, 20};
    static_assert(span.end() == 120);

    EXPECT_TRUE(span.isValid());
    EXPECT_FALSE((FrameSpan{100, 0}).isValid());
    EXPECT_FALSE((FrameSpan{UINT64_MAX - 1, 4}).isValid());
}

TEST(RecordLocatorTest, OrdersByFrameThenIntraOffset) {
    const RecordLocator a{"x.lz4", FrameSpan{0, 50}, ByteSlice{30, 5}};
    const RecordLocator b{"x.lz4", FrameSpan{50, 10}, ByteSlice{0, 5}};
    const RecordLocator c{"x.lz4", FrameSpan{50, 10}, ByteSlice{6, 3}};

    EXPECT_TRUE(locatorOrderLess(a, b));
    EXPECT_TRUE(locatorOrderLess(b, c));
    EXPECT_FALSE(locatorOrderLess(c, a));
    EXPECT_FALSE(locatorOrderLess(b, b));
}

TEST(ReconstructionStateTest, Names) {
    EXPECT_EQ(reconstructionStateToString(ReconstructionState::kInit), "init");
    EXPECT_EQ(reconstructionStateToString(ReconstructionState::kStreaming), "streaming");
    EXPECT_EQ(reconstructionStateToString(ReconstructionState::kComplete), "complete");
    EXPECT_EQ(reconstructionStateToString(ReconstructionState::kFailed), "failed");
    EXPECT_EQ(reconstructionStateToString(ReconstructionState::kCancelled), "cancelled");
}

}  // namespace
}  // namespace acr
