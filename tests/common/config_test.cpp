// =============================================================================
// autoclaved-reader - Engine Configuration Tests
// =============================================================================

#include "acr/common/config.h"
#include "acr/common/logger.h"

#include <gtest/gtest.h>

namespace acr {
namespace {

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;

    EXPECT_EQ(config.archiveBaseUrl, kDefaultArchiveBaseUrl);
    EXPECT_EQ(config.chunkSize, kDefaultChunkSize);
    EXPECT_EQ(config.fetch.timeoutMs, kDefaultTimeoutMs);
    EXPECT_EQ(config.fetch.connectTimeoutMs, kDefaultConnectTimeoutMs);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsEmptyBaseUrl) {
    EngineConfig config;
    config.archiveBaseUrl.clear();

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kConfigError);
}

TEST(EngineConfigTest, RejectsBaseUrlWithoutScheme) {
    EngineConfig config;
    config.archiveBaseUrl = "datacollector.infra.ooni.io/autoclaved";

    EXPECT_FALSE(config.validate().has_value());
}

TEST(EngineConfigTest, AcceptsFileUrls) {
    EngineConfig config;
    config.archiveBaseUrl = "file:///srv/autoclaved/";

    EXPECT_TRUE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsNonPositiveTimeouts) {
    EngineConfig config;
    config.fetch.timeoutMs = 0;
    EXPECT_FALSE(config.validate().has_value());

    config = EngineConfig{};
    config.fetch.connectTimeoutMs = -5;
    EXPECT_FALSE(config.validate().has_value());
}

TEST(EngineConfigTest, RejectsTinyChunks) {
    EngineConfig config;
    config.chunkSize = kMinChunkSize - 1;

    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message().find("chunk size"), std::string::npos);
}

TEST(EngineConfigTest, BufferMustHoldOneChunk) {
    EngineConfig config;
    config.chunkSize = 128 * 1024;
    config.fetch.maxBufferedBytes = 64 * 1024;
    EXPECT_FALSE(config.validate().has_value());

    config.fetch.maxBufferedBytes = config.chunkSize;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(log::levelFromString("DEBUG"), log::Level::kDebug);
    EXPECT_EQ(log::levelFromString("warn"), log::Level::kWarning);
    EXPECT_EQ(log::levelFromString("critical"), log::Level::kCritical);
    EXPECT_EQ(log::levelFromString("nonsense"), log::Level::kInfo);
    EXPECT_EQ(log::levelToString(log::Level::kTrace), "trace");
}

TEST(LogLevelTest, VerbosityOnlyLowersTheThreshold) {
    EXPECT_EQ(log::levelForVerbosity(log::Level::kWarning, 0), log::Level::kWarning);
    EXPECT_EQ(log::levelForVerbosity(log::Level::kWarning, 1), log::Level::kInfo);
    EXPECT_EQ(log::levelForVerbosity(log::Level::kWarning, 2), log::Level::kDebug);
    EXPECT_EQ(log::levelForVerbosity(log::Level::kWarning, 5), log::Level::kDebug);
    EXPECT_EQ(log::levelForVerbosity(log::Level::kTrace, 1), log::Level::kTrace);
}

}  // namespace
}  // namespace acr
