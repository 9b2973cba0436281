// =============================================================================
// autoclaved-reader - Report Reconstructor Tests
// =============================================================================
// Unit and property tests for streaming report reconstruction.
//
// Properties:
// - Any report packed into consecutive frames is rebuilt byte for byte
// - Output does not depend on the chunk size or on transport read sizes
// - Emitted chunks are never empty and never exceed the chunk size
// =============================================================================

#include "acr/archive/report_reconstructor.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "acr/archive/locator_resolver.h"
#include "acr/common/error.h"
#include "support/archive_builder.h"

namespace acr::archive::test {

using acr::test::ArchiveBuilder;
using acr::test::MemoryRangeFetcher;
using acr::test::toBytes;
using acr::test::toString;

namespace {

constexpr std::string_view kRecordA = R"({"a":1})";
constexpr std::string_view kRecordB = "{123}";

/// @brief Two frames: `{"z":0}\n{"a":1}\n` then the given payload.
struct TwoFrameArchive {
    MemoryRangeFetcher fetcher;
    ArchiveBuilder archive;
    FrameSpan first;
    FrameSpan second;

    explicit TwoFrameArchive(std::string_view secondPayload = kRecordB) {
        first = archive.addFrame(std::string(R"({"z":0})") + "\n" + std::string(kRecordA) + "\n");
        second = archive.addFrame(secondPayload);
    }

    /// @brief Publish the archive as "r.bin" and plan the A+B report.
    [[nodiscard]] ReportPlan publish(ByteCount reportSize = 14) {
        fetcher.addArchive("r.bin", archive.bytes());
        ReportPlan plan;
        plan.archiveFile = "r.bin";
        plan.window = FrameSpan{first.frameOff, archive.bytes().size() - first.frameOff};
        plan.leadingTrim = 8;
        plan.reportSize = reportSize;
        return plan;
    }
};

/// @brief Drain a stream, returning the concatenated output.
[[nodiscard]] std::string drain(ReportStream& stream) {
    std::string out;
    while (auto chunk = stream.next()) {
        out += toString(*chunk);
    }
    return out;
}

[[nodiscard]] IntegrityErrorKind integrityFailure(const ReportReconstructor& reconstructor,
                                                  const ReportPlan& plan) {
    try {
        (void)reconstructor.reconstruct(plan, [](std::span<const std::uint8_t>) { return true; });
    } catch (const IntegrityError& e) {
        return e.kind();
    }
    throw std::logic_error("reconstruction passed its integrity checks");
}

}  // namespace

// =============================================================================
// Scenarios
// =============================================================================

TEST(ReportReconstructorTest, SynthesizesMissingFinalSeparator) {
    TwoFrameArchive fixture;
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    std::string out;
    const auto summary = reconstructor.reconstruct(plan, [&out](std::span<const std::uint8_t> c) {
        out += toString(c);
        return true;
    });

    EXPECT_EQ(out, std::string(kRecordA) + "\n" + std::string(kRecordB) + "\n");
    EXPECT_EQ(summary.state, ReconstructionState::kComplete);
    EXPECT_EQ(summary.bytesEmitted, 14u);
    EXPECT_EQ(summary.framesDecoded, 2u);
    EXPECT_TRUE(summary.separatorSynthesized);
    EXPECT_EQ(fixture.fetcher.openCount(), 1u);
}

TEST(ReportReconstructorTest, CompleteReportAppendsNothing) {
    TwoFrameArchive fixture(std::string(kRecordB) + "\n");
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    ReportStream stream = reconstructor.open(plan);
    const std::string out = drain(stream);

    EXPECT_EQ(out, std::string(kRecordA) + "\n" + std::string(kRecordB) + "\n");
    EXPECT_FALSE(stream.separatorSynthesized());
    EXPECT_EQ(stream.bytesEmitted(), 14u);
}

TEST(ReportReconstructorTest, DropsRecordsAfterReportInLastFrame) {
    TwoFrameArchive fixture(std::string(kRecordB) + "\n" + R"({"next":1})" + "\n");
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    ReportStream stream = reconstructor.open(plan);

    EXPECT_EQ(drain(stream), std::string(kRecordA) + "\n" + std::string(kRecordB) + "\n");
    EXPECT_EQ(stream.state(), ReconstructionState::kComplete);
    EXPECT_FALSE(stream.separatorSynthesized());
}

TEST(ReportReconstructorTest, TrimLongerThanOneChunk) {
    ArchiveBuilder archive;
    std::string payload;
    for (int i = 0; i < 300; ++i) {
        payload += R"({"n":)" + std::to_string(i) + "}\n";
    }
    const std::size_t trim = payload.size();
    payload += std::string(kRecordA) + "\n";
    archive.addFrame(payload);

    MemoryRangeFetcher fetcher;
    fetcher.addArchive("t.bin", archive.bytes());
    ReportReconstructor reconstructor(fetcher, kMinChunkSize);
    ASSERT_GT(trim, 2 * kMinChunkSize);

    ReportPlan plan;
    plan.archiveFile = "t.bin";
    plan.window = FrameSpan{0, archive.bytes().size()};
    plan.leadingTrim = trim;
    plan.reportSize = kRecordA.size() + 1;

    ReportStream stream = reconstructor.open(plan);
    EXPECT_EQ(drain(stream), std::string(kRecordA) + "\n");
}

TEST(ReportReconstructorTest, ChunksAreBoundedAndNonEmpty) {
    ArchiveBuilder archive;
    std::string payload;
    while (payload.size() < 10 * kMinChunkSize) {
        payload += R"({"filler":"abcdefghijklmnopqrstuvwxyz"})" "\n";
    }
    archive.addFrame(payload);
    MemoryRangeFetcher fetcher;
    fetcher.addArchive("c.bin", archive.bytes());
    fetcher.setMaxReadSize(100);
    ReportReconstructor reconstructor(fetcher, kMinChunkSize);

    ReportPlan plan;
    plan.archiveFile = "c.bin";
    plan.window = FrameSpan{0, archive.bytes().size()};
    plan.reportSize = payload.size();

    std::string out;
    (void)reconstructor.reconstruct(plan, [&out](std::span<const std::uint8_t> chunk) {
        EXPECT_FALSE(chunk.empty());
        EXPECT_LE(chunk.size(), kMinChunkSize);
        out += toString(chunk);
        return true;
    });
    EXPECT_EQ(out, payload);
}

// =============================================================================
// Integrity Failures
// =============================================================================

TEST(ReportReconstructorTest, WrongTrimIsBadStart) {
    TwoFrameArchive fixture;
    ReportPlan plan = fixture.publish();
    plan.leadingTrim = 7;
    ReportReconstructor reconstructor(fixture.fetcher);

    EXPECT_EQ(integrityFailure(reconstructor, plan), IntegrityErrorKind::kBadStart);
}

TEST(ReportReconstructorTest, ShortReportSizeIsBadEnd) {
    TwoFrameArchive fixture(std::string(kRecordB) + "\n");
    const ReportPlan plan = fixture.publish(13);
    ReportReconstructor reconstructor(fixture.fetcher);

    EXPECT_EQ(integrityFailure(reconstructor, plan), IntegrityErrorKind::kBadEnd);
}

TEST(ReportReconstructorTest, ExtraFrameInWindowIsTrailingData) {
    TwoFrameArchive fixture(std::string(kRecordB) + "\n");
    fixture.archive.addFrame(R"({"later":1})" "\n");
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    EXPECT_EQ(integrityFailure(reconstructor, plan), IntegrityErrorKind::kTrailingData);
}

TEST(ReportReconstructorTest, GarbageAfterLastFrameIsTrailingData) {
    TwoFrameArchive fixture;
    fixture.archive.addRaw(toBytes("garbage"));
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    EXPECT_EQ(integrityFailure(reconstructor, plan), IntegrityErrorKind::kTrailingData);
}

TEST(ReportReconstructorTest, OversizedReportIsSizeMismatch) {
    TwoFrameArchive fixture;
    ReportReconstructor reconstructor(fixture.fetcher);

    EXPECT_EQ(integrityFailure(reconstructor, fixture.publish(15)),
              IntegrityErrorKind::kSizeMismatch);
    EXPECT_EQ(integrityFailure(reconstructor, fixture.publish(40)),
              IntegrityErrorKind::kSizeMismatch);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(ReportStreamTest, OpenIsLazy) {
    TwoFrameArchive fixture;
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    ReportStream stream = reconstructor.open(plan);

    EXPECT_EQ(stream.state(), ReconstructionState::kInit);
    EXPECT_EQ(fixture.fetcher.openCount(), 0u);
    EXPECT_EQ(stream.plan(), plan);
}

TEST(ReportStreamTest, StateTransitions) {
    TwoFrameArchive fixture;
    ReportReconstructor reconstructor(fixture.fetcher);
    ReportStream stream = reconstructor.open(fixture.publish());

    ASSERT_TRUE(stream.next().has_value());
    EXPECT_EQ(stream.state(), ReconstructionState::kStreaming);

    while (stream.next()) {
    }
    EXPECT_EQ(stream.state(), ReconstructionState::kComplete);
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.bytesEmitted(), 14u);
}

TEST(ReportStreamTest, CancelStopsTheStream) {
    TwoFrameArchive fixture;
    ReportReconstructor reconstructor(fixture.fetcher);
    ReportStream stream = reconstructor.open(fixture.publish());

    ASSERT_TRUE(stream.next().has_value());
    stream.cancel();

    EXPECT_EQ(stream.state(), ReconstructionState::kCancelled);
    EXPECT_FALSE(stream.next().has_value());

    stream.cancel();
    EXPECT_EQ(stream.state(), ReconstructionState::kCancelled);
}

TEST(ReportStreamTest, CancelAfterCompletionKeepsState) {
    TwoFrameArchive fixture;
    ReportReconstructor reconstructor(fixture.fetcher);
    ReportStream stream = reconstructor.open(fixture.publish());

    (void)drain(stream);
    stream.cancel();

    EXPECT_EQ(stream.state(), ReconstructionState::kComplete);
}

TEST(ReportStreamTest, FailureIsTerminal) {
    TwoFrameArchive fixture;
    ReportPlan plan = fixture.publish();
    plan.leadingTrim = 7;
    ReportReconstructor reconstructor(fixture.fetcher);
    ReportStream stream = reconstructor.open(plan);

    EXPECT_THROW((void)stream.next(), IntegrityError);
    EXPECT_EQ(stream.state(), ReconstructionState::kFailed);
    EXPECT_FALSE(stream.next().has_value());
}

TEST(ReportStreamTest, CorruptFrameFailsTheStream) {
    TwoFrameArchive fixture;
    auto bytes = fixture.archive.bytes();
    bytes[fixture.second.frameOff + 1] ^= 0x40;
    fixture.fetcher.addArchive("bad.bin", bytes);
    ReportReconstructor reconstructor(fixture.fetcher);

    ReportPlan plan;
    plan.archiveFile = "bad.bin";
    plan.window = FrameSpan{0, bytes.size()};
    plan.leadingTrim = 8;
    plan.reportSize = 14;
    ReportStream stream = reconstructor.open(plan);

    EXPECT_THROW((void)drain(stream), DecodeError);
    EXPECT_EQ(stream.state(), ReconstructionState::kFailed);
}

TEST(ReportStreamTest, MoveAssignmentCancelsTarget) {
    TwoFrameArchive fixture;
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    ReportStream stream = reconstructor.open(plan);
    ASSERT_TRUE(stream.next().has_value());
    stream = reconstructor.open(plan);

    EXPECT_EQ(stream.state(), ReconstructionState::kInit);
    EXPECT_EQ(drain(stream), std::string(kRecordA) + "\n" + std::string(kRecordB) + "\n");
}

TEST(ReportReconstructorTest, SinkCanCancel) {
    TwoFrameArchive fixture;
    const ReportPlan plan = fixture.publish();
    ReportReconstructor reconstructor(fixture.fetcher);

    std::size_t calls = 0;
    const auto summary = reconstructor.reconstruct(plan, [&calls](std::span<const std::uint8_t>) {
        ++calls;
        return false;
    });

    EXPECT_EQ(calls, 1u);
    EXPECT_EQ(summary.state, ReconstructionState::kCancelled);
    EXPECT_LT(summary.bytesEmitted, 14u);
}

TEST(ReportReconstructorTest, InvalidPlansAreUsageErrors) {
    MemoryRangeFetcher fetcher;
    ReportReconstructor reconstructor(fetcher);

    ReportPlan emptyWindow;
    emptyWindow.archiveFile = "x.bin";
    emptyWindow.reportSize = 10;
    EXPECT_THROW((void)reconstructor.open(emptyWindow), UsageError);

    ReportPlan tinyReport;
    tinyReport.archiveFile = "x.bin";
    tinyReport.window = FrameSpan{0, 100};
    tinyReport.reportSize = 1;
    EXPECT_THROW((void)reconstructor.open(tinyReport), UsageError);

    EXPECT_EQ(fetcher.openCount(), 0u);
}

TEST(ReportReconstructorTest, TryReconstructReturnsFetchError) {
    MemoryRangeFetcher fetcher;
    ReportReconstructor reconstructor(fetcher);

    ReportPlan plan;
    plan.archiveFile = "missing.bin";
    plan.window = FrameSpan{0, 100};
    plan.reportSize = 10;

    auto result =
        reconstructor.tryReconstruct(plan, [](std::span<const std::uint8_t>) { return true; });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFetchError);
}

// =============================================================================
// Properties
// =============================================================================

namespace {

/// @brief Records packed into consecutive frames, plus their locators.
struct PackedArchive {
    ArchiveBuilder archive;
    std::vector<std::string> records;
    std::vector<RecordLocator> locators;
};

[[nodiscard]] PackedArchive packRecords(const std::vector<std::string>& records,
                                        const std::vector<std::size_t>& frameSizes,
                                        bool dropFinalSeparator) {
    PackedArchive packed;
    packed.records = records;

    std::size_t next = 0;
    for (std::size_t f = 0; next < records.size(); ++f) {
        const std::size_t count =
            std::min(records.size() - next, f < frameSizes.size() ? frameSizes[f] : records.size());
        std::string payload;
        std::vector<ByteSlice> slices;
        for (std::size_t i = next; i < next + count; ++i) {
            slices.push_back(ByteSlice{payload.size(), records[i].size()});
            payload += records[i];
            if (i + 1 < records.size() || !dropFinalSeparator) {
                payload += "\n";
            }
        }
        const FrameSpan frame = packed.archive.addFrame(payload);
        for (const auto& slice : slices) {
            packed.locators.push_back(RecordLocator{"p.bin", frame, slice});
        }
        next += count;
    }
    return packed;
}

[[nodiscard]] rc::Gen<std::string> recordBody() {
    return rc::gen::map(
        rc::gen::container<std::string>(rc::gen::inRange<std::size_t>(0, 600),
                                        rc::gen::inRange('0', 'z')),
        [](std::string inner) { return "{" + inner + "}"; });
}

}  // namespace

RC_GTEST_PROP(ReportReconstructorProperty, RebuildsAnyPackedReport, ()) {
    const auto records = *rc::gen::container<std::vector<std::string>>(
        rc::gen::inRange<std::size_t>(1, 12), recordBody());
    const auto frameSizes = *rc::gen::container<std::vector<std::size_t>>(
        rc::gen::inRange<std::size_t>(1, 5));
    const bool dropFinalSeparator = *rc::gen::arbitrary<bool>();
    const auto firstIndex = *rc::gen::inRange<std::size_t>(0, records.size());
    const auto lastIndex = *rc::gen::inRange<std::size_t>(firstIndex, records.size());
    const auto maxReadSize = *rc::gen::inRange<std::size_t>(0, 500);

    const PackedArchive packed = packRecords(records, frameSizes, dropFinalSeparator);

    ReportLocators report;
    report.first = packed.locators[lastIndex];
    report.last = packed.locators[firstIndex];
    std::string expected;
    for (std::size_t i = firstIndex; i <= lastIndex; ++i) {
        report.reportSize += records[i].size() + 1;
        ++report.recordCount;
        expected += records[i] + "\n";
    }
    const ReportPlan plan = planReport(report);

    MemoryRangeFetcher fetcher;
    fetcher.addArchive("p.bin", packed.archive.bytes());
    fetcher.setMaxReadSize(maxReadSize);

    for (const std::size_t chunkSize : {kMinChunkSize, kDefaultChunkSize}) {
        ReportReconstructor reconstructor(fetcher, chunkSize);
        std::string out;
        bool bounded = true;
        const auto summary =
            reconstructor.reconstruct(plan, [&](std::span<const std::uint8_t> chunk) {
                bounded = bounded && !chunk.empty() && chunk.size() <= chunkSize;
                out += toString(chunk);
                return true;
            });

        RC_ASSERT(out == expected);
        RC_ASSERT(bounded);
        RC_ASSERT(summary.state == ReconstructionState::kComplete);
        RC_ASSERT(summary.bytesEmitted == report.reportSize);
        RC_ASSERT(summary.separatorSynthesized ==
                  (dropFinalSeparator && lastIndex + 1 == records.size()));
    }
}

}  // namespace acr::archive::test
