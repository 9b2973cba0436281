// =============================================================================
// autoclaved-reader - Command Tests
// =============================================================================
// Runs the extract and report commands against file:// archives and
// checks their exit codes and output handling.
// =============================================================================

#include <gtest/gtest.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "acr/common/error.h"
#include "commands/extract_command.h"
#include "commands/output_target.h"
#include "commands/report_command.h"
#include "support/archive_builder.h"

namespace acr::commands::test {

using acr::test::ArchiveBuilder;

// =============================================================================
// Test Fixture
// =============================================================================

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("acr_cmd_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        ArchiveBuilder archive;
        first_ = archive.addFrame("{\"z\":0}\n{\"a\":1}\n");
        second_ = archive.addFrame("{\"b\":2}");
        const auto bytes = archive.bytes();
        std::ofstream out(dir_ / "r.lz4", std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    [[nodiscard]] EngineConfig engine() const {
        EngineConfig config;
        config.archiveBaseUrl = "file://" + dir_.string();
        return config;
    }

    [[nodiscard]] ReportPlan plan(ByteCount reportSize = 16) const {
        ReportPlan p;
        p.archiveFile = "r.lz4";
        p.window = FrameSpan{first_.frameOff, second_.end() - first_.frameOff};
        p.leadingTrim = 8;
        p.reportSize = reportSize;
        return p;
    }

    [[nodiscard]] static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream text;
        text << in.rdbuf();
        return text.str();
    }

    std::filesystem::path dir_;
    FrameSpan first_;
    FrameSpan second_;
};

// =============================================================================
// Report Command
// =============================================================================

TEST_F(CommandTest, ReportGoesToConsole) {
    ReportOptions options;
    options.engine = engine();
    options.plan = plan();

    std::ostringstream console;
    EXPECT_EQ(ReportCommand(options, console).execute(), 0);
    EXPECT_EQ(console.str(), "{\"a\":1}\n{\"b\":2}\n");
}

TEST_F(CommandTest, ClosedConsoleIsCancelled) {
    ReportOptions options;
    options.engine = engine();
    options.plan = plan();

    std::ostream closed(nullptr);
    EXPECT_EQ(ReportCommand(options, closed).execute(), toExitCode(ErrorCode::kCancelled));
}

TEST_F(CommandTest, ReportWritesOutputFile) {
    ReportOptions options;
    options.engine = engine();
    options.plan = plan();
    options.outputPath = dir_ / "report.json";

    EXPECT_EQ(ReportCommand(options).execute(), 0);
    EXPECT_EQ(readFile(options.outputPath), "{\"a\":1}\n{\"b\":2}\n");
}

TEST_F(CommandTest, FailedReportRemovesPartialFile) {
    ReportOptions options;
    options.engine = engine();
    options.plan = plan(40);
    options.outputPath = dir_ / "report.json";

    EXPECT_EQ(ReportCommand(options).execute(), toExitCode(ErrorCode::kIntegrityError));
    EXPECT_FALSE(std::filesystem::exists(options.outputPath));
}

TEST_F(CommandTest, ReportMissingFromIndexIsNotFound) {
    const auto index = dir_ / "archive.idx";
    std::ofstream(index) << "1\tother\tr.lz4\t0\t10\t0\t5\n";

    ReportOptions options;
    options.engine = engine();
    options.indexPath = index;
    options.reportName = "missing";

    std::ostringstream console;
    EXPECT_EQ(ReportCommand(options, console).execute(), toExitCode(ErrorCode::kNotFound));
    EXPECT_TRUE(console.str().empty());
}

// =============================================================================
// Extract Command
// =============================================================================

TEST_F(CommandTest, ExtractResolvesIdThroughIndex) {
    const auto index = dir_ / "archive.idx";
    std::ofstream(index) << "msm_no\treport\tfilename\tframe_off\tframe_size\tintra_off\t"
                            "intra_size\n"
                         << "9\tr\tr.lz4\t" << first_.frameOff << '\t' << first_.frameSize
                         << "\t8\t7\n";

    ExtractOptions options;
    options.engine = engine();
    options.indexPath = index;
    options.measurementId = "temp-id-9";

    std::ostringstream console;
    EXPECT_EQ(ExtractCommand(options, console).execute(), 0);
    EXPECT_EQ(console.str(), "{\"a\":1}");
}

TEST_F(CommandTest, ExtractToClosedConsoleIsCancelled) {
    ExtractOptions options;
    options.engine = engine();
    options.locator = RecordLocator{"r.lz4", first_, ByteSlice{8, 7}};

    std::ostream closed(nullptr);
    EXPECT_EQ(ExtractCommand(options, closed).execute(), toExitCode(ErrorCode::kCancelled));
}

TEST_F(CommandTest, ExtractWithoutLocatorIsUsageError) {
    ExtractOptions options;
    options.engine = engine();

    std::ostringstream console;
    EXPECT_EQ(ExtractCommand(options, console).execute(), toExitCode(ErrorCode::kUsageError));
}

// =============================================================================
// Output Target
// =============================================================================

TEST(OutputTargetTest, UncommittedFileIsRemoved) {
    const auto path = std::filesystem::temp_directory_path() / "acr_output_target_test.out";
    {
        OutputTarget output(path);
        const std::vector<std::uint8_t> bytes = {'{', '}'};
        EXPECT_TRUE(output.write(bytes));
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(OutputTargetTest, DashSelectsConsole) {
    std::ostringstream console;
    OutputTarget output("-", console);
    const std::vector<std::uint8_t> bytes = {'o', 'k'};

    EXPECT_TRUE(output.isStdout());
    EXPECT_TRUE(output.write(bytes));
    output.commit();
    EXPECT_EQ(console.str(), "ok");
}

TEST(OutputTargetTest, ClosedPipeFailsTheWrite) {
    ignoreBrokenPipe();

    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    ::close(fds[0]);

    const char byte = 'x';
    errno = 0;
    EXPECT_EQ(::write(fds[1], &byte, 1), -1);
    EXPECT_EQ(errno, EPIPE);
    ::close(fds[1]);
}

}  // namespace acr::commands::test
