// =============================================================================
// autoclaved-reader - Autoclaved Archive Reader
// =============================================================================
// Main entry point for the acr command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: extract (single record), report (streamed report)
// - Global options: base URL, timeouts, chunk and buffer sizes, logging
// - Environment variables (ACR_*) and an INI/TOML file via --config
//
// Record and report bytes go to stdout or -o; diagnostics go to stderr.
// =============================================================================

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "acr/common/config.h"
#include "acr/common/error.h"
#include "acr/common/logger.h"
#include "acr/common/types.h"

// Command implementations
#include "commands/extract_command.h"
#include "commands/output_target.h"
#include "commands/report_command.h"

namespace acr::commands {
int runExtract(CLI::App* app);
int runReport(CLI::App* app);
}  // namespace acr::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "acr: Read measurements out of LZ4-compressed autoclaved archive files\n"
    "using HTTP byte-range requests.\n\n"
    "Records are located by explicit byte coordinates or through a\n"
    "tab-separated index file (msm_no, report, filename, frame_off,\n"
    "frame_size, intra_off, intra_size).";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string baseUrl{acr::kDefaultArchiveBaseUrl};
    long timeoutMs = acr::kDefaultTimeoutMs;
    long connectTimeoutMs = acr::kDefaultConnectTimeoutMs;
    std::size_t chunkSize = acr::kDefaultChunkSize;
    std::size_t maxBuffered = acr::kDefaultMaxBufferedBytes;
    std::string logLevel = "warning";
    std::string logFile;
    int verbosity = 0;  // -v: info, -vv: debug
};

GlobalOptions gOptions;

// =============================================================================
// Extract Command Options
// =============================================================================

struct CliExtractOptions {
    std::string archive;
    std::optional<std::uint64_t> frameOff;
    std::optional<std::uint64_t> frameSize;
    std::optional<std::uint64_t> intraOff;
    std::optional<std::uint64_t> intraSize;
    std::string index;
    std::string id;
    std::string output;
};

CliExtractOptions gExtractOpts;

// =============================================================================
// Report Command Options
// =============================================================================

struct CliReportOptions {
    std::string archive;
    std::optional<std::uint64_t> frameOff;
    std::optional<std::uint64_t> windowSize;
    std::optional<std::uint64_t> intraOff;
    std::optional<std::uint64_t> reportSize;
    std::string index;
    std::string report;
    std::string output;
};

CliReportOptions gReportOpts;

// =============================================================================
// Option Conversion
// =============================================================================

[[nodiscard]] acr::log::Level effectiveLogLevel() {
    return acr::log::levelForVerbosity(acr::log::levelFromString(gOptions.logLevel),
                                       gOptions.verbosity);
}

[[nodiscard]] acr::EngineConfig engineConfig() {
    acr::EngineConfig config;
    config.archiveBaseUrl = gOptions.baseUrl;
    config.fetch.timeoutMs = gOptions.timeoutMs;
    config.fetch.connectTimeoutMs = gOptions.connectTimeoutMs;
    config.fetch.maxBufferedBytes = gOptions.maxBuffered;
    config.chunkSize = gOptions.chunkSize;
    config.logLevel = effectiveLogLevel();
    config.logFile = gOptions.logFile;
    return config;
}

/// @brief Require all or none of a group of coordinate options.
template <typename... Values>
[[nodiscard]] bool allCoordinatesGiven(const std::string& archive, const char* what,
                                       const Values&... values) {
    const bool any = (values.has_value() || ...);
    const bool all = (values.has_value() && ...);
    if (archive.empty()) {
        if (any) {
            throw acr::UsageError(fmt::format("{} options require --archive", what));
        }
        return false;
    }
    if (!all) {
        throw acr::UsageError(fmt::format("--archive requires all {} options", what));
    }
    return true;
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupExtractCommand(CLI::App& app) {
    auto* extract = app.add_subcommand("extract", "Extract a single measurement record");
    extract->alias("x");

    auto* archive = extract->add_option("--archive", gExtractOpts.archive,
                                        "Archive file, relative to the base URL");
    extract->add_option("--frame-off", gExtractOpts.frameOff, "Offset of the LZ4 frame(s)");
    extract->add_option("--frame-size", gExtractOpts.frameSize, "Size of the LZ4 frame(s)")
        ->check(CLI::PositiveNumber);
    extract->add_option("--intra-off", gExtractOpts.intraOff,
                        "Record offset in the decompressed frame bytes");
    extract->add_option("--intra-size", gExtractOpts.intraSize, "Record length in bytes");

    auto* index = extract->add_option("--index", gExtractOpts.index, "Index file (TSV)")
                      ->check(CLI::ExistingFile)
                      ->excludes(archive);
    auto* id = extract->add_option("--id", gExtractOpts.id, "Measurement id (temp-id-<n>)")
                   ->needs(index);
    index->needs(id);

    extract->add_option("-o,--output", gExtractOpts.output, "Output file (default: stdout)");
}

void setupReportCommand(CLI::App& app) {
    auto* report = app.add_subcommand("report", "Stream a full multi-record report");
    report->alias("r");

    auto* archive = report->add_option("--archive", gReportOpts.archive,
                                       "Archive file, relative to the base URL");
    report->add_option("--frame-off", gReportOpts.frameOff, "Offset of the first frame");
    report->add_option("--window-size", gReportOpts.windowSize,
                       "Compressed bytes covering every frame of the report")
        ->check(CLI::PositiveNumber);
    report->add_option("--intra-off", gReportOpts.intraOff,
                       "Offset of the first record in its decompressed frame");
    report->add_option("--report-size", gReportOpts.reportSize,
                       "Sum of (record size + 1) over all records");

    auto* index = report->add_option("--index", gReportOpts.index, "Index file (TSV)")
                      ->check(CLI::ExistingFile)
                      ->excludes(archive);
    auto* name = report->add_option("--report", gReportOpts.report, "Report file name")
                     ->needs(index);
    index->needs(name);

    report->add_option("-o,--output", gReportOpts.output, "Output file (default: stdout)");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    // A closed stdout pipe surfaces as a failed write (exit 7)
    acr::commands::ignoreBrokenPipe();

    CLI::App app{kDescription, "acr"};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from an INI/TOML file");

    // Global options
    app.add_option("--base-url", gOptions.baseUrl, "Base URL of the archive files")
        ->envname("ACR_ARCHIVE_BASE_URL")
        ->capture_default_str();

    app.add_option("--timeout-ms", gOptions.timeoutMs, "Timeout of one range request")
        ->envname("ACR_TIMEOUT_MS")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--connect-timeout-ms", gOptions.connectTimeoutMs, "Connection timeout")
        ->envname("ACR_CONNECT_TIMEOUT_MS")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app.add_option("--chunk-size", gOptions.chunkSize, "Decompressed chunk size in bytes")
        ->envname("ACR_CHUNK_SIZE")
        ->capture_default_str();

    app.add_option("--max-buffered", gOptions.maxBuffered,
                   "Network bytes buffered ahead of the output")
        ->capture_default_str();

    app.add_option("--log-level", gOptions.logLevel, "Log level")
        ->envname("ACR_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"},
                              CLI::ignore_case))
        ->capture_default_str();

    app.add_option("--log-file", gOptions.logFile, "Also write logs to this file")
        ->envname("ACR_LOG_FILE");

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for debug)");

    // Setup subcommands
    setupExtractCommand(app);
    setupReportCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        const int rc = app.exit(e);
        return rc == 0 ? rc : acr::toExitCode(acr::ErrorCode::kUsageError);
    }

    // Initialize logger
    try {
        acr::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = effectiveLogLevel();
        acr::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return acr::toExitCode(acr::ErrorCode::kConfigError);
    }

    // Dispatch to subcommand handlers
    int exitCode = acr::toExitCode(acr::ErrorCode::kSuccess);
    if (app.got_subcommand("extract")) {
        exitCode = acr::commands::runExtract(app.get_subcommand("extract"));
    } else if (app.got_subcommand("report")) {
        exitCode = acr::commands::runReport(app.get_subcommand("report"));
    }

    acr::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace acr::commands {

int runExtract([[maybe_unused]] CLI::App* app) {
    try {
        ExtractOptions opts;
        opts.engine = engineConfig();
        opts.indexPath = gExtractOpts.index;
        opts.measurementId = gExtractOpts.id;
        opts.outputPath = gExtractOpts.output;

        if (allCoordinatesGiven(gExtractOpts.archive, "record coordinate", gExtractOpts.frameOff,
                                gExtractOpts.frameSize, gExtractOpts.intraOff,
                                gExtractOpts.intraSize)) {
            RecordLocator locator;
            locator.archiveFile = gExtractOpts.archive;
            locator.frame = FrameSpan{*gExtractOpts.frameOff, *gExtractOpts.frameSize};
            locator.slice = ByteSlice{*gExtractOpts.intraOff, *gExtractOpts.intraSize};
            opts.locator = std::move(locator);
        }

        ExtractCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const ACRException& e) {
        ACR_LOG_ERROR("Extract failed: {}", e.what());
        return e.exitCode();
    }
}

int runReport([[maybe_unused]] CLI::App* app) {
    try {
        ReportOptions opts;
        opts.engine = engineConfig();
        opts.indexPath = gReportOpts.index;
        opts.reportName = gReportOpts.report;
        opts.outputPath = gReportOpts.output;

        if (allCoordinatesGiven(gReportOpts.archive, "report window", gReportOpts.frameOff,
                                gReportOpts.windowSize, gReportOpts.intraOff,
                                gReportOpts.reportSize)) {
            ReportPlan plan;
            plan.archiveFile = gReportOpts.archive;
            plan.window = FrameSpan{*gReportOpts.frameOff, *gReportOpts.windowSize};
            plan.leadingTrim = *gReportOpts.intraOff;
            plan.reportSize = *gReportOpts.reportSize;
            opts.plan = std::move(plan);
        }

        ReportCommand cmd(std::move(opts));
        return cmd.execute();
    } catch (const ACRException& e) {
        ACR_LOG_ERROR("Report failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace acr::commands
