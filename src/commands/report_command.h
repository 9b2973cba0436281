// =============================================================================
// autoclaved-reader - Report Command
// =============================================================================
// Command handler for streaming a full report.
//
// Chunks are written as they are decoded. Writing to a file removes the
// partial file on failure; on stdout the bytes already written stay and
// only the exit code reports the failure.
// =============================================================================

#ifndef ACR_COMMANDS_REPORT_COMMAND_H
#define ACR_COMMANDS_REPORT_COMMAND_H

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "acr/common/config.h"
#include "acr/common/types.h"

namespace acr::commands {

// =============================================================================
// Report Options
// =============================================================================

/// @brief Configuration options for the report command.
struct ReportOptions {
    /// @brief Engine settings (base URL, transport, chunk size).
    EngineConfig engine;

    /// @brief Explicit window and sizes; takes precedence over the index.
    std::optional<ReportPlan> plan;

    /// @brief Index file used to resolve reportName.
    std::filesystem::path indexPath;

    /// @brief Report file name as listed in the index.
    std::string reportName;

    /// @brief Output file; empty or "-" for stdout.
    std::filesystem::path outputPath;
};

// =============================================================================
// ReportCommand Class
// =============================================================================

/// @brief Command handler for streamed report reconstruction.
class ReportCommand {
public:
    /// @param console Stream that receives output when no file is given.
    explicit ReportCommand(ReportOptions options, std::ostream& console = std::cout);

    /// @brief Execute the report command.
    /// @return Exit code (0 = success, ErrorCode value otherwise).
    [[nodiscard]] int execute();

    [[nodiscard]] const ReportOptions& options() const noexcept { return options_; }

private:
    /// @throws UsageError, NotFoundError.
    [[nodiscard]] ReportPlan resolvePlan() const;

    ReportOptions options_;
    std::ostream* console_;
};

}  // namespace acr::commands

#endif  // ACR_COMMANDS_REPORT_COMMAND_H
