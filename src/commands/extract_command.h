// =============================================================================
// autoclaved-reader - Extract Command
// =============================================================================
// Command handler for recovering a single measurement record.
//
// The record is located either by explicit byte coordinates or by a
// "temp-id-<n>" identifier looked up in an index file.
// =============================================================================

#ifndef ACR_COMMANDS_EXTRACT_COMMAND_H
#define ACR_COMMANDS_EXTRACT_COMMAND_H

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "acr/common/config.h"
#include "acr/common/types.h"

namespace acr::commands {

// =============================================================================
// Extract Options
// =============================================================================

/// @brief Configuration options for the extract command.
struct ExtractOptions {
    /// @brief Engine settings (base URL, transport, chunk size).
    EngineConfig engine;

    /// @brief Explicit record coordinates; takes precedence over the index.
    std::optional<RecordLocator> locator;

    /// @brief Index file used to resolve measurementId.
    std::filesystem::path indexPath;

    /// @brief Public measurement identifier ("temp-id-<n>").
    std::string measurementId;

    /// @brief Output file; empty or "-" for stdout.
    std::filesystem::path outputPath;
};

// =============================================================================
// ExtractCommand Class
// =============================================================================

/// @brief Command handler for single-record extraction.
class ExtractCommand {
public:
    /// @param console Stream that receives output when no file is given.
    explicit ExtractCommand(ExtractOptions options, std::ostream& console = std::cout);

    /// @brief Execute the extract command.
    /// @return Exit code (0 = success, ErrorCode value otherwise).
    [[nodiscard]] int execute();

    [[nodiscard]] const ExtractOptions& options() const noexcept { return options_; }

private:
    /// @brief Explicit coordinates, or the index row of the identifier.
    /// @throws UsageError, NotFoundError.
    [[nodiscard]] RecordLocator resolveLocator() const;

    ExtractOptions options_;
    std::ostream* console_;
};

}  // namespace acr::commands

#endif  // ACR_COMMANDS_EXTRACT_COMMAND_H
