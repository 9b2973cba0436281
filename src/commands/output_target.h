// =============================================================================
// autoclaved-reader - Command Output Target
// =============================================================================
// Destination of record and report bytes: a file or stdout.
//
// A file that was not committed is removed when the target is destroyed,
// so a failed command leaves no partial output behind. Bytes already
// written to stdout cannot be taken back; the exit code reports the
// failure instead.
// =============================================================================

#ifndef ACR_COMMANDS_OUTPUT_TARGET_H
#define ACR_COMMANDS_OUTPUT_TARGET_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <ostream>
#include <span>
#include <string>

namespace acr::commands {

/// @brief Make writes to a closed pipe fail with EPIPE instead of
///        terminating the process.
void ignoreBrokenPipe();

class OutputTarget {
public:
    /// @param path Output file; empty or "-" selects the console stream.
    /// @param console Stream standing in for stdout.
    /// @throws UsageError if the file cannot be created.
    explicit OutputTarget(const std::filesystem::path& path, std::ostream& console = std::cout);

    ~OutputTarget();

    OutputTarget(const OutputTarget&) = delete;
    OutputTarget& operator=(const OutputTarget&) = delete;

    /// @brief Write bytes.
    /// @return false if the destination stopped accepting output.
    [[nodiscard]] bool write(std::span<const std::uint8_t> bytes);

    /// @brief Flush and keep the output.
    /// @throws CancelledError if the final flush fails.
    void commit();

    [[nodiscard]] bool isStdout() const noexcept { return toStdout_; }

    /// @brief Name for diagnostics ("stdout" or the file path).
    [[nodiscard]] std::string displayName() const;

private:
    /// @brief The stream write() and commit() go to.
    [[nodiscard]] std::ostream& stream() noexcept;

    std::filesystem::path path_;
    std::ostream* console_;
    std::ofstream file_;
    bool toStdout_ = false;
    bool committed_ = false;
};

}  // namespace acr::commands

#endif  // ACR_COMMANDS_OUTPUT_TARGET_H
