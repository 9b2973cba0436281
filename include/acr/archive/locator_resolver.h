// =============================================================================
// autoclaved-reader - Locator Resolution
// =============================================================================
// Turns public identifiers into byte coordinates.
//
// This module provides:
// - LocatorResolver: Abstract read-only index
// - ReportLocators: Extremal records of a report plus its total size
// - planReport(): Derive the fetch window and trims of a report
// - IndexFileResolver: LocatorResolver over a tab-separated index file
// - parseMeasurementId(): "temp-id-<n>" -> measurement number
//
// Index file format (one row per record, tab-separated, '#' comments):
//   msm_no  report  filename  frame_off  frame_size  intra_off  intra_size
// The first non-comment line is a header if it starts with "msm_no".
// =============================================================================

#ifndef ACR_ARCHIVE_LOCATOR_RESOLVER_H
#define ACR_ARCHIVE_LOCATOR_RESOLVER_H

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "acr/common/types.h"

namespace acr::archive {

// =============================================================================
// ReportLocators
// =============================================================================

/// @brief What the engine needs to know about a report's records.
struct ReportLocators {
    /// @brief First record in (frameOff, intraOff) order.
    RecordLocator first;

    /// @brief Last record in (frameOff, intraOff) order.
    RecordLocator last;

    /// @brief Sum of (intraSize + 1) over every record of the report.
    ByteCount reportSize = 0;

    /// @brief Number of records in the report.
    std::size_t recordCount = 0;

    bool operator==(const ReportLocators&) const = default;
};

/// @brief Derive the window, leading trim and size of a report.
/// @note The two locators may be given in either order.
/// @throws UsageError if they name different archive files or describe
///         an empty window.
[[nodiscard]] ReportPlan planReport(const ReportLocators& locators);

// =============================================================================
// LocatorResolver
// =============================================================================

/// @brief Read-only lookup of record coordinates.
/// @note "Not found" is a nullopt result, never an exception.
class LocatorResolver {
public:
    virtual ~LocatorResolver() = default;

    /// @brief Coordinates of one measurement.
    [[nodiscard]] virtual std::optional<RecordLocator> resolveMeasurement(
        MeasurementNo msmNo) const = 0;

    /// @brief Extremal records and total size of a report.
    [[nodiscard]] virtual std::optional<ReportLocators> resolveReport(
        std::string_view reportName) const = 0;
};

// =============================================================================
// IndexFileResolver
// =============================================================================

/// @brief LocatorResolver backed by a tab-separated index.
/// @note Duplicate rows for one measurement number are skipped with a
///       warning; the first row wins.
class IndexFileResolver final : public LocatorResolver {
public:
    /// @brief Load an index file.
    /// @throws UsageError if the file cannot be read or a row is malformed.
    [[nodiscard]] static IndexFileResolver load(const std::filesystem::path& path);

    /// @brief Parse an index from a stream.
    /// @param name Name used in diagnostics.
    /// @throws UsageError if a row is malformed.
    [[nodiscard]] static IndexFileResolver parse(std::istream& input, std::string_view name);

    [[nodiscard]] std::optional<RecordLocator> resolveMeasurement(
        MeasurementNo msmNo) const override;

    [[nodiscard]] std::optional<ReportLocators> resolveReport(
        std::string_view reportName) const override;

    [[nodiscard]] std::size_t measurementCount() const noexcept { return measurements_.size(); }

    [[nodiscard]] std::size_t reportCount() const noexcept { return reports_.size(); }

private:
    IndexFileResolver() = default;

    /// @brief Add one row.
    /// @return false if the measurement number was already indexed.
    bool addRow(MeasurementNo msmNo, const std::string& reportName, RecordLocator locator);

    std::unordered_map<MeasurementNo, RecordLocator> measurements_;
    std::unordered_map<std::string, ReportLocators> reports_;
};

// =============================================================================
// Measurement Identifiers
// =============================================================================

/// @brief Parse a public measurement identifier ("temp-id-<digits>").
/// @throws UsageError for anything else.
[[nodiscard]] MeasurementNo parseMeasurementId(std::string_view measurementId);

}  // namespace acr::archive

#endif  // ACR_ARCHIVE_LOCATOR_RESOLVER_H
