// =============================================================================
// autoclaved-reader - Locator Resolution Implementation
// =============================================================================

#include "acr/archive/locator_resolver.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <utility>

#include <fmt/format.h>

#include "acr/common/error.h"
#include "acr/common/logger.h"

namespace acr::archive {

namespace {

/// @brief Number of columns in an index row.
constexpr std::size_t kIndexColumns = 7;

/// @brief Parse a full string as an unsigned decimal number.
[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

/// @brief Split a row on tabs.
/// @return Number of fields found (fields beyond the array are counted only).
std::size_t splitRow(std::string_view line, std::array<std::string_view, kIndexColumns>& fields) {
    std::size_t count = 0;
    std::size_t start = 0;
    while (true) {
        std::size_t end = line.find('\t', start);
        std::string_view field =
            line.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (count < fields.size()) {
            fields[count] = field;
        }
        ++count;
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
    return count;
}

}  // namespace

// =============================================================================
// Report Planning
// =============================================================================

ReportPlan planReport(const ReportLocators& locators) {
    const RecordLocator* first = &locators.first;
    const RecordLocator* last = &locators.last;
    if (locatorOrderLess(*last, *first)) {
        std::swap(first, last);
    }

    if (first->archiveFile != last->archiveFile) {
        throw UsageError(fmt::format("report spans two archive files: '{}' and '{}'",
                                     first->archiveFile, last->archiveFile));
    }

    ReportPlan plan;
    plan.archiveFile = first->archiveFile;
    plan.window.frameOff = first->frame.frameOff;
    const ByteOffset end = std::max(first->frame.end(), last->frame.end());
    plan.window.frameSize = end - first->frame.frameOff;
    plan.leadingTrim = first->slice.intraOff;
    plan.reportSize = locators.reportSize;

    if (!plan.window.isValid()) {
        throw UsageError(fmt::format("report window {}+{} is empty", plan.window.frameOff,
                                     plan.window.frameSize),
                         ErrorContext(plan.archiveFile));
    }
    return plan;
}

// =============================================================================
// IndexFileResolver Implementation
// =============================================================================

IndexFileResolver IndexFileResolver::load(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw UsageError(fmt::format("cannot open index file '{}'", path.string()));
    }
    return parse(input, path.string());
}

IndexFileResolver IndexFileResolver::parse(std::istream& input, std::string_view name) {
    IndexFileResolver resolver;
    std::string line;
    std::size_t lineNo = 0;
    std::size_t duplicates = 0;
    bool firstRow = true;

    while (std::getline(input, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }
        const bool headerCandidate = std::exchange(firstRow, false);
        if (headerCandidate && line.starts_with("msm_no")) {
            continue;
        }

        std::array<std::string_view, kIndexColumns> fields;
        const std::size_t count = splitRow(line, fields);
        if (count != kIndexColumns) {
            throw UsageError(fmt::format("{}:{}: expected {} tab-separated columns, found {}",
                                         name, lineNo, kIndexColumns, count));
        }

        auto number = [&](std::size_t column, std::string_view columnName) {
            auto value = parseUnsigned(fields[column]);
            if (!value) {
                throw UsageError(fmt::format("{}:{}: invalid {} '{}'", name, lineNo, columnName,
                                             fields[column]));
            }
            return *value;
        };

        const MeasurementNo msmNo = number(0, "msm_no");
        RecordLocator locator;
        locator.archiveFile = std::string(fields[2]);
        locator.frame.frameOff = number(3, "frame_off");
        locator.frame.frameSize = number(4, "frame_size");
        locator.slice.intraOff = number(5, "intra_off");
        locator.slice.intraSize = number(6, "intra_size");

        if (fields[1].empty() || locator.archiveFile.empty()) {
            throw UsageError(
                fmt::format("{}:{}: report and filename must not be empty", name, lineNo));
        }

        if (!resolver.addRow(msmNo, std::string(fields[1]), std::move(locator))) {
            ++duplicates;
            ACR_LOG_WARNING("{}:{}: duplicate row for measurement {}, keeping the first", name,
                            lineNo, msmNo);
        }
    }

    if (input.bad()) {
        throw UsageError(fmt::format("failed to read index file '{}'", name));
    }

    ACR_LOG_DEBUG("Loaded index {}: {} measurements, {} reports, {} duplicate rows", name,
                  resolver.measurementCount(), resolver.reportCount(), duplicates);
    return resolver;
}

bool IndexFileResolver::addRow(MeasurementNo msmNo, const std::string& reportName,
                               RecordLocator locator) {
    auto [it, inserted] = measurements_.try_emplace(msmNo, locator);
    if (!inserted) {
        return false;
    }

    auto [reportIt, isNewReport] = reports_.try_emplace(reportName);
    ReportLocators& report = reportIt->second;
    if (isNewReport) {
        report.first = locator;
        report.last = locator;
    } else {
        if (locatorOrderLess(locator, report.first)) {
            report.first = locator;
        }
        if (locatorOrderLess(report.last, locator)) {
            report.last = locator;
        }
    }
    report.reportSize += locator.slice.intraSize + 1;
    ++report.recordCount;
    return true;
}

std::optional<RecordLocator> IndexFileResolver::resolveMeasurement(MeasurementNo msmNo) const {
    auto it = measurements_.find(msmNo);
    if (it == measurements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ReportLocators> IndexFileResolver::resolveReport(std::string_view reportName) const {
    auto it = reports_.find(std::string(reportName));
    if (it == reports_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =============================================================================
// Measurement Identifiers
// =============================================================================

MeasurementNo parseMeasurementId(std::string_view measurementId) {
    if (measurementId.starts_with(kMeasurementIdPrefix)) {
        if (auto value = parseUnsigned(measurementId.substr(kMeasurementIdPrefix.size()))) {
            return *value;
        }
    }
    throw UsageError(fmt::format("Invalid measurement_id '{}'", measurementId));
}

}  // namespace acr::archive
