// =============================================================================
// autoclaved-reader - Extract Command Implementation
// =============================================================================

#include "extract_command.h"

#include <fmt/format.h>

#include "acr/archive/locator_resolver.h"
#include "acr/archive/record_extractor.h"
#include "acr/common/error.h"
#include "acr/common/logger.h"
#include "acr/io/http_range_fetcher.h"
#include "output_target.h"

namespace acr::commands {

ExtractCommand::ExtractCommand(ExtractOptions options, std::ostream& console)
    : options_(std::move(options)), console_(&console) {}

int ExtractCommand::execute() {
    try {
        unwrapOrThrow(options_.engine.validate());

        const RecordLocator locator = resolveLocator();

        io::HttpRangeFetcher fetcher(options_.engine.archiveBaseUrl, options_.engine.fetch);
        archive::RecordExtractor extractor(fetcher, options_.engine.chunkSize);
        const auto record = extractor.extract(locator);

        OutputTarget output(options_.outputPath, *console_);
        if (!output.write(record)) {
            throw CancelledError(
                fmt::format("failed to write {} record bytes to {}", record.size(),
                            output.displayName()));
        }
        output.commit();

        ACR_LOG_INFO("Extracted {} bytes from {} to {}", record.size(), locator.archiveFile,
                     output.displayName());
        return toExitCode(ErrorCode::kSuccess);

    } catch (const ACRException& e) {
        ACR_LOG_ERROR("Extract failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        ACR_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInvalidState);
    }
}

RecordLocator ExtractCommand::resolveLocator() const {
    if (options_.locator) {
        return *options_.locator;
    }
    if (options_.indexPath.empty() || options_.measurementId.empty()) {
        throw UsageError("either --index with --id or --archive with record coordinates is "
                         "required");
    }

    const MeasurementNo msmNo = archive::parseMeasurementId(options_.measurementId);
    const auto resolver = archive::IndexFileResolver::load(options_.indexPath);
    auto locator = resolver.resolveMeasurement(msmNo);
    if (!locator) {
        throw NotFoundError(fmt::format("measurement {} is not in index {}",
                                        options_.measurementId, options_.indexPath.string()));
    }
    return *locator;
}

}  // namespace acr::commands
