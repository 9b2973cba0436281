// =============================================================================
// autoclaved-reader - Report Command Implementation
// =============================================================================

#include "report_command.h"

#include <fmt/format.h>

#include "acr/archive/locator_resolver.h"
#include "acr/archive/report_reconstructor.h"
#include "acr/common/error.h"
#include "acr/common/logger.h"
#include "acr/io/http_range_fetcher.h"
#include "output_target.h"

namespace acr::commands {

ReportCommand::ReportCommand(ReportOptions options, std::ostream& console)
    : options_(std::move(options)), console_(&console) {}

int ReportCommand::execute() {
    try {
        unwrapOrThrow(options_.engine.validate());

        const ReportPlan plan = resolvePlan();
        archive::ReportReconstructor::validatePlan(plan);

        io::HttpRangeFetcher fetcher(options_.engine.archiveBaseUrl, options_.engine.fetch);
        archive::ReportReconstructor reconstructor(fetcher, options_.engine.chunkSize);

        OutputTarget output(options_.outputPath, *console_);
        const auto summary = reconstructor.reconstruct(
            plan, [&output](std::span<const std::uint8_t> chunk) { return output.write(chunk); });

        if (summary.state == ReconstructionState::kCancelled) {
            throw CancelledError(fmt::format("{} stopped accepting output after {} of {} bytes",
                                             output.displayName(), summary.bytesEmitted,
                                             plan.reportSize));
        }
        output.commit();

        ACR_LOG_INFO("Wrote report of {} bytes ({} frames{}) from {} to {}",
                     summary.bytesEmitted, summary.framesDecoded,
                     summary.separatorSynthesized ? ", separator appended" : "",
                     plan.archiveFile, output.displayName());
        return toExitCode(ErrorCode::kSuccess);

    } catch (const ACRException& e) {
        ACR_LOG_ERROR("Report failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        ACR_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInvalidState);
    }
}

ReportPlan ReportCommand::resolvePlan() const {
    if (options_.plan) {
        return *options_.plan;
    }
    if (options_.indexPath.empty() || options_.reportName.empty()) {
        throw UsageError("either --index with --report or --archive with a report window is "
                         "required");
    }

    const auto resolver = archive::IndexFileResolver::load(options_.indexPath);
    auto locators = resolver.resolveReport(options_.reportName);
    if (!locators) {
        throw NotFoundError(fmt::format("report {} is not in index {}", options_.reportName,
                                        options_.indexPath.string()));
    }
    return archive::planReport(*locators);
}

}  // namespace acr::commands
