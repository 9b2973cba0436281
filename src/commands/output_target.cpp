// =============================================================================
// autoclaved-reader - Command Output Target Implementation
// =============================================================================

#include "output_target.h"

#include <csignal>
#include <system_error>

#include <fmt/format.h>

#include "acr/common/error.h"
#include "acr/common/logger.h"

namespace acr::commands {

void ignoreBrokenPipe() {
    std::signal(SIGPIPE, SIG_IGN);
}

OutputTarget::OutputTarget(const std::filesystem::path& path, std::ostream& console)
    : path_(path), console_(&console), toStdout_(path.empty() || path == "-") {
    if (toStdout_) {
        return;
    }
    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_) {
        throw UsageError(fmt::format("cannot create output file '{}'", path_.string()));
    }
}

OutputTarget::~OutputTarget() {
    if (toStdout_ || committed_) {
        return;
    }
    file_.close();
    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
        ACR_LOG_DEBUG("Removed partial output file {}", path_.string());
    } else if (ec) {
        ACR_LOG_WARNING("Failed to remove partial output file {}: {}", path_.string(),
                        ec.message());
    }
}

std::ostream& OutputTarget::stream() noexcept {
    return toStdout_ ? *console_ : file_;
}

bool OutputTarget::write(std::span<const std::uint8_t> bytes) {
    std::ostream& out = stream();
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

void OutputTarget::commit() {
    std::ostream& out = stream();
    out.flush();
    if (!out) {
        throw CancelledError(fmt::format("failed to flush output to {}", displayName()));
    }
    if (!toStdout_) {
        file_.close();
        if (file_.fail()) {
            throw CancelledError(fmt::format("failed to close output file {}", displayName()));
        }
    }
    committed_ = true;
}

std::string OutputTarget::displayName() const {
    return toStdout_ ? std::string("stdout") : path_.string();
}

}  // namespace acr::commands
