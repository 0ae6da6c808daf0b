#include "syncpoint/common/logger.h"

#include <absl/strings/ascii.h>

namespace syncpoint {

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    if (lower == "none") {
        return LogLevel::NONE;
    }
    return std::nullopt;
}

}  // namespace syncpoint
