#include "syncpoint/common/file_system.h"

#include <iterator>

#include <absl/strings/str_cat.h>

namespace syncpoint {

absl::StatusOr<std::string> ReadFile(const IFileSystem& fs, const std::filesystem::path& path) {
    auto in = fs.OpenRead(path);
    if (!in.ok()) {
        return in.status();
    }

    std::string content((std::istreambuf_iterator<char>(**in)), std::istreambuf_iterator<char>());
    if ((*in)->bad()) {
        return absl::InternalError(absl::StrCat("Failed to read ", path.string()));
    }
    return content;
}

absl::Status WriteFile(IFileSystem& fs, const std::filesystem::path& path, std::string_view data) {
    auto out = fs.OpenWrite(path);
    if (!out.ok()) {
        return out.status();
    }

    (*out)->write(data.data(), static_cast<std::streamsize>(data.size()));
    (*out)->flush();
    if (!**out) {
        return absl::InternalError(absl::StrCat("Failed to write ", path.string()));
    }
    return absl::OkStatus();
}

absl::Status ErrorCodeToStatus(const std::error_code& ec, std::string_view context) {
    const auto condition = ec.default_error_condition();
    const std::string message = absl::StrCat(absl::string_view(context.data(), context.size()), ": ", ec.message());
    if (condition.category() == std::generic_category()) {
        return absl::ErrnoToStatus(condition.value(), message);
    }
    return absl::InternalError(message);
}

}  // namespace syncpoint
