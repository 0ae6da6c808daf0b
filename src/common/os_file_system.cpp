#include "syncpoint/common/os_file_system.h"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <absl/strings/str_cat.h>

namespace fs = std::filesystem;

namespace syncpoint {

namespace {

// Links are described, not followed, except for the storage root itself.
absl::StatusOr<FileInfo> InfoFor(const fs::path& full_path, std::string name, bool follow_links) {
    std::error_code ec;
    const auto status =
        follow_links ? fs::status(full_path, ec) : fs::symlink_status(full_path, ec);
    if (ec == std::errc::not_a_directory) {
        // A file stands where a parent directory was expected
        return absl::NotFoundError(absl::StrCat("No such file or directory: ", full_path.string()));
    }
    if (ec) {
        return ErrorCodeToStatus(ec, absl::StrCat("stat ", full_path.string()));
    }

    FileInfo info;
    info.name = std::move(name);
    info.is_directory = fs::is_directory(status);
    info.is_symlink = fs::is_symlink(status);
    info.mode = static_cast<uint32_t>(status.permissions() & fs::perms::mask);
    if (info.is_directory) {
        info.mode |= kModeDirectory;
    } else if (fs::is_regular_file(status)) {
        const auto size = fs::file_size(full_path, ec);
        if (ec) {
            return ErrorCodeToStatus(ec, absl::StrCat("stat ", full_path.string()));
        }
        info.size = static_cast<int64_t>(size);
    }

    // last_write_time follows links, a dangling one has no time to report.
    if (!info.is_symlink) {
        const auto write_time = fs::last_write_time(full_path, ec);
        if (ec) {
            return ErrorCodeToStatus(ec, absl::StrCat("stat ", full_path.string()));
        }
        info.mod_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(write_time));
    }
    return info;
}

}  // namespace

OsFileSystem::OsFileSystem(fs::path root) : root_(std::move(root)) {}

fs::path OsFileSystem::Resolve(const fs::path& path) const {
    // Normalizing against "/" first drops leading "..", nothing escapes the root.
    const auto inside = (fs::path("/") / path.relative_path()).lexically_normal();
    return (root_ / inside.relative_path()).lexically_normal();
}

absl::StatusOr<FileInfo> OsFileSystem::Stat(const fs::path& path) const {
    const auto full_path = Resolve(path);
    return InfoFor(full_path, full_path.filename().string(), full_path == Resolve("/"));
}

absl::StatusOr<std::vector<FileInfo>> OsFileSystem::ReadDir(const fs::path& path) const {
    const auto full_path = Resolve(path);

    std::error_code ec;
    fs::directory_iterator it(full_path, ec);
    if (ec) {
        return ErrorCodeToStatus(ec, absl::StrCat("readdir ", full_path.string()));
    }

    std::vector<FileInfo> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        auto info = InfoFor(it->path(), name, false);
        if (info.ok()) {
            entries.push_back(std::move(*info));
        } else if (!absl::IsNotFound(info.status())) {
            FileInfo unreadable;
            unreadable.name = std::move(name);
            unreadable.error = info.status();
            entries.push_back(std::move(unreadable));
        }
        // Entries that vanished between listing and stat are dropped.
    }
    if (ec) {
        return ErrorCodeToStatus(ec, absl::StrCat("readdir ", full_path.string()));
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });
    return entries;
}

absl::StatusOr<std::unique_ptr<std::istream>> OsFileSystem::OpenRead(const fs::path& path) const {
    const auto full_path = Resolve(path);

    std::error_code ec;
    const auto status = fs::symlink_status(full_path, ec);
    if (ec) {
        return ErrorCodeToStatus(ec, absl::StrCat("open ", full_path.string()));
    }
    if (fs::is_directory(status)) {
        return absl::FailedPreconditionError(
            absl::StrCat("Cannot read a directory: ", full_path.string()));
    }
    // Links may leave the root, FIFOs would block the reader.
    if (!fs::is_regular_file(status)) {
        return absl::FailedPreconditionError(
            absl::StrCat("Not a regular file: ", full_path.string()));
    }

    auto in = std::make_unique<std::ifstream>(full_path, std::ios::binary);
    if (!in->is_open()) {
        return absl::InternalError(absl::StrCat("Failed to open file: ", full_path.string()));
    }
    return std::unique_ptr<std::istream>(std::move(in));
}

absl::StatusOr<std::unique_ptr<std::ostream>> OsFileSystem::OpenWrite(const fs::path& path) {
    const auto full_path = Resolve(path);

    std::error_code ec;
    if (!fs::is_directory(full_path.parent_path(), ec)) {
        return absl::NotFoundError(
            absl::StrCat("Parent directory does not exist: ", full_path.parent_path().string()));
    }
    if (fs::is_directory(full_path, ec)) {
        return absl::FailedPreconditionError(
            absl::StrCat("Cannot write to a directory: ", full_path.string()));
    }

    auto out = std::make_unique<std::ofstream>(full_path, std::ios::binary | std::ios::trunc);
    if (!out->is_open()) {
        return absl::InternalError(
            absl::StrCat("Failed to open file for writing: ", full_path.string()));
    }
    return std::unique_ptr<std::ostream>(std::move(out));
}

absl::Status OsFileSystem::MkdirAll(const fs::path& path) {
    const auto full_path = Resolve(path);

    std::error_code ec;
    fs::create_directories(full_path, ec);
    if (ec) {
        return ErrorCodeToStatus(ec, absl::StrCat("mkdir ", full_path.string()));
    }
    if (!fs::is_directory(full_path, ec)) {
        return absl::AlreadyExistsError(
            absl::StrCat("A file is in the way of directory ", full_path.string()));
    }
    return absl::OkStatus();
}

absl::Status OsFileSystem::RemoveAll(const fs::path& path) {
    const auto full_path = Resolve(path);
    if (full_path == Resolve("/")) {
        return absl::InvalidArgumentError("Refusing to remove the storage root");
    }

    std::error_code ec;
    fs::remove_all(full_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return ErrorCodeToStatus(ec, absl::StrCat("remove ", full_path.string()));
    }
    return absl::OkStatus();
}

absl::Status OsFileSystem::Rename(const fs::path& from, const fs::path& to) {
    const auto full_from = Resolve(from);
    const auto full_to = Resolve(to);

    std::error_code ec;
    fs::rename(full_from, full_to, ec);
    if (ec) {
        return ErrorCodeToStatus(
            ec, absl::StrCat("rename ", full_from.string(), " -> ", full_to.string()));
    }
    return absl::OkStatus();
}

}  // namespace syncpoint
