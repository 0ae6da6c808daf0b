#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace syncpoint {

struct FileInfo {
    std::string name;
    bool is_directory = false;
    int64_t size = 0;
    std::chrono::system_clock::time_point mod_time{};
    uint32_t mode = 0;  // permission bits, plus kModeDirectory for directories

    // Symbolic links are reported as such and never followed
    bool is_symlink = false;

    // ReadDir only: the entry was listed but its metadata could not be read
    absl::Status error;
};

inline constexpr uint32_t kModeDirectory = 0040000;

/* This interface is the storage an endpoint works on. */
/* Paths are native paths relative to the storage root, with a leading separator. */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // Metadata
    virtual absl::StatusOr<FileInfo> Stat(const std::filesystem::path& path) const = 0;

    // Entries of a directory, sorted by name. An entry whose metadata cannot be
    // read is still listed, with `error` set.
    virtual absl::StatusOr<std::vector<FileInfo>> ReadDir(
        const std::filesystem::path& path) const = 0;

    // Content
    virtual absl::StatusOr<std::unique_ptr<std::istream>> OpenRead(
        const std::filesystem::path& path) const = 0;

    // Creates the file if missing, truncates it otherwise. The parent must exist.
    virtual absl::StatusOr<std::unique_ptr<std::ostream>> OpenWrite(
        const std::filesystem::path& path) = 0;

    // Tree operations
    virtual absl::Status MkdirAll(const std::filesystem::path& path) = 0;

    // Missing paths are not an error
    virtual absl::Status RemoveAll(const std::filesystem::path& path) = 0;

    // Replaces an existing file at `to`. The parent of `to` must exist.
    virtual absl::Status Rename(const std::filesystem::path& from,
                                const std::filesystem::path& to) = 0;

    // Capabilities
    virtual std::filesystem::path NativeRoot() const = 0;

    // True for storages that the OS cannot send notifications about
    virtual bool IsVirtual() const = 0;

    // True when renaming a directory carries all of its descendants along
    virtual bool SupportsAtomicSubtreeRename() const = 0;
};

absl::StatusOr<std::string> ReadFile(const IFileSystem& fs, const std::filesystem::path& path);

absl::Status WriteFile(IFileSystem& fs, const std::filesystem::path& path, std::string_view data);

// Maps a std::filesystem error to the matching canonical status code.
absl::Status ErrorCodeToStatus(const std::error_code& ec, std::string_view context);

}  // namespace syncpoint
