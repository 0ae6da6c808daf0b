#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "syncpoint/common/file_system.h"

namespace syncpoint {

/// Volatile storage for tests. Entries live in a flat ordered map keyed by
/// path, so renaming a directory only relocates the directory entry itself:
/// directories that still have children cannot be renamed.
class InMemoryFileSystem : public IFileSystem {
public:
    InMemoryFileSystem();
    ~InMemoryFileSystem() override = default;

    InMemoryFileSystem(const InMemoryFileSystem&) = delete;
    InMemoryFileSystem& operator=(const InMemoryFileSystem&) = delete;
    InMemoryFileSystem(InMemoryFileSystem&&) = delete;
    InMemoryFileSystem& operator=(InMemoryFileSystem&&) = delete;

    absl::StatusOr<FileInfo> Stat(const std::filesystem::path& path) const override;
    absl::StatusOr<std::vector<FileInfo>> ReadDir(
        const std::filesystem::path& path) const override;

    absl::StatusOr<std::unique_ptr<std::istream>> OpenRead(
        const std::filesystem::path& path) const override;
    absl::StatusOr<std::unique_ptr<std::ostream>> OpenWrite(
        const std::filesystem::path& path) override;

    absl::Status MkdirAll(const std::filesystem::path& path) override;
    absl::Status RemoveAll(const std::filesystem::path& path) override;
    absl::Status Rename(const std::filesystem::path& from,
                        const std::filesystem::path& to) override;

    std::filesystem::path NativeRoot() const override { return "/"; }
    bool IsVirtual() const override { return true; }
    bool SupportsAtomicSubtreeRename() const override { return false; }

    // Number of entries including the root, for tests
    size_t EntryCount() const;

    struct Entry {
        bool is_directory = false;
        uint32_t mode = 0;
        std::chrono::system_clock::time_point mod_time{};

        // Guards content, writers may outlive the map slot.
        mutable std::mutex content_mutex;
        std::string content;
    };

private:
    static std::string Clean(const std::filesystem::path& path);
    static std::string ParentOf(const std::string& clean_path);
    static std::string NameOf(const std::string& clean_path);

    FileInfo InfoFor(const std::string& clean_path, const Entry& entry) const;
    bool HasChildrenLocked(const std::string& clean_path) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace syncpoint
