#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "syncpoint/common/file_system.h"

namespace syncpoint {

/// Real filesystem below a base directory. "/a/b" maps to <root>/a/b.
class OsFileSystem : public IFileSystem {
public:
    explicit OsFileSystem(std::filesystem::path root);
    ~OsFileSystem() override = default;

    OsFileSystem(const OsFileSystem&) = delete;
    OsFileSystem& operator=(const OsFileSystem&) = delete;
    OsFileSystem(OsFileSystem&&) = delete;
    OsFileSystem& operator=(OsFileSystem&&) = delete;

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

    std::filesystem::path NativeRoot() const override { return root_; }
    bool IsVirtual() const override { return false; }
    bool SupportsAtomicSubtreeRename() const override { return true; }

private:
    std::filesystem::path Resolve(const std::filesystem::path& path) const;

    std::filesystem::path root_;
};

}  // namespace syncpoint
