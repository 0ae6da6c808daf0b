#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "syncpoint.pb.h"
#include "syncpoint/common/file_system.h"
#include "syncpoint/common/ignore_list.h"
#include "syncpoint/endpoint/file_watcher.h"
#include "syncpoint/endpoint/watch_session.h"

namespace syncpoint {

struct EndpointInfo {
    // Moving a directory only reports the directory, its content must be rescanned
    bool requires_folders_rescan = true;
    // Paths coming from this endpoint need Unicode normalization before comparison
    bool requires_normalization = false;
};

struct EndpointOptions {
    // Initial capacity of the event pipe of each watch
    size_t pipe_capacity = 1000;
    IgnoreList ignore = IgnoreList::WithDefaults();
    // Replaces the platform watcher backend when set
    FileWatcher::ImplFactory watcher_factory;
};

// Called once per walked path with the loaded node or the failure for that path
using WalkCallback =
    std::function<void(const std::string& path, const absl::StatusOr<Node>& node)>;

// Identifier of a node: the persisted uuid of a collection, the etag of a leaf.
const std::string& NodeIdentifier(const Node& node);

/* A directory tree exposed as a synchronization endpoint. */
/* All paths taken and returned are canonical paths. */
class Endpoint : public std::enable_shared_from_this<Endpoint> {
public:
    // Endpoint on a real directory. Throws std::runtime_error if it is unreachable.
    static std::shared_ptr<Endpoint> Open(const std::filesystem::path& root,
                                          EndpointOptions options = {});

    // Endpoint on any storage. Throws std::runtime_error if its root is unreachable.
    static std::shared_ptr<Endpoint> Create(std::unique_ptr<IFileSystem> fs,
                                            EndpointOptions options = {});

    ~Endpoint();

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;
    Endpoint(Endpoint&&) = delete;
    Endpoint& operator=(Endpoint&&) = delete;

    EndpointInfo GetEndpointInfo() const;

    std::filesystem::path RootPath() const;

    IFileSystem& FileSystem() { return *fs_; }

    const IgnoreList& Ignore() const { return options_.ignore; }

    // Pre-order walk of `roots`, or of the whole endpoint when empty. A failure
    // on one path is reported to `visit` and the walk goes on.
    void Walk(const WalkCallback& visit, const std::vector<std::string>& roots = {});

    // Stats the path unless `is_leaf` is given. Collections get a persisted
    // identifier on first load.
    absl::StatusOr<Node> LoadNode(const std::string& path,
                                  std::optional<bool> is_leaf = std::nullopt);

    // Collections only, leaves are written through GetWriterOn
    absl::Status CreateNode(const Node& node);
    absl::Status UpdateNode(const Node& node);

    // Missing paths are not an error
    absl::Status DeleteNode(const std::string& path);

    absl::Status MoveNode(const std::string& old_path, const std::string& new_path);

    absl::StatusOr<std::unique_ptr<std::ostream>> GetWriterOn(const std::string& path);
    absl::StatusOr<std::unique_ptr<std::istream>> GetReaderOn(const std::string& path) const;

    // Starts a recursive watch on a directory. One live session per sub-path.
    // The session must not outlive this endpoint's last owner.
    absl::StatusOr<std::unique_ptr<WatchSession>> Watch(const std::string& sub_path = "/");

    bool IsWatching(const std::string& sub_path) const;

private:
    struct MoveStep {
        std::filesystem::path from;
        std::filesystem::path to;
        bool is_directory = false;
        size_t depth = 0;
    };

    Endpoint(std::shared_ptr<IFileSystem> fs, EndpointOptions options);

    absl::StatusOr<Node> ResolveNode(const std::string& canonical,
                                     const std::filesystem::path& native,
                                     bool is_leaf,
                                     const FileInfo* info);

    absl::StatusOr<std::string> ReadOrCreateFolderId(const std::filesystem::path& native);
    absl::StatusOr<std::string> HashFile(const std::filesystem::path& native) const;

    void WalkTree(const WalkCallback& visit, const std::string& canonical, const FileInfo& info);

    absl::Status CollectSubtree(const std::filesystem::path& dir,
                                size_t depth,
                                std::vector<MoveStep>& steps) const;
    absl::Status MoveRecursively(const std::filesystem::path& old_native,
                                 const std::filesystem::path& new_native);
    absl::Status MoveDirectoryEntry(const std::filesystem::path& from,
                                    const std::filesystem::path& to);

    void ReleaseWatch(const std::string& sub_path);

    std::shared_ptr<IFileSystem> fs_;
    EndpointOptions options_;

    mutable std::mutex watches_mutex_;
    std::set<std::string> active_watches_;
};

}  // namespace syncpoint
