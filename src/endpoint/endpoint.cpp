#include "syncpoint/endpoint/endpoint.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "syncpoint/common/content_hash.h"
#include "syncpoint/common/logger.h"
#include "syncpoint/common/os_file_system.h"
#include "syncpoint/common/path_normalizer.h"
#include "syncpoint/common/uuid.h"
#include "syncpoint/endpoint/event_translator.h"

namespace fs = std::filesystem;

namespace syncpoint {

namespace {

std::string JoinCanonical(const std::string& parent, const std::string& native_name) {
    const std::string child = ToCanonical(native_name);
    return parent == "/" ? child : parent + child;
}

}  // namespace

const std::string& NodeIdentifier(const Node& node) {
    return node.type() == LEAF ? node.etag() : node.uuid();
}

std::shared_ptr<Endpoint> Endpoint::Open(const fs::path& root, EndpointOptions options) {
    std::error_code ec;
    auto absolute = fs::absolute(root, ec);
    if (ec) {
        throw std::runtime_error("Unreachable block storage at " + root.string() + ": " +
                                 ec.message());
    }
    auto storage = std::make_shared<OsFileSystem>(CanonicalRoot(absolute));
    return std::shared_ptr<Endpoint>(new Endpoint(std::move(storage), std::move(options)));
}

std::shared_ptr<Endpoint> Endpoint::Create(std::unique_ptr<IFileSystem> fs,
                                           EndpointOptions options) {
    return std::shared_ptr<Endpoint>(
        new Endpoint(std::shared_ptr<IFileSystem>(std::move(fs)), std::move(options)));
}

Endpoint::Endpoint(std::shared_ptr<IFileSystem> fs, EndpointOptions options)
    : fs_(std::move(fs)), options_(std::move(options)) {
    if (!fs_) {
        throw std::invalid_argument("Endpoint requires a storage backend");
    }

    auto root = fs_->Stat("/");
    if (!root.ok()) {
        throw std::runtime_error("Unreachable block storage at " + fs_->NativeRoot().string() +
                                 ": " + root.status().ToString());
    }
    if (!root->is_directory) {
        throw std::runtime_error("Unreachable block storage at " + fs_->NativeRoot().string() +
                                 ": not a directory");
    }

    LOG_INFO("[Endpoint] Serving " + fs_->NativeRoot().string() +
             (fs_->IsVirtual() ? " (virtual)" : ""));
}

Endpoint::~Endpoint() = default;

EndpointInfo Endpoint::GetEndpointInfo() const {
    EndpointInfo info;
    info.requires_folders_rescan = true;
    info.requires_normalization = PlatformStoresDecomposedUnicode();
    return info;
}

fs::path Endpoint::RootPath() const {
    return fs_->NativeRoot();
}

// Node identity

absl::StatusOr<std::string> Endpoint::HashFile(const fs::path& native) const {
    auto in = fs_->OpenRead(native);
    if (!in.ok()) {
        return in.status();
    }
    return HashStream(**in);
}

absl::StatusOr<std::string> Endpoint::ReadOrCreateFolderId(const fs::path& native) {
    const fs::path marker = native / kFolderMarkerName;

    auto content = ReadFile(*fs_, marker);
    if (content.ok()) {
        std::string uid(absl::StripAsciiWhitespace(*content));
        if (!uid.empty()) {
            return uid;
        }
        LOG_WARNING("[Endpoint] Empty marker in " + native.string() + ", regenerating");
    } else if (!absl::IsNotFound(content.status())) {
        return content.status();
    }

    // Unlocked: two first loads of the same directory may race, the last write wins.
    std::string uid = GenerateUuid();
    auto status = WriteFile(*fs_, marker, uid);
    if (!status.ok()) {
        return status;
    }
    LOG_DEBUG("[Endpoint] New folder id " + uid + " for " + native.string());
    return uid;
}

absl::StatusOr<Node> Endpoint::ResolveNode(const std::string& canonical,
                                           const fs::path& native,
                                           bool is_leaf,
                                           const FileInfo* info) {
    Node node;
    node.set_path(canonical);

    if (is_leaf) {
        auto hash = HashFile(native);
        if (!hash.ok()) {
            return hash.status();
        }
        node.set_type(LEAF);
        node.set_etag(*hash);
    } else {
        auto uid = ReadOrCreateFolderId(native);
        if (!uid.ok()) {
            return uid.status();
        }
        node.set_type(COLLECTION);
        node.set_uuid(*uid);
    }

    if (info != nullptr) {
        node.set_mtime(absl::ToUnixSeconds(absl::FromChrono(info->mod_time)));
        node.set_size(info->size);
        node.set_mode(static_cast<int32_t>(info->mode));
    }
    return node;
}

absl::StatusOr<Node> Endpoint::LoadNode(const std::string& path, std::optional<bool> is_leaf) {
    const std::string canonical = ToCanonical(path);
    const fs::path native = ToNative(canonical);

    if (is_leaf.has_value()) {
        return ResolveNode(canonical, native, *is_leaf, nullptr);
    }

    auto info = fs_->Stat(native);
    if (!info.ok()) {
        return info.status();
    }
    return ResolveNode(canonical, native, !info->is_directory, &*info);
}

// Walk

void Endpoint::Walk(const WalkCallback& visit, const std::vector<std::string>& roots) {
    const std::vector<std::string> targets =
        roots.empty() ? std::vector<std::string>{"/"} : roots;

    for (const auto& root : targets) {
        const std::string canonical = ToCanonical(root);
        auto info = fs_->Stat(ToNative(canonical));
        if (!info.ok()) {
            visit(canonical, info.status());
            continue;
        }
        WalkTree(visit, canonical, *info);
    }
}

void Endpoint::WalkTree(const WalkCallback& visit, const std::string& canonical,
                        const FileInfo& info) {
    const fs::path native = ToNative(canonical);

    // The endpoint root has no node of its own
    if (canonical != "/") {
        visit(canonical, ResolveNode(canonical, native, !info.is_directory, &info));
    }
    if (!info.is_directory) {
        return;
    }

    auto entries = fs_->ReadDir(native);
    if (!entries.ok()) {
        visit(canonical, entries.status());
        return;
    }
    for (const auto& entry : *entries) {
        if (options_.ignore.IsIgnored(entry.name)) {
            continue;
        }
        const std::string child = JoinCanonical(canonical, entry.name);
        if (!entry.error.ok()) {
            visit(child, entry.error);
            continue;
        }
        // Links could loop or leave the root
        if (entry.is_symlink) {
            LOG_DEBUG("[Endpoint] Skipping symbolic link " + child);
            continue;
        }
        WalkTree(visit, child, entry);
    }
}

// CRUD

absl::Status Endpoint::CreateNode(const Node& node) {
    if (node.type() == LEAF) {
        return absl::InvalidArgumentError(
            absl::StrCat("Leaves are written through a writer, not created: ", node.path()));
    }

    const fs::path native = ToNative(node.path());
    auto info = fs_->Stat(native);
    if (info.ok()) {
        if (!info->is_directory) {
            return absl::AlreadyExistsError(
                absl::StrCat("A file exists at ", ToCanonical(node.path())));
        }
        return absl::OkStatus();
    }
    if (!absl::IsNotFound(info.status())) {
        return info.status();
    }

    auto status = fs_->MkdirAll(native);
    if (!status.ok()) {
        return status;
    }
    if (!node.uuid().empty()) {
        status = WriteFile(*fs_, native / kFolderMarkerName, node.uuid());
    }
    LOG_DEBUG("[Endpoint] Created " + ToCanonical(node.path()));
    return status;
}

absl::Status Endpoint::UpdateNode(const Node& node) {
    return CreateNode(node);
}

absl::Status Endpoint::DeleteNode(const std::string& path) {
    const std::string canonical = ToCanonical(path);
    if (canonical == "/") {
        return absl::InvalidArgumentError("Refusing to delete the endpoint root");
    }

    auto status = fs_->RemoveAll(ToNative(canonical));
    if (status.ok()) {
        LOG_DEBUG("[Endpoint] Deleted " + canonical);
    }
    return status;
}

absl::Status Endpoint::MoveNode(const std::string& old_path, const std::string& new_path) {
    const std::string old_canonical = ToCanonical(old_path);
    const std::string new_canonical = ToCanonical(new_path);
    if (old_canonical == new_canonical) {
        return absl::OkStatus();
    }
    if (old_canonical == "/" || new_canonical == "/") {
        return absl::InvalidArgumentError("Cannot move the endpoint root");
    }
    if (absl::StartsWith(new_canonical, old_canonical + "/")) {
        return absl::InvalidArgumentError(
            absl::StrCat("Cannot move ", old_canonical, " into itself: ", new_canonical));
    }

    const fs::path old_native = ToNative(old_canonical);
    const fs::path new_native = ToNative(new_canonical);

    auto info = fs_->Stat(old_native);
    if (absl::IsNotFound(info.status())) {
        return absl::OkStatus();
    }
    if (!info.ok()) {
        return info.status();
    }

    LOG_DEBUG("[Endpoint] Moving " + old_canonical + " to " + new_canonical);
    if (info->is_directory && !fs_->SupportsAtomicSubtreeRename()) {
        return MoveRecursively(old_native, new_native);
    }
    return fs_->Rename(old_native, new_native);
}

absl::Status Endpoint::CollectSubtree(const fs::path& dir, size_t depth,
                                      std::vector<MoveStep>& steps) const {
    auto entries = fs_->ReadDir(dir);
    if (!entries.ok()) {
        return entries.status();
    }
    for (const auto& entry : *entries) {
        if (!entry.error.ok()) {
            return entry.error;
        }
        MoveStep step;
        step.from = dir / entry.name;
        step.is_directory = entry.is_directory;
        step.depth = depth;
        steps.push_back(step);

        if (entry.is_directory) {
            auto status = CollectSubtree(step.from, depth + 1, steps);
            if (!status.ok()) {
                return status;
            }
        }
    }
    return absl::OkStatus();
}

absl::Status Endpoint::MoveRecursively(const fs::path& old_native, const fs::path& new_native) {
    // Marker files are collected too, they carry the directory identities along.
    std::vector<MoveStep> steps;
    auto status = CollectSubtree(old_native, 1, steps);
    if (!status.ok()) {
        return status;
    }

    for (auto& step : steps) {
        step.to = new_native / step.from.lexically_relative(old_native);
    }

    // Children strictly before their parents, reverse discovery order among equals
    std::reverse(steps.begin(), steps.end());
    std::stable_sort(steps.begin(), steps.end(),
                     [](const MoveStep& a, const MoveStep& b) { return a.depth > b.depth; });

    for (const auto& step : steps) {
        if (step.is_directory) {
            status = MoveDirectoryEntry(step.from, step.to);
        } else {
            status = fs_->MkdirAll(step.to.parent_path());
            if (status.ok()) {
                status = fs_->Rename(step.from, step.to);
            }
        }
        if (!status.ok()) {
            LOG_WARNING("[Endpoint] Move of " + step.from.string() + " stopped: " +
                        status.ToString());
            return status;
        }
    }

    return MoveDirectoryEntry(old_native, new_native);
}

absl::Status Endpoint::MoveDirectoryEntry(const fs::path& from, const fs::path& to) {
    auto target = fs_->Stat(to);
    if (absl::IsNotFound(target.status())) {
        auto status = fs_->MkdirAll(to.parent_path());
        if (!status.ok()) {
            return status;
        }
        return fs_->Rename(from, to);
    }
    if (!target.ok()) {
        return target.status();
    }
    if (!target->is_directory) {
        return absl::FailedPreconditionError(
            absl::StrCat("A file is in the way of directory ", to.string()));
    }

    // Entries already went over to the existing target, drop the husk.
    auto left = fs_->ReadDir(from);
    if (!left.ok()) {
        return left.status();
    }
    if (!left->empty()) {
        return absl::FailedPreconditionError(
            absl::StrCat("Directory still has entries after moving them: ", from.string()));
    }
    return fs_->RemoveAll(from);
}

// Content

absl::StatusOr<std::unique_ptr<std::ostream>> Endpoint::GetWriterOn(const std::string& path) {
    return fs_->OpenWrite(ToNative(ToCanonical(path)));
}

absl::StatusOr<std::unique_ptr<std::istream>> Endpoint::GetReaderOn(const std::string& path) const {
    return fs_->OpenRead(ToNative(ToCanonical(path)));
}

// Watch

absl::StatusOr<std::unique_ptr<WatchSession>> Endpoint::Watch(const std::string& sub_path) {
    const std::string canonical = ToCanonical(sub_path);
    const fs::path native = ToNative(canonical);

    auto info = fs_->Stat(native);
    if (!info.ok()) {
        return info.status();
    }
    if (!info->is_directory) {
        return absl::FailedPreconditionError(absl::StrCat("Not a directory: ", canonical));
    }

    {
        std::lock_guard<std::mutex> lock(watches_mutex_);
        if (!active_watches_.insert(canonical).second) {
            return absl::AlreadyExistsError(absl::StrCat("Already watching ", canonical));
        }
    }

    std::unique_ptr<FileWatcher> watcher;
    if (!fs_->IsVirtual()) {
        watcher = options_.watcher_factory
                      ? std::make_unique<FileWatcher>(options_.watcher_factory)
                      : std::make_unique<FileWatcher>();
    }

    fs::path watch_path = fs_->NativeRoot();
    if (!native.relative_path().empty()) {
        watch_path = (watch_path / native.relative_path()).lexically_normal();
    }

    auto session = std::make_unique<WatchSession>(
        canonical, std::move(watcher), watch_path,
        EventTranslator(fs_, options_.ignore, weak_from_this()), options_.pipe_capacity);

    std::weak_ptr<Endpoint> weak_self = weak_from_this();
    session->SetOnClosed([weak_self, canonical]() {
        if (auto self = weak_self.lock()) {
            self->ReleaseWatch(canonical);
        }
    });

    auto status = session->Start();
    if (!status.ok()) {
        ReleaseWatch(canonical);
        return status;
    }
    return session;
}

bool Endpoint::IsWatching(const std::string& sub_path) const {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    return active_watches_.count(ToCanonical(sub_path)) > 0;
}

void Endpoint::ReleaseWatch(const std::string& sub_path) {
    std::lock_guard<std::mutex> lock(watches_mutex_);
    active_watches_.erase(sub_path);
}

}  // namespace syncpoint
