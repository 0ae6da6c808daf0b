#include "syncpoint/common/in_memory_file_system.h"

#include <sstream>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace syncpoint {

namespace {

constexpr uint32_t kDefaultDirMode = 0777 | kModeDirectory;
constexpr uint32_t kDefaultFileMode = 0666;

// Buffers written bytes and publishes them to the entry on every flush.
class EntryWriteBuffer : public std::stringbuf {
public:
    explicit EntryWriteBuffer(std::shared_ptr<InMemoryFileSystem::Entry> entry)
        : std::stringbuf(std::ios::out), entry_(std::move(entry)) {}

protected:
    int sync() override {
        std::lock_guard<std::mutex> lock(entry_->content_mutex);
        entry_->content = str();
        entry_->mod_time = std::chrono::system_clock::now();
        return 0;
    }

private:
    std::shared_ptr<InMemoryFileSystem::Entry> entry_;
};

class EntryWriter : public std::ostream {
public:
    explicit EntryWriter(std::shared_ptr<InMemoryFileSystem::Entry> entry)
        : std::ostream(nullptr), buffer_(std::move(entry)) {
        rdbuf(&buffer_);
    }

    ~EntryWriter() override { buffer_.pubsync(); }

private:
    EntryWriteBuffer buffer_;
};

}  // namespace

InMemoryFileSystem::InMemoryFileSystem() {
    auto root = std::make_shared<Entry>();
    root->is_directory = true;
    root->mode = kDefaultDirMode;
    root->mod_time = std::chrono::system_clock::now();
    entries_["/"] = std::move(root);
}

std::string InMemoryFileSystem::Clean(const std::filesystem::path& path) {
    std::string clean = (std::filesystem::path("/") / path.relative_path())
                            .lexically_normal()
                            .generic_string();
    while (clean.size() > 1 && clean.back() == '/') {
        clean.pop_back();
    }
    return clean;
}

std::string InMemoryFileSystem::ParentOf(const std::string& clean_path) {
    const auto pos = clean_path.find_last_of('/');
    if (pos == 0 || pos == std::string::npos) {
        return "/";
    }
    return clean_path.substr(0, pos);
}

std::string InMemoryFileSystem::NameOf(const std::string& clean_path) {
    return clean_path.substr(clean_path.find_last_of('/') + 1);
}

FileInfo InMemoryFileSystem::InfoFor(const std::string& clean_path, const Entry& entry) const {
    FileInfo info;
    info.name = NameOf(clean_path);
    info.is_directory = entry.is_directory;
    info.mode = entry.mode;
    std::lock_guard<std::mutex> lock(entry.content_mutex);
    info.mod_time = entry.mod_time;
    info.size = entry.is_directory ? 0 : static_cast<int64_t>(entry.content.size());
    return info;
}

bool InMemoryFileSystem::HasChildrenLocked(const std::string& clean_path) const {
    const std::string prefix = clean_path == "/" ? "/" : clean_path + "/";
    auto it = entries_.upper_bound(prefix);
    return it != entries_.end() && absl::StartsWith(it->first, prefix);
}

absl::StatusOr<FileInfo> InMemoryFileSystem::Stat(const std::filesystem::path& path) const {
    const std::string clean = Clean(path);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(clean);
    if (it == entries_.end()) {
        return absl::NotFoundError(absl::StrCat("No such file or directory: ", clean));
    }
    return InfoFor(clean, *it->second);
}

absl::StatusOr<std::vector<FileInfo>> InMemoryFileSystem::ReadDir(
    const std::filesystem::path& path) const {
    const std::string clean = Clean(path);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(clean);
    if (it == entries_.end()) {
        return absl::NotFoundError(absl::StrCat("No such directory: ", clean));
    }
    if (!it->second->is_directory) {
        return absl::FailedPreconditionError(absl::StrCat("Not a directory: ", clean));
    }

    const std::string prefix = clean == "/" ? "/" : clean + "/";
    std::vector<FileInfo> result;
    for (auto child = entries_.lower_bound(prefix);
         child != entries_.end() && absl::StartsWith(child->first, prefix); ++child) {
        // Only direct children
        if (child->first == clean || child->first.find('/', prefix.size()) != std::string::npos) {
            continue;
        }
        result.push_back(InfoFor(child->first, *child->second));
    }
    return result;
}

absl::StatusOr<std::unique_ptr<std::istream>> InMemoryFileSystem::OpenRead(
    const std::filesystem::path& path) const {
    const std::string clean = Clean(path);

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(clean);
        if (it == entries_.end()) {
            return absl::NotFoundError(absl::StrCat("No such file: ", clean));
        }
        entry = it->second;
    }
    if (entry->is_directory) {
        return absl::FailedPreconditionError(absl::StrCat("Cannot read a directory: ", clean));
    }

    std::lock_guard<std::mutex> content_lock(entry->content_mutex);
    return std::unique_ptr<std::istream>(
        std::make_unique<std::istringstream>(entry->content, std::ios::binary));
}

absl::StatusOr<std::unique_ptr<std::ostream>> InMemoryFileSystem::OpenWrite(
    const std::filesystem::path& path) {
    const std::string clean = Clean(path);
    if (clean == "/") {
        return absl::FailedPreconditionError("Cannot write to the root directory");
    }

    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto parent = entries_.find(ParentOf(clean));
        if (parent == entries_.end() || !parent->second->is_directory) {
            return absl::NotFoundError(
                absl::StrCat("Parent directory does not exist: ", ParentOf(clean)));
        }

        auto it = entries_.find(clean);
        if (it != entries_.end()) {
            if (it->second->is_directory) {
                return absl::FailedPreconditionError(
                    absl::StrCat("Cannot write to a directory: ", clean));
            }
            entry = it->second;
        } else {
            entry = std::make_shared<Entry>();
            entry->mode = kDefaultFileMode;
            entries_[clean] = entry;
        }
    }

    {
        std::lock_guard<std::mutex> content_lock(entry->content_mutex);
        entry->content.clear();
        entry->mod_time = std::chrono::system_clock::now();
    }
    return std::unique_ptr<std::ostream>(std::make_unique<EntryWriter>(std::move(entry)));
}

absl::Status InMemoryFileSystem::MkdirAll(const std::filesystem::path& path) {
    const std::string clean = Clean(path);
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate the whole chain first so a file in the way leaves no partial tree.
    std::vector<std::string> missing;
    for (std::string current = clean;; current = ParentOf(current)) {
        auto it = entries_.find(current);
        if (it != entries_.end()) {
            if (!it->second->is_directory) {
                return absl::AlreadyExistsError(
                    absl::StrCat("A file is in the way of directory ", current));
            }
            break;
        }
        missing.push_back(current);
        if (current == "/") {
            break;
        }
    }

    const auto now = std::chrono::system_clock::now();
    for (const auto& dir : missing) {
        auto entry = std::make_shared<Entry>();
        entry->is_directory = true;
        entry->mode = kDefaultDirMode;
        entry->mod_time = now;
        entries_[dir] = std::move(entry);
    }
    return absl::OkStatus();
}

absl::Status InMemoryFileSystem::RemoveAll(const std::filesystem::path& path) {
    const std::string clean = Clean(path);
    if (clean == "/") {
        return absl::InvalidArgumentError("Refusing to remove the storage root");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(clean);

    const std::string prefix = clean + "/";
    auto it = entries_.lower_bound(prefix);
    while (it != entries_.end() && absl::StartsWith(it->first, prefix)) {
        it = entries_.erase(it);
    }
    return absl::OkStatus();
}

absl::Status InMemoryFileSystem::Rename(const std::filesystem::path& from,
                                        const std::filesystem::path& to) {
    const std::string clean_from = Clean(from);
    const std::string clean_to = Clean(to);
    if (clean_from == "/" || clean_to == "/") {
        return absl::InvalidArgumentError("Cannot rename the storage root");
    }
    if (clean_from == clean_to) {
        return absl::OkStatus();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto source = entries_.find(clean_from);
    if (source == entries_.end()) {
        return absl::NotFoundError(absl::StrCat("No such file or directory: ", clean_from));
    }

    auto parent = entries_.find(ParentOf(clean_to));
    if (parent == entries_.end() || !parent->second->is_directory) {
        return absl::NotFoundError(
            absl::StrCat("Parent directory does not exist: ", ParentOf(clean_to)));
    }

    if (source->second->is_directory && HasChildrenLocked(clean_from)) {
        return absl::FailedPreconditionError(
            absl::StrCat("Directory is not empty, move its entries first: ", clean_from));
    }

    auto target = entries_.find(clean_to);
    if (target != entries_.end() && target->second->is_directory) {
        return absl::AlreadyExistsError(absl::StrCat("Directory exists: ", clean_to));
    }

    auto entry = std::move(source->second);
    entries_.erase(source);
    entries_[clean_to] = std::move(entry);
    return absl::OkStatus();
}

size_t InMemoryFileSystem::EntryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace syncpoint
