#include "syncpoint/endpoint/file_watcher.h"

#include <sys/inotify.h>
#include <unistd.h>
#include <poll.h>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "syncpoint/common/logger.h"

namespace syncpoint {

namespace {

constexpr uint32_t kWatchMask =
    IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB;

uint32_t ToRawFlags(uint32_t mask) {
    uint32_t flags = 0;
    if (mask & IN_CREATE) {
        flags |= kRawCreate;
    }
    if (mask & IN_MODIFY) {
        flags |= kRawWrite;
    }
    if (mask & (IN_MOVED_FROM | IN_MOVED_TO)) {
        flags |= kRawRename;
    }
    if (mask & IN_DELETE) {
        flags |= kRawRemove;
    }
    if (mask & IN_ATTRIB) {
        flags |= kRawOther;
    }
    return flags;
}

}  // namespace

class InotifyFileWatcherImpl : public FileWatcher::Impl {
public:
    explicit InotifyFileWatcherImpl(FileWatcher* owner) : Impl(owner) {}

    ~InotifyFileWatcherImpl() override {
        if (watch_thread_.joinable()) {
            watch_thread_.join();
        }
        if (inotify_fd_ != -1) {
            close(inotify_fd_);
        }
    }

    void StartImpl() override {
        init_error_.clear();
        init_done_ = false;

        watch_thread_ = std::thread([this]() { WatchThread(); });

        std::unique_lock<std::mutex> lock(init_mutex_);
        init_cv_.wait(lock, [this]() { return init_done_; });

        if (!init_error_.empty()) {
            lock.unlock();
            if (watch_thread_.joinable()) {
                watch_thread_.join();
            }
            throw std::runtime_error(init_error_);
        }
    }

    void StopImpl() override {
        // The owner already cleared its running flag, the loop exits on the
        // next poll timeout.
        if (watch_thread_.joinable()) {
            watch_thread_.join();
        }
    }

    void AddWatchImpl(const std::filesystem::path& path, bool recursive) override {
        // All inotify calls happen on the watch thread, so only record the
        // request here.
        pending_watches_[path] = recursive;
    }

    void RemoveWatchImpl(const std::filesystem::path& path) override {
        pending_watches_.erase(path);
    }

private:
    void AddWatchRecursive(const std::filesystem::path& path, bool recursive) {
        int wd = inotify_add_watch(inotify_fd_, path.c_str(), kWatchMask);
        if (wd == -1) {
            throw std::runtime_error("Failed to add watch for " + path.string() +
                                     ": " + std::string(std::strerror(errno)));
        }

        wd_to_path_[wd] = path;
        recursive_[wd] = recursive;

        if (!recursive || !std::filesystem::is_directory(path)) {
            return;
        }

        std::error_code ec;
        for (auto it = std::filesystem::recursive_directory_iterator(
                 path, std::filesystem::directory_options::skip_permission_denied, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code entry_ec;
            if (!it->is_directory(entry_ec)) {
                continue;
            }
            int sub_wd = inotify_add_watch(inotify_fd_, it->path().c_str(), kWatchMask);
            if (sub_wd == -1) {
                LOG_WARNING("[FileWatcher] Cannot watch " + it->path().string() + ": " +
                            std::strerror(errno));
                continue;
            }
            wd_to_path_[sub_wd] = it->path();
            recursive_[sub_wd] = true;
        }
        if (ec) {
            LOG_WARNING("[FileWatcher] Incomplete scan of " + path.string() + ": " + ec.message());
        }
    }

    void FinishInit(const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(init_mutex_);
            init_error_ = error;
            init_done_ = true;
        }
        init_cv_.notify_one();
    }

    void WatchThread() {
        inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);

        if (inotify_fd_ == -1) {
            FinishInit("Failed to initialize inotify: " + std::string(std::strerror(errno)));
            return;
        }

        for (const auto& [path, recursive] : pending_watches_) {
            try {
                AddWatchRecursive(path, recursive);
            } catch (const std::exception& e) {
                close(inotify_fd_);
                inotify_fd_ = -1;
                wd_to_path_.clear();
                recursive_.clear();
                FinishInit("Failed to add watch: " + std::string(e.what()));
                return;
            }
        }

        FinishInit("");

        WatchLoop();

        // Closing the descriptor drops every watch at once.
        close(inotify_fd_);
        inotify_fd_ = -1;

        wd_to_path_.clear();
        recursive_.clear();
    }

    void WatchLoop() {
        constexpr size_t BUF_LEN = 4096;
        alignas(struct inotify_event) char buf[BUF_LEN];

        struct pollfd pfd;
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;

        while (IsOwnerRunning()) {
            int poll_result = poll(&pfd, 1, 100);  // 100ms timeout

            if (poll_result == -1) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("[FileWatcher] poll failed: " + std::string(std::strerror(errno)));
                break;
            }

            if (poll_result == 0) {
                continue;  // Timeout, check running flag
            }

            ssize_t len = read(inotify_fd_, buf, sizeof(buf));
            if (len == -1) {
                if (errno == EAGAIN || errno == EINTR) {
                    continue;
                }
                LOG_ERROR("[FileWatcher] read failed: " + std::string(std::strerror(errno)));
                break;
            }

            for (char* ptr = buf; ptr < buf + len; ) {
                auto* event = reinterpret_cast<struct inotify_event*>(ptr);
                ProcessEvent(event);
                ptr += sizeof(struct inotify_event) + event->len;
            }
        }
    }

    void ProcessEvent(const struct inotify_event* event) {
        if (event->mask & IN_Q_OVERFLOW) {
            LOG_WARNING("[FileWatcher] inotify queue overflow, events were lost");
            return;
        }

        auto it = wd_to_path_.find(event->wd);
        if (it == wd_to_path_.end()) {
            return;
        }

        if (event->mask & IN_IGNORED) {
            // Watched directory is gone
            recursive_.erase(event->wd);
            wd_to_path_.erase(it);
            return;
        }

        std::filesystem::path full_path = it->second;
        if (event->len > 0) {
            full_path /= event->name;
        }

        // New subdirectories join the recursive watch.
        if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO)) &&
            recursive_[event->wd]) {
            try {
                AddWatchRecursive(full_path, true);
            } catch (const std::exception& e) {
                // It may already be gone again, the event still goes out.
                LOG_DEBUG(std::string("[FileWatcher] ") + e.what());
            }
        }

        RawEvent raw;
        raw.path = std::move(full_path);
        raw.flags = ToRawFlags(event->mask);
        raw.timestamp = std::chrono::system_clock::now();
        Emit(raw);
    }

    int inotify_fd_ = -1;
    std::thread watch_thread_;

    std::mutex init_mutex_;
    std::condition_variable init_cv_;
    bool init_done_ = false;
    std::string init_error_;

    std::map<std::filesystem::path, bool> pending_watches_;  // path -> recursive flag
    std::map<int, std::filesystem::path> wd_to_path_;        // watch descriptor -> path
    std::map<int, bool> recursive_;                          // watch descriptor -> recursive flag
};

FileWatcher::FileWatcher() {
    pimpl_ = std::make_unique<InotifyFileWatcherImpl>(this);
}

}  // namespace syncpoint
