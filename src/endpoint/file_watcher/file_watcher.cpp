#include "syncpoint/endpoint/file_watcher.h"

#include <stdexcept>
#include <system_error>

#include "syncpoint/common/logger.h"

namespace syncpoint {

FileWatcher::FileWatcher(const ImplFactory& factory) {
    pimpl_ = factory(this);
    if (!pimpl_) {
        throw std::invalid_argument("FileWatcher backend factory returned null");
    }
}

FileWatcher::~FileWatcher() {
    Stop();
}

void FileWatcher::AddWatch(const std::filesystem::path& path, bool recursive) {
    if (running_) {
        throw std::runtime_error("Cannot add watch while watcher is running");
    }

    std::error_code ec;
    const bool is_directory = std::filesystem::is_directory(path, ec);
    if (ec || !is_directory) {
        throw std::runtime_error("Not a watchable directory: " + path.string());
    }

    LOG_DEBUG("[FileWatcher] Watch " + path.string() + (recursive ? " (recursive)" : ""));
    pimpl_->AddWatchImpl(path, recursive);
}

void FileWatcher::RemoveWatch(const std::filesystem::path& path) {
    if (running_) {
        throw std::runtime_error("Cannot remove watch while watcher is running");
    }
    LOG_DEBUG("[FileWatcher] Unwatch " + path.string());
    pimpl_->RemoveWatchImpl(path);
}

void FileWatcher::SetEventCallback(RawEventCallback callback) {
    if (running_) {
        throw std::runtime_error("Cannot replace the callback while watcher is running");
    }
    callback_ = std::move(callback);
}

void FileWatcher::Start() {
    if (running_.exchange(true)) {
        return;
    }
    if (!callback_) {
        running_ = false;
        throw std::runtime_error("Event callback must be set before starting");
    }

    try {
        pimpl_->StartImpl();
    } catch (const std::exception& e) {
        running_ = false;
        LOG_ERROR("[FileWatcher] Backend failed to start: " + std::string(e.what()));
        throw;
    }
}

void FileWatcher::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Backends join their threads here, nothing reaches the callback afterwards.
    pimpl_->StopImpl();
    LOG_DEBUG("[FileWatcher] Stopped");
}

bool FileWatcher::IsRunning() const {
    return running_;
}

void FileWatcher::Impl::Emit(const RawEvent& event) {
    if (owner_->callback_) {
        owner_->callback_(event);
    }
}

bool FileWatcher::Impl::IsOwnerRunning() const {
    return owner_->running_;
}

}  // namespace syncpoint
