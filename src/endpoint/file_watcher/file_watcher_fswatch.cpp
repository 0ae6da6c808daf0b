#include "syncpoint/endpoint/file_watcher.h"

#include <libfswatch/c++/monitor.hpp>
#include <libfswatch/c++/monitor_factory.hpp>

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "syncpoint/common/logger.h"

namespace syncpoint {

namespace {

uint32_t ToRawFlags(const std::vector<fsw_event_flag>& flags) {
    uint32_t raw = 0;
    for (const auto& flag : flags) {
        switch (flag) {
            case fsw_event_flag::Created:
                raw |= kRawCreate;
                break;
            case fsw_event_flag::Updated:
                raw |= kRawWrite;
                break;
            case fsw_event_flag::Removed:
                raw |= kRawRemove;
                break;
            case fsw_event_flag::Renamed:
            case fsw_event_flag::MovedFrom:
            case fsw_event_flag::MovedTo:
                raw |= kRawRename;
                break;
            case fsw_event_flag::IsFile:
            case fsw_event_flag::IsDir:
            case fsw_event_flag::IsSymLink:
                break;
            default:
                raw |= kRawOther;
                break;
        }
    }
    return raw;
}

}  // namespace

class FswatchFileWatcherImpl : public FileWatcher::Impl {
public:
    explicit FswatchFileWatcherImpl(FileWatcher* owner) : Impl(owner) {}

    ~FswatchFileWatcherImpl() override {
        StopMonitor();
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
        StopMonitor();
    }

    void AddWatchImpl(const std::filesystem::path& path, bool recursive) override {
        watches_[path] = recursive;
    }

    void RemoveWatchImpl(const std::filesystem::path& path) override {
        watches_.erase(path);
    }

private:
    // Static callback wrapper for fswatch
    static void StaticEventCallback(const std::vector<fsw::event>& events, void* context) {
        auto* impl = static_cast<FswatchFileWatcherImpl*>(context);
        impl->ProcessEvents(events);
    }

    void FinishInit(const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(init_mutex_);
            init_error_ = error;
            init_done_ = true;
        }
        init_cv_.notify_one();
    }

    void StopMonitor() {
        {
            std::lock_guard<std::mutex> lock(monitor_mutex_);
            if (monitor_) {
                monitor_->stop();
            }
        }
        if (watch_thread_.joinable()) {
            watch_thread_.join();
        }
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_.reset();
    }

    void WatchThread() {
        std::vector<std::string> paths;
        bool recursive = false;
        for (const auto& [path, path_recursive] : watches_) {
            paths.push_back(path.string());
            recursive = recursive || path_recursive;
        }

        if (paths.empty()) {
            FinishInit("No paths to watch");
            return;
        }

        try {
            fsw::monitor* raw_monitor = fsw::monitor_factory::create_monitor(
                fsw_monitor_type::system_default_monitor_type, paths, &StaticEventCallback);
            if (!raw_monitor) {
                FinishInit("Failed to create fswatch monitor");
                return;
            }

            {
                std::lock_guard<std::mutex> lock(monitor_mutex_);
                monitor_.reset(raw_monitor);
                monitor_->set_context(this);
                // The system monitors follow new subdirectories on their own.
                monitor_->set_recursive(recursive);
                monitor_->set_latency(0.1);
            }
        } catch (const std::exception& e) {
            FinishInit("Failed to start monitor: " + std::string(e.what()));
            return;
        }

        FinishInit("");

        try {
            // Blocks until stop() is called
            monitor_->start();
        } catch (const std::exception& e) {
            LOG_ERROR("[FileWatcher] fswatch monitor failed: " + std::string(e.what()));
        }
    }

    void ProcessEvents(const std::vector<fsw::event>& events) {
        if (!IsOwnerRunning()) {
            return;
        }

        for (const auto& fsw_event : events) {
            const auto& flags = fsw_event.get_flags();
            for (const auto& flag : flags) {
                if (flag == fsw_event_flag::Overflow) {
                    LOG_WARNING("[FileWatcher] fswatch queue overflow, events were lost");
                }
            }

            RawEvent raw;
            raw.path = fsw_event.get_path();
            raw.flags = ToRawFlags(flags);
            raw.timestamp = std::chrono::system_clock::now();
            Emit(raw);
        }
    }

    std::mutex monitor_mutex_;
    std::unique_ptr<fsw::monitor> monitor_;
    std::thread watch_thread_;

    std::mutex init_mutex_;
    std::condition_variable init_cv_;
    bool init_done_ = false;
    std::string init_error_;

    std::map<std::filesystem::path, bool> watches_;  // path -> recursive flag
};

FileWatcher::FileWatcher() {
    pimpl_ = std::unique_ptr<FileWatcher::Impl>(new FswatchFileWatcherImpl(this));
}

}  // namespace syncpoint
