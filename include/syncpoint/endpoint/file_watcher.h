#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

namespace syncpoint {

// Raw notification kinds, several may be set on one event.
enum RawEventFlag : uint32_t {
    kRawCreate = 1u << 0,
    kRawWrite = 1u << 1,
    kRawRename = 1u << 2,
    kRawRemove = 1u << 3,
    kRawOther = 1u << 4,  // attribute changes, overflows, anything unsupported
};

struct RawEvent {
    std::filesystem::path path;  // absolute OS path
    uint32_t flags = 0;
    std::chrono::system_clock::time_point timestamp;
};

using RawEventCallback = std::function<void(const RawEvent&)>;

/// OS notification source. The backend is picked per platform by the build
/// (inotify on Linux, libfswatch elsewhere). The callback runs on the
/// backend's thread and must not block.
class FileWatcher {
public:
    class Impl;
    using ImplFactory = std::function<std::unique_ptr<Impl>(FileWatcher*)>;

    // Platform backend
    FileWatcher();

    // Custom backend, e.g. a scripted one in tests
    explicit FileWatcher(const ImplFactory& factory);

    ~FileWatcher();

    FileWatcher(const FileWatcher&) = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;
    FileWatcher(FileWatcher&&) = delete;
    FileWatcher& operator=(FileWatcher&&) = delete;

    // Add a directory to watch
    // recursive - whether to watch subdirectories
    void AddWatch(const std::filesystem::path& path, bool recursive = true);

    // Remove a directory from watching
    void RemoveWatch(const std::filesystem::path& path);

    // Set callback for raw events
    void SetEventCallback(RawEventCallback callback);

    // Start watching (asynchronously). Throws std::runtime_error if the OS
    // subscription cannot be established.
    void Start();

    // Stop watching. No callback runs once this returns.
    void Stop();

    // Check if watcher is running
    bool IsRunning() const;

    class Impl {
    public:
        explicit Impl(FileWatcher* owner) : owner_(owner) {}
        virtual ~Impl() = default;

        virtual void StartImpl() = 0;
        virtual void StopImpl() = 0;
        virtual void AddWatchImpl(const std::filesystem::path& path, bool recursive) = 0;
        virtual void RemoveWatchImpl(const std::filesystem::path& path) = 0;

    protected:
        void Emit(const RawEvent& event);
        bool IsOwnerRunning() const;

        FileWatcher* owner_;
    };

private:
    std::unique_ptr<Impl> pimpl_;

    RawEventCallback callback_;
    std::atomic<bool> running_{false};

    friend class Impl;
};

}  // namespace syncpoint
