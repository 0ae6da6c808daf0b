#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <absl/status/status.h>

#include "syncpoint/common/channel.h"
#include "syncpoint/endpoint/change_event.h"
#include "syncpoint/endpoint/event_pipe.h"
#include "syncpoint/endpoint/event_translator.h"
#include "syncpoint/endpoint/file_watcher.h"

namespace syncpoint {

enum class WatchState {
    kIdle,        // created, not subscribed yet
    kSubscribed,  // OS notifications flow in
    kDraining,    // unsubscribed, buffered notifications are still translated
    kClosed       // Events() and Errors() are closed
};

const char* WatchStateName(WatchState state);

/// One subscription on a directory below an endpoint root.
///
/// Raw notifications travel from the FileWatcher thread through an EventPipe
/// to a translator thread which publishes ChangeEvents on Events() and
/// per-event failures on Errors(). Cancel() stops the subscription, the
/// buffered notifications are still delivered, then both channels close.
///
/// A session without a FileWatcher (virtual storage) never produces events.
class WatchSession {
public:
    WatchSession(std::string sub_path,
                 std::unique_ptr<FileWatcher> watcher,
                 std::filesystem::path watch_path,
                 EventTranslator translator,
                 size_t pipe_capacity);

    // Cancels and waits for the threads to finish
    ~WatchSession();

    WatchSession(const WatchSession&) = delete;
    WatchSession& operator=(const WatchSession&) = delete;
    WatchSession(WatchSession&&) = delete;
    WatchSession& operator=(WatchSession&&) = delete;

    // Subscribes to the OS and starts delivering. Only valid once.
    absl::Status Start();

    // Ordered changes. Closed once the session is done.
    Channel<ChangeEvent>& Events() { return events_; }

    // Non-fatal per-event failures. Closed together with Events().
    Channel<absl::Status>& Errors() { return errors_; }

    // Single-use done signal. Later calls do nothing.
    void Cancel();

    // Blocks until the session reached kClosed
    void Wait();

    WatchState State() const { return state_.load(); }

    const std::string& SubPath() const { return sub_path_; }

    // Runs once, on the session's own thread, when the session closes
    void SetOnClosed(std::function<void()> callback);

private:
    void Supervise();
    void TranslateLoop();
    void MarkClosed();

    const std::string sub_path_;
    const std::filesystem::path watch_path_;
    EventTranslator translator_;
    const size_t pipe_capacity_;

    Channel<ChangeEvent> events_;
    Channel<absl::Status> errors_;

    // Closed by the first Cancel()
    Channel<bool> done_;
    std::atomic<bool> cancel_requested_{false};

    std::atomic<WatchState> state_{WatchState::kIdle};
    std::mutex closed_mutex_;
    std::condition_variable closed_cv_;
    std::function<void()> on_closed_;

    // The watcher callback feeds the pipe, so the watcher goes first.
    std::unique_ptr<EventPipe<RawEvent>> pipe_;
    std::unique_ptr<FileWatcher> watcher_;

    std::thread supervisor_thread_;
    std::thread translator_thread_;
};

}  // namespace syncpoint
