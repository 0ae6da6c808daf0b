#include "syncpoint/endpoint/watch_session.h"

#include <stdexcept>

#include <absl/strings/str_cat.h>

#include "syncpoint/common/logger.h"

namespace syncpoint {

const char* WatchStateName(WatchState state) {
    switch (state) {
        case WatchState::kIdle: return "idle";
        case WatchState::kSubscribed: return "subscribed";
        case WatchState::kDraining: return "draining";
        case WatchState::kClosed: return "closed";
    }
    return "unknown";
}

WatchSession::WatchSession(std::string sub_path,
                           std::unique_ptr<FileWatcher> watcher,
                           std::filesystem::path watch_path,
                           EventTranslator translator,
                           size_t pipe_capacity)
    : sub_path_(std::move(sub_path)),
      watch_path_(std::move(watch_path)),
      translator_(std::move(translator)),
      pipe_capacity_(pipe_capacity),
      watcher_(std::move(watcher)) {}

WatchSession::~WatchSession() {
    Cancel();
    if (supervisor_thread_.joinable()) {
        supervisor_thread_.join();
    }
    if (translator_thread_.joinable()) {
        translator_thread_.join();
    }
}

absl::Status WatchSession::Start() {
    if (state_.load() != WatchState::kIdle) {
        return absl::FailedPreconditionError(
            absl::StrCat("Watch on ", sub_path_, " was already started"));
    }

    if (!watcher_) {
        LOG_INFO("[WatchSession] Virtual storage, " + sub_path_ + " will not report changes");
        state_ = WatchState::kSubscribed;
        supervisor_thread_ = std::thread([this]() { Supervise(); });
        return absl::OkStatus();
    }

    pipe_ = std::make_unique<EventPipe<RawEvent>>(pipe_capacity_);
    auto* pipe = pipe_.get();
    watcher_->SetEventCallback([pipe](const RawEvent& raw) {
        // Fails only once the input is closed during shutdown
        pipe->Input().Send(raw);
    });

    try {
        watcher_->AddWatch(watch_path_, true);
        watcher_->Start();
    } catch (const std::exception& e) {
        pipe_.reset();
        return absl::UnavailableError(
            absl::StrCat("Cannot watch ", watch_path_.string(), ": ", e.what()));
    }

    state_ = WatchState::kSubscribed;
    LOG_INFO("[WatchSession] Watching " + watch_path_.string());

    translator_thread_ = std::thread([this]() { TranslateLoop(); });
    supervisor_thread_ = std::thread([this]() { Supervise(); });
    return absl::OkStatus();
}

void WatchSession::Cancel() {
    if (cancel_requested_.exchange(true)) {
        return;
    }
    done_.Close();
}

void WatchSession::Wait() {
    std::unique_lock<std::mutex> lock(closed_mutex_);
    closed_cv_.wait(lock, [this]() { return state_.load() == WatchState::kClosed; });
}

void WatchSession::SetOnClosed(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(closed_mutex_);
    on_closed_ = std::move(callback);
}

void WatchSession::Supervise() {
    // Only ever closed, never written
    done_.Receive();

    state_ = WatchState::kDraining;
    LOG_DEBUG("[WatchSession] Draining " + sub_path_);

    if (!watcher_) {
        events_.Close();
        errors_.Close();
        MarkClosed();
        return;
    }

    // No callback runs after Stop() returns, closing the input cannot race a send.
    watcher_->Stop();
    pipe_->Input().Close();
}

void WatchSession::TranslateLoop() {
    while (auto raw = pipe_->Output().Receive()) {
        auto event = translator_.Translate(*raw);
        if (!event.ok()) {
            LOG_WARNING("[WatchSession] " + event.status().ToString());
            errors_.Send(event.status());
            continue;
        }
        if (event->has_value()) {
            LOG_DEBUG("[WatchSession] " + DescribeEvent(**event));
            events_.Send(std::move(**event));
        }
    }

    events_.Close();
    errors_.Close();
    MarkClosed();
}

void WatchSession::MarkClosed() {
    std::function<void()> on_closed;
    {
        std::lock_guard<std::mutex> lock(closed_mutex_);
        on_closed = std::move(on_closed_);
        on_closed_ = nullptr;
    }
    // Runs before waiters wake, Wait() returns with the sub-path released.
    if (on_closed) {
        on_closed();
    }

    {
        std::lock_guard<std::mutex> lock(closed_mutex_);
        state_ = WatchState::kClosed;
    }
    closed_cv_.notify_all();
    LOG_INFO("[WatchSession] Closed watch on " + sub_path_);
}

}  // namespace syncpoint
