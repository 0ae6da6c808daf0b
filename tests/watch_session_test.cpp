#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "syncpoint/common/in_memory_file_system.h"
#include "syncpoint/common/os_file_system.h"
#include "syncpoint/endpoint/endpoint.h"

using namespace syncpoint;
using ::testing::ElementsAre;

namespace {

constexpr auto kReceiveTimeout = std::chrono::seconds(5);

class ScriptedWatcherImpl;

// Shared between a test and the backends created for it
struct Script {
    std::mutex mutex;
    ScriptedWatcherImpl* impl = nullptr;
    bool fail_start = false;
    int stops = 0;
    std::vector<std::filesystem::path> watched;
};

// Backend driven by the test instead of the OS
class ScriptedWatcherImpl : public FileWatcher::Impl {
public:
    ScriptedWatcherImpl(FileWatcher* owner, std::shared_ptr<Script> script)
        : Impl(owner), script_(std::move(script)) {}

    ~ScriptedWatcherImpl() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->impl == this) {
            script_->impl = nullptr;
        }
    }

    void StartImpl() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        if (script_->fail_start) {
            throw std::runtime_error("inotify instance limit reached");
        }
        script_->impl = this;
    }

    void StopImpl() override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        ++script_->stops;
    }

    void AddWatchImpl(const std::filesystem::path& path, bool) override {
        std::lock_guard<std::mutex> lock(script_->mutex);
        script_->watched.push_back(path);
    }

    void RemoveWatchImpl(const std::filesystem::path&) override {}

    void Inject(const std::filesystem::path& path, uint32_t flags) {
        if (!IsOwnerRunning()) {
            return;
        }
        RawEvent raw;
        raw.path = path;
        raw.flags = flags;
        raw.timestamp = std::chrono::system_clock::now();
        Emit(raw);
    }

private:
    std::shared_ptr<Script> script_;
};

// Real directory with one path whose metadata cannot be read
class LockedPathFileSystem : public OsFileSystem {
public:
    using OsFileSystem::OsFileSystem;

    absl::StatusOr<FileInfo> Stat(const std::filesystem::path& path) const override {
        if (path == "/locked") {
            return absl::PermissionDeniedError("stat /locked");
        }
        return OsFileSystem::Stat(path);
    }
};

}  // namespace

class WatchSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("syncpoint_watch_session_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "docs");

        script_ = std::make_shared<Script>();
        EndpointOptions options;
        options.pipe_capacity = 4;
        auto script = script_;
        options.watcher_factory = [script](FileWatcher* owner) {
            return std::unique_ptr<FileWatcher::Impl>(new ScriptedWatcherImpl(owner, script));
        };
        endpoint_ = Endpoint::Create(std::make_unique<LockedPathFileSystem>(root_),
                                     std::move(options));
    }

    void TearDown() override {
        endpoint_.reset();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void Touch(const std::string& relative, const std::string& content = "x") {
        std::ofstream out(root_ / relative, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void Inject(const std::string& relative, uint32_t flags) {
        std::lock_guard<std::mutex> lock(script_->mutex);
        ASSERT_NE(script_->impl, nullptr);
        script_->impl->Inject(root_ / relative, flags);
    }

    std::filesystem::path root_;
    std::shared_ptr<Script> script_;
    std::shared_ptr<Endpoint> endpoint_;
};

TEST_F(WatchSessionTest, DeliversEventsInOrder) {
    Touch("a.txt", "1");
    Touch("b.txt", "22");
    Touch("docs/c.txt", "333");

    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok()) << session.status();
    EXPECT_EQ((*session)->State(), WatchState::kSubscribed);

    Inject("a.txt", kRawCreate);
    Inject("b.txt", kRawWrite);
    Inject("docs/c.txt", kRawCreate);

    std::vector<std::string> paths;
    for (int i = 0; i < 3; ++i) {
        auto event = (*session)->Events().ReceiveFor(kReceiveTimeout);
        ASSERT_TRUE(event.has_value());
        paths.push_back(event->path);
        EXPECT_EQ(event->is_folder, false);
        EXPECT_EQ(event->source.lock(), endpoint_);
    }
    EXPECT_THAT(paths, ElementsAre("/a.txt", "/b.txt", "/docs/c.txt"));
}

TEST_F(WatchSessionTest, CancelDeliversBufferedEventsThenCloses) {
    Touch("busy.log");
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok());

    constexpr int kBurst = 500;
    for (int i = 0; i < kBurst; ++i) {
        Inject("busy.log", kRawWrite);
    }
    (*session)->Cancel();
    (*session)->Cancel();

    int received = 0;
    while (auto event = (*session)->Events().Receive()) {
        EXPECT_EQ(event->type, ChangeEventType::kWrite);
        ++received;
    }
    EXPECT_EQ(received, kBurst);
    EXPECT_FALSE((*session)->Errors().Receive().has_value());

    (*session)->Wait();
    EXPECT_EQ((*session)->State(), WatchState::kClosed);
    EXPECT_FALSE(endpoint_->IsWatching("/"));
    EXPECT_EQ(script_->stops, 1);
}

TEST_F(WatchSessionTest, EphemeralAndIgnoredPathsAreDropped) {
    Touch(".DS_Store");
    Touch("kept.txt");
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok());

    Inject("vanished.tmp", kRawCreate);
    Inject(".DS_Store", kRawWrite);
    Inject("kept.txt", kRawWrite);

    auto event = (*session)->Events().ReceiveFor(kReceiveTimeout);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->path, "/kept.txt");
}

TEST_F(WatchSessionTest, RemovalsAreReportedWithoutMetadata) {
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok());

    Inject("docs/old.txt", kRawRemove);
    Inject("docs/moved.txt", kRawRename);

    auto removed = (*session)->Events().ReceiveFor(kReceiveTimeout);
    auto renamed = (*session)->Events().ReceiveFor(kReceiveTimeout);
    ASSERT_TRUE(removed.has_value());
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(removed->type, ChangeEventType::kRemove);
    EXPECT_FALSE(removed->size.has_value());
    EXPECT_EQ(renamed->type, ChangeEventType::kRemove);
    EXPECT_EQ(renamed->path, "/docs/moved.txt");
}

TEST_F(WatchSessionTest, StatFailuresGoToErrors) {
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok());

    Inject("locked", kRawCreate);
    auto error = (*session)->Errors().ReceiveFor(kReceiveTimeout);
    ASSERT_TRUE(error.has_value());
    EXPECT_TRUE(absl::IsPermissionDenied(*error));

    // The session keeps going
    Touch("after.txt");
    Inject("after.txt", kRawCreate);
    auto event = (*session)->Events().ReceiveFor(kReceiveTimeout);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->path, "/after.txt");
}

TEST_F(WatchSessionTest, OneSessionPerSubPath) {
    auto first = endpoint_->Watch("/docs");
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(endpoint_->IsWatching("/docs"));
    EXPECT_TRUE(absl::IsAlreadyExists(endpoint_->Watch("/docs").status()));

    auto other = endpoint_->Watch("/");
    EXPECT_TRUE(other.ok());

    (*first)->Cancel();
    (*first)->Wait();
    EXPECT_FALSE(endpoint_->IsWatching("/docs"));
    EXPECT_TRUE(endpoint_->Watch("/docs").ok());
}

TEST_F(WatchSessionTest, SubPathWatchesItsOwnDirectory) {
    auto session = endpoint_->Watch("/docs");
    ASSERT_TRUE(session.ok());
    EXPECT_EQ((*session)->SubPath(), "/docs");

    std::lock_guard<std::mutex> lock(script_->mutex);
    ASSERT_EQ(script_->watched.size(), 1u);
    EXPECT_EQ(script_->watched[0], (root_ / "docs").lexically_normal());
}

TEST_F(WatchSessionTest, DestroyingTheSessionReleasesTheSubPath) {
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok());
    session->reset();
    EXPECT_FALSE(endpoint_->IsWatching("/"));
}

TEST_F(WatchSessionTest, RejectsFilesAndMissingPaths) {
    Touch("plain.txt");
    EXPECT_TRUE(absl::IsFailedPrecondition(endpoint_->Watch("/plain.txt").status()));
    EXPECT_TRUE(absl::IsNotFound(endpoint_->Watch("/nowhere").status()));
    EXPECT_FALSE(endpoint_->IsWatching("/plain.txt"));
}

TEST_F(WatchSessionTest, SubscriptionFailureReleasesTheSubPath) {
    script_->fail_start = true;
    auto session = endpoint_->Watch();
    EXPECT_TRUE(absl::IsUnavailable(session.status()));
    EXPECT_FALSE(endpoint_->IsWatching("/"));

    script_->fail_start = false;
    EXPECT_TRUE(endpoint_->Watch().ok());
}

TEST(VirtualWatchTest, ReportsNothingAndClosesOnCancel) {
    auto endpoint = Endpoint::Create(std::make_unique<InMemoryFileSystem>());
    auto session = endpoint->Watch();
    ASSERT_TRUE(session.ok()) << session.status();
    EXPECT_EQ((*session)->State(), WatchState::kSubscribed);
    EXPECT_TRUE(endpoint->IsWatching("/"));

    EXPECT_FALSE((*session)->Events().ReceiveFor(std::chrono::milliseconds(50)).has_value());

    (*session)->Cancel();
    EXPECT_FALSE((*session)->Events().Receive().has_value());
    EXPECT_FALSE((*session)->Errors().Receive().has_value());
    (*session)->Wait();
    EXPECT_EQ((*session)->State(), WatchState::kClosed);
    EXPECT_FALSE(endpoint->IsWatching("/"));
}

TEST(WatchStateTest, Names) {
    EXPECT_STREQ(WatchStateName(WatchState::kIdle), "idle");
    EXPECT_STREQ(WatchStateName(WatchState::kSubscribed), "subscribed");
    EXPECT_STREQ(WatchStateName(WatchState::kDraining), "draining");
    EXPECT_STREQ(WatchStateName(WatchState::kClosed), "closed");
}
