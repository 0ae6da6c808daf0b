#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>

#include <unistd.h>

#include "syncpoint/endpoint/endpoint.h"

using namespace syncpoint;

// Exercises the platform watcher backend on a real directory.
class WatchIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("syncpoint_watch_integration_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "docs");
        endpoint_ = Endpoint::Open(root_);
    }

    void TearDown() override {
        endpoint_.reset();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    void WriteLocal(const std::string& relative, const std::string& content) {
        std::ofstream out(root_ / relative, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // Skips unrelated notifications until the expected one arrives
    std::optional<ChangeEvent> WaitFor(WatchSession& session,
                                       const std::string& path,
                                       ChangeEventType type,
                                       std::optional<int64_t> size = std::nullopt) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            auto event = session.Events().ReceiveFor(std::chrono::milliseconds(100));
            if (!event) {
                continue;
            }
            if (event->path == path && event->type == type &&
                (!size || event->size == size)) {
                return event;
            }
        }
        return std::nullopt;
    }

    std::filesystem::path root_;
    std::shared_ptr<Endpoint> endpoint_;
};

TEST_F(WatchIntegrationTest, FileLifecycle) {
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok()) << session.status();

    WriteLocal("docs/readme.txt", "v1");
    auto created = WaitFor(**session, "/docs/readme.txt", ChangeEventType::kCreate, 2);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->is_folder, false);

    WriteLocal("docs/readme.txt", "v2");
    auto written = WaitFor(**session, "/docs/readme.txt", ChangeEventType::kWrite, 2);
    ASSERT_TRUE(written.has_value());

    std::filesystem::remove(root_ / "docs" / "readme.txt");
    auto removed = WaitFor(**session, "/docs/readme.txt", ChangeEventType::kRemove);
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed->size.has_value());

    (*session)->Cancel();
    (*session)->Wait();
    EXPECT_EQ((*session)->State(), WatchState::kClosed);
}

TEST_F(WatchIntegrationTest, NewDirectoriesAreFollowed) {
    auto session = endpoint_->Watch();
    ASSERT_TRUE(session.ok()) << session.status();

    std::filesystem::create_directories(root_ / "album");
    auto folder = WaitFor(**session, "/album", ChangeEventType::kCreate);
    ASSERT_TRUE(folder.has_value());
    EXPECT_EQ(folder->is_folder, true);

    // Give the backend time to subscribe to the new directory
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    WriteLocal("album/photo.jpg", "jpeg");
    EXPECT_TRUE(WaitFor(**session, "/album/photo.jpg", ChangeEventType::kCreate).has_value());
}

TEST_F(WatchIntegrationTest, SubPathOnlySeesItsSubtree) {
    auto session = endpoint_->Watch("/docs");
    ASSERT_TRUE(session.ok()) << session.status();

    WriteLocal("outside.txt", "o");
    WriteLocal("docs/inside.txt", "i");

    auto event = WaitFor(**session, "/docs/inside.txt", ChangeEventType::kCreate);
    ASSERT_TRUE(event.has_value());

    (*session)->Cancel();
    while (auto late = (*session)->Events().Receive()) {
        EXPECT_NE(late->path, "/outside.txt");
    }
}
