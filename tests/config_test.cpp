#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include "syncpoint/endpoint/config.h"

using namespace syncpoint;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

// Test fixture for endpoint configuration tests
class EndpointConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() /
                    ("syncpoint_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(temp_dir_);
        config_file_ = temp_dir_ / "config.json";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
    }

    void WriteConfig(const std::string& text) {
        std::ofstream file(config_file_);
        file << text;
    }

    std::filesystem::path temp_dir_;
    std::filesystem::path config_file_;
};

TEST_F(EndpointConfigTest, DefaultValues) {
    EndpointConfig config;

    EXPECT_EQ(config.GetRootPath(), ".");
    EXPECT_EQ(config.GetPipeCapacity(), 1000u);
    EXPECT_THAT(config.GetIgnorePatterns(), IsEmpty());
    EXPECT_TRUE(config.GetLogPath().empty());
    EXPECT_EQ(config.GetLogLevel(), "info");
}

TEST_F(EndpointConfigTest, SaveLoad) {
    EndpointConfig saved;
    saved.SetRootPath("/home/test/My \"Quoted\" Docs");
    saved.SetPipeCapacity(64);
    saved.AddIgnorePattern("*.part");
    saved.AddIgnorePattern("build-?");
    saved.SetLogPath("/var/log/syncpoint.log");
    saved.SetLogLevel("debug");

    auto status = saved.Save(config_file_);
    ASSERT_TRUE(status.ok()) << status.message();

    EndpointConfig loaded;
    status = loaded.Load(config_file_);
    ASSERT_TRUE(status.ok()) << status.message();

    EXPECT_EQ(loaded.GetRootPath(), "/home/test/My \"Quoted\" Docs");
    EXPECT_EQ(loaded.GetPipeCapacity(), 64u);
    EXPECT_THAT(loaded.GetIgnorePatterns(), ElementsAre("*.part", "build-?"));
    EXPECT_EQ(loaded.GetLogPath(), "/var/log/syncpoint.log");
    EXPECT_EQ(loaded.GetLogLevel(), "debug");
}

TEST_F(EndpointConfigTest, SaveCreatesParentDirectories) {
    const auto nested = temp_dir_ / "a" / "b" / "config.json";
    EndpointConfig config;
    ASSERT_TRUE(config.Save(nested).ok());
    EXPECT_TRUE(std::filesystem::exists(nested));
}

TEST_F(EndpointConfigTest, LoadNonExistentFile) {
    EndpointConfig config;
    auto status = config.Load(temp_dir_ / "missing.json");
    EXPECT_EQ(status.code(), absl::StatusCode::kNotFound);
}

TEST_F(EndpointConfigTest, MissingKeysKeepDefaults) {
    WriteConfig("{ \"log_level\": \"warning\" }");

    EndpointConfig config;
    ASSERT_TRUE(config.Load(config_file_).ok());
    EXPECT_EQ(config.GetLogLevel(), "warning");
    EXPECT_EQ(config.GetPipeCapacity(), 1000u);
    EXPECT_EQ(config.GetRootPath(), ".");
}

TEST_F(EndpointConfigTest, ZeroPipeCapacityIsRejected) {
    WriteConfig("{ \"pipe_capacity\": 0 }");

    EndpointConfig config;
    EXPECT_EQ(config.Load(config_file_).code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(EndpointConfigTest, EndpointOptionsExtendTheDefaultIgnoreList) {
    EndpointConfig config;
    config.SetPipeCapacity(8);
    config.AddIgnorePattern("*.part");

    const auto options = config.ToEndpointOptions();
    EXPECT_EQ(options.pipe_capacity, 8u);
    EXPECT_TRUE(options.ignore.IsIgnored("/movies/film.mkv.part"));
    EXPECT_TRUE(options.ignore.IsIgnored("/docs/.__syncpoint"));
    EXPECT_FALSE(options.ignore.IsIgnored("/movies/film.mkv"));
    EXPECT_FALSE(options.watcher_factory);
}
