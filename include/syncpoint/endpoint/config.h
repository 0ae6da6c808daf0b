#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "syncpoint/endpoint/endpoint.h"

namespace syncpoint {

class EndpointConfig {
public:
    EndpointConfig();
    ~EndpointConfig();

    EndpointConfig(const EndpointConfig&) = delete;
    EndpointConfig& operator=(const EndpointConfig&) = delete;
    EndpointConfig(EndpointConfig&&) = delete;
    EndpointConfig& operator=(EndpointConfig&&) = delete;

    // Load configuration from file
    absl::Status Load(const std::filesystem::path& config_file);

    // Save configuration to file
    absl::Status Save(const std::filesystem::path& config_file) const;

    // Directory exposed as the endpoint
    void SetRootPath(const std::filesystem::path& path);
    const std::filesystem::path& GetRootPath() const;

    // Watch settings
    void SetPipeCapacity(size_t capacity);
    size_t GetPipeCapacity() const;

    // Extra glob patterns on top of the default ignore list
    void AddIgnorePattern(const std::string& pattern);
    const std::vector<std::string>& GetIgnorePatterns() const;

    // Logging
    void SetLogPath(const std::filesystem::path& path);
    const std::filesystem::path& GetLogPath() const;

    void SetLogLevel(const std::string& level);
    const std::string& GetLogLevel() const;

    // Options for Endpoint::Open built from these settings
    EndpointOptions ToEndpointOptions() const;

private:
    std::filesystem::path root_path_;
    size_t pipe_capacity_;
    std::vector<std::string> ignore_patterns_;

    std::filesystem::path log_path_;
    std::string log_level_;
};

}  // namespace syncpoint
