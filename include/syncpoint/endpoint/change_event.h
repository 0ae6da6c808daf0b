#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace syncpoint {

class Endpoint;

enum class ChangeEventType {
    kCreate,
    kWrite,
    kRename,
    kRemove
};

/// One detected change below an endpoint root.
struct ChangeEvent {
    std::chrono::system_clock::time_point time;
    std::string path;  // canonical
    ChangeEventType type = ChangeEventType::kCreate;

    // Set for create, write and rename while the target still exists
    std::optional<int64_t> size;
    std::optional<bool> is_folder;

    // The endpoint that detected the change. Never owning.
    std::weak_ptr<const Endpoint> source;
};

const char* ChangeEventTypeName(ChangeEventType type);

/// UTC, millisecond precision: 2006-01-02T15:04:05.000Z
std::string FormatEventTime(std::chrono::system_clock::time_point time);

std::string DescribeEvent(const ChangeEvent& event);

}  // namespace syncpoint
