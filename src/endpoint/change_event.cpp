#include "syncpoint/endpoint/change_event.h"

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace syncpoint {

const char* ChangeEventTypeName(ChangeEventType type) {
    switch (type) {
        case ChangeEventType::kCreate: return "create";
        case ChangeEventType::kWrite: return "write";
        case ChangeEventType::kRename: return "rename";
        case ChangeEventType::kRemove: return "remove";
    }
    return "unknown";
}

std::string FormatEventTime(std::chrono::system_clock::time_point time) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E3SZ", absl::FromChrono(time), absl::UTCTimeZone());
}

std::string DescribeEvent(const ChangeEvent& event) {
    std::string out = absl::StrCat(FormatEventTime(event.time), " ",
                                   ChangeEventTypeName(event.type), " ", event.path);
    if (event.is_folder.has_value()) {
        absl::StrAppend(&out, *event.is_folder ? " folder" : " file");
    }
    if (event.size.has_value()) {
        absl::StrAppend(&out, " size=", *event.size);
    }
    return out;
}

}  // namespace syncpoint
