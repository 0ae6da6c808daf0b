#include "syncpoint/endpoint/event_translator.h"

#include <absl/status/status.h>

#include "syncpoint/common/logger.h"
#include "syncpoint/common/path_normalizer.h"

namespace syncpoint {

EventTranslator::EventTranslator(std::shared_ptr<const IFileSystem> fs, IgnoreList ignore,
                                 std::weak_ptr<const Endpoint> source)
    : fs_(std::move(fs)), ignore_(std::move(ignore)), source_(std::move(source)) {}

ChangeEvent EventTranslator::MakeEvent(const RawEvent& raw, std::string path,
                                       ChangeEventType type) const {
    ChangeEvent event;
    event.time = raw.timestamp;
    event.path = std::move(path);
    event.type = type;
    event.source = source_;
    return event;
}

absl::StatusOr<std::optional<ChangeEvent>> EventTranslator::Translate(const RawEvent& raw) const {
    if (ignore_.IsIgnored(raw.path)) {
        return std::nullopt;
    }

    const std::string native = RelativeToRoot(fs_->NativeRoot(), raw.path);
    std::string canonical = ToCanonical(native);

    if (raw.flags & (kRawCreate | kRawWrite)) {
        const auto type = (raw.flags & kRawCreate) ? ChangeEventType::kCreate
                                                   : ChangeEventType::kWrite;
        auto info = fs_->Stat(native);
        if (absl::IsNotFound(info.status())) {
            LOG_DEBUG("[WatchSession] Ephemeral entry skipped: " + canonical);
            return std::nullopt;
        }
        if (!info.ok()) {
            return info.status();
        }

        auto event = MakeEvent(raw, std::move(canonical), type);
        event.size = info->size;
        event.is_folder = info->is_directory;
        return event;
    }

    if (raw.flags & kRawRename) {
        auto info = fs_->Stat(native);
        if (absl::IsNotFound(info.status())) {
            // Moved away, indistinguishable from a removal here
            return MakeEvent(raw, std::move(canonical), ChangeEventType::kRemove);
        }
        if (!info.ok()) {
            return info.status();
        }

        auto event = MakeEvent(raw, std::move(canonical), ChangeEventType::kRename);
        event.size = info->size;
        event.is_folder = info->is_directory;
        return event;
    }

    if (raw.flags & kRawRemove) {
        return MakeEvent(raw, std::move(canonical), ChangeEventType::kRemove);
    }

    return std::nullopt;
}

}  // namespace syncpoint
