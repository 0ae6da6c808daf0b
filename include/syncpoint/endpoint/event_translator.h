#pragma once

#include <memory>
#include <optional>

#include <absl/status/statusor.h>

#include "syncpoint/common/file_system.h"
#include "syncpoint/common/ignore_list.h"
#include "syncpoint/endpoint/change_event.h"
#include "syncpoint/endpoint/file_watcher.h"

namespace syncpoint {

class Endpoint;

/// Reduces one raw OS notification to at most one ChangeEvent.
///
/// Create and write notifications are confirmed with a stat: a target that is
/// already gone was ephemeral and yields nothing. A rename whose target is
/// gone is reported as a removal. Removals are reported without a stat.
/// Stat failures other than NotFound are returned as errors.
class EventTranslator {
public:
    EventTranslator(std::shared_ptr<const IFileSystem> fs, IgnoreList ignore,
                    std::weak_ptr<const Endpoint> source);

    absl::StatusOr<std::optional<ChangeEvent>> Translate(const RawEvent& raw) const;

private:
    ChangeEvent MakeEvent(const RawEvent& raw, std::string path, ChangeEventType type) const;

    std::shared_ptr<const IFileSystem> fs_;
    IgnoreList ignore_;
    std::weak_ptr<const Endpoint> source_;
};

}  // namespace syncpoint
