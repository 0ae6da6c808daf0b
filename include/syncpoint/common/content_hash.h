#pragma once

#include <istream>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

namespace syncpoint {

/// Streams `in` to the end and returns the lowercase hex MD5 of its bytes.
/// Used as the content signature of leaf nodes.
absl::StatusOr<std::string> HashStream(std::istream& in);

absl::StatusOr<std::string> HashBytes(std::string_view data);

}  // namespace syncpoint
