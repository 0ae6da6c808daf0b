#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace syncpoint {

inline constexpr char kInternalPathSeparator = '/';

// Canonical paths always start with a single '/', use '/' between components
// and are NFC-normalized. Native paths are what the storage backend expects,
// relative to the endpoint root but with a leading separator.
//
// The conversion strategy is fixed per target platform at build time, each
// platform has its own translation unit.

/// Native (OS or backend) path to canonical form. Empty input gives "/".
std::string ToCanonical(std::string_view native_path);

/// Canonical path to the form the storage backend stores.
std::string ToNative(std::string_view canonical_path);

/// True where the native filesystem hands out decomposed (NFD) names.
bool PlatformStoresDecomposedUnicode();

/// Prepares a user supplied root directory before it backs an endpoint.
std::filesystem::path CanonicalRoot(const std::filesystem::path& root);

/// Strips `root` off an absolute OS path, keeping a leading separator.
/// Paths outside of `root` are returned unchanged.
std::string RelativeToRoot(const std::filesystem::path& root,
                           const std::filesystem::path& absolute_path);

}  // namespace syncpoint
