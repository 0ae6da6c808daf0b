#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace syncpoint {

/// Name of the hidden file persisting a directory's identifier.
inline constexpr char kFolderMarkerName[] = ".__syncpoint";

/// Glob patterns matched against the last path component.
/// Supports `*` and `?`; everything else matches literally.
class IgnoreList {
public:
    IgnoreList() = default;

    /// Marker file, OS metadata files and editor swap/lock files.
    static IgnoreList WithDefaults();

    void Add(const std::string& glob);

    bool IsIgnored(const std::filesystem::path& path) const;

    const std::vector<std::string>& Patterns() const { return globs_; }

private:
    static std::string GlobToRegex(const std::string& glob);

    std::vector<std::string> globs_;
    std::vector<std::regex> regexes_;
};

}  // namespace syncpoint
