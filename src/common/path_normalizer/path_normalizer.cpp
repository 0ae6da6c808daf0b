#include "syncpoint/common/path_normalizer.h"

namespace syncpoint {

namespace {

std::filesystem::path WithoutTrailingSeparator(const std::filesystem::path& p) {
    auto normal = p.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        return normal.parent_path();
    }
    return normal;
}

}  // namespace

std::string RelativeToRoot(const std::filesystem::path& root,
                           const std::filesystem::path& absolute_path) {
    const auto base = WithoutTrailingSeparator(root);
    const auto target = absolute_path.lexically_normal();
    const auto rel = target.lexically_relative(base);

    if (rel.empty() || *rel.begin() == "..") {
        return absolute_path.string();
    }

    const std::string separator(1, std::filesystem::path::preferred_separator);
    if (rel == ".") {
        return separator;
    }
    return separator + rel.string();
}

}  // namespace syncpoint
