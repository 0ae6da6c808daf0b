#include "syncpoint/common/path_normalizer.h"

namespace syncpoint {

namespace {

std::string WithLeadingSeparator(std::string_view p) {
    const auto start = p.find_first_not_of(kInternalPathSeparator);
    std::string out(1, kInternalPathSeparator);
    if (start != std::string_view::npos) {
        out.append(p.substr(start));
    }
    return out;
}

}  // namespace

std::string ToCanonical(std::string_view native_path) {
    return WithLeadingSeparator(native_path);
}

std::string ToNative(std::string_view canonical_path) {
    return WithLeadingSeparator(canonical_path);
}

bool PlatformStoresDecomposedUnicode() {
    return false;
}

std::filesystem::path CanonicalRoot(const std::filesystem::path& root) {
    return root;
}

}  // namespace syncpoint
