#include "syncpoint/common/path_normalizer.h"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace syncpoint {

namespace {

constexpr char kNativeSeparator = '\\';

std::string WithLeadingSeparator(std::string_view p, char separator) {
    const auto start = p.find_first_not_of("/\\");
    std::string out(1, separator);
    if (start != std::string_view::npos) {
        out.append(p.substr(start));
    }
    return out;
}

}  // namespace

std::string ToCanonical(std::string_view native_path) {
    std::string out = WithLeadingSeparator(native_path, kInternalPathSeparator);
    std::replace(out.begin(), out.end(), kNativeSeparator, kInternalPathSeparator);
    return out;
}

std::string ToNative(std::string_view canonical_path) {
    std::string out = WithLeadingSeparator(canonical_path, kNativeSeparator);
    std::replace(out.begin(), out.end(), kInternalPathSeparator, kNativeSeparator);
    return out;
}

bool PlatformStoresDecomposedUnicode() {
    return false;
}

std::filesystem::path CanonicalRoot(const std::filesystem::path& root) {
    std::string trimmed = root.string();
    const auto start = trimmed.find_first_not_of("/\\");
    trimmed = start == std::string::npos ? std::string() : trimmed.substr(start);

    std::error_code ec;
    const auto resolved = std::filesystem::canonical(trimmed, ec);
    if (ec) {
        return trimmed;
    }

    // Drive letters compare case-insensitively, keep them lowercase.
    std::string out = resolved.string();
    if (out.size() >= 2 && out[1] == ':') {
        out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    }
    return out;
}

}  // namespace syncpoint
