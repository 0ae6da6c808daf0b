#include "syncpoint/common/path_normalizer.h"

#include <cstdlib>
#include <memory>

#include <utf8proc.h>

namespace syncpoint {

namespace {

struct FreeDeleter {
    void operator()(utf8proc_uint8_t* p) const { std::free(p); }
};

using Utf8ProcString = std::unique_ptr<utf8proc_uint8_t, FreeDeleter>;

std::string WithLeadingSeparator(std::string_view p) {
    const auto start = p.find_first_not_of(kInternalPathSeparator);
    std::string out(1, kInternalPathSeparator);
    if (start != std::string_view::npos) {
        out.append(p.substr(start));
    }
    return out;
}

// utf8proc returns NULL for invalid UTF-8, such names are kept byte for byte.
std::string Normalize(const std::string& p, utf8proc_uint8_t* (*form)(const utf8proc_uint8_t*)) {
    Utf8ProcString normalized(form(reinterpret_cast<const utf8proc_uint8_t*>(p.c_str())));
    if (!normalized) {
        return p;
    }
    return std::string(reinterpret_cast<const char*>(normalized.get()));
}

}  // namespace

std::string ToCanonical(std::string_view native_path) {
    return Normalize(WithLeadingSeparator(native_path), &utf8proc_NFC);
}

std::string ToNative(std::string_view canonical_path) {
    return Normalize(WithLeadingSeparator(canonical_path), &utf8proc_NFD);
}

bool PlatformStoresDecomposedUnicode() {
    return true;
}

std::filesystem::path CanonicalRoot(const std::filesystem::path& root) {
    return root;
}

}  // namespace syncpoint
