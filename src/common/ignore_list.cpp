#include "syncpoint/common/ignore_list.h"

namespace syncpoint {

IgnoreList IgnoreList::WithDefaults() {
    IgnoreList list;
    for (const char* glob : {kFolderMarkerName, ".DS_Store", "Thumbs.db", "desktop.ini",
                             "*.swp", "*.swx", "*~", ".~lock.*", "*.tmp"}) {
        list.Add(glob);
    }
    return list;
}

void IgnoreList::Add(const std::string& glob) {
    if (glob.empty()) {
        return;
    }
    globs_.push_back(glob);
    regexes_.emplace_back(GlobToRegex(glob));
}

bool IgnoreList::IsIgnored(const std::filesystem::path& path) const {
    // Trailing separators leave an empty filename, fall back to the parent's.
    std::string name = path.filename().string();
    if (name.empty()) {
        name = path.parent_path().filename().string();
    }
    if (name.empty()) {
        return false;
    }

    for (const auto& re : regexes_) {
        if (std::regex_match(name, re)) {
            return true;
        }
    }
    return false;
}

std::string IgnoreList::GlobToRegex(const std::string& glob) {
    std::string out = "^";
    for (char c : glob) {
        switch (c) {
        case '*': out += ".*"; break;
        case '?': out += "."; break;
        case '.': case '+': case '(': case ')': case '[': case ']':
        case '{': case '}': case '^': case '$': case '|': case '\\':
            out += '\\';
            out += c;
            break;
        default:
            out += c;
            break;
        }
    }
    out += "$";
    return out;
}

}  // namespace syncpoint
