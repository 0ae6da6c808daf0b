#include "syncpoint/endpoint/config.h"

#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string_view>

namespace syncpoint {

namespace {

std::string JsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string JsonUnescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out += s[i];
            continue;
        }
        switch (s[++i]) {
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        default:
            out += s[i];
            break;
        }
    }
    return out;
}

// Matches a JSON string body, escaped quotes included
constexpr std::string_view kStringBody = "((?:[^\"\\\\]|\\\\.)*)";

std::optional<std::string> ExtractJsonStringField(const std::string& text, std::string_view key) {
    std::string pattern;
    pattern += "\"";
    pattern += key;
    pattern += "\"\\s*:\\s*\"";
    pattern += kStringBody;
    pattern += "\"";

    const std::regex re(pattern);
    std::smatch m;
    if (!std::regex_search(text, m, re) || m.size() < 2) {
        return std::nullopt;
    }
    return JsonUnescape(m[1].str());
}

std::optional<long long> ExtractJsonIntField(const std::string& text, std::string_view key) {
    std::string pattern;
    pattern += "\"";
    pattern += key;
    pattern += "\"\\s*:\\s*([0-9]+)";

    const std::regex re(pattern);
    std::smatch m;
    if (!std::regex_search(text, m, re) || m.size() < 2) {
        return std::nullopt;
    }
    return std::stoll(m[1].str());
}

std::optional<std::vector<std::string>> ExtractJsonStringArray(const std::string& text,
                                                               std::string_view key) {
    std::string pattern;
    pattern += "\"";
    pattern += key;
    pattern += "\"\\s*:\\s*\\[([^\\]]*)\\]";

    const std::regex array_re(pattern);
    std::smatch array_m;
    if (!std::regex_search(text, array_m, array_re) || array_m.size() < 2) {
        return std::nullopt;
    }

    const std::string body = array_m[1].str();
    const std::regex item_re(std::string("\"") + std::string(kStringBody) + "\"");
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(body.begin(), body.end(), item_re);
         it != std::sregex_iterator(); ++it) {
        out.push_back(JsonUnescape((*it)[1].str()));
    }
    return out;
}

}  // namespace

EndpointConfig::EndpointConfig()
    : root_path_("."),
      pipe_capacity_(1000),
      log_level_("info") {
}

EndpointConfig::~EndpointConfig() = default;

absl::Status EndpointConfig::Load(const std::filesystem::path& config_file) {
    std::ifstream in(config_file);
    if (!in.is_open()) {
        return absl::NotFoundError("Config file not found");
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    if (auto v = ExtractJsonStringField(text, "root_path")) {
        root_path_ = *v;
    }
    if (auto v = ExtractJsonIntField(text, "pipe_capacity")) {
        if (*v <= 0) {
            return absl::InvalidArgumentError("pipe_capacity must be positive");
        }
        pipe_capacity_ = static_cast<size_t>(*v);
    }
    if (auto v = ExtractJsonStringArray(text, "ignore_patterns")) {
        ignore_patterns_ = std::move(*v);
    }
    if (auto v = ExtractJsonStringField(text, "log_path")) {
        log_path_ = *v;
    }
    if (auto v = ExtractJsonStringField(text, "log_level")) {
        log_level_ = *v;
    }
    return absl::OkStatus();
}

absl::Status EndpointConfig::Save(const std::filesystem::path& config_file) const {
    std::error_code ec;
    auto parent = config_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return absl::InternalError("Failed to create config directory");
        }
    }

    std::ofstream out(config_file, std::ios::trunc);
    if (!out.is_open()) {
        return absl::InternalError("Failed to open config file for writing");
    }

    out << "{\n";
    out << "  \"root_path\": \"" << JsonEscape(root_path_.string()) << "\",\n";
    out << "  \"pipe_capacity\": " << pipe_capacity_ << ",\n";
    out << "  \"ignore_patterns\": [";
    for (size_t i = 0; i < ignore_patterns_.size(); ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << "\"" << JsonEscape(ignore_patterns_[i]) << "\"";
    }
    out << "],\n";
    out << "  \"log_path\": \"" << JsonEscape(log_path_.string()) << "\",\n";
    out << "  \"log_level\": \"" << JsonEscape(log_level_) << "\"\n";
    out << "}\n";

    if (!out) {
        return absl::InternalError("Failed to write config file");
    }
    return absl::OkStatus();
}

void EndpointConfig::SetRootPath(const std::filesystem::path& path) {
    root_path_ = path;
}

const std::filesystem::path& EndpointConfig::GetRootPath() const {
    return root_path_;
}

void EndpointConfig::SetPipeCapacity(size_t capacity) {
    pipe_capacity_ = capacity;
}

size_t EndpointConfig::GetPipeCapacity() const {
    return pipe_capacity_;
}

void EndpointConfig::AddIgnorePattern(const std::string& pattern) {
    ignore_patterns_.push_back(pattern);
}

const std::vector<std::string>& EndpointConfig::GetIgnorePatterns() const {
    return ignore_patterns_;
}

void EndpointConfig::SetLogPath(const std::filesystem::path& path) {
    log_path_ = path;
}

const std::filesystem::path& EndpointConfig::GetLogPath() const {
    return log_path_;
}

void EndpointConfig::SetLogLevel(const std::string& level) {
    log_level_ = level;
}

const std::string& EndpointConfig::GetLogLevel() const {
    return log_level_;
}

EndpointOptions EndpointConfig::ToEndpointOptions() const {
    EndpointOptions options;
    options.pipe_capacity = pipe_capacity_;
    for (const auto& pattern : ignore_patterns_) {
        options.ignore.Add(pattern);
    }
    return options;
}

}  // namespace syncpoint
