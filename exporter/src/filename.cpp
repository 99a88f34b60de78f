#include "frameport/exporter/filename.hpp"
#include <algorithm>
#include <regex>

namespace frameport {
namespace exporter {

namespace {

constexpr size_t kMaxFilenameLength = 200;

std::string trim_dashes(const std::string& value) {
    size_t start = value.find_first_not_of('-');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of('-');
    return value.substr(start, end - start + 1);
}

} // namespace

std::string sanitize_filename(const std::string& name) {
    static const std::regex reserved(R"([/\\:*?"<>|])");
    static const std::regex whitespace(R"(\s+)");
    static const std::regex separators(R"([\s\-]+)");

    std::string sanitized = std::regex_replace(name, reserved, "");
    sanitized = std::regex_replace(sanitized, whitespace, " ");
    sanitized = std::regex_replace(sanitized, separators, "-");
    sanitized = trim_dashes(sanitized);

    if (sanitized.empty()) {
        return "Unnamed";
    }
    if (sanitized.size() > kMaxFilenameLength) {
        sanitized = sanitized.substr(0, kMaxFilenameLength);
        while (!sanitized.empty() && sanitized.back() == '-') {
            sanitized.pop_back();
        }
    }
    return sanitized;
}

std::string sanitize_node_id(const std::string& id) {
    std::string result = id;
    std::replace(result.begin(), result.end(), ':', '-');
    std::replace(result.begin(), result.end(), '/', '-');
    std::replace(result.begin(), result.end(), '\\', '-');
    return result;
}

} // namespace exporter
} // namespace frameport
