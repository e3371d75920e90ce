#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <map>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string redact_url(const std::string& url) {
    std::string out = url;

    auto scheme_end = out.find("://");
    auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto at = out.find('@', host_start);
    auto slash = out.find('/', host_start);
    if (at != std::string::npos && (slash == std::string::npos || at < slash)) {
        out.replace(host_start, at - host_start, "***");
    }

    auto query = out.find('?');
    if (query != std::string::npos) {
        out = out.substr(0, query) + "?***";
    }
    return out;
}

std::string file_type_for(const std::string& filename) {
    static const std::map<std::string, std::string> types = {
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".json", "application/json"},
        {".txt", "text/plain"}
    };

    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return "application/octet-stream";

    auto it = types.find(to_lower(filename.substr(dot)));
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string join_url(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;

    bool base_slash = base.back() == '/';
    bool path_slash = path.front() == '/';
    if (base_slash && path_slash) return base + path.substr(1);
    if (!base_slash && !path_slash) return base + "/" + path;
    return base + path;
}

std::string truncate_utf8(const std::string& str, size_t max_bytes) {
    if (str.size() <= max_bytes) {
        return str;
    }
    size_t end = max_bytes;
    while (end > 0 && (static_cast<unsigned char>(str[end]) & 0xC0) == 0x80) {
        end--;
    }
    return str.substr(0, end);
}

} // namespace util
