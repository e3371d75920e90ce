#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(std::string str);

    // Hides userinfo and query strings (API keys) before a URL is logged.
    std::string redact_url(const std::string& url);

    // MIME type from the file extension, application/octet-stream when unknown.
    std::string file_type_for(const std::string& filename);

    std::string join_url(const std::string& base, const std::string& path);

    // At most max_bytes of str, never ending inside a UTF-8 multibyte sequence.
    std::string truncate_utf8(const std::string& str, size_t max_bytes);
}
