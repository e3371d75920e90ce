#include "content_cache.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
constexpr const char* kFallbackPrefix = "bafybeif";
constexpr size_t kFallbackHashChars = 52;
}

LocalContentCache::LocalContentCache(fs::path dir) : dir_(std::move(dir)) {}

std::string LocalContentCache::derive_id(const std::string& bytes) {
    return kFallbackPrefix + digest::sha256_hex(bytes).substr(0, kFallbackHashChars);
}

bool LocalContentCache::is_cacheable(const std::string& id) {
    return !id.empty() && id.find('/') == std::string::npos && id.find("..") == std::string::npos;
}

fs::path LocalContentCache::path_for(const std::string& id) const {
    if (!is_cacheable(id)) {
        throw ValidationError("Invalid content id: " + id);
    }
    return dir_ / (id + ".dat");
}

fs::path LocalContentCache::put(const std::string& id, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto path = path_for(id);
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw AnchorError("Cannot create cache directory " + dir_.string() + ": " + ec.message());
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw AnchorError("Cannot write cache file " + tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw AnchorError("Short write to cache file " + tmp.string());
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        throw AnchorError("Cannot finalize cache file " + path.string() + ": " + ec.message());
    }

    spdlog::debug("Cached {} bytes as {}", bytes.size(), path.string());
    return path;
}

std::optional<std::string> LocalContentCache::get(const std::string& id) const {
    if (!is_cacheable(id)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    auto path = path_for(id);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool LocalContentCache::contains(const std::string& id) const {
    if (!is_cacheable(id)) {
        return false;
    }
    std::error_code ec;
    return fs::exists(path_for(id), ec);
}
