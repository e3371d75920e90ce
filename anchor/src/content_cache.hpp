#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <filesystem>

// Content-addressed files under one directory, keyed by the locally derived content id.
class LocalContentCache {
public:
    explicit LocalContentCache(std::filesystem::path dir);

    // "bafybeif" + first 52 hex chars of sha256(bytes). Placeholder only, not a valid CID.
    static std::string derive_id(const std::string& bytes);

    // Ids with a path component ("<cid>/file.json") are never cached, lookups miss.
    static bool is_cacheable(const std::string& id);

    // Writes bytes under id (overwrites) and returns the file path.
    std::filesystem::path put(const std::string& id, const std::string& bytes);
    std::optional<std::string> get(const std::string& id) const;
    bool contains(const std::string& id) const;

    std::filesystem::path path_for(const std::string& id) const;
    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    mutable std::mutex mutex_;
};
