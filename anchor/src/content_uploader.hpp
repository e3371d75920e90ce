#pragma once

#include "audit_log.hpp"
#include "content_cache.hpp"
#include "http_client.hpp"
#include "storage_backend.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct UploadAttempt {
    std::string backend;
    std::string sha256;
    size_t size = 0;
    bool success = false;
    std::string error;
    int tries = 0;
};

struct ContentRecord {
    std::string cid;
    size_t size = 0;
    std::optional<std::filesystem::path> cache_path;  // set only on the local fallback path
    std::string backend;                               // "local-fallback" for the fallback
    std::vector<UploadAttempt> attempts;

    bool fallback() const { return cache_path.has_value(); }
};

struct UploaderOptions {
    std::vector<std::string> gateways;
    int gateway_timeout_ms = 30000;
    size_t max_upload_mb = 1000;
};

// Uploads through an ordered chain of storage backends and falls back to a locally derived,
// cached content id, so upload() of valid input always returns a content id.
class ContentUploader {
public:
    ContentUploader(std::vector<std::unique_ptr<StorageBackend>> backends,
                    const std::filesystem::path& cache_dir,
                    std::shared_ptr<HttpClient> http,
                    UploaderOptions options = UploaderOptions{},
                    std::shared_ptr<AuditLog> audit = nullptr);

    // Throws ValidationError for empty or oversized input; no backend is contacted.
    ContentRecord upload(const std::string& bytes,
                         const std::string& name,
                         const nlohmann::json& metadata = nlohmann::json::object());

    // Pretty-printed (2-space indent) as "<name>.json".
    ContentRecord upload_json(const nlohmann::json& document,
                              const std::string& name,
                              const nlohmann::json& metadata = nlohmann::json::object());

    // Local cache first, then each gateway in order. Throws NotFoundError.
    std::string download(const std::string& cid);
    nlohmann::json download_json(const std::string& cid);

    static std::string ipfs_uri(const std::string& cid);
    std::string gateway_url(const std::string& cid) const;

    static bool validate_size(const std::string& bytes, size_t max_mb = 1000);

    std::vector<std::string> enabled_backends() const;
    nlohmann::json status() const;

    static std::vector<std::string> default_gateways();

private:
    std::vector<std::unique_ptr<StorageBackend>> backends_;
    LocalContentCache cache_;
    std::shared_ptr<HttpClient> http_;
    UploaderOptions options_;
    std::shared_ptr<AuditLog> audit_;

    void record(const std::string& status, nlohmann::json payload);
    ContentRecord upload_checked(const std::string& bytes,
                                 const std::string& name,
                                 const nlohmann::json& metadata);
};
