#include "content_uploader.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/ranges.h>
#include <chrono>

namespace {
constexpr const char* kFallbackBackend = "local-fallback";
}

ContentUploader::ContentUploader(std::vector<std::unique_ptr<StorageBackend>> backends,
                                 const std::filesystem::path& cache_dir,
                                 std::shared_ptr<HttpClient> http,
                                 UploaderOptions options,
                                 std::shared_ptr<AuditLog> audit)
    : backends_(std::move(backends))
    , cache_(cache_dir)
    , http_(std::move(http))
    , options_(std::move(options))
    , audit_(std::move(audit))
{
    if (options_.gateways.empty()) {
        options_.gateways = default_gateways();
    }

    auto enabled = enabled_backends();
    if (enabled.empty()) {
        spdlog::warn("No storage backend credentials configured, uploads use the local fallback");
    } else {
        spdlog::info("Storage backends enabled: {}", fmt::join(enabled, ", "));
    }
}

std::vector<std::string> ContentUploader::default_gateways() {
    return {
        "https://ipfs.io/ipfs/",
        "https://gateway.pinata.cloud/ipfs/",
        "https://cloudflare-ipfs.com/ipfs/",
        "https://dweb.link/ipfs/"
    };
}

void ContentUploader::record(const std::string& status, nlohmann::json payload) {
    if (audit_) {
        audit_->append(EntryType::Upload, status, std::move(payload));
    }
}

bool ContentUploader::validate_size(const std::string& bytes, size_t max_mb) {
    return bytes.size() <= max_mb * 1024 * 1024;
}

ContentRecord ContentUploader::upload(const std::string& bytes,
                                      const std::string& name,
                                      const nlohmann::json& metadata) {
    std::string error;
    if (bytes.empty()) {
        error = "Content is empty";
    } else if (!validate_size(bytes, options_.max_upload_mb)) {
        error = "Content exceeds " + std::to_string(options_.max_upload_mb) + " MB";
    }

    if (!error.empty()) {
        spdlog::error("Rejected upload of {}: {}", name, error);
        record("failed", {
            {"filename", name},
            {"size_bytes", bytes.size()},
            {"file_type", util::file_type_for(name)},
            {"error", error}
        });
        throw ValidationError(error);
    }

    try {
        return upload_checked(bytes, name, metadata);
    } catch (const AuditStoreError&) {
        throw;
    } catch (const AnchorError& e) {
        record("failed", {
            {"filename", name},
            {"size_bytes", bytes.size()},
            {"file_type", util::file_type_for(name)},
            {"error", e.what()}
        });
        throw;
    }
}

ContentRecord ContentUploader::upload_checked(const std::string& bytes,
                                              const std::string& name,
                                              const nlohmann::json& metadata) {
    auto started = std::chrono::steady_clock::now();
    auto sha256 = digest::sha256_hex(bytes);

    ContentRecord out;
    out.size = bytes.size();

    for (auto& backend : backends_) {
        if (!backend->enabled()) {
            spdlog::debug("Skipping {}: no credential", backend->name());
            continue;
        }

        BackendResult result;
        try {
            result = backend->upload(bytes, name, metadata);
        } catch (const AuditStoreError&) {
            throw;
        } catch (const std::exception& e) {
            result.outcome = AttemptOutcome::Terminal;
            result.error = e.what();
            result.attempts = 1;
        }

        UploadAttempt attempt;
        attempt.backend = backend->name();
        attempt.sha256 = sha256;
        attempt.size = bytes.size();
        attempt.success = result.ok();
        attempt.error = result.error;
        attempt.tries = result.attempts;
        out.attempts.push_back(attempt);

        if (result.ok()) {
            out.cid = result.cid;
            out.backend = backend->name();
            break;
        }

        spdlog::warn("{} failed for {} ({}), trying next backend",
                     backend->name(), name, result.error);
        record("failed", {
            {"filename", name},
            {"size_bytes", bytes.size()},
            {"file_type", util::file_type_for(name)},
            {"sha256", sha256},
            {"backend", backend->name()},
            {"outcome", to_string(result.outcome)},
            {"tries", result.attempts},
            {"error", result.error}
        });
    }

    if (out.cid.empty()) {
        out.cid = LocalContentCache::derive_id(bytes);
        out.cache_path = cache_.put(out.cid, bytes);
        out.backend = kFallbackBackend;
        spdlog::warn("All storage backends unavailable, using local content id {} for {}",
                     out.cid, name);
    }

    double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    nlohmann::json payload = {
        {"filename", name},
        {"size_bytes", bytes.size()},
        {"file_type", util::file_type_for(name)},
        {"sha256", sha256},
        {"cid", out.cid},
        {"ipfs_uri", ipfs_uri(out.cid)},
        {"gateway_url", gateway_url(out.cid)},
        {"backend", out.backend},
        {"fallback", out.fallback()},
        {"duration_seconds", duration},
        {"metadata", metadata.is_null() ? nlohmann::json::object() : metadata}
    };
    if (out.cache_path) {
        payload["cache_path"] = out.cache_path->string();
    }
    record("success", std::move(payload));

    spdlog::info("Uploaded {} ({} bytes) as {} via {}", name, bytes.size(), out.cid, out.backend);
    return out;
}

ContentRecord ContentUploader::upload_json(const nlohmann::json& document,
                                           const std::string& name,
                                           const nlohmann::json& metadata) {
    return upload(document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
                  name + ".json", metadata);
}

std::string ContentUploader::download(const std::string& cid) {
    if (util::trim(cid).empty()) {
        throw ValidationError("Content id is empty");
    }

    if (auto cached = cache_.get(cid)) {
        spdlog::debug("Cache hit for {}", cid);
        return *cached;
    }

    for (const auto& gateway : options_.gateways) {
        auto url = util::join_url(gateway, cid);
        auto response = http_->get(url, options_.gateway_timeout_ms);
        if (response.ok()) {
            spdlog::info("Retrieved {} ({} bytes) from {}", cid, response.body.size(), gateway);
            return response.body;
        }

        if (response.transport != TransportStatus::Ok) {
            spdlog::warn("Gateway {} failed for {}: {}", gateway, cid, to_string(response.transport));
        } else {
            spdlog::warn("Gateway {} returned HTTP {} for {}", gateway, response.status, cid);
        }
    }

    throw NotFoundError("Could not retrieve content " + cid + " from cache or " +
                        std::to_string(options_.gateways.size()) + " gateways");
}

nlohmann::json ContentUploader::download_json(const std::string& cid) {
    auto body = download(cid);
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("Content " + cid + " is not JSON: " + e.what());
    }
}

std::string ContentUploader::ipfs_uri(const std::string& cid) {
    return "ipfs://" + cid;
}

std::string ContentUploader::gateway_url(const std::string& cid) const {
    if (options_.gateways.empty()) {
        return ipfs_uri(cid);
    }
    return util::join_url(options_.gateways.front(), cid);
}

std::vector<std::string> ContentUploader::enabled_backends() const {
    std::vector<std::string> names;
    for (const auto& backend : backends_) {
        if (backend->enabled()) {
            names.push_back(backend->name());
        }
    }
    return names;
}

nlohmann::json ContentUploader::status() const {
    auto enabled = enabled_backends();

    nlohmann::json backends = nlohmann::json::array();
    for (const auto& backend : backends_) {
        backends.push_back({
            {"name", backend->name()},
            {"enabled", backend->enabled()}
        });
    }

    return {
        {"provider", enabled.empty() ? std::string(kFallbackBackend) : enabled.front()},
        {"enabled_backends", enabled},
        {"backends", backends},
        {"gateways", options_.gateways},
        {"cache_dir", cache_.dir().string()}
    };
}
