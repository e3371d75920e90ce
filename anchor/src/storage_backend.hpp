#pragma once

#include "http_client.hpp"
#include "retry_policy.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

struct BackendResult {
    AttemptOutcome outcome = AttemptOutcome::Terminal;
    std::string cid;
    std::string error;
    int attempts = 0;

    bool ok() const { return outcome == AttemptOutcome::Success; }
};

// One interchangeable upload strategy in the fallback chain.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual const std::string& name() const = 0;

    // A backend without its credential is skipped, not counted as a failure.
    virtual bool enabled() const = 0;

    virtual BackendResult upload(const std::string& bytes,
                                 const std::string& filename,
                                 const nlohmann::json& metadata) = 0;
};

struct BackendSpec {
    std::string name;
    std::string upload_url;
    std::string cid_field;      // dotted path into the response body, e.g. "value.cid"
    std::string token;          // sent as "Authorization: Bearer <token>"
    bool pinata_fields = false; // adds pinataMetadata / pinataOptions form fields

    static BackendSpec web3_storage(const std::string& token);
    static BackendSpec nft_storage(const std::string& token);
    static BackendSpec pinata(const std::string& jwt);
};

// Multipart POST with a bearer token, content id read from a backend-specific field.
class HttpStorageBackend : public StorageBackend {
public:
    HttpStorageBackend(BackendSpec spec,
                       std::shared_ptr<HttpClient> http,
                       int timeout_ms = 60000,
                       RetryPolicy retry = RetryPolicy{1, 0});

    const std::string& name() const override { return spec_.name; }
    bool enabled() const override { return !spec_.token.empty(); }

    BackendResult upload(const std::string& bytes,
                         const std::string& filename,
                         const nlohmann::json& metadata) override;

    static std::string extract_cid(const nlohmann::json& body, const std::string& path);

private:
    BackendSpec spec_;
    std::shared_ptr<HttpClient> http_;
    int timeout_ms_;
    RetryPolicy retry_;

    AttemptOutcome attempt(const MultipartFile& file, const FormFields& fields,
                           BackendResult& out);
};
