#include "storage_backend.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

BackendSpec BackendSpec::web3_storage(const std::string& token) {
    return {"web3.storage", "https://api.web3.storage/upload", "cid", token, false};
}

BackendSpec BackendSpec::nft_storage(const std::string& token) {
    return {"nft.storage", "https://api.nft.storage/upload", "value.cid", token, false};
}

BackendSpec BackendSpec::pinata(const std::string& jwt) {
    return {"pinata", "https://api.pinata.cloud/pinning/pinFileToIPFS", "IpfsHash", jwt, true};
}

HttpStorageBackend::HttpStorageBackend(BackendSpec spec,
                                       std::shared_ptr<HttpClient> http,
                                       int timeout_ms,
                                       RetryPolicy retry)
    : spec_(std::move(spec))
    , http_(std::move(http))
    , timeout_ms_(timeout_ms)
    , retry_(retry)
{
    if (retry_.max_attempts < 1) {
        retry_.max_attempts = 1;
    }
}

std::string HttpStorageBackend::extract_cid(const nlohmann::json& body, const std::string& path) {
    const nlohmann::json* node = &body;
    for (const auto& key : util::split(path, '.')) {
        if (!node->is_object() || !node->contains(key)) {
            return "";
        }
        node = &(*node)[key];
    }
    return node->is_string() ? node->get<std::string>() : "";
}

AttemptOutcome HttpStorageBackend::attempt(const MultipartFile& file, const FormFields& fields,
                                           BackendResult& out) {
    HeaderList headers = {"Authorization: Bearer " + spec_.token};
    auto response = http_->post_multipart(spec_.upload_url, headers, file, fields, timeout_ms_);

    if (response.transport != TransportStatus::Ok) {
        out.error = to_string(response.transport) + ": " + response.error;
        return AttemptOutcome::Retryable;
    }

    if (response.status == 429 || response.status >= 500) {
        out.error = "HTTP " + std::to_string(response.status);
        return AttemptOutcome::Retryable;
    }

    if (response.status != 200) {
        out.error = "HTTP " + std::to_string(response.status) + ": " +
                    util::truncate_utf8(response.body, 200);
        return AttemptOutcome::Terminal;
    }

    try {
        out.cid = extract_cid(nlohmann::json::parse(response.body), spec_.cid_field);
    } catch (const std::exception& e) {
        out.error = std::string("unparseable response: ") + e.what();
        return AttemptOutcome::Terminal;
    }

    if (out.cid.empty()) {
        out.error = "response carried no " + spec_.cid_field;
        return AttemptOutcome::Terminal;
    }
    return AttemptOutcome::Success;
}

BackendResult HttpStorageBackend::upload(const std::string& bytes,
                                         const std::string& filename,
                                         const nlohmann::json& metadata) {
    MultipartFile file{"file", filename, util::file_type_for(filename), bytes};

    FormFields fields;
    if (spec_.pinata_fields) {
        nlohmann::json pin_metadata = (metadata.is_object() && !metadata.empty())
            ? metadata
            : nlohmann::json{{"name", filename}};
        fields.emplace_back("pinataMetadata",
                            pin_metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        fields.emplace_back("pinataOptions", nlohmann::json{{"cidVersion", 1}}.dump());
    }

    BackendResult result;
    for (int attempt_no = 1; ; attempt_no++) {
        result.attempts = attempt_no;
        result.error.clear();
        result.outcome = attempt(file, fields, result);

        if (result.outcome == AttemptOutcome::Success) {
            spdlog::info("Uploaded {} to {}: {}", filename, spec_.name, result.cid);
            return result;
        }

        spdlog::warn("{} upload attempt {}/{} failed: {}",
                     spec_.name, attempt_no, retry_.max_attempts, result.error);

        if (result.outcome == AttemptOutcome::Terminal) {
            return result;
        }
        if (retry_.exhausted(attempt_no)) {
            result.outcome = AttemptOutcome::Failover;
            return result;
        }
        retry_.pause();
    }
}
