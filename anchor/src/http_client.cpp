#include "http_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string to_string(TransportStatus status) {
    switch (status) {
        case TransportStatus::Ok: return "ok";
        case TransportStatus::Timeout: return "timeout";
        case TransportStatus::ConnectionFailed: return "connection_failed";
        case TransportStatus::Failed: return "failed";
    }
    return "failed";
}

CurlHttpClient::CurlHttpClient()
    : curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

TransportStatus CurlHttpClient::classify(CURLcode code) {
    switch (code) {
        case CURLE_OK:
            return TransportStatus::Ok;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportStatus::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
            return TransportStatus::ConnectionFailed;
        default:
            return TransportStatus::Failed;
    }
}

void CurlHttpClient::prepare(const std::string& url, int timeout_ms, std::string* response) {
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
}

HttpResponse CurlHttpClient::perform(std::string& response) {
    HttpResponse result;

    CURLcode res = curl_easy_perform(curl_);
    result.transport = classify(res);

    if (res != CURLE_OK) {
        result.error = curl_easy_strerror(res);
        return result;
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &result.status);
    result.body = std::move(response);
    return result;
}

HttpResponse CurlHttpClient::post_json(const std::string& url,
                                       const std::string& body,
                                       int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string response_string;

    prepare(url, timeout_ms, &response_string);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    struct curl_slist* headers = NULL;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

    auto result = perform(response_string);
    curl_slist_free_all(headers);

    if (result.transport != TransportStatus::Ok) {
        spdlog::debug("POST {} failed: {}", util::redact_url(url), result.error);
    }
    return result;
}

HttpResponse CurlHttpClient::post_multipart(const std::string& url,
                                            const HeaderList& headers,
                                            const MultipartFile& file,
                                            const FormFields& fields,
                                            int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string response_string;

    prepare(url, timeout_ms, &response_string);

    curl_mime* mime = curl_mime_init(curl_);

    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, file.field.c_str());
    curl_mime_filename(part, file.filename.c_str());
    curl_mime_data(part, file.data.data(), file.data.size());
    if (!file.content_type.empty()) {
        curl_mime_type(part, file.content_type.c_str());
    }

    for (const auto& [name, value] : fields) {
        curl_mimepart* field = curl_mime_addpart(mime);
        curl_mime_name(field, name.c_str());
        curl_mime_data(field, value.data(), value.size());
    }
    curl_easy_setopt(curl_, CURLOPT_MIMEPOST, mime);

    struct curl_slist* header_list = NULL;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    auto result = perform(response_string);
    curl_slist_free_all(header_list);
    curl_mime_free(mime);

    if (result.transport != TransportStatus::Ok) {
        spdlog::debug("Multipart POST {} failed: {}", util::redact_url(url), result.error);
    }
    return result;
}

HttpResponse CurlHttpClient::get(const std::string& url, int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string response_string;

    prepare(url, timeout_ms, &response_string);
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);

    auto result = perform(response_string);
    if (result.transport != TransportStatus::Ok) {
        spdlog::debug("GET {} failed: {}", util::redact_url(url), result.error);
    }
    return result;
}
