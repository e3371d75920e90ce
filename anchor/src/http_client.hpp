#pragma once

#include <string>
#include <vector>
#include <utility>
#include <mutex>
#include <curl/curl.h>

enum class TransportStatus {
    Ok,
    Timeout,
    ConnectionFailed,
    Failed
};

std::string to_string(TransportStatus status);

struct HttpResponse {
    TransportStatus transport = TransportStatus::Failed;
    long status = 0;
    std::string body;
    std::string error;

    bool ok() const { return transport == TransportStatus::Ok && status == 200; }
};

struct MultipartFile {
    std::string field;
    std::string filename;
    std::string content_type;
    std::string data;
};

using HeaderList = std::vector<std::string>;
using FormFields = std::vector<std::pair<std::string, std::string>>;

// Blocking HTTP seam. Network conditions are reported through HttpResponse::transport,
// never thrown.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post_json(const std::string& url,
                                   const std::string& body,
                                   int timeout_ms) = 0;

    virtual HttpResponse post_multipart(const std::string& url,
                                        const HeaderList& headers,
                                        const MultipartFile& file,
                                        const FormFields& fields,
                                        int timeout_ms) = 0;

    virtual HttpResponse get(const std::string& url, int timeout_ms) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    // Disable copy
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           int timeout_ms) override;

    HttpResponse post_multipart(const std::string& url,
                                const HeaderList& headers,
                                const MultipartFile& file,
                                const FormFields& fields,
                                int timeout_ms) override;

    HttpResponse get(const std::string& url, int timeout_ms) override;

private:
    CURL* curl_;
    std::mutex mutex_;

    void prepare(const std::string& url, int timeout_ms, std::string* response);
    HttpResponse perform(std::string& response);

    static TransportStatus classify(CURLcode code);
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
