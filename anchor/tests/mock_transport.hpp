#pragma once

#include "../src/http_client.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

struct RecordedRequest {
    std::string verb;     // "POST_JSON", "POST_MULTIPART", "GET"
    std::string url;
    std::string body;
    std::string rpc_method;
    HeaderList headers;
    FormFields fields;
    std::string filename;
};

// Scripted HttpClient: responses are looked up per URL (queued first, then sticky), then by
// JSON-RPC method, and default to a connection failure. Every request is recorded.
class MockTransport : public HttpClient {
public:
    using RpcHandler = std::function<HttpResponse(const nlohmann::json& request)>;

    std::vector<RecordedRequest> requests;

    void enqueue(const std::string& url, HttpResponse response) {
        queued_[url].push_back(std::move(response));
    }

    void always(const std::string& url, HttpResponse response) {
        sticky_[url] = std::move(response);
    }

    void on_rpc(const std::string& method, RpcHandler handler) {
        rpc_handlers_[method] = std::move(handler);
    }

    HttpResponse post_json(const std::string& url, const std::string& body, int) override {
        RecordedRequest rec;
        rec.verb = "POST_JSON";
        rec.url = url;
        rec.body = body;

        nlohmann::json request = nlohmann::json::parse(body, nullptr, false);
        if (request.is_object()) {
            rec.rpc_method = request.value("method", std::string());
        }
        requests.push_back(rec);

        if (auto scripted = scripted_for(url)) {
            return *scripted;
        }
        auto it = rpc_handlers_.find(rec.rpc_method);
        if (it != rpc_handlers_.end()) {
            return it->second(request);
        }
        return connection_failed();
    }

    HttpResponse post_multipart(const std::string& url, const HeaderList& headers,
                                const MultipartFile& file, const FormFields& fields, int) override {
        RecordedRequest rec;
        rec.verb = "POST_MULTIPART";
        rec.url = url;
        rec.body = file.data;
        rec.headers = headers;
        rec.fields = fields;
        rec.filename = file.filename;
        requests.push_back(rec);

        if (auto scripted = scripted_for(url)) {
            return *scripted;
        }
        return connection_failed();
    }

    HttpResponse get(const std::string& url, int) override {
        RecordedRequest rec;
        rec.verb = "GET";
        rec.url = url;
        requests.push_back(rec);

        if (auto scripted = scripted_for(url)) {
            return *scripted;
        }
        return ok("", 404);
    }

    size_t calls_to(const std::string& url) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.url == url) n++;
        }
        return n;
    }

    size_t rpc_calls(const std::string& method) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.rpc_method == method) n++;
        }
        return n;
    }

    std::vector<RecordedRequest> rpc_requests(const std::string& method) const {
        std::vector<RecordedRequest> out;
        for (const auto& r : requests) {
            if (r.rpc_method == method) out.push_back(r);
        }
        return out;
    }

    // Response builders

    static HttpResponse ok(const std::string& body, long status = 200) {
        HttpResponse r;
        r.transport = TransportStatus::Ok;
        r.status = status;
        r.body = body;
        return r;
    }

    static HttpResponse timeout() {
        HttpResponse r;
        r.transport = TransportStatus::Timeout;
        r.error = "Timeout was reached";
        return r;
    }

    static HttpResponse connection_failed() {
        HttpResponse r;
        r.transport = TransportStatus::ConnectionFailed;
        r.error = "Couldn't connect to server";
        return r;
    }

    static HttpResponse rpc_result(const nlohmann::json& result, int64_t id = 1) {
        return ok(nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump());
    }

    static HttpResponse rpc_error(int code, const std::string& message, int64_t id = 1) {
        return ok(nlohmann::json{
            {"jsonrpc", "2.0"},
            {"id", id},
            {"error", {{"code", code}, {"message", message}}}
        }.dump());
    }

private:
    std::map<std::string, std::deque<HttpResponse>> queued_;
    std::map<std::string, HttpResponse> sticky_;
    std::map<std::string, RpcHandler> rpc_handlers_;

    const HttpResponse* scripted_for(const std::string& url) {
        auto q = queued_.find(url);
        if (q != queued_.end() && !q->second.empty()) {
            last_ = q->second.front();
            q->second.pop_front();
            return &last_;
        }
        auto s = sticky_.find(url);
        if (s != sticky_.end()) {
            return &s->second;
        }
        return nullptr;
    }

    HttpResponse last_;
};
