#pragma once

#include "endpoint_pool.hpp"
#include "http_client.hpp"
#include "retry_policy.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

struct RpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;
};

struct RpcResponse {
    int64_t id = 0;
    nlohmann::json result;
    std::optional<RpcError> error;
    std::string endpoint;
    int attempts = 0;

    bool ok() const { return !error.has_value(); }
};

// JSON-RPC 2.0 over HTTP POST with per-endpoint retries and sticky failover.
// Not thread-safe: the endpoint pointer is plain instance state.
class RpcClient {
public:
    RpcClient(EndpointPool pool,
              std::shared_ptr<HttpClient> http,
              RetryPolicy retry = RetryPolicy{},
              int timeout_ms = 45000,
              int failover_pause_ms = 1000);

    // Retries and fails over until an endpoint answers. A JSON-RPC error object counts
    // as an answer and is returned in RpcResponse::error. Throws ConnectivityError when
    // every endpoint exhausted its retries.
    RpcResponse request(const std::string& method,
                        const nlohmann::json& params = nlohmann::json::array());

    // Exactly one attempt on the current endpoint, no retry and no failover.
    // Throws ConnectivityError if the endpoint did not answer.
    RpcResponse request_once(const std::string& method,
                             const nlohmann::json& params = nlohmann::json::array());

    // request() that returns the result payload or throws RpcCallError.
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& params = nlohmann::json::array());

    bool test_connectivity();
    void set_probe_method(const std::string& method) { probe_method_ = method; }

    const EndpointPool& pool() const { return pool_; }
    const std::string& current_endpoint() const { return pool_.current().url; }

private:
    EndpointPool pool_;
    std::shared_ptr<HttpClient> http_;
    RetryPolicy retry_;
    int timeout_ms_;
    int failover_pause_ms_;
    int64_t next_id_;
    std::string probe_method_;

    nlohmann::json make_payload(const std::string& method, const nlohmann::json& params, int64_t id) const;
    AttemptOutcome attempt(const std::string& url, const std::string& body,
                           RpcResponse& out, std::string& failure);
};
