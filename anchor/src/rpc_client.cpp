#include "rpc_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

RpcClient::RpcClient(EndpointPool pool,
                     std::shared_ptr<HttpClient> http,
                     RetryPolicy retry,
                     int timeout_ms,
                     int failover_pause_ms)
    : pool_(std::move(pool))
    , http_(std::move(http))
    , retry_(retry)
    , timeout_ms_(timeout_ms)
    , failover_pause_ms_(failover_pause_ms)
    , next_id_(1)
    , probe_method_("eth_blockNumber")
{
    if (!http_) {
        throw ValidationError("RpcClient requires an HTTP client");
    }
    if (retry_.max_attempts < 1) {
        retry_.max_attempts = 1;
    }
}

nlohmann::json RpcClient::make_payload(const std::string& method,
                                       const nlohmann::json& params,
                                       int64_t id) const {
    return {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params.is_null() ? nlohmann::json::array() : params},
        {"id", id}
    };
}

AttemptOutcome RpcClient::attempt(const std::string& url, const std::string& body,
                                  RpcResponse& out, std::string& failure) {
    auto response = http_->post_json(url, body, timeout_ms_);

    if (response.transport != TransportStatus::Ok) {
        failure = to_string(response.transport) + ": " + response.error;
        return AttemptOutcome::Retryable;
    }

    if (response.status == 429) {
        failure = "rate limited (429)";
        return AttemptOutcome::Retryable;
    }

    if (response.status != 200) {
        failure = "HTTP " + std::to_string(response.status);
        return AttemptOutcome::Failover;
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(response.body);
    } catch (const std::exception& e) {
        failure = std::string("unparseable response: ") + e.what();
        return AttemptOutcome::Retryable;
    }

    if (!parsed.is_object()) {
        failure = "unexpected response";
        return AttemptOutcome::Retryable;
    }

    if (parsed.contains("error") && !parsed["error"].is_null()) {
        const auto& err = parsed["error"];
        RpcError rpc_error;
        if (err.is_object()) {
            const auto code = err.find("code");
            const auto message = err.find("message");
            const auto data = err.find("data");
            if (data != err.end()) {
                rpc_error.data = *data;
            }
            if (code != err.end() && code->is_number_integer()) {
                rpc_error.code = code->get<int>();
            } else if (code != err.end()) {
                // Some providers send the code as a string; keep it verbatim.
                rpc_error.data = {{"code", *code}, {"data", rpc_error.data}};
            }
            if (message != err.end()) {
                rpc_error.message = message->is_string() ? message->get<std::string>() : message->dump();
            }
        } else {
            rpc_error.message = err.dump();
        }
        out.error = rpc_error;
        return AttemptOutcome::Success;
    }

    if (!parsed.contains("result")) {
        failure = "response carries neither result nor error";
        return AttemptOutcome::Retryable;
    }

    out.result = parsed["result"];
    return AttemptOutcome::Success;
}

RpcResponse RpcClient::request(const std::string& method, const nlohmann::json& params) {
    const int64_t id = next_id_++;
    const std::string body = make_payload(method, params, id).dump();
    const size_t start_index = pool_.current_index();
    int total_attempts = 0;

    for (size_t tried = 0; tried < pool_.size(); ++tried) {
        const size_t index = pool_.current_index();
        const std::string url = pool_.current().url;

        for (int attempt_no = 1; ; ++attempt_no) {
            ++total_attempts;

            RpcResponse out;
            std::string failure;
            auto started = util::current_timestamp_ms();
            auto outcome = attempt(url, body, out, failure);

            if (outcome == AttemptOutcome::Success) {
                pool_.record_latency(index, util::current_timestamp_ms() - started);
                out.id = id;
                out.endpoint = url;
                out.attempts = total_attempts;
                if (!out.ok()) {
                    spdlog::debug("{} returned RPC error {}: {}", method, out.error->code, out.error->message);
                }
                return out;
            }

            if (outcome != AttemptOutcome::Retryable) {
                spdlog::warn("{} on {} failed ({}), moving to next endpoint",
                             method, util::redact_url(url), failure);
                break;
            }

            if (retry_.exhausted(attempt_no)) {
                spdlog::warn("{} on {} failed after {} attempts ({})",
                             method, util::redact_url(url), attempt_no, failure);
                break;
            }

            spdlog::warn("{} on {} attempt {}/{} failed ({}), retrying",
                         method, util::redact_url(url), attempt_no, retry_.max_attempts, failure);
            retry_.pause();
        }

        if (tried + 1 < pool_.size()) {
            pool_.advance();
            if (failover_pause_ms_ > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(failover_pause_ms_));
            }
        }
    }

    pool_.pin(start_index);

    throw ConnectivityError(
        fmt::format("Could not reach any RPC endpoint for {} after {} attempts across {} endpoints",
                    method, total_attempts, pool_.size()),
        pool_.size(), total_attempts);
}

RpcResponse RpcClient::request_once(const std::string& method, const nlohmann::json& params) {
    const int64_t id = next_id_++;
    const std::string body = make_payload(method, params, id).dump();
    const std::string url = pool_.current().url;

    RpcResponse out;
    std::string failure;
    auto outcome = attempt(url, body, out, failure);

    if (outcome != AttemptOutcome::Success) {
        spdlog::error("{} on {} failed ({}), not retried", method, util::redact_url(url), failure);
        throw ConnectivityError(
            fmt::format("{} on {} failed: {}", method, util::redact_url(url), failure), 1, 1);
    }

    out.id = id;
    out.endpoint = url;
    out.attempts = 1;
    return out;
}

nlohmann::json RpcClient::call(const std::string& method, const nlohmann::json& params) {
    auto response = request(method, params);
    if (!response.ok()) {
        throw RpcCallError(method, response.error->code, response.error->message,
                           response.error->data.is_null() ? "" : response.error->data.dump());
    }
    return response.result;
}

bool RpcClient::test_connectivity() {
    try {
        auto response = request(probe_method_);
        return response.ok() && !response.result.is_null();
    } catch (const std::exception& e) {
        spdlog::warn("Connectivity test failed: {}", e.what());
        return false;
    }
}
