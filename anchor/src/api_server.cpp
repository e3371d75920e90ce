#include "api_server.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

void send_error(httplib::Response& res, int status, const std::string& kind,
                const std::string& message, nlohmann::json extra = nlohmann::json::object()) {
    extra["ok"] = false;
    extra["error"] = kind;
    extra["message"] = message;
    send_json(res, status, extra);
}

// Maps the error taxonomy onto HTTP statuses.
template <typename Handler>
void guarded(const httplib::Request& req, httplib::Response& res, Handler&& handler) {
    try {
        handler();
    } catch (const ValidationError& e) {
        send_error(res, 400, "validation", e.what());
    } catch (const NotFoundError& e) {
        send_error(res, 404, "not_found", e.what());
    } catch (const GasEstimationError& e) {
        send_error(res, 422, "gas_estimation", e.what());
    } catch (const BroadcastError& e) {
        send_error(res, 502, "broadcast", e.what());
    } catch (const RpcCallError& e) {
        send_error(res, 502, "rpc", e.what(), {{"code", e.code()}});
    } catch (const ConfirmationTimeoutError& e) {
        send_error(res, 504, "confirmation_timeout", e.what(), {{"tx_hash", e.tx_hash()}});
    } catch (const ConnectivityError& e) {
        send_error(res, 503, "connectivity", e.what(),
                   {{"endpoints_tried", e.endpoints_tried()}, {"attempts", e.attempts()}});
    } catch (const nlohmann::json::exception& e) {
        send_error(res, 400, "bad_request", e.what());
    } catch (const std::exception& e) {
        spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
        send_error(res, 500, "internal", e.what());
    }
}

CallDescriptor call_from(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }

    CallDescriptor call;
    call.function = body.value("signature", std::string());
    call.parameters = body.contains("args") ? body["args"] : nlohmann::json::array();
    call.to = body.value("to", std::string());
    call.data = body.value("data", std::string());
    call.value = body.value("value", static_cast<uint64_t>(0));
    if (call.function.empty() && call.data.empty()) {
        throw ValidationError("signature or data is required");
    }
    return call;
}

AuditFilter filter_from(const httplib::Request& req) {
    AuditFilter filter;
    auto param = [&req](const char* key) -> std::optional<std::string> {
        if (!req.has_param(key)) return std::nullopt;
        return req.get_param_value(key);
    };

    filter.status = param("status");
    filter.filename_contains = param("filename");
    filter.cid = param("cid");
    filter.tx_hash = param("tx_hash");
    filter.function = param("function");
    filter.since = param("since");
    filter.until = param("until");

    if (auto limit = param("limit")) {
        try {
            filter.limit = static_cast<size_t>(std::stoul(*limit));
        } catch (const std::exception&) {
            throw ValidationError("limit must be a non-negative integer");
        }
    }
    return filter;
}

} // namespace

ApiServer::ApiServer(const Config& config,
                     std::shared_ptr<ContentUploader> uploader,
                     std::shared_ptr<TransactionPipeline> pipeline,
                     std::shared_ptr<Signer> signer,
                     std::shared_ptr<AuditLog> upload_log,
                     std::shared_ptr<AuditLog> tx_log,
                     std::shared_ptr<HealthCheck> health)
    : config_(config)
    , uploader_(std::move(uploader))
    , pipeline_(std::move(pipeline))
    , signer_(std::move(signer))
    , upload_log_(std::move(upload_log))
    , tx_log_(std::move(tx_log))
    , health_(std::move(health))
    , server_(std::make_unique<httplib::Server>())
{}

void ApiServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
        }
    });

    spdlog::info("API server started");
}

void ApiServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("API server stopped");
}

void ApiServer::setup_routes() {
    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) { handle_health(req, res); });
    server_->Get("/info/account",
        [this](const httplib::Request& req, httplib::Response& res) { handle_account(req, res); });
    server_->Get("/info/network",
        [this](const httplib::Request& req, httplib::Response& res) { handle_network(req, res); });

    server_->Post("/content",
        [this](const httplib::Request& req, httplib::Response& res) { handle_upload(req, res); });
    server_->Get(R"(/content/([A-Za-z0-9]+(?:/[A-Za-z0-9._-]+)*))",
        [this](const httplib::Request& req, httplib::Response& res) { handle_download(req, res); });

    server_->Post("/tx",
        [this](const httplib::Request& req, httplib::Response& res) { handle_submit(req, res); });
    server_->Post("/call",
        [this](const httplib::Request& req, httplib::Response& res) { handle_call(req, res); });
    server_->Get(R"(/tx/(0x[0-9a-fA-F]{64}))",
        [this](const httplib::Request& req, httplib::Response& res) { handle_receipt(req, res); });

    server_->Get("/logs/uploads",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_logs(*upload_log_, EntryType::Upload, req, res);
        });
    server_->Get("/logs/transactions",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_logs(*tx_log_, EntryType::Transaction, req, res);
        });
    server_->Get("/logs/stats",
        [this](const httplib::Request& req, httplib::Response& res) { handle_stats(req, res); });
    server_->Post("/logs/trim",
        [this](const httplib::Request& req, httplib::Response& res) { handle_trim(req, res); });
}

void ApiServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        std::lock_guard<std::mutex> lock(chain_mutex_);
        auto status = health_->get_status();
        status["service"] = config_.service_name;
        send_json(res, health_->is_healthy() ? 200 : 503, status);
    });
}

void ApiServer::handle_account(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        std::lock_guard<std::mutex> lock(chain_mutex_);
        send_json(res, 200, pipeline_->account_info(signer_->address()));
    });
}

void ApiServer::handle_network(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        std::lock_guard<std::mutex> lock(chain_mutex_);
        send_json(res, 200, pipeline_->network_info());
    });
}

void ApiServer::handle_upload(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        std::string name = req.has_param("name") ? req.get_param_value("name") : "upload.bin";
        auto record = uploader_->upload(req.body, name);

        nlohmann::json attempts = nlohmann::json::array();
        for (const auto& a : record.attempts) {
            attempts.push_back({
                {"backend", a.backend},
                {"success", a.success},
                {"tries", a.tries},
                {"error", a.error}
            });
        }

        send_json(res, 201, {
            {"ok", true},
            {"cid", record.cid},
            {"size_bytes", record.size},
            {"backend", record.backend},
            {"fallback", record.fallback()},
            {"ipfs_uri", ContentUploader::ipfs_uri(record.cid)},
            {"gateway_url", uploader_->gateway_url(record.cid)},
            {"attempts", attempts}
        });
    });
}

void ApiServer::handle_download(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        auto bytes = uploader_->download(req.matches[1]);
        res.status = 200;
        res.set_content(bytes, "application/octet-stream");
    });
}

void ApiServer::handle_submit(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        auto call = call_from(nlohmann::json::parse(req.body));

        std::lock_guard<std::mutex> lock(chain_mutex_);
        auto result = pipeline_->submit(call, *signer_);

        auto out = result.to_json();
        out["ok"] = result.succeeded();
        out["reverted"] = !result.succeeded();
        send_json(res, 200, out);
    });
}

void ApiServer::handle_call(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        auto body = nlohmann::json::parse(req.body);
        auto call = call_from(body);
        auto returns = body.value("returns", std::string());

        std::string result;
        {
            std::lock_guard<std::mutex> lock(chain_mutex_);
            result = pipeline_->read_call(call, signer_->address());
        }

        nlohmann::json out = {{"ok", true}, {"result", result}};
        if (!returns.empty()) {
            out["value"] = abi::decode_result(result, returns);
        }
        send_json(res, 200, out);
    });
}

void ApiServer::handle_receipt(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        std::string hash = req.matches[1];

        std::optional<TransactionResult> receipt;
        {
            std::lock_guard<std::mutex> lock(chain_mutex_);
            receipt = pipeline_->find_receipt(hash);
        }

        auto audit = tx_log_->find_by_tx_hash(hash);
        nlohmann::json out = {
            {"tx_hash", hash},
            {"explorer_url", pipeline_->explorer_link(hash)},
            {"audit", audit ? audit->to_json() : nlohmann::json()}
        };

        if (!receipt) {
            out["pending"] = true;
            send_json(res, 202, out);
            return;
        }

        out["pending"] = false;
        out["block_number"] = receipt->block_number;
        out["gas_used"] = receipt->gas_used;
        out["status"] = receipt->status;
        send_json(res, 200, out);
    });
}

void ApiServer::handle_logs(const AuditLog& log, EntryType type,
                            const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        auto filter = filter_from(req);
        filter.type = type;

        nlohmann::json entries = nlohmann::json::array();
        for (const auto& e : log.query(filter)) {
            entries.push_back(e.to_json());
        }

        send_json(res, 200, {
            {"count", entries.size()},
            {"entries", entries}
        });
    });
}

void ApiServer::handle_stats(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        send_json(res, 200, {
            {"uploads", upload_log_->aggregate().to_json()},
            {"transactions", tx_log_->aggregate().to_json()}
        });
    });
}

void ApiServer::handle_trim(const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&]() {
        if (!req.has_param("keep")) {
            throw ValidationError("keep is required");
        }

        size_t keep = 0;
        try {
            keep = static_cast<size_t>(std::stoul(req.get_param_value("keep")));
        } catch (const std::exception&) {
            throw ValidationError("keep must be a non-negative integer");
        }

        std::string which = req.has_param("log") ? req.get_param_value("log") : "all";
        if (which != "all" && which != "uploads" && which != "transactions") {
            throw ValidationError("log must be uploads, transactions or all");
        }

        nlohmann::json removed = nlohmann::json::object();
        if (which != "transactions") {
            removed["uploads"] = upload_log_->trim(keep);
        }
        if (which != "uploads") {
            removed["transactions"] = tx_log_->trim(keep);
        }

        send_json(res, 200, {
            {"ok", true},
            {"keep", keep},
            {"removed", removed}
        });
    });
}
