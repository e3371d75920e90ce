#include "api_server.hpp"
#include "audit_log.hpp"
#include "config.hpp"
#include "content_uploader.hpp"
#include "endpoint_pool.hpp"
#include "health.hpp"
#include "http_client.hpp"
#include "rpc_client.hpp"
#include "signer.hpp"
#include "storage_backend.hpp"
#include "transaction_pipeline.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("anchor", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::vector<std::unique_ptr<StorageBackend>> make_backends(const Config& config,
                                                           std::shared_ptr<HttpClient> http) {
    std::vector<std::unique_ptr<StorageBackend>> backends;
    for (auto spec : {BackendSpec::web3_storage(config.web3_storage_token),
                      BackendSpec::nft_storage(config.nft_storage_token),
                      BackendSpec::pinata(config.pinata_jwt)}) {
        backends.push_back(std::make_unique<HttpStorageBackend>(spec, http, config.upload_timeout_ms));
    }
    return backends;
}

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        return 1;
    }

    int exit_code = 0;
    try {
        auto config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("cidanchor content anchoring service v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Separate transports so a long upload never holds the RPC handle
        auto rpc_http = std::make_shared<CurlHttpClient>();
        auto storage_http = std::make_shared<CurlHttpClient>();

        RetryPolicy rpc_retry{config.rpc_max_retries, config.rpc_retry_delay_ms};
        auto rpc = std::make_shared<RpcClient>(EndpointPool(config.rpc_urls), rpc_http,
                                               rpc_retry, config.rpc_timeout_ms);

        auto max_entries = static_cast<size_t>(std::max(config.audit_max_entries, 0));
        auto upload_log = std::make_shared<AuditLog>(config.upload_log_path,
                                                     "Content upload attempts", max_entries);
        auto tx_log = std::make_shared<AuditLog>(config.tx_log_path,
                                                 "Ledger transaction attempts", max_entries);

        UploaderOptions uploader_options;
        uploader_options.gateways = config.ipfs_gateways;
        uploader_options.gateway_timeout_ms = config.gateway_timeout_ms;
        auto uploader = std::make_shared<ContentUploader>(make_backends(config, storage_http),
                                                          config.cache_dir, storage_http,
                                                          uploader_options, upload_log);

        auto signer = std::make_shared<Signer>(config.private_key);
        spdlog::info("Signing account: {}", signer->address());

        PipelineOptions pipeline_options;
        pipeline_options.chain_id = config.chain_id;
        pipeline_options.default_to = config.contract_address;
        pipeline_options.gas_margin_percent = config.gas_margin_percent;
        pipeline_options.receipt_poll_ms = config.receipt_poll_ms;
        pipeline_options.receipt_timeout_ms = config.receipt_timeout_ms;
        pipeline_options.explorer_tx_url = config.explorer_tx_url;
        auto pipeline = std::make_shared<TransactionPipeline>(rpc, pipeline_options, tx_log);

        auto health = std::make_shared<HealthCheck>(rpc, uploader, upload_log, tx_log);

        if (rpc->test_connectivity()) {
            spdlog::info("RPC reachable via {}", util::redact_url(rpc->current_endpoint()));
        } else {
            spdlog::warn("No RPC endpoint answered at startup, continuing degraded");
        }

        ApiServer server(config, uploader, pipeline, signer, upload_log, tx_log, health);
        server.start();

        spdlog::info("{} started", config.service_name);

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Stopping services...");
        server.stop();
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
