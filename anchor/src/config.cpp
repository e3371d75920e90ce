#include "config.hpp"
#include "hex.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

uint64_t Config::parse_chain_id(const std::string& text) {
    auto trimmed = util::trim(text);
    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("CHAIN_ID must be a positive decimal integer, got '" + text + "'");
    }
    try {
        return std::stoull(trimmed);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("CHAIN_ID is out of range: " + text);
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.rpc_urls = util::split(get_env("RPC_URLS", "https://sepolia-rollup.arbitrum.io/rpc"), ',');
    cfg.chain_id = parse_chain_id(get_env("CHAIN_ID", "421614"));
    cfg.rpc_max_retries = get_env_int("RPC_MAX_RETRIES", 3);
    cfg.rpc_retry_delay_ms = get_env_int("RPC_RETRY_DELAY_MS", 2000);
    cfg.rpc_timeout_ms = get_env_int("RPC_TIMEOUT_MS", 45000);

    cfg.private_key = get_env("PRIVATE_KEY");
    cfg.contract_address = get_env("CONTRACT_ADDRESS");
    cfg.explorer_tx_url = get_env("EXPLORER_TX_URL", "https://sepolia.arbiscan.io/tx/");
    cfg.gas_margin_percent = get_env_int("GAS_MARGIN_PERCENT", 120);
    cfg.receipt_poll_ms = get_env_int("RECEIPT_POLL_MS", 2000);
    cfg.receipt_timeout_ms = get_env_int("RECEIPT_TIMEOUT_MS", 120000);

    cfg.web3_storage_token = get_env("WEB3_STORAGE_TOKEN");
    cfg.nft_storage_token = get_env("NFT_STORAGE_TOKEN");
    cfg.pinata_jwt = get_env("PINATA_JWT");
    cfg.upload_timeout_ms = get_env_int("UPLOAD_TIMEOUT_MS", 60000);
    cfg.ipfs_gateways = util::split(get_env("IPFS_GATEWAYS"), ',');
    cfg.gateway_timeout_ms = get_env_int("GATEWAY_TIMEOUT_MS", 30000);
    cfg.cache_dir = get_env("CACHE_DIR", "data/cache");

    cfg.upload_log_path = get_env("UPLOAD_LOG_PATH", "data/logs/upload_log.json");
    cfg.tx_log_path = get_env("TX_LOG_PATH", "data/logs/transaction_log.json");
    cfg.audit_max_entries = get_env_int("AUDIT_MAX_ENTRIES", 1000);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8090);

    cfg.service_name = get_env("SERVICE_NAME", "anchor");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (rpc_urls.empty()) {
        throw std::runtime_error("RPC_URLS is required");
    }
    if (private_key.empty()) {
        throw std::runtime_error("PRIVATE_KEY is required");
    }
    auto key = hex::strip_prefix(util::trim(private_key));
    if (key.size() != 64 || key.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        throw std::runtime_error("PRIVATE_KEY must be 32 bytes of hex");
    }
    if (chain_id == 0) {
        throw std::runtime_error("CHAIN_ID must be non-zero");
    }
    if (gas_margin_percent < 100) {
        throw std::runtime_error("GAS_MARGIN_PERCENT must be at least 100");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  RPC endpoints: {}", rpc_urls.size());
    spdlog::info("  Chain id: {}", chain_id);
    spdlog::info("  Retries: {} x {}ms, timeout {}ms", rpc_max_retries, rpc_retry_delay_ms, rpc_timeout_ms);
    spdlog::info("  Gas margin: {}%", gas_margin_percent);
    if (contract_address.empty()) {
        spdlog::warn("  CONTRACT_ADDRESS not set, /tx requests must name a target");
    }
}
