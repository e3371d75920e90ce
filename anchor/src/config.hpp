#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

struct Config {
    // RPC
    std::vector<std::string> rpc_urls;
    uint64_t chain_id;
    int rpc_max_retries;
    int rpc_retry_delay_ms;
    int rpc_timeout_ms;

    // Signing and contract
    std::string private_key;
    std::string contract_address;
    std::string explorer_tx_url;
    int gas_margin_percent;
    int receipt_poll_ms;
    int receipt_timeout_ms;

    // Storage backends (each enabled by its credential)
    std::string web3_storage_token;
    std::string nft_storage_token;
    std::string pinata_jwt;
    int upload_timeout_ms;
    std::vector<std::string> ipfs_gateways;
    int gateway_timeout_ms;
    std::string cache_dir;

    // Audit logs
    std::string upload_log_path;
    std::string tx_log_path;
    int audit_max_entries;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    // Decimal chain id. Throws std::runtime_error on signs, junk or overflow.
    static uint64_t parse_chain_id(const std::string& text);

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
