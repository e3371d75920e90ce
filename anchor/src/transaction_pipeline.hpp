#pragma once

#include "audit_log.hpp"
#include "rpc_client.hpp"
#include "signer.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

struct CallDescriptor {
    std::string function;   // Solidity signature, e.g. "setTokenURI(uint256,string)"
    nlohmann::json parameters = nlohmann::json::array();
    std::string to;         // empty: the pipeline's default contract
    std::string data;       // pre-encoded calldata, takes precedence over function/parameters
    uint64_t value = 0;     // wei
};

struct TransactionResult {
    std::string hash;
    uint64_t block_number = 0;
    uint64_t gas_used = 0;
    int status = 0;  // 1 = success, 0 = reverted on chain

    uint64_t nonce = 0;
    uint64_t gas_estimate = 0;
    uint64_t gas_limit = 0;
    uint64_t gas_price = 0;
    std::string explorer_url;

    bool succeeded() const { return status == 1; }
    nlohmann::json to_json() const;
};

struct PipelineOptions {
    uint64_t chain_id = 421614;
    std::string default_to;
    int gas_margin_percent = 120;
    int receipt_poll_ms = 2000;
    int receipt_timeout_ms = 120000;
    std::string explorer_tx_url;
};

// nonce -> gas estimate -> gas price -> sign -> broadcast -> receipt, strictly in order
// and blocking. A broadcast is never repeated automatically.
class TransactionPipeline {
public:
    TransactionPipeline(std::shared_ptr<RpcClient> rpc,
                        PipelineOptions options = PipelineOptions{},
                        std::shared_ptr<AuditLog> audit = nullptr);

    // Throws ValidationError, ConnectivityError, RpcCallError, GasEstimationError,
    // BroadcastError or ConfirmationTimeoutError. An on-chain revert is returned with
    // status 0, not thrown.
    TransactionResult submit(const CallDescriptor& call, const Signer& signer);

    // eth_call against the latest block, returns the raw result hex.
    std::string read_call(const CallDescriptor& call, const std::string& from = "");

    // nullopt while the transaction is not yet mined.
    std::optional<TransactionResult> find_receipt(const std::string& tx_hash);

    // Best-effort display reads, fields degrade to an "errors" list instead of throwing.
    nlohmann::json account_info(const std::string& address);
    nlohmann::json network_info();

    std::string explorer_link(const std::string& tx_hash) const;
    const PipelineOptions& options() const { return options_; }

    static uint64_t apply_margin(uint64_t estimate, int margin_percent);

private:
    std::shared_ptr<RpcClient> rpc_;
    PipelineOptions options_;
    std::shared_ptr<AuditLog> audit_;

    std::string target(const CallDescriptor& call) const;
    static Bytes calldata(const CallDescriptor& call);
    static TransactionResult parse_receipt(const nlohmann::json& receipt, const std::string& tx_hash);

    uint64_t estimate_gas(const std::string& from, const std::string& to,
                          const Bytes& data, uint64_t value);
    std::string broadcast(const SignedTransaction& signed_tx);
    TransactionResult wait_for_receipt(const std::string& tx_hash);

    void record(const std::string& status, nlohmann::json payload);
};
