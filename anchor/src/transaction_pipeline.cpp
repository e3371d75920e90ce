#include "transaction_pipeline.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <thread>

nlohmann::json TransactionResult::to_json() const {
    return {
        {"tx_hash", hash},
        {"block_number", block_number},
        {"gas_used", gas_used},
        {"status", status},
        {"nonce", nonce},
        {"gas_estimate", gas_estimate},
        {"gas_limit", gas_limit},
        {"gas_price", gas_price},
        {"explorer_url", explorer_url}
    };
}

TransactionPipeline::TransactionPipeline(std::shared_ptr<RpcClient> rpc,
                                         PipelineOptions options,
                                         std::shared_ptr<AuditLog> audit)
    : rpc_(std::move(rpc))
    , options_(std::move(options))
    , audit_(std::move(audit))
{
    if (!rpc_) {
        throw ValidationError("TransactionPipeline requires an RPC client");
    }
    if (options_.gas_margin_percent < 100) {
        throw ValidationError("Gas margin must be at least 100 percent");
    }
}

uint64_t TransactionPipeline::apply_margin(uint64_t estimate, int margin_percent) {
    return estimate * static_cast<uint64_t>(margin_percent) / 100;
}

std::string TransactionPipeline::explorer_link(const std::string& tx_hash) const {
    if (options_.explorer_tx_url.empty()) return "";
    return util::join_url(options_.explorer_tx_url, tx_hash);
}

void TransactionPipeline::record(const std::string& status, nlohmann::json payload) {
    if (audit_) {
        audit_->append(EntryType::Transaction, status, std::move(payload));
    }
}

std::string TransactionPipeline::target(const CallDescriptor& call) const {
    std::string to = call.to.empty() ? options_.default_to : call.to;
    if (to.empty()) {
        throw ValidationError("No target contract address");
    }
    if (hex::decode(to).size() != 20) {
        throw ValidationError("Target must be a 20-byte address: " + to);
    }
    return to;
}

Bytes TransactionPipeline::calldata(const CallDescriptor& call) {
    if (!call.data.empty()) {
        return hex::decode(call.data);
    }
    if (call.function.empty()) {
        return Bytes();
    }
    return abi::encode_call(call.function, call.parameters);
}

TransactionResult TransactionPipeline::parse_receipt(const nlohmann::json& receipt,
                                                     const std::string& tx_hash) {
    TransactionResult out;
    out.hash = receipt.value("transactionHash", tx_hash);

    auto quantity_of = [&receipt](const char* key, uint64_t fallback) {
        if (receipt.contains(key) && receipt[key].is_string()) {
            return hex::parse_quantity(receipt[key].get<std::string>());
        }
        return fallback;
    };

    out.block_number = quantity_of("blockNumber", 0);
    out.gas_used = quantity_of("gasUsed", 0);
    // Receipts without a status field predate Byzantium and only exist for mined successes
    out.status = static_cast<int>(quantity_of("status", 1));
    if (receipt.contains("effectiveGasPrice") && receipt["effectiveGasPrice"].is_string()) {
        out.gas_price = hex::parse_quantity(receipt["effectiveGasPrice"].get<std::string>());
    }
    return out;
}

std::optional<TransactionResult> TransactionPipeline::find_receipt(const std::string& tx_hash) {
    auto receipt = rpc_->call("eth_getTransactionReceipt", nlohmann::json::array({tx_hash}));
    if (receipt.is_null()) {
        return std::nullopt;
    }
    if (!receipt.is_object()) {
        throw ValidationError("Unexpected receipt for " + tx_hash);
    }

    auto result = parse_receipt(receipt, tx_hash);
    result.explorer_url = explorer_link(result.hash);
    return result;
}

uint64_t TransactionPipeline::estimate_gas(const std::string& from, const std::string& to,
                                           const Bytes& data, uint64_t value) {
    nlohmann::json tx = {
        {"from", from},
        {"to", to},
        {"data", hex::encode(data)},
        {"value", hex::quantity(value)}
    };

    auto response = rpc_->request("eth_estimateGas", nlohmann::json::array({tx}));
    if (!response.ok()) {
        throw GasEstimationError(fmt::format("Gas estimation failed, the call would revert: {} (code {})",
                                             response.error->message, response.error->code));
    }
    if (!response.result.is_string()) {
        throw GasEstimationError("Gas estimation returned no quantity");
    }
    return hex::parse_quantity(response.result.get<std::string>());
}

std::string TransactionPipeline::broadcast(const SignedTransaction& signed_tx) {
    RpcResponse response;
    try {
        response = rpc_->request_once("eth_sendRawTransaction", nlohmann::json::array({signed_tx.raw_hex}));
    } catch (const ConnectivityError& e) {
        throw BroadcastError(std::string("Broadcast did not reach the node: ") + e.what());
    }

    if (!response.ok()) {
        throw BroadcastError(fmt::format("Node rejected transaction {}: {} (code {})",
                                         signed_tx.hash, response.error->message, response.error->code));
    }

    if (response.result.is_string()) {
        auto node_hash = response.result.get<std::string>();
        if (util::to_lower(node_hash) != util::to_lower(signed_tx.hash)) {
            spdlog::warn("Node returned hash {} but local hash is {}, using the node's",
                         node_hash, signed_tx.hash);
            return node_hash;
        }
    }
    return signed_tx.hash;
}

TransactionResult TransactionPipeline::wait_for_receipt(const std::string& tx_hash) {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + std::chrono::milliseconds(options_.receipt_timeout_ms);
    int polls = 0;

    for (;;) {
        polls++;
        try {
            if (auto receipt = find_receipt(tx_hash)) {
                return *receipt;
            }
        } catch (const ConnectivityError& e) {
            spdlog::warn("Receipt poll {} for {} failed: {}", polls, tx_hash, e.what());
        } catch (const RpcCallError& e) {
            spdlog::warn("Receipt poll {} for {} failed: {}", polls, tx_hash, e.what());
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw ConfirmationTimeoutError(
                fmt::format("No receipt for {} after {} ms ({} polls); it may still be mined, "
                            "query it by hash instead of resubmitting",
                            tx_hash, options_.receipt_timeout_ms, polls),
                tx_hash);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(options_.receipt_poll_ms)));
    }
}

TransactionResult TransactionPipeline::submit(const CallDescriptor& call, const Signer& signer) {
    const auto started = std::chrono::steady_clock::now();
    const std::string& from = signer.address();
    std::string stage = "validate";

    nlohmann::json payload = {
        {"function", call.function},
        {"parameters", call.parameters},
        {"from", from},
        {"value", call.value},
        {"chain_id", options_.chain_id}
    };

    TransactionResult result;
    try {
        auto to = target(call);
        payload["to"] = to;
        Bytes data = calldata(call);

        stage = "nonce";
        result.nonce = hex::parse_quantity(
            rpc_->call("eth_getTransactionCount", nlohmann::json::array({from, "pending"})).get<std::string>());
        payload["nonce"] = result.nonce;
        spdlog::info("Nonce for {}: {}", from, result.nonce);

        stage = "estimate_gas";
        try {
            result.gas_estimate = estimate_gas(from, to, data, call.value);
        } catch (const RpcCallError& e) {
            throw GasEstimationError(e.what());
        }
        result.gas_limit = apply_margin(result.gas_estimate, options_.gas_margin_percent);
        payload["gas_estimate"] = result.gas_estimate;
        payload["gas_limit"] = result.gas_limit;
        spdlog::info("Gas estimate {} -> limit {} ({}%)",
                     result.gas_estimate, result.gas_limit, options_.gas_margin_percent);

        stage = "gas_price";
        result.gas_price = hex::parse_quantity(rpc_->call("eth_gasPrice").get<std::string>());
        payload["gas_price"] = result.gas_price;
        spdlog::info("Gas price {} wei", result.gas_price);

        stage = "sign";
        UnsignedTransaction tx;
        tx.nonce = result.nonce;
        tx.gas_price = result.gas_price;
        tx.gas_limit = result.gas_limit;
        tx.to = to;
        tx.value = call.value;
        tx.data = data;
        tx.chain_id = options_.chain_id;
        auto signed_tx = signer.sign(tx);

        stage = "broadcast";
        result.hash = broadcast(signed_tx);
        result.explorer_url = explorer_link(result.hash);
        payload["tx_hash"] = result.hash;
        payload["explorer_url"] = result.explorer_url;
        spdlog::info("Broadcast {} via {}", result.hash, util::redact_url(rpc_->current_endpoint()));

        stage = "receipt";
        auto receipt = wait_for_receipt(result.hash);
        result.block_number = receipt.block_number;
        result.gas_used = receipt.gas_used;
        result.status = receipt.status;
    } catch (const AuditStoreError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        // A result of the wrong JSON type from the node
        payload["stage"] = stage;
        payload["error"] = e.what();
        record("failed", std::move(payload));
        throw RpcCallError(stage, 0, e.what());
    } catch (const AnchorError& e) {
        spdlog::error("Transaction failed at {}: {}", stage, e.what());
        payload["stage"] = stage;
        payload["error"] = e.what();
        record("failed", std::move(payload));
        throw;
    }

    double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    payload["block_number"] = result.block_number;
    payload["gas_used"] = result.gas_used;
    payload["status"] = result.status;
    payload["duration_seconds"] = duration;

    if (result.succeeded()) {
        spdlog::info("Transaction {} confirmed in block {}, gas used {}",
                     result.hash, result.block_number, result.gas_used);
        record("success", std::move(payload));
    } else {
        spdlog::error("Transaction {} reverted in block {}", result.hash, result.block_number);
        payload["reverted"] = true;
        record("failed", std::move(payload));
    }
    return result;
}

std::string TransactionPipeline::read_call(const CallDescriptor& call, const std::string& from) {
    nlohmann::json tx = {
        {"to", target(call)},
        {"data", hex::encode(calldata(call))}
    };
    if (!from.empty()) {
        tx["from"] = from;
    }

    auto result = rpc_->call("eth_call", nlohmann::json::array({tx, "latest"}));
    if (!result.is_string()) {
        throw RpcCallError("eth_call", 0, "non-string result");
    }
    return result.get<std::string>();
}

nlohmann::json TransactionPipeline::account_info(const std::string& address) {
    nlohmann::json info = {{"address", address}};
    nlohmann::json errors = nlohmann::json::array();

    try {
        auto balance = rpc_->call("eth_getBalance", nlohmann::json::array({address, "latest"})).get<std::string>();
        info["balance_wei"] = hex::quantity_to_decimal(balance);
        info["balance_eth"] = static_cast<double>(hex::parse_quantity_ld(balance) / 1e18L);
    } catch (const AnchorError& e) {
        errors.push_back(std::string("balance: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        errors.push_back(std::string("balance: ") + e.what());
    }

    try {
        auto nonce = rpc_->call("eth_getTransactionCount", nlohmann::json::array({address, "latest"})).get<std::string>();
        info["nonce"] = hex::parse_quantity(nonce);
    } catch (const AnchorError& e) {
        errors.push_back(std::string("nonce: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        errors.push_back(std::string("nonce: ") + e.what());
    }

    if (!errors.empty()) {
        spdlog::warn("Account info for {} is partial: {}", address,
                     errors.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        info["errors"] = errors;
    }
    return info;
}

nlohmann::json TransactionPipeline::network_info() {
    nlohmann::json info = {
        {"endpoint", util::redact_url(rpc_->current_endpoint())},
        {"configured_chain_id", options_.chain_id}
    };
    nlohmann::json errors = nlohmann::json::array();

    auto read_quantity = [this, &errors](const char* method) -> std::optional<uint64_t> {
        try {
            return hex::parse_quantity(rpc_->call(method).get<std::string>());
        } catch (const AnchorError& e) {
            errors.push_back(std::string(method) + ": " + e.what());
        } catch (const nlohmann::json::exception& e) {
            errors.push_back(std::string(method) + ": " + e.what());
        }
        return std::nullopt;
    };

    if (auto chain_id = read_quantity("eth_chainId")) {
        info["chain_id"] = *chain_id;
        if (*chain_id != options_.chain_id) {
            spdlog::warn("Node reports chain id {}, configured {}", *chain_id, options_.chain_id);
        }
    }
    if (auto block = read_quantity("eth_blockNumber")) {
        info["block_number"] = *block;
    }
    if (auto gas_price = read_quantity("eth_gasPrice")) {
        info["gas_price_wei"] = *gas_price;
        info["gas_price_gwei"] = static_cast<double>(*gas_price) / 1e9;
    }

    info["connected"] = errors.empty();
    if (!errors.empty()) {
        info["errors"] = errors;
    }
    return info;
}
