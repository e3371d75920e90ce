#pragma once

#include "audit_log.hpp"
#include "content_uploader.hpp"
#include "rpc_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RpcClient> rpc,
                std::shared_ptr<ContentUploader> uploader,
                std::shared_ptr<AuditLog> upload_log,
                std::shared_ptr<AuditLog> tx_log);

    // Probes the RPC pool, so callers sharing the client must hold their lock.
    nlohmann::json get_status();
    bool is_healthy() const { return rpc_ok_; }

private:
    std::shared_ptr<RpcClient> rpc_;
    std::shared_ptr<ContentUploader> uploader_;
    std::shared_ptr<AuditLog> upload_log_;
    std::shared_ptr<AuditLog> tx_log_;
    bool rpc_ok_;
};
