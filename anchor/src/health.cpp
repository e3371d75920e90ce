#include "health.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

HealthCheck::HealthCheck(std::shared_ptr<RpcClient> rpc,
                         std::shared_ptr<ContentUploader> uploader,
                         std::shared_ptr<AuditLog> upload_log,
                         std::shared_ptr<AuditLog> tx_log)
    : rpc_(rpc), uploader_(uploader), upload_log_(upload_log), tx_log_(tx_log), rpc_ok_(false) {}

nlohmann::json HealthCheck::get_status() {
    rpc_ok_ = rpc_->test_connectivity();

    nlohmann::json audit;
    try {
        audit = {
            {"uploads", upload_log_->size()},
            {"transactions", tx_log_->size()}
        };
    } catch (const AuditStoreError& e) {
        spdlog::error("Audit store unreadable: {}", e.what());
        audit = {{"error", e.what()}};
    }

    nlohmann::json status = {
        {"ok", rpc_ok_},
        {"rpc", rpc_ok_ ? "up" : "degraded"},
        {"endpoint", util::redact_url(rpc_->current_endpoint())},
        {"endpoints", rpc_->pool().size()},
        {"storage", uploader_->enabled_backends()},
        {"audit", audit},
        {"ts", util::current_iso8601()}
    };

    return status;
}
