#pragma once

#include "audit_log.hpp"
#include "config.hpp"
#include "content_uploader.hpp"
#include "health.hpp"
#include "signer.hpp"
#include "transaction_pipeline.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

class ApiServer {
public:
    ApiServer(const Config& config,
              std::shared_ptr<ContentUploader> uploader,
              std::shared_ptr<TransactionPipeline> pipeline,
              std::shared_ptr<Signer> signer,
              std::shared_ptr<AuditLog> upload_log,
              std::shared_ptr<AuditLog> tx_log,
              std::shared_ptr<HealthCheck> health);

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    const Config& config_;
    std::shared_ptr<ContentUploader> uploader_;
    std::shared_ptr<TransactionPipeline> pipeline_;
    std::shared_ptr<Signer> signer_;
    std::shared_ptr<AuditLog> upload_log_;
    std::shared_ptr<AuditLog> tx_log_;
    std::shared_ptr<HealthCheck> health_;

    // RpcClient's sticky endpoint pointer is unsynchronized; every handler that
    // reaches the chain holds this.
    std::mutex chain_mutex_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_account(const httplib::Request& req, httplib::Response& res);
    void handle_network(const httplib::Request& req, httplib::Response& res);
    void handle_upload(const httplib::Request& req, httplib::Response& res);
    void handle_download(const httplib::Request& req, httplib::Response& res);
    void handle_submit(const httplib::Request& req, httplib::Response& res);
    void handle_call(const httplib::Request& req, httplib::Response& res);
    void handle_receipt(const httplib::Request& req, httplib::Response& res);
    void handle_logs(const AuditLog& log, EntryType type,
                     const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_trim(const httplib::Request& req, httplib::Response& res);
};
