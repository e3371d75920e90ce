#pragma once

#include <stdexcept>
#include <string>

class AnchorError : public std::runtime_error {
public:
    explicit AnchorError(const std::string& what) : std::runtime_error(what) {}
};

// Empty or malformed input, raised before any network call.
class ValidationError : public AnchorError {
public:
    explicit ValidationError(const std::string& what) : AnchorError(what) {}
};

// Every RPC endpoint exhausted its retries.
class ConnectivityError : public AnchorError {
public:
    ConnectivityError(const std::string& what, size_t endpoints_tried, int attempts)
        : AnchorError(what), endpoints_tried_(endpoints_tried), attempts_(attempts) {}

    size_t endpoints_tried() const { return endpoints_tried_; }
    int attempts() const { return attempts_; }

private:
    size_t endpoints_tried_;
    int attempts_;
};

// A healthy endpoint answered with a JSON-RPC error object.
class RpcCallError : public AnchorError {
public:
    RpcCallError(const std::string& method, int code, const std::string& message,
                 const std::string& data = "")
        : AnchorError(method + " failed: code=" + std::to_string(code) + " message=" + message)
        , method_(method), code_(code), message_(message), data_(data) {}

    const std::string& method() const { return method_; }
    int code() const { return code_; }
    const std::string& rpc_message() const { return message_; }
    const std::string& data() const { return data_; }

private:
    std::string method_;
    int code_;
    std::string message_;
    std::string data_;
};

class GasEstimationError : public AnchorError {
public:
    explicit GasEstimationError(const std::string& what) : AnchorError(what) {}
};

class BroadcastError : public AnchorError {
public:
    explicit BroadcastError(const std::string& what) : AnchorError(what) {}
};

// No receipt within the bound. The transaction may still be mined: re-query by hash.
class ConfirmationTimeoutError : public AnchorError {
public:
    ConfirmationTimeoutError(const std::string& what, const std::string& tx_hash)
        : AnchorError(what), tx_hash_(tx_hash) {}

    const std::string& tx_hash() const { return tx_hash_; }

private:
    std::string tx_hash_;
};

class NotFoundError : public AnchorError {
public:
    explicit NotFoundError(const std::string& what) : AnchorError(what) {}
};

class SigningError : public AnchorError {
public:
    explicit SigningError(const std::string& what) : AnchorError(what) {}
};

class AuditStoreError : public AnchorError {
public:
    explicit AuditStoreError(const std::string& what) : AnchorError(what) {}
};
