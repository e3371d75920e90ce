#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class EntryType {
    Upload,
    Transaction
};

std::string to_string(EntryType type);
std::optional<EntryType> entry_type_from_string(const std::string& s);

struct AuditEntry {
    int64_t seq = 0;
    std::string timestamp;
    EntryType type = EntryType::Upload;
    std::string status;
    nlohmann::json payload;

    nlohmann::json to_json() const;
    static AuditEntry from_json(const nlohmann::json& j);
};

struct AuditFilter {
    std::optional<EntryType> type;
    std::optional<std::string> status;
    std::optional<std::string> filename_contains;  // case-insensitive, payload.filename
    std::optional<std::string> cid;
    std::optional<std::string> tx_hash;
    std::optional<std::string> function;
    std::optional<std::string> since;  // ISO-8601, inclusive
    std::optional<std::string> until;  // ISO-8601, inclusive
    size_t limit = 0;                  // most recent N matches, 0 = all
};

struct AuditStats {
    size_t total_entries = 0;
    std::map<std::string, size_t> by_type;
    std::map<std::string, size_t> by_status;
    std::map<std::string, size_t> by_function;
    uint64_t total_bytes = 0;       // successful uploads
    uint64_t total_gas = 0;         // every transaction with a receipt
    double success_rate = 0.0;
    double average_upload_bytes = 0.0;
    std::string first_timestamp;
    std::string last_timestamp;

    nlohmann::json to_json() const;
};

// Append-only audit store kept as one pretty-printed JSON document
// {metadata: {...}, entries: [...]}. Every mutation is read-modify-write of the whole file
// under an in-process mutex, written to "<path>.tmp" and renamed into place. Single writer
// process only: separate processes sharing one file can lose updates.
class AuditLog {
public:
    // max_entries > 0 trims the oldest entries on append once the cap is exceeded.
    explicit AuditLog(std::filesystem::path path,
                      std::string description = "",
                      size_t max_entries = 0);

    // Returns the new entry's sequence id. Ids are never reused, even after a trim.
    int64_t append(EntryType type, const std::string& status, nlohmann::json payload);

    std::vector<AuditEntry> query(const AuditFilter& filter) const;
    std::vector<AuditEntry> recent(size_t limit) const;
    std::optional<AuditEntry> find_by_tx_hash(const std::string& tx_hash) const;
    std::vector<AuditEntry> entries() const;
    size_t size() const;

    // Full scan on every call.
    AuditStats aggregate() const;

    // Retention. Each returns the number of entries removed.
    size_t trim(size_t keep_last_n);
    size_t trim_before(const std::string& iso_timestamp);
    size_t remove_cids(const std::set<std::string>& cids);

    // Returns the number of rows written (header excluded).
    size_t export_csv(const std::filesystem::path& csv_path) const;

    nlohmann::json metadata() const;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::string description_;
    size_t max_entries_;
    mutable std::mutex mutex_;

    nlohmann::json fresh_document() const;
    nlohmann::json load() const;
    void save(nlohmann::json& doc) const;

    static size_t drop_oldest(nlohmann::json& doc, size_t keep_last_n);
    static bool matches(const AuditEntry& entry, const AuditFilter& filter);
};
