#include "audit_log.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* kStoreVersion = "1.0.0";

std::string payload_string(const nlohmann::json& payload, const char* key) {
    if (payload.is_object() && payload.contains(key) && payload[key].is_string()) {
        return payload[key].get<std::string>();
    }
    return "";
}

uint64_t payload_u64(const nlohmann::json& payload, const char* key) {
    if (payload.is_object() && payload.contains(key) && payload[key].is_number_unsigned()) {
        return payload[key].get<uint64_t>();
    }
    if (payload.is_object() && payload.contains(key) && payload[key].is_number_integer()) {
        auto v = payload[key].get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return 0;
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

std::string to_string(EntryType type) {
    switch (type) {
        case EntryType::Upload: return "upload";
        case EntryType::Transaction: return "transaction";
    }
    return "upload";
}

std::optional<EntryType> entry_type_from_string(const std::string& s) {
    if (s == "upload") return EntryType::Upload;
    if (s == "transaction") return EntryType::Transaction;
    return std::nullopt;
}

nlohmann::json AuditEntry::to_json() const {
    return {
        {"seq", seq},
        {"timestamp", timestamp},
        {"type", to_string(type)},
        {"status", status},
        {"payload", payload}
    };
}

AuditEntry AuditEntry::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("seq") || !j["seq"].is_number_integer()) {
        throw AuditStoreError("Audit entry without an integer seq");
    }

    AuditEntry entry;
    entry.seq = j["seq"].get<int64_t>();
    entry.timestamp = j.value("timestamp", std::string());
    auto type = entry_type_from_string(j.value("type", std::string()));
    if (!type) {
        throw AuditStoreError("Unknown audit entry type at seq " + std::to_string(entry.seq));
    }
    entry.type = *type;
    entry.status = j.value("status", std::string());
    entry.payload = j.contains("payload") ? j["payload"] : nlohmann::json::object();
    return entry;
}

nlohmann::json AuditStats::to_json() const {
    return {
        {"total_entries", total_entries},
        {"by_type", by_type},
        {"by_status", by_status},
        {"by_function", by_function},
        {"total_bytes", total_bytes},
        {"total_size_mb", static_cast<double>(total_bytes) / (1024.0 * 1024.0)},
        {"total_gas", total_gas},
        {"success_rate", success_rate},
        {"average_upload_bytes", average_upload_bytes},
        {"first_timestamp", first_timestamp.empty() ? nlohmann::json() : nlohmann::json(first_timestamp)},
        {"last_timestamp", last_timestamp.empty() ? nlohmann::json() : nlohmann::json(last_timestamp)}
    };
}

AuditLog::AuditLog(fs::path path, std::string description, size_t max_entries)
    : path_(std::move(path))
    , description_(std::move(description))
    , max_entries_(max_entries)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw AuditStoreError("Cannot create audit directory " +
                                  path_.parent_path().string() + ": " + ec.message());
        }
    }

    if (!fs::exists(path_)) {
        auto doc = fresh_document();
        save(doc);
        spdlog::info("Initialized audit log {}", path_.string());
    } else {
        // Refuse to start on top of a corrupt store
        auto doc = load();
        spdlog::info("Opened audit log {} ({} entries)", path_.string(), doc["entries"].size());
    }
}

nlohmann::json AuditLog::fresh_document() const {
    return {
        {"metadata", {
            {"created_at", util::current_iso8601()},
            {"version", kStoreVersion},
            {"description", description_},
            {"last_seq", 0},
            {"last_updated", nullptr},
            {"total_entries", 0},
            {"last_trimmed", nullptr}
        }},
        {"entries", nlohmann::json::array()}
    };
}

nlohmann::json AuditLog::load() const {
    std::ifstream in(path_);
    if (!in) {
        if (!fs::exists(path_)) {
            return fresh_document();
        }
        throw AuditStoreError("Cannot read audit log " + path_.string());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw AuditStoreError("Corrupt audit log " + path_.string() + ": " + e.what());
    }

    if (!doc.is_object() || !doc.contains("entries") || !doc["entries"].is_array()) {
        throw AuditStoreError("Audit log " + path_.string() + " has no entries array");
    }
    if (!doc.contains("metadata") || !doc["metadata"].is_object()) {
        doc["metadata"] = fresh_document()["metadata"];
    }

    // Older documents without a persisted counter continue from the highest seq on file
    auto& meta = doc["metadata"];
    if (!meta.contains("last_seq") || !meta["last_seq"].is_number_integer()) {
        int64_t max_seq = 0;
        for (const auto& e : doc["entries"]) {
            max_seq = std::max(max_seq, e.value("seq", static_cast<int64_t>(0)));
        }
        meta["last_seq"] = max_seq;
    }
    return doc;
}

void AuditLog::save(nlohmann::json& doc) const {
    auto& meta = doc["metadata"];
    meta["total_entries"] = doc["entries"].size();
    meta["last_updated"] = util::current_iso8601();

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw AuditStoreError("Cannot write audit log " + tmp.string());
        }
        out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        if (!out) {
            throw AuditStoreError("Short write to audit log " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        throw AuditStoreError("Cannot replace audit log " + path_.string() + ": " + ec.message());
    }
}

size_t AuditLog::drop_oldest(nlohmann::json& doc, size_t keep_last_n) {
    auto& entries = doc["entries"];
    if (entries.size() <= keep_last_n) {
        return 0;
    }
    size_t removed = entries.size() - keep_last_n;
    entries.erase(entries.begin(), entries.begin() + static_cast<long>(removed));
    doc["metadata"]["last_trimmed"] = util::current_iso8601();
    return removed;
}

int64_t AuditLog::append(EntryType type, const std::string& status, nlohmann::json payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    int64_t seq = doc["metadata"]["last_seq"].get<int64_t>() + 1;

    AuditEntry entry;
    entry.seq = seq;
    entry.timestamp = util::current_iso8601();
    entry.type = type;
    entry.status = status;
    entry.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);

    doc["entries"].push_back(entry.to_json());
    doc["metadata"]["last_seq"] = seq;

    if (max_entries_ > 0) {
        size_t removed = drop_oldest(doc, max_entries_);
        if (removed > 0) {
            spdlog::info("Audit log {} capped at {} entries, dropped {}",
                         path_.filename().string(), max_entries_, removed);
        }
    }

    save(doc);
    spdlog::debug("Audit {} #{} {} {}", path_.filename().string(), seq, to_string(type), status);
    return seq;
}

bool AuditLog::matches(const AuditEntry& entry, const AuditFilter& filter) {
    if (filter.type && entry.type != *filter.type) return false;
    if (filter.status && entry.status != *filter.status) return false;

    if (filter.filename_contains) {
        auto filename = util::to_lower(payload_string(entry.payload, "filename"));
        if (filename.find(util::to_lower(*filter.filename_contains)) == std::string::npos) {
            return false;
        }
    }
    if (filter.cid && payload_string(entry.payload, "cid") != *filter.cid) return false;
    if (filter.tx_hash &&
        util::to_lower(payload_string(entry.payload, "tx_hash")) != util::to_lower(*filter.tx_hash)) {
        return false;
    }
    if (filter.function && payload_string(entry.payload, "function") != *filter.function) return false;

    // ISO-8601 UTC timestamps order lexicographically
    if (filter.since && entry.timestamp < *filter.since) return false;
    if (filter.until && entry.timestamp > *filter.until) return false;
    return true;
}

std::vector<AuditEntry> AuditLog::query(const AuditFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = load();

    std::vector<AuditEntry> out;
    for (const auto& j : doc["entries"]) {
        auto entry = AuditEntry::from_json(j);
        if (matches(entry, filter)) {
            out.push_back(std::move(entry));
        }
    }

    if (filter.limit > 0 && out.size() > filter.limit) {
        out.erase(out.begin(), out.end() - static_cast<long>(filter.limit));
    }
    return out;
}

std::vector<AuditEntry> AuditLog::recent(size_t limit) const {
    AuditFilter filter;
    filter.limit = limit;
    return query(filter);
}

std::vector<AuditEntry> AuditLog::entries() const {
    return query(AuditFilter{});
}

std::optional<AuditEntry> AuditLog::find_by_tx_hash(const std::string& tx_hash) const {
    AuditFilter filter;
    filter.tx_hash = tx_hash;
    auto found = query(filter);
    if (found.empty()) {
        return std::nullopt;
    }
    return found.back();
}

size_t AuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load()["entries"].size();
}

nlohmann::json AuditLog::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load()["metadata"];
}

AuditStats AuditLog::aggregate() const {
    AuditStats stats;
    size_t successes = 0;
    size_t successful_uploads = 0;

    for (const auto& entry : entries()) {
        stats.total_entries++;
        stats.by_type[to_string(entry.type)]++;
        stats.by_status[entry.status]++;

        if (entry.status == "success") {
            successes++;
        }

        if (entry.type == EntryType::Upload && entry.status == "success") {
            successful_uploads++;
            stats.total_bytes += payload_u64(entry.payload, "size_bytes");
        }

        if (entry.type == EntryType::Transaction) {
            stats.total_gas += payload_u64(entry.payload, "gas_used");
            auto function = payload_string(entry.payload, "function");
            if (!function.empty()) {
                stats.by_function[function]++;
            }
        }

        if (stats.first_timestamp.empty() || entry.timestamp < stats.first_timestamp) {
            stats.first_timestamp = entry.timestamp;
        }
        if (entry.timestamp > stats.last_timestamp) {
            stats.last_timestamp = entry.timestamp;
        }
    }

    if (stats.total_entries > 0) {
        stats.success_rate = static_cast<double>(successes) / static_cast<double>(stats.total_entries);
    }
    if (successful_uploads > 0) {
        stats.average_upload_bytes =
            static_cast<double>(stats.total_bytes) / static_cast<double>(successful_uploads);
    }
    return stats;
}

size_t AuditLog::trim(size_t keep_last_n) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    size_t removed = drop_oldest(doc, keep_last_n);
    if (removed > 0) {
        save(doc);
        spdlog::info("Trimmed {} entries from {}, kept last {}",
                     removed, path_.filename().string(), keep_last_n);
    }
    return removed;
}

size_t AuditLog::trim_before(const std::string& iso_timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    auto& entries = doc["entries"];
    size_t before = entries.size();

    nlohmann::json kept = nlohmann::json::array();
    for (auto& e : entries) {
        if (e.value("timestamp", std::string()) >= iso_timestamp) {
            kept.push_back(std::move(e));
        }
    }
    entries = std::move(kept);

    size_t removed = before - entries.size();
    if (removed > 0) {
        doc["metadata"]["last_trimmed"] = util::current_iso8601();
        save(doc);
        spdlog::info("Trimmed {} entries older than {} from {}",
                     removed, iso_timestamp, path_.filename().string());
    }
    return removed;
}

size_t AuditLog::remove_cids(const std::set<std::string>& cids) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto doc = load();
    auto& entries = doc["entries"];
    size_t before = entries.size();

    nlohmann::json kept = nlohmann::json::array();
    for (auto& e : entries) {
        auto cid = e.contains("payload") ? payload_string(e["payload"], "cid") : "";
        if (cid.empty() || cids.count(cid) == 0) {
            kept.push_back(std::move(e));
        }
    }
    entries = std::move(kept);

    size_t removed = before - entries.size();
    if (removed > 0) {
        doc["metadata"]["last_trimmed"] = util::current_iso8601();
        save(doc);
        spdlog::info("Removed {} entries for {} content ids from {}",
                     removed, cids.size(), path_.filename().string());
    }
    return removed;
}

size_t AuditLog::export_csv(const fs::path& csv_path) const {
    auto all = entries();

    std::ofstream out(csv_path, std::ios::trunc);
    if (!out) {
        throw AuditStoreError("Cannot write CSV export " + csv_path.string());
    }

    out << "seq,timestamp,type,status,filename,size_bytes,cid,tx_hash\n";
    for (const auto& e : all) {
        out << e.seq << ','
            << csv_field(e.timestamp) << ','
            << to_string(e.type) << ','
            << csv_field(e.status) << ','
            << csv_field(payload_string(e.payload, "filename")) << ','
            << payload_u64(e.payload, "size_bytes") << ','
            << csv_field(payload_string(e.payload, "cid")) << ','
            << csv_field(payload_string(e.payload, "tx_hash")) << '\n';
    }
    if (!out) {
        throw AuditStoreError("Short write to CSV export " + csv_path.string());
    }

    spdlog::info("Exported {} audit entries to {}", all.size(), csv_path.string());
    return all.size();
}
