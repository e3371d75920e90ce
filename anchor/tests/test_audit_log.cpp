#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/audit_log.hpp"
#include "../src/errors.hpp"
#include "temp_dir.hpp"
#include <fstream>
#include <sstream>

namespace {

nlohmann::json upload_payload(const std::string& filename, uint64_t size, const std::string& cid) {
    return {{"filename", filename}, {"size_bytes", size}, {"cid", cid}};
}

nlohmann::json tx_payload(const std::string& function, const std::string& tx_hash, uint64_t gas_used) {
    return {{"function", function}, {"tx_hash", tx_hash}, {"gas_used", gas_used}};
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Sequence ids survive reopen", "[audit]") {
    TempDir tmp;
    auto path = tmp / "logs" / "upload_log.json";

    {
        AuditLog log(path, "Content upload attempts");
        for (int i = 0; i < 5; i++) {
            log.append(EntryType::Upload, "success", upload_payload("f" + std::to_string(i), 10, "bafy" + std::to_string(i)));
        }
    }

    AuditLog reopened(path);
    auto entries = reopened.entries();
    REQUIRE(entries.size() == 5);
    for (size_t i = 0; i < entries.size(); i++) {
        REQUIRE(entries[i].seq == static_cast<int64_t>(i + 1));
        REQUIRE(entries[i].timestamp.size() == 20);
    }

    REQUIRE(reopened.append(EntryType::Upload, "failed", {{"filename", "x"}}) == 6);

    auto meta = reopened.metadata();
    REQUIRE(meta["version"] == "1.0.0");
    REQUIRE(meta["description"] == "Content upload attempts");
    REQUIRE(meta["total_entries"] == 6);
    REQUIRE(meta["last_seq"] == 6);
}

TEST_CASE("Trimming never reuses sequence ids", "[audit]") {
    TempDir tmp;
    AuditLog log(tmp / "log.json");
    for (int i = 0; i < 10; i++) {
        log.append(EntryType::Transaction, "success", tx_payload("mint(address)", "0x" + std::to_string(i), 100));
    }

    REQUIRE(log.trim(3) == 7);
    REQUIRE(log.trim(3) == 0);

    auto entries = log.entries();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries.front().seq == 8);
    REQUIRE(entries.back().seq == 10);
    REQUIRE_FALSE(log.metadata()["last_trimmed"].is_null());

    REQUIRE(log.append(EntryType::Transaction, "success", tx_payload("mint(address)", "0xff", 1)) == 11);

    SECTION("Trim to zero keeps the counter") {
        REQUIRE(log.trim(0) == 4);
        REQUIRE(log.size() == 0);
        REQUIRE(log.append(EntryType::Upload, "success", {}) == 12);
    }
}

TEST_CASE("Capped log drops the oldest entries on append", "[audit]") {
    TempDir tmp;
    AuditLog log(tmp / "capped.json", "", 3);
    for (int i = 0; i < 5; i++) {
        log.append(EntryType::Upload, "success", upload_payload("f", 1, "bafy"));
    }

    auto entries = log.entries();
    REQUIRE(entries.size() == 3);
    REQUIRE(entries.front().seq == 3);
    REQUIRE(entries.back().seq == 5);
}

TEST_CASE("Filtered queries", "[audit]") {
    TempDir tmp;
    AuditLog log(tmp / "mixed.json");
    log.append(EntryType::Upload, "success", upload_payload("Artwork.PNG", 2048, "bafyart"));
    log.append(EntryType::Upload, "failed", {{"filename", "artwork-v2.png"}, {"error", "HTTP 401"}});
    log.append(EntryType::Upload, "success", upload_payload("notes.txt", 12, "bafynotes"));
    log.append(EntryType::Transaction, "success", tx_payload("setTokenURI(uint256,string)", "0xABCdef", 42000));
    log.append(EntryType::Transaction, "failed", tx_payload("mint(address)", "0x123", 0));

    SECTION("Filename match is case-insensitive") {
        AuditFilter filter;
        filter.filename_contains = "ARTWORK";
        auto found = log.query(filter);
        REQUIRE(found.size() == 2);
        REQUIRE(found[0].seq == 1);
        REQUIRE(found[1].seq == 2);
    }

    SECTION("Type and status") {
        AuditFilter filter;
        filter.type = EntryType::Upload;
        filter.status = "success";
        REQUIRE(log.query(filter).size() == 2);
    }

    SECTION("Content id and function") {
        AuditFilter by_cid;
        by_cid.cid = "bafynotes";
        REQUIRE(log.query(by_cid).at(0).seq == 3);

        AuditFilter by_function;
        by_function.function = "mint(address)";
        REQUIRE(log.query(by_function).at(0).seq == 5);
    }

    SECTION("Transaction hash lookup ignores case") {
        auto found = log.find_by_tx_hash("0xabcDEF");
        REQUIRE(found.has_value());
        REQUIRE(found->seq == 4);
        REQUIRE_FALSE(log.find_by_tx_hash("0x999").has_value());
    }

    SECTION("Limit keeps the most recent matches") {
        auto last_two = log.recent(2);
        REQUIRE(last_two.size() == 2);
        REQUIRE(last_two[0].seq == 4);
        REQUIRE(last_two[1].seq == 5);
    }

    SECTION("Time window") {
        AuditFilter future;
        future.since = "2999-01-01T00:00:00Z";
        REQUIRE(log.query(future).empty());

        AuditFilter past;
        past.until = "2000-01-01T00:00:00Z";
        REQUIRE(log.query(past).empty());
    }
}

TEST_CASE("Aggregate statistics", "[audit]") {
    TempDir tmp;
    AuditLog log(tmp / "stats.json");

    SECTION("Empty log") {
        auto stats = log.aggregate();
        REQUIRE(stats.total_entries == 0);
        REQUIRE(stats.success_rate == 0.0);
        REQUIRE(stats.to_json()["first_timestamp"].is_null());
    }

    SECTION("Mixed entries") {
        log.append(EntryType::Upload, "success", upload_payload("a.png", 1000, "bafya"));
        log.append(EntryType::Upload, "success", upload_payload("b.png", 3000, "bafyb"));
        log.append(EntryType::Upload, "failed", upload_payload("c.png", 5000, ""));
        log.append(EntryType::Transaction, "success", tx_payload("mint(address)", "0x1", 50000));
        log.append(EntryType::Transaction, "failed", tx_payload("mint(address)", "0x2", 21000));

        auto stats = log.aggregate();
        REQUIRE(stats.total_entries == 5);
        REQUIRE(stats.by_type["upload"] == 3);
        REQUIRE(stats.by_type["transaction"] == 2);
        REQUIRE(stats.by_status["success"] == 3);
        REQUIRE(stats.by_status["failed"] == 2);
        REQUIRE(stats.by_function["mint(address)"] == 2);
        REQUIRE(stats.total_bytes == 4000);
        REQUIRE(stats.average_upload_bytes == Catch::Approx(2000.0));
        REQUIRE(stats.total_gas == 71000);
        REQUIRE(stats.success_rate == Catch::Approx(0.6));
        REQUIRE(stats.first_timestamp <= stats.last_timestamp);
    }
}

TEST_CASE("Retention by time and content id", "[audit]") {
    TempDir tmp;
    AuditLog log(tmp / "retention.json");
    log.append(EntryType::Upload, "success", upload_payload("a", 1, "bafya"));
    log.append(EntryType::Upload, "success", upload_payload("b", 1, "bafyb"));
    log.append(EntryType::Upload, "success", upload_payload("a-again", 1, "bafya"));

    SECTION("Entries before a timestamp") {
        REQUIRE(log.trim_before("2000-01-01T00:00:00Z") == 0);
        REQUIRE(log.trim_before("2999-01-01T00:00:00Z") == 3);
        REQUIRE(log.size() == 0);
    }

    SECTION("Entries for given content ids") {
        REQUIRE(log.remove_cids({"bafya"}) == 2);
        auto left = log.entries();
        REQUIRE(left.size() == 1);
        REQUIRE(left[0].payload["cid"] == "bafyb");
        REQUIRE(log.remove_cids({"bafymissing"}) == 0);
    }
}

TEST_CASE("CSV export", "[audit]") {
    TempDir tmp;
    AuditLog log(tmp / "export.json");
    log.append(EntryType::Upload, "success", upload_payload("plain.txt", 5, "bafyplain"));
    log.append(EntryType::Upload, "success", upload_payload("a, \"quoted\" name.txt", 7, "bafyq"));

    auto csv_path = tmp / "export.csv";
    REQUIRE(log.export_csv(csv_path) == 2);

    std::istringstream lines(read_file(csv_path));
    std::string header, first, second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);

    REQUIRE(header == "seq,timestamp,type,status,filename,size_bytes,cid,tx_hash");
    REQUIRE(first.rfind("1,", 0) == 0);
    REQUIRE(first.find(",upload,success,plain.txt,5,bafyplain,") != std::string::npos);
    REQUIRE(second.find("\"a, \"\"quoted\"\" name.txt\"") != std::string::npos);
}

TEST_CASE("Payloads that are not UTF-8 are stored with replacement characters", "[audit]") {
    TempDir tmp;
    auto path = tmp / "bytes.json";

    {
        AuditLog log(path);
        REQUIRE(log.append(EntryType::Upload, "success", upload_payload("caf\xe9.txt", 5, "bafycafe")) == 1);
    }

    AuditLog reopened(path);
    auto entries = reopened.entries();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].payload["cid"] == "bafycafe");
    REQUIRE(entries[0].payload["filename"] == "caf\xef\xbf\xbd.txt");
}

TEST_CASE("Corrupt store is refused", "[audit]") {
    TempDir tmp;
    auto path = tmp / "corrupt.json";

    SECTION("Not JSON") {
        std::ofstream(path) << "{\"entries\": [";
        REQUIRE_THROWS_AS(AuditLog(path), AuditStoreError);
    }

    SECTION("No entries array") {
        std::ofstream(path) << R"({"metadata": {}})";
        REQUIRE_THROWS_AS(AuditLog(path), AuditStoreError);
    }

    SECTION("Corruption after open surfaces on the next read") {
        AuditLog log(path);
        log.append(EntryType::Upload, "success", {});
        std::ofstream(path, std::ios::trunc) << "garbage";
        REQUIRE_THROWS_AS(log.entries(), AuditStoreError);
        REQUIRE_THROWS_AS(log.append(EntryType::Upload, "success", {}), AuditStoreError);
    }

    SECTION("Entry with an unknown type") {
        std::ofstream(path) << R"({"metadata": {"last_seq": 1}, "entries": [{"seq": 1, "type": "bogus"}]})";
        AuditLog log(path);
        REQUIRE_THROWS_AS(log.entries(), AuditStoreError);
    }
}
