#include <catch2/catch_test_macros.hpp>
#include "../src/content_uploader.hpp"
#include "../src/errors.hpp"
#include "mock_transport.hpp"
#include "temp_dir.hpp"
#include <algorithm>

namespace {

const std::string WEB3_URL = "https://api.web3.storage/upload";
const std::string NFT_URL = "https://api.nft.storage/upload";
const std::string PINATA_URL = "https://api.pinata.cloud/pinning/pinFileToIPFS";

std::vector<std::unique_ptr<StorageBackend>> make_backends(std::shared_ptr<MockTransport> mock,
                                                           const std::string& web3_token,
                                                           const std::string& nft_token,
                                                           const std::string& pinata_jwt) {
    std::vector<std::unique_ptr<StorageBackend>> out;
    out.push_back(std::make_unique<HttpStorageBackend>(BackendSpec::web3_storage(web3_token), mock, 1000));
    out.push_back(std::make_unique<HttpStorageBackend>(BackendSpec::nft_storage(nft_token), mock, 1000));
    out.push_back(std::make_unique<HttpStorageBackend>(BackendSpec::pinata(pinata_jwt), mock, 1000));
    return out;
}

// A strategy that fails by throwing instead of returning a result.
class ThrowingBackend : public StorageBackend {
public:
    const std::string& name() const override { return name_; }
    bool enabled() const override { return true; }

    BackendResult upload(const std::string&, const std::string&, const nlohmann::json&) override {
        calls++;
        throw std::runtime_error("backend blew up");
    }

    int calls = 0;

private:
    std::string name_ = "throwing";
};

std::string pattern_bytes(size_t n) {
    std::string out(n, '\0');
    for (size_t i = 0; i < n; i++) {
        out[i] = static_cast<char>((i * 31 + 7) % 256);
    }
    return out;
}

} // namespace

TEST_CASE("Local fallback round trip", "[uploader]") {
    TempDir tmp;
    auto mock = std::make_shared<MockTransport>();
    auto audit = std::make_shared<AuditLog>(tmp / "uploads.json");
    ContentUploader uploader(make_backends(mock, "", "", ""), tmp / "cache", mock,
                             UploaderOptions{}, audit);

    SECTION("2 KB with every backend disabled") {
        auto bytes = pattern_bytes(2048);
        auto record = uploader.upload(bytes, "image.png");

        REQUIRE(record.fallback());
        REQUIRE(record.backend == "local-fallback");
        REQUIRE(record.size == 2048);
        REQUIRE(record.attempts.empty());
        REQUIRE(std::filesystem::exists(*record.cache_path));

        auto entries = audit->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].status == "success");
        REQUIRE(entries[0].payload["cid"] == record.cid);
        REQUIRE(entries[0].payload["fallback"] == true);
        REQUIRE(entries[0].payload["file_type"] == "image/png");

        auto downloaded = uploader.download(record.cid);
        REQUIRE(downloaded == bytes);
        REQUIRE(mock->requests.empty());
    }

    SECTION("Binary content survives unchanged") {
        std::string bytes("\x00\x01\xff\x00zz", 6);
        auto record = uploader.upload(bytes, "blob.bin");
        REQUIRE(uploader.download(record.cid) == bytes);
    }

    SECTION("JSON documents") {
        nlohmann::json doc = {{"name", "Token #1"}, {"image", "ipfs://bafyimage"}};
        auto record = uploader.upload_json(doc, "metadata");

        REQUIRE(audit->entries().back().payload["filename"] == "metadata.json");
        REQUIRE(uploader.download_json(record.cid) == doc);
    }
}

TEST_CASE("Fallback id is a pure function of the bytes", "[uploader]") {
    TempDir tmp;
    auto mock = std::make_shared<MockTransport>();
    ContentUploader uploader(make_backends(mock, "", "", ""), tmp / "cache", mock);

    auto first = uploader.upload("same bytes", "a.txt");
    auto second = uploader.upload("same bytes", "b.txt");
    auto other = uploader.upload("other bytes", "a.txt");

    REQUIRE(first.cid == second.cid);
    REQUIRE(first.cid != other.cid);
    REQUIRE(first.cid.size() == 60);
    REQUIRE(first.cid.rfind("bafybeif", 0) == 0);

    REQUIRE(LocalContentCache::derive_id("abc") ==
            "bafybeifba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410");
}

TEST_CASE("Invalid input never reaches a backend", "[uploader]") {
    TempDir tmp;
    auto mock = std::make_shared<MockTransport>();
    auto audit = std::make_shared<AuditLog>(tmp / "uploads.json");

    SECTION("Empty content") {
        ContentUploader uploader(make_backends(mock, "w3", "nft", "jwt"), tmp / "cache", mock,
                                 UploaderOptions{}, audit);

        REQUIRE_THROWS_AS(uploader.upload("", "empty.png"), ValidationError);
        REQUIRE(mock->requests.empty());

        auto entries = audit->entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].status == "failed");
    }

    SECTION("Oversized content") {
        UploaderOptions options;
        options.max_upload_mb = 0;
        ContentUploader uploader(make_backends(mock, "w3", "nft", "jwt"), tmp / "cache", mock,
                                 options, audit);

        REQUIRE_THROWS_AS(uploader.upload("x", "big.bin"), ValidationError);
        REQUIRE(mock->requests.empty());
    }

    SECTION("Size check") {
        REQUIRE(ContentUploader::validate_size(std::string(1024, 'a'), 1));
        REQUIRE_FALSE(ContentUploader::validate_size(std::string(1024 * 1024 + 1, 'a'), 1));
    }
}

TEST_CASE("Backend chain", "[uploader]") {
    TempDir tmp;
    auto mock = std::make_shared<MockTransport>();
    auto audit = std::make_shared<AuditLog>(tmp / "uploads.json");

    SECTION("Backends without credentials are skipped") {
        mock->always(NFT_URL, MockTransport::ok(R"({"ok":true,"value":{"cid":"bafynft"}})"));
        ContentUploader uploader(make_backends(mock, "", "nft-token", ""), tmp / "cache", mock,
                                 UploaderOptions{}, audit);

        auto record = uploader.upload("hello", "hello.txt");

        REQUIRE(record.cid == "bafynft");
        REQUIRE(record.backend == "nft.storage");
        REQUIRE_FALSE(record.fallback());
        REQUIRE(record.attempts.size() == 1);
        REQUIRE(mock->calls_to(WEB3_URL) == 0);
        REQUIRE(mock->calls_to(PINATA_URL) == 0);

        const auto& req = mock->requests.at(0);
        REQUIRE(req.filename == "hello.txt");
        REQUIRE(req.body == "hello");
        REQUIRE(std::find(req.headers.begin(), req.headers.end(),
                          "Authorization: Bearer nft-token") != req.headers.end());

        REQUIRE(uploader.enabled_backends() == std::vector<std::string>{"nft.storage"});
        REQUIRE(audit->size() == 1);
    }

    SECTION("A failing backend hands over to the next") {
        mock->always(WEB3_URL, MockTransport::ok("unavailable", 503));
        mock->always(NFT_URL, MockTransport::ok(R"({"ok":false})", 401));
        mock->always(PINATA_URL, MockTransport::ok(R"({"IpfsHash":"bafypinata","PinSize":5})"));
        ContentUploader uploader(make_backends(mock, "w3", "nft", "jwt"), tmp / "cache", mock,
                                 UploaderOptions{}, audit);

        auto record = uploader.upload("hello", "hello.txt");

        REQUIRE(record.cid == "bafypinata");
        REQUIRE(record.backend == "pinata");
        REQUIRE(record.attempts.size() == 3);
        REQUIRE_FALSE(record.attempts[0].success);
        REQUIRE_FALSE(record.attempts[1].success);
        REQUIRE(record.attempts[2].success);

        const auto& pinata_req = mock->requests.back();
        REQUIRE(pinata_req.url == PINATA_URL);
        bool has_options = false;
        for (const auto& [name, value] : pinata_req.fields) {
            if (name == "pinataOptions") {
                has_options = nlohmann::json::parse(value)["cidVersion"] == 1;
            }
        }
        REQUIRE(has_options);

        AuditFilter failed;
        failed.status = "failed";
        REQUIRE(audit->query(failed).size() == 2);
        REQUIRE(audit->entries().back().status == "success");
        REQUIRE(audit->entries().back().payload["backend"] == "pinata");
    }

    SECTION("Every backend failing still yields a content id") {
        mock->always(WEB3_URL, MockTransport::timeout());
        mock->always(NFT_URL, MockTransport::connection_failed());
        mock->always(PINATA_URL, MockTransport::ok(R"({"unexpected":true})"));
        ContentUploader uploader(make_backends(mock, "w3", "nft", "jwt"), tmp / "cache", mock,
                                 UploaderOptions{}, audit);

        auto record = uploader.upload("payload", "payload.txt");

        REQUIRE(record.fallback());
        REQUIRE(record.cid == LocalContentCache::derive_id("payload"));
        REQUIRE(record.attempts.size() == 3);

        auto entries = audit->entries();
        REQUIRE(entries.size() == 4);
        REQUIRE(entries[0].status == "failed");
        REQUIRE(entries[1].status == "failed");
        REQUIRE(entries[2].status == "failed");
        REQUIRE(entries[3].status == "success");
        REQUIRE(entries[3].payload["backend"] == "local-fallback");
    }
}

TEST_CASE("Uploads of valid input always produce a content id", "[uploader]") {
    TempDir tmp;
    auto mock = std::make_shared<MockTransport>();
    auto audit = std::make_shared<AuditLog>(tmp / "uploads.json");

    SECTION("A throwing backend is recorded and skipped") {
        mock->always(WEB3_URL, MockTransport::ok("unavailable", 503));

        auto throwing = std::make_unique<ThrowingBackend>();
        auto* throwing_ptr = throwing.get();
        std::vector<std::unique_ptr<StorageBackend>> backends;
        backends.push_back(std::move(throwing));
        backends.push_back(std::make_unique<HttpStorageBackend>(BackendSpec::web3_storage("w3"), mock, 1000));

        ContentUploader uploader(std::move(backends), tmp / "cache", mock, UploaderOptions{}, audit);
        auto record = uploader.upload("payload", "payload.txt");

        REQUIRE(throwing_ptr->calls == 1);
        REQUIRE(record.fallback());
        REQUIRE(record.cid == LocalContentCache::derive_id("payload"));
        REQUIRE(record.attempts.size() == 2);
        REQUIRE(record.attempts[0].backend == "throwing");
        REQUIRE(record.attempts[0].error == "backend blew up");
        REQUIRE(mock->calls_to(WEB3_URL) == 1);

        auto entries = audit->entries();
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].status == "failed");
        REQUIRE(entries[0].payload["backend"] == "throwing");
        REQUIRE(entries[1].status == "failed");
        REQUIRE(entries[1].payload["backend"] == "web3.storage");
        REQUIRE(entries[2].status == "success");
        REQUIRE(entries[2].payload["backend"] == "local-fallback");
    }

    SECTION("Error bodies cut inside a multibyte character") {
        mock->always(WEB3_URL, MockTransport::ok(std::string(199, 'x') + "\xc3\xa9", 400));
        ContentUploader uploader(make_backends(mock, "w3", "", ""), tmp / "cache", mock,
                                 UploaderOptions{}, audit);

        auto record = uploader.upload("payload", "payload.txt");

        REQUIRE(record.fallback());
        REQUIRE(record.attempts.at(0).error == "HTTP 400: " + std::string(199, 'x'));

        AuditLog reopened(tmp / "uploads.json");
        auto entries = reopened.entries();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].status == "failed");
        REQUIRE(entries[1].status == "success");
    }

    SECTION("Filenames that are not UTF-8") {
        ContentUploader uploader(make_backends(mock, "", "", ""), tmp / "cache", mock,
                                 UploaderOptions{}, audit);

        auto record = uploader.upload("hello", "caf\xe9.txt");

        REQUIRE(record.fallback());
        AuditLog reopened(tmp / "uploads.json");
        auto entries = reopened.entries();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].status == "success");
        REQUIRE(entries[0].payload["cid"] == record.cid);
    }
}

TEST_CASE("Gateway retrieval", "[uploader]") {
    TempDir tmp;
    auto mock = std::make_shared<MockTransport>();

    UploaderOptions options;
    options.gateways = {"https://g1.example/ipfs/", "https://g2.example/ipfs/"};
    ContentUploader uploader(make_backends(mock, "", "", ""), tmp / "cache", mock, options);

    SECTION("First gateway miss, second hit") {
        mock->always("https://g2.example/ipfs/bafyremote", MockTransport::ok("remote bytes"));

        REQUIRE(uploader.download("bafyremote") == "remote bytes");
        REQUIRE(mock->calls_to("https://g1.example/ipfs/bafyremote") == 1);
        REQUIRE(mock->calls_to("https://g2.example/ipfs/bafyremote") == 1);
    }

    SECTION("Gateway timeouts move on") {
        mock->always("https://g1.example/ipfs/bafyremote", MockTransport::timeout());
        mock->always("https://g2.example/ipfs/bafyremote", MockTransport::ok("remote bytes"));

        REQUIRE(uploader.download("bafyremote") == "remote bytes");
    }

    SECTION("Paths below a content id go to the gateways") {
        mock->always("https://g1.example/ipfs/bafydir/meta.json", MockTransport::ok(R"({"n":1})"));

        REQUIRE(uploader.download_json("bafydir/meta.json")["n"] == 1);
        REQUIRE_FALSE(LocalContentCache::is_cacheable("bafydir/meta.json"));
    }

    SECTION("Unresolvable id") {
        REQUIRE_THROWS_AS(uploader.download("bafymissing"), NotFoundError);
        REQUIRE(mock->requests.size() == 2);
    }

    SECTION("Links") {
        REQUIRE(ContentUploader::ipfs_uri("bafyx") == "ipfs://bafyx");
        REQUIRE(uploader.gateway_url("bafyx") == "https://g1.example/ipfs/bafyx");

        auto status = uploader.status();
        REQUIRE(status["provider"] == "local-fallback");
        REQUIRE(status["enabled_backends"].empty());
        REQUIRE(status["backends"].size() == 3);
    }
}

TEST_CASE("Content id extraction", "[uploader]") {
    auto body = nlohmann::json::parse(R"({"ok":true,"value":{"cid":"bafynested"}})");
    REQUIRE(HttpStorageBackend::extract_cid(body, "value.cid") == "bafynested");
    REQUIRE(HttpStorageBackend::extract_cid(body, "cid").empty());
    REQUIRE(HttpStorageBackend::extract_cid(nlohmann::json::parse(R"({"cid":"bafytop"})"), "cid") == "bafytop");
}
