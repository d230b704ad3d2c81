#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <credo/identity/identity_connector.hpp>
#include <credo/storage/sqlite_document_store.hpp>
#include <credo/vault/memory_vault.hpp>
#include <filesystem>

using namespace credo;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    std::shared_ptr<SqliteDocumentStore> store = std::make_shared<SqliteDocumentStore>();

    explicit TestDB(const std::string &name) : path(name + ".db") { cleanup(); }

    ~TestDB() {
        store->close();
        cleanup();
    }

    void open() {
        auto opened = store->open(path);
        REQUIRE(opened.is_ok());
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove(path);
        }
        if (std::filesystem::exists(path + "-wal")) {
            std::filesystem::remove(path + "-wal");
        }
        if (std::filesystem::exists(path + "-shm")) {
            std::filesystem::remove(path + "-shm");
        }
    }
};

namespace {

    IdentityDocumentRecord makeRecord(const std::string &id, const std::string &document) {
        IdentityDocumentRecord record;
        record.id = dp::String(id.c_str());
        record.document = dp::String(document.c_str());
        record.signature = dp::String("c2lnbmF0dXJl");
        record.controller = dp::String("did:controller:1");
        return record;
    }

} // namespace

// ===========================================
// Core database operations
// ===========================================

TEST_CASE("Database lifecycle") {
    TestDB db("test_document_lifecycle");
    CHECK_FALSE(db.store->isOpen());

    SUBCASE("Open creates the schema") {
        db.open();
        CHECK(db.store->isOpen());
        CHECK(db.store->quickCheck());
        CHECK(db.store->count().value() == 0);
    }

    SUBCASE("Operations on a closed store fail") {
        auto got = db.store->get("did:x:1");
        REQUIRE(got.is_err());
        CHECK(got.error().code == ERR_STORAGE);
        CHECK(db.store->set(makeRecord("did:x:1", "{}"), 0).is_err());
        CHECK(db.store->count().is_err());
    }

    SUBCASE("Close and reopen") {
        db.open();
        db.store->close();
        CHECK_FALSE(db.store->isOpen());
        db.open();
        CHECK(db.store->isOpen());
    }
}

TEST_CASE("In-memory database") {
    SqliteDocumentStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.set(makeRecord("did:x:1", "{}"), 0).is_ok());
    CHECK(store.count().value() == 1);
}

// ===========================================
// Record operations
// ===========================================

TEST_CASE("Record storage") {
    TestDB db("test_document_records");
    db.open();

    SUBCASE("Missing record") {
        auto got = db.store->get("did:x:missing");
        REQUIRE(got.is_ok());
        CHECK_FALSE(got.value().has_value());
    }

    SUBCASE("Insert and read back") {
        auto written = db.store->set(makeRecord("did:x:1", R"({"id":"did:x:1"})"), 0);
        REQUIRE(written.is_ok());
        CHECK(written.value() == 1);

        auto got = db.store->get("did:x:1");
        REQUIRE(got.is_ok());
        REQUIRE(got.value().has_value());
        CHECK(got.value()->getDocument() == R"({"id":"did:x:1"})");
        CHECK(got.value()->getSignature() == "c2lnbmF0dXJl");
        CHECK(got.value()->getController() == "did:controller:1");
        CHECK(got.value()->version == 1);
    }

    SUBCASE("Versions advance one write at a time") {
        REQUIRE(db.store->set(makeRecord("did:x:1", "v1"), 0).is_ok());
        auto second = db.store->set(makeRecord("did:x:1", "v2"), 1);
        REQUIRE(second.is_ok());
        CHECK(second.value() == 2);
        CHECK(db.store->get("did:x:1").value()->getDocument() == "v2");
    }

    SUBCASE("Stale writes are rejected") {
        REQUIRE(db.store->set(makeRecord("did:x:1", "v1"), 0).is_ok());
        REQUIRE(db.store->set(makeRecord("did:x:1", "v2"), 1).is_ok());

        auto stale = db.store->set(makeRecord("did:x:1", "stale"), 1);
        REQUIRE(stale.is_err());
        CHECK(stale.error().code == ERR_VERSION_CONFLICT);

        auto recreate = db.store->set(makeRecord("did:x:1", "again"), 0);
        REQUIRE(recreate.is_err());
        CHECK(recreate.error().code == ERR_VERSION_CONFLICT);

        CHECK(db.store->get("did:x:1").value()->getDocument() == "v2");
    }

    SUBCASE("Ids are ordered") {
        REQUIRE(db.store->set(makeRecord("did:x:b", "{}"), 0).is_ok());
        REQUIRE(db.store->set(makeRecord("did:x:a", "{}"), 0).is_ok());
        REQUIRE(db.store->set(makeRecord("did:x:c", "{}"), 0).is_ok());

        auto ids = db.store->ids();
        REQUIRE(ids.is_ok());
        CHECK(ids.value() == std::vector<std::string>{"did:x:a", "did:x:b", "did:x:c"});
        CHECK(db.store->count().value() == 3);
    }
}

TEST_CASE("Records survive reopening") {
    TestDB db("test_document_persistence");
    db.open();
    REQUIRE(db.store->set(makeRecord("did:x:1", "persisted"), 0).is_ok());
    db.store->close();

    db.open();
    auto got = db.store->get("did:x:1");
    REQUIRE(got.is_ok());
    REQUIRE(got.value().has_value());
    CHECK(got.value()->getDocument() == "persisted");
    CHECK(got.value()->version == 1);
}

// ===========================================
// Connector over SQLite
// ===========================================

TEST_CASE("Identity connector over SQLite") {
    TestDB db("test_document_connector");
    db.open();
    auto vault = std::make_shared<MemoryVault>();

    std::string doc_id;
    std::string credential_jwt;
    {
        IdentityConnector connector(db.store, vault);
        auto doc = connector.createDocument("did:controller:1");
        REQUIRE(doc.is_ok());
        doc_id = doc.value().getId();

        auto method = connector.addVerificationMethod(doc_id, "assertionMethod", std::string("key-1"));
        REQUIRE(method.is_ok());

        Json::Value subject(Json::objectValue);
        subject["name"] = "Alice";
        auto issued = connector.createVerifiableCredential(method.value().getId(), std::nullopt, subject, 9);
        REQUIRE(issued.is_ok());
        credential_jwt = issued.value().jwt;
        REQUIRE(connector.revokeVerifiableCredentials(doc_id, {9}).is_ok());
    }

    db.store->close();
    db.open();

    IdentityConnector reopened(db.store, vault);
    auto resolved = reopened.resolveDocument(doc_id);
    REQUIRE(resolved.is_ok());
    CHECK(resolved.value().hasMethod(doc_id + "#key-1"));
    CHECK(db.store->get(doc_id).value()->version == 3);

    auto check = reopened.checkVerifiableCredential(credential_jwt);
    REQUIRE(check.is_ok());
    CHECK(check.value().revoked);

    // Integrity key lives in the vault, a fresh vault cannot vouch for the record
    IdentityConnector without_keys(db.store, std::make_shared<MemoryVault>());
    auto unverifiable = without_keys.resolveDocument(doc_id);
    REQUIRE(unverifiable.is_err());
    CHECK(unverifiable.error().code == ERR_INTEGRITY);
}
