#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "credo/identity/identity_connector.hpp"
#include "credo/identity/identity_resolver.hpp"
#include "credo/storage/memory_document_store.hpp"
#include "credo/vault/memory_vault.hpp"
#include <doctest/doctest.h>
#include <limits>

using namespace credo;

namespace {

    const std::string UNKNOWN_DOC = "did:entity-storage:0xdeadbeef";

    // Test helper: connector over in-memory collaborators
    struct TestConnector {
        std::shared_ptr<MemoryDocumentStore> store = std::make_shared<MemoryDocumentStore>();
        std::shared_ptr<MemoryVault> vault = std::make_shared<MemoryVault>();
        IdentityConnector connector{store, vault};

        std::string createDocument(const std::string &controller = "did:controller:1") {
            auto doc = connector.createDocument(controller);
            REQUIRE(doc.is_ok());
            return doc.value().getId();
        }

        std::string addMethod(const std::string &document_id, const std::string &fragment = "key-1",
                              const std::string &purpose = "assertionMethod") {
            auto method = connector.addVerificationMethod(document_id, purpose, fragment);
            REQUIRE(method.is_ok());
            return method.value().getId();
        }
    };

    // Store that lets another writer slip in between the read and the write of an operation
    class RacingDocumentStore : public DocumentStore {
      public:
        dp::Result<std::optional<IdentityDocumentRecord>, dp::Error> get(const std::string &id) const override {
            return inner.get(id);
        }

        dp::Result<dp::u64, dp::Error> set(const IdentityDocumentRecord &record, dp::u64 expected_version) override {
            if (race_next_write) {
                race_next_write = false;
                auto concurrent = inner.set(record, expected_version);
                REQUIRE(concurrent.is_ok());
            }
            return inner.set(record, expected_version);
        }

        MemoryDocumentStore inner;
        bool race_next_write{false};
    };

    Json::Value aliceSubject(const std::string &subject_id = "") {
        Json::Value subject(Json::objectValue);
        if (!subject_id.empty()) {
            subject["id"] = subject_id;
        }
        subject["name"] = "Alice";
        return subject;
    }

    // Re-sign an edited payload with the vault key of the signing method
    std::string resign(TestConnector &t, const std::string &method_id, const Json::Value &payload) {
        auto vault_key = t.vault->getKey(method_id).value();
        auto key = Ed25519KeyPair::fromPrivateKey(vault_key.private_key, vault_key.public_key).value();
        auto token = jwt::encode(jwt::makeHeader(method_id), payload, key);
        REQUIRE(token.is_ok());
        return token.value();
    }

    std::string alterSignature(const std::string &token) {
        std::string altered = token;
        size_t pos = token.rfind('.') + 10;
        altered[pos] = altered[pos] == 'A' ? 'B' : 'A';
        return altered;
    }

} // namespace

TEST_SUITE("Identity Connector Document Tests") {

    TEST_CASE("Create document") {
        TestConnector t;
        auto doc = t.connector.createDocument("did:controller:1");
        REQUIRE(doc.is_ok());

        const std::string &id = doc.value().getId();
        CHECK(id.rfind("did:entity-storage:0x", 0) == 0);
        CHECK(id.size() == std::string("did:entity-storage:0x").size() + 64);

        auto revocation = doc.value().findService(id + "#revocation");
        REQUIRE(revocation.is_ok());
        CHECK(revocation.value().getTypeString() == "BitstringStatusList");
        CHECK(revocation.value().getServiceEndpoint().rfind("data:application/octet-stream;base64,", 0) == 0);

        auto bitmap = RevocationBitmap::fromDataUri(revocation.value().getServiceEndpoint());
        REQUIRE(bitmap.is_ok());
        CHECK(bitmap.value().countSet() == 0);

        CHECK(t.vault->keyCount() == 1);
        CHECK(t.vault->hasKey(IdentityConnector::integrityKeyId(id)));

        auto record = t.store->get(id);
        REQUIRE(record.is_ok());
        REQUIRE(record.value().has_value());
        CHECK(record.value()->version == 1);
        CHECK(record.value()->getController() == "did:controller:1");
    }

    TEST_CASE("Create document requires a controller") {
        TestConnector t;
        auto doc = t.connector.createDocument("");
        REQUIRE(doc.is_err());
        CHECK(doc.error().code == ERR_VALIDATION);
        CHECK(t.vault->keyCount() == 0);
        CHECK(t.store->size() == 0);
    }

    TEST_CASE("Documents get distinct ids") {
        TestConnector t;
        CHECK(t.createDocument() != t.createDocument());
        CHECK(t.store->size() == 2);
    }

    TEST_CASE("Resolve document") {
        TestConnector t;
        auto created = t.connector.createDocument("did:controller:1");
        REQUIRE(created.is_ok());

        auto resolved = t.connector.resolveDocument(created.value().getId());
        REQUIRE(resolved.is_ok());
        CHECK(resolved.value() == created.value());

        IdentityResolver resolver(t.store, t.vault);
        auto via_resolver = resolver.resolveDocument(created.value().getId());
        REQUIRE(via_resolver.is_ok());
        CHECK(via_resolver.value() == created.value());
    }

    TEST_CASE("Connectors with separate stores do not share documents") {
        TestConnector a;
        TestConnector b;
        std::string id = a.createDocument();
        auto resolved = b.connector.resolveDocument(id);
        REQUIRE(resolved.is_err());
        CHECK(resolved.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Operations on an unknown document fail NotFound") {
        TestConnector t;
        std::string method_id = UNKNOWN_DOC + "#key-1";

        auto resolved = t.connector.resolveDocument(UNKNOWN_DOC);
        REQUIRE(resolved.is_err());
        CHECK(resolved.error().code == ERR_NOT_FOUND);
        CHECK(errorMessage(resolved.error()).find(UNKNOWN_DOC) != std::string::npos);

        CHECK(t.connector.addVerificationMethod(UNKNOWN_DOC, "assertionMethod", std::string("key-1")).error().code ==
              ERR_NOT_FOUND);
        CHECK(t.connector.removeVerificationMethod(UNKNOWN_DOC, "key-1").error().code == ERR_NOT_FOUND);
        CHECK(t.connector.addService(UNKNOWN_DOC, "svc", {"LinkedDomains"}, {"https://example.com"}).error().code ==
              ERR_NOT_FOUND);
        CHECK(t.connector.removeService(UNKNOWN_DOC, "svc").error().code == ERR_NOT_FOUND);
        CHECK(t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject()).error().code ==
              ERR_NOT_FOUND);
        CHECK(t.connector.createProof(UNKNOWN_DOC, method_id, stringToBytes("x")).error().code == ERR_NOT_FOUND);
        CHECK(t.connector.verifyProof(UNKNOWN_DOC, method_id, stringToBytes("x"), "Ed25519", Bytes(64, 0))
                  .error()
                  .code == ERR_NOT_FOUND);
        CHECK(t.connector.revokeVerifiableCredentials(UNKNOWN_DOC, {1}).error().code == ERR_NOT_FOUND);

        CHECK(t.vault->keyCount() == 0);
    }
}

TEST_SUITE("Identity Connector Verification Method Tests") {

    TEST_CASE("Add method with explicit id") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        auto method = t.connector.addVerificationMethod(doc_id, "assertionMethod", std::string("key-1"));
        REQUIRE(method.is_ok());
        CHECK(method.value().getId() == doc_id + "#key-1");
        CHECK(method.value().getController() == doc_id);
        CHECK(method.value().getType() == "JsonWebKey");
        REQUIRE(method.value().hasPublicKeyJwk());
        CHECK(std::string(method.value().public_key_jwk.kid.c_str()) ==
              method.value().public_key_jwk.computeKid().value());

        CHECK(t.vault->hasKey(doc_id + "#key-1"));
        CHECK(t.vault->getKey(doc_id + "#key-1").value().public_key ==
              method.value().public_key_jwk.publicKeyBytes().value());
        CHECK(t.vault->keyCount() == 2);

        auto doc = t.connector.resolveDocument(doc_id).value();
        auto assertion = doc.methodsFor(VerificationPurpose::AssertionMethod);
        REQUIRE(assertion.size() == 1);
        CHECK(assertion[0].method == method.value());
    }

    TEST_CASE("Fragment defaults to the key id") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        auto method = t.connector.addVerificationMethod(doc_id, "authentication");
        REQUIRE(method.is_ok());
        CHECK(method.value().getFragment() == method.value().public_key_jwk.computeKid().value());
        CHECK(t.vault->hasKey(method.value().getId()));
    }

    TEST_CASE("Explicit id forms are qualified with the document id") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        CHECK(t.addMethod(doc_id, "#hash-form") == doc_id + "#hash-form");
        CHECK(t.addMethod(doc_id, doc_id + "#full-form") == doc_id + "#full-form");

        auto foreign = t.connector.addVerificationMethod(doc_id, "assertionMethod",
                                                         std::string("did:entity-storage:0xother#key-1"));
        REQUIRE(foreign.is_err());
        CHECK(foreign.error().code == ERR_VALIDATION);
    }

    TEST_CASE("Invalid purpose fails before any key is created") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        size_t keys_before = t.vault->keyCount();

        auto method = t.connector.addVerificationMethod(doc_id, "signing", std::string("key-1"));
        REQUIRE(method.is_err());
        CHECK(method.error().code == ERR_VALIDATION);
        CHECK(t.vault->keyCount() == keys_before);

        auto unknown_doc = t.connector.addVerificationMethod(UNKNOWN_DOC, "signing");
        REQUIRE(unknown_doc.is_err());
        CHECK(unknown_doc.error().code == ERR_VALIDATION);
    }

    TEST_CASE("Adding the same explicit id twice leaves one entry and the second wins") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        auto first = t.connector.addVerificationMethod(doc_id, "assertionMethod", std::string("key-1"));
        auto second = t.connector.addVerificationMethod(doc_id, "authentication", std::string("key-1"));
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value() != second.value());

        auto doc = t.connector.resolveDocument(doc_id).value();
        CHECK(doc.allMethods().size() == 1);
        CHECK(doc.methodsFor(VerificationPurpose::AssertionMethod).empty());
        REQUIRE(doc.findMethod(doc_id + "#key-1").is_ok());
        CHECK(doc.findMethod(doc_id + "#key-1").value() == second.value());

        CHECK(t.vault->keyCount() == 2);
        CHECK(t.vault->getKey(doc_id + "#key-1").value().public_key ==
              second.value().public_key_jwk.publicKeyBytes().value());
    }

    TEST_CASE("Remove method") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        t.addMethod(doc_id, "key-1");
        t.addMethod(doc_id, "key-2");

        REQUIRE(t.connector.removeVerificationMethod(doc_id, "key-1").is_ok());
        auto doc = t.connector.resolveDocument(doc_id).value();
        CHECK_FALSE(doc.hasMethod(doc_id + "#key-1"));
        CHECK(doc.hasMethod(doc_id + "#key-2"));
        CHECK(t.vault->hasKey(doc_id + "#key-1"));

        auto missing = t.connector.removeVerificationMethod(doc_id, doc_id + "#key-1");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == ERR_NOT_FOUND);
        CHECK(errorMessage(missing.error()).find(doc_id + "#key-1") != std::string::npos);
    }

    TEST_CASE("Every write bumps the stored version") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        t.addMethod(doc_id, "key-1");
        REQUIRE(t.connector.addService(doc_id, "svc", {"LinkedDomains"}, {"https://example.com"}).is_ok());

        auto record = t.store->get(doc_id).value();
        REQUIRE(record.has_value());
        CHECK(record->version == 3);
    }
}

TEST_SUITE("Identity Connector Service Tests") {

    TEST_CASE("Add and replace service") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        auto first = t.connector.addService(doc_id, "linked", {"LinkedDomains"}, {"https://a.example"});
        REQUIRE(first.is_ok());
        CHECK(first.value().getId() == doc_id + "#linked");

        auto second =
            t.connector.addService(doc_id, "#linked", {"LinkedDomains", "Website"}, {"https://b.example"});
        REQUIRE(second.is_ok());

        auto doc = t.connector.resolveDocument(doc_id).value();
        CHECK(doc.getServices().size() == 2);
        auto service = doc.findService(doc_id + "#linked");
        REQUIRE(service.is_ok());
        CHECK(service.value().getTypes() == std::vector<std::string>{"LinkedDomains", "Website"});
        CHECK(service.value().getServiceEndpoint() == "https://b.example");
    }

    TEST_CASE("Service input is validated") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        CHECK(t.connector.addService(doc_id, "", {"T"}, {"https://a.example"}).error().code == ERR_VALIDATION);
        CHECK(t.connector.addService(doc_id, "svc", {}, {"https://a.example"}).error().code == ERR_VALIDATION);
        CHECK(t.connector.addService(doc_id, "svc", {"T"}, {}).error().code == ERR_VALIDATION);
        CHECK(t.connector.addService(doc_id, "svc", {""}, {"https://a.example"}).error().code == ERR_VALIDATION);
    }

    TEST_CASE("Remove service") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        REQUIRE(t.connector.addService(doc_id, "svc", {"T"}, {"https://a.example"}).is_ok());

        REQUIRE(t.connector.removeService(doc_id, "svc").is_ok());
        CHECK_FALSE(t.connector.resolveDocument(doc_id).value().hasService(doc_id + "#svc"));

        auto missing = t.connector.removeService(doc_id, "svc");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == ERR_NOT_FOUND);
    }
}

TEST_SUITE("Identity Connector Credential Tests") {

    TEST_CASE("Scenario A: issue and check a credential") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");

        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 5);
        REQUIRE(issued.is_ok());
        const auto &vc = issued.value().verifiable_credential;
        CHECK(vc.issuer == doc_id);
        REQUIRE(vc.credential_status.has_value());
        CHECK(vc.credential_status->id == doc_id + "#revocation");
        CHECK(vc.credential_status->type == "BitstringStatusList");
        CHECK(vc.credential_status->revocation_bitmap_index == "5");

        auto check = t.connector.checkVerifiableCredential(issued.value().jwt);
        REQUIRE(check.is_ok());
        CHECK_FALSE(check.value().revoked);
        REQUIRE(check.value().verifiable_credential.has_value());
        CHECK(check.value().verifiable_credential->credential_subject["name"].asString() == "Alice");
        CHECK(check.value().verifiable_credential->issuer == doc_id);
    }

    TEST_CASE("Scenario B: revoke and unrevoke") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 5).value();

        REQUIRE(t.connector.revokeVerifiableCredentials(doc_id, {5}).is_ok());
        auto revoked = t.connector.checkVerifiableCredential(issued.jwt);
        REQUIRE(revoked.is_ok());
        CHECK(revoked.value().revoked);
        CHECK_FALSE(revoked.value().verifiable_credential.has_value());

        REQUIRE(t.connector.unrevokeVerifiableCredentials(doc_id, {5}).is_ok());
        auto restored = t.connector.checkVerifiableCredential(issued.jwt);
        REQUIRE(restored.is_ok());
        CHECK_FALSE(restored.value().revoked);
        CHECK(restored.value().verifiable_credential.has_value());
    }

    TEST_CASE("Toggling one index leaves the others alone") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        auto vc4 = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 4).value();
        auto vc5 = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 5).value();
        auto vc6 = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 6).value();

        REQUIRE(t.connector.revokeVerifiableCredentials(doc_id, {5, 6}).is_ok());
        REQUIRE(t.connector.unrevokeVerifiableCredentials(doc_id, {5}).is_ok());

        CHECK_FALSE(t.connector.checkVerifiableCredential(vc4.jwt).value().revoked);
        CHECK_FALSE(t.connector.checkVerifiableCredential(vc5.jwt).value().revoked);
        CHECK(t.connector.checkVerifiableCredential(vc6.jwt).value().revoked);
    }

    TEST_CASE("Revocation input is validated") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        CHECK(t.connector.revokeVerifiableCredentials(doc_id, {}).error().code == ERR_VALIDATION);
        CHECK(t.connector.revokeVerifiableCredentials(doc_id, {-1}).error().code == ERR_VALIDATION);
        CHECK(t.connector.revokeVerifiableCredentials(doc_id, {131072}).error().code == ERR_VALIDATION);
        CHECK(t.connector.unrevokeVerifiableCredentials(doc_id, {}).error().code == ERR_VALIDATION);
        CHECK(t.connector.revokeVerifiableCredentials(doc_id, {131071}).is_ok());

        std::string method_id = t.addMethod(doc_id, "key-1");
        auto out_of_range = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 131072);
        REQUIRE(out_of_range.is_err());
        CHECK(out_of_range.error().code == ERR_VALIDATION);
    }

    TEST_CASE("Credential JWT claims") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");

        Json::Value subject = aliceSubject("did:entity-storage:0xholder");
        subject["@context"] = "https://schema.org";
        subject["type"] = "Person";

        auto issued =
            t.connector.createVerifiableCredential(method_id, std::string("https://example.com/credentials/1"), subject);
        REQUIRE(issued.is_ok());

        const auto &vc = issued.value().verifiable_credential;
        CHECK(vc.contexts == std::vector<std::string>{VC_CONTEXT_V2, "https://schema.org"});
        CHECK(vc.types == std::vector<std::string>{"VerifiableCredential", "Person"});
        CHECK_FALSE(vc.credential_status.has_value());

        auto decoded = jwt::decode(issued.value().jwt);
        REQUIRE(decoded.is_ok());
        const Json::Value &payload = decoded.value().payload;
        CHECK(decoded.value().header["kid"].asString() == method_id);
        CHECK(payload["iss"].asString() == doc_id);
        CHECK(payload["jti"].asString() == "https://example.com/credentials/1");
        CHECK(payload["sub"].asString() == "did:entity-storage:0xholder");
        CHECK(payload["nbf"].isIntegral());
        CHECK_FALSE(payload["vc"]["credentialSubject"].isMember("id"));
        CHECK_FALSE(payload["vc"].isMember("credentialStatus"));

        auto check = t.connector.checkVerifiableCredential(issued.value().jwt);
        REQUIRE(check.is_ok());
        REQUIRE(check.value().verifiable_credential.has_value());
        CHECK(check.value().verifiable_credential->id == "https://example.com/credentials/1");
        CHECK(check.value().verifiable_credential->subjectId() == std::optional<std::string>("did:entity-storage:0xholder"));
    }

    TEST_CASE("Array subject uses the first subject id") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");

        Json::Value subjects(Json::arrayValue);
        subjects.append(aliceSubject("did:example:first"));
        subjects.append(aliceSubject("did:example:second"));

        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, subjects);
        REQUIRE(issued.is_ok());
        auto decoded = jwt::decode(issued.value().jwt).value();
        CHECK(decoded.payload["sub"].asString() == "did:example:first");
        CHECK(decoded.payload["vc"]["credentialSubject"].size() == 2);
    }

    TEST_CASE("Credential input is validated") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");

        CHECK(t.connector.createVerifiableCredential("key-1", std::nullopt, aliceSubject()).error().code ==
              ERR_VALIDATION);
        CHECK(t.connector.createVerifiableCredential(doc_id, std::nullopt, aliceSubject()).error().code ==
              ERR_VALIDATION);
        CHECK(t.connector.createVerifiableCredential(method_id, std::nullopt, Json::Value("Alice")).error().code ==
              ERR_VALIDATION);
        CHECK(t.connector.createVerifiableCredential(method_id, std::nullopt, Json::Value(Json::arrayValue))
                  .error()
                  .code == ERR_VALIDATION);
        CHECK(t.connector.checkVerifiableCredential("").error().code == ERR_VALIDATION);
    }

    TEST_CASE("Unknown method on an existing document") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        auto issued = t.connector.createVerifiableCredential(doc_id + "#missing", std::nullopt, aliceSubject());
        REQUIRE(issued.is_err());
        CHECK(issued.error().code == ERR_NOT_FOUND);
        CHECK(errorMessage(issued.error()).find("methodMissing") != std::string::npos);

        auto proof = t.connector.createProof(doc_id, "missing", stringToBytes("x"));
        REQUIRE(proof.is_err());
        CHECK(proof.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Tampered credential is a failure, not a revocation") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 3).value();

        auto tampered = t.connector.checkVerifiableCredential(alterSignature(issued.jwt));
        REQUIRE(tampered.is_err());
        CHECK(tampered.error().code == ERR_OPERATION_FAILED);
        CHECK(errorMessage(tampered.error()).find("signatureInvalid") != std::string::npos);

        auto decoded = jwt::decode(issued.jwt).value();
        Json::Value forged = decoded.payload;
        forged["vc"]["credentialSubject"]["name"] = "Mallory";
        std::string forged_token = issued.jwt.substr(0, issued.jwt.find('.') + 1) +
                                   base64UrlEncode(stringToBytes(canonicalize(forged))) +
                                   issued.jwt.substr(issued.jwt.rfind('.'));
        auto forged_check = t.connector.checkVerifiableCredential(forged_token);
        REQUIRE(forged_check.is_err());
        CHECK(errorMessage(forged_check.error()).find("signatureInvalid") != std::string::npos);
    }

    TEST_CASE("Out of range nbf and status index are rejected as errors") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id);
        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 3);
        REQUIRE(issued.is_ok());
        Json::Value payload = jwt::decode(issued.value().jwt).value().payload;

        Json::Value far_future = payload;
        far_future["nbf"] = 1e19;
        auto nbf_check = t.connector.checkVerifiableCredential(resign(t, method_id, far_future));
        REQUIRE(nbf_check.is_err());
        CHECK(nbf_check.error().code == ERR_OPERATION_FAILED);
        CHECK(errorMessage(nbf_check.error()).find("Invalid nbf claim") != std::string::npos);

        far_future["nbf"] = Json::Int64(10000000000);
        auto late = t.connector.checkVerifiableCredential(resign(t, method_id, far_future));
        REQUIRE(late.is_ok());
        CHECK(late.value().verifiable_credential->issuance_date == "2286-11-20T17:46:40Z");

        Json::Value huge_index = payload;
        huge_index["vc"]["credentialStatus"]["revocationBitmapIndex"] = Json::UInt64(18446744073709551615ull);
        auto index_check = t.connector.checkVerifiableCredential(resign(t, method_id, huge_index));
        REQUIRE(index_check.is_err());
        CHECK(errorMessage(index_check.error()).find("revocationBitmapIndex") != std::string::npos);
    }

    TEST_CASE("Malformed credential JWT is reported as malformed") {
        TestConnector t;
        auto check = t.connector.checkVerifiableCredential("not-a-jwt");
        REQUIRE(check.is_err());
        CHECK(check.error().code == ERR_OPERATION_FAILED);
        CHECK(errorMessage(check.error()).find("checkVerifiableCredentialFailed") != std::string::npos);
        CHECK(errorMessage(check.error()).find("signatureInvalid") == std::string::npos);
    }

    TEST_CASE("Credential from an unknown issuer is NotFound") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject()).value();

        TestConnector other;
        auto check = other.connector.checkVerifiableCredential(issued.jwt);
        REQUIRE(check.is_err());
        CHECK(check.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Credential signed by a removed method no longer checks") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        auto issued = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject()).value();

        REQUIRE(t.connector.removeVerificationMethod(doc_id, "key-1").is_ok());
        auto check = t.connector.checkVerifiableCredential(issued.jwt);
        REQUIRE(check.is_err());
        CHECK(check.error().code == ERR_NOT_FOUND);
    }

    TEST_CASE("Scenario D: credentials without status survive removal of the revocation list") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        auto with_status = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 7).value();
        REQUIRE(t.connector.revokeVerifiableCredentials(doc_id, {7}).is_ok());

        REQUIRE(t.connector.removeService(doc_id, "#revocation").is_ok());

        auto without_status = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject());
        REQUIRE(without_status.is_ok());
        auto check = t.connector.checkVerifiableCredential(without_status.value().jwt);
        REQUIRE(check.is_ok());
        CHECK_FALSE(check.value().revoked);

        CHECK_FALSE(t.connector.checkVerifiableCredential(with_status.jwt).value().revoked);

        auto indexed = t.connector.createVerifiableCredential(method_id, std::nullopt, aliceSubject(), 1);
        REQUIRE(indexed.is_err());
        CHECK(indexed.error().code == ERR_NOT_FOUND);
        CHECK(t.connector.revokeVerifiableCredentials(doc_id, {1}).error().code == ERR_NOT_FOUND);
    }
}

TEST_SUITE("Identity Connector Presentation Tests") {

    TEST_CASE("Scenario C: present a credential") {
        TestConnector t;
        std::string holder_id = t.createDocument("did:controller:holder");
        std::string holder_method = t.addMethod(holder_id, "key-1", "authentication");
        std::string issuer_id = t.createDocument("did:controller:issuer");
        std::string issuer_method = t.addMethod(issuer_id, "key-1");

        auto credential =
            t.connector.createVerifiableCredential(issuer_method, std::nullopt, aliceSubject(holder_id), 5).value();

        auto presentation = t.connector.createVerifiablePresentation(
            holder_method, std::string("urn:uuid:presentation-1"), {"https://schema.org"}, {"ExamplePresentation"},
            {credential.jwt}, 10);
        REQUIRE(presentation.is_ok());
        const auto &vp = presentation.value().verifiable_presentation;
        CHECK(vp.holder == holder_id);
        CHECK(vp.types == std::vector<std::string>{"VerifiablePresentation", "ExamplePresentation"});
        CHECK(vp.contexts == std::vector<std::string>{VC_CONTEXT_V2, "https://schema.org"});

        auto payload = jwt::decode(presentation.value().jwt).value().payload;
        CHECK(payload["exp"].asInt64() - payload["nbf"].asInt64() == 600);
        CHECK(payload["jti"].asString() == "urn:uuid:presentation-1");

        auto check = t.connector.checkVerifiablePresentation(presentation.value().jwt);
        REQUIRE(check.is_ok());
        CHECK_FALSE(check.value().revoked);
        REQUIRE(check.value().verifiable_presentation.has_value());
        CHECK(check.value().verifiable_presentation->holder == holder_id);
        CHECK(check.value().verifiable_presentation->id == "urn:uuid:presentation-1");
        REQUIRE(check.value().issuers.size() == 1);
        CHECK(check.value().issuers[0].getId() == issuer_id);
    }

    TEST_CASE("Presentation is revoked when any credential is revoked") {
        TestConnector t;
        std::string holder_id = t.createDocument();
        std::string holder_method = t.addMethod(holder_id, "key-1");
        std::string issuer_id = t.createDocument();
        std::string issuer_method = t.addMethod(issuer_id, "key-1");

        auto first = t.connector.createVerifiableCredential(issuer_method, std::nullopt, aliceSubject(), 1).value();
        auto second = t.connector.createVerifiableCredential(issuer_method, std::nullopt, aliceSubject(), 2).value();
        auto presentation =
            t.connector.createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {first.jwt, second.jwt})
                .value();

        auto before = t.connector.checkVerifiablePresentation(presentation.jwt);
        REQUIRE(before.is_ok());
        CHECK_FALSE(before.value().revoked);
        CHECK(before.value().issuers.size() == 1);

        REQUIRE(t.connector.revokeVerifiableCredentials(issuer_id, {2}).is_ok());
        auto after = t.connector.checkVerifiablePresentation(presentation.jwt);
        REQUIRE(after.is_ok());
        CHECK(after.value().revoked);
    }

    TEST_CASE("Tampered embedded credential fails the presentation") {
        TestConnector t;
        std::string holder_id = t.createDocument();
        std::string holder_method = t.addMethod(holder_id, "key-1");
        std::string issuer_id = t.createDocument();
        std::string issuer_method = t.addMethod(issuer_id, "key-1");

        auto credential = t.connector.createVerifiableCredential(issuer_method, std::nullopt, aliceSubject()).value();
        auto presentation = t.connector
                                .createVerifiablePresentation(holder_method, std::nullopt, {}, {},
                                                              {alterSignature(credential.jwt)})
                                .value();

        auto check = t.connector.checkVerifiablePresentation(presentation.jwt);
        REQUIRE(check.is_err());
        CHECK(check.error().code == ERR_OPERATION_FAILED);
        CHECK(errorMessage(check.error()).find("signatureInvalid") != std::string::npos);
    }

    TEST_CASE("Tampered presentation signature fails") {
        TestConnector t;
        std::string holder_id = t.createDocument();
        std::string holder_method = t.addMethod(holder_id, "key-1");
        auto presentation = t.connector.createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {}).value();

        CHECK(t.connector.checkVerifiablePresentation(presentation.jwt).is_ok());
        auto check = t.connector.checkVerifiablePresentation(alterSignature(presentation.jwt));
        REQUIRE(check.is_err());
        CHECK(check.error().code == ERR_OPERATION_FAILED);
    }

    TEST_CASE("Expired presentation fails") {
        TestConnector t;
        std::string holder_id = t.createDocument();
        std::string holder_method = t.addMethod(holder_id, "key-1");

        auto vault_key = t.vault->getKey(holder_method).value();
        auto key = Ed25519KeyPair::fromPrivateKey(vault_key.private_key, vault_key.public_key).value();
        dp::i64 issued_at = nowSeconds() - 3600;
        auto vp = VerifiablePresentation::build(holder_id, std::nullopt, {}, {}, {});
        auto token = jwt::encode(jwt::makeHeader(holder_method), vp.toJwtClaims(issued_at, issued_at + 60), key);
        REQUIRE(token.is_ok());

        auto check = t.connector.checkVerifiablePresentation(token.value());
        REQUIRE(check.is_err());
        CHECK(errorMessage(check.error()).find("presentationExpired") != std::string::npos);
    }

    TEST_CASE("Presentation input is validated") {
        TestConnector t;
        std::string holder_id = t.createDocument();
        std::string holder_method = t.addMethod(holder_id, "key-1");

        CHECK(t.connector.createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {}, -1).error().code ==
              ERR_VALIDATION);
        CHECK(t.connector.createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {""}).error().code ==
              ERR_VALIDATION);
        CHECK(t.connector.createVerifiablePresentation(UNKNOWN_DOC + "#key-1", std::nullopt, {}, {}, {})
                  .error()
                  .code == ERR_NOT_FOUND);
        CHECK(t.connector.checkVerifiablePresentation("").error().code == ERR_VALIDATION);

        dp::i64 huge = std::numeric_limits<dp::i64>::max() / 2;
        CHECK(t.connector.createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {}, huge).error().code ==
              ERR_VALIDATION);
        CHECK(t.connector
                  .createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {},
                                                std::numeric_limits<dp::i64>::max())
                  .error()
                  .code == ERR_VALIDATION);
        CHECK(t.connector.createVerifiablePresentation(holder_method, std::nullopt, {}, {}, {}, 60 * 24 * 365).is_ok());
    }

    TEST_CASE("Out of range exp claims are rejected as errors") {
        TestConnector t;
        std::string holder_id = t.createDocument();
        std::string holder_method = t.addMethod(holder_id, "key-1");

        auto vp = VerifiablePresentation::build(holder_id, std::nullopt, {}, {}, {});
        Json::Value payload = vp.toJwtClaims(nowSeconds(), std::nullopt);

        std::vector<Json::Value> bad_values = {Json::Value(1e19), Json::Value(Json::UInt64(18446744073709551615ull)),
                                               Json::Value(Json::Int64(-1)), Json::Value(1.5), Json::Value("soon")};
        for (const auto &bad : bad_values) {
            payload["exp"] = bad;
            auto check = t.connector.checkVerifiablePresentation(resign(t, holder_method, payload));
            REQUIRE(check.is_err());
            CHECK(check.error().code == ERR_OPERATION_FAILED);
            CHECK(errorMessage(check.error()).find("Invalid exp claim") != std::string::npos);
        }

        payload["exp"] = Json::Int64(nowSeconds() + 600);
        CHECK(t.connector.checkVerifiablePresentation(resign(t, holder_method, payload)).is_ok());
    }
}

TEST_SUITE("Identity Connector Proof Tests") {

    TEST_CASE("Create and verify proof") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        Bytes data = stringToBytes("bytes to prove");

        auto proof = t.connector.createProof(doc_id, method_id, data);
        REQUIRE(proof.is_ok());
        CHECK(proof.value().type == "Ed25519");
        CHECK(proof.value().value.size() == 64);

        auto verified = t.connector.verifyProof(doc_id, "key-1", data, "Ed25519", proof.value().value);
        REQUIRE(verified.is_ok());
        CHECK(verified.value());

        Bytes altered_data = data;
        altered_data[0] ^= 0x01;
        CHECK_FALSE(t.connector.verifyProof(doc_id, method_id, altered_data, "Ed25519", proof.value().value).value());

        Bytes altered_signature = proof.value().value;
        altered_signature[0] ^= 0x01;
        CHECK_FALSE(t.connector.verifyProof(doc_id, method_id, data, "Ed25519", altered_signature).value());

        auto parsed = Proof::fromJson(proof.value().toJson());
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().value == proof.value().value);
    }

    TEST_CASE("Unsupported signature type is a validation error") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");

        auto verified = t.connector.verifyProof(doc_id, method_id, stringToBytes("x"), "RSA", Bytes(64, 0));
        REQUIRE(verified.is_err());
        CHECK(verified.error().code == ERR_VALIDATION);
    }

    TEST_CASE("Data integrity proof") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        std::string method_id = t.addMethod(doc_id, "key-1");
        Bytes data = stringToBytes("{\"hello\":\"world\"}");

        auto proof = t.connector.createDataIntegrityProof(method_id, data);
        REQUIRE(proof.is_ok());
        CHECK(proof.value().type == "DataIntegrityProof");
        CHECK(proof.value().cryptosuite == "eddsa-jcs-2022");
        CHECK(proof.value().proof_purpose == "assertionMethod");
        CHECK(proof.value().verification_method == method_id);

        auto verified = t.connector.verifyDataIntegrityProof(data, proof.value());
        REQUIRE(verified.is_ok());
        CHECK(verified.value());

        CHECK_FALSE(t.connector.verifyDataIntegrityProof(stringToBytes("{}"), proof.value()).value());

        auto restored = DataIntegrityProof::fromJson(proof.value().toJson());
        REQUIRE(restored.is_ok());
        CHECK(restored.value().verification_method == method_id);
        CHECK(restored.value().proof_value == proof.value().proof_value);
        CHECK(restored.value().created == proof.value().created);
        CHECK(t.connector.verifyDataIntegrityProof(data, restored.value()).value());
        CHECK(DataIntegrityProof::fromJson(Json::Value("proof")).error().code == ERR_DECODE);

        DataIntegrityProof wrong_suite = proof.value();
        wrong_suite.cryptosuite = "ecdsa-rdfc-2019";
        CHECK(t.connector.verifyDataIntegrityProof(data, wrong_suite).error().code == ERR_VALIDATION);
    }
}

TEST_SUITE("Identity Connector Storage Tests") {

    TEST_CASE("Tampered stored document fails integrity") {
        TestConnector t;
        std::string doc_id = t.createDocument();

        auto record = t.store->get(doc_id).value().value();
        std::string document = record.getDocument();
        auto doc = DidDocument::fromJsonString(document).value();
        doc.addService(Service(doc_id + "#evil", "LinkedDomains", "https://evil.example"));
        record.document = dp::String(doc.toJsonString().c_str());
        t.store->putRaw(record);

        auto resolved = t.connector.resolveDocument(doc_id);
        REQUIRE(resolved.is_err());
        CHECK(resolved.error().code == ERR_INTEGRITY);

        auto added = t.connector.addService(doc_id, "svc", {"T"}, {"https://a.example"});
        REQUIRE(added.is_err());
        CHECK(added.error().code == ERR_INTEGRITY);
    }

    TEST_CASE("Concurrent write makes the later writer fail") {
        auto store = std::make_shared<RacingDocumentStore>();
        auto vault = std::make_shared<MemoryVault>();
        IdentityConnector connector(store, vault);

        auto doc = connector.createDocument("did:controller:1");
        REQUIRE(doc.is_ok());
        std::string doc_id = doc.value().getId();

        store->race_next_write = true;
        auto added = connector.addService(doc_id, "svc", {"T"}, {"https://a.example"});
        REQUIRE(added.is_err());
        CHECK(added.error().code == ERR_VERSION_CONFLICT);
    }

    TEST_CASE("Failed document write removes the new method key") {
        auto store = std::make_shared<RacingDocumentStore>();
        auto vault = std::make_shared<MemoryVault>();
        IdentityConnector connector(store, vault);
        std::string doc_id = connector.createDocument("did:controller:1").value().getId();
        size_t keys_before = vault->keyCount();

        store->race_next_write = true;
        auto method = connector.addVerificationMethod(doc_id, "assertionMethod", std::string("key-1"));
        REQUIRE(method.is_err());
        CHECK(method.error().code == ERR_VERSION_CONFLICT);
        CHECK_FALSE(vault->hasKey(doc_id + "#key-1"));
        CHECK(vault->keyCount() == keys_before);
    }

    TEST_CASE("Failed replacement restores the previous method key") {
        auto store = std::make_shared<RacingDocumentStore>();
        auto vault = std::make_shared<MemoryVault>();
        IdentityConnector connector(store, vault);
        std::string doc_id = connector.createDocument("did:controller:1").value().getId();
        auto original = connector.addVerificationMethod(doc_id, "assertionMethod", std::string("key-1")).value();
        auto original_key = vault->getKey(doc_id + "#key-1").value();

        store->race_next_write = true;
        auto replacement = connector.addVerificationMethod(doc_id, "assertionMethod", std::string("key-1"));
        REQUIRE(replacement.is_err());

        REQUIRE(vault->hasKey(doc_id + "#key-1"));
        CHECK(vault->getKey(doc_id + "#key-1").value().public_key == original_key.public_key);
        CHECK(vault->keyCount() == 2);
    }

    TEST_CASE("Custom DID method and bitmap size") {
        IdentityConnectorConfig config;
        config.did_method = "local";
        config.revocation_bitmap_bits = 64;
        auto store = std::make_shared<MemoryDocumentStore>();
        IdentityConnector connector(store, std::make_shared<MemoryVault>(), config);

        auto doc = connector.createDocument("did:controller:1");
        REQUIRE(doc.is_ok());
        CHECK(doc.value().getId().rfind("did:local:0x", 0) == 0);

        CHECK(connector.revokeVerifiableCredentials(doc.value().getId(), {63}).is_ok());
        CHECK(connector.revokeVerifiableCredentials(doc.value().getId(), {64}).error().code == ERR_VALIDATION);
    }

    TEST_CASE("Print summary") {
        TestConnector t;
        std::string doc_id = t.createDocument();
        t.addMethod(doc_id, "key-1");
        t.connector.printSummary(doc_id);
        t.connector.printSummary(UNKNOWN_DOC);
    }
}
