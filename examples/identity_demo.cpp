/// Identity Demo
/// Demonstrates documents, credentials, revocation, presentations and profiles

#include <credo.hpp>
#include <iostream>

using namespace credo;

int main(int argc, char **argv) {
    std::cout << "=== Credo Identity Demo ===" << std::endl;
    std::cout << std::endl;

    // Documents go to SQLite when a path is given, memory otherwise
    std::shared_ptr<DocumentStore> store;
    if (argc > 1) {
        auto sqlite = std::make_shared<SqliteDocumentStore>();
        auto opened = sqlite->open(argv[1]);
        if (opened.is_err()) {
            std::cerr << "Failed to open " << argv[1] << ": " << errorMessage(opened.error()) << std::endl;
            return 1;
        }
        store = sqlite;
    } else {
        store = std::make_shared<MemoryDocumentStore>();
    }
    auto vault = std::make_shared<MemoryVault>();
    IdentityConnector connector(store, vault);

    // === Part 1: Documents ===
    std::cout << "--- Part 1: Creating documents ---" << std::endl;

    auto issuer = connector.createDocument("did:example:university");
    auto holder = connector.createDocument("did:example:alice");
    if (issuer.is_err() || holder.is_err()) {
        std::cerr << "Failed to create documents" << std::endl;
        return 1;
    }
    std::string issuer_id = issuer.value().getId();
    std::string holder_id = holder.value().getId();

    auto issuer_key = connector.addVerificationMethod(issuer_id, "assertionMethod", std::string("key-1"));
    auto holder_key = connector.addVerificationMethod(holder_id, "authentication", std::string("key-1"));
    if (issuer_key.is_err() || holder_key.is_err()) {
        std::cerr << "Failed to add verification methods" << std::endl;
        return 1;
    }
    auto service = connector.addService(issuer_id, "website", {"LinkedDomains"}, {"https://university.example"});
    if (service.is_err()) {
        std::cerr << "Failed to add service: " << errorMessage(service.error()) << std::endl;
        return 1;
    }
    connector.printSummary(issuer_id);
    std::cout << std::endl;

    // === Part 2: Credentials ===
    std::cout << "--- Part 2: Issuing a credential ---" << std::endl;

    Json::Value subject(Json::objectValue);
    subject["@context"] = "https://schema.org";
    subject["type"] = "Person";
    subject["id"] = holder_id;
    subject["name"] = "Alice";

    auto credential = connector.createVerifiableCredential(issuer_key.value().getId(),
                                                           std::string("https://university.example/credentials/1"),
                                                           subject, 5);
    if (credential.is_err()) {
        std::cerr << "Failed to issue credential: " << errorMessage(credential.error()) << std::endl;
        return 1;
    }
    std::cout << "Credential JWT: " << credential.value().jwt.substr(0, 48) << "..." << std::endl;
    std::cout << prettyJson(credential.value().verifiable_credential.toJson()) << std::endl;

    auto check = connector.checkVerifiableCredential(credential.value().jwt);
    if (check.is_err()) {
        std::cerr << "Credential check failed: " << errorMessage(check.error()) << std::endl;
        return 1;
    }
    std::cout << "Revoked: " << (check.value().revoked ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    // === Part 3: Presentations ===
    std::cout << "--- Part 3: Presenting the credential ---" << std::endl;

    auto presentation = connector.createVerifiablePresentation(holder_key.value().getId(), std::nullopt, {}, {},
                                                               {credential.value().jwt}, 10);
    if (presentation.is_err()) {
        std::cerr << "Failed to create presentation: " << errorMessage(presentation.error()) << std::endl;
        return 1;
    }
    auto presented = connector.checkVerifiablePresentation(presentation.value().jwt);
    if (presented.is_err()) {
        std::cerr << "Presentation check failed: " << errorMessage(presented.error()) << std::endl;
        return 1;
    }
    std::cout << "Presentation issuers: " << presented.value().issuers.size() << std::endl;
    std::cout << "Revoked: " << (presented.value().revoked ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    // === Part 4: Revocation ===
    std::cout << "--- Part 4: Revoking ---" << std::endl;

    if (connector.revokeVerifiableCredentials(issuer_id, {5}).is_err()) {
        std::cerr << "Failed to revoke" << std::endl;
        return 1;
    }
    auto revoked = connector.checkVerifiableCredential(credential.value().jwt);
    if (revoked.is_ok()) {
        std::cout << "Revoked after revocation: " << (revoked.value().revoked ? "yes" : "no") << std::endl;
    }
    std::cout << std::endl;

    // === Part 5: Proofs ===
    std::cout << "--- Part 5: Data integrity proof ---" << std::endl;

    Bytes payload = stringToBytes(canonicalize(subject));
    auto proof = connector.createDataIntegrityProof(issuer_key.value().getId(), payload);
    if (proof.is_ok()) {
        std::cout << prettyJson(proof.value().toJson()) << std::endl;
        auto verified = connector.verifyDataIntegrityProof(payload, proof.value());
        std::cout << "Verified: " << (verified.is_ok() && verified.value() ? "yes" : "no") << std::endl;
    }
    std::cout << std::endl;

    // === Part 6: Profiles ===
    std::cout << "--- Part 6: Profiles ---" << std::endl;

    IdentityProfileConnector profiles(std::make_shared<MemoryProfileStore>());
    Json::Value public_profile(Json::objectValue);
    public_profile["displayName"] = "Alice";
    Json::Value private_profile(Json::objectValue);
    private_profile["email"] = "alice@example.com";
    if (profiles.create(holder_id, public_profile, private_profile).is_err()) {
        std::cerr << "Failed to create profile" << std::endl;
        return 1;
    }
    auto listed = profiles.list();
    if (listed.is_ok()) {
        for (const auto &item : listed.value().items) {
            std::cout << "  " << item.identity << " -> " << canonicalize(item.public_profile) << std::endl;
        }
    }

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
