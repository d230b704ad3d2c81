#include <algorithm>
#include <credo/identity/identity_connector.hpp>
#include <iostream>
#include <random>

namespace credo {

    namespace {

        const std::string REVOCATION_SUFFIX = std::string("#") + REVOCATION_FRAGMENT;

    } // namespace

    IdentityConnector::IdentityConnector(std::shared_ptr<DocumentStore> store, std::shared_ptr<Vault> vault,
                                         IdentityConnectorConfig config)
        : store_(std::move(store)), vault_(std::move(vault)), config_(std::move(config)) {}

    // ===========================================
    // Documents
    // ===========================================

    dp::Result<DidDocument, dp::Error> IdentityConnector::createDocument(const std::string &controller) {
        if (controller.empty()) {
            return dp::Result<DidDocument, dp::Error>::err(validation("controller must not be empty"));
        }

        auto bitmap = RevocationBitmap::create(config_.revocation_bitmap_bits);
        if (bitmap.is_err()) {
            return dp::Result<DidDocument, dp::Error>::err(bitmap.error());
        }
        auto revocation_uri = bitmap.value().toDataUri();
        if (revocation_uri.is_err()) {
            return dp::Result<DidDocument, dp::Error>::err(operation_failed("createDocument", revocation_uri.error()));
        }

        std::string temp_id = tempKeyId(controller);
        auto public_key = vault_->createKey(temp_id, VaultKeyType::Ed25519);
        if (public_key.is_err()) {
            return dp::Result<DidDocument, dp::Error>::err(operation_failed("createDocument", public_key.error()));
        }

        auto did = Did::fromPublicKey(config_.did_method, public_key.value());
        if (did.is_err()) {
            discardKey(temp_id);
            return dp::Result<DidDocument, dp::Error>::err(operation_failed("createDocument", did.error()));
        }
        std::string document_id = did.value().toString();

        auto renamed = vault_->renameKey(temp_id, integrityKeyId(document_id));
        if (renamed.is_err()) {
            discardKey(temp_id);
            return dp::Result<DidDocument, dp::Error>::err(operation_failed("createDocument", renamed.error()));
        }

        DidDocument document = DidDocument::create(document_id);
        document.addService(Service(document_id + REVOCATION_SUFFIX, REVOCATION_SERVICE_TYPE, revocation_uri.value()));

        auto stored = storeDocument(document, controller, 0);
        if (stored.is_err()) {
            discardKey(integrityKeyId(document_id));
            return dp::Result<DidDocument, dp::Error>::err(operation_failed("createDocument", stored.error()));
        }

        std::cout << "Document created: " << document_id << " (controller " << controller << ")" << std::endl;
        return dp::Result<DidDocument, dp::Error>::ok(std::move(document));
    }

    dp::Result<DidDocument, dp::Error> IdentityConnector::resolveDocument(const std::string &document_id) const {
        if (document_id.empty()) {
            return dp::Result<DidDocument, dp::Error>::err(validation("documentId must not be empty"));
        }
        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<DidDocument, dp::Error>::err(operation_failed("resolveDocument", loaded.error()));
        }
        return dp::Result<DidDocument, dp::Error>::ok(std::move(loaded.value().document));
    }

    dp::Result<VerificationMethod, dp::Error>
    IdentityConnector::addVerificationMethod(const std::string &document_id, const std::string &purpose,
                                             const std::optional<std::string> &explicit_id) {
        if (document_id.empty()) {
            return dp::Result<VerificationMethod, dp::Error>::err(validation("documentId must not be empty"));
        }
        auto parsed_purpose = parseVerificationPurpose(purpose);
        if (parsed_purpose.is_err()) {
            return dp::Result<VerificationMethod, dp::Error>::err(parsed_purpose.error());
        }
        std::string explicit_method_id;
        if (explicit_id.has_value()) {
            auto qualified = qualifyId(document_id, *explicit_id);
            if (qualified.is_err()) {
                return dp::Result<VerificationMethod, dp::Error>::err(qualified.error());
            }
            explicit_method_id = qualified.value();
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<VerificationMethod, dp::Error>::err(
                operation_failed("addVerificationMethod", loaded.error()));
        }
        LoadedDocument &current = loaded.value();

        std::string temp_id = tempKeyId(document_id);
        auto public_key = vault_->createKey(temp_id, VaultKeyType::Ed25519);
        if (public_key.is_err()) {
            return dp::Result<VerificationMethod, dp::Error>::err(
                operation_failed("addVerificationMethod", public_key.error()));
        }

        Jwk jwk = Jwk::fromEd25519(public_key.value());
        auto kid = jwk.computeKid();
        if (kid.is_err()) {
            discardKey(temp_id);
            return dp::Result<VerificationMethod, dp::Error>::err(operation_failed("addVerificationMethod", kid.error()));
        }
        jwk.kid = dp::String(kid.value().c_str());
        std::string method_id = explicit_method_id.empty() ? document_id + "#" + kid.value() : explicit_method_id;

        // A key already held under the final id is parked until the new document is stored
        std::string parked_id;
        if (vault_->getKey(method_id).is_ok()) {
            parked_id = tempKeyId(method_id);
            auto parked = vault_->renameKey(method_id, parked_id);
            if (parked.is_err()) {
                discardKey(temp_id);
                return dp::Result<VerificationMethod, dp::Error>::err(
                    operation_failed("addVerificationMethod", parked.error()));
            }
        }

        auto renamed = vault_->renameKey(temp_id, method_id);
        if (renamed.is_err()) {
            discardKey(temp_id);
            if (!parked_id.empty()) {
                restoreKey(parked_id, method_id);
            }
            return dp::Result<VerificationMethod, dp::Error>::err(
                operation_failed("addVerificationMethod", renamed.error()));
        }

        VerificationMethod method(method_id, document_id, jwk);
        current.document.addVerificationMethod(parsed_purpose.value(), method);

        auto stored = storeDocument(current.document, current.controller, current.version);
        if (stored.is_err()) {
            discardKey(method_id);
            if (!parked_id.empty()) {
                restoreKey(parked_id, method_id);
            }
            return dp::Result<VerificationMethod, dp::Error>::err(
                operation_failed("addVerificationMethod", stored.error()));
        }
        if (!parked_id.empty()) {
            discardKey(parked_id);
        }

        return dp::Result<VerificationMethod, dp::Error>::ok(std::move(method));
    }

    dp::Result<void, dp::Error> IdentityConnector::removeVerificationMethod(const std::string &document_id,
                                                                            const std::string &method_id) {
        if (document_id.empty()) {
            return dp::Result<void, dp::Error>::err(validation("documentId must not be empty"));
        }
        auto qualified = qualifyId(document_id, method_id);
        if (qualified.is_err()) {
            return dp::Result<void, dp::Error>::err(qualified.error());
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("removeVerificationMethod", loaded.error()));
        }
        LoadedDocument &current = loaded.value();

        auto removed = current.document.removeVerificationMethod(qualified.value());
        if (removed.is_err()) {
            return removed;
        }

        auto stored = storeDocument(current.document, current.controller, current.version);
        if (stored.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("removeVerificationMethod", stored.error()));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Service, dp::Error> IdentityConnector::addService(const std::string &document_id,
                                                                 const std::string &service_id,
                                                                 const std::vector<std::string> &types,
                                                                 const std::vector<std::string> &endpoints) {
        if (document_id.empty()) {
            return dp::Result<Service, dp::Error>::err(validation("documentId must not be empty"));
        }
        if (types.empty() || std::any_of(types.begin(), types.end(), [](const std::string &t) { return t.empty(); })) {
            return dp::Result<Service, dp::Error>::err(validation("Service types must be non-empty strings"));
        }
        if (endpoints.empty() ||
            std::any_of(endpoints.begin(), endpoints.end(), [](const std::string &e) { return e.empty(); })) {
            return dp::Result<Service, dp::Error>::err(validation("Service endpoints must be non-empty strings"));
        }
        auto qualified = qualifyId(document_id, service_id);
        if (qualified.is_err()) {
            return dp::Result<Service, dp::Error>::err(qualified.error());
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<Service, dp::Error>::err(operation_failed("addService", loaded.error()));
        }
        LoadedDocument &current = loaded.value();

        Service service(qualified.value(), types, endpoints);
        current.document.addService(service);

        auto stored = storeDocument(current.document, current.controller, current.version);
        if (stored.is_err()) {
            return dp::Result<Service, dp::Error>::err(operation_failed("addService", stored.error()));
        }
        return dp::Result<Service, dp::Error>::ok(std::move(service));
    }

    dp::Result<void, dp::Error> IdentityConnector::removeService(const std::string &document_id,
                                                                 const std::string &service_id) {
        if (document_id.empty()) {
            return dp::Result<void, dp::Error>::err(validation("documentId must not be empty"));
        }
        auto qualified = qualifyId(document_id, service_id);
        if (qualified.is_err()) {
            return dp::Result<void, dp::Error>::err(qualified.error());
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("removeService", loaded.error()));
        }
        LoadedDocument &current = loaded.value();

        auto removed = current.document.removeService(qualified.value());
        if (removed.is_err()) {
            return removed;
        }

        auto stored = storeDocument(current.document, current.controller, current.version);
        if (stored.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("removeService", stored.error()));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Credentials
    // ===========================================

    dp::Result<CredentialResult, dp::Error>
    IdentityConnector::createVerifiableCredential(const std::string &verification_method_id,
                                                  const std::optional<std::string> &credential_id,
                                                  const Json::Value &subject,
                                                  const std::optional<dp::i64> &revocation_index) {
        auto url = parseDidUrl(verification_method_id);
        if (url.is_err()) {
            return dp::Result<CredentialResult, dp::Error>::err(url.error());
        }
        if (url.value().fragment.empty()) {
            return dp::Result<CredentialResult, dp::Error>::err(
                validation("verificationMethodId must include a fragment: " + verification_method_id));
        }
        if (!subject.isObject() && !subject.isArray()) {
            return dp::Result<CredentialResult, dp::Error>::err(
                validation("Credential subject must be an object or an array of objects"));
        }
        if (revocation_index.has_value() &&
            (*revocation_index < 0 || static_cast<dp::u64>(*revocation_index) >= config_.revocation_bitmap_bits)) {
            return dp::Result<CredentialResult, dp::Error>::err(
                validation("revocationIndex out of range: " + std::to_string(*revocation_index)));
        }

        const std::string &issuer_id = url.value().did;
        auto loaded = loadDocument(issuer_id);
        if (loaded.is_err()) {
            return dp::Result<CredentialResult, dp::Error>::err(
                operation_failed("createVerifiableCredential", loaded.error()));
        }
        const DidDocument &issuer = loaded.value().document;

        auto method = signingMethod(issuer, verification_method_id);
        if (method.is_err()) {
            return dp::Result<CredentialResult, dp::Error>::err(
                operation_failed("createVerifiableCredential", method.error()));
        }

        std::optional<CredentialStatus> status;
        if (revocation_index.has_value()) {
            auto service = issuer.findServiceBySuffix(REVOCATION_SUFFIX);
            if (service.is_err()) {
                return dp::Result<CredentialResult, dp::Error>::err(
                    not_found("revocationServiceMissing", issuer_id));
            }
            CredentialStatus credential_status;
            credential_status.id = service.value().getId();
            credential_status.type = service.value().getTypeString();
            credential_status.revocation_bitmap_index = std::to_string(*revocation_index);
            status = credential_status;
        }

        dp::i64 now = nowSeconds();
        auto credential = VerifiableCredential::build(issuer_id, credential_id, subject, status, now);
        if (credential.is_err()) {
            return dp::Result<CredentialResult, dp::Error>::err(credential.error());
        }

        auto key = signingKey(method.value());
        if (key.is_err()) {
            return dp::Result<CredentialResult, dp::Error>::err(
                operation_failed("createVerifiableCredential", key.error()));
        }

        auto token = jwt::encode(jwt::makeHeader(verification_method_id), credential.value().toJwtClaims(now),
                                 key.value());
        if (token.is_err()) {
            return dp::Result<CredentialResult, dp::Error>::err(
                operation_failed("createVerifiableCredential", token.error()));
        }

        CredentialResult result;
        result.verifiable_credential = std::move(credential.value());
        result.jwt = std::move(token.value());
        return dp::Result<CredentialResult, dp::Error>::ok(std::move(result));
    }

    dp::Result<CredentialCheck, dp::Error>
    IdentityConnector::checkVerifiableCredential(const std::string &credential_jwt) const {
        if (credential_jwt.empty()) {
            return dp::Result<CredentialCheck, dp::Error>::err(validation("credentialJwt must not be empty"));
        }
        auto check = checkCredential(credential_jwt, nullptr);
        if (check.is_err()) {
            return dp::Result<CredentialCheck, dp::Error>::err(
                operation_failed("checkVerifiableCredential", check.error()));
        }
        return check;
    }

    dp::Result<void, dp::Error> IdentityConnector::revokeVerifiableCredentials(const std::string &issuer_document_id,
                                                                               const std::vector<dp::i64> &indices) {
        return setRevocation("revokeVerifiableCredentials", issuer_document_id, indices, true);
    }

    dp::Result<void, dp::Error>
    IdentityConnector::unrevokeVerifiableCredentials(const std::string &issuer_document_id,
                                                     const std::vector<dp::i64> &indices) {
        return setRevocation("unrevokeVerifiableCredentials", issuer_document_id, indices, false);
    }

    // ===========================================
    // Presentations
    // ===========================================

    dp::Result<PresentationResult, dp::Error> IdentityConnector::createVerifiablePresentation(
        const std::string &verification_method_id, const std::optional<std::string> &presentation_id,
        const std::vector<std::string> &contexts, const std::vector<std::string> &types,
        const std::vector<std::string> &credential_jwts, const std::optional<dp::i64> &expires_in_minutes) {
        auto url = parseDidUrl(verification_method_id);
        if (url.is_err()) {
            return dp::Result<PresentationResult, dp::Error>::err(url.error());
        }
        if (url.value().fragment.empty()) {
            return dp::Result<PresentationResult, dp::Error>::err(
                validation("verificationMethodId must include a fragment: " + verification_method_id));
        }
        if (expires_in_minutes.has_value() && *expires_in_minutes < 0) {
            return dp::Result<PresentationResult, dp::Error>::err(
                validation("expiresInMinutes must not be negative"));
        }
        dp::i64 now = nowSeconds();
        if (expires_in_minutes.has_value() && *expires_in_minutes > (MAX_TIMESTAMP_SECONDS - now) / 60) {
            return dp::Result<PresentationResult, dp::Error>::err(validation("expiresInMinutes is too large"));
        }
        for (const auto &token : credential_jwts) {
            if (token.empty()) {
                return dp::Result<PresentationResult, dp::Error>::err(
                    validation("Credential JWTs must not be empty"));
            }
        }

        const std::string &holder_id = url.value().did;
        auto loaded = loadDocument(holder_id);
        if (loaded.is_err()) {
            return dp::Result<PresentationResult, dp::Error>::err(
                operation_failed("createVerifiablePresentation", loaded.error()));
        }

        auto method = signingMethod(loaded.value().document, verification_method_id);
        if (method.is_err()) {
            return dp::Result<PresentationResult, dp::Error>::err(
                operation_failed("createVerifiablePresentation", method.error()));
        }
        auto key = signingKey(method.value());
        if (key.is_err()) {
            return dp::Result<PresentationResult, dp::Error>::err(
                operation_failed("createVerifiablePresentation", key.error()));
        }

        VerifiablePresentation presentation =
            VerifiablePresentation::build(holder_id, presentation_id, contexts, types, credential_jwts);
        std::optional<dp::i64> expires_at;
        if (expires_in_minutes.has_value()) {
            expires_at = now + *expires_in_minutes * 60;
        }

        auto token = jwt::encode(jwt::makeHeader(verification_method_id), presentation.toJwtClaims(now, expires_at),
                                 key.value());
        if (token.is_err()) {
            return dp::Result<PresentationResult, dp::Error>::err(
                operation_failed("createVerifiablePresentation", token.error()));
        }

        PresentationResult result;
        result.verifiable_presentation = std::move(presentation);
        result.jwt = std::move(token.value());
        return dp::Result<PresentationResult, dp::Error>::ok(std::move(result));
    }

    dp::Result<PresentationCheck, dp::Error>
    IdentityConnector::checkVerifiablePresentation(const std::string &presentation_jwt) const {
        if (presentation_jwt.empty()) {
            return dp::Result<PresentationCheck, dp::Error>::err(validation("presentationJwt must not be empty"));
        }

        auto decoded = jwt::decode(presentation_jwt);
        if (decoded.is_err()) {
            return dp::Result<PresentationCheck, dp::Error>::err(
                operation_failed("checkVerifiablePresentation", decoded.error()));
        }
        std::string holder_id = stringMember(decoded.value().payload, "iss");
        if (holder_id.empty()) {
            return dp::Result<PresentationCheck, dp::Error>::err(
                operation_failed("checkVerifiablePresentation", jwt_malformed("Presentation JWT has no iss claim")));
        }

        auto holder = loadDocument(holder_id);
        if (holder.is_err()) {
            return dp::Result<PresentationCheck, dp::Error>::err(
                operation_failed("checkVerifiablePresentation", holder.error()));
        }
        auto verified = verifyJwt(holder.value().document, decoded.value());
        if (verified.is_err()) {
            return dp::Result<PresentationCheck, dp::Error>::err(
                operation_failed("checkVerifiablePresentation", verified.error()));
        }

        if (decoded.value().payload.isMember("exp")) {
            auto exp = timestampClaim(decoded.value().payload, "exp");
            if (exp.is_err()) {
                return dp::Result<PresentationCheck, dp::Error>::err(
                    operation_failed("checkVerifiablePresentation", exp.error()));
            }
            if (exp.value() < nowSeconds()) {
                std::cout << "Presentation from " << holder_id << " expired at " << isoFromSeconds(exp.value())
                          << std::endl;
                return dp::Result<PresentationCheck, dp::Error>::err(
                    operation_failed("checkVerifiablePresentation", general_error("presentationExpired", holder_id)));
            }
        }

        auto presentation = VerifiablePresentation::fromJwtClaims(decoded.value().payload);
        if (presentation.is_err()) {
            return dp::Result<PresentationCheck, dp::Error>::err(
                operation_failed("checkVerifiablePresentation", presentation.error()));
        }

        PresentationCheck result;
        for (const auto &credential_jwt : presentation.value().verifiable_credentials) {
            DidDocument issuer;
            auto check = checkCredential(credential_jwt, &issuer);
            if (check.is_err()) {
                return dp::Result<PresentationCheck, dp::Error>::err(
                    operation_failed("checkVerifiablePresentation", check.error()));
            }
            result.revoked = result.revoked || check.value().revoked;

            bool known = std::any_of(result.issuers.begin(), result.issuers.end(),
                                     [&issuer](const DidDocument &d) { return d.getId() == issuer.getId(); });
            if (!known) {
                result.issuers.push_back(std::move(issuer));
            }
        }
        result.verifiable_presentation = std::move(presentation.value());
        return dp::Result<PresentationCheck, dp::Error>::ok(std::move(result));
    }

    // ===========================================
    // Proofs
    // ===========================================

    dp::Result<Proof, dp::Error> IdentityConnector::createProof(const std::string &document_id,
                                                                const std::string &method_id, const Bytes &data) const {
        if (document_id.empty()) {
            return dp::Result<Proof, dp::Error>::err(validation("documentId must not be empty"));
        }
        auto qualified = qualifyId(document_id, method_id);
        if (qualified.is_err()) {
            return dp::Result<Proof, dp::Error>::err(qualified.error());
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<Proof, dp::Error>::err(operation_failed("createProof", loaded.error()));
        }
        auto method = signingMethod(loaded.value().document, qualified.value());
        if (method.is_err()) {
            return dp::Result<Proof, dp::Error>::err(operation_failed("createProof", method.error()));
        }

        auto signature = vault_->sign(method.value().getId(), data);
        if (signature.is_err()) {
            return dp::Result<Proof, dp::Error>::err(operation_failed("createProof", signature.error()));
        }

        Proof proof;
        proof.value = std::move(signature.value());
        return dp::Result<Proof, dp::Error>::ok(std::move(proof));
    }

    dp::Result<bool, dp::Error> IdentityConnector::verifyProof(const std::string &document_id,
                                                               const std::string &method_id, const Bytes &data,
                                                               const std::string &signature_type,
                                                               const Bytes &signature_value) const {
        if (document_id.empty()) {
            return dp::Result<bool, dp::Error>::err(validation("documentId must not be empty"));
        }
        if (signature_type != PROOF_TYPE_ED25519) {
            return dp::Result<bool, dp::Error>::err(validation("Unsupported signature type: '" + signature_type + "'"));
        }
        auto qualified = qualifyId(document_id, method_id);
        if (qualified.is_err()) {
            return dp::Result<bool, dp::Error>::err(qualified.error());
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<bool, dp::Error>::err(operation_failed("verifyProof", loaded.error()));
        }
        auto method = signingMethod(loaded.value().document, qualified.value());
        if (method.is_err()) {
            return dp::Result<bool, dp::Error>::err(operation_failed("verifyProof", method.error()));
        }
        auto public_key = method.value().public_key_jwk.publicKeyBytes();
        if (public_key.is_err()) {
            return dp::Result<bool, dp::Error>::err(operation_failed("verifyProof", public_key.error()));
        }

        return dp::Result<bool, dp::Error>::ok(ed25519Verify(public_key.value(), data, signature_value));
    }

    dp::Result<DataIntegrityProof, dp::Error>
    IdentityConnector::createDataIntegrityProof(const std::string &verification_method_id, const Bytes &data) const {
        auto url = parseDidUrl(verification_method_id);
        if (url.is_err()) {
            return dp::Result<DataIntegrityProof, dp::Error>::err(url.error());
        }

        auto proof = createProof(url.value().did, verification_method_id, data);
        if (proof.is_err()) {
            return dp::Result<DataIntegrityProof, dp::Error>::err(proof.error());
        }

        DataIntegrityProof integrity_proof;
        integrity_proof.created = nowIso8601();
        integrity_proof.verification_method = verification_method_id;
        integrity_proof.proof_value = base58Encode(proof.value().value);
        return dp::Result<DataIntegrityProof, dp::Error>::ok(std::move(integrity_proof));
    }

    dp::Result<bool, dp::Error> IdentityConnector::verifyDataIntegrityProof(const Bytes &data,
                                                                            const DataIntegrityProof &proof) const {
        if (proof.type != DataIntegrityProof::TYPE) {
            return dp::Result<bool, dp::Error>::err(validation("Unsupported proof type: '" + proof.type + "'"));
        }
        if (proof.cryptosuite != DataIntegrityProof::CRYPTOSUITE) {
            return dp::Result<bool, dp::Error>::err(
                validation("Unsupported cryptosuite: '" + proof.cryptosuite + "'"));
        }
        auto url = parseDidUrl(proof.verification_method);
        if (url.is_err()) {
            return dp::Result<bool, dp::Error>::err(url.error());
        }
        auto signature = base58Decode(proof.proof_value);
        if (signature.is_err()) {
            return dp::Result<bool, dp::Error>::err(validation("proofValue is not base58"));
        }
        return verifyProof(url.value().did, proof.verification_method, data, PROOF_TYPE_ED25519, signature.value());
    }

    // ===========================================
    // Diagnostics
    // ===========================================

    void IdentityConnector::printSummary(const std::string &document_id) const {
        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            std::cout << "Document " << document_id << " unavailable: " << errorMessage(loaded.error()) << std::endl;
            return;
        }
        const DidDocument &document = loaded.value().document;

        std::cout << "=== Identity Summary ===\n";
        std::cout << "Document: " << document.getId() << "\n";
        std::cout << "Controller: " << loaded.value().controller << "\n";
        std::cout << "Version: " << loaded.value().version << "\n";
        std::cout << "Verification Methods: " << document.allMethods().size() << "\n";
        for (const auto &entry : document.allMethods()) {
            std::cout << "  [" << verificationPurposeToString(entry.purpose) << "] " << entry.method.getId()
                      << (entry.is_reference ? " (reference)" : "") << "\n";
        }
        std::cout << "Services: " << document.getServices().size() << "\n";
        for (const auto &service : document.getServices()) {
            std::cout << "  " << service.getId() << " (" << service.getTypeString() << ")\n";
        }
        auto bitmap = readRevocationBitmap(document);
        if (bitmap.is_ok()) {
            std::cout << "Revoked Indices: " << bitmap.value().countSet() << " of " << bitmap.value().size() << "\n";
        }
        std::cout << std::flush;
    }

    // ===========================================
    // Internals
    // ===========================================

    dp::Result<IdentityConnector::LoadedDocument, dp::Error>
    IdentityConnector::loadDocument(const std::string &document_id) const {
        auto record = store_->get(document_id);
        if (record.is_err()) {
            return dp::Result<LoadedDocument, dp::Error>::err(record.error());
        }
        if (!record.value().has_value()) {
            return dp::Result<LoadedDocument, dp::Error>::err(not_found("documentNotFound", document_id));
        }
        const IdentityDocumentRecord &stored = *record.value();

        auto signature = base64Decode(stored.getSignature());
        bool intact = false;
        if (signature.is_ok()) {
            auto verified =
                vault_->verify(integrityKeyId(document_id), stringToBytes(stored.getDocument()), signature.value());
            intact = verified.is_ok() && verified.value();
        }
        if (!intact) {
            std::cout << "Integrity check failed for document " << document_id << std::endl;
            return dp::Result<LoadedDocument, dp::Error>::err(integrity_failed(document_id));
        }

        auto document = DidDocument::fromJsonString(stored.getDocument());
        if (document.is_err()) {
            return dp::Result<LoadedDocument, dp::Error>::err(document.error());
        }
        if (document.value().getId() != document_id) {
            std::cout << "Stored document id " << document.value().getId() << " does not match " << document_id
                      << std::endl;
            return dp::Result<LoadedDocument, dp::Error>::err(integrity_failed(document_id));
        }

        LoadedDocument loaded;
        loaded.document = std::move(document.value());
        loaded.controller = stored.getController();
        loaded.version = stored.version;
        return dp::Result<LoadedDocument, dp::Error>::ok(std::move(loaded));
    }

    dp::Result<dp::u64, dp::Error> IdentityConnector::storeDocument(const DidDocument &document,
                                                                    const std::string &controller,
                                                                    dp::u64 expected_version) {
        std::string canonical = document.toJsonString();
        auto signature = vault_->sign(integrityKeyId(document.getId()), stringToBytes(canonical));
        if (signature.is_err()) {
            return dp::Result<dp::u64, dp::Error>::err(signature.error());
        }

        IdentityDocumentRecord record;
        record.id = dp::String(document.getId().c_str());
        record.document = dp::String(canonical.c_str());
        record.signature = dp::String(base64Encode(signature.value()).c_str());
        record.controller = dp::String(controller.c_str());
        record.version = expected_version + 1;
        return store_->set(record, expected_version);
    }

    dp::Result<std::string, dp::Error> IdentityConnector::qualifyId(const std::string &document_id,
                                                                    const std::string &id) const {
        if (id.empty()) {
            return dp::Result<std::string, dp::Error>::err(validation("Identifier must not be empty"));
        }
        if (id.rfind("did:", 0) == 0) {
            auto url = parseDidUrl(id);
            if (url.is_err()) {
                return dp::Result<std::string, dp::Error>::err(url.error());
            }
            if (url.value().did != document_id) {
                return dp::Result<std::string, dp::Error>::err(
                    validation("Identifier '" + id + "' does not belong to " + document_id));
            }
            if (url.value().fragment.empty()) {
                return dp::Result<std::string, dp::Error>::err(validation("Identifier '" + id + "' has no fragment"));
            }
            return dp::Result<std::string, dp::Error>::ok(id);
        }

        std::string fragment = id[0] == '#' ? id.substr(1) : id;
        if (fragment.empty() || fragment.find('#') != std::string::npos) {
            return dp::Result<std::string, dp::Error>::err(validation("Invalid fragment: '" + id + "'"));
        }
        return dp::Result<std::string, dp::Error>::ok(document_id + "#" + fragment);
    }

    dp::Result<VerificationMethod, dp::Error> IdentityConnector::signingMethod(const DidDocument &document,
                                                                               const std::string &method_id) const {
        auto entry = document.findEntry(method_id);
        if (entry.is_err()) {
            return dp::Result<VerificationMethod, dp::Error>::err(not_found("methodMissing", method_id));
        }
        if (entry.value().is_reference || !entry.value().method.hasPublicKeyJwk()) {
            return dp::Result<VerificationMethod, dp::Error>::err(general_error("publicKeyJwkMissing", method_id));
        }
        return dp::Result<VerificationMethod, dp::Error>::ok(entry.value().method);
    }

    dp::Result<Ed25519KeyPair, dp::Error> IdentityConnector::signingKey(const VerificationMethod &method) const {
        auto public_key = method.public_key_jwk.publicKeyBytes();
        if (public_key.is_err()) {
            return dp::Result<Ed25519KeyPair, dp::Error>::err(public_key.error());
        }
        auto key = vault_->getKey(method.getId());
        if (key.is_err()) {
            return dp::Result<Ed25519KeyPair, dp::Error>::err(key.error());
        }
        return Ed25519KeyPair::fromPrivateKey(key.value().private_key, public_key.value());
    }

    dp::Result<CredentialCheck, dp::Error> IdentityConnector::checkCredential(const std::string &credential_jwt,
                                                                              DidDocument *issuer_out) const {
        auto decoded = jwt::decode(credential_jwt);
        if (decoded.is_err()) {
            return dp::Result<CredentialCheck, dp::Error>::err(decoded.error());
        }
        std::string issuer_id = stringMember(decoded.value().payload, "iss");
        if (issuer_id.empty()) {
            return dp::Result<CredentialCheck, dp::Error>::err(jwt_malformed("Credential JWT has no iss claim"));
        }

        auto issuer = loadDocument(issuer_id);
        if (issuer.is_err()) {
            return dp::Result<CredentialCheck, dp::Error>::err(issuer.error());
        }
        auto verified = verifyJwt(issuer.value().document, decoded.value());
        if (verified.is_err()) {
            return dp::Result<CredentialCheck, dp::Error>::err(verified.error());
        }

        auto credential = VerifiableCredential::fromJwtClaims(decoded.value().payload);
        if (credential.is_err()) {
            return dp::Result<CredentialCheck, dp::Error>::err(credential.error());
        }
        auto revoked = isRevoked(issuer.value().document, credential.value().credential_status);
        if (revoked.is_err()) {
            return dp::Result<CredentialCheck, dp::Error>::err(revoked.error());
        }

        CredentialCheck check;
        check.revoked = revoked.value();
        if (!check.revoked) {
            check.verifiable_credential = std::move(credential.value());
        }
        if (issuer_out != nullptr) {
            *issuer_out = std::move(issuer.value().document);
        }
        return dp::Result<CredentialCheck, dp::Error>::ok(std::move(check));
    }

    dp::Result<void, dp::Error> IdentityConnector::verifyJwt(const DidDocument &document,
                                                             const jwt::DecodedJwt &decoded) const {
        std::string kid = stringMember(decoded.header, "kid");
        if (kid.empty()) {
            return dp::Result<void, dp::Error>::err(jwt_malformed("JWT header has no kid"));
        }
        auto method = signingMethod(document, kid);
        if (method.is_err()) {
            return dp::Result<void, dp::Error>::err(method.error());
        }
        auto public_key = method.value().public_key_jwk.publicKeyBytes();
        if (public_key.is_err()) {
            return dp::Result<void, dp::Error>::err(public_key.error());
        }
        if (!jwt::verify(decoded, public_key.value())) {
            std::cout << "Signature verification failed for " << kid << std::endl;
            return dp::Result<void, dp::Error>::err(signature_invalid("signatureInvalid: " + kid));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<RevocationBitmap, dp::Error> IdentityConnector::readRevocationBitmap(const DidDocument &document) const {
        auto service = document.findServiceBySuffix(REVOCATION_SUFFIX);
        if (service.is_err()) {
            return dp::Result<RevocationBitmap, dp::Error>::err(
                not_found("revocationServiceMissing", document.getId()));
        }
        if (service.value().getTypeString() != REVOCATION_SERVICE_TYPE) {
            return dp::Result<RevocationBitmap, dp::Error>::err(
                decode_failed("Revocation service has type '" + service.value().getTypeString() + "'"));
        }
        return RevocationBitmap::fromDataUri(service.value().getServiceEndpoint(), config_.revocation_bitmap_bits);
    }

    dp::Result<bool, dp::Error> IdentityConnector::isRevoked(const DidDocument &issuer,
                                                             const std::optional<CredentialStatus> &status) const {
        if (!status.has_value()) {
            return dp::Result<bool, dp::Error>::ok(false);
        }
        auto index = status->index();
        if (index.is_err()) {
            return dp::Result<bool, dp::Error>::err(index.error());
        }

        auto bitmap = readRevocationBitmap(issuer);
        if (bitmap.is_err()) {
            if (bitmap.error().code == ERR_NOT_FOUND) {
                // No revocation list left on the issuer, nothing can be revoked
                return dp::Result<bool, dp::Error>::ok(false);
            }
            return dp::Result<bool, dp::Error>::err(bitmap.error());
        }
        return bitmap.value().getBit(index.value());
    }

    dp::Result<void, dp::Error> IdentityConnector::setRevocation(const std::string &operation,
                                                                 const std::string &document_id,
                                                                 const std::vector<dp::i64> &indices, bool revoked) {
        if (document_id.empty()) {
            return dp::Result<void, dp::Error>::err(validation("documentId must not be empty"));
        }
        if (indices.empty()) {
            return dp::Result<void, dp::Error>::err(validation("credentialIndices must not be empty"));
        }
        for (auto index : indices) {
            if (index < 0 || static_cast<dp::u64>(index) >= config_.revocation_bitmap_bits) {
                return dp::Result<void, dp::Error>::err(
                    validation("Revocation index out of range: " + std::to_string(index)));
            }
        }

        auto loaded = loadDocument(document_id);
        if (loaded.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed(operation, loaded.error()));
        }
        LoadedDocument &current = loaded.value();

        auto bitmap = readRevocationBitmap(current.document);
        if (bitmap.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed(operation, bitmap.error()));
        }
        for (auto index : indices) {
            auto set = bitmap.value().setBit(index, revoked);
            if (set.is_err()) {
                return dp::Result<void, dp::Error>::err(set.error());
            }
        }
        auto uri = bitmap.value().toDataUri();
        if (uri.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed(operation, uri.error()));
        }

        Service service = current.document.findServiceBySuffix(REVOCATION_SUFFIX).value();
        service.setServiceEndpoint(uri.value());
        current.document.addService(service);

        auto stored = storeDocument(current.document, current.controller, current.version);
        if (stored.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed(operation, stored.error()));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    std::string IdentityConnector::tempKeyId(const std::string &scope) {
        std::random_device rd;
        Bytes suffix(16);
        for (auto &b : suffix) {
            b = static_cast<uint8_t>(rd() & 0xff);
        }
        return scope + "/temp-" + toHex(suffix);
    }

    void IdentityConnector::discardKey(const std::string &key_id) {
        auto removed = vault_->removeKey(key_id);
        if (removed.is_err()) {
            std::cout << "Failed to remove vault key " << key_id << ": " << errorMessage(removed.error()) << std::endl;
        }
    }

    void IdentityConnector::restoreKey(const std::string &parked_id, const std::string &key_id) {
        auto restored = vault_->renameKey(parked_id, key_id);
        if (restored.is_err()) {
            std::cout << "Failed to restore vault key " << key_id << ": " << errorMessage(restored.error())
                      << std::endl;
        }
    }

} // namespace credo
