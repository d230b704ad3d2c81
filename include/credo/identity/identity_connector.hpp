#pragma once

#include "config.hpp"
#include "credential.hpp"
#include "did_document.hpp"
#include "presentation.hpp"
#include "proof.hpp"
#include <credo/crypto/ed25519.hpp>
#include <credo/jwt/jwt.hpp>
#include <credo/revocation/bitmap.hpp>
#include <credo/storage/document_store.hpp>
#include <credo/vault/vault.hpp>
#include <datapod/datapod.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace credo {

    /// Issued credential with its compact JWT
    struct CredentialResult {
        VerifiableCredential verifiable_credential;
        std::string jwt;
    };

    /// Outcome of checking a credential JWT. A revoked credential is returned without its body.
    struct CredentialCheck {
        bool revoked{false};
        std::optional<VerifiableCredential> verifiable_credential;
    };

    struct PresentationResult {
        VerifiablePresentation verifiable_presentation;
        std::string jwt;
    };

    /// Outcome of checking a presentation JWT.
    /// `revoked` is set when any embedded credential is revoked; `issuers` holds each distinct issuer once.
    struct PresentationCheck {
        bool revoked{false};
        std::optional<VerifiablePresentation> verifiable_presentation;
        std::vector<DidDocument> issuers;
    };

    /// DID documents, credentials, presentations and proofs over an injected document store and vault.
    ///
    /// Vault key layout:
    ///   <did>/did          integrity key, signs the stored document record
    ///   <did>#<fragment>   verification method key
    ///
    /// Validation and NotFound errors reach the caller unchanged; other failures are wrapped
    /// as ERR_OPERATION_FAILED "<operation>Failed: <cause>". Revocation is a result, never an error.
    class IdentityConnector {
      public:
        IdentityConnector(std::shared_ptr<DocumentStore> store, std::shared_ptr<Vault> vault,
                          IdentityConnectorConfig config = IdentityConnectorConfig{});

        // === Documents ===

        /// New document with a content derived id and an empty revocation list
        dp::Result<DidDocument, dp::Error> createDocument(const std::string &controller);

        /// Load a document, checking its integrity signature
        dp::Result<DidDocument, dp::Error> resolveDocument(const std::string &document_id) const;

        /// Create a key and register it under `purpose` as <document_id>#<explicit_id ?? kid>.
        /// A method with the same id is replaced.
        dp::Result<VerificationMethod, dp::Error>
        addVerificationMethod(const std::string &document_id, const std::string &purpose,
                              const std::optional<std::string> &explicit_id = std::nullopt);

        /// Remove a method from the document. The vault key is kept.
        dp::Result<void, dp::Error> removeVerificationMethod(const std::string &document_id,
                                                             const std::string &method_id);

        dp::Result<Service, dp::Error> addService(const std::string &document_id, const std::string &service_id,
                                                  const std::vector<std::string> &types,
                                                  const std::vector<std::string> &endpoints);

        dp::Result<void, dp::Error> removeService(const std::string &document_id, const std::string &service_id);

        // === Credentials ===

        dp::Result<CredentialResult, dp::Error>
        createVerifiableCredential(const std::string &verification_method_id,
                                   const std::optional<std::string> &credential_id, const Json::Value &subject,
                                   const std::optional<dp::i64> &revocation_index = std::nullopt);

        dp::Result<CredentialCheck, dp::Error> checkVerifiableCredential(const std::string &credential_jwt) const;

        dp::Result<void, dp::Error> revokeVerifiableCredentials(const std::string &issuer_document_id,
                                                                const std::vector<dp::i64> &indices);

        dp::Result<void, dp::Error> unrevokeVerifiableCredentials(const std::string &issuer_document_id,
                                                                  const std::vector<dp::i64> &indices);

        // === Presentations ===

        dp::Result<PresentationResult, dp::Error>
        createVerifiablePresentation(const std::string &verification_method_id,
                                     const std::optional<std::string> &presentation_id,
                                     const std::vector<std::string> &contexts, const std::vector<std::string> &types,
                                     const std::vector<std::string> &credential_jwts,
                                     const std::optional<dp::i64> &expires_in_minutes = std::nullopt);

        dp::Result<PresentationCheck, dp::Error> checkVerifiablePresentation(const std::string &presentation_jwt) const;

        // === Proofs ===

        dp::Result<Proof, dp::Error> createProof(const std::string &document_id, const std::string &method_id,
                                                 const Bytes &data) const;

        dp::Result<bool, dp::Error> verifyProof(const std::string &document_id, const std::string &method_id,
                                                const Bytes &data, const std::string &signature_type,
                                                const Bytes &signature_value) const;

        dp::Result<DataIntegrityProof, dp::Error> createDataIntegrityProof(const std::string &verification_method_id,
                                                                           const Bytes &data) const;

        dp::Result<bool, dp::Error> verifyDataIntegrityProof(const Bytes &data, const DataIntegrityProof &proof) const;

        // === Diagnostics ===

        void printSummary(const std::string &document_id) const;

        inline const IdentityConnectorConfig &config() const { return config_; }

        /// Vault id of a document's integrity key
        inline static std::string integrityKeyId(const std::string &document_id) { return document_id + "/did"; }

      private:
        struct LoadedDocument {
            DidDocument document;
            std::string controller;
            dp::u64 version{0};
        };

        std::shared_ptr<DocumentStore> store_;
        std::shared_ptr<Vault> vault_;
        IdentityConnectorConfig config_;

        dp::Result<LoadedDocument, dp::Error> loadDocument(const std::string &document_id) const;

        /// Sign and write with optimistic concurrency; returns the new version
        dp::Result<dp::u64, dp::Error> storeDocument(const DidDocument &document, const std::string &controller,
                                                     dp::u64 expected_version);

        /// "key-1", "#key-1" or "<document_id>#key-1" to "<document_id>#key-1"
        dp::Result<std::string, dp::Error> qualifyId(const std::string &document_id, const std::string &id) const;

        /// Method usable for signing: inline with an Ed25519 JWK
        dp::Result<VerificationMethod, dp::Error> signingMethod(const DidDocument &document,
                                                                const std::string &method_id) const;

        dp::Result<Ed25519KeyPair, dp::Error> signingKey(const VerificationMethod &method) const;

        /// Check a credential JWT against its issuer; returns the issuer with the check
        dp::Result<CredentialCheck, dp::Error> checkCredential(const std::string &credential_jwt,
                                                               DidDocument *issuer_out) const;

        /// Verify a compact JWT signed by a method of `document`
        dp::Result<void, dp::Error> verifyJwt(const DidDocument &document, const jwt::DecodedJwt &decoded) const;

        dp::Result<RevocationBitmap, dp::Error> readRevocationBitmap(const DidDocument &document) const;

        dp::Result<bool, dp::Error> isRevoked(const DidDocument &issuer,
                                              const std::optional<CredentialStatus> &status) const;

        dp::Result<void, dp::Error> setRevocation(const std::string &operation, const std::string &document_id,
                                                  const std::vector<dp::i64> &indices, bool revoked);

        static std::string tempKeyId(const std::string &scope);

        /// Cleanup after a failed operation; failures are only logged
        void discardKey(const std::string &key_id);
        void restoreKey(const std::string &parked_id, const std::string &key_id);
    };

} // namespace credo
