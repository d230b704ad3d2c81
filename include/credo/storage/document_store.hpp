#pragma once

#include <credo/common/error.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>

namespace credo {

    /// Persisted form of a DID document.
    /// `document` is the canonical JSON, `signature` the base64 Ed25519 signature over it
    /// made with the document's integrity key.
    struct IdentityDocumentRecord {
        dp::String id;
        dp::String document;
        dp::String signature;
        dp::String controller;
        dp::u64 version{0};

        IdentityDocumentRecord() = default;

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getDocument() const { return std::string(document.c_str()); }
        inline std::string getSignature() const { return std::string(signature.c_str()); }
        inline std::string getController() const { return std::string(controller.c_str()); }

        /// Serialize to binary using datapod
        inline dp::ByteBuf serialize() const {
            auto &self = const_cast<IdentityDocumentRecord &>(*this);
            return dp::serialize<dp::Mode::WITH_VERSION>(self);
        }

        inline static dp::Result<IdentityDocumentRecord, dp::Error> deserialize(const dp::u8 *data, dp::usize size) {
            try {
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, IdentityDocumentRecord>(data, size);
                return dp::Result<IdentityDocumentRecord, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<IdentityDocumentRecord, dp::Error>::err(
                    decode_failed(std::string("Invalid document record: ") + e.what()));
            }
        }

        /// Serialization
        auto members() { return std::tie(id, document, signature, controller, version); }
        auto members() const { return std::tie(id, document, signature, controller, version); }
    };

    /// Document persistence with optimistic concurrency.
    /// set() succeeds only if the stored version equals `expected_version` (0 = not stored yet);
    /// the record is written with version expected_version + 1, which is returned.
    class DocumentStore {
      public:
        virtual ~DocumentStore() = default;

        virtual dp::Result<std::optional<IdentityDocumentRecord>, dp::Error> get(const std::string &id) const = 0;

        virtual dp::Result<dp::u64, dp::Error> set(const IdentityDocumentRecord &record, dp::u64 expected_version) = 0;
    };

} // namespace credo
