#pragma once

#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    constexpr const char *PROOF_TYPE_ED25519 = "Ed25519";

    /// Raw signature over caller supplied bytes
    struct Proof {
        std::string type = PROOF_TYPE_ED25519;
        Bytes value;

        /// {type, value: base58(signature)}
        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["type"] = type;
            json["value"] = base58Encode(value);
            return json;
        }

        inline static dp::Result<Proof, dp::Error> fromJson(const Json::Value &json) {
            std::string encoded = stringMember(json, "value");
            if (encoded.empty()) {
                return dp::Result<Proof, dp::Error>::err(decode_failed("Proof has no value"));
            }
            auto decoded = base58Decode(encoded);
            if (decoded.is_err()) {
                return dp::Result<Proof, dp::Error>::err(decoded.error());
            }
            Proof proof;
            proof.type = stringMember(json, "type");
            proof.value = std::move(decoded.value());
            return dp::Result<Proof, dp::Error>::ok(std::move(proof));
        }
    };

    /// W3C data integrity proof (eddsa-jcs-2022 cryptosuite)
    struct DataIntegrityProof {
        static constexpr const char *TYPE = "DataIntegrityProof";
        static constexpr const char *CRYPTOSUITE = "eddsa-jcs-2022";
        static constexpr const char *ASSERTION_METHOD = "assertionMethod";

        std::string type = TYPE;
        std::string cryptosuite = CRYPTOSUITE;
        std::string created;
        std::string verification_method;
        std::string proof_purpose = ASSERTION_METHOD;
        std::string proof_value; // base58

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["type"] = type;
            json["cryptosuite"] = cryptosuite;
            json["created"] = created;
            json["verificationMethod"] = verification_method;
            json["proofPurpose"] = proof_purpose;
            json["proofValue"] = proof_value;
            return json;
        }

        inline static dp::Result<DataIntegrityProof, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject()) {
                return dp::Result<DataIntegrityProof, dp::Error>::err(decode_failed("Proof must be a JSON object"));
            }
            DataIntegrityProof proof;
            proof.type = stringMember(json, "type");
            proof.cryptosuite = stringMember(json, "cryptosuite");
            proof.created = stringMember(json, "created");
            proof.verification_method = stringMember(json, "verificationMethod");
            proof.proof_purpose = stringMember(json, "proofPurpose");
            proof.proof_value = stringMember(json, "proofValue");
            return dp::Result<DataIntegrityProof, dp::Error>::ok(std::move(proof));
        }
    };

} // namespace credo
