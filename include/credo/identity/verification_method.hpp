#pragma once

#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <credo/crypto/jwk.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    /// Verification relationships of a DID document.
    /// VerificationMethod is the plain `verificationMethod` array.
    enum class VerificationPurpose : dp::u8 {
        VerificationMethod = 0,
        Authentication = 1,
        AssertionMethod = 2,
        KeyAgreement = 3,
        CapabilityInvocation = 4,
        CapabilityDelegation = 5,
    };

    constexpr VerificationPurpose ALL_PURPOSES[] = {
        VerificationPurpose::VerificationMethod,   VerificationPurpose::Authentication,
        VerificationPurpose::AssertionMethod,      VerificationPurpose::KeyAgreement,
        VerificationPurpose::CapabilityInvocation, VerificationPurpose::CapabilityDelegation,
    };

    /// JSON property name of the purpose array
    inline std::string verificationPurposeToString(VerificationPurpose purpose) {
        switch (purpose) {
        case VerificationPurpose::VerificationMethod:
            return "verificationMethod";
        case VerificationPurpose::Authentication:
            return "authentication";
        case VerificationPurpose::AssertionMethod:
            return "assertionMethod";
        case VerificationPurpose::KeyAgreement:
            return "keyAgreement";
        case VerificationPurpose::CapabilityInvocation:
            return "capabilityInvocation";
        case VerificationPurpose::CapabilityDelegation:
            return "capabilityDelegation";
        default:
            return "unknown";
        }
    }

    inline dp::Result<VerificationPurpose, dp::Error> parseVerificationPurpose(const std::string &name) {
        for (auto purpose : ALL_PURPOSES) {
            if (verificationPurposeToString(purpose) == name) {
                return dp::Result<VerificationPurpose, dp::Error>::ok(purpose);
            }
        }
        return dp::Result<VerificationPurpose, dp::Error>::err(
            validation("Invalid verification method type: '" + name + "'"));
    }

    /// A verification method carrying its public key as a JWK
    struct VerificationMethod {
        static constexpr const char *JSON_WEB_KEY = "JsonWebKey";

        dp::String id;         // e.g., "did:entity-storage:0x..#key-1"
        dp::String controller; // document id
        dp::String type = dp::String(JSON_WEB_KEY);
        Jwk public_key_jwk;    // empty x when the method carries no JWK

        VerificationMethod() = default;

        inline VerificationMethod(const std::string &id, const std::string &controller, const Jwk &jwk)
            : id(dp::String(id.c_str())), controller(dp::String(controller.c_str())), type(dp::String(JSON_WEB_KEY)),
              public_key_jwk(jwk) {}

        inline std::string getId() const { return std::string(id.c_str()); }
        inline std::string getController() const { return std::string(controller.c_str()); }
        inline std::string getType() const { return std::string(type.c_str()); }
        inline bool hasPublicKeyJwk() const { return public_key_jwk.hasKey(); }

        /// Fragment after '#', empty when the id has none
        inline std::string getFragment() const {
            std::string full = getId();
            size_t pos = full.find('#');
            return pos == std::string::npos ? std::string() : full.substr(pos + 1);
        }

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["id"] = getId();
            json["controller"] = getController();
            json["type"] = getType();
            if (hasPublicKeyJwk()) {
                json["publicKeyJwk"] = public_key_jwk.toJson();
            }
            return json;
        }

        inline static dp::Result<VerificationMethod, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject() || stringMember(json, "id").empty()) {
                return dp::Result<VerificationMethod, dp::Error>::err(
                    decode_failed("Verification method must be an object with an id"));
            }
            VerificationMethod vm;
            vm.id = dp::String(stringMember(json, "id").c_str());
            vm.controller = dp::String(stringMember(json, "controller").c_str());
            vm.type = dp::String(stringMember(json, "type").c_str());
            if (json.isMember("publicKeyJwk")) {
                auto jwk = Jwk::fromJson(json["publicKeyJwk"]);
                if (jwk.is_err()) {
                    return dp::Result<VerificationMethod, dp::Error>::err(jwk.error());
                }
                vm.public_key_jwk = jwk.value();
            }
            return dp::Result<VerificationMethod, dp::Error>::ok(std::move(vm));
        }

        inline bool operator==(const VerificationMethod &other) const {
            return getId() == other.getId() && getController() == other.getController() &&
                   public_key_jwk == other.public_key_jwk;
        }

        inline bool operator!=(const VerificationMethod &other) const { return !(*this == other); }

        /// Serialization
        auto members() { return std::tie(id, controller, type, public_key_jwk); }
        auto members() const { return std::tie(id, controller, type, public_key_jwk); }
    };

} // namespace credo
