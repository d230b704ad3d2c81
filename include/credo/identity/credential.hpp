#pragma once

#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace credo {

    constexpr const char *VC_CONTEXT_V2 = "https://www.w3.org/ns/credentials/v2";
    constexpr const char *VERIFIABLE_CREDENTIAL_TYPE = "VerifiableCredential";

    /// Pointer from a credential into its issuer's revocation bitmap
    struct CredentialStatus {
        std::string id;                      // issuer's "#revocation" service id
        std::string type;                    // "BitstringStatusList"
        std::string revocation_bitmap_index; // decimal string

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["id"] = id;
            json["type"] = type;
            json["revocationBitmapIndex"] = revocation_bitmap_index;
            return json;
        }

        inline static CredentialStatus fromJson(const Json::Value &json) {
            CredentialStatus status;
            status.id = stringMember(json, "id");
            status.type = stringMember(json, "type");
            const Json::Value &index = json["revocationBitmapIndex"];
            if (index.isString()) {
                status.revocation_bitmap_index = index.asString();
            } else if (index.isInt64()) {
                status.revocation_bitmap_index = std::to_string(index.asInt64());
            } else if (index.isUInt64()) {
                status.revocation_bitmap_index = std::to_string(index.asUInt64());
            }
            return status;
        }

        /// Parsed index; a non-numeric value is a decode error
        inline dp::Result<dp::i64, dp::Error> index() const {
            if (revocation_bitmap_index.empty() ||
                revocation_bitmap_index.find_first_not_of("0123456789") != std::string::npos ||
                revocation_bitmap_index.size() > 18) {
                return dp::Result<dp::i64, dp::Error>::err(
                    decode_failed("Invalid revocationBitmapIndex: '" + revocation_bitmap_index + "'"));
            }
            return dp::Result<dp::i64, dp::Error>::ok(std::stoll(revocation_bitmap_index));
        }
    };

    /// W3C Verifiable Credential, transported as an EdDSA JWT.
    /// The JWT `vc` claim only carries @context, type, credentialSubject and credentialStatus;
    /// id, issuer and issuanceDate travel as jti, iss and nbf.
    class VerifiableCredential {
      public:
        std::vector<std::string> contexts;
        std::string id; // empty when the credential has none
        std::vector<std::string> types;
        Json::Value credential_subject{Json::objectValue}; // object or array of objects
        std::optional<CredentialStatus> credential_status;
        std::string issuer;
        std::string issuance_date;

        VerifiableCredential() = default;

        /// Assemble a credential from a JSON-LD subject.
        /// "@context" and "@type"/"type" are lifted out of the subject; its id stays.
        inline static dp::Result<VerifiableCredential, dp::Error>
        build(const std::string &issuer, const std::optional<std::string> &credential_id, const Json::Value &subject,
              const std::optional<CredentialStatus> &status, dp::i64 issued_at) {
            if (!subject.isObject() && !subject.isArray()) {
                return dp::Result<VerifiableCredential, dp::Error>::err(
                    validation("Credential subject must be an object or an array of objects"));
            }
            if (subject.isArray() && subject.empty()) {
                return dp::Result<VerifiableCredential, dp::Error>::err(
                    validation("Credential subject array must not be empty"));
            }

            VerifiableCredential vc;
            vc.contexts.push_back(VC_CONTEXT_V2);
            vc.types.push_back(VERIFIABLE_CREDENTIAL_TYPE);
            vc.credential_subject = subject;

            auto lift = [&vc](Json::Value &node) -> bool {
                if (!node.isObject()) {
                    return false;
                }
                if (node.isMember("@context")) {
                    for (const auto &ctx : readStringOrArray(node["@context"])) {
                        addUnique(vc.contexts, ctx);
                    }
                    node.removeMember("@context");
                }
                for (const char *key : {"@type", "type"}) {
                    if (node.isMember(key)) {
                        for (const auto &t : readStringOrArray(node[key])) {
                            addUnique(vc.types, t);
                        }
                        node.removeMember(key);
                        break;
                    }
                }
                return true;
            };

            if (vc.credential_subject.isArray()) {
                for (auto &node : vc.credential_subject) {
                    if (!lift(node)) {
                        return dp::Result<VerifiableCredential, dp::Error>::err(
                            validation("Credential subject array must only hold objects"));
                    }
                }
            } else {
                lift(vc.credential_subject);
            }

            if (credential_id.has_value()) {
                vc.id = *credential_id;
            }
            vc.credential_status = status;
            vc.issuer = issuer;
            vc.issuance_date = isoFromSeconds(issued_at);
            return dp::Result<VerifiableCredential, dp::Error>::ok(std::move(vc));
        }

        /// Id of the (first) subject, from "@id" or "id"
        inline std::optional<std::string> subjectId() const {
            const Json::Value &first =
                credential_subject.isArray() ? credential_subject[Json::ArrayIndex(0)] : credential_subject;
            for (const char *key : {"@id", "id"}) {
                std::string value = stringMember(first, key);
                if (!value.empty()) {
                    return value;
                }
            }
            return std::nullopt;
        }

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["@context"] = stringOrArray(contexts);
            if (!id.empty()) {
                json["id"] = id;
            }
            Json::Value type_arr(Json::arrayValue);
            for (const auto &t : types) {
                type_arr.append(t);
            }
            json["type"] = type_arr;
            json["credentialSubject"] = credential_subject;
            if (credential_status.has_value()) {
                json["credentialStatus"] = credential_status->toJson();
            }
            json["issuer"] = issuer;
            json["issuanceDate"] = issuance_date;
            return json;
        }

        inline static dp::Result<VerifiableCredential, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject()) {
                return dp::Result<VerifiableCredential, dp::Error>::err(
                    decode_failed("Verifiable credential must be a JSON object"));
            }
            VerifiableCredential vc;
            vc.contexts = readStringOrArray(json["@context"]);
            vc.id = stringMember(json, "id");
            vc.types = readStringOrArray(json["type"]);
            if (json.isMember("credentialSubject")) {
                vc.credential_subject = json["credentialSubject"];
            }
            if (json["credentialStatus"].isObject()) {
                vc.credential_status = CredentialStatus::fromJson(json["credentialStatus"]);
            }
            vc.issuer = stringMember(json, "issuer");
            vc.issuance_date = stringMember(json, "issuanceDate");
            return dp::Result<VerifiableCredential, dp::Error>::ok(std::move(vc));
        }

        /// JWT payload: {iss, nbf, jti?, sub?, vc}
        inline Json::Value toJwtClaims(dp::i64 not_before) const {
            Json::Value vc(Json::objectValue);
            vc["@context"] = stringOrArray(contexts);
            Json::Value type_arr(Json::arrayValue);
            for (const auto &t : types) {
                type_arr.append(t);
            }
            vc["type"] = type_arr;

            Json::Value subject = credential_subject;
            if (subject.isArray()) {
                for (auto &node : subject) {
                    node.removeMember("id");
                }
            } else if (subject.isObject()) {
                subject.removeMember("id");
            }
            vc["credentialSubject"] = subject;
            if (credential_status.has_value()) {
                vc["credentialStatus"] = credential_status->toJson();
            }

            Json::Value payload(Json::objectValue);
            payload["iss"] = issuer;
            payload["nbf"] = static_cast<Json::Int64>(not_before);
            if (!id.empty()) {
                payload["jti"] = id;
            }
            auto sub = subjectId();
            if (sub.has_value()) {
                payload["sub"] = *sub;
            }
            payload["vc"] = vc;
            return payload;
        }

        /// Rebuild the full credential from JWT claims
        inline static dp::Result<VerifiableCredential, dp::Error> fromJwtClaims(const Json::Value &payload) {
            if (!payload["vc"].isObject()) {
                return dp::Result<VerifiableCredential, dp::Error>::err(decode_failed("JWT has no vc claim"));
            }
            auto parsed = fromJson(payload["vc"]);
            if (parsed.is_err()) {
                return parsed;
            }
            VerifiableCredential vc = std::move(parsed.value());

            vc.id = stringMember(payload, "jti");
            vc.issuer = stringMember(payload, "iss");
            if (payload.isMember("nbf")) {
                auto nbf = timestampClaim(payload, "nbf");
                if (nbf.is_err()) {
                    return dp::Result<VerifiableCredential, dp::Error>::err(nbf.error());
                }
                vc.issuance_date = isoFromSeconds(nbf.value());
            }
            std::string sub = stringMember(payload, "sub");
            if (!sub.empty()) {
                if (vc.credential_subject.isArray()) {
                    for (auto &node : vc.credential_subject) {
                        if (node.isObject()) {
                            node["id"] = sub;
                        }
                    }
                } else if (vc.credential_subject.isObject()) {
                    vc.credential_subject["id"] = sub;
                }
            }
            return dp::Result<VerifiableCredential, dp::Error>::ok(std::move(vc));
        }

      private:
        inline static void addUnique(std::vector<std::string> &list, const std::string &value) {
            for (const auto &v : list) {
                if (v == value) {
                    return;
                }
            }
            list.push_back(value);
        }
    };

} // namespace credo
