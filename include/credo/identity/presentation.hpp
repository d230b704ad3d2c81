#pragma once

#include "credential.hpp"
#include <algorithm>
#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace credo {

    constexpr const char *VERIFIABLE_PRESENTATION_TYPE = "VerifiablePresentation";

    /// W3C Verifiable Presentation bundling credential JWTs.
    /// JWT payload: {iss = holder, nbf, jti?, exp?, vp: {@context, type, verifiableCredential}}
    class VerifiablePresentation {
      public:
        std::vector<std::string> contexts;
        std::string id; // empty when the presentation has none
        std::vector<std::string> types;
        std::vector<std::string> verifiable_credentials; // compact credential JWTs
        std::string holder;

        VerifiablePresentation() = default;

        inline static VerifiablePresentation build(const std::string &holder,
                                                   const std::optional<std::string> &presentation_id,
                                                   const std::vector<std::string> &extra_contexts,
                                                   const std::vector<std::string> &extra_types,
                                                   const std::vector<std::string> &credential_jwts) {
            VerifiablePresentation vp;
            vp.contexts.push_back(VC_CONTEXT_V2);
            for (const auto &ctx : extra_contexts) {
                if (std::find(vp.contexts.begin(), vp.contexts.end(), ctx) == vp.contexts.end()) {
                    vp.contexts.push_back(ctx);
                }
            }
            vp.types.push_back(VERIFIABLE_PRESENTATION_TYPE);
            for (const auto &t : extra_types) {
                if (t != VERIFIABLE_PRESENTATION_TYPE) {
                    vp.types.push_back(t);
                }
            }
            if (presentation_id.has_value()) {
                vp.id = *presentation_id;
            }
            vp.verifiable_credentials = credential_jwts;
            vp.holder = holder;
            return vp;
        }

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["@context"] = stringOrArray(contexts);
            if (!id.empty()) {
                json["id"] = id;
            }
            json["type"] = typesJson();
            json["verifiableCredential"] = credentialsJson();
            json["holder"] = holder;
            return json;
        }

        inline static dp::Result<VerifiablePresentation, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject()) {
                return dp::Result<VerifiablePresentation, dp::Error>::err(
                    decode_failed("Verifiable presentation must be a JSON object"));
            }
            const Json::Value &credentials = json["verifiableCredential"];
            if (!credentials.isNull() && !credentials.isArray()) {
                return dp::Result<VerifiablePresentation, dp::Error>::err(
                    decode_failed("verifiableCredential must be an array"));
            }

            VerifiablePresentation vp;
            vp.contexts = readStringOrArray(json["@context"]);
            vp.id = stringMember(json, "id");
            vp.types = readStringOrArray(json["type"]);
            for (const auto &item : credentials) {
                if (!item.isString()) {
                    return dp::Result<VerifiablePresentation, dp::Error>::err(
                        decode_failed("verifiableCredential entries must be JWT strings"));
                }
                vp.verifiable_credentials.push_back(item.asString());
            }
            vp.holder = stringMember(json, "holder");
            return dp::Result<VerifiablePresentation, dp::Error>::ok(std::move(vp));
        }

        inline Json::Value toJwtClaims(dp::i64 not_before, const std::optional<dp::i64> &expires_at) const {
            Json::Value vp(Json::objectValue);
            vp["@context"] = stringOrArray(contexts);
            vp["type"] = typesJson();
            vp["verifiableCredential"] = credentialsJson();

            Json::Value payload(Json::objectValue);
            payload["iss"] = holder;
            payload["nbf"] = static_cast<Json::Int64>(not_before);
            if (!id.empty()) {
                payload["jti"] = id;
            }
            if (expires_at.has_value()) {
                payload["exp"] = static_cast<Json::Int64>(*expires_at);
            }
            payload["vp"] = vp;
            return payload;
        }

        inline static dp::Result<VerifiablePresentation, dp::Error> fromJwtClaims(const Json::Value &payload) {
            if (!payload["vp"].isObject()) {
                return dp::Result<VerifiablePresentation, dp::Error>::err(decode_failed("JWT has no vp claim"));
            }
            auto parsed = fromJson(payload["vp"]);
            if (parsed.is_err()) {
                return parsed;
            }
            VerifiablePresentation vp = std::move(parsed.value());
            vp.id = stringMember(payload, "jti");
            vp.holder = stringMember(payload, "iss");
            return dp::Result<VerifiablePresentation, dp::Error>::ok(std::move(vp));
        }

      private:
        inline Json::Value typesJson() const {
            Json::Value arr(Json::arrayValue);
            for (const auto &t : types) {
                arr.append(t);
            }
            return arr;
        }

        inline Json::Value credentialsJson() const {
            Json::Value arr(Json::arrayValue);
            for (const auto &jwt : verifiable_credentials) {
                arr.append(jwt);
            }
            return arr;
        }
    };

} // namespace credo
