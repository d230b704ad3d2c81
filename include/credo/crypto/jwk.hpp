#pragma once

#include "hash.hpp"
#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    /// Public Ed25519 key as a JSON Web Key (RFC 8037 OKP)
    struct Jwk {
        dp::String kty = dp::String("OKP");
        dp::String crv = dp::String("Ed25519");
        dp::String alg = dp::String("EdDSA");
        dp::String x;   // base64url public key
        dp::String kid; // optional

        Jwk() = default;

        inline static Jwk fromEd25519(const Bytes &public_key) {
            Jwk jwk;
            jwk.x = dp::String(base64UrlEncode(public_key).c_str());
            return jwk;
        }

        /// base64url(SHA-256(canonical {alg, crv, kty, x}))
        inline dp::Result<std::string, dp::Error> computeKid() const {
            Json::Value params(Json::objectValue);
            params["alg"] = std::string(alg.c_str());
            params["crv"] = std::string(crv.c_str());
            params["kty"] = std::string(kty.c_str());
            params["x"] = std::string(x.c_str());

            auto digest = sha256(canonicalize(params));
            if (digest.is_err()) {
                return dp::Result<std::string, dp::Error>::err(digest.error());
            }
            return dp::Result<std::string, dp::Error>::ok(base64UrlEncode(digest.value()));
        }

        /// Decoded `x`; must be a 32-byte Ed25519 key
        inline dp::Result<Bytes, dp::Error> publicKeyBytes() const {
            if (std::string(kty.c_str()) != "OKP" || std::string(crv.c_str()) != "Ed25519") {
                return dp::Result<Bytes, dp::Error>::err(validation("JWK is not an Ed25519 OKP key"));
            }
            auto decoded = base64UrlDecode(std::string(x.c_str()));
            if (decoded.is_err()) {
                return decoded;
            }
            if (decoded.value().size() != 32) {
                return dp::Result<Bytes, dp::Error>::err(validation("JWK x must be a 32-byte Ed25519 key"));
            }
            return decoded;
        }

        inline bool hasKey() const { return !x.empty(); }

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["kty"] = std::string(kty.c_str());
            json["crv"] = std::string(crv.c_str());
            json["alg"] = std::string(alg.c_str());
            json["x"] = std::string(x.c_str());
            if (!kid.empty()) {
                json["kid"] = std::string(kid.c_str());
            }
            return json;
        }

        inline static dp::Result<Jwk, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject()) {
                return dp::Result<Jwk, dp::Error>::err(validation("JWK must be a JSON object"));
            }
            Jwk jwk;
            jwk.kty = dp::String(stringMember(json, "kty").c_str());
            jwk.crv = dp::String(stringMember(json, "crv").c_str());
            jwk.alg = dp::String(stringMember(json, "alg").c_str());
            jwk.x = dp::String(stringMember(json, "x").c_str());
            jwk.kid = dp::String(stringMember(json, "kid").c_str());
            return dp::Result<Jwk, dp::Error>::ok(std::move(jwk));
        }

        inline bool operator==(const Jwk &other) const {
            return std::string(x.c_str()) == std::string(other.x.c_str()) &&
                   std::string(kid.c_str()) == std::string(other.kid.c_str());
        }

        /// Serialization
        auto members() { return std::tie(kty, crv, alg, x, kid); }
        auto members() const { return std::tie(kty, crv, alg, x, kid); }
    };

} // namespace credo
