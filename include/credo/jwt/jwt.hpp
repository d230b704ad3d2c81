#pragma once

#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <credo/crypto/ed25519.hpp>
#include <datapod/datapod.hpp>
#include <functional>
#include <string>

namespace credo::jwt {

    constexpr const char *ALG_EDDSA = "EdDSA";
    constexpr const char *TYP_JWT = "JWT";

    /// Signs the JWT signing input ("<header>.<payload>")
    using Signer = std::function<dp::Result<Bytes, dp::Error>(const Bytes &)>;

    struct DecodedJwt {
        Json::Value header;
        Json::Value payload;
        Bytes signature;
        std::string signing_input; // exactly as it appeared in the token
    };

    /// {kid, typ: "JWT", alg: "EdDSA"}
    inline Json::Value makeHeader(const std::string &kid) {
        Json::Value header(Json::objectValue);
        header["kid"] = kid;
        header["typ"] = TYP_JWT;
        header["alg"] = ALG_EDDSA;
        return header;
    }

    inline std::string signingInput(const Json::Value &header, const Json::Value &payload) {
        return base64UrlEncode(stringToBytes(canonicalize(header))) + "." +
               base64UrlEncode(stringToBytes(canonicalize(payload)));
    }

    inline dp::Result<std::string, dp::Error> encode(const Json::Value &header, const Json::Value &payload,
                                                     const Signer &signer) {
        if (!header.isObject() || !payload.isObject()) {
            return dp::Result<std::string, dp::Error>::err(validation("JWT header and payload must be objects"));
        }
        std::string input = signingInput(header, payload);
        auto signature = signer(stringToBytes(input));
        if (signature.is_err()) {
            return dp::Result<std::string, dp::Error>::err(signature.error());
        }
        return dp::Result<std::string, dp::Error>::ok(input + "." + base64UrlEncode(signature.value()));
    }

    inline dp::Result<std::string, dp::Error> encode(const Json::Value &header, const Json::Value &payload,
                                                     const Ed25519KeyPair &key) {
        return encode(header, payload, [&key](const Bytes &input) { return key.sign(input); });
    }

    /// Split and decode a compact JWT. Structural problems are ERR_JWT_MALFORMED;
    /// the signature is not checked here.
    inline dp::Result<DecodedJwt, dp::Error> decode(const std::string &token) {
        size_t first = token.find('.');
        size_t second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
        if (first == std::string::npos || second == std::string::npos ||
            token.find('.', second + 1) != std::string::npos) {
            return dp::Result<DecodedJwt, dp::Error>::err(jwt_malformed("JWT must have three segments"));
        }

        auto header_bytes = base64UrlDecode(token.substr(0, first));
        auto payload_bytes = base64UrlDecode(token.substr(first + 1, second - first - 1));
        auto signature = base64UrlDecode(token.substr(second + 1));
        if (header_bytes.is_err() || payload_bytes.is_err() || signature.is_err()) {
            return dp::Result<DecodedJwt, dp::Error>::err(jwt_malformed("JWT segment is not base64url"));
        }

        auto header = parseJson(bytesToString(header_bytes.value()));
        auto payload = parseJson(bytesToString(payload_bytes.value()));
        if (header.is_err() || payload.is_err() || !header.value().isObject() || !payload.value().isObject()) {
            return dp::Result<DecodedJwt, dp::Error>::err(jwt_malformed("JWT header and payload must be JSON objects"));
        }

        DecodedJwt decoded;
        decoded.header = std::move(header.value());
        decoded.payload = std::move(payload.value());
        decoded.signature = std::move(signature.value());
        decoded.signing_input = token.substr(0, second);
        return dp::Result<DecodedJwt, dp::Error>::ok(std::move(decoded));
    }

    /// Verify against the signing input carried by the token
    inline bool verify(const DecodedJwt &decoded, const Bytes &public_key) {
        if (stringMember(decoded.header, "alg") != ALG_EDDSA) {
            return false;
        }
        return ed25519Verify(public_key, stringToBytes(decoded.signing_input), decoded.signature);
    }

    /// Verify by re-encoding header and payload canonically
    inline bool verifySignature(const Json::Value &header, const Json::Value &payload, const Bytes &signature,
                                const Bytes &public_key) {
        return ed25519Verify(public_key, stringToBytes(signingInput(header, payload)), signature);
    }

} // namespace credo::jwt
