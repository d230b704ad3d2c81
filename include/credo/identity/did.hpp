#pragma once

#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <credo/crypto/hash.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    /// DID (Decentralized Identifier) following W3C DID Core v1.0
    /// Format: did:<method>:<method-specific-id>
    class Did {
      public:
        static constexpr const char *SCHEME = "did";

        Did() = default;

        /// Parse a DID string; fragment, query and path are dropped
        inline static dp::Result<Did, dp::Error> parse(const std::string &did_string) {
            if (did_string.size() < 4 || did_string.substr(0, 4) != "did:") {
                return dp::Result<Did, dp::Error>::err(validation("Invalid DID: must start with 'did:'"));
            }

            size_t second_colon = did_string.find(':', 4);
            if (second_colon == std::string::npos || second_colon == 4) {
                return dp::Result<Did, dp::Error>::err(validation("Invalid DID: missing method"));
            }

            std::string method = did_string.substr(4, second_colon - 4);
            std::string method_specific_id = did_string.substr(second_colon + 1);

            size_t cut = method_specific_id.find_first_of("#?/");
            if (cut != std::string::npos) {
                method_specific_id = method_specific_id.substr(0, cut);
            }
            if (method_specific_id.empty()) {
                return dp::Result<Did, dp::Error>::err(validation("Invalid DID: missing method-specific-id"));
            }

            Did did;
            did.method_ = dp::String(method.c_str());
            did.method_specific_id_ = dp::String(method_specific_id.c_str());
            return dp::Result<Did, dp::Error>::ok(did);
        }

        /// Content derived DID: did:<method>:0x<hex sha256(public key)>
        inline static dp::Result<Did, dp::Error> fromPublicKey(const std::string &method, const Bytes &public_key) {
            auto digest = sha256(public_key);
            if (digest.is_err()) {
                return dp::Result<Did, dp::Error>::err(digest.error());
            }
            Did did;
            did.method_ = dp::String(method.c_str());
            did.method_specific_id_ = dp::String(("0x" + toHex(digest.value())).c_str());
            return dp::Result<Did, dp::Error>::ok(did);
        }

        inline std::string toString() const {
            return std::string(SCHEME) + ":" + std::string(method_.c_str()) + ":" +
                   std::string(method_specific_id_.c_str());
        }

        inline std::string getMethod() const { return std::string(method_.c_str()); }
        inline std::string getMethodSpecificId() const { return std::string(method_specific_id_.c_str()); }

        /// did:<method>:xxx#fragment
        inline std::string withFragment(const std::string &fragment) const { return toString() + "#" + fragment; }

        inline bool isEmpty() const { return method_specific_id_.empty(); }

        inline bool operator==(const Did &other) const { return toString() == other.toString(); }
        inline bool operator!=(const Did &other) const { return !(*this == other); }

        /// Serialization
        auto members() { return std::tie(method_, method_specific_id_); }
        auto members() const { return std::tie(method_, method_specific_id_); }

      private:
        dp::String method_;
        dp::String method_specific_id_;
    };

    /// A DID URL split at its fragment
    struct DidUrl {
        std::string did;
        std::string fragment; // empty when the URL has none
    };

    inline dp::Result<DidUrl, dp::Error> parseDidUrl(const std::string &url) {
        size_t hash = url.find('#');
        std::string base = hash == std::string::npos ? url : url.substr(0, hash);

        auto parsed = Did::parse(base);
        if (parsed.is_err()) {
            return dp::Result<DidUrl, dp::Error>::err(parsed.error());
        }

        DidUrl result;
        result.did = base;
        if (hash != std::string::npos) {
            result.fragment = url.substr(hash + 1);
        }
        return dp::Result<DidUrl, dp::Error>::ok(std::move(result));
    }

} // namespace credo
