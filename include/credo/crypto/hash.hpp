#pragma once

#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>

namespace credo {

    /// SHA-256 digest using keylock
    inline dp::Result<Bytes, dp::Error> sha256(const Bytes &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto hash_result = crypto.hash(data);
        if (!hash_result.success) {
            return dp::Result<Bytes, dp::Error>::err(crypto_failed("SHA-256 failed: " + hash_result.error_message));
        }
        return dp::Result<Bytes, dp::Error>::ok(hash_result.data);
    }

    inline dp::Result<Bytes, dp::Error> sha256(const std::string &data) { return sha256(stringToBytes(data)); }

} // namespace credo
