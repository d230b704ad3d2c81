#pragma once

#include <algorithm>
#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>

namespace credo {

    constexpr size_t ED25519_SEED_SIZE = 32;
    constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
    constexpr size_t ED25519_SIGNING_KEY_SIZE = 64;
    constexpr size_t ED25519_SIGNATURE_SIZE = 64;

    /// Ed25519 keypair kept as {seed, public key}.
    /// Signing needs the 64-byte expanded form (seed || public key), see toSigningKey().
    class Ed25519KeyPair {
      public:
        Ed25519KeyPair() = default;

        /// Generate new keypair using keylock
        inline static dp::Result<Ed25519KeyPair, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty()) {
                return dp::Result<Ed25519KeyPair, dp::Error>::err(crypto_failed("Failed to generate keypair"));
            }
            return fromPrivateKey(keypair.private_key, keypair.public_key);
        }

        /// Private key may be the 32-byte seed or the 64-byte expanded key
        inline static dp::Result<Ed25519KeyPair, dp::Error> fromPrivateKey(const Bytes &private_key,
                                                                           const Bytes &public_key) {
            if (public_key.size() != ED25519_PUBLIC_KEY_SIZE) {
                return dp::Result<Ed25519KeyPair, dp::Error>::err(validation("Ed25519 public key must be 32 bytes"));
            }
            if (private_key.size() != ED25519_SEED_SIZE && private_key.size() != ED25519_SIGNING_KEY_SIZE) {
                return dp::Result<Ed25519KeyPair, dp::Error>::err(
                    validation("Ed25519 private key must be 32 or 64 bytes"));
            }
            if (private_key.size() == ED25519_SIGNING_KEY_SIZE &&
                !std::equal(public_key.begin(), public_key.end(), private_key.begin() + ED25519_SEED_SIZE)) {
                return dp::Result<Ed25519KeyPair, dp::Error>::err(
                    validation("Ed25519 expanded private key does not match public key"));
            }

            Ed25519KeyPair pair;
            pair.seed_.assign(private_key.begin(), private_key.begin() + ED25519_SEED_SIZE);
            pair.public_key_ = public_key;
            return dp::Result<Ed25519KeyPair, dp::Error>::ok(std::move(pair));
        }

        /// seed || public key
        inline Bytes toSigningKey() const {
            Bytes signing_key;
            signing_key.reserve(ED25519_SIGNING_KEY_SIZE);
            signing_key.insert(signing_key.end(), seed_.begin(), seed_.end());
            signing_key.insert(signing_key.end(), public_key_.begin(), public_key_.end());
            return signing_key;
        }

        inline dp::Result<Bytes, dp::Error> sign(const Bytes &data) const {
            if (seed_.empty()) {
                return dp::Result<Bytes, dp::Error>::err(crypto_failed("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, toSigningKey());
            if (!result.success) {
                return dp::Result<Bytes, dp::Error>::err(crypto_failed("Ed25519 sign failed: " + result.error_message));
            }
            return dp::Result<Bytes, dp::Error>::ok(result.data);
        }

        inline const Bytes &seed() const { return seed_; }
        inline const Bytes &publicKey() const { return public_key_; }

      private:
        Bytes seed_;
        Bytes public_key_;
    };

    /// Verify an Ed25519 signature; malformed keys or signatures verify as false
    inline bool ed25519Verify(const Bytes &public_key, const Bytes &data, const Bytes &signature) {
        if (public_key.size() != ED25519_PUBLIC_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE) {
            return false;
        }
        keylock::keylock crypto(keylock::Algorithm::Ed25519);
        auto result = crypto.verify(data, signature, public_key);
        return result.success;
    }

} // namespace credo
