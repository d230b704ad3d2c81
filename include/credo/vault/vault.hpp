#pragma once

#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    enum class VaultKeyType : dp::u8 {
        Ed25519 = 0,
    };

    inline std::string vaultKeyTypeToString(VaultKeyType type) {
        switch (type) {
        case VaultKeyType::Ed25519:
            return "Ed25519";
        default:
            return "Unknown";
        }
    }

    /// Key material held by a vault
    struct VaultKey {
        VaultKeyType type{VaultKeyType::Ed25519};
        Bytes private_key; // 32-byte seed
        Bytes public_key;
    };

    /// Owner of all private key material and secrets.
    /// Unknown ids fail with ERR_NOT_FOUND; renaming onto an existing id fails with ERR_ALREADY_EXISTS.
    class Vault {
      public:
        virtual ~Vault() = default;

        /// Create a key and return its public part
        virtual dp::Result<Bytes, dp::Error> createKey(const std::string &id, VaultKeyType type) = 0;

        virtual dp::Result<VaultKey, dp::Error> getKey(const std::string &id) const = 0;

        virtual dp::Result<void, dp::Error> renameKey(const std::string &old_id, const std::string &new_id) = 0;

        virtual dp::Result<void, dp::Error> removeKey(const std::string &id) = 0;

        virtual dp::Result<Bytes, dp::Error> sign(const std::string &id, const Bytes &data) const = 0;

        virtual dp::Result<bool, dp::Error> verify(const std::string &id, const Bytes &data,
                                                   const Bytes &signature) const = 0;

        virtual dp::Result<void, dp::Error> setSecret(const std::string &id, const Bytes &value) = 0;

        virtual dp::Result<Bytes, dp::Error> getSecret(const std::string &id) const = 0;
    };

} // namespace credo
