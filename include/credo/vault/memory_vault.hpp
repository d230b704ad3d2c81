#pragma once

#include "vault.hpp"
#include <credo/crypto/ed25519.hpp>
#include <shared_mutex>
#include <unordered_map>

namespace credo {

    /// In-process vault backed by hash maps
    class MemoryVault : public Vault {
      public:
        MemoryVault() = default;

        inline dp::Result<Bytes, dp::Error> createKey(const std::string &id, VaultKeyType type) override {
            if (id.empty()) {
                return dp::Result<Bytes, dp::Error>::err(validation("Vault key id must not be empty"));
            }
            auto keypair = Ed25519KeyPair::generate();
            if (keypair.is_err()) {
                return dp::Result<Bytes, dp::Error>::err(keypair.error());
            }

            VaultKey key;
            key.type = type;
            key.private_key = keypair.value().seed();
            key.public_key = keypair.value().publicKey();

            std::unique_lock lock(mutex_);
            if (keys_.find(id) != keys_.end()) {
                return dp::Result<Bytes, dp::Error>::err(already_exists("vaultKeyExists", id));
            }
            keys_[id] = key;
            return dp::Result<Bytes, dp::Error>::ok(key.public_key);
        }

        /// Import existing key material
        inline dp::Result<void, dp::Error> addKey(const std::string &id, const VaultKey &key) {
            std::unique_lock lock(mutex_);
            if (keys_.find(id) != keys_.end()) {
                return dp::Result<void, dp::Error>::err(already_exists("vaultKeyExists", id));
            }
            keys_[id] = key;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<VaultKey, dp::Error> getKey(const std::string &id) const override {
            std::shared_lock lock(mutex_);
            auto it = keys_.find(id);
            if (it == keys_.end()) {
                return dp::Result<VaultKey, dp::Error>::err(not_found("vaultKeyNotFound", id));
            }
            return dp::Result<VaultKey, dp::Error>::ok(it->second);
        }

        inline dp::Result<void, dp::Error> renameKey(const std::string &old_id, const std::string &new_id) override {
            std::unique_lock lock(mutex_);
            auto it = keys_.find(old_id);
            if (it == keys_.end()) {
                return dp::Result<void, dp::Error>::err(not_found("vaultKeyNotFound", old_id));
            }
            if (old_id == new_id) {
                return dp::Result<void, dp::Error>::ok();
            }
            if (keys_.find(new_id) != keys_.end()) {
                return dp::Result<void, dp::Error>::err(already_exists("vaultKeyExists", new_id));
            }
            VaultKey key = std::move(it->second);
            keys_.erase(it);
            keys_[new_id] = std::move(key);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> removeKey(const std::string &id) override {
            std::unique_lock lock(mutex_);
            if (keys_.erase(id) == 0) {
                return dp::Result<void, dp::Error>::err(not_found("vaultKeyNotFound", id));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<Bytes, dp::Error> sign(const std::string &id, const Bytes &data) const override {
            auto key = getKey(id);
            if (key.is_err()) {
                return dp::Result<Bytes, dp::Error>::err(key.error());
            }
            auto keypair = Ed25519KeyPair::fromPrivateKey(key.value().private_key, key.value().public_key);
            if (keypair.is_err()) {
                return dp::Result<Bytes, dp::Error>::err(keypair.error());
            }
            return keypair.value().sign(data);
        }

        inline dp::Result<bool, dp::Error> verify(const std::string &id, const Bytes &data,
                                                  const Bytes &signature) const override {
            auto key = getKey(id);
            if (key.is_err()) {
                return dp::Result<bool, dp::Error>::err(key.error());
            }
            return dp::Result<bool, dp::Error>::ok(ed25519Verify(key.value().public_key, data, signature));
        }

        inline dp::Result<void, dp::Error> setSecret(const std::string &id, const Bytes &value) override {
            std::unique_lock lock(mutex_);
            secrets_[id] = value;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<Bytes, dp::Error> getSecret(const std::string &id) const override {
            std::shared_lock lock(mutex_);
            auto it = secrets_.find(id);
            if (it == secrets_.end()) {
                return dp::Result<Bytes, dp::Error>::err(not_found("vaultSecretNotFound", id));
            }
            return dp::Result<Bytes, dp::Error>::ok(it->second);
        }

        inline size_t keyCount() const {
            std::shared_lock lock(mutex_);
            return keys_.size();
        }

        inline bool hasKey(const std::string &id) const {
            std::shared_lock lock(mutex_);
            return keys_.find(id) != keys_.end();
        }

      private:
        std::unordered_map<std::string, VaultKey> keys_;
        std::unordered_map<std::string, Bytes> secrets_;
        mutable std::shared_mutex mutex_;
    };

} // namespace credo
