#pragma once

#include "identity_profile.hpp"
#include <map>
#include <shared_mutex>

namespace credo {

    /// Profile persistence, one record per identity
    class ProfileStore {
      public:
        virtual ~ProfileStore() = default;

        virtual dp::Result<std::optional<IdentityProfile>, dp::Error> get(const std::string &identity) const = 0;

        virtual dp::Result<void, dp::Error> set(const IdentityProfile &profile) = 0;

        /// Fails with NotFound when the identity has no profile
        virtual dp::Result<void, dp::Error> remove(const std::string &identity) = 0;

        /// Every profile, ordered by identity
        virtual dp::Result<std::vector<IdentityProfile>, dp::Error> all() const = 0;
    };

    class MemoryProfileStore : public ProfileStore {
      public:
        MemoryProfileStore() = default;

        inline dp::Result<std::optional<IdentityProfile>, dp::Error> get(const std::string &identity) const override {
            std::shared_lock lock(mutex_);
            auto it = profiles_.find(identity);
            if (it == profiles_.end()) {
                return dp::Result<std::optional<IdentityProfile>, dp::Error>::ok(std::nullopt);
            }
            return dp::Result<std::optional<IdentityProfile>, dp::Error>::ok(it->second);
        }

        inline dp::Result<void, dp::Error> set(const IdentityProfile &profile) override {
            if (profile.identity.empty()) {
                return dp::Result<void, dp::Error>::err(validation("Profile identity must not be empty"));
            }
            std::unique_lock lock(mutex_);
            profiles_[profile.identity] = profile;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> remove(const std::string &identity) override {
            std::unique_lock lock(mutex_);
            if (profiles_.erase(identity) == 0) {
                return dp::Result<void, dp::Error>::err(not_found("profileNotFound", identity));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<std::vector<IdentityProfile>, dp::Error> all() const override {
            std::shared_lock lock(mutex_);
            std::vector<IdentityProfile> result;
            result.reserve(profiles_.size());
            for (const auto &[identity, profile] : profiles_) {
                result.push_back(profile);
            }
            return dp::Result<std::vector<IdentityProfile>, dp::Error>::ok(std::move(result));
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return profiles_.size();
        }

      private:
        std::map<std::string, IdentityProfile> profiles_;
        mutable std::shared_mutex mutex_;
    };

} // namespace credo
