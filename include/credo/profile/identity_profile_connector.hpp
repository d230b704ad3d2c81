#pragma once

#include "identity_profile.hpp"
#include "profile_store.hpp"
#include <memory>

namespace credo {

    /// Profile management over an injected ProfileStore.
    /// Property name lists project profiles down to the named top-level properties.
    class IdentityProfileConnector {
      public:
        explicit IdentityProfileConnector(std::shared_ptr<ProfileStore> store);

        /// Create or overwrite the profile of an identity
        dp::Result<void, dp::Error> create(const std::string &identity,
                                           const std::optional<Json::Value> &public_profile = std::nullopt,
                                           const std::optional<Json::Value> &private_profile = std::nullopt);

        dp::Result<IdentityProfile, dp::Error>
        get(const std::string &identity,
            const std::optional<std::vector<std::string>> &public_property_names = std::nullopt,
            const std::optional<std::vector<std::string>> &private_property_names = std::nullopt) const;

        /// Replace the supplied halves of an existing profile
        dp::Result<void, dp::Error> update(const std::string &identity,
                                           const std::optional<Json::Value> &public_profile = std::nullopt,
                                           const std::optional<Json::Value> &private_profile = std::nullopt);

        dp::Result<void, dp::Error> remove(const std::string &identity);

        dp::Result<ProfileListResult, dp::Error> list(const ProfileListOptions &options = ProfileListOptions{}) const;

      private:
        std::shared_ptr<ProfileStore> store_;

        static Json::Value project(const Json::Value &profile, const std::optional<std::vector<std::string>> &names);
        static bool matches(const Json::Value &profile, const std::vector<ProfileFilter> &filters);
        static dp::Result<void, dp::Error> checkProfileObject(const char *name, const std::optional<Json::Value> &value);
    };

} // namespace credo
