#pragma once

#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

namespace credo {

    /// Public and private profile properties of an identity
    struct IdentityProfile {
        std::string identity;
        Json::Value public_profile{Json::objectValue};
        Json::Value private_profile{Json::objectValue};

        IdentityProfile() = default;

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["identity"] = identity;
            json["publicProfile"] = public_profile;
            json["privateProfile"] = private_profile;
            return json;
        }

        inline static dp::Result<IdentityProfile, dp::Error> fromJson(const Json::Value &json) {
            std::string identity = stringMember(json, "identity");
            if (identity.empty()) {
                return dp::Result<IdentityProfile, dp::Error>::err(decode_failed("Profile has no identity"));
            }
            IdentityProfile profile;
            profile.identity = identity;
            if (json["publicProfile"].isObject()) {
                profile.public_profile = json["publicProfile"];
            }
            if (json["privateProfile"].isObject()) {
                profile.private_profile = json["privateProfile"];
            }
            return dp::Result<IdentityProfile, dp::Error>::ok(std::move(profile));
        }
    };

    /// Equality match on one top-level property
    struct ProfileFilter {
        std::string property_name;
        Json::Value property_value;
    };

    /// Query for IdentityProfileConnector::list
    struct ProfileListOptions {
        std::vector<ProfileFilter> public_filters;
        std::vector<ProfileFilter> private_filters;
        std::optional<std::vector<std::string>> public_property_names;  // all properties when unset
        std::optional<std::vector<std::string>> private_property_names; // all properties when unset
        std::optional<std::string> cursor;                              // decimal offset of the page
        dp::usize page_size = 20;

        ProfileListOptions() = default;
    };

    struct ProfileListResult {
        std::vector<IdentityProfile> items;
        std::optional<std::string> cursor; // unset on the last page
        dp::usize total{0};                // matches across all pages
    };

} // namespace credo
