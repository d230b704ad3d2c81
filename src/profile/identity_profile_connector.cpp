#include <algorithm>
#include <credo/profile/identity_profile_connector.hpp>
#include <iostream>

namespace credo {

    IdentityProfileConnector::IdentityProfileConnector(std::shared_ptr<ProfileStore> store) : store_(std::move(store)) {}

    dp::Result<void, dp::Error> IdentityProfileConnector::create(const std::string &identity,
                                                                 const std::optional<Json::Value> &public_profile,
                                                                 const std::optional<Json::Value> &private_profile) {
        if (identity.empty()) {
            return dp::Result<void, dp::Error>::err(validation("identity must not be empty"));
        }
        auto public_checked = checkProfileObject("publicProfile", public_profile);
        if (public_checked.is_err()) {
            return public_checked;
        }
        auto private_checked = checkProfileObject("privateProfile", private_profile);
        if (private_checked.is_err()) {
            return private_checked;
        }

        IdentityProfile profile;
        profile.identity = identity;
        if (public_profile.has_value()) {
            profile.public_profile = *public_profile;
        }
        if (private_profile.has_value()) {
            profile.private_profile = *private_profile;
        }

        auto stored = store_->set(profile);
        if (stored.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("create", stored.error()));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<IdentityProfile, dp::Error>
    IdentityProfileConnector::get(const std::string &identity,
                                  const std::optional<std::vector<std::string>> &public_property_names,
                                  const std::optional<std::vector<std::string>> &private_property_names) const {
        if (identity.empty()) {
            return dp::Result<IdentityProfile, dp::Error>::err(validation("identity must not be empty"));
        }
        auto stored = store_->get(identity);
        if (stored.is_err()) {
            return dp::Result<IdentityProfile, dp::Error>::err(operation_failed("get", stored.error()));
        }
        if (!stored.value().has_value()) {
            return dp::Result<IdentityProfile, dp::Error>::err(not_found("profileNotFound", identity));
        }

        IdentityProfile profile = std::move(*stored.value());
        profile.public_profile = project(profile.public_profile, public_property_names);
        profile.private_profile = project(profile.private_profile, private_property_names);
        return dp::Result<IdentityProfile, dp::Error>::ok(std::move(profile));
    }

    dp::Result<void, dp::Error> IdentityProfileConnector::update(const std::string &identity,
                                                                 const std::optional<Json::Value> &public_profile,
                                                                 const std::optional<Json::Value> &private_profile) {
        if (identity.empty()) {
            return dp::Result<void, dp::Error>::err(validation("identity must not be empty"));
        }
        auto public_checked = checkProfileObject("publicProfile", public_profile);
        if (public_checked.is_err()) {
            return public_checked;
        }
        auto private_checked = checkProfileObject("privateProfile", private_profile);
        if (private_checked.is_err()) {
            return private_checked;
        }

        auto stored = store_->get(identity);
        if (stored.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("update", stored.error()));
        }
        if (!stored.value().has_value()) {
            return dp::Result<void, dp::Error>::err(not_found("profileNotFound", identity));
        }

        IdentityProfile profile = std::move(*stored.value());
        if (public_profile.has_value()) {
            profile.public_profile = *public_profile;
        }
        if (private_profile.has_value()) {
            profile.private_profile = *private_profile;
        }

        auto written = store_->set(profile);
        if (written.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("update", written.error()));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> IdentityProfileConnector::remove(const std::string &identity) {
        if (identity.empty()) {
            return dp::Result<void, dp::Error>::err(validation("identity must not be empty"));
        }
        auto removed = store_->remove(identity);
        if (removed.is_err()) {
            return dp::Result<void, dp::Error>::err(operation_failed("remove", removed.error()));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<ProfileListResult, dp::Error> IdentityProfileConnector::list(const ProfileListOptions &options) const {
        if (options.page_size == 0) {
            return dp::Result<ProfileListResult, dp::Error>::err(validation("pageSize must be positive"));
        }
        dp::usize offset = 0;
        if (options.cursor.has_value()) {
            const std::string &cursor = *options.cursor;
            if (cursor.empty() || cursor.size() > 18 || cursor.find_first_not_of("0123456789") != std::string::npos) {
                return dp::Result<ProfileListResult, dp::Error>::err(validation("Invalid cursor: '" + cursor + "'"));
            }
            offset = static_cast<dp::usize>(std::stoull(cursor));
        }

        auto all = store_->all();
        if (all.is_err()) {
            return dp::Result<ProfileListResult, dp::Error>::err(operation_failed("list", all.error()));
        }

        std::vector<IdentityProfile> matching;
        for (auto &profile : all.value()) {
            if (matches(profile.public_profile, options.public_filters) &&
                matches(profile.private_profile, options.private_filters)) {
                matching.push_back(std::move(profile));
            }
        }
        std::sort(matching.begin(), matching.end(),
                  [](const IdentityProfile &a, const IdentityProfile &b) { return a.identity < b.identity; });

        ProfileListResult result;
        result.total = matching.size();
        dp::usize end = matching.size();
        if (offset < matching.size() && options.page_size < matching.size() - offset) {
            end = offset + options.page_size;
        }
        for (dp::usize i = offset; i < end; ++i) {
            IdentityProfile item = std::move(matching[i]);
            item.public_profile = project(item.public_profile, options.public_property_names);
            item.private_profile = project(item.private_profile, options.private_property_names);
            result.items.push_back(std::move(item));
        }
        if (end < matching.size()) {
            result.cursor = std::to_string(end);
        }
        return dp::Result<ProfileListResult, dp::Error>::ok(std::move(result));
    }

    Json::Value IdentityProfileConnector::project(const Json::Value &profile,
                                                  const std::optional<std::vector<std::string>> &names) {
        if (!names.has_value()) {
            return profile;
        }
        Json::Value projected(Json::objectValue);
        for (const auto &name : *names) {
            if (profile.isMember(name)) {
                projected[name] = profile[name];
            }
        }
        return projected;
    }

    bool IdentityProfileConnector::matches(const Json::Value &profile, const std::vector<ProfileFilter> &filters) {
        for (const auto &filter : filters) {
            if (!profile.isMember(filter.property_name) || profile[filter.property_name] != filter.property_value) {
                return false;
            }
        }
        return true;
    }

    dp::Result<void, dp::Error> IdentityProfileConnector::checkProfileObject(const char *name,
                                                                             const std::optional<Json::Value> &value) {
        if (value.has_value() && !value->isObject()) {
            std::cout << "Rejected " << name << ": not a JSON object" << std::endl;
            return dp::Result<void, dp::Error>::err(validation(std::string(name) + " must be a JSON object"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace credo
