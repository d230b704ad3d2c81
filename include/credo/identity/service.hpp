#pragma once

#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace credo {

    /// Fragment of the reserved revocation list service
    constexpr const char *REVOCATION_FRAGMENT = "revocation";
    constexpr const char *REVOCATION_SERVICE_TYPE = "BitstringStatusList";

    /// A service endpoint of the DID subject (W3C DID Core v1.0)
    /// `type` and `serviceEndpoint` may each hold one or several values.
    struct Service {
        dp::String id;                          // e.g., "did:entity-storage:0x..#revocation"
        dp::Vector<dp::String> types;           // one or more type names
        dp::Vector<dp::String> service_endpoints; // one or more URIs

        Service() = default;

        inline Service(const std::string &id, const std::string &type, const std::string &endpoint)
            : id(dp::String(id.c_str())) {
            types.push_back(dp::String(type.c_str()));
            service_endpoints.push_back(dp::String(endpoint.c_str()));
        }

        inline Service(const std::string &id, const std::vector<std::string> &type_list,
                       const std::vector<std::string> &endpoint_list)
            : id(dp::String(id.c_str())) {
            for (const auto &t : type_list) {
                types.push_back(dp::String(t.c_str()));
            }
            for (const auto &e : endpoint_list) {
                service_endpoints.push_back(dp::String(e.c_str()));
            }
        }

        inline std::string getId() const { return std::string(id.c_str()); }

        inline std::vector<std::string> getTypes() const {
            std::vector<std::string> result;
            for (const auto &t : types) {
                result.push_back(std::string(t.c_str()));
            }
            return result;
        }

        inline std::vector<std::string> getServiceEndpoints() const {
            std::vector<std::string> result;
            for (const auto &e : service_endpoints) {
                result.push_back(std::string(e.c_str()));
            }
            return result;
        }

        /// First type (empty when none)
        inline std::string getTypeString() const { return types.empty() ? std::string() : std::string(types[0].c_str()); }

        /// First endpoint (empty when none)
        inline std::string getServiceEndpoint() const {
            return service_endpoints.empty() ? std::string() : std::string(service_endpoints[0].c_str());
        }

        inline void setServiceEndpoint(const std::string &endpoint) {
            service_endpoints.clear();
            service_endpoints.push_back(dp::String(endpoint.c_str()));
        }

        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["id"] = getId();
            json["type"] = stringOrArray(getTypes());
            json["serviceEndpoint"] = stringOrArray(getServiceEndpoints());
            return json;
        }

        inline static dp::Result<Service, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject() || stringMember(json, "id").empty()) {
                return dp::Result<Service, dp::Error>::err(decode_failed("Service must be an object with an id"));
            }
            return dp::Result<Service, dp::Error>::ok(Service(stringMember(json, "id"), readStringOrArray(json["type"]),
                                                              readStringOrArray(json["serviceEndpoint"])));
        }

        inline bool operator==(const Service &other) const {
            return getId() == other.getId() && getTypes() == other.getTypes() &&
                   getServiceEndpoints() == other.getServiceEndpoints();
        }

        inline bool operator!=(const Service &other) const { return !(*this == other); }

        /// Serialization
        auto members() { return std::tie(id, types, service_endpoints); }
        auto members() const { return std::tie(id, types, service_endpoints); }
    };

} // namespace credo
