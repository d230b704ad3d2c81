#pragma once

#include "did.hpp"
#include "service.hpp"
#include "verification_method.hpp"
#include <algorithm>
#include <credo/common/error.hpp>
#include <credo/common/json.hpp>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace credo {

    /// One entry of the document's method collection.
    /// Inline methods are unique by id across all purposes; a reference entry only carries the id.
    struct MethodEntry {
        VerificationPurpose purpose{VerificationPurpose::VerificationMethod};
        VerificationMethod method;
        bool is_reference{false};
    };

    /// DID Document following W3C DID Core v1.0
    /// The six purpose arrays are views over a single ordered method collection.
    class DidDocument {
      public:
        static constexpr const char *DID_CONTEXT = "https://www.w3.org/ns/did/v1";

        DidDocument() = default;

        /// Empty document for an identifier
        inline static DidDocument create(const std::string &id) {
            DidDocument doc;
            doc.id_ = id;
            return doc;
        }

        inline const std::string &getId() const { return id_; }

        // === Verification Methods ===

        /// Insert a method under a purpose. An inline method with the same id is removed first,
        /// whichever purpose it had, so re-adding moves a method between purposes.
        inline void addVerificationMethod(VerificationPurpose purpose, const VerificationMethod &method) {
            std::string id = method.getId();
            entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                          [&id](const MethodEntry &e) {
                                              return !e.is_reference && e.method.getId() == id;
                                          }),
                           entries_.end());
            entries_.push_back(MethodEntry{purpose, method, false});
        }

        /// Add a string reference to a method (possibly held by another document)
        inline void addMethodReference(VerificationPurpose purpose, const std::string &method_id) {
            for (const auto &e : entries_) {
                if (e.is_reference && e.purpose == purpose && e.method.getId() == method_id) {
                    return;
                }
            }
            VerificationMethod ref;
            ref.id = dp::String(method_id.c_str());
            ref.type = dp::String();
            entries_.push_back(MethodEntry{purpose, ref, true});
        }

        /// Remove a method and every reference to it
        inline dp::Result<void, dp::Error> removeVerificationMethod(const std::string &id) {
            auto it = std::remove_if(entries_.begin(), entries_.end(),
                                     [&id](const MethodEntry &e) { return e.method.getId() == id; });
            if (it == entries_.end()) {
                return dp::Result<void, dp::Error>::err(not_found("verificationMethodNotFound", id));
            }
            entries_.erase(it, entries_.end());
            return dp::Result<void, dp::Error>::ok();
        }

        /// Inline method by id, falling back to a bare reference entry
        inline dp::Result<VerificationMethod, dp::Error> findMethod(const std::string &id) const {
            auto entry = findEntry(id);
            if (entry.is_err()) {
                return dp::Result<VerificationMethod, dp::Error>::err(entry.error());
            }
            return dp::Result<VerificationMethod, dp::Error>::ok(entry.value().method);
        }

        inline dp::Result<MethodEntry, dp::Error> findEntry(const std::string &id) const {
            const MethodEntry *reference = nullptr;
            for (const auto &e : entries_) {
                if (e.method.getId() != id) {
                    continue;
                }
                if (!e.is_reference) {
                    return dp::Result<MethodEntry, dp::Error>::ok(e);
                }
                if (reference == nullptr) {
                    reference = &e;
                }
            }
            if (reference != nullptr) {
                return dp::Result<MethodEntry, dp::Error>::ok(*reference);
            }
            return dp::Result<MethodEntry, dp::Error>::err(not_found("verificationMethodNotFound", id));
        }

        inline bool hasMethod(const std::string &id) const { return findEntry(id).is_ok(); }

        /// Every entry with its owning purpose, in document order
        inline const std::vector<MethodEntry> &allMethods() const { return entries_; }

        inline std::vector<MethodEntry> methodsFor(VerificationPurpose purpose) const {
            std::vector<MethodEntry> result;
            for (const auto &e : entries_) {
                if (e.purpose == purpose) {
                    result.push_back(e);
                }
            }
            return result;
        }

        // === Services ===

        /// Insert a service; an existing service with the same id is replaced
        inline void addService(const Service &service) {
            for (auto &s : services_) {
                if (s.getId() == service.getId()) {
                    s = service;
                    return;
                }
            }
            services_.push_back(service);
        }

        inline dp::Result<void, dp::Error> removeService(const std::string &id) {
            auto it =
                std::find_if(services_.begin(), services_.end(), [&id](const Service &s) { return s.getId() == id; });
            if (it == services_.end()) {
                return dp::Result<void, dp::Error>::err(not_found("serviceNotFound", id));
            }
            services_.erase(it);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<Service, dp::Error> findService(const std::string &id) const {
            for (const auto &s : services_) {
                if (s.getId() == id) {
                    return dp::Result<Service, dp::Error>::ok(s);
                }
            }
            return dp::Result<Service, dp::Error>::err(not_found("serviceNotFound", id));
        }

        /// First service whose id ends with `suffix` (e.g. "#revocation")
        inline dp::Result<Service, dp::Error> findServiceBySuffix(const std::string &suffix) const {
            for (const auto &s : services_) {
                std::string sid = s.getId();
                if (sid.size() >= suffix.size() && sid.compare(sid.size() - suffix.size(), suffix.size(), suffix) == 0) {
                    return dp::Result<Service, dp::Error>::ok(s);
                }
            }
            return dp::Result<Service, dp::Error>::err(not_found("serviceNotFound", id_ + suffix));
        }

        inline bool hasService(const std::string &id) const { return findService(id).is_ok(); }

        inline const std::vector<Service> &getServices() const { return services_; }

        // === JSON ===

        /// W3C JSON shape; empty arrays are omitted
        inline Json::Value toJson() const {
            Json::Value json(Json::objectValue);
            json["@context"] = DID_CONTEXT;
            json["id"] = id_;

            for (auto purpose : ALL_PURPOSES) {
                Json::Value arr(Json::arrayValue);
                for (const auto &e : entries_) {
                    if (e.purpose != purpose) {
                        continue;
                    }
                    if (e.is_reference) {
                        arr.append(e.method.getId());
                    } else {
                        arr.append(e.method.toJson());
                    }
                }
                if (!arr.empty()) {
                    json[verificationPurposeToString(purpose)] = arr;
                }
            }

            if (!services_.empty()) {
                Json::Value arr(Json::arrayValue);
                for (const auto &s : services_) {
                    arr.append(s.toJson());
                }
                json["service"] = arr;
            }
            return json;
        }

        inline std::string toJsonString() const { return canonicalize(toJson()); }

        inline static dp::Result<DidDocument, dp::Error> fromJson(const Json::Value &json) {
            if (!json.isObject()) {
                return dp::Result<DidDocument, dp::Error>::err(decode_failed("DID document must be a JSON object"));
            }
            std::string id = stringMember(json, "id");
            if (Did::parse(id).is_err()) {
                return dp::Result<DidDocument, dp::Error>::err(decode_failed("DID document has an invalid id"));
            }

            DidDocument doc = create(id);
            for (auto purpose : ALL_PURPOSES) {
                const Json::Value &arr = json[verificationPurposeToString(purpose)];
                if (arr.isNull()) {
                    continue;
                }
                if (!arr.isArray()) {
                    return dp::Result<DidDocument, dp::Error>::err(
                        decode_failed(verificationPurposeToString(purpose) + " must be an array"));
                }
                for (const auto &item : arr) {
                    if (item.isString()) {
                        doc.addMethodReference(purpose, item.asString());
                        continue;
                    }
                    auto vm = VerificationMethod::fromJson(item);
                    if (vm.is_err()) {
                        return dp::Result<DidDocument, dp::Error>::err(vm.error());
                    }
                    doc.addVerificationMethod(purpose, vm.value());
                }
            }

            const Json::Value &services = json["service"];
            if (!services.isNull()) {
                if (!services.isArray()) {
                    return dp::Result<DidDocument, dp::Error>::err(decode_failed("service must be an array"));
                }
                for (const auto &item : services) {
                    auto svc = Service::fromJson(item);
                    if (svc.is_err()) {
                        return dp::Result<DidDocument, dp::Error>::err(svc.error());
                    }
                    doc.addService(svc.value());
                }
            }
            return dp::Result<DidDocument, dp::Error>::ok(std::move(doc));
        }

        inline static dp::Result<DidDocument, dp::Error> fromJsonString(const std::string &text) {
            auto json = parseJson(text);
            if (json.is_err()) {
                return dp::Result<DidDocument, dp::Error>::err(json.error());
            }
            return fromJson(json.value());
        }

        inline bool operator==(const DidDocument &other) const { return toJsonString() == other.toJsonString(); }
        inline bool operator!=(const DidDocument &other) const { return !(*this == other); }

      private:
        std::string id_;
        std::vector<MethodEntry> entries_;
        std::vector<Service> services_;
    };

} // namespace credo
