#pragma once

#include "document_store.hpp"
#include <iostream>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace credo {

    /// Document store held in memory, one instance per connector (no process-wide state)
    class MemoryDocumentStore : public DocumentStore {
      public:
        MemoryDocumentStore() = default;

        inline dp::Result<std::optional<IdentityDocumentRecord>, dp::Error> get(const std::string &id) const override {
            std::shared_lock lock(mutex_);
            auto it = records_.find(id);
            if (it == records_.end()) {
                return dp::Result<std::optional<IdentityDocumentRecord>, dp::Error>::ok(std::nullopt);
            }
            return dp::Result<std::optional<IdentityDocumentRecord>, dp::Error>::ok(it->second);
        }

        inline dp::Result<dp::u64, dp::Error> set(const IdentityDocumentRecord &record,
                                                  dp::u64 expected_version) override {
            std::string id = record.getId();
            if (id.empty()) {
                return dp::Result<dp::u64, dp::Error>::err(validation("Document record id must not be empty"));
            }

            std::unique_lock lock(mutex_);
            auto it = records_.find(id);
            dp::u64 current = it == records_.end() ? 0 : it->second.version;
            if (current != expected_version) {
                std::cout << "Version conflict on " << id << ": expected " << expected_version << ", stored "
                          << current << std::endl;
                return dp::Result<dp::u64, dp::Error>::err(version_conflict(id));
            }

            IdentityDocumentRecord stored = record;
            stored.version = expected_version + 1;
            records_[id] = stored;
            return dp::Result<dp::u64, dp::Error>::ok(stored.version);
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return records_.size();
        }

        inline std::vector<std::string> ids() const {
            std::shared_lock lock(mutex_);
            std::vector<std::string> result;
            for (const auto &[id, record] : records_) {
                result.push_back(id);
            }
            return result;
        }

        /// Overwrite a record without any checks (tests use this to simulate tampering)
        inline void putRaw(const IdentityDocumentRecord &record) {
            std::unique_lock lock(mutex_);
            records_[record.getId()] = record;
        }

      private:
        std::unordered_map<std::string, IdentityDocumentRecord> records_;
        mutable std::shared_mutex mutex_;
    };

} // namespace credo
