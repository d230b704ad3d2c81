#pragma once

#include "identity_connector.hpp"
#include <memory>

namespace credo {

    /// Read-only view of the documents managed by an IdentityConnector
    class IdentityResolver {
      public:
        inline IdentityResolver(std::shared_ptr<DocumentStore> store, std::shared_ptr<Vault> vault,
                                IdentityConnectorConfig config = IdentityConnectorConfig{})
            : connector_(std::move(store), std::move(vault), std::move(config)) {}

        inline dp::Result<DidDocument, dp::Error> resolveDocument(const std::string &document_id) const {
            return connector_.resolveDocument(document_id);
        }

      private:
        IdentityConnector connector_;
    };

} // namespace credo
