#pragma once

// Credo umbrella header
// Identity connector, profile connector and their storage backends

#include "credo/identity/identity_connector.hpp"
#include "credo/identity/identity_resolver.hpp"
#include "credo/profile/identity_profile_connector.hpp"
#include "credo/storage/memory_document_store.hpp"
#include "credo/storage/sqlite_document_store.hpp"
#include "credo/vault/memory_vault.hpp"
