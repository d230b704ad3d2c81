#pragma once

#include <credo/revocation/bitmap.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    /// Identity connector configuration
    struct IdentityConnectorConfig {
        std::string did_method = "entity-storage";
        dp::u64 revocation_bitmap_bits = RevocationBitmap::DEFAULT_SIZE_BITS;

        IdentityConnectorConfig() = default;
    };

} // namespace credo
