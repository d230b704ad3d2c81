#pragma once

#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <datapod/datapod.hpp>

namespace credo {

    /// gzip (RFC 1952) compress a byte buffer
    dp::Result<Bytes, dp::Error> gzipCompress(const Bytes &input);

    /// gzip decompress; truncated or corrupt input is a decode error
    dp::Result<Bytes, dp::Error> gzipDecompress(const Bytes &input);

} // namespace credo
