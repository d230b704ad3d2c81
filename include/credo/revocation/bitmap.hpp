#pragma once

#include "compression.hpp"
#include <algorithm>
#include <credo/common/encoding.hpp>
#include <credo/common/error.hpp>
#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    /// Fixed-size bitstring status list.
    /// Bit i lives in byte i / 8, most significant bit first.
    class RevocationBitmap {
      public:
        static constexpr dp::u64 DEFAULT_SIZE_BITS = 131072;
        static constexpr const char *DATA_URI_PREFIX = "data:application/octet-stream;base64,";

        RevocationBitmap() = default;

        /// All-zero bitmap; size must be a positive multiple of 8
        inline static dp::Result<RevocationBitmap, dp::Error> create(dp::u64 size_bits = DEFAULT_SIZE_BITS) {
            if (size_bits == 0 || size_bits % 8 != 0) {
                return dp::Result<RevocationBitmap, dp::Error>::err(
                    validation("Revocation bitmap size must be a positive multiple of 8"));
            }
            RevocationBitmap bitmap;
            bitmap.size_bits_ = size_bits;
            bitmap.bytes_.assign(size_bits / 8, 0);
            return dp::Result<RevocationBitmap, dp::Error>::ok(std::move(bitmap));
        }

        inline dp::Result<void, dp::Error> setBit(dp::i64 index, bool value) {
            auto check = checkIndex(index);
            if (check.is_err()) {
                return check;
            }
            auto pos = static_cast<dp::u64>(index);
            uint8_t mask = static_cast<uint8_t>(0x80 >> (pos % 8));
            if (value) {
                bytes_[pos / 8] |= mask;
            } else {
                bytes_[pos / 8] &= static_cast<uint8_t>(~mask);
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<bool, dp::Error> getBit(dp::i64 index) const {
            auto check = checkIndex(index);
            if (check.is_err()) {
                return dp::Result<bool, dp::Error>::err(check.error());
            }
            auto pos = static_cast<dp::u64>(index);
            return dp::Result<bool, dp::Error>::ok((bytes_[pos / 8] & (0x80 >> (pos % 8))) != 0);
        }

        inline dp::u64 size() const { return size_bits_; }

        /// Number of set bits
        inline dp::u64 countSet() const {
            dp::u64 count = 0;
            for (uint8_t b : bytes_) {
                while (b) {
                    count += b & 1;
                    b >>= 1;
                }
            }
            return count;
        }

        inline const Bytes &bytes() const { return bytes_; }

        // === Codec ===

        inline dp::Result<Bytes, dp::Error> toCompressedBytes() const { return gzipCompress(bytes_); }

        inline static dp::Result<RevocationBitmap, dp::Error> fromCompressedBytes(const Bytes &compressed,
                                                                                 dp::u64 size_bits = DEFAULT_SIZE_BITS) {
            auto bitmap = create(size_bits);
            if (bitmap.is_err()) {
                return bitmap;
            }

            auto raw = gzipDecompress(compressed);
            if (raw.is_err()) {
                return dp::Result<RevocationBitmap, dp::Error>::err(raw.error());
            }
            if (raw.value().size() != size_bits / 8) {
                return dp::Result<RevocationBitmap, dp::Error>::err(
                    decode_failed("Revocation bitmap has " + std::to_string(raw.value().size()) +
                                  " bytes, expected " + std::to_string(size_bits / 8)));
            }

            RevocationBitmap result = std::move(bitmap.value());
            result.bytes_ = std::move(raw.value());
            return dp::Result<RevocationBitmap, dp::Error>::ok(std::move(result));
        }

        /// data:application/octet-stream;base64,<base64url(gzip(bits))>
        inline dp::Result<std::string, dp::Error> toDataUri() const {
            auto compressed = toCompressedBytes();
            if (compressed.is_err()) {
                return dp::Result<std::string, dp::Error>::err(compressed.error());
            }
            return dp::Result<std::string, dp::Error>::ok(std::string(DATA_URI_PREFIX) +
                                                          base64UrlEncode(compressed.value()));
        }

        inline static dp::Result<RevocationBitmap, dp::Error> fromDataUri(const std::string &uri,
                                                                         dp::u64 size_bits = DEFAULT_SIZE_BITS) {
            if (uri.rfind("data:", 0) != 0 || std::count(uri.begin(), uri.end(), ',') != 1) {
                return dp::Result<RevocationBitmap, dp::Error>::err(decode_failed("Malformed revocation data URI"));
            }
            size_t comma = uri.find(',');
            std::string header = uri.substr(0, comma);
            const std::string marker = ";base64";
            if (header.size() < marker.size() || header.compare(header.size() - marker.size(), marker.size(), marker) != 0) {
                return dp::Result<RevocationBitmap, dp::Error>::err(
                    decode_failed("Revocation data URI is not base64 encoded"));
            }

            // Accept both alphabets, writers differ on which one they use
            std::string payload = uri.substr(comma + 1);
            std::replace(payload.begin(), payload.end(), '+', '-');
            std::replace(payload.begin(), payload.end(), '/', '_');

            auto compressed = base64UrlDecode(payload);
            if (compressed.is_err()) {
                return dp::Result<RevocationBitmap, dp::Error>::err(compressed.error());
            }
            return fromCompressedBytes(compressed.value(), size_bits);
        }

        inline bool operator==(const RevocationBitmap &other) const {
            return size_bits_ == other.size_bits_ && bytes_ == other.bytes_;
        }
        inline bool operator!=(const RevocationBitmap &other) const { return !(*this == other); }

      private:
        inline dp::Result<void, dp::Error> checkIndex(dp::i64 index) const {
            if (index < 0 || static_cast<dp::u64>(index) >= size_bits_) {
                return dp::Result<void, dp::Error>::err(validation("Revocation index " + std::to_string(index) +
                                                                   " out of range [0, " +
                                                                   std::to_string(size_bits_) + ")"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        dp::u64 size_bits_ = 0;
        Bytes bytes_;
    };

} // namespace credo
