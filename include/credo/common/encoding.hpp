#pragma once

#include "error.hpp"
#include <cctype>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace credo {

    using Bytes = std::vector<uint8_t>;

    inline Bytes stringToBytes(const std::string &str) { return {str.begin(), str.end()}; }
    inline std::string bytesToString(const Bytes &bytes) { return {bytes.begin(), bytes.end()}; }

    inline std::string toHex(const Bytes &data) { return keylock::keylock::to_hex(data); }

    inline dp::Result<Bytes, dp::Error> fromHex(const std::string &hex) {
        std::string digits = hex;
        if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            digits = digits.substr(2);
        }
        if (digits.size() % 2 != 0) {
            return dp::Result<Bytes, dp::Error>::err(decode_failed("Hex string has odd length"));
        }
        for (char c : digits) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return dp::Result<Bytes, dp::Error>::err(decode_failed("Hex string has invalid characters"));
            }
        }
        return dp::Result<Bytes, dp::Error>::ok(keylock::keylock::from_hex(digits));
    }

    namespace detail {

        constexpr const char *BASE64_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr const char *BASE64URL_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
        constexpr const char *BASE58_CHARS = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

        inline std::string base64EncodeWith(const Bytes &data, const char *chars, bool pad) {
            std::string encoded;
            encoded.reserve(((data.size() + 2) / 3) * 4);
            for (size_t i = 0; i < data.size(); i += 3) {
                uint32_t temp = static_cast<uint32_t>(data[i]) << 16;
                size_t remaining = data.size() - i;
                if (remaining > 1)
                    temp |= static_cast<uint32_t>(data[i + 1]) << 8;
                if (remaining > 2)
                    temp |= data[i + 2];

                encoded += chars[(temp >> 18) & 0x3F];
                encoded += chars[(temp >> 12) & 0x3F];
                if (remaining > 1)
                    encoded += chars[(temp >> 6) & 0x3F];
                else if (pad)
                    encoded += '=';
                if (remaining > 2)
                    encoded += chars[temp & 0x3F];
                else if (pad)
                    encoded += '=';
            }
            return encoded;
        }

        inline dp::Result<Bytes, dp::Error> base64DecodeWith(const std::string &encoded, const std::string &chars) {
            std::string clean = encoded;
            while (!clean.empty() && clean.back() == '=')
                clean.pop_back();
            if (clean.size() % 4 == 1) {
                return dp::Result<Bytes, dp::Error>::err(decode_failed("Invalid base64 length"));
            }

            Bytes decoded;
            decoded.reserve((clean.size() * 3) / 4);
            for (size_t i = 0; i < clean.size(); i += 4) {
                uint32_t temp = 0;
                size_t group = 0;
                for (size_t j = 0; j < 4 && i + j < clean.size(); ++j) {
                    size_t pos = chars.find(clean[i + j]);
                    if (pos == std::string::npos) {
                        return dp::Result<Bytes, dp::Error>::err(decode_failed("Invalid base64 character"));
                    }
                    temp |= static_cast<uint32_t>(pos) << (6 * (3 - j));
                    group++;
                }
                if (group >= 2)
                    decoded.push_back((temp >> 16) & 0xFF);
                if (group >= 3)
                    decoded.push_back((temp >> 8) & 0xFF);
                if (group >= 4)
                    decoded.push_back(temp & 0xFF);
            }
            return dp::Result<Bytes, dp::Error>::ok(std::move(decoded));
        }

    } // namespace detail

    inline std::string base64Encode(const Bytes &data) { return detail::base64EncodeWith(data, detail::BASE64_CHARS, true); }

    inline dp::Result<Bytes, dp::Error> base64Decode(const std::string &encoded) {
        return detail::base64DecodeWith(encoded, detail::BASE64_CHARS);
    }

    /// RFC 4648 section 5, unpadded (JWT segments, JWK members, data URIs)
    inline std::string base64UrlEncode(const Bytes &data) {
        return detail::base64EncodeWith(data, detail::BASE64URL_CHARS, false);
    }

    inline dp::Result<Bytes, dp::Error> base64UrlDecode(const std::string &encoded) {
        return detail::base64DecodeWith(encoded, detail::BASE64URL_CHARS);
    }

    /// Bitcoin alphabet base58
    inline std::string base58Encode(const Bytes &input) {
        size_t leading_zeros = 0;
        for (auto b : input) {
            if (b == 0)
                leading_zeros++;
            else
                break;
        }

        std::vector<uint8_t> digits;
        for (uint8_t byte : input) {
            int carry = byte;
            for (auto &digit : digits) {
                carry += digit * 256;
                digit = carry % 58;
                carry /= 58;
            }
            while (carry > 0) {
                digits.push_back(carry % 58);
                carry /= 58;
            }
        }

        std::string result(leading_zeros, '1');
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            result += detail::BASE58_CHARS[*it];
        }
        return result;
    }

    inline dp::Result<Bytes, dp::Error> base58Decode(const std::string &encoded) {
        const std::string alphabet = detail::BASE58_CHARS;

        size_t leading_ones = 0;
        for (char c : encoded) {
            if (c == '1')
                leading_ones++;
            else
                break;
        }

        std::vector<uint8_t> bytes;
        for (char c : encoded) {
            size_t pos = alphabet.find(c);
            if (pos == std::string::npos) {
                return dp::Result<Bytes, dp::Error>::err(decode_failed("Invalid base58 character"));
            }
            int carry = static_cast<int>(pos);
            for (auto &b : bytes) {
                carry += b * 58;
                b = carry & 0xFF;
                carry >>= 8;
            }
            while (carry > 0) {
                bytes.push_back(carry & 0xFF);
                carry >>= 8;
            }
        }

        Bytes result(leading_ones, 0);
        result.insert(result.end(), bytes.rbegin(), bytes.rend());
        return dp::Result<Bytes, dp::Error>::ok(std::move(result));
    }

} // namespace credo
