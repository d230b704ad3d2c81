#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace credo {

    // ===========================================
    // Credo error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_VALIDATION = 200;
    constexpr dp::u32 ERR_NOT_FOUND = 201;
    constexpr dp::u32 ERR_OPERATION_FAILED = 202;
    constexpr dp::u32 ERR_DECODE = 203;
    constexpr dp::u32 ERR_JWT_MALFORMED = 204;
    constexpr dp::u32 ERR_SIGNATURE_INVALID = 205;
    constexpr dp::u32 ERR_INTEGRITY = 206;
    constexpr dp::u32 ERR_VERSION_CONFLICT = 207;
    constexpr dp::u32 ERR_ALREADY_EXISTS = 208;
    constexpr dp::u32 ERR_CRYPTO = 209;
    constexpr dp::u32 ERR_STORAGE = 210;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error validation(const std::string &msg) { return dp::Error{ERR_VALIDATION, dp::String(msg.c_str())}; }

    /// NotFound carries the key and the offending identifier, e.g. "documentNotFound: did:x:0x12"
    inline dp::Error not_found(const std::string &key, const std::string &id) {
        return dp::Error{ERR_NOT_FOUND, dp::String((key + ": " + id).c_str())};
    }

    inline dp::Error decode_failed(const std::string &msg) { return dp::Error{ERR_DECODE, dp::String(msg.c_str())}; }

    inline dp::Error jwt_malformed(const std::string &msg = "Token is not a compact JWT") {
        return dp::Error{ERR_JWT_MALFORMED, dp::String(msg.c_str())};
    }

    inline dp::Error signature_invalid(const std::string &msg = "Signature verification failed") {
        return dp::Error{ERR_SIGNATURE_INVALID, dp::String(msg.c_str())};
    }

    inline dp::Error integrity_failed(const std::string &id) {
        return dp::Error{ERR_INTEGRITY, dp::String(("documentIntegrityFailed: " + id).c_str())};
    }

    inline dp::Error version_conflict(const std::string &id) {
        return dp::Error{ERR_VERSION_CONFLICT, dp::String(("versionConflict: " + id).c_str())};
    }

    inline dp::Error already_exists(const std::string &key, const std::string &id) {
        return dp::Error{ERR_ALREADY_EXISTS, dp::String((key + ": " + id).c_str())};
    }

    inline dp::Error crypto_failed(const std::string &msg) { return dp::Error{ERR_CRYPTO, dp::String(msg.c_str())}; }

    inline dp::Error storage_failed(const std::string &msg) { return dp::Error{ERR_STORAGE, dp::String(msg.c_str())}; }

    /// General failure carrying a key and the affected identifier, e.g. "publicKeyJwkMissing: did:x:0x12#key-1"
    inline dp::Error general_error(const std::string &key, const std::string &id) {
        return dp::Error{ERR_OPERATION_FAILED, dp::String((key + ": " + id).c_str())};
    }

    /// Message of an error as std::string
    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

    /// Wrap a lower-layer error with the failing operation's name.
    /// Validation, NotFound, integrity and version conflict errors pass through unchanged.
    inline dp::Error operation_failed(const std::string &operation, const dp::Error &cause) {
        if (cause.code == ERR_VALIDATION || cause.code == ERR_NOT_FOUND || cause.code == ERR_INTEGRITY ||
            cause.code == ERR_VERSION_CONFLICT) {
            return cause;
        }
        std::string msg = operation + "Failed: " + errorMessage(cause);
        return dp::Error{ERR_OPERATION_FAILED, dp::String(msg.c_str())};
    }

    inline dp::Error operation_failed(const std::string &operation, const std::string &reason) {
        std::string msg = operation + "Failed: " + reason;
        return dp::Error{ERR_OPERATION_FAILED, dp::String(msg.c_str())};
    }

} // namespace credo
