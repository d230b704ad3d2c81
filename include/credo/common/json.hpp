#pragma once

#include "error.hpp"
#include <chrono>
#include <ctime>
#include <datapod/datapod.hpp>
#include <iomanip>
#include <json/json.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace credo {

    /// Canonical JSON: members in sorted key order, no whitespace.
    /// jsoncpp keeps object members in a sorted map, so the compact writer output is canonical.
    inline std::string canonicalize(const Json::Value &value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        builder["commentStyle"] = "None";
        builder["emitUTF8"] = true;
        return Json::writeString(builder, value);
    }

    /// Human readable JSON (summaries, demos)
    inline std::string prettyJson(const Json::Value &value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, value);
    }

    inline dp::Result<Json::Value, dp::Error> parseJson(const std::string &text) {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value root;
        std::string errors;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
            return dp::Result<Json::Value, dp::Error>::err(decode_failed("Invalid JSON: " + errors));
        }
        return dp::Result<Json::Value, dp::Error>::ok(std::move(root));
    }

    /// String member of an object, empty when missing or not a string
    inline std::string stringMember(const Json::Value &object, const char *key) {
        if (!object.isObject()) {
            return {};
        }
        const Json::Value &member = object[key];
        return member.isString() ? member.asString() : std::string();
    }

    /// String or list of strings as JSON ("a" for one entry, ["a","b"] otherwise)
    inline Json::Value stringOrArray(const std::vector<std::string> &values) {
        if (values.size() == 1) {
            return Json::Value(values[0]);
        }
        Json::Value arr(Json::arrayValue);
        for (const auto &v : values) {
            arr.append(v);
        }
        return arr;
    }

    inline std::vector<std::string> readStringOrArray(const Json::Value &value) {
        std::vector<std::string> result;
        if (value.isString()) {
            result.push_back(value.asString());
        } else if (value.isArray()) {
            for (const auto &v : value) {
                if (v.isString()) {
                    result.push_back(v.asString());
                }
            }
        }
        return result;
    }

    // ===========================================
    // Time helpers
    // ===========================================

    inline dp::i64 nowSeconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Latest timestamp accepted from a token, 9999-12-31T23:59:59Z
    constexpr dp::i64 MAX_TIMESTAMP_SECONDS = 253402300799;

    /// Read a NumericDate claim (nbf, exp). Anything but a whole number in
    /// [0, MAX_TIMESTAMP_SECONDS] is a decode error.
    inline dp::Result<dp::i64, dp::Error> timestampClaim(const Json::Value &payload, const std::string &name) {
        const Json::Value &value = payload[name];
        if (!value.isInt64() || value.asInt64() < 0 || value.asInt64() > MAX_TIMESTAMP_SECONDS) {
            return dp::Result<dp::i64, dp::Error>::err(decode_failed("Invalid " + name + " claim"));
        }
        return dp::Result<dp::i64, dp::Error>::ok(value.asInt64());
    }

    /// ISO8601 (UTC, second precision) for a unix timestamp
    inline std::string isoFromSeconds(dp::i64 seconds) {
        auto time_t = static_cast<std::time_t>(seconds);
        std::tm tm_utc{};
        if (gmtime_r(&time_t, &tm_utc) == nullptr) {
            return std::string();
        }
        std::stringstream ss;
        ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    inline std::string nowIso8601() { return isoFromSeconds(nowSeconds()); }

} // namespace credo
