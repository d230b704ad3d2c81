#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "credo/common/encoding.hpp"
#include "credo/common/json.hpp"
#include <doctest/doctest.h>

using namespace credo;

TEST_SUITE("Encoding Tests") {

    TEST_CASE("Hex round trip") {
        Bytes data = {0x00, 0x0f, 0xab, 0xff};
        CHECK(toHex(data).size() == 8);

        auto decoded = fromHex(toHex(data));
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == data);

        auto prefixed = fromHex("0x000fabff");
        REQUIRE(prefixed.is_ok());
        CHECK(prefixed.value() == data);
    }

    TEST_CASE("Invalid hex is a decode error") {
        CHECK(fromHex("abc").error().code == ERR_DECODE);
        CHECK(fromHex("zz").error().code == ERR_DECODE);
    }

    TEST_CASE("Base64 known vectors") {
        CHECK(base64Encode(stringToBytes("")) == "");
        CHECK(base64Encode(stringToBytes("f")) == "Zg==");
        CHECK(base64Encode(stringToBytes("fo")) == "Zm8=");
        CHECK(base64Encode(stringToBytes("foobar")) == "Zm9vYmFy");

        auto decoded = base64Decode("Zm9vYg==");
        REQUIRE(decoded.is_ok());
        CHECK(bytesToString(decoded.value()) == "foob");
    }

    TEST_CASE("Base64url is unpadded and uses the url alphabet") {
        Bytes data = {0xfb, 0xff, 0xbf};
        CHECK(base64Encode(data) == "+/+/");
        CHECK(base64UrlEncode(data) == "-_-_");
        CHECK(base64UrlEncode(stringToBytes("f")) == "Zg");

        auto decoded = base64UrlDecode("-_-_");
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == data);

        CHECK(base64UrlDecode("+/+/").is_err());
        CHECK(base64UrlDecode("abcde").is_err());
    }

    TEST_CASE("Base58 known vectors") {
        CHECK(base58Encode(stringToBytes("hello world")) == "StV1DL6CwTryKyV");
        CHECK(base58Encode(Bytes{0x00, 0x00, 0x01}) == "112");

        auto decoded = base58Decode("StV1DL6CwTryKyV");
        REQUIRE(decoded.is_ok());
        CHECK(bytesToString(decoded.value()) == "hello world");

        auto zeros = base58Decode("112");
        REQUIRE(zeros.is_ok());
        CHECK(zeros.value() == Bytes{0x00, 0x00, 0x01});
    }

    TEST_CASE("Base58 rejects characters outside the alphabet") {
        auto result = base58Decode("0OIl");
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_DECODE);
    }

    TEST_CASE("Canonical JSON sorts keys and drops whitespace") {
        Json::Value value(Json::objectValue);
        value["b"] = 1;
        value["a"] = "x";
        value["c"]["z"] = true;
        value["c"]["y"] = Json::Value(Json::arrayValue);

        CHECK(canonicalize(value) == R"({"a":"x","b":1,"c":{"y":[],"z":true}})");
    }

    TEST_CASE("JSON parsing errors are decode errors") {
        auto parsed = parseJson("{\"a\": 1}");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value()["a"].asInt() == 1);

        auto broken = parseJson("{\"a\": ");
        REQUIRE(broken.is_err());
        CHECK(broken.error().code == ERR_DECODE);
    }

    TEST_CASE("Timestamps format as ISO8601 UTC") {
        CHECK(isoFromSeconds(0) == "1970-01-01T00:00:00Z");
        CHECK(isoFromSeconds(1700000000) == "2023-11-14T22:13:20Z");
        CHECK(isoFromSeconds(10000000000) == "2286-11-20T17:46:40Z");
        CHECK(isoFromSeconds(MAX_TIMESTAMP_SECONDS) == "9999-12-31T23:59:59Z");
    }

    TEST_CASE("Timestamp claims must be whole seconds in range") {
        Json::Value payload(Json::objectValue);
        payload["nbf"] = Json::Int64(1700000000);
        auto nbf = timestampClaim(payload, "nbf");
        REQUIRE(nbf.is_ok());
        CHECK(nbf.value() == 1700000000);

        payload["whole"] = 1700000000.0;
        CHECK(timestampClaim(payload, "whole").value() == 1700000000);

        payload["exp"] = 1e19;
        CHECK(timestampClaim(payload, "exp").error().code == ERR_DECODE);
        payload["exp"] = Json::UInt64(18446744073709551615ull);
        CHECK(timestampClaim(payload, "exp").error().code == ERR_DECODE);
        payload["exp"] = Json::Int64(MAX_TIMESTAMP_SECONDS + 1);
        CHECK(timestampClaim(payload, "exp").error().code == ERR_DECODE);
        payload["exp"] = Json::Int64(-5);
        CHECK(timestampClaim(payload, "exp").error().code == ERR_DECODE);
        payload["exp"] = 12.5;
        CHECK(timestampClaim(payload, "exp").error().code == ERR_DECODE);
        CHECK(timestampClaim(payload, "missing").error().code == ERR_DECODE);
    }
}
