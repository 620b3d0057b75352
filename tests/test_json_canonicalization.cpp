#include <catch2/catch_test_macros.hpp>
#include "attest/json_canonicalization.hpp"
#include <limits>

using namespace attest;
using namespace attest::json;
using Json = nlohmann::json;

namespace
{
    std::string canon(const Json &value)
    {
        auto result = RFC8785Canonicalizer::canonicalize(value);
        REQUIRE(result.has_value());
        return *result;
    }
}

TEST_CASE("RFC 8785 - Simple object canonicalization", "[json]")
{
    Json obj = {
        {"z", 3},
        {"a", 1},
        {"m", 2}};

    REQUIRE(canon(obj) == R"({"a":1,"m":2,"z":3})");
}

TEST_CASE("RFC 8785 - Nested object canonicalization", "[json]")
{
    Json obj = {
        {"outer", {{"z", "last"}, {"a", "first"}}}};

    REQUIRE(canon(obj) == R"({"outer":{"a":"first","z":"last"}})");
}

TEST_CASE("RFC 8785 - Arrays keep their order", "[json]")
{
    REQUIRE(canon(Json{3, 1, 2}) == "[3,1,2]");
    REQUIRE(canon(Json::array()) == "[]");
    REQUIRE(canon(Json::object()) == "{}");
}

TEST_CASE("RFC 8785 - String escaping", "[json]")
{
    Json obj = {
        {"quote", "He said \"hello\""},
        {"newline", "line1\nline2"},
        {"slash", "a\\b"}};

    REQUIRE(canon(obj) == R"({"newline":"line1\nline2","quote":"He said \"hello\"","slash":"a\\b"})");
}

TEST_CASE("RFC 8785 - Control characters and non-ASCII", "[json]")
{
    Json obj = {{"ctrl", std::string("test\x01\x1F")}, {"name", "Zoë"}};

    auto canonical = canon(obj);
    REQUIRE(canonical.find("\\u0001") != std::string::npos);
    REQUIRE(canonical.find("\\u001f") != std::string::npos);
    // Non-ASCII passes through as UTF-8
    REQUIRE(canonical.find("Zoë") != std::string::npos);
}

TEST_CASE("RFC 8785 - Number formatting", "[json]")
{
    Json obj = {
        {"int", 42},
        {"negative", -17},
        {"zero", 0},
        {"big", 18446744073709551615ULL},
        {"whole_double", 5.0},
        {"fraction", 0.1},
        {"negative_zero", -0.0}};

    REQUIRE(canon(obj) ==
            R"({"big":18446744073709551615,"fraction":0.1,"int":42,"negative":-17,"negative_zero":0,"whole_double":5,"zero":0})");
}

TEST_CASE("RFC 8785 - Boolean and null", "[json]")
{
    Json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr}};

    REQUIRE(canon(obj) == R"({"bool_false":false,"bool_true":true,"null_val":null})");
}

TEST_CASE("RFC 8785 - Insertion order does not matter", "[json]")
{
    Json first = Json::object();
    first["proof_name"] = "p";
    first["payload"] = {{"v", 1}, {"w", {1, 2}}};
    first["timestamp"] = 1700000000;

    Json second = Json::object();
    second["timestamp"] = 1700000000;
    second["payload"] = {{"w", {1, 2}}, {"v", 1}};
    second["proof_name"] = "p";

    REQUIRE(canon(first) == canon(second));
    REQUIRE(canon(first) == canon(first));
}

TEST_CASE("RFC 8785 - Unrepresentable values are rejected", "[json]")
{
    SECTION("NaN and infinity")
    {
        auto nan = RFC8785Canonicalizer::canonicalize(Json{{"x", std::numeric_limits<double>::quiet_NaN()}});
        REQUIRE_FALSE(nan.has_value());
        REQUIRE(nan.error().code == ErrorCode::CanonicalizationError);

        auto inf = RFC8785Canonicalizer::canonicalize(Json(std::numeric_limits<double>::infinity()));
        REQUIRE_FALSE(inf.has_value());
    }

    SECTION("invalid UTF-8")
    {
        auto bad = RFC8785Canonicalizer::canonicalize(Json{{"x", std::string("\xC3\x28")}});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::CanonicalizationError);

        auto bad_key = RFC8785Canonicalizer::canonicalize(Json{{std::string("\xFF"), 1}});
        REQUIRE_FALSE(bad_key.has_value());
    }

    SECTION("binary values")
    {
        auto binary = RFC8785Canonicalizer::canonicalize(Json::binary({1, 2, 3}));
        REQUIRE_FALSE(binary.has_value());
    }

    SECTION("excessive nesting")
    {
        Json deep = 1;
        for (int i = 0; i < 300; ++i)
        {
            deep = Json::array({deep});
        }
        auto result = RFC8785Canonicalizer::canonicalize(deep);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ErrorCode::CanonicalizationError);
    }
}

TEST_CASE("RFC 8785 - Parse then canonicalize", "[json]")
{
    auto result = RFC8785Canonicalizer::canonicalize_string(R"({ "b" : [1, 2], "a" : {} })");
    REQUIRE(result.has_value());
    REQUIRE(*result == R"({"a":{},"b":[1,2]})");

    auto invalid = RFC8785Canonicalizer::canonicalize_string("{not json");
    REQUIRE_FALSE(invalid.has_value());
    REQUIRE(invalid.error().code == ErrorCode::InvalidInput);
}

TEST_CASE("CanonicalCodec drops excluded top-level fields only", "[json][codec]")
{
    Json record = {
        {"keep", 1},
        {"sig", "abc"},
        {"nested", {{"sig", "stays"}}}};

    auto bytes = CanonicalCodec::encode(record, {"sig"});
    REQUIRE(bytes.has_value());
    std::string text(bytes->begin(), bytes->end());
    REQUIRE(text == R"({"keep":1,"nested":{"sig":"stays"}})");

    // Excluding an absent field is a no-op
    REQUIRE(CanonicalCodec::encode_string(record, {"absent"}).value() ==
            CanonicalCodec::encode_string(record).value());

    auto not_object = CanonicalCodec::encode(Json::array({1}), {"sig"});
    REQUIRE_FALSE(not_object.has_value());
    REQUIRE(not_object.error().code == ErrorCode::CanonicalizationError);
}
