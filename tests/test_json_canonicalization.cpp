#include <catch2/catch_test_macros.hpp>
#include "ward/json_canonicalization.hpp"

using namespace ward::json;
using json = nlohmann::json;

TEST_CASE("RFC 8785 - Simple object canonicalization", "[json]")
{
    json obj = {
        {"z", 3},
        {"a", 1},
        {"m", 2}};

    auto canonical = RFC8785Canonicalizer::canonicalize(obj);
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == R"({"a":1,"m":2,"z":3})");
}

TEST_CASE("RFC 8785 - Nested structures", "[json]")
{
    json obj = {
        {"outer", {{"z", "last"}, {"a", "first"}}},
        {"array", {9, 8, 7}}};

    auto canonical = RFC8785Canonicalizer::canonicalize(obj);
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == R"({"array":[9,8,7],"outer":{"a":"first","z":"last"}})");
}

TEST_CASE("RFC 8785 - Literals and integers", "[json]")
{
    json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr},
        {"negative", -17},
        {"big", 4102444800LL}};

    auto canonical = RFC8785Canonicalizer::canonicalize(obj);
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == R"({"big":4102444800,"bool_false":false,"bool_true":true,"negative":-17,"null_val":null})");
}

TEST_CASE("RFC 8785 - String escaping", "[json]")
{
    std::string str_with_ctrl = "say \"hi\"\n\x01\x1F";
    json obj = {{"s", str_with_ctrl}};

    auto canonical = RFC8785Canonicalizer::canonicalize(obj);
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == R"({"s":"say \"hi\"\n\u0001\u001f"})");
}

TEST_CASE("RFC 8785 - Floats are rejected", "[json]")
{
    json obj = {{"ratio", 0.5}};
    auto canonical = RFC8785Canonicalizer::canonicalize(obj);
    REQUIRE_FALSE(canonical.has_value());
    REQUIRE(canonical.error().code == ward::ErrorCode::InvalidInput);
}

TEST_CASE("RFC 8785 - Empty structures", "[json]")
{
    REQUIRE(*RFC8785Canonicalizer::canonicalize(json::object()) == "{}");
    REQUIRE(*RFC8785Canonicalizer::canonicalize(json::array()) == "[]");
}
