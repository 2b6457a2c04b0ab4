#include "docstore/storage/json_value.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using docstore::catalog::Value;
using docstore::catalog::ValueArray;
using docstore::catalog::ValueObject;

TEST_CASE("parse_json reads scalars")
{
    CHECK(docstore::storage::parse_json("null").value == Value{});
    CHECK(docstore::storage::parse_json(" true ").value == Value{true});
    CHECK(docstore::storage::parse_json("-12.5e1").value == Value{-125.0});
    CHECK(docstore::storage::parse_json("\"hi\"").value == Value{"hi"});
}

TEST_CASE("parse_json builds nested containers")
{
    const auto result = docstore::storage::parse_json(R"({"table": "users", "rows": [{"id": 1}, {"id": 2, "tags": []}], "empty": {}})");
    REQUIRE(result.success());

    const auto& root = *result.value;
    REQUIRE(root.is_object());
    CHECK(*root.find("table") == Value{"users"});
    CHECK(root.find("empty")->as_object().empty());

    const auto& rows = root.find("rows")->as_array();
    REQUIRE(rows.size() == 2U);
    CHECK(*rows[1].find("id") == Value{2});
    CHECK(rows[1].find("tags")->as_array().empty());
}

TEST_CASE("parse_json decodes escapes")
{
    const auto result = docstore::storage::parse_json(R"("line\nbreak \"quoted\" \u00e9 \ud83d\ude00")");
    REQUIRE(result.success());
    CHECK(result.value->as_string() == "line\nbreak \"quoted\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST_CASE("parse_json reports where parsing stopped")
{
    auto result = docstore::storage::parse_json(R"({"a": })");
    REQUIRE_FALSE(result.success());
    CHECK(result.message == "expected a value after ':'");
    CHECK(result.line == 1U);
    CHECK(result.column == 7U);

    result = docstore::storage::parse_json("{\n  \"a\": 1\n} trailing");
    REQUIRE_FALSE(result.success());
    CHECK(result.message == "unexpected content after JSON value");
    CHECK(result.line == 3U);

    result = docstore::storage::parse_json("[1, 2");
    REQUIRE_FALSE(result.success());
    CHECK(result.message == "expected ',' or ']'");

    result = docstore::storage::parse_json("");
    REQUIRE_FALSE(result.success());
    CHECK_FALSE(result.message.empty());
}

TEST_CASE("parse_json rejects non-standard literals")
{
    CHECK_FALSE(docstore::storage::parse_json("{'a': 1}").success());
    CHECK_FALSE(docstore::storage::parse_json("[1,]").success());
    CHECK_FALSE(docstore::storage::parse_json("01").success());
    CHECK_FALSE(docstore::storage::parse_json("NaN").success());
}

TEST_CASE("write_json emits compact output")
{
    const Value value{ValueObject{
        {"name", Value{"a\"b"}},
        {"count", Value{3}},
        {"ratio", Value{0.25}},
        {"items", Value{ValueArray{Value{true}, Value{}}}}}};

    CHECK(docstore::storage::write_json(value) == R"({"count":3,"items":[true,null],"name":"a\"b","ratio":0.25})");
}

TEST_CASE("write_json indents one member per line")
{
    const Value value{ValueObject{{"a", Value{1}}, {"b", Value{ValueArray{Value{true}}}}}};

    const std::string expected = "{\n  \"a\": 1,\n  \"b\": [\n    true\n  ]\n}";
    CHECK(docstore::storage::write_json(value, 2U) == expected);
}

TEST_CASE("append_json_string escapes control characters")
{
    std::string out;
    docstore::storage::append_json_string(out, std::string{"tab\there\x01"});
    CHECK(out == "\"tab\\there\\u0001\"");
}
