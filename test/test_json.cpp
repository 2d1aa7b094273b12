#include <catch2/catch.hpp>
#include <ort/json.h>
#include <ort/ort.h>

#include <cmath>
#include <string>

using namespace ort;
using namespace ort::json_literals;

TEST_CASE("parse_json reads every JSON type", "[json]") {
    auto v = parse_json(R"({"s":"hi","n":-1.5e2,"t":true,"f":false,"z":null,"a":[1,[2]],"o":{"k":"v"}})");
    REQUIRE(v.get("s") == Value("hi"));
    REQUIRE(v.get("n") == Value(-150));
    REQUIRE(v.get("t") == Value(true));
    REQUIRE(v.get("f") == Value(false));
    REQUIRE(v.get("z").isNull());
    REQUIRE(v.get("a") == Value::array({1, Value::array({2})}));
    REQUIRE(v.get("o") == Value{{"k", "v"}});
}

TEST_CASE("parse_json keeps key order", "[json]") {
    auto v = R"({"b":1,"a":2,"c":3})"_json;
    REQUIRE(v.keys() == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("parse_json decodes string escapes", "[json]") {
    auto v = parse_json(R"(["a\"b", "tab\there", "\u00e9", "\ud83d\ude00", "\/"])");
    REQUIRE(v.get(0) == Value("a\"b"));
    REQUIRE(v.get(1) == Value("tab\there"));
    REQUIRE(v.get(2) == Value("\xC3\xA9"));
    REQUIRE(v.get(3) == Value("\xF0\x9F\x98\x80"));
    REQUIRE(v.get(4) == Value("/"));
}

TEST_CASE("parse_json skips comments", "[json][comments]") {
    auto v = parse_json("// leading\n{ /* inline */ \"a\": 1, // trailing\n \"b\": 2 }");
    REQUIRE(v == Value{{"a", 1}, {"b", 2}});
}

TEST_CASE("parse_json accepts top level scalars", "[json]") {
    REQUIRE(parse_json("  42 ") == Value(42));
    REQUIRE(parse_json("\"x\"") == Value("x"));
    REQUIRE(parse_json("null").isNull());
}

TEST_CASE("parse_json errors carry position", "[json][errors]") {
    try {
        parse_json("{\n  \"a\": 1,\n  \"b\" 2\n}");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(e.line == 3);
        REQUIRE(e.column == 7);
        REQUIRE(e.code == "  \"b\" 2");
        std::string msg = e.what();
        REQUIRE(msg.find("expected ':' after object key") != std::string::npos);
        REQUIRE(msg.find("opened at line 1") != std::string::npos);
    }
}

TEST_CASE("parse_json rejects malformed documents", "[json][errors]") {
    REQUIRE_THROWS_AS(parse_json(""), ParseError);
    REQUIRE_THROWS_AS(parse_json("true false"), ParseError);
    REQUIRE_THROWS_AS(parse_json("[1,]"), ParseError);
    REQUIRE_THROWS_AS(parse_json("{\"a\":1,}"), ParseError);
    REQUIRE_THROWS_AS(parse_json("[1 2]"), ParseError);
    REQUIRE_THROWS_AS(parse_json("{\"a\":1 \"b\":2}"), ParseError);
    REQUIRE_THROWS_AS(parse_json("\"open"), ParseError);
    REQUIRE_THROWS_AS(parse_json("01x"), ParseError);
    REQUIRE_THROWS_AS(parse_json("/* never closed"), ParseError);
    REQUIRE_THROWS_AS(parse_json("[\"\\q\"]"), ParseError);
}

TEST_CASE("parse_json rejects duplicate keys", "[json][errors]") {
    try {
        parse_json(R"({"a":1,"a":2})");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(std::string(e.what()).find("duplicate key 'a'") != std::string::npos);
    }
}

TEST_CASE("parse_json suggests fixes for common mistakes", "[json][errors]") {
    try {
        parse_json("{\"a\": True}");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(std::string(e.what()).find("did you mean 'true'") != std::string::npos);
    }
    try {
        parse_json("{a: 1}");
        FAIL("expected parse to throw");
    } catch (const ParseError& e) {
        REQUIRE(std::string(e.what()).find("missing quotes around 'a'") != std::string::npos);
    }
}

TEST_CASE("dump_json compact output", "[json][dump]") {
    Value v{{"name", "A \"q\"\n"}, {"n", 1.5}, {"i", 3}, {"l", Value::array({true, nullptr})}, {"o", Value::object()}};
    REQUIRE(dump_json(v) == R"({"name":"A \"q\"\n","n":1.5,"i":3,"l":[true,null],"o":{}})");
    REQUIRE(dump_json(Value::array()) == "[]");
    REQUIRE(dump_json(Value(std::nan(""))) == "null");
    REQUIRE(dump_json(Value("\x01")) == "\"\\u0001\"");
}

TEST_CASE("dump_json pretty output", "[json][dump]") {
    Value v{{"a", 1}, {"b", Value::array({1, 2})}};
    REQUIRE(dump_json(v, 2) == "{\n  \"a\": 1,\n  \"b\": [\n    1,\n    2\n  ]\n}");
}

TEST_CASE("JSON and ORT agree on values", "[json][ort]") {
    auto from_json = parse_json(R"({"people":[{"name":"Alice","age":30},{"name":"Bob","age":25}]})");
    auto from_ort = parse("people:name,age:\nAlice,30\nBob,25");
    REQUIRE(from_json == from_ort);
    REQUIRE(parse_json(dump_json(from_ort, 4)) == from_ort);
}
