#include <catch2/catch.hpp>
#include <ort/ort.h>

#include <cmath>
#include <string>

using namespace ort;

TEST_CASE("Mixed object renders one block per key", "[generate]") {
    Value v{{"a", 1}, {"b", Value::array({Value{{"x", 1}, {"y", 2}}, Value{{"x", 3}, {"y", 4}}})}};
    REQUIRE(generate(v) == "a:\n1\n\nb:x,y:\n1,2\n3,4\n");
}

TEST_CASE("Single key object with a uniform array is one table", "[generate]") {
    Value v{{"people",
             Value::array({Value{{"name", "Alice"}, {"age", 30}}, Value{{"age", 25}, {"name", "Bob"}}})}};
    // rows follow the first row's key order regardless of their own
    REQUIRE(generate(v) == "people:name,age:\nAlice,30\nBob,25");
}

TEST_CASE("Single key object with a scalar", "[generate]") {
    REQUIRE(generate(Value{{"n", 3.5}}) == "n:\n3.5");
    REQUIRE(generate(Value{{"tags", Value::array({"a", "b"})}}) == "tags:\n[a,b]");
    REQUIRE(generate(Value{{"none", nullptr}}) == "none:\n");
    REQUIRE(generate(Value{{"empty", Value::array()}}) == "empty:\n[]");
}

TEST_CASE("Empty object renders as empty text", "[generate]") {
    REQUIRE(generate(Value::object()).empty());
}

TEST_CASE("Top level arrays use the anonymous header", "[generate]") {
    Value rows = Value::array({Value{{"id", 1}}, Value{{"id", 2}}});
    REQUIRE(generate(rows) == ":id:\n1\n2");
    REQUIRE(generate(Value::array({1, "two", true})) == ":[1,two,true]");
    REQUIRE(generate(Value::array()) == ":[]");
    // one row would read back as a bare record
    REQUIRE(generate(Value::array({Value{{"id", 1}}})) == ":[(id:1)]");
}

TEST_CASE("Top level scalars render their literal", "[generate]") {
    REQUIRE(generate(Value(42)) == "42");
    REQUIRE(generate(Value(-0.25)) == "-0.25");
    REQUIRE(generate(Value(true)) == "true");
    REQUIRE(generate(Value("a,b\nc")) == "a\\,b\\nc");
    REQUIRE(generate(Value()) == "");
}

TEST_CASE("Heterogeneous object arrays use the literal form", "[generate]") {
    Value v{{"items", Value::array({Value{{"a", 1}}, Value{{"b", 2}}})}};
    REQUIRE(generate(v) == "items:\n[(a:1),(b:2)]");

    Value mixed{{"items", Value::array({Value{{"a", 1}}, 5})}};
    REQUIRE(generate(mixed) == "items:\n[(a:1),5]");
}

TEST_CASE("Nested objects become header groups", "[generate][nested]") {
    Value people = Value::array({
                Value{{"name", "Alice"}, {"addr", Value{{"street", "Main St"}, {"city", "NYC"}}}},
                Value{{"name", "Bob"}, {"addr", Value{{"city", "LA"}, {"street", "Elm"}}}},
                Value{{"name", "Eve"}, {"addr", nullptr}},
    });
    REQUIRE(generate(Value{{"people", people}}) ==
            "people:name,addr(street,city):\nAlice,(Main St,NYC)\nBob,(Elm,LA)\nEve,");
}

TEST_CASE("Deep nesting recurses", "[generate][nested]") {
    Value row{{"k", "a"}, {"style", Value{{"stroke", Value{{"color", "red"}, {"width", 2}}}, {"fill", "blue"}}}};
    Value rows = Value::array({row, row});
    REQUIRE(generate(Value{{"s", rows}}) ==
            "s:k,style(stroke(color,width),fill):\na,((red,2),blue)\na,((red,2),blue)");
}

TEST_CASE("Inconsistent nested shapes stay inline", "[generate][nested]") {
    Value rows = Value::array({
                Value{{"id", 1}, {"meta", Value{{"a", 1}}}},
                Value{{"id", 2}, {"meta", Value{{"b", 2}}}},
    });
    REQUIRE(generate(Value{{"t", rows}}) == "t:id,meta:\n1,(a:1)\n2,(b:2)");
}

TEST_CASE("Empty nested objects render as ()", "[generate][nested]") {
    Value rows = Value::array({Value{{"id", 1}, {"meta", Value::object()}}, Value{{"id", 2}, {"meta", Value::object()}}});
    REQUIRE(generate(Value{{"t", rows}}) == "t:id,meta:\n1,()\n2,()");
}

TEST_CASE("One-key groups whose tuple would read as () stay inline", "[generate][nested]") {
    Value empty{{"t", Value::array({Value{{"id", 1}, {"m", Value{{"k", ""}}}}, Value{{"id", 2}, {"m", Value{{"k", "x"}}}}})}};
    REQUIRE(generate(empty) == "t:id,m:\n1,(k:)\n2,(k:x)");

    Value none{{"t", Value::array({Value{{"id", 1}, {"m", Value{{"k", nullptr}}}}, Value{{"id", 2}, {"m", Value{{"k", 3}}}}})}};
    REQUIRE(generate(none) == "t:id,m:\n1,(k:)\n2,(k:3)");

    Value deep{{"t", Value::array({Value{{"id", 1}, {"m", Value{{"k", Value{{"j", ""}}}}}},
                                   Value{{"id", 2}, {"m", Value{{"k", Value{{"j", "y"}}}}}}})}};
    REQUIRE(generate(deep) == "t:id,m(k):\n1,((j:))\n2,((j:y))");

    Value wider{{"t", Value::array({Value{{"id", 1}, {"m", Value{{"k", ""}, {"n", 1}}}}, Value{{"id", 2}, {"m", Value{{"k", "x"}, {"n", 2}}}}})}};
    REQUIRE(generate(wider) == "t:id,m(k,n):\n1,(,1)\n2,(x,2)");
}

TEST_CASE("Null array elements keep their slots", "[generate][literal]") {
    std::string text = generate(Value{{"a", Value::array({1, nullptr})}});
    REQUIRE(text == "a:\n[1,]");
    REQUIRE(parse(text) == Value{{"a", Value::array({1, nullptr})}});
    REQUIRE(generate(Value::array({nullptr, nullptr})) == ":[,]");
}

TEST_CASE("Rows that would read as headers or comments fall back to literals", "[generate]") {
    Value comment{{"t", Value::array({Value{{"s", "#x"}}, Value{{"s", "y"}}})}};
    REQUIRE(generate(comment) == "t:\n[(s:#x),(s:y)]");

    Value blank{{"t", Value::array({Value{{"s", nullptr}}, Value{{"s", 1}}})}};
    REQUIRE(generate(blank) == "t:\n[(s:),(s:1)]");
}

TEST_CASE("Strings are escaped and numbers canonical", "[generate][escape]") {
    Value v{{"t", Value::array({Value{{"s", "a,b"}, {"n", 1.5}}, Value{{"s", "(x)"}, {"n", 1e20}}})}};
    REQUIRE(generate(v) == "t:s,n:\na\\,b,1.5\n\\(x\\),1e+20");
    REQUIRE(generate(Value{{"x", std::nan("")}}) == "x:\nnan");
}
