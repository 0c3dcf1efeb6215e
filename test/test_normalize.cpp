// test_normalize.cpp - Tests for recursive normalization

#include <catch2/catch_all.hpp>
#include <semdiff/builders.h>
#include <semdiff/diff_engine.h>
#include <semdiff/serialization.h>

#include <string>
#include <vector>

using namespace semdiff;

namespace {

DiffEngine full_engine() {
    return DiffEngineBuilder()
        .use_ignore_null()
        .use_negate()
        .use_regex()
        .use_wildcard()
        .use_additional_properties()
        .use_json()
        .use_html()
        .finish();
}

} // namespace

// ============================================================
// Structure
// ============================================================

TEST_CASE("normalize without rules returns equal trees", "[normalize]") {
    DiffEngine engine;
    auto expected = from_json(R"({"a": [1, {"b": null}], "c": "x"})");
    auto actual = from_json(R"({"c": "y", "a": [1, {"b": 2}], "d": true})");

    auto out = engine.normalize(expected, actual);
    REQUIRE(out.expected == expected);
    REQUIRE(out.actual.keys() == std::vector<std::string>{"a", "c", "d"});
    REQUIRE(out.actual.at("a") == actual.at("a"));
}

TEST_CASE("normalize orders actual keys after expected keys", "[normalize][order]") {
    DiffEngine engine;
    auto expected = Value::object({{"b", 1}, {"a", 2}, {"only_expected", 3}});
    auto actual = Value::object({{"extra", 0}, {"a", 2}, {"b", 1}});

    auto out = engine.normalize(expected, actual);
    REQUIRE(out.expected.keys() == std::vector<std::string>{"b", "a", "only_expected"});
    REQUIRE(out.actual.keys() == std::vector<std::string>{"b", "a", "extra"});
}

TEST_CASE("normalize passes member names to rules", "[normalize][names]") {
    std::vector<std::string> names;
    DiffEngine engine = DiffEngineBuilder()
        .use([&](const Value& e, const Value& a, std::string_view name, const DiffEngine&) {
            names.emplace_back(name);
            return NormalizedPair{e, a};
        })
        .finish();

    (void)engine.normalize(Value::object({{"k", Value::array({1})}}),
                           Value::object({{"k", Value::array({2})}}));

    REQUIRE(names == std::vector<std::string>{"", "k", ""});
}

TEST_CASE("rules run in registration order at the same node", "[normalize][chain]") {
    std::string trace;
    DiffEngine engine = DiffEngineBuilder()
        .use([&](const Value& e, const Value&, std::string_view, const DiffEngine&) {
            trace += "1";
            return NormalizedPair{e, Value{"first"}};
        })
        .use([&](const Value& e, const Value& a, std::string_view, const DiffEngine&) {
            trace += "2";
            REQUIRE(a == Value{"first"});
            return NormalizedPair{e, Value{"second"}};
        })
        .finish();

    auto out = engine.normalize(Value{"x"}, Value{"y"});
    REQUIRE(trace == "12");
    REQUIRE(out.actual == Value{"second"});
}

TEST_CASE("predicate gates a custom transform", "[normalize][chain]") {
    DiffEngine engine = DiffEngineBuilder()
        .use([](const Value&, const Value&, std::string_view name) { return name == "time"; },
             [](const Value&, const Value&, std::string_view, const DiffEngine&) {
                 return NormalizedPair{Value{"<time>"}, Value{"<time>"}};
             })
        .finish();

    auto out = engine.normalize(Value::object({{"time", 1}, {"other", 1}}),
                                Value::object({{"time", 2}, {"other", 2}}));
    REQUIRE(out.expected.at("time") == out.actual.at("time"));
    REQUIRE(out.expected.at("other") != out.actual.at("other"));
}

// ============================================================
// Arrays
// ============================================================

TEST_CASE("array tails are never normalized", "[normalize][array]") {
    int calls = 0;
    DiffEngine engine = DiffEngineBuilder()
        .use_ignore_null()
        .use([&](const Value& e, const Value& a, std::string_view, const DiffEngine&) {
            ++calls;
            return NormalizedPair{e, a};
        })
        .finish();

    auto expected = Value::array({nullptr, nullptr});
    auto actual = Value::array({"x", "y", "z"});
    auto out = engine.normalize(expected, actual);

    REQUIRE(calls == 3);  // array node plus two paired elements
    REQUIRE(out.expected == Value::array({nullptr, nullptr}));
    REQUIRE(out.actual == Value::array({nullptr, nullptr, "z"}));
}

// ============================================================
// Purity and idempotence
// ============================================================

TEST_CASE("normalize leaves inputs untouched and shares no storage", "[normalize][purity]") {
    auto engine = full_engine();
    auto expected = from_json(R"({"list": [{"a": null}], "obj": {"k": "v*"}})");
    auto actual = from_json(R"({"list": [{"a": 1, "b": 2}], "obj": {"k": "vvv"}})");
    auto expected_copy = deep_clone(expected);
    auto actual_copy = deep_clone(actual);

    auto out = engine.normalize(expected, actual);

    REQUIRE(expected == expected_copy);
    REQUIRE(actual == actual_copy);
    REQUIRE(&out.actual.as_object()[0].value.get() != &actual.as_object()[0].value.get());
    REQUIRE(&out.expected.as_object()[1].value.get() != &expected.as_object()[1].value.get());
}

TEST_CASE("normalize handles wide objects", "[normalize][order]") {
    ObjectBuilder expected;
    ObjectBuilder actual;
    for (int i = 0; i < 20000; ++i) {
        expected.set("k" + std::to_string(i), i);
        actual.set("k" + std::to_string(19999 - i), 19999 - i);
    }
    actual.set("extra", true);

    auto out = full_engine().normalize(expected.finish(), actual.finish());

    REQUIRE(out.expected == out.actual);
    REQUIRE(out.actual.size() == 20000);
    REQUIRE(out.actual.keys().front() == "k0");
    REQUIRE(out.actual.keys().back() == "k19999");
}

TEST_CASE("normalize is idempotent with built-in rules", "[normalize][idempotence]") {
    auto engine = full_engine();

    auto expected = from_json(R"({
        "id": null,
        "name": "!bob",
        "email": "/@example\\.com$/",
        "version": "1.*",
        "nested": {"a": 1},
        "items": [1, 2],
        "data.json": "{\"x\": 1, \"y\": null}",
        "page.html": "<b  class='c'>hi</b>"
    })");
    auto actual = from_json(R"({
        "id": 7,
        "name": "alice",
        "email": "alice@example.com",
        "version": "1.4",
        "nested": {"a": 1, "extra": true},
        "items": [1, 2, 3],
        "data.json": "{\"x\": 1, \"z\": 5}",
        "page.html": "<b class='c'>hi</b>"
    })");

    auto once = engine.normalize(expected, actual);
    auto twice = engine.normalize(once.expected, once.actual);

    REQUIRE(twice.expected == once.expected);
    REQUIRE(twice.actual == once.actual);
}
