// test_rules.cpp - Tests for built-in normalization rules and predicates

#include <catch2/catch_all.hpp>
#include <semdiff/diff_engine.h>
#include <semdiff/errors.h>
#include <semdiff/rules.h>

#include <regex>
#include <string>

using namespace semdiff;

namespace {

NormalizedPair run(const Rule& rule, const Value& expected, const Value& actual, std::string_view name = "") {
    DiffEngine engine;
    return rule.transform(expected, actual, name, engine);
}

} // namespace

// ============================================================
// File extension predicate
// ============================================================

TEST_CASE("file_extension", "[rules][predicate]") {
    REQUIRE(file_extension("data.json") == ".json");
    REQUIRE(file_extension("dir/archive.tar.gz") == ".gz");
    REQUIRE(file_extension("dir.d/readme") == "");
    REQUIRE(file_extension("dir.d\\readme") == "");
    REQUIRE(file_extension("trailing.") == "");
    REQUIRE(file_extension("noext") == "");
    REQUIRE(file_extension(".json") == ".json");
}

TEST_CASE("has_file_extension is case-insensitive", "[rules][predicate]") {
    auto is_json = has_file_extension({".json"});
    Value any;

    REQUIRE(is_json(any, any, "a.json"));
    REQUIRE(is_json(any, any, "A.JSON"));
    REQUIRE_FALSE(is_json(any, any, "a.jsonx"));
    REQUIRE_FALSE(is_json(any, any, "json"));
    REQUIRE_FALSE(is_json(any, any, ""));

    auto is_html = has_file_extension({".html", ".htm"});
    REQUIRE(is_html(any, any, "page.htm"));
    REQUIRE(is_html(any, any, "page.Html"));
}

// ============================================================
// Scalar rules
// ============================================================

TEST_CASE("ignore_null rule", "[rules][ignore_null]") {
    auto rule = rules::ignore_null();

    auto out = run(rule, Value{}, Value{"anything"});
    REQUIRE(out.expected.is_null());
    REQUIRE(out.actual.is_null());

    out = run(rule, Value{"x"}, Value{"y"});
    REQUIRE(out.expected == Value{"x"});
    REQUIRE(out.actual == Value{"y"});

    SECTION("predicate restricts the rule") {
        Rule restricted = rules::ignore_null(
            [](const Value&, const Value&, std::string_view name) { return name == "id"; });
        REQUIRE(restricted.applies(Value{}, Value{1}, "id"));
        REQUIRE_FALSE(restricted.applies(Value{}, Value{1}, "other"));
        REQUIRE(rule.applies(Value{}, Value{1}, "anything"));
    }
}

TEST_CASE("negate rule", "[rules][negate]") {
    auto rule = rules::negate();

    SECTION("different value passes") {
        auto out = run(rule, Value{"!value"}, Value{"a value"});
        REQUIRE(out.expected == Value{"a value"});
        REQUIRE(out.actual == Value{"a value"});
    }

    SECTION("same value is left to fail") {
        auto out = run(rule, Value{"!value"}, Value{"value"});
        REQUIRE(out.expected == Value{"!value"});
        REQUIRE(out.actual == Value{"value"});
    }

    SECTION("non-string actual untouched") {
        auto out = run(rule, Value{"!1"}, Value{2});
        REQUIRE(out.expected == Value{"!1"});
    }
}

TEST_CASE("regex rule", "[rules][regex]") {
    auto rule = rules::regex();

    REQUIRE(run(rule, Value{"/^a*$/"}, Value{"a"}).expected == Value{"a"});
    REQUIRE(run(rule, Value{"/^a*$/"}, Value{"b"}).expected == Value{"/^a*$/"});

    SECTION("search semantics") {
        REQUIRE(run(rule, Value{"/b+/"}, Value{"abbbc"}).expected == Value{"abbbc"});
    }

    SECTION("needs slashes around a non-empty pattern") {
        REQUIRE(run(rule, Value{"//"}, Value{"x"}).expected == Value{"//"});
        REQUIRE(run(rule, Value{"/a"}, Value{"a"}).expected == Value{"/a"});
    }

    SECTION("malformed pattern propagates") {
        REQUIRE_THROWS_AS(run(rule, Value{"/(/"}, Value{"x"}), std::regex_error);
    }
}

TEST_CASE("wildcard rule", "[rules][wildcard]") {
    auto rule = rules::wildcard();

    REQUIRE(run(rule, Value{"a*"}, Value{"aa"}).expected == Value{"aa"});
    REQUIRE(run(rule, Value{"a*"}, Value{"bb"}).expected == Value{"a*"});

    SECTION("anchored at both ends") {
        REQUIRE(run(rule, Value{"*b"}, Value{"abc"}).expected == Value{"*b"});
        REQUIRE(run(rule, Value{"a*c"}, Value{"abbbc"}).expected == Value{"abbbc"});
    }

    SECTION("other characters are literal") {
        REQUIRE(run(rule, Value{"v1.*"}, Value{"v1.2"}).expected == Value{"v1.2"});
        REQUIRE(run(rule, Value{"v1.*"}, Value{"v142"}).expected == Value{"v1.*"});
        REQUIRE(run(rule, Value{"(x)*"}, Value{"(x)yz"}).expected == Value{"(x)yz"});
        REQUIRE(run(rule, Value{"[a]*"}, Value{"a"}).expected == Value{"[a]*"});
    }
}

// ============================================================
// Object rules
// ============================================================

TEST_CASE("additional_properties rule", "[rules][additional_properties]") {
    auto expected = Value::object({{"a", 1}});
    auto actual = Value::object({{"b", 2}, {"a", 1}, {"c", 3}});

    SECTION("extra keys dropped") {
        auto out = run(rules::additional_properties(), expected, actual);
        REQUIRE(out.actual == Value::object({{"a", 1}}));
        REQUIRE(actual.size() == 3);
    }

    SECTION("required keys kept") {
        auto rule = rules::additional_properties({}, [](std::string_view key) { return key == "c"; });
        auto out = run(rule, expected, actual);
        REQUIRE(out.actual == Value::object({{"a", 1}, {"c", 3}}));
    }

    SECTION("non-objects untouched") {
        auto out = run(rules::additional_properties(), Value::array({}), actual);
        REQUIRE(out.actual == actual);
    }
}

// ============================================================
// Nested document rules
// ============================================================

TEST_CASE("nested_json rule", "[rules][json]") {
    auto rule = rules::nested_json();

    SECTION("default predicate looks at the extension") {
        REQUIRE(rule.applies(Value{""}, Value{""}, "result.json"));
        REQUIRE_FALSE(rule.applies(Value{""}, Value{""}, "result.txt"));
    }

    SECTION("both sides rewritten as indented JSON") {
        auto out = run(rule, Value{R"({"a":1,"n":null})"}, Value{R"({ "a" : 1 })"});
        REQUIRE(out.expected == Value{"{\n  \"a\": 1\n}"});
        REQUIRE(out.actual == Value{"{\n  \"a\": 1\n}"});
    }

    SECTION("calling engine rules apply inside") {
        DiffEngine engine = DiffEngineBuilder().use_wildcard().finish();
        auto out = rule.transform(Value{R"({"id":"x*"})"}, Value{R"({"id":"xyz"})"}, "a.json", engine);
        REQUIRE(out.expected == out.actual);
    }

    SECTION("explicit engine overrides the calling one") {
        auto inner = std::make_shared<const DiffEngine>(DiffEngineBuilder().use_wildcard().finish());
        auto explicit_rule = rules::nested_json({}, inner);
        auto out = run(explicit_rule, Value{R"(["x*"])"}, Value{R"(["xyz"])"});
        REQUIRE(out.expected == out.actual);
    }

    SECTION("invalid JSON propagates") {
        REQUIRE_THROWS_AS(run(rule, Value{"{"}, Value{"{}"}), JsonParseError);
    }

    SECTION("non-strings untouched") {
        auto out = run(rule, Value{1}, Value{"{}"});
        REQUIRE(out.expected == Value{1});
        REQUIRE(out.actual == Value{"{}"});
    }
}

TEST_CASE("nested_html rule", "[rules][html]") {
    auto rule = rules::nested_html();

    REQUIRE(rule.applies(Value{""}, Value{""}, "page.htm"));
    REQUIRE_FALSE(rule.applies(Value{""}, Value{""}, "page.txt"));

    auto out = run(rule, Value{R"(<p b="1" a="2">x</p>)"}, Value{R"(<p a="2"  b="1"> x </p>)"});
    REQUIRE(out.expected == out.actual);
    REQUIRE(out.expected == Value{"<p a=\"2\" b=\"1\">\n  x\n</p>"});
}
