// test_serialization.cpp - Tests for the JSON codec

#include <catch2/catch_all.hpp>
#include <semdiff/errors.h>
#include <semdiff/serialization.h>

#include <cmath>
#include <limits>
#include <string>

using namespace semdiff;

// ============================================================
// Parsing
// ============================================================

TEST_CASE("from_json parses all kinds", "[serialization][parse]") {
    auto v = from_json(R"({"s": "x", "i": -12, "f": 1.5, "e": 2e3, "b": true, "n": null, "a": [1, {}]})");

    REQUIRE(v.keys() == std::vector<std::string>{"s", "i", "f", "e", "b", "n", "a"});
    REQUIRE(v.at("s") == Value{"x"});
    REQUIRE(v.at("i") == Value{-12});
    REQUIRE(v.at("f") == Value{1.5});
    REQUIRE(v.at("e") == Value{2000.0});
    REQUIRE(v.at("b") == Value{true});
    REQUIRE(v.at("n").is_null());
    REQUIRE(v.at("a").size() == 2);
}

TEST_CASE("from_json numbers", "[serialization][parse]") {
    SECTION("int64 range stays integer") {
        REQUIRE(from_json("9223372036854775807").is_integer());
        REQUIRE(from_json("-9223372036854775808").is_integer());
    }

    SECTION("beyond int64 becomes float") {
        auto v = from_json("9223372036854775808");
        REQUIRE(v.is_float());
    }

    SECTION("huge exponent saturates") {
        REQUIRE(std::isinf(from_json("1e400").as_number()));
        REQUIRE(from_json("1e-400").as_number() == 0.0);
    }

    SECTION("invalid forms") {
        REQUIRE_THROWS_AS(from_json("01"), JsonParseError);
        REQUIRE_THROWS_AS(from_json("1."), JsonParseError);
        REQUIRE_THROWS_AS(from_json("+1"), JsonParseError);
        REQUIRE_THROWS_AS(from_json("-"), JsonParseError);
    }
}

TEST_CASE("from_json strings", "[serialization][parse]") {
    REQUIRE(from_json(R"("a\nb\t\"q\"")").as_string() == "a\nb\t\"q\"");
    REQUIRE(from_json(R"("é")").as_string() == "\xC3\xA9");
    REQUIRE(from_json(R"("😀")").as_string() == "\xF0\x9F\x98\x80");
    REQUIRE_THROWS_AS(from_json("\"line\nbreak\""), JsonParseError);
    REQUIRE_THROWS_AS(from_json(R"("\x")"), JsonParseError);
    REQUIRE_THROWS_AS(from_json(R"("open)"), JsonParseError);

    SECTION("lone surrogates are rejected") {
        REQUIRE_THROWS_AS(from_json(R"("\uD800")"), JsonParseError);
        REQUIRE_THROWS_AS(from_json(R"("\uD83Dx")"), JsonParseError);
        REQUIRE_THROWS_AS(from_json(R"("\uDE00")"), JsonParseError);
        REQUIRE_THROWS_AS(from_json(R"("\uD83D\u0041")"), JsonParseError);
        REQUIRE(from_json(R"("\uD83D\uDE00")").as_string() == "\xF0\x9F\x98\x80");
    }
}

TEST_CASE("parse_decimal_double saturates out-of-range literals", "[serialization][parse]") {
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE(parse_decimal_double("2.5") == 2.5);
    REQUIRE(parse_decimal_double("+1e3") == 1000.0);
    REQUIRE(parse_decimal_double("1e400") == inf);
    REQUIRE(parse_decimal_double("-1e400") == -inf);
    REQUIRE(parse_decimal_double("123.4e310") == inf);
    REQUIRE(parse_decimal_double(std::string(400, '9')) == inf);

    auto tiny = parse_decimal_double("-0.000001e-400");
    REQUIRE(tiny == 0.0);
    REQUIRE(std::signbit(*tiny));
    REQUIRE(parse_decimal_double("1e-400") == 0.0);
    REQUIRE(parse_decimal_double("1e99999999999999999999") == inf);

    REQUIRE_FALSE(parse_decimal_double("inf").has_value());
    REQUIRE_FALSE(parse_decimal_double("nan").has_value());
    REQUIRE_FALSE(parse_decimal_double("1,5").has_value());
    REQUIRE_FALSE(parse_decimal_double("").has_value());
}

TEST_CASE("from_json rejects malformed documents", "[serialization][parse]") {
    SECTION("duplicate keys") {
        try {
            (void)from_json(R"({"a": 1, "a": 2})");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.position() == 9);
            REQUIRE(std::string(e.what()).find("Duplicate key 'a'") != std::string::npos);
        }
    }

    SECTION("trailing content") {
        REQUIRE_THROWS_AS(from_json("{} x"), JsonParseError);
    }

    SECTION("error position") {
        try {
            (void)from_json("[1, 2,, 3]");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.position() == 6);
        }
    }

    SECTION("empty input") {
        REQUIRE_THROWS_AS(from_json("   "), JsonParseError);
    }

    SECTION("non-throwing overload") {
        std::string error;
        auto v = from_json("[1,", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());
    }
}

// ============================================================
// Writing
// ============================================================

TEST_CASE("to_json layout", "[serialization][write]") {
    auto v = Value::object({{"a", 1}, {"b", Value::array({true, nullptr})}, {"c", Value::object({})}});

    SECTION("compact") {
        JsonWriteOptions options;
        options.compact = true;
        REQUIRE(to_json(v, options) == R"({"a":1,"b":[true,null],"c":{}})");
    }

    SECTION("indented") {
        REQUIRE(to_json(v) ==
                "{\n"
                "  \"a\": 1,\n"
                "  \"b\": [\n"
                "    true,\n"
                "    null\n"
                "  ],\n"
                "  \"c\": {}\n"
                "}");
    }

    SECTION("empty array") {
        REQUIRE(to_json(Value::array({})) == "[]");
    }
}

TEST_CASE("to_json options", "[serialization][write]") {
    SECTION("omit null members") {
        JsonWriteOptions options;
        options.compact = true;
        options.omit_null_members = true;
        auto v = Value::object({{"a", nullptr}, {"b", 1}, {"c", Value::array({nullptr})}});
        REQUIRE(to_json(v, options) == R"({"b":1,"c":[null]})");
    }

    SECTION("multiline strings") {
        JsonWriteOptions options;
        options.multiline_strings = true;
        REQUIRE(to_json(Value{"one\r\ntwo"}, options) == "\"one\ntwo\"");
        REQUIRE(to_json(Value{"one\r\ntwo"}) == R"("one\r\ntwo")");
    }

    SECTION("open empty objects") {
        JsonWriteOptions options;
        options.open_empty_objects = true;
        REQUIRE(to_json(Value::object({}), options) == "{\n}");
    }
}

TEST_CASE("to_json numbers", "[serialization][write]") {
    JsonWriteOptions compact;
    compact.compact = true;

    REQUIRE(to_json(Value{2.0}) == "2.0");
    REQUIRE(to_json(Value{0.1}) == "0.1");
    REQUIRE(to_json(Value{1e300}) == "1e+300");
    REQUIRE(to_json(Value{-7}) == "-7");
    REQUIRE(to_json(Value{std::numeric_limits<double>::quiet_NaN()}) == "NaN");
    REQUIRE(to_json(Value{std::numeric_limits<double>::infinity()}) == "Infinity");
    REQUIRE(to_json(Value{-std::numeric_limits<double>::infinity()}) == "-Infinity");
}

TEST_CASE("JSON text round trip keeps kinds and order", "[serialization][roundtrip]") {
    const std::string text = R"({"z":[1,2.5,"s",false,null],"a":{"nested":-0.5}})";
    JsonWriteOptions compact;
    compact.compact = true;

    auto v = from_json(text);
    REQUIRE(to_json(v, compact) == text);
    REQUIRE(from_json(to_json(v)) == v);
}
