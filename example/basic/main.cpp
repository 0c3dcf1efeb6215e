// main.cpp
// Basic Example - verifying a JSON result against a YAML expectation
//
// The expectation is written by hand in YAML and uses the matching rules:
//   ~          any value is accepted
//   "!x"       anything but x
//   "/re/"     must contain a match of re
//   "a*"       wildcard
// Members the expectation does not mention are ignored, and "*.json"
// members are compared as nested JSON documents.

#include <semdiff/diff_engine.h>
#include <semdiff/errors.h>
#include <semdiff/serialization.h>
#include <semdiff/yaml_converter.h>

#include <iostream>
#include <string>

using namespace semdiff;

// ============================================================
// Test data
// ============================================================

const char* kExpectation = R"(
request: GET /users/42
response:
  status: 200
  id: ~
  name: J*
  email: /@example\.com$/
  role: '!guest'
  payload.json: '{"items": [1, 2, 3]}'
)";

const char* kActualPass = R"({
  "request": "GET /users/42",
  "response": {
    "status": 200,
    "id": "6f1c2d",
    "name": "Jane",
    "email": "jane@example.com",
    "role": "admin",
    "created": "2024-05-01",
    "payload.json": "{\"items\":[1,2,3],\"cursor\":null}"
  }
})";

const char* kActualFail = R"({
  "request": "GET /users/42",
  "response": {
    "status": 404,
    "id": "6f1c2d",
    "name": "Bob",
    "email": "bob@example.org",
    "role": "guest",
    "payload.json": "{\"items\":[1,2]}"
  }
})";

void run_case(const DiffEngine& engine, const Value& expected, const char* label, const char* actual_json)
{
    std::cout << "=== " << label << " ===\n";
    try {
        engine.verify(expected, from_json(actual_json), label);
        std::cout << "passed\n\n";
    } catch (const DiffMismatchError& e) {
        std::cout << e.what() << "\n";
    }
}

int main()
{
    auto expected = yaml_to_value(kExpectation, [](const YamlEvent& key) {
        std::cerr << "duplicate key '" << key.value << "' at line " << key.line << "\n";
    });
    if (!expected) {
        std::cerr << "empty expectation\n";
        return 1;
    }

    DiffEngine engine = DiffEngineBuilder()
        .use_ignore_null()
        .use_negate()
        .use_regex()
        .use_wildcard()
        .use_additional_properties()
        .use_json()
        .finish();

    run_case(engine, *expected, "matching response", kActualPass);
    run_case(engine, *expected, "mismatching response", kActualFail);

    return 0;
}
