// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file rules.h
/// @brief Normalization rules applied by DiffEngine before the text diff.
///
/// A Rule is a (predicate, transform) pair. The transform receives the
/// expected/actual pair at one node and returns a rewritten pair; the
/// predicate, when set, decides whether the transform runs at all. Rules
/// run in registration order at every node, each one seeing the output of
/// the previous one, before the engine recurses into children.
///
/// @code
///   DiffEngine engine = DiffEngineBuilder()
///       .use_ignore_null()
///       .use_wildcard()
///       .use_json()          // *.json members compared as nested JSON
///       .finish();
///
///   // Custom rule: compare "id" members case-insensitively
///   builder.use(
///       [](const Value&, const Value&, std::string_view name) { return name == "id"; },
///       [](const Value& e, const Value& a, std::string_view, const DiffEngine&) {
///           return NormalizedPair{to_lower(e), to_lower(a)};
///       });
/// @endcode

#pragma once

#include "api.h"
#include "value.h"
#include "value_fwd.h"

#include <immer/vector.hpp>

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff {

/// Expected and actual value after normalization
struct NormalizedPair {
    Value expected;
    Value actual;
};

/// @param name Member key when the pair is an object member, "" otherwise
using Predicate = std::function<bool(const Value& expected, const Value& actual, std::string_view name)>;

/// @param engine The engine currently normalizing, for rules that recurse
using Transform = std::function<NormalizedPair(const Value& expected,
                                               const Value& actual,
                                               std::string_view name,
                                               const DiffEngine& engine)>;

/// Decides whether an actual-only object member must be kept
using KeyPredicate = std::function<bool(std::string_view key)>;

struct Rule {
    Predicate predicate;  ///< empty: always applies
    Transform transform;

    [[nodiscard]] bool applies(const Value& expected, const Value& actual, std::string_view name) const {
        return !predicate || predicate(expected, actual, name);
    }
};

using RuleChain = immer::vector<Rule, memory_policy>;

/// Predicate matching member names whose file extension is one of
/// `extensions` (compared case-insensitively, dot included, e.g. ".json").
/// The extension is the text from the last '.' after the last '/' or '\\';
/// a name ending in '.' has none.
[[nodiscard]] SEMDIFF_API Predicate has_file_extension(std::vector<std::string> extensions);

[[nodiscard]] inline Predicate has_file_extension(std::initializer_list<std::string> extensions) {
    return has_file_extension(std::vector<std::string>(extensions));
}

/// Extension of `name` as described above; "" when there is none
[[nodiscard]] SEMDIFF_API std::string_view file_extension(std::string_view name) noexcept;

namespace rules {

/// Expected null accepts any actual value: { "a": null } matches { "a": "anything" }
[[nodiscard]] SEMDIFF_API Rule ignore_null(Predicate predicate = {});

/// Expected "!value" accepts any string except "value"
[[nodiscard]] SEMDIFF_API Rule negate(Predicate predicate = {});

/// Expected "/pattern/" accepts any string containing a match of the
/// ECMAScript regex `pattern`. Malformed patterns throw std::regex_error.
[[nodiscard]] SEMDIFF_API Rule regex(Predicate predicate = {});

/// Expected string containing '*' accepts any string matching it in full,
/// '*' standing for any run of characters
[[nodiscard]] SEMDIFF_API Rule wildcard(Predicate predicate = {});

/// Actual object members absent from the expected object are dropped,
/// unless `is_required` accepts the key
[[nodiscard]] SEMDIFF_API Rule additional_properties(Predicate predicate = {}, KeyPredicate is_required = {});

/// String pair parsed as JSON, normalized with `engine` (or the calling
/// engine when null) and written back as indented JSON without null members.
/// Default predicate: member name ends in ".json".
/// @throws JsonParseError when either side is not valid JSON
[[nodiscard]] SEMDIFF_API Rule nested_json(Predicate predicate = {},
                                           std::shared_ptr<const DiffEngine> engine = nullptr);

/// String pair rewritten to canonical HTML (see canonicalize_html).
/// Default predicate: member name ends in ".html" or ".htm".
[[nodiscard]] SEMDIFF_API Rule nested_html(Predicate predicate = {});

} // namespace rules

} // namespace semdiff
