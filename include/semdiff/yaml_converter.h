// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file yaml_converter.h
/// @brief YAML document to Value conversion with YAML 1.1 scalar typing.
///
/// Conversion works on a flat event stream, as produced by a streaming YAML
/// parser. read_yaml_events() records that stream from text with yaml-cpp;
/// YamlConverter turns it into a Value.
///
/// @code
///   auto expected = yaml_to_value(R"(
///   name: Alice
///   age: 30
///   nickname: ~
///   )");
///   // {"name": "Alice", "age": 30, "nickname": null}
///
///   // Report duplicate keys with their position
///   auto doc = yaml_to_value(text, [](const YamlEvent& key) {
///       std::cerr << "duplicate key " << key.value << " at line " << key.line << "\n";
///   });
/// @endcode
///
/// Plain (unquoted) scalars are typed as follows:
/// | Text                                   | Value            |
/// |----------------------------------------|------------------|
/// | empty, ~, null (any case)              | null             |
/// | true, false (any case)                 | bool             |
/// | [-+]?(0 or [1-9][0-9]*)                | integer (double on int64 overflow) |
/// | decimal with '.' and/or exponent       | double           |
/// | .nan / .inf / +.inf / -.inf (any case) | NaN / +-Infinity |
/// | anything else (08, 0x1F, 1_000, ...)   | string           |
///
/// Quoted, literal and folded scalars are always strings.

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff {

enum class YamlEventType : std::uint8_t {
    DocumentStart,
    DocumentEnd,
    Scalar,
    SequenceStart,
    SequenceEnd,
    MappingStart,
    MappingEnd,
    Alias
};

enum class ScalarStyle : std::uint8_t {
    Plain,
    NonPlain  ///< single/double quoted, literal or folded
};

struct YamlEvent {
    YamlEventType type = YamlEventType::Scalar;
    std::string value;  ///< scalar text
    std::string tag;
    ScalarStyle style = ScalarStyle::Plain;
    int line = 0;       ///< 1-based, 0 when unknown
    int column = 0;     ///< 1-based, 0 when unknown
};

[[nodiscard]] SEMDIFF_API std::string_view event_type_name(YamlEventType type) noexcept;

/// Events of the first document in `text`; empty when there is none.
/// @throws YamlParseError on malformed YAML
[[nodiscard]] SEMDIFF_API std::vector<YamlEvent> read_yaml_events(std::string_view text);

/// Type a plain scalar per the table above
[[nodiscard]] SEMDIFF_API Value resolve_plain_scalar(std::string_view text);

/// Called with the key event of a repeated mapping key
using DuplicateKeyHandler = std::function<void(const YamlEvent& key)>;

/// Called with each node right after it is built and the event it came from
/// (the scalar, or the start event of a collection); returns the node to use
using NodeBuiltHook = std::function<Value(Value node, const YamlEvent& event)>;

class SEMDIFF_API YamlConverter {
public:
    YamlConverter() = default;
    explicit YamlConverter(DuplicateKeyHandler on_duplicate_key, NodeBuiltHook on_node_built = {});

    /// Value of the single document in `events`; std::nullopt for an empty stream.
    /// A repeated key keeps its first position and takes the last value.
    /// @throws UnsupportedConstructError on aliases, non-scalar keys and
    ///         misplaced end or document events
    [[nodiscard]] std::optional<Value> convert(std::span<const YamlEvent> events) const;

    /// read_yaml_events() followed by convert()
    [[nodiscard]] std::optional<Value> convert(std::string_view text) const;

private:
    class Cursor;

    Value convert_node(Cursor& cursor) const;
    Value convert_sequence(Cursor& cursor, const YamlEvent& start) const;
    Value convert_mapping(Cursor& cursor, const YamlEvent& start) const;
    Value built(Value node, const YamlEvent& event) const;

    DuplicateKeyHandler on_duplicate_key_;
    NodeBuiltHook on_node_built_;
};

/// Convert the first document of `text`; std::nullopt when it has none
[[nodiscard]] SEMDIFF_API std::optional<Value> yaml_to_value(std::string_view text,
                                                             DuplicateKeyHandler on_duplicate_key = {},
                                                             NodeBuiltHook on_node_built = {});

} // namespace semdiff
