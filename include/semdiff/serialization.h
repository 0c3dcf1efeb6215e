// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text serialization for Value trees.
///
/// @code
///   #include <semdiff/serialization.h>
///
///   Value data = from_json(R"({"name": "Alice", "tags": ["a", "b"]})");
///   std::string pretty  = to_json(data);
///   std::string compact = to_json(data, JsonWriteOptions{.compact = true});
/// @endcode
///
/// Numbers:
/// - integers that fit in int64 parse as integer Values, all others as double
/// - doubles are written in shortest round-trip form, with ".0" appended when
///   the text would otherwise read back as an integer
/// - NaN and infinities are written as the bare tokens NaN, Infinity and
///   -Infinity (they have no JSON spelling)

#pragma once

#include "api.h"
#include "value.h"

#include <optional>
#include <string>
#include <string_view>

namespace semdiff {

struct JsonWriteOptions {
    /// Single line, no spaces
    bool compact = false;

    /// Skip object members whose value is null
    bool omit_null_members = false;

    /// Write '\n' inside strings as a real line break and drop '\r', so a
    /// multi-line string occupies several output lines (used for line diffs)
    bool multiline_strings = false;

    /// Write an empty object as "{" and "}" on separate lines (pretty mode)
    bool open_empty_objects = false;
};

/// Convert Value to JSON text
[[nodiscard]] SEMDIFF_API std::string to_json(const Value& val, const JsonWriteOptions& options = {});

/// Parse JSON text
/// @throws JsonParseError on malformed input, duplicate object keys or
///         trailing content
[[nodiscard]] SEMDIFF_API Value from_json(std::string_view json_str);

/// Parse JSON text without throwing
/// @param error_out If provided, receives the error message on failure
/// @return Parsed Value, or null Value on parse error
[[nodiscard]] SEMDIFF_API Value from_json(std::string_view json_str, std::string* error_out);

/// Locale-independent decimal parse of a complete number literal (an optional
/// leading '+' is accepted). Literals beyond the double range saturate to
/// +-infinity, those below it to +-0.
/// @return std::nullopt if the text is not a decimal number
[[nodiscard]] SEMDIFF_API std::optional<double> parse_decimal_double(std::string_view text);

} // namespace semdiff
