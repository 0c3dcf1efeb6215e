// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file line_diff.h
/// @brief Line-based text diff (longest common subsequence).
///
/// Usage:
/// @code
///   auto lines = diff_lines(render_canonical(expected), render_canonical(actual));
///   if (has_changes(lines)) {
///       std::cout << format_diff(lines);
///   }
/// @endcode
///
/// Output order inside one changed block is: all deleted (expected-only)
/// lines, then all inserted (actual-only) lines. Unchanged lines carry the
/// text of the actual side.

#pragma once

#include "api.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace semdiff {

enum class DiffLineType : std::uint8_t {
    Unchanged,
    Inserted,  ///< present only in the actual text
    Deleted    ///< present only in the expected text
};

struct DiffLine {
    DiffLineType type = DiffLineType::Unchanged;
    std::string text;

    bool operator==(const DiffLine& other) const {
        return type == other.type && text == other.text;
    }
};

using DiffResult = std::vector<DiffLine>;

struct LineDiffOptions {
    /// Compare lines with leading and trailing whitespace removed
    bool ignore_whitespace = true;
};

/// Split on '\n'; a trailing '\r' is dropped from each line and a final
/// empty line after a terminating newline is not reported.
[[nodiscard]] SEMDIFF_API std::vector<std::string> split_lines(std::string_view text);

[[nodiscard]] SEMDIFF_API DiffResult diff_lines(std::string_view expected_text,
                                                std::string_view actual_text,
                                                const LineDiffOptions& options = {});

/// True if any line is Inserted or Deleted
[[nodiscard]] SEMDIFF_API bool has_changes(const DiffResult& lines) noexcept;

/// Empty string when nothing changed; otherwise every line prefixed with
/// ' ', '+' or '-' and terminated by '\n'
[[nodiscard]] SEMDIFF_API std::string format_diff(const DiffResult& lines);

} // namespace semdiff
