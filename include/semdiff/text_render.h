// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file text_render.h
/// @brief Canonical text form of a Value, used as line differ input.
///
/// The canonical form is indented JSON with:
/// - object members in insertion order
/// - null-valued object members omitted
/// - empty objects written as "{" and "}" on separate lines
/// - multi-line strings spread over several lines, so that a change inside
///   a nested document shows up as a line-level change
///
/// Structurally identical trees always render to identical text.

#pragma once

#include "api.h"
#include "serialization.h"
#include "value.h"

#include <string>

namespace semdiff {

/// Write options used by render_canonical()
[[nodiscard]] SEMDIFF_API JsonWriteOptions canonical_write_options() noexcept;

[[nodiscard]] SEMDIFF_API std::string render_canonical(const Value& val);

} // namespace semdiff
