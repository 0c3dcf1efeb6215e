// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file html_canonicalizer.h
/// @brief Line-oriented canonical form of an HTML document or fragment.
///
/// Two HTML texts that differ only in attribute order, whitespace or
/// optional close tags canonicalize to the same text:
///
/// @code
///   canonicalize_html(R"(<div  b="2" a=" 1 "><p>Hello
///       world</div>)");
///   // <div a="1" b="2">
///   //   <p>
///   //     Hello world
///   //   </p>
///   // </div>
/// @endcode
///
/// Rules:
/// - one line per open tag, indented two spaces per depth, attributes sorted
///   by name, values whitespace-collapsed, valueless attributes as name=""
/// - one line per text node after collapsing whitespace runs to one space;
///   whitespace-only text is dropped
/// - one line per close tag, void elements included
/// - comments, doctype and processing instructions are dropped
/// - entities are decoded, then '&', '<', '>' (and '"' in attribute values)
///   are written escaped
///
/// Input starting with "<!doctype" or "<html" is treated as a full document;
/// anything else is a fragment and only the content of its implied body is
/// emitted.

#pragma once

#include "api.h"

#include <string>
#include <string_view>

namespace semdiff {

/// Canonical text of `html`; "" when libxml2 cannot produce a document
[[nodiscard]] SEMDIFF_API std::string canonicalize_html(std::string_view html);

} // namespace semdiff
