// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value and builder types.
///
/// Lets headers declare functions taking or returning these types without
/// pulling in immer through value.h.
///
/// @code
///   // In a header:
///   #include <semdiff/value_fwd.h>
///   semdiff::Value load_expectation();
///
///   // In the implementation file:
///   #include <semdiff/value.h>
/// @endcode

#pragma once

namespace semdiff {

struct Value;
struct ObjectMember;

class ObjectBuilder;
class ArrayBuilder;
class ObjectIndex;

struct NormalizedPair;
class DiffEngine;

} // namespace semdiff
