// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Tree value type compared by the semantic diff engine.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool
/// - Number, kept either as int64_t or as double so that integer and
///   floating values survive a round trip unchanged
/// - String
/// - Object: ordered (key, value) members, keys unique within one object
/// - Array: ordered values
///
/// Containers are immer persistent vectors of boxed values. Every
/// "modifying" member function returns a new Value and leaves the original
/// untouched, so trees handed to the engine are never mutated.

#pragma once

#include "api.h"
#include "semdiff_config.h"

#include <immer/box.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace semdiff {

/// Atomic reference counting: engines and rule chains are shared across threads.
using memory_policy = immer::default_memory_policy;

struct Value;

using ValueBox = immer::box<Value, memory_policy>;

struct ObjectMember {
    std::string key;
    ValueBox value;
};

using ValueObject = immer::vector<ObjectMember, memory_policy>;
using ValueArray  = immer::vector<ValueBox, memory_policy>;

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Integer,
    Float,
    String,
    Object,
    Array
};

struct SEMDIFF_API Value
{
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 ValueObject,
                 ValueArray>
        data;

    constexpr Value() noexcept : data(std::monostate{}) {}
    constexpr Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr Value(bool v) noexcept : data(v) {}
    constexpr Value(int v) noexcept : data(std::int64_t{v}) {}
    constexpr Value(long v) noexcept : data(static_cast<std::int64_t>(v)) {}
    constexpr Value(long long v) noexcept : data(static_cast<std::int64_t>(v)) {}
    constexpr Value(unsigned v) noexcept : data(std::int64_t{v}) {}
    constexpr Value(unsigned long v) noexcept : Value(static_cast<unsigned long long>(v)) {}
    constexpr Value(unsigned long long v) noexcept
        : data(v <= static_cast<unsigned long long>(std::numeric_limits<std::int64_t>::max())
                   ? decltype(data){static_cast<std::int64_t>(v)}
                   : decltype(data){static_cast<double>(v)}) {}
    constexpr Value(float v) noexcept : data(static_cast<double>(v)) {}
    constexpr Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueObject v) : data(std::move(v)) {}
    Value(ValueArray v) : data(std::move(v)) {}

    /// Object in the given member order. A repeated key overwrites the earlier
    /// value but keeps the earlier position.
    static Value object(std::initializer_list<std::pair<std::string, Value>> init);

    static Value array(std::initializer_list<Value> init);

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_integer() const noexcept { return is<std::int64_t>(); }
    [[nodiscard]] bool is_float() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_integer() || is_float(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<ValueObject>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<ValueArray>(); }

    // Narrowing accessors: throw TypeMismatchError when the kind differs.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_integer() const;
    /// Integer or floating number widened to double
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const ValueObject& as_object() const;
    [[nodiscard]] const ValueArray& as_array() const;

    /// Member lookup; nullptr when this is not an object or the key is absent
    [[nodiscard]] const Value* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Member value, or null (logged) when missing
    [[nodiscard]] Value at(std::string_view key) const;

    /// Element value, or null (logged) when out of range
    [[nodiscard]] Value at(std::size_t index) const;

    /// Member keys in object order; empty for non-objects
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Member or element count; 0 for scalars
    [[nodiscard]] std::size_t size() const noexcept;

    /// Object with key set: overwritten in place when present, appended otherwise.
    /// A null value becomes an empty object first.
    [[nodiscard]] Value set(std::string_view key, Value val) const;

    /// Object without key; unchanged when absent
    [[nodiscard]] Value erase(std::string_view key) const;

    /// Array with element replaced; unchanged (logged) when out of range
    [[nodiscard]] Value set(std::size_t index, Value val) const;

    /// Array with element appended. A null value becomes an empty array first.
    [[nodiscard]] Value push_back(Value val) const;
};

/// Structural equality: same kind and recursively equal content.
/// Integer 1 and floating 1.0 are different values.
[[nodiscard]] SEMDIFF_API bool equals(const Value& a, const Value& b);

inline bool operator==(const Value& a, const Value& b) { return equals(a, b); }
inline bool operator!=(const Value& a, const Value& b) { return !equals(a, b); }

/// Copy with fresh storage at every level; shares nothing with the source.
[[nodiscard]] SEMDIFF_API Value deep_clone(const Value& val);

[[nodiscard]] SEMDIFF_API std::string_view type_name(ValueKind kind) noexcept;

[[nodiscard]] inline std::string_view type_name(const Value& val) noexcept { return type_name(val.kind()); }

/// Short human-readable form, e.g. "hello", 42, {object:3}, [array:2]
[[nodiscard]] SEMDIFF_API std::string value_to_string(const Value& val);

} // namespace semdiff
