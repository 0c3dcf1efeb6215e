// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-based builders for O(n) construction of Value containers.
///
/// @code
///   #include <semdiff/builders.h>
///
///   Value user = ObjectBuilder()
///       .set("name", "Alice")
///       .set("age", 30)
///       .finish();
///
///   Value tags = ArrayBuilder()
///       .push_back("a")
///       .push_back("b")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

#include <string>
#include <string_view>
#include <unordered_map>

namespace semdiff {

/// Builds an ordered object. Setting an existing key replaces its value in
/// place, so members keep their first-seen position.
class SEMDIFF_API ObjectBuilder {
public:
    using transient_type = ValueObject::transient_type;

    ObjectBuilder() : transient_(ValueObject{}.transient()) {}
    explicit ObjectBuilder(const ValueObject& existing);

    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    template <typename T>
    ObjectBuilder& set(std::string_view key, T&& val) {
        return set(key, Value{std::forward<T>(val)});
    }

    ObjectBuilder& set(std::string_view key, Value val);

    [[nodiscard]] bool contains(std::string_view key) const {
        return index_.find(std::string(key)) != index_.end();
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueObject finish_object() { return transient_.persistent(); }

private:
    transient_type transient_;
    std::unordered_map<std::string, std::size_t> index_;
};

/// Hashed key lookup over an existing object. The object must outlive the
/// index; keys are viewed, not copied.
class SEMDIFF_API ObjectIndex {
public:
    explicit ObjectIndex(const ValueObject& object);

    [[nodiscard]] const Value* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const {
        return index_.find(key) != index_.end();
    }

private:
    const ValueObject& object_;
    std::unordered_map<std::string_view, std::size_t> index_;
};

class SEMDIFF_API ArrayBuilder {
public:
    using transient_type = ValueArray::transient_type;

    ArrayBuilder() : transient_(ValueArray{}.transient()) {}
    explicit ArrayBuilder(const ValueArray& existing) : transient_(existing.transient()) {}

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;

    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    template <typename T>
    ArrayBuilder& push_back(T&& val) {
        transient_.push_back(ValueBox{Value{std::forward<T>(val)}});
        return *this;
    }

    /// Replace element at index; ignored (logged) when out of range
    ArrayBuilder& set(std::size_t index, Value val);

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    [[nodiscard]] Value finish() { return Value{transient_.persistent()}; }

    [[nodiscard]] ValueArray finish_array() { return transient_.persistent(); }

private:
    transient_type transient_;
};

} // namespace semdiff
