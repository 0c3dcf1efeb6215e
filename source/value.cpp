// value.cpp - Value accessors, structural equality and deep cloning

#include <semdiff/value.h>
#include <semdiff/builders.h>
#include <semdiff/diagnostics.h>
#include <semdiff/errors.h>

#include <cmath>
#include <sstream>
#include <iomanip>

namespace semdiff {

namespace {

[[noreturn]] void throw_type_mismatch(std::string_view func, ValueKind wanted, const Value& got)
{
    detail::log_access_error(func, std::string("expected ") + std::string(type_name(wanted)) +
                                   ", got " + std::string(type_name(got)));
    throw TypeMismatchError(type_name(wanted), type_name(got));
}

std::ptrdiff_t find_member_index(const ValueObject& obj, std::string_view key)
{
    for (std::size_t i = 0; i < obj.size(); ++i) {
        if (obj[i].key == key) return static_cast<std::ptrdiff_t>(i);
    }
    return -1;
}

bool objects_equal(const ValueObject& a, const ValueObject& b)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto& lhs = a[i];
        const auto& rhs = b[i];
        if (lhs.key != rhs.key) return false;
        // Shared box: identical subtree
        if (&lhs.value.get() == &rhs.value.get()) continue;
        if (!equals(*lhs.value, *rhs.value)) return false;
    }
    return true;
}

bool arrays_equal(const ValueArray& a, const ValueArray& b)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (&a[i].get() == &b[i].get()) continue;
        if (!equals(*a[i], *b[i])) return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================
// Factories
// ============================================================

Value Value::object(std::initializer_list<std::pair<std::string, Value>> init)
{
    ObjectBuilder builder;
    for (const auto& [key, val] : init) {
        builder.set(key, val);
    }
    return builder.finish();
}

Value Value::array(std::initializer_list<Value> init)
{
    auto t = ValueArray{}.transient();
    for (const auto& val : init) {
        t.push_back(ValueBox{val});
    }
    return Value{t.persistent()};
}

// ============================================================
// Narrowing accessors
// ============================================================

bool Value::as_bool() const
{
    if (auto* p = get_if<bool>()) return *p;
    throw_type_mismatch("Value::as_bool", ValueKind::Bool, *this);
}

std::int64_t Value::as_integer() const
{
    if (auto* p = get_if<std::int64_t>()) return *p;
    throw_type_mismatch("Value::as_integer", ValueKind::Integer, *this);
}

double Value::as_number() const
{
    if (auto* p = get_if<double>()) return *p;
    if (auto* p = get_if<std::int64_t>()) return static_cast<double>(*p);
    throw_type_mismatch("Value::as_number", ValueKind::Float, *this);
}

const std::string& Value::as_string() const
{
    if (auto* p = get_if<std::string>()) return *p;
    throw_type_mismatch("Value::as_string", ValueKind::String, *this);
}

const ValueObject& Value::as_object() const
{
    if (auto* p = get_if<ValueObject>()) return *p;
    throw_type_mismatch("Value::as_object", ValueKind::Object, *this);
}

const ValueArray& Value::as_array() const
{
    if (auto* p = get_if<ValueArray>()) return *p;
    throw_type_mismatch("Value::as_array", ValueKind::Array, *this);
}

// ============================================================
// Lookup
// ============================================================

const Value* Value::find(std::string_view key) const
{
    if (auto* obj = get_if<ValueObject>()) {
        auto index = find_member_index(*obj, key);
        if (index >= 0) return &(*obj)[static_cast<std::size_t>(index)].value.get();
    }
    return nullptr;
}

Value Value::at(std::string_view key) const
{
    if (auto* found = find(key)) return *found;
    detail::log_key_error("Value::at", key, "not found or type mismatch");
    return Value{};
}

Value Value::at(std::size_t index) const
{
    if (auto* arr = get_if<ValueArray>()) {
        if (index < arr->size()) return (*arr)[index].get();
    }
    detail::log_index_error("Value::at", index, "out of range or type mismatch");
    return Value{};
}

std::vector<std::string> Value::keys() const
{
    std::vector<std::string> result;
    if (auto* obj = get_if<ValueObject>()) {
        result.reserve(obj->size());
        for (const auto& member : *obj) {
            result.push_back(member.key);
        }
    }
    return result;
}

std::size_t Value::size() const noexcept
{
    if (auto* obj = get_if<ValueObject>()) return obj->size();
    if (auto* arr = get_if<ValueArray>()) return arr->size();
    return 0;
}

// ============================================================
// Persistent updates
// ============================================================

Value Value::set(std::string_view key, Value val) const
{
    if (is_null()) {
        return ValueObject{}.push_back(ObjectMember{std::string(key), ValueBox{std::move(val)}});
    }
    if (auto* obj = get_if<ValueObject>()) {
        auto index = find_member_index(*obj, key);
        if (index >= 0) {
            return obj->set(static_cast<std::size_t>(index),
                            ObjectMember{std::string(key), ValueBox{std::move(val)}});
        }
        return obj->push_back(ObjectMember{std::string(key), ValueBox{std::move(val)}});
    }
    detail::log_key_error("Value::set", key, "cannot set on non-object type");
    return *this;
}

Value Value::erase(std::string_view key) const
{
    auto* obj = get_if<ValueObject>();
    if (!obj) {
        detail::log_key_error("Value::erase", key, "cannot erase from non-object type");
        return *this;
    }
    auto index = find_member_index(*obj, key);
    if (index < 0) return *this;

    auto t = ValueObject{}.transient();
    for (std::size_t i = 0; i < obj->size(); ++i) {
        if (static_cast<std::ptrdiff_t>(i) != index) t.push_back((*obj)[i]);
    }
    return Value{t.persistent()};
}

Value Value::set(std::size_t index, Value val) const
{
    if (auto* arr = get_if<ValueArray>()) {
        if (index < arr->size()) return arr->set(index, ValueBox{std::move(val)});
    }
    detail::log_index_error("Value::set", index, "out of range or non-array type");
    return *this;
}

Value Value::push_back(Value val) const
{
    if (is_null()) return ValueArray{}.push_back(ValueBox{std::move(val)});
    if (auto* arr = get_if<ValueArray>()) return arr->push_back(ValueBox{std::move(val)});
    detail::log_access_error("Value::push_back", "cannot append to non-array type");
    return *this;
}

// ============================================================
// Free functions
// ============================================================

bool equals(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) return false;

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return objects_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return arrays_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, double>) {
            // NaN matches NaN so that a tree always equals itself
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

Value deep_clone(const Value& val)
{
    if (auto* obj = val.get_if<ValueObject>()) {
        auto t = ValueObject{}.transient();
        for (const auto& member : *obj) {
            t.push_back(ObjectMember{member.key, ValueBox{deep_clone(*member.value)}});
        }
        return Value{t.persistent()};
    }
    if (auto* arr = val.get_if<ValueArray>()) {
        auto t = ValueArray{}.transient();
        for (const auto& elem : *arr) {
            t.push_back(ValueBox{deep_clone(*elem)});
        }
        return Value{t.persistent()};
    }
    // Scalars own their storage
    return val;
}

std::string_view type_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:    return "null";
        case ValueKind::Bool:    return "bool";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float:   return "float";
        case ValueKind::String:  return "string";
        case ValueKind::Object:  return "object";
        case ValueKind::Array:   return "array";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isnan(arg)) return "NaN";
            if (std::isinf(arg)) return arg > 0 ? "Infinity" : "-Infinity";
            std::ostringstream oss;
            oss << std::setprecision(15) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else {
            return "[array:" + std::to_string(arg.size()) + "]";
        }
    }, val.data);
}

} // namespace semdiff
