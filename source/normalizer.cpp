// normalizer.cpp - Recursive normalization of expected/actual trees

#include <semdiff/diff_engine.h>
#include <semdiff/builders.h>

#include <algorithm>

namespace semdiff {

NormalizedPair DiffEngine::normalize(const Value& expected, const Value& actual) const
{
    return normalize_node(expected, actual, "");
}

NormalizedPair DiffEngine::apply_rules(Value expected, Value actual, std::string_view name) const
{
    for (const auto& rule : rules_) {
        if (!rule.applies(expected, actual, name)) continue;
        auto rewritten = rule.transform(expected, actual, name, *this);
        expected = std::move(rewritten.expected);
        actual = std::move(rewritten.actual);
    }
    return NormalizedPair{std::move(expected), std::move(actual)};
}

NormalizedPair DiffEngine::normalize_node(const Value& expected, const Value& actual, std::string_view name) const
{
    auto [e, a] = apply_rules(expected, actual, name);

    // ============ Object / Object ============
    if (e.is_object() && a.is_object()) {
        const auto& expected_obj = e.as_object();
        const auto& actual_obj = a.as_object();

        const ObjectIndex expected_keys(expected_obj);
        const ObjectIndex actual_keys(actual_obj);

        ObjectBuilder expected_out;
        ObjectBuilder actual_out;

        for (const auto& member : expected_obj) {
            if (const Value* actual_member = actual_keys.find(member.key)) {
                auto child = normalize_node(*member.value, *actual_member, member.key);
                expected_out.set(member.key, std::move(child.expected));
                actual_out.set(member.key, std::move(child.actual));
            } else {
                expected_out.set(member.key, deep_clone(*member.value));
            }
        }

        for (const auto& member : actual_obj) {
            if (!expected_keys.contains(member.key)) {
                actual_out.set(member.key, deep_clone(*member.value));
            }
        }

        return NormalizedPair{expected_out.finish(), actual_out.finish()};
    }

    // ============ Array / Array ============
    if (e.is_array() && a.is_array()) {
        const auto& expected_arr = e.as_array();
        const auto& actual_arr = a.as_array();

        ArrayBuilder expected_out(deep_clone(e).as_array());
        ArrayBuilder actual_out(deep_clone(a).as_array());

        const auto common = std::min(expected_arr.size(), actual_arr.size());
        for (std::size_t i = 0; i < common; ++i) {
            auto child = normalize_node(*expected_arr[i], *actual_arr[i], "");
            expected_out.set(i, std::move(child.expected));
            actual_out.set(i, std::move(child.actual));
        }

        return NormalizedPair{expected_out.finish(), actual_out.finish()};
    }

    return NormalizedPair{deep_clone(e), deep_clone(a)};
}

} // namespace semdiff
