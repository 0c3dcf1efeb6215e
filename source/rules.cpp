// rules.cpp - Built-in normalization rules

#include <semdiff/rules.h>
#include <semdiff/builders.h>
#include <semdiff/diff_engine.h>
#include <semdiff/html_canonicalizer.h>
#include <semdiff/serialization.h>

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <regex>

namespace semdiff {

namespace {

bool both_strings(const Value& expected, const Value& actual)
{
    return expected.is_string() && actual.is_string();
}

std::string wildcard_to_regex(std::string_view pattern)
{
    static constexpr std::string_view special = R"(\^$.|?+()[]{})";

    std::string out;
    out.reserve(pattern.size() * 2);
    for (char c : pattern) {
        if (c == '*') {
            out += ".*";
        } else {
            if (special.find(c) != std::string_view::npos) out += '\\';
            out += c;
        }
    }
    return out;
}

} // anonymous namespace

// ============================================================
// File extension predicate
// ============================================================

std::string_view file_extension(std::string_view name) noexcept
{
    auto dot = name.find_last_of('.');
    if (dot == std::string_view::npos) return {};

    auto sep = name.find_last_of("/\\");
    if (sep != std::string_view::npos && sep > dot) return {};
    if (dot + 1 == name.size()) return {};

    return name.substr(dot);
}

Predicate has_file_extension(std::vector<std::string> extensions)
{
    return [extensions = std::move(extensions)](const Value&, const Value&, std::string_view name) {
        auto ext = file_extension(name);
        if (ext.empty()) return false;
        return std::any_of(extensions.begin(), extensions.end(), [ext](const std::string& candidate) {
            return boost::algorithm::iequals(candidate, ext);
        });
    };
}

namespace rules {

// ============================================================
// Scalar rules
// ============================================================

Rule ignore_null(Predicate predicate)
{
    return Rule{std::move(predicate),
                [](const Value& expected, const Value& actual, std::string_view, const DiffEngine&) {
                    if (expected.is_null() && !actual.is_null()) {
                        return NormalizedPair{expected, Value{}};
                    }
                    return NormalizedPair{expected, actual};
                }};
}

Rule negate(Predicate predicate)
{
    return Rule{std::move(predicate),
                [](const Value& expected, const Value& actual, std::string_view, const DiffEngine&) {
                    if (both_strings(expected, actual)) {
                        std::string_view text = expected.as_string();
                        if (!text.empty() && text.front() == '!' && text.substr(1) != actual.as_string()) {
                            return NormalizedPair{actual, actual};
                        }
                    }
                    return NormalizedPair{expected, actual};
                }};
}

Rule regex(Predicate predicate)
{
    return Rule{std::move(predicate),
                [](const Value& expected, const Value& actual, std::string_view, const DiffEngine&) {
                    if (both_strings(expected, actual)) {
                        const auto& text = expected.as_string();
                        if (text.size() > 2 && text.front() == '/' && text.back() == '/') {
                            std::regex pattern(text.substr(1, text.size() - 2), std::regex::ECMAScript);
                            if (std::regex_search(actual.as_string(), pattern)) {
                                return NormalizedPair{actual, actual};
                            }
                        }
                    }
                    return NormalizedPair{expected, actual};
                }};
}

Rule wildcard(Predicate predicate)
{
    return Rule{std::move(predicate),
                [](const Value& expected, const Value& actual, std::string_view, const DiffEngine&) {
                    if (both_strings(expected, actual)) {
                        const auto& text = expected.as_string();
                        if (text.find('*') != std::string::npos) {
                            std::regex pattern(wildcard_to_regex(text), std::regex::ECMAScript);
                            if (std::regex_match(actual.as_string(), pattern)) {
                                return NormalizedPair{actual, actual};
                            }
                        }
                    }
                    return NormalizedPair{expected, actual};
                }};
}

// ============================================================
// Object rules
// ============================================================

Rule additional_properties(Predicate predicate, KeyPredicate is_required)
{
    return Rule{std::move(predicate),
                [is_required = std::move(is_required)](const Value& expected, const Value& actual,
                                                       std::string_view, const DiffEngine&) {
                    if (!expected.is_object() || !actual.is_object()) {
                        return NormalizedPair{expected, actual};
                    }

                    const ObjectIndex expected_keys(expected.as_object());
                    ObjectBuilder kept;
                    for (const auto& member : actual.as_object()) {
                        if (expected_keys.contains(member.key) || (is_required && is_required(member.key))) {
                            kept.set(member.key, deep_clone(*member.value));
                        }
                    }
                    return NormalizedPair{expected, kept.finish()};
                }};
}

// ============================================================
// Nested document rules
// ============================================================

Rule nested_json(Predicate predicate, std::shared_ptr<const DiffEngine> engine)
{
    if (!predicate) predicate = has_file_extension({".json"});

    return Rule{std::move(predicate),
                [engine = std::move(engine)](const Value& expected, const Value& actual,
                                             std::string_view, const DiffEngine& calling) {
                    if (!both_strings(expected, actual)) {
                        return NormalizedPair{expected, actual};
                    }

                    const DiffEngine& normalizer = engine ? *engine : calling;
                    auto normalized = normalizer.normalize(from_json(expected.as_string()),
                                                           from_json(actual.as_string()));

                    JsonWriteOptions options;
                    options.omit_null_members = true;
                    return NormalizedPair{Value{to_json(normalized.expected, options)},
                                          Value{to_json(normalized.actual, options)}};
                }};
}

Rule nested_html(Predicate predicate)
{
    if (!predicate) predicate = has_file_extension({".html", ".htm"});

    return Rule{std::move(predicate),
                [](const Value& expected, const Value& actual, std::string_view, const DiffEngine&) {
                    if (!both_strings(expected, actual)) {
                        return NormalizedPair{expected, actual};
                    }
                    return NormalizedPair{Value{canonicalize_html(expected.as_string())},
                                          Value{canonicalize_html(actual.as_string())}};
                }};
}

} // namespace rules

} // namespace semdiff
