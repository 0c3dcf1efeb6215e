// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_engine.cpp
/// @brief DiffEngine diff/verify entry points and DiffEngineBuilder

#include <semdiff/diff_engine.h>
#include <semdiff/diagnostics.h>
#include <semdiff/errors.h>
#include <semdiff/line_diff.h>
#include <semdiff/text_render.h>

namespace semdiff {

DiffEngine::DiffEngine(RuleChain rules)
    : rules_(std::move(rules))
{
}

std::string DiffEngine::diff(const Value& expected, const Value& actual) const
{
    auto normalized = normalize(expected, actual);
    auto lines = diff_lines(render_canonical(normalized.expected),
                            render_canonical(normalized.actual));
    return format_diff(lines);
}

void DiffEngine::verify(const Value& expected, const Value& actual, std::string_view summary) const
{
    auto text = diff(expected, actual);
    if (text.empty()) return;

    detail::log_access_error("DiffEngine::verify",
                             summary.empty() ? std::string_view{"trees differ"} : summary);
    throw DiffMismatchError(std::string(summary), std::move(text));
}

// ============================================================
// DiffEngineBuilder
// ============================================================

DiffEngineBuilder& DiffEngineBuilder::use(Rule rule)
{
    transient_.push_back(std::move(rule));
    return *this;
}

DiffEngineBuilder& DiffEngineBuilder::use(Transform transform)
{
    return use(Rule{{}, std::move(transform)});
}

DiffEngineBuilder& DiffEngineBuilder::use(Predicate predicate, Transform transform)
{
    return use(Rule{std::move(predicate), std::move(transform)});
}

DiffEngineBuilder& DiffEngineBuilder::use_ignore_null(Predicate predicate)
{
    return use(rules::ignore_null(std::move(predicate)));
}

DiffEngineBuilder& DiffEngineBuilder::use_negate(Predicate predicate)
{
    return use(rules::negate(std::move(predicate)));
}

DiffEngineBuilder& DiffEngineBuilder::use_regex(Predicate predicate)
{
    return use(rules::regex(std::move(predicate)));
}

DiffEngineBuilder& DiffEngineBuilder::use_wildcard(Predicate predicate)
{
    return use(rules::wildcard(std::move(predicate)));
}

DiffEngineBuilder& DiffEngineBuilder::use_additional_properties(Predicate predicate, KeyPredicate is_required)
{
    return use(rules::additional_properties(std::move(predicate), std::move(is_required)));
}

DiffEngineBuilder& DiffEngineBuilder::use_json(Predicate predicate, std::shared_ptr<const DiffEngine> engine)
{
    return use(rules::nested_json(std::move(predicate), std::move(engine)));
}

DiffEngineBuilder& DiffEngineBuilder::use_html(Predicate predicate)
{
    return use(rules::nested_html(std::move(predicate)));
}

// ============================================================
// Free functions
// ============================================================

std::string diff(const Value& expected, const Value& actual, const RuleChain& rules)
{
    return DiffEngine{rules}.diff(expected, actual);
}

void verify(const Value& expected, const Value& actual, const RuleChain& rules, std::string_view summary)
{
    DiffEngine{rules}.verify(expected, actual, summary);
}

} // namespace semdiff
