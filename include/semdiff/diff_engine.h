// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_engine.h
/// @brief Semantic diff of two Value trees.
///
/// DiffEngine normalizes an expected/actual pair with its rule chain, renders
/// both sides as canonical text and diffs the lines. An empty diff means the
/// trees are semantically equal.
///
/// @code
///   DiffEngine engine = DiffEngineBuilder()
///       .use_ignore_null()
///       .use_additional_properties()
///       .finish();
///
///   std::string d = engine.diff(expected, actual);   // "" when equal
///   engine.verify(expected, actual, "login.yml");     // throws DiffMismatchError
/// @endcode
///
/// Normalization at one node:
/// 1. every rule of the chain runs on the pair, in registration order
/// 2. two objects: members of the expected object are paired by key and
///    normalized recursively; expected-only members are kept as they are;
///    actual-only members follow in actual's order
/// 3. two arrays: elements are paired by index up to the shorter length;
///    surplus elements are kept as they are, so a length mismatch always
///    shows in the diff
///
/// Output trees share no storage with the inputs. A finished engine is
/// immutable and can be used from several threads at once.

#pragma once

#include "api.h"
#include "rules.h"
#include "value.h"

#include <memory>
#include <string>
#include <string_view>

namespace semdiff {

class SEMDIFF_API DiffEngine {
public:
    DiffEngine() = default;
    explicit DiffEngine(RuleChain rules);

    /// Rewrite both trees according to the rule chain
    [[nodiscard]] NormalizedPair normalize(const Value& expected, const Value& actual) const;

    /// Marked line diff of the normalized trees; "" when they match
    [[nodiscard]] std::string diff(const Value& expected, const Value& actual) const;

    /// @throws DiffMismatchError carrying `summary` and the diff when they differ
    void verify(const Value& expected, const Value& actual, std::string_view summary = {}) const;

    [[nodiscard]] const RuleChain& rules() const noexcept { return rules_; }

private:
    NormalizedPair normalize_node(const Value& expected, const Value& actual, std::string_view name) const;
    NormalizedPair apply_rules(Value expected, Value actual, std::string_view name) const;

    RuleChain rules_;
};

/// Accumulates rules, then produces an immutable DiffEngine.
/// Move-only; meant to live only in setup code.
class SEMDIFF_API DiffEngineBuilder {
public:
    DiffEngineBuilder() : transient_(RuleChain{}.transient()) {}

    DiffEngineBuilder(DiffEngineBuilder&&) noexcept = default;
    DiffEngineBuilder& operator=(DiffEngineBuilder&&) noexcept = default;

    DiffEngineBuilder(const DiffEngineBuilder&) = delete;
    DiffEngineBuilder& operator=(const DiffEngineBuilder&) = delete;

    DiffEngineBuilder& use(Rule rule);
    DiffEngineBuilder& use(Transform transform);
    DiffEngineBuilder& use(Predicate predicate, Transform transform);

    DiffEngineBuilder& use_ignore_null(Predicate predicate = {});
    DiffEngineBuilder& use_negate(Predicate predicate = {});
    DiffEngineBuilder& use_regex(Predicate predicate = {});
    DiffEngineBuilder& use_wildcard(Predicate predicate = {});
    DiffEngineBuilder& use_additional_properties(Predicate predicate = {}, KeyPredicate is_required = {});
    DiffEngineBuilder& use_json(Predicate predicate = {}, std::shared_ptr<const DiffEngine> engine = nullptr);
    DiffEngineBuilder& use_html(Predicate predicate = {});

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] DiffEngine finish() { return DiffEngine{transient_.persistent()}; }

private:
    RuleChain::transient_type transient_;
};

/// One-shot diff with a temporary engine over `rules`
[[nodiscard]] SEMDIFF_API std::string diff(const Value& expected, const Value& actual, const RuleChain& rules = {});

/// One-shot verify with a temporary engine over `rules`
SEMDIFF_API void verify(const Value& expected,
                        const Value& actual,
                        const RuleChain& rules = {},
                        std::string_view summary = {});

} // namespace semdiff
