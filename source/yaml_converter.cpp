// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file yaml_converter.cpp
/// @brief yaml-cpp event recording, plain scalar typing and event-to-Value conversion

#include <semdiff/yaml_converter.h>
#include <semdiff/builders.h>
#include <semdiff/diagnostics.h>
#include <semdiff/errors.h>
#include <semdiff/serialization.h>

#include <yaml-cpp/eventhandler.h>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/mark.h>
#include <yaml-cpp/parser.h>

#include <boost/algorithm/string/predicate.hpp>

#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>

namespace semdiff {

namespace {

// ============================================================
// Event recording
// ============================================================

/// yaml-cpp tags plain scalars "?" and quoted/block scalars "!"
constexpr std::string_view kNonPlainTag = "!";

/// Text of the plain token starting at pos, after any tag or anchor properties
std::string_view plain_token_at(std::string_view source, std::size_t pos)
{
    constexpr std::string_view kDelimiters = " \t\r\n,[]{}:#";

    while (pos < source.size() && (source[pos] == '!' || source[pos] == '&')) {
        pos = source.find_first_of(" \t\r\n", pos);
        if (pos == std::string_view::npos) return {};
        pos = source.find_first_not_of(" \t\r\n", pos);
        if (pos == std::string_view::npos) return {};
    }
    if (pos >= source.size()) return {};

    auto end = source.find_first_of(kDelimiters, pos);
    if (end == pos) return {};
    return source.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
}

class EventRecorder : public YAML::EventHandler {
public:
    EventRecorder(std::vector<YamlEvent>& events, std::string_view source)
        : events_(events), source_(source) {}

    void OnDocumentStart(const YAML::Mark& mark) override {
        push(YamlEventType::DocumentStart, mark);
    }

    void OnDocumentEnd() override {
        push(YamlEventType::DocumentEnd, YAML::Mark::null_mark());
    }

    // "~", "null", "Null", "NULL" and empty nodes arrive here. The spelling
    // is recovered from the source so that such keys keep their text.
    void OnNull(const YAML::Mark& mark, YAML::anchor_t) override {
        auto& event = push(YamlEventType::Scalar, mark);
        if (mark.is_null() || mark.pos < 0) return;

        auto token = plain_token_at(source_, static_cast<std::size_t>(mark.pos));
        if (token == "~" || token == "null" || token == "Null" || token == "NULL") {
            event.value = std::string(token);
        }
    }

    void OnAlias(const YAML::Mark& mark, YAML::anchor_t) override {
        push(YamlEventType::Alias, mark);
    }

    void OnScalar(const YAML::Mark& mark, const std::string& tag,
                  YAML::anchor_t, const std::string& value) override {
        auto& event = push(YamlEventType::Scalar, mark);
        event.value = value;
        event.tag = tag;
        event.style = tag == kNonPlainTag ? ScalarStyle::NonPlain : ScalarStyle::Plain;
    }

    void OnSequenceStart(const YAML::Mark& mark, const std::string& tag,
                         YAML::anchor_t, YAML::EmitterStyle::value) override {
        push(YamlEventType::SequenceStart, mark).tag = tag;
    }

    void OnSequenceEnd() override {
        push(YamlEventType::SequenceEnd, YAML::Mark::null_mark());
    }

    void OnMapStart(const YAML::Mark& mark, const std::string& tag,
                    YAML::anchor_t, YAML::EmitterStyle::value) override {
        push(YamlEventType::MappingStart, mark).tag = tag;
    }

    void OnMapEnd() override {
        push(YamlEventType::MappingEnd, YAML::Mark::null_mark());
    }

private:
    std::vector<YamlEvent>& events_;
    std::string_view source_;

    YamlEvent& push(YamlEventType type, const YAML::Mark& mark) {
        YamlEvent event;
        event.type = type;
        if (!mark.is_null()) {
            event.line = mark.line + 1;
            event.column = mark.column + 1;
        }
        events_.push_back(std::move(event));
        return events_.back();
    }
};

// ============================================================
// Plain scalar grammar
// ============================================================

bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::size_t skip_sign(std::string_view s)
{
    return !s.empty() && (s[0] == '+' || s[0] == '-') ? 1 : 0;
}

/// [-+]?(0|[1-9][0-9]*)
bool is_integer_literal(std::string_view s)
{
    auto digits = s.substr(skip_sign(s));
    if (digits.empty()) return false;
    if (digits[0] == '0') return digits.size() == 1;
    for (char c : digits) {
        if (!is_digit(c)) return false;
    }
    return true;
}

/// [-+]?(\.[0-9]+|[0-9]+\.[0-9]*)([eE][-+]?[0-9]+)?  or  [-+]?[0-9]+[eE][-+]?[0-9]+
bool is_float_literal(std::string_view s)
{
    std::size_t i = skip_sign(s);

    std::size_t int_digits = 0;
    while (i < s.size() && is_digit(s[i])) { ++i; ++int_digits; }

    bool has_dot = false;
    std::size_t frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        has_dot = true;
        ++i;
        while (i < s.size() && is_digit(s[i])) { ++i; ++frac_digits; }
    }

    if (int_digits == 0 && frac_digits == 0) return false;

    bool has_exponent = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t exp_digits = 0;
        while (i < s.size() && is_digit(s[i])) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
        has_exponent = true;
    }

    return i == s.size() && (has_dot || has_exponent);
}

/// Only called on text the literal grammar has accepted
double parse_double(std::string_view s)
{
    return parse_decimal_double(s).value_or(0.0);
}

} // anonymous namespace

std::string_view event_type_name(YamlEventType type) noexcept
{
    switch (type) {
        case YamlEventType::DocumentStart: return "DocumentStart";
        case YamlEventType::DocumentEnd:   return "DocumentEnd";
        case YamlEventType::Scalar:        return "Scalar";
        case YamlEventType::SequenceStart: return "SequenceStart";
        case YamlEventType::SequenceEnd:   return "SequenceEnd";
        case YamlEventType::MappingStart:  return "MappingStart";
        case YamlEventType::MappingEnd:    return "MappingEnd";
        case YamlEventType::Alias:         return "Alias";
    }
    return "Unknown";
}

std::vector<YamlEvent> read_yaml_events(std::string_view text)
{
    std::vector<YamlEvent> events;
    std::string source(text);
    std::istringstream input{source};

    try {
        YAML::Parser parser(input);
        EventRecorder recorder(events, source);
        parser.HandleNextDocument(recorder);
    } catch (const YAML::Exception& e) {
        int line = e.mark.is_null() ? 0 : e.mark.line + 1;
        int column = e.mark.is_null() ? 0 : e.mark.column + 1;
        throw YamlParseError(e.what(), line, column);
    }

    return events;
}

Value resolve_plain_scalar(std::string_view text)
{
    if (text.empty() || text == "~" || boost::algorithm::iequals(text, "null")) {
        return Value{};
    }
    if (boost::algorithm::iequals(text, "true")) return Value{true};
    if (boost::algorithm::iequals(text, "false")) return Value{false};

    if (is_integer_literal(text)) {
        auto digits = text[0] == '+' ? text.substr(1) : text;
        std::int64_t ival = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), ival);
        if (ec == std::errc{}) return Value{ival};
        // Beyond int64
        return Value{parse_double(text)};
    }

    if (is_float_literal(text)) {
        double d = parse_double(text);
        // A literal too large for a double stays text
        if (!std::isinf(d)) return Value{d};
        return Value{text};
    }

    if (boost::algorithm::iequals(text, ".nan")) {
        return Value{std::numeric_limits<double>::quiet_NaN()};
    }
    if (boost::algorithm::iequals(text, ".inf") || boost::algorithm::iequals(text, "+.inf")) {
        return Value{std::numeric_limits<double>::infinity()};
    }
    if (boost::algorithm::iequals(text, "-.inf")) {
        return Value{-std::numeric_limits<double>::infinity()};
    }

    return Value{text};
}

// ============================================================
// YamlConverter
// ============================================================

class YamlConverter::Cursor {
public:
    explicit Cursor(std::span<const YamlEvent> events) : events_(events) {}

    [[nodiscard]] bool at_end() const { return pos_ >= events_.size(); }

    [[nodiscard]] const YamlEvent* peek() const {
        return at_end() ? nullptr : &events_[pos_];
    }

    const YamlEvent& next() {
        if (at_end()) {
            // The stream stopped inside a document or collection
            throw UnsupportedConstructError("StreamEnd");
        }
        return events_[pos_++];
    }

    bool consume_if(YamlEventType type) {
        if (!at_end() && events_[pos_].type == type) {
            ++pos_;
            return true;
        }
        return false;
    }

private:
    std::span<const YamlEvent> events_;
    std::size_t pos_ = 0;
};

namespace {

[[noreturn]] void throw_unsupported(const YamlEvent& event)
{
    throw UnsupportedConstructError(event_type_name(event.type), event.line, event.column);
}

} // anonymous namespace

YamlConverter::YamlConverter(DuplicateKeyHandler on_duplicate_key, NodeBuiltHook on_node_built)
    : on_duplicate_key_(std::move(on_duplicate_key))
    , on_node_built_(std::move(on_node_built))
{
}

std::optional<Value> YamlConverter::convert(std::span<const YamlEvent> events) const
{
    Cursor cursor(events);
    if (cursor.at_end()) return std::nullopt;

    cursor.consume_if(YamlEventType::DocumentStart);
    Value result = convert_node(cursor);
    cursor.consume_if(YamlEventType::DocumentEnd);

    // Only one document is converted
    if (const auto* extra = cursor.peek(); extra && extra->type != YamlEventType::DocumentStart) {
        throw_unsupported(*extra);
    }
    return result;
}

std::optional<Value> YamlConverter::convert(std::string_view text) const
{
    auto events = read_yaml_events(text);
    return convert(std::span<const YamlEvent>(events));
}

Value YamlConverter::built(Value node, const YamlEvent& event) const
{
    if (!on_node_built_) return node;
    return on_node_built_(std::move(node), event);
}

Value YamlConverter::convert_node(Cursor& cursor) const
{
    const YamlEvent& event = cursor.next();

    switch (event.type) {
        case YamlEventType::Scalar:
            if (event.style == ScalarStyle::Plain) {
                return built(resolve_plain_scalar(event.value), event);
            }
            return built(Value{event.value}, event);

        case YamlEventType::SequenceStart:
            return convert_sequence(cursor, event);

        case YamlEventType::MappingStart:
            return convert_mapping(cursor, event);

        default:
            throw_unsupported(event);
    }
}

Value YamlConverter::convert_sequence(Cursor& cursor, const YamlEvent& start) const
{
    ArrayBuilder builder;
    while (!cursor.consume_if(YamlEventType::SequenceEnd)) {
        builder.push_back(convert_node(cursor));
    }
    return built(builder.finish(), start);
}

Value YamlConverter::convert_mapping(Cursor& cursor, const YamlEvent& start) const
{
    ObjectBuilder builder;
    while (!cursor.consume_if(YamlEventType::MappingEnd)) {
        const YamlEvent& key = cursor.next();
        if (key.type != YamlEventType::Scalar) {
            throw_unsupported(key);
        }

        Value value = convert_node(cursor);

        if (builder.contains(key.value)) {
            if (on_duplicate_key_) {
                on_duplicate_key_(key);
            } else {
                detail::log_key_error("YamlConverter::convert", key.value,
                                      "repeated at line " + std::to_string(key.line));
            }
        }
        builder.set(key.value, std::move(value));
    }
    return built(builder.finish(), start);
}

std::optional<Value> yaml_to_value(std::string_view text,
                                   DuplicateKeyHandler on_duplicate_key,
                                   NodeBuiltHook on_node_built)
{
    return YamlConverter(std::move(on_duplicate_key), std::move(on_node_built)).convert(text);
}

} // namespace semdiff
