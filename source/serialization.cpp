// serialization.cpp - JSON writer and parser for Value

#include <semdiff/serialization.h>
#include <semdiff/builders.h>
#include <semdiff/errors.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace semdiff {

namespace {

// ============================================================
// Number helpers
// ============================================================

bool is_digit(char c) { return c >= '0' && c <= '9'; }

/// Decimal exponent of the leading significant digit of a literal that
/// from_chars reported out of range; the sign says overflow or underflow
std::int64_t leading_digit_exponent(std::string_view digits)
{
    constexpr std::int64_t kClamp = 1'000'000'000;

    std::size_t i = 0;
    std::int64_t int_digits = 0;
    bool leading = true;
    while (i < digits.size() && is_digit(digits[i])) {
        if (digits[i] != '0') leading = false;
        if (!leading) ++int_digits;
        ++i;
    }

    std::int64_t magnitude = int_digits - 1;
    if (i < digits.size() && digits[i] == '.') {
        ++i;
        std::int64_t zeros = 0;
        while (i < digits.size() && is_digit(digits[i])) {
            if (int_digits == 0 && leading) {
                if (digits[i] == '0') ++zeros;
                else leading = false;
            }
            ++i;
        }
        if (int_digits == 0) magnitude = -(zeros + 1);
    }

    if (i < digits.size() && (digits[i] == 'e' || digits[i] == 'E')) {
        ++i;
        bool negative = false;
        if (i < digits.size() && (digits[i] == '+' || digits[i] == '-')) {
            negative = digits[i] == '-';
            ++i;
        }
        std::int64_t exponent = 0;
        while (i < digits.size() && is_digit(digits[i])) {
            exponent = std::min(exponent * 10 + (digits[i] - '0'), kClamp);
            ++i;
        }
        magnitude += negative ? -exponent : exponent;
    }
    return magnitude;
}

// ============================================================
// JSON Writer
// ============================================================

// OPTIMIZATION: append into one string instead of going through ostringstream
void append_escaped(std::string& out, const std::string& s, bool multiline)
{
    out.reserve(out.size() + s.size() + 2);
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\t': out += "\\t"; break;
            case '\n':
                out += multiline ? "\n" : "\\n";
                break;
            case '\r':
                if (!multiline) out += "\\r";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_double(std::string& out, double d)
{
    if (std::isnan(d)) {
        out += "NaN";
        return;
    }
    if (std::isinf(d)) {
        out += d > 0 ? "Infinity" : "-Infinity";
        return;
    }

    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string_view text(buf, static_cast<std::size_t>(end - buf));
    out += text;
    // Keep the floating kind visible: 2.0 must not read back as integer 2
    if (text.find_first_of(".e") == std::string_view::npos) {
        out += ".0";
    }
}

class JsonWriter {
public:
    JsonWriter(std::string& out, const JsonWriteOptions& options)
        : out_(out), options_(options) {}

    void write(const Value& val, int indent_level)
    {
        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                out_ += "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out_ += arg ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out_ += std::to_string(arg);
            } else if constexpr (std::is_same_v<T, double>) {
                append_double(out_, arg);
            } else if constexpr (std::is_same_v<T, std::string>) {
                append_escaped(out_, arg, options_.multiline_strings);
            } else if constexpr (std::is_same_v<T, ValueObject>) {
                write_object(arg, indent_level);
            } else if constexpr (std::is_same_v<T, ValueArray>) {
                write_array(arg, indent_level);
            }
        }, val.data);
    }

private:
    std::string& out_;
    const JsonWriteOptions& options_;

    void newline_and_indent(int level)
    {
        if (options_.compact) return;
        out_ += '\n';
        out_.append(static_cast<std::size_t>(level * SEMDIFF_JSON_INDENT), ' ');
    }

    void write_object(const ValueObject& obj, int indent_level)
    {
        bool first = true;
        out_ += '{';
        for (const auto& member : obj) {
            if (options_.omit_null_members && member.value->is_null()) continue;
            if (!first) out_ += ',';
            first = false;
            newline_and_indent(indent_level + 1);
            append_escaped(out_, member.key, false);
            out_ += options_.compact ? ":" : ": ";
            write(*member.value, indent_level + 1);
        }
        if (!first || (options_.open_empty_objects && !options_.compact)) {
            newline_and_indent(indent_level);
        }
        out_ += '}';
    }

    void write_array(const ValueArray& arr, int indent_level)
    {
        out_ += '[';
        if (arr.size() == 0) {
            out_ += ']';
            return;
        }
        bool first = true;
        for (const auto& elem : arr) {
            if (!first) out_ += ',';
            first = false;
            newline_and_indent(indent_level + 1);
            write(*elem, indent_level + 1);
        }
        newline_and_indent(indent_level);
        out_ += ']';
    }
};

// ============================================================
// JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Value parse()
    {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("Empty JSON input");
        }
        Value result = parse_value();
        skip_whitespace();
        if (pos_ < json_.size()) {
            fail("Unexpected trailing content");
        }
        return result;
    }

private:
    std::string_view json_;
    std::size_t pos_;

    [[noreturn]] void fail(const std::string& message) const
    {
        throw JsonParseError(message, pos_);
    }

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (peek() != c) {
            fail(std::string("Expected '") + c + "'");
        }
        ++pos_;
    }

    bool consume_literal(std::string_view literal) {
        if (json_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        if (consume_literal("true")) return Value{true};
        if (consume_literal("false")) return Value{false};
        if (consume_literal("null")) return Value{};

        if (c == '\0') fail("Unexpected end of input");
        fail("Unexpected character '" + std::string(1, c) + "'");
    }

    Value parse_object() {
        expect('{');
        skip_whitespace();

        ObjectBuilder builder;
        if (peek() == '}') {
            consume();
            return builder.finish();
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') fail("Expected string key");
            std::size_t key_pos = pos_;
            std::string key = parse_string_raw();
            if (builder.contains(key)) {
                throw JsonParseError("Duplicate key '" + key + "'", key_pos);
            }
            expect(':');
            builder.set(key, parse_value());

            skip_whitespace();
            char c = consume();
            if (c == '}') break;
            if (c != ',') {
                --pos_;
                fail("Expected ',' or '}' in object");
            }
        }

        return builder.finish();
    }

    Value parse_array() {
        expect('[');
        skip_whitespace();

        ArrayBuilder builder;
        if (peek() == ']') {
            consume();
            return builder.finish();
        }

        while (true) {
            builder.push_back(parse_value());

            skip_whitespace();
            char c = consume();
            if (c == ']') break;
            if (c != ',') {
                --pos_;
                fail("Expected ',' or ']' in array");
            }
        }

        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            fail("Invalid unicode escape");
        }
        unsigned code = 0;
        auto [ptr, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, code, 16);
        if (ec != std::errc{} || ptr != json_.data() + pos_ + 4) {
            fail("Invalid unicode escape");
        }
        pos_ += 4;
        return code;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                fail("Unescaped control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= json_.size()) {
                fail("Unexpected end of string escape");
            }
            char escaped = consume();
            switch (escaped) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned cp = parse_hex4();
                    if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("Lone low surrogate");
                    }
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) {
                            fail("Lone high surrogate");
                        }
                        unsigned low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("Invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    fail("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        fail("Unterminated string");
    }

    Value parse_number() {
        std::size_t start = pos_;
        bool is_float = false;

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
        } else if (peek() >= '1' && peek() <= '9') {
            while (peek() >= '0' && peek() <= '9') consume();
        } else {
            fail("Invalid number");
        }

        if (peek() == '.') {
            is_float = true;
            consume();
            if (!(peek() >= '0' && peek() <= '9')) fail("Expected digit after decimal point");
            while (peek() >= '0' && peek() <= '9') consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            is_float = true;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            if (!(peek() >= '0' && peek() <= '9')) fail("Expected digit in exponent");
            while (peek() >= '0' && peek() <= '9') consume();
        }

        const char* first = json_.data() + start;
        const char* last = json_.data() + pos_;

        if (!is_float) {
            std::int64_t ival = 0;
            auto [ptr, ec] = std::from_chars(first, last, ival);
            if (ec == std::errc{} && ptr == last) {
                return Value{ival};
            }
            // Out of int64 range: fall back to double
        }

        auto dval = parse_decimal_double(std::string_view(first, static_cast<std::size_t>(last - first)));
        if (!dval) {
            pos_ = start;
            fail("Invalid number");
        }
        return Value{*dval};
    }
};

} // anonymous namespace

std::string to_json(const Value& val, const JsonWriteOptions& options)
{
    std::string out;
    JsonWriter writer(out, options);
    writer.write(val, 0);
    return out;
}

Value from_json(std::string_view json_str)
{
    JsonParser parser(json_str);
    return parser.parse();
}

Value from_json(std::string_view json_str, std::string* error_out)
{
    try {
        return from_json(json_str);
    } catch (const JsonParseError& e) {
        if (error_out) *error_out = e.what();
        return Value{};
    }
}

std::optional<double> parse_decimal_double(std::string_view text)
{
    // from_chars rejects a leading '+'
    if (!text.empty() && text[0] == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;
    // Reject "inf" and "nan", which from_chars would accept
    {
        const char lead = text.size() > 1 && text[0] == '-' ? text[1] : text[0];
        if (!is_digit(lead) && lead != '.') return std::nullopt;
    }

    double result = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result,
                                     std::chars_format::general);
    if (ptr != text.data() + text.size()) return std::nullopt;
    if (ec == std::errc{}) return result;
    if (ec != std::errc::result_out_of_range) return std::nullopt;

    const bool negative = text[0] == '-';
    auto digits = negative ? text.substr(1) : text;
    if (leading_digit_exponent(digits) >= 0) {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    return negative ? -0.0 : 0.0;
}

} // namespace semdiff
