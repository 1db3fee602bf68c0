// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <value_de/serialization.h>

#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace value_de {

// ============================================================
// JSON Writer
// ============================================================

namespace {

std::string json_escape_string(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, Number>) {
            oss << arg.to_string();
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueArrayPtr>) {
            if (arg->empty()) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                for (std::size_t i = 0; i < arg->size(); ++i) {
                    if (i > 0) oss << "," << newline;
                    oss << child_indent;
                    to_json_impl((*arg)[i], oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        } else if constexpr (std::is_same_v<T, ValueObjectPtr>) {
            if (arg->empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& [k, v] : *arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(k) << "\":" << space_after_colon;
                    to_json_impl(v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        }
    }, val.data);
}

// ============================================================
// JSON Reader
// ============================================================

class JsonParser
{
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0), depth_(0) {}

    Value parse(std::string* error_out)
    {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                fail("Empty JSON input");
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ != json_.size()) {
                fail("Trailing characters at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::runtime_error& e) {
            detail::log_parse_error("from_json", e.what());
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;
    std::size_t depth_;

    [[noreturn]] static void fail(const std::string& message) { throw std::runtime_error(message); }

    char peek() const { return pos_ < json_.size() ? json_[pos_] : '\0'; }

    char consume() { return pos_ < json_.size() ? json_[pos_++] : '\0'; }

    void skip_whitespace()
    {
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c)
    {
        skip_whitespace();
        if (consume() != c) {
            fail(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    void enter()
    {
        if (++depth_ > parser_max_depth) {
            fail("Nesting deeper than " + std::to_string(parser_max_depth) + " at position " +
                 std::to_string(pos_));
        }
    }

    void leave() { --depth_; }

    Value parse_value()
    {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return Value{parse_string_raw()};
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();

        if (pos_ >= json_.size()) {
            fail("Unexpected end of input");
        }
        fail("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object()
    {
        expect('{');
        enter();
        skip_whitespace();

        ValueObject obj;
        if (peek() == '}') {
            consume();
            leave();
            return Value{std::move(obj)};
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            obj.insert(std::move(key), std::move(val));

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        leave();
        return Value{std::move(obj)};
    }

    Value parse_array()
    {
        expect('[');
        enter();
        skip_whitespace();

        ValueArray items;
        if (peek() == ']') {
            consume();
            leave();
            return Value{std::move(items)};
        }

        while (true) {
            items.push_back(parse_value());

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                fail("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        leave();
        return Value{std::move(items)};
    }

    uint32_t parse_hex4()
    {
        if (pos_ + 4 > json_.size()) {
            fail("Invalid unicode escape at position " + std::to_string(pos_));
        }
        uint32_t code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') {
                code |= static_cast<uint32_t>(h - '0');
            } else if (h >= 'a' && h <= 'f') {
                code |= static_cast<uint32_t>(h - 'a' + 10);
            } else if (h >= 'A' && h <= 'F') {
                code |= static_cast<uint32_t>(h - 'A' + 10);
            } else {
                fail("Invalid hex digit in unicode escape at position " + std::to_string(pos_ - 1));
            }
        }
        return code;
    }

    static void append_utf8(std::string& out, uint32_t codepoint)
    {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw()
    {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("Control character in string at position " + std::to_string(pos_ - 1));
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
                    uint32_t code = parse_hex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00-\uDFFF
                        if (pos_ + 2 > json_.size() || json_[pos_] != '\\' || json_[pos_ + 1] != 'u') {
                            fail("Unpaired surrogate in unicode escape at position " + std::to_string(pos_));
                        }
                        pos_ += 2;
                        uint32_t low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("Invalid low surrogate at position " + std::to_string(pos_));
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired surrogate in unicode escape at position " + std::to_string(pos_));
                    }
                    append_utf8(result, code);
                    break;
                }
                default:
                    fail("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        }

        fail("Unterminated string");
    }

    Value parse_number()
    {
        const std::size_t start = pos_;

        if (peek() == '-') consume();
        while (pos_ < json_.size()) {
            char c = peek();
            if ((c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                consume();
            } else {
                break;
            }
        }

        std::string_view text = json_.substr(start, pos_ - start);
        auto number = Number::from_string(text);
        if (!number) {
            fail("Invalid number '" + std::string(text) + "' at position " + std::to_string(start));
        }
        return Value{*number};
    }

    Value parse_bool()
    {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        fail("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null()
    {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        fail("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out)
{
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

} // namespace value_de
