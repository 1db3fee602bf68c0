// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <value_de/error.h>
#include <value_de/number.h>

#include <cstdio>

namespace value_de {

namespace {

// Debug-style quoting: string "a\"b"
std::string quote_debug(std::string_view s)
{
    std::string result;
    result.reserve(s.size() + 2);
    result += '"';
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[10];
                    std::snprintf(buf, sizeof(buf), "\\u{%x}",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    result += '"';
    return result;
}

// "`a`", "`a` or `b`", "one of `a`, `b`, `c`"
std::string one_of(std::span<const std::string_view> names)
{
    std::string result;
    if (names.size() == 1) {
        result += '`';
        result += names[0];
        result += '`';
        return result;
    }
    if (names.size() == 2) {
        result += '`';
        result += names[0];
        result += "` or `";
        result += names[1];
        result += '`';
        return result;
    }
    result += "one of ";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) result += ", ";
        result += '`';
        result += names[i];
        result += '`';
    }
    return result;
}

} // anonymous namespace

std::string_view to_string(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::InvalidType:   return "invalid type";
        case ErrorKind::InvalidValue:  return "invalid value";
        case ErrorKind::InvalidLength: return "invalid length";
        case ErrorKind::Custom:        return "custom";
    }
    return "unknown";
}

// ============================================================
// Unexpected
// ============================================================

std::string Unexpected::to_string() const
{
    switch (kind_) {
        case Kind::Bool:
            return std::get<bool>(payload_) ? "boolean `true`" : "boolean `false`";
        case Kind::Unsigned:
            return "integer `" + std::to_string(std::get<uint64_t>(payload_)) + "`";
        case Kind::Signed:
            return "integer `" + std::to_string(std::get<int64_t>(payload_)) + "`";
        case Kind::Float:
            return "floating point `" + Number::format_f64(std::get<double>(payload_)) + "`";
        case Kind::Char:
            return "character `" + std::get<std::string>(payload_) + "`";
        case Kind::Str:
            return "string " + quote_debug(std::get<std::string>(payload_));
        case Kind::Bytes:          return "byte array";
        case Kind::Unit:           return "unit value";
        case Kind::Option:         return "Option value";
        case Kind::NewtypeStruct:  return "newtype struct";
        case Kind::Seq:            return "sequence";
        case Kind::Map:            return "map";
        case Kind::Enum:           return "enum";
        case Kind::UnitVariant:    return "unit variant";
        case Kind::NewtypeVariant: return "newtype variant";
        case Kind::TupleVariant:   return "tuple variant";
        case Kind::StructVariant:  return "struct variant";
        case Kind::Other:
            return std::get<std::string>(payload_);
    }
    return {};
}

// ============================================================
// Error
// ============================================================

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind)
{
}

Error Error::custom(std::string_view message)
{
    return Error{ErrorKind::Custom, std::string{message}};
}

Error Error::invalid_type(const Unexpected& unexp, std::string_view expected)
{
    std::string msg = "invalid type: " + unexp.to_string() + ", expected ";
    msg += expected;
    return Error{ErrorKind::InvalidType, msg};
}

Error Error::invalid_value(const Unexpected& unexp, std::string_view expected)
{
    std::string msg = "invalid value: " + unexp.to_string() + ", expected ";
    msg += expected;
    return Error{ErrorKind::InvalidValue, msg};
}

Error Error::invalid_length(std::size_t len, std::string_view expected)
{
    std::string msg = "invalid length " + std::to_string(len) + ", expected ";
    msg += expected;
    return Error{ErrorKind::InvalidLength, msg};
}

Error Error::unknown_variant(std::string_view variant, std::span<const std::string_view> expected)
{
    std::string msg = "unknown variant `";
    msg += variant;
    if (expected.empty()) {
        msg += "`, there are no variants";
    } else {
        msg += "`, expected " + one_of(expected);
    }
    return custom(msg);
}

Error Error::unknown_field(std::string_view field, std::span<const std::string_view> expected)
{
    std::string msg = "unknown field `";
    msg += field;
    if (expected.empty()) {
        msg += "`, there are no fields";
    } else {
        msg += "`, expected " + one_of(expected);
    }
    return custom(msg);
}

Error Error::missing_field(std::string_view field)
{
    std::string msg = "missing field `";
    msg += field;
    msg += '`';
    return custom(msg);
}

Error Error::duplicate_field(std::string_view field)
{
    std::string msg = "duplicate field `";
    msg += field;
    msg += '`';
    return custom(msg);
}

} // namespace value_de
