// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <value_de/number.h>

#include <charconv>
#include <cmath>
#include <limits>

namespace value_de {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Validates the JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
bool scan_number(std::string_view text, bool& is_integer)
{
    std::size_t pos = 0;
    is_integer = true;

    if (pos < text.size() && text[pos] == '-') ++pos;
    if (pos >= text.size()) return false;

    if (text[pos] == '0') {
        ++pos;
    } else if (is_digit(text[pos])) {
        while (pos < text.size() && is_digit(text[pos])) ++pos;
    } else {
        return false;
    }

    if (pos < text.size() && text[pos] == '.') {
        is_integer = false;
        ++pos;
        if (pos >= text.size() || !is_digit(text[pos])) return false;
        while (pos < text.size() && is_digit(text[pos])) ++pos;
    }

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        is_integer = false;
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
        if (pos >= text.size() || !is_digit(text[pos])) return false;
        while (pos < text.size() && is_digit(text[pos])) ++pos;
    }

    return pos == text.size();
}

} // anonymous namespace

std::optional<Number> Number::from_f64(double v) noexcept
{
    if (!std::isfinite(v)) return std::nullopt;
    Number n;
    n.kind_ = Kind::Float;
    n.f_ = v;
    return n;
}

std::optional<Number> Number::from_string(std::string_view text) noexcept
{
    bool is_integer = true;
    if (!scan_number(text, is_integer)) return std::nullopt;

    const char* first = text.data();
    const char* last = text.data() + text.size();

    if (is_integer) {
        if (text.front() == '-') {
            int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last) return Number{i};
        } else {
            uint64_t u = 0;
            auto [ptr, ec] = std::from_chars(first, last, u);
            if (ec == std::errc{} && ptr == last) return Number{u};
        }
        // Out of 64-bit range: fall through to floating point
    }

    double f = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, f);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return from_f64(f);
}

bool Number::is_i64() const noexcept
{
    switch (kind_) {
        case Kind::PosInt: return u_ <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        case Kind::NegInt: return true;
        case Kind::Float:  return false;
    }
    return false;
}

std::optional<uint64_t> Number::as_u64() const noexcept
{
    if (kind_ == Kind::PosInt) return u_;
    return std::nullopt;
}

std::optional<int64_t> Number::as_i64() const noexcept
{
    if (kind_ == Kind::NegInt) return i_;
    if (kind_ == Kind::PosInt && is_i64()) return static_cast<int64_t>(u_);
    return std::nullopt;
}

double Number::as_f64() const noexcept
{
    switch (kind_) {
        case Kind::PosInt: return static_cast<double>(u_);
        case Kind::NegInt: return static_cast<double>(i_);
        case Kind::Float:  return f_;
    }
    return 0.0;
}

Unexpected Number::unexpected() const
{
    switch (kind_) {
        case Kind::PosInt: return Unexpected::unsigned_int(u_);
        case Kind::NegInt: return Unexpected::signed_int(i_);
        case Kind::Float:  return Unexpected::floating(f_);
    }
    return Unexpected::other("number");
}

std::string Number::to_string() const
{
    switch (kind_) {
        case Kind::PosInt: return std::to_string(u_);
        case Kind::NegInt: return std::to_string(i_);
        case Kind::Float:  return format_f64(f_);
    }
    return {};
}

std::string Number::format_f64(double v)
{
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    std::string result(buf, ec == std::errc{} ? ptr : buf);
    if (result.find_first_of(".e") == std::string::npos) {
        result += ".0";
    }
    return result;
}

bool Number::operator==(const Number& other) const noexcept
{
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Kind::PosInt: return u_ == other.u_;
        case Kind::NegInt: return i_ == other.i_;
        case Kind::Float:  return f_ == other.f_;
    }
    return false;
}

} // namespace value_de
