// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file integer.h
/// @brief Integer helpers shared by the visitors and the map key consumer.
///
/// - integer_name<T>(): "i8", "u32", ... (used as the expected-type phrase)
/// - fits<T>(v): exact range check across signedness and widths
/// - parse_integer<T>(text): strict decimal parsing of a map key
/// - to_string() for the 128-bit types

#pragma once

#include "value_de_config.h"

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace value_de::detail {

// ============================================================
// Type classification
// ============================================================

/// Fixed-width integers up to 64 bits (bool and the character types excluded)
template <typename T>
inline constexpr bool is_integer_v = std::is_integral_v<T> &&
                                     !std::is_same_v<T, bool> &&
                                     !std::is_same_v<T, char> &&
                                     !std::is_same_v<T, wchar_t> &&
                                     !std::is_same_v<T, char8_t> &&
                                     !std::is_same_v<T, char16_t> &&
                                     !std::is_same_v<T, char32_t> &&
                                     sizeof(T) <= 8;

#if VALUE_DE_HAS_INT128
template <typename T>
inline constexpr bool is_int128_v = std::is_same_v<T, int128_t> || std::is_same_v<T, uint128_t>;

using widest_uint = uint128_t;
#else
template <typename T>
inline constexpr bool is_int128_v = false;

using widest_uint = uint64_t;
#endif

template <typename T>
inline constexpr bool is_signed_integer_v =
#if VALUE_DE_HAS_INT128
    std::is_same_v<T, int128_t> ||
#endif
    (is_integer_v<T> && std::is_signed_v<T>);

template <typename T>
constexpr std::string_view integer_name() noexcept
{
#if VALUE_DE_HAS_INT128
    if constexpr (std::is_same_v<T, int128_t>) return "i128";
    else if constexpr (std::is_same_v<T, uint128_t>) return "u128";
    else
#endif
    if constexpr (is_signed_integer_v<T>) {
        if constexpr (sizeof(T) == 1) return "i8";
        else if constexpr (sizeof(T) == 2) return "i16";
        else if constexpr (sizeof(T) == 4) return "i32";
        else return "i64";
    } else {
        if constexpr (sizeof(T) == 1) return "u8";
        else if constexpr (sizeof(T) == 2) return "u16";
        else if constexpr (sizeof(T) == 4) return "u32";
        else return "u64";
    }
}

// ============================================================
// Range checks
// ============================================================

/// Largest value of T, widened
template <typename T>
constexpr widest_uint max_of() noexcept
{
#if VALUE_DE_HAS_INT128
    if constexpr (std::is_same_v<T, uint128_t>) return ~uint128_t{0};
    else if constexpr (std::is_same_v<T, int128_t>) return ~uint128_t{0} >> 1;
    else
#endif
    return static_cast<widest_uint>(std::numeric_limits<T>::max());
}

/// Magnitude of the smallest value of T (0 for unsigned types)
template <typename T>
constexpr widest_uint min_magnitude_of() noexcept
{
    if constexpr (is_signed_integer_v<T>) {
        return max_of<T>() + 1;
    } else {
        return 0;
    }
}

/// Whether v is representable as T
template <typename T, typename V>
constexpr bool fits(V v) noexcept
{
    if constexpr (is_int128_v<T> || is_int128_v<V>) {
        if constexpr (is_signed_integer_v<V>) {
            if (v < 0) {
                const widest_uint magnitude = widest_uint{0} - static_cast<widest_uint>(v);
                return magnitude <= min_magnitude_of<T>();
            }
        }
        return static_cast<widest_uint>(v) <= max_of<T>();
    } else {
        return std::in_range<T>(v);
    }
}

// ============================================================
// Text conversion
// ============================================================

#if VALUE_DE_HAS_INT128
inline std::string to_string(uint128_t v)
{
    if (v == 0) return "0";
    char buf[40];
    char* end = buf + sizeof(buf);
    char* p = end;
    while (v != 0) {
        *--p = static_cast<char>('0' + static_cast<int>(v % 10));
        v /= 10;
    }
    return std::string(p, end);
}

inline std::string to_string(int128_t v)
{
    if (v < 0) {
        return "-" + to_string(uint128_t{0} - static_cast<uint128_t>(v));
    }
    return to_string(static_cast<uint128_t>(v));
}
#endif

/// Parse decimal text as T: optional sign, digits only, no whitespace.
/// Leading '+' and leading zeros are accepted; '-' only for signed types.
template <typename T>
std::optional<T> parse_integer(std::string_view text) noexcept
{
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
        if (text.empty()) return std::nullopt;
        if (negative && !is_signed_integer_v<T>) return std::nullopt;
    }

    const widest_uint limit = negative ? min_magnitude_of<T>() : max_of<T>();
    widest_uint magnitude = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto digit = static_cast<widest_uint>(c - '0');
        if (magnitude > (limit - digit) / 10) return std::nullopt;
        magnitude = magnitude * 10 + digit;
    }

    if (!negative) return static_cast<T>(magnitude);
    if constexpr (is_signed_integer_v<T>) {
        if (magnitude == 0) return T{0};
        // -(magnitude) computed without overflowing at the minimum
        return static_cast<T>(-static_cast<T>(magnitude - 1) - 1);
    } else {
        return std::nullopt;
    }
}

} // namespace value_de::detail
