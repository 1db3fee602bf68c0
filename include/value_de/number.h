// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file number.h
/// @brief JSON number held by a Value tree.
///
/// A Number is one of three representations:
///   - non-negative integer (stored as uint64_t)
///   - negative integer (stored as int64_t)
///   - finite floating point (stored as double)
///
/// Integers >= 0 are always stored unsigned, so Number{5} and Number{5u}
/// compare equal and dispatch identically.

#pragma once

#include "api.h"
#include "error.h"

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace value_de {

class VALUE_DE_API Number
{
public:
    Number() noexcept : kind_(Kind::PosInt), u_(0) {}

    template <std::unsigned_integral T>
        requires(!std::same_as<T, bool>)
    Number(T v) noexcept : kind_(Kind::PosInt), u_(static_cast<uint64_t>(v)) {}

    template <std::signed_integral T>
    Number(T v) noexcept : kind_(v < 0 ? Kind::NegInt : Kind::PosInt)
    {
        if (v < 0) {
            i_ = static_cast<int64_t>(v);
        } else {
            u_ = static_cast<uint64_t>(v);
        }
    }

    /// Returns std::nullopt for NaN and infinities, which JSON cannot hold
    [[nodiscard]] static std::optional<Number> from_f64(double v) noexcept;

    /// Parse a JSON number literal ("-12", "3.5e2"). Integers too large for
    /// 64 bits fall back to double. Returns std::nullopt on malformed text.
    [[nodiscard]] static std::optional<Number> from_string(std::string_view text) noexcept;

    [[nodiscard]] bool is_u64() const noexcept { return kind_ == Kind::PosInt; }
    [[nodiscard]] bool is_i64() const noexcept;
    [[nodiscard]] bool is_f64() const noexcept { return kind_ == Kind::Float; }

    [[nodiscard]] std::optional<uint64_t> as_u64() const noexcept;
    [[nodiscard]] std::optional<int64_t> as_i64() const noexcept;
    [[nodiscard]] double as_f64() const noexcept;

    /// Hand the number to the visitor in its own best-fit representation.
    /// Typed requests (i8, u16, f32, ...) also come through here; the visitor
    /// for the requested width is responsible for the exact range check.
    template <typename V>
    typename std::remove_cvref_t<V>::value_type deserialize_any(V&& visitor) const
    {
        if (kind_ == Kind::PosInt) return visitor.visit_u64(u_);
        if (kind_ == Kind::NegInt) return visitor.visit_i64(i_);
        return visitor.visit_f64(f_);
    }

    /// Error descriptor for this number ("integer `5`", "floating point `0.5`")
    [[nodiscard]] Unexpected unexpected() const;

    [[nodiscard]] std::string to_string() const;

    /// Shortest round-trip text for a double; whole values keep a ".0"
    [[nodiscard]] static std::string format_f64(double v);

    [[nodiscard]] bool operator==(const Number& other) const noexcept;

private:
    enum class Kind : uint8_t { PosInt, NegInt, Float };

    Kind kind_;
    union {
        uint64_t u_;
        int64_t i_;
        double f_;
    };
};

} // namespace value_de
