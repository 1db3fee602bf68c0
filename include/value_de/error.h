// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file error.h
/// @brief Error type raised while consuming a Value tree.
///
/// Every failure inside the deserialization core is reported by throwing
/// value_de::Error. Nothing is retried or recovered internally: the first
/// error unwinds straight back to the caller of from_value() / deserialize().
///
/// Message formats:
///   - invalid type:   "invalid type: boolean `true`, expected a string"
///   - invalid value:  "invalid value: integer `200`, expected i8"
///   - invalid length: "invalid length 3, expected fewer elements in array"
///   - custom:         free text ("value is missing", "missing field `id`", ...)

#pragma once

#include "api.h"
#include "value_de_config.h"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace value_de {

/// Error categories, coarse enough to compare across owning/borrowing modes
enum class ErrorKind : uint8_t {
    InvalidType,   ///< actual node kind does not match the requested shape
    InvalidValue,  ///< right kind, unacceptable value (range, enum selector shape)
    InvalidLength, ///< residual elements after the visitor finished
    Custom,        ///< anything else (missing map value, raw passthrough, user errors)
};

[[nodiscard]] VALUE_DE_API std::string_view to_string(ErrorKind kind) noexcept;

// ============================================================
// Unexpected - description of the input that was found
// ============================================================

class VALUE_DE_API Unexpected
{
public:
    enum class Kind : uint8_t {
        Bool,
        Unsigned,
        Signed,
        Float,
        Char,
        Str,
        Bytes,
        Unit,
        Option,
        NewtypeStruct,
        Seq,
        Map,
        Enum,
        UnitVariant,
        NewtypeVariant,
        TupleVariant,
        StructVariant,
        Other,
    };

    [[nodiscard]] static Unexpected boolean(bool v) { return Unexpected{Kind::Bool, v}; }
    [[nodiscard]] static Unexpected unsigned_int(uint64_t v) { return Unexpected{Kind::Unsigned, v}; }
    [[nodiscard]] static Unexpected signed_int(int64_t v) { return Unexpected{Kind::Signed, v}; }
    [[nodiscard]] static Unexpected floating(double v) { return Unexpected{Kind::Float, v}; }
    [[nodiscard]] static Unexpected character(char v) { return Unexpected{Kind::Char, std::string(1, v)}; }
    [[nodiscard]] static Unexpected str(std::string_view v) { return Unexpected{Kind::Str, std::string{v}}; }
    [[nodiscard]] static Unexpected bytes() { return Unexpected{Kind::Bytes}; }
    [[nodiscard]] static Unexpected unit() { return Unexpected{Kind::Unit}; }
    [[nodiscard]] static Unexpected option() { return Unexpected{Kind::Option}; }
    [[nodiscard]] static Unexpected newtype_struct() { return Unexpected{Kind::NewtypeStruct}; }
    [[nodiscard]] static Unexpected seq() { return Unexpected{Kind::Seq}; }
    [[nodiscard]] static Unexpected map() { return Unexpected{Kind::Map}; }
    [[nodiscard]] static Unexpected enumeration() { return Unexpected{Kind::Enum}; }
    [[nodiscard]] static Unexpected unit_variant() { return Unexpected{Kind::UnitVariant}; }
    [[nodiscard]] static Unexpected newtype_variant() { return Unexpected{Kind::NewtypeVariant}; }
    [[nodiscard]] static Unexpected tuple_variant() { return Unexpected{Kind::TupleVariant}; }
    [[nodiscard]] static Unexpected struct_variant() { return Unexpected{Kind::StructVariant}; }
    [[nodiscard]] static Unexpected other(std::string what) { return Unexpected{Kind::Other, std::move(what)}; }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    /// Human readable form, e.g. "integer `5`" or "string \"abc\""
    [[nodiscard]] std::string to_string() const;

private:
    using Payload = std::variant<std::monostate, bool, uint64_t, int64_t, double, std::string>;

    explicit Unexpected(Kind kind, Payload payload = {}) : kind_(kind), payload_(std::move(payload)) {}

    Kind kind_;
    Payload payload_;
};

// ============================================================
// Error
// ============================================================

class VALUE_DE_API Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    [[nodiscard]] static Error custom(std::string_view message);
    [[nodiscard]] static Error invalid_type(const Unexpected& unexp, std::string_view expected);
    [[nodiscard]] static Error invalid_value(const Unexpected& unexp, std::string_view expected);
    [[nodiscard]] static Error invalid_length(std::size_t len, std::string_view expected);

    // Helpers for hand-written Deserialize implementations of structs and enums
    [[nodiscard]] static Error unknown_variant(std::string_view variant, std::span<const std::string_view> expected);
    [[nodiscard]] static Error unknown_field(std::string_view field, std::span<const std::string_view> expected);
    [[nodiscard]] static Error missing_field(std::string_view field);
    [[nodiscard]] static Error duplicate_field(std::string_view field);

private:
    ErrorKind kind_;
};

} // namespace value_de
