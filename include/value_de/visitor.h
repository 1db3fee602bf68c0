// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file visitor.h
/// @brief The "build a value from primitives" callback interface.
///
/// A deserializer inspects its input and calls exactly one trigger on the
/// visitor it was given. A visitor derives from Visitor<Self, T>, defines
/// `std::string expecting() const` and overrides the triggers it accepts:
///
/// @code
///   struct PortVisitor : Visitor<PortVisitor, uint16_t> {
///       std::string expecting() const { return "a port number"; }
///
///       uint16_t visit_u64(uint64_t v) {
///           if (v > 65535) throw Error::invalid_value(Unexpected::unsigned_int(v), expecting());
///           return static_cast<uint16_t>(v);
///       }
///   };
/// @endcode
///
/// Triggers that are not overridden forward along the usual chain
/// (i8/i16/i32 -> i64, u8/u16/u32 -> u64, f32 -> f64, borrowed_str and
/// string -> str, borrowed_bytes and byte_buf -> bytes, char -> str) and end
/// in "invalid type: <what was found>, expected <expecting()>".
///
/// Compound input is handed over through access objects:
/// - SeqAccess:     next_element<T>() until std::nullopt
/// - MapAccess:     next_key<K>() then next_value<V>(), or next_entry<K, V>()
/// - EnumAccess:    variant<T>() -> (variant name, VariantAccess)
/// - VariantAccess: unit_variant() / newtype_variant<T>() / tuple_variant() / struct_variant()

#pragma once

#include "value_fwd.h"
#include "error.h"
#include "integer.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace value_de {

// ============================================================
// Visitor
// ============================================================

template <typename Derived, typename T>
class Visitor
{
public:
    using value_type = T;

    T visit_bool(bool v) { throw Error::invalid_type(Unexpected::boolean(v), self().expecting()); }

    T visit_i8(int8_t v) { return self().visit_i64(static_cast<int64_t>(v)); }
    T visit_i16(int16_t v) { return self().visit_i64(static_cast<int64_t>(v)); }
    T visit_i32(int32_t v) { return self().visit_i64(static_cast<int64_t>(v)); }
    T visit_i64(int64_t v) { throw Error::invalid_type(Unexpected::signed_int(v), self().expecting()); }

    T visit_u8(uint8_t v) { return self().visit_u64(static_cast<uint64_t>(v)); }
    T visit_u16(uint16_t v) { return self().visit_u64(static_cast<uint64_t>(v)); }
    T visit_u32(uint32_t v) { return self().visit_u64(static_cast<uint64_t>(v)); }
    T visit_u64(uint64_t v) { throw Error::invalid_type(Unexpected::unsigned_int(v), self().expecting()); }

#if VALUE_DE_HAS_INT128
    T visit_i128(int128_t v)
    {
        throw Error::invalid_type(Unexpected::other("integer `" + detail::to_string(v) + "` as i128"),
                                  self().expecting());
    }

    T visit_u128(uint128_t v)
    {
        throw Error::invalid_type(Unexpected::other("integer `" + detail::to_string(v) + "` as u128"),
                                  self().expecting());
    }
#endif

    T visit_f32(float v) { return self().visit_f64(static_cast<double>(v)); }
    T visit_f64(double v) { throw Error::invalid_type(Unexpected::floating(v), self().expecting()); }

    T visit_char(char v) { return self().visit_str(std::string_view(&v, 1)); }

    T visit_str(std::string_view v) { throw Error::invalid_type(Unexpected::str(v), self().expecting()); }
    /// Text that lives as long as the input tree
    T visit_borrowed_str(std::string_view v) { return self().visit_str(v); }
    /// Text the visitor may keep without copying
    T visit_string(std::string v) { return self().visit_str(v); }

    T visit_bytes(std::span<const uint8_t>) { throw Error::invalid_type(Unexpected::bytes(), self().expecting()); }
    T visit_borrowed_bytes(std::span<const uint8_t> v) { return self().visit_bytes(v); }
    T visit_byte_buf(std::vector<uint8_t> v) { return self().visit_bytes(v); }

    T visit_none() { throw Error::invalid_type(Unexpected::option(), self().expecting()); }

    template <typename D>
    T visit_some(D&&)
    {
        throw Error::invalid_type(Unexpected::option(), self().expecting());
    }

    T visit_unit() { throw Error::invalid_type(Unexpected::unit(), self().expecting()); }

    template <typename D>
    T visit_newtype_struct(D&&)
    {
        throw Error::invalid_type(Unexpected::newtype_struct(), self().expecting());
    }

    template <typename A>
    T visit_seq(A&)
    {
        throw Error::invalid_type(Unexpected::seq(), self().expecting());
    }

    template <typename A>
    T visit_map(A&)
    {
        throw Error::invalid_type(Unexpected::map(), self().expecting());
    }

    template <typename A>
    T visit_enum(A&)
    {
        throw Error::invalid_type(Unexpected::enumeration(), self().expecting());
    }

protected:
    Derived& self() { return static_cast<Derived&>(*this); }
};

// ============================================================
// Seeds
// ============================================================

/// Stateless seed that builds T through Deserialize<T>
template <typename T>
struct PhantomSeed {
    using value_type = T;

    template <typename D>
    T deserialize(D&& de) const
    {
        return Deserialize<T>::deserialize(std::forward<D>(de));
    }
};

// ============================================================
// Access bases (CRTP)
// ============================================================
// The derived cursor provides the *_seed primitives; the typed helpers
// below wrap them with PhantomSeed.

template <typename Derived>
class SeqAccess
{
public:
    /// Next element as T, or std::nullopt once the sequence is exhausted
    template <typename T>
    std::optional<T> next_element()
    {
        return self().next_element_seed(PhantomSeed<T>{});
    }

protected:
    Derived& self() { return static_cast<Derived&>(*this); }
};

template <typename Derived>
class MapAccess
{
public:
    template <typename K>
    std::optional<K> next_key()
    {
        return self().next_key_seed(PhantomSeed<K>{});
    }

    template <typename V>
    V next_value()
    {
        return self().next_value_seed(PhantomSeed<V>{});
    }

    template <typename KS, typename VS>
    std::optional<std::pair<visitor_value_t<KS>, visitor_value_t<VS>>> next_entry_seed(KS&& kseed, VS&& vseed)
    {
        auto key = self().next_key_seed(kseed);
        if (!key) return std::nullopt;
        auto value = self().next_value_seed(vseed);
        return std::optional<std::pair<visitor_value_t<KS>, visitor_value_t<VS>>>{
            std::in_place, std::move(*key), std::move(value)};
    }

    template <typename K, typename V>
    std::optional<std::pair<K, V>> next_entry()
    {
        return next_entry_seed(PhantomSeed<K>{}, PhantomSeed<V>{});
    }

protected:
    Derived& self() { return static_cast<Derived&>(*this); }
};

template <typename Derived>
class EnumAccess
{
public:
    /// Resolve the variant name as T; the second member consumes the payload
    template <typename T>
    auto variant()
    {
        return self().variant_seed(PhantomSeed<T>{});
    }

protected:
    Derived& self() { return static_cast<Derived&>(*this); }
};

template <typename Derived>
class VariantAccess
{
public:
    template <typename T>
    T newtype_variant()
    {
        return self().newtype_variant_seed(PhantomSeed<T>{});
    }

protected:
    Derived& self() { return static_cast<Derived&>(*this); }
};

// ============================================================
// Integer dispatch
// ============================================================

namespace detail {

template <typename V> visitor_value_t<V> visit_integer(V& v, int8_t n) { return v.visit_i8(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, int16_t n) { return v.visit_i16(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, int32_t n) { return v.visit_i32(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, int64_t n) { return v.visit_i64(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, uint8_t n) { return v.visit_u8(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, uint16_t n) { return v.visit_u16(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, uint32_t n) { return v.visit_u32(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, uint64_t n) { return v.visit_u64(n); }
#if VALUE_DE_HAS_INT128
template <typename V> visitor_value_t<V> visit_integer(V& v, int128_t n) { return v.visit_i128(n); }
template <typename V> visitor_value_t<V> visit_integer(V& v, uint128_t n) { return v.visit_u128(n); }
#endif

} // namespace detail

} // namespace value_de
