// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file deserialize.h
/// @brief Deserialize<T> for the standard library types.
///
/// Provided here:
/// - bool, char, every integer type (128-bit where available), float, double
/// - std::string, std::monostate (unit), std::optional<T>
/// - std::vector<T>, std::map<K, V>, std::unordered_map<K, V>
/// - std::pair<A, B>, std::tuple<Ts...>, std::array<T, N>
/// - ByteBuf (bytes, strings or sequences of u8)
/// - IgnoredAny (accepts and discards anything)
///
/// Value and RawValue are in from_value.h and raw_value.h.
///
/// A user type plugs in by specializing Deserialize:
/// @code
///   template <>
///   struct value_de::Deserialize<Celsius> {
///       template <Deserializer D>
///       static Celsius deserialize(D&& de) {
///           return Celsius{Deserialize<double>::deserialize(de)};
///       }
///   };
/// @endcode

#pragma once

#include "concepts.h"
#include "visitor.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace value_de {

/// Owned byte buffer; accepts bytes, strings and sequences of u8
struct ByteBuf {
    std::vector<uint8_t> bytes;

    bool operator==(const ByteBuf&) const = default;
};

/// Placeholder that consumes any input and keeps nothing
struct IgnoredAny {
    bool operator==(const IgnoredAny&) const = default;
};

namespace detail {

// Upper bound for reserve() driven by an untrusted size hint
inline constexpr std::size_t max_prealloc = 4096;

// ============================================================
// Primitive visitors
// ============================================================

struct BoolVisitor : Visitor<BoolVisitor, bool> {
    std::string expecting() const { return "a boolean"; }

    bool visit_bool(bool v) { return v; }
};

template <typename I>
struct IntegerVisitor : Visitor<IntegerVisitor<I>, I> {
    std::string expecting() const { return std::string{integer_name<I>()}; }

    I visit_i64(int64_t v)
    {
        if (!fits<I>(v)) throw Error::invalid_value(Unexpected::signed_int(v), expecting());
        return static_cast<I>(v);
    }

    I visit_u64(uint64_t v)
    {
        if (!fits<I>(v)) throw Error::invalid_value(Unexpected::unsigned_int(v), expecting());
        return static_cast<I>(v);
    }

#if VALUE_DE_HAS_INT128
    I visit_i128(int128_t v)
    {
        if (!fits<I>(v)) {
            throw Error::invalid_value(Unexpected::other("integer `" + to_string(v) + "` as i128"), expecting());
        }
        return static_cast<I>(v);
    }

    I visit_u128(uint128_t v)
    {
        if (!fits<I>(v)) {
            throw Error::invalid_value(Unexpected::other("integer `" + to_string(v) + "` as u128"), expecting());
        }
        return static_cast<I>(v);
    }
#endif
};

template <typename F>
struct FloatVisitor : Visitor<FloatVisitor<F>, F> {
    std::string expecting() const { return sizeof(F) == 4 ? "f32" : "f64"; }

    F visit_f64(double v) { return static_cast<F>(v); }
    F visit_i64(int64_t v) { return static_cast<F>(v); }
    F visit_u64(uint64_t v) { return static_cast<F>(v); }
};

struct CharVisitor : Visitor<CharVisitor, char> {
    std::string expecting() const { return "a character"; }

    char visit_char(char v) { return v; }

    char visit_str(std::string_view v)
    {
        if (v.size() != 1) throw Error::invalid_value(Unexpected::str(v), expecting());
        return v.front();
    }
};

struct StringVisitor : Visitor<StringVisitor, std::string> {
    std::string expecting() const { return "a string"; }

    std::string visit_str(std::string_view v) { return std::string{v}; }
    std::string visit_string(std::string v) { return v; }
};

struct UnitVisitor : Visitor<UnitVisitor, std::monostate> {
    std::string expecting() const { return "unit"; }

    std::monostate visit_unit() { return {}; }
};

// ============================================================
// Container visitors
// ============================================================

template <typename T>
struct OptionVisitor : Visitor<OptionVisitor<T>, std::optional<T>> {
    std::string expecting() const { return "option"; }

    std::optional<T> visit_unit() { return std::nullopt; }
    std::optional<T> visit_none() { return std::nullopt; }

    template <typename D>
    std::optional<T> visit_some(D&& de)
    {
        return std::optional<T>{std::in_place, Deserialize<T>::deserialize(std::forward<D>(de))};
    }
};

template <typename T>
struct VectorVisitor : Visitor<VectorVisitor<T>, std::vector<T>> {
    std::string expecting() const { return "a sequence"; }

    template <SeqAccessType A>
    std::vector<T> visit_seq(A& seq)
    {
        std::vector<T> out;
        if (auto hint = seq.size_hint()) {
            out.reserve(std::min(*hint, max_prealloc));
        }
        while (auto elem = seq.template next_element<T>()) {
            out.push_back(std::move(*elem));
        }
        return out;
    }
};

template <typename M>
struct MapVisitor : Visitor<MapVisitor<M>, M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    std::string expecting() const { return "a map"; }

    template <MapAccessType A>
    M visit_map(A& map)
    {
        M out;
        while (auto entry = map.template next_entry<key_type, mapped_type>()) {
            out.insert_or_assign(std::move(entry->first), std::move(entry->second));
        }
        return out;
    }
};

/// pair / tuple: exactly sizeof...(Ts) elements
template <typename Tuple, typename... Ts>
struct TupleVisitor : Visitor<TupleVisitor<Tuple, Ts...>, Tuple> {
    std::string expecting() const { return "a tuple of size " + std::to_string(sizeof...(Ts)); }

    template <SeqAccessType A>
    Tuple visit_seq(A& seq)
    {
        return read(seq, std::index_sequence_for<Ts...>{});
    }

private:
    template <typename T, typename A>
    T next(A& seq, std::size_t index)
    {
        auto elem = seq.template next_element<T>();
        if (!elem) throw Error::invalid_length(index, expecting());
        return std::move(*elem);
    }

    template <typename A, std::size_t... I>
    Tuple read(A& seq, std::index_sequence<I...>)
    {
        std::tuple<std::optional<Ts>...> slots;
        // Comma fold evaluates left to right
        (std::get<I>(slots).emplace(next<Ts>(seq, I)), ...);
        return Tuple{std::move(*std::get<I>(slots))...};
    }
};

template <typename T, std::size_t N>
struct ArrayVisitor : Visitor<ArrayVisitor<T, N>, std::array<T, N>> {
    std::string expecting() const { return "an array of length " + std::to_string(N); }

    template <SeqAccessType A>
    std::array<T, N> visit_seq(A& seq)
    {
        std::array<T, N> out{};
        for (std::size_t i = 0; i < N; ++i) {
            auto elem = seq.template next_element<T>();
            if (!elem) throw Error::invalid_length(i, expecting());
            out[i] = std::move(*elem);
        }
        return out;
    }
};

struct ByteBufVisitor : Visitor<ByteBufVisitor, ByteBuf> {
    std::string expecting() const { return "byte array"; }

    ByteBuf visit_bytes(std::span<const uint8_t> v) { return ByteBuf{std::vector<uint8_t>(v.begin(), v.end())}; }
    ByteBuf visit_byte_buf(std::vector<uint8_t> v) { return ByteBuf{std::move(v)}; }

    ByteBuf visit_str(std::string_view v) { return ByteBuf{std::vector<uint8_t>(v.begin(), v.end())}; }

    template <SeqAccessType A>
    ByteBuf visit_seq(A& seq)
    {
        ByteBuf out;
        if (auto hint = seq.size_hint()) {
            out.bytes.reserve(std::min(*hint, max_prealloc));
        }
        while (auto byte = seq.template next_element<uint8_t>()) {
            out.bytes.push_back(*byte);
        }
        return out;
    }
};

struct IgnoredAnyVisitor : Visitor<IgnoredAnyVisitor, IgnoredAny> {
    std::string expecting() const { return "anything at all"; }

    IgnoredAny visit_bool(bool) { return {}; }
    IgnoredAny visit_i64(int64_t) { return {}; }
    IgnoredAny visit_u64(uint64_t) { return {}; }
#if VALUE_DE_HAS_INT128
    IgnoredAny visit_i128(int128_t) { return {}; }
    IgnoredAny visit_u128(uint128_t) { return {}; }
#endif
    IgnoredAny visit_f64(double) { return {}; }
    IgnoredAny visit_str(std::string_view) { return {}; }
    IgnoredAny visit_bytes(std::span<const uint8_t>) { return {}; }
    IgnoredAny visit_none() { return {}; }
    IgnoredAny visit_unit() { return {}; }

    template <typename D>
    IgnoredAny visit_some(D&& de)
    {
        return de.deserialize_ignored_any(IgnoredAnyVisitor{});
    }

    template <typename D>
    IgnoredAny visit_newtype_struct(D&& de)
    {
        return de.deserialize_ignored_any(IgnoredAnyVisitor{});
    }

    template <SeqAccessType A>
    IgnoredAny visit_seq(A& seq)
    {
        while (seq.template next_element<IgnoredAny>()) {
        }
        return {};
    }

    template <MapAccessType A>
    IgnoredAny visit_map(A& map)
    {
        while (map.template next_key<IgnoredAny>()) {
            map.template next_value<IgnoredAny>();
        }
        return {};
    }

    template <EnumAccessType A>
    IgnoredAny visit_enum(A& data)
    {
        auto resolved = data.template variant<IgnoredAny>();
        return resolved.second.template newtype_variant<IgnoredAny>();
    }
};

} // namespace detail

// ============================================================
// Primitive types
// ============================================================

template <>
struct Deserialize<bool> {
    template <Deserializer D>
    static bool deserialize(D&& de)
    {
        return de.deserialize_bool(detail::BoolVisitor{});
    }
};

template <typename T>
struct Deserialize<T, std::enable_if_t<detail::is_integer_v<T>>> {
    template <Deserializer D>
    static T deserialize(D&& de)
    {
        if constexpr (detail::is_signed_integer_v<T>) {
            if constexpr (sizeof(T) == 1) return de.deserialize_i8(detail::IntegerVisitor<T>{});
            else if constexpr (sizeof(T) == 2) return de.deserialize_i16(detail::IntegerVisitor<T>{});
            else if constexpr (sizeof(T) == 4) return de.deserialize_i32(detail::IntegerVisitor<T>{});
            else return de.deserialize_i64(detail::IntegerVisitor<T>{});
        } else {
            if constexpr (sizeof(T) == 1) return de.deserialize_u8(detail::IntegerVisitor<T>{});
            else if constexpr (sizeof(T) == 2) return de.deserialize_u16(detail::IntegerVisitor<T>{});
            else if constexpr (sizeof(T) == 4) return de.deserialize_u32(detail::IntegerVisitor<T>{});
            else return de.deserialize_u64(detail::IntegerVisitor<T>{});
        }
    }
};

#if VALUE_DE_HAS_INT128
template <>
struct Deserialize<int128_t> {
    template <Deserializer D>
    static int128_t deserialize(D&& de)
    {
        return de.deserialize_i128(detail::IntegerVisitor<int128_t>{});
    }
};

template <>
struct Deserialize<uint128_t> {
    template <Deserializer D>
    static uint128_t deserialize(D&& de)
    {
        return de.deserialize_u128(detail::IntegerVisitor<uint128_t>{});
    }
};
#endif

template <>
struct Deserialize<float> {
    template <Deserializer D>
    static float deserialize(D&& de)
    {
        return de.deserialize_f32(detail::FloatVisitor<float>{});
    }
};

template <>
struct Deserialize<double> {
    template <Deserializer D>
    static double deserialize(D&& de)
    {
        return de.deserialize_f64(detail::FloatVisitor<double>{});
    }
};

template <>
struct Deserialize<char> {
    template <Deserializer D>
    static char deserialize(D&& de)
    {
        return de.deserialize_char(detail::CharVisitor{});
    }
};

template <>
struct Deserialize<std::string> {
    template <Deserializer D>
    static std::string deserialize(D&& de)
    {
        return de.deserialize_string(detail::StringVisitor{});
    }
};

template <>
struct Deserialize<std::monostate> {
    template <Deserializer D>
    static std::monostate deserialize(D&& de)
    {
        return de.deserialize_unit(detail::UnitVisitor{});
    }
};

// ============================================================
// Containers
// ============================================================

template <typename T>
struct Deserialize<std::optional<T>> {
    template <Deserializer D>
    static std::optional<T> deserialize(D&& de)
    {
        return de.deserialize_option(detail::OptionVisitor<T>{});
    }
};

template <typename T>
struct Deserialize<std::vector<T>> {
    template <Deserializer D>
    static std::vector<T> deserialize(D&& de)
    {
        return de.deserialize_seq(detail::VectorVisitor<T>{});
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct Deserialize<std::map<K, V, Compare, Alloc>> {
    using map_type = std::map<K, V, Compare, Alloc>;

    template <Deserializer D>
    static map_type deserialize(D&& de)
    {
        return de.deserialize_map(detail::MapVisitor<map_type>{});
    }
};

template <typename K, typename V, typename Hash, typename KeyEqual, typename Alloc>
struct Deserialize<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {
    using map_type = std::unordered_map<K, V, Hash, KeyEqual, Alloc>;

    template <Deserializer D>
    static map_type deserialize(D&& de)
    {
        return de.deserialize_map(detail::MapVisitor<map_type>{});
    }
};

template <typename A, typename B>
struct Deserialize<std::pair<A, B>> {
    template <Deserializer D>
    static std::pair<A, B> deserialize(D&& de)
    {
        return de.deserialize_tuple(2, detail::TupleVisitor<std::pair<A, B>, A, B>{});
    }
};

template <typename... Ts>
struct Deserialize<std::tuple<Ts...>> {
    template <Deserializer D>
    static std::tuple<Ts...> deserialize(D&& de)
    {
        return de.deserialize_tuple(sizeof...(Ts), detail::TupleVisitor<std::tuple<Ts...>, Ts...>{});
    }
};

template <typename T, std::size_t N>
struct Deserialize<std::array<T, N>> {
    template <Deserializer D>
    static std::array<T, N> deserialize(D&& de)
    {
        return de.deserialize_tuple(N, detail::ArrayVisitor<T, N>{});
    }
};

template <>
struct Deserialize<ByteBuf> {
    template <Deserializer D>
    static ByteBuf deserialize(D&& de)
    {
        return de.deserialize_byte_buf(detail::ByteBufVisitor{});
    }
};

template <>
struct Deserialize<IgnoredAny> {
    template <Deserializer D>
    static IgnoredAny deserialize(D&& de)
    {
        return de.deserialize_ignored_any(detail::IgnoredAnyVisitor{});
    }
};

} // namespace value_de
