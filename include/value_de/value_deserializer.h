// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_deserializer.h
/// @brief Drive a visitor from a Value tree.
///
/// BasicValueDeserializer comes in two modes that make identical dispatch
/// decisions and raise identical errors:
///
/// | Mode                   | Holds          | Strings               | Containers         |
/// |------------------------|----------------|-----------------------|--------------------|
/// | ValueDeserializer      | Value          | visit_string (moved)  | elements moved out |
/// | ValueRefDeserializer   | const Value*   | visit_borrowed_str    | read in place      |
///
/// Compound nodes are handed to the visitor through cursors:
/// - SeqDeserializer:     array elements, exact size_hint
/// - MapDeserializer:     object entries, key first (MapKeyDeserializer) then value
/// - EnumDeserializer:    "name" or {"name": payload}
/// - VariantDeserializer: unit / newtype / tuple / struct payloads
///
/// Arrays and objects must be drained: entries left over after visit_seq /
/// visit_map returns fail the whole request with an invalid length error
/// carrying the original element count.
///
/// There is no depth limit; nesting is bounded by the input tree.
///
/// @code
///   Value doc = from_json(R"({"id": 7, "tags": ["a", "b"]})");
///
///   ValueRefDeserializer ref{doc};  // doc stays intact
///   auto tags = Deserialize<std::map<std::string, Value>>::deserialize(ref);
///
///   ValueDeserializer owned{std::move(doc)};  // doc is consumed
///   auto same = Deserialize<std::map<std::string, Value>>::deserialize(owned);
/// @endcode

#pragma once

#include "value.h"
#include "visitor.h"
#include "concepts.h"
#include "deserialize.h"
#include "str_deserializer.h"
#include "serialization.h"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace value_de {

template <Ownership M>
class SeqDeserializer;
template <Ownership M>
class MapDeserializer;
template <Ownership M>
class EnumDeserializer;
template <Ownership M>
class VariantDeserializer;

namespace detail {

template <Ownership M>
inline constexpr bool is_owned_v = M == Ownership::Owned;

// How each mode receives a node, an array and an object
template <Ownership M>
using node_arg_t = std::conditional_t<is_owned_v<M>, Value&&, const Value&>;
template <Ownership M>
using array_arg_t = std::conditional_t<is_owned_v<M>, ValueArray&&, const ValueArray&>;
template <Ownership M>
using object_arg_t = std::conditional_t<is_owned_v<M>, ValueObject&&, const ValueObject&>;

// Keys and variant names
template <Ownership M>
using text_t = std::conditional_t<is_owned_v<M>, std::string, std::string_view>;
template <Ownership M>
using variant_name_deserializer_t = std::conditional_t<is_owned_v<M>, StringDeserializer, StrDeserializer>;

// Enum payload
template <Ownership M>
using payload_t = std::conditional_t<is_owned_v<M>, std::optional<Value>, const Value*>;

} // namespace detail

// ============================================================
// RawCapsule - one-entry map {RAW_VALUE_TOKEN: "<json text>"}
// ============================================================

class RawCapsule : public MapAccess<RawCapsule>
{
public:
    explicit RawCapsule(std::string raw) : raw_(std::move(raw)) {}

    template <DeserializeSeedType S>
    std::optional<visitor_value_t<S>> next_key_seed(S&& seed)
    {
        if (key_taken_) return std::nullopt;
        key_taken_ = true;
        BorrowedStrDeserializer de{RAW_VALUE_TOKEN};
        return std::optional<visitor_value_t<S>>{std::in_place, seed.deserialize(de)};
    }

    template <DeserializeSeedType S>
    visitor_value_t<S> next_value_seed(S&& seed)
    {
        if (!raw_) throw Error::custom("value is missing");
        StringDeserializer de{std::move(*raw_)};
        raw_.reset();
        return seed.deserialize(de);
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const { return std::size_t{key_taken_ ? 0u : 1u}; }

private:
    std::optional<std::string> raw_;
    bool key_taken_ = false;
};

// ============================================================
// MapKeyDeserializer - object key as text, or as an integer on request
// ============================================================

/// Str is std::string (owned keys) or std::string_view (borrowed keys).
/// Integer requests parse the key; text that does not parse as the
/// requested width is handed over as a string instead.
template <typename Str>
class MapKeyDeserializer : public ForwardToAny<MapKeyDeserializer<Str>>
{
    static constexpr bool owned = std::is_same_v<Str, std::string>;

public:
    explicit MapKeyDeserializer(Str key) : key_(std::move(key)) {}

    template <VisitorType V>
    visitor_value_t<V> deserialize_any(V&& visitor)
    {
        return text().deserialize_any(visitor);
    }

    template <VisitorType V> visitor_value_t<V> deserialize_i8(V&& visitor) { return integer_key<int8_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_i16(V&& visitor) { return integer_key<int16_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_i32(V&& visitor) { return integer_key<int32_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_i64(V&& visitor) { return integer_key<int64_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u8(V&& visitor) { return integer_key<uint8_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u16(V&& visitor) { return integer_key<uint16_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u32(V&& visitor) { return integer_key<uint32_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u64(V&& visitor) { return integer_key<uint64_t>(visitor); }
#if VALUE_DE_HAS_INT128
    template <VisitorType V> visitor_value_t<V> deserialize_i128(V&& visitor) { return integer_key<int128_t>(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u128(V&& visitor) { return integer_key<uint128_t>(visitor); }
#endif

    template <VisitorType V>
    visitor_value_t<V> deserialize_option(V&& visitor)
    {
        return visitor.visit_some(*this);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_newtype_struct(std::string_view, V&& visitor)
    {
        return visitor.visit_newtype_struct(*this);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_enum(std::string_view name, std::span<const std::string_view> variants, V&& visitor)
    {
        return text().deserialize_enum(name, variants, visitor);
    }

private:
    auto text()
    {
        if constexpr (owned) {
            return StringDeserializer{std::move(key_)};
        } else {
            return BorrowedStrDeserializer{key_};
        }
    }

    template <typename I, VisitorType V>
    visitor_value_t<V> integer_key(V& visitor)
    {
        if (auto parsed = detail::parse_integer<I>(std::string_view{key_})) {
            return detail::visit_integer(visitor, *parsed);
        }
        return deserialize_any(visitor);
    }

    Str key_;
};

// ============================================================
// BasicValueDeserializer - the tree consumer
// ============================================================

template <Ownership M>
class BasicValueDeserializer
{
    static constexpr bool owned = detail::is_owned_v<M>;
    using storage_type = std::conditional_t<owned, Value, const Value*>;

public:
    /// Owned mode takes the Value (pass an rvalue); borrowed mode keeps a
    /// pointer, so the Value must outlive the deserializer
    explicit BasicValueDeserializer(detail::node_arg_t<M> node)
        : node_(store(static_cast<detail::node_arg_t<M>>(node)))
    {
    }

    /// A borrowed node must not be a temporary
    BasicValueDeserializer(Value&&) requires (!owned) = delete;

    [[nodiscard]] const Value& node() const noexcept
    {
        if constexpr (owned) {
            return node_;
        } else {
            return *node_;
        }
    }

    // ============================================================
    // Self-describing dispatch
    // ============================================================

    template <VisitorType V>
    visitor_value_t<V> deserialize_any(V&& visitor)
    {
        switch (node().kind()) {
            case ValueKind::Null:   return visitor.visit_unit();
            case ValueKind::Bool:   return visitor.visit_bool(std::get<bool>(node().data));
            case ValueKind::Number: return std::get<Number>(node().data).deserialize_any(visitor);
            case ValueKind::String: return visit_string_node(visitor);
            case ValueKind::Array:  return visit_array_node(visitor);
            case ValueKind::Object: return visit_object_node(visitor);
        }
        throw Error::custom("corrupt value kind");
    }

    // ============================================================
    // Numbers
    // ============================================================

    template <VisitorType V> visitor_value_t<V> deserialize_i8(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_i16(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_i32(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_i64(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u8(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u16(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u32(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u64(V&& visitor) { return deserialize_number(visitor); }
#if VALUE_DE_HAS_INT128
    template <VisitorType V> visitor_value_t<V> deserialize_i128(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_u128(V&& visitor) { return deserialize_number(visitor); }
#endif
    template <VisitorType V> visitor_value_t<V> deserialize_f32(V&& visitor) { return deserialize_number(visitor); }
    template <VisitorType V> visitor_value_t<V> deserialize_f64(V&& visitor) { return deserialize_number(visitor); }

    // ============================================================
    // Scalars and text
    // ============================================================

    template <VisitorType V>
    visitor_value_t<V> deserialize_bool(V&& visitor)
    {
        if (const bool* b = node().template get_if<bool>()) return visitor.visit_bool(*b);
        throw invalid_type(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_char(V&& visitor)
    {
        return deserialize_string(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_str(V&& visitor)
    {
        return deserialize_string(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_string(V&& visitor)
    {
        if (node().is_string()) return visit_string_node(visitor);
        throw invalid_type(visitor);
    }

    /// Strings are reinterpreted as bytes; arrays go through the sequence
    /// cursor unchanged, so the visitor sees Values rather than octets
    template <VisitorType V>
    visitor_value_t<V> deserialize_bytes(V&& visitor)
    {
        return deserialize_byte_buf(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_byte_buf(V&& visitor)
    {
        if (node().is_string()) return visit_string_node(visitor);
        if (node().is_array()) return visit_array_node(visitor);
        throw invalid_type(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_identifier(V&& visitor)
    {
        return deserialize_string(visitor);
    }

    // ============================================================
    // Unit, option and newtype
    // ============================================================

    /// Null is "none"; anything else is "some" of this same node
    template <VisitorType V>
    visitor_value_t<V> deserialize_option(V&& visitor)
    {
        if (node().is_null()) return visitor.visit_none();
        return visitor.visit_some(*this);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_unit(V&& visitor)
    {
        if (node().is_null()) return visitor.visit_unit();
        throw invalid_type(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_unit_struct(std::string_view, V&& visitor)
    {
        return deserialize_unit(visitor);
    }

    /// RAW_VALUE_TOKEN switches to raw passthrough: the node is written back
    /// to JSON text and offered as a one-entry map {RAW_VALUE_TOKEN: text}
    template <VisitorType V>
    visitor_value_t<V> deserialize_newtype_struct(std::string_view name, V&& visitor)
    {
        if (name == RAW_VALUE_TOKEN) return visit_raw(visitor);
        return visitor.visit_newtype_struct(*this);
    }

    // ============================================================
    // Sequences, maps and structs
    // ============================================================

    template <VisitorType V>
    visitor_value_t<V> deserialize_seq(V&& visitor)
    {
        if (node().is_array()) return visit_array_node(visitor);
        throw invalid_type(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_tuple(std::size_t, V&& visitor)
    {
        return deserialize_seq(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_tuple_struct(std::string_view, std::size_t, V&& visitor)
    {
        return deserialize_seq(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_map(V&& visitor)
    {
        if (node().is_object()) return visit_object_node(visitor);
        throw invalid_type(visitor);
    }

    /// Objects by field name, or arrays positionally
    template <VisitorType V>
    visitor_value_t<V> deserialize_struct(std::string_view, std::span<const std::string_view>, V&& visitor)
    {
        if (node().is_array()) return visit_array_node(visitor);
        if (node().is_object()) return visit_object_node(visitor);
        throw invalid_type(visitor);
    }

    // ============================================================
    // Enums
    // ============================================================

    /// "Variant" (no payload) or {"Variant": payload}
    template <VisitorType V>
    visitor_value_t<V> deserialize_enum(std::string_view, std::span<const std::string_view>, V&& visitor)
    {
        if (const ValueObject* obj = node().get_object()) {
            if (obj->size() != 1) {
                throw Error::invalid_value(Unexpected::map(), "map with a single key");
            }
            if constexpr (owned) {
                auto entries = std::move(*std::get<ValueObjectPtr>(node_.data)).release();
                auto& entry = entries.front();
                EnumDeserializer<M> access{std::move(entry.first), std::optional<Value>{std::move(entry.second)}};
                return visitor.visit_enum(access);
            } else {
                const auto& entry = *obj->begin();
                EnumDeserializer<M> access{std::string_view{entry.first}, &entry.second};
                return visitor.visit_enum(access);
            }
        }

        if (node().is_string()) {
            if constexpr (owned) {
                EnumDeserializer<M> access{std::move(std::get<std::string>(node_.data)), std::nullopt};
                return visitor.visit_enum(access);
            } else {
                EnumDeserializer<M> access{node().as_string_view(), nullptr};
                return visitor.visit_enum(access);
            }
        }

        throw Error::invalid_type(node().unexpected(), "string or map");
    }

    // ============================================================
    // Ignored
    // ============================================================

    template <VisitorType V>
    visitor_value_t<V> deserialize_ignored_any(V&& visitor)
    {
        if constexpr (owned) {
            node_ = Value{};
        }
        return visitor.visit_unit();
    }

private:
    static storage_type store(detail::node_arg_t<M> node)
    {
        if constexpr (owned) {
            return std::move(node);
        } else {
            return &node;
        }
    }

    template <VisitorType V>
    Error invalid_type(const V& visitor) const
    {
        return Error::invalid_type(node().unexpected(), visitor.expecting());
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_number(V& visitor)
    {
        if (const Number* n = node().template get_if<Number>()) return n->deserialize_any(visitor);
        throw invalid_type(visitor);
    }

    template <VisitorType V>
    visitor_value_t<V> visit_string_node(V& visitor)
    {
        if constexpr (owned) {
            return visitor.visit_string(std::move(std::get<std::string>(node_.data)));
        } else {
            return visitor.visit_borrowed_str(node().as_string_view());
        }
    }

    template <VisitorType V>
    visitor_value_t<V> visit_array_node(V& visitor)
    {
        if constexpr (owned) {
            return SeqDeserializer<M>::visit(std::move(*node_.get_array()), visitor);
        } else {
            return SeqDeserializer<M>::visit(*node().get_array(), visitor);
        }
    }

    template <VisitorType V>
    visitor_value_t<V> visit_object_node(V& visitor)
    {
        if constexpr (owned) {
            return MapDeserializer<M>::visit(std::move(*node_.get_object()), visitor);
        } else {
            return MapDeserializer<M>::visit(*node().get_object(), visitor);
        }
    }

    template <VisitorType V>
    visitor_value_t<V> visit_raw(V& visitor)
    {
        RawCapsule capsule{to_json(node(), true)};
        try {
            return visitor.visit_map(capsule);
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::Custom) throw;
            throw Error::custom(e.what());
        }
    }

    storage_type node_;
};

// ============================================================
// SeqDeserializer - array cursor
// ============================================================

template <Ownership M>
class SeqDeserializer : public SeqAccess<SeqDeserializer<M>>
{
    static constexpr bool owned = detail::is_owned_v<M>;
    using storage_type = std::conditional_t<owned, ValueArray, const ValueArray*>;

public:
    explicit SeqDeserializer(detail::array_arg_t<M> items)
        : items_(store(static_cast<detail::array_arg_t<M>>(items)))
    {
    }

    template <DeserializeSeedType S>
    std::optional<visitor_value_t<S>> next_element_seed(S&& seed)
    {
        if (pos_ >= elements().size()) return std::nullopt;
        if constexpr (owned) {
            BasicValueDeserializer<M> de{std::move(items_[pos_++])};
            return std::optional<visitor_value_t<S>>{std::in_place, seed.deserialize(de)};
        } else {
            BasicValueDeserializer<M> de{(*items_)[pos_++]};
            return std::optional<visitor_value_t<S>>{std::in_place, seed.deserialize(de)};
        }
    }

    /// Exact: the array is fully materialized
    [[nodiscard]] std::optional<std::size_t> size_hint() const { return remaining(); }

    [[nodiscard]] std::size_t remaining() const noexcept { return elements().size() - pos_; }

    /// Run visit_seq over the array and require every element be consumed
    template <VisitorType V>
    static visitor_value_t<V> visit(detail::array_arg_t<M> items, V& visitor)
    {
        const std::size_t len = items.size();
        SeqDeserializer seq{static_cast<detail::array_arg_t<M>>(items)};
        auto result = visitor.visit_seq(seq);
        if (seq.remaining() != 0) {
            throw Error::invalid_length(len, "fewer elements in array");
        }
        return result;
    }

private:
    static storage_type store(detail::array_arg_t<M> items)
    {
        if constexpr (owned) {
            return std::move(items);
        } else {
            return &items;
        }
    }

    const ValueArray& elements() const noexcept
    {
        if constexpr (owned) {
            return items_;
        } else {
            return *items_;
        }
    }

    storage_type items_;
    std::size_t pos_ = 0;
};

// ============================================================
// MapDeserializer - object cursor
// ============================================================

template <Ownership M>
class MapDeserializer : public MapAccess<MapDeserializer<M>>
{
    static constexpr bool owned = detail::is_owned_v<M>;
    using storage_type = std::conditional_t<owned, ValueObject::container_type, const ValueObject*>;

public:
    explicit MapDeserializer(detail::object_arg_t<M> object)
        : entries_(store(static_cast<detail::object_arg_t<M>>(object)))
    {
    }

    /// Stashes the entry's value for the following next_value_seed()
    template <DeserializeSeedType S>
    std::optional<visitor_value_t<S>> next_key_seed(S&& seed)
    {
        if (pos_ >= count()) return std::nullopt;
        if constexpr (owned) {
            auto& entry = entries_[pos_++];
            value_.emplace(std::move(entry.second));
            MapKeyDeserializer<std::string> de{std::move(entry.first)};
            return std::optional<visitor_value_t<S>>{std::in_place, seed.deserialize(de)};
        } else {
            const auto& entry = entries_->begin()[static_cast<std::ptrdiff_t>(pos_++)];
            value_ = &entry.second;
            MapKeyDeserializer<std::string_view> de{entry.first};
            return std::optional<visitor_value_t<S>>{std::in_place, seed.deserialize(de)};
        }
    }

    template <DeserializeSeedType S>
    visitor_value_t<S> next_value_seed(S&& seed)
    {
        if (!value_) throw Error::custom("value is missing");
        if constexpr (owned) {
            BasicValueDeserializer<M> de{std::move(*value_)};
            value_.reset();
            return seed.deserialize(de);
        } else {
            BasicValueDeserializer<M> de{*std::exchange(value_, nullptr)};
            return seed.deserialize(de);
        }
    }

    [[nodiscard]] std::optional<std::size_t> size_hint() const { return remaining(); }

    [[nodiscard]] std::size_t remaining() const noexcept { return count() - pos_; }

    /// Run visit_map over the object and require every entry be consumed
    template <VisitorType V>
    static visitor_value_t<V> visit(detail::object_arg_t<M> object, V& visitor)
    {
        const std::size_t len = object.size();
        MapDeserializer map{static_cast<detail::object_arg_t<M>>(object)};
        auto result = visitor.visit_map(map);
        if (map.remaining() != 0) {
            throw Error::invalid_length(len, "fewer elements in map");
        }
        return result;
    }

private:
    static storage_type store(detail::object_arg_t<M> object)
    {
        if constexpr (owned) {
            return std::move(object).release();
        } else {
            return &object;
        }
    }

    std::size_t count() const noexcept
    {
        if constexpr (owned) {
            return entries_.size();
        } else {
            return entries_->size();
        }
    }

    storage_type entries_;
    std::size_t pos_ = 0;
    detail::payload_t<M> value_{};
};

// ============================================================
// EnumDeserializer / VariantDeserializer
// ============================================================

template <Ownership M>
class EnumDeserializer : public EnumAccess<EnumDeserializer<M>>
{
public:
    EnumDeserializer(detail::text_t<M> variant, detail::payload_t<M> payload)
        : variant_(std::move(variant)), payload_(std::move(payload))
    {
    }

    /// The name goes through a text deserializer, so the seed may resolve
    /// it to a string, an index or its own identifier type
    template <DeserializeSeedType S>
    std::pair<visitor_value_t<S>, VariantDeserializer<M>> variant_seed(S&& seed)
    {
        detail::variant_name_deserializer_t<M> name{std::move(variant_)};
        auto resolved = seed.deserialize(name);
        return {std::move(resolved), VariantDeserializer<M>{std::move(payload_)}};
    }

private:
    detail::text_t<M> variant_;
    detail::payload_t<M> payload_;
};

template <Ownership M>
class VariantDeserializer : public VariantAccess<VariantDeserializer<M>>
{
    static constexpr bool owned = detail::is_owned_v<M>;

public:
    explicit VariantDeserializer(detail::payload_t<M> payload) : payload_(std::move(payload)) {}

    /// No payload, or a payload that is itself unit (null)
    void unit_variant()
    {
        if (!payload_) return;
        BasicValueDeserializer<M> de{take()};
        Deserialize<std::monostate>::deserialize(de);
    }

    template <DeserializeSeedType S>
    visitor_value_t<S> newtype_variant_seed(S&& seed)
    {
        if (!payload_) throw Error::invalid_type(Unexpected::unit_variant(), "newtype variant");
        BasicValueDeserializer<M> de{take()};
        return seed.deserialize(de);
    }

    /// An empty array is reported as visit_unit(), not as an empty sequence
    template <VisitorType V>
    visitor_value_t<V> tuple_variant(std::size_t, V&& visitor)
    {
        if (!payload_) throw Error::invalid_type(Unexpected::unit_variant(), "tuple variant");
        const Value& node = *payload_;
        if (const ValueArray* items = node.get_array()) {
            if (items->empty()) return visitor.visit_unit();
            if constexpr (owned) {
                return SeqDeserializer<M>::visit(std::move(*payload_->get_array()), visitor);
            } else {
                return SeqDeserializer<M>::visit(*items, visitor);
            }
        }
        throw Error::invalid_type(node.unexpected(), "tuple variant");
    }

    template <VisitorType V>
    visitor_value_t<V> struct_variant(std::span<const std::string_view>, V&& visitor)
    {
        if (!payload_) throw Error::invalid_type(Unexpected::unit_variant(), "struct variant");
        const Value& node = *payload_;
        if (const ValueObject* obj = node.get_object()) {
            if constexpr (owned) {
                return MapDeserializer<M>::visit(std::move(*payload_->get_object()), visitor);
            } else {
                return MapDeserializer<M>::visit(*obj, visitor);
            }
        }
        throw Error::invalid_type(node.unexpected(), "struct variant");
    }

private:
    decltype(auto) take()
    {
        if constexpr (owned) {
            Value v = std::move(*payload_);
            payload_.reset();
            return v;
        } else {
            return *payload_;
        }
    }

    detail::payload_t<M> payload_;
};

static_assert(Deserializer<ValueDeserializer> && Deserializer<ValueRefDeserializer>);
static_assert(Deserializer<MapKeyDeserializer<std::string>> && Deserializer<MapKeyDeserializer<std::string_view>>);
static_assert(SeqAccessType<SeqDeserializer<Ownership::Owned>> && SeqAccessType<SeqDeserializer<Ownership::Borrowed>>);
static_assert(MapAccessType<MapDeserializer<Ownership::Owned>> && MapAccessType<MapDeserializer<Ownership::Borrowed>>);
static_assert(MapAccessType<RawCapsule>);
static_assert(EnumAccessType<EnumDeserializer<Ownership::Owned>> && EnumAccessType<EnumDeserializer<Ownership::Borrowed>>);
static_assert(VariantAccessType<VariantDeserializer<Ownership::Owned>> &&
              VariantAccessType<VariantDeserializer<Ownership::Borrowed>>);

} // namespace value_de
