// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file str_deserializer.h
/// @brief Deserializers over a single piece of text.
///
/// Used for variant names and object keys:
/// - StringDeserializer:      owns the text, calls visit_string
/// - StrDeserializer:         transient text, calls visit_str
/// - BorrowedStrDeserializer: text owned by the input tree, calls visit_borrowed_str
///
/// Every typed request is answered by deserialize_any, except
/// deserialize_enum, which presents the text as a unit variant name.

#pragma once

#include "concepts.h"
#include "visitor.h"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace value_de {

// ============================================================
// ForwardToAny - CRTP base answering every request with deserialize_any
// ============================================================

template <typename Derived>
class ForwardToAny
{
public:
    template <VisitorType V> visitor_value_t<V> deserialize_bool(V&& v) { return any(v); }

    template <VisitorType V> visitor_value_t<V> deserialize_i8(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_i16(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_i32(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_i64(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_u8(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_u16(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_u32(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_u64(V&& v) { return any(v); }
#if VALUE_DE_HAS_INT128
    template <VisitorType V> visitor_value_t<V> deserialize_i128(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_u128(V&& v) { return any(v); }
#endif
    template <VisitorType V> visitor_value_t<V> deserialize_f32(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_f64(V&& v) { return any(v); }

    template <VisitorType V> visitor_value_t<V> deserialize_char(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_str(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_string(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_bytes(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_byte_buf(V&& v) { return any(v); }

    template <VisitorType V> visitor_value_t<V> deserialize_option(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_unit(V&& v) { return any(v); }

    template <VisitorType V>
    visitor_value_t<V> deserialize_unit_struct(std::string_view, V&& v)
    {
        return any(v);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_newtype_struct(std::string_view, V&& v)
    {
        return any(v);
    }

    template <VisitorType V> visitor_value_t<V> deserialize_seq(V&& v) { return any(v); }

    template <VisitorType V>
    visitor_value_t<V> deserialize_tuple(std::size_t, V&& v)
    {
        return any(v);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_tuple_struct(std::string_view, std::size_t, V&& v)
    {
        return any(v);
    }

    template <VisitorType V> visitor_value_t<V> deserialize_map(V&& v) { return any(v); }

    template <VisitorType V>
    visitor_value_t<V> deserialize_struct(std::string_view, std::span<const std::string_view>, V&& v)
    {
        return any(v);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_enum(std::string_view, std::span<const std::string_view>, V&& v)
    {
        return any(v);
    }

    template <VisitorType V> visitor_value_t<V> deserialize_identifier(V&& v) { return any(v); }
    template <VisitorType V> visitor_value_t<V> deserialize_ignored_any(V&& v) { return any(v); }

private:
    template <VisitorType V>
    visitor_value_t<V> any(V& v)
    {
        return static_cast<Derived&>(*this).deserialize_any(v);
    }
};

// ============================================================
// UnitOnly - payload access for a variant named by bare text
// ============================================================

class UnitOnly : public VariantAccess<UnitOnly>
{
public:
    void unit_variant() {}

    template <DeserializeSeedType S>
    visitor_value_t<S> newtype_variant_seed(S&&)
    {
        throw Error::invalid_type(Unexpected::unit_variant(), "newtype variant");
    }

    template <VisitorType V>
    visitor_value_t<V> tuple_variant(std::size_t, V&&)
    {
        throw Error::invalid_type(Unexpected::unit_variant(), "tuple variant");
    }

    template <VisitorType V>
    visitor_value_t<V> struct_variant(std::span<const std::string_view>, V&&)
    {
        throw Error::invalid_type(Unexpected::unit_variant(), "struct variant");
    }
};

/// Enum access for text deserializers: the text itself names the variant
template <typename StrDe>
class StrEnumAccess : public EnumAccess<StrEnumAccess<StrDe>>
{
public:
    explicit StrEnumAccess(StrDe de) : de_(std::move(de)) {}

    template <DeserializeSeedType S>
    std::pair<visitor_value_t<S>, UnitOnly> variant_seed(S&& seed)
    {
        return {seed.deserialize(de_), UnitOnly{}};
    }

private:
    StrDe de_;
};

// ============================================================
// Text deserializers
// ============================================================

class StringDeserializer : public ForwardToAny<StringDeserializer>
{
public:
    explicit StringDeserializer(std::string value) : value_(std::move(value)) {}

    template <VisitorType V>
    visitor_value_t<V> deserialize_any(V&& visitor)
    {
        return visitor.visit_string(std::move(value_));
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_enum(std::string_view, std::span<const std::string_view>, V&& visitor)
    {
        StrEnumAccess<StringDeserializer> access{StringDeserializer{std::move(value_)}};
        return visitor.visit_enum(access);
    }

private:
    std::string value_;
};

class StrDeserializer : public ForwardToAny<StrDeserializer>
{
public:
    explicit StrDeserializer(std::string_view value) : value_(value) {}

    template <VisitorType V>
    visitor_value_t<V> deserialize_any(V&& visitor)
    {
        return visitor.visit_str(value_);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_enum(std::string_view, std::span<const std::string_view>, V&& visitor)
    {
        StrEnumAccess<StrDeserializer> access{*this};
        return visitor.visit_enum(access);
    }

private:
    std::string_view value_;
};

class BorrowedStrDeserializer : public ForwardToAny<BorrowedStrDeserializer>
{
public:
    explicit BorrowedStrDeserializer(std::string_view value) : value_(value) {}

    template <VisitorType V>
    visitor_value_t<V> deserialize_any(V&& visitor)
    {
        return visitor.visit_borrowed_str(value_);
    }

    template <VisitorType V>
    visitor_value_t<V> deserialize_enum(std::string_view, std::span<const std::string_view>, V&& visitor)
    {
        StrEnumAccess<BorrowedStrDeserializer> access{*this};
        return visitor.visit_enum(access);
    }

private:
    std::string_view value_;
};

} // namespace value_de
