// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for the deserialization protocol.
///
/// These concepts document what each role in the protocol must provide and
/// give readable diagnostics when a user type gets it wrong.
///
/// @note Requires C++20 or later.

#pragma once

#include "visitor.h"

#include <concepts>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace value_de {

// ============================================================
// Visitor / Seed Concepts
// ============================================================

/// Concept for visitors: a result type and a description of what they accept
template<typename V>
concept VisitorType = requires(const std::remove_cvref_t<V>& v) {
    typename std::remove_cvref_t<V>::value_type;
    { v.expecting() } -> std::convertible_to<std::string>;
};

/// Concept for stateful deserialization requests (PhantomSeed, KeyClassifier, ...)
template<typename S>
concept DeserializeSeedType = requires {
    typename std::remove_cvref_t<S>::value_type;
};

// ============================================================
// Access Concepts
// ============================================================

/// Concept for sequence cursors handed to visit_seq
template<typename A>
concept SeqAccessType = std::derived_from<std::remove_cvref_t<A>, SeqAccess<std::remove_cvref_t<A>>> &&
                        requires(const std::remove_cvref_t<A>& a) {
    { a.size_hint() } -> std::same_as<std::optional<std::size_t>>;
};

/// Concept for map cursors handed to visit_map
template<typename A>
concept MapAccessType = std::derived_from<std::remove_cvref_t<A>, MapAccess<std::remove_cvref_t<A>>> &&
                        requires(const std::remove_cvref_t<A>& a) {
    { a.size_hint() } -> std::same_as<std::optional<std::size_t>>;
};

/// Concept for enum resolvers handed to visit_enum
template<typename A>
concept EnumAccessType = std::derived_from<std::remove_cvref_t<A>, EnumAccess<std::remove_cvref_t<A>>>;

/// Concept for the payload half of an enum resolver
template<typename A>
concept VariantAccessType = std::derived_from<std::remove_cvref_t<A>, VariantAccess<std::remove_cvref_t<A>>> &&
                            requires(std::remove_cvref_t<A>& a) {
    { a.unit_variant() } -> std::same_as<void>;
};

// ============================================================
// Deserializer Concept
// ============================================================

namespace detail {

/// Accepts nothing; stands in for any visitor when checking deserializer signatures
struct SignatureVisitor : Visitor<SignatureVisitor, std::monostate> {
    std::string expecting() const { return "nothing"; }
};

} // namespace detail

/// Concept for anything that can drive a visitor (tree consumers, map key
/// consumers, string deserializers, ...)
template<typename D>
concept Deserializer = requires(std::remove_cvref_t<D>& de,
                                detail::SignatureVisitor& v,
                                std::string_view name,
                                std::span<const std::string_view> names) {
    { de.deserialize_any(v) } -> std::same_as<std::monostate>;
    { de.deserialize_option(v) } -> std::same_as<std::monostate>;
    { de.deserialize_seq(v) } -> std::same_as<std::monostate>;
    { de.deserialize_map(v) } -> std::same_as<std::monostate>;
    { de.deserialize_newtype_struct(name, v) } -> std::same_as<std::monostate>;
    { de.deserialize_enum(name, names, v) } -> std::same_as<std::monostate>;
};

/// Concept for types with a Deserialize specialization usable with D
template<typename T, typename D>
concept DeserializableFrom = Deserializer<D> && requires(std::remove_cvref_t<D>& de) {
    { Deserialize<T>::deserialize(de) } -> std::same_as<T>;
};

} // namespace value_de
