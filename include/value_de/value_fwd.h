// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for value_de types.
///
/// Include this header when you only need to name the types (function
/// declarations, pointers, references) without pulling in the templates.

#pragma once

#include <cstdint>
#include <type_traits>

namespace value_de {

struct Value;
class ValueObject;
class Number;
class Error;
class Unexpected;
class RawValue;

/// How a tree consumer holds its node
enum class Ownership : uint8_t {
    Owned,    ///< holds the Value and may move its parts out
    Borrowed, ///< reads through a const Value& that outlives the consumer
};

template <Ownership M>
class BasicValueDeserializer;

/// Consumes (and destroys) the Value it was given
using ValueDeserializer = BasicValueDeserializer<Ownership::Owned>;

/// Reads a Value in place, leaving it intact
using ValueRefDeserializer = BasicValueDeserializer<Ownership::Borrowed>;

/// Customization point: specialize with
///   template <class D> static T deserialize(D&& de);
template <typename T, typename Enable = void>
struct Deserialize;

/// Result type of a visitor (or seed) passed by any reference category
template <typename V>
using visitor_value_t = typename std::remove_cvref_t<V>::value_type;

} // namespace value_de
