// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file raw_value.h
/// @brief Capture a sub-tree as unparsed JSON text.
///
/// A RawValue field keeps its part of the input as compact JSON instead of
/// building a typed value. Against a Value tree this works through the
/// newtype request named RAW_VALUE_TOKEN: the tree consumer writes the node
/// out with to_json() and offers it as the one-entry map
/// {RAW_VALUE_TOKEN: "<json text>"}.
///
/// @code
///   struct Envelope { std::string kind; RawValue body; };
///
///   RawValue body = from_value<RawValue>(doc.at("body"));
///   Value later = body.to_value();
/// @endcode

#pragma once

#include "api.h"
#include "deserialize.h"
#include "value_fwd.h"
#include "visitor.h"

#include <ostream>
#include <string>
#include <string_view>

namespace value_de {

class VALUE_DE_API RawValue
{
public:
    /// Validate json and keep it verbatim
    /// @throws Error (custom) if json is not a single well-formed JSON value
    [[nodiscard]] static RawValue from_string(std::string json);

    /// Compact JSON text of a Value
    [[nodiscard]] static RawValue from_value(const Value& val);

    [[nodiscard]] const std::string& get() const noexcept { return json_; }

    /// Parse the captured text back into a Value
    [[nodiscard]] Value to_value() const;

    bool operator==(const RawValue&) const = default;

private:
    explicit RawValue(std::string json) : json_(std::move(json)) {}

    std::string json_;
};

VALUE_DE_API std::ostream& operator<<(std::ostream& os, const RawValue& raw);

namespace detail {

/// The only key a raw capsule may carry
struct RawKey {};

struct RawKeyVisitor : Visitor<RawKeyVisitor, RawKey> {
    std::string expecting() const { return "raw value"; }

    RawKey visit_str(std::string_view s)
    {
        if (s != RAW_VALUE_TOKEN) throw Error::custom("unexpected raw value");
        return {};
    }
};

struct RawValueVisitor : Visitor<RawValueVisitor, RawValue> {
    std::string expecting() const { return "any valid JSON value"; }

    template <MapAccessType A>
    RawValue visit_map(A& map)
    {
        auto key = map.template next_key<RawKey>();
        if (!key) throw Error::invalid_type(Unexpected::map(), expecting());
        return RawValue::from_string(map.template next_value<std::string>());
    }
};

} // namespace detail

template <>
struct Deserialize<detail::RawKey> {
    template <Deserializer D>
    static detail::RawKey deserialize(D&& de)
    {
        return de.deserialize_identifier(detail::RawKeyVisitor{});
    }
};

template <>
struct Deserialize<RawValue> {
    template <Deserializer D>
    static RawValue deserialize(D&& de)
    {
        return de.deserialize_newtype_struct(RAW_VALUE_TOKEN, detail::RawValueVisitor{});
    }
};

} // namespace value_de
