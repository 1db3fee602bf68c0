// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file from_value.h
/// @brief Entry points: build a T from a Value tree, and Value as a target.
///
/// @code
///   Value doc = from_json(R"({"1": "one", "2": "two"})");
///
///   // Borrowing: doc is left intact
///   auto names = from_value<std::map<int, std::string>>(doc);
///
///   // Owning: doc is consumed, strings are moved rather than copied
///   auto same = from_value<std::map<int, std::string>>(std::move(doc));
/// @endcode
///
/// Deserialize<Value> accepts everything a deserializer can produce, so
/// from_value<Value>(v) rebuilds a tree equal to v.

#pragma once

#include "concepts.h"
#include "deserialize.h"
#include "raw_value.h"
#include "serialization.h"
#include "value.h"
#include "value_deserializer.h"
#include "visitor.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace value_de {

namespace detail {

// ============================================================
// Key classifier - first key of a map
// ============================================================
// A map whose first key is one of the reserved tokens is not an object:
// it carries a number in text form or a raw JSON capsule.

enum class KeyClass : uint8_t {
    Map,
    Number,
    RawValue,
};

struct ClassifiedKey {
    KeyClass kind = KeyClass::Map;
    std::string key; ///< set for KeyClass::Map only
};

struct KeyClassVisitor : Visitor<KeyClassVisitor, ClassifiedKey> {
    std::string expecting() const { return "a string key"; }

    ClassifiedKey visit_str(std::string_view s) { return classify(std::string{s}); }
    ClassifiedKey visit_string(std::string s) { return classify(std::move(s)); }

private:
    static ClassifiedKey classify(std::string key)
    {
        if (key == NUMBER_TOKEN) return {KeyClass::Number, {}};
        if (key == RAW_VALUE_TOKEN) return {KeyClass::RawValue, {}};
        return {KeyClass::Map, std::move(key)};
    }
};

struct KeyClassifier {
    using value_type = ClassifiedKey;

    template <typename D>
    ClassifiedKey deserialize(D&& de) const
    {
        return de.deserialize_str(KeyClassVisitor{});
    }
};

// ============================================================
// ValueVisitor
// ============================================================

struct ValueVisitor : Visitor<ValueVisitor, Value> {
    std::string expecting() const { return "any valid JSON value"; }

    Value visit_bool(bool v) { return Value{v}; }
    Value visit_i64(int64_t v) { return Value{v}; }
    Value visit_u64(uint64_t v) { return Value{v}; }

#if VALUE_DE_HAS_INT128
    Value visit_i128(int128_t v)
    {
        if (fits<int64_t>(v)) return Value{static_cast<int64_t>(v)};
        if (fits<uint64_t>(v)) return Value{static_cast<uint64_t>(v)};
        throw Error::custom("number out of range");
    }

    Value visit_u128(uint128_t v)
    {
        if (fits<uint64_t>(v)) return Value{static_cast<uint64_t>(v)};
        throw Error::custom("number out of range");
    }
#endif

    /// NaN and infinities become null
    Value visit_f64(double v) { return Value{v}; }

    Value visit_str(std::string_view v) { return Value{std::string{v}}; }
    Value visit_string(std::string v) { return Value{std::move(v)}; }

    Value visit_none() { return Value{}; }
    Value visit_unit() { return Value{}; }

    template <typename D>
    Value visit_some(D&& de)
    {
        return de.deserialize_any(ValueVisitor{});
    }

    template <SeqAccessType A>
    Value visit_seq(A& seq)
    {
        ValueArray out;
        if (auto hint = seq.size_hint()) {
            out.reserve(std::min(*hint, max_prealloc));
        }
        while (auto elem = seq.template next_element<Value>()) {
            out.push_back(std::move(*elem));
        }
        return Value{std::move(out)};
    }

    template <MapAccessType A>
    Value visit_map(A& map)
    {
        auto first = map.next_key_seed(KeyClassifier{});
        if (!first) return Value::object();

        switch (first->kind) {
            case KeyClass::Number: {
                auto text = map.template next_value<std::string>();
                auto number = Number::from_string(text);
                if (!number) throw Error::custom("invalid number");
                return Value{*number};
            }
            case KeyClass::RawValue: {
                auto text = map.template next_value<std::string>();
                std::string error;
                Value parsed = from_json(text, &error);
                if (!error.empty()) throw Error::custom(error);
                return parsed;
            }
            case KeyClass::Map:
                break;
        }

        ValueObject obj;
        obj.insert(std::move(first->key), map.template next_value<Value>());
        while (auto entry = map.template next_entry<std::string, Value>()) {
            obj.insert(std::move(entry->first), std::move(entry->second));
        }
        return Value{std::move(obj)};
    }
};

} // namespace detail

template <>
struct Deserialize<Value> {
    template <Deserializer D>
    static Value deserialize(D&& de)
    {
        return de.deserialize_any(detail::ValueVisitor{});
    }
};

// ============================================================
// Entry points
// ============================================================

/// Consume value and build a T from it
template <typename T>
    requires DeserializableFrom<T, ValueDeserializer>
[[nodiscard]] T from_value(Value&& value)
{
    ValueDeserializer de{std::move(value)};
    return Deserialize<T>::deserialize(de);
}

/// Build a T from value, leaving it untouched
template <typename T>
    requires DeserializableFrom<T, ValueRefDeserializer>
[[nodiscard]] T from_value(const Value& value)
{
    ValueRefDeserializer de{value};
    return Deserialize<T>::deserialize(de);
}

} // namespace value_de
