// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamically typed JSON-like tree consumed by the deserializers.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool
/// - Number (see number.h)
/// - String
/// - Array (std::vector<Value>, boxed)
/// - Object (ValueObject, insertion ordered, unique keys, boxed)
///
/// ## Ownership
/// Value is move-only. Containers hold their children directly, and the
/// containers themselves are boxed in unique_ptr to break the recursive type
/// dependency and keep sizeof(Value) small. Use clone() for a deep copy.
///
/// This makes the two consumption modes explicit:
/// - ValueDeserializer takes a Value by value and may tear it apart
/// - ValueRefDeserializer reads through a const Value& and leaves it intact
///
/// ## Usage Example
/// ```cpp
/// Value root = Value::object();
/// root.set("name", "sensor");
/// root.set("samples", Value::array_of(1, 2, 3));
///
/// if (const Value* name = root.get("name")) {
///     std::cout << name->as_string() << std::endl;
/// }
/// ```

#pragma once

#include "api.h"
#include "value_de_config.h"
#include "number.h"

#include <concepts>
#include <cstdint>
#include <iosfwd>
#include <iostream>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <tsl/robin_map.h>
#include <utility>
#include <variant>
#include <vector>

namespace value_de {

namespace detail {

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if VALUE_DE_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if VALUE_DE_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

inline void log_parse_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if VALUE_DE_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

// ============================================================
// Transparent Hash/Equal for robin_map heterogeneous lookup
// ============================================================

struct ValueStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] std::size_t operator()(const char* s) const noexcept { return std::hash<std::string_view>{}(s); }
};

struct ValueStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

struct Value;
class ValueObject;

using ValueArray = std::vector<Value>;

using ValueArrayPtr = std::unique_ptr<ValueArray>;
using ValueObjectPtr = std::unique_ptr<ValueObject>;

/// Node tags, in DataVariant order
enum class ValueKind : uint8_t { Null, Bool, Number, String, Array, Object };

// ============================================================
// Value
// ============================================================

struct VALUE_DE_API Value {
    using DataVariant = std::variant<std::monostate, // null
                                     bool,
                                     Number,
                                     std::string,
                                     ValueArrayPtr,  // boxed std::vector<Value>
                                     ValueObjectPtr  // boxed ValueObject
                                     >;

    DataVariant data;

    // ============================================================
    // Constructors
    // ============================================================
    // Not explicit, so trees read naturally:
    //   obj.set("name", "sensor");
    //   obj.set("count", 3);

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) noexcept : data(Number{v}) {}

    /// Non-finite doubles become Null, as JSON cannot represent them
    Value(double v);
    Value(float v) : Value(static_cast<double>(v)) {}
    Value(Number v) noexcept : data(v) {}

    Value(std::string v) : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string_view v) : data(std::string(v)) {}

    /// Takes ownership of the container and boxes it
    Value(ValueArray v);
    Value(ValueObject v);

    Value(Value&& other) noexcept;
    Value& operator=(Value&& other) noexcept;
    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;
    ~Value();

    // ============================================================
    // Factory Methods
    // ============================================================

    [[nodiscard]] static Value array();
    [[nodiscard]] static Value object();

    /// Build an array from the given elements (each converted to Value)
    template <typename... Args>
    [[nodiscard]] static Value array_of(Args&&... elements) {
        ValueArray items;
        items.reserve(sizeof...(Args));
        (items.emplace_back(std::forward<Args>(elements)), ...);
        return Value{std::move(items)};
    }

    // ============================================================
    // Type Checking
    // ============================================================

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

    /// "null", "boolean", "number", "string", "array" or "object"
    [[nodiscard]] std::string_view kind_name() const noexcept;

    /// Error descriptor for this node: Null is "unit value", arrays are
    /// "sequence", objects are "map"
    [[nodiscard]] Unexpected unexpected() const;

    template <typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == ValueKind::Number; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
    [[nodiscard]] bool is_array() const noexcept { return kind() == ValueKind::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == ValueKind::Object; }

    // ============================================================
    // Value Access
    // ============================================================

    template <typename T>
    [[nodiscard]] T* get_if() {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] ValueArray* get_array() noexcept;
    [[nodiscard]] const ValueArray* get_array() const noexcept;
    [[nodiscard]] ValueObject* get_object() noexcept;
    [[nodiscard]] const ValueObject* get_object() const noexcept;

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_i64(int64_t default_val = 0) const {
        if (auto* p = get_if<Number>()) return p->as_i64().value_or(default_val);
        return default_val;
    }

    [[nodiscard]] uint64_t as_u64(uint64_t default_val = 0) const {
        if (auto* p = get_if<Number>()) return p->as_u64().value_or(default_val);
        return default_val;
    }

    [[nodiscard]] double as_f64(double default_val = 0.0) const {
        if (auto* p = get_if<Number>()) return p->as_f64();
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const& {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    /// Moves the string out when the Value is about to be dropped
    [[nodiscard]] std::string as_string(std::string default_val = "") && {
        if (auto* p = get_if<std::string>()) return std::move(*p);
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    // ============================================================
    // Object Operations
    // ============================================================

    /// Child by key, or nullptr if missing or not an object
    [[nodiscard]] Value* get(std::string_view key);
    [[nodiscard]] const Value* get(std::string_view key) const;

    /// Child by key; logs and returns a shared null on miss
    [[nodiscard]] const Value& at(std::string_view key) const;

    /// Set child by key (turns Null into an empty object first)
    Value& set(std::string_view key, Value value);

    [[nodiscard]] bool contains(std::string_view key) const;

    // ============================================================
    // Array Operations
    // ============================================================

    [[nodiscard]] Value* get(std::size_t index);
    [[nodiscard]] const Value* get(std::size_t index) const;

    [[nodiscard]] const Value& at(std::size_t index) const;

    /// Append to an array (turns Null into an empty array first)
    Value& push_back(Value value);

    /// Element count for arrays and objects, 0 otherwise
    [[nodiscard]] std::size_t size() const;

    // ============================================================
    // Utility
    // ============================================================

    [[nodiscard]] Value clone() const;

    /// Deep structural equality; objects compare as mappings
    [[nodiscard]] bool operator==(const Value& other) const;

    /// Compact JSON text (see serialization.h)
    [[nodiscard]] std::string to_string() const;
};

// ============================================================
// ValueObject - insertion-ordered map with unique keys
// ============================================================

class VALUE_DE_API ValueObject
{
public:
    using entry_type = std::pair<std::string, Value>;
    using container_type = std::vector<entry_type>;
    using const_iterator = container_type::const_iterator;
    using index_type = tsl::robin_map<std::string, std::size_t, ValueStringHash, ValueStringEqual>;

    ValueObject() = default;
    ValueObject(ValueObject&&) noexcept = default;
    ValueObject& operator=(ValueObject&&) noexcept = default;
    ValueObject(const ValueObject&) = delete;
    ValueObject& operator=(const ValueObject&) = delete;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    [[nodiscard]] Value* find(std::string_view key);
    [[nodiscard]] const Value* find(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const;

    /// Insert or replace. A replaced key keeps its original position.
    /// @return the stored value and whether the key was new
    std::pair<Value*, bool> insert(std::string key, Value value);

    /// Remove a key, keeping the relative order of the remaining entries
    bool erase(std::string_view key);

    /// Move every entry out in insertion order; the object is left empty
    [[nodiscard]] container_type release() &&;

    [[nodiscard]] ValueObject clone() const;

    /// Same keys mapped to equal values, regardless of order
    [[nodiscard]] bool operator==(const ValueObject& other) const;

private:
    container_type entries_;
    index_type index_;
};

// ============================================================
// Inline definitions that need ValueObject to be complete
// ============================================================

inline Value::Value(ValueArray v) : data(std::make_unique<ValueArray>(std::move(v))) {}

inline Value::Value(ValueObject v) : data(std::make_unique<ValueObject>(std::move(v))) {}

inline Value Value::array() { return Value{ValueArray{}}; }

inline Value Value::object() { return Value{ValueObject{}}; }

inline ValueArray* Value::get_array() noexcept
{
    if (auto* p = get_if<ValueArrayPtr>()) return p->get();
    return nullptr;
}

inline const ValueArray* Value::get_array() const noexcept
{
    if (auto* p = get_if<ValueArrayPtr>()) return p->get();
    return nullptr;
}

inline ValueObject* Value::get_object() noexcept
{
    if (auto* p = get_if<ValueObjectPtr>()) return p->get();
    return nullptr;
}

inline const ValueObject* Value::get_object() const noexcept
{
    if (auto* p = get_if<ValueObjectPtr>()) return p->get();
    return nullptr;
}

/// Writes compact JSON (useful for test diagnostics)
VALUE_DE_API std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace value_de
