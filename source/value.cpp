// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <value_de/value.h>
#include <value_de/serialization.h>

#include <ostream>

namespace value_de {

// ============================================================
// ValueObject
// ============================================================

Value* ValueObject::find(std::string_view key)
{
    // Heterogeneous lookup via transparent equal - no allocation
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

const Value* ValueObject::find(std::string_view key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

bool ValueObject::contains(std::string_view key) const
{
    return index_.find(key) != index_.end();
}

std::pair<Value*, bool> ValueObject::insert(std::string key, Value value)
{
    auto it = index_.find(key);
    if (it != index_.end()) {
        // Last write wins, position unchanged
        Value& slot = entries_[it->second].second;
        slot = std::move(value);
        return {&slot, false};
    }

    const std::size_t pos = entries_.size();
    index_.emplace(key, pos);
    entries_.emplace_back(std::move(key), std::move(value));
    return {&entries_.back().second, true};
}

bool ValueObject::erase(std::string_view key)
{
    auto it = index_.find(key);
    if (it == index_.end()) return false;

    const std::size_t pos = it->second;
    index_.erase(it);
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));

    // Entries after the removed one shifted down by one
    for (auto idx = index_.begin(); idx != index_.end(); ++idx) {
        if (idx->second > pos) {
            idx.value() = idx->second - 1;
        }
    }
    return true;
}

ValueObject::container_type ValueObject::release() &&
{
    container_type out = std::move(entries_);
    entries_.clear();
    index_.clear();
    return out;
}

ValueObject ValueObject::clone() const
{
    ValueObject copy;
    copy.entries_.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        copy.entries_.emplace_back(key, value.clone());
    }
    copy.index_ = index_;
    return copy;
}

bool ValueObject::operator==(const ValueObject& other) const
{
    if (entries_.size() != other.entries_.size()) return false;
    for (const auto& [key, value] : entries_) {
        const Value* theirs = other.find(key);
        if (!theirs || !(value == *theirs)) return false;
    }
    return true;
}

// ============================================================
// Value - construction
// ============================================================

Value::Value(double v)
{
    if (auto n = Number::from_f64(v)) {
        data = *n;
    }
}

Value::Value(Value&& other) noexcept = default;
Value& Value::operator=(Value&& other) noexcept = default;
Value::~Value() = default;

std::string_view Value::kind_name() const noexcept
{
    switch (kind()) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

Unexpected Value::unexpected() const
{
    switch (kind()) {
        case ValueKind::Null:   return Unexpected::unit();
        case ValueKind::Bool:   return Unexpected::boolean(std::get<bool>(data));
        case ValueKind::Number: return std::get<Number>(data).unexpected();
        case ValueKind::String: return Unexpected::str(std::get<std::string>(data));
        case ValueKind::Array:  return Unexpected::seq();
        case ValueKind::Object: return Unexpected::map();
    }
    return Unexpected::other("value");
}

// ============================================================
// Object Operations
// ============================================================

Value* Value::get(std::string_view key)
{
    auto* obj = get_object();
    if (!obj) return nullptr;
    return obj->find(key);
}

const Value* Value::get(std::string_view key) const
{
    const auto* obj = get_object();
    if (!obj) return nullptr;
    return obj->find(key);
}

const Value& Value::at(std::string_view key) const
{
    static const Value null_value;

    const auto* obj = get_object();
    if (!obj) {
        detail::log_key_error("Value::at", key, "lookup on non-object");
        return null_value;
    }
    if (const Value* found = obj->find(key)) {
        return *found;
    }
    detail::log_key_error("Value::at", key, "not found");
    return null_value;
}

Value& Value::set(std::string_view key, Value value)
{
    if (!is_object()) {
        data = std::make_unique<ValueObject>();
    }
    get_object()->insert(std::string{key}, std::move(value));
    return *this;
}

bool Value::contains(std::string_view key) const
{
    const auto* obj = get_object();
    return obj && obj->contains(key);
}

// ============================================================
// Array Operations
// ============================================================

Value* Value::get(std::size_t index)
{
    auto* arr = get_array();
    if (!arr || index >= arr->size()) return nullptr;
    return &(*arr)[index];
}

const Value* Value::get(std::size_t index) const
{
    const auto* arr = get_array();
    if (!arr || index >= arr->size()) return nullptr;
    return &(*arr)[index];
}

const Value& Value::at(std::size_t index) const
{
    static const Value null_value;

    const auto* arr = get_array();
    if (!arr) {
        detail::log_index_error("Value::at", index, "lookup on non-array");
        return null_value;
    }
    if (index >= arr->size()) {
        detail::log_index_error("Value::at", index, "out of range");
        return null_value;
    }
    return (*arr)[index];
}

Value& Value::push_back(Value value)
{
    if (!is_array()) {
        data = std::make_unique<ValueArray>();
    }
    get_array()->push_back(std::move(value));
    return *this;
}

std::size_t Value::size() const
{
    if (const auto* arr = get_array()) return arr->size();
    if (const auto* obj = get_object()) return obj->size();
    return 0;
}

// ============================================================
// Utility
// ============================================================

Value Value::clone() const
{
    return std::visit(
        [](const auto& arg) -> Value {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return Value{};
            } else if constexpr (std::is_same_v<T, ValueArrayPtr>) {
                ValueArray items;
                items.reserve(arg->size());
                for (const auto& v : *arg) {
                    items.push_back(v.clone());
                }
                return Value{std::move(items)};
            } else if constexpr (std::is_same_v<T, ValueObjectPtr>) {
                return Value{arg->clone()};
            } else {
                return Value{arg};
            }
        },
        data);
}

bool Value::operator==(const Value& other) const
{
    if (data.index() != other.data.index()) return false;

    return std::visit(
        [&other](const auto& arg) -> bool {
            using T = std::decay_t<decltype(arg)>;
            const auto& theirs = std::get<T>(other.data);
            if constexpr (std::is_same_v<T, std::monostate>) {
                return true;
            } else if constexpr (std::is_same_v<T, ValueArrayPtr>) {
                if (arg->size() != theirs->size()) return false;
                for (std::size_t i = 0; i < arg->size(); ++i) {
                    if (!((*arg)[i] == (*theirs)[i])) return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, ValueObjectPtr>) {
                return *arg == *theirs;
            } else {
                return arg == theirs;
            }
        },
        data);
}

std::string Value::to_string() const
{
    return to_json(*this, true);
}

std::ostream& operator<<(std::ostream& os, const Value& value)
{
    return os << to_json(value, true);
}

} // namespace value_de
