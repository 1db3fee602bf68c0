// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text reader and writer for Value trees.
///
/// Usage:
/// @code
///   #include <value_de/serialization.h>
///
///   std::string error;
///   Value doc = from_json(R"({"id": 7, "tags": ["a", "b"]})", &error);
///   if (!error.empty()) { ... }
///
///   std::string pretty = to_json(doc, false);
///   std::string wire = to_json(doc);  // compact
/// @endcode
///
/// The raw passthrough (see raw_value.h) relies on both directions:
/// to_json() captures a sub-tree as text and from_json() reads it back.

#pragma once

#include "api.h"
#include "value.h"

#include <string>
#include <string_view>

namespace value_de {

/// Convert a Value to JSON text
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, indent with two spaces
/// @return JSON text. Object keys keep their insertion order.
[[nodiscard]] VALUE_DE_API std::string to_json(const Value& val, bool compact = true);

/// Parse JSON text into a Value
/// @param json_str The text to parse
/// @param error_out If provided, receives the error message on failure
/// @return Parsed Value, or a null Value on error
///
/// Integers that fit 64 bits are kept exact; larger ones become doubles.
/// Nesting deeper than VALUE_DE_PARSER_MAX_DEPTH is rejected.
/// Duplicate object keys keep the last value at the first key's position.
[[nodiscard]] VALUE_DE_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

} // namespace value_de
