// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_de_config.h
/// @brief Centralized compile-time configuration for value_de
///
/// Every public value_de header includes this file first, so users only
/// need to define the macros below (on the command line or before the first
/// include) to change the defaults.
///
/// | Macro                       | Default                   |
/// |-----------------------------|---------------------------|
/// | VALUE_DE_VERBOSE_LOG        | 1 in debug, 0 with NDEBUG |
/// | VALUE_DE_HAS_INT128         | 1 when __int128 exists    |
/// | VALUE_DE_PARSER_MAX_DEPTH   | 128                       |

#pragma once

#include <cstddef>
#include <string_view>

#define VALUE_DE_CONFIGURED 1

// ============================================================
// Verbose Logging Configuration
//
// When VALUE_DE_VERBOSE_LOG is enabled:
//   - Value::get() misses and from_json() failures log to stderr
//   - The deserialization core never logs; errors are its only signal
//
// To explicitly enable: #define VALUE_DE_VERBOSE_LOG 1
// To explicitly disable: #define VALUE_DE_VERBOSE_LOG 0
// ============================================================

#ifndef VALUE_DE_VERBOSE_LOG
#  if defined(NDEBUG)
#    define VALUE_DE_VERBOSE_LOG 0
#  else
#    define VALUE_DE_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// 128-bit Integer Support
//
// deserialize_i128 / deserialize_u128 and the matching visitor triggers
// are only available when the compiler provides __int128.
// ============================================================

#ifndef VALUE_DE_HAS_INT128
#  if defined(__SIZEOF_INT128__)
#    define VALUE_DE_HAS_INT128 1
#  else
#    define VALUE_DE_HAS_INT128 0
#  endif
#endif

// ============================================================
// JSON Reader Limits
// ============================================================

/// @brief Maximum array/object nesting accepted by from_json()
///
/// Deeper input is rejected with a regular parse error instead of
/// exhausting the call stack.
#ifndef VALUE_DE_PARSER_MAX_DEPTH
#define VALUE_DE_PARSER_MAX_DEPTH 128
#endif

namespace value_de {

#if VALUE_DE_HAS_INT128
__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;
#endif

/// Newtype name that switches a deserializer into raw passthrough mode
inline constexpr std::string_view RAW_VALUE_TOKEN = "$value_de::private::RawValue";

/// Map key marking a number carried as its decimal text
inline constexpr std::string_view NUMBER_TOKEN = "$value_de::private::Number";

inline constexpr std::size_t parser_max_depth = VALUE_DE_PARSER_MAX_DEPTH;

} // namespace value_de
