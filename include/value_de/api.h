// api.h - DLL export/import macros for value_de

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for value_de library.
///
/// Usage:
/// - When building value_de as a SHARED library:
///   - CMake defines VALUE_DE_EXPORTS (private) and VALUE_DE_SHARED (public)
///   - Functions/classes marked with VALUE_DE_API will be exported
///
/// - When using value_de as a SHARED library:
///   - Link against value_de target (CMake propagates VALUE_DE_SHARED)
///   - Functions/classes marked with VALUE_DE_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, VALUE_DE_API expands to nothing
///
/// Most of the deserialization protocol is header-only templates; only the
/// Value tree, Number, Error and the JSON reader/writer carry exported symbols.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef VALUE_DE_SHARED
        #ifdef VALUE_DE_EXPORTS
            #define VALUE_DE_API __declspec(dllexport)
        #else
            #define VALUE_DE_API __declspec(dllimport)
        #endif
    #else
        #define VALUE_DE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(VALUE_DE_SHARED) && defined(VALUE_DE_EXPORTS)
        #define VALUE_DE_API __attribute__((visibility("default")))
    #else
        #define VALUE_DE_API
    #endif
#else
    #define VALUE_DE_API
#endif
