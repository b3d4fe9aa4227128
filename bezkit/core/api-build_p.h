// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each Bezkit source file. This means that any
// macros we might need to define to build 'bezkit' can be defined here instead of passing them to the compiler
// through command line.

#ifndef BEZKIT_CORE_API_BUILD_P_H_INCLUDED
#define BEZKIT_CORE_API_BUILD_P_H_INCLUDED

// Build - Export
// ==============

//! \cond INTERNAL
//! Export mode is on when `BK_BUILD_EXPORT` is defined - this MUST be defined before including any other header
//! as "api.h" uses `BK_BUILD_EXPORT` to define a proper `BK_API` decorator that is used by all exported functions.
#if !defined(BK_BUILD_EXPORT)
  #define BK_BUILD_EXPORT
#endif
//! \endcond

// Build - Configuration
// =====================

// #define BK_TRACE_SPLIT
// ----------------------
//
// Traces the parameters at which quadratic and cubic segments are split. Traces are written through the runtime
// message sink and can help to understand which roots were accepted and which were rejected. Enabled by the
// BEZKIT_TRACE_SPLIT option of CMakeLists.txt.

// Build - Requirements
// ====================

//! \cond NEVER

// Turn off deprecation warnings when building 'bezkit'. Required as runtime.cpp uses `snprintf()` and
// `vsnprintf()`, which we use correctly.
#ifdef _MSC_VER
  #if !defined(_CRT_SECURE_NO_DEPRECATE)
    #define _CRT_SECURE_NO_DEPRECATE
  #endif
  #if !defined(_CRT_SECURE_NO_WARNINGS)
    #define _CRT_SECURE_NO_WARNINGS
  #endif
#endif

//! \endcond

// Build - Compiler Diagnostics
// ============================

//! \cond NEVER

#if defined(__clang__)
  #pragma clang diagnostic warning "-Wattributes"
  #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
  #pragma GCC diagnostic warning "-Wattributes"
  #pragma GCC diagnostic ignored "-Wunused-function"
#elif defined(_MSC_VER)
  #pragma warning(disable: 4127) // Conditional expression is constant.
  #pragma warning(disable: 4201) // Nameless struct/union.
  #pragma warning(disable: 4505) // Unreferenced local function has been removed.
  #pragma warning(disable: 4800) // Forcing value to bool true or false.
#endif

//! \endcond

// Build - Include API
// ===================

#include <bezkit/core/api.h>
#include <bezkit/core/api-internal_p.h>

#endif // BEZKIT_CORE_API_BUILD_P_H_INCLUDED
