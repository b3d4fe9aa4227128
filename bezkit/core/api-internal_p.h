// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_API_INTERNAL_P_H_INCLUDED
#define BEZKIT_CORE_API_INTERNAL_P_H_INCLUDED

#include <bezkit/core/api.h>

// C Headers
// =========

// NOTE: Some headers are already included by <api.h>. This should be useful for creating an overview of what
// Bezkit really needs globally to be included.
#include <math.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// C++ Headers
// ===========

// Some overloads in C++'s <cmath> are nicer to use than those in <math.h>, Math::is_finite() relies on them.
#include <cmath>
#include <type_traits>

// Platform Specific Headers
// =========================

#if defined(_WIN32)
  //! \cond NEVER
  #if !defined(WIN32_LEAN_AND_MEAN)
    #define WIN32_LEAN_AND_MEAN
  #endif
  #if !defined(NOMINMAX)
    #define NOMINMAX
  #endif
  //! \endcond

  #include <windows.h>   // Required by the runtime message sink (OutputDebugStringA).
#endif

//! \cond INTERNAL
//! \addtogroup bk_globals
//! \{

// Internal Macros
// ===============

//! \def BK_HIDDEN
//!
//! Decorates a function that is used across more than one source file, but should never be exported. Expands to
//! a compiler-specific code that affects the visibility.
#if defined(__GNUC__) && !defined(__MINGW32__)
  #define BK_HIDDEN __attribute__((__visibility__("hidden")))
#else
  #define BK_HIDDEN
#endif

//! \def BK_ASSUME(...)
//!
//! Assumes that the given condition is always true, used to help the optimizer.
#if defined(__clang__)
  #define BK_ASSUME(...) __builtin_assume(__VA_ARGS__)
#elif defined(__GNUC__)
  #define BK_ASSUME(...) do { if (!(__VA_ARGS__)) __builtin_unreachable(); } while (0)
#elif defined(_MSC_VER)
  #define BK_ASSUME(...) __assume(__VA_ARGS__)
#else
  #define BK_ASSUME(...) (void)0
#endif

#define BK_API_IMPL extern "C" BK_API

#define BK_STRINGIFY_WRAP(N) #N
#define BK_STRINGIFY(N) BK_STRINGIFY_WRAP(N)

//! \def BK_NOT_REACHED()
//!
//! Run-time assertion used in code that should never be reached.
#ifdef BK_BUILD_DEBUG
  #define BK_NOT_REACHED() bk_runtime_assertion_failure(__FILE__, __LINE__, "BK_NOT_REACHED()")
#elif defined(__GNUC__)
  #define BK_NOT_REACHED() __builtin_unreachable()
#else
  #define BK_NOT_REACHED() BK_ASSUME(0)
#endif

#define BK_ARRAY_SIZE(X) uint32_t(sizeof(X) / sizeof(X[0]))

// Internal Functions
// ==================

//! Returns the passed `result`.
//!
//! All errors Bezkit reports go through this function, which makes it the ideal place to put a breakpoint at when
//! debugging a failing call.
[[nodiscard]]
static BK_INLINE_NODEBUG BKResult bk_make_error(BKResult result) noexcept { return result; }

//! \}
//! \endcond

#endif // BEZKIT_CORE_API_INTERNAL_P_H_INCLUDED
