// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_API_H_INCLUDED
#define BEZKIT_CORE_API_H_INCLUDED

// C Headers
// =========

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

//! \addtogroup bk_globals
//! \{

// Version
// =======

//! Makes a version number representing a `MAJOR.MINOR.PATCH` combination.
#define BK_MAKE_VERSION(MAJOR, MINOR, PATCH) (((MAJOR) << 16) | ((MINOR) << 8) | (PATCH))

//! Bezkit library version.
#define BK_VERSION BK_MAKE_VERSION(0, 9, 2)

// Build Type
// ==========

//! \cond INTERNAL
#if !defined(BK_BUILD_DEBUG) && !defined(BK_BUILD_RELEASE)
  #if !defined(NDEBUG)
    #define BK_BUILD_DEBUG
  #else
    #define BK_BUILD_RELEASE
  #endif
#endif
//! \endcond

// Public Macros
// =============

//! \def BK_API
//!
//! A base API decorator that marks functions and variables exported by Bezkit.
#if !defined(BK_STATIC)
  #if defined(_WIN32) && (defined(_MSC_VER) || defined(__MINGW32__))
    #if defined(BK_BUILD_EXPORT)
      #define BK_API __declspec(dllexport)
    #else
      #define BK_API __declspec(dllimport)
    #endif
  #elif defined(_WIN32) && defined(__GNUC__)
    #if defined(BK_BUILD_EXPORT)
      #define BK_API __attribute__((__dllexport__))
    #else
      #define BK_API __attribute__((__dllimport__))
    #endif
  #elif defined(__GNUC__)
    #define BK_API __attribute__((__visibility__("default")))
  #endif
#endif

#if !defined(BK_API)
  #define BK_API
#endif

//! \def BK_CDECL
//!
//! Calling convention used by all exported functions and function callbacks.
#if defined(__GNUC__) && defined(__i386__) && !defined(__x86_64__)
  #define BK_CDECL __attribute__((__cdecl__))
#elif defined(_MSC_VER)
  #define BK_CDECL __cdecl
#else
  #define BK_CDECL
#endif

//! \def BK_INLINE
//!
//! Marks functions that should always be inlined.
#if defined(__GNUC__) && !defined(BK_BUILD_DEBUG)
  #define BK_INLINE inline __attribute__((__always_inline__))
#elif defined(_MSC_VER) && !defined(BK_BUILD_DEBUG)
  #define BK_INLINE __forceinline
#else
  #define BK_INLINE inline
#endif

//! \def BK_INLINE_NODEBUG
//!
//! The same as `BK_INLINE` combined with `__attribute__((artificial))` or `__attribute__((nodebug))` if supported.
#if defined(__clang__) && !defined(BK_BUILD_DEBUG)
  #define BK_INLINE_NODEBUG inline __attribute__((__always_inline__, __nodebug__))
#elif defined(__GNUC__) && !defined(BK_BUILD_DEBUG)
  #define BK_INLINE_NODEBUG inline __attribute__((__always_inline__, __artificial__))
#else
  #define BK_INLINE_NODEBUG BK_INLINE
#endif

//! \def BK_INLINE_CONSTEXPR
//!
//! The same as `BK_INLINE_NODEBUG`, but having `constexpr` at the front.
#define BK_INLINE_CONSTEXPR constexpr BK_INLINE_NODEBUG

//! \def BK_NORETURN
//!
//! Function attribute used by functions that never return (that terminate the process).
#if defined(__GNUC__)
  #define BK_NORETURN __attribute__((__noreturn__))
#elif defined(_MSC_VER)
  #define BK_NORETURN __declspec(noreturn)
#else
  #define BK_NORETURN
#endif

//! \def BK_LIKELY(...)
//!
//! A condition is likely.
#if defined(__GNUC__)
  #define BK_LIKELY(...) __builtin_expect(!!(__VA_ARGS__), 1)
  #define BK_UNLIKELY(...) __builtin_expect(!!(__VA_ARGS__), 0)
#else
  #define BK_LIKELY(...) (__VA_ARGS__)
  #define BK_UNLIKELY(...) (__VA_ARGS__)
#endif

//! \def BK_NOEXCEPT_C
//!
//! Expands to `noexcept` when compiled by a C++ compiler, used by C API declarations.
#ifdef __cplusplus
  #define BK_NOEXCEPT_C noexcept
  #define BK_BEGIN_C_DECLS extern "C" {
  #define BK_END_C_DECLS } /* {ExternC} */
#else
  #define BK_NOEXCEPT_C
  #define BK_BEGIN_C_DECLS
  #define BK_END_C_DECLS
#endif

//! \def BK_DEFINE_ENUM(NAME)
//!
//! Defines an enumeration used by Bezkit that is `uint32_t` in both C and C++.
#ifdef __cplusplus
  #define BK_DEFINE_ENUM(NAME) enum NAME : uint32_t
  #define BK_FORCE_ENUM_UINT32(ENUM_VALUE_PREFIX)
#else
  #define BK_DEFINE_ENUM(NAME) typedef enum NAME NAME; enum NAME
  #define BK_FORCE_ENUM_UINT32(ENUM_VALUE_PREFIX) , ENUM_VALUE_PREFIX##_FORCE_UINT = 0xFFFFFFFFu
#endif

#define BK_FORWARD_DECLARE_STRUCT(NAME) typedef struct NAME NAME

//! \def BK_PROPAGATE(...)
//!
//! Executes the code within the macro and returns if it returned any value other than `BK_SUCCESS`.
#define BK_PROPAGATE(...)                                                     \
  do {                                                                        \
    BKResult result_to_propagate = (__VA_ARGS__);                             \
    if (BK_UNLIKELY(result_to_propagate != BK_SUCCESS)) {                     \
      return result_to_propagate;                                             \
    }                                                                         \
  } while (0)

// Forward Declarations
// ====================

BK_FORWARD_DECLARE_STRUCT(BKPoint);
BK_FORWARD_DECLARE_STRUCT(BKBox);
BK_FORWARD_DECLARE_STRUCT(BKQuadParameters);
BK_FORWARD_DECLARE_STRUCT(BKCubicParameters);
BK_FORWARD_DECLARE_STRUCT(BKSegment);
BK_FORWARD_DECLARE_STRUCT(BKSegmentSplit);
BK_FORWARD_DECLARE_STRUCT(BKRuntimeBuildInfo);

// Result
// ======

//! Result code used by most Bezkit functions (32-bit unsigned integer).
//!
//! The `BKResultCode` enumeration contains Bezkit result codes that contain Bezkit specific set of errors.
typedef uint32_t BKResult;

//! Bezkit result code.
BK_DEFINE_ENUM(BKResultCode) {
  //! Successful result code.
  BK_SUCCESS = 0,

  //! Start of Bezkit error codes.
  BK_ERROR_START_INDEX = 0x00010000u,

  //! Invalid value/argument (null pointer, unknown axis or segment type).
  BK_ERROR_INVALID_VALUE = 0x00010000u,
  //! Invalid geometry (for example an empty point set passed where a bounding box is required).
  BK_ERROR_INVALID_GEOMETRY

  BK_FORCE_ENUM_UINT32(BK_ERROR)
};

//! \}

// Internal API
// ============

//! \cond INTERNAL
BK_BEGIN_C_DECLS

//! Reports an assertion failure and terminates the process.
BK_API BK_NORETURN void BK_CDECL bk_runtime_assertion_failure(const char* file, int line, const char* msg) BK_NOEXCEPT_C;

BK_END_C_DECLS
//! \endcond

//! \def BK_ASSERT(EXP)
//!
//! Run-time assertion executed in debug builds.
#ifdef BK_BUILD_DEBUG
  #define BK_ASSERT(EXP)                                                      \
    do {                                                                      \
      if (BK_UNLIKELY(!(EXP)))                                                \
        bk_runtime_assertion_failure(__FILE__, __LINE__, #EXP);               \
    } while (0)
#else
  #define BK_ASSERT(EXP) ((void)0)
#endif

#ifdef __cplusplus
//! \cond INTERNAL
namespace BKInternal {

//! Returns `a && b` without short-circuit evaluation.
template<typename... Args>
BK_INLINE_CONSTEXPR bool bool_and(Args&&... args) noexcept { return (... & unsigned(bool(args))) != 0u; }

} // {BKInternal}
//! \endcond

//! \name Utility Functions
//! \{

template<typename T>
[[nodiscard]]
static BK_INLINE_CONSTEXPR T bk_min(const T& a, const T& b) noexcept { return b < a ? b : a; }

template<typename T>
[[nodiscard]]
static BK_INLINE_CONSTEXPR T bk_max(const T& a, const T& b) noexcept { return a < b ? b : a; }

template<typename T>
[[nodiscard]]
static BK_INLINE_CONSTEXPR T bk_abs(const T& x) noexcept { return x < T(0) ? -x : x; }

template<typename T>
[[nodiscard]]
static BK_INLINE_CONSTEXPR T bk_clamp(const T& x, const T& lo, const T& hi) noexcept { return bk_min(hi, bk_max(lo, x)); }

template<typename T>
[[nodiscard]]
static BK_INLINE_CONSTEXPR bool bk_equals(const T& a, const T& b) noexcept { return a == b; }

//! \}
#endif

#endif // BEZKIT_CORE_API_H_INCLUDED
