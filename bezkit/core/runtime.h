// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_CORE_RUNTIME_H_INCLUDED
#define BEZKIT_CORE_RUNTIME_H_INCLUDED

#include <bezkit/core/api.h>

//! \addtogroup bk_runtime
//! \{

//! \name BKRuntime - Constants
//! \{

//! Bezkit runtime limits.
BK_DEFINE_ENUM(BKRuntimeLimits) {
  //! Maximum number of pieces a single split produces, which is a cubic crossing the split line 3 times.
  BK_RUNTIME_MAX_SPLIT_COUNT = 4

  BK_FORCE_ENUM_UINT32(BK_RUNTIME_LIMITS)
};

//! Bezkit runtime build type.
BK_DEFINE_ENUM(BKRuntimeBuildType) {
  //! Debug build, `BK_ASSERT()` checks are active.
  BK_RUNTIME_BUILD_TYPE_DEBUG = 0,
  //! Release build.
  BK_RUNTIME_BUILD_TYPE_RELEASE = 1

  BK_FORCE_ENUM_UINT32(BK_RUNTIME_BUILD_TYPE)
};

//! \}

//! \name BKRuntime - Structs
//! \{

//! Describes how the Bezkit library was built.
struct BKRuntimeBuildInfo {
  //! Version of the library, see \ref BK_VERSION.
  uint32_t major_version;
  uint32_t minor_version;
  uint32_t patch_version;

  //! Build type, see \ref BKRuntimeBuildType.
  uint32_t build_type;

  //! Capacity of \ref BKSegmentSplit, see \ref BK_RUNTIME_MAX_SPLIT_COUNT.
  uint32_t max_split_count;

  //! Non-zero if split operations write traces to the message sink (compiled with `BK_TRACE_SPLIT`).
  uint32_t split_trace;

  //! Name and version of the C++ compiler used to build Bezkit.
  char compiler_info[32];
};

//! \}
//! \}

//! \addtogroup bk_c_api
//! \{

//! \name BKRuntime - C API
//!
//! Messages are written to `stderr`, and on Windows to the debugger as well. Split traces and assertion failures
//! go through the same sink.
//!
//! \{

BK_BEGIN_C_DECLS

BK_API BKResult BK_CDECL bk_runtime_query_build_info(BKRuntimeBuildInfo* out) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_runtime_message_out(const char* msg) BK_NOEXCEPT_C;
BK_API BKResult BK_CDECL bk_runtime_message_fmt(const char* fmt, ...) BK_NOEXCEPT_C;

BK_END_C_DECLS

//! \}
//! \}

#ifdef __cplusplus
//! Interface to access Bezkit runtime (wraps C API).
namespace BKRuntime {

static BK_INLINE_NODEBUG BKResult query_build_info(BKRuntimeBuildInfo* out) noexcept { return bk_runtime_query_build_info(out); }
static BK_INLINE_NODEBUG BKResult message(const char* msg) noexcept { return bk_runtime_message_out(msg); }

} // {BKRuntime}
#endif

#endif // BEZKIT_CORE_RUNTIME_H_INCLUDED
