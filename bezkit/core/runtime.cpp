// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_p.h>
#include <bezkit/core/runtime.h>

// BKRuntime - Build Information
// =============================

#if defined(__clang_minor__)
  #define BK_COMPILER_INFO "Clang " BK_STRINGIFY(__clang_major__) "." BK_STRINGIFY(__clang_minor__)
#elif defined(__GNUC_MINOR__)
  #define BK_COMPILER_INFO "GCC " BK_STRINGIFY(__GNUC__) "." BK_STRINGIFY(__GNUC_MINOR__)
#elif defined(_MSC_VER)
  #define BK_COMPILER_INFO "MSC " BK_STRINGIFY(_MSC_VER)
#else
  #define BK_COMPILER_INFO "Unknown"
#endif

BK_API_IMPL BKResult bk_runtime_query_build_info(BKRuntimeBuildInfo* out) noexcept {
  if (BK_UNLIKELY(!out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  memset(out, 0, sizeof(*out));
  out->major_version = uint32_t(BK_VERSION) >> 16;
  out->minor_version = (uint32_t(BK_VERSION) >> 8) & 0xFFu;
  out->patch_version = uint32_t(BK_VERSION) & 0xFFu;

#if defined(BK_BUILD_DEBUG)
  out->build_type = BK_RUNTIME_BUILD_TYPE_DEBUG;
#else
  out->build_type = BK_RUNTIME_BUILD_TYPE_RELEASE;
#endif

  out->max_split_count = BK_RUNTIME_MAX_SPLIT_COUNT;

#if defined(BK_TRACE_SPLIT)
  out->split_trace = 1;
#endif

  snprintf(out->compiler_info, sizeof(out->compiler_info), "%s", BK_COMPILER_INFO);
  return BK_SUCCESS;
}

// BKRuntime - Message Sink
// ========================

BK_API_IMPL BKResult bk_runtime_message_out(const char* msg) noexcept {
  if (BK_UNLIKELY(!msg))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

#if defined(_WIN32)
  OutputDebugStringA(msg);
#endif

  fputs(msg, stderr);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_runtime_message_fmt(const char* fmt, ...) noexcept {
  if (BK_UNLIKELY(!fmt))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  // Longer messages are truncated.
  char buf[512];

  va_list ap;
  va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);

  return bk_runtime_message_out(buf);
}

BK_API_IMPL void bk_runtime_assertion_failure(const char* file, int line, const char* msg) noexcept {
  bk_runtime_message_fmt("[Bezkit] ASSERTION FAILURE: '%s' at '%s' [line %d]\n", msg, file, line);
  abort();
}
