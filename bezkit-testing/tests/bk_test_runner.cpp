// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_test_p.h>
#include <bezkit/core/runtime.h>

int main(int argc, char* argv[]) {
  BKRuntimeBuildInfo build_info;
  BKResult result = BKRuntime::query_build_info(&build_info);

  if (result != BK_SUCCESS) {
    bk_runtime_message_fmt("Failed to query Bezkit build information (0x%08X)\n", unsigned(result));
    return 1;
  }

  bk_runtime_message_fmt(
    "Bezkit Unit Tests [use --help for command line options]\n"
    "  Version    : %u.%u.%u\n"
    "  Build Type : %s\n"
    "  Compiled By: %s\n\n",
    build_info.major_version,
    build_info.minor_version,
    build_info.patch_version,
    build_info.build_type == BK_RUNTIME_BUILD_TYPE_DEBUG ? "Debug" : "Release",
    build_info.compiler_info);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
