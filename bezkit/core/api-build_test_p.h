// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

// This is an internal header file that is always included first by each Bezkit test file.

#ifndef BEZKIT_CORE_API_BUILD_TEST_P_H_INCLUDED
#define BEZKIT_CORE_API_BUILD_TEST_P_H_INCLUDED

#include <bezkit/core/api-build_p.h>

// bk::Build - Tests
// =================

//! \cond NEVER
// Make sure '#ifdef'ed unit tests are not disabled by IDE.
#if !defined(BK_TEST) && defined(__INTELLISENSE__)
  #define BK_TEST
#endif
//! \endcond

// Include a unit testing package if this is a `bk_test_runner` build.
#if defined(BK_TEST)

#include <gtest/gtest.h>

//! \cond INTERNAL
#define EXPECT_SUCCESS(...) EXPECT_EQ(BKResult(__VA_ARGS__), BKResult(BK_SUCCESS))
#define EXPECT_FAILURE(CODE, ...) EXPECT_EQ(BKResult(__VA_ARGS__), BKResult(CODE))
//! \endcond

#endif // BK_TEST

#endif // BEZKIT_CORE_API_BUILD_TEST_P_H_INCLUDED
