// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_p.h>
#include <bezkit/core/polynomial.h>
#include <bezkit/support/math_p.h>

// BKPolynomial - API - Solvers
// ============================

BK_API_IMPL BKResult bk_solve_quadratic(double roots_out[2], size_t* count_out, double a, double b, double c) noexcept {
  if (BK_UNLIKELY(!roots_out || !count_out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  *count_out = bk::Math::solve_quadratic(roots_out, a, b, c);
  return BK_SUCCESS;
}

BK_API_IMPL BKResult bk_solve_cubic(double roots_out[3], size_t* count_out, double a, double b, double c, double d) noexcept {
  if (BK_UNLIKELY(!roots_out || !count_out))
    return bk_make_error(BK_ERROR_INVALID_VALUE);

  *count_out = bk::Math::solve_cubic(roots_out, a, b, c, d);
  return BK_SUCCESS;
}
