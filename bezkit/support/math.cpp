// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <bezkit/core/api-build_p.h>
#include <bezkit/support/math_p.h>

namespace bk {
namespace Math {

// bk::Math - Cubic Roots
// ======================

// Ax^3 + Bx^2 + Cx + D = 0.
//
// CUBIC.C - public domain by Ross Cottrell. The polynomial is normalized to `x^3 + a1*x^2 + a2*x + a3 = 0`, which
// has either three real roots (trigonometric method) or a single real root (Cardano's formula).
size_t solve_cubic(double dst[3], const double poly[4]) noexcept {
  double a = poly[0];

  if (bk_abs(a) < kCUBIC_EPSILON)
    return solve_quadratic(dst, poly[1], poly[2], poly[3]);

  double a1 = poly[1] / a;
  double a2 = poly[2] / a;
  double a3 = poly[3] / a;

  double q = (a1 * a1 - 3.0 * a2) / 9.0;
  double r = (2.0 * a1 * a1 * a1 - 9.0 * a1 * a2 + 27.0 * a3) / 54.0;
  double r2_q3 = r * r - q * q * q;

  // Resubstitution constant.
  double sub = a1 / 3.0;

  if (r2_q3 < 0.0) {
    // Three real roots. Rounding can push the argument of acos() slightly outside of [-1, 1].
    double theta = acos(bk_clamp(r / sqrt(q * q * q), -1.0, 1.0));
    double rq2 = -2.0 * sqrt(q);

    dst[0] = rq2 * cos(theta / 3.0) - sub;
    dst[1] = rq2 * cos((theta + kPI_MUL_2) / 3.0) - sub;
    dst[2] = rq2 * cos((theta + kPI_MUL_4) / 3.0) - sub;
    return 3;
  }

  double x = 0.0;
  if (!(q == 0.0 && r == 0.0)) {
    x = cbrt(sqrt(r2_q3) + bk_abs(r));
    x += q / x;
  }

  if (r >= 0.0)
    x = -x;

  dst[0] = x - sub;
  return 1;
}

} // {Math}
} // {bk}
