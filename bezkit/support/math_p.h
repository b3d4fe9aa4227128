// This file is part of Bezkit project <https://github.com/bezkit/bezkit>
//
// See bezkit.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#ifndef BEZKIT_SUPPORT_MATH_P_H_INCLUDED
#define BEZKIT_SUPPORT_MATH_P_H_INCLUDED

#include <bezkit/core/api-internal_p.h>
#include <bezkit/core/geometry.h>
#include <bezkit/support/mathconst_p.h>

//! \cond INTERNAL
//! \addtogroup bk_internal
//! \{

namespace bk {
namespace Math {
namespace {

//! \name Floating Point Tests
//! \{

static BK_INLINE_NODEBUG bool is_finite(double x) noexcept { return std::isfinite(x); }
static BK_INLINE_NODEBUG bool is_finite(const BKPoint& p) noexcept { return BKInternal::bool_and(is_finite(p.x), is_finite(p.y)); }
static BK_INLINE_NODEBUG bool is_finite(const BKBox& b) noexcept {
  return BKInternal::bool_and(is_finite(b.x0), is_finite(b.y0), is_finite(b.x1), is_finite(b.y1));
}

//! Checks whether `t` is within [0, 1) range, which is the range of parameters accepted by split and bounds.
//!
//! The end of a segment is excluded, so a root at `t == 1` never produces an empty trailing piece.
static BK_INLINE_NODEBUG bool is_unit_interval_open_end(double t) noexcept { return BKInternal::bool_and(t >= 0.0, t < 1.0); }

//! \}

//! \name Power Functions
//! \{

template<typename T>
static BK_INLINE_CONSTEXPR T square(const T& x) noexcept { return x * x; }

template<typename T>
static BK_INLINE_CONSTEXPR T cube(const T& x) noexcept { return x * x * x; }

static BK_INLINE_NODEBUG double sqrt(double x) noexcept { return std::sqrt(x); }
static BK_INLINE_NODEBUG double cbrt(double x) noexcept { return std::cbrt(x); }

//! \}

//! \name Trigonometric Functions
//! \{

static BK_INLINE_NODEBUG double cos(double x) noexcept { return std::cos(x); }
static BK_INLINE_NODEBUG double acos(double x) noexcept { return std::acos(x); }

//! \}

//! \name Quadratic Roots
//! \{

//! Solves a quadratic polynomial `Ax^2 + Bx + C = 0` and stores the result in `dst`.
//!
//! Returns the number of real roots found, `0` to `2`:
//!
//!   - `A == 0 && B == 0` - not an equation, no roots.
//!   - `A == 0`           - linear equation, a single root `-C / B`.
//!   - `D < 0`            - complex roots only, nothing is reported.
//!   - `D >= 0`           - two roots `(-B + sqrt(D)) / 2A` and `(-B - sqrt(D)) / 2A` in this order.
//!
//! Roots are neither sorted nor deduplicated, a double root is reported twice.
static BK_INLINE size_t solve_quadratic(double dst[2], double a, double b, double c) noexcept {
  if (a == 0.0) {
    if (b == 0.0)
      return 0;

    dst[0] = -c / b;
    return 1;
  }

  double d = b * b - 4.0 * a * c;
  if (d < 0.0)
    return 0;

  double s = sqrt(d);
  dst[0] = (-b + s) / 2.0 / a;
  dst[1] = (-b - s) / 2.0 / a;
  return 2;
}

//! \}

} // {anonymous}

//! \name Cubic Roots
//! \{

//! Solves a cubic polynomial `Ax^3 + Bx^2 + Cx + D = 0` stored in `poly` and stores the result in `dst`.
//!
//! Returns the number of real roots found, `0` to `3`. If `|A| < kCUBIC_EPSILON` the polynomial is solved as a
//! quadratic `Bx^2 + Cx + D = 0`. Roots are neither sorted nor deduplicated.
BK_HIDDEN size_t solve_cubic(double dst[3], const double poly[4]) noexcept;

//! \overload
static BK_INLINE size_t solve_cubic(double dst[3], double a, double b, double c, double d) noexcept {
  double poly[4] = { a, b, c, d };
  return solve_cubic(dst, poly);
}

//! \}

} // {Math}
} // {bk}

//! \}
//! \endcond

#endif // BEZKIT_SUPPORT_MATH_P_H_INCLUDED
